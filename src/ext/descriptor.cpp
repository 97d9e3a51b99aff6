/*
    author: qcisbridge developers
    date:   11 February 2026
*/

#include "ext/descriptor.h"
#include "ext/descriptor_lexer.h"
#include "error.h"
#include "globals.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

const std::string&
DESCRIPTOR::constructor_name() const
{
    if (path.empty())
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MALFORMED_DESCRIPTOR, "descriptor has no constructor name");
    return path.back();
}

std::string
DESCRIPTOR::to_string() const
{
    std::vector<std::string> args;
    for (const auto& x : positional)
        args.push_back(format_argument(x));
    for (const auto& [k, x] : keyword)
        args.push_back(k + "=" + format_argument(x));
    return join(path, ".") + "(" + join(args, ", ") + ")";
}

DESCRIPTOR
parse_descriptor(std::string_view text)
{
    DESCRIPTOR out;

    std::istringstream istrm{std::string{text}};
    DESCRIPTOR_LEXER lexer(istrm, text);
    yy::parser parser(lexer, out);
    int retcode = parser();
    if (retcode != 0)
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MALFORMED_DESCRIPTOR,
                    "failed to parse descriptor \"" + std::string{text} + "\"");
    }
    return out;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string
format_real(double x)
{
    if (std::isnan(x))
        return "nan";
    if (std::isinf(x))
        return x > 0 ? "inf" : "-inf";

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf+sizeof(buf), x);
    std::string out(buf, end);
    if (out.find_first_of(".e") == std::string::npos)
        out += ".0";
    return out;
}

std::string
format_string(std::string_view s)
{
    std::string out{"'"};
    for (char c : s)
    {
        if (c == '\\' || c == '\'')
            out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string
format_argument(const argument_type& x)
{
    if (const auto* i = std::get_if<int64_t>(&x))
        return std::to_string(*i);
    else if (const auto* f = std::get_if<double>(&x))
        return format_real(*f);
    else
        return format_string(std::get<std::string>(x));
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

ARGUMENT_BINDING::ARGUMENT_BINDING(const DESCRIPTOR& d, const std::vector<std::string>& parameter_names)
    :constructor_(d.constructor_name())
{
    if (d.positional.size() > parameter_names.size())
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MALFORMED_DESCRIPTOR,
                    constructor_ + " takes at most " + std::to_string(parameter_names.size())
                    + " arguments, but " + std::to_string(d.positional.size()) + " were given");
    }

    for (size_t i = 0; i < d.positional.size(); i++)
        values_[parameter_names[i]] = d.positional[i];

    for (const auto& [k, x] : d.keyword)
    {
        if (std::find(parameter_names.begin(), parameter_names.end(), k) == parameter_names.end())
        {
            throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MALFORMED_DESCRIPTOR,
                        constructor_ + " got an unexpected keyword argument \"" + k + "\"");
        }
        if (!values_.emplace(k, x).second)
        {
            throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MALFORMED_DESCRIPTOR,
                        constructor_ + " got multiple values for argument \"" + k + "\"");
        }
    }
}

bool
ARGUMENT_BINDING::has(const std::string& name) const
{
    return values_.count(name) > 0;
}

int64_t
ARGUMENT_BINDING::get_int(const std::string& name) const
{
    const auto& x = get(name);
    if (const auto* i = std::get_if<int64_t>(&x))
        return *i;
    throw_wrong_kind(name, "an integer");
}

double
ARGUMENT_BINDING::get_real(const std::string& name) const
{
    const auto& x = get(name);
    if (const auto* f = std::get_if<double>(&x))
        return *f;
    if (const auto* i = std::get_if<int64_t>(&x))
        return static_cast<double>(*i);
    throw_wrong_kind(name, "a number");
}

double
ARGUMENT_BINDING::get_real(const std::string& name, double default_value) const
{
    return has(name) ? get_real(name) : default_value;
}

std::string
ARGUMENT_BINDING::get_string(const std::string& name) const
{
    const auto& x = get(name);
    if (const auto* s = std::get_if<std::string>(&x))
        return *s;
    throw_wrong_kind(name, "a string");
}

std::string
ARGUMENT_BINDING::get_string(const std::string& name, std::string default_value) const
{
    return has(name) ? get_string(name) : default_value;
}

const argument_type&
ARGUMENT_BINDING::get(const std::string& name) const
{
    auto it = values_.find(name);
    if (it == values_.end())
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MALFORMED_DESCRIPTOR,
                    constructor_ + " is missing required argument \"" + name + "\"");
    }
    return it->second;
}

void
ARGUMENT_BINDING::throw_wrong_kind(const std::string& name, std::string_view expected) const
{
    throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MALFORMED_DESCRIPTOR,
                "argument \"" + name + "\" of " + constructor_ + " must be " + std::string{expected}
                + ", got " + format_argument(get(name)));
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
