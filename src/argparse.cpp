/*
    author: qcisbridge developers
    date:   14 February 2026
*/

#include "argparse.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

namespace
{

[[noreturn]] void
_die_with_error(const std::string& msg, const std::string& usage)
{
    std::cerr << usage << "\n";
    throw std::runtime_error(msg);
}

}   // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ARGPARSE::parse(int argc, char** argv)
{
    std::string usage = "usage: " + std::string{argv[0]} + usage_strm_.str() + " [options]"
                        + "\n\nOPTIONS ---------------------------------------\n"
                        + options_strm_.str();

    size_t required_idx{0};
    for (int i = 1; i < argc; ++i)
    {
        std::string x{argv[i]};

        if (x == "-h" || x == "--help")
        {
            std::cout << usage << "\n";
            exit(0);
        }

        // negative numbers are values, not options
        bool looks_like_option = x.size() > 1 && x.front() == '-' && !std::isdigit(static_cast<unsigned char>(x[1]));

        if (required_idx < required_arguments_.size() && !looks_like_option)
        {
            const auto& [name, description, ptr, type] = required_arguments_[required_idx];
            try
            {
                read_argument_and_write_to_ptr(x, ptr, type);
            }
            catch (const std::logic_error&)
            {
                _die_with_error("bad value `" + x + "` for argument `" + std::string{name} + "`", usage);
            }
            required_idx++;
            continue;
        }

        if (!looks_like_option)
            _die_with_error("expected optional argument but got `" + x + "`", usage);

        bool is_long_option = (x[1] == '-');
        auto opt_it = std::find_if(optional_arguments_.begin(), optional_arguments_.end(),
                                    [&x, is_long_option] (const auto& arg)
                                    {
                                        return is_long_option ? arg.full_name == x : arg.flag_name == x;
                                    });
        if (opt_it == optional_arguments_.end())
            _die_with_error("unknown optional argument: " + x, usage);

        const auto& [flag_name, full_name, description, ptr, type] = *opt_it;
        if (type == ARGPARSE::TYPE_INFO::FLAG)
        {
            *static_cast<bool*>(ptr) = true;
            continue;
        }

        if (i+1 >= argc)
            _die_with_error("option `" + x + "` expects a value", usage);

        std::string value{argv[++i]};
        try
        {
            read_argument_and_write_to_ptr(value, ptr, type);
        }
        catch (const std::logic_error&)
        {
            _die_with_error("bad value `" + value + "` for option `" + x + "`", usage);
        }
    }

    if (required_idx < required_arguments_.size())
    {
        _die_with_error("expected "
                + std::to_string(required_arguments_.size() - required_idx) + " more required arguments",
                usage);
    }
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
read_argument_and_write_to_ptr(const std::string& arg, void* ptr, ARGPARSE::TYPE_INFO type)
{
    switch (type)
    {
    case ARGPARSE::TYPE_INFO::STRING:
        *static_cast<std::string*>(ptr) = arg;
        break;

    case ARGPARSE::TYPE_INFO::INT:
        *static_cast<int64_t*>(ptr) = std::stoll(arg);
        break;

    case ARGPARSE::TYPE_INFO::FLOAT:
        *static_cast<double*>(ptr) = std::stod(arg);
        break;

    case ARGPARSE::TYPE_INFO::LIST:
        {
            auto& out = *static_cast<std::vector<std::string>*>(ptr);
            out.clear();
            for (const auto& x : split(arg, ','))
            {
                auto t = trim(x);
                if (!t.empty())
                    out.emplace_back(t);
            }
        }
        break;

    default:
        throw std::runtime_error("flag is unexpected -- should be resolved earlier.");
    }
}

std::string_view
argparse_type_name(ARGPARSE::TYPE_INFO type)
{
    switch (type)
    {
    case ARGPARSE::TYPE_INFO::STRING:   return "string";
    case ARGPARSE::TYPE_INFO::INT:      return "int";
    case ARGPARSE::TYPE_INFO::FLOAT:    return "float";
    case ARGPARSE::TYPE_INFO::FLAG:     return "bool";
    case ARGPARSE::TYPE_INFO::LIST:     return "list";
    }
    return "?";
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
