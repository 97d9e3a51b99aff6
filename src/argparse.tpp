/*
    author: qcisbridge developers
    date:   14 February 2026
*/

#include "globals.h"

#include <iomanip>
#include <stdexcept>
#include <type_traits>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

template <class T> constexpr ARGPARSE::TYPE_INFO
argparse_get_type_info()
{
    if constexpr (std::is_same<T, std::string>::value)
        return ARGPARSE::TYPE_INFO::STRING;
    else if constexpr (std::is_same<T, int64_t>::value)
        return ARGPARSE::TYPE_INFO::INT;
    else if constexpr (std::is_same<T, double>::value)
        return ARGPARSE::TYPE_INFO::FLOAT;
    else if constexpr (std::is_same<T, std::vector<std::string>>::value)
        return ARGPARSE::TYPE_INFO::LIST;
    else
        return ARGPARSE::TYPE_INFO::FLAG;
}

template <class T> constexpr void
argparse_check_valid_type()
{
    constexpr bool type_is_ok = std::is_same<T, std::string>::value
                                || std::is_same<T, int64_t>::value
                                || std::is_same<T, double>::value
                                || std::is_same<T, bool>::value
                                || std::is_same<T, std::vector<std::string>>::value;
    static_assert(type_is_ok,
        "invalid type for argparse, only valid types are std::string, int64_t, double, bool, and std::vector<std::string>");
}

template <class T> std::string
_argparse_default_string(const T& x)
{
    if constexpr (std::is_same<T, std::vector<std::string>>::value)
    {
        return x.empty() ? std::string{"(none)"} : join(x, ",");
    }
    else if constexpr (std::is_same<T, bool>::value)
    {
        return x ? "true" : "false";
    }
    else
    {
        std::ostringstream strm;
        strm << x;
        return strm.str();
    }
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

template <class T> ARGPARSE&
ARGPARSE::required(std::string_view name, std::string_view description, T& ref)
{
    if (optional_arguments_.size() > 0)
        throw std::runtime_error("required arguments must be added before optional arguments");

    argparse_check_valid_type<T>();
    static_assert(!std::is_same<T, bool>::value, "argparse: a required argument cannot be a flag");

    constexpr TYPE_INFO type = argparse_get_type_info<T>();
    required_arguments_.push_back({name, description, static_cast<void*>(&ref), type});

    usage_strm_ << " <" << name << ">";
    options_strm_ << std::setw(32) << std::left << name
                << std::setw(64) << std::left << description
                << std::setw(8) << std::left << argparse_type_name(type)
                << "required\n";

    return *this;
}

template <class T, class DT> ARGPARSE&
ARGPARSE::optional(std::string_view flag_name,
                        std::string_view full_name,
                        std::string_view description,
                        T& ref,
                        DT default_value)
{
    argparse_check_valid_type<T>();

    ref = static_cast<T>(default_value);

    constexpr TYPE_INFO type = argparse_get_type_info<T>();
    optional_arguments_.push_back({flag_name, full_name, description, static_cast<void*>(&ref), type});

    std::string name_string;
    if (flag_name.empty())
        name_string = std::string{full_name};
    else if (full_name.empty())
        name_string = std::string{flag_name};
    else
        name_string = std::string{flag_name} + ", " + std::string{full_name};

    options_strm_ << std::setw(32) << std::left << name_string
                << std::setw(64) << std::left << description
                << std::setw(8) << std::left << argparse_type_name(type)
                << "optional, default: " << _argparse_default_string(ref)
                << "\n";

    return *this;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
