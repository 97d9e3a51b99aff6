/*
    author: qcisbridge developers
    date:   9 February 2026
*/

#include "globals.h"

#include <algorithm>
#include <cctype>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string_view
trim(std::string_view s)
{
    auto is_space = [] (char c) { return std::isspace(static_cast<unsigned char>(c)); };
    while (!s.empty() && is_space(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))
        s.remove_suffix(1);
    return s;
}

std::vector<std::string>
split_whitespace(std::string_view s)
{
    std::vector<std::string> out;
    size_t i{0};
    while (i < s.size())
    {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
            i++;
        size_t j{i};
        while (j < s.size() && !std::isspace(static_cast<unsigned char>(s[j])))
            j++;
        if (j > i)
            out.emplace_back(s.substr(i, j-i));
        i = j;
    }
    return out;
}

std::vector<std::string>
split(std::string_view s, char delim)
{
    std::vector<std::string> out;
    size_t start{0};
    while (true)
    {
        size_t end = s.find(delim, start);
        out.emplace_back(s.substr(start, end == std::string_view::npos ? std::string_view::npos : end-start));
        if (end == std::string_view::npos)
            break;
        start = end+1;
    }
    return out;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

bool
is_indexed_name(std::string_view s, char prefix)
{
    if (s.size() < 2 || s.front() != prefix)
        return false;
    return std::all_of(s.begin()+1, s.end(), [] (char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
