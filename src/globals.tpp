/*
    author: qcisbridge developers
    date:   9 February 2026
*/

#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

template <class ITER> std::string
join(ITER begin, ITER end, std::string_view sep)
{
    std::string out;
    for (auto it = begin; it != end; ++it)
    {
        if (it != begin)
            out.append(sep);
        out.append(*it);
    }
    return out;
}

template <class CONTAINER> std::string
join(const CONTAINER& c, std::string_view sep)
{
    return join(std::begin(c), std::end(c), sep);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

template <class T> void
print_stat_line(std::ostream& out, std::string_view name, T value)
{
    out << std::setw(48) << std::left << name;
    if constexpr (std::is_floating_point<T>::value)
        out << std::setw(12) << std::right << std::fixed << std::setprecision(3) << value;
    else
        out << std::setw(12) << std::right << value;
    out << "\n";
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
