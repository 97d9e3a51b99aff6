/*
    author: qcisbridge developers
    date:   9 February 2026
*/

#ifndef QCIS_GLOBALS_h
#define QCIS_GLOBALS_h

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * String helpers shared by the reader, the writer and the tools.
 * */

std::string_view         trim(std::string_view);
std::vector<std::string> split_whitespace(std::string_view);
std::vector<std::string> split(std::string_view, char delim);

template <class ITER> std::string join(ITER begin, ITER end, std::string_view sep);
template <class CONTAINER> std::string join(const CONTAINER&, std::string_view sep);

/*
 * Returns true if `s` is `prefix` followed by one or more decimal digits
 * (i.e., "Q01" for prefix 'Q').
 * */
bool is_indexed_name(std::string_view s, char prefix);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

template <class T> void print_stat_line(std::ostream&, std::string_view, T);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#include "globals.tpp"

#endif  // QCIS_GLOBALS_h
