/*
    author: qcisbridge developers
    date:   11 February 2026
*/

#ifndef QCIS_EXT_DESCRIPTOR_h
#define QCIS_EXT_DESCRIPTOR_h

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

using argument_type = std::variant<int64_t, double, std::string>;

/*
 * A parsed `# Gate:` line, i.e., for
 *
 *      qcis.CPMG(2, total_duration_ns=1000.0, pi_gate='Y')
 *
 * `path` is {"qcis", "CPMG"}, `positional` is {2}, and `keyword` holds the
 * other two arguments in order. Only literals are allowed as arguments:
 * the descriptor is data, and is never evaluated.
 * */
struct DESCRIPTOR
{
    std::vector<std::string>                           path;
    std::vector<argument_type>                         positional;
    std::vector<std::pair<std::string, argument_type>> keyword;

    const std::string& constructor_name() const;

    std::string to_string() const;
};

/*
 * Parses a descriptor string with the bison grammar in `descriptor.y`.
 * Any syntax error throws `MALFORMED_DESCRIPTOR`.
 * */
DESCRIPTOR parse_descriptor(std::string_view);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Formatting helpers for writing descriptors. `format_real` produces the
 * shortest string that parses back to the same double and always marks it
 * as real (1000 -> "1000.0"). `format_string` single-quotes and escapes.
 * */
std::string format_real(double);
std::string format_string(std::string_view);
std::string format_argument(const argument_type&);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Binds the arguments of a descriptor to the parameter names of a
 * constructor, as a call `f(*positional, **keyword)` would. The typed
 * getters check the kind of each argument. All failures throw
 * `MALFORMED_DESCRIPTOR`:
 *  (1) too many positional arguments,
 *  (2) an unknown or duplicate keyword,
 *  (3) a missing required parameter (a getter without a default),
 *  (4) a value of the wrong kind. Integers are accepted for reals, but
 *      reals are never accepted for integers.
 * */
class ARGUMENT_BINDING
{
private:
    std::string                          constructor_;
    std::map<std::string, argument_type> values_;
public:
    ARGUMENT_BINDING(const DESCRIPTOR&, const std::vector<std::string>& parameter_names);

    bool has(const std::string&) const;

    int64_t     get_int(const std::string&) const;
    double      get_real(const std::string&) const;
    double      get_real(const std::string&, double default_value) const;
    std::string get_string(const std::string&) const;
    std::string get_string(const std::string&, std::string default_value) const;
private:
    const argument_type& get(const std::string&) const;
    [[noreturn]] void    throw_wrong_kind(const std::string&, std::string_view expected) const;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_EXT_DESCRIPTOR_h
