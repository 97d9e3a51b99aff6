/*
    author: qcisbridge developers
    date:   12 February 2026
*/

#ifndef QCIS_QCIS_COUPLER_MAP_h
#define QCIS_QCIS_COUPLER_MAP_h

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Couplers are the physical resources that address a qubit pair in
 * two-qubit instructions (`CZ G01`). The pair is unordered: `find_coupler`
 * gives the same result for (a, b) and (b, a).
 * */
class COUPLER_MAP
{
public:
    using qubit_pair_type = std::pair<std::string, std::string>;
    using entry_type = std::tuple<std::string, std::string, std::string>;  // coupler, qubit a, qubit b
private:
    std::map<std::string, qubit_pair_type> qubits_of_;
    std::map<qubit_pair_type, std::string> coupler_of_;
public:
    COUPLER_MAP() =default;
    COUPLER_MAP(std::initializer_list<entry_type>);

    /*
     * Parses a comma-separated list of `coupler:qubit:qubit` entries
     * (i.e., "G01:Q01:Q02,G02:Q02:Q03"). Throws `std::invalid_argument` if
     * an entry is malformed.
     * */
    static COUPLER_MAP from_string(std::string_view);

    // throws `std::invalid_argument` if the coupler or the pair is already registered
    void add(std::string coupler, std::string qubit_a, std::string qubit_b);

    std::optional<std::string>     find_coupler(const std::string& qubit_a, const std::string& qubit_b) const;
    std::optional<qubit_pair_type> find_qubits(const std::string& coupler) const;

    size_t                   size() const;
    std::vector<std::string> couplers() const;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_QCIS_COUPLER_MAP_h
