/*
    author: qcisbridge developers
    date:   10 February 2026
*/

#ifndef QCIS_CIRCUIT_h
#define QCIS_CIRCUIT_h

#include "ext/extension.h"

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * A qubit is either a grid qubit (row, col) or a named qubit. Named qubits
 * are what the reader produces before late binding, so they carry the QCIS
 * name (i.e., "Q01") verbatim.
 * */
struct QUBIT
{
    int64_t     row{0};
    int64_t     col{0};
    std::string name{};

    static QUBIT grid(int64_t row, int64_t col);
    static QUBIT named(std::string);

    bool is_named() const;

    bool operator==(const QUBIT&) const;
    bool operator<(const QUBIT&) const;

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream&, const QUBIT&);

using qubit_to_name_fn = std::function<std::string(const QUBIT&)>;
using name_to_qubit_fn = std::function<QUBIT(const std::string&)>;
using qubit_map_fn = std::function<QUBIT(const QUBIT&)>;

/*
 * Convenience naming functions. Lookups of unmapped entries throw
 * `std::out_of_range` -- mapping is the caller's responsibility.
 * */
qubit_to_name_fn make_qubit_namer(std::map<QUBIT, std::string>);
name_to_qubit_fn make_name_resolver(std::map<std::string, QUBIT>);

// identity naming for named qubits (grid qubits throw `std::invalid_argument`)
qubit_to_name_fn named_qubit_namer();
name_to_qubit_fn named_qubit_resolver();

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

struct GATE
{
    // `num_qubits()` returns this for gates that take any number of qubits.
    constexpr static size_t ANY_ARITY{std::numeric_limits<size_t>::max()};

    enum class TYPE
    {
        // QCIS native:
        X, Y,
        X2P, X2M,           // X**0.5, X**-0.5
        Y2P, Y2M,           // Y**0.5, Y**-0.5
        CZ,
        MEASURE,

        // not native, but representable:
        Z, H, S, T,
        CX,
        RX, RY, RZ,

        // noise channels:
        DEPOLARIZE,
        ASYMMETRIC_DEPOLARIZE,
        TWO_QUBIT_ASYMMETRIC_DEPOLARIZE,

        // annotations:
        DETECTOR,
        OBSERVABLE_INCLUDE,
        SHIFT_COORDS
    };

    TYPE                type;
    std::vector<double> args{};  // rotation angle, noise probabilities, coordinates
    std::string         key{};   // measurement key (only for `MEASURE`)

    static GATE measure(std::string key);

    size_t num_qubits() const;

    bool operator==(const GATE&) const;

    std::string to_string() const;
};

std::string_view gate_type_name(GATE::TYPE);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

class CIRCUIT;

struct GATE_OPERATION
{
    GATE               gate;
    std::vector<QUBIT> qubits;
};

struct EXTENSION_OPERATION
{
    extension_ptr      gate;
    std::vector<QUBIT> qubits;
};

struct SUBCIRCUIT_OPERATION
{
    std::shared_ptr<const CIRCUIT> circuit;
    uint64_t                       repetitions{1};
};

/*
 * An operation is exactly one of the three alternatives above. The
 * translators dispatch on the alternative with `std::visit`.
 *
 * Construction validates the operation: a gate must be given as many
 * qubits as it acts on, no qubit may appear twice, and sub-circuits must
 * repeat at least once. Violations throw `INVALID_OPERATION`.
 * */
class OPERATION
{
public:
    using variant_type = std::variant<GATE_OPERATION, EXTENSION_OPERATION, SUBCIRCUIT_OPERATION>;
private:
    variant_type value_;
public:
    OPERATION(GATE, std::vector<QUBIT>);
    OPERATION(extension_ptr, std::vector<QUBIT>);
    OPERATION(std::shared_ptr<const CIRCUIT>, uint64_t repetitions);

    const variant_type& value() const;

    std::vector<QUBIT> qubits() const;

    OPERATION transform_qubits(const qubit_map_fn&) const;

    bool operator==(const OPERATION&) const;

    std::string to_string() const;
};

// shorthand for `OPERATION(std::make_shared<const CIRCUIT>(c), repetitions)`
OPERATION repeat(CIRCUIT, uint64_t repetitions);

std::ostream& operator<<(std::ostream&, const OPERATION&);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * A moment is a set of operations on disjoint qubits. Adding an operation
 * that overlaps with an existing one throws `OVERLAPPING_OPERATION`.
 * */
class MOMENT
{
private:
    std::vector<OPERATION> operations_;
public:
    MOMENT() =default;
    MOMENT(std::initializer_list<OPERATION>);
    MOMENT(std::vector<OPERATION>);

    void add(OPERATION);
    bool operates_on(const std::vector<QUBIT>&) const;

    const std::vector<OPERATION>& operations() const;
    size_t size() const;
    bool   empty() const;

    std::vector<OPERATION>::const_iterator begin() const;
    std::vector<OPERATION>::const_iterator end() const;

    // order-insensitive
    bool operator==(const MOMENT&) const;

    std::string to_string() const;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

class CIRCUIT
{
private:
    std::vector<MOMENT> moments_;
public:
    CIRCUIT() =default;
    CIRCUIT(std::initializer_list<MOMENT>);
    CIRCUIT(std::vector<MOMENT>);

    /*
     * Places the operation in the moment right after the last moment that
     * touches any of its qubits (or creates a new moment at the end).
     * */
    void append(OPERATION);
    void append_moment(MOMENT);
    void extend(const CIRCUIT&);

    const std::vector<MOMENT>& moments() const;
    size_t size() const;
    bool   empty() const;

    std::vector<MOMENT>::const_iterator begin() const;
    std::vector<MOMENT>::const_iterator end() const;

    // sorted, without duplicates
    std::vector<QUBIT> all_qubits() const;

    CIRCUIT transform_qubits(const qubit_map_fn&) const;

    bool operator==(const CIRCUIT&) const;

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream&, const CIRCUIT&);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_CIRCUIT_h
