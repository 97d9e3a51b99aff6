/*
    author: qcisbridge developers
    date:   12 February 2026
*/

#ifndef QCIS_QCIS_WRITER_h
#define QCIS_QCIS_WRITER_h

#include "circuit.h"
#include "qcis/coupler_map.h"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Gates and operations the writer skips instead of failing on. An
 * operation is ignored if its gate type is in the set, or if its gate or
 * the operation itself is equal to one in the set.
 *
 * The ignore set is only consulted for operations that have no other way
 * to be written, so ignoring a gate table gate has no effect.
 * */
class IGNORE_SET
{
private:
    std::set<GATE::TYPE>   types_;
    std::vector<GATE>      gates_;
    std::vector<OPERATION> operations_;
public:
    IGNORE_SET() =default;

    // noise channels and annotations
    static IGNORE_SET defaults();

    IGNORE_SET& add(GATE::TYPE);
    IGNORE_SET& add(GATE);
    IGNORE_SET& add(OPERATION);
    IGNORE_SET& merge(const IGNORE_SET&);

    bool matches(const OPERATION&) const;
    bool empty() const;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Translates circuits into QCIS lines, one moment at a time. Every moment
 * that produced output is followed by a barrier over all blockable
 * resources, unless the moment already ended with barriers of its own
 * (i.e., from an extension gate or a sub-circuit).
 *
 * Sub-circuits are translated once by a child writer, and its lines are
 * then copied `repetitions` times.
 * */
class WRITER
{
private:
    const qubit_to_name_fn&           qubit_to_name_;
    const std::vector<std::string>&   blockable_;
    const std::optional<COUPLER_MAP>& couplers_;
    const IGNORE_SET&                 ignored_;

    std::vector<std::string> lines_;
    size_t                   barrier_count_{0};
public:
    WRITER(const qubit_to_name_fn&,
            const std::vector<std::string>& blockable,
            const std::optional<COUPLER_MAP>&,
            const IGNORE_SET&);

    void write(const CIRCUIT&);
    void write(const MOMENT&);

    const std::vector<std::string>& lines() const;
    size_t                          barrier_count() const;

    // lines joined by '\n', with a trailing '\n'
    std::string str() const;
private:
    void emit(std::string);
    void emit_barrier();

    void write_operation(const OPERATION&);
    void write_gate_operation(const OPERATION&, const GATE_OPERATION&);
    void write_extension_operation(const EXTENSION_OPERATION&);
    void write_subcircuit_operation(const SUBCIRCUIT_OPERATION&);

    std::vector<std::string> resolve_targets(const std::vector<QUBIT>&) const;
    std::string              resolve_coupler(const std::vector<QUBIT>&) const;
};

bool is_barrier(std::string_view line);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Translates `circuit` into QCIS text.
 *
 * `qubit_to_name` must be total over the qubits of the circuit. `blockable`
 * lists every resource named in barriers. `couplers` is required if the
 * circuit contains CZ gates (`MISSING_COUPLER` otherwise). `ignored` is
 * merged with `IGNORE_SET::defaults()`.
 *
 * Operations that can't be written and aren't ignored throw
 * `UNCONVERTIBLE_OPERATION`.
 * */
std::string circuit_to_qcis(const CIRCUIT&,
                            const qubit_to_name_fn& qubit_to_name,
                            const std::vector<std::string>& blockable,
                            const std::optional<COUPLER_MAP>& couplers=std::nullopt,
                            const std::optional<IGNORE_SET>& ignored=std::nullopt);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_QCIS_WRITER_h
