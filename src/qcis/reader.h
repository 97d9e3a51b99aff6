/*
    author: qcisbridge developers
    date:   13 February 2026
*/

#ifndef QCIS_QCIS_READER_h
#define QCIS_QCIS_READER_h

#include "circuit.h"
#include "ext/registry.h"
#include "qcis/coupler_map.h"

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Reads QCIS text into a circuit on named qubits (i.e., QUBIT::named("Q01")).
 *
 * Instructions between two barriers form one step. A step becomes one or
 * more moments: each instruction is placed as early as possible within
 * the step, so two instructions on the same qubit spill into a second
 * moment. A barrier with no instructions before it becomes an empty moment.
 *
 * Each READER reads one text, and `read()` can only be called once.
 * */
class READER
{
public:
    enum class STATE { NORMAL, IN_CONTEXT };

    using line_type = std::pair<size_t, std::string>;  // (line number, trimmed text)
private:
    const std::optional<COUPLER_MAP>& couplers_;
    const std::vector<std::string>&   ignored_prefixes_;
    const EXTENSION_REGISTRY&         registry_;

    std::deque<line_type> buffer_;
    STATE                 state_{STATE::NORMAL};
    bool                  consumed_{false};

    CIRCUIT circuit_;
    CIRCUIT step_;
    bool    last_was_barrier_{true};

    // state of the context block being read:
    size_t                     context_start_line_{0};
    std::optional<std::string> context_descriptor_;
    std::vector<std::string>   context_targets_;
public:
    READER(std::string_view text,
            const std::optional<COUPLER_MAP>&,
            const std::vector<std::string>& ignored_prefixes,
            const EXTENSION_REGISTRY&);

    CIRCUIT read();

    STATE state() const { return state_; }
private:
    void read_normal_line(const line_type&);
    void read_context_line(const line_type&);

    void read_instruction(const line_type&);
    void finish_context();
    void commit_step();

    bool is_ignored(const std::string&) const;
};

/*
 * Parses the list in a `# Targets:` line, i.e., "['Q01', 'Q02']". Names may
 * be single- or double-quoted.
 * */
std::vector<std::string> parse_target_list(std::string_view);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Translates QCIS text into a circuit. Qubit names are resolved through
 * `name_to_qubit` only after the whole text has been read.
 *
 * `couplers` is required if the text contains coupler instructions
 * (`MISSING_COUPLER` otherwise). Lines starting with any of `ignored` are
 * skipped. Extension gate blocks are rebuilt through `registry`.
 * */
CIRCUIT qcis_to_circuit(std::string_view text,
                        const name_to_qubit_fn& name_to_qubit,
                        const std::optional<COUPLER_MAP>& couplers=std::nullopt,
                        const std::vector<std::string>& ignored={},
                        const EXTENSION_REGISTRY& registry=EXTENSION_REGISTRY::defaults());

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_QCIS_READER_h
