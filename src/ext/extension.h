/*
    author: qcisbridge developers
    date:   10 February 2026
*/

#ifndef QCIS_EXT_EXTENSION_h
#define QCIS_EXT_EXTENSION_h

#include <memory>
#include <string>
#include <vector>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * An `EXTENSION_GATE` is any gate that the gate table does not know about
 * but that knows how to write itself out as QCIS.
 *
 * The writer wraps the lines returned by `emit_qcis` in a context block that
 * also records `descriptor()`, so the reader can rebuild the gate through
 * the extension registry. `descriptor()` must therefore parse back into an
 * equal gate.
 * */
class EXTENSION_GATE
{
public:
    virtual ~EXTENSION_GATE() =default;

    // constructor name as registered in `EXTENSION_REGISTRY` (i.e., "CPMG")
    virtual std::string name() const =0;

    // i.e., "qcis.CPMG(num_pi_pair=2, total_duration_ns=1000.0, ...)"
    virtual std::string descriptor() const =0;

    virtual size_t num_qubits() const =0;

    /*
     * Returns the QCIS lines (without trailing newlines) implementing the gate
     * on `targets`. Lines may include barriers.
     * */
    virtual std::vector<std::string> emit_qcis(const std::vector<std::string>& targets) const =0;

    virtual bool equals(const EXTENSION_GATE&) const =0;

    virtual std::string diagram_label() const =0;
};

using extension_ptr = std::shared_ptr<const EXTENSION_GATE>;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_EXT_EXTENSION_h
