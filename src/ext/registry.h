/*
    author: qcisbridge developers
    date:   11 February 2026
*/

#ifndef QCIS_EXT_REGISTRY_h
#define QCIS_EXT_REGISTRY_h

#include "ext/descriptor.h"
#include "ext/extension.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Maps constructor names (the last component of a descriptor path) to
 * builders. The reader only ever constructs extension gates through a
 * registry, so the set of gates that can appear in QCIS text is exactly
 * the set registered here.
 * */
class EXTENSION_REGISTRY
{
public:
    using builder_type = std::function<extension_ptr(const DESCRIPTOR&)>;
private:
    std::map<std::string, builder_type> builders_;
public:
    EXTENSION_REGISTRY() =default;

    // CPMG, XY, and XYYX
    static const EXTENSION_REGISTRY& defaults();

    // replaces any builder already registered under `name`
    void add(std::string name, builder_type);

    bool contains(const std::string& name) const;

    // throws `UNKNOWN_EXTENSION` if the constructor name is not registered
    extension_ptr build(const DESCRIPTOR&) const;
    extension_ptr build(std::string_view descriptor) const;

    std::vector<std::string> names() const;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_EXT_REGISTRY_h
