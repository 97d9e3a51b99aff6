/*
    author: qcisbridge developers
    date:   11 February 2026
*/

#include "ext/registry.h"
#include "ext/dynamical_decoupling.h"
#include "error.h"
#include "globals.h"

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

const EXTENSION_REGISTRY&
EXTENSION_REGISTRY::defaults()
{
    static const EXTENSION_REGISTRY registry = []
    {
        EXTENSION_REGISTRY r;
        r.add("CPMG", CPMG::from_descriptor);
        r.add("XY", XY::from_descriptor);
        r.add("XYYX", XYYX::from_descriptor);
        return r;
    }();
    return registry;
}

void
EXTENSION_REGISTRY::add(std::string name, builder_type builder)
{
    builders_[std::move(name)] = std::move(builder);
}

bool
EXTENSION_REGISTRY::contains(const std::string& name) const
{
    return builders_.count(name) > 0;
}

extension_ptr
EXTENSION_REGISTRY::build(const DESCRIPTOR& d) const
{
    const std::string& name = d.constructor_name();
    auto it = builders_.find(name);
    if (it == builders_.end())
    {
        auto known = names();
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::UNKNOWN_EXTENSION,
                    "extension gate \"" + name + "\" is not registered (registered: " + join(known, ", ") + ")");
    }

    extension_ptr g = it->second(d);
    if (g == nullptr)
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::UNKNOWN_EXTENSION,
                    "builder for extension gate \"" + name + "\" returned nothing");
    }
    return g;
}

extension_ptr
EXTENSION_REGISTRY::build(std::string_view descriptor) const
{
    return build(parse_descriptor(descriptor));
}

std::vector<std::string>
EXTENSION_REGISTRY::names() const
{
    std::vector<std::string> out;
    out.reserve(builders_.size());
    for (const auto& [name, b] : builders_)
        out.push_back(name);
    return out;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
