/*
    author: qcisbridge developers
    date:   10 February 2026
*/

#include "gate_table.h"
#include "error.h"

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::optional<std::string>
find_opcode(const GATE& g)
{
    // measurement is matched on its type alone: the key never selects the opcode
    if (g.type == GATE::TYPE::MEASURE)
        return std::string{MEASURE_OPCODE};

    if (!g.args.empty() || !g.key.empty())
        return std::nullopt;

    for (const auto& [opcode, type] : GATE_TABLE)
    {
        if (type == g.type)
            return std::string{opcode};
    }
    return std::nullopt;
}

std::optional<GATE>
find_gate(std::string_view opcode)
{
    for (const auto& [op, type] : GATE_TABLE)
    {
        if (op == opcode)
            return GATE{type};
    }
    return std::nullopt;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string
to_opcode(const GATE& g)
{
    auto opcode = find_opcode(g);
    if (!opcode.has_value())
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::UNKNOWN_GATE, "gate " + g.to_string() + " has no qcis opcode");
    return *opcode;
}

GATE
to_gate(std::string_view opcode)
{
    auto g = find_gate(opcode);
    if (!g.has_value())
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::UNKNOWN_OPCODE, "qcis opcode \"" + std::string{opcode} + "\" has no gate");
    return *g;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
