/*
    author: qcisbridge developers
    date:   10 February 2026
*/

#ifndef QCIS_GATE_TABLE_h
#define QCIS_GATE_TABLE_h

#include "circuit.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * The fixed opcode <-> gate bijection. `B` (barrier) and `I` (idle) are
 * structural and are not in the table.
 * */
constexpr std::pair<std::string_view, GATE::TYPE> GATE_TABLE[] =
{
    {"X",   GATE::TYPE::X},
    {"Y",   GATE::TYPE::Y},
    {"X2P", GATE::TYPE::X2P},
    {"X2M", GATE::TYPE::X2M},
    {"Y2P", GATE::TYPE::Y2P},
    {"Y2M", GATE::TYPE::Y2M},
    {"CZ",  GATE::TYPE::CZ},
    {"M",   GATE::TYPE::MEASURE}
};

constexpr std::string_view MEASURE_OPCODE{"M"};
constexpr std::string_view BARRIER_OPCODE{"B"};
constexpr std::string_view IDLE_OPCODE{"I"};

/*
 * `find_opcode` returns std::nullopt when the gate has no opcode. A
 * measurement maps to "M" for any key. Parameterized gates never match.
 * */
std::optional<std::string> find_opcode(const GATE&);

/*
 * `find_gate` returns std::nullopt for unknown opcodes. The gate returned
 * for "M" has an empty key: the reader fills it in from the targets.
 * */
std::optional<GATE> find_gate(std::string_view opcode);

// throwing versions (`UNKNOWN_GATE` and `UNKNOWN_OPCODE`)
std::string to_opcode(const GATE&);
GATE        to_gate(std::string_view opcode);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_GATE_TABLE_h
