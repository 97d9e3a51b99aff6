/*
    author: qcisbridge developers
    date:   16 February 2026
*/

#include "gate_table.h"
#include "check.h"

using namespace qcis;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
test_table_is_a_bijection()
{
    for (const auto& [opcode, type] : GATE_TABLE)
    {
        GATE g = to_gate(opcode);
        CHECK(g.type == type);
        CHECK_EQ(to_opcode(g), std::string{opcode});
    }
}

void
test_native_opcodes()
{
    CHECK_EQ(to_opcode(GATE{GATE::TYPE::X2P}), "X2P");
    CHECK_EQ(to_opcode(GATE{GATE::TYPE::Y2M}), "Y2M");
    CHECK_EQ(to_opcode(GATE{GATE::TYPE::CZ}), "CZ");
    CHECK(to_gate("Y").type == GATE::TYPE::Y);
    CHECK(to_gate("X2M").type == GATE::TYPE::X2M);
}

void
test_measurement_is_keyed_by_type()
{
    // any key selects "M"
    CHECK_EQ(to_opcode(GATE::measure("m")), "M");
    CHECK_EQ(to_opcode(GATE::measure("Q01,Q02")), "M");

    auto g = find_gate(MEASURE_OPCODE);
    CHECK(g.has_value());
    CHECK(g->type == GATE::TYPE::MEASURE);
    CHECK(g->key.empty());
}

void
test_unknown_gates_and_opcodes()
{
    CHECK(!find_opcode(GATE{GATE::TYPE::H}).has_value());
    CHECK(!find_opcode(GATE{GATE::TYPE::CX}).has_value());
    CHECK(!find_opcode(GATE{GATE::TYPE::RX, {0.5}}).has_value());
    CHECK_THROWS(UNKNOWN_GATE, to_opcode(GATE{GATE::TYPE::Z}));

    // parameterized versions of table gates are not table gates
    CHECK(!find_opcode(GATE{GATE::TYPE::X, {0.25}}).has_value());

    CHECK(!find_gate("CNOT").has_value());
    CHECK(!find_gate("x2p").has_value());
    CHECK_THROWS(UNKNOWN_OPCODE, to_gate("Z"));

    // structural opcodes are not in the table
    CHECK_THROWS(UNKNOWN_OPCODE, to_gate(BARRIER_OPCODE));
    CHECK_THROWS(UNKNOWN_OPCODE, to_gate(IDLE_OPCODE));
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main()
{
    test_table_is_a_bijection();
    test_native_opcodes();
    test_measurement_is_keyed_by_type();
    test_unknown_gates_and_opcodes();
    return test::test_exit_code("test_gate_table");
}
