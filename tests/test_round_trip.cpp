/*
    author: qcisbridge developers
    date:   17 February 2026
*/

#include "qcis/reader.h"
#include "qcis/writer.h"
#include "ext/dynamical_decoupling.h"
#include "check.h"

#include <map>
#include <memory>

using namespace qcis;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

namespace
{

/*
 * A 2x3 grid of qubits named Q01..Q06, with a coupler between every pair of
 * horizontal or vertical neighbors.
 * */
struct DEVICE
{
    std::map<QUBIT, std::string> names;
    std::map<std::string, QUBIT> qubits;
    std::vector<std::string>     blockable;
    std::optional<COUPLER_MAP>   couplers{COUPLER_MAP{}};

    DEVICE()
    {
        for (int64_t r = 0; r < 2; r++)
        {
            for (int64_t c = 0; c < 3; c++)
            {
                std::string name = "Q0" + std::to_string(3*r + c + 1);
                names[QUBIT::grid(r, c)] = name;
                qubits[name] = QUBIT::grid(r, c);
                blockable.push_back(name);
            }
        }
        blockable.push_back("R01");

        int g{1};
        auto add = [this, &g] (QUBIT a, QUBIT b)
        {
            couplers->add("G0" + std::to_string(g++), names.at(a), names.at(b));
        };
        for (int64_t r = 0; r < 2; r++)
        {
            add(QUBIT::grid(r, 0), QUBIT::grid(r, 1));
            add(QUBIT::grid(r, 1), QUBIT::grid(r, 2));
        }
        for (int64_t c = 0; c < 3; c++)
            add(QUBIT::grid(0, c), QUBIT::grid(1, c));
    }

    CIRCUIT
    round_trip(const CIRCUIT& c) const
    {
        auto text = circuit_to_qcis(c, make_qubit_namer(names), blockable, couplers);
        return qcis_to_circuit(text, make_name_resolver(qubits), couplers);
    }
};

OPERATION
_op(GATE::TYPE t, std::vector<QUBIT> qubits)
{
    return OPERATION(GATE{t}, std::move(qubits));
}

}   // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
test_table_gates_round_trip()
{
    DEVICE dev;
    auto g = [] (int64_t r, int64_t c) { return QUBIT::grid(r, c); };

    CIRCUIT c{
        MOMENT{_op(GATE::TYPE::X, {g(0, 0)}), _op(GATE::TYPE::Y, {g(0, 1)}), _op(GATE::TYPE::X2P, {g(0, 2)}),
                _op(GATE::TYPE::X2M, {g(1, 0)}), _op(GATE::TYPE::Y2P, {g(1, 1)}), _op(GATE::TYPE::Y2M, {g(1, 2)})},
        MOMENT{_op(GATE::TYPE::CZ, {g(0, 0), g(0, 1)}), _op(GATE::TYPE::CZ, {g(1, 2), g(0, 2)})},
        MOMENT{_op(GATE::TYPE::Y2P, {g(1, 1)})},
        MOMENT{_op(GATE::TYPE::CZ, {g(1, 1), g(1, 0)}), _op(GATE::TYPE::X, {g(0, 1)})},
        MOMENT{OPERATION(GATE::measure("Q01,Q02,Q06"), {g(0, 0), g(0, 1), g(1, 2)}),
                OPERATION(GATE::measure("Q04"), {g(1, 0)})}
    };
    CHECK_EQ(dev.round_trip(c), c);
}

void
test_round_trip_is_stable_on_text()
{
    DEVICE dev;
    std::string text =
        "X2P Q01\n"
        "Y2M Q05\n"
        "B Q01 Q02 Q03 Q04 Q05 Q06 R01\n"
        "CZ G01\n"
        "B Q01 Q02 Q03 Q04 Q05 Q06 R01\n"
        "M Q01 Q02\n"
        "B Q01 Q02 Q03 Q04 Q05 Q06 R01\n";

    auto c = qcis_to_circuit(text, make_name_resolver(dev.qubits), dev.couplers);
    CHECK_EQ(circuit_to_qcis(c, make_qubit_namer(dev.names), dev.blockable, dev.couplers), text);
}

void
test_repetitions_flatten()
{
    DEVICE dev;
    CIRCUIT body{
        MOMENT{_op(GATE::TYPE::X2P, {QUBIT::grid(0, 0)})},
        MOMENT{_op(GATE::TYPE::CZ, {QUBIT::grid(0, 0), QUBIT::grid(1, 0)})}
    };
    CIRCUIT c{MOMENT{repeat(body, 3)}};

    // the reader has no notion of repetition, so the result is the unrolled circuit
    CIRCUIT unrolled;
    for (int i = 0; i < 3; i++)
        unrolled.extend(body);
    CHECK_EQ(dev.round_trip(c), unrolled);
}

void
test_extension_gates_round_trip()
{
    DEVICE dev;
    CIRCUIT c{
        MOMENT{_op(GATE::TYPE::Y2P, {QUBIT::grid(0, 0)})},
        MOMENT{OPERATION(GATE::measure("Q01"), {QUBIT::grid(0, 0)}),
                OPERATION(std::make_shared<const CPMG>(2, 1000.0), {QUBIT::grid(0, 1)}),
                OPERATION(std::make_shared<const XY>(3, 2000.0, 30.0), {QUBIT::grid(1, 1)}),
                OPERATION(std::make_shared<const XYYX>(2, 1000.0), {QUBIT::grid(1, 2)})},
        MOMENT{OPERATION(std::make_shared<const CPMG>(1, 333.3, 25.0, "Y"), {QUBIT::grid(0, 0)})}
    };
    CHECK_EQ(dev.round_trip(c), c);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main()
{
    test_table_gates_round_trip();
    test_round_trip_is_stable_on_text();
    test_repetitions_flatten();
    test_extension_gates_round_trip();
    return test::test_exit_code("test_round_trip");
}
