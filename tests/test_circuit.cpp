/*
    author: qcisbridge developers
    date:   16 February 2026
*/

#include "circuit.h"
#include "ext/dynamical_decoupling.h"
#include "check.h"

#include <memory>
#include <stdexcept>

using namespace qcis;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

namespace
{

const QUBIT Q01 = QUBIT::named("Q01");
const QUBIT Q02 = QUBIT::named("Q02");
const QUBIT Q03 = QUBIT::named("Q03");

OPERATION
_op(GATE::TYPE t, std::vector<QUBIT> qubits)
{
    return OPERATION(GATE{t}, std::move(qubits));
}

}   // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
test_qubits()
{
    CHECK_THROWS_AS(std::invalid_argument, QUBIT::named(""));

    CHECK(QUBIT::grid(0, 1) == QUBIT::grid(0, 1));
    CHECK(!(QUBIT::grid(0, 1) == QUBIT::grid(1, 0)));
    CHECK(QUBIT::grid(0, 1) < QUBIT::grid(0, 2));
    CHECK(QUBIT::grid(0, 5) < QUBIT::grid(1, 0));
    CHECK(QUBIT::grid(9, 9) < Q01);
    CHECK(Q01 < Q02);

    CHECK_EQ(QUBIT::grid(0, 2).to_string(), "q(0, 2)");
    CHECK_EQ(Q01.to_string(), "Q01");
}

void
test_naming_functions()
{
    auto namer = make_qubit_namer({{QUBIT::grid(0, 1), "Q01"}});
    CHECK_EQ(namer(QUBIT::grid(0, 1)), "Q01");
    CHECK_THROWS_AS(std::out_of_range, namer(QUBIT::grid(0, 2)));

    auto resolver = make_name_resolver({{"Q01", QUBIT::grid(0, 1)}});
    CHECK_EQ(resolver("Q01"), QUBIT::grid(0, 1));
    CHECK_THROWS_AS(std::out_of_range, resolver("Q02"));

    CHECK_EQ(named_qubit_namer()(Q02), "Q02");
    CHECK_THROWS_AS(std::invalid_argument, named_qubit_namer()(QUBIT::grid(0, 0)));
    CHECK_EQ(named_qubit_resolver()("Q03"), Q03);
}

void
test_operation_validation()
{
    CHECK_THROWS(INVALID_OPERATION, _op(GATE::TYPE::CZ, {Q01}));
    CHECK_THROWS(INVALID_OPERATION, _op(GATE::TYPE::X, {Q01, Q02}));
    CHECK_THROWS(INVALID_OPERATION, _op(GATE::TYPE::CZ, {Q01, Q01}));
    CHECK_THROWS(INVALID_OPERATION, OPERATION(GATE::measure("m"), {}));
    CHECK_THROWS(INVALID_OPERATION, OPERATION(GATE::measure("m"), {Q01, Q02, Q01}));
    CHECK_THROWS(INVALID_OPERATION, repeat(CIRCUIT{}, 0));
    CHECK_THROWS(INVALID_OPERATION, OPERATION(extension_ptr{}, {Q01}));

    auto dd = std::make_shared<const CPMG>(2, 1000.0);
    CHECK_THROWS(INVALID_OPERATION, OPERATION(dd, {Q01, Q02}));

    // measurements take any number of qubits
    OPERATION m(GATE::measure("Q01,Q02,Q03"), {Q01, Q02, Q03});
    CHECK(m.qubits().size() == 3);
}

void
test_operation_equality()
{
    CHECK(_op(GATE::TYPE::X, {Q01}) == _op(GATE::TYPE::X, {Q01}));
    CHECK(!(_op(GATE::TYPE::X, {Q01}) == _op(GATE::TYPE::Y, {Q01})));
    CHECK(!(_op(GATE::TYPE::X, {Q01}) == _op(GATE::TYPE::X, {Q02})));

    // CZ is symmetric, CX is not
    CHECK(_op(GATE::TYPE::CZ, {Q01, Q02}) == _op(GATE::TYPE::CZ, {Q02, Q01}));
    CHECK(!(_op(GATE::TYPE::CX, {Q01, Q02}) == _op(GATE::TYPE::CX, {Q02, Q01})));

    CHECK(OPERATION(GATE::measure("a"), {Q01}) == OPERATION(GATE::measure("a"), {Q01}));
    CHECK(!(OPERATION(GATE::measure("a"), {Q01}) == OPERATION(GATE::measure("b"), {Q01})));

    // extension gates compare by parameters
    auto a = std::make_shared<const CPMG>(2, 1000.0);
    auto b = std::make_shared<const CPMG>(2, 1000.0, 50.0, "X");
    auto c = std::make_shared<const CPMG>(2, 1000.0, 50.0, "Y");
    CHECK(OPERATION(a, {Q01}) == OPERATION(b, {Q01}));
    CHECK(!(OPERATION(a, {Q01}) == OPERATION(c, {Q01})));
    CHECK(!(OPERATION(a, {Q01}) == _op(GATE::TYPE::X, {Q01})));

    CHECK_EQ(_op(GATE::TYPE::X2P, {Q01}).to_string(), "X2P on Q01");
    CHECK_EQ(OPERATION(GATE::measure("k"), {Q01, Q02}).to_string(), "MEASURE('k') on Q01, Q02");
    CHECK_EQ(OPERATION(GATE{GATE::TYPE::RX, {0.5}}, {Q01}).to_string(), "RX(0.5) on Q01");
    CHECK_EQ(OPERATION(a, {Q01}).to_string(), "DD([X]*4) on Q01");
}

void
test_moments()
{
    MOMENT m;
    m.add(_op(GATE::TYPE::X, {Q01}));
    m.add(_op(GATE::TYPE::CZ, {Q02, Q03}));
    CHECK(m.size() == 2);
    CHECK(m.operates_on({Q03}));
    CHECK(!m.operates_on({QUBIT::named("Q04")}));
    CHECK_THROWS(OVERLAPPING_OPERATION, m.add(_op(GATE::TYPE::Y, {Q02})));
    CHECK_THROWS(OVERLAPPING_OPERATION, MOMENT{_op(GATE::TYPE::X, {Q01}), _op(GATE::TYPE::Y, {Q01})});

    // order-insensitive
    MOMENT a{_op(GATE::TYPE::X, {Q01}), _op(GATE::TYPE::Y, {Q02})};
    MOMENT b{_op(GATE::TYPE::Y, {Q02}), _op(GATE::TYPE::X, {Q01})};
    MOMENT c{_op(GATE::TYPE::Y, {Q02})};
    CHECK(a == b);
    CHECK(!(a == c));
    CHECK(MOMENT{} == MOMENT{});
    CHECK_EQ(a.to_string(), "X on Q01; Y on Q02");
}

void
test_append_places_operations_early()
{
    CIRCUIT c;
    c.append(_op(GATE::TYPE::X, {Q01}));
    c.append(_op(GATE::TYPE::Y, {Q02}));
    CHECK(c.size() == 1);

    c.append(_op(GATE::TYPE::X2P, {Q01}));
    CHECK(c.size() == 2);

    // Q02 is free in moment 1
    c.append(_op(GATE::TYPE::Y2P, {Q02}));
    CHECK(c.size() == 2);
    CHECK(c.moments()[1].size() == 2);

    // a two-qubit gate waits for both of its qubits
    c.append(_op(GATE::TYPE::X, {Q03}));
    CHECK(c.moments()[0].size() == 3);
    c.append(_op(GATE::TYPE::CZ, {Q01, Q03}));
    CHECK(c.size() == 3);

    c.append_moment(MOMENT{});
    CHECK(c.size() == 4);
    c.append(_op(GATE::TYPE::X, {Q02}));
    CHECK(c.size() == 4);
    CHECK(c.moments()[2].size() == 2);
}

void
test_circuit_queries()
{
    CIRCUIT c{
        MOMENT{_op(GATE::TYPE::X, {Q03}), _op(GATE::TYPE::Y, {Q01})},
        MOMENT{},
        MOMENT{_op(GATE::TYPE::CZ, {Q01, Q03})}
    };

    auto qubits = c.all_qubits();
    CHECK(qubits.size() == 2);
    CHECK(qubits[0] == Q01);
    CHECK(qubits[1] == Q03);

    auto mapped = c.transform_qubits([] (const QUBIT& q) { return QUBIT::grid(0, q.name == "Q01" ? 1 : 3); });
    CHECK(mapped.size() == 3);
    CHECK(mapped.moments()[1].empty());
    CHECK(mapped.moments()[2] == MOMENT{_op(GATE::TYPE::CZ, {QUBIT::grid(0, 3), QUBIT::grid(0, 1)})});

    CIRCUIT d = c;
    CHECK(c == d);
    d.append_moment(MOMENT{});
    CHECK(!(c == d));

    CHECK_EQ(CIRCUIT{MOMENT{_op(GATE::TYPE::X, {Q01})}}.to_string(), "moment 0: X on Q01\n");
}

void
test_subcircuits()
{
    CIRCUIT inner{MOMENT{_op(GATE::TYPE::X, {Q02})}, MOMENT{_op(GATE::TYPE::Y, {Q01})}};
    OPERATION r = repeat(inner, 3);

    auto qubits = r.qubits();
    CHECK(qubits.size() == 2);
    CHECK_EQ(r.to_string(), "SUBCIRCUIT(2 moments) x 3");
    CHECK(r == repeat(inner, 3));
    CHECK(!(r == repeat(inner, 2)));
    CHECK(!(r == repeat(CIRCUIT{MOMENT{_op(GATE::TYPE::X, {Q02})}}, 3)));
    CHECK(!(r == _op(GATE::TYPE::X, {Q02})));

    // a sub-circuit blocks all of its qubits
    CIRCUIT c;
    c.append(_op(GATE::TYPE::X, {Q01}));
    c.append(r);
    c.append(_op(GATE::TYPE::X, {Q03}));
    CHECK(c.size() == 2);
    CHECK(c.moments()[0].size() == 2);

    auto mapped = r.transform_qubits([] (const QUBIT& q) { return QUBIT::named(q.name + "x"); });
    CHECK(mapped.qubits()[0] == QUBIT::named("Q01x"));
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main()
{
    test_qubits();
    test_naming_functions();
    test_operation_validation();
    test_operation_equality();
    test_moments();
    test_append_places_operations_early();
    test_circuit_queries();
    test_subcircuits();
    return test::test_exit_code("test_circuit");
}
