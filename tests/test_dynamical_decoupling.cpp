/*
    author: qcisbridge developers
    date:   16 February 2026
*/

#include "ext/dynamical_decoupling.h"
#include "check.h"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace qcis;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
test_cpmg_timing()
{
    CPMG dd(2, 1000.0, 50.0, "X");

    // floor(floor(1000/4) - 50) / 2
    CHECK(dd.idle_before_after_pulse_ns() == 100.0);

    std::vector<std::string> expected{
        "I Q00 100",
        "X Q00", "I Q00 200",
        "X Q00", "I Q00 200",
        "X Q00", "I Q00 200",
        "X Q00",
        "I Q00 100"
    };
    CHECK(dd.emit_qcis({"Q00"}) == expected);

    CPMG dd_y(2, 1000.0, 50.0, "Y");
    auto lines = dd_y.emit_qcis({"Q07"});
    CHECK(lines.size() == 9);
    CHECK_EQ(lines[1], "Y Q07");
    CHECK_EQ(lines[7], "Y Q07");
}

void
test_xyyx_timing_is_truncated()
{
    XYYX dd(2, 1000.0);

    // floor(1000/8) = 125, (125 - 50) / 2 = 37.5
    CHECK(dd.idle_before_after_pulse_ns() == 37.5);

    auto lines = dd.emit_qcis({"Q00"});
    CHECK(lines.size() == 17);
    CHECK_EQ(lines.front(), "I Q00 37");
    CHECK_EQ(lines[2], "I Q00 75");
    CHECK_EQ(lines.back(), "I Q00 37");

    std::vector<std::string> pulses;
    for (size_t i = 1; i < lines.size(); i += 2)
        pulses.push_back(lines[i]);
    std::vector<std::string> expected{"X Q00", "Y Q00", "X Q00", "Y Q00", "Y Q00", "X Q00", "Y Q00", "X Q00"};
    CHECK(pulses == expected);
}

void
test_floors_are_applied_in_order()
{
    // floor(1001/2) = 500, floor(500 - 50.5) = 449, 449 / 2 = 224.5
    CPMG dd(1, 1001.0, 50.5);
    CHECK(dd.idle_before_after_pulse_ns() == 224.5);

    auto lines = dd.emit_qcis({"Q01"});
    CHECK_EQ(lines[0], "I Q01 224");
    CHECK_EQ(lines[2], "I Q01 449");
}

void
test_pulse_sequences()
{
    using S = std::vector<PULSE_AXIS>;
    const auto X = PULSE_AXIS::X;
    const auto Y = PULSE_AXIS::Y;

    CHECK(CPMG(2, 1000.0).pulse_sequence() == S{X, X, X, X});
    CHECK(CPMG(1, 1000.0, 50.0, "Y").pulse_sequence() == S{Y, Y});
    CHECK(XY(2, 1000.0).pulse_sequence() == S{X, Y, X, Y});
    CHECK(XYYX(1, 1000.0).pulse_sequence() == S{X, Y, Y, X});
    CHECK(XYYX(2, 1000.0).pulse_sequence() == S{X, Y, X, Y, Y, X, Y, X});
}

void
test_validation()
{
    CHECK_THROWS(INVALID_PULSE_AXIS, CPMG(2, 1000.0, 50.0, "Z"));
    CHECK_THROWS(INVALID_PULSE_AXIS, CPMG(2, 1000.0, 50.0, "x"));
    CHECK_THROWS(INVALID_PULSE_COUNT, CPMG(0, 1000.0));
    CHECK_THROWS(INVALID_PULSE_COUNT, XY(-1, 1000.0));
    CHECK_THROWS(INVALID_PULSE_COUNT, XYYX(0, 1000.0));

    // 40 pulses of 50ns do not fit in 1000ns, and neither do exactly 20
    CHECK_THROWS(DURATION_EXCEEDED, CPMG(20, 1000.0));
    CHECK_THROWS(DURATION_EXCEEDED, CPMG(10, 1000.0));
    CHECK_THROWS(DURATION_EXCEEDED, XYYX(3, 500.0, 50.0));

    // the axis is checked before the pulse count
    CHECK_THROWS(INVALID_PULSE_AXIS, CPMG(0, 1000.0, 50.0, "Z"));

    CHECK_THROWS(INVALID_OPERATION, CPMG(2, 1000.0).emit_qcis({"Q01", "Q02"}));
    CHECK_THROWS(INVALID_OPERATION, CPMG(2, 1000.0).emit_qcis({}));
}

void
test_pulse_count_overflow()
{
    // pair counts whose pulse count would not fit in an int64_t
    const int64_t max = std::numeric_limits<int64_t>::max();
    CHECK_THROWS(INVALID_PULSE_COUNT, XYYX(max/4 + 1, 1000.0));
    CHECK_THROWS(INVALID_PULSE_COUNT, XYYX(4611686018427387905LL, 1000.0));
    CHECK_THROWS(INVALID_PULSE_COUNT, CPMG(max/2 + 1, 1000.0));
    CHECK_THROWS(INVALID_PULSE_COUNT, XY(max, 1000.0));

    CHECK(CPMG(3, 1000.0).num_pulses() == 6);
    CHECK(XYYX(2, 1000.0).num_pulses() == 8);

    // the largest representable counts are still checked against the duration
    CHECK_THROWS(DURATION_EXCEEDED, XYYX(max/4, 1000.0));
    CHECK_THROWS(DURATION_EXCEEDED, CPMG(max/2, 1000.0));
}

void
test_non_finite_durations()
{
    const double inf = std::numeric_limits<double>::infinity(),
                 nan = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS(DURATION_EXCEEDED, CPMG(1, nan));
    CHECK_THROWS(DURATION_EXCEEDED, CPMG(1, inf));
    CHECK_THROWS(DURATION_EXCEEDED, CPMG(1, -inf));
    CHECK_THROWS(DURATION_EXCEEDED, XY(1, 1000.0, nan));
    CHECK_THROWS(DURATION_EXCEEDED, XYYX(1, 1000.0, -inf));

    // finite, but the idle time does not fit in an `I` instruction
    CHECK_THROWS(DURATION_EXCEEDED, CPMG(1, 1e300));
    CHECK_THROWS(DURATION_EXCEEDED, CPMG(1, 1000.0, -1e300));

    // the ns count is still an integer near the limit
    CPMG big(1, 1e18);
    CHECK_EQ(big.emit_qcis({"Q01"}).front(), "I Q01 " + std::to_string(static_cast<int64_t>(big.idle_before_after_pulse_ns())));
}

void
test_descriptors_and_labels()
{
    CHECK_EQ(CPMG(2, 1000.0).descriptor(),
            "qcis.CPMG(num_pi_pair=2, total_duration_ns=1000.0, single_pi_gate_duration_ns=50.0, pi_gate='X')");
    CHECK_EQ(XY(3, 2000.0, 40.0).descriptor(),
            "qcis.XY(num_xy_pair=3, total_duration_ns=2000.0, single_pi_gate_duration_ns=40.0)");
    CHECK_EQ(XYYX(2, 1000.5).descriptor(),
            "qcis.XYYX(num_xyyx_pair=2, total_duration_ns=1000.5, single_pi_gate_duration_ns=50.0)");

    CHECK_EQ(CPMG(2, 1000.0).diagram_label(), "DD([X]*4)");
    CHECK_EQ(CPMG(2, 1000.0, 50.0, "Y").diagram_label(), "DD([Y]*4)");
    CHECK_EQ(XY(2, 1000.0).diagram_label(), "DD([X--Y]*2)");
    CHECK_EQ(XYYX(2, 1000.0).diagram_label(), "DD([X--Y...Y--X]*2)");

    CHECK_EQ(CPMG(2, 1000.0).name(), "CPMG");
    CHECK(CPMG(2, 1000.0).num_qubits() == 1);
}

void
test_equality_uses_parameters()
{
    CHECK(CPMG(2, 1000.0).equals(CPMG(2, 1000.0, 50.0, "X")));
    CHECK(!CPMG(2, 1000.0).equals(CPMG(2, 1000.0, 50.0, "Y")));
    CHECK(!CPMG(2, 1000.0).equals(CPMG(2, 1000.0, 40.0)));
    CHECK(!CPMG(2, 1000.0).equals(XY(2, 1000.0)));
    CHECK(XY(2, 1000.0).equals(XY(2, 1000.0)));
    CHECK(!XY(2, 1000.0).equals(XYYX(2, 1000.0)));

    // 1000 and 1001 give the same idle time, but are different gates
    CHECK(CPMG(2, 1000.0).idle_before_after_pulse_ns() == CPMG(2, 1001.0).idle_before_after_pulse_ns());
    CHECK(!CPMG(2, 1000.0).equals(CPMG(2, 1001.0)));
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main()
{
    test_cpmg_timing();
    test_xyyx_timing_is_truncated();
    test_floors_are_applied_in_order();
    test_pulse_sequences();
    test_validation();
    test_pulse_count_overflow();
    test_non_finite_durations();
    test_descriptors_and_labels();
    test_equality_uses_parameters();
    return test::test_exit_code("test_dynamical_decoupling");
}
