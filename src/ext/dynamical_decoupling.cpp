/*
    author: qcisbridge developers
    date:   11 February 2026
*/

#include "ext/dynamical_decoupling.h"
#include "ext/descriptor.h"
#include "error.h"
#include "gate_table.h"

#include <cmath>
#include <limits>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

namespace
{

constexpr double MAX_IDLE_NS{0x1p62};

// returns the total number of pulses
int64_t
_validate_pulses(std::string_view pulse_axis,
                    int64_t num_pairs,
                    int64_t pulses_per_pair,
                    double total_duration_ns,
                    double single_pulse_duration_ns)
{
    parse_pulse_axis(pulse_axis);
    if (num_pairs < 1 || num_pairs > std::numeric_limits<int64_t>::max() / pulses_per_pair)
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_PULSE_COUNT,
                    "number of pulse pairs must be between 1 and "
                    + std::to_string(std::numeric_limits<int64_t>::max() / pulses_per_pair)
                    + ", got " + std::to_string(num_pairs));
    }

    int64_t num_pulses = num_pairs * pulses_per_pair;
    if (!std::isfinite(total_duration_ns) || !std::isfinite(single_pulse_duration_ns))
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::DURATION_EXCEEDED,
                    "durations must be finite, got total " + format_real(total_duration_ns)
                    + "ns and single pulse " + format_real(single_pulse_duration_ns) + "ns");
    }
    if (!(static_cast<double>(num_pulses) * single_pulse_duration_ns < total_duration_ns))
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::DURATION_EXCEEDED,
                    "number of pulses is too large, the total duration of " + std::to_string(num_pulses)
                    + " pulses exceeds the maximum " + format_real(total_duration_ns) + "ns");
    }
    return num_pulses;
}

// the two floors must be applied in this order
double
_idle_ns_before_after_pulse(int64_t num_pulses, double total_duration_ns, double single_pulse_duration_ns)
{
    double duration_per_pulse_ns = std::floor(total_duration_ns / static_cast<double>(num_pulses));
    double idle_ns = std::floor(duration_per_pulse_ns - single_pulse_duration_ns) / 2.0;
    // `I` lines carry 2*idle as an integer
    if (!(2.0*idle_ns < MAX_IDLE_NS))
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::DURATION_EXCEEDED,
                    "idle time of " + format_real(idle_ns) + "ns between pulses is too long");
    }
    return idle_ns;
}

std::string
_idle_line(const std::string& qubit, double ns)
{
    return std::string{IDLE_OPCODE} + " " + qubit + " " + std::to_string(static_cast<int64_t>(ns));
}

std::string
_durations(const DYNAMICAL_DECOUPLING& dd)
{
    return "total_duration_ns=" + format_real(dd.total_duration_ns())
            + ", single_pi_gate_duration_ns=" + format_real(dd.single_pulse_duration_ns());
}

}   // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string_view
pulse_axis_name(PULSE_AXIS a)
{
    return a == PULSE_AXIS::X ? "X" : "Y";
}

PULSE_AXIS
parse_pulse_axis(std::string_view s)
{
    if (s == "X")
        return PULSE_AXIS::X;
    if (s == "Y")
        return PULSE_AXIS::Y;
    throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_PULSE_AXIS,
                "pulse axis \"" + std::string{s} + "\" is not supported for dynamical decoupling (must be X or Y)");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

DYNAMICAL_DECOUPLING::DYNAMICAL_DECOUPLING(std::string_view pulse_axis,
                                            int64_t num_pairs,
                                            int64_t pulses_per_pair,
                                            double total_duration_ns,
                                            double single_pulse_duration_ns)
    :total_duration_ns_(total_duration_ns),
    single_pulse_duration_ns_(single_pulse_duration_ns),
    num_pulses_(_validate_pulses(pulse_axis, num_pairs, pulses_per_pair, total_duration_ns, single_pulse_duration_ns)),
    idle_ns_(_idle_ns_before_after_pulse(num_pulses_, total_duration_ns, single_pulse_duration_ns))
{}

double
DYNAMICAL_DECOUPLING::idle_before_after_pulse_ns() const
{
    return idle_ns_;
}

double
DYNAMICAL_DECOUPLING::total_duration_ns() const
{
    return total_duration_ns_;
}

double
DYNAMICAL_DECOUPLING::single_pulse_duration_ns() const
{
    return single_pulse_duration_ns_;
}

size_t
DYNAMICAL_DECOUPLING::num_qubits() const
{
    return 1;
}

std::vector<std::string>
DYNAMICAL_DECOUPLING::emit_qcis(const std::vector<std::string>& targets) const
{
    if (targets.size() != 1)
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_OPERATION,
                    name() + " acts on one qubit, but was given " + std::to_string(targets.size()));
    }

    const std::string& q = targets[0];
    auto sequence = pulse_sequence();

    std::vector<std::string> lines;
    lines.reserve(2*sequence.size() + 1);

    lines.push_back(_idle_line(q, idle_ns_));
    for (size_t i = 0; i < sequence.size(); i++)
    {
        if (i > 0)
            lines.push_back(_idle_line(q, 2*idle_ns_));
        GATE g{sequence[i] == PULSE_AXIS::X ? GATE::TYPE::X : GATE::TYPE::Y};
        lines.push_back(to_opcode(g) + " " + q);
    }
    lines.push_back(_idle_line(q, idle_ns_));
    return lines;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

CPMG::CPMG(int64_t num_pulse_pairs, double total_duration_ns, double single_pulse_duration_ns, std::string_view pulse_axis)
    :DYNAMICAL_DECOUPLING(pulse_axis, num_pulse_pairs, 2, total_duration_ns, single_pulse_duration_ns),
    num_pulse_pairs_(num_pulse_pairs),
    axis_(parse_pulse_axis(pulse_axis))
{}

extension_ptr
CPMG::from_descriptor(const DESCRIPTOR& d)
{
    ARGUMENT_BINDING args(d, {"num_pi_pair", "total_duration_ns", "single_pi_gate_duration_ns", "pi_gate"});
    return std::make_shared<CPMG>(args.get_int("num_pi_pair"),
                                    args.get_real("total_duration_ns"),
                                    args.get_real("single_pi_gate_duration_ns", DEFAULT_SINGLE_PULSE_DURATION_NS),
                                    args.get_string("pi_gate", "X"));
}

std::vector<PULSE_AXIS>
CPMG::pulse_sequence() const
{
    return std::vector<PULSE_AXIS>(num_pulses_, axis_);
}

std::string
CPMG::name() const
{
    return "CPMG";
}

std::string
CPMG::descriptor() const
{
    return std::string{DESCRIPTOR_NAMESPACE} + ".CPMG(num_pi_pair=" + std::to_string(num_pulse_pairs_)
            + ", " + _durations(*this)
            + ", pi_gate=" + format_string(pulse_axis_name(axis_)) + ")";
}

bool
CPMG::equals(const EXTENSION_GATE& other) const
{
    const auto* x = dynamic_cast<const CPMG*>(&other);
    return x != nullptr
            && num_pulse_pairs_ == x->num_pulse_pairs_
            && total_duration_ns_ == x->total_duration_ns_
            && single_pulse_duration_ns_ == x->single_pulse_duration_ns_
            && axis_ == x->axis_;
}

std::string
CPMG::diagram_label() const
{
    return "DD([" + std::string{pulse_axis_name(axis_)} + "]*" + std::to_string(num_pulses_) + ")";
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

XY::XY(int64_t num_xy_pairs, double total_duration_ns, double single_pulse_duration_ns)
    :DYNAMICAL_DECOUPLING("X", num_xy_pairs, 2, total_duration_ns, single_pulse_duration_ns),
    num_xy_pairs_(num_xy_pairs)
{}

extension_ptr
XY::from_descriptor(const DESCRIPTOR& d)
{
    ARGUMENT_BINDING args(d, {"num_xy_pair", "total_duration_ns", "single_pi_gate_duration_ns"});
    return std::make_shared<XY>(args.get_int("num_xy_pair"),
                                args.get_real("total_duration_ns"),
                                args.get_real("single_pi_gate_duration_ns", DEFAULT_SINGLE_PULSE_DURATION_NS));
}

std::vector<PULSE_AXIS>
XY::pulse_sequence() const
{
    std::vector<PULSE_AXIS> out;
    out.reserve(num_pulses_);
    for (int64_t i = 0; i < num_xy_pairs_; i++)
    {
        out.push_back(PULSE_AXIS::X);
        out.push_back(PULSE_AXIS::Y);
    }
    return out;
}

std::string
XY::name() const
{
    return "XY";
}

std::string
XY::descriptor() const
{
    return std::string{DESCRIPTOR_NAMESPACE} + ".XY(num_xy_pair=" + std::to_string(num_xy_pairs_)
            + ", " + _durations(*this) + ")";
}

bool
XY::equals(const EXTENSION_GATE& other) const
{
    const auto* x = dynamic_cast<const XY*>(&other);
    return x != nullptr
            && num_xy_pairs_ == x->num_xy_pairs_
            && total_duration_ns_ == x->total_duration_ns_
            && single_pulse_duration_ns_ == x->single_pulse_duration_ns_;
}

std::string
XY::diagram_label() const
{
    return "DD([X--Y]*" + std::to_string(num_xy_pairs_) + ")";
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

XYYX::XYYX(int64_t num_xyyx_pairs, double total_duration_ns, double single_pulse_duration_ns)
    :DYNAMICAL_DECOUPLING("X", num_xyyx_pairs, 4, total_duration_ns, single_pulse_duration_ns),
    num_xyyx_pairs_(num_xyyx_pairs)
{}

extension_ptr
XYYX::from_descriptor(const DESCRIPTOR& d)
{
    ARGUMENT_BINDING args(d, {"num_xyyx_pair", "total_duration_ns", "single_pi_gate_duration_ns"});
    return std::make_shared<XYYX>(args.get_int("num_xyyx_pair"),
                                    args.get_real("total_duration_ns"),
                                    args.get_real("single_pi_gate_duration_ns", DEFAULT_SINGLE_PULSE_DURATION_NS));
}

std::vector<PULSE_AXIS>
XYYX::pulse_sequence() const
{
    std::vector<PULSE_AXIS> out;
    out.reserve(num_pulses_);
    for (int64_t i = 0; i < num_xyyx_pairs_; i++)
    {
        out.push_back(PULSE_AXIS::X);
        out.push_back(PULSE_AXIS::Y);
    }
    for (int64_t i = 0; i < num_xyyx_pairs_; i++)
    {
        out.push_back(PULSE_AXIS::Y);
        out.push_back(PULSE_AXIS::X);
    }
    return out;
}

std::string
XYYX::name() const
{
    return "XYYX";
}

std::string
XYYX::descriptor() const
{
    return std::string{DESCRIPTOR_NAMESPACE} + ".XYYX(num_xyyx_pair=" + std::to_string(num_xyyx_pairs_)
            + ", " + _durations(*this) + ")";
}

bool
XYYX::equals(const EXTENSION_GATE& other) const
{
    const auto* x = dynamic_cast<const XYYX*>(&other);
    return x != nullptr
            && num_xyyx_pairs_ == x->num_xyyx_pairs_
            && total_duration_ns_ == x->total_duration_ns_
            && single_pulse_duration_ns_ == x->single_pulse_duration_ns_;
}

std::string
XYYX::diagram_label() const
{
    return "DD([X--Y...Y--X]*" + std::to_string(num_xyyx_pairs_) + ")";
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
