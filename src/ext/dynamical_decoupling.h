/*
    author: qcisbridge developers
    date:   11 February 2026
*/

#ifndef QCIS_EXT_DYNAMICAL_DECOUPLING_h
#define QCIS_EXT_DYNAMICAL_DECOUPLING_h

#include "ext/extension.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace qcis
{

struct DESCRIPTOR;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

enum class PULSE_AXIS { X, Y };

std::string_view pulse_axis_name(PULSE_AXIS);

// throws `INVALID_PULSE_AXIS` for anything other than "X" or "Y"
PULSE_AXIS parse_pulse_axis(std::string_view);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Dynamical decoupling (DD): a train of pi pulses on one idle qubit. The
 * pulses are spread evenly over `total_duration_ns`:
 *
 *      I q t; P1 q; I q 2t; P2 q; I q 2t; ... Pn q; I q t
 *
 * where `t` is `idle_before_after_pulse_ns()` truncated to an integer.
 *
 * All parameters are validated on construction, so an invalid DD gate can
 * never reach the writer.
 * */
class DYNAMICAL_DECOUPLING : public EXTENSION_GATE
{
public:
    constexpr static double DEFAULT_SINGLE_PULSE_DURATION_NS{50.0};

    // module path used when writing descriptors
    constexpr static std::string_view DESCRIPTOR_NAMESPACE{"qcis"};
protected:
    const double  total_duration_ns_;
    const double  single_pulse_duration_ns_;
    const int64_t num_pulses_;
    const double  idle_ns_;
public:
    /*
     * The sequence has `num_pairs * pulses_per_pair` pulses. Throws
     * `INVALID_PULSE_COUNT` if `num_pairs` is not positive or the pulse count
     * does not fit in an int64_t, and `DURATION_EXCEEDED` if the durations
     * are not finite or the pulses do not fit in `total_duration_ns`.
     * */
    DYNAMICAL_DECOUPLING(std::string_view pulse_axis,
                            int64_t num_pairs,
                            int64_t pulses_per_pair,
                            double total_duration_ns,
                            double single_pulse_duration_ns);

    virtual std::vector<PULSE_AXIS> pulse_sequence() const =0;

    int64_t num_pulses() const { return num_pulses_; }
    double  idle_before_after_pulse_ns() const;
    double  total_duration_ns() const;
    double  single_pulse_duration_ns() const;

    size_t                   num_qubits() const override;
    std::vector<std::string> emit_qcis(const std::vector<std::string>& targets) const override;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Carr-Purcell-Meiboom-Gill: `2*num_pulse_pairs` pulses on the same axis.
 *
 *      q: --X--X--X--X--
 * */
class CPMG : public DYNAMICAL_DECOUPLING
{
private:
    const int64_t    num_pulse_pairs_;
    const PULSE_AXIS axis_;
public:
    CPMG(int64_t num_pulse_pairs,
            double total_duration_ns,
            double single_pulse_duration_ns=DEFAULT_SINGLE_PULSE_DURATION_NS,
            std::string_view pulse_axis="X");

    static extension_ptr from_descriptor(const DESCRIPTOR&);

    std::vector<PULSE_AXIS> pulse_sequence() const override;

    std::string name() const override;
    std::string descriptor() const override;
    bool        equals(const EXTENSION_GATE&) const override;
    std::string diagram_label() const override;

    int64_t    num_pulse_pairs() const { return num_pulse_pairs_; }
    PULSE_AXIS pulse_axis() const { return axis_; }
};

/*
 *      q: --X--Y--X--Y--
 * */
class XY : public DYNAMICAL_DECOUPLING
{
private:
    const int64_t num_xy_pairs_;
public:
    XY(int64_t num_xy_pairs,
        double total_duration_ns,
        double single_pulse_duration_ns=DEFAULT_SINGLE_PULSE_DURATION_NS);

    static extension_ptr from_descriptor(const DESCRIPTOR&);

    std::vector<PULSE_AXIS> pulse_sequence() const override;

    std::string name() const override;
    std::string descriptor() const override;
    bool        equals(const EXTENSION_GATE&) const override;
    std::string diagram_label() const override;

    int64_t num_xy_pairs() const { return num_xy_pairs_; }
};

/*
 * The XY sequence followed by its mirror image.
 *
 *      q: --X--Y--X--Y--Y--X--Y--X--
 * */
class XYYX : public DYNAMICAL_DECOUPLING
{
private:
    const int64_t num_xyyx_pairs_;
public:
    XYYX(int64_t num_xyyx_pairs,
            double total_duration_ns,
            double single_pulse_duration_ns=DEFAULT_SINGLE_PULSE_DURATION_NS);

    static extension_ptr from_descriptor(const DESCRIPTOR&);

    std::vector<PULSE_AXIS> pulse_sequence() const override;

    std::string name() const override;
    std::string descriptor() const override;
    bool        equals(const EXTENSION_GATE&) const override;
    std::string diagram_label() const override;

    int64_t num_xyyx_pairs() const { return num_xyyx_pairs_; }
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_EXT_DYNAMICAL_DECOUPLING_h
