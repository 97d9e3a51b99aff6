/*
    author: qcisbridge developers
    date:   15 February 2026
*/

#include "argparse.h"
#include "circuit.h"
#include "error.h"
#include "ext/dynamical_decoupling.h"
#include "generic_io.h"
#include "qcis/writer.h"

#include <iostream>
#include <memory>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main(int argc, char* argv[])
{
    std::string variant;
    std::string qubit_name;
    int64_t     num_pairs;
    double      total_duration_ns;
    double      single_pulse_duration_ns;
    std::string pulse_axis;
    std::string output_file;
    bool        print_descriptor;

    qcis::ARGPARSE()
        .required("variant", "DD sequence (CPMG, XY, or XYYX)", variant)
        .required("qubit", "Qubit to decouple (i.e., Q01)", qubit_name)
        .required("pairs", "Number of pulse pairs", num_pairs)
        .required("total-ns", "Total duration of the sequence (ns)", total_duration_ns)
        .optional("-s", "--single-pulse-ns", "Duration of a single pulse (ns)", single_pulse_duration_ns,
                    qcis::DYNAMICAL_DECOUPLING::DEFAULT_SINGLE_PULSE_DURATION_NS)
        .optional("-a", "--axis", "Pulse axis (CPMG only)", pulse_axis, "X")
        .optional("-o", "--output", "Output file (default: stdout)", output_file, "")
        .optional("-d", "--descriptor", "Print the gate descriptor to stderr", print_descriptor, false)
        .parse(argc, argv);

    try
    {
        qcis::extension_ptr gate;
        if (variant == "CPMG")
            gate = std::make_shared<const qcis::CPMG>(num_pairs, total_duration_ns, single_pulse_duration_ns, pulse_axis);
        else if (variant == "XY")
            gate = std::make_shared<const qcis::XY>(num_pairs, total_duration_ns, single_pulse_duration_ns);
        else if (variant == "XYYX")
            gate = std::make_shared<const qcis::XYYX>(num_pairs, total_duration_ns, single_pulse_duration_ns);
        else
            throw qcis::TRANSLATION_ERROR(qcis::TRANSLATION_ERROR::TYPE::UNKNOWN_EXTENSION,
                                            "no DD sequence named `" + variant + "` (expected CPMG, XY, or XYYX)");

        if (print_descriptor)
            std::cerr << gate->descriptor() << "\n";

        qcis::QUBIT q = qcis::QUBIT::named(qubit_name);
        qcis::CIRCUIT circuit{ qcis::MOMENT{ qcis::OPERATION(gate, {q}) } };

        std::string out = qcis::circuit_to_qcis(circuit, qcis::named_qubit_namer(), {qubit_name});
        if (output_file.empty())
            std::cout << out;
        else
            qcis::generic_strm_write_all(output_file, out);
    }
    catch (const qcis::TRANSLATION_ERROR& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////
