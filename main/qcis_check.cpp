/*
    author: qcisbridge developers
    date:   15 February 2026
*/

#include "argparse.h"
#include "circuit.h"
#include "error.h"
#include "gate_table.h"
#include "generic_io.h"
#include "globals.h"
#include "qcis/reader.h"
#include "qcis/writer.h"

#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main(int argc, char* argv[])
{
    std::string              input_file;
    std::string              output_file;
    std::string              coupler_list;
    std::vector<std::string> ignored_prefixes;
    std::vector<std::string> blockable;
    bool                     print_circuit;

    qcis::ARGPARSE()
        .required("input-file", "QCIS file to read (.gz and .xz are decompressed)", input_file)
        .optional("-o", "--output", "Write the circuit back out as QCIS to this file", output_file, "")
        .optional("-c", "--couplers", "Coupler map (i.e., G01:Q01:Q02,G02:Q02:Q03)", coupler_list, "")
        .optional("-i", "--ignore", "Skip lines starting with these prefixes", ignored_prefixes, std::vector<std::string>{})
        .optional("-b", "--blockable", "Barrier resources for --output (default: all qubits)", blockable, std::vector<std::string>{})
        .optional("-p", "--print-circuit", "Print the circuit moment by moment", print_circuit, false)
        .parse(argc, argv);

    std::optional<qcis::COUPLER_MAP> couplers;
    if (!coupler_list.empty())
    {
        try
        {
            couplers = qcis::COUPLER_MAP::from_string(coupler_list);
        }
        catch (const std::invalid_argument& e)
        {
            std::cerr << "--couplers: " << e.what() << "\n";
            return 1;
        }
    }

    std::string text = qcis::generic_strm_read_all(input_file);

    qcis::CIRCUIT circuit;
    try
    {
        circuit = qcis::qcis_to_circuit(text, qcis::named_qubit_resolver(), couplers, ignored_prefixes);
    }
    catch (const qcis::TRANSLATION_ERROR& e)
    {
        std::cerr << input_file << ": " << e.what() << "\n";
        return 1;
    }

    if (print_circuit)
        std::cout << circuit << "\n";

    // count operations by opcode:
    size_t                        num_operations{0};
    size_t                        num_extensions{0};
    std::map<std::string, size_t> opcode_count;
    std::map<std::string, size_t> coupler_count;
    for (const auto& m : circuit)
    {
        for (const auto& op : m)
        {
            num_operations++;
            if (const auto* g = std::get_if<qcis::GATE_OPERATION>(&op.value()))
            {
                opcode_count[qcis::to_opcode(g->gate)]++;
                if (couplers.has_value() && g->qubits.size() == 2)
                {
                    auto c = couplers->find_coupler(g->qubits[0].name, g->qubits[1].name);
                    if (c.has_value())
                        coupler_count[*c]++;
                }
            }
            else
            {
                num_extensions++;
            }
        }
    }

    auto qubits = circuit.all_qubits();

    qcis::print_stat_line(std::cout, "MOMENTS", circuit.size());
    qcis::print_stat_line(std::cout, "OPERATIONS", num_operations);
    for (const auto& [opcode, count] : opcode_count)
        qcis::print_stat_line(std::cout, "OPCODE_" + opcode, count);
    qcis::print_stat_line(std::cout, "EXTENSION_GATES", num_extensions);
    qcis::print_stat_line(std::cout, "QUBITS", qubits.size());
    if (couplers.has_value())
    {
        // every coupler in the map, including unused ones
        for (const auto& c : couplers->couplers())
            qcis::print_stat_line(std::cout, "COUPLER_" + c, coupler_count[c]);
    }

    if (output_file.empty())
        return 0;

    if (blockable.empty())
    {
        for (const auto& q : qubits)
            blockable.push_back(q.name);
    }

    try
    {
        std::string out = qcis::circuit_to_qcis(circuit, qcis::named_qubit_namer(), blockable, couplers);
        qcis::generic_strm_write_all(output_file, out);
    }
    catch (const qcis::TRANSLATION_ERROR& e)
    {
        std::cerr << output_file << ": " << e.what() << "\n";
        return 1;
    }

    return 0;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////
