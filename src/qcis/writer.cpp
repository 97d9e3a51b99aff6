/*
    author: qcisbridge developers
    date:   12 February 2026
*/

#include "qcis/writer.h"
#include "qcis/context.h"
#include "error.h"
#include "gate_table.h"
#include "globals.h"

#include <algorithm>
#include <iostream>
#include <type_traits>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

IGNORE_SET
IGNORE_SET::defaults()
{
    IGNORE_SET out;
    out.add(GATE::TYPE::DEPOLARIZE)
        .add(GATE::TYPE::ASYMMETRIC_DEPOLARIZE)
        .add(GATE::TYPE::TWO_QUBIT_ASYMMETRIC_DEPOLARIZE)
        .add(GATE::TYPE::DETECTOR)
        .add(GATE::TYPE::OBSERVABLE_INCLUDE)
        .add(GATE::TYPE::SHIFT_COORDS);
    return out;
}

IGNORE_SET&
IGNORE_SET::add(GATE::TYPE t)
{
    types_.insert(t);
    return *this;
}

IGNORE_SET&
IGNORE_SET::add(GATE g)
{
    gates_.push_back(std::move(g));
    return *this;
}

IGNORE_SET&
IGNORE_SET::add(OPERATION op)
{
    operations_.push_back(std::move(op));
    return *this;
}

IGNORE_SET&
IGNORE_SET::merge(const IGNORE_SET& other)
{
    types_.insert(other.types_.begin(), other.types_.end());
    gates_.insert(gates_.end(), other.gates_.begin(), other.gates_.end());
    operations_.insert(operations_.end(), other.operations_.begin(), other.operations_.end());
    return *this;
}

bool
IGNORE_SET::matches(const OPERATION& op) const
{
    if (const auto* g_op = std::get_if<GATE_OPERATION>(&op.value()))
    {
        if (types_.count(g_op->gate.type))
            return true;
        if (std::find(gates_.begin(), gates_.end(), g_op->gate) != gates_.end())
            return true;
    }
    return std::find(operations_.begin(), operations_.end(), op) != operations_.end();
}

bool
IGNORE_SET::empty() const
{
    return types_.empty() && gates_.empty() && operations_.empty();
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

WRITER::WRITER(const qubit_to_name_fn& qubit_to_name,
                const std::vector<std::string>& blockable,
                const std::optional<COUPLER_MAP>& couplers,
                const IGNORE_SET& ignored)
    :qubit_to_name_(qubit_to_name),
    blockable_(blockable),
    couplers_(couplers),
    ignored_(ignored)
{}

void
WRITER::write(const CIRCUIT& circuit)
{
    for (const auto& m : circuit)
        write(m);
}

void
WRITER::write(const MOMENT& moment)
{
    size_t lines_before = lines_.size();
    size_t barriers_before = barrier_count_;

    for (const auto& op : moment)
        write_operation(op);

    // if the moment emitted its own barriers, it is already synchronized
    if (lines_.size() != lines_before && barrier_count_ == barriers_before)
        emit_barrier();

#if defined(QCIS_WRITER_VERBOSE)
    std::cout << "[ QCIS_WRITER ] moment with " << moment.size() << " operations -> "
                << (lines_.size() - lines_before) << " lines, "
                << (barrier_count_ - barriers_before) << " barriers\n";
#endif
}

const std::vector<std::string>&
WRITER::lines() const
{
    return lines_;
}

size_t
WRITER::barrier_count() const
{
    return barrier_count_;
}

std::string
WRITER::str() const
{
    return join(lines_, "\n") + "\n";
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
WRITER::emit(std::string line)
{
    if (is_barrier(line))
        barrier_count_++;
    lines_.push_back(std::move(line));
}

void
WRITER::emit_barrier()
{
    std::string line{BARRIER_OPCODE};
    for (const auto& r : blockable_)
        line += " " + r;
    emit(std::move(line));
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
WRITER::write_operation(const OPERATION& op)
{
    std::visit([this, &op] (const auto& x)
            {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, GATE_OPERATION>)
                    write_gate_operation(op, x);
                else if constexpr (std::is_same_v<T, EXTENSION_OPERATION>)
                    write_extension_operation(x);
                else
                    write_subcircuit_operation(x);
            },
            op.value());
}

void
WRITER::write_gate_operation(const OPERATION& op, const GATE_OPERATION& g_op)
{
    auto opcode = find_opcode(g_op.gate);
    if (opcode.has_value())
    {
        if (g_op.gate.type == GATE::TYPE::CZ)
            emit(*opcode + " " + resolve_coupler(g_op.qubits));
        else
            emit(*opcode + " " + join(resolve_targets(g_op.qubits), " "));
        return;
    }

    if (ignored_.matches(op))
    {
#if defined(QCIS_WRITER_VERBOSE)
        std::cout << "[ QCIS_WRITER ] ignoring " << op << "\n";
#endif
        return;
    }

    throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::UNCONVERTIBLE_OPERATION,
                "cannot convert " + op.to_string() + " to qcis: " + std::string{REMEDIATION_HINT});
}

void
WRITER::write_extension_operation(const EXTENSION_OPERATION& e_op)
{
    auto targets = resolve_targets(e_op.qubits);

    std::vector<std::string> quoted;
    quoted.reserve(targets.size());
    for (const auto& t : targets)
        quoted.push_back("'" + t + "'");

    emit(std::string{CONTEXT_START});
    emit(std::string{CONTEXT_GATE_PREFIX} + e_op.gate->descriptor());
    emit(std::string{CONTEXT_TARGETS_PREFIX} + "[" + join(quoted, ", ") + "]");
    for (auto& line : e_op.gate->emit_qcis(targets))
        emit(std::move(line));
    emit(std::string{CONTEXT_END});
}

void
WRITER::write_subcircuit_operation(const SUBCIRCUIT_OPERATION& s_op)
{
    WRITER child(qubit_to_name_, blockable_, couplers_, ignored_);
    child.write(*s_op.circuit);

#if defined(QCIS_WRITER_VERBOSE)
    std::cout << "[ QCIS_WRITER ] subcircuit: " << child.lines().size() << " lines x "
                << s_op.repetitions << " repetitions\n";
#endif

    for (uint64_t r = 0; r < s_op.repetitions; r++)
    {
        for (const auto& line : child.lines())
            emit(line);
    }
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::vector<std::string>
WRITER::resolve_targets(const std::vector<QUBIT>& qubits) const
{
    std::vector<std::string> out;
    out.reserve(qubits.size());
    for (const auto& q : qubits)
        out.push_back(qubit_to_name_(q));
    return out;
}

std::string
WRITER::resolve_coupler(const std::vector<QUBIT>& qubits) const
{
    auto names = resolve_targets(qubits);
    if (!couplers_.has_value())
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MISSING_COUPLER,
                    "no coupler map was provided for two-qubit gate on " + join(names, ", "));
    }

    auto coupler = couplers_->find_coupler(names[0], names[1]);
    if (!coupler.has_value())
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MISSING_COUPLER,
                    "no coupler for qubit pair (" + names[0] + ", " + names[1] + ")");
    }
    return *coupler;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

bool
is_barrier(std::string_view line)
{
    return line == BARRIER_OPCODE
            || (line.size() > BARRIER_OPCODE.size()
                && line.substr(0, BARRIER_OPCODE.size()) == BARRIER_OPCODE
                && line[BARRIER_OPCODE.size()] == ' ');
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string
circuit_to_qcis(const CIRCUIT& circuit,
                const qubit_to_name_fn& qubit_to_name,
                const std::vector<std::string>& blockable,
                const std::optional<COUPLER_MAP>& couplers,
                const std::optional<IGNORE_SET>& ignored)
{
    IGNORE_SET ignore_set = IGNORE_SET::defaults();
    if (ignored.has_value())
        ignore_set.merge(*ignored);

    WRITER writer(qubit_to_name, blockable, couplers, ignore_set);
    writer.write(circuit);
    return writer.str();
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
