/*
    author: qcisbridge developers
    date:   13 February 2026
*/

#include "qcis/reader.h"
#include "qcis/context.h"
#include "error.h"
#include "gate_table.h"
#include "globals.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

namespace
{

std::string
_at_line(size_t line_number, const std::string& line)
{
    return "line " + std::to_string(line_number) + " (\"" + line + "\")";
}

[[noreturn]] void
_throw_unrecognized(const READER::line_type& line)
{
    throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::UNRECOGNIZED_INSTRUCTION,
                "cannot translate " + _at_line(line.first, line.second) + ": " + std::string{REMEDIATION_HINT});
}

bool
_is_unsigned_integer(std::string_view s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [] (char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

}   // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

READER::READER(std::string_view text,
                const std::optional<COUPLER_MAP>& couplers,
                const std::vector<std::string>& ignored_prefixes,
                const EXTENSION_REGISTRY& registry)
    :couplers_(couplers),
    ignored_prefixes_(ignored_prefixes),
    registry_(registry)
{
    auto lines = split(text, '\n');
    for (size_t i = 0; i < lines.size(); i++)
    {
        auto line = trim(lines[i]);
        if (!line.empty())
            buffer_.emplace_back(i+1, std::string{line});
    }
}

CIRCUIT
READER::read()
{
    if (consumed_)
        throw std::runtime_error("READER::read: text was already read");
    consumed_ = true;

    while (!buffer_.empty())
    {
        line_type line = std::move(buffer_.front());
        buffer_.pop_front();

        if (state_ == STATE::NORMAL)
            read_normal_line(line);
        else
            read_context_line(line);
    }

    if (state_ == STATE::IN_CONTEXT)
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::UNTERMINATED_CONTEXT,
                    "context block starting at line " + std::to_string(context_start_line_)
                    + " has no \"" + std::string{CONTEXT_END} + "\"");
    }

    if (!last_was_barrier_)
        commit_step();

#if defined(QCIS_READER_VERBOSE)
    std::cout << "[ QCIS_READER ] read " << circuit_.size() << " moments\n";
#endif

    return std::move(circuit_);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
READER::read_normal_line(const line_type& line)
{
    const std::string& s = line.second;

    if (is_ignored(s))
        return;

    if (s == CONTEXT_START)
    {
        state_ = STATE::IN_CONTEXT;
        context_start_line_ = line.first;
        context_descriptor_.reset();
        context_targets_.clear();
        return;
    }

    if (s.front() == COMMENT_CHAR)
        return;

    if (s.front() == BARRIER_OPCODE.front())
    {
        commit_step();
        last_was_barrier_ = true;
        return;
    }

    read_instruction(line);
    last_was_barrier_ = false;
}

void
READER::read_context_line(const line_type& line)
{
    const std::string& s = line.second;

    if (s == CONTEXT_END)
    {
        finish_context();
        state_ = STATE::NORMAL;
        last_was_barrier_ = false;
    }
    else if (s.starts_with(CONTEXT_GATE_PREFIX))
    {
        context_descriptor_ = std::string{trim(std::string_view{s}.substr(CONTEXT_GATE_PREFIX.size()))};
    }
    else if (s.starts_with(CONTEXT_TARGETS_PREFIX))
    {
        context_targets_ = parse_target_list(std::string_view{s}.substr(CONTEXT_TARGETS_PREFIX.size()));
    }
    // everything else in the block is the gate's own lowering, which the
    // rebuilt gate regenerates.
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
READER::read_instruction(const line_type& line)
{
    auto tokens = split_whitespace(line.second);
    const std::string& opcode = tokens[0];

    if (opcode == IDLE_OPCODE)
    {
        if (tokens.size() == 3 && is_indexed_name(tokens[1], 'Q') && _is_unsigned_integer(tokens[2]))
        {
            throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::NOT_YET_SUPPORTED,
                        "idle instructions outside of an extension gate block are not supported: "
                        + _at_line(line.first, line.second));
        }
        _throw_unrecognized(line);
    }

    auto g = find_gate(opcode);
    if (!g.has_value() || tokens.size() < 2)
        _throw_unrecognized(line);

    if (g->type == GATE::TYPE::MEASURE)
    {
        std::vector<QUBIT> qubits;
        std::vector<std::string> names(tokens.begin()+1, tokens.end());
        for (const auto& t : names)
        {
            if (!is_indexed_name(t, 'Q'))
                _throw_unrecognized(line);
            qubits.push_back(QUBIT::named(t));
        }
        step_.append(OPERATION(GATE::measure(join(names, ",")), std::move(qubits)));
        return;
    }

    if (tokens.size() != 2)
        _throw_unrecognized(line);

    const std::string& target = tokens[1];
    if (g->num_qubits() == 1 && is_indexed_name(target, 'Q'))
    {
        step_.append(OPERATION(*g, {QUBIT::named(target)}));
    }
    else if (g->num_qubits() == 2 && is_indexed_name(target, 'G'))
    {
        if (!couplers_.has_value())
        {
            throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MISSING_COUPLER,
                        "no coupler map was provided for " + _at_line(line.first, line.second));
        }
        auto qubits = couplers_->find_qubits(target);
        if (!qubits.has_value())
        {
            throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MISSING_COUPLER,
                        "coupler " + target + " is not in the coupler map: " + _at_line(line.first, line.second));
        }
        step_.append(OPERATION(*g, {QUBIT::named(qubits->first), QUBIT::named(qubits->second)}));
    }
    else
    {
        _throw_unrecognized(line);
    }
}

void
READER::finish_context()
{
    if (!context_descriptor_.has_value())
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MALFORMED_DESCRIPTOR,
                    "context block starting at line " + std::to_string(context_start_line_)
                    + " has no \"" + std::string{trim(CONTEXT_GATE_PREFIX)} + "\" line");
    }

    extension_ptr g = registry_.build(*context_descriptor_);

    std::vector<QUBIT> qubits;
    qubits.reserve(context_targets_.size());
    for (const auto& t : context_targets_)
        qubits.push_back(QUBIT::named(t));

#if defined(QCIS_READER_VERBOSE)
    std::cout << "[ QCIS_READER ] rebuilt extension gate " << g->diagram_label()
                << " on " << join(context_targets_, ", ") << "\n";
#endif

    step_.append(OPERATION(std::move(g), std::move(qubits)));
}

void
READER::commit_step()
{
    if (step_.empty())
        circuit_.append_moment(MOMENT{});
    else
        circuit_.extend(step_);
    step_ = CIRCUIT{};
}

bool
READER::is_ignored(const std::string& line) const
{
    return std::any_of(ignored_prefixes_.begin(), ignored_prefixes_.end(),
                        [&line] (const std::string& p) { return line.starts_with(p); });
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::vector<std::string>
parse_target_list(std::string_view s)
{
    std::vector<std::string> out;
    size_t i{0};
    while (i < s.size())
    {
        char q = s[i];
        if (q != '\'' && q != '"')
        {
            i++;
            continue;
        }
        size_t end = s.find(q, i+1);
        if (end == std::string_view::npos)
        {
            throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::MALFORMED_DESCRIPTOR,
                        "unterminated name in target list \"" + std::string{s} + "\"");
        }
        out.emplace_back(s.substr(i+1, end-i-1));
        i = end+1;
    }
    return out;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

CIRCUIT
qcis_to_circuit(std::string_view text,
                const name_to_qubit_fn& name_to_qubit,
                const std::optional<COUPLER_MAP>& couplers,
                const std::vector<std::string>& ignored,
                const EXTENSION_REGISTRY& registry)
{
    READER reader(text, couplers, ignored, registry);
    CIRCUIT named = reader.read();

    // late binding: names are only resolved once the whole text is read
    return named.transform_qubits([&name_to_qubit] (const QUBIT& q) { return name_to_qubit(q.name); });
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
