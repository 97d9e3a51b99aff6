/*
    author: qcisbridge developers
    date:   10 February 2026
*/

#include "circuit.h"
#include "error.h"
#include "globals.h"

#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

namespace
{

bool
_has_duplicates(const std::vector<QUBIT>& qubits)
{
    std::set<QUBIT> seen;
    for (const auto& q : qubits)
    {
        if (!seen.insert(q).second)
            return true;
    }
    return false;
}

std::vector<QUBIT>
_sorted(std::vector<QUBIT> qubits)
{
    std::sort(qubits.begin(), qubits.end());
    return qubits;
}

std::string
_qubit_list(const std::vector<QUBIT>& qubits)
{
    std::vector<std::string> names;
    names.reserve(qubits.size());
    for (const auto& q : qubits)
        names.push_back(q.to_string());
    return join(names, ", ");
}

std::string
_format_arg(double x)
{
    std::ostringstream strm;
    strm << x;
    return strm.str();
}

}   // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

QUBIT
QUBIT::grid(int64_t row, int64_t col)
{
    return QUBIT{row, col, ""};
}

QUBIT
QUBIT::named(std::string name)
{
    if (name.empty())
        throw std::invalid_argument("QUBIT::named: name cannot be empty");
    return QUBIT{0, 0, std::move(name)};
}

bool
QUBIT::is_named() const
{
    return !name.empty();
}

bool
QUBIT::operator==(const QUBIT& other) const
{
    if (is_named() != other.is_named())
        return false;
    if (is_named())
        return name == other.name;
    return row == other.row && col == other.col;
}

bool
QUBIT::operator<(const QUBIT& other) const
{
    // grid qubits order before named qubits
    if (is_named() != other.is_named())
        return !is_named();
    if (is_named())
        return name < other.name;
    return row < other.row || (row == other.row && col < other.col);
}

std::string
QUBIT::to_string() const
{
    if (is_named())
        return name;
    return "q(" + std::to_string(row) + ", " + std::to_string(col) + ")";
}

std::ostream&
operator<<(std::ostream& out, const QUBIT& q)
{
    return out << q.to_string();
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

qubit_to_name_fn
make_qubit_namer(std::map<QUBIT, std::string> names)
{
    return [names=std::move(names)] (const QUBIT& q) { return names.at(q); };
}

name_to_qubit_fn
make_name_resolver(std::map<std::string, QUBIT> qubits)
{
    return [qubits=std::move(qubits)] (const std::string& name) { return qubits.at(name); };
}

qubit_to_name_fn
named_qubit_namer()
{
    return [] (const QUBIT& q)
    {
        if (!q.is_named())
            throw std::invalid_argument("named_qubit_namer: qubit " + q.to_string() + " has no name");
        return q.name;
    };
}

name_to_qubit_fn
named_qubit_resolver()
{
    return [] (const std::string& name) { return QUBIT::named(name); };
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

GATE
GATE::measure(std::string key)
{
    return GATE{TYPE::MEASURE, {}, std::move(key)};
}

size_t
GATE::num_qubits() const
{
    switch (type)
    {
    case TYPE::CZ:
    case TYPE::CX:
    case TYPE::TWO_QUBIT_ASYMMETRIC_DEPOLARIZE:
        return 2;

    case TYPE::MEASURE:
    case TYPE::DETECTOR:
    case TYPE::OBSERVABLE_INCLUDE:
    case TYPE::SHIFT_COORDS:
        return ANY_ARITY;

    default:
        return 1;
    }
}

bool
GATE::operator==(const GATE& other) const
{
    return type == other.type && args == other.args && key == other.key;
}

std::string
GATE::to_string() const
{
    std::string out(gate_type_name(type));
    if (type == TYPE::MEASURE)
        return out + "('" + key + "')";
    if (!args.empty())
    {
        std::vector<std::string> arg_strings;
        for (double x : args)
            arg_strings.push_back(_format_arg(x));
        out += "(" + join(arg_strings, ", ") + ")";
    }
    return out;
}

std::string_view
gate_type_name(GATE::TYPE t)
{
    switch (t)
    {
    case GATE::TYPE::X:                                 return "X";
    case GATE::TYPE::Y:                                 return "Y";
    case GATE::TYPE::X2P:                               return "X2P";
    case GATE::TYPE::X2M:                               return "X2M";
    case GATE::TYPE::Y2P:                               return "Y2P";
    case GATE::TYPE::Y2M:                               return "Y2M";
    case GATE::TYPE::CZ:                                return "CZ";
    case GATE::TYPE::MEASURE:                           return "MEASURE";
    case GATE::TYPE::Z:                                 return "Z";
    case GATE::TYPE::H:                                 return "H";
    case GATE::TYPE::S:                                 return "S";
    case GATE::TYPE::T:                                 return "T";
    case GATE::TYPE::CX:                                return "CX";
    case GATE::TYPE::RX:                                return "RX";
    case GATE::TYPE::RY:                                return "RY";
    case GATE::TYPE::RZ:                                return "RZ";
    case GATE::TYPE::DEPOLARIZE:                        return "DEPOLARIZE";
    case GATE::TYPE::ASYMMETRIC_DEPOLARIZE:             return "ASYMMETRIC_DEPOLARIZE";
    case GATE::TYPE::TWO_QUBIT_ASYMMETRIC_DEPOLARIZE:   return "TWO_QUBIT_ASYMMETRIC_DEPOLARIZE";
    case GATE::TYPE::DETECTOR:                          return "DETECTOR";
    case GATE::TYPE::OBSERVABLE_INCLUDE:                return "OBSERVABLE_INCLUDE";
    case GATE::TYPE::SHIFT_COORDS:                      return "SHIFT_COORDS";
    }
    return "?";
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

OPERATION::OPERATION(GATE g, std::vector<QUBIT> qubits)
{
    size_t arity = g.num_qubits();
    if (arity != GATE::ANY_ARITY && qubits.size() != arity)
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_OPERATION,
                    "gate " + g.to_string() + " acts on " + std::to_string(arity)
                    + " qubits, but was given " + std::to_string(qubits.size()));
    }
    if (g.type == GATE::TYPE::MEASURE && qubits.empty())
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_OPERATION, "measurement must act on at least one qubit");
    if (_has_duplicates(qubits))
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_OPERATION, "duplicate qubits in " + g.to_string() + " operation");

    value_ = GATE_OPERATION{std::move(g), std::move(qubits)};
}

OPERATION::OPERATION(extension_ptr g, std::vector<QUBIT> qubits)
{
    if (g == nullptr)
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_OPERATION, "extension gate cannot be null");
    if (qubits.size() != g->num_qubits())
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_OPERATION,
                    "extension gate " + g->name() + " acts on " + std::to_string(g->num_qubits())
                    + " qubits, but was given " + std::to_string(qubits.size()));
    }
    if (_has_duplicates(qubits))
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_OPERATION, "duplicate qubits in " + g->name() + " operation");

    value_ = EXTENSION_OPERATION{std::move(g), std::move(qubits)};
}

OPERATION::OPERATION(std::shared_ptr<const CIRCUIT> c, uint64_t repetitions)
{
    if (c == nullptr)
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_OPERATION, "subcircuit cannot be null");
    if (repetitions == 0)
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::INVALID_OPERATION, "subcircuit must be repeated at least once");

    value_ = SUBCIRCUIT_OPERATION{std::move(c), repetitions};
}

const OPERATION::variant_type&
OPERATION::value() const
{
    return value_;
}

std::vector<QUBIT>
OPERATION::qubits() const
{
    return std::visit([] (const auto& op) -> std::vector<QUBIT>
            {
                using T = std::decay_t<decltype(op)>;
                if constexpr (std::is_same_v<T, SUBCIRCUIT_OPERATION>)
                    return op.circuit->all_qubits();
                else
                    return op.qubits;
            },
            value_);
}

OPERATION
OPERATION::transform_qubits(const qubit_map_fn& f) const
{
    auto map_all = [&f] (const std::vector<QUBIT>& qubits)
    {
        std::vector<QUBIT> out;
        out.reserve(qubits.size());
        for (const auto& q : qubits)
            out.push_back(f(q));
        return out;
    };

    return std::visit([&] (const auto& op) -> OPERATION
            {
                using T = std::decay_t<decltype(op)>;
                if constexpr (std::is_same_v<T, GATE_OPERATION>)
                    return OPERATION(op.gate, map_all(op.qubits));
                else if constexpr (std::is_same_v<T, EXTENSION_OPERATION>)
                    return OPERATION(op.gate, map_all(op.qubits));
                else
                    return repeat(op.circuit->transform_qubits(f), op.repetitions);
            },
            value_);
}

bool
OPERATION::operator==(const OPERATION& other) const
{
    if (value_.index() != other.value_.index())
        return false;

    if (const auto* a = std::get_if<GATE_OPERATION>(&value_))
    {
        const auto& b = std::get<GATE_OPERATION>(other.value_);
        if (!(a->gate == b.gate))
            return false;
        // CZ is symmetric in its qubits
        if (a->gate.type == GATE::TYPE::CZ)
            return _sorted(a->qubits) == _sorted(b.qubits);
        return a->qubits == b.qubits;
    }
    else if (const auto* ea = std::get_if<EXTENSION_OPERATION>(&value_))
    {
        const auto& eb = std::get<EXTENSION_OPERATION>(other.value_);
        return ea->qubits == eb.qubits && ea->gate->equals(*eb.gate);
    }
    else
    {
        const auto& sa = std::get<SUBCIRCUIT_OPERATION>(value_);
        const auto& sb = std::get<SUBCIRCUIT_OPERATION>(other.value_);
        return sa.repetitions == sb.repetitions && *sa.circuit == *sb.circuit;
    }
}

std::string
OPERATION::to_string() const
{
    return std::visit([] (const auto& op) -> std::string
            {
                using T = std::decay_t<decltype(op)>;
                if constexpr (std::is_same_v<T, GATE_OPERATION>)
                    return op.gate.to_string() + " on " + _qubit_list(op.qubits);
                else if constexpr (std::is_same_v<T, EXTENSION_OPERATION>)
                    return op.gate->diagram_label() + " on " + _qubit_list(op.qubits);
                else
                    return "SUBCIRCUIT(" + std::to_string(op.circuit->size()) + " moments) x "
                                + std::to_string(op.repetitions);
            },
            value_);
}

OPERATION
repeat(CIRCUIT c, uint64_t repetitions)
{
    return OPERATION(std::make_shared<const CIRCUIT>(std::move(c)), repetitions);
}

std::ostream&
operator<<(std::ostream& out, const OPERATION& op)
{
    return out << op.to_string();
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

MOMENT::MOMENT(std::initializer_list<OPERATION> ops)
    :MOMENT(std::vector<OPERATION>(ops))
{}

MOMENT::MOMENT(std::vector<OPERATION> ops)
{
    for (auto& op : ops)
        add(std::move(op));
}

void
MOMENT::add(OPERATION op)
{
    if (operates_on(op.qubits()))
    {
        throw TRANSLATION_ERROR(TRANSLATION_ERROR::TYPE::OVERLAPPING_OPERATION,
                    "operation " + op.to_string() + " overlaps with another operation in the moment");
    }
    operations_.push_back(std::move(op));
}

bool
MOMENT::operates_on(const std::vector<QUBIT>& qubits) const
{
    for (const auto& op : operations_)
    {
        auto op_qubits = op.qubits();
        for (const auto& q : qubits)
        {
            if (std::find(op_qubits.begin(), op_qubits.end(), q) != op_qubits.end())
                return true;
        }
    }
    return false;
}

const std::vector<OPERATION>&
MOMENT::operations() const
{
    return operations_;
}

size_t
MOMENT::size() const
{
    return operations_.size();
}

bool
MOMENT::empty() const
{
    return operations_.empty();
}

std::vector<OPERATION>::const_iterator
MOMENT::begin() const
{
    return operations_.begin();
}

std::vector<OPERATION>::const_iterator
MOMENT::end() const
{
    return operations_.end();
}

bool
MOMENT::operator==(const MOMENT& other) const
{
    if (size() != other.size())
        return false;

    // operations are on disjoint qubits, so each one matches at most one
    // operation in `other`, except for operations without qubits.
    std::vector<bool> matched(other.size(), false);
    for (const auto& op : operations_)
    {
        bool found{false};
        for (size_t i = 0; i < other.size(); i++)
        {
            if (!matched[i] && op == other.operations_[i])
            {
                matched[i] = true;
                found = true;
                break;
            }
        }
        if (!found)
            return false;
    }
    return true;
}

std::string
MOMENT::to_string() const
{
    std::vector<std::string> op_strings;
    op_strings.reserve(size());
    for (const auto& op : operations_)
        op_strings.push_back(op.to_string());
    return join(op_strings, "; ");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

CIRCUIT::CIRCUIT(std::initializer_list<MOMENT> moments)
    :moments_(moments)
{}

CIRCUIT::CIRCUIT(std::vector<MOMENT> moments)
    :moments_(std::move(moments))
{}

void
CIRCUIT::append(OPERATION op)
{
    auto qubits = op.qubits();

    // scan backwards for the last moment that conflicts with `op`:
    size_t k = moments_.size();
    while (k > 0 && !moments_[k-1].operates_on(qubits))
        k--;

    if (k == moments_.size())
        moments_.emplace_back();
    moments_[k].add(std::move(op));
}

void
CIRCUIT::append_moment(MOMENT m)
{
    moments_.push_back(std::move(m));
}

void
CIRCUIT::extend(const CIRCUIT& other)
{
    moments_.insert(moments_.end(), other.moments_.begin(), other.moments_.end());
}

const std::vector<MOMENT>&
CIRCUIT::moments() const
{
    return moments_;
}

size_t
CIRCUIT::size() const
{
    return moments_.size();
}

bool
CIRCUIT::empty() const
{
    return moments_.empty();
}

std::vector<MOMENT>::const_iterator
CIRCUIT::begin() const
{
    return moments_.begin();
}

std::vector<MOMENT>::const_iterator
CIRCUIT::end() const
{
    return moments_.end();
}

std::vector<QUBIT>
CIRCUIT::all_qubits() const
{
    std::set<QUBIT> qubits;
    for (const auto& m : moments_)
    {
        for (const auto& op : m)
        {
            auto op_qubits = op.qubits();
            qubits.insert(op_qubits.begin(), op_qubits.end());
        }
    }
    return std::vector<QUBIT>(qubits.begin(), qubits.end());
}

CIRCUIT
CIRCUIT::transform_qubits(const qubit_map_fn& f) const
{
    std::vector<MOMENT> moments;
    moments.reserve(moments_.size());
    for (const auto& m : moments_)
    {
        MOMENT m_new;
        for (const auto& op : m)
            m_new.add(op.transform_qubits(f));
        moments.push_back(std::move(m_new));
    }
    return CIRCUIT(std::move(moments));
}

bool
CIRCUIT::operator==(const CIRCUIT& other) const
{
    return moments_ == other.moments_;
}

std::string
CIRCUIT::to_string() const
{
    std::ostringstream strm;
    for (size_t i = 0; i < moments_.size(); i++)
        strm << "moment " << i << ": " << moments_[i].to_string() << "\n";
    return strm.str();
}

std::ostream&
operator<<(std::ostream& out, const CIRCUIT& c)
{
    return out << c.to_string();
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
