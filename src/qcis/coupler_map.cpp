/*
    author: qcisbridge developers
    date:   12 February 2026
*/

#include "qcis/coupler_map.h"
#include "globals.h"

#include <stdexcept>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

namespace
{

COUPLER_MAP::qubit_pair_type
_unordered_key(const std::string& a, const std::string& b)
{
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

}   // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

COUPLER_MAP::COUPLER_MAP(std::initializer_list<entry_type> entries)
{
    for (const auto& [c, a, b] : entries)
        add(c, a, b);
}

COUPLER_MAP
COUPLER_MAP::from_string(std::string_view s)
{
    COUPLER_MAP out;
    for (const auto& entry : split(s, ','))
    {
        auto e = trim(entry);
        if (e.empty())
            continue;
        std::vector<std::string> fields;
        for (const auto& f : split(e, ':'))
            fields.emplace_back(trim(f));
        if (fields.size() != 3 || fields[0].empty() || fields[1].empty() || fields[2].empty())
            throw std::invalid_argument("COUPLER_MAP::from_string: expected coupler:qubit:qubit, got \"" + std::string{e} + "\"");
        out.add(fields[0], fields[1], fields[2]);
    }
    return out;
}

void
COUPLER_MAP::add(std::string coupler, std::string qubit_a, std::string qubit_b)
{
    if (qubit_a == qubit_b)
        throw std::invalid_argument("COUPLER_MAP::add: coupler " + coupler + " must connect two different qubits");

    auto key = _unordered_key(qubit_a, qubit_b);
    if (qubits_of_.count(coupler))
        throw std::invalid_argument("COUPLER_MAP::add: coupler " + coupler + " is already registered");
    if (coupler_of_.count(key))
    {
        throw std::invalid_argument("COUPLER_MAP::add: qubits " + qubit_a + " and " + qubit_b
                                    + " already have coupler " + coupler_of_.at(key));
    }

    coupler_of_[key] = coupler;
    qubits_of_[std::move(coupler)] = std::make_pair(std::move(qubit_a), std::move(qubit_b));
}

std::optional<std::string>
COUPLER_MAP::find_coupler(const std::string& qubit_a, const std::string& qubit_b) const
{
    auto it = coupler_of_.find(_unordered_key(qubit_a, qubit_b));
    if (it == coupler_of_.end())
        return std::nullopt;
    return it->second;
}

std::optional<COUPLER_MAP::qubit_pair_type>
COUPLER_MAP::find_qubits(const std::string& coupler) const
{
    auto it = qubits_of_.find(coupler);
    if (it == qubits_of_.end())
        return std::nullopt;
    return it->second;
}

size_t
COUPLER_MAP::size() const
{
    return qubits_of_.size();
}

std::vector<std::string>
COUPLER_MAP::couplers() const
{
    std::vector<std::string> out;
    out.reserve(qubits_of_.size());
    for (const auto& [c, q] : qubits_of_)
        out.push_back(c);
    return out;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
