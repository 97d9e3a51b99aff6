/*
    author: qcisbridge developers
    date:   9 February 2026
*/

#include "error.h"

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

const std::string_view REMEDIATION_HINT =
    "either add it to the gate table, implement it as an extension gate with its own qcis conversion, "
    "or add it to the ignore set";

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

TRANSLATION_ERROR::TRANSLATION_ERROR(TYPE _type, const std::string& msg)
    :std::runtime_error(std::string{error_type_name(_type)} + ": " + msg),
    type(_type)
{}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string_view
error_type_name(TRANSLATION_ERROR::TYPE t)
{
    using TYPE = TRANSLATION_ERROR::TYPE;

    switch (t)
    {
    case TYPE::MISSING_COUPLER:             return "missing coupler";
    case TYPE::UNKNOWN_EXTENSION:           return "unknown extension";
    case TYPE::UNCONVERTIBLE_OPERATION:     return "unconvertible operation";
    case TYPE::UNRECOGNIZED_INSTRUCTION:    return "unrecognized instruction";
    case TYPE::UNKNOWN_GATE:                return "unknown gate";
    case TYPE::UNKNOWN_OPCODE:              return "unknown opcode";
    case TYPE::INVALID_PULSE_AXIS:          return "invalid pulse axis";
    case TYPE::INVALID_PULSE_COUNT:         return "invalid pulse count";
    case TYPE::DURATION_EXCEEDED:           return "duration exceeded";
    case TYPE::INVALID_OPERATION:           return "invalid operation";
    case TYPE::OVERLAPPING_OPERATION:       return "overlapping operation";
    case TYPE::NOT_YET_SUPPORTED:           return "not yet supported";
    case TYPE::MALFORMED_DESCRIPTOR:        return "malformed descriptor";
    case TYPE::UNTERMINATED_CONTEXT:        return "unterminated context";
    }
    return "unknown error";
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis
