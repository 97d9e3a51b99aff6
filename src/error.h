/*
    author: qcisbridge developers
    date:   9 February 2026
*/

#ifndef QCIS_ERROR_h
#define QCIS_ERROR_h

#include <stdexcept>
#include <string>
#include <string_view>

namespace qcis
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * All failures raised by the translators and the extension gates.
 * Every failure is a deterministic function of the input, so nothing
 * is retried internally -- the caller decides whether to extend the
 * gate table, the registry, or the ignore set and try again.
 * */
class TRANSLATION_ERROR : public std::runtime_error
{
public:
    enum class TYPE
    {
        // configuration errors:
        MISSING_COUPLER,
        UNKNOWN_EXTENSION,

        // unsupported input:
        UNCONVERTIBLE_OPERATION,
        UNRECOGNIZED_INSTRUCTION,
        UNKNOWN_GATE,
        UNKNOWN_OPCODE,

        // validation errors:
        INVALID_PULSE_AXIS,
        INVALID_PULSE_COUNT,
        DURATION_EXCEEDED,
        INVALID_OPERATION,
        OVERLAPPING_OPERATION,

        // partial input:
        NOT_YET_SUPPORTED,
        MALFORMED_DESCRIPTOR,
        UNTERMINATED_CONTEXT
    };

    const TYPE type;

    TRANSLATION_ERROR(TYPE, const std::string& msg);
};

std::string_view error_type_name(TRANSLATION_ERROR::TYPE);

/*
 * The remediation hint appended to every "unsupported input" message.
 * */
extern const std::string_view REMEDIATION_HINT;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}   // namespace qcis

#endif  // QCIS_ERROR_h
