/*
    author: qcisbridge developers
    date:   12 February 2026

    Markers for extension gate blocks. The writer wraps the output of
    `EXTENSION_GATE::emit_qcis` as

        # CIRQ_CONTEXT_START
        # Gate: <descriptor>
        # Targets: ['Q01']
        ...
        # CIRQ_CONTEXT_END
*/

#ifndef QCIS_QCIS_CONTEXT_h
#define QCIS_QCIS_CONTEXT_h

#include <string_view>

namespace qcis
{

constexpr std::string_view CONTEXT_START{"# CIRQ_CONTEXT_START"};
constexpr std::string_view CONTEXT_END{"# CIRQ_CONTEXT_END"};

constexpr std::string_view CONTEXT_GATE_PREFIX{"# Gate: "};
constexpr std::string_view CONTEXT_TARGETS_PREFIX{"# Targets: "};

constexpr char COMMENT_CHAR{'#'};

}   // namespace qcis

#endif  // QCIS_QCIS_CONTEXT_h
