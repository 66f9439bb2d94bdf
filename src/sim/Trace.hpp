// File: src/sim/Trace.hpp
// Purpose: Declare tracing configuration and sink for CPU instruction steps.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink borrows its output stream; the caller keeps it alive.
// Links: sim/Cpu.hpp
#pragma once

#include "isa/Isa.hpp"

#include <cstdint>
#include <ostream>

namespace rexta::sim
{

/// @brief Configuration for instruction tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,  ///< Tracing disabled
        Instr ///< One line per executed instruction
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Everything the sink needs to describe one executed instruction.
struct TraceEvent
{
    isa::Address pc = 0;                        ///< Address the instruction was fetched from.
    const isa::IsaEntry *entry = nullptr;       ///< Table row of the instruction.
    isa::DecodedInstr instr;                    ///< Decoded operands.
    const uint8_t *bytes = nullptr;             ///< Encoded bytes in memory.
    uint32_t length = 0;                        ///< Number of encoded bytes.
    bool carry = false;                         ///< CARRY after execution.
    bool zero = false;                          ///< ZERO after execution.
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record execution of one instruction.
    void onStep(const TraceEvent &ev);

  private:
    TraceConfig cfg; ///< Active configuration
};

} // namespace rexta::sim
