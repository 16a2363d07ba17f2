// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "tracing.hpp"
#include "execution_state.hpp"
#include "instructions_traits.hpp"
#include <evmc/hex.hpp>
#include <array>
#include <vector>

namespace evmcore
{
namespace
{
std::string opcode_name(uint8_t opcode)
{
    if (const auto* const name = instr::traits[opcode].name; name != nullptr)
        return name;
    return "0x" + evmc::hex(opcode);
}

/// The "error" of the frame summary, empty for success.
std::string_view error_name(evmc_status_code status) noexcept
{
    switch (status)
    {
    case EVMC_SUCCESS:
        return {};
    case EVMC_REVERT:
        return "revert";
    case EVMC_OUT_OF_GAS:
        return "out of gas";
    case EVMC_INVALID_INSTRUCTION:
        return "invalid opcode";
    case EVMC_UNDEFINED_INSTRUCTION:
        return "undefined opcode";
    case EVMC_STACK_OVERFLOW:
        return "stack overflow";
    case EVMC_STACK_UNDERFLOW:
        return "stack underflow";
    case EVMC_BAD_JUMP_DESTINATION:
        return "invalid jump";
    case EVMC_INVALID_MEMORY_ACCESS:
        return "invalid memory access";
    case EVMC_STATIC_MODE_VIOLATION:
        return "static mode violation";
    case EVMC_CALL_DEPTH_EXCEEDED:
        return "recursive create";
    default:
        return "failure";
    }
}

/// Writes the integer as the JSON string of its 0x-prefixed hex form.
struct HexQuantity
{
    int64_t value;
};

std::ostream& operator<<(std::ostream& out, HexQuantity q)
{
    return out << "\"0x" << std::hex << q.value << std::dec << '"';
}

/// Counts the executed opcodes of every frame and prints them as CSV when the frame ends.
class HistogramTracer : public Tracer
{
    struct Frame
    {
        int32_t depth;
        const uint8_t* code;
        std::array<uint32_t, 256> counts{};
    };

    std::vector<Frame> m_frames;
    std::ostream& m_out;

    void on_execution_start(
        evmc_revision /*rev*/, const evmc_message& msg, bytes_view code) noexcept override
    {
        m_frames.push_back({msg.depth, code.data()});
    }

    void on_instruction_start(uint32_t pc, const intx::uint256* /*stack_top*/, int /*stack_height*/,
        int64_t /*gas*/, const ExecutionState& /*state*/) noexcept override
    {
        auto& frame = m_frames.back();
        ++frame.counts[frame.code[pc]];
    }

    void on_execution_end(const evmc_result& /*result*/) noexcept override
    {
        const auto& frame = m_frames.back();
        m_out << "--- # HISTOGRAM depth=" << frame.depth << '\n';
        m_out << "opcode,count\n";
        for (size_t op = 0; op < frame.counts.size(); ++op)
        {
            if (const auto n = frame.counts[op]; n != 0)
                m_out << opcode_name(static_cast<uint8_t>(op)) << ',' << n << '\n';
        }
        m_frames.pop_back();
    }

public:
    explicit HistogramTracer(std::ostream& out) noexcept : m_out{out} {}
};

/// Writes a JSON object for every instruction before it executes
/// and the summary of every frame after it ends.
class InstructionTracer : public Tracer
{
    struct Frame
    {
        int32_t depth;
        const uint8_t* code;
        int64_t gas;
    };

    std::vector<Frame> m_frames;
    std::ostream& m_out;

    /// The stack items from the bottom to the top.
    void write_stack(const intx::uint256* stack_top, int stack_height)
    {
        const auto* const bottom = stack_top - stack_height + 1;
        m_out << ",\"stack\":[";
        for (int i = 0; i < stack_height; ++i)
            m_out << (i != 0 ? "," : "") << "\"0x" << intx::hex(bottom[i]) << '"';
        m_out << ']';
    }

    void on_execution_start(
        evmc_revision /*rev*/, const evmc_message& msg, bytes_view code) noexcept override
    {
        m_frames.push_back({msg.depth, code.data(), msg.gas});
    }

    void on_instruction_start(uint32_t pc, const intx::uint256* stack_top, int stack_height,
        int64_t gas, const ExecutionState& state) noexcept override
    {
        const auto& frame = m_frames.back();
        const auto op = frame.code[pc];

        m_out << "{\"pc\":" << pc << ",\"op\":" << int{op};
        m_out << ",\"gas\":" << HexQuantity{gas};
        m_out << ",\"gasCost\":" << HexQuantity{static_cast<uint16_t>(instr::gas_costs[state.rev][op])};
        m_out << ",\"memSize\":" << state.memory.size();
        write_stack(stack_top, stack_height);
        if (!state.return_data.empty())
            m_out << ",\"returnData\":\"0x" << evmc::hex(state.return_data) << '"';
        // The depth is 1-based, as in other EVM tracers.
        m_out << ",\"depth\":" << frame.depth + 1;
        m_out << ",\"refund\":" << state.gas_refund;
        m_out << ",\"opName\":\"" << opcode_name(op) << "\"}\n";
    }

    void on_execution_end(const evmc_result& result) noexcept override
    {
        const auto& frame = m_frames.back();
        m_out << "{\"output\":\"0x" << evmc::hex({result.output_data, result.output_size}) << '"';
        m_out << ",\"gasUsed\":" << HexQuantity{frame.gas - result.gas_left};
        if (const auto error = error_name(result.status_code); !error.empty())
            m_out << ",\"error\":\"" << error << '"';
        m_out << "}\n";
        m_frames.pop_back();
    }

public:
    explicit InstructionTracer(std::ostream& out) noexcept : m_out{out} { m_out << std::dec; }
};
}  // namespace

std::unique_ptr<Tracer> create_histogram_tracer(std::ostream& out)
{
    return std::make_unique<HistogramTracer>(out);
}

std::unique_ptr<Tracer> create_instruction_tracer(std::ostream& out)
{
    return std::make_unique<InstructionTracer>(out);
}
}  // namespace evmcore
