// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/utils.h>
#include <intx/intx.hpp>
#include <memory>
#include <ostream>

namespace evmcore
{
using evmc::bytes_view;

class ExecutionState;

/// Observes the baseline interpreter. The VM owns a singly linked chain of tracers and
/// the interpreter notifies its head, which forwards every event down the chain.
class Tracer
{
    friend class VM;
    std::unique_ptr<Tracer> m_next_tracer;

public:
    virtual ~Tracer() = default;

    /// A frame starts executing the code.
    void notify_execution_start(evmc_revision rev, const evmc_message& msg, bytes_view code) noexcept
    {
        for (auto* t = this; t != nullptr; t = t->m_next_tracer.get())
            t->on_execution_start(rev, msg, code);
    }

    /// The frame has finished with the result.
    void notify_execution_end(const evmc_result& result) noexcept
    {
        for (auto* t = this; t != nullptr; t = t->m_next_tracer.get())
            t->on_execution_end(result);
    }

    /// The instruction at pc is about to execute; gas is what remains before its cost.
    void notify_instruction_start(uint32_t pc, intx::uint256* stack_top, int stack_height,
        int64_t gas, const ExecutionState& state) noexcept
    {
        for (auto* t = this; t != nullptr; t = t->m_next_tracer.get())
            t->on_instruction_start(pc, stack_top, stack_height, gas, state);
    }

private:
    virtual void on_execution_start(
        evmc_revision rev, const evmc_message& msg, bytes_view code) noexcept = 0;
    virtual void on_instruction_start(uint32_t pc, const intx::uint256* stack_top, int stack_height,
        int64_t gas, const ExecutionState& state) noexcept = 0;
    virtual void on_execution_end(const evmc_result& result) noexcept = 0;
};

/// Prints the opcode counts of every frame as CSV rows when the frame ends.
EVMC_EXPORT std::unique_ptr<Tracer> create_histogram_tracer(std::ostream& out);

/// One JSON line per instruction (pc, opcode, gas, stack, memory size, depth)
/// followed by the frame summary line.
EVMC_EXPORT std::unique_ptr<Tracer> create_instruction_tracer(std::ostream& out);
}  // namespace evmcore
