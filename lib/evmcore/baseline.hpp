// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <evmc/utils.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace evmcore
{
using evmc::bytes_view;
class ExecutionState;
class VM;

namespace baseline
{
/// The result of the code analysis done once before execution.
///
/// It owns a copy of the code padded with zero bytes, so that PUSH data truncated by
/// the end of the code reads as zeros and execution always ends with STOP,
/// and the bitmap of valid jump destinations.
class CodeAnalysis
{
public:
    /// The number of zero bytes appended to the code: 32 for missing PUSH32 data and
    /// 1 for the final STOP.
    static constexpr size_t padding = 32 + 1;

private:
    std::unique_ptr<uint8_t[]> m_padded_code;
    size_t m_code_size = 0;

    /// One bit per code position, set for JUMPDEST instructions.
    std::vector<uint64_t> m_jumpdest_bits;

public:
    CodeAnalysis(std::unique_ptr<uint8_t[]> padded_code, size_t code_size,
        std::vector<uint64_t> jumpdest_bits) noexcept
      : m_padded_code{std::move(padded_code)},
        m_code_size{code_size},
        m_jumpdest_bits{std::move(jumpdest_bits)}
    {}

    /// The original code, without padding.
    [[nodiscard]] bytes_view raw_code() const noexcept
    {
        return {m_padded_code.get(), m_code_size};
    }

    /// The code the interpreter executes; padding follows it in memory.
    [[nodiscard]] const uint8_t* executable_code() const noexcept { return m_padded_code.get(); }

    /// Checks if the position is a JUMPDEST instruction (not a byte of PUSH data).
    [[nodiscard]] bool check_jumpdest(uint64_t position) const noexcept
    {
        if (position >= m_code_size)
            return false;
        return (m_jumpdest_bits[position / 64] & (uint64_t{1} << (position % 64))) != 0;
    }
};

/// Analyzes the code in preparation for execution: copies and pads the code
/// and builds the map of valid jump destinations.
EVMC_EXPORT CodeAnalysis analyze(bytes_view code);

/// Executes in the baseline interpreter using EVMC-compatible parameters.
evmc_result execute(evmc_vm* vm, const evmc_host_interface* host, evmc_host_context* ctx,
    evmc_revision rev, const evmc_message* msg, const uint8_t* code, size_t code_size) noexcept;

/// Executes in the baseline interpreter with the pre-analyzed code.
EVMC_EXPORT evmc_result execute(VM& vm, const evmc_host_interface& host, evmc_host_context* ctx,
    evmc_revision rev, const evmc_message& msg, const CodeAnalysis& analysis) noexcept;
}  // namespace baseline
}  // namespace evmcore
