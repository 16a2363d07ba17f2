// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "state_diff.hpp"
#include "transaction.hpp"
#include <optional>
#include <string_view>
#include <variant>

namespace evmcore::state
{
enum class SuccessReason : uint8_t
{
    stop,
    return_,
    self_destruct,
};

/// The kinds of faults ending the execution and consuming all the gas.
enum class HaltReason : uint8_t
{
    out_of_gas,
    invalid_jump,
    invalid_opcode,
    stack_underflow,
    stack_overflow,
    static_state_change,
    create_collision,
    nonce_overflow,
    create_size_limit,
    create_code_rejected,
    recursive_create,
    precompile_failure,
    invalid_memory_access,
    internal_error,
};

struct Success
{
    SuccessReason reason = SuccessReason::stop;
    int64_t gas_used = 0;

    /// The refund applied, after the cap.
    int64_t gas_refunded = 0;
    bytes output;
    std::vector<Log> logs;
};

struct Revert
{
    bytes output;
    int64_t gas_used = 0;
};

struct Halt
{
    HaltReason reason = HaltReason::internal_error;
    int64_t gas_used = 0;
};

using Result = std::variant<Success, Revert, Halt>;

/// The outcome of the executed transaction.
struct ExecutionOutcome
{
    Result result;

    /// The state changes, including the gas payment of a failed transaction.
    StateDiff diff;

    /// The gas paid for by the sender.
    int64_t gas_used = 0;

    /// The status code of the top-level frame.
    evmc_status_code status = EVMC_INTERNAL_ERROR;

    /// The address of the created contract, for a successful creation transaction.
    std::optional<address> create_address;
};

/// Maps the status code of a failed frame to the halt reason.
HaltReason to_halt_reason(evmc_status_code status) noexcept;

/// Returns the name of the halt reason.
std::string_view to_string(HaltReason reason) noexcept;
}  // namespace evmcore::state
