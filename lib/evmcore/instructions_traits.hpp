// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "instructions_opcodes.hpp"
#include <array>
#include <optional>

namespace evmcore::instr
{
/// The gas cost sentinel marking an instruction as undefined in a revision.
constexpr int16_t undefined = -1;

/// The oldest revision the interpreter executes.
constexpr auto min_supported_revision = EVMC_LONDON;

/// The newest revision the interpreter executes.
constexpr auto max_supported_revision = EVMC_CANCUN;

/// Checks if the interpreter has a gas schedule for the revision.
constexpr bool is_supported(evmc_revision rev) noexcept
{
    return rev >= min_supported_revision && rev <= max_supported_revision;
}

/// EIP-2929 access costs (https://eips.ethereum.org/EIPS/eip-2929).
/// @{
inline constexpr auto cold_sload_cost = 2100;
inline constexpr auto cold_account_access_cost = 2600;
inline constexpr auto warm_storage_read_cost = 100;

/// The part of the cold account access cost charged on top of the warm cost,
/// which is always included in the base cost of account accessing instructions.
inline constexpr auto additional_cold_account_access_cost =
    cold_account_access_cost - warm_storage_read_cost;
/// @}

/// Gas costs of the call and create families.
/// @{
inline constexpr auto call_value_cost = 9000;
inline constexpr auto account_creation_cost = 25000;
inline constexpr auto create_data_gas = 200;
inline constexpr auto initcode_word_cost = 2;
inline constexpr auto keccak256_word_cost = 6;
inline constexpr auto copy_word_cost = 3;
inline constexpr auto log_data_cost = 8;
inline constexpr auto log_topic_cost = 375;
/// @}

/// The table of base gas costs, indexed by revision and opcode.
using GasCostTable = std::array<std::array<int16_t, 256>, EVMC_MAX_REVISION + 1>;

/// The base gas costs of instructions. Revisions outside of the supported range and
/// instructions undefined in a revision have instr::undefined cost.
constexpr inline GasCostTable gas_costs = []() noexcept {
    GasCostTable table{};
    for (auto& rev_table : table)
        rev_table.fill(undefined);

    auto& london = table[EVMC_LONDON];

    constexpr int16_t zero = 0;
    constexpr int16_t base = 2;
    constexpr int16_t very_low = 3;
    constexpr int16_t low = 5;
    constexpr int16_t mid = 8;
    constexpr int16_t high = 10;

    for (const auto op : {OP_STOP, OP_SSTORE, OP_RETURN, OP_REVERT, OP_INVALID})
        london[op] = zero;

    for (const auto op : {OP_ADDRESS, OP_ORIGIN, OP_CALLER, OP_CALLVALUE, OP_CALLDATASIZE,
             OP_CODESIZE, OP_GASPRICE, OP_RETURNDATASIZE, OP_COINBASE, OP_TIMESTAMP, OP_NUMBER,
             OP_PREVRANDAO, OP_GASLIMIT, OP_CHAINID, OP_BASEFEE, OP_POP, OP_PC, OP_MSIZE, OP_GAS})
        london[op] = base;

    for (const auto op : {OP_ADD, OP_SUB, OP_NOT, OP_LT, OP_GT, OP_SLT, OP_SGT, OP_EQ, OP_ISZERO,
             OP_AND, OP_OR, OP_XOR, OP_BYTE, OP_SHL, OP_SHR, OP_SAR, OP_CALLDATALOAD, OP_MLOAD,
             OP_MSTORE, OP_MSTORE8, OP_CALLDATACOPY, OP_CODECOPY, OP_RETURNDATACOPY})
        london[op] = very_low;

    for (const auto op : {OP_MUL, OP_DIV, OP_SDIV, OP_MOD, OP_SMOD, OP_SIGNEXTEND, OP_SELFBALANCE})
        london[op] = low;

    london[OP_ADDMOD] = mid;
    london[OP_MULMOD] = mid;
    london[OP_JUMP] = mid;
    london[OP_EXP] = high;
    london[OP_JUMPI] = high;
    london[OP_JUMPDEST] = 1;
    london[OP_BLOCKHASH] = 20;
    london[OP_KECCAK256] = 30;
    london[OP_SELFDESTRUCT] = 5000;

    // Account and storage access: the warm cost is the base cost, the cold surcharge is dynamic.
    for (const auto op : {OP_BALANCE, OP_EXTCODESIZE, OP_EXTCODECOPY, OP_EXTCODEHASH, OP_SLOAD,
             OP_CALL, OP_CALLCODE, OP_DELEGATECALL, OP_STATICCALL})
        london[op] = warm_storage_read_cost;

    for (auto op = size_t{OP_PUSH1}; op <= OP_PUSH32; ++op)
        london[op] = very_low;
    for (auto op = size_t{OP_DUP1}; op <= OP_DUP16; ++op)
        london[op] = very_low;
    for (auto op = size_t{OP_SWAP1}; op <= OP_SWAP16; ++op)
        london[op] = very_low;
    for (auto op = size_t{OP_LOG0}; op <= OP_LOG4; ++op)
        london[op] = static_cast<int16_t>((op - OP_LOG0 + 1) * log_topic_cost);

    london[OP_CREATE] = 32000;
    london[OP_CREATE2] = 32000;

    table[EVMC_PARIS] = london;

    table[EVMC_SHANGHAI] = table[EVMC_PARIS];
    table[EVMC_SHANGHAI][OP_PUSH0] = base;

    table[EVMC_CANCUN] = table[EVMC_SHANGHAI];
    table[EVMC_CANCUN][OP_BLOBHASH] = very_low;
    table[EVMC_CANCUN][OP_BLOBBASEFEE] = base;
    table[EVMC_CANCUN][OP_TLOAD] = warm_storage_read_cost;
    table[EVMC_CANCUN][OP_TSTORE] = warm_storage_read_cost;
    table[EVMC_CANCUN][OP_MCOPY] = very_low;

    return table;
}();

static_assert(gas_costs[max_supported_revision][OP_ADD] > 0, "gas costs missing for a revision");
static_assert(gas_costs[EVMC_BERLIN][OP_ADD] == undefined);


/// The EVM instruction traits.
struct Traits
{
    /// The instruction mnemonic.
    const char* name = nullptr;

    /// Size of the immediate argument in bytes.
    uint8_t immediate_size = 0;

    /// Whether the instruction ends the execution of the frame.
    bool is_terminating = false;

    /// The number of stack items the instruction accesses during execution.
    int8_t stack_height_required = 0;

    /// The stack height change caused by the instruction execution. Can be negative.
    int8_t stack_height_change = 0;

    /// The first supported revision defining the instruction. Empty for undefined opcodes.
    std::optional<evmc_revision> since;
};

namespace detail
{
constexpr const char* push_names[] = {"PUSH1", "PUSH2", "PUSH3", "PUSH4", "PUSH5", "PUSH6",
    "PUSH7", "PUSH8", "PUSH9", "PUSH10", "PUSH11", "PUSH12", "PUSH13", "PUSH14", "PUSH15",
    "PUSH16", "PUSH17", "PUSH18", "PUSH19", "PUSH20", "PUSH21", "PUSH22", "PUSH23", "PUSH24",
    "PUSH25", "PUSH26", "PUSH27", "PUSH28", "PUSH29", "PUSH30", "PUSH31", "PUSH32"};
constexpr const char* dup_names[] = {"DUP1", "DUP2", "DUP3", "DUP4", "DUP5", "DUP6", "DUP7",
    "DUP8", "DUP9", "DUP10", "DUP11", "DUP12", "DUP13", "DUP14", "DUP15", "DUP16"};
constexpr const char* swap_names[] = {"SWAP1", "SWAP2", "SWAP3", "SWAP4", "SWAP5", "SWAP6",
    "SWAP7", "SWAP8", "SWAP9", "SWAP10", "SWAP11", "SWAP12", "SWAP13", "SWAP14", "SWAP15",
    "SWAP16"};
constexpr const char* log_names[] = {"LOG0", "LOG1", "LOG2", "LOG3", "LOG4"};
}  // namespace detail

/// The revision independent table of traits of all known EVM instructions.
constexpr inline std::array<Traits, 256> traits = []() noexcept {
    std::array<Traits, 256> table{};

    // Pure stack operations: name, number of inputs, number of outputs.
    const auto op = [&table](Opcode code, const char* name, int inputs, int outputs,
                        evmc_revision since = EVMC_LONDON) noexcept {
        table[code] = {name, 0, false, static_cast<int8_t>(inputs),
            static_cast<int8_t>(outputs - inputs), since};
    };
    const auto terminating = [&table](Opcode code, const char* name, int inputs) noexcept {
        table[code] = {
            name, 0, true, static_cast<int8_t>(inputs), static_cast<int8_t>(-inputs), EVMC_LONDON};
    };

    terminating(OP_STOP, "STOP", 0);
    op(OP_ADD, "ADD", 2, 1);
    op(OP_MUL, "MUL", 2, 1);
    op(OP_SUB, "SUB", 2, 1);
    op(OP_DIV, "DIV", 2, 1);
    op(OP_SDIV, "SDIV", 2, 1);
    op(OP_MOD, "MOD", 2, 1);
    op(OP_SMOD, "SMOD", 2, 1);
    op(OP_ADDMOD, "ADDMOD", 3, 1);
    op(OP_MULMOD, "MULMOD", 3, 1);
    op(OP_EXP, "EXP", 2, 1);
    op(OP_SIGNEXTEND, "SIGNEXTEND", 2, 1);

    op(OP_LT, "LT", 2, 1);
    op(OP_GT, "GT", 2, 1);
    op(OP_SLT, "SLT", 2, 1);
    op(OP_SGT, "SGT", 2, 1);
    op(OP_EQ, "EQ", 2, 1);
    op(OP_ISZERO, "ISZERO", 1, 1);
    op(OP_AND, "AND", 2, 1);
    op(OP_OR, "OR", 2, 1);
    op(OP_XOR, "XOR", 2, 1);
    op(OP_NOT, "NOT", 1, 1);
    op(OP_BYTE, "BYTE", 2, 1);
    op(OP_SHL, "SHL", 2, 1);
    op(OP_SHR, "SHR", 2, 1);
    op(OP_SAR, "SAR", 2, 1);

    op(OP_KECCAK256, "KECCAK256", 2, 1);

    op(OP_ADDRESS, "ADDRESS", 0, 1);
    op(OP_BALANCE, "BALANCE", 1, 1);
    op(OP_ORIGIN, "ORIGIN", 0, 1);
    op(OP_CALLER, "CALLER", 0, 1);
    op(OP_CALLVALUE, "CALLVALUE", 0, 1);
    op(OP_CALLDATALOAD, "CALLDATALOAD", 1, 1);
    op(OP_CALLDATASIZE, "CALLDATASIZE", 0, 1);
    op(OP_CALLDATACOPY, "CALLDATACOPY", 3, 0);
    op(OP_CODESIZE, "CODESIZE", 0, 1);
    op(OP_CODECOPY, "CODECOPY", 3, 0);
    op(OP_GASPRICE, "GASPRICE", 0, 1);
    op(OP_EXTCODESIZE, "EXTCODESIZE", 1, 1);
    op(OP_EXTCODECOPY, "EXTCODECOPY", 4, 0);
    op(OP_RETURNDATASIZE, "RETURNDATASIZE", 0, 1);
    op(OP_RETURNDATACOPY, "RETURNDATACOPY", 3, 0);
    op(OP_EXTCODEHASH, "EXTCODEHASH", 1, 1);

    op(OP_BLOCKHASH, "BLOCKHASH", 1, 1);
    op(OP_COINBASE, "COINBASE", 0, 1);
    op(OP_TIMESTAMP, "TIMESTAMP", 0, 1);
    op(OP_NUMBER, "NUMBER", 0, 1);
    op(OP_PREVRANDAO, "PREVRANDAO", 0, 1);
    op(OP_GASLIMIT, "GASLIMIT", 0, 1);
    op(OP_CHAINID, "CHAINID", 0, 1);
    op(OP_SELFBALANCE, "SELFBALANCE", 0, 1);
    op(OP_BASEFEE, "BASEFEE", 0, 1);
    op(OP_BLOBHASH, "BLOBHASH", 1, 1, EVMC_CANCUN);
    op(OP_BLOBBASEFEE, "BLOBBASEFEE", 0, 1, EVMC_CANCUN);

    op(OP_POP, "POP", 1, 0);
    op(OP_MLOAD, "MLOAD", 1, 1);
    op(OP_MSTORE, "MSTORE", 2, 0);
    op(OP_MSTORE8, "MSTORE8", 2, 0);
    op(OP_SLOAD, "SLOAD", 1, 1);
    op(OP_SSTORE, "SSTORE", 2, 0);
    op(OP_JUMP, "JUMP", 1, 0);
    op(OP_JUMPI, "JUMPI", 2, 0);
    op(OP_PC, "PC", 0, 1);
    op(OP_MSIZE, "MSIZE", 0, 1);
    op(OP_GAS, "GAS", 0, 1);
    op(OP_JUMPDEST, "JUMPDEST", 0, 0);
    op(OP_TLOAD, "TLOAD", 1, 1, EVMC_CANCUN);
    op(OP_TSTORE, "TSTORE", 2, 0, EVMC_CANCUN);
    op(OP_MCOPY, "MCOPY", 3, 0, EVMC_CANCUN);
    op(OP_PUSH0, "PUSH0", 0, 1, EVMC_SHANGHAI);

    for (uint8_t n = 1; n <= 32; ++n)
        table[OP_PUSH1 + n - 1] = {detail::push_names[n - 1], n, false, 0, 1, EVMC_LONDON};

    for (int n = 1; n <= 16; ++n)
    {
        op(static_cast<Opcode>(OP_DUP1 + n - 1), detail::dup_names[n - 1], n, n + 1);
        op(static_cast<Opcode>(OP_SWAP1 + n - 1), detail::swap_names[n - 1], n + 1, n + 1);
    }

    for (int n = 0; n <= 4; ++n)
        op(static_cast<Opcode>(OP_LOG0 + n), detail::log_names[n], n + 2, 0);

    op(OP_CREATE, "CREATE", 3, 1);
    op(OP_CALL, "CALL", 7, 1);
    op(OP_CALLCODE, "CALLCODE", 7, 1);
    terminating(OP_RETURN, "RETURN", 2);
    op(OP_DELEGATECALL, "DELEGATECALL", 6, 1);
    op(OP_CREATE2, "CREATE2", 4, 1);
    op(OP_STATICCALL, "STATICCALL", 6, 1);
    terminating(OP_REVERT, "REVERT", 2);
    terminating(OP_INVALID, "INVALID", 0);
    terminating(OP_SELFDESTRUCT, "SELFDESTRUCT", 1);

    return table;
}();

static_assert(traits[OP_SWAP16].stack_height_required == 17);
static_assert(traits[OP_PUSH32].immediate_size == 32);
static_assert(traits[OP_CALL].stack_height_change == -6);
}  // namespace evmcore::instr
