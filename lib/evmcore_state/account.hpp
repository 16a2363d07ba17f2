// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <limits>
#include <unordered_map>

namespace evmcore::state
{
using evmc::address;
using evmc::bytes;
using evmc::bytes32;
using namespace evmc::literals;

/// The storage slot as seen by SSTORE: the value at the transaction start and the current one.
struct StorageValue
{
    /// The current value.
    bytes32 current;

    /// The value at the start of the transaction.
    bytes32 original;
};

/// The account as cached and modified by the transaction.
struct Account
{
    /// The maximum nonce value (EIP-2681).
    static constexpr auto NonceMax = std::numeric_limits<uint64_t>::max();

    /// The keccak256 hash of the empty code.
    static constexpr auto EMPTY_CODE_HASH =
        0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32;

    uint64_t nonce = 0;

    intx::uint256 balance;

    bytes32 code_hash = EMPTY_CODE_HASH;

    /// The account had storage in the initial state.
    bool has_initial_storage = false;

    /// The storage slots accessed in the transaction.
    std::unordered_map<bytes32, StorageValue> storage;

    /// The code, loaded lazily. Check code_hash to know if the code is empty.
    bytes code;

    /// The account has been self-destructed and is deleted at the end of the transaction.
    bool destructed = false;

    /// The account is deleted at the end of the transaction if it is empty (EIP-161).
    bool erase_if_empty = false;

    /// The account has been created in this transaction.
    bool just_created = false;

    /// The code has been deployed in this transaction.
    bool code_changed = false;

    [[nodiscard]] bool is_empty() const noexcept
    {
        return nonce == 0 && balance == 0 && code_hash == EMPTY_CODE_HASH;
    }
};
}  // namespace evmcore::state
