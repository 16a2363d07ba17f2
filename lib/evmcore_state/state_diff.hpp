// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <optional>
#include <vector>

namespace evmcore::state
{
using evmc::address;
using evmc::bytes;
using evmc::bytes32;
using intx::uint256;

/// The changes a transaction makes to the state, to be applied by the embedder.
struct StateDiff
{
    struct Entry
    {
        address addr;

        /// The nonce after the transaction.
        uint64_t nonce;

        /// The balance after the transaction.
        uint256 balance;

        /// The deployed code, only for contracts created in the transaction.
        std::optional<bytes> code;

        /// The modified storage slots: key => new value. Zero value means the slot is cleared.
        std::vector<std::pair<bytes32, bytes32>> modified_storage;
    };

    /// Modified or created accounts.
    std::vector<Entry> modified_accounts;

    /// Deleted accounts: self-destructed or touched and empty. Disjoint with modified_accounts.
    std::vector<address> deleted_accounts;
};
}  // namespace evmcore::state
