// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "block.hpp"
#include <intx/intx.hpp>
#include <optional>
#include <vector>

namespace evmcore::state
{
using AccessList = std::vector<std::pair<address, std::vector<bytes32>>>;

struct Transaction
{
    /// The type of the transaction (EIP-2718).
    enum class Type : uint8_t
    {
        /// The legacy transaction without leading "type" byte.
        legacy = 0,

        /// The transaction with the access list (EIP-2930).
        access_list = 1,

        /// The transaction with the priority gas price (EIP-1559).
        eip1559 = 2,

        /// The transaction carrying blob hashes (EIP-4844).
        blob = 3,
    };

    /// Returns the amount of blob gas used by the transaction.
    [[nodiscard]] uint64_t blob_gas_used() const noexcept
    {
        return GAS_PER_BLOB * blob_hashes.size();
    }

    Type type = Type::legacy;
    bytes data;
    int64_t gas_limit = 0;

    /// The fee cap. The gas price of the legacy and access list transactions.
    intx::uint256 max_gas_price;

    /// The priority fee cap. Equal to the gas price for the legacy and access list transactions.
    intx::uint256 max_priority_gas_price;
    intx::uint256 max_blob_gas_price;
    address sender;

    /// The recipient, empty for the contract creation transaction.
    std::optional<address> to;
    intx::uint256 value;
    AccessList access_list;
    std::vector<bytes32> blob_hashes;
    uint64_t chain_id = 0;
    uint64_t nonce = 0;
};

/// The transaction properties computed by the validation and needed for the execution.
struct TransactionProperties
{
    /// The amount of gas provided to the EVM: the gas limit minus the intrinsic cost.
    int64_t execution_gas_limit = 0;
};

struct Log
{
    address addr;
    bytes data;
    std::vector<bytes32> topics;
};
}  // namespace evmcore::state
