// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include <intx/intx.hpp>
#include <optional>

namespace evmcore::state
{
/// The cost of a single blob in gas units (EIP-4844).
constexpr auto GAS_PER_BLOB = 0x20000;

/// The maximum number of blobs in a block, therefore in a transaction (EIP-4844).
constexpr size_t MAX_BLOB_COUNT = 6;

/// The version byte of the KZG commitment hash (EIP-4844).
constexpr uint8_t VERSIONED_HASH_VERSION_KZG = 0x01;

/// The block environment of the transaction.
struct BlockInfo
{
    int64_t number = 0;
    int64_t timestamp = 0;
    int64_t parent_timestamp = 0;
    int64_t gas_limit = 0;
    address coinbase;
    bytes32 prev_randao;

    /// The EIP-1559 base fee.
    uint64_t base_fee = 0;

    /// The blob gas price. When absent it is computed from excess_blob_gas.
    std::optional<intx::uint256> blob_base_fee;

    /// The "excess blob gas" parameter from EIP-4844.
    std::optional<uint64_t> excess_blob_gas;
};

/// Computes the blob gas price based on the excess blob gas (EIP-4844).
intx::uint256 compute_blob_gas_price(uint64_t excess_blob_gas) noexcept;

/// Returns the blob gas price of the block: the given one or the one computed from
/// the excess blob gas.
intx::uint256 get_blob_base_fee(const BlockInfo& block) noexcept;
}  // namespace evmcore::state
