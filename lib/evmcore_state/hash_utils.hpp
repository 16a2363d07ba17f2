// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <ethash/keccak.hpp>
#include <bit>
#include <ostream>

namespace evmcore
{
using evmc::address;
using evmc::bytes;
using evmc::bytes32;
using evmc::bytes_view;
using namespace evmc::literals;

/// Default type for 256-bit hash.
using hash256 = bytes32;

/// Computes Keccak-256 hash of the input bytes.
inline hash256 keccak256(bytes_view data) noexcept
{
    return std::bit_cast<hash256>(ethash::keccak256(data.data(), data.size()));
}
}  // namespace evmcore

std::ostream& operator<<(std::ostream& out, const evmcore::address& a);
std::ostream& operator<<(std::ostream& out, const evmcore::bytes32& b);
