// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <cstdint>

namespace evmcore::state
{
/// The precompile identifiers and their corresponding addresses.
enum class PrecompileId : uint8_t
{
    ecrecover = 0x01,
    sha256 = 0x02,
    ripemd160 = 0x03,
    identity = 0x04,
    expmod = 0x05,
    ecadd = 0x06,
    ecmul = 0x07,
    ecpairing = 0x08,
    blake2bf = 0x09,
    point_evaluation = 0x0a,

    since_cancun = point_evaluation,  ///< The first precompile introduced in Cancun.
    latest = point_evaluation         ///< The latest introduced precompile (highest address).
};

/// The total number of known precompile ids, including 0.
inline constexpr std::size_t NumPrecompiles = static_cast<std::size_t>(PrecompileId::latest) + 1;

/// The precompiled contracts available to the transaction.
///
/// The default implementation treats all the addresses of the revision as precompiles
/// and implements only the identity one. The others fail with EVMC_PRECOMPILE_FAILURE.
/// Embedders override it to plug in the cryptographic precompiles.
class PrecompileRegistry
{
public:
    virtual ~PrecompileRegistry() = default;

    /// Checks if the address @p addr is a precompiled contract in the revision @p rev.
    [[nodiscard]] virtual bool is_precompile(
        evmc_revision rev, const evmc::address& addr) const noexcept;

    /// Executes the message to a precompiled contract (msg.code_address must be a precompile).
    [[nodiscard]] virtual evmc::Result execute(
        evmc_revision rev, const evmc_message& msg) const noexcept;
};
}  // namespace evmcore::state
