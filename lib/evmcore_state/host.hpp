// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "precompiles.hpp"
#include "state.hpp"
#include <algorithm>
#include <optional>

namespace evmcore::state
{
using evmc::uint256be;

/// Computes the address of the contract created with the CREATE scheme:
/// the last 20 bytes of keccak256(rlp([sender, sender_nonce])).
///
/// @param sender        The address of the message sender.
/// @param sender_nonce  The sender's nonce before the increase.
/// @return              The address computed with the CREATE scheme.
[[nodiscard]] address compute_create_address(const address& sender, uint64_t sender_nonce) noexcept;

/// Computes the address of the contract created with the CREATE2 scheme:
/// the last 20 bytes of keccak256(0xff ++ sender ++ salt ++ keccak256(init_code)).
[[nodiscard]] address compute_create2_address(
    const address& sender, const bytes32& salt, bytes_view init_code) noexcept;

/// The EVMC Host of the transaction: the bridge between the interpreter and the State.
/// It runs the message call protocol: value transfers, contract creation, precompiles
/// and reverting the state of failed frames.
class Host : public evmc::Host
{
    evmc_revision m_rev;
    evmc::VM& m_vm;
    State& m_state;
    const BlockInfo& m_block;
    const Transaction& m_tx;
    const PrecompileRegistry& m_precompiles;
    std::vector<Log> m_logs;

    /// The accounts which executed SELFDESTRUCT in frames not reverted.
    std::vector<address> m_selfdestructs;

    /// The reason the top-level creation failed after the init code execution.
    std::optional<HaltReason> m_create_failure;

public:
    Host(evmc_revision rev, evmc::VM& vm, State& state, const BlockInfo& block,
        const Transaction& tx, const PrecompileRegistry& precompiles) noexcept
      : m_rev{rev}, m_vm{vm}, m_state{state}, m_block{block}, m_tx{tx}, m_precompiles{precompiles}
    {}

    [[nodiscard]] std::vector<Log>&& take_logs() noexcept { return std::move(m_logs); }

    [[nodiscard]] bool has_selfdestructed(const address& addr) const noexcept
    {
        return std::ranges::find(m_selfdestructs, addr) != m_selfdestructs.end();
    }

    [[nodiscard]] std::optional<HaltReason> create_failure() const noexcept
    {
        return m_create_failure;
    }

    evmc::Result call(const evmc_message& msg) noexcept override;

    evmc_access_status access_account(const address& addr) noexcept override;

private:
    [[nodiscard]] bool account_exists(const address& addr) const noexcept override;

    [[nodiscard]] bytes32 get_storage(
        const address& addr, const bytes32& key) const noexcept override;

    evmc_storage_status set_storage(
        const address& addr, const bytes32& key, const bytes32& value) noexcept override;

    [[nodiscard]] evmc::bytes32 get_transient_storage(
        const address& addr, const bytes32& key) const noexcept override;

    void set_transient_storage(
        const address& addr, const bytes32& key, const bytes32& value) noexcept override;

    [[nodiscard]] uint256be get_balance(const address& addr) const noexcept override;

    [[nodiscard]] size_t get_code_size(const address& addr) const noexcept override;

    [[nodiscard]] bytes32 get_code_hash(const address& addr) const noexcept override;

    size_t copy_code(const address& addr, size_t code_offset, uint8_t* buffer_data,
        size_t buffer_size) const noexcept override;

    bool selfdestruct(const address& addr, const address& beneficiary) noexcept override;

    [[nodiscard]] evmc_tx_context get_tx_context() const noexcept override;

    [[nodiscard]] bytes32 get_block_hash(int64_t block_number) const noexcept override;

    void emit_log(const address& addr, const uint8_t* data, size_t data_size,
        const bytes32 topics[], size_t topics_count) noexcept override;

    evmc_access_status access_storage(const address& addr, const bytes32& key) noexcept override;

    /// Prepares the message for execution: bumps the creator nonce and computes
    /// the address of the created account. These changes are not reverted.
    /// @return The modified message or std::nullopt in case of the light failure.
    std::optional<evmc_message> prepare_message(evmc_message msg) noexcept;

    evmc::Result create(const evmc_message& msg) noexcept;

    /// Fails the creation with the reason reported for the top-level frame.
    evmc::Result fail_create(
        const evmc_message& msg, evmc_status_code status, HaltReason reason) noexcept;

    evmc::Result execute_message(const evmc_message& msg) noexcept;
};
}  // namespace evmcore::state
