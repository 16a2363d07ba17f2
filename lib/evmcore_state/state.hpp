// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "account.hpp"
#include "block.hpp"
#include "errors.hpp"
#include "hash_utils.hpp"
#include "result.hpp"
#include "state_diff.hpp"
#include "state_view.hpp"
#include "transaction.hpp"
#include <unordered_set>
#include <variant>

namespace evmcore::state
{
class PrecompileRegistry;

/// The state of accounts during a transaction: the accounts loaded from the initial state view
/// and modified by the execution, with the journal of changes allowing to revert them.
///
/// The warm sets of EIP-2929 and the transient storage of EIP-1153 are kept here as well.
/// The transient storage is journaled, the warm sets are not: once an account or a storage slot
/// is warm it stays warm for the rest of the transaction, even if the frame warming it reverts.
class State
{
    struct JournalBase
    {
        address addr;
    };

    struct JournalBalanceChange : JournalBase
    {
        uint256 prev_balance;
    };

    struct JournalNonceChange : JournalBase
    {
        uint64_t prev_nonce;
    };

    struct JournalTouched : JournalBase
    {};

    struct JournalStorageChange : JournalBase
    {
        bytes32 key;
        bytes32 prev_value;
    };

    struct JournalTransientStorageChange : JournalBase
    {
        bytes32 key;
        bytes32 prev_value;
    };

    struct JournalCreate : JournalBase
    {
        bool existed;
    };

    struct JournalDestruct : JournalBase
    {};

    using JournalEntry = std::variant<JournalBalanceChange, JournalNonceChange, JournalTouched,
        JournalStorageChange, JournalTransientStorageChange, JournalCreate, JournalDestruct>;

    struct Undo;

    /// The read-only view of the initial state.
    const StateView& m_initial;

    const BlockHashes& m_block_hashes;

    /// The accounts loaded from the initial state and potentially modified.
    std::unordered_map<address, Account> m_modified;

    /// The journal of changes, with information how to revert them.
    std::vector<JournalEntry> m_journal;

    std::unordered_set<address> m_warm_accounts;
    std::unordered_map<address, std::unordered_set<bytes32>> m_warm_storage;

    std::unordered_map<address, std::unordered_map<bytes32, bytes32>> m_transient_storage;

public:
    State(const StateView& state_view, const BlockHashes& block_hashes) noexcept
      : m_initial{state_view}, m_block_hashes{block_hashes}
    {}
    State(const State&) = delete;
    State(State&&) = delete;
    State& operator=(State&&) = delete;

    /// Inserts the new account at the address. No account may exist at this address.
    Account& insert(const address& addr, Account account = {});

    /// Returns the pointer to the account at the address, loading it from the initial state.
    /// Null if the account does not exist.
    Account* find(const address& addr) noexcept;

    /// Gets the account at the address. The account must exist.
    Account& get(const address& addr) noexcept;

    /// Gets the existing account or inserts the new one.
    Account& get_or_insert(const address& addr, Account account = {});

    /// Returns the code of the account, empty for non-existing accounts.
    bytes_view get_code(const address& addr);

    /// Returns the storage slot of the existing account, loading it from the initial state.
    StorageValue& get_storage(const address& addr, const bytes32& key);

    /// Returns the storage slot, or nothing if the account does not exist.
    std::optional<StorageValue> read_storage(const address& addr, const bytes32& key);

    bytes32 get_block_hash(int64_t block_number) const noexcept
    {
        return m_block_hashes.get_block_hash(block_number);
    }

    /// Builds the changes to the initial state, applying account deletion rules of the revision.
    StateDiff build_diff(evmc_revision rev) const;

    /// Returns the journal checkpoint to be later passed to rollback().
    ///
    /// There is no commit: a successful frame leaves its journal entries in place, so they
    /// become the changes of the enclosing frame and are reverted with it.
    [[nodiscard]] size_t checkpoint() const noexcept { return m_journal.size(); }

    /// Reverts the changes made after the checkpoint.
    void rollback(size_t checkpoint);

    /// Marks the account warm. Returns true if the account was cold.
    bool mark_warm(const address& addr);

    /// Marks the storage slot warm. Returns true if the slot was cold.
    bool mark_warm(const address& addr, const bytes32& key);

    [[nodiscard]] bool is_warm(const address& addr) const noexcept;

    [[nodiscard]] bool is_warm(const address& addr, const bytes32& key) const noexcept;

    [[nodiscard]] bytes32 get_transient_storage(
        const address& addr, const bytes32& key) const noexcept;

    /// Clears the transient storage at the transaction end.
    void clear_transient_storage() noexcept { m_transient_storage.clear(); }

    /// Changes to the state which can be reverted by rollback().
    /// @{

    void set_balance(const address& addr, const uint256& balance);

    void set_nonce(const address& addr, uint64_t nonce);

    /// Creates the account with the balance, to be erased at the end if it stays empty.
    Account& new_account(const address& addr, const uint256& balance);

    /// Creates the contract account at the address: nonce 1, the code and the balance
    /// increased by @p endowment (the address may hold a balance already).
    /// An existing account at the address must not be a create collision.
    Account& new_contract(const address& addr, bytes_view code, const uint256& endowment);

    /// Deploys the code of the contract created in the current frame.
    void set_code(const address& addr, bytes_view code);

    /// Touches (as in EIP-161) an existing account or inserts the new erasable account.
    Account& touch(const address& addr);

    /// Marks the account to be deleted at the end. Returns false if it was marked already.
    bool set_destructed(const address& addr);

    void write_storage(const address& addr, const bytes32& key, const bytes32& value);

    void set_transient_storage(const address& addr, const bytes32& key, const bytes32& value);

    /// @}
};

/// Validates the transaction against the initial state and the block.
///
/// @return  The execution properties or the transaction validation error.
[[nodiscard]] std::variant<TransactionProperties, std::error_code> validate_transaction(
    const StateView& state_view, const BlockInfo& block, const Transaction& tx,
    evmc_revision rev) noexcept;

/// Executes the valid transaction.
ExecutionOutcome transition(const StateView& state_view, const BlockInfo& block,
    const BlockHashes& block_hashes, const Transaction& tx, evmc_revision rev, evmc::VM& vm,
    const PrecompileRegistry& precompiles, const TransactionProperties& tx_props);

/// Validates and executes the transaction.
///
/// @return  The execution outcome with the state diff or the transaction validation error.
[[nodiscard]] std::variant<ExecutionOutcome, std::error_code> execute(const StateView& state_view,
    const BlockInfo& block, const BlockHashes& block_hashes, const Transaction& tx,
    evmc_revision rev, evmc::VM& vm, const PrecompileRegistry& precompiles);
}  // namespace evmcore::state
