// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "state.hpp"
#include "host.hpp"
#include "precompiles.hpp"
#include <evmcore/constants.hpp>
#include <evmcore/instructions_traits.hpp>
#include <algorithm>
#include <cassert>
#include <utility>

using namespace intx;

namespace evmcore::state
{
namespace
{
/// The gas cost of the transaction, charged before the execution (Yellow Paper: g0).
int64_t intrinsic_gas(evmc_revision rev, const Transaction& tx) noexcept
{
    constexpr int64_t BASE = 21000;
    constexpr int64_t CREATE = 32000;
    constexpr int64_t DATA_ZERO_BYTE = 4;
    constexpr int64_t DATA_NONZERO_BYTE = 16;
    constexpr int64_t INITCODE_WORD = 2;  // EIP-3860
    constexpr int64_t ACCESS_LIST_ADDRESS = 2400;
    constexpr int64_t ACCESS_LIST_STORAGE_KEY = 1900;

    auto gas = BASE;
    for (const auto byte : tx.data)
        gas += byte == 0 ? DATA_ZERO_BYTE : DATA_NONZERO_BYTE;

    for (const auto& entry : tx.access_list)
    {
        gas += ACCESS_LIST_ADDRESS;
        gas += ACCESS_LIST_STORAGE_KEY * static_cast<int64_t>(entry.second.size());
    }

    if (!tx.to.has_value())
    {
        gas += CREATE;
        if (rev >= EVMC_SHANGHAI)
            gas += INITCODE_WORD * static_cast<int64_t>((tx.data.size() + 31) / 32);
    }
    return gas;
}

/// The message of the top-level frame. For creation the recipient is set by the Host.
evmc_message make_tx_message(const Transaction& tx, int64_t gas) noexcept
{
    evmc_message msg{};
    msg.kind = tx.to.has_value() ? EVMC_CALL : EVMC_CREATE;
    msg.gas = gas;
    msg.sender = tx.sender;
    if (tx.to.has_value())
    {
        msg.recipient = *tx.to;
        msg.code_address = *tx.to;
    }
    msg.input_data = tx.data.data();
    msg.input_size = tx.data.size();
    msg.value = intx::be::store<evmc::uint256be>(tx.value);
    return msg;
}

/// Builds the tagged result of the top-level frame.
Result build_result(const Transaction& tx, State& state, Host& host, const evmc::Result& result,
    int64_t gas_used, int64_t gas_refunded)
{
    switch (result.status_code)
    {
    case EVMC_SUCCESS:
    {
        Success success{.gas_used = gas_used, .gas_refunded = gas_refunded};
        if (tx.to.has_value())
            success.output.assign(result.output_data, result.output_size);
        else
            success.output = state.get_code(result.create_address);

        if (tx.to.has_value() && host.has_selfdestructed(*tx.to))
            success.reason = SuccessReason::self_destruct;
        else if (!success.output.empty())
            success.reason = SuccessReason::return_;
        success.logs = host.take_logs();
        return success;
    }
    case EVMC_REVERT:
        return Revert{{result.output_data, result.output_size}, gas_used};
    default:
        return Halt{host.create_failure().value_or(to_halt_reason(result.status_code)), gas_used};
    }
}
}  // namespace

HaltReason to_halt_reason(evmc_status_code status) noexcept
{
    switch (status)
    {
    case EVMC_OUT_OF_GAS:
        return HaltReason::out_of_gas;
    case EVMC_BAD_JUMP_DESTINATION:
        return HaltReason::invalid_jump;
    case EVMC_INVALID_INSTRUCTION:
    case EVMC_UNDEFINED_INSTRUCTION:
        return HaltReason::invalid_opcode;
    case EVMC_STACK_UNDERFLOW:
        return HaltReason::stack_underflow;
    case EVMC_STACK_OVERFLOW:
        return HaltReason::stack_overflow;
    case EVMC_STATIC_MODE_VIOLATION:
        return HaltReason::static_state_change;
    case EVMC_CONTRACT_VALIDATION_FAILURE:
        return HaltReason::create_code_rejected;
    case EVMC_CALL_DEPTH_EXCEEDED:
        return HaltReason::recursive_create;
    case EVMC_PRECOMPILE_FAILURE:
        return HaltReason::precompile_failure;
    case EVMC_INVALID_MEMORY_ACCESS:
        return HaltReason::invalid_memory_access;
    default:
        return HaltReason::internal_error;
    }
}

std::string_view to_string(HaltReason reason) noexcept
{
    switch (reason)
    {
    case HaltReason::out_of_gas:
        return "out of gas";
    case HaltReason::invalid_jump:
        return "invalid jump";
    case HaltReason::invalid_opcode:
        return "invalid opcode";
    case HaltReason::stack_underflow:
        return "stack underflow";
    case HaltReason::stack_overflow:
        return "stack overflow";
    case HaltReason::static_state_change:
        return "state change in static context";
    case HaltReason::create_collision:
        return "create collision";
    case HaltReason::nonce_overflow:
        return "nonce overflow";
    case HaltReason::create_size_limit:
        return "create size limit";
    case HaltReason::create_code_rejected:
        return "create code rejected";
    case HaltReason::recursive_create:
        return "out of gas (recursive create)";
    case HaltReason::precompile_failure:
        return "precompile failure";
    case HaltReason::invalid_memory_access:
        return "invalid memory access";
    case HaltReason::internal_error:
        break;
    }
    return "internal error";
}

StateDiff State::build_diff(evmc_revision rev) const
{
    StateDiff diff;
    for (const auto& [addr, m] : m_modified)
    {
        // From Cancun only the accounts created in the transaction can be destructed (EIP-6780).
        if (m.destructed && (rev < EVMC_CANCUN || m.just_created))
        {
            diff.deleted_accounts.emplace_back(addr);
            continue;
        }
        if (m.erase_if_empty && m.is_empty())
        {
            if (!m.just_created)  // Just created accounts have not existed before.
                diff.deleted_accounts.emplace_back(addr);
            continue;
        }

        // NOLINTNEXTLINE(modernize-use-emplace)
        auto& a = diff.modified_accounts.emplace_back(StateDiff::Entry{addr, m.nonce, m.balance});

        if (m.code_changed)
            a.code = m.code;

        for (const auto& [k, v] : m.storage)
        {
            if (v.current != v.original)
                a.modified_storage.emplace_back(k, v.current);
        }
    }
    return diff;
}

Account& State::insert(const address& addr, Account account)
{
    const auto [it, inserted] = m_modified.emplace(addr, std::move(account));
    assert(inserted);
    (void)inserted;
    return it->second;
}

Account* State::find(const address& addr) noexcept
{
    if (auto it = m_modified.find(addr); it != m_modified.end())
        return &it->second;

    const auto initial = m_initial.get_account(addr);
    if (!initial.has_value())
        return nullptr;

    Account acc;
    acc.nonce = initial->nonce;
    acc.balance = initial->balance;
    acc.code_hash = initial->code_hash;
    acc.has_initial_storage = initial->has_storage;
    return &insert(addr, std::move(acc));
}

Account& State::get(const address& addr) noexcept
{
    auto* const acc = find(addr);
    assert(acc != nullptr);
    return *acc;
}

Account& State::get_or_insert(const address& addr, Account account)
{
    auto* const acc = find(addr);
    return acc != nullptr ? *acc : insert(addr, std::move(account));
}

bytes_view State::get_code(const address& addr)
{
    auto* const acc = find(addr);
    if (acc == nullptr || acc->code_hash == Account::EMPTY_CODE_HASH)
        return {};

    // The code of the initial accounts is loaded lazily.
    if (acc->code.empty())
        acc->code = m_initial.get_account_code(addr);
    return acc->code;
}

StorageValue& State::get_storage(const address& addr, const bytes32& key)
{
    auto& storage = get(addr).storage;
    if (const auto it = storage.find(key); it != storage.end())
        return it->second;

    const auto value = m_initial.get_storage(addr, key);
    return storage.emplace(key, StorageValue{value, value}).first->second;
}

std::optional<StorageValue> State::read_storage(const address& addr, const bytes32& key)
{
    if (find(addr) == nullptr)
        return std::nullopt;
    return get_storage(addr, key);
}

/// Reverts a single journal entry.
struct State::Undo
{
    State& state;

    void operator()(const JournalBalanceChange& e) const
    {
        state.get(e.addr).balance = e.prev_balance;
    }

    void operator()(const JournalNonceChange& e) const { state.get(e.addr).nonce = e.prev_nonce; }

    void operator()(const JournalTouched& e) const { state.get(e.addr).erase_if_empty = false; }

    void operator()(const JournalStorageChange& e) const
    {
        state.get(e.addr).storage.at(e.key).current = e.prev_value;
    }

    void operator()(const JournalTransientStorageChange& e) const
    {
        state.m_transient_storage[e.addr][e.key] = e.prev_value;
    }

    void operator()(const JournalCreate& e) const
    {
        if (!e.existed)
        {
            state.m_modified.erase(e.addr);
            return;
        }

        // The account had only a balance before the creation.
        auto& acc = state.get(e.addr);
        acc.nonce = 0;
        acc.code_hash = Account::EMPTY_CODE_HASH;
        acc.code.clear();
        acc.code_changed = false;
        acc.just_created = false;
    }

    void operator()(const JournalDestruct& e) const { state.get(e.addr).destructed = false; }
};

void State::rollback(size_t checkpoint)
{
    for (; m_journal.size() > checkpoint; m_journal.pop_back())
        std::visit(Undo{*this}, m_journal.back());
}

bool State::mark_warm(const address& addr)
{
    return m_warm_accounts.insert(addr).second;
}

bool State::mark_warm(const address& addr, const bytes32& key)
{
    return m_warm_storage[addr].insert(key).second;
}

bool State::is_warm(const address& addr) const noexcept
{
    return m_warm_accounts.contains(addr);
}

bool State::is_warm(const address& addr, const bytes32& key) const noexcept
{
    const auto it = m_warm_storage.find(addr);
    return it != m_warm_storage.end() && it->second.contains(key);
}

bytes32 State::get_transient_storage(const address& addr, const bytes32& key) const noexcept
{
    const auto storage = m_transient_storage.find(addr);
    if (storage == m_transient_storage.end())
        return {};
    const auto slot = storage->second.find(key);
    return slot != storage->second.end() ? slot->second : bytes32{};
}

void State::set_balance(const address& addr, const uint256& balance)
{
    auto& acc = get(addr);
    m_journal.emplace_back(JournalBalanceChange{{addr}, std::exchange(acc.balance, balance)});
}

void State::set_nonce(const address& addr, uint64_t nonce)
{
    auto& acc = get(addr);
    m_journal.emplace_back(JournalNonceChange{{addr}, std::exchange(acc.nonce, nonce)});
}

Account& State::new_account(const address& addr, const uint256& balance)
{
    m_journal.emplace_back(JournalCreate{{addr}, false});
    Account acc;
    acc.erase_if_empty = true;
    auto& inserted = insert(addr, std::move(acc));
    if (balance != 0)
        set_balance(addr, balance);
    return inserted;
}

Account& State::new_contract(const address& addr, bytes_view code, const uint256& endowment)
{
    auto* acc = find(addr);
    m_journal.emplace_back(JournalCreate{{addr}, acc != nullptr});
    if (acc == nullptr)
        acc = &insert(addr);

    // The nonce is restored by undoing the creation.
    assert(acc->nonce == 0);
    acc->nonce = 1;
    acc->just_created = true;

    if (endowment != 0)
        set_balance(addr, acc->balance + endowment);
    if (!code.empty())
        set_code(addr, code);
    return *acc;
}

void State::set_code(const address& addr, bytes_view code)
{
    auto& acc = get(addr);
    assert(acc.just_created);
    acc.code = code;
    acc.code_hash = keccak256(acc.code);
    acc.code_changed = true;
}

Account& State::touch(const address& addr)
{
    auto* const acc = find(addr);
    if (acc == nullptr)
        return new_account(addr, 0);

    if (acc->is_empty() && !acc->erase_if_empty)
    {
        m_journal.emplace_back(JournalTouched{addr});
        acc->erase_if_empty = true;
    }
    return *acc;
}

bool State::set_destructed(const address& addr)
{
    auto& acc = get(addr);
    if (acc.destructed)
        return false;
    m_journal.emplace_back(JournalDestruct{addr});
    acc.destructed = true;
    return true;
}

void State::write_storage(const address& addr, const bytes32& key, const bytes32& value)
{
    auto& slot = get_storage(addr, key);
    m_journal.emplace_back(JournalStorageChange{{addr}, key, std::exchange(slot.current, value)});
}

void State::set_transient_storage(const address& addr, const bytes32& key, const bytes32& value)
{
    auto& slot = m_transient_storage[addr][key];
    m_journal.emplace_back(JournalTransientStorageChange{{addr}, key, std::exchange(slot, value)});
}

namespace
{
/// EIP-4844 rules of the blob transaction.
std::error_code check_blob_tx(
    const BlockInfo& block, const Transaction& tx, evmc_revision rev) noexcept
{
    if (rev < EVMC_CANCUN)
        return make_error_code(TX_TYPE_NOT_SUPPORTED);
    if (!tx.to.has_value())
        return make_error_code(CREATE_BLOB_TX);
    if (tx.blob_hashes.empty())
        return make_error_code(EMPTY_BLOB_HASHES_LIST);
    if (tx.blob_hashes.size() > MAX_BLOB_COUNT)
        return make_error_code(BLOB_GAS_LIMIT_EXCEEDED);
    if (tx.max_blob_gas_price < get_blob_base_fee(block))
        return make_error_code(BLOB_FEE_CAP_LESS_THAN_BLOCKS);
    for (const auto& hash : tx.blob_hashes)
    {
        if (hash.bytes[0] != VERSIONED_HASH_VERSION_KZG)
            return make_error_code(INVALID_BLOB_HASH_VERSION);
    }
    return {};
}

/// The upper bound of what the transaction may cost the sender, computed in 512 bits.
intx::uint512 max_tx_cost(const Transaction& tx) noexcept
{
    intx::uint512 cost = umul(uint256{static_cast<uint64_t>(tx.gas_limit)}, tx.max_gas_price);
    cost += tx.value;
    if (tx.type == Transaction::Type::blob)
        cost += umul(uint256{tx.blob_gas_used()}, tx.max_blob_gas_price);
    return cost;
}

/// Warms up the accounts and slots accessed before the execution (EIP-2929, EIP-3651).
void prewarm(State& state, const BlockInfo& block, const Transaction& tx, evmc_revision rev,
    const PrecompileRegistry& precompiles)
{
    state.mark_warm(tx.sender);
    if (tx.to.has_value())
        state.mark_warm(*tx.to);

    for (size_t id = 1; id < NumPrecompiles; ++id)
    {
        if (const evmc::address addr{id}; precompiles.is_precompile(rev, addr))
            state.mark_warm(addr);
    }

    for (const auto& [addr, keys] : tx.access_list)
    {
        state.mark_warm(addr);
        for (const auto& key : keys)
            state.mark_warm(addr, key);
    }

    if (rev >= EVMC_SHANGHAI)
        state.mark_warm(block.coinbase);
}
}  // namespace

std::variant<TransactionProperties, std::error_code> validate_transaction(
    const StateView& state_view, const BlockInfo& block, const Transaction& tx,
    evmc_revision rev) noexcept
{
    if (!instr::is_supported(rev))
        return make_error_code(REVISION_NOT_SUPPORTED);

    if (tx.type == Transaction::Type::blob)
    {
        if (const auto ec = check_blob_tx(block, tx, rev))
            return ec;
    }

    const auto has_fee_market =
        tx.type == Transaction::Type::eip1559 || tx.type == Transaction::Type::blob;
    if (has_fee_market && tx.max_priority_gas_price > tx.max_gas_price)
        return make_error_code(TIP_GT_FEE_CAP);

    if (tx.gas_limit > block.gas_limit)
        return make_error_code(GAS_LIMIT_REACHED);

    if (tx.max_gas_price < block.base_fee)
        return make_error_code(FEE_CAP_LESS_THAN_BLOCKS);

    // A missing sender is validated as an empty account.
    StateView::Account sender{.code_hash = Account::EMPTY_CODE_HASH};
    if (auto acc = state_view.get_account(tx.sender); acc.has_value())
        sender = *acc;

    if (sender.code_hash != Account::EMPTY_CODE_HASH)  // EIP-3607
        return make_error_code(SENDER_NOT_EOA);

    if (sender.nonce == Account::NonceMax)  // EIP-2681
        return make_error_code(NONCE_HAS_MAX_VALUE);
    if (tx.nonce > sender.nonce)
        return make_error_code(NONCE_TOO_HIGH);
    if (tx.nonce < sender.nonce)
        return make_error_code(NONCE_TOO_LOW);

    if (!tx.to.has_value() && rev >= EVMC_SHANGHAI && tx.data.size() > MAX_INITCODE_SIZE)
        return make_error_code(INIT_CODE_SIZE_LIMIT_EXCEEDED);

    if (sender.balance < max_tx_cost(tx))
        return make_error_code(INSUFFICIENT_FUNDS);

    const auto intrinsic_cost = intrinsic_gas(rev, tx);
    if (tx.gas_limit < intrinsic_cost)
        return make_error_code(INTRINSIC_GAS_TOO_LOW);

    return TransactionProperties{tx.gas_limit - intrinsic_cost};
}

ExecutionOutcome transition(const StateView& state_view, const BlockInfo& block,
    const BlockHashes& block_hashes, const Transaction& tx, evmc_revision rev, evmc::VM& vm,
    const PrecompileRegistry& precompiles, const TransactionProperties& tx_props)
{
    State state{state_view, block_hashes};

    const auto tip = std::min(tx.max_priority_gas_price, tx.max_gas_price - block.base_fee);
    const auto gas_price = block.base_fee + tip;

    // The sender pays for the whole gas limit upfront, the unused gas is refunded at the end.
    // These changes are outside of the journal, they are never reverted.
    auto& sender = state.get_or_insert(tx.sender);
    ++sender.nonce;
    sender.balance -= tx.gas_limit * gas_price;
    if (tx.type == Transaction::Type::blob)
        sender.balance -= tx.blob_gas_used() * get_blob_base_fee(block);

    prewarm(state, block, tx, rev, precompiles);

    Host host{rev, vm, state, block, tx, precompiles};
    const auto result = host.call(make_tx_message(tx, tx_props.execution_gas_limit));

    const auto gas_consumed = tx.gas_limit - result.gas_left;
    const auto refund = std::min(result.gas_refund, gas_consumed / REFUND_QUOTIENT);
    const auto gas_used = gas_consumed - refund;

    state.get(tx.sender).balance += (tx.gas_limit - gas_used) * gas_price;
    state.touch(block.coinbase).balance += gas_used * tip;
    state.clear_transient_storage();

    ExecutionOutcome outcome;
    outcome.result = build_result(tx, state, host, result, gas_used, refund);
    outcome.gas_used = gas_used;
    outcome.status = result.status_code;
    if (!tx.to.has_value() && result.status_code == EVMC_SUCCESS)
        outcome.create_address = result.create_address;
    outcome.diff = state.build_diff(rev);
    return outcome;
}

std::variant<ExecutionOutcome, std::error_code> execute(const StateView& state_view,
    const BlockInfo& block, const BlockHashes& block_hashes, const Transaction& tx,
    evmc_revision rev, evmc::VM& vm, const PrecompileRegistry& precompiles)
{
    auto validation = validate_transaction(state_view, block, tx, rev);
    if (const auto* const ec = std::get_if<std::error_code>(&validation))
        return *ec;

    return transition(state_view, block, block_hashes, tx, rev, vm, precompiles,
        std::get<TransactionProperties>(validation));
}
}  // namespace evmcore::state
