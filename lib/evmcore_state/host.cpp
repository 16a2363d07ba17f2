// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "host.hpp"
#include <evmcore/constants.hpp>
#include <array>
#include <bit>
#include <cassert>

namespace evmcore::state
{
namespace
{
/// Checks if an existing account blocks the creation at its address (EIP-7610).
[[nodiscard]] bool is_create_collision(const Account& acc) noexcept
{
    return acc.nonce != 0 || acc.code_hash != Account::EMPTY_CODE_HASH || acc.has_initial_storage;
}

/// The address is the low 20 bytes of the hash.
[[nodiscard]] address address_from_hash(const hash256& h) noexcept
{
    address addr;
    std::copy_n(&h.bytes[sizeof(h) - sizeof(addr)], sizeof(addr), addr.bytes);
    return addr;
}

/// Classifies the storage write by the EIP-2200 transition original -> current -> value.
[[nodiscard]] evmc_storage_status classify_storage_write(
    const bytes32& original, const bytes32& current, const bytes32& value) noexcept
{
    if (current == value)
        return EVMC_STORAGE_ASSIGNED;

    if (original == current)  // clean slot
    {
        if (is_zero(original))
            return EVMC_STORAGE_ADDED;
        return is_zero(value) ? EVMC_STORAGE_DELETED : EVMC_STORAGE_MODIFIED;
    }

    if (original == value)  // dirty slot restored
    {
        if (is_zero(current))
            return EVMC_STORAGE_DELETED_RESTORED;
        return is_zero(original) ? EVMC_STORAGE_ADDED_DELETED : EVMC_STORAGE_MODIFIED_RESTORED;
    }

    if (is_zero(current))
        return EVMC_STORAGE_DELETED_ADDED;  // X -> 0 -> Z
    if (is_zero(value))
        return EVMC_STORAGE_MODIFIED_DELETED;  // X -> Y -> 0
    return EVMC_STORAGE_ASSIGNED;
}
}  // namespace

bool Host::account_exists(const address& addr) const noexcept
{
    const auto* const acc = m_state.find(addr);
    return acc != nullptr && !acc->is_empty();
}

bytes32 Host::get_storage(const address& addr, const bytes32& key) const noexcept
{
    const auto slot = m_state.read_storage(addr, key);
    return slot.has_value() ? slot->current : bytes32{};
}

evmc_storage_status Host::set_storage(
    const address& addr, const bytes32& key, const bytes32& value) noexcept
{
    const auto [current, original] = m_state.get_storage(addr, key);
    const auto status = classify_storage_write(original, current, value);
    m_state.write_storage(addr, key, value);
    return status;
}

uint256be Host::get_balance(const address& addr) const noexcept
{
    if (const auto* const acc = m_state.find(addr); acc != nullptr)
        return intx::be::store<uint256be>(acc->balance);
    return {};
}

size_t Host::get_code_size(const address& addr) const noexcept
{
    return m_state.get_code(addr).size();
}

bytes32 Host::get_code_hash(const address& addr) const noexcept
{
    // EIP-1052: 0 for non-existing and empty accounts.
    const auto* const acc = m_state.find(addr);
    return (acc != nullptr && !acc->is_empty()) ? acc->code_hash : bytes32{};
}

size_t Host::copy_code(const address& addr, size_t code_offset, uint8_t* buffer_data,
    size_t buffer_size) const noexcept
{
    const auto code = m_state.get_code(addr);
    if (code_offset >= code.size())
        return 0;
    const auto n = std::min(buffer_size, code.size() - code_offset);
    std::copy_n(&code[code_offset], n, buffer_data);
    return n;
}

bool Host::selfdestruct(const address& addr, const address& beneficiary) noexcept
{
    m_state.touch(beneficiary);
    m_selfdestructs.push_back(addr);

    const auto balance = m_state.get(addr).balance;
    const auto only_transfer = m_rev >= EVMC_CANCUN && !m_state.get(addr).just_created;

    // The order matters when the beneficiary is the account itself:
    // EIP-6780 keeps the balance there, the full destruction burns it.
    if (only_transfer)
        m_state.set_balance(addr, 0);
    m_state.set_balance(beneficiary, m_state.get(beneficiary).balance + balance);
    if (only_transfer)
        return false;
    m_state.set_balance(addr, 0);
    return m_state.set_destructed(addr);
}

address compute_create_address(const address& sender, uint64_t sender_nonce) noexcept
{
    uint8_t nonce_be[sizeof(sender_nonce)];
    intx::be::unsafe::store(nonce_be, sender_nonce);
    const auto nonce_size =
        sizeof(nonce_be) - static_cast<size_t>(std::countl_zero(sender_nonce)) / 8;

    // rlp([sender, nonce]) where all the items are short.
    std::array<uint8_t, 1 + 1 + sizeof(sender) + 1 + sizeof(nonce_be)> rlp{};
    size_t pos = 1;  // rlp[0] is the list prefix
    rlp[pos++] = 0x80 + sizeof(sender);
    std::copy_n(sender.bytes, sizeof(sender), &rlp[pos]);
    pos += sizeof(sender);
    if (sender_nonce != 0 && sender_nonce < 0x80)
        rlp[pos++] = static_cast<uint8_t>(sender_nonce);
    else
    {
        rlp[pos++] = static_cast<uint8_t>(0x80 + nonce_size);
        std::copy_n(&nonce_be[sizeof(nonce_be) - nonce_size], nonce_size, &rlp[pos]);
        pos += nonce_size;
    }
    rlp[0] = static_cast<uint8_t>(0xc0 + (pos - 1));

    return address_from_hash(keccak256({rlp.data(), pos}));
}

address compute_create2_address(
    const address& sender, const bytes32& salt, bytes_view init_code) noexcept
{
    const auto init_code_hash = keccak256(init_code);

    // 0xff ++ sender ++ salt ++ keccak256(init_code)
    std::array<uint8_t, 1 + sizeof(sender) + sizeof(salt) + sizeof(init_code_hash)> preimage{};
    preimage[0] = 0xff;
    auto out = std::copy_n(sender.bytes, sizeof(sender), &preimage[1]);
    out = std::copy_n(salt.bytes, sizeof(salt), out);
    std::copy_n(init_code_hash.bytes, sizeof(init_code_hash), out);

    return address_from_hash(keccak256({preimage.data(), preimage.size()}));
}

std::optional<evmc_message> Host::prepare_message(evmc_message msg) noexcept
{
    const auto is_create = msg.kind == EVMC_CREATE || msg.kind == EVMC_CREATE2;
    if (msg.depth != 0 && !is_create)
        return msg;

    // The state transition has already bumped the nonce of the transaction sender,
    // so only the nested creations check the EIP-2681 limit here.
    const auto nonce = m_state.get(msg.sender).nonce;
    if (msg.depth != 0)
    {
        if (nonce == Account::NonceMax)
            return std::nullopt;
        m_state.set_nonce(msg.sender, nonce + 1);
    }
    const auto creation_nonce = msg.depth != 0 ? nonce : nonce - 1;

    if (is_create)
    {
        msg.recipient = msg.kind == EVMC_CREATE ?
                            compute_create_address(msg.sender, creation_nonce) :
                            compute_create2_address(
                                msg.sender, msg.create2_salt, {msg.input_data, msg.input_size});

        // EIP-2929: the created address stays warm even if the creation fails.
        m_state.mark_warm(msg.recipient);
    }
    return msg;
}

evmc::Result Host::fail_create(
    const evmc_message& msg, evmc_status_code status, HaltReason reason) noexcept
{
    if (msg.depth == 0)
        m_create_failure = reason;
    return evmc::Result{status};
}

evmc::Result Host::create(const evmc_message& msg) noexcept
{
    assert(msg.kind == EVMC_CREATE || msg.kind == EVMC_CREATE2);

    const auto* const existing = m_state.find(msg.recipient);
    if (existing != nullptr && is_create_collision(*existing))
        return fail_create(msg, EVMC_FAILURE, HaltReason::create_collision);

    // The sender balance is already checked by the caller.
    const auto endowment = intx::be::load<intx::uint256>(msg.value);
    m_state.set_balance(msg.sender, m_state.get(msg.sender).balance - endowment);
    m_state.new_contract(msg.recipient, {}, endowment);

    // The init code is executed as the code with empty input.
    auto init_msg = msg;
    init_msg.input_data = nullptr;
    init_msg.input_size = 0;
    auto result = m_vm.execute(*this, m_rev, init_msg, msg.input_data, msg.input_size);
    if (result.status_code != EVMC_SUCCESS)
    {
        result.create_address = msg.recipient;
        return result;
    }

    const bytes_view runtime_code{result.output_data, result.output_size};
    if (runtime_code.size() > MAX_CODE_SIZE)
        return fail_create(msg, EVMC_FAILURE, HaltReason::create_size_limit);

    const auto deposit_cost = static_cast<int64_t>(runtime_code.size()) * CODE_DEPOSIT_COST;
    if (deposit_cost > result.gas_left)
        return fail_create(msg, EVMC_OUT_OF_GAS, HaltReason::out_of_gas);

    // EIP-3541
    if (!runtime_code.empty() && runtime_code.front() == 0xEF)
        return fail_create(msg, EVMC_CONTRACT_VALIDATION_FAILURE, HaltReason::create_code_rejected);

    if (!runtime_code.empty())
        m_state.set_code(msg.recipient, runtime_code);
    return evmc::Result{
        EVMC_SUCCESS, result.gas_left - deposit_cost, result.gas_refund, msg.recipient};
}

evmc::Result Host::execute_message(const evmc_message& msg) noexcept
{
    if (msg.kind == EVMC_CREATE || msg.kind == EVMC_CREATE2)
        return create(msg);

    // Only CALL transfers value, the other kinds just pass it to the callee.
    if (msg.kind == EVMC_CALL)
    {
        const auto value = intx::be::load<intx::uint256>(msg.value);
        if (value == 0)
            m_state.touch(msg.recipient);
        else
        {
            if (m_state.find(msg.recipient) == nullptr)
                m_state.new_account(msg.recipient, 0);
            m_state.set_balance(msg.sender, m_state.get(msg.sender).balance - value);
            m_state.set_balance(msg.recipient, m_state.get(msg.recipient).balance + value);
        }
    }

    if (m_precompiles.is_precompile(m_rev, msg.code_address))
        return m_precompiles.execute(m_rev, msg);

    const auto code = m_state.get_code(msg.code_address);
    if (code.empty())
        return evmc::Result{EVMC_SUCCESS, msg.gas};

    return m_vm.execute(*this, m_rev, msg, code.data(), code.size());
}

evmc::Result Host::call(const evmc_message& orig_msg) noexcept
{
    const auto msg = prepare_message(orig_msg);
    if (!msg)  // The light failure: the caller keeps the gas.
        return evmc::Result{EVMC_FAILURE, orig_msg.gas};

    const auto num_logs = m_logs.size();
    const auto num_selfdestructs = m_selfdestructs.size();
    const auto checkpoint = m_state.checkpoint();

    auto result = execute_message(*msg);
    if (result.status_code == EVMC_SUCCESS)
        return result;

    m_state.rollback(checkpoint);
    m_logs.resize(num_logs);
    m_selfdestructs.resize(num_selfdestructs);
    return result;
}

evmc_tx_context Host::get_tx_context() const noexcept
{
    // EIP-1559: the base fee plus the tip capped by the fee cap.
    const auto tip = std::min(m_tx.max_priority_gas_price, m_tx.max_gas_price - m_block.base_fee);

    evmc_tx_context ctx{};
    ctx.tx_gas_price = intx::be::store<uint256be>(m_block.base_fee + tip);
    ctx.tx_origin = m_tx.sender;
    ctx.block_coinbase = m_block.coinbase;
    ctx.block_number = m_block.number;
    ctx.block_timestamp = m_block.timestamp;
    ctx.block_gas_limit = m_block.gas_limit;
    ctx.block_prev_randao = m_block.prev_randao;
    ctx.chain_id = intx::be::store<uint256be>(intx::uint256{m_tx.chain_id});
    ctx.block_base_fee = intx::be::store<uint256be>(intx::uint256{m_block.base_fee});
    ctx.blob_base_fee = intx::be::store<uint256be>(get_blob_base_fee(m_block));
    ctx.blob_hashes = m_tx.blob_hashes.data();
    ctx.blob_hashes_count = m_tx.blob_hashes.size();
    return ctx;
}

bytes32 Host::get_block_hash(int64_t block_number) const noexcept
{
    return m_state.get_block_hash(block_number);
}

void Host::emit_log(const address& addr, const uint8_t* data, size_t data_size,
    const bytes32 topics[], size_t topics_count) noexcept
{
    m_logs.push_back({addr, bytes{data, data_size}, {topics, topics + topics_count}});
}

evmc_access_status Host::access_account(const address& addr) noexcept
{
    // Precompiles are always warm (EIP-2929).
    if (m_precompiles.is_precompile(m_rev, addr))
        return EVMC_ACCESS_WARM;
    return m_state.mark_warm(addr) ? EVMC_ACCESS_COLD : EVMC_ACCESS_WARM;
}

evmc_access_status Host::access_storage(const address& addr, const bytes32& key) noexcept
{
    return m_state.mark_warm(addr, key) ? EVMC_ACCESS_COLD : EVMC_ACCESS_WARM;
}

evmc::bytes32 Host::get_transient_storage(const address& addr, const bytes32& key) const noexcept
{
    return m_state.get_transient_storage(addr, key);
}

void Host::set_transient_storage(
    const address& addr, const bytes32& key, const bytes32& value) noexcept
{
    m_state.set_transient_storage(addr, key, value);
}
}  // namespace evmcore::state
