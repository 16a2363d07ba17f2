// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "instructions.hpp"
#include <algorithm>

namespace evmcore::instr::core
{
namespace
{
template <Opcode Op>
constexpr bool transfers_value = Op == OP_CALL || Op == OP_CALLCODE;

template <Opcode Op>
constexpr evmc_call_kind call_kind_of = Op == OP_CALLCODE     ? EVMC_CALLCODE :
                                        Op == OP_DELEGATECALL ? EVMC_DELEGATECALL :
                                        Op == OP_CREATE       ? EVMC_CREATE :
                                        Op == OP_CREATE2      ? EVMC_CREATE2 :
                                                                EVMC_CALL;

/// A memory region given by the stack operands, validated by check_memory().
struct Region
{
    uint256 offset;
    uint256 size;

    [[nodiscard]] bool empty() const noexcept { return size == 0; }

    [[nodiscard]] bytes_view view(const Memory& memory) const noexcept
    {
        if (empty())
            return {};
        return {memory.data() + static_cast<size_t>(offset), static_cast<size_t>(size)};
    }
};

bool has_balance(ExecutionState& state, const uint256& amount) noexcept
{
    if (amount == 0)
        return true;
    return to_word(state.host.get_balance(state.msg->recipient)) >= amount;
}

/// The gas passed to a child frame: the requested amount capped at all but one 64th.
int64_t forwarded_gas(const uint256& requested, int64_t gas_avail) noexcept
{
    const auto cap = gas_avail - gas_avail / CALL_GAS_RETAINED_DIVISOR;
    if (requested >= uint256{static_cast<uint64_t>(cap)})
        return cap;
    return static_cast<int64_t>(requested);
}

/// Accounts the child frame result in the parent frame.
int64_t settle(ExecutionState& state, int64_t gas_avail, int64_t gas_sent,
    const evmc::Result& result) noexcept
{
    state.return_data.assign(result.output_data, result.output_size);
    state.gas_refund += result.gas_refund;
    return gas_avail - (gas_sent - result.gas_left);
}
}  // namespace

template <Opcode Op>
Result call_impl(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    static_assert(transfers_value<Op> || Op == OP_DELEGATECALL || Op == OP_STATICCALL);

    const auto requested_gas = stack.pop();
    const auto target = to_address(stack.pop());
    uint256 value;
    if constexpr (transfers_value<Op>)
        value = stack.pop();
    const Region input{stack.pop(), stack.pop()};
    const Region output{stack.pop(), stack.pop()};

    // The result word is 0 until the child frame succeeds.
    stack.push(0);
    state.return_data.clear();

    if (!charge_account_access(gas_avail, state, target))
        return {EVMC_OUT_OF_GAS, gas_avail};
    if (!check_memory(gas_avail, state.memory, input.offset, input.size) ||
        !check_memory(gas_avail, state.memory, output.offset, output.size))
        return {EVMC_OUT_OF_GAS, gas_avail};

    const bool with_value = value != 0;
    int64_t extra_cost = 0;
    if (with_value)
    {
        if constexpr (Op == OP_CALL)
        {
            if (state.in_static_mode())
                return {EVMC_STATIC_MODE_VIOLATION, gas_avail};
            if (!state.host.account_exists(target))
                extra_cost += instr::account_creation_cost;
        }
        extra_cost += instr::call_value_cost;
    }
    if (!charge(gas_avail, extra_cost))
        return {EVMC_OUT_OF_GAS, gas_avail};

    evmc_message msg{};
    msg.kind = call_kind_of<Op>;
    msg.depth = state.msg->depth + 1;
    msg.flags = Op == OP_STATICCALL ? uint32_t{EVMC_STATIC} : state.msg->flags;
    msg.code_address = target;
    msg.gas = forwarded_gas(requested_gas, gas_avail);

    switch (Op)
    {
    case OP_DELEGATECALL:
        msg.recipient = state.msg->recipient;
        msg.sender = state.msg->sender;
        msg.value = state.msg->value;
        break;
    case OP_CALLCODE:
        msg.recipient = state.msg->recipient;
        msg.sender = state.msg->recipient;
        msg.value = intx::be::store<evmc::uint256be>(value);
        break;
    default:
        msg.recipient = target;
        msg.sender = state.msg->recipient;
        msg.value = intx::be::store<evmc::uint256be>(value);
        break;
    }

    const auto input_data = input.view(state.memory);
    msg.input_data = input_data.data();
    msg.input_size = input_data.size();

    // The stipend is added on top of the forwarded gas.
    if (with_value)
    {
        msg.gas += CALL_STIPEND;
        gas_avail += CALL_STIPEND;
    }

    // A call failing on the depth limit or the balance returns the forwarded gas.
    if (state.msg->depth >= CALL_DEPTH_LIMIT || !has_balance(state, value))
        return {EVMC_SUCCESS, gas_avail};

    const auto result = state.host.call(msg);
    gas_avail = settle(state, gas_avail, msg.gas, result);
    stack.top() = result.status_code == EVMC_SUCCESS;

    const auto out_size = std::min(static_cast<size_t>(output.size), result.output_size);
    if (out_size != 0)
        std::copy_n(result.output_data, out_size, &state.memory[static_cast<size_t>(output.offset)]);

    return {EVMC_SUCCESS, gas_avail};
}

template Result call_impl<OP_CALL>(StackRef, int64_t, ExecutionState&) noexcept;
template Result call_impl<OP_CALLCODE>(StackRef, int64_t, ExecutionState&) noexcept;
template Result call_impl<OP_DELEGATECALL>(StackRef, int64_t, ExecutionState&) noexcept;
template Result call_impl<OP_STATICCALL>(StackRef, int64_t, ExecutionState&) noexcept;

template <Opcode Op>
Result create_impl(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    static_assert(Op == OP_CREATE || Op == OP_CREATE2);

    if (state.in_static_mode())
        return {EVMC_STATIC_MODE_VIOLATION, gas_avail};

    const auto value = stack.pop();
    const Region init{stack.pop(), stack.pop()};
    uint256 salt;
    if constexpr (Op == OP_CREATE2)
        salt = stack.pop();

    // The result word is 0 until the creation succeeds.
    stack.push(0);
    state.return_data.clear();

    if (!check_memory(gas_avail, state.memory, init.offset, init.size))
        return {EVMC_OUT_OF_GAS, gas_avail};

    const auto init_code = init.view(state.memory);
    const bool shanghai = state.rev >= EVMC_SHANGHAI;
    if (shanghai && init_code.size() > MAX_INITCODE_SIZE)
        return {EVMC_OUT_OF_GAS, gas_avail};

    int64_t word_cost = 0;
    if (Op == OP_CREATE2)
        word_cost += instr::keccak256_word_cost;  // hashing the init code for the address
    if (shanghai)
        word_cost += instr::initcode_word_cost;
    if (!charge(gas_avail, num_words(init_code.size()) * word_cost))
        return {EVMC_OUT_OF_GAS, gas_avail};

    // Deploying a copy of the executing code halts the frame with all the gas consumed.
    // The distinct status lets the state transition tell it from plain out of gas.
    if (state.recursive_create_guard && !init_code.empty() && init_code == state.original_code)
        return {EVMC_CALL_DEPTH_EXCEEDED, gas_avail};

    if (state.msg->depth >= CALL_DEPTH_LIMIT || !has_balance(state, value))
        return {EVMC_SUCCESS, gas_avail};

    evmc_message msg{};
    msg.kind = call_kind_of<Op>;
    msg.depth = state.msg->depth + 1;
    msg.sender = state.msg->recipient;
    msg.gas = gas_avail - gas_avail / CALL_GAS_RETAINED_DIVISOR;
    msg.value = intx::be::store<evmc::uint256be>(value);
    msg.create2_salt = intx::be::store<evmc::bytes32>(salt);
    msg.input_data = init_code.data();
    msg.input_size = init_code.size();

    const auto result = state.host.call(msg);
    gas_avail = settle(state, gas_avail, msg.gas, result);
    if (result.status_code == EVMC_SUCCESS)
        stack.top() = to_word(result.create_address);

    return {EVMC_SUCCESS, gas_avail};
}

template Result create_impl<OP_CREATE>(StackRef, int64_t, ExecutionState&) noexcept;
template Result create_impl<OP_CREATE2>(StackRef, int64_t, ExecutionState&) noexcept;
}  // namespace evmcore::instr::core
