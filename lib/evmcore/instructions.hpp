// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "baseline.hpp"
#include "execution_state.hpp"
#include "instructions_traits.hpp"
#include "instructions_xmacro.hpp"
#include <ethash/keccak.hpp>
#include <array>
#include <limits>
#include <optional>

namespace evmcore
{
using code_ptr = const uint8_t*;

/// A view of the EVM stack through the pointer to its top item.
class StackRef
{
    uint256* m_top;

public:
    StackRef(uint256* top) noexcept : m_top{top} {}

    /// Returns the item at @p index, where 0 is the top item.
    [[nodiscard]] uint256& operator[](int index) noexcept { return m_top[-index]; }

    [[nodiscard]] uint256& top() noexcept { return *m_top; }

    /// Returns the top item and moves the top pointer down.
    /// The returned reference stays valid until the next push().
    [[nodiscard]] uint256& pop() noexcept { return *m_top--; }

    void push(const uint256& value) noexcept { *++m_top = value; }
};


/// The outcome of an instruction which may fail: the status and the gas left.
struct Result
{
    evmc_status_code status;
    int64_t gas_avail;
};

/// The outcome of an instruction which always ends the frame.
struct HaltResult : Result
{};

/// Offsets and sizes above this limit cost more gas than any frame can have.
constexpr uint64_t max_buffer_size = 0xffffffff;

constexpr auto word_size = 32;

/// Number of 32-byte words needed for @p size_in_bytes.
inline constexpr int64_t num_words(uint64_t size_in_bytes) noexcept
{
    return static_cast<int64_t>(size_in_bytes / word_size + (size_in_bytes % word_size != 0));
}

/// The stack word holding the big-endian bytes.
inline uint256 to_word(const evmc_bytes32& value) noexcept
{
    return intx::be::load<uint256>(value);
}

/// The stack word holding the address in its low 20 bytes.
inline uint256 to_word(const evmc_address& addr) noexcept
{
    return intx::be::load<uint256>(addr);
}

/// The address from the low 20 bytes of the stack word.
inline evmc::address to_address(const uint256& word) noexcept
{
    return intx::be::trunc<evmc::address>(word);
}

/// Subtracts @p cost from the gas. Returns false if the gas went negative.
inline bool charge(int64_t& gas_avail, int64_t cost) noexcept
{
    gas_avail -= cost;
    return gas_avail >= 0;
}

/// Checks that the stack word fits in the buffer size limit.
inline bool is_buffer_sized(const uint256& x) noexcept
{
    return x <= max_buffer_size;
}

/// Charges the memory expansion to @p new_size bytes and grows the memory if affordable.
/// The total memory cost of w words is 3w + w*w/512.
[[gnu::noinline]] inline int64_t grow_memory(
    int64_t gas_avail, Memory& memory, uint64_t new_size) noexcept
{
    constexpr auto cost = [](int64_t w) noexcept { return 3 * w + w * w / 512; };

    const auto words_after = num_words(new_size);
    const auto words_before = static_cast<int64_t>(memory.size()) / word_size;
    gas_avail -= cost(words_after) - cost(words_before);
    if (gas_avail >= 0) [[likely]]
        memory.grow(static_cast<size_t>(words_after) * word_size);
    return gas_avail;
}

/// Makes memory [offset, offset + size) accessible, charging the expansion cost.
inline bool check_memory(
    int64_t& gas_avail, Memory& memory, const uint256& offset, uint64_t size) noexcept
{
    if (!is_buffer_sized(offset))
        return false;

    const auto end = static_cast<uint64_t>(offset) + size;
    if (end <= memory.size())
        return true;

    gas_avail = grow_memory(gas_avail, memory, end);
    return gas_avail >= 0;
}

/// Variant of check_memory() for instructions with a size from the stack.
/// Zero size is always valid and free, whatever the offset.
inline bool check_memory(
    int64_t& gas_avail, Memory& memory, const uint256& offset, const uint256& size) noexcept
{
    if (size == 0)
        return true;
    return is_buffer_sized(size) &&
           check_memory(gas_avail, memory, offset, static_cast<uint64_t>(size));
}

/// Charges the cold account access surcharge if the account is accessed first time.
inline bool charge_account_access(
    int64_t& gas_avail, ExecutionState& state, const evmc::address& addr) noexcept
{
    if (state.host.access_account(addr) == EVMC_ACCESS_WARM)
        return true;
    return charge(gas_avail, instr::additional_cold_account_access_cost);
}

namespace instr::core
{
// Each instruction gets the stack with its arguments checked and the base cost already
// charged. The stack pointer is moved by the interpreter after the call.

inline void noop(StackRef /*stack*/) noexcept {}
inline constexpr auto pop = noop;
inline constexpr auto jumpdest = noop;

template <evmc_status_code Status>
inline HaltResult halt(StackRef /*stack*/, int64_t gas_avail, ExecutionState& /*state*/) noexcept
{
    return {Status, gas_avail};
}
inline constexpr auto stop = halt<EVMC_SUCCESS>;
inline constexpr auto invalid = halt<EVMC_INVALID_INSTRUCTION>;

/// Binary operation on the two top items, replacing them with the result.
template <typename Op>
inline void binary(StackRef stack, Op op) noexcept
{
    const auto a = stack.pop();
    auto& b = stack.top();
    b = op(a, b);
}

inline void add(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept { return a + b; });
}

inline void mul(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept { return a * b; });
}

inline void sub(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept { return a - b; });
}

// Division and modulo by 0 give 0.

inline void div(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept {
        return b == 0 ? uint256{} : a / b;
    });
}

inline void sdiv(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept {
        return b == 0 ? uint256{} : intx::sdivrem(a, b).quot;
    });
}

inline void mod(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept {
        return b == 0 ? uint256{} : a % b;
    });
}

inline void smod(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept {
        return b == 0 ? uint256{} : intx::sdivrem(a, b).rem;
    });
}

inline void addmod(StackRef stack) noexcept
{
    const auto a = stack.pop();
    const auto b = stack.pop();
    auto& n = stack.top();
    n = n == 0 ? uint256{} : intx::addmod(a, b, n);
}

inline void mulmod(StackRef stack) noexcept
{
    const auto a = stack.pop();
    const auto b = stack.pop();
    auto& n = stack.top();
    n = n == 0 ? uint256{} : intx::mulmod(a, b, n);
}

/// EXP: 50 gas for each byte of the exponent.
inline Result exp(StackRef stack, int64_t gas_avail, ExecutionState& /*state*/) noexcept
{
    const auto base = stack.pop();
    auto& e = stack.top();

    if (!charge(gas_avail, 50 * static_cast<int64_t>(intx::count_significant_bytes(e))))
        return {EVMC_OUT_OF_GAS, gas_avail};

    e = intx::exp(base, e);
    return {EVMC_SUCCESS, gas_avail};
}

/// SIGNEXTEND: extends the sign bit of the byte at index b (counted from the low end).
inline void signextend(StackRef stack) noexcept
{
    const auto b = stack.pop();
    auto& x = stack.top();
    if (b > 30)
        return;

    const auto sign_bit_pos = 8 * static_cast<unsigned>(b) + 7;
    const auto low_bits = (uint256{1} << sign_bit_pos) - 1;
    if (((x >> sign_bit_pos)[0] & 1) != 0)
        x |= ~low_bits;
    else
        x &= low_bits;
}

inline void lt(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept { return uint256{a < b}; });
}

inline void gt(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept { return uint256{b < a}; });
}

inline void slt(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept {
        return uint256{intx::slt(a, b)};
    });
}

inline void sgt(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept {
        return uint256{intx::slt(b, a)};
    });
}

inline void eq(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept { return uint256{a == b}; });
}

inline void iszero(StackRef stack) noexcept
{
    auto& x = stack.top();
    x = uint256{x == 0};
}

inline void and_(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept { return a & b; });
}

inline void or_(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept { return a | b; });
}

inline void xor_(StackRef stack) noexcept
{
    binary(stack, [](const uint256& a, const uint256& b) noexcept { return a ^ b; });
}

inline void not_(StackRef stack) noexcept
{
    auto& x = stack.top();
    x = ~x;
}

/// BYTE: index 0 is the most significant byte, indexes >= 32 give 0.
inline void byte(StackRef stack) noexcept
{
    binary(stack, [](const uint256& i, const uint256& x) noexcept {
        if (i >= 32)
            return uint256{};
        const auto shift = 8 * (31 - static_cast<unsigned>(i));
        return (x >> shift) & uint256{0xff};
    });
}

// Shifts by 256 bits or more give 0.

inline void shl(StackRef stack) noexcept
{
    binary(stack, [](const uint256& shift, const uint256& x) noexcept { return x << shift; });
}

inline void shr(StackRef stack) noexcept
{
    binary(stack, [](const uint256& shift, const uint256& x) noexcept { return x >> shift; });
}

inline void sar(StackRef stack) noexcept
{
    binary(stack, [](const uint256& shift, const uint256& x) noexcept {
        const auto fill = (x >> 255) != 0 ? ~uint256{} : uint256{};
        if (shift >= 256)
            return fill;
        const auto n = static_cast<unsigned>(shift);
        if (n == 0)
            return x;
        return (x >> n) | (fill << (256 - n));
    });
}

inline Result keccak256(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    const auto offset = stack.pop();
    auto& size = stack.top();

    if (!check_memory(gas_avail, state.memory, offset, size))
        return {EVMC_OUT_OF_GAS, gas_avail};

    const auto len = static_cast<size_t>(size);
    if (!charge(gas_avail, num_words(len) * instr::keccak256_word_cost))
        return {EVMC_OUT_OF_GAS, gas_avail};

    const uint8_t* const data = len != 0 ? &state.memory[static_cast<size_t>(offset)] : nullptr;
    size = intx::be::load<uint256>(ethash::keccak256(data, len));
    return {EVMC_SUCCESS, gas_avail};
}

inline void address(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(to_word(state.msg->recipient));
}

inline void caller(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(to_word(state.msg->sender));
}

inline void callvalue(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(to_word(state.msg->value));
}

inline void origin(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(to_word(state.get_tx_context().tx_origin));
}

/// The account query instructions (BALANCE, EXTCODESIZE, EXTCODEHASH) replacing the address
/// on the stack top with the @p Query result.
template <uint256 (*Query)(ExecutionState&, const evmc::address&) noexcept>
inline Result account_query(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    const auto addr = to_address(x);
    if (!charge_account_access(gas_avail, state, addr))
        return {EVMC_OUT_OF_GAS, gas_avail};
    x = Query(state, addr);
    return {EVMC_SUCCESS, gas_avail};
}

inline uint256 balance_of(ExecutionState& state, const evmc::address& addr) noexcept
{
    return to_word(state.host.get_balance(addr));
}

inline uint256 code_size_of(ExecutionState& state, const evmc::address& addr) noexcept
{
    return state.host.get_code_size(addr);
}

inline uint256 code_hash_of(ExecutionState& state, const evmc::address& addr) noexcept
{
    return to_word(state.host.get_code_hash(addr));
}

inline constexpr auto balance = account_query<balance_of>;
inline constexpr auto extcodesize = account_query<code_size_of>;
inline constexpr auto extcodehash = account_query<code_hash_of>;

inline void selfbalance(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(balance_of(state, state.msg->recipient));
}

/// CALLDATALOAD: the input is read as if padded with zeros.
inline void calldataload(StackRef stack, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    const auto input_size = state.msg->input_size;
    if (x >= input_size)
    {
        x = 0;
        return;
    }

    const auto pos = static_cast<size_t>(x);
    uint8_t word[word_size]{};
    std::memcpy(word, &state.msg->input_data[pos], std::min<size_t>(word_size, input_size - pos));
    x = intx::be::load<uint256>(word);
}

inline void calldatasize(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(state.msg->input_size);
}

inline void codesize(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(state.original_code.size());
}

inline void returndatasize(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(state.return_data.size());
}

inline void msize(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(state.memory.size());
}

/// Pops the (memory offset, source offset, size) of a copy instruction,
/// expands the memory and charges the copy cost.
/// Returns the size or nothing if out of gas.
inline std::optional<size_t> prepare_copy(StackRef& stack, int64_t& gas_avail,
    ExecutionState& state, uint256& mem_offset, uint256& src_offset) noexcept
{
    mem_offset = stack.pop();
    src_offset = stack.pop();
    const auto size = stack.pop();

    if (!check_memory(gas_avail, state.memory, mem_offset, size))
        return std::nullopt;
    const auto len = static_cast<size_t>(size);
    if (!charge(gas_avail, num_words(len) * instr::copy_word_cost))
        return std::nullopt;
    return len;
}

/// Copies from @p src at @p src_offset to memory at @p dst, zero-filling what is past
/// the end of the source.
inline void copy_padded(
    Memory& memory, size_t dst, bytes_view src, const uint256& src_offset, size_t len) noexcept
{
    const auto from = src_offset < src.size() ? static_cast<size_t>(src_offset) : src.size();
    const auto n = std::min(len, src.size() - from);
    if (n != 0)
        std::memcpy(&memory[dst], src.data() + from, n);
    if (n != len)
        std::memset(&memory[dst + n], 0, len - n);
}

/// CALLDATACOPY and CODECOPY from the input or the code of the frame.
template <bool FromCode>
inline Result copy_from_frame(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    uint256 dst;
    uint256 src;
    const auto len = prepare_copy(stack, gas_avail, state, dst, src);
    if (!len)
        return {EVMC_OUT_OF_GAS, gas_avail};

    if (*len != 0)
    {
        const auto source = FromCode ? state.original_code :
                                       bytes_view{state.msg->input_data, state.msg->input_size};
        copy_padded(state.memory, static_cast<size_t>(dst), source, src, *len);
    }
    return {EVMC_SUCCESS, gas_avail};
}

inline constexpr auto calldatacopy = copy_from_frame<false>;
inline constexpr auto codecopy = copy_from_frame<true>;

inline Result extcodecopy(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    const auto addr = to_address(stack.pop());
    uint256 dst;
    uint256 src;
    const auto len = prepare_copy(stack, gas_avail, state, dst, src);
    if (!len || !charge_account_access(gas_avail, state, addr))
        return {EVMC_OUT_OF_GAS, gas_avail};

    if (*len != 0)
    {
        const auto mem = &state.memory[static_cast<size_t>(dst)];
        const auto code_offset = static_cast<size_t>(std::min(src, uint256{max_buffer_size}));
        const auto n = state.host.copy_code(addr, code_offset, mem, *len);
        std::memset(mem + n, 0, *len - n);
    }
    return {EVMC_SUCCESS, gas_avail};
}

/// RETURNDATACOPY: unlike other copies, reading past the return data is a fault.
inline Result returndatacopy(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    const auto mem_offset = stack.pop();
    const auto data_offset = stack.pop();
    const auto size = stack.pop();

    if (!check_memory(gas_avail, state.memory, mem_offset, size))
        return {EVMC_OUT_OF_GAS, gas_avail};

    const auto available = state.return_data.size();
    if (data_offset > available || size > available - static_cast<size_t>(data_offset))
        return {EVMC_INVALID_MEMORY_ACCESS, gas_avail};

    const auto len = static_cast<size_t>(size);
    if (!charge(gas_avail, num_words(len) * instr::copy_word_cost))
        return {EVMC_OUT_OF_GAS, gas_avail};

    if (len != 0)
    {
        std::memcpy(&state.memory[static_cast<size_t>(mem_offset)],
            &state.return_data[static_cast<size_t>(data_offset)], len);
    }
    return {EVMC_SUCCESS, gas_avail};
}

inline void gasprice(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(to_word(state.get_tx_context().tx_gas_price));
}

/// BLOCKHASH: only the 256 most recent complete blocks are available.
inline void blockhash(StackRef stack, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    const auto current = state.get_tx_context().block_number;

    evmc::bytes32 hash;
    if (x < current)
    {
        const auto n = static_cast<int64_t>(x);
        if (current - n <= 256)
            hash = state.host.get_block_hash(n);
    }
    x = to_word(hash);
}

inline void coinbase(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(to_word(state.get_tx_context().block_coinbase));
}

inline void timestamp(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(static_cast<uint64_t>(state.get_tx_context().block_timestamp));
}

inline void number(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(static_cast<uint64_t>(state.get_tx_context().block_number));
}

inline void prevrandao(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(to_word(state.get_tx_context().block_prev_randao));
}

inline void gaslimit(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(static_cast<uint64_t>(state.get_tx_context().block_gas_limit));
}

inline void chainid(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(to_word(state.get_tx_context().chain_id));
}

inline void basefee(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(to_word(state.get_tx_context().block_base_fee));
}

/// BLOBHASH (EIP-4844): 0 for indexes out of the transaction blob list.
inline void blobhash(StackRef stack, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    const auto& tx = state.get_tx_context();
    if (x < tx.blob_hashes_count)
        x = to_word(tx.blob_hashes[static_cast<size_t>(x)]);
    else
        x = 0;
}

inline void blobbasefee(StackRef stack, ExecutionState& state) noexcept
{
    stack.push(to_word(state.get_tx_context().blob_base_fee));
}

inline Result mload(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    if (!check_memory(gas_avail, state.memory, x, word_size))
        return {EVMC_OUT_OF_GAS, gas_avail};

    x = intx::be::unsafe::load<uint256>(&state.memory[static_cast<size_t>(x)]);
    return {EVMC_SUCCESS, gas_avail};
}

inline Result mstore(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    const auto offset = stack.pop();
    const auto value = stack.pop();
    if (!check_memory(gas_avail, state.memory, offset, word_size))
        return {EVMC_OUT_OF_GAS, gas_avail};

    intx::be::unsafe::store(&state.memory[static_cast<size_t>(offset)], value);
    return {EVMC_SUCCESS, gas_avail};
}

inline Result mstore8(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    const auto offset = stack.pop();
    const auto value = stack.pop();
    if (!check_memory(gas_avail, state.memory, offset, 1))
        return {EVMC_OUT_OF_GAS, gas_avail};

    state.memory[static_cast<size_t>(offset)] = static_cast<uint8_t>(value);
    return {EVMC_SUCCESS, gas_avail};
}

/// MCOPY (EIP-5656): the regions may overlap, memory expands to cover both of them.
inline Result mcopy(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    uint256 dst;
    uint256 src;
    // The source region must be accessible too, the destination is checked by prepare_copy().
    const auto size = stack[2];
    if (!check_memory(gas_avail, state.memory, stack[1], size))
        return {EVMC_OUT_OF_GAS, gas_avail};
    const auto len = prepare_copy(stack, gas_avail, state, dst, src);
    if (!len)
        return {EVMC_OUT_OF_GAS, gas_avail};

    if (*len != 0)
    {
        std::memmove(&state.memory[static_cast<size_t>(dst)],
            &state.memory[static_cast<size_t>(src)], *len);
    }
    return {EVMC_SUCCESS, gas_avail};
}

Result sload(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept;

Result sstore(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept;

Result tload(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept;

Result tstore(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept;

/// Resolves the jump destination. On failure returns null and sets the frame status.
inline code_ptr jump_target(ExecutionState& state, const uint256& dst) noexcept
{
    const auto& analysis = *state.analysis;
    if (dst >= analysis.raw_code().size() || !analysis.check_jumpdest(static_cast<uint64_t>(dst)))
    {
        state.status = EVMC_BAD_JUMP_DESTINATION;
        return nullptr;
    }
    return analysis.executable_code() + static_cast<size_t>(dst);
}

inline code_ptr jump(StackRef stack, ExecutionState& state, code_ptr /*pos*/) noexcept
{
    return jump_target(state, stack.pop());
}

/// JUMPI: the destination is validated only if the jump is taken.
inline code_ptr jumpi(StackRef stack, ExecutionState& state, code_ptr pos) noexcept
{
    const auto dst = stack.pop();
    if (stack.pop() == 0)
        return pos + 1;
    return jump_target(state, dst);
}

inline code_ptr pc(StackRef stack, ExecutionState& state, code_ptr pos) noexcept
{
    stack.push(static_cast<uint64_t>(pos - state.analysis->executable_code()));
    return pos + 1;
}

inline Result gas(StackRef stack, int64_t gas_avail, ExecutionState& /*state*/) noexcept
{
    stack.push(gas_avail);
    return {EVMC_SUCCESS, gas_avail};
}

inline void push0(StackRef stack) noexcept
{
    stack.push(0);
}

/// PUSH1..PUSH32 with @p Len bytes of immediate data.
///
/// Reads past the end of the code are safe because the analyzed code is padded.
template <size_t Len>
inline code_ptr push(StackRef stack, ExecutionState& /*state*/, code_ptr pos) noexcept
{
    uint8_t word[word_size]{};
    std::copy_n(pos + 1, Len, std::end(word) - Len);
    stack.push(intx::be::load<uint256>(word));
    return pos + 1 + Len;
}

template <int N>
inline void dup(StackRef stack) noexcept
{
    static_assert(N >= 1 && N <= 16);
    const auto item = stack[N - 1];
    stack.push(item);
}

template <int N>
inline void swap(StackRef stack) noexcept
{
    static_assert(N >= 1 && N <= 16);
    std::swap(stack[0], stack[N]);
}

/// LOG0..LOG4. The topics are charged with the base cost.
template <size_t NumTopics>
inline Result log(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    static_assert(NumTopics <= 4);

    if (state.in_static_mode())
        return {EVMC_STATIC_MODE_VIOLATION, 0};

    const auto offset = stack.pop();
    const auto size = stack.pop();
    if (!check_memory(gas_avail, state.memory, offset, size))
        return {EVMC_OUT_OF_GAS, gas_avail};

    const auto len = static_cast<size_t>(size);
    if (!charge(gas_avail, static_cast<int64_t>(len) * instr::log_data_cost))
        return {EVMC_OUT_OF_GAS, gas_avail};

    std::array<evmc::bytes32, NumTopics> topics;
    for (size_t i = 0; i < NumTopics; ++i)
        topics[i] = intx::be::store<evmc::bytes32>(stack.pop());

    const uint8_t* const data = len != 0 ? &state.memory[static_cast<size_t>(offset)] : nullptr;
    state.host.emit_log(state.msg->recipient, data, len, topics.data(), NumTopics);
    return {EVMC_SUCCESS, gas_avail};
}

template <Opcode Op>
Result call_impl(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept;
inline constexpr auto call = call_impl<OP_CALL>;
inline constexpr auto callcode = call_impl<OP_CALLCODE>;
inline constexpr auto delegatecall = call_impl<OP_DELEGATECALL>;
inline constexpr auto staticcall = call_impl<OP_STATICCALL>;

template <Opcode Op>
Result create_impl(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept;
inline constexpr auto create = create_impl<OP_CREATE>;
inline constexpr auto create2 = create_impl<OP_CREATE2>;

/// RETURN and REVERT: the output is the memory area, left for the interpreter to copy.
template <evmc_status_code Status>
inline HaltResult finish(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    const auto& offset = stack[0];
    const auto& size = stack[1];
    if (!check_memory(gas_avail, state.memory, offset, size))
        return {EVMC_OUT_OF_GAS, gas_avail};

    state.output_size = static_cast<size_t>(size);
    state.output_offset = state.output_size != 0 ? static_cast<size_t>(offset) : 0;
    return {Status, gas_avail};
}
inline constexpr auto return_ = finish<EVMC_SUCCESS>;
inline constexpr auto revert = finish<EVMC_REVERT>;

/// SELFDESTRUCT. Whether the account is deleted is decided by the host for the revision.
inline HaltResult selfdestruct(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    if (state.in_static_mode())
        return {EVMC_STATIC_MODE_VIOLATION, gas_avail};

    const auto beneficiary = to_address(stack[0]);
    const auto& self = state.msg->recipient;

    auto cost = int64_t{0};
    if (state.host.access_account(beneficiary) == EVMC_ACCESS_COLD)
        cost += instr::cold_account_access_cost;
    if (!charge(gas_avail, cost))
        return {EVMC_OUT_OF_GAS, gas_avail};

    // Sending a non-zero balance to a dead account creates it.
    if (!evmc::is_zero(state.host.get_balance(self)) && !state.host.account_exists(beneficiary))
    {
        if (!charge(gas_avail, instr::account_creation_cost))
            return {EVMC_OUT_OF_GAS, gas_avail};
    }

    state.host.selfdestruct(self, beneficiary);
    return {EVMC_SUCCESS, gas_avail};
}

/// Maps an opcode to its implementation: instr::core::impl<OP_ADD> is add().
/// The unspecialized template must not be used.
template <Opcode Op>
inline constexpr auto impl = nullptr;

#define EVMCORE_IMPL(OPCODE, IDENTIFIER) \
    template <>                          \
    inline constexpr auto impl<OPCODE> = IDENTIFIER;
EVMCORE_FOR_EACH_OPCODE(EVMCORE_IMPL, EVMCORE_OPCODE_IGNORED)
#undef EVMCORE_IMPL
}  // namespace instr::core
}  // namespace evmcore
