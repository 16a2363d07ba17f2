// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmcore/instructions_opcodes.hpp>
#include <intx/intx.hpp>
#include <test/utils/utils.hpp>
#include <array>
#include <ostream>
#include <stdexcept>
#include <string>

namespace evmcore::test
{
using enum evmcore::Opcode;
using evmcore::Opcode;

struct bytecode;

inline bytecode push(bytes_view data);

/// Minimal big-endian encoding of a number, at least one byte.
inline bytes to_min_be(uint64_t n)
{
    bytes out;
    do
    {
        out.insert(out.begin(), static_cast<uint8_t>(n));
        n >>= 8;
    } while (n != 0);
    return out;
}

/// EVM code under construction.
///
/// Numbers, addresses and words convert to the PUSH instruction of their shortest
/// encoding, strings are parsed as (optionally spaced) hex.
struct bytecode : bytes
{
    bytecode() noexcept = default;
    bytecode(bytes b) : bytes{std::move(b)} {}
    bytecode(const uint8_t* data, size_t size) : bytes{data, size} {}
    bytecode(Opcode opcode) : bytes(1, static_cast<uint8_t>(opcode)) {}

    template <typename T,
        typename = typename std::enable_if_t<std::is_convertible_v<T, std::string_view>>>
    bytecode(T hex) : bytes{from_spaced_hex(hex).value()}
    {}

    bytecode(uint64_t n);
    bytecode(evmc::address addr);
    bytecode(evmc::bytes32 word);

    operator bytes_view() const noexcept { return {data(), size()}; }

    bytecode& operator+=(const bytecode& other)
    {
        append(other);
        return *this;
    }
};

inline bytecode operator+(bytecode a, const bytecode& b)
{
    return a += b;
}

inline bool operator==(const bytecode& a, const bytecode& b) noexcept
{
    return bytes_view{a} == bytes_view{b};
}

inline std::ostream& operator<<(std::ostream& os, const bytecode& code)
{
    return os << evmc::hex(code);
}

inline bytecode operator*(int n, const bytecode& code)
{
    bytecode out;
    for (int i = 0; i < n; ++i)
        out += code;
    return out;
}

inline bytecode operator*(int n, Opcode opcode)
{
    return n * bytecode{opcode};
}

inline bytecode push(bytes_view data)
{
    if (data.empty() || data.size() > 32)
        throw std::invalid_argument{"push data size must be in [1, 32]"};
    return Opcode(OP_PUSH1 + data.size() - 1) + bytecode{data.data(), data.size()};
}

inline bytecode push(std::string_view hex_data)
{
    return push(from_spaced_hex(hex_data).value());
}

inline bytecode push(const intx::uint256& value)
{
    const auto word = intx::be::store<evmc::bytes32>(value);
    return push(bytes_view{word.bytes, sizeof(word)});
}

inline bytecode push(uint64_t n)
{
    return push(to_min_be(n));
}

inline bytecode push(evmc::address addr)
{
    return push(bytes_view{addr.bytes, sizeof(addr)});
}

inline bytecode push(evmc::bytes32 word)
{
    const bytes_view data{word.bytes, sizeof(word)};
    const auto first = data.find_first_not_of(uint8_t{0});
    return push(data.substr(first == bytes_view::npos ? 31 : first));
}

bytecode push(Opcode opcode) = delete;

inline bytecode::bytecode(uint64_t n) : bytes{push(n)} {}
inline bytecode::bytecode(evmc::address addr) : bytes{push(addr)} {}
inline bytecode::bytecode(evmc::bytes32 word) : bytes{push(word)} {}

/// The instruction with its stack arguments, the first argument ending on the stack top.
template <typename... Args>
inline bytecode op(Opcode opcode, Args&&... args)
{
    bytecode code;
    ((code = bytecode{std::forward<Args>(args)} + code), ...);
    return code + opcode;
}

inline bytecode add(bytecode a, bytecode b)
{
    return op(OP_ADD, a, b);
}
inline bytecode sub(bytecode a, bytecode b)
{
    return op(OP_SUB, a, b);
}
inline bytecode mul(bytecode a, bytecode b)
{
    return op(OP_MUL, a, b);
}

inline bytecode mload(bytecode offset)
{
    return op(OP_MLOAD, offset);
}
inline bytecode mstore(bytecode offset)
{
    return op(OP_MSTORE, offset);
}
inline bytecode mstore(bytecode offset, bytecode value)
{
    return op(OP_MSTORE, offset, value);
}
inline bytecode mstore8(bytecode offset)
{
    return op(OP_MSTORE8, offset);
}
inline bytecode mstore8(bytecode offset, bytecode value)
{
    return op(OP_MSTORE8, offset, value);
}
inline bytecode mcopy(bytecode dst, bytecode src, bytecode size)
{
    return op(OP_MCOPY, dst, src, size);
}

inline bytecode jump(bytecode target)
{
    return op(OP_JUMP, target);
}
inline bytecode jumpi(bytecode target, bytecode condition)
{
    return op(OP_JUMPI, target, condition);
}

inline bytecode ret(bytecode offset, bytecode size)
{
    return op(OP_RETURN, offset, size);
}

/// Returns the stack top as a 32-byte word.
inline bytecode ret_top()
{
    return mstore(0) + ret(0, 32);
}

inline bytecode ret(bytecode value)
{
    return value + ret_top();
}

inline bytecode revert(bytecode offset, bytecode size)
{
    return op(OP_REVERT, offset, size);
}

inline bytecode selfdestruct(bytecode beneficiary)
{
    return op(OP_SELFDESTRUCT, beneficiary);
}

inline bytecode keccak256(bytecode offset, bytecode size)
{
    return op(OP_KECCAK256, offset, size);
}

inline bytecode calldataload(bytecode offset)
{
    return op(OP_CALLDATALOAD, offset);
}
inline bytecode calldatacopy(bytecode dst, bytecode src, bytecode size)
{
    return op(OP_CALLDATACOPY, dst, src, size);
}

inline bytecode balance(bytecode addr)
{
    return op(OP_BALANCE, addr);
}
inline bytecode blobhash(bytecode index)
{
    return op(OP_BLOBHASH, index);
}

inline bytecode sload(bytecode key)
{
    return op(OP_SLOAD, key);
}
inline bytecode sstore(bytecode key, bytecode value)
{
    return op(OP_SSTORE, key, value);
}
inline bytecode tload(bytecode key)
{
    return op(OP_TLOAD, key);
}
inline bytecode tstore(bytecode key, bytecode value)
{
    return op(OP_TSTORE, key, value);
}

inline bytecode log(bytecode offset, bytecode size, std::initializer_list<bytecode> topics = {})
{
    bytecode code;
    for (const auto& topic : topics)
        code = topic + code;
    return code + size + offset + Opcode(OP_LOG0 + topics.size());
}

/// Builder of the message call instructions. The operands default to 0.
template <Opcode Kind>
class call_instruction
{
    static constexpr bool has_value = Kind == OP_CALL || Kind == OP_CALLCODE;

    bytecode m_target;
    bytecode m_gas = 0;
    bytecode m_value = 0;
    std::array<bytecode, 4> m_memory{0, 0, 0, 0};  // in offset, in size, out offset, out size

public:
    explicit call_instruction(bytecode target) : m_target{std::move(target)} {}

    call_instruction& gas(bytecode g)
    {
        m_gas = std::move(g);
        return *this;
    }

    call_instruction& value(bytecode v)
        requires has_value
    {
        m_value = std::move(v);
        return *this;
    }

    call_instruction& input(bytecode offset, bytecode size)
    {
        m_memory[0] = std::move(offset);
        m_memory[1] = std::move(size);
        return *this;
    }

    call_instruction& output(bytecode offset, bytecode size)
    {
        m_memory[2] = std::move(offset);
        m_memory[3] = std::move(size);
        return *this;
    }

    operator bytecode() const
    {
        const auto& [in, in_size, out, out_size] = m_memory;
        if constexpr (has_value)
            return op(Kind, m_gas, m_target, m_value, in, in_size, out, out_size);
        else
            return op(Kind, m_gas, m_target, in, in_size, out, out_size);
    }
};

inline auto call(bytecode target)
{
    return call_instruction<OP_CALL>{std::move(target)};
}
inline auto callcode(bytecode target)
{
    return call_instruction<OP_CALLCODE>{std::move(target)};
}
inline auto delegatecall(bytecode target)
{
    return call_instruction<OP_DELEGATECALL>{std::move(target)};
}
inline auto staticcall(bytecode target)
{
    return call_instruction<OP_STATICCALL>{std::move(target)};
}

/// Builder of CREATE and CREATE2. The operands default to 0.
template <Opcode Kind>
class create_instruction
{
    bytecode m_value = 0;
    bytecode m_offset = 0;
    bytecode m_size = 0;
    bytecode m_salt = 0;

public:
    create_instruction& value(bytecode v)
    {
        m_value = std::move(v);
        return *this;
    }

    create_instruction& input(bytecode offset, bytecode size)
    {
        m_offset = std::move(offset);
        m_size = std::move(size);
        return *this;
    }

    create_instruction& salt(bytecode s)
        requires(Kind == OP_CREATE2)
    {
        m_salt = std::move(s);
        return *this;
    }

    operator bytecode() const
    {
        if constexpr (Kind == OP_CREATE2)
            return op(Kind, m_value, m_offset, m_size, m_salt);
        else
            return op(Kind, m_value, m_offset, m_size);
    }
};

inline auto create()
{
    return create_instruction<OP_CREATE>{};
}
inline auto create2()
{
    return create_instruction<OP_CREATE2>{};
}

/// Init code returning the given runtime code, written to memory byte by byte.
inline bytecode deploy(bytes_view runtime_code)
{
    bytecode init;
    for (size_t i = 0; i < runtime_code.size(); ++i)
        init += mstore8(i, runtime_code[i]);
    return init + ret(0, runtime_code.size());
}
}  // namespace evmcore::test
