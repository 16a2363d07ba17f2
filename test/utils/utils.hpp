// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <algorithm>
#include <ostream>
#include <string>

namespace evmcore::test
{
using evmc::bytes;
using evmc::bytes_view;
using evmc::from_hex;
using evmc::from_spaced_hex;
using evmc::hex;

/// Convert address to 32-byte value left-padding with 0s.
inline evmc::bytes32 to_bytes32(const evmc::address& addr)
{
    evmc::bytes32 addr32;
    std::copy_n(addr.bytes, sizeof(addr), &addr32.bytes[sizeof(addr32) - sizeof(addr)]);
    return addr32;
}

inline bytes operator""_hex(const char* s, size_t size)
{
    return from_spaced_hex({s, size}).value();
}

/// Encodes bytes as hex with 0x prefix.
inline std::string hex0x(const bytes_view& v)
{
    return "0x" + evmc::hex(v);
}
}  // namespace evmcore::test

inline std::ostream& operator<<(std::ostream& out, const evmc::address& a)
{
    return out << evmcore::test::hex0x(a);
}

inline std::ostream& operator<<(std::ostream& out, const evmc::bytes32& b)
{
    return out << evmcore::test::hex0x(b);
}
