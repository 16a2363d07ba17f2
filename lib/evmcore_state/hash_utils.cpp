// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#include "hash_utils.hpp"

std::ostream& operator<<(std::ostream& out, const evmcore::address& a)
{
    return out << "0x" << evmc::hex(a);
}

std::ostream& operator<<(std::ostream& out, const evmcore::bytes32& b)
{
    return out << "0x" << evmc::hex(b);
}
