// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "baseline.hpp"
#include "instructions_opcodes.hpp"
#include <algorithm>
#include <limits>

namespace evmcore::baseline
{
static_assert(std::is_move_constructible_v<CodeAnalysis>);
static_assert(!std::is_copy_constructible_v<CodeAnalysis>);

namespace
{
std::vector<uint64_t> find_jumpdests(bytes_view code)
{
    std::vector<uint64_t> bits((code.size() + 63) / 64);

    // OP_PUSH32 is the largest value of int8_t so every byte interpreted as signed
    // and not less than OP_PUSH1 is a PUSH instruction.
    static_assert(OP_PUSH32 == std::numeric_limits<int8_t>::max());

    for (size_t i = 0; i < code.size(); ++i)
    {
        const auto op = code[i];
        if (static_cast<int8_t>(op) >= OP_PUSH1)
            i += op - size_t{OP_PUSH1 - 1};
        else if (op == OP_JUMPDEST)
            bits[i / 64] |= uint64_t{1} << (i % 64);
    }
    return bits;
}
}  // namespace

CodeAnalysis analyze(bytes_view code)
{
    auto padded_code = std::make_unique<uint8_t[]>(code.size() + CodeAnalysis::padding);
    std::ranges::copy(code, padded_code.get());
    return {std::move(padded_code), code.size(), find_jumpdests(code)};
}
}  // namespace evmcore::baseline
