// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"
#include <limits>

namespace evmcore::state
{
namespace
{
constexpr uint64_t MIN_BLOB_GASPRICE = 1;
constexpr uint64_t BLOB_BASE_FEE_UPDATE_FRACTION = 3338477;

/// Approximates `factor * e ** (numerator / denominator)` with the Taylor expansion.
intx::uint256 fake_exponential(uint64_t factor, uint64_t numerator, uint64_t denominator) noexcept
{
    intx::uint256 i = 1;
    intx::uint256 output = 0;
    intx::uint256 numerator_accum = intx::uint256{factor} * denominator;
    const intx::uint256 numerator256 = numerator;
    while (numerator_accum > 0)
    {
        output += numerator_accum;
        if (const auto p = intx::umul(numerator_accum, numerator256);
            p <= std::numeric_limits<intx::uint256>::max())
            numerator_accum = intx::uint256(p) / (denominator * i);
        else
            return std::numeric_limits<intx::uint256>::max();
        i += 1;
    }
    return output / denominator;
}
}  // namespace

intx::uint256 compute_blob_gas_price(uint64_t excess_blob_gas) noexcept
{
    return fake_exponential(MIN_BLOB_GASPRICE, excess_blob_gas, BLOB_BASE_FEE_UPDATE_FRACTION);
}

intx::uint256 get_blob_base_fee(const BlockInfo& block) noexcept
{
    if (block.blob_base_fee.has_value())
        return *block.blob_base_fee;
    return compute_blob_gas_price(block.excess_blob_gas.value_or(0));
}
}  // namespace evmcore::state
