// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmcore_state/block.hpp>
#include <gtest/gtest.h>

using namespace evmcore::state;
using namespace intx::literals;

TEST(state_block, blob_gas_price)
{
    static constexpr uint64_t TARGET_BLOB_GAS_PER_BLOCK = 0x60000;

    EXPECT_EQ(compute_blob_gas_price(0), 1);
    EXPECT_EQ(compute_blob_gas_price(1), 1);
    EXPECT_EQ(compute_blob_gas_price(TARGET_BLOB_GAS_PER_BLOCK), 1);
    EXPECT_EQ(compute_blob_gas_price(TARGET_BLOB_GAS_PER_BLOCK * 2), 1);
    EXPECT_EQ(compute_blob_gas_price(TARGET_BLOB_GAS_PER_BLOCK * 7), 2);

    EXPECT_EQ(compute_blob_gas_price(10'000'000), 19);
    EXPECT_EQ(compute_blob_gas_price(100'000'000), 10203769476395);

    // Close to the computation overflowing:
    EXPECT_EQ(compute_blob_gas_price(400'000'000),
        10840331274704280429132033759016842817414750029778539_u256);
}

TEST(state_block, blob_base_fee)
{
    BlockInfo block;
    EXPECT_EQ(get_blob_base_fee(block), 1);

    block.excess_blob_gas = 10'000'000;
    EXPECT_EQ(get_blob_base_fee(block), 19);

    // The explicitly provided fee takes precedence.
    block.blob_base_fee = 7;
    EXPECT_EQ(get_blob_base_fee(block), 7);
}
