// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

/// This file contains EVM unit tests that perform any kind of calls.

#include "evm_fixture.hpp"

using namespace evmc::literals;
using namespace evmcore::test;

TEST_P(evm, call_with_value_insufficient_balance)
{
    // The caller has no balance: the call fails without reaching the host.
    execute(ret(call(0xaa).gas(0xffff).value(1)));
    EXPECT_STATUS(EVMC_SUCCESS);
    EXPECT_OUTPUT_INT(0);
    EXPECT_TRUE(host.recorded_calls.empty());

    // Value transfer to a new account: 9000 + 25000, minus the unused stipend.
    EXPECT_EQ(gas_used, 21 + (100 + 2500 + 9000 + 25000 - 2300) + 15);
}

TEST_P(evm, call_with_value_adds_stipend)
{
    host.accounts[msg.recipient].balance = evmc::bytes32{1};
    execute(call(0xaa).gas(0).value(1));
    EXPECT_STATUS(EVMC_SUCCESS);
    ASSERT_EQ(host.recorded_calls.size(), 1);
    const auto& call_msg = host.recorded_calls.back();
    EXPECT_EQ(call_msg.kind, EVMC_CALL);
    EXPECT_EQ(call_msg.gas, 2300);
    EXPECT_EQ(evmc::bytes32{call_msg.value}, evmc::bytes32{1});
    EXPECT_EQ(call_msg.depth, 1);
}

TEST_P(evm, call_gas_all_but_one_64th)
{
    execute(100000, call(0xaa).gas(push(~intx::uint256{})));
    EXPECT_STATUS(EVMC_SUCCESS);
    ASSERT_EQ(host.recorded_calls.size(), 1);

    // 97379 gas left at the call, 1521 of it is retained.
    EXPECT_EQ(host.recorded_calls.back().gas, 95858);
}

TEST_P(evm, staticcall)
{
    execute(staticcall(0xaa).gas(1000));
    EXPECT_STATUS(EVMC_SUCCESS);
    ASSERT_EQ(host.recorded_calls.size(), 1);
    const auto& call_msg = host.recorded_calls.back();
    EXPECT_EQ(call_msg.kind, EVMC_CALL);
    EXPECT_EQ(call_msg.flags, uint32_t{EVMC_STATIC});
    EXPECT_EQ(call_msg.recipient, 0xaa_address);
    EXPECT_EQ(call_msg.sender, msg.recipient);
    EXPECT_EQ(call_msg.gas, 1000);
}

TEST_P(evm, delegatecall)
{
    msg.sender = 0x5e_address;
    msg.recipient = 0xdd_address;
    msg.value = evmc::bytes32{7};
    execute(delegatecall(0xaa).gas(1000));
    EXPECT_STATUS(EVMC_SUCCESS);
    ASSERT_EQ(host.recorded_calls.size(), 1);
    const auto& call_msg = host.recorded_calls.back();
    EXPECT_EQ(call_msg.kind, EVMC_DELEGATECALL);
    EXPECT_EQ(call_msg.sender, 0x5e_address);
    EXPECT_EQ(call_msg.recipient, 0xdd_address);
    EXPECT_EQ(call_msg.code_address, 0xaa_address);
    EXPECT_EQ(evmc::bytes32{call_msg.value}, evmc::bytes32{7});
}

TEST_P(evm, callcode)
{
    msg.recipient = 0xdd_address;
    execute(callcode(0xaa).gas(1000));
    EXPECT_STATUS(EVMC_SUCCESS);
    ASSERT_EQ(host.recorded_calls.size(), 1);
    const auto& call_msg = host.recorded_calls.back();
    EXPECT_EQ(call_msg.kind, EVMC_CALLCODE);
    EXPECT_EQ(call_msg.sender, 0xdd_address);
    EXPECT_EQ(call_msg.recipient, 0xdd_address);
    EXPECT_EQ(call_msg.code_address, 0xaa_address);
}

TEST_P(evm, call_with_value_in_static_mode)
{
    msg.flags = EVMC_STATIC;
    host.accounts[msg.recipient].balance = evmc::bytes32{1};
    execute(call(0xaa).gas(1000).value(1));
    EXPECT_STATUS(EVMC_STATIC_MODE_VIOLATION);
    EXPECT_TRUE(host.recorded_calls.empty());
}

TEST_P(evm, call_depth_limit)
{
    msg.depth = 1024;
    execute(ret(call(0xaa).gas(1000)));
    EXPECT_STATUS(EVMC_SUCCESS);
    EXPECT_OUTPUT_INT(0);
    EXPECT_TRUE(host.recorded_calls.empty());
}

TEST_P(evm, call_address_uses_low_bytes)
{
    execute(call(push("ffffffffffffffffffffffff00000000000000000000000000000000000000aa")).gas(1));
    ASSERT_EQ(host.recorded_calls.size(), 1);
    EXPECT_EQ(host.recorded_calls.back().recipient, 0xaa_address);
}

TEST_P(evm, call_output)
{
    const uint8_t call_output[]{0x0a, 0x0b, 0x0c};
    host.call_result.output_data = std::data(call_output);
    host.call_result.output_size = std::size(call_output);

    // The output is truncated to the area of 2 bytes.
    execute(call(0xaa).gas(0xffff).output(0, 2) + OP_POP + ret(0, 3));
    EXPECT_STATUS(EVMC_SUCCESS);
    EXPECT_EQ(output, "0a0b00"_hex);

    execute(call(0xaa).gas(0xffff) + OP_POP + ret(bytecode{OP_RETURNDATASIZE}));
    EXPECT_OUTPUT_INT(3);

    execute(call(0xaa).gas(0xffff) + OP_POP + push(3) + push(0) + push(0) + OP_RETURNDATACOPY +
            ret(0, 3));
    EXPECT_EQ(output, "0a0b0c"_hex);
}

TEST_P(evm, call_failure_pushes_zero)
{
    host.call_result.status_code = EVMC_REVERT;
    host.call_result.gas_left = 400;
    execute(ret(call(0xaa).gas(1000)));
    EXPECT_STATUS(EVMC_SUCCESS);
    EXPECT_OUTPUT_INT(0);

    // The gas left by the callee is returned to the caller.
    EXPECT_EQ(gas_used, 21 + 2600 + 600 + 15);
}

TEST_P(evm, returndatacopy_outside_return_data)
{
    execute(push(1) + push(0) + push(0) + OP_RETURNDATACOPY);
    EXPECT_STATUS(EVMC_INVALID_MEMORY_ACCESS);
}

TEST_P(evm, create)
{
    host.call_result.create_address = 0xcc_address;
    execute(mstore8(0, 0xfe) + ret(create().value(0).input(0, 1)));
    EXPECT_STATUS(EVMC_SUCCESS);
    EXPECT_OUTPUT_INT(0xcc);

    ASSERT_EQ(host.recorded_calls.size(), 1);
    const auto& call_msg = host.recorded_calls.back();
    EXPECT_EQ(call_msg.kind, EVMC_CREATE);
    EXPECT_EQ(call_msg.sender, msg.recipient);
    EXPECT_EQ(call_msg.depth, 1);
    EXPECT_EQ(bytes_view(call_msg.input_data, call_msg.input_size), "fe"_hex);
}

TEST_P(evm, create2_salt)
{
    host.call_result.create_address = 0xcc_address;
    execute(ret(create2().salt(0x5a).input(0, 0)));
    EXPECT_OUTPUT_INT(0xcc);
    ASSERT_EQ(host.recorded_calls.size(), 1);
    EXPECT_EQ(host.recorded_calls.back().kind, EVMC_CREATE2);
    EXPECT_EQ(evmc::bytes32{host.recorded_calls.back().create2_salt}, evmc::bytes32{0x5a});
}

TEST_P(evm, create_failure_pushes_zero)
{
    host.call_result.status_code = EVMC_REVERT;
    host.call_result.create_address = 0xcc_address;
    execute(ret(create()));
    EXPECT_STATUS(EVMC_SUCCESS);
    EXPECT_OUTPUT_INT(0);
}

TEST_P(evm, create_in_static_mode)
{
    msg.flags = EVMC_STATIC;
    execute(create());
    EXPECT_STATUS(EVMC_STATIC_MODE_VIOLATION);
    EXPECT_TRUE(host.recorded_calls.empty());
}

TEST_P(evm, create_initcode_limit)
{
    execute(create().input(0, 0xC001));
    EXPECT_STATUS(EVMC_OUT_OF_GAS);
    EXPECT_TRUE(host.recorded_calls.empty());

    execute(create().input(0, 0xC000));
    EXPECT_STATUS(EVMC_SUCCESS);
    EXPECT_EQ(host.recorded_calls.size(), 1);

    // No limit before Shanghai.
    rev = EVMC_LONDON;
    execute(create().input(0, 0xC001));
    EXPECT_STATUS(EVMC_SUCCESS);
    EXPECT_EQ(host.recorded_calls.size(), 2);
}

TEST_P(evm, create_depth_limit)
{
    msg.depth = 1024;
    execute(ret(create()));
    EXPECT_STATUS(EVMC_SUCCESS);
    EXPECT_OUTPUT_INT(0);
    EXPECT_TRUE(host.recorded_calls.empty());
}

TEST_P(evm, selfdestruct)
{
    host.accounts[msg.recipient].balance = evmc::bytes32{231};
    execute(selfdestruct(0xbe));
    EXPECT_GAS_USED(EVMC_SUCCESS, 3 + 5000 + 2600 + 25000);
    ASSERT_EQ(host.recorded_selfdestructs[msg.recipient].size(), 1);
    EXPECT_EQ(host.recorded_selfdestructs[msg.recipient][0], 0xbe_address);
}

TEST_P(evm, selfdestruct_in_static_mode)
{
    msg.flags = EVMC_STATIC;
    execute(selfdestruct(0xbe));
    EXPECT_STATUS(EVMC_STATIC_MODE_VIOLATION);
    EXPECT_TRUE(host.recorded_selfdestructs.empty());
}
