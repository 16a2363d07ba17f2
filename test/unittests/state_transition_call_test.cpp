// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "state_transition.hpp"
#include <test/utils/bytecode.hpp>

using namespace evmc::literals;
using namespace evmcore::test;

TEST_F(state_transition, transfer_to_new_account)
{
    tx.to = To;
    tx.value = 1;

    expect.gas_used = 21000;
    expect.success_reason = SuccessReason::stop;
    expect.post[Sender].nonce = 2;
    expect.post[Sender].balance = 1'000'000'001 - 1 - 21000 * 1000;
    expect.post[To].balance = 1;
    expect.post[Coinbase].balance = 21000;
}

TEST_F(state_transition, call_with_value_from_empty_account)
{
    // The sub-call fails because of insufficient balance but the transaction succeeds.
    tx.to = To;
    pre[To] = {.code = ret(call(0xaa).gas(0xffff).value(1))};

    expect.gas_used = 21000 + 21 + (100 + 2500 + 9000 + 25000 - 2300) + 15;
    expect.success_reason = SuccessReason::return_;
    expect.output = bytes(32, 0);
    expect.post[To].balance = 0;
    expect.post[0xaa_address].exists = false;
}

TEST_F(state_transition, staticcall_into_sstore)
{
    static constexpr auto Callee = 0xca11ee_address;

    tx.to = To;
    pre[To] = {.code = sstore(2, 0x22) + ret(staticcall(Callee).gas(0xffff))};
    pre[Callee] = {.code = sstore(1, 1)};

    expect.success_reason = SuccessReason::return_;
    expect.output = bytes(32, 0);
    expect.post[To].storage[0x02_bytes32] = 0x22_bytes32;
    expect.post[Callee].exists = true;
}

TEST_F(state_transition, reverted_call_keeps_accounts_warm)
{
    static constexpr auto Callee = 0xca11ee_address;

    // The callee writes the storage and warms 0xbb, then reverts.
    // The caller measures the cost of BALANCE(0xbb) and stores it in slot 1.
    tx.to = To;
    pre[Callee] = {.code = sstore(7, 7) + balance(0xbb) + OP_POP + revert(0, 0)};
    pre[To] = {.code = call(Callee).gas(0xffff) + OP_POP + OP_GAS + balance(0xbb) + OP_POP +
                       OP_GAS + OP_SWAP1 + OP_SUB + push(1) + OP_SSTORE};

    expect.post[To].storage[0x01_bytes32] = 0x6b_bytes32;  // 3 + 100 + 2 + 2
    expect.post[Callee].exists = true;
}

TEST_F(state_transition, call_output_of_identity_precompile)
{
    tx.to = To;
    pre[To] = {.code = mstore(0, 0x1234) + call(0x04).input(0, 32).output(32, 32).gas(0xffff) +
                       OP_POP + ret(32, 32)};

    expect.success_reason = SuccessReason::return_;
    expect.output = bytes(30, 0) + bytes{0x12, 0x34};
    expect.post[To].exists = true;
}

TEST_F(state_transition, call_unimplemented_precompile)
{
    tx.to = To;
    pre[To] = {.code = ret(call(0x01).gas(0xffff))};

    expect.success_reason = SuccessReason::return_;
    expect.output = bytes(32, 0);
    expect.post[To].exists = true;
}

TEST_F(state_transition, delegatecall_revert)
{
    static constexpr auto Callee = 0xca11ee_address;

    tx.to = To;
    pre[Callee] = {.code = sstore(1, 0xdd) + revert(0, 0)};
    pre[To] = {.storage = {{0x01_bytes32, 0x01_bytes32}},
        .code = delegatecall(Callee).gas(0xffff) + sstore(2, 0x22)};

    expect.post[To].storage[0x01_bytes32] = 0x01_bytes32;
    expect.post[To].storage[0x02_bytes32] = 0x22_bytes32;
    expect.post[Callee].exists = true;
}

TEST_F(state_transition, refund_cap)
{
    // Clearing 2 slots: 2 * (3 + 3 + 2100 + 2900) of execution, 2 * 4800 of refund.
    tx.to = To;
    pre[To] = {.storage = {{0x01_bytes32, 0x01_bytes32}, {0x02_bytes32, 0x01_bytes32}},
        .code = sstore(1, 0) + sstore(2, 0)};

    // The refund is limited to 1/5 of 31012.
    expect.gas_used = 31012 - 6202;
    expect.post[To].storage = {};
}

TEST_F(state_transition, refund_below_cap)
{
    tx.to = To;
    pre[To] = {.storage = {{0x01_bytes32, 0x01_bytes32}}, .code = sstore(1, 0)};

    expect.gas_used = 21000 + 5006 - 4800;
    expect.post[To].storage = {};
}

TEST_F(state_transition, access_list_warms_account)
{
    tx.to = To;
    tx.access_list = {{0xbb_address, {}}};
    pre[To] = {.code = balance(0xbb) + OP_POP};

    expect.gas_used = 21000 + 2400 + 3 + 100 + 2;
    expect.post[To].exists = true;
}

TEST_F(state_transition, access_list_warms_storage)
{
    tx.to = To;
    tx.access_list = {{To, {0x01_bytes32}}};
    pre[To] = {.code = sload(1) + OP_POP};

    expect.gas_used = 21000 + 2400 + 1900 + 3 + 100 + 2;
    expect.post[To].exists = true;
}

TEST_F(state_transition, cold_account_access)
{
    tx.to = To;
    pre[To] = {.code = balance(0xbb) + OP_POP};

    expect.gas_used = 21000 + 3 + 2600 + 2;
    expect.post[To].exists = true;
}

TEST_F(state_transition, coinbase_warm_from_shanghai)
{
    tx.to = To;
    pre[To] = {.code = balance(Coinbase) + OP_POP};

    expect.gas_used = 21000 + 3 + 100 + 2;
    expect.post[To].exists = true;
}

TEST_F(state_transition, coinbase_cold_in_london)
{
    rev = EVMC_LONDON;
    tx.to = To;
    pre[To] = {.code = balance(Coinbase) + OP_POP};

    expect.gas_used = 21000 + 3 + 2600 + 2;
    expect.post[To].exists = true;
}

TEST_F(state_transition, log)
{
    tx.to = To;
    pre[To] = {.code = mstore8(0, 0x77) + log(0, 1, {0xaa}) + log(0, 0)};

    expect.success_reason = SuccessReason::stop;
    expect.num_logs = 2;
    expect.post[To].exists = true;
}

TEST_F(state_transition, log_reverted_call)
{
    static constexpr auto Callee = 0xca11ee_address;

    tx.to = To;
    pre[Callee] = {.code = log(0, 0) + revert(0, 0)};
    pre[To] = {.code = log(0, 0) + call(Callee).gas(0xffff)};

    expect.success_reason = SuccessReason::stop;
    expect.num_logs = 1;
    expect.post[To].exists = true;
    expect.post[Callee].exists = true;
}

TEST_F(state_transition, revert_tx)
{
    tx.to = To;
    pre[To] = {.code = sstore(1, 1) + mstore8(0, 0xee) + revert(0, 1)};

    expect.status = EVMC_REVERT;
    expect.output = bytes{0xee};
    expect.post[Sender].nonce = 2;
    expect.post[To].storage = {};
}

TEST_F(state_transition, halt_tx)
{
    tx.to = To;
    tx.value = 1;
    pre.at(Sender).balance += 1;
    pre[To] = {.code = sstore(1, 1) + OP_INVALID};

    expect.status = EVMC_INVALID_INSTRUCTION;
    expect.halt_reason = HaltReason::invalid_opcode;
    expect.gas_used = tx.gas_limit;

    // The value transfer is reverted but the gas is paid.
    expect.post[Sender].nonce = 2;
    expect.post[Sender].balance = 1'000'000'002 - 1'000'000 * 1000;
    expect.post[To].balance = 0;
    expect.post[To].storage = {};
    expect.post[Coinbase].balance = 1'000'000;
}
