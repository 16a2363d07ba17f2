// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "state_transition.hpp"
#include <test/utils/bytecode.hpp>

using namespace evmc::literals;
using namespace evmcore::test;

TEST_F(state_transition, tx_legacy)
{
    rev = EVMC_LONDON;
    tx.type = Transaction::Type::legacy;
    tx.to = To;

    expect.gas_used = 21000;
    expect.post[Sender].nonce = 2;
    expect.post[Sender].balance = 1'000'000'001 - 21000 * 1000;
}

TEST_F(state_transition, tx_non_existing_sender)
{
    tx.to = To;
    tx.max_gas_price = 0;
    tx.max_priority_gas_price = 0;
    tx.nonce = 0;
    block.base_fee = 0;
    pre.erase(Sender);

    // The sender is created by the nonce bump. The zero-priority coinbase stays empty.
    expect.post.erase(Sender);
    expect.post[Sender].nonce = 1;
    expect.post[Coinbase].exists = false;
}

TEST_F(state_transition, tx_nonce_too_high)
{
    tx.to = To;
    tx.nonce = 2;
    expect.tx_error = NONCE_TOO_HIGH;
}

TEST_F(state_transition, tx_nonce_too_low)
{
    tx.to = To;
    tx.nonce = 0;
    expect.tx_error = NONCE_TOO_LOW;
}

TEST_F(state_transition, tx_nonce_has_max_value)
{
    tx.to = To;
    pre.at(Sender).nonce = ~uint64_t{0};
    tx.nonce = ~uint64_t{0};
    expect.tx_error = NONCE_HAS_MAX_VALUE;
}

TEST_F(state_transition, tx_nonce_max_minus_one_call)
{
    // The last valid nonce: the sender ends up with the max nonce.
    pre.at(Sender).nonce = ~uint64_t{0} - 1;
    tx.nonce = ~uint64_t{0} - 1;
    tx.to = To;
    pre[To] = {.code = sstore(1, 1)};

    expect.success_reason = SuccessReason::stop;
    expect.post[Sender].nonce = ~uint64_t{0};
    expect.post[To].storage[0x01_bytes32] = 0x01_bytes32;
}

TEST_F(state_transition, tx_nonce_max_minus_one_create)
{
    pre.at(Sender).nonce = ~uint64_t{0} - 1;
    tx.nonce = ~uint64_t{0} - 1;
    tx.data = mstore8(0, push(0xFE)) + ret(0, 1);

    // The address comes from the nonce of the transaction, before the bump.
    const auto create_address = compute_create_address(Sender, 0xfffffffffffffffe);
    EXPECT_EQ(create_address, 0xf97457aeefcaca73626a9d22ce931d93b4b2e4ce_address);
    expect.success_reason = SuccessReason::return_;
    expect.post[Sender].nonce = ~uint64_t{0};
    expect.post[create_address] = {.nonce = 1, .code = bytes{0xFE}};
}

TEST_F(state_transition, tx_insufficient_funds)
{
    tx.to = To;
    tx.value = 2;
    expect.tx_error = INSUFFICIENT_FUNDS;
}

TEST_F(state_transition, tx_intrinsic_gas_too_low)
{
    tx.to = To;
    tx.gas_limit = 20999;
    expect.tx_error = INTRINSIC_GAS_TOO_LOW;
}

TEST_F(state_transition, tx_intrinsic_gas_of_data)
{
    // 21000 + 2 * 16 + 2 * 4.
    tx.to = To;
    tx.data = bytes{0x00, 0x01, 0x00, 0x02};
    tx.gas_limit = 21039;
    expect.tx_error = INTRINSIC_GAS_TOO_LOW;
}

TEST_F(state_transition, tx_intrinsic_gas_of_access_list)
{
    tx.to = To;
    tx.access_list = {{0xaa_address, {0x01_bytes32, 0x02_bytes32}}};
    tx.gas_limit = 21000 + 2400 + 2 * 1900;

    expect.gas_used = tx.gas_limit;
    expect.post[0xaa_address].exists = false;
}

TEST_F(state_transition, tx_gas_limit_reached)
{
    tx.to = To;
    tx.gas_limit = block.gas_limit + 1;
    expect.tx_error = GAS_LIMIT_REACHED;
}

TEST_F(state_transition, tx_fee_cap_less_than_base_fee)
{
    tx.to = To;
    tx.max_gas_price = block.base_fee - 1;
    tx.max_priority_gas_price = block.base_fee - 1;
    expect.tx_error = FEE_CAP_LESS_THAN_BLOCKS;
}

TEST_F(state_transition, tx_tip_greater_than_fee_cap)
{
    tx.to = To;
    tx.max_priority_gas_price = tx.max_gas_price + 1;
    expect.tx_error = TIP_GT_FEE_CAP;
}

TEST_F(state_transition, tx_sender_not_eoa)
{
    tx.to = To;
    pre.at(Sender).code = bytes{0x00};
    expect.tx_error = SENDER_NOT_EOA;
}

TEST_F(state_transition, tx_initcode_size_limit)
{
    tx.data = bytes(0xC001, 0);
    expect.tx_error = INIT_CODE_SIZE_LIMIT_EXCEEDED;
}

TEST_F(state_transition, tx_initcode_size_limit_london)
{
    // No limit before Shanghai. The gas limit is too low for the data.
    rev = EVMC_LONDON;
    tx.data = bytes(0xC001, 0);
    expect.tx_error = INTRINSIC_GAS_TOO_LOW;
    tx.gas_limit = 53000 + 0xC001 * 4 - 1;
}

TEST_F(state_transition, tx_revision_not_supported)
{
    rev = EVMC_BERLIN;
    tx.to = To;
    expect.tx_error = REVISION_NOT_SUPPORTED;
}

TEST_F(state_transition, tx_blob)
{
    tx.type = Transaction::Type::blob;
    tx.to = To;
    tx.max_blob_gas_price = 1;
    tx.blob_hashes = {0x0100000000000000000000000000000000000000000000000000000000000000_bytes32};
    pre.at(Sender).balance += GAS_PER_BLOB;

    expect.gas_used = 21000;
    expect.post[Sender].balance = 1'000'000'001 - 21000 * 1000;
    expect.post[To].exists = false;
}

TEST_F(state_transition, tx_blob_hash_opcode)
{
    static constexpr auto BlobHash =
        0x01a915e4d060149eb4365960e6a7a45f334393093061116b197e3240065ff2d8_bytes32;

    tx.type = Transaction::Type::blob;
    tx.to = To;
    tx.max_blob_gas_price = 1;
    tx.blob_hashes = {BlobHash};
    pre.at(Sender).balance += GAS_PER_BLOB;
    pre[To] = {.code = sstore(1, blobhash(0)) + sstore(2, blobhash(1))};

    expect.post[To].storage[0x01_bytes32] = BlobHash;
}

TEST_F(state_transition, tx_blob_before_cancun)
{
    rev = EVMC_SHANGHAI;
    tx.type = Transaction::Type::blob;
    tx.to = To;
    tx.blob_hashes = {0x0100000000000000000000000000000000000000000000000000000000000000_bytes32};
    expect.tx_error = TX_TYPE_NOT_SUPPORTED;
}

TEST_F(state_transition, tx_blob_create)
{
    tx.type = Transaction::Type::blob;
    tx.blob_hashes = {0x0100000000000000000000000000000000000000000000000000000000000000_bytes32};
    expect.tx_error = CREATE_BLOB_TX;
}

TEST_F(state_transition, tx_blob_empty_hashes)
{
    tx.type = Transaction::Type::blob;
    tx.to = To;
    expect.tx_error = EMPTY_BLOB_HASHES_LIST;
}

TEST_F(state_transition, tx_blob_too_many_hashes)
{
    tx.type = Transaction::Type::blob;
    tx.to = To;
    tx.max_blob_gas_price = 1;
    tx.blob_hashes.assign(MAX_BLOB_COUNT + 1,
        0x0100000000000000000000000000000000000000000000000000000000000000_bytes32);
    expect.tx_error = BLOB_GAS_LIMIT_EXCEEDED;
}

TEST_F(state_transition, tx_blob_fee_cap_too_low)
{
    tx.type = Transaction::Type::blob;
    tx.to = To;
    tx.max_blob_gas_price = 1;
    block.excess_blob_gas = 0x60000 * 7;  // Blob gas price 2.
    tx.blob_hashes = {0x0100000000000000000000000000000000000000000000000000000000000000_bytes32};
    expect.tx_error = BLOB_FEE_CAP_LESS_THAN_BLOCKS;
}

TEST_F(state_transition, tx_blob_invalid_hash_version)
{
    tx.type = Transaction::Type::blob;
    tx.to = To;
    tx.max_blob_gas_price = 1;
    tx.blob_hashes = {0x0200000000000000000000000000000000000000000000000000000000000000_bytes32};
    expect.tx_error = INVALID_BLOB_HASH_VERSION;
}

TEST_F(state_transition, tx_blob_insufficient_funds)
{
    // The balance does not cover the blob gas.
    tx.type = Transaction::Type::blob;
    tx.to = To;
    tx.max_blob_gas_price = 1;
    tx.blob_hashes = {0x0100000000000000000000000000000000000000000000000000000000000000_bytes32};
    expect.tx_error = INSUFFICIENT_FUNDS;
}
