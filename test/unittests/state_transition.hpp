// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmcore/evmcore.h>
#include <evmcore_state/host.hpp>
#include <evmcore_state/precompiles.hpp>
#include <evmcore_state/state.hpp>
#include <gtest/gtest.h>
#include <test/utils/test_state.hpp>
#include <test/utils/utils.hpp>

namespace evmcore::test
{
using namespace evmc::literals;
using namespace evmcore::state;

/// Fixture to define test cases in the form similar to JSON State Tests.
///
/// It takes the "pre" state and produces the "post" state by executing the "tx" transaction
/// and applying the resulting state diff. Then the expectations declared in "expect"
/// are checked against the execution outcome and the "post" state.
class state_transition : public testing::Test
{
protected:
    /// The default sender address of the test transaction.
    static constexpr auto Sender = 0x5e4de2a97f0cb1d3e1a6f70c9d8b4e21a7c3f0d9_address;

    /// The default destination address of the test transaction.
    static constexpr auto To = 0xc0ffee_address;

    static constexpr auto Coinbase = 0xc0ba5e_address;

    static inline evmc::VM vm{evmc_create_evmcore()};
    static inline evmc::VM tracing_vm{evmc_create_evmcore(), {{"trace", "1"}}};

    struct ExpectedAccount
    {
        bool exists = true;
        std::optional<uint64_t> nonce;
        std::optional<intx::uint256> balance;
        std::optional<bytes> code;
        std::unordered_map<bytes32, bytes32> storage;
    };

    struct Expectation
    {
        /// The transaction is invalid because of the given error.
        /// The rest of Expectation is ignored if the error is expected.
        ErrorCode tx_error = SUCCESS;

        /// The expected EVM status code of the transaction execution.
        evmc_status_code status = EVMC_SUCCESS;

        /// The expected amount of gas used by the transaction.
        std::optional<int64_t> gas_used;

        std::optional<SuccessReason> success_reason;
        std::optional<HaltReason> halt_reason;

        /// The expected output of the successful or reverted transaction.
        std::optional<bytes> output;

        /// The expected number of logs of the successful transaction.
        std::optional<size_t> num_logs;

        /// The expected post-execution state.
        std::unordered_map<address, ExpectedAccount> post;

        /// The expected EVM execution trace. If not empty transaction execution will be performed
        /// with tracing enabled and the output compared.
        std::string_view trace;
    };


    evmc_revision rev = EVMC_CANCUN;
    BlockInfo block{
        .number = 1,
        .gas_limit = 1'000'000,
        .coinbase = Coinbase,
        .base_fee = 999,
    };
    TestBlockHashes block_hashes;
    Transaction tx{
        .type = Transaction::Type::eip1559,
        .gas_limit = block.gas_limit,
        .max_gas_price = block.base_fee + 1,
        .max_priority_gas_price = block.base_fee + 1,
        .sender = Sender,
        .nonce = 1,
    };
    TestState pre;
    PrecompileRegistry precompiles;
    Expectation expect;

    void SetUp() override;

    /// Executes the transaction and checks the expectations.
    void TearDown() override;

private:
    void check_outcome(const ExecutionOutcome& outcome);
    void check_post(const TestState& post);
};
}  // namespace evmcore::test
