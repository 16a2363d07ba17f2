// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "precompiles.hpp"
#include <array>
#include <cstring>
#include <new>

namespace evmcore::state
{
using evmc::bytes_view;

namespace
{
struct ExecutionResult
{
    evmc_status_code status_code;
    size_t output_size;
};

struct PrecompileAnalysis
{
    int64_t gas_cost;
    size_t max_output_size;
};

constexpr int64_t num_words(size_t size_in_bytes) noexcept
{
    return static_cast<int64_t>((size_in_bytes + 31) / 32);
}

template <int BaseCost, int WordCost>
constexpr int64_t cost_per_input_word(size_t input_size) noexcept
{
    return BaseCost + WordCost * num_words(input_size);
}

PrecompileAnalysis identity_analyze(bytes_view input, evmc_revision /*rev*/) noexcept
{
    return {cost_per_input_word<15, 3>(input.size()), input.size()};
}

ExecutionResult identity_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t /*output_size*/) noexcept
{
    if (input_size != 0)
        std::memcpy(output, input, input_size);
    return {EVMC_SUCCESS, input_size};
}

struct PrecompileTraits
{
    decltype(identity_analyze)* analyze = nullptr;
    decltype(identity_execute)* execute = nullptr;
};

/// The implemented precompiles, indexed by id. Empty entries have no implementation.
inline constexpr std::array<PrecompileTraits, NumPrecompiles> traits{{
    {},  // undefined for 0
    {},
    {},
    {},
    {identity_analyze, identity_execute},
}};
}  // namespace

bool PrecompileRegistry::is_precompile(evmc_revision rev, const evmc::address& addr) const noexcept
{
    static constexpr evmc::address address_boundary{static_cast<uint64_t>(PrecompileId::latest)};

    if (evmc::is_zero(addr) || addr > address_boundary)
        return false;

    const auto id = addr.bytes[19];
    if (rev < EVMC_CANCUN && id >= static_cast<uint8_t>(PrecompileId::since_cancun))
        return false;

    return true;
}

evmc::Result PrecompileRegistry::execute(evmc_revision rev, const evmc_message& msg) const noexcept
{
    const auto id = msg.code_address.bytes[19];
    const auto [analyze_fn, execute_fn] = traits[id];
    if (analyze_fn == nullptr)
        return evmc::Result{EVMC_PRECOMPILE_FAILURE};

    const bytes_view input{msg.input_data, msg.input_size};
    const auto [gas_cost, max_output_size] = analyze_fn(input, rev);
    const auto gas_left = msg.gas - gas_cost;
    if (gas_left < 0)
        return evmc::Result{EVMC_OUT_OF_GAS};

    // The output buffer ownership is passed to the evmc::Result.
    const auto output_data = new (std::nothrow) uint8_t[max_output_size];
    if (output_data == nullptr)
        return evmc::Result{EVMC_OUT_OF_MEMORY};

    const auto [status_code, output_size] =
        execute_fn(msg.input_data, msg.input_size, output_data, max_output_size);
    const evmc_result result{status_code, status_code == EVMC_SUCCESS ? gas_left : 0, 0,
        output_data, output_size,
        [](const evmc_result* res) noexcept { delete[] res->output_data; }};
    return evmc::Result{result};
}
}  // namespace evmcore::state
