// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "instructions.hpp"

namespace evmcore::instr::core
{
namespace
{
/// The EIP-2200 parameters under EIP-2929 and EIP-3529 (London onwards).
constexpr int16_t warm_access = instr::warm_storage_read_cost;
constexpr int16_t set_cost = 20000;
constexpr int16_t reset_cost = 5000 - instr::cold_sload_cost;
constexpr int16_t clear_refund = 4800;

/// EIP-2200: SSTORE fails if the gas left is not above the call stipend.
constexpr int64_t sstore_sentry_gas = 2300;

struct StorageStoreCost
{
    int16_t gas_cost;
    int16_t gas_refund;
};

/// The SSTORE cost and refund by the storage status reported by the host.
constexpr auto sstore_costs = []() noexcept {
    std::array<StorageStoreCost, EVMC_STORAGE_MODIFIED_RESTORED + 1> tbl{};
    // X → X
    tbl[EVMC_STORAGE_ASSIGNED] = {warm_access, 0};
    // 0 → 0 → Z
    tbl[EVMC_STORAGE_ADDED] = {set_cost, 0};
    // X → X → 0
    tbl[EVMC_STORAGE_DELETED] = {reset_cost, clear_refund};
    // X → X → Z
    tbl[EVMC_STORAGE_MODIFIED] = {reset_cost, 0};
    // X → 0 → Z
    tbl[EVMC_STORAGE_DELETED_ADDED] = {warm_access, -clear_refund};
    // X → Y → 0
    tbl[EVMC_STORAGE_MODIFIED_DELETED] = {warm_access, clear_refund};
    // X → 0 → X
    tbl[EVMC_STORAGE_DELETED_RESTORED] = {warm_access, reset_cost - warm_access - clear_refund};
    // 0 → Y → 0
    tbl[EVMC_STORAGE_ADDED_DELETED] = {warm_access, set_cost - warm_access};
    // X → Y → X
    tbl[EVMC_STORAGE_MODIFIED_RESTORED] = {warm_access, reset_cost - warm_access};
    return tbl;
}();

static_assert(sstore_costs[EVMC_STORAGE_DELETED_RESTORED].gas_refund == -2000);
static_assert(sstore_costs[EVMC_STORAGE_ADDED_DELETED].gas_refund == 19900);
static_assert(sstore_costs[EVMC_STORAGE_MODIFIED_RESTORED].gas_refund == 2800);
}  // namespace

Result sload(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    const auto key = intx::be::store<evmc::bytes32>(x);

    if (state.host.access_storage(state.msg->recipient, key) == EVMC_ACCESS_COLD)
    {
        // The warm cost has been charged as the base cost.
        constexpr auto additional_cold_sload_cost =
            instr::cold_sload_cost - instr::warm_storage_read_cost;
        if ((gas_avail -= additional_cold_sload_cost) < 0)
            return {EVMC_OUT_OF_GAS, gas_avail};
    }

    x = intx::be::load<uint256>(state.host.get_storage(state.msg->recipient, key));
    return {EVMC_SUCCESS, gas_avail};
}

Result sstore(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    if (state.in_static_mode())
        return {EVMC_STATIC_MODE_VIOLATION, gas_avail};

    if (gas_avail <= sstore_sentry_gas)
        return {EVMC_OUT_OF_GAS, gas_avail};

    const auto key = intx::be::store<evmc::bytes32>(stack.pop());
    const auto value = intx::be::store<evmc::bytes32>(stack.pop());

    const auto cold_cost =
        state.host.access_storage(state.msg->recipient, key) == EVMC_ACCESS_COLD ?
            instr::cold_sload_cost :
            0;
    const auto status = state.host.set_storage(state.msg->recipient, key, value);

    const auto [warm_cost, gas_refund] = sstore_costs[status];
    if ((gas_avail -= warm_cost + cold_cost) < 0)
        return {EVMC_OUT_OF_GAS, gas_avail};
    state.gas_refund += gas_refund;
    return {EVMC_SUCCESS, gas_avail};
}

/// TLOAD (EIP-1153). Transient storage has no warm/cold distinction.
Result tload(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    auto& x = stack.top();
    const auto key = intx::be::store<evmc::bytes32>(x);
    x = intx::be::load<uint256>(state.host.get_transient_storage(state.msg->recipient, key));
    return {EVMC_SUCCESS, gas_avail};
}

Result tstore(StackRef stack, int64_t gas_avail, ExecutionState& state) noexcept
{
    if (state.in_static_mode())
        return {EVMC_STATIC_MODE_VIOLATION, gas_avail};

    const auto key = intx::be::store<evmc::bytes32>(stack.pop());
    const auto value = intx::be::store<evmc::bytes32>(stack.pop());
    state.host.set_transient_storage(state.msg->recipient, key, value);
    return {EVMC_SUCCESS, gas_avail};
}
}  // namespace evmcore::instr::core
