// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "baseline_instruction_table.hpp"
#include "instructions_traits.hpp"

namespace evmcore::baseline
{
namespace
{
consteval auto build_cost_tables() noexcept
{
    std::array<CostTable, EVMC_MAX_REVISION + 1> tables{};
    for (size_t r = 0; r <= EVMC_MAX_REVISION; ++r)
    {
        for (size_t op = 0; op < tables[r].size(); ++op)
        {
            const auto since = instr::traits[op].since;
            const auto defined = since.has_value() && r >= static_cast<size_t>(*since) &&
                                 instr::is_supported(static_cast<evmc_revision>(r));
            tables[r][op] = defined ? instr::gas_costs[r][op] : instr::undefined;
        }
    }
    return tables;
}

constexpr auto COST_TABLES = build_cost_tables();

static_assert(COST_TABLES[EVMC_LONDON][OP_PUSH0] == instr::undefined);
static_assert(COST_TABLES[EVMC_SHANGHAI][OP_PUSH0] == 2);
static_assert(COST_TABLES[EVMC_SHANGHAI][OP_TLOAD] == instr::undefined);
static_assert(COST_TABLES[EVMC_CANCUN][OP_MCOPY] == 3);
}  // namespace

const CostTable& get_baseline_cost_table(evmc_revision rev) noexcept
{
    return COST_TABLES[rev];
}
}  // namespace evmcore::baseline
