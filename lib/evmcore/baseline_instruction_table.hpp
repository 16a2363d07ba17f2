// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.h>
#include <array>
#include <cstdint>

namespace evmcore::baseline
{
/// Base gas costs of all opcodes in a revision. Negative cost marks an undefined opcode.
using CostTable = std::array<int16_t, 256>;

/// Returns the cost table of the revision. Unsupported revisions have all opcodes undefined.
const CostTable& get_baseline_cost_table(evmc_revision rev) noexcept;
}  // namespace evmcore::baseline
