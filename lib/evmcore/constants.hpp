// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>

namespace evmcore
{
/// The maximum call depth (the depth of the outermost frame is 0).
constexpr auto CALL_DEPTH_LIMIT = 1024;

/// The maximum number of items on the EVM stack.
constexpr auto STACK_LIMIT = 1024;

/// The size limit of deployed contract code
/// defined by [EIP-170](https://eips.ethereum.org/EIPS/eip-170)
constexpr auto MAX_CODE_SIZE = 0x6000;

/// The size limit of init code for contract creation
/// defined by [EIP-3860](https://eips.ethereum.org/EIPS/eip-3860)
constexpr auto MAX_INITCODE_SIZE = 2 * MAX_CODE_SIZE;

/// The gas charged per byte of the deployed contract code.
constexpr int64_t CODE_DEPOSIT_COST = 200;

/// The gas granted to the callee on top of the forwarded gas when value is transferred.
constexpr int64_t CALL_STIPEND = 2300;

/// The divisor of the gas left that is withheld from a sub-call (EIP-150 "all but one 64th").
constexpr int64_t CALL_GAS_RETAINED_DIVISOR = 64;

/// The EIP-3529 cap divisor: the refund is at most gas_used / 5.
constexpr int64_t REFUND_QUOTIENT = 5;
}  // namespace evmcore
