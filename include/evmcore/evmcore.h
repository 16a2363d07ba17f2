// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#ifndef EVMCORE_H
#define EVMCORE_H

#include <evmc/evmc.h>
#include <evmc/utils.h>

#if __cplusplus
extern "C" {
#endif

/// Creates the evmcore VM instance. Destroy it with evmc_vm::destroy().
EVMC_EXPORT struct evmc_vm* evmc_create_evmcore(void) EVMC_NOEXCEPT;

#if __cplusplus
}
#endif

#endif  // EVMCORE_H
