// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "execution_state.hpp"
#include "tracing.hpp"
#include <evmc/evmc.h>

#include <vector>

#if defined(_MSC_VER) && !defined(__clang__)
#define EVMCORE_CGOTO_SUPPORTED 0
#else
#define EVMCORE_CGOTO_SUPPORTED 1
#endif

namespace evmcore
{
/// The evmcore engine behind the evmc_vm handle: the options set by evmc_set_option(),
/// the per-depth execution states reused across calls, and the tracer chain.
class VM : public evmc_vm
{
public:
    /// Dispatch with the computed-goto table instead of the switch loop.
    bool cgoto = EVMCORE_CGOTO_SUPPORTED;

    /// Halt CREATE and CREATE2 deploying the init code equal to the executing code.
    bool recursive_create_guard = true;

private:
    std::vector<ExecutionState> m_execution_states;
    std::unique_ptr<Tracer> m_first_tracer;

public:
    VM() noexcept;

    /// The execution state reused by every frame at the call depth.
    [[nodiscard]] ExecutionState& get_execution_state(size_t depth) noexcept;

    /// Appends the tracer to the chain. Tracers are notified in the order they are added.
    void add_tracer(std::unique_ptr<Tracer> tracer) noexcept
    {
        auto* slot = &m_first_tracer;
        while (*slot != nullptr)
            slot = &(*slot)->m_next_tracer;
        *slot = std::move(tracer);
    }

    [[nodiscard]] Tracer* get_tracer() const noexcept { return m_first_tracer.get(); }
};
}  // namespace evmcore
