// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

/// @file
/// The evmcore VM: the EVMC vtable, the VM options and the evmc_create_evmcore() factory.

#include "vm.hpp"
#include "baseline.hpp"
#include <evmcore/evmcore.h>
#include <cassert>
#include <iostream>
#include <optional>
#include <string_view>

namespace evmcore
{
namespace
{
void destroy(evmc_vm* c_vm) noexcept
{
    assert(c_vm != nullptr);
    delete static_cast<VM*>(c_vm);
}

/// Only EVM1 bytecode is executed. Precompiles are the host's business.
constexpr evmc_capabilities_flagset get_capabilities(evmc_vm* /*c_vm*/) noexcept
{
    return EVMC_CAPABILITY_EVM1;
}

/// Parses the yes/no option value. The empty value means yes.
std::optional<bool> parse_flag(std::string_view value) noexcept
{
    if (value.empty() || value == "yes")
        return true;
    if (value == "no")
        return false;
    return std::nullopt;
}

evmc_set_option_result set_option(evmc_vm* c_vm, char const* c_name, char const* c_value) noexcept
{
    auto& vm = *static_cast<VM*>(c_vm);
    const std::string_view name{c_name != nullptr ? c_name : ""};
    const std::string_view value{c_value != nullptr ? c_value : ""};

    if (name == "trace" || name == "histogram")
    {
        // Each tracer writes to the log stream and joins the end of the chain.
        vm.add_tracer(name == "trace" ? create_instruction_tracer(std::clog) :
                                        create_histogram_tracer(std::clog));
        return EVMC_SET_OPTION_SUCCESS;
    }

    if (name == "recursive-create-guard")
    {
        const auto enabled = parse_flag(value);
        if (!enabled)
            return EVMC_SET_OPTION_INVALID_VALUE;
        vm.recursive_create_guard = *enabled;
        return EVMC_SET_OPTION_SUCCESS;
    }

#if EVMCORE_CGOTO_SUPPORTED
    // Computed goto is the default; the only accepted value switches to the switch loop.
    if (name == "cgoto")
    {
        if (value != "no")
            return EVMC_SET_OPTION_INVALID_VALUE;
        vm.cgoto = false;
        return EVMC_SET_OPTION_SUCCESS;
    }
#endif

    return EVMC_SET_OPTION_INVALID_NAME;
}
}  // namespace


VM::VM() noexcept
  : evmc_vm{
        EVMC_ABI_VERSION,
        "evmcore",
        EVMCORE_VERSION,
        evmcore::destroy,
        evmcore::baseline::execute,
        evmcore::get_capabilities,
        evmcore::set_option,
    }
{
    m_execution_states.reserve(CALL_DEPTH_LIMIT + 1);
}

ExecutionState& VM::get_execution_state(size_t depth) noexcept
{
    // Reserved up front for the depth limit, so references stay valid while nested frames
    // grow the vector. A state is only built when a frame first reaches its depth.
    assert(depth < m_execution_states.capacity());
    while (m_execution_states.size() <= depth)
        m_execution_states.emplace_back();
    return m_execution_states[depth];
}
}  // namespace evmcore

extern "C" {
EVMC_EXPORT evmc_vm* evmc_create_evmcore() noexcept
{
    return new evmcore::VM{};
}
}
