// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0

#include "baseline.hpp"
#include "baseline_instruction_table.hpp"
#include "execution_state.hpp"
#include "instructions.hpp"
#include "vm.hpp"

#ifdef NDEBUG
#define hot_inline gnu::always_inline
#else
#define hot_inline
#endif

#if defined(__GNUC__)
#define EVMCORE_ASM_COMMENT(COMMENT) asm("# " #COMMENT)  // NOLINT(hicpp-no-assembler)
#else
#define EVMCORE_ASM_COMMENT(COMMENT)
#endif

namespace evmcore::baseline
{
namespace
{
/// Checks if the opcode has the same base cost in all supported revisions
/// and is defined in all of them.
consteval bool has_const_gas_cost(Opcode op) noexcept
{
    const auto g = instr::gas_costs[instr::min_supported_revision][op];
    for (auto r = int{instr::min_supported_revision}; r <= instr::max_supported_revision; ++r)
    {
        if (instr::gas_costs[static_cast<size_t>(r)][op] != g)
            return false;
    }
    return g != instr::undefined;
}

/// Validates that the instruction Op may run and charges its base cost.
///
/// The checks go from the cheapest to the most expensive failure:
/// undefined opcode, stack overflow, stack underflow, out of gas.
template <Opcode Op>
inline evmc_status_code check_preconditions(const CostTable& costs, int64_t& gas,
    const uint256* sp, const uint256* stack_base) noexcept
{
    constexpr auto& tr = instr::traits[Op];

    auto base_cost = instr::gas_costs[instr::min_supported_revision][Op];
    if constexpr (!has_const_gas_cost(Op))
    {
        base_cost = costs[Op];
        if (INTX_UNLIKELY(base_cost == instr::undefined))
            return EVMC_UNDEFINED_INSTRUCTION;
    }

    if constexpr (tr.stack_height_change > 0)
    {
        static_assert(tr.stack_height_change == 1, "instructions push at most one item");
        if (INTX_UNLIKELY(sp - stack_base == StackSpace::limit))
            return EVMC_STACK_OVERFLOW;
    }
    if constexpr (tr.stack_height_required > 0)
    {
        if (INTX_UNLIKELY(sp - stack_base < tr.stack_height_required))
            return EVMC_STACK_UNDERFLOW;
    }

    gas -= base_cost;
    return INTX_UNLIKELY(gas < 0) ? EVMC_OUT_OF_GAS : EVMC_SUCCESS;
}

/// Where the interpreter is: the next instruction and the stack top.
/// A null ip means the frame has ended and state.status tells how.
struct Cursor
{
    code_ptr ip;
    uint256* sp;
};

/// Adapters from the instruction signatures to the common "next ip" form.
/// @{
[[hot_inline]] inline code_ptr run(void (*fn)(StackRef) noexcept, Cursor cur,
    int64_t& /*gas*/, ExecutionState& /*state*/) noexcept
{
    fn(cur.sp);
    return cur.ip + 1;
}

[[hot_inline]] inline code_ptr run(void (*fn)(StackRef, ExecutionState&) noexcept,
    Cursor cur, int64_t& /*gas*/, ExecutionState& state) noexcept
{
    fn(cur.sp, state);
    return cur.ip + 1;
}

[[hot_inline]] inline code_ptr run(code_ptr (*fn)(StackRef, ExecutionState&, code_ptr) noexcept,
    Cursor cur, int64_t& /*gas*/, ExecutionState& state) noexcept
{
    return fn(cur.sp, state, cur.ip);
}

[[hot_inline]] inline code_ptr run(Result (*fn)(StackRef, int64_t, ExecutionState&) noexcept,
    Cursor cur, int64_t& gas, ExecutionState& state) noexcept
{
    const auto [status, gas_after] = fn(cur.sp, gas, state);
    gas = gas_after;
    if (status == EVMC_SUCCESS)
        return cur.ip + 1;
    state.status = status;
    return nullptr;
}

[[hot_inline]] inline code_ptr run(HaltResult (*fn)(StackRef, int64_t, ExecutionState&) noexcept,
    Cursor cur, int64_t& gas, ExecutionState& state) noexcept
{
    const auto [status, gas_after] = fn(cur.sp, gas, state);
    gas = gas_after;
    state.status = status;
    return nullptr;
}
/// @}

/// Executes a single instruction Op at the cursor.
template <Opcode Op>
[[hot_inline]] inline Cursor step(const CostTable& costs, const uint256* stack_base, Cursor cur,
    int64_t& gas, ExecutionState& state) noexcept
{
    if (const auto status = check_preconditions<Op>(costs, gas, cur.sp, stack_base);
        status != EVMC_SUCCESS)
    {
        state.status = status;
        return {nullptr, cur.sp};
    }
    const auto next_ip = run(instr::core::impl<Op>, cur, gas, state);
    return {next_ip, cur.sp + instr::traits[Op].stack_height_change};
}

/// Runs one instruction and leaves the dispatch loop if the frame has ended.
#define EVMCORE_STEP(OPCODE)                                      \
    EVMCORE_ASM_COMMENT(OPCODE);                                  \
    cursor = step<OPCODE>(costs, stack_base, cursor, gas, state); \
    if (cursor.ip == nullptr)                                     \
        return gas;

template <bool TracingEnabled>
int64_t dispatch(const CostTable& costs, ExecutionState& state, int64_t gas, const uint8_t* code,
    Tracer* tracer = nullptr) noexcept
{
    const auto stack_base = state.stack_space.bottom();
    Cursor cursor{code, stack_base};

    // The loop ends at the latest at the STOP of the code padding.
    for (;;)
    {
        if constexpr (TracingEnabled)
        {
            // The padding is not a part of the code.
            if (const auto pc = static_cast<uint32_t>(cursor.ip - code);
                pc < state.original_code.size())
            {
                tracer->notify_instruction_start(
                    pc, cursor.sp, static_cast<int>(cursor.sp - stack_base), gas, state);
            }
        }

        switch (*cursor.ip)
        {
#define EVMCORE_CASE(OPCODE, _) \
    case OPCODE:                \
        EVMCORE_STEP(OPCODE)    \
        break;
            EVMCORE_FOR_EACH_OPCODE(EVMCORE_CASE, EVMCORE_OPCODE_IGNORED)
#undef EVMCORE_CASE
        default:
            state.status = EVMC_UNDEFINED_INSTRUCTION;
            return gas;
        }
    }
}

#if EVMCORE_CGOTO_SUPPORTED
int64_t dispatch_cgoto(
    const CostTable& costs, ExecutionState& state, int64_t gas, const uint8_t* code) noexcept
{
#pragma GCC diagnostic ignored "-Wpedantic"

    static constexpr void* labels[] = {
#define EVMCORE_TARGET(OPCODE, _) &&TARGET_##OPCODE,
#define EVMCORE_UNDEFINED_TARGET(_) &&TARGET_UNDEFINED,
        EVMCORE_FOR_EACH_OPCODE(EVMCORE_TARGET, EVMCORE_UNDEFINED_TARGET)
#undef EVMCORE_TARGET
#undef EVMCORE_UNDEFINED_TARGET
    };
    static_assert(std::size(labels) == 256);

    const auto stack_base = state.stack_space.bottom();
    Cursor cursor{code, stack_base};
    goto* labels[*cursor.ip];

#define EVMCORE_LABEL(OPCODE, _) \
    TARGET_##OPCODE:             \
    EVMCORE_STEP(OPCODE)         \
    goto* labels[*cursor.ip];
    EVMCORE_FOR_EACH_OPCODE(EVMCORE_LABEL, EVMCORE_OPCODE_IGNORED)
#undef EVMCORE_LABEL

TARGET_UNDEFINED:
    state.status = EVMC_UNDEFINED_INSTRUCTION;
    return gas;
}
#endif

#undef EVMCORE_STEP
}  // namespace

evmc_result execute(VM& vm, const evmc_host_interface& host, evmc_host_context* ctx,
    evmc_revision rev, const evmc_message& msg, const CodeAnalysis& analysis) noexcept
{
    if (!instr::is_supported(rev))
        return evmc::make_result(EVMC_REJECTED, 0, 0, nullptr, 0);

    const auto code = analysis.executable_code();
    auto gas = msg.gas;

    auto& state = vm.get_execution_state(static_cast<size_t>(msg.depth));
    state.reset(msg, rev, host, ctx, analysis.raw_code());

    // Instruction implementations reach the analysis and the options through the state.
    state.analysis = &analysis;
    state.recursive_create_guard = vm.recursive_create_guard;

    const auto& costs = get_baseline_cost_table(state.rev);

    auto* tracer = vm.get_tracer();
    if (INTX_UNLIKELY(tracer != nullptr))
    {
        tracer->notify_execution_start(state.rev, *state.msg, analysis.raw_code());
        gas = dispatch<true>(costs, state, gas, code, tracer);
    }
    else
    {
#if EVMCORE_CGOTO_SUPPORTED
        if (vm.cgoto)
            gas = dispatch_cgoto(costs, state, gas, code);
        else
#endif
            gas = dispatch<false>(costs, state, gas, code);
    }

    // Only a successful frame keeps the refund. Reverted frames return the unused gas.
    const auto gas_left = (state.status == EVMC_SUCCESS || state.status == EVMC_REVERT) ? gas : 0;
    const auto gas_refund = (state.status == EVMC_SUCCESS) ? state.gas_refund : 0;

    const auto result = evmc::make_result(state.status, gas_left, gas_refund,
        state.output_size != 0 ? &state.memory[state.output_offset] : nullptr, state.output_size);

    if (INTX_UNLIKELY(tracer != nullptr))
        tracer->notify_execution_end(result);

    return result;
}

evmc_result execute(evmc_vm* c_vm, const evmc_host_interface* host, evmc_host_context* ctx,
    evmc_revision rev, const evmc_message* msg, const uint8_t* code, size_t code_size) noexcept
{
    if (!instr::is_supported(rev))
        return evmc::make_result(EVMC_REJECTED, 0, 0, nullptr, 0);

    auto vm = static_cast<VM*>(c_vm);
    const auto code_analysis = analyze({code, code_size});
    return execute(*vm, *host, ctx, rev, *msg, code_analysis);
}
}  // namespace evmcore::baseline
