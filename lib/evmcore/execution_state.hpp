// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "constants.hpp"
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <optional>

namespace evmcore
{
namespace baseline
{
class CodeAnalysis;
}

using evmc::bytes;
using evmc::bytes_view;
using intx::uint256;


/// Aligned storage for the items of one EVM stack.
class StackSpace
{
    struct Deleter
    {
        void operator()(void* p) const noexcept { std::free(p); }
    };

    /// Space for the maximum number of items, 32-byte aligned.
    std::unique_ptr<uint256, Deleter> m_items;

    static uint256* allocate() noexcept
    {
        const auto p = std::aligned_alloc(sizeof(uint256), limit * sizeof(uint256));
        if (p == nullptr) [[unlikely]]
            std::terminate();
        return static_cast<uint256*>(p);
    }

public:
    static constexpr auto limit = STACK_LIMIT;

    StackSpace() noexcept : m_items{allocate()} {}

    /// Returns the pointer just below the first stack item.
    [[nodiscard, clang::no_sanitize("bounds")]] uint256* bottom() noexcept
    {
        return m_items.get() - 1;
    }
};


/// The EVM memory of a single frame.
///
/// Zero-initialized, byte addressable, grows in multiples of 32 bytes and never shrinks.
/// The backing allocation starts at one page and doubles its capacity when needed.
class Memory
{
    static constexpr size_t initial_capacity = 4096;

    struct Free
    {
        void operator()(void* ptr) const noexcept { std::free(ptr); }
    };

    std::unique_ptr<uint8_t[], Free> m_buffer;
    size_t m_capacity = 0;

    /// The EVM visible size.
    size_t m_size = 0;

    void reserve(size_t capacity) noexcept
    {
        auto* const grown = std::realloc(m_buffer.get(), capacity);
        if (grown == nullptr) [[unlikely]]
            std::terminate();
        static_cast<void>(m_buffer.release());
        m_buffer.reset(static_cast<uint8_t*>(grown));
        m_capacity = capacity;
    }

public:
    Memory() noexcept { reserve(initial_capacity); }

    uint8_t& operator[](size_t index) noexcept { return m_buffer[index]; }

    [[nodiscard]] const uint8_t* data() const noexcept { return m_buffer.get(); }

    [[nodiscard]] size_t size() const noexcept { return m_size; }

    /// Grows the memory to @p new_size bytes, zero-filling the new extent.
    ///
    /// @param new_size  The new size, a multiple of 32 larger than the current size.
    void grow(size_t new_size) noexcept
    {
        INTX_REQUIRE(new_size > m_size && new_size % 32 == 0);

        if (new_size > m_capacity)
        {
            auto capacity = m_capacity * 2;
            while (capacity < new_size)
                capacity *= 2;
            reserve(capacity);
        }
        std::fill(m_buffer.get() + m_size, m_buffer.get() + new_size, uint8_t{0});
        m_size = new_size;
    }

    /// Makes the memory empty again. The allocation is kept for the next frame.
    void clear() noexcept { m_size = 0; }
};


/// The state of a single call frame shared by all instruction implementations.
class ExecutionState
{
public:
    /// The refund counter of the frame. May go negative; only the transaction total is capped.
    int64_t gas_refund = 0;
    Memory memory;
    const evmc_message* msg = nullptr;
    evmc::HostContext host;
    evmc_revision rev = {};

    /// The output of the most recent sub-call.
    bytes return_data;

    /// The code being executed.
    bytes_view original_code;

    evmc_status_code status = EVMC_SUCCESS;
    size_t output_offset = 0;
    size_t output_size = 0;

    /// Halts CREATE/CREATE2 executing init code equal to the frame's own code.
    bool recursive_create_guard = true;

    const baseline::CodeAnalysis* analysis = nullptr;

private:
    std::optional<evmc_tx_context> m_tx;

public:
    /// The stack. Kept last so the other fields have small offsets.
    StackSpace stack_space;

    ExecutionState() noexcept = default;

    ExecutionState(const evmc_message& message, evmc_revision revision,
        const evmc_host_interface& host_interface, evmc_host_context* host_ctx,
        bytes_view code) noexcept
      : msg{&message}, host{host_interface, host_ctx}, rev{revision}, original_code{code}
    {}

    /// Prepares the state for executing another message.
    void reset(const evmc_message& message, evmc_revision revision,
        const evmc_host_interface& host_interface, evmc_host_context* host_ctx,
        bytes_view code) noexcept
    {
        gas_refund = 0;
        memory.clear();
        msg = &message;
        host = {host_interface, host_ctx};
        rev = revision;
        return_data.clear();
        original_code = code;
        status = EVMC_SUCCESS;
        output_offset = 0;
        output_size = 0;
        recursive_create_guard = true;
        analysis = nullptr;
        m_tx.reset();
    }

    [[nodiscard]] bool in_static_mode() const noexcept { return (msg->flags & EVMC_STATIC) != 0; }

    /// Returns the transaction and block context, fetched from the host on first use.
    const evmc_tx_context& get_tx_context() noexcept
    {
        if (!m_tx.has_value())
            m_tx = host.get_tx_context();
        return *m_tx;
    }
};
}  // namespace evmcore
