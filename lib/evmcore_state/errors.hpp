// evmcore: Ethereum Virtual Machine execution engine
// Copyright 2026 The evmcore Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace evmcore::state
{
/// The reasons a transaction is rejected before execution.
enum ErrorCode : int
{
    SUCCESS = 0,
    REVISION_NOT_SUPPORTED,
    TX_TYPE_NOT_SUPPORTED,
    INTRINSIC_GAS_TOO_LOW,
    INSUFFICIENT_FUNDS,
    NONCE_HAS_MAX_VALUE,
    NONCE_TOO_HIGH,
    NONCE_TOO_LOW,
    TIP_GT_FEE_CAP,
    FEE_CAP_LESS_THAN_BLOCKS,
    BLOB_FEE_CAP_LESS_THAN_BLOCKS,
    GAS_LIMIT_REACHED,
    SENDER_NOT_EOA,
    INIT_CODE_SIZE_LIMIT_EXCEEDED,
    CREATE_BLOB_TX,
    EMPTY_BLOB_HASHES_LIST,
    INVALID_BLOB_HASH_VERSION,
    BLOB_GAS_LIMIT_EXCEEDED,
    UNKNOWN_ERROR,
};

namespace detail
{
/// The messages of the error codes, indexed by the code value.
inline constexpr std::string_view error_messages[] = {
    "",
    "revision not supported",
    "transaction type not supported",
    "intrinsic gas too low",
    "insufficient funds for gas * price + value",
    "nonce has max value",
    "nonce too high",
    "nonce too low",
    "max priority fee per gas higher than max fee per gas",
    "max fee per gas less than block base fee",
    "max blob fee per gas less than block base fee",
    "gas limit reached",
    "sender not an eoa",
    "max initcode size exceeded",
    "blob transaction must not be a create transaction",
    "empty blob hashes list",
    "invalid blob hash version",
    "blob gas limit exceeded",
    "unknown error",
};
static_assert(std::size(error_messages) == UNKNOWN_ERROR + 1);

class ErrorCategory final : public std::error_category
{
public:
    [[nodiscard]] const char* name() const noexcept override { return "evmcore"; }

    [[nodiscard]] std::string message(int ev) const override
    {
        if (ev < 0 || ev > UNKNOWN_ERROR)
            ev = UNKNOWN_ERROR;
        return std::string{error_messages[ev]};
    }
};
}  // namespace detail

/// The category of the transaction validation errors.
inline const std::error_category& evmcore_category() noexcept
{
    static const detail::ErrorCategory category;
    return category;
}

inline std::error_code make_error_code(ErrorCode errc) noexcept
{
    return {errc, evmcore_category()};
}
}  // namespace evmcore::state
