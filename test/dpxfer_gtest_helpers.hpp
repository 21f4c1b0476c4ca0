//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_GTEST_HELPERS_HPP_INCLUDED
#define DPXFER_GTEST_HELPERS_HPP_INCLUDED

#include <dpxfer/sdk/errors.hpp>
#include <dpxfer/sdk/repository.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <ostream>
#include <string>

// MARK: - GTest Printers:

namespace dpxfer
{
namespace sdk
{

inline void PrintTo(const Existence existence, std::ostream* os)  // NOLINT(readability-identifier-naming)
{
    *os << toString(existence);
}

inline void PrintTo(const Category category, std::ostream* os)  // NOLINT(readability-identifier-naming)
{
    *os << toString(category);
}

inline void PrintTo(const MountError& error, std::ostream* os)  // NOLINT(readability-identifier-naming)
{
    *os << describe(Error{error});
}

inline void PrintTo(const UnsupportedPayloadError& error, std::ostream* os)  // NOLINT(readability-identifier-naming)
{
    *os << describe(Error{error});
}

inline void PrintTo(const TransferError& error, std::ostream* os)  // NOLINT(readability-identifier-naming)
{
    *os << describe(Error{error});
}

}  // namespace sdk
}  // namespace dpxfer

// MARK: - GTest Matchers:

namespace dpxfer
{

/// Matches an `sdk::Error` which holds an `sdk::TransferError` with the given code.
///
MATCHER_P(IsTransferError, code, "")
{
    const auto* const error = cetl::get_if<sdk::TransferError>(&arg);
    if (error == nullptr)
    {
        *result_listener << "which is " << sdk::describe(arg);
        return false;
    }
    *result_listener << "which has code " << error->code;
    return error->code == code;
}

/// Matches an `sdk::Error` which holds an `sdk::MountError` with the given code.
///
MATCHER_P(IsMountError, code, "")
{
    const auto* const error = cetl::get_if<sdk::MountError>(&arg);
    if (error == nullptr)
    {
        *result_listener << "which is " << sdk::describe(arg);
        return false;
    }
    *result_listener << "which has code " << error->code;
    return error->code == code;
}

MATCHER(IsUnsupportedPayload, "")
{
    return cetl::holds_alternative<sdk::UnsupportedPayloadError>(arg);
}

}  // namespace dpxfer

#endif  // DPXFER_GTEST_HELPERS_HPP_INCLUDED
