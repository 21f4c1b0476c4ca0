//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <dpxfer/sdk/errors.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstring>
#include <string>

namespace dpxfer
{
namespace sdk
{
namespace
{

struct Describer final
{
    std::string operator()(const MountError& error) const
    {
        return fmt::format("mount error: {} ({})", error.message, std::strerror(error.code));
    }

    std::string operator()(const UnsupportedPayloadError& error) const
    {
        return fmt::format("unsupported payload '{}': {}", error.path, error.message);
    }

    std::string operator()(const TransferError& error) const
    {
        return fmt::format("transfer error: {} ({})", error.message, std::strerror(error.code));
    }

};  // Describer

}  // namespace

std::string describe(const Error& error)
{
    return cetl::visit(Describer{}, error);
}

}  // namespace sdk
}  // namespace dpxfer
