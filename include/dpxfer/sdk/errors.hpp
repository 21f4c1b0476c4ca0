//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_ERRORS_HPP_INCLUDED
#define DPXFER_SDK_ERRORS_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace dpxfer
{
namespace sdk
{

/// Mount or unmount of a network share has failed (bad credentials, unreachable host, missing share, busy volume).
///
/// Never retried automatically - the caller decides whether to try again.
///
struct MountError final
{
    int         code;  // `errno`-like error code
    std::string message;
};

/// The payload has a shape the backend can't store, f.e. a bundle-style (directory) package.
///
struct UnsupportedPayloadError final
{
    std::string path;
    std::string message;
};

/// Upload, cloud or local file transfer has failed.
///
/// The `code` is `errno`-like; for HTTP level failures it is `EIO` and the `message` carries the details.
///
struct TransferError final
{
    int         code;
    std::string message;
};

using Error = cetl::variant<MountError, UnsupportedPayloadError, TransferError>;

/// Renders the error as a single line (f.e. "mount error: mount exited with status 32 (Input/output error)").
///
std::string describe(const Error& error);

}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_ERRORS_HPP_INCLUDED
