//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_HTTP_CURL_CLI_TRANSPORT_HPP_INCLUDED
#define DPXFER_SDK_HTTP_CURL_CLI_TRANSPORT_HPP_INCLUDED

#include "http_transport.hpp"

#include <cetl/cetl.hpp>

#include <string>
#include <vector>

namespace dpxfer
{
namespace sdk
{
namespace http
{

/// Executes requests with the system `curl` binary, as a subprocess.
///
/// The system binary is linked against the platform TLS stack, so it gets through where the in-process one is
/// rejected by the server.
///
class CurlCliTransport
{
public:
    CETL_NODISCARD static HttpTransport::Ptr make(std::string curl_program = "curl");

    /// Command line arguments (without the program itself) for the request.
    ///
    static std::vector<std::string> buildArguments(const HttpRequest& request);

    /// Text fed to `curl --config -`; keeps credentials out of the process list.
    ///
    static std::string buildStdinConfig(const HttpRequest& request);

    /// Human readable description of a `curl` exit code.
    ///
    static std::string describeExitCode(const int exit_code);

};  // CurlCliTransport

}  // namespace http
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_HTTP_CURL_CLI_TRANSPORT_HPP_INCLUDED
