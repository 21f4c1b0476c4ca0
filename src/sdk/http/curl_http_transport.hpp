//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_HTTP_CURL_HTTP_TRANSPORT_HPP_INCLUDED
#define DPXFER_SDK_HTTP_CURL_HTTP_TRANSPORT_HPP_INCLUDED

#include "http_transport.hpp"

#include <cetl/cetl.hpp>

namespace dpxfer
{
namespace sdk
{
namespace http
{

/// In-process transport on top of the libcurl "easy" interface.
///
class CurlHttpTransport
{
public:
    CETL_NODISCARD static HttpTransport::Ptr make();

    /// libcurl result codes which point at the TLS stack (rather than the network) as the culprit.
    ///
    static bool isTlsStackFailure(const int curl_code) noexcept;

};  // CurlHttpTransport

}  // namespace http
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_HTTP_CURL_HTTP_TRANSPORT_HPP_INCLUDED
