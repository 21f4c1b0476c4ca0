//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_CLOUD_AWS_SIGV4_HPP_INCLUDED
#define DPXFER_SDK_CLOUD_AWS_SIGV4_HPP_INCLUDED

#include "http/http_transport.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <string>

namespace dpxfer
{
namespace sdk
{
namespace cloud
{

struct AwsCredentials final
{
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;  // empty if not a temporary credential
};

/// Request parts which take part in the signature.
///
struct CanonicalRequest final
{
    std::string   method;
    std::string   host;
    std::string   uri;    // already URI-encoded path, f.e. "/Packages/Firefox%20128.pkg"
    std::string   query;  // already canonical query string, usually empty
    http::Headers headers;
    std::string   payload_hash;  // hex SHA-256 of the body, or "UNSIGNED-PAYLOAD"
};

/// AWS Signature Version 4 signer (HMAC-SHA256 over the canonical request).
///
class AwsSigV4 final
{
public:
    struct Sign final
    {
        /// Headers to add to the request: `x-amz-date`, `x-amz-content-sha256`,
        /// optional `x-amz-security-token`, and `Authorization`.
        using Success = http::Headers;
        using Failure = std::string;
        using Result  = cetl::variant<Success, Failure>;
    };

    AwsSigV4(AwsCredentials credentials, std::string region, std::string service);

    Sign::Result sign(const CanonicalRequest& request, const std::chrono::system_clock::time_point now) const;

    static std::string sha256Hex(const std::string& data);

    /// Percent-encodes all but the RFC 3986 unreserved characters; `/` is kept unless `encode_slash`.
    ///
    static std::string uriEncode(const std::string& str, const bool encode_slash);

    /// "YYYYMMDDTHHMMSSZ" in UTC.
    ///
    static std::string amzDate(const std::chrono::system_clock::time_point time);

private:
    const AwsCredentials credentials_;
    const std::string    region_;
    const std::string    service_;

};  // AwsSigV4

}  // namespace cloud
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_CLOUD_AWS_SIGV4_HPP_INCLUDED
