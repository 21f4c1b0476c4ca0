//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "aws_sigv4.hpp"

#include "common_helpers.hpp"
#include "http/http_transport.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <map>
#include <string>
#include <utility>

namespace dpxfer
{
namespace sdk
{
namespace cloud
{
namespace
{

constexpr const char* Algorithm      = "AWS4-HMAC-SHA256";
constexpr const char* RequestType    = "aws4_request";
constexpr std::size_t Sha256Size     = 32;
constexpr std::size_t DateStampChars = 8;

using Digest = std::array<unsigned char, Sha256Size>;

std::string toHex(const unsigned char* const data, const std::size_t size)
{
    static const char* const digits = "0123456789abcdef";

    std::string result;
    result.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i)
    {
        const unsigned char byte = data[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        result += digits[byte >> 4U];        // NOLINT
        result += digits[byte & 0x0FU];      // NOLINT
    }
    return result;
}

/// @return Empty string if OpenSSL failed.
///
std::string hmacSha256(const std::string& key, const std::string& data)
{
    Digest       digest{};
    unsigned int digest_len = 0;
    if (nullptr == ::HMAC(::EVP_sha256(),
                          key.data(),
                          static_cast<int>(key.size()),
                          reinterpret_cast<const unsigned char*>(data.data()),  // NOLINT(*-reinterpret-cast)
                          data.size(),
                          digest.data(),
                          &digest_len))
    {
        return {};
    }
    return std::string{reinterpret_cast<const char*>(digest.data()), digest_len};  // NOLINT(*-reinterpret-cast)
}

std::string trimmed(const std::string& str)
{
    const auto first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
    {
        return {};
    }
    const auto last = str.find_last_not_of(" \t");
    return str.substr(first, last - first + 1);
}

}  // namespace

AwsSigV4::AwsSigV4(AwsCredentials credentials, std::string region, std::string service)
    : credentials_{std::move(credentials)}
    , region_{std::move(region)}
    , service_{std::move(service)}
{
}

AwsSigV4::Sign::Result AwsSigV4::sign(const CanonicalRequest&                      request,
                                      const std::chrono::system_clock::time_point now) const
{
    const auto amz_date   = amzDate(now);
    const auto date_stamp = amz_date.substr(0, DateStampChars);
    const auto scope      = fmt::format("{}/{}/{}/{}", date_stamp, region_, service_, RequestType);

    http::Headers added{{"x-amz-date", amz_date}, {"x-amz-content-sha256", request.payload_hash}};
    if (!credentials_.session_token.empty())
    {
        added.emplace_back("x-amz-security-token", credentials_.session_token);
    }

    // Sorted, lower-cased & trimmed; the caller's headers win over the added ones.
    std::map<std::string, std::string> canonical;
    canonical["host"] = request.host;
    for (const auto& header : added)
    {
        canonical[header.first] = header.second;
    }
    for (const auto& header : request.headers)
    {
        canonical[common::toLower(header.first)] = trimmed(header.second);
    }

    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& header : canonical)
    {
        canonical_headers += fmt::format("{}:{}\n", header.first, header.second);
        signed_headers += (signed_headers.empty() ? "" : ";") + header.first;
    }

    const auto canonical_request = fmt::format("{}\n{}\n{}\n{}\n{}\n{}",
                                               request.method,
                                               request.uri,
                                               request.query,
                                               canonical_headers,
                                               signed_headers,
                                               request.payload_hash);
    const auto string_to_sign =
        fmt::format("{}\n{}\n{}\n{}", Algorithm, amz_date, scope, sha256Hex(canonical_request));

    const auto date_key    = hmacSha256("AWS4" + credentials_.secret_access_key, date_stamp);
    const auto region_key  = hmacSha256(date_key, region_);
    const auto service_key = hmacSha256(region_key, service_);
    const auto signing_key = hmacSha256(service_key, RequestType);
    const auto signature   = hmacSha256(signing_key, string_to_sign);
    if (date_key.empty() || region_key.empty() || service_key.empty() || signing_key.empty() || signature.empty())
    {
        return std::string{"HMAC-SHA256 computation failed"};
    }

    added.emplace_back("Authorization",
                       fmt::format("{} Credential={}/{},SignedHeaders={},Signature={}",
                                   Algorithm,
                                   credentials_.access_key_id,
                                   scope,
                                   signed_headers,
                                   toHex(reinterpret_cast<const unsigned char*>(signature.data()),  // NOLINT
                                         signature.size())));
    return added;
}

std::string AwsSigV4::sha256Hex(const std::string& data)
{
    Digest       digest{};
    unsigned int digest_len = 0;
    if (1 != ::EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, ::EVP_sha256(), nullptr))
    {
        return {};
    }
    return toHex(digest.data(), digest_len);
}

std::string AwsSigV4::uriEncode(const std::string& str, const bool encode_slash)
{
    std::string result;
    for (const char ch : str)
    {
        const auto uch = static_cast<unsigned char>(ch);
        if ((std::isalnum(uch) != 0) || (ch == '-') || (ch == '_') || (ch == '.') || (ch == '~') ||
            ((ch == '/') && !encode_slash))
        {
            result += ch;
        }
        else
        {
            result += fmt::format("%{:02X}", uch);
        }
    }
    return result;
}

std::string AwsSigV4::amzDate(const std::chrono::system_clock::time_point time)
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm           utc{};
    ::gmtime_r(&seconds, &utc);

    std::array<char, 32> buffer{};  // NOLINT(*-magic-numbers)
    const auto           size = std::strftime(buffer.data(), buffer.size(), "%Y%m%dT%H%M%SZ", &utc);
    return std::string{buffer.data(), size};
}

}  // namespace cloud
}  // namespace sdk
}  // namespace dpxfer
