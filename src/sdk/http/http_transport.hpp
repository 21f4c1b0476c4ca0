//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_HTTP_HTTP_TRANSPORT_HPP_INCLUDED
#define DPXFER_SDK_HTTP_HTTP_TRANSPORT_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dpxfer
{
namespace sdk
{
namespace http
{

enum class Method : std::uint8_t
{
    Get,
    Head,
    Put,
    Post,
    Delete,
};

const char* toString(const Method method) noexcept;

using Headers = std::vector<std::pair<std::string, std::string>>;

struct BasicAuth final
{
    std::string username;
    std::string password;
};

struct MultipartForm final
{
    struct FilePart final
    {
        std::string field_name;
        std::string path;
        std::string filename;
        std::string content_type;
    };

    std::vector<std::pair<std::string, std::string>> fields;
    FilePart                                         file;
};

struct HttpRequest final
{
    Method                        method{Method::Get};
    std::string                   url;
    Headers                       headers;
    cetl::optional<BasicAuth>     auth;
    bool                          verify_tls{true};
    cetl::optional<MultipartForm> multipart;
    cetl::optional<std::string>   upload_file;  // streamed as the request body
};

struct HttpResponse final
{
    long        status;  // NOLINT(google-runtime-int)
    std::string body;
};

struct HttpFailure final
{
    enum class Kind : std::uint8_t
    {
        Transport,  // network level (resolve, connect, timeout, ...)
        TlsStack,   // handshake or TLS record level failure of the in-process TLS implementation
        Local,      // local file or setup failure
    };

    Kind        kind;
    int         code;  // backend specific (libcurl `CURLcode`, curl exit code, or `errno`)
    std::string message;
};

class HttpTransport
{
public:
    using Ptr = std::unique_ptr<HttpTransport>;

    struct Perform final
    {
        using Success = HttpResponse;
        using Failure = HttpFailure;
        using Result  = cetl::variant<Success, Failure>;
    };

    HttpTransport(const HttpTransport&)                = delete;
    HttpTransport(HttpTransport&&) noexcept            = delete;
    HttpTransport& operator=(const HttpTransport&)     = delete;
    HttpTransport& operator=(HttpTransport&&) noexcept = delete;

    virtual ~HttpTransport() = default;

    /// Performs the request synchronously. Any received HTTP status (including 4xx/5xx) is a `Success`.
    ///
    virtual Perform::Result perform(const HttpRequest& request) = 0;

protected:
    HttpTransport() = default;

};  // HttpTransport

inline bool isSuccessStatus(const long status) noexcept  // NOLINT(google-runtime-int)
{
    constexpr long Ok       = 200;  // NOLINT(google-runtime-int)
    constexpr long Redirect = 300;  // NOLINT(google-runtime-int)
    return (status >= Ok) && (status < Redirect);
}

}  // namespace http
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_HTTP_HTTP_TRANSPORT_HPP_INCLUDED
