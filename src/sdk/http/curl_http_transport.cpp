//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "curl_http_transport.hpp"

#include "http_transport.hpp"
#include "io/io.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <curl/curl.h>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace dpxfer
{
namespace sdk
{
namespace http
{
namespace
{

constexpr long ConnectTimeoutSecs = 30;  // NOLINT(google-runtime-int)

/// Process wide libcurl initialization, done once on first use.
///
class CurlGlobal final
{
public:
    CurlGlobal()
        : result_{::curl_global_init(CURL_GLOBAL_DEFAULT)}
    {
    }

    CurlGlobal(const CurlGlobal&)                = delete;
    CurlGlobal(CurlGlobal&&) noexcept            = delete;
    CurlGlobal& operator=(const CurlGlobal&)     = delete;
    CurlGlobal& operator=(CurlGlobal&&) noexcept = delete;

    ~CurlGlobal()
    {
        if (result_ == CURLE_OK)
        {
            ::curl_global_cleanup();
        }
    }

    CURLcode result() const noexcept
    {
        return result_;
    }

private:
    const CURLcode result_;

};  // CurlGlobal

struct EasyDeleter final
{
    void operator()(CURL* const handle) const
    {
        ::curl_easy_cleanup(handle);
    }
};

struct SlistDeleter final
{
    void operator()(curl_slist* const list) const
    {
        ::curl_slist_free_all(list);
    }
};

struct MimeDeleter final
{
    void operator()(curl_mime* const mime) const
    {
        ::curl_mime_free(mime);
    }
};

using EasyPtr  = std::unique_ptr<CURL, EasyDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;
using MimePtr  = std::unique_ptr<curl_mime, MimeDeleter>;

class CurlHttpTransportImpl final : public HttpTransport
{
public:
    CurlHttpTransportImpl()
        : logger_{common::getLogger("http")}
    {
    }

    // HttpTransport

    Perform::Result perform(const HttpRequest& request) override
    {
        static const CurlGlobal curl_global;
        if (curl_global.result() != CURLE_OK)
        {
            return HttpFailure{HttpFailure::Kind::Local,
                               curl_global.result(),
                               ::curl_easy_strerror(curl_global.result())};
        }

        const EasyPtr easy{::curl_easy_init()};
        if (!easy)
        {
            return HttpFailure{HttpFailure::Kind::Local, CURLE_FAILED_INIT, "can't create libcurl handle"};
        }
        CURL* const handle = easy.get();

        std::array<char, CURL_ERROR_SIZE> error_buffer{};
        std::string                        body;

        // NOLINTBEGIN(cppcoreguidelines-pro-type-vararg)
        ::curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
        ::curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        ::curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, ConnectTimeoutSecs);
        ::curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer.data());
        ::curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &CurlHttpTransportImpl::onWrite);
        ::curl_easy_setopt(handle, CURLOPT_WRITEDATA, &body);
        if (!request.verify_tls)
        {
            ::curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 0L);
            ::curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        if (request.auth)
        {
            ::curl_easy_setopt(handle, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));  // NOLINT
            ::curl_easy_setopt(handle, CURLOPT_USERNAME, request.auth->username.c_str());
            ::curl_easy_setopt(handle, CURLOPT_PASSWORD, request.auth->password.c_str());
        }

        SlistPtr headers;
        for (const auto& header : request.headers)
        {
            const auto line = fmt::format("{}: {}", header.first, header.second);
            auto*      list = ::curl_slist_append(headers.get(), line.c_str());
            if (list == nullptr)
            {
                return HttpFailure{HttpFailure::Kind::Local, CURLE_OUT_OF_MEMORY, "can't build request headers"};
            }
            static_cast<void>(headers.release());
            headers.reset(list);
        }
        if (headers)
        {
            ::curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
        }

        MimePtr           mime;
        common::io::OwnFd upload_fd;
        switch (request.method)
        {
        case Method::Get:
            ::curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Head:
            ::curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
            break;
        case Method::Delete:
            ::curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
        case Method::Post:
        case Method::Put:
            if (request.multipart)
            {
                mime = makeMime(handle, *request.multipart);
                if (!mime)
                {
                    return HttpFailure{HttpFailure::Kind::Local, CURLE_OUT_OF_MEMORY, "can't build multipart form"};
                }
                ::curl_easy_setopt(handle, CURLOPT_MIMEPOST, mime.get());
            }
            else if (request.upload_file)
            {
                const int raw_fd = ::open(request.upload_file->c_str(), O_RDONLY | O_CLOEXEC);  // NOLINT(*-vararg)
                if (raw_fd < 0)
                {
                    const int err = errno;
                    return HttpFailure{HttpFailure::Kind::Local,
                                       err,
                                       fmt::format("can't open '{}': {}", *request.upload_file, std::strerror(err))};
                }
                upload_fd = common::io::OwnFd{raw_fd};

                struct stat file_stat
                {};
                if (::fstat(upload_fd.get(), &file_stat) < 0)
                {
                    const int err = errno;
                    return HttpFailure{HttpFailure::Kind::Local, err, std::strerror(err)};
                }
                ::curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
                ::curl_easy_setopt(handle, CURLOPT_READFUNCTION, &CurlHttpTransportImpl::onRead);
                ::curl_easy_setopt(handle, CURLOPT_READDATA, &upload_fd);
                ::curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(file_stat.st_size));
            }
            else
            {
                ::curl_easy_setopt(handle, CURLOPT_POSTFIELDS, "");
                ::curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, 0L);
            }
            if (request.method == Method::Put)
            {
                ::curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "PUT");
            }
            break;
        }
        // NOLINTEND(cppcoreguidelines-pro-type-vararg)

        logger_->debug("{} '{}'...", toString(request.method), common::maskedUrl(request.url));

        const CURLcode code = ::curl_easy_perform(handle);
        if (code != CURLE_OK)
        {
            std::string message = error_buffer.data();
            if (message.empty())
            {
                message = ::curl_easy_strerror(code);
            }
            const auto kind = CurlHttpTransport::isTlsStackFailure(code) ? HttpFailure::Kind::TlsStack
                                                                          : HttpFailure::Kind::Transport;
            logger_->warn("{} '{}' failed (code={}, tls={}): {}.",
                          toString(request.method),
                          common::maskedUrl(request.url),
                          static_cast<int>(code),
                          kind == HttpFailure::Kind::TlsStack,
                          message);
            return HttpFailure{kind, static_cast<int>(code), std::move(message)};
        }

        long status = 0;                                                      // NOLINT(google-runtime-int)
        ::curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);  // NOLINT(*-vararg)
        logger_->debug("{} '{}' → {} (body_size={}).",
                       toString(request.method),
                       common::maskedUrl(request.url),
                       status,
                       body.size());
        return HttpResponse{status, std::move(body)};
    }

private:
    static std::size_t onWrite(char* const data, const std::size_t size, const std::size_t count, void* const user)
    {
        auto* const body = static_cast<std::string*>(user);
        body->append(data, size * count);
        return size * count;
    }

    static std::size_t onRead(char* const buffer, const std::size_t size, const std::size_t count, void* const user)
    {
        const auto* const fd        = static_cast<const common::io::OwnFd*>(user);
        const ssize_t     read_size = ::read(fd->get(), buffer, size * count);
        return (read_size < 0) ? CURL_READFUNC_ABORT : static_cast<std::size_t>(read_size);
    }

    static MimePtr makeMime(CURL* const handle, const MultipartForm& form)
    {
        MimePtr mime{::curl_mime_init(handle)};
        if (!mime)
        {
            return nullptr;
        }
        for (const auto& field : form.fields)
        {
            curl_mimepart* const part = ::curl_mime_addpart(mime.get());
            if ((part == nullptr) || (::curl_mime_name(part, field.first.c_str()) != CURLE_OK) ||
                (::curl_mime_data(part, field.second.data(), field.second.size()) != CURLE_OK))
            {
                return nullptr;
            }
        }

        const auto&          file = form.file;
        curl_mimepart* const part = ::curl_mime_addpart(mime.get());
        if ((part == nullptr) || (::curl_mime_name(part, file.field_name.c_str()) != CURLE_OK) ||
            (::curl_mime_filedata(part, file.path.c_str()) != CURLE_OK) ||
            (::curl_mime_filename(part, file.filename.c_str()) != CURLE_OK) ||
            (::curl_mime_type(part, file.content_type.c_str()) != CURLE_OK))
        {
            return nullptr;
        }
        return mime;
    }

    const common::LoggerPtr logger_;

};  // CurlHttpTransportImpl

}  // namespace

const char* toString(const Method method) noexcept
{
    switch (method)
    {
    case Method::Get:
        return "GET";
    case Method::Head:
        return "HEAD";
    case Method::Put:
        return "PUT";
    case Method::Post:
        return "POST";
    case Method::Delete:
        return "DELETE";
    }
    return "";
}

HttpTransport::Ptr CurlHttpTransport::make()
{
    return std::make_unique<CurlHttpTransportImpl>();
}

bool CurlHttpTransport::isTlsStackFailure(const int curl_code) noexcept
{
    switch (curl_code)
    {
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_SSL_CIPHER:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
        return true;
    default:
        return false;
    }
}

}  // namespace http
}  // namespace sdk
}  // namespace dpxfer
