//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "curl_cli_transport.hpp"

#include "http_transport.hpp"
#include "logging.hpp"
#include "process/subprocess.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
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
namespace
{

constexpr int ExecFailureStatus = 127;

// Exit codes of the `curl` tool.
constexpr int CurlSslConnectError = 35;
constexpr int CurlPeerCertError   = 60;

constexpr const char* StatusSeparator = "|";

/// Escapes a value for a double-quoted `curl` config/form string.
///
std::string quoted(const std::string& value)
{
    std::string result{"\""};
    for (const char ch : value)
    {
        if ((ch == '"') || (ch == '\\'))
        {
            result += '\\';
        }
        result += ch;
    }
    result += '"';
    return result;
}

class CurlCliTransportImpl final : public HttpTransport
{
public:
    explicit CurlCliTransportImpl(std::string curl_program)
        : curl_program_{std::move(curl_program)}
        , logger_{common::getLogger("http")}
    {
    }

    // HttpTransport

    Perform::Result perform(const HttpRequest& request) override
    {
        common::process::ProcessRequest process_request;
        process_request.argv.push_back(curl_program_);
        auto args = CurlCliTransport::buildArguments(request);
        process_request.argv.insert(process_request.argv.end(), args.begin(), args.end());
        process_request.stdin_text = CurlCliTransport::buildStdinConfig(request);

        logger_->info("{} '{}' via '{}'...", toString(request.method), common::maskedUrl(request.url), curl_program_);

        auto maybe_run = common::process::runProcess(process_request);
        if (const auto* const err = cetl::get_if<common::process::RunProcess::Failure>(&maybe_run))
        {
            logger_->error("Failed to run '{}': {}.", curl_program_, std::strerror(*err));
            return HttpFailure{HttpFailure::Kind::Local,
                               *err,
                               fmt::format("can't run '{}': {}", curl_program_, std::strerror(*err))};
        }
        auto& run = cetl::get<common::process::RunProcess::Success>(maybe_run);

        if (run.exit_status == ExecFailureStatus)
        {
            return HttpFailure{HttpFailure::Kind::Local, ENOENT, fmt::format("can't execute '{}'", curl_program_)};
        }
        if (run.exit_status != 0)
        {
            const auto kind = ((run.exit_status == CurlSslConnectError) || (run.exit_status == CurlPeerCertError))
                                  ? HttpFailure::Kind::TlsStack
                                  : HttpFailure::Kind::Transport;
            auto message = fmt::format("curl error: {}", CurlCliTransport::describeExitCode(run.exit_status));
            logger_->warn("'{}' failed (status={}): {} {}", curl_program_, run.exit_status, message, run.errors);
            return HttpFailure{kind, run.exit_status, std::move(message)};
        }

        // Output is the response body followed by "|<status>" (see `--write-out`).
        const auto sep_pos = run.output.rfind(StatusSeparator);
        if (sep_pos == std::string::npos)
        {
            return HttpFailure{HttpFailure::Kind::Transport, EPROTO, "curl output has no HTTP status"};
        }
        char*      end    = nullptr;
        const auto status = std::strtol(run.output.c_str() + sep_pos + 1, &end, 10);  // NOLINT(*-magic-numbers)
        if ((end == run.output.c_str() + sep_pos + 1) || (status <= 0))
        {
            return HttpFailure{HttpFailure::Kind::Transport, EPROTO, "curl reported no HTTP status"};
        }
        run.output.resize(sep_pos);

        logger_->debug("'{}' → {} (body_size={}).", curl_program_, status, run.output.size());
        return HttpResponse{status, std::move(run.output)};
    }

private:
    const std::string       curl_program_;
    const common::LoggerPtr logger_;

};  // CurlCliTransportImpl

}  // namespace

HttpTransport::Ptr CurlCliTransport::make(std::string curl_program)
{
    return std::make_unique<CurlCliTransportImpl>(std::move(curl_program));
}

std::vector<std::string> CurlCliTransport::buildArguments(const HttpRequest& request)
{
    std::vector<std::string> args{"--silent",
                                  "--show-error",
                                  "--write-out",
                                  fmt::format("{}%{{http_code}}", StatusSeparator),
                                  "--config",
                                  "-"};
    if (!request.verify_tls)
    {
        args.emplace_back("--insecure");
    }

    switch (request.method)
    {
    case Method::Head:
        args.emplace_back("--head");
        break;
    case Method::Get:
        break;
    case Method::Put:
    case Method::Post:
    case Method::Delete:
        if (!request.multipart || (request.method != Method::Post))
        {
            args.emplace_back("--request");
            args.emplace_back(toString(request.method));
        }
        break;
    }

    for (const auto& header : request.headers)
    {
        args.emplace_back("--header");
        args.push_back(fmt::format("{}: {}", header.first, header.second));
    }

    if (request.multipart)
    {
        for (const auto& field : request.multipart->fields)
        {
            args.emplace_back("--form-string");
            args.push_back(fmt::format("{}={}", field.first, field.second));
        }
        const auto& file = request.multipart->file;
        args.emplace_back("--form");
        args.push_back(fmt::format("{}=@{};filename={};type={}",
                                   file.field_name,
                                   quoted(file.path),
                                   quoted(file.filename),
                                   file.content_type));
    }
    else if (request.upload_file)
    {
        args.emplace_back("--upload-file");
        args.push_back(*request.upload_file);
    }

    args.push_back(request.url);
    return args;
}

std::string CurlCliTransport::buildStdinConfig(const HttpRequest& request)
{
    if (!request.auth)
    {
        return {};
    }
    return fmt::format("user = {}\n", quoted(request.auth->username + ":" + request.auth->password));
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
std::string CurlCliTransport::describeExitCode(const int exit_code)
{
    switch (exit_code)
    {
    case 1:
        return "Unsupported protocol. This build of curl has no support for this protocol.";
    case 2:
        return "Failed to initialize.";
    case 3:
        return "URL malformed. The syntax was not correct.";
    case 4:
        return "A feature or option that was needed to perform the desired request was not enabled or was "
               "explicitly disabled at build-time.";
    case 5:
        return "Couldn't resolve proxy. The given proxy host could not be resolved.";
    case 6:
        return "Couldn't resolve host. The given remote host was not resolved.";
    case 7:
        return "Failed to connect to host.";
    case 8:
        return "Weird server reply. The server sent data curl couldn't parse.";
    case 22:
        return "HTTP page not retrieved. The requested url was not found or returned another error with the HTTP "
               "error code being 400 or above.";
    case 23:
        return "Write error. Curl couldn't write data to a local filesystem or similar.";
    case 26:
        return "Read error. Curl couldn't read the local file to upload.";
    case 27:
        return "Out of memory. A memory allocation request failed.";
    case 28:
        return "Operation timeout. The specified time-out period was reached according to the conditions.";
    case 33:
        return "HTTP range error. The range \"command\" didn't work.";
    case CurlSslConnectError:
        return "SSL connect error. The SSL handshaking failed.";
    case 47:
        return "Too many redirects. When following redirects, curl hit the maximum amount.";
    case CurlPeerCertError:
        return "Peer certificate cannot be authenticated with known CA certificates.";
    default:
        return fmt::format("Unknown curl error: {}.", exit_code);
    }
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace http
}  // namespace sdk
}  // namespace dpxfer
