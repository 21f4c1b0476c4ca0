//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cloud_repository.hpp"

#include "cloud/aws_sigv4.hpp"
#include "common_helpers.hpp"
#include "http/http_transport.hpp"
#include "logging.hpp"

#include <dpxfer/platform/posix_utils.hpp>
#include <dpxfer/sdk/errors.hpp>
#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <utility>

namespace dpxfer
{
namespace sdk
{
namespace repo
{
namespace
{

constexpr long HttpNotFound = 404;  // NOLINT(google-runtime-int)

constexpr const char* UnsignedPayload = "UNSIGNED-PAYLOAD";

class CloudRepositoryImpl final : public Repository
{
public:
    CloudRepositoryImpl(std::string                     name,
                        CloudBucket                     config,
                        http::HttpTransport::Ptr        transport,
                        CloudRepository::Clock          clock)
        : name_{std::move(name)}
        , config_{std::move(config)}
        , transport_{std::move(transport)}
        , clock_{std::move(clock)}
        , signer_{cloud::AwsCredentials{config_.access_key_id, config_.secret_access_key, config_.session_token},
                  config_.region,
                  "s3"}
        , logger_{common::getLogger("cloud")}
    {
        CETL_DEBUG_ASSERT(transport_, "");
    }

    // Repository

    const std::string& getName() const override
    {
        return name_;
    }

    RepositoryKind getKind() const override
    {
        return RepositoryKind::Cloud;
    }

    Copy::Result copy(const TransferRequest& request) override
    {
        struct stat source_stat
        {};
        if (const auto err = platform::posixStat(request.source_path, source_stat))
        {
            return TransferError{err, fmt::format("can't access source '{}'", request.source_path)};
        }
        if (S_ISDIR(source_stat.st_mode))
        {
            return UnsupportedPayloadError{request.source_path,
                                           "directory (bundle) payloads can't be stored as a single object"};
        }

        const auto key = CloudRepository::objectKey(config_, request.category, common::baseName(request.source_path));
        auto       maybe_request = makeRequest(http::Method::Put, key);
        if (const auto* const err = cetl::get_if<Error>(&maybe_request))
        {
            return *err;
        }
        auto& http_request       = cetl::get<http::HttpRequest>(maybe_request);
        http_request.upload_file = request.source_path;

        logger_->info("Uploading '{}' → '{}' (repo='{}')...", request.source_path, key, name_);
        auto maybe_response = transport_->perform(http_request);
        if (const auto* const failure = cetl::get_if<http::HttpTransport::Perform::Failure>(&maybe_response))
        {
            logger_->error("Upload of '{}' failed (repo='{}'): {}.", key, name_, failure->message);
            return TransferError{(failure->kind == http::HttpFailure::Kind::Local) ? failure->code : EIO,
                                 failure->message};
        }
        const auto& response = cetl::get<http::HttpTransport::Perform::Success>(maybe_response);
        if (!http::isSuccessStatus(response.status))
        {
            logger_->error("Upload of '{}' rejected (repo='{}', status={}): {}",
                           key,
                           name_,
                           response.status,
                           response.body);
            return TransferError{EIO, fmt::format("object storage responded with HTTP status {}", response.status)};
        }

        logger_->info("Uploaded '{}' (repo='{}').", key, name_);
        return Copy::Success{};
    }

    Existence exists(const std::string& filename, const Category category) override
    {
        if (!common::isPlainFileName(filename))
        {
            return Existence::Unknown;
        }

        const auto key           = CloudRepository::objectKey(config_, category, filename);
        auto       maybe_request = makeRequest(http::Method::Head, key);
        if (const auto* const err = cetl::get_if<Error>(&maybe_request))
        {
            logger_->warn("Can't check '{}' (repo='{}'): {}.", key, name_, describe(*err));
            return Existence::Unknown;
        }

        auto maybe_response = transport_->perform(cetl::get<http::HttpRequest>(maybe_request));
        if (const auto* const failure = cetl::get_if<http::HttpTransport::Perform::Failure>(&maybe_response))
        {
            logger_->warn("Existence check of '{}' failed (repo='{}'): {}.", key, name_, failure->message);
            return Existence::Unknown;
        }
        const auto status = cetl::get<http::HttpTransport::Perform::Success>(maybe_response).status;
        if (http::isSuccessStatus(status))
        {
            return Existence::Present;
        }
        if (status == HttpNotFound)
        {
            return Existence::Absent;
        }
        logger_->warn("Existence of '{}' is unknown (repo='{}', status={}).", key, name_, status);
        return Existence::Unknown;
    }

    Remove::Result remove(const std::string& filename, const Category category) override
    {
        if (!common::isPlainFileName(filename))
        {
            return TransferError{EINVAL, fmt::format("'{}' is not a plain file name", filename)};
        }

        const auto key           = CloudRepository::objectKey(config_, category, filename);
        auto       maybe_request = makeRequest(http::Method::Delete, key);
        if (const auto* const err = cetl::get_if<Error>(&maybe_request))
        {
            return *err;
        }

        auto maybe_response = transport_->perform(cetl::get<http::HttpRequest>(maybe_request));
        if (const auto* const failure = cetl::get_if<http::HttpTransport::Perform::Failure>(&maybe_response))
        {
            return TransferError{(failure->kind == http::HttpFailure::Kind::Local) ? failure->code : EIO,
                                 failure->message};
        }
        const auto status = cetl::get<http::HttpTransport::Perform::Success>(maybe_response).status;
        if (!http::isSuccessStatus(status) && (status != HttpNotFound))
        {
            return TransferError{EIO, fmt::format("object storage responded with HTTP status {}", status)};
        }

        logger_->info("Removed '{}' (repo='{}').", key, name_);
        return Remove::Success{};
    }

private:
    cetl::variant<http::HttpRequest, Error> makeRequest(const http::Method method, const std::string& key) const
    {
        const auto location = CloudRepository::locate(config_, key);

        const cloud::CanonicalRequest canonical{toString(method),
                                                location.host,
                                                location.canonical_uri,
                                                {},
                                                {},
                                                UnsignedPayload};
        auto maybe_headers = signer_.sign(canonical, clock_());
        if (const auto* const err = cetl::get_if<cloud::AwsSigV4::Sign::Failure>(&maybe_headers))
        {
            return Error{TransferError{EPROTO, *err}};
        }

        http::HttpRequest request;
        request.method  = method;
        request.url     = location.url;
        request.headers = cetl::get<cloud::AwsSigV4::Sign::Success>(std::move(maybe_headers));
        return request;
    }

    const std::string              name_;
    const CloudBucket              config_;
    const http::HttpTransport::Ptr transport_;
    const CloudRepository::Clock   clock_;
    const cloud::AwsSigV4          signer_;
    const common::LoggerPtr        logger_;

};  // CloudRepositoryImpl

}  // namespace

Repository::Ptr CloudRepository::make(std::string              name,
                                      CloudBucket              config,
                                      http::HttpTransport::Ptr transport,
                                      Clock                    clock)
{
    return std::make_unique<CloudRepositoryImpl>(std::move(name),
                                                 std::move(config),
                                                 std::move(transport),
                                                 std::move(clock));
}

std::string CloudRepository::objectKey(const CloudBucket& config, const Category category, const std::string& filename)
{
    return fmt::format("{}{}/{}", config.key_prefix, categoryDirectory(category), filename);
}

CloudRepository::ObjectLocation CloudRepository::locate(const CloudBucket& config, const std::string& key)
{
    const auto encoded_key = cloud::AwsSigV4::uriEncode(key, false);
    if (config.endpoint.empty())
    {
        const auto host = fmt::format("{}.s3.{}.amazonaws.com", config.bucket, config.region);
        return ObjectLocation{fmt::format("https://{}/{}", host, encoded_key), host, "/" + encoded_key};
    }

    auto endpoint = config.endpoint;
    while (!endpoint.empty() && (endpoint.back() == '/'))
    {
        endpoint.pop_back();
    }
    const auto scheme_end = endpoint.find("://");
    const auto host_begin = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
    const auto host_end   = endpoint.find('/', host_begin);
    const auto host_size  = (host_end == std::string::npos) ? host_end : host_end - host_begin;
    const auto host       = endpoint.substr(host_begin, host_size);
    const auto base_path  = (host_end == std::string::npos) ? std::string{} : endpoint.substr(host_end);

    const auto uri = fmt::format("{}/{}/{}", base_path, cloud::AwsSigV4::uriEncode(config.bucket, true), encoded_key);
    return ObjectLocation{endpoint.substr(0, host_begin) + host + uri, host, uri};
}

}  // namespace repo
}  // namespace sdk
}  // namespace dpxfer
