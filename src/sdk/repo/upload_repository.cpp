//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "upload_repository.hpp"

#include "common_helpers.hpp"
#include "http/http_transport.hpp"
#include "logging.hpp"

#include <dpxfer/platform/posix_utils.hpp>
#include <dpxfer/sdk/catalog.hpp>
#include <dpxfer/sdk/errors.hpp>
#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
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

constexpr ObjectId NewObjectId = -1;

int toErrorCode(const http::HttpFailure& failure)
{
    switch (failure.kind)
    {
    case http::HttpFailure::Kind::Local:
        return failure.code;
    case http::HttpFailure::Kind::TlsStack:
        return EPROTO;
    case http::HttpFailure::Kind::Transport:
        break;
    }
    return EIO;
}

std::string trimmed(const std::string& str)
{
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return {};
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

cetl::optional<ObjectId> parseInteger(const std::string& str)
{
    if (str.empty() || (str == "-") ||
        !std::all_of(str.begin() + ((str[0] == '-') ? 1 : 0), str.end(), [](const unsigned char ch) {
            //
            return std::isdigit(ch) != 0;
        }))
    {
        return cetl::nullopt;
    }
    errno             = 0;
    const auto result = std::strtoll(str.c_str(), nullptr, 10);  // NOLINT(*-magic-numbers)
    if (errno == ERANGE)
    {
        return cetl::nullopt;
    }
    return static_cast<ObjectId>(result);
}

class UploadRepositoryImpl final : public Repository
{
public:
    UploadRepositoryImpl(std::string              name,
                         LegacyUpload             config,
                         Catalog::Ptr             catalog,
                         http::HttpTransport::Ptr primary,
                         http::HttpTransport::Ptr fallback)
        : name_{std::move(name)}
        , config_{std::move(config)}
        , catalog_{std::move(catalog)}
        , primary_{std::move(primary)}
        , fallback_{std::move(fallback)}
        , logger_{common::getLogger("upload")}
    {
        CETL_DEBUG_ASSERT(primary_, "");
    }

    // Repository

    const std::string& getName() const override
    {
        return name_;
    }

    RepositoryKind getKind() const override
    {
        return RepositoryKind::LegacyUpload;
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
            logger_->error("Rejected bundle payload '{}' (repo='{}').", request.source_path, name_);
            return UnsupportedPayloadError{request.source_path,
                                           "only flat packages can be uploaded; bundle (directory) payloads are "
                                           "not supported by this backend"};
        }
        if (!catalog_)
        {
            return TransferError{ENOTCONN, "no authenticated server session"};
        }

        const auto session   = catalog_->getSession();
        const auto filename  = common::baseName(request.source_path);
        const auto object_id = request.associated_object_id.value_or(NewObjectId);

        http::HttpRequest http_request;
        http_request.method     = http::Method::Post;
        http_request.url        = uploadUrl(session);
        http_request.auth       = http::BasicAuth{session.username, session.password};
        http_request.verify_tls = session.verify_tls;

        const http::Headers fields{{"DESTINATION", config_.destination},
                                   {"OBJECT_ID", std::to_string(object_id)},
                                   {"FILE_TYPE", UploadRepository::fileType(request.category)},
                                   {"FILE_NAME", filename}};
        http_request.headers = fields;
        http_request.multipart =
            http::MultipartForm{fields, {"file", request.source_path, filename, "application/octet-stream"}};

        logger_->info("Uploading '{}' (repo='{}', type={}, object_id={})...",
                      request.source_path,
                      name_,
                      toString(request.category),
                      object_id);

        auto maybe_response = performWithFallback(http_request);
        if (const auto* const failure = cetl::get_if<http::HttpTransport::Perform::Failure>(&maybe_response))
        {
            logger_->error("Upload of '{}' failed (repo='{}'): {}.", filename, name_, failure->message);
            return TransferError{toErrorCode(*failure), failure->message};
        }
        const auto& response = cetl::get<http::HttpTransport::Perform::Success>(maybe_response);
        if (!http::isSuccessStatus(response.status))
        {
            logger_->error("Upload of '{}' rejected (repo='{}', status={}).", filename, name_, response.status);
            return TransferError{EIO, fmt::format("server responded with HTTP status {}", response.status)};
        }

        Copy::Success success{UploadRepository::parseObjectId(response.body)};
        if (!success.object_id)
        {
            success.object_id = request.associated_object_id;
        }
        logger_->info("Uploaded '{}' (repo='{}', object_id={}).",
                      filename,
                      name_,
                      success.object_id.value_or(NewObjectId));
        return success;
    }

    Existence exists(const std::string& filename, const Category category) override
    {
        if (!catalog_ || !common::isPlainFileName(filename))
        {
            return Existence::Unknown;
        }

        auto maybe_record = catalog_->findRecord(category, filename);
        if (const auto* const err = cetl::get_if<Catalog::FindRecord::Failure>(&maybe_record))
        {
            logger_->warn("Record lookup of '{}' failed (repo='{}'): {}.", filename, name_, std::strerror(*err));
            return Existence::Unknown;
        }
        if (!cetl::get<Catalog::FindRecord::Success>(maybe_record))
        {
            return Existence::Absent;
        }

        // A record only says the server knows the file; the side channel may confirm the payload itself.
        if (category != Category::Package)
        {
            return Existence::Unknown;
        }
        const auto server_sets = catalog_->queryServerFileSets();
        if (!server_sets || server_sets->empty())
        {
            logger_->debug("No propagation info for '{}' (repo='{}').", filename, name_);
            return Existence::Unknown;
        }
        for (const auto& files : *server_sets)
        {
            if (std::find(files.begin(), files.end(), filename) == files.end())
            {
                return Existence::Unknown;
            }
        }
        return Existence::Present;
    }

    Remove::Result remove(const std::string& filename, const Category category) override
    {
        if (!catalog_)
        {
            return TransferError{ENOTCONN, "no authenticated server session"};
        }

        auto maybe_record = catalog_->findRecord(category, filename);
        if (const auto* const err = cetl::get_if<Catalog::FindRecord::Failure>(&maybe_record))
        {
            return TransferError{*err, fmt::format("can't look up the record of '{}'", filename)};
        }
        const auto& record = cetl::get<Catalog::FindRecord::Success>(maybe_record);
        if (!record)
        {
            logger_->debug("No record of '{}' to delete (repo='{}').", filename, name_);
            return Remove::Success{};
        }

        if (const auto err = catalog_->deleteRecord(category, record->id))
        {
            logger_->error("Failed to delete record {} (repo='{}'): {}.", record->id, name_, std::strerror(err));
            return TransferError{err, fmt::format("can't delete the record of '{}'", filename)};
        }
        logger_->info("Deleted record {} of '{}' (repo='{}').", record->id, filename, name_);
        return Remove::Success{};
    }

private:
    static std::string uploadUrl(const ServerSession& session)
    {
        auto base = session.base_url;
        while (!base.empty() && (base.back() == '/'))
        {
            base.pop_back();
        }
        return base + "/dbfileupload";
    }

    /// The only automatic fallback: a TLS stack failure of the in-process transport is retried once
    /// with the external one.
    ///
    http::HttpTransport::Perform::Result performWithFallback(const http::HttpRequest& request)
    {
        auto result = primary_->perform(request);
        if (const auto* const failure = cetl::get_if<http::HttpTransport::Perform::Failure>(&result))
        {
            if ((failure->kind == http::HttpFailure::Kind::TlsStack) && fallback_)
            {
                logger_->warn("In-process TLS failed (repo='{}', code={}); falling back to external client.",
                              name_,
                              failure->code);
                return fallback_->perform(request);
            }
        }
        return result;
    }

    const std::string              name_;
    const LegacyUpload             config_;
    const Catalog::Ptr             catalog_;
    const http::HttpTransport::Ptr primary_;
    const http::HttpTransport::Ptr fallback_;
    const common::LoggerPtr        logger_;

};  // UploadRepositoryImpl

}  // namespace

Repository::Ptr UploadRepository::make(std::string              name,
                                       LegacyUpload             config,
                                       Catalog::Ptr             catalog,
                                       http::HttpTransport::Ptr primary,
                                       http::HttpTransport::Ptr fallback)
{
    return std::make_unique<UploadRepositoryImpl>(std::move(name),
                                                  std::move(config),
                                                  std::move(catalog),
                                                  std::move(primary),
                                                  std::move(fallback));
}

cetl::optional<ObjectId> UploadRepository::parseObjectId(const std::string& body)
{
    static const std::string open_tag  = "<id>";
    static const std::string close_tag = "</id>";

    const auto open_pos = body.find(open_tag);
    if (open_pos != std::string::npos)
    {
        const auto value_pos = open_pos + open_tag.size();
        const auto close_pos = body.find(close_tag, value_pos);
        if (close_pos != std::string::npos)
        {
            return parseInteger(trimmed(body.substr(value_pos, close_pos - value_pos)));
        }
    }
    return parseInteger(trimmed(body));
}

const char* UploadRepository::fileType(const Category category) noexcept
{
    switch (category)
    {
    case Category::Package:
        return "0";
    case Category::Script:
        return "3";
    }
    return "0";
}

}  // namespace repo
}  // namespace sdk
}  // namespace dpxfer
