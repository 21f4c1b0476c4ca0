//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_REPO_UPLOAD_REPOSITORY_HPP_INCLUDED
#define DPXFER_SDK_REPO_UPLOAD_REPOSITORY_HPP_INCLUDED

#include "http/http_transport.hpp"

#include <dpxfer/sdk/catalog.hpp>
#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace dpxfer
{
namespace sdk
{
namespace repo
{

/// Legacy "dbfileupload" backend: the server keeps payloads in its database, so there is nothing to mount.
///
class UploadRepository
{
public:
    /// @param catalog Source of the authenticated session and of catalog records; may be null
    ///                (then every operation reports that there is no session).
    /// @param primary In-process transport.
    /// @param fallback Used only when the primary transport fails in its TLS stack; may be null.
    ///
    CETL_NODISCARD static Repository::Ptr make(std::string              name,
                                               LegacyUpload             config,
                                               Catalog::Ptr             catalog,
                                               http::HttpTransport::Ptr primary,
                                               http::HttpTransport::Ptr fallback);

    /// Identifier from the upload response body: `<id>N</id>`, or the whole body being an integer.
    ///
    static cetl::optional<ObjectId> parseObjectId(const std::string& body);

    /// Numeric `FILE_TYPE` of the upload protocol.
    ///
    static const char* fileType(const Category category) noexcept;

};  // UploadRepository

}  // namespace repo
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_REPO_UPLOAD_REPOSITORY_HPP_INCLUDED
