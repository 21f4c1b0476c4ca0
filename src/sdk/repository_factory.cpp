//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <dpxfer/sdk/repository_factory.hpp>

#include "http/curl_cli_transport.hpp"
#include "http/curl_http_transport.hpp"
#include "mount/mount_handle.hpp"
#include "repo/cloud_repository.hpp"
#include "repo/mounted_repository.hpp"
#include "repo/upload_repository.hpp"

#include <dpxfer/sdk/catalog.hpp>
#include <dpxfer/sdk/distribution_points.hpp>
#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <utility>

namespace dpxfer
{
namespace sdk
{
namespace
{

/// Makes the production backend for each kind of connection.
///
struct DefaultMaker final
{
    Repository::Ptr operator()(const AfpShare& share) const
    {
        return repo::MountedRepository::make(name, share, mount::MountHandle::make());
    }

    Repository::Ptr operator()(const SmbShare& share) const
    {
        return repo::MountedRepository::make(name, share, mount::MountHandle::make());
    }

    Repository::Ptr operator()(const LocalShare& share) const
    {
        return repo::MountedRepository::make(name, share);
    }

    Repository::Ptr operator()(const LegacyUpload& upload) const
    {
        return repo::UploadRepository::make(name,
                                            upload,
                                            catalog,
                                            http::CurlHttpTransport::make(),
                                            http::CurlCliTransport::make());
    }

    Repository::Ptr operator()(const CloudBucket& bucket) const
    {
        return repo::CloudRepository::make(name, bucket, http::CurlHttpTransport::make());
    }

    const std::string&  name;
    const Catalog::Ptr& catalog;

};  // DefaultMaker

}  // namespace

RepositoryFactory makeDefaultRepositoryFactory(Catalog::Ptr catalog)
{
    return [catalog = std::move(catalog)](const RepositoryConfig& config) -> Repository::Ptr {
        //
        const auto name = config.getName();
        return cetl::visit(DefaultMaker{name, catalog}, config.connection);
    };
}

}  // namespace sdk
}  // namespace dpxfer
