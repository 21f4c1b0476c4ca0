//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_REPO_CLOUD_REPOSITORY_HPP_INCLUDED
#define DPXFER_SDK_REPO_CLOUD_REPOSITORY_HPP_INCLUDED

#include "http/http_transport.hpp"

#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/cetl.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace dpxfer
{
namespace sdk
{
namespace repo
{

/// S3-compatible object storage backend; existence and removal are authoritative here.
///
class CloudRepository
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct ObjectLocation final
    {
        std::string url;
        std::string host;
        std::string canonical_uri;
    };

    CETL_NODISCARD static Repository::Ptr make(std::string              name,
                                               CloudBucket              config,
                                               http::HttpTransport::Ptr transport,
                                               Clock                    clock = &std::chrono::system_clock::now);

    /// "[key_prefix]<Packages|Scripts>/<filename>".
    ///
    static std::string objectKey(const CloudBucket& config, const Category category, const std::string& filename);

    /// Virtual-hosted location on AWS, or path-style under the custom `endpoint`.
    ///
    static ObjectLocation locate(const CloudBucket& config, const std::string& key);

};  // CloudRepository

}  // namespace repo
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_REPO_CLOUD_REPOSITORY_HPP_INCLUDED
