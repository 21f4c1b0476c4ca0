//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <string>

namespace dpxfer
{
namespace sdk
{
namespace
{

struct DefaultName final
{
    std::string operator()(const AfpShare& share) const
    {
        return fmt::format("AFP:{}/{}", share.host, share.share_name);
    }

    std::string operator()(const SmbShare& share) const
    {
        return fmt::format("SMB:{}/{}", share.host, share.share_name);
    }

    std::string operator()(const LocalShare& share) const
    {
        return fmt::format("Local:{}/{}", share.mount_point, share.share_name);
    }

    std::string operator()(const LegacyUpload& upload) const
    {
        return fmt::format("LegacyUpload:{}", upload.destination);
    }

    std::string operator()(const CloudBucket& bucket) const
    {
        return fmt::format("Cloud:{}/{}", bucket.bucket, bucket.key_prefix);
    }

};  // DefaultName

}  // namespace

const char* toString(const RepositoryKind kind) noexcept
{
    switch (kind)
    {
    case RepositoryKind::Afp:
        return "AFP";
    case RepositoryKind::Smb:
        return "SMB";
    case RepositoryKind::Local:
        return "Local";
    case RepositoryKind::LegacyUpload:
        return "LegacyUpload";
    case RepositoryKind::Cloud:
        return "Cloud";
    }
    return "";
}

cetl::optional<RepositoryKind> parseRepositoryKind(const std::string& str)
{
    for (const auto kind : {RepositoryKind::Afp,
                            RepositoryKind::Smb,
                            RepositoryKind::Local,
                            RepositoryKind::LegacyUpload,
                            RepositoryKind::Cloud})
    {
        if (str == toString(kind))
        {
            return kind;
        }
    }
    return cetl::nullopt;
}

RepositoryKind RepositoryConfig::getKind() const noexcept
{
    // Alternatives of `Connection` are declared in the same order as the kinds.
    return static_cast<RepositoryKind>(connection.index());
}

std::string RepositoryConfig::getName() const
{
    if (display_name && !display_name->empty())
    {
        return *display_name;
    }
    return cetl::visit(DefaultName{}, connection);
}

}  // namespace sdk
}  // namespace dpxfer
