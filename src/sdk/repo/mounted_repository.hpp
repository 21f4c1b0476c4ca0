//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_REPO_MOUNTED_REPOSITORY_HPP_INCLUDED
#define DPXFER_SDK_REPO_MOUNTED_REPOSITORY_HPP_INCLUDED

#include "mount/mount_handle.hpp"
#include "mount/remote_identity.hpp"

#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>

namespace dpxfer
{
namespace sdk
{
namespace repo
{

/// Mount bookkeeping, owned exclusively by one repository (never shared, even for the same remote share).
///
struct MountState final
{
    cetl::optional<std::string> local_path;
    bool                        is_mounted{false};
    mount::RemoteIdentity       remote_identity;
};

/// AFP, SMB and local-path backends.
///
class MountedRepository : public Repository, public FileRepository
{
public:
    using Ptr = std::unique_ptr<MountedRepository>;

    CETL_NODISCARD static Ptr make(std::string name, const AfpShare& share, mount::MountHandle::Ptr mount_handle);
    CETL_NODISCARD static Ptr make(std::string name, const SmbShare& share, mount::MountHandle::Ptr mount_handle);
    CETL_NODISCARD static Ptr make(std::string name, const LocalShare& share);

    CETL_NODISCARD virtual const MountState& getMountState() const noexcept = 0;

    // Repository

    FileRepository* asFileRepository() noexcept override
    {
        return this;
    }

protected:
    MountedRepository() = default;

};  // MountedRepository

}  // namespace repo
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_REPO_MOUNTED_REPOSITORY_HPP_INCLUDED
