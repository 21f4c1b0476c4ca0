//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_MOUNT_MOUNT_HANDLE_HPP_INCLUDED
#define DPXFER_SDK_MOUNT_MOUNT_HANDLE_HPP_INCLUDED

#include "mount_table.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dpxfer
{
namespace sdk
{
namespace mount
{

enum class MountProtocol : std::uint8_t
{
    Afp,
    Smb,
};

struct MountRequest final
{
    MountProtocol protocol;
    std::string   host;
    std::uint16_t port;
    std::string   share_name;
    std::string   username;
    std::string   password;
    std::string   domain;  // SMB only
    std::string   mount_point;
    bool          invisible;
};

/// OS boundary of the mount lifecycle: the live mount table, the mount helper and `umount2`.
///
class MountHandle
{
public:
    using Ptr = std::unique_ptr<MountHandle>;

    struct QueryMounts final
    {
        using Success = std::vector<MountEntry>;
        using Failure = int;
        using Result  = cetl::variant<Success, Failure>;
    };

    struct Mount final
    {
        using Success = std::string;  // local path actually mounted
        struct Failure final
        {
            int         code;
            std::string message;
        };
        using Result = cetl::variant<Success, Failure>;
    };

    struct Options final
    {
        std::vector<std::string> mount_tables{"/proc/self/mounts", "/etc/mtab"};
        std::string              smb_mount_program{"mount"};
        std::string              afp_mount_program{"mount_afp"};
    };

    CETL_NODISCARD static Ptr make();
    CETL_NODISCARD static Ptr make(Options options);

    MountHandle(const MountHandle&)                = delete;
    MountHandle(MountHandle&&) noexcept            = delete;
    MountHandle& operator=(const MountHandle&)     = delete;
    MountHandle& operator=(MountHandle&&) noexcept = delete;

    virtual ~MountHandle() = default;

    virtual QueryMounts::Result queryMounts() = 0;

    /// Creates the mount point directory (if missing) and mounts the share onto it.
    ///
    virtual Mount::Result mount(const MountRequest& request) = 0;

    /// @return `errno`-like error code, zero on success.
    ///
    virtual int unmount(const std::string& target, const bool forced) = 0;

    /// Best-effort alternative names of a host: numeric address, canonical name and short name.
    ///
    virtual std::vector<std::string> resolveHostAliases(const std::string& host) = 0;

protected:
    MountHandle() = default;

};  // MountHandle

}  // namespace mount
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_MOUNT_MOUNT_HANDLE_HPP_INCLUDED
