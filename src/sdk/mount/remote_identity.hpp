//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_MOUNT_REMOTE_IDENTITY_HPP_INCLUDED
#define DPXFER_SDK_MOUNT_REMOTE_IDENTITY_HPP_INCLUDED

#include "mount_handle.hpp"
#include "mount_table.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dpxfer
{
namespace sdk
{
namespace mount
{

/// Server and share a mounted volume must come from to belong to a repository.
///
/// Identity is matched against the `source` of mount table entries, never against the local mount point.
///
struct RemoteIdentity final
{
    MountProtocol            protocol;
    std::string              host;
    std::uint16_t            port;
    std::string              share_name;
    std::vector<std::string> host_aliases;  // resolved address, short and fully qualified names

    /// Lower-cased "host/share" & "host:port/share" strings, for every host name and for both
    /// the raw and the percent-encoded share name.
    ///
    std::vector<std::string> candidates() const;

    bool matches(const MountEntry& entry) const;
};

/// Percent-encodes everything except alphanumerics and `_.-~()*!'`.
///
std::string percentEncode(const std::string& str);

bool isProtocolFsType(const MountProtocol protocol, const std::string& fs_type);

}  // namespace mount
}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_MOUNT_REMOTE_IDENTITY_HPP_INCLUDED
