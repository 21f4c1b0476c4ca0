//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remote_identity.hpp"

#include "common_helpers.hpp"
#include "mount_table.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace dpxfer
{
namespace sdk
{
namespace mount
{
namespace
{

void addCandidate(std::vector<std::string>& candidates, std::string candidate)
{
    candidate = common::toLower(std::move(candidate));
    if (std::find(candidates.begin(), candidates.end(), candidate) == candidates.end())
    {
        candidates.push_back(std::move(candidate));
    }
}

/// Candidate must start on a component boundary and end the source (a single trailing `/` is allowed),
/// so that "host/share" matches none of "otherhost/share", "host/share2" and "host/share/sub/folder".
///
bool containsAsComponent(const std::string& source, const std::string& candidate)
{
    std::string::size_type pos = 0;
    while ((pos = source.find(candidate, pos)) != std::string::npos)
    {
        const auto end            = pos + candidate.size();
        const bool is_left_bound  = (pos == 0) || (source[pos - 1] == '/') || (source[pos - 1] == '@');
        const bool is_right_bound = (end == source.size()) || ((end + 1 == source.size()) && (source[end] == '/'));
        if (is_left_bound && is_right_bound)
        {
            return true;
        }
        ++pos;
    }
    return false;
}

}  // namespace

std::vector<std::string> RemoteIdentity::candidates() const
{
    std::vector<std::string> hosts{host};
    hosts.insert(hosts.end(), host_aliases.begin(), host_aliases.end());

    const std::vector<std::string> shares{share_name, percentEncode(share_name)};

    std::vector<std::string> result;
    for (const auto& host_name : hosts)
    {
        for (const auto& share : shares)
        {
            addCandidate(result, fmt::format("{}/{}", host_name, share));
            addCandidate(result, fmt::format("{}:{}/{}", host_name, port, share));
        }
    }
    return result;
}

bool RemoteIdentity::matches(const MountEntry& entry) const
{
    if (!isProtocolFsType(protocol, entry.fs_type))
    {
        return false;
    }

    const auto source = common::toLower(entry.source);
    for (const auto& candidate : candidates())
    {
        if (containsAsComponent(source, candidate))
        {
            return true;
        }
    }
    return false;
}

std::string percentEncode(const std::string& str)
{
    static const char* const safe_chars = "_.-~()*!'";

    std::string result;
    for (const char ch : str)
    {
        const auto uch = static_cast<unsigned char>(ch);
        if ((std::isalnum(uch) != 0) || ((ch != '\0') && (std::strchr(safe_chars, ch) != nullptr)))
        {
            result += ch;
        }
        else
        {
            result += fmt::format("%{:02X}", uch);
        }
    }
    return result;
}

bool isProtocolFsType(const MountProtocol protocol, const std::string& fs_type)
{
    switch (protocol)
    {
    case MountProtocol::Smb:
        return (fs_type == "cifs") || (fs_type == "smb3") || (fs_type == "smbfs");
    case MountProtocol::Afp:
        return (fs_type == "afpfs") || (fs_type == "fuse.afpfs");
    }
    return false;
}

}  // namespace mount
}  // namespace sdk
}  // namespace dpxfer
