//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_SDK_REPOSITORY_CONFIG_HPP_INCLUDED
#define DPXFER_SDK_REPOSITORY_CONFIG_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>

namespace dpxfer
{
namespace sdk
{

enum class RepositoryKind : std::uint8_t
{
    Afp,
    Smb,
    Local,
    LegacyUpload,
    Cloud,
};

/// Returns the configuration spelling of the kind ("AFP", "SMB", "Local", "LegacyUpload", "Cloud").
///
const char* toString(const RepositoryKind kind) noexcept;

/// Parses the configuration spelling of a kind (case-insensitive).
///
cetl::optional<RepositoryKind> parseRepositoryKind(const std::string& str);

/// Connection fields shared by the mountable network shares.
///
struct NetworkShare
{
    std::string   host;
    std::uint16_t port{0};  // 0 means the protocol default
    std::string   share_name;
    std::string   username;
    std::string   password;
    std::string   mount_point;
    bool          invisible{false};  // keep the volume out of interactive file browsers
};

struct AfpShare final : NetworkShare
{
    static constexpr std::uint16_t DefaultPort = 548;
};

struct SmbShare final : NetworkShare
{
    static constexpr std::uint16_t DefaultPort = 139;

    std::string domain;
};

/// A repository which is already reachable as a local directory.
///
struct LocalShare final
{
    std::string mount_point;
    std::string share_name;
};

/// The management server stores payloads in its database; the session comes from the catalog collaborator.
///
struct LegacyUpload final
{
    std::string destination{"1"};
};

/// S3-compatible object storage bucket.
///
struct CloudBucket final
{
    std::string bucket;
    std::string region;
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;  // optional
    std::string endpoint;       // optional, enables path-style addressing
    std::string key_prefix;     // optional
};

/// Immutable description of one configured backend.
///
struct RepositoryConfig final
{
    using Connection = cetl::variant<AfpShare, SmbShare, LocalShare, LegacyUpload, CloudBucket>;

    Connection                  connection;
    cetl::optional<std::string> display_name;

    RepositoryKind getKind() const noexcept;

    /// Display name if configured, otherwise "<kind>:<host or bucket>/<share>".
    ///
    std::string getName() const;
};

}  // namespace sdk
}  // namespace dpxfer

#endif  // DPXFER_SDK_REPOSITORY_CONFIG_HPP_INCLUDED
