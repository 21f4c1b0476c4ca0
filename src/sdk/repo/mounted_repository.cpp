//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mounted_repository.hpp"

#include "common_helpers.hpp"
#include "io/io.hpp"
#include "logging.hpp"
#include "mount/mount_handle.hpp"
#include "mount/mount_table.hpp"
#include "mount/remote_identity.hpp"

#include <dpxfer/platform/posix_utils.hpp>
#include <dpxfer/sdk/errors.hpp>
#include <dpxfer/sdk/repository.hpp>
#include <dpxfer/sdk/repository_config.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace dpxfer
{
namespace sdk
{
namespace repo
{
namespace
{

constexpr int MaxMountPointSuffix = 100;

/// File operations shared by all mount-based backends; subclasses only know how to get mounted.
///
class MountedRepositoryBase : public MountedRepository
{
public:
    MountedRepositoryBase(std::string name, const RepositoryKind kind)
        : name_{std::move(name)}
        , kind_{kind}
        , logger_{common::getLogger("mount")}
    {
    }

    // Repository

    const std::string& getName() const override
    {
        return name_;
    }

    RepositoryKind getKind() const override
    {
        return kind_;
    }

    Copy::Result copy(const TransferRequest& request) override
    {
        struct stat source_stat
        {};
        if (const auto err = platform::posixStat(request.source_path, source_stat))
        {
            logger_->error("Can't access source '{}' (repo='{}'): {}.", request.source_path, name_, std::strerror(err));
            return TransferError{err, fmt::format("can't access source '{}'", request.source_path)};
        }
        if (S_ISDIR(source_stat.st_mode))
        {
            logger_->error("Rejected directory payload '{}' (repo='{}').", request.source_path, name_);
            return UnsupportedPayloadError{request.source_path,
                                           "directory (bundle) payloads can't be placed into a flat category "
                                           "directory; archive it into a single file first"};
        }

        auto maybe_dir = resolveCategoryPath(request.category);
        if (const auto* const err = cetl::get_if<ResolvePath::Failure>(&maybe_dir))
        {
            return *err;
        }
        const auto& category_dir = cetl::get<ResolvePath::Success>(maybe_dir);
        if (const auto err = makeDirectory(category_dir))
        {
            logger_->error("Can't create '{}' (repo='{}'): {}.", category_dir, name_, std::strerror(err));
            return TransferError{err, fmt::format("can't create directory '{}'", category_dir)};
        }

        const auto filename    = common::baseName(request.source_path);
        const auto target_path = fmt::format("{}/{}", category_dir, filename);
        if (const auto err = copyFile(request.source_path, category_dir, target_path))
        {
            logger_->error("Failed to copy '{}' → '{}' (repo='{}'): {}.",
                           request.source_path,
                           target_path,
                           name_,
                           std::strerror(err));
            return TransferError{err, fmt::format("can't copy to '{}'", target_path)};
        }

        logger_->info("Copied '{}' → '{}' (repo='{}').", request.source_path, target_path, name_);
        return Copy::Success{};
    }

    Existence exists(const std::string& filename, const Category category) override
    {
        if (!common::isPlainFileName(filename))
        {
            logger_->warn("Not a plain file name '{}' (repo='{}').", filename, name_);
            return Existence::Unknown;
        }

        auto maybe_dir = resolveCategoryPath(category);
        if (const auto* const err = cetl::get_if<ResolvePath::Failure>(&maybe_dir))
        {
            logger_->warn("Existence of '{}' is unknown (repo='{}'): {}.", filename, name_, describe(*err));
            return Existence::Unknown;
        }

        const auto  path = fmt::format("{}/{}", cetl::get<ResolvePath::Success>(maybe_dir), filename);
        struct stat file_stat
        {};
        const auto err = platform::posixStat(path, file_stat);
        if (err == 0)
        {
            return Existence::Present;
        }
        if ((err == ENOENT) || (err == ENOTDIR))
        {
            return Existence::Absent;
        }
        logger_->warn("Can't stat '{}' (repo='{}'): {}.", path, name_, std::strerror(err));
        return Existence::Unknown;
    }

    Remove::Result remove(const std::string& filename, const Category category) override
    {
        if (!common::isPlainFileName(filename))
        {
            return TransferError{EINVAL, fmt::format("'{}' is not a plain file name", filename)};
        }

        auto maybe_dir = resolveCategoryPath(category);
        if (const auto* const err = cetl::get_if<ResolvePath::Failure>(&maybe_dir))
        {
            return *err;
        }

        const auto path = fmt::format("{}/{}", cetl::get<ResolvePath::Success>(maybe_dir), filename);
        if (const auto err = platform::posixSyscallError([&path] {
                //
                return ::unlink(path.c_str());
            }))
        {
            if (err != ENOENT)
            {
                logger_->error("Failed to remove '{}' (repo='{}'): {}.", path, name_, std::strerror(err));
                return TransferError{err, fmt::format("can't remove '{}'", path)};
            }
            logger_->debug("Nothing to remove at '{}' (repo='{}').", path, name_);
            return Remove::Success{};
        }

        logger_->info("Removed '{}' (repo='{}').", path, name_);
        return Remove::Success{};
    }

    // FileRepository

    ResolvePath::Result resolveCategoryPath(const Category category) override
    {
        auto maybe_root = ensureMounted();
        if (const auto* const err = cetl::get_if<EnsureMounted::Failure>(&maybe_root))
        {
            return *err;
        }
        return fmt::format("{}/{}", cetl::get<EnsureMounted::Success>(maybe_root), categoryDirectory(category));
    }

    CETL_NODISCARD bool isMounted() const noexcept override
    {
        return state_.is_mounted;
    }

    // MountedRepository

    CETL_NODISCARD const MountState& getMountState() const noexcept override
    {
        return state_;
    }

protected:
    MountState& state()
    {
        return state_;
    }

    const std::string& name() const
    {
        return name_;
    }

    const common::LoggerPtr& logger() const
    {
        return logger_;
    }

private:
    static int makeDirectory(const std::string& path)
    {
        constexpr mode_t mode = 0755;
        const auto       err  = platform::posixSyscallError([&path] {
            //
            return ::mkdir(path.c_str(), mode);
        });
        return (err == EEXIST) ? 0 : err;
    }

    /// Writes into a hidden sibling first, and renames it into place only when complete.
    ///
    static int copyFile(const std::string& source_path, const std::string& dir, const std::string& target_path)
    {
        const int raw_src_fd = ::open(source_path.c_str(), O_RDONLY | O_CLOEXEC);  // NOLINT(*-vararg)
        if (raw_src_fd < 0)
        {
            return errno;
        }
        const common::io::OwnFd src_fd{raw_src_fd};

        std::string temp_path = fmt::format("{}/.{}.XXXXXX", dir, common::baseName(target_path));
        const int   raw_dst_fd = ::mkostemp(&temp_path[0], O_CLOEXEC);
        if (raw_dst_fd < 0)
        {
            return errno;
        }
        common::io::OwnFd dst_fd{raw_dst_fd};

        constexpr mode_t mode = 0644;
        int              err  = common::io::copyAll(src_fd, dst_fd);
        if ((err == 0) && (::fchmod(dst_fd.get(), mode) < 0))
        {
            err = errno;
        }
        if (err == 0)
        {
            err = dst_fd.close();
        }
        if ((err == 0) && (::rename(temp_path.c_str(), target_path.c_str()) < 0))
        {
            err = errno;
        }
        if (err != 0)
        {
            ::unlink(temp_path.c_str());
        }
        return err;
    }

    const std::string       name_;
    const RepositoryKind    kind_;
    const common::LoggerPtr logger_;
    MountState              state_;

};  // MountedRepositoryBase

/// AFP & SMB shares, reconciled against the live OS mount table.
///
class NetworkRepository final : public MountedRepositoryBase
{
public:
    NetworkRepository(std::string                 name,
                      const RepositoryKind        kind,
                      mount::MountRequest         request,
                      mount::MountHandle::Ptr     mount_handle)
        : MountedRepositoryBase{std::move(name), kind}
        , request_{std::move(request)}
        , mount_handle_{std::move(mount_handle)}
        , aliases_resolved_{false}
    {
        CETL_DEBUG_ASSERT(mount_handle_, "");

        state().remote_identity = mount::RemoteIdentity{request_.protocol,
                                                        request_.host,
                                                        request_.port,
                                                        request_.share_name,
                                                        {}};
    }

    // FileRepository

    EnsureMounted::Result ensureMounted() override
    {
        auto maybe_entries = mount_handle_->queryMounts();
        if (const auto* const err = cetl::get_if<mount::MountHandle::QueryMounts::Failure>(&maybe_entries))
        {
            markUnmounted();
            return MountError{*err, "can't read the OS mount table"};
        }
        const auto& entries = cetl::get<mount::MountHandle::QueryMounts::Success>(maybe_entries);

        if (const auto* const entry = findOwnMount(entries))
        {
            if (!state().is_mounted || (state().local_path != entry->target))
            {
                logger()->info("Adopting existing mount '{}' on '{}' (repo='{}').",
                               entry->source,
                               entry->target,
                               name());
            }
            state().local_path = entry->target;
            state().is_mounted = true;
            return entry->target;
        }

        auto request        = request_;
        request.mount_point = pickMountPoint(entries);

        auto maybe_mounted = mount_handle_->mount(request);
        if (const auto* const failure = cetl::get_if<mount::MountHandle::Mount::Failure>(&maybe_mounted))
        {
            markUnmounted();
            logger()->error("Failed to mount (repo='{}'): {}.", name(), failure->message);
            return MountError{failure->code, failure->message};
        }

        const auto& local_path = cetl::get<mount::MountHandle::Mount::Success>(maybe_mounted);
        state().local_path     = local_path;
        state().is_mounted     = true;
        return local_path;
    }

    Unmount::Result unmount(const bool forced) override
    {
        auto maybe_entries = mount_handle_->queryMounts();
        if (const auto* const err = cetl::get_if<mount::MountHandle::QueryMounts::Failure>(&maybe_entries))
        {
            return MountError{*err, "can't read the OS mount table"};
        }
        const auto& entries = cetl::get<mount::MountHandle::QueryMounts::Success>(maybe_entries);

        const auto* const entry = findOwnMount(entries);
        if (entry == nullptr)
        {
            logger()->debug("Nothing to unmount (repo='{}').", name());
            markUnmounted();
            return Unmount::Success{};
        }

        if (const auto err = mount_handle_->unmount(entry->target, forced))
        {
            return MountError{err, fmt::format("can't unmount '{}'", entry->target)};
        }
        markUnmounted();
        return Unmount::Success{};
    }

private:
    void markUnmounted()
    {
        state().is_mounted = false;
        state().local_path.reset();
    }

    const mount::RemoteIdentity& identity()
    {
        if (!aliases_resolved_)
        {
            state().remote_identity.host_aliases = mount_handle_->resolveHostAliases(request_.host);
            aliases_resolved_                    = true;
        }
        return state().remote_identity;
    }

    /// Mount of this repository's share; the one at the current local path wins over others.
    ///
    const mount::MountEntry* findOwnMount(const std::vector<mount::MountEntry>& entries)
    {
        const auto&              remote_identity = identity();
        const mount::MountEntry* found           = nullptr;
        for (const auto& entry : entries)
        {
            if (!remote_identity.matches(entry))
            {
                continue;
            }
            if (state().local_path == entry.target)
            {
                return &entry;
            }
            if (found == nullptr)
            {
                found = &entry;
            }
        }
        return found;
    }

    /// Configured mount point, or the first of its "-1", "-2"... variants not occupied by another mount.
    ///
    std::string pickMountPoint(const std::vector<mount::MountEntry>& entries) const
    {
        const auto isOccupied = [&entries](const std::string& path) {
            //
            for (const auto& entry : entries)
            {
                if (entry.target == path)
                {
                    return true;
                }
            }
            return false;
        };

        const auto& base = request_.mount_point;
        if (!isOccupied(base))
        {
            return base;
        }
        for (int suffix = 1; suffix < MaxMountPointSuffix; ++suffix)
        {
            auto candidate = fmt::format("{}-{}", base, suffix);
            if (!isOccupied(candidate))
            {
                logger()->info("Mount point '{}' is taken; using '{}' (repo='{}').", base, candidate, name());
                return candidate;
            }
        }
        return base;
    }

    const mount::MountRequest     request_;
    const mount::MountHandle::Ptr mount_handle_;
    bool                          aliases_resolved_;

};  // NetworkRepository

/// Plain local directory; it is "mounted" whenever the directory exists.
///
class LocalRepository final : public MountedRepositoryBase
{
public:
    LocalRepository(std::string name, LocalShare share)
        : MountedRepositoryBase{std::move(name), RepositoryKind::Local}
        , share_{std::move(share)}
    {
        state().remote_identity.share_name = share_.share_name;
    }

    // FileRepository

    EnsureMounted::Result ensureMounted() override
    {
        struct stat dir_stat
        {};
        int err = platform::posixStat(share_.mount_point, dir_stat);
        if ((err == 0) && !S_ISDIR(dir_stat.st_mode))
        {
            err = ENOTDIR;
        }
        if (err != 0)
        {
            state().is_mounted = false;
            state().local_path.reset();
            logger()->error("Local repository path '{}' is unusable (repo='{}'): {}.",
                            share_.mount_point,
                            name(),
                            std::strerror(err));
            return MountError{err, fmt::format("local path '{}' is not a directory", share_.mount_point)};
        }

        state().local_path = share_.mount_point;
        state().is_mounted = true;
        return share_.mount_point;
    }

    Unmount::Result unmount(const bool) override
    {
        state().is_mounted = false;
        state().local_path.reset();
        return Unmount::Success{};
    }

private:
    const LocalShare share_;

};  // LocalRepository

mount::MountRequest makeMountRequest(const mount::MountProtocol protocol,
                                     const NetworkShare&        share,
                                     const std::uint16_t        default_port,
                                     std::string                domain)
{
    auto mount_point = share.mount_point;
    if (mount_point.empty())
    {
        mount_point = fmt::format("/mnt/{}", share.share_name);
    }
    return mount::MountRequest{protocol,
                               share.host,
                               (share.port != 0) ? share.port : default_port,
                               share.share_name,
                               share.username,
                               share.password,
                               std::move(domain),
                               std::move(mount_point),
                               share.invisible};
}

}  // namespace

MountedRepository::Ptr MountedRepository::make(std::string             name,
                                               const AfpShare&         share,
                                               mount::MountHandle::Ptr mount_handle)
{
    return std::make_unique<NetworkRepository>(std::move(name),
                                               RepositoryKind::Afp,
                                               makeMountRequest(mount::MountProtocol::Afp,
                                                                share,
                                                                AfpShare::DefaultPort,
                                                                {}),
                                               std::move(mount_handle));
}

MountedRepository::Ptr MountedRepository::make(std::string             name,
                                               const SmbShare&         share,
                                               mount::MountHandle::Ptr mount_handle)
{
    return std::make_unique<NetworkRepository>(std::move(name),
                                               RepositoryKind::Smb,
                                               makeMountRequest(mount::MountProtocol::Smb,
                                                                share,
                                                                SmbShare::DefaultPort,
                                                                share.domain),
                                               std::move(mount_handle));
}

MountedRepository::Ptr MountedRepository::make(std::string name, const LocalShare& share)
{
    return std::make_unique<LocalRepository>(std::move(name), share);
}

}  // namespace repo
}  // namespace sdk
}  // namespace dpxfer
