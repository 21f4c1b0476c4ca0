//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mount_handle.hpp"

#include "logging.hpp"
#include "mount_table.hpp"
#include "process/subprocess.hpp"
#include "remote_identity.hpp"

#include <dpxfer/platform/posix_utils.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>
#include <netdb.h>
#include <string>
#include <sys/mount.h>
#include <sys/socket.h>
#include <sys/stat.h>
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

class PosixMountHandle final : public MountHandle
{
public:
    explicit PosixMountHandle(Options options)
        : options_{std::move(options)}
        , logger_{common::getLogger("mount")}
    {
    }

    // MountHandle

    QueryMounts::Result queryMounts() override
    {
        return readMountTable(options_.mount_tables);
    }

    Mount::Result mount(const MountRequest& request) override
    {
        if (const auto err = makeMountPoint(request.mount_point))
        {
            logger_->error("Failed to create mount point '{}': {}.", request.mount_point, std::strerror(err));
            return Mount::Failure{err, fmt::format("can't create mount point '{}'", request.mount_point)};
        }

        const auto process_request = (request.protocol == MountProtocol::Smb) ? makeSmbCommand(request)
                                                                                : makeAfpCommand(request);
        logger_->info("Mounting '{}:{}/{}' on '{}'...",
                      request.host,
                      request.port,
                      request.share_name,
                      request.mount_point);

        auto run_result = common::process::runProcess(process_request);
        if (const auto* const err = cetl::get_if<common::process::RunProcess::Failure>(&run_result))
        {
            logger_->error("Failed to run mount helper '{}': {}.", process_request.argv.front(), std::strerror(*err));
            return Mount::Failure{*err, fmt::format("can't run '{}'", process_request.argv.front())};
        }
        const auto& run = cetl::get<common::process::RunProcess::Success>(run_result);
        if (run.exit_status != 0)
        {
            auto message = trimmed(run.errors);
            logger_->error("Mount helper failed (status={}, stderr='{}').", run.exit_status, message);
            if (message.empty())
            {
                message = fmt::format("'{}' exited with status {}", process_request.argv.front(), run.exit_status);
            }
            return Mount::Failure{EIO, std::move(message)};
        }

        logger_->info("Mounted on '{}'.", request.mount_point);
        return request.mount_point;
    }

    int unmount(const std::string& target, const bool forced) override
    {
        const int flags = forced ? (MNT_FORCE | MNT_DETACH) : 0;
        if (const auto err = platform::posixSyscallError([&target, flags] {
                //
                return ::umount2(target.c_str(), flags);
            }))
        {
            logger_->warn("Failed to unmount '{}' (forced={}): {}.", target, forced, std::strerror(err));
            return err;
        }
        logger_->info("Unmounted '{}' (forced={}).", target, forced);
        return 0;
    }

    std::vector<std::string> resolveHostAliases(const std::string& host) override
    {
        std::vector<std::string> aliases;

        addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags    = AI_CANONNAME;

        addrinfo* raw_info = nullptr;
        if (const int gai_err = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw_info))
        {
            logger_->debug("Can't resolve host '{}': {}.", host, ::gai_strerror(gai_err));
            return aliases;
        }
        const std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> info{raw_info, &::freeaddrinfo};

        if (info->ai_canonname != nullptr)
        {
            addAlias(aliases, info->ai_canonname);
        }
        std::array<char, NI_MAXHOST> name_buf{};
        if (0 == ::getnameinfo(info->ai_addr,
                               info->ai_addrlen,
                               name_buf.data(),
                               name_buf.size(),
                               nullptr,
                               0,
                               NI_NUMERICHOST))
        {
            addAlias(aliases, name_buf.data());
        }
        if (0 == ::getnameinfo(info->ai_addr, info->ai_addrlen, name_buf.data(), name_buf.size(), nullptr, 0, 0))
        {
            addAlias(aliases, name_buf.data());
        }

        // Short names of the fully qualified ones.
        const auto full_names = aliases;
        for (const auto& name : full_names)
        {
            const auto dot_pos = name.find('.');
            if ((dot_pos != std::string::npos) && (dot_pos > 0) && !std::isdigit(static_cast<unsigned char>(name[0])))
            {
                addAlias(aliases, name.substr(0, dot_pos));
            }
        }

        logger_->trace("Host '{}' aliases: {}.", host, fmt::join(aliases, ", "));
        return aliases;
    }

private:
    static void addAlias(std::vector<std::string>& aliases, std::string alias)
    {
        if (!alias.empty() && (std::find(aliases.begin(), aliases.end(), alias) == aliases.end()))
        {
            aliases.push_back(std::move(alias));
        }
    }

    static std::string trimmed(const std::string& str)
    {
        const auto first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
        {
            return {};
        }
        const auto last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    static int makeMountPoint(const std::string& path)
    {
        constexpr mode_t mode = 0755;
        if (const auto err = platform::posixSyscallError([&path] {
                //
                return ::mkdir(path.c_str(), mode);
            }))
        {
            return (err == EEXIST) ? 0 : err;
        }
        return 0;
    }

    common::process::ProcessRequest makeSmbCommand(const MountRequest& request) const
    {
        auto options = fmt::format("username={},port={}", request.username, request.port);
        if (!request.domain.empty())
        {
            options += fmt::format(",domain={}", request.domain);
        }
        if (request.invisible)
        {
            options += ",x-gvfs-hide";
        }

        common::process::ProcessRequest process_request;
        process_request.argv = {options_.smb_mount_program,
                                "-t",
                                "cifs",
                                fmt::format("//{}/{}", request.host, request.share_name),
                                request.mount_point,
                                "-o",
                                options};
        // `mount.cifs` takes the password from the environment, which keeps it out of the process list.
        process_request.env.emplace_back("PASSWD", request.password);
        return process_request;
    }

    common::process::ProcessRequest makeAfpCommand(const MountRequest& request) const
    {
        if (request.invisible)
        {
            logger_->debug("AFP mount helper has no option to hide the volume; ignoring 'invisible'.");
        }

        common::process::ProcessRequest process_request;
        process_request.argv = {options_.afp_mount_program,
                                fmt::format("afp://{}:{}@{}:{}/{}",
                                            percentEncode(request.username),
                                            percentEncode(request.password),
                                            request.host,
                                            request.port,
                                            percentEncode(request.share_name)),
                                request.mount_point};
        return process_request;
    }

    const Options           options_;
    const common::LoggerPtr logger_;

};  // PosixMountHandle

}  // namespace

MountHandle::Ptr MountHandle::make()
{
    return make(Options{});
}

MountHandle::Ptr MountHandle::make(Options options)
{
    return std::make_unique<PosixMountHandle>(std::move(options));
}

}  // namespace mount
}  // namespace sdk
}  // namespace dpxfer
