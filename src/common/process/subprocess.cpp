//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "subprocess.hpp"

#include "io/io.hpp"
#include "logging.hpp"

#include <dpxfer/platform/posix_utils.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;  // NOLINT(readability-redundant-declaration)

namespace dpxfer
{
namespace common
{
namespace process
{
namespace
{

constexpr int ExecFailureStatus = 127;
constexpr int SignalStatusBase  = 128;

struct Pipe final
{
    io::OwnFd read_end;
    io::OwnFd write_end;
};

int makePipe(Pipe& pipe)
{
    std::array<int, 2> fds{-1, -1};
    if (::pipe2(fds.data(), O_CLOEXEC) < 0)
    {
        return errno;
    }
    pipe.read_end  = io::OwnFd{fds[0]};
    pipe.write_end = io::OwnFd{fds[1]};
    return 0;
}

/// Inherited environment, with the request's variables replacing same-named ones.
///
std::vector<std::string> buildEnvironment(const ProcessRequest& request)
{
    std::vector<std::string> result;
    for (char** entry = environ; (entry != nullptr) && (*entry != nullptr); ++entry)  // NOLINT
    {
        const std::string entry_str{*entry};
        const auto        eq_pos = entry_str.find('=');
        const auto        name   = entry_str.substr(0, eq_pos);
        bool              is_overridden = false;
        for (const auto& var : request.env)
        {
            is_overridden = is_overridden || (var.first == name);
        }
        if (!is_overridden)
        {
            result.push_back(entry_str);
        }
    }
    for (const auto& var : request.env)
    {
        result.push_back(var.first + "=" + var.second);
    }
    return result;
}

std::vector<char*> toCStrings(std::vector<std::string>& strings)
{
    std::vector<char*> result;
    result.reserve(strings.size() + 1);
    for (auto& str : strings)
    {
        result.push_back(&str[0]);
    }
    result.push_back(nullptr);
    return result;
}

/// Drains both child outputs until EOF on each of them.
///
int drainOutputs(io::OwnFd& out_fd, io::OwnFd& err_fd, RunProcess::Success& success)
{
    std::array<char, 4096> buffer{};  // NOLINT(*-magic-numbers)
    while (out_fd.isValid() || err_fd.isValid())
    {
        std::array<pollfd, 2> poll_fds{pollfd{out_fd.get(), POLLIN, 0}, pollfd{err_fd.get(), POLLIN, 0}};
        if (const auto err = platform::posixSyscallError([&poll_fds] {
                //
                return ::poll(poll_fds.data(), poll_fds.size(), -1);
            }))
        {
            return err;
        }

        const auto drainOne = [&buffer](io::OwnFd& fd, const short revents, std::string& sink) {
            //
            if ((revents & (POLLIN | POLLHUP | POLLERR)) == 0)
            {
                return 0;
            }
            ssize_t read_size = 0;
            if (const auto err = platform::posixSyscallError([&fd, &buffer, &read_size] {
                    //
                    read_size = ::read(fd.get(), buffer.data(), buffer.size());
                    return read_size;
                }))
            {
                return err;
            }
            if (read_size == 0)
            {
                fd.reset();
                return 0;
            }
            sink.append(buffer.data(), static_cast<std::size_t>(read_size));
            return 0;
        };

        // `poll` ignores negative descriptors, so an already closed stream just reports nothing.
        if (const auto err = drainOne(out_fd, poll_fds[0].revents, success.output))
        {
            return err;
        }
        if (const auto err = drainOne(err_fd, poll_fds[1].revents, success.errors))
        {
            return err;
        }
    }
    return 0;
}

}  // namespace

RunProcess::Result runProcess(const ProcessRequest& request)
{
    const auto logger = getLogger("io");

    if (request.argv.empty())
    {
        return EINVAL;
    }

    Pipe in_pipe;
    Pipe out_pipe;
    Pipe err_pipe;
    if (const auto err = makePipe(in_pipe))
    {
        return err;
    }
    if (const auto err = makePipe(out_pipe))
    {
        return err;
    }
    if (const auto err = makePipe(err_pipe))
    {
        return err;
    }

    // Everything the child needs is prepared before `fork`, so the child only does async-signal-safe calls.
    auto args     = request.argv;
    auto env_strs = buildEnvironment(request);
    auto c_args   = toCStrings(args);
    auto c_env    = toCStrings(env_strs);

    logger->debug("Running '{}' (args={}).", request.argv.front(), request.argv.size() - 1);

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const int err = errno;
        logger->error("Failed to fork: {}.", std::strerror(err));
        return err;
    }
    if (pid == 0)
    {
        ::dup2(in_pipe.read_end.get(), STDIN_FILENO);
        ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end.get(), STDERR_FILENO);
        ::execvpe(c_args.front(), c_args.data(), c_env.data());
        ::_exit(ExecFailureStatus);
    }

    // Parent keeps only its own pipe ends.
    in_pipe.read_end.reset();
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();

    // SIGPIPE would kill us if the child exits without reading its stdin.
    struct sigaction ignore_action
    {};
    struct sigaction previous_action
    {};
    ignore_action.sa_handler = SIG_IGN;
    ::sigaction(SIGPIPE, &ignore_action, &previous_action);

    if (!request.stdin_text.empty())
    {
        // EPIPE just means the child didn't want its input; its exit status tells the rest.
        const auto feed_err = io::writeAll(in_pipe.write_end, request.stdin_text.data(), request.stdin_text.size());
        if ((feed_err != 0) && (feed_err != EPIPE))
        {
            logger->warn("Failed to feed child stdin (err={}).", feed_err);
        }
    }
    in_pipe.write_end.reset();

    RunProcess::Success success{0, {}, {}};
    const auto          io_error = drainOutputs(out_pipe.read_end, err_pipe.read_end, success);

    ::sigaction(SIGPIPE, &previous_action, nullptr);

    int status = 0;
    if (const auto err = platform::posixSyscallError([pid, &status] {
            //
            return ::waitpid(pid, &status, 0);
        }))
    {
        logger->error("Failed to wait for child (pid={}): {}.", pid, std::strerror(err));
        return err;
    }
    if (io_error != 0)
    {
        logger->error("Failed to read child output (pid={}): {}.", pid, std::strerror(io_error));
        return io_error;
    }

    if (WIFEXITED(status))
    {
        success.exit_status = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        success.exit_status = SignalStatusBase + WTERMSIG(status);
    }
    logger->debug("Child '{}' exited (pid={}, status={}).", request.argv.front(), pid, success.exit_status);
    return success;
}

}  // namespace process
}  // namespace common
}  // namespace dpxfer
