// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace toolbridge
{

namespace
{

    /// Interval at which blocked readers re-check whether the transport was closed.
    constexpr auto PollIntervalMs = 100;

    void ignoreSigpipeOnce()
    {
        static auto flag = std::once_flag {};
        std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto environmentKey(std::string_view entry) -> std::string_view
    {
        auto const eq = entry.find('=');
        return eq == std::string_view::npos ? entry : entry.substr(0, eq);
    }

} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;

    std::atomic<bool> connected = false;
    std::atomic<bool> closing = false;
    std::mutex processMutex;

    std::string stdoutBuffer;
    std::string stderrBuffer;

    /// @brief Reads one newline-terminated line from a pipe.
    ///
    /// Polls with a short interval so that close() from another thread is noticed.
    auto readLine(int fd, std::string& buffer) -> Result<std::string>
    {
        while (true)
        {
            auto const newlinePos = buffer.find('\n');
            if (newlinePos != std::string::npos)
            {
                auto line = buffer.substr(0, newlinePos);
                buffer.erase(0, newlinePos + 1);
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                return line;
            }

            if (closing || fd < 0)
                return makeError(ErrorCode::TransportError, "Transport closed");

            auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&pfd, 1, PollIntervalMs);
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                return makeError(ErrorCode::TransportError, std::format("poll failed: {}", std::strerror(errno)));
            }
            if (ready == 0)
                continue;

            auto buf = std::array<char, 4096> {};
            auto const bytesRead = ::read(fd, buf.data(), buf.size());
            if (bytesRead < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                return makeError(ErrorCode::TransportError, std::format("read failed: {}", std::strerror(errno)));
            }
            if (bytesRead == 0)
                return makeError(ErrorCode::TransportError, "Process stream closed");

            buffer.append(buf.data(), static_cast<size_t>(bytesRead));
        }
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
    closeFd(_impl->stdinWrite);
    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected || _impl->childPid > 0)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    if (config.command.empty())
        return makeError(ErrorCode::SpawnError, "No command configured");

    ignoreSigpipeOnce();

    // Parent-side ends are close-on-exec so that sibling servers never inherit them.
    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::SpawnError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::SpawnError, "Failed to create stdout pipe");
    }
    if (::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return makeError(ErrorCode::SpawnError, "Failed to create stderr pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment: inherited entries, with configured keys taking precedence
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view { *e };
            if (!config.env.contains(std::string(environmentKey(entry))))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        return makeError(ErrorCode::SpawnError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    {
        auto const lock = std::lock_guard { _impl->processMutex };
        _impl->childPid = pid;
        _impl->stdinWrite = stdinPipe[1];
        _impl->stdoutRead = stdoutPipe[0];
        _impl->stderrRead = stderrPipe[0];
        _impl->closing = false;
        _impl->connected = true;
    }

    log::debug("Tool server process started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        }
        offset += static_cast<size_t>(written);
    }

    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    while (true)
    {
        auto line = _impl->readLine(_impl->stdoutRead, _impl->stdoutBuffer);
        if (!line)
        {
            _impl->connected = false;
            return std::unexpected(line.error());
        }

        if (line->find_first_not_of(" \t") == std::string::npos)
            continue;

        return json::parse(*line);
    }
}

auto StdioTransport::receiveDiagnostic() -> Result<std::string>
{
    if (_impl->stderrRead < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    return _impl->readLine(_impl->stderrRead, _impl->stderrBuffer);
}

void StdioTransport::close()
{
    auto const lock = std::lock_guard { _impl->processMutex };

    _impl->closing = true;
    _impl->connected = false;

    // File descriptors stay open until destruction; reader threads may still be polling them.
    if (_impl->childPid > 0)
    {
        ::kill(_impl->childPid, SIGKILL);
        int status;
        ::waitpid(_impl->childPid, &status, 0);
        log::debug("Tool server process {} terminated", _impl->childPid);
        _impl->childPid = -1;
    }
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::processId() const -> int
{
    auto const lock = std::lock_guard { _impl->processMutex };
    return _impl->childPid;
}

} // namespace toolbridge
