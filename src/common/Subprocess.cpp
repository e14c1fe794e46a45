// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Toolgate a resilient tool-serving process.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "common/Subprocess.hpp"
#include "common/Context.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolgate {

namespace {

constexpr int pollIntervalMs = 50;

Error systemError(const std::string& what) {
    return Error {ErrorCode::Internal, what + ": " + std::strerror(errno)};
}

int waitChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::expected<ProcessResult, Error> runProcess(
    const Context& ctx,
    const std::vector<std::string>& argv,
    const std::string& workingDir) {
    if (argv.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "empty command"}};
    }
    if (auto err = ctx.err(); err.has_value()) {
        return std::unexpected {err.value()};
    }
    // Built before fork(): the child must not allocate.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);
    const char* dir = workingDir.empty() ? nullptr : workingDir.c_str();

    std::array<int, 2> out {};
    if (pipe2(out.data(), O_CLOEXEC) == -1) {
        return std::unexpected {systemError("pipe")};
    }
    const pid_t pid = fork();
    if (pid < 0) {
        close(out[0]);
        close(out[1]);
        return std::unexpected {systemError("fork")};
    }
    if (pid == 0) {
        dup2(out[1], STDOUT_FILENO);
        dup2(out[1], STDERR_FILENO);
        if (dir != nullptr && chdir(dir) == -1) {
            _exit(127);
        }
        execvp(args[0], args.data());
        _exit(127);
    }
    close(out[1]);

    ProcessResult result {0, ""};
    std::array<char, 4096> buf {};
    pollfd pfd {out[0], POLLIN, 0};
    for (;;) {
        if (auto err = ctx.err(); err.has_value()) {
            kill(pid, SIGKILL);
            close(out[0]);
            std::ignore = waitChild(pid);
            spdlog::debug("Killed {} (pid {}): {}", argv[0], pid, err->what);
            return std::unexpected {err.value()};
        }
        const int ready = poll(&pfd, 1, pollIntervalMs);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            auto e = systemError("poll");
            kill(pid, SIGKILL);
            close(out[0]);
            std::ignore = waitChild(pid);
            return std::unexpected {e};
        }
        if (ready == 0) {
            continue;
        }
        const ssize_t n = read(out[0], buf.data(), buf.size());
        if (n > 0) {
            result.output.append(buf.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        break;
    }
    close(out[0]);
    result.exitCode = waitChild(pid);
    if (result.exitCode == -1) {
        return std::unexpected {systemError("waitpid")};
    }
    return result;
}

} // namespace toolgate
