// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Child process handle for the solver program (POSIX fork/exec).

#pragma once

#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace recede::session {

/// Move-only owner of a child process. A still-running child is killed and
/// reaped on destruction.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    /// Start `executable` (resolved through PATH) with `args`.
    /// Throws std::system_error when fork fails. A failed exec shows up as
    /// the child exiting with code 127.
    [[nodiscard]] static ChildProcess spawn(const std::string& executable,
                                            const std::vector<std::string>& args);

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /// Non-blocking liveness probe; reaps the child once it has exited.
    [[nodiscard]] bool isRunning();

    /// Exit code once the child has exited normally.
    [[nodiscard]] std::optional<int> exitCode() const noexcept { return exit_code_; }

    void terminate() noexcept;   // SIGTERM
    void kill() noexcept;        // SIGKILL

private:
    explicit ChildProcess(pid_t pid) noexcept : pid_(pid) {}

    void release() noexcept;

    pid_t pid_{-1};
    bool reaped_{false};
    std::optional<int> exit_code_;
};

}  // namespace recede::session
