//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessSupervisor.cpp
// Purpose: fork/exec based tool-host supervision
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <atomic>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "websearch/ProcessSupervisor.hpp"
#include "websearch/errors/Errors.h"

extern char** environ;

namespace websearch {

namespace {

std::once_flag sigpipeOnce;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string errnoText(int err) {
    return std::string(::strerror(err));
}

// Builds "KEY=VALUE" entries: inherited environment first, overridden by the spec's pairs.
std::vector<std::string> buildEnvironment(const ProcessSpec& spec) {
    std::map<std::string, std::string> merged;
    if (spec.inheritEnvironment && environ != nullptr) {
        for (char** e = environ; *e != nullptr; ++e) {
            std::string entry(*e);
            auto eq = entry.find('=');
            if (eq == std::string::npos) continue;
            merged[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    for (const auto& [k, v] : spec.env) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}

std::vector<char*> toPointers(std::vector<std::string>& items) {
    std::vector<char*> ptrs;
    ptrs.reserve(items.size() + 1);
    for (auto& s : items) {
        ptrs.push_back(s.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

ExitStatus statusFromSiginfo(const siginfo_t& info) {
    ExitStatus st;
    if (info.si_code == CLD_EXITED) {
        st.exitCode = info.si_status;
    } else {
        st.signal = info.si_status;
    }
    return st;
}

} // namespace

const char* toString(StderrMode mode) {
    switch (mode) {
        case StderrMode::Log: return "log";
        case StderrMode::Discard: return "discard";
        case StderrMode::Inherit: return "inherit";
    }
    return "log";
}

std::string ExitStatus::Describe() const {
    if (signal != 0) {
        const char* name = ::strsignal(signal);
        return fmt::format("killed by signal {} ({})", signal, name ? name : "unknown");
    }
    if (exitCode < 0) {
        return "exit status unknown";
    }
    return fmt::format("exit code {}", exitCode);
}

//==========================================================================================================
// ChildProcess::Impl
//==========================================================================================================
class ChildProcess::Impl {
public:
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};

    std::atomic<bool> exited{false};
    std::atomic<bool> stopping{false};
    bool reaped{false};
    ExitStatus status;

    std::promise<ExitStatus> exitPromise;
    std::shared_future<ExitStatus> exitFuture{exitPromise.get_future().share()};

    std::mutex mutex;  // guards reaping, stdinFd and status
    std::thread watcherThread;
    std::thread stderrThread;

    void startWatcher() {
        watcherThread = std::thread([this]() {
            siginfo_t info;
            std::memset(&info, 0, sizeof(info));
            int rc;
            do {
                rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
            } while (rc != 0 && errno == EINTR);
            ExitStatus st;
            if (rc == 0) {
                st = statusFromSiginfo(info);
            } else {
                LOG_WARN("ProcessSupervisor: waitid failed for pid {} (errno={} msg={})", pid, errno, errnoText(errno));
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                status = st;
            }
            exited.store(true);
            LOG_INFO("ProcessSupervisor: tool host pid {} terminated ({})", pid, st.Describe());
            exitPromise.set_value(st);
        });
    }

    // Drains the child's stderr into the log with a bounded poll so Stop() never waits on a grandchild
    // that inherited the pipe.
    void startStderrDrain() {
        if (stderrFd < 0) return;
        stderrThread = std::thread([this]() {
            std::string pending;
            char buf[4096];
            while (true) {
                struct pollfd pfd{};
                pfd.fd = stderrFd;
                pfd.events = POLLIN;
                int rc = ::poll(&pfd, 1, 100);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    break;
                }
                if (rc == 0) {
                    if (stopping.load() && exited.load()) break;
                    continue;
                }
                ssize_t n = ::read(stderrFd, buf, sizeof(buf));
                if (n < 0) {
                    if (errno == EINTR || errno == EAGAIN) continue;
                    break;
                }
                if (n == 0) break;
                pending.append(buf, static_cast<std::size_t>(n));
                std::size_t nl;
                while ((nl = pending.find('\n')) != std::string::npos) {
                    std::string line = pending.substr(0, nl);
                    pending.erase(0, nl + 1);
                    if (!line.empty() && line.back() == '\r') line.pop_back();
                    if (!line.empty()) {
                        LOG_INFO("tool-host[{}]: {}", pid, line);
                    }
                }
            }
            if (!pending.empty()) {
                LOG_INFO("tool-host[{}]: {}", pid, pending);
            }
        });
    }

    // Caller holds mutex.
    void reapLocked() {
        if (reaped) return;
        int rc;
        do {
            rc = ::waitpid(pid, nullptr, 0);
        } while (rc < 0 && errno == EINTR);
        reaped = true;
    }

    ~Impl() {
        stopping.store(true);
        if (pid > 0) {
            std::lock_guard<std::mutex> lock(mutex);
            if (!exited.load() && !reaped) {
                LOG_WARN("ProcessSupervisor: killing still-running tool host pid {}", pid);
                ::kill(pid, SIGKILL);
            }
        }
        if (watcherThread.joinable()) watcherThread.join();
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (pid > 0) reapLocked();
            closeFd(stdinFd);
        }
        if (stderrThread.joinable()) stderrThread.join();
        closeFd(stdoutFd);
        closeFd(stderrFd);
    }
};

ChildProcess::ChildProcess(Key) : pImpl(std::make_unique<Impl>()) {}
ChildProcess::~ChildProcess() = default;

int ChildProcess::Pid() const { return static_cast<int>(pImpl->pid); }

int ChildProcess::StdinFd() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stdinFd;
}

int ChildProcess::StdoutFd() const { return pImpl->stdoutFd; }
bool ChildProcess::HasExited() const { return pImpl->exited.load(); }
std::shared_future<ExitStatus> ChildProcess::ExitFuture() const { return pImpl->exitFuture; }

void ChildProcess::CloseStdin() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    closeFd(pImpl->stdinFd);
}

//==========================================================================================================
// ProcessSupervisor
//==========================================================================================================
std::unique_ptr<ChildProcess> ProcessSupervisor::Start(const ProcessSpec& spec) {
    FUNC_SCOPE();
    if (spec.executable.empty()) {
        throw errors::SpawnError("tool host executable is not configured");
    }

    // A dead child must surface as EPIPE on write, never as a fatal signal in the bridge.
    std::call_once(sigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });

    // Everything the child needs is built before fork; only async-signal-safe calls run after it.
    std::vector<std::string> argvStore;
    argvStore.reserve(spec.args.size() + 1);
    argvStore.push_back(spec.executable);
    argvStore.insert(argvStore.end(), spec.args.begin(), spec.args.end());
    std::vector<std::string> envStore = buildEnvironment(spec);
    std::vector<char*> argv = toPointers(argvStore);
    std::vector<char*> envp = toPointers(envStore);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    int devNull = -1;

    auto cleanup = [&]() {
        closeFd(inPipe[0]); closeFd(inPipe[1]);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(execPipe[0]); closeFd(execPipe[1]);
        closeFd(devNull);
    };

    auto failPipe = [&](const char* what) {
        int err = errno;
        cleanup();
        throw errors::SpawnError(fmt::format("{} failed: {}", what, errnoText(err)), err);
    };

    if (::pipe2(inPipe, O_CLOEXEC) != 0) failPipe("pipe2(stdin)");
    if (::pipe2(outPipe, O_CLOEXEC) != 0) failPipe("pipe2(stdout)");
    if (::pipe2(execPipe, O_CLOEXEC) != 0) failPipe("pipe2(exec status)");
    if (spec.stderrMode == StderrMode::Log) {
        if (::pipe2(errPipe, O_CLOEXEC) != 0) failPipe("pipe2(stderr)");
    } else if (spec.stderrMode == StderrMode::Discard) {
        devNull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (devNull < 0) failPipe("open(/dev/null)");
    }

    const char* workDir = spec.workingDirectory.empty() ? nullptr : spec.workingDirectory.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        failPipe("fork");
    }
    if (pid == 0) {
        // Child
        ::signal(SIGPIPE, SIG_DFL);
        int errTarget = spec.stderrMode == StderrMode::Log ? errPipe[1]
                      : spec.stderrMode == StderrMode::Discard ? devNull : -1;
        bool ok = ::dup2(inPipe[0], STDIN_FILENO) >= 0 && ::dup2(outPipe[1], STDOUT_FILENO) >= 0;
        if (ok && errTarget >= 0) {
            ok = ::dup2(errTarget, STDERR_FILENO) >= 0;
        }
        if (ok && workDir != nullptr) {
            ok = ::chdir(workDir) == 0;
        }
        if (ok) {
            ::execvpe(argv[0], argv.data(), envp.data());
        }
        int err = errno;
        ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent: drop the child's ends
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);
    closeFd(devNull);

    // The exec pipe closes on a successful exec; an errno arrives otherwise.
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);
    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int rc;
        do {
            rc = ::waitpid(pid, nullptr, 0);
        } while (rc < 0 && errno == EINTR);
        cleanup();
        LOG_ERROR("ProcessSupervisor: failed to launch '{}': {}", spec.executable, errnoText(childErr));
        throw errors::SpawnError(
            fmt::format("failed to launch '{}': {}", spec.executable, errnoText(childErr)), childErr);
    }

    auto child = std::make_unique<ChildProcess>(ChildProcess::Key{});
    auto& impl = *child->pImpl;
    impl.pid = pid;
    impl.stdinFd = inPipe[1];
    impl.stdoutFd = outPipe[0];
    impl.stderrFd = errPipe[0];
    inPipe[1] = -1;
    outPipe[0] = -1;
    errPipe[0] = -1;

    impl.startWatcher();
    impl.startStderrDrain();
    LOG_INFO("ProcessSupervisor: started '{}' pid {} (stderr={})", spec.executable, pid, toString(spec.stderrMode));
    return child;
}

std::shared_future<ExitStatus> ProcessSupervisor::Watch(const ChildProcess& child) {
    return child.ExitFuture();
}

ExitStatus ProcessSupervisor::Stop(ChildProcess& child, std::chrono::milliseconds grace) {
    FUNC_SCOPE();
    auto& impl = *child.pImpl;
    {
        std::lock_guard<std::mutex> lock(impl.mutex);
        if (impl.reaped) {
            return impl.status;
        }
        closeFd(impl.stdinFd);
        impl.stopping.store(true);
        if (!impl.exited.load()) {
            LOG_DEBUG("ProcessSupervisor: SIGTERM to pid {}", impl.pid);
            ::kill(impl.pid, SIGTERM);
        }
    }

    auto fut = impl.exitFuture;
    if (fut.wait_for(grace) != std::future_status::ready) {
        LOG_WARN("ProcessSupervisor: pid {} still running after {} ms; sending SIGKILL",
                 impl.pid, static_cast<long long>(grace.count()));
        std::lock_guard<std::mutex> lock(impl.mutex);
        if (!impl.exited.load()) {
            ::kill(impl.pid, SIGKILL);
        }
    }
    ExitStatus st = fut.get();

    std::lock_guard<std::mutex> lock(impl.mutex);
    impl.reapLocked();
    return st;
}

} // namespace websearch
