//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessSupervisor.hpp
// Purpose: Tool-host subprocess lifecycle (spawn, exit detection, graceful then forceful stop)
//==========================================================================================================
#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace websearch {

// Where the child's diagnostic stream goes. It never shares the protocol stream.
enum class StderrMode {
    Log,      // drained line by line into the bridge logger
    Discard,  // /dev/null
    Inherit   // the bridge's own stderr
};

const char* toString(StderrMode mode);

struct ProcessSpec {
    std::string executable;  // resolved through PATH when it has no '/'
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;  // added to (or replacing) the inherited env
    bool inheritEnvironment = true;
    StderrMode stderrMode = StderrMode::Log;
    std::string workingDirectory;  // empty: inherit
};

struct ExitStatus {
    int exitCode = -1;  // valid when the process exited normally
    int signal = 0;     // terminating signal, 0 when it exited normally

    bool Exited() const { return signal == 0 && exitCode >= 0; }
    std::string Describe() const;
};

//==========================================================================================================
// ChildProcess
// Purpose: Owning handle to a running tool host.
// Notes:
//   - The exit watcher observes termination without reaping, so the pid stays valid for signals until
//     ProcessSupervisor::Stop() or the destructor reaps it.
//   - Destroying a still-running child kills it.
//==========================================================================================================
class ChildProcess {
public:
    // Only ProcessSupervisor can create a key, so only it constructs children.
    class Key {
        friend class ProcessSupervisor;
        Key() = default;
    };

    explicit ChildProcess(Key);
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    int Pid() const;
    int StdinFd() const;   // parent's write end, -1 after CloseStdin()
    int StdoutFd() const;  // parent's read end
    bool HasExited() const;

    // Single-fire exit event; ready once the process has terminated.
    std::shared_future<ExitStatus> ExitFuture() const;

    void CloseStdin();

private:
    friend class ProcessSupervisor;

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ProcessSupervisor
// Purpose: Starts, watches and stops tool-host processes.
//==========================================================================================================
class ProcessSupervisor {
public:
    //==========================================================================================================
    // Start
    // Purpose: Spawns the child with stdin/stdout connected to pipes owned by the returned handle.
    // Args:
    //   spec: Executable, arguments, environment and stderr routing.
    // Returns:
    //   The running child.
    // Throws:
    //   errors::SpawnError when pipes cannot be created, fork fails, or exec of the executable fails.
    //==========================================================================================================
    static std::unique_ptr<ChildProcess> Start(const ProcessSpec& spec);

    //==========================================================================================================
    // Watch
    // Purpose: Exit event for a started child, carrying its exit status.
    //==========================================================================================================
    static std::shared_future<ExitStatus> Watch(const ChildProcess& child);

    //==========================================================================================================
    // Stop
    // Purpose: Closes the child's stdin, sends SIGTERM, waits up to grace, then sends SIGKILL.
    //          Calling it on an exited (or already stopped) child only returns the recorded status.
    // Returns:
    //   Final exit status.
    //==========================================================================================================
    static ExitStatus Stop(ChildProcess& child, std::chrono::milliseconds grace = std::chrono::milliseconds(5000));
};

} // namespace websearch
