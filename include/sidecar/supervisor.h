#pragma once
// ═══════════════════════════════════════════════════════════════════
//  sidecar/supervisor.h — Run, watch and restart one child process
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    boost::asio::io_context ioc;
//    ProcessSupervisor engine(ioc, {"/usr/bin/engineproxy",
//                                   std::string("/etc/engine.json")});
//    engine.on<std::string>("restarting", [](const std::string& why) { ... });
//    auto ready = engine.start();
//    // run ioc; ready.get().url == "http://localhost:4000"
//
//  Events:
//    "start"       ListeningAddress      once, when the child first reports
//    "restarting"  std::string           every unexpected exit
//    "error"       std::exception_ptr    failures after startup succeeded
//
//  All callbacks and future completions happen on the io_context thread.
//
// ═══════════════════════════════════════════════════════════════════

#include "events.h"
#include "options.h"

#include <boost/asio/io_context.hpp>

#include <future>
#include <memory>
#include <sys/types.h>

namespace sidecar {

enum class SupervisorState : int {
    NotStarted,
    Starting,
    Running,
    Restarting,
    Stopped,
    Failed,
};

const char* toString(SupervisorState state);

class ProcessSupervisor : public EventEmitter {
public:
    ProcessSupervisor(boost::asio::io_context& ioc, SupervisorConfig config);

    // Kills and reaps any child still alive.
    ~ProcessSupervisor() override;

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Spawns the child and hooks the configured termination events.
    // Throws UsageError on a second call or an unknown cleanup event,
    // SpawnError when the binary cannot be launched at all. The future
    // fails with ConfigurationError, TimeoutError or ChannelError.
    std::future<ListeningAddress> start(LauncherOptions options = {});

    // Terminates the tracked child; the future completes once it has exited.
    // Throws UsageError when no child is tracked.
    std::future<void> stop();

    SupervisorState state() const;
    std::size_t spawnCount() const;

    // Pid of the tracked child, 0 when there is none.
    pid_t pid() const;

    struct Impl;

private:
    std::shared_ptr<Impl> impl_;
};

} // namespace sidecar
