// ═══════════════════════════════════════════════════════════════════
//  src/supervisor.cpp — Boost.Asio-driven child supervisor
// ═══════════════════════════════════════════════════════════════════
//
//  Everything runs on the caller's io_context:
//    SIGCHLD signal_set  → waitpid() on every child not yet reaped
//    StartupChannel      → first readiness message resolves start()
//    steady_timer        → startup timeout, races the readiness message
//    SignalRelay         → stops the child before this process goes away
//
// ═══════════════════════════════════════════════════════════════════

#include "sidecar/supervisor.h"
#include "sidecar/child_process.h"
#include "sidecar/console.h"
#include "sidecar/errors.h"
#include "sidecar/lifecycle.h"
#include "sidecar/startup_channel.h"
#include "sidecar/stream_relay.h"

#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <map>

#include <unistd.h>

extern char** environ;

namespace sidecar {

namespace net = boost::asio;

namespace {

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace

const char* toString(SupervisorState state) {
    switch (state) {
        case SupervisorState::NotStarted: return "not-started";
        case SupervisorState::Starting:   return "starting";
        case SupervisorState::Running:    return "running";
        case SupervisorState::Restarting: return "restarting";
        case SupervisorState::Stopped:    return "stopped";
        case SupervisorState::Failed:     return "failed";
    }
    return "unknown";
}

// ═══════════════════════════════════════════
//  ProcessSupervisor::Impl
// ═══════════════════════════════════════════
struct ProcessSupervisor::Impl : std::enable_shared_from_this<ProcessSupervisor::Impl> {
    // One spawned process plus the readers attached to its pipes.
    struct Tracked {
        std::shared_ptr<ChildProcess>   process;
        std::shared_ptr<StartupChannel> startup;
        std::shared_ptr<StreamRelay>    out;
        std::shared_ptr<StreamRelay>    err;
    };

    Impl(net::io_context& ioc, SupervisorConfig config, EventEmitter& events)
        : ioc(ioc)
        , config(std::move(config))
        , events(events)
        , childSignals(ioc, SIGCHLD)
        , startupTimer(ioc)
    {}

    net::io_context& ioc;
    SupervisorConfig config;
    EventEmitter&    events;
    LauncherOptions  options;

    net::signal_set   childSignals;
    net::steady_timer startupTimer;

    std::shared_ptr<ChildProcess> child;     // the one live child we answer for
    std::vector<Tracked>          live;      // every child not reaped yet
    std::shared_ptr<SignalRelay>  relay;

    std::promise<ListeningAddress> startup;
    bool startupPending = false;
    bool started = false;
    bool ready   = false;
    SupervisorState state = SupervisorState::NotStarted;
    std::size_t spawns = 0;

    // ── SIGCHLD: reap whatever exited ──
    void watchChildren() {
        std::weak_ptr<Impl> weak = weak_from_this();
        childSignals.async_wait([weak](const boost::system::error_code& ec, int) {
            if (ec) return;
            if (auto self = weak.lock()) {
                self->reapChildren();
                self->watchChildren();
            }
        });
    }

    void reapChildren() {
        // Exit callbacks may respawn, which appends to `live`.
        auto snapshot = live;
        for (auto& tracked : snapshot) {
            if (!tracked.process->reap()) continue;
            live.erase(std::remove_if(live.begin(), live.end(),
                [&](const Tracked& t) { return t.process == tracked.process; }), live.end());
        }
    }

    std::vector<std::string> childArguments() const {
        std::vector<std::string> args;
        args.push_back("-listening-reporter-fd=" + std::to_string(kListeningReporterFd));
        if (auto* path = std::get_if<std::string>(&config.config)) {
            // The child watches the file for changes itself.
            args.push_back("-config=" + *path);
        } else {
            args.push_back("-config=env");
        }
        args.insert(args.end(), options.extraArgs.begin(), options.extraArgs.end());
        return args;
    }

    std::vector<std::string> childEnvironment() const {
        std::map<std::string, std::string> env;
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            std::string kv(*entry);
            auto eq = kv.find('=');
            if (eq == std::string::npos) continue;
            env[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
        if (auto* inline_ = std::get_if<nlohmann::json>(&config.config)) {
            env[config.configEnvVar] = inline_->dump();
        }
        for (const auto& [key, value] : options.extraEnv) {
            env[key] = value;
        }

        std::vector<std::string> result;
        result.reserve(env.size());
        for (const auto& [key, value] : env) {
            result.push_back(key + "=" + value);
        }
        return result;
    }

    // Throws SpawnError.
    void spawnChild() {
        SpawnParams params;
        params.file       = config.binary;
        params.args       = childArguments();
        params.env        = childEnvironment();
        params.pipeStdout = options.proxyStdoutStream != nullptr;
        params.pipeStderr = options.proxyStderrStream != nullptr;

        auto process = ChildProcess::spawn(params);
        ++spawns;
        child = process;
        console::debug("Spawned", config.binary, "as pid", process->pid());

        std::weak_ptr<Impl> weak = weak_from_this();
        std::weak_ptr<ChildProcess> spawned = process;

        Tracked tracked;
        tracked.process = process;
        tracked.startup = std::make_shared<StartupChannel>(ioc, process->takeReporter());
        tracked.startup->start(
            [weak, spawned](const ListeningAddress& address) {
                if (auto self = weak.lock()) self->onReady(spawned.lock(), address);
            },
            [weak](std::exception_ptr error) {
                if (auto self = weak.lock()) self->reportError(error);
            }
        );

        // Relays never end the sinks: the next respawn writes to them too.
        if (options.proxyStdoutStream) {
            tracked.out = std::make_shared<StreamRelay>(ioc, process->takeStdout(), *options.proxyStdoutStream);
            tracked.out->start();
        }
        if (options.proxyStderrStream) {
            tracked.err = std::make_shared<StreamRelay>(ioc, process->takeStderr(), *options.proxyStderrStream);
            tracked.err->start();
        }

        process->onExit([weak, spawned](const ExitStatus& status) {
            if (auto self = weak.lock()) self->onChildExit(spawned.lock(), status);
        });
        live.push_back(std::move(tracked));
    }

    void onReady(const std::shared_ptr<ChildProcess>& reporter, const ListeningAddress& address) {
        if (!child || child != reporter) return;

        state = SupervisorState::Running;
        if (ready) {
            console::info("Engine restarted, listening on", address.url);
            return;
        }
        ready = true;
        console::success("Engine listening on", address.url);
        events.emit("start", address);
        resolveStartup(address);
    }

    void onChildExit(const std::shared_ptr<ChildProcess>& exited, const ExitStatus& status) {
        // Not ours any more: stop() or the startup timeout let go of it.
        if (!child || child != exited) return;

        if (status.reason == ExitStatus::Reason::Exit && status.code == kInvalidConfigurationExitCode) {
            child.reset();
            state = SupervisorState::Failed;
            if (relay) relay->detach();
            reportError(std::make_exception_ptr(
                ConfigurationError("Engine crashed due to invalid configuration.")));
            return;
        }

        if (ready) state = SupervisorState::Restarting;
        emitRestarting(describeExit(status));

        try {
            spawnChild();
        } catch (const SpawnError&) {
            child.reset();
            state = SupervisorState::Failed;
            if (relay) relay->detach();
            reportError(std::current_exception());
        }
    }

    void emitRestarting(const std::string& cause) {
        if (!events.emit("restarting", cause)) {
            console::error(cause);
        }
    }

    // Before readiness every failure rejects start(); afterwards it is an event.
    void reportError(std::exception_ptr error) {
        if (startupPending) {
            rejectStartup(error);
            return;
        }
        if (!events.emit("error", error)) {
            console::error("Engine error:", describe(error));
        }
    }

    void armStartupTimer(std::chrono::milliseconds timeout) {
        startupTimer.expires_after(timeout);
        std::weak_ptr<Impl> weak = weak_from_this();
        startupTimer.async_wait([weak](const boost::system::error_code& ec) {
            if (ec) return;
            if (auto self = weak.lock()) self->onStartupTimeout();
        });
    }

    void onStartupTimeout() {
        if (!startupPending) return;
        if (child) {
            child->kill(SIGKILL);
            child.reset();
        }
        rejectStartup(std::make_exception_ptr(TimeoutError("engineproxy timed out")));
    }

    void resolveStartup(const ListeningAddress& address) {
        if (!startupPending) return;
        startupPending = false;
        startupTimer.cancel();
        startup.set_value(address);
    }

    void rejectStartup(std::exception_ptr error) {
        if (!startupPending) return;
        startupPending = false;
        startupTimer.cancel();
        state = SupervisorState::Failed;

        // Leave nothing running that nobody is watching.
        if (child) {
            child->kill(SIGKILL);
            child.reset();
        }
        if (relay) relay->detach();
        console::error("Engine failed to start:", describe(error));
        startup.set_exception(error);
    }

    // Forgets the child first, so its exit reads as expected, then asks it to go.
    void stopChild(std::function<void()> done) {
        if (relay) relay->detach();
        auto stopping = std::move(child);
        child.reset();
        state = SupervisorState::Stopped;

        console::debug("Stopping engine pid", stopping->pid());
        stopping->onExit([done = std::move(done)](const ExitStatus&) {
            done();
        });
        stopping->kill(SIGTERM);
    }

    void installRelay() {
        std::weak_ptr<Impl> weak = weak_from_this();
        relay = SignalRelay::install(ioc, options.processCleanupEvents,
            [weak](const std::string&, SignalRelay::Done done) {
                auto self = weak.lock();
                if (!self || !self->child) {
                    done();
                    return;
                }
                self->stopChild(std::move(done));
            });
    }

    void shutdown() {
        if (relay) {
            relay->detach();
            relay.reset();
        }
        boost::system::error_code ignored;
        startupTimer.cancel();
        childSignals.cancel(ignored);
        child.reset();

        if (startupPending) {
            startupPending = false;
            startup.set_exception(std::make_exception_ptr(
                SupervisorError("Supervisor destroyed before the engine became ready")));
        }

        auto remaining = std::move(live);
        live.clear();
        for (auto& tracked : remaining) {
            tracked.startup->close();
            if (tracked.out) tracked.out->close();
            if (tracked.err) tracked.err->close();
            tracked.process->kill(SIGKILL);
            tracked.process->reapBlocking();
        }
    }
};

// ═══════════════════════════════════════════
//  ProcessSupervisor — Public API
// ═══════════════════════════════════════════

ProcessSupervisor::ProcessSupervisor(net::io_context& ioc, SupervisorConfig config)
    : impl_(std::make_shared<Impl>(ioc, std::move(config), *this))
{
    impl_->watchChildren();
}

ProcessSupervisor::~ProcessSupervisor() {
    impl_->shutdown();
}

std::future<ListeningAddress> ProcessSupervisor::start(LauncherOptions options) {
    if (impl_->started) {
        throw UsageError("Only call start() on a ProcessSupervisor once");
    }
    for (const auto& event : options.processCleanupEvents) {
        if (!SignalRelay::isKnownEvent(event)) {
            throw UsageError("Unknown process cleanup event: " + event);
        }
    }
    if (::access(impl_->config.binary.c_str(), X_OK) != 0) {
        throw SpawnError("Cannot execute '" + impl_->config.binary + "'", errno);
    }

    impl_->started = true;
    impl_->state   = SupervisorState::Starting;
    impl_->options = std::move(options);
    impl_->startupPending = true;
    auto future = impl_->startup.get_future();

    try {
        impl_->spawnChild();
    } catch (const SpawnError&) {
        impl_->startupPending = false;
        impl_->state = SupervisorState::Failed;
        throw;
    }

    impl_->installRelay();

    if (auto timeout = effectiveStartupTimeout(impl_->options)) {
        impl_->armStartupTimer(*timeout);
    }
    return future;
}

std::future<void> ProcessSupervisor::stop() {
    if (!impl_->child) {
        throw UsageError("No engine instance running!");
    }
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    impl_->stopChild([promise] { promise->set_value(); });
    return future;
}

SupervisorState ProcessSupervisor::state() const {
    return impl_->state;
}

std::size_t ProcessSupervisor::spawnCount() const {
    return impl_->spawns;
}

pid_t ProcessSupervisor::pid() const {
    return impl_->child ? impl_->child->pid() : 0;
}

} // namespace sidecar
