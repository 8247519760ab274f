// ═══════════════════════════════════════════════════════════════════
//  src/lifecycle.cpp — SignalRelay and the process-wide hook registry
// ═══════════════════════════════════════════════════════════════════

#include "sidecar/lifecycle.h"
#include "sidecar/console.h"
#include "sidecar/errors.h"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <mutex>

#include <unistd.h>

namespace sidecar {

namespace net = boost::asio;

namespace {

struct SignalInfo {
    const char* name;
    int number;
    bool hookable;
};

constexpr SignalInfo kSignals[] = {
    {"SIGHUP",  SIGHUP,  true},
    {"SIGINT",  SIGINT,  true},
    {"SIGQUIT", SIGQUIT, true},
    {"SIGILL",  SIGILL,  false},
    {"SIGTRAP", SIGTRAP, false},
    {"SIGABRT", SIGABRT, false},
    {"SIGBUS",  SIGBUS,  false},
    {"SIGFPE",  SIGFPE,  false},
    {"SIGKILL", SIGKILL, false},
    {"SIGUSR1", SIGUSR1, true},
    {"SIGSEGV", SIGSEGV, false},
    {"SIGUSR2", SIGUSR2, true},
    {"SIGPIPE", SIGPIPE, true},
    {"SIGALRM", SIGALRM, true},
    {"SIGTERM", SIGTERM, true},
    {"SIGCHLD", SIGCHLD, false},
    {"SIGCONT", SIGCONT, false},
    {"SIGSTOP", SIGSTOP, false},
    {"SIGTSTP", SIGTSTP, false},
    {"SIGXCPU", SIGXCPU, false},
};

const SignalInfo* findSignal(const std::string& name) {
    for (const auto& info : kSignals) {
        if (name == info.name) return &info;
    }
    return nullptr;
}

constexpr const char* kExitEvent  = "exit";
constexpr const char* kFaultEvent = "uncaughtException";

} // namespace

std::optional<int> signalNumber(const std::string& name) {
    if (auto* info = findSignal(name)) return info->number;
    return std::nullopt;
}

std::string signalName(int signal) {
    for (const auto& info : kSignals) {
        if (info.number == signal) return info.name;
    }
    return "signal " + std::to_string(signal);
}

// ═══════════════════════════════════════════
//  Process-wide registry for exit / terminate
// ═══════════════════════════════════════════
namespace detail {

struct ProcessHook {
    std::uint64_t id;
    std::string event;
    std::function<void()> fn;
};

inline std::mutex& registryMutex() {
    static std::mutex m;
    return m;
}

inline std::vector<ProcessHook>& registry() {
    static std::vector<ProcessHook> hooks;
    return hooks;
}

inline std::terminate_handler& previousTerminate() {
    static std::terminate_handler handler = nullptr;
    return handler;
}

// Hooks are one-shot: they leave the registry before they run.
void runProcessHooks(const std::string& event) {
    std::vector<ProcessHook> toRun;
    {
        std::lock_guard<std::mutex> lock(registryMutex());
        auto& hooks = registry();
        auto split = std::stable_partition(hooks.begin(), hooks.end(),
            [&](const ProcessHook& h) { return h.event != event; });
        toRun.assign(std::make_move_iterator(split), std::make_move_iterator(hooks.end()));
        hooks.erase(split, hooks.end());
    }
    for (auto& hook : toRun) {
        hook.fn();
    }
}

void onProcessExit() {
    runProcessHooks(kExitEvent);
}

[[noreturn]] void onTerminate() {
    runProcessHooks(kFaultEvent);
    if (auto previous = previousTerminate()) {
        previous();
    }
    std::abort();
}

void ensureTrampolines() {
    static std::once_flag once;
    std::call_once(once, [] {
        // Statics built before atexit() registration outlive onProcessExit,
        // including the ones the exit hooks log through.
        registryMutex();
        registry();
        previousTerminate();
        console::detail::threshold();
        console::detail::outputMutex();
        if (std::atexit(onProcessExit) != 0) {
            console::warn("Could not register exit hook; children may outlive this process");
        }
        previousTerminate() = std::set_terminate(onTerminate);
    });
}

std::uint64_t addProcessHook(const std::string& event, std::function<void()> fn) {
    ensureTrampolines();
    static std::uint64_t nextId = 0;
    std::lock_guard<std::mutex> lock(registryMutex());
    auto id = ++nextId;
    registry().push_back({id, event, std::move(fn)});
    return id;
}

void removeProcessHook(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto& hooks = registry();
    hooks.erase(std::remove_if(hooks.begin(), hooks.end(),
        [id](const ProcessHook& h) { return h.id == id; }), hooks.end());
}

std::size_t processHookCount(const std::string& event) {
    std::lock_guard<std::mutex> lock(registryMutex());
    return static_cast<std::size_t>(std::count_if(registry().begin(), registry().end(),
        [&](const ProcessHook& h) { return h.event == event; }));
}

} // namespace detail

// ═══════════════════════════════════════════
//  SignalRelay
// ═══════════════════════════════════════════

void SignalRelay::defaultReraise(int signal) {
    ::kill(::getpid(), signal);
}

bool SignalRelay::isKnownEvent(const std::string& event) {
    if (event == kExitEvent || event == kFaultEvent) return true;
    auto* info = findSignal(event);
    return info != nullptr && info->hookable;
}

SignalRelay::SignalRelay(Hook hook, Reraise reraise)
    : hook_(std::move(hook))
    , reraise_(std::move(reraise))
{}

std::shared_ptr<SignalRelay> SignalRelay::install(net::io_context& ioc,
                                                  const std::vector<std::string>& events,
                                                  Hook hook,
                                                  Reraise reraise) {
    for (const auto& event : events) {
        if (!isKnownEvent(event)) {
            throw UsageError("Unknown process cleanup event: " + event);
        }
    }

    std::shared_ptr<SignalRelay> relay(new SignalRelay(std::move(hook), std::move(reraise)));
    relay->attached_ = true;

    for (const auto& event : events) {
        // Each event is processed at most once.
        if (std::find(relay->events_.begin(), relay->events_.end(), event) != relay->events_.end()) {
            continue;
        }
        relay->events_.push_back(event);

        if (event == kExitEvent || event == kFaultEvent) {
            std::weak_ptr<SignalRelay> weak = relay;
            relay->processHooks_.push_back(detail::addProcessHook(event, [weak, event] {
                if (auto self = weak.lock()) {
                    self->hook_(event, [] {});
                }
            }));
            continue;
        }

        SignalHook signalHook;
        signalHook.event  = event;
        signalHook.signal = *signalNumber(event);
        signalHook.set    = std::make_unique<net::signal_set>(ioc, signalHook.signal);
        relay->signals_.push_back(std::move(signalHook));
    }

    for (auto& signalHook : relay->signals_) {
        relay->arm(signalHook);
    }
    return relay;
}

SignalRelay::~SignalRelay() {
    detach();
}

void SignalRelay::detach() {
    if (!attached_) return;
    attached_ = false;

    for (auto id : processHooks_) {
        detail::removeProcessHook(id);
    }
    processHooks_.clear();

    // Clearing a set restores the default disposition of its signal.
    for (auto& signalHook : signals_) {
        boost::system::error_code ignored;
        signalHook.set->cancel(ignored);
        signalHook.set->clear(ignored);
        signalHook.armed = false;
    }
}

std::size_t SignalRelay::handlerCount() const {
    auto armedSignals = std::count_if(signals_.begin(), signals_.end(),
        [](const SignalHook& h) { return h.armed; });
    return static_cast<std::size_t>(armedSignals) + processHooks_.size();
}

void SignalRelay::arm(SignalHook& signalHook) {
    signalHook.armed = true;
    std::weak_ptr<SignalRelay> weak = shared_from_this();
    signalHook.set->async_wait(
        [weak, event = signalHook.event](const boost::system::error_code& ec, int signal) {
            if (ec) return;
            if (auto self = weak.lock()) {
                self->fire(event, signal);
            }
        }
    );
}

void SignalRelay::fire(const std::string& event, int signal) {
    for (auto& signalHook : signals_) {
        if (signalHook.event != event) continue;
        if (!signalHook.armed) return;
        signalHook.armed = false;
        boost::system::error_code ignored;
        signalHook.set->clear(ignored);
    }

    console::info("Received", event, "- stopping engine before exiting");

    // The set was cleared above, so the re-raised signal gets its default action.
    hook_(event, [reraise = reraise_, signal] {
        reraise(signal);
    });
}

} // namespace sidecar
