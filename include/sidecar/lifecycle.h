#pragma once
// ═══════════════════════════════════════════════════════════════════
//  sidecar/lifecycle.h — Process termination hooks (SignalRelay)
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto relay = SignalRelay::install(ioc, {"exit", "SIGINT", "SIGTERM"},
//        [&](const std::string& event, SignalRelay::Done done) {
//            stopChildThen(std::move(done));
//        });
//    ...
//    relay->detach();
//
//  Event names:
//    "exit"               normal process exit (std::atexit)
//    "uncaughtException"  std::terminate; the previous terminate handler
//                         runs right after the hook, so the fault is still
//                         reported and the process still aborts
//    "SIGINT", "SIGTERM", "SIGUSR2", ...
//                         the hook gets a `done` callback; once it is
//                         called the signal is re-delivered to this
//                         process with its default disposition restored
//
//  Every distinct event is hooked once and fires at most once.
//
// ═══════════════════════════════════════════════════════════════════

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sidecar {

// "SIGTERM" -> 15; nullopt for names we do not know.
std::optional<int> signalNumber(const std::string& name);

// 15 -> "SIGTERM"; "signal 42" for numbers we do not know.
std::string signalName(int signal);

class SignalRelay : public std::enable_shared_from_this<SignalRelay> {
public:
    using Done    = std::function<void()>;
    using Hook    = std::function<void(const std::string& event, Done done)>;
    using Reraise = std::function<void(int signal)>;

    // Sends `signal` to this process.
    static void defaultReraise(int signal);

    static bool isKnownEvent(const std::string& event);

    // Throws UsageError for an unknown event name; nothing is installed then.
    static std::shared_ptr<SignalRelay> install(boost::asio::io_context& ioc,
                                                const std::vector<std::string>& events,
                                                Hook hook,
                                                Reraise reraise = defaultReraise);

    ~SignalRelay();

    SignalRelay(const SignalRelay&) = delete;
    SignalRelay& operator=(const SignalRelay&) = delete;

    // Removes every hook that has not fired yet. Safe to call repeatedly,
    // including from inside the hook.
    void detach();

    bool attached() const { return attached_; }

    // Distinct events still hooked.
    std::size_t handlerCount() const;

    const std::vector<std::string>& events() const { return events_; }

private:
    struct SignalHook {
        std::string event;
        int signal = 0;
        std::unique_ptr<boost::asio::signal_set> set;
        bool armed = false;
    };

    SignalRelay(Hook hook, Reraise reraise);

    void arm(SignalHook& hook);
    void fire(const std::string& event, int signal);

    Hook     hook_;
    Reraise  reraise_;
    bool     attached_ = false;
    std::vector<std::string> events_;
    std::vector<SignalHook>  signals_;
    std::vector<std::uint64_t> processHooks_;   // ids in the process-wide registry
};

namespace detail {
// Hooks currently registered process-wide for "exit"/"uncaughtException".
std::size_t processHookCount(const std::string& event);
} // namespace detail

} // namespace sidecar
