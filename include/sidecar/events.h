#pragma once
// ═══════════════════════════════════════════════════════════════════
//  sidecar/events.h — Node.js-style EventEmitter
// ═══════════════════════════════════════════════════════════════════
//
//  Single-threaded: listeners run on the thread that calls emit(),
//  which for the supervisor is always the io_context thread.
//
// ═══════════════════════════════════════════════════════════════════

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <any>
#include <algorithm>
#include <cstdint>

namespace sidecar {

class EventEmitter {
public:
    using EventListener = std::function<void(const std::vector<std::any>&)>;
    using ListenerId    = std::uint64_t;

    EventEmitter() = default;
    virtual ~EventEmitter() = default;

    EventEmitter(EventEmitter&&) noexcept = default;
    EventEmitter& operator=(EventEmitter&&) noexcept = default;

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    // ── Register a persistent listener ──
    ListenerId on(const std::string& event, EventListener listener) {
        return add(event, std::move(listener), false);
    }

    // ── Register a one-time listener ──
    ListenerId once(const std::string& event, EventListener listener) {
        return add(event, std::move(listener), true);
    }

    // ── Typed single-argument listener ──
    template <typename T>
    ListenerId on(const std::string& event, std::function<void(const T&)> listener) {
        return on(event, EventListener([listener = std::move(listener)](const std::vector<std::any>& args) {
            if (!args.empty()) {
                listener(std::any_cast<const T&>(args[0]));
            }
        }));
    }

    template <typename T>
    ListenerId once(const std::string& event, std::function<void(const T&)> listener) {
        return once(event, EventListener([listener = std::move(listener)](const std::vector<std::any>& args) {
            if (!args.empty()) {
                listener(std::any_cast<const T&>(args[0]));
            }
        }));
    }

    ListenerId on(const std::string& event, std::function<void()> listener) {
        return on(event, EventListener([listener = std::move(listener)](const std::vector<std::any>&) {
            listener();
        }));
    }

    // ── Emit an event; returns whether anybody was listening ──
    template <typename... Args>
    bool emit(const std::string& event, Args&&... args) {
        auto it = listeners_.find(event);
        if (it == listeners_.end() || it->second.empty()) return false;

        // Listeners may add or remove listeners while we iterate.
        std::vector<Entry> toCall = it->second;
        auto& entries = it->second;
        entries.erase(
            std::remove_if(entries.begin(), entries.end(),
                [](const Entry& e) { return e.once; }),
            entries.end()
        );

        std::vector<std::any> packed = {std::any(std::forward<Args>(args))...};
        for (auto& entry : toCall) {
            entry.fn(packed);
        }
        return true;
    }

    // ── Remove one listener by the id on()/once() returned ──
    bool removeListener(const std::string& event, ListenerId id) {
        auto it = listeners_.find(event);
        if (it == listeners_.end()) return false;
        auto& entries = it->second;
        auto pos = std::find_if(entries.begin(), entries.end(),
            [id](const Entry& e) { return e.id == id; });
        if (pos == entries.end()) return false;
        entries.erase(pos);
        return true;
    }

    void removeAllListeners(const std::string& event) {
        listeners_.erase(event);
    }

    void removeAllListeners() {
        listeners_.clear();
    }

    std::size_t listenerCount(const std::string& event) const {
        auto it = listeners_.find(event);
        if (it == listeners_.end()) return 0;
        return it->second.size();
    }

private:
    struct Entry {
        ListenerId id = 0;
        EventListener fn;
        bool once = false;
    };

    ListenerId add(const std::string& event, EventListener listener, bool once) {
        auto id = ++nextId_;
        listeners_[event].push_back({id, std::move(listener), once});
        return id;
    }

    ListenerId nextId_ = 0;
    std::unordered_map<std::string, std::vector<Entry>> listeners_;
};

} // namespace sidecar
