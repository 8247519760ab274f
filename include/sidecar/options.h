#pragma once
// ═══════════════════════════════════════════════════════════════════
//  sidecar/options.h — Supervisor configuration and result records
// ═══════════════════════════════════════════════════════════════════
//
//  SupervisorConfig says what to run; LauncherOptions says how one
//  start() should run it. ListeningAddress is what start() produces.
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace sidecar {

// Exit code a child uses to say "my configuration is broken, do not restart me".
inline constexpr int kInvalidConfigurationExitCode = 78;

// Descriptor number the child sees the readiness channel on.
inline constexpr int kListeningReporterFd = 3;

inline constexpr int kDefaultStartupTimeoutMs = 5000;

// Either a path to a config file (the child watches it) or an inline
// object that is serialized into the environment.
using EngineConfig = std::variant<std::string, nlohmann::json>;

struct SupervisorConfig {
    std::string  binary;
    EngineConfig config = nlohmann::json::object();
    std::string  configEnvVar = "ENGINE_CONFIG";
};

inline std::vector<std::string> defaultCleanupEvents() {
    return {"exit", "uncaughtException", "SIGINT", "SIGTERM", "SIGUSR2"};
}

struct LauncherOptions {
    std::vector<std::string>           extraArgs;
    std::map<std::string, std::string> extraEnv;     // overrides inherited entries

    // Not owned; never closed. May be shared by every respawn.
    std::ostream* proxyStdoutStream = nullptr;
    std::ostream* proxyStderrStream = nullptr;

    // Unset: 5000 ms. Positive: that many ms. Zero or negative: no timeout.
    std::optional<int> startupTimeout;

    std::vector<std::string> processCleanupEvents = defaultCleanupEvents();
};

// ── Startup window for a set of options; nullopt means "wait forever" ──
inline std::optional<std::chrono::milliseconds> effectiveStartupTimeout(const LauncherOptions& options) {
    if (!options.startupTimeout) {
        return std::chrono::milliseconds(kDefaultStartupTimeoutMs);
    }
    if (*options.startupTimeout <= 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(*options.startupTimeout);
}

struct ListeningAddress {
    std::string ip;
    int port = 0;
    std::string url;
};

inline bool operator==(const ListeningAddress& a, const ListeningAddress& b) {
    return a.ip == b.ip && a.port == b.port && a.url == b.url;
}

// Literal IPv6 addresses contain colons and need square brackets.
inline std::string joinHostPort(const std::string& host, int port) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

// "Any address" binds are reported to callers as localhost.
inline std::string listeningUrl(const std::string& ip, int port) {
    const std::string host = (ip.empty() || ip == "::") ? "localhost" : ip;
    return "http://" + joinHostPort(host, port);
}

inline std::ostream& operator<<(std::ostream& os, const ListeningAddress& address) {
    return os << address.url;
}

} // namespace sidecar
