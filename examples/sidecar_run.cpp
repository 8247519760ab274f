// ═══════════════════════════════════════════════════════════════════
//  sidecar_run.cpp — Supervise any engine binary from the shell
// ═══════════════════════════════════════════════════════════════════
//
//  sidecar-run [--config=PATH | --config-json=JSON]
//              [--startup-timeout=MS] [--cleanup-event=NAME]...
//              [--env=KEY=VALUE]... -- BINARY [ARGS...]
//
//  Prints the listening URL once the engine is ready, then keeps it
//  running (and restarting) until SIGINT/SIGTERM/SIGUSR2 arrives.
//
// ═══════════════════════════════════════════════════════════════════

#include "sidecar/sidecar.h"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>

using namespace sidecar;

namespace {

int usage(const std::string& problem) {
    console::error(problem);
    std::cerr << "usage: sidecar-run [--config=PATH | --config-json=JSON] [--startup-timeout=MS]\n"
                 "                   [--cleanup-event=NAME]... [--env=KEY=VALUE]... -- BINARY [ARGS...]\n";
    return 2;
}

bool startsWith(std::string_view value, std::string_view prefix) {
    return value.substr(0, prefix.size()) == prefix;
}

} // namespace

int main(int argc, char** argv) {
    SupervisorConfig config;
    LauncherOptions options;
    std::vector<std::string> cleanupEvents;

    int i = 1;
    for (; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--") {
            ++i;
            break;
        }
        if (startsWith(arg, "--config=")) {
            config.config = std::string(arg.substr(9));
        } else if (startsWith(arg, "--config-json=")) {
            try {
                config.config = nlohmann::json::parse(std::string(arg.substr(14)));
            } catch (const nlohmann::json::parse_error& e) {
                return usage(std::string("--config-json is not valid JSON: ") + e.what());
            }
        } else if (startsWith(arg, "--startup-timeout=")) {
            try {
                options.startupTimeout = std::stoi(std::string(arg.substr(18)));
            } catch (const std::exception&) {
                return usage("--startup-timeout expects milliseconds");
            }
        } else if (startsWith(arg, "--cleanup-event=")) {
            cleanupEvents.emplace_back(arg.substr(16));
        } else if (startsWith(arg, "--env=")) {
            auto kv = arg.substr(6);
            auto eq = kv.find('=');
            if (eq == std::string_view::npos) return usage("--env expects KEY=VALUE");
            options.extraEnv[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
        } else {
            return usage("Unknown option: " + std::string(arg));
        }
    }

    if (i >= argc) return usage("Missing engine binary");
    config.binary = argv[i++];
    for (; i < argc; ++i) options.extraArgs.emplace_back(argv[i]);
    if (!cleanupEvents.empty()) options.processCleanupEvents = cleanupEvents;

    boost::asio::io_context ioc;
    ProcessSupervisor engine(ioc, config);

    engine.on<std::string>("restarting", [](const std::string& cause) {
        console::warn(cause, "- restarting");
    });
    engine.on<std::exception_ptr>("error", [&ioc](const std::exception_ptr& error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            console::error(e.what());
        }
        ioc.stop();
    });

    std::future<ListeningAddress> ready;
    try {
        ready = engine.start(options);
    } catch (const UsageError& e) {
        return usage(e.what());
    } catch (const SpawnError& e) {
        console::error(e.what());
        return 1;
    }

    while (ready.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        ioc.run_one();
    }

    try {
        std::cout << ready.get().url << std::endl;
    } catch (const SupervisorError&) {
        return 1;
    }

    ioc.run();
    return engine.state() == SupervisorState::Failed ? 1 : 0;
}
