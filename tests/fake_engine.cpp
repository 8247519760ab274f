// ═══════════════════════════════════════════════════════════════════
//  fake_engine.cpp — Scriptable stand-in for the supervised engine
// ═══════════════════════════════════════════════════════════════════
//
//  FAKE_ENGINE_MODE     ready (default) | invalid-config | crash-once |
//                       ready-then-invalid | hang | garbage | silent |
//                       late-report
//  FAKE_ENGINE_COUNTER  file that gets one line per start
//  FAKE_ENGINE_IP/PORT  what to report (127.0.0.1 / 4000)
//  FAKE_ENGINE_ECHO     print argv and ENGINE_CONFIG to stdout, a line
//                       to stderr
//
// ═══════════════════════════════════════════════════════════════════

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h>

namespace {

std::string env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value != nullptr ? value : fallback;
}

int previousStarts(const std::string& counter) {
    std::ifstream in(counter);
    int lines = 0;
    std::string line;
    while (std::getline(in, line)) ++lines;
    return lines;
}

void writeAll(int fd, const std::string& data) {
    std::size_t done = 0;
    while (done < data.size()) {
        auto n = ::write(fd, data.data() + done, data.size() - done);
        if (n <= 0) std::exit(2);
        done += static_cast<std::size_t>(n);
    }
}

[[noreturn]] void waitForever() {
    for (;;) ::pause();
}

} // namespace

int main(int argc, char** argv) {
    int reporterFd = -1;
    for (int i = 1; i < argc; ++i) {
        const char* prefix = "-listening-reporter-fd=";
        if (std::strncmp(argv[i], prefix, std::strlen(prefix)) == 0) {
            reporterFd = std::atoi(argv[i] + std::strlen(prefix));
        }
    }
    if (reporterFd < 0) {
        std::cerr << "fake_engine: missing -listening-reporter-fd" << std::endl;
        return 2;
    }

    auto mode = env("FAKE_ENGINE_MODE", "ready");
    auto counter = env("FAKE_ENGINE_COUNTER");
    int starts = 0;
    if (!counter.empty()) {
        starts = previousStarts(counter);
        std::ofstream(counter, std::ios::app) << ::getpid() << "\n";
    }

    if (env("FAKE_ENGINE_ECHO") == "1") {
        std::cout << "args:";
        for (int i = 1; i < argc; ++i) std::cout << " " << argv[i];
        std::cout << "\nconfig: " << env("ENGINE_CONFIG", "<unset>") << std::endl;
        std::cerr << "engine stderr line" << std::endl;
    }

    if (mode == "invalid-config") return 78;
    if (mode == "crash-once" && starts == 0) return 3;
    if (mode == "ready-then-invalid" && starts > 0) return 78;
    if (mode == "hang") waitForever();

    // First start: a grandchild keeps the reporter open and writes a bogus
    // address after this process has crashed. Later starts report late.
    if (mode == "late-report") {
        if (starts == 0) {
            pid_t pid = ::fork();
            if (pid == 0) {
                ::usleep(300 * 1000);
                writeAll(reporterFd, "{\"ip\": \"10.9.9.9\", \"port\": 9}");
                ::_exit(0);
            }
            return 3;
        }
        ::usleep(800 * 1000);
    }

    if (mode == "silent") {
        ::close(reporterFd);
        waitForever();
    }

    if (mode == "garbage") {
        writeAll(reporterFd, "this is not json");
    } else {
        auto port = env("FAKE_ENGINE_PORT", "4000");
        writeAll(reporterFd, "{\"ip\": \"" + env("FAKE_ENGINE_IP", "127.0.0.1") + "\", \"port\": " + port + "}");
    }
    ::close(reporterFd);
    waitForever();
}
