// ═══════════════════════════════════════════════════════════════════
//  test_events.cpp — EventEmitter
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <sidecar/events.h>

using namespace sidecar;

TEST(EventEmitterTest, EmitReportsWhetherAnybodyListened) {
    EventEmitter emitter;
    EXPECT_FALSE(emitter.emit("restarting", std::string("boom")));

    int calls = 0;
    emitter.on("restarting", [&]() { calls++; });
    EXPECT_TRUE(emitter.emit("restarting", std::string("boom")));
    EXPECT_EQ(calls, 1);
}

TEST(EventEmitterTest, TypedListenerReceivesPayload) {
    EventEmitter emitter;
    std::string received;
    emitter.on<std::string>("restarting", [&](const std::string& cause) { received = cause; });

    emitter.emit("restarting", std::string("Engine crashed unexpectedly with code: 1"));
    EXPECT_EQ(received, "Engine crashed unexpectedly with code: 1");
}

TEST(EventEmitterTest, OnceFiresOnlyOnce) {
    EventEmitter emitter;
    int calls = 0;
    emitter.once("start", [&](const std::vector<std::any>&) { calls++; });

    EXPECT_TRUE(emitter.emit("start"));
    EXPECT_FALSE(emitter.emit("start"));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(emitter.listenerCount("start"), 0u);
}

TEST(EventEmitterTest, RemoveListenerById) {
    EventEmitter emitter;
    int first = 0;
    int second = 0;
    auto id = emitter.on("error", [&]() { first++; });
    emitter.on("error", [&]() { second++; });

    EXPECT_TRUE(emitter.removeListener("error", id));
    EXPECT_FALSE(emitter.removeListener("error", id));

    emitter.emit("error");
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(EventEmitterTest, ListenerMayRemoveItselfDuringEmit) {
    EventEmitter emitter;
    int calls = 0;
    EventEmitter::ListenerId id = 0;
    id = emitter.on("tick", [&]() {
        calls++;
        emitter.removeListener("tick", id);
    });

    emitter.emit("tick");
    emitter.emit("tick");
    EXPECT_EQ(calls, 1);
}

TEST(EventEmitterTest, RemoveAllListeners) {
    EventEmitter emitter;
    emitter.on("a", []() {});
    emitter.on("b", []() {});
    emitter.removeAllListeners("a");
    EXPECT_EQ(emitter.listenerCount("a"), 0u);
    EXPECT_EQ(emitter.listenerCount("b"), 1u);
    emitter.removeAllListeners();
    EXPECT_EQ(emitter.listenerCount("b"), 0u);
}
