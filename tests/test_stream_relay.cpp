// ═══════════════════════════════════════════════════════════════════
//  test_stream_relay.cpp — Forwarding child output to caller sinks
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <sidecar/stream_relay.h>

#include <boost/asio/io_context.hpp>

#include <array>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

using namespace sidecar;

namespace {

struct PipeEnds {
    FileDescriptor readEnd;
    FileDescriptor writeEnd;
};

PipeEnds makePipe() {
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        throw std::runtime_error("pipe2 failed");
    }
    return {FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

void writeAll(const FileDescriptor& fd, const std::string& data) {
    ASSERT_EQ(::write(fd.get(), data.data(), data.size()), static_cast<ssize_t>(data.size()));
}

} // namespace

TEST(StreamRelayTest, ForwardsEverythingUntilEof) {
    boost::asio::io_context ioc;
    std::ostringstream sink;
    auto pipe = makePipe();

    auto relay = std::make_shared<StreamRelay>(ioc, std::move(pipe.readEnd), sink);
    relay->start();
    writeAll(pipe.writeEnd, "hello ");
    writeAll(pipe.writeEnd, "world\n");
    pipe.writeEnd.reset();

    ioc.run();
    EXPECT_EQ(sink.str(), "hello world\n");
    EXPECT_EQ(relay->bytesRelayed(), 12u);
    EXPECT_TRUE(relay->finished());
}

TEST(StreamRelayTest, SinkOutlivesRelaysAndIsShared) {
    boost::asio::io_context ioc;
    std::ostringstream sink;

    for (const char* line : {"first run\n", "second run\n"}) {
        auto pipe = makePipe();
        auto relay = std::make_shared<StreamRelay>(ioc, std::move(pipe.readEnd), sink);
        relay->start();
        writeAll(pipe.writeEnd, line);
        pipe.writeEnd.reset();
        ioc.restart();
        ioc.run();
    }

    EXPECT_TRUE(sink.good());
    sink << "still writable";
    EXPECT_EQ(sink.str(), "first run\nsecond run\nstill writable");
}

TEST(StreamRelayTest, CloseStopsForwarding) {
    boost::asio::io_context ioc;
    std::ostringstream sink;
    auto pipe = makePipe();

    auto relay = std::make_shared<StreamRelay>(ioc, std::move(pipe.readEnd), sink);
    writeAll(pipe.writeEnd, "dropped");
    relay->start();
    relay->close();

    ioc.run();
    EXPECT_EQ(sink.str(), "");
    EXPECT_EQ(relay->bytesRelayed(), 0u);
}
