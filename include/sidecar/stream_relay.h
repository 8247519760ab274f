#pragma once
// ═══════════════════════════════════════════════════════════════════
//  sidecar/stream_relay.h — Forward a child's output pipe to a sink
// ═══════════════════════════════════════════════════════════════════
//
//  The sink is borrowed: it is written and flushed, never closed, so
//  one sink can serve every respawn of the child.
//
// ═══════════════════════════════════════════════════════════════════

#include "child_process.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <array>
#include <memory>
#include <ostream>

namespace sidecar {

class StreamRelay : public std::enable_shared_from_this<StreamRelay> {
public:
    StreamRelay(boost::asio::io_context& ioc, FileDescriptor fd, std::ostream& sink);

    void start();
    void close();

    bool finished() const { return closed_; }
    std::size_t bytesRelayed() const { return relayed_; }

private:
    void doRead();

    boost::asio::posix::stream_descriptor descriptor_;
    std::ostream& sink_;
    std::array<char, 4096> chunk_{};
    std::size_t relayed_ = 0;
    bool closed_ = false;
};

} // namespace sidecar
