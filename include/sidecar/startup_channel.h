#pragma once
// ═══════════════════════════════════════════════════════════════════
//  sidecar/startup_channel.h — One-shot readiness message reader
// ═══════════════════════════════════════════════════════════════════
//
//  Collects everything the child writes to its reporter descriptor.
//  When the descriptor closes:
//    • nonzero bytes  → parsed as {"ip": string, "port": integer}
//    • zero bytes     → ordinary teardown, nothing is reported
//  Read failures and malformed payloads are reported as ChannelError.
//
// ═══════════════════════════════════════════════════════════════════

#include "options.h"
#include "child_process.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <array>
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace sidecar {

class StartupChannel : public std::enable_shared_from_this<StartupChannel> {
public:
    using ReadyHandler = std::function<void(const ListeningAddress&)>;
    using ErrorHandler = std::function<void(std::exception_ptr)>;

    StartupChannel(boost::asio::io_context& ioc, FileDescriptor fd);

    // Handlers run at most once each, on the io_context thread.
    void start(ReadyHandler onReady, ErrorHandler onError);

    // Stops reading; no handler runs afterwards.
    void close();

    std::size_t bytesReceived() const { return received_; }

    // Decodes a readiness payload; throws ChannelError.
    static ListeningAddress parse(const std::string& payload);

private:
    void doRead();
    void onRead(const boost::system::error_code& ec, std::size_t bytes);
    void finish();

    boost::asio::posix::stream_descriptor descriptor_;
    std::array<char, 1024> chunk_{};
    std::string  buffer_;
    std::size_t  received_ = 0;
    ReadyHandler onReady_;
    ErrorHandler onError_;
    bool closed_ = false;
};

} // namespace sidecar
