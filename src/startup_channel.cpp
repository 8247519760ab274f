// ═══════════════════════════════════════════════════════════════════
//  src/startup_channel.cpp — Readiness message reader
// ═══════════════════════════════════════════════════════════════════

#include "sidecar/startup_channel.h"
#include "sidecar/errors.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>

namespace sidecar {

namespace net = boost::asio;

StartupChannel::StartupChannel(net::io_context& ioc, FileDescriptor fd)
    : descriptor_(ioc, fd.release())
{}

void StartupChannel::start(ReadyHandler onReady, ErrorHandler onError) {
    onReady_ = std::move(onReady);
    onError_ = std::move(onError);
    doRead();
}

void StartupChannel::close() {
    if (closed_) return;
    closed_ = true;
    onReady_ = nullptr;
    onError_ = nullptr;
    boost::system::error_code ignored;
    descriptor_.close(ignored);
}

ListeningAddress StartupChannel::parse(const std::string& payload) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw ChannelError(std::string("Malformed listening address report: ") + e.what());
    }

    if (!message.is_object()
        || !message.contains("ip") || !message["ip"].is_string()
        || !message.contains("port") || !message["port"].is_number_integer()) {
        throw ChannelError("Listening address report must be {\"ip\": string, \"port\": integer}, got "
                           + message.dump());
    }

    const auto& rawPort = message["port"];
    bool inRange = rawPort.is_number_unsigned()
        ? rawPort.get<std::uint64_t>() <= 65535
        : rawPort.get<std::int64_t>() >= 0 && rawPort.get<std::int64_t>() <= 65535;
    if (!inRange) {
        throw ChannelError("Listening address report has an out-of-range port: " + rawPort.dump());
    }

    ListeningAddress address;
    address.ip   = message["ip"].get<std::string>();
    address.port = rawPort.get<int>();
    address.url  = listeningUrl(address.ip, address.port);
    return address;
}

void StartupChannel::doRead() {
    auto self = shared_from_this();
    descriptor_.async_read_some(
        net::buffer(chunk_),
        [self](const boost::system::error_code& ec, std::size_t bytes) {
            self->onRead(ec, bytes);
        }
    );
}

void StartupChannel::onRead(const boost::system::error_code& ec, std::size_t bytes) {
    if (closed_) return;

    if (!ec) {
        buffer_.append(chunk_.data(), bytes);
        received_ += bytes;
        doRead();
        return;
    }

    if (ec == net::error::eof) {
        finish();
        return;
    }

    auto onError = std::move(onError_);
    close();
    if (onError) {
        onError(std::make_exception_ptr(ChannelError("Reading listening address report failed", ec)));
    }
}

void StartupChannel::finish() {
    auto onReady = std::move(onReady_);
    auto onError = std::move(onError_);
    auto payload = std::move(buffer_);
    close();

    // Nothing written: the child is just shutting down.
    if (payload.empty()) return;

    ListeningAddress address;
    try {
        address = parse(payload);
    } catch (const ChannelError&) {
        if (onError) onError(std::current_exception());
        return;
    }
    if (onReady) onReady(address);
}

} // namespace sidecar
