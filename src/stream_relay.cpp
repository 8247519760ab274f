// ═══════════════════════════════════════════════════════════════════
//  src/stream_relay.cpp — Child output forwarding
// ═══════════════════════════════════════════════════════════════════

#include "sidecar/stream_relay.h"
#include "sidecar/console.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

namespace sidecar {

namespace net = boost::asio;

StreamRelay::StreamRelay(net::io_context& ioc, FileDescriptor fd, std::ostream& sink)
    : descriptor_(ioc, fd.release())
    , sink_(sink)
{}

void StreamRelay::start() {
    doRead();
}

void StreamRelay::close() {
    if (closed_) return;
    closed_ = true;
    boost::system::error_code ignored;
    descriptor_.close(ignored);
}

void StreamRelay::doRead() {
    auto self = shared_from_this();
    descriptor_.async_read_some(
        net::buffer(chunk_),
        [self](const boost::system::error_code& ec, std::size_t bytes) {
            if (self->closed_) return;
            if (ec) {
                if (ec != net::error::eof) {
                    console::warn("Engine output relay stopped:", ec.message());
                }
                self->close();
                return;
            }
            self->sink_.write(self->chunk_.data(), static_cast<std::streamsize>(bytes));
            self->sink_.flush();
            self->relayed_ += bytes;
            self->doRead();
        }
    );
}

} // namespace sidecar
