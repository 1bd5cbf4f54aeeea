#include "networking/PortProbe.h"

#include "networking/BlockingIo.hpp"

namespace deskpool::networking {

bool port_open(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
    boost::asio::io_context ioc;
    boost::beast::tcp_stream stream(ioc);
    return !connect(ioc, stream, host, port, timeout);
}

} // namespace deskpool::networking
