#pragma once
#include <asio.hpp>
#include <chrono>
#include <string>

namespace blockview {

// Blocking TCP connection whose every operation is bounded by a timeout.
// Each call runs asynchronous operations on a private io_context for at most
// the given duration. The socket is closed on destruction.
class TcpConnection {
public:
    using tcp = asio::ip::tcp;
    TcpConnection();
    ~TcpConnection();
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    // Resolve and connect; a timeout closes the socket and yields timed_out.
    std::error_code connect(const std::string& host, uint16_t port,
                            std::chrono::milliseconds timeout);
    // A timeout closes the socket; a partially written request is useless.
    std::error_code write_all(const uint8_t* data, size_t len,
                              std::chrono::milliseconds timeout);
    // Reads at least one byte into buf. A timeout cancels the pending read
    // and leaves the connection open, so the call can be repeated.
    std::error_code read_some(uint8_t* buf, size_t len, size_t& n,
                              std::chrono::milliseconds timeout);
    void close();
    bool is_open() const { return socket_.is_open(); }

private:
    bool run_for(std::chrono::milliseconds timeout);

    asio::io_context io_;
    tcp::socket socket_;
};

} // namespace blockview
