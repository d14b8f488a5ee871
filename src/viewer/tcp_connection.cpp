
#include "tcp_connection.hpp"

namespace blockview {

TcpConnection::TcpConnection() : socket_(io_) {}

TcpConnection::~TcpConnection() { close(); }

void TcpConnection::close() {
  if (!socket_.is_open())
    return;
  std::error_code ignored;
  socket_.shutdown(tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}

// True when all outstanding work completed before the deadline.
bool TcpConnection::run_for(std::chrono::milliseconds timeout) {
  io_.restart();
  io_.run_for(timeout);
  return io_.stopped();
}

std::error_code TcpConnection::connect(const std::string &host, uint16_t port,
                                       std::chrono::milliseconds timeout) {
  std::error_code result = asio::error::would_block;
  // Set once the deadline passed; a resolve completing while the queue is
  // drained must not start a connect nobody waits for.
  bool expired = false;
  tcp::resolver resolver(io_);
  resolver.async_resolve(
      host, std::to_string(port),
      [this, &result, &expired](std::error_code ec,
                                tcp::resolver::results_type res) {
        if (ec) {
          result = ec;
          return;
        }
        if (expired) {
          result = asio::error::timed_out;
          return;
        }
        asio::async_connect(
            socket_, res,
            [&result](std::error_code ec, const tcp::endpoint &) {
              result = ec;
            });
      });

  if (!run_for(timeout)) {
    expired = true;
    resolver.cancel();
    close();
    io_.restart();
    io_.run();
    return asio::error::timed_out;
  }
  return result;
}

std::error_code TcpConnection::write_all(const uint8_t *data, size_t len,
                                         std::chrono::milliseconds timeout) {
  std::error_code result = asio::error::would_block;
  asio::async_write(socket_, asio::buffer(data, len),
                    [&result](std::error_code ec, std::size_t) {
                      result = ec;
                    });
  if (!run_for(timeout)) {
    close();
    io_.restart();
    io_.run();
    return asio::error::timed_out;
  }
  return result;
}

std::error_code TcpConnection::read_some(uint8_t *buf, size_t len, size_t &n,
                                         std::chrono::milliseconds timeout) {
  std::error_code result = asio::error::would_block;
  n = 0;
  socket_.async_read_some(asio::buffer(buf, len),
                          [&result, &n](std::error_code ec, std::size_t got) {
                            result = ec;
                            n = got;
                          });
  if (run_for(timeout))
    return result;

  std::error_code ignored;
  socket_.cancel(ignored);
  io_.restart();
  io_.run();
  // The read may have completed between the deadline and the cancel.
  if (!result && n > 0)
    return result;
  return asio::error::timed_out;
}

} // namespace blockview
