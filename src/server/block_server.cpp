
#include "block_server.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <sodium.h>
#include <stdexcept>

namespace blockview {

BlockServer::BlockServer(asio::io_context &io, const ServerConfig &cfg)
    : io_(io), cfg_(cfg), acceptor_(io) {
  if (sodium_init() < 0)
    throw std::runtime_error("libsodium initialization failed");
  if (cfg_.packet_size == 0)
    cfg_.packet_size = 4096;
}

void BlockServer::start() {
  tcp::endpoint ep(asio::ip::make_address(cfg_.listen_host), cfg_.listen_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  Logger::instance().log(LogLevel::INFO, "serving %s on %s:%u",
                         cfg_.data_dir.c_str(), cfg_.listen_host.c_str(),
                         (unsigned)port());
  do_accept();
}

uint16_t BlockServer::port() const { return acceptor_.local_endpoint().port(); }

std::string BlockServer::replica_path(uint64_t block_id,
                                      uint64_t gen_stamp) const {
  return cfg_.data_dir + "/blk_" + std::to_string(block_id) + "_" +
         std::to_string(gen_stamp);
}

void BlockServer::do_accept() {
  auto c = std::make_shared<Conn>(io_);
  acceptor_.async_accept(c->sock, [this, c](std::error_code ec) {
    if (ec) {
      if (ec == asio::error::operation_aborted)
        return;
      Logger::instance().log(LogLevel::ERROR, "accept failed: %s",
                             ec.message().c_str());
    } else {
      c->deadline.expires_after(cfg_.request_timeout);
      c->deadline.async_wait([c](std::error_code ec) {
        if (ec)
          return;
        Logger::instance().log(LogLevel::WARN, "request timed out");
        std::error_code ignored;
        c->sock.close(ignored);
      });
      read_request(c);
    }
    do_accept();
  });
}

void BlockServer::read_request(std::shared_ptr<Conn> c) {
  asio::async_read(
      c->sock, asio::buffer(&c->req, sizeof(c->req)),
      [this, c](std::error_code ec, std::size_t) {
        if (ec) {
          c->deadline.cancel();
          return;
        }
        const ReadRequestHeader &r = c->req;
        if (!header_intact(r) || r.version != kVersion ||
            r.op != static_cast<uint8_t>(OpCode::READ_BLOCK) ||
            r.token_len > kMaxTokenLen) {
          Logger::instance().log(LogLevel::WARN, "malformed read request");
          reply_error(c, Status::ERROR);
          return;
        }
        read_token(c);
      });
}

void BlockServer::read_token(std::shared_ptr<Conn> c) {
  c->token.resize(c->req.token_len);
  asio::async_read(c->sock, asio::buffer(c->token),
                   [this, c](std::error_code ec, std::size_t) {
                     c->deadline.cancel();
                     if (ec)
                       return;
                     handle_request(c);
                   });
}

void BlockServer::handle_request(std::shared_ptr<Conn> c) {
  const ReadRequestHeader &r = c->req;
  if (!cfg_.required_token.empty() &&
      (c->token.size() != cfg_.required_token.size() ||
       sodium_memcmp(c->token.data(), cfg_.required_token.data(),
                     c->token.size()) != 0)) {
    Logger::instance().log(LogLevel::WARN, "access token rejected for blk_%llu",
                           (unsigned long long)r.block_id);
    reply_error(c, Status::ERROR_ACCESS_TOKEN);
    return;
  }

  std::string path = replica_path(r.block_id, r.gen_stamp);
  std::error_code fs_ec;
  if (std::filesystem::is_regular_file(path, fs_ec))
    c->file.open(path, std::ios::binary);
  if (!c->file.is_open()) {
    Logger::instance().log(LogLevel::WARN, "no replica blk_%llu_%llu",
                           (unsigned long long)r.block_id,
                           (unsigned long long)r.gen_stamp);
    reply_error(c, Status::ERROR_INVALID);
    return;
  }
  c->file.seekg(0, std::ios::end);
  std::streamoff end = c->file.tellg();
  if (!c->file || end < 0) {
    Logger::instance().log(LogLevel::WARN, "cannot size replica blk_%llu_%llu",
                           (unsigned long long)r.block_id,
                           (unsigned long long)r.gen_stamp);
    reply_error(c, Status::ERROR_INVALID);
    return;
  }
  uint64_t size = (uint64_t)end;
  if (r.offset > size || r.length > size - r.offset) {
    Logger::instance().log(LogLevel::WARN,
                           "range [%llu, +%llu) outside blk_%llu of %llu bytes",
                           (unsigned long long)r.offset,
                           (unsigned long long)r.length,
                           (unsigned long long)r.block_id,
                           (unsigned long long)size);
    reply_error(c, Status::ERROR_INVALID);
    return;
  }
  c->file.seekg((std::streamoff)r.offset);
  c->next_offset = r.offset;
  c->end_offset = r.offset + r.length;

  Logger::instance().log(LogLevel::DEBUG, "serving blk_%llu [%llu, %llu)",
                         (unsigned long long)r.block_id,
                         (unsigned long long)c->next_offset,
                         (unsigned long long)c->end_offset);
  c->out = encode_response(Status::SUCCESS, r.length);
  asio::async_write(c->sock, asio::buffer(c->out),
                    [this, c](std::error_code ec, std::size_t) {
                      if (ec)
                        return;
                      send_next_packet(c);
                    });
}

void BlockServer::reply_error(std::shared_ptr<Conn> c, Status status) {
  c->deadline.cancel();
  c->out = encode_response(status, 0);
  asio::async_write(c->sock, asio::buffer(c->out),
                    [this, c](std::error_code, std::size_t) { finish(c); });
}

void BlockServer::send_next_packet(std::shared_ptr<Conn> c) {
  if (c->next_offset == c->end_offset) {
    finish(c);
    return;
  }
  size_t n = (size_t)std::min<uint64_t>(cfg_.packet_size,
                                        c->end_offset - c->next_offset);
  c->chunk.resize(n);
  c->file.read(reinterpret_cast<char *>(c->chunk.data()), (std::streamsize)n);
  if ((size_t)c->file.gcount() != n) {
    Logger::instance().log(LogLevel::ERROR,
                           "short read of replica blk_%llu at offset %llu",
                           (unsigned long long)c->req.block_id,
                           (unsigned long long)c->next_offset);
    finish(c);
    return;
  }
  c->out = encode_packet(c->next_offset, c->chunk.data(), n);
  c->next_offset += n;
  asio::async_write(c->sock, asio::buffer(c->out),
                    [this, c](std::error_code ec, std::size_t) {
                      if (ec) {
                        Logger::instance().log(LogLevel::WARN,
                                               "send failed: %s",
                                               ec.message().c_str());
                        return;
                      }
                      send_next_packet(c);
                    });
}

void BlockServer::finish(std::shared_ptr<Conn> c) {
  std::error_code ignored;
  c->sock.shutdown(tcp::socket::shutdown_both, ignored);
  c->sock.close(ignored);
}

} // namespace blockview
