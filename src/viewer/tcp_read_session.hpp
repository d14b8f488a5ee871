#pragma once
#include <vector>
#include "read_session.hpp"
#include "tcp_connection.hpp"

namespace blockview {

class TcpReadSession : public ReadSession {
public:
    TcpReadSession(size_t io_buffer_size, std::chrono::milliseconds timeout);

    // Connects, sends the read request and waits for the response header.
    void open(const ReplicaEndpoint& endpoint, const BlockDescriptor& block,
              const AccessCredential& credential, uint64_t offset,
              uint64_t length);
    size_t read(uint8_t* buf, size_t len) override;

private:
    void next_packet();
    void receive();
    size_t buffered() const { return inbuf_.size() - inbuf_off_; }
    [[noreturn]] void fail(std::error_code ec, const std::string& what);

    TcpConnection conn_;
    std::chrono::milliseconds timeout_;
    std::string peer_;
    std::vector<uint8_t> read_buf_;
    std::vector<uint8_t> inbuf_;
    size_t inbuf_off_{0};
    std::vector<uint8_t> pending_;
    size_t pending_off_{0};
    uint64_t next_offset_{0};
    uint64_t end_offset_{0};
    // Set once the stream can no longer be trusted; later reads fail with it.
    std::error_code broken_;
};

class TcpReadSessionFactory : public ReadSessionFactory {
public:
    explicit TcpReadSessionFactory(size_t io_buffer_size) : io_buffer_size_(io_buffer_size) {}
    std::unique_ptr<ReadSession> open(const ReplicaEndpoint& endpoint,
                                      const BlockDescriptor& block,
                                      const AccessCredential& credential,
                                      uint64_t offset, uint64_t length,
                                      std::chrono::milliseconds timeout) override;
private:
    size_t io_buffer_size_;
};

} // namespace blockview
