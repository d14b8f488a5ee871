#pragma once
#include <asio.hpp>
#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace blockview {

struct ServerConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{};
    int threads{4};
    std::string data_dir;
    uint32_t packet_size{4096};
    std::chrono::milliseconds request_timeout{60000};
    // When non-empty, read requests must present exactly this token.
    std::vector<uint8_t> required_token;
};

// Serves one range read per connection from replica files named
// blk_<block id>_<generation stamp> in the data directory.
class BlockServer {
public:
    using tcp = asio::ip::tcp;

    struct Conn : public std::enable_shared_from_this<Conn> {
        tcp::socket sock;
        asio::steady_timer deadline;
        ReadRequestHeader req{};
        std::vector<uint8_t> token;
        std::ifstream file;
        uint64_t next_offset{0};
        uint64_t end_offset{0};
        std::vector<uint8_t> chunk;
        std::vector<uint8_t> out;
        // The socket and its deadline share a strand so the timeout handler
        // never races a pending read on another worker thread.
        Conn(asio::io_context& io)
            : sock(asio::make_strand(io)), deadline(sock.get_executor()) {}
    };

    BlockServer(asio::io_context& io, const ServerConfig& cfg);
    void start();
    // Port actually bound; differs from the configured one when that was 0.
    uint16_t port() const;

    std::string replica_path(uint64_t block_id, uint64_t gen_stamp) const;

private:
    void do_accept();
    void read_request(std::shared_ptr<Conn> c);
    void read_token(std::shared_ptr<Conn> c);
    void handle_request(std::shared_ptr<Conn> c);
    void reply_error(std::shared_ptr<Conn> c, Status status);
    void send_next_packet(std::shared_ptr<Conn> c);
    void finish(std::shared_ptr<Conn> c);

    asio::io_context& io_;
    ServerConfig cfg_;
    tcp::acceptor acceptor_;
};

} // namespace blockview
