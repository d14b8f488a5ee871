#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

#include "block_server.hpp"
#include "block_viewer.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "tcp_read_session.hpp"

namespace blockview {
namespace {

namespace fs = std::filesystem;

const std::chrono::milliseconds kTimeout(2000);

// A port nothing listens on: bind an ephemeral port, then release it.
uint16_t closed_port() {
  asio::io_context io;
  asio::ip::tcp::acceptor acc(
      io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  uint16_t port = acc.local_endpoint().port();
  acc.close();
  return port;
}

class EndToEndTest : public ::testing::Test {
protected:
  void SetUp() override {
    static std::atomic<int> seq{0};
    dir_ = fs::temp_directory_path() /
           ("blockview_e2e_" + std::to_string(::getpid()) + "_" +
            std::to_string(seq++));
    fs::create_directories(dir_);

    for (int i = 0; i < 10000; ++i)
      content_ += "line " + std::to_string(i) + "\n";
    block_ = BlockDescriptor{4242, 1007, content_.size()};
    std::ofstream(dir_ / "blk_4242_1007", std::ios::binary) << content_;
  }

  void TearDown() override {
    io_.stop();
    for (auto &t : threads_)
      t.join();
    server_.reset();
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void start_server(std::vector<uint8_t> token = {},
                    std::chrono::milliseconds request_timeout =
                        std::chrono::milliseconds(60000)) {
    ServerConfig cfg;
    cfg.request_timeout = request_timeout;
    cfg.listen_host = "127.0.0.1";
    cfg.listen_port = 0;
    cfg.data_dir = dir_.string();
    cfg.packet_size = 1000;
    cfg.required_token = std::move(token);
    server_.reset(new BlockServer(io_, cfg));
    server_->start();
    for (int i = 0; i < 2; ++i)
      threads_.emplace_back([this]() { io_.run(); });
  }

  ReplicaEndpoint live() const {
    return ReplicaEndpoint{"127.0.0.1", server_->port()};
  }

  std::vector<uint8_t> stream(uint64_t offset, uint64_t length,
                              const AccessCredential &credential,
                              const BlockDescriptor &block) {
    TcpReadSessionFactory sessions(4096);
    RangeStreamer streamer(sessions);
    return streamer.stream(live(), block, credential,
                           ReadRange{offset, length}, kTimeout);
  }

  std::error_code stream_error(const AccessCredential &credential,
                               const BlockDescriptor &block) {
    try {
      stream(0, 100, credential, block);
    } catch (const std::system_error &e) {
      return e.code();
    }
    ADD_FAILURE() << "stream did not fail";
    return {};
  }

  fs::path dir_;
  std::string content_;
  BlockDescriptor block_;
  asio::io_context io_;
  std::unique_ptr<BlockServer> server_;
  std::vector<std::thread> threads_;
};

// Answers one read request with a fixed byte script, then hangs up.
class ScriptedReplica {
public:
  struct Step {
    std::vector<uint8_t> bytes;
    std::chrono::milliseconds pause{0};
  };

  explicit ScriptedReplica(std::vector<Step> script)
      : acceptor_(io_, asio::ip::tcp::endpoint(
                           asio::ip::make_address("127.0.0.1"), 0)),
        port_(acceptor_.local_endpoint().port()),
        script_(std::move(script)) {
    thread_ = std::thread([this]() { serve(); });
  }

  ~ScriptedReplica() {
    if (!accepted_) {
      // Unblock accept when the test never connected.
      asio::ip::tcp::socket s(io_);
      std::error_code ec;
      s.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"),
                                        port_),
                ec);
    }
    thread_.join();
  }

  ReplicaEndpoint endpoint() const {
    return ReplicaEndpoint{"127.0.0.1", port_};
  }

private:
  void serve() {
    asio::ip::tcp::socket sock(io_);
    std::error_code ec;
    acceptor_.accept(sock, ec);
    accepted_ = true;
    if (ec)
      return;
    ReadRequestHeader req{};
    asio::read(sock, asio::buffer(&req, sizeof(req)), ec);
    if (ec)
      return;
    std::vector<uint8_t> token(req.token_len);
    asio::read(sock, asio::buffer(token), ec);
    if (ec)
      return;
    for (const auto &step : script_) {
      std::this_thread::sleep_for(step.pause);
      asio::write(sock, asio::buffer(step.bytes), ec);
      if (ec)
        return;
    }
    sock.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    sock.close(ec);
  }

  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_;
  uint16_t port_;
  std::vector<Step> script_;
  std::atomic<bool> accepted_{false};
  std::thread thread_;
};

class ScriptedStreamTest : public ::testing::Test {
protected:
  static constexpr uint64_t kLen = 100;

  void SetUp() override {
    for (uint64_t i = 0; i < kLen; ++i)
      content_.push_back(static_cast<char>('a' + i % 26));
    block_ = BlockDescriptor{7, 1, kLen};
  }

  std::vector<uint8_t> packet(uint64_t offset, uint64_t from, size_t len) const {
    return encode_packet(
        offset, reinterpret_cast<const uint8_t *>(content_.data()) + from, len);
  }

  ScriptedReplica::Step response() const {
    return {encode_response(Status::SUCCESS, kLen)};
  }

  std::vector<uint8_t> stream(const ScriptedReplica &replica,
                              std::chrono::milliseconds timeout, int retries) {
    TcpReadSessionFactory sessions(4096);
    RangeStreamer streamer(sessions);
    return streamer.stream(replica.endpoint(), block_, AccessCredential(),
                           ReadRange{0, kLen}, timeout, retries);
  }

  std::error_code stream_error(const ScriptedReplica &replica) {
    try {
      stream(replica, kTimeout, 2);
    } catch (const std::system_error &e) {
      return e.code();
    }
    ADD_FAILURE() << "stream did not fail";
    return {};
  }

  std::string content_;
  BlockDescriptor block_;
};

TEST_F(ScriptedStreamTest, CorruptPayloadFailsAfterRetries) {
  auto bad = packet(0, 0, kLen);
  bad.back() ^= 0xff;
  ScriptedReplica replica({response(), {bad}});
  EXPECT_EQ(make_error_code(Errc::transient_read_failure),
            stream_error(replica));
}

TEST_F(ScriptedStreamTest, CorruptPayloadKeepsSessionBroken) {
  auto bad = packet(0, 0, kLen);
  bad.back() ^= 0xff;
  ScriptedReplica replica({response(), {bad}});
  TcpReadSessionFactory sessions(4096);
  auto session = sessions.open(replica.endpoint(), block_, AccessCredential(),
                               0, kLen, kTimeout);
  uint8_t buf[kLen];
  for (int i = 0; i < 3; ++i) {
    try {
      session->read(buf, sizeof(buf));
      FAIL() << "read returned corrupt data";
    } catch (const std::system_error &e) {
      EXPECT_EQ(make_error_code(Errc::checksum_mismatch), e.code());
    }
  }
}

TEST_F(ScriptedStreamTest, WrongPacketOffsetFails) {
  ScriptedReplica replica({response(), {packet(10, 0, 50)}});
  EXPECT_EQ(make_error_code(Errc::transient_read_failure),
            stream_error(replica));
}

TEST_F(ScriptedStreamTest, EarlyCloseFails) {
  ScriptedReplica replica({response(), {packet(0, 0, 50)}});
  EXPECT_EQ(make_error_code(Errc::transient_read_failure),
            stream_error(replica));
}

TEST_F(ScriptedStreamTest, StallRecoversWithOneRetry) {
  // The second packet arrives after one read timeout but before a second.
  const std::chrono::milliseconds timeout(400);
  ScriptedReplica replica({response(), {packet(0, 0, 50)},
                           {packet(50, 50, 50), std::chrono::milliseconds(600)}});
  auto data = stream(replica, timeout, 1);
  EXPECT_EQ(content_, std::string(data.begin(), data.end()));
}

TEST_F(ScriptedStreamTest, StallBeyondRetriesFails) {
  const std::chrono::milliseconds timeout(200);
  ScriptedReplica replica({response(), {packet(0, 0, 50)},
                           {packet(50, 50, 50), std::chrono::milliseconds(1000)}});
  try {
    stream(replica, timeout, 1);
    FAIL() << "expected transient_read_failure";
  } catch (const std::system_error &e) {
    EXPECT_EQ(make_error_code(Errc::transient_read_failure), e.code());
  }
}

TEST(TcpConnectionTest, ConnectReturnsWithinDeadline) {
  TcpConnection conn;
  auto start = std::chrono::steady_clock::now();
  // Non-routable; either times out or fails fast when there is no route.
  std::error_code ec =
      conn.connect("10.255.255.1", 9, std::chrono::milliseconds(200));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(static_cast<bool>(ec));
  EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}

TEST_F(EndToEndTest, IncompleteRequestIsDropped) {
  start_server({}, std::chrono::milliseconds(200));
  TcpConnection conn;
  ASSERT_FALSE(conn.connect("127.0.0.1", server_->port(), kTimeout));
  auto req = encode_read_request(4242, 1007, 0, 10, {});
  ASSERT_FALSE(conn.write_all(req.data(), 10, kTimeout));
  uint8_t buf[64];
  size_t n = 0;
  std::error_code eof = asio::error::eof;
  EXPECT_EQ(eof, conn.read_some(buf, sizeof(buf), n, kTimeout));
}

TEST_F(EndToEndTest, NonRegularReplicaIsRejected) {
  start_server();
  fs::create_directory(dir_ / "blk_4242_2000");
  BlockDescriptor dir_block = block_;
  dir_block.gen_stamp = 2000;
  EXPECT_EQ(make_error_code(Errc::session_open_failed),
            stream_error(AccessCredential(), dir_block));
}

TEST_F(EndToEndTest, ProbeRefusedPort) {
  TcpLivenessProbe probe;
  EXPECT_TRUE(static_cast<bool>(
      probe.probe(ReplicaEndpoint{"127.0.0.1", closed_port()}, kTimeout)));
}

TEST_F(EndToEndTest, SelectorSkipsDeadReplica) {
  start_server();
  TcpLivenessProbe probe;
  ReplicaSelector selector(probe);
  ReplicaEndpoint dead{"127.0.0.1", closed_port()};
  for (int i = 0; i < 5; ++i)
    EXPECT_EQ(live(), selector.select({dead, live()}, kTimeout));
}

TEST_F(EndToEndTest, SelectorFailsWhenAllRefuse) {
  TcpLivenessProbe probe;
  ReplicaSelector selector(probe);
  try {
    selector.select({ReplicaEndpoint{"127.0.0.1", closed_port()}}, kTimeout);
    FAIL() << "expected no_reachable_replica";
  } catch (const std::system_error &e) {
    EXPECT_EQ(make_error_code(Errc::no_reachable_replica), e.code());
  }
}

TEST_F(EndToEndTest, StreamsRangeAcrossPackets) {
  start_server();
  auto data = stream(123, 5000, AccessCredential(), block_);
  EXPECT_EQ(content_.substr(123, 5000), std::string(data.begin(), data.end()));
}

TEST_F(EndToEndTest, StreamClampsAtBlockEnd) {
  start_server();
  auto data = stream(content_.size() - 10, 4096, AccessCredential(), block_);
  EXPECT_EQ(content_.substr(content_.size() - 10),
            std::string(data.begin(), data.end()));
}

TEST_F(EndToEndTest, TokenIsChecked) {
  start_server({0x01, 0x02, 0x03});
  AccessCredential good(std::vector<uint8_t>{0x01, 0x02, 0x03});
  AccessCredential bad(std::vector<uint8_t>{0x01, 0x02, 0x04});
  EXPECT_EQ(100u, stream(0, 100, good, block_).size());
  EXPECT_EQ(make_error_code(Errc::session_open_failed),
            stream_error(bad, block_));
  EXPECT_EQ(make_error_code(Errc::session_open_failed),
            stream_error(AccessCredential(), block_));
}

TEST_F(EndToEndTest, StaleGenerationStampIsRejected) {
  start_server();
  BlockDescriptor stale = block_;
  stale.gen_stamp = 1006;
  EXPECT_EQ(make_error_code(Errc::session_open_failed),
            stream_error(AccessCredential(), stale));
}

TEST_F(EndToEndTest, ConnectFailureIsSessionOpenError) {
  TcpReadSessionFactory sessions(4096);
  RangeStreamer streamer(sessions);
  try {
    streamer.stream(ReplicaEndpoint{"127.0.0.1", closed_port()}, block_,
                    AccessCredential(), ReadRange{0, 10}, kTimeout);
    FAIL() << "expected session_open_failed";
  } catch (const std::system_error &e) {
    EXPECT_EQ(make_error_code(Errc::session_open_failed), e.code());
  }
}

TEST_F(EndToEndTest, ViewerReadsLines) {
  start_server();
  ViewerConfig cfg;
  cfg.probe_timeout = kTimeout;
  cfg.session_timeout = kTimeout;
  BlockViewer viewer(cfg);
  std::vector<ReplicaEndpoint> candidates{
      ReplicaEndpoint{"127.0.0.1", closed_port()}, live()};

  // "line 0\n" is 7 bytes, "line 1\n" starts at 7.
  auto lines = viewer.read_lines(block_, candidates, AccessCredential(), 7, 14);
  ASSERT_EQ(2u, lines.size());
  EXPECT_EQ("line 1", lines[0].text);
  EXPECT_EQ(7u, lines[0].offset);
  EXPECT_EQ("line 2", lines[1].text);
  EXPECT_EQ(14u, lines[1].offset);
}

} // namespace
} // namespace blockview
