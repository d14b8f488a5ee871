
#include "tcp_read_session.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include <algorithm>
#include <cstring>

namespace blockview {

TcpReadSession::TcpReadSession(size_t io_buffer_size,
                               std::chrono::milliseconds timeout)
    : timeout_(timeout), read_buf_(std::max<size_t>(io_buffer_size, 512)) {}

void TcpReadSession::open(const ReplicaEndpoint &endpoint,
                          const BlockDescriptor &block,
                          const AccessCredential &credential, uint64_t offset,
                          uint64_t length) {
  peer_ = endpoint.to_string();
  if (credential.bytes().size() > kMaxTokenLen)
    throw_error(Errc::session_open_failed,
                "access token too large for " + peer_);

  std::error_code ec = conn_.connect(endpoint.host, endpoint.port, timeout_);
  if (ec)
    throw_error(Errc::session_open_failed,
                "connect to " + peer_ + " failed: " + ec.message());

  auto req = encode_read_request(block.block_id, block.gen_stamp, offset,
                                 length, credential.bytes());
  ec = conn_.write_all(req.data(), req.size(), timeout_);
  if (ec)
    throw_error(Errc::session_open_failed,
                "sending read request to " + peer_ + " failed: " +
                    ec.message());

  while (buffered() < sizeof(ReadResponseHeader)) {
    size_t n = 0;
    ec = conn_.read_some(read_buf_.data(), read_buf_.size(), n, timeout_);
    if (ec)
      throw_error(Errc::session_open_failed,
                  "no response from " + peer_ + ": " + ec.message());
    inbuf_.insert(inbuf_.end(), read_buf_.begin(), read_buf_.begin() + n);
  }

  ReadResponseHeader rsp;
  std::memcpy(&rsp, inbuf_.data() + inbuf_off_, sizeof(rsp));
  inbuf_off_ += sizeof(rsp);
  if (!header_intact(rsp) || rsp.version != kVersion)
    throw_error(Errc::session_open_failed, "malformed response from " + peer_);
  Status status = static_cast<Status>(rsp.status);
  if (status != Status::SUCCESS)
    throw_error(Errc::session_open_failed,
                "read of blk_" + std::to_string(block.block_id) +
                    " rejected by " + peer_ + ": " + status_name(status));
  if (rsp.length != length)
    throw_error(Errc::session_open_failed,
                "datanode " + peer_ + " offered " + std::to_string(rsp.length) +
                    " bytes, requested " + std::to_string(length));

  next_offset_ = offset;
  end_offset_ = offset + length;
  Logger::instance().log(LogLevel::DEBUG,
                         "opened read of blk_%llu [%llu, %llu) on %s",
                         (unsigned long long)block.block_id,
                         (unsigned long long)offset,
                         (unsigned long long)end_offset_, peer_.c_str());
}

void TcpReadSession::fail(std::error_code ec, const std::string &what) {
  broken_ = ec;
  throw std::system_error(ec, what);
}

void TcpReadSession::receive() {
  size_t n = 0;
  std::error_code ec =
      conn_.read_some(read_buf_.data(), read_buf_.size(), n, timeout_);
  if (ec == asio::error::timed_out)
    throw_error(Errc::read_timeout, "no data from " + peer_);
  if (ec == asio::error::eof)
    fail(make_error_code(Errc::short_stream),
         peer_ + " closed the stream at offset " +
             std::to_string(next_offset_));
  if (ec)
    fail(ec, "read from " + peer_ + " failed");

  if (inbuf_off_ > 0) {
    inbuf_.erase(inbuf_.begin(), inbuf_.begin() + inbuf_off_);
    inbuf_off_ = 0;
  }
  inbuf_.insert(inbuf_.end(), read_buf_.begin(), read_buf_.begin() + n);
}

void TcpReadSession::next_packet() {
  if (next_offset_ >= end_offset_)
    fail(make_error_code(Errc::short_stream),
         "read past the requested range from " + peer_);

  while (buffered() < sizeof(PacketHeader))
    receive();
  PacketHeader hdr;
  std::memcpy(&hdr, inbuf_.data() + inbuf_off_, sizeof(hdr));
  if (!header_intact(hdr))
    fail(make_error_code(Errc::malformed_header),
         "bad packet header from " + peer_);
  if (hdr.offset_in_block != next_offset_ || hdr.payload_len == 0 ||
      hdr.payload_len > end_offset_ - next_offset_)
    fail(make_error_code(Errc::out_of_sequence),
         "unexpected packet at offset " + std::to_string(hdr.offset_in_block) +
             " from " + peer_);

  while (buffered() < sizeof(PacketHeader) + hdr.payload_len)
    receive();
  const uint8_t *payload = inbuf_.data() + inbuf_off_ + sizeof(PacketHeader);
  if (crc32(payload, hdr.payload_len) != hdr.payload_crc32)
    fail(make_error_code(Errc::checksum_mismatch),
         "checksum error at offset " + std::to_string(hdr.offset_in_block) +
             " from " + peer_);

  pending_.assign(payload, payload + hdr.payload_len);
  pending_off_ = 0;
  inbuf_off_ += sizeof(PacketHeader) + hdr.payload_len;
  next_offset_ += hdr.payload_len;
}

size_t TcpReadSession::read(uint8_t *buf, size_t len) {
  if (broken_)
    throw std::system_error(broken_, "read session to " + peer_ + " broken");
  if (len == 0)
    return 0;
  if (pending_off_ == pending_.size())
    next_packet();
  size_t n = std::min(len, pending_.size() - pending_off_);
  std::memcpy(buf, pending_.data() + pending_off_, n);
  pending_off_ += n;
  return n;
}

std::unique_ptr<ReadSession>
TcpReadSessionFactory::open(const ReplicaEndpoint &endpoint,
                            const BlockDescriptor &block,
                            const AccessCredential &credential, uint64_t offset,
                            uint64_t length,
                            std::chrono::milliseconds timeout) {
  std::unique_ptr<TcpReadSession> s(
      new TcpReadSession(io_buffer_size_, timeout));
  s->open(endpoint, block, credential, offset, length);
  return s;
}

} // namespace blockview
