
#include "protocol.hpp"
#include <array>
#include <cstring>

namespace blockview {

namespace {

std::array<uint32_t, 256> make_crc_table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; i++) {
    uint32_t c = i;
    for (int j = 0; j < 8; j++)
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    table[i] = c;
  }
  return table;
}

template <typename Header>
void append_header(std::vector<uint8_t> &out, const Header &h) {
  size_t at = out.size();
  out.resize(at + sizeof(Header));
  std::memcpy(out.data() + at, &h, sizeof(Header));
}

} // namespace

uint32_t crc32(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = make_crc_table();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

std::vector<uint8_t> encode_read_request(uint64_t block_id, uint64_t gen_stamp,
                                         uint64_t offset, uint64_t length,
                                         const std::vector<uint8_t> &token) {
  ReadRequestHeader h{};
  h.magic = kMagic;
  h.version = kVersion;
  h.op = static_cast<uint8_t>(OpCode::READ_BLOCK);
  h.token_len = (uint16_t)token.size();
  h.block_id = block_id;
  h.gen_stamp = gen_stamp;
  h.offset = offset;
  h.length = length;
  seal_header(h);

  std::vector<uint8_t> out;
  out.reserve(sizeof(h) + token.size());
  append_header(out, h);
  out.insert(out.end(), token.begin(), token.end());
  return out;
}

std::vector<uint8_t> encode_response(Status status, uint64_t length) {
  ReadResponseHeader h{};
  h.magic = kMagic;
  h.version = kVersion;
  h.status = static_cast<uint16_t>(status);
  h.length = length;
  seal_header(h);
  std::vector<uint8_t> out;
  append_header(out, h);
  return out;
}

std::vector<uint8_t> encode_packet(uint64_t offset_in_block,
                                   const uint8_t *data, size_t len) {
  PacketHeader h{};
  h.magic = kMagic;
  h.payload_len = (uint32_t)len;
  h.offset_in_block = offset_in_block;
  h.payload_crc32 = crc32(data, len);
  seal_header(h);
  std::vector<uint8_t> out;
  out.reserve(sizeof(h) + len);
  append_header(out, h);
  out.insert(out.end(), data, data + len);
  return out;
}

const char *status_name(Status s) {
  switch (s) {
  case Status::SUCCESS:
    return "SUCCESS";
  case Status::ERROR:
    return "ERROR";
  case Status::ERROR_CHECKSUM:
    return "ERROR_CHECKSUM";
  case Status::ERROR_INVALID:
    return "ERROR_INVALID";
  case Status::ERROR_EXISTS:
    return "ERROR_EXISTS";
  case Status::ERROR_ACCESS_TOKEN:
    return "ERROR_ACCESS_TOKEN";
  }
  return "UNKNOWN";
}

} // namespace blockview
