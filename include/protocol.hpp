#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace blockview {

constexpr uint32_t kMagic = 0x424C4B56; // 'BLKV'
constexpr uint8_t  kVersion = 1;
constexpr uint16_t kMaxTokenLen = 4096;

enum class OpCode : uint8_t { READ_BLOCK = 81 };

enum class Status : uint16_t {
    SUCCESS = 0,
    ERROR = 1,
    ERROR_CHECKSUM = 2,
    ERROR_INVALID = 3,
    ERROR_EXISTS = 4,
    ERROR_ACCESS_TOKEN = 5
};

#pragma pack(push, 1)
// Followed on the wire by token_len credential bytes.
struct ReadRequestHeader {
    uint32_t magic;
    uint8_t  version;
    uint8_t  op;
    uint16_t token_len;
    uint64_t block_id;
    uint64_t gen_stamp;
    uint64_t offset;
    uint64_t length;
    uint32_t header_crc32;
};

struct ReadResponseHeader {
    uint32_t magic;
    uint8_t  version;
    uint8_t  reserved;
    uint16_t status;
    uint64_t length;
    uint32_t header_crc32;
};

// Followed on the wire by payload_len data bytes.
struct PacketHeader {
    uint32_t magic;
    uint32_t payload_len;
    uint64_t offset_in_block;
    uint32_t payload_crc32;
    uint32_t header_crc32;
};
#pragma pack(pop)
static_assert(sizeof(ReadRequestHeader) == 44, "ReadRequestHeader must be 44 bytes");
static_assert(sizeof(ReadResponseHeader) == 20, "ReadResponseHeader must be 20 bytes");
static_assert(sizeof(PacketHeader) == 24, "PacketHeader must be 24 bytes");

uint32_t crc32(const uint8_t* data, size_t len);

// header_crc32 is always the trailing field and covers everything before it.
template <typename Header>
void seal_header(Header& h) {
    h.header_crc32 = crc32(reinterpret_cast<const uint8_t*>(&h), sizeof(h) - 4);
}

template <typename Header>
bool header_intact(const Header& h) {
    return h.magic == kMagic &&
           h.header_crc32 == crc32(reinterpret_cast<const uint8_t*>(&h), sizeof(h) - 4);
}

std::vector<uint8_t> encode_read_request(uint64_t block_id, uint64_t gen_stamp,
                                         uint64_t offset, uint64_t length,
                                         const std::vector<uint8_t>& token);
std::vector<uint8_t> encode_response(Status status, uint64_t length);
std::vector<uint8_t> encode_packet(uint64_t offset_in_block, const uint8_t* data, size_t len);

const char* status_name(Status s);

} // namespace blockview
