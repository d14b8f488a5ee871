#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace blockview {

struct BlockDescriptor {
    uint64_t block_id{0};
    uint64_t gen_stamp{0};
    uint64_t length{0};
};

struct ReplicaEndpoint {
    std::string host;
    uint16_t port{0};

    std::string to_string() const;
};

bool operator==(const ReplicaEndpoint& a, const ReplicaEndpoint& b);
bool operator!=(const ReplicaEndpoint& a, const ReplicaEndpoint& b);
bool operator<(const ReplicaEndpoint& a, const ReplicaEndpoint& b);

// Opaque token authorizing a block read. Never inspected or logged; the
// bytes are wiped when the object goes away.
class AccessCredential {
public:
    AccessCredential() = default;
    explicit AccessCredential(std::vector<uint8_t> token);
    AccessCredential(const AccessCredential&) = default;
    AccessCredential(AccessCredential&&) = default;
    AccessCredential& operator=(const AccessCredential& other);
    AccessCredential& operator=(AccessCredential&& other);
    ~AccessCredential();

    const std::vector<uint8_t>& bytes() const { return token_; }
private:
    void wipe();
    std::vector<uint8_t> token_;
};

struct ReadRange {
    uint64_t offset{0};
    uint64_t length{0};

    // min(length, block.length - offset); throws Errc::invalid_range when
    // offset is past the end of the block.
    uint64_t effective_length(const BlockDescriptor& block) const;
};

} // namespace blockview
