#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include "block.hpp"

namespace blockview {

// A range read in progress against one replica. Owns its connection; the
// connection is released when the session is destroyed.
class ReadSession {
public:
    virtual ~ReadSession() = default;
    // Copies up to len bytes of the range into buf and returns how many.
    // Throws std::system_error on a failed read.
    virtual size_t read(uint8_t* buf, size_t len) = 0;
};

class ReadSessionFactory {
public:
    virtual ~ReadSessionFactory() = default;
    // Throws std::system_error with Errc::session_open_failed when the
    // replica cannot be reached or refuses the request.
    virtual std::unique_ptr<ReadSession> open(const ReplicaEndpoint& endpoint,
                                              const BlockDescriptor& block,
                                              const AccessCredential& credential,
                                              uint64_t offset, uint64_t length,
                                              std::chrono::milliseconds timeout) = 0;
};

} // namespace blockview
