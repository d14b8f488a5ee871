#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "block.hpp"
#include "read_session.hpp"

namespace blockview {

struct Line {
    std::string text;
    uint64_t offset;  // position of the first byte of the line in the block
};

// Splits on '\n' and drops the delimiters; offsets advance by the line length
// plus one so they stay true byte positions. Empty lines between two
// delimiters are kept, a trailing delimiter does not start a new line.
std::vector<Line> split_lines(const std::vector<uint8_t>& buf, uint64_t start_offset);

class RangeStreamer {
public:
    static constexpr int kDefaultMaxRetries = 2;

    explicit RangeStreamer(ReadSessionFactory& sessions) : sessions_(sessions) {}

    // Returns exactly range.effective_length(block) bytes or throws. A read
    // error consumes one retry; an error with no retries left throws
    // Errc::transient_read_failure. Session open failures propagate as
    // Errc::session_open_failed.
    std::vector<uint8_t> stream(const ReplicaEndpoint& endpoint,
                                const BlockDescriptor& block,
                                const AccessCredential& credential,
                                const ReadRange& range,
                                std::chrono::milliseconds session_timeout,
                                int max_retries = kDefaultMaxRetries);

    std::vector<Line> stream_lines(const ReplicaEndpoint& endpoint,
                                   const BlockDescriptor& block,
                                   const AccessCredential& credential,
                                   const ReadRange& range,
                                   std::chrono::milliseconds session_timeout,
                                   int max_retries = kDefaultMaxRetries);

private:
    ReadSessionFactory& sessions_;
};

} // namespace blockview
