#pragma once
#include <chrono>
#include <memory>
#include <vector>
#include "block.hpp"
#include "range_streamer.hpp"
#include "replica_selector.hpp"

namespace blockview {

struct ViewerConfig {
    std::chrono::milliseconds probe_timeout{60000};
    std::chrono::milliseconds session_timeout{60000};
    int max_retries{RangeStreamer::kDefaultMaxRetries};
    size_t io_buffer_size{4096};
    uint64_t default_chunk_size{32 * 1024};
};

// One viewer request: pick a reachable replica, then read from it. A failure
// while streaming is reported as is; selection is not run again.
class BlockViewer {
public:
    explicit BlockViewer(const ViewerConfig& cfg);
    BlockViewer(const ViewerConfig& cfg, LivenessProbe& probe, ReadSessionFactory& sessions);

    ReplicaEndpoint best_node(const std::vector<ReplicaEndpoint>& candidates);

    std::vector<uint8_t> read_chunk(const BlockDescriptor& block,
                                    const std::vector<ReplicaEndpoint>& candidates,
                                    const AccessCredential& credential,
                                    uint64_t offset, uint64_t chunk_size);
    std::vector<Line> read_lines(const BlockDescriptor& block,
                                 const std::vector<ReplicaEndpoint>& candidates,
                                 const AccessCredential& credential,
                                 uint64_t offset, uint64_t chunk_size);

    const ViewerConfig& config() const { return cfg_; }

private:
    ViewerConfig cfg_;
    std::unique_ptr<LivenessProbe> owned_probe_;
    std::unique_ptr<ReadSessionFactory> owned_sessions_;
    ReplicaSelector selector_;
    RangeStreamer streamer_;
};

} // namespace blockview
