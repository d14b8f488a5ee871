
#include "block_viewer.hpp"
#include "tcp_read_session.hpp"

namespace blockview {

BlockViewer::BlockViewer(const ViewerConfig &cfg)
    : cfg_(cfg), owned_probe_(new TcpLivenessProbe()),
      owned_sessions_(new TcpReadSessionFactory(cfg.io_buffer_size)),
      selector_(*owned_probe_), streamer_(*owned_sessions_) {}

BlockViewer::BlockViewer(const ViewerConfig &cfg, LivenessProbe &probe,
                         ReadSessionFactory &sessions)
    : cfg_(cfg), selector_(probe), streamer_(sessions) {}

ReplicaEndpoint
BlockViewer::best_node(const std::vector<ReplicaEndpoint> &candidates) {
  return selector_.select(candidates, cfg_.probe_timeout);
}

std::vector<uint8_t>
BlockViewer::read_chunk(const BlockDescriptor &block,
                        const std::vector<ReplicaEndpoint> &candidates,
                        const AccessCredential &credential, uint64_t offset,
                        uint64_t chunk_size) {
  ReadRange range{offset, chunk_size};
  if (range.effective_length(block) == 0)
    return {};
  ReplicaEndpoint node = best_node(candidates);
  return streamer_.stream(node, block, credential, range,
                          cfg_.session_timeout, cfg_.max_retries);
}

std::vector<Line>
BlockViewer::read_lines(const BlockDescriptor &block,
                        const std::vector<ReplicaEndpoint> &candidates,
                        const AccessCredential &credential, uint64_t offset,
                        uint64_t chunk_size) {
  return split_lines(read_chunk(block, candidates, credential, offset,
                                chunk_size),
                     offset);
}

} // namespace blockview
