
#include "range_streamer.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace blockview {

std::vector<Line> split_lines(const std::vector<uint8_t> &buf,
                              uint64_t start_offset) {
  std::vector<Line> lines;
  uint64_t offset = start_offset;
  auto pos = buf.begin();
  while (pos != buf.end()) {
    auto nl = std::find(pos, buf.end(), (uint8_t)'\n');
    std::string text(pos, nl);
    lines.push_back(Line{text, offset});
    offset += text.size() + 1;
    if (nl == buf.end())
      break;
    pos = nl + 1;
  }
  return lines;
}

std::vector<uint8_t> RangeStreamer::stream(
    const ReplicaEndpoint &endpoint, const BlockDescriptor &block,
    const AccessCredential &credential, const ReadRange &range,
    std::chrono::milliseconds session_timeout, int max_retries) {
  uint64_t amt_to_read = range.effective_length(block);
  if (amt_to_read == 0)
    return {};

  std::unique_ptr<ReadSession> session =
      sessions_.open(endpoint, block, credential, range.offset, amt_to_read,
                     session_timeout);

  enum class State { Reading, RetryPending, Failed };
  State state = State::Reading;
  int retries = std::max(max_retries, 0);
  std::error_code last_error;

  std::vector<uint8_t> buf(amt_to_read);
  size_t read_offset = 0;
  while (read_offset < buf.size()) {
    if (state == State::RetryPending) {
      if (retries == 0) {
        state = State::Failed;
        break;
      }
      retries--;
      state = State::Reading;
    }

    size_t num_read = 0;
    try {
      num_read =
          session->read(buf.data() + read_offset, buf.size() - read_offset);
      if (num_read == 0)
        last_error = make_error_code(Errc::short_stream);
    } catch (const std::system_error &e) {
      last_error = e.code();
    }
    if (num_read == 0) {
      Logger::instance().log(
          LogLevel::WARN,
          "read of blk_%llu from %s failed at %zu/%zu: %s (%d retries left)",
          (unsigned long long)block.block_id, endpoint.to_string().c_str(),
          read_offset, buf.size(), last_error.message().c_str(), retries);
      state = State::RetryPending;
      continue;
    }
    read_offset += num_read;
  }

  if (state == State::Failed)
    throw_error(Errc::transient_read_failure,
                "Could not read data from datanode " + endpoint.to_string() +
                    ": " + last_error.message());
  return buf;
}

std::vector<Line> RangeStreamer::stream_lines(
    const ReplicaEndpoint &endpoint, const BlockDescriptor &block,
    const AccessCredential &credential, const ReadRange &range,
    std::chrono::milliseconds session_timeout, int max_retries) {
  return split_lines(stream(endpoint, block, credential, range,
                            session_timeout, max_retries),
                     range.offset);
}

} // namespace blockview
