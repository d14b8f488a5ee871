
#include "block_viewer.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <cstdlib>
#include <iostream>

using namespace blockview;

int main(int argc, char **argv) {
  ViewerConfig cfg;
  std::vector<ReplicaEndpoint> replicas;
  BlockDescriptor block;
  bool have_block = false, have_len = false;
  uint64_t offset = 0;
  std::string chunk;
  std::string token_hex;
  std::string log_level;
  bool lines = false;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto next_u64 = [&](int &i) -> uint64_t {
      std::string v = next(i);
      uint64_t n = 0;
      if (parse_u64(v, n))
        return n;
      std::cerr << "bad number for " << a << ": " << v << "\n";
      std::exit(1);
    };
    if (a == "--replica") {
      ReplicaEndpoint ep;
      if (!parse_host_port(next(i), ep.host, ep.port)) {
        std::cerr << "bad replica" << std::endl;
        return 1;
      }
      replicas.push_back(ep);
    } else if (a == "--block-id") {
      block.block_id = next_u64(i);
      have_block = true;
    } else if (a == "--gen-stamp")
      block.gen_stamp = next_u64(i);
    else if (a == "--block-len") {
      block.length = next_u64(i);
      have_len = true;
    } else if (a == "--offset")
      offset = next_u64(i);
    else if (a == "--chunk")
      chunk = next(i);
    else if (a == "--token")
      token_hex = next(i);
    else if (a == "--lines")
      lines = true;
    else if (a == "--probe-timeout-ms")
      cfg.probe_timeout = std::chrono::milliseconds(next_u64(i));
    else if (a == "--session-timeout-ms")
      cfg.session_timeout = std::chrono::milliseconds(next_u64(i));
    else if (a == "--retries") {
      uint64_t n = 0;
      if (!parse_u64_in_range(next(i), 0, 100, n)) {
        std::cerr << "bad retries" << std::endl;
        return 1;
      }
      cfg.max_retries = (int)n;
    }
    else if (a == "--log-level")
      log_level = next(i);
    else {
      std::cerr << "unknown option " << a << "\n";
      return 1;
    }
  }

  if (!log_level.empty()) {
    LogLevel lvl;
    if (!parse_log_level(log_level, lvl)) {
      std::cerr << "bad log level" << std::endl;
      return 1;
    }
    Logger::instance().set_level(lvl);
  }
  if (!have_block || !have_len) {
    std::cerr << "--block-id and --block-len are required" << std::endl;
    return 1;
  }

  AccessCredential credential;
  if (!token_hex.empty()) {
    credential = AccessCredential(hex_to_bytes(token_hex));
    if (credential.bytes().empty()) {
      std::cerr << "bad token" << std::endl;
      return 1;
    }
  }
  uint64_t chunk_size = parse_chunk_size(chunk, cfg.default_chunk_size);

  try {
    BlockViewer viewer(cfg);
    if (lines) {
      for (const auto &l :
           viewer.read_lines(block, replicas, credential, offset, chunk_size))
        std::cout << l.offset << '\t' << l.text << '\n';
    } else {
      auto data =
          viewer.read_chunk(block, replicas, credential, offset, chunk_size);
      std::cout.write(reinterpret_cast<const char *>(data.data()),
                      (std::streamsize)data.size());
    }
    std::cout.flush();
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "%s", e.what());
    return 1;
  }
  return 0;
}
