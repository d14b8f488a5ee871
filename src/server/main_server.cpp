
#include "block_server.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <asio.hpp>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace blockview;

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:50010";
  int threads = std::max(2u, std::thread::hardware_concurrency());
  std::string data_dir;
  uint32_t packet_size = 4096;
  std::string token_hex;
  std::string log_level;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--listen")
      listen = next(i);
    else if (a == "--threads") {
      uint64_t n = 0;
      if (!parse_u64_in_range(next(i), 1, 1024, n)) {
        std::cerr << "bad threads" << std::endl;
        return 1;
      }
      threads = (int)n;
    }
    else if (a == "--data-dir")
      data_dir = next(i);
    else if (a == "--packet-size") {
      uint64_t n = 0;
      if (!parse_u64_in_range(next(i), 1, 1u << 24, n)) {
        std::cerr << "bad packet size" << std::endl;
        return 1;
      }
      packet_size = (uint32_t)n;
    }
    else if (a == "--token")
      token_hex = next(i);
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

  std::string host;
  uint16_t port;
  if (!parse_host_port(listen, host, port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  if (data_dir.empty()) {
    std::cerr << "--data-dir is required" << std::endl;
    return 1;
  }

  ServerConfig cfg;
  cfg.listen_host = host;
  cfg.listen_port = port;
  cfg.threads = threads;
  cfg.data_dir = data_dir;
  cfg.packet_size = packet_size;
  if (!token_hex.empty()) {
    cfg.required_token = hex_to_bytes(token_hex);
    if (cfg.required_token.empty()) {
      std::cerr << "bad token" << std::endl;
      return 1;
    }
  }

  try {
    asio::io_context io;
    BlockServer server(io, cfg);
    server.start();

    std::vector<std::thread> th;
    th.reserve(cfg.threads);
    for (int i = 0; i < cfg.threads; i++)
      th.emplace_back([&]() { io.run(); });
    for (auto &t : th)
      t.join();
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "%s", e.what());
    return 1;
  }
  return 0;
}
