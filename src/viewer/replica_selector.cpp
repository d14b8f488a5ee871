
#include "replica_selector.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "random_source.hpp"
#include "tcp_connection.hpp"
#include <algorithm>
#include <set>

namespace blockview {

std::error_code TcpLivenessProbe::probe(const ReplicaEndpoint &endpoint,
                                        std::chrono::milliseconds timeout) {
  TcpConnection conn;
  return conn.connect(endpoint.host, endpoint.port, timeout);
}

ReplicaEndpoint
ReplicaSelector::select(const std::vector<ReplicaEndpoint> &candidates,
                        std::chrono::milliseconds probe_timeout) {
  if (candidates.empty())
    throw_error(Errc::no_candidates, "No nodes contain this block");

  std::set<ReplicaEndpoint> dead;
  std::vector<size_t> live(candidates.size());
  for (size_t i = 0; i < live.size(); ++i)
    live[i] = i;
  size_t failures = 0;

  auto &rng = RandomSource::instance();
  while (!live.empty()) {
    const ReplicaEndpoint &chosen =
        candidates[live[rng.uniform((uint32_t)live.size())]];

    std::error_code ec = probe_.probe(chosen, probe_timeout);
    if (!ec) {
      Logger::instance().log(LogLevel::DEBUG, "replica %s is reachable",
                             chosen.to_string().c_str());
      return chosen;
    }

    failures++;
    Logger::instance().log(LogLevel::WARN,
                           "replica %s failed liveness probe: %s (%zu/%zu)",
                           chosen.to_string().c_str(), ec.message().c_str(),
                           failures, candidates.size());
    dead.insert(chosen);
    live.erase(std::remove_if(live.begin(), live.end(),
                              [&](size_t i) {
                                return dead.count(candidates[i]) != 0;
                              }),
               live.end());
  }

  throw_error(Errc::no_reachable_replica,
              "Could not reach the block containing the data. Please try "
              "again");
}

} // namespace blockview
