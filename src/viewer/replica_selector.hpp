#pragma once
#include <chrono>
#include <system_error>
#include <vector>
#include "block.hpp"

namespace blockview {

class LivenessProbe {
public:
    virtual ~LivenessProbe() = default;
    // Empty error code when the endpoint accepted a connection in time.
    virtual std::error_code probe(const ReplicaEndpoint& endpoint,
                                  std::chrono::milliseconds timeout) = 0;
};

// Connects to the data-transfer port and hangs up immediately.
class TcpLivenessProbe : public LivenessProbe {
public:
    std::error_code probe(const ReplicaEndpoint& endpoint,
                          std::chrono::milliseconds timeout) override;
};

class ReplicaSelector {
public:
    explicit ReplicaSelector(LivenessProbe& probe) : probe_(probe) {}

    // Picks candidates uniformly at random among those not yet found dead and
    // returns the first one whose probe succeeds. Throws Errc::no_candidates
    // for an empty list and Errc::no_reachable_replica once every candidate
    // has failed its probe.
    ReplicaEndpoint select(const std::vector<ReplicaEndpoint>& candidates,
                           std::chrono::milliseconds probe_timeout);

private:
    LivenessProbe& probe_;
};

} // namespace blockview
