
#include "block.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sodium.h>
#include <tuple>

namespace blockview {

std::string ReplicaEndpoint::to_string() const {
  if (host.find(':') != std::string::npos)
    return "[" + host + "]:" + std::to_string(port);
  return host + ":" + std::to_string(port);
}

bool operator==(const ReplicaEndpoint &a, const ReplicaEndpoint &b) {
  return a.port == b.port && a.host == b.host;
}

bool operator!=(const ReplicaEndpoint &a, const ReplicaEndpoint &b) {
  return !(a == b);
}

bool operator<(const ReplicaEndpoint &a, const ReplicaEndpoint &b) {
  return std::tie(a.host, a.port) < std::tie(b.host, b.port);
}

AccessCredential::AccessCredential(std::vector<uint8_t> token)
    : token_(std::move(token)) {}

AccessCredential &AccessCredential::operator=(const AccessCredential &other) {
  if (this != &other) {
    wipe();
    token_ = other.token_;
  }
  return *this;
}

AccessCredential &AccessCredential::operator=(AccessCredential &&other) {
  if (this != &other) {
    wipe();
    token_ = std::move(other.token_);
  }
  return *this;
}

AccessCredential::~AccessCredential() { wipe(); }

void AccessCredential::wipe() {
  if (!token_.empty())
    sodium_memzero(token_.data(), token_.size());
  token_.clear();
}

uint64_t ReadRange::effective_length(const BlockDescriptor &block) const {
  if (offset > block.length)
    throw_error(Errc::invalid_range,
                "offset " + std::to_string(offset) + " past block length " +
                    std::to_string(block.length));
  return std::min(length, block.length - offset);
}

} // namespace blockview
