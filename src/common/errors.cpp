
#include "errors.hpp"

namespace blockview {

namespace {

class BlockviewCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "blockview"; }

  std::string message(int ev) const override {
    switch (static_cast<Errc>(ev)) {
    case Errc::no_candidates:
      return "no nodes contain this block";
    case Errc::no_reachable_replica:
      return "could not reach any node holding the block";
    case Errc::transient_read_failure:
      return "could not read data from datanode";
    case Errc::invalid_range:
      return "read offset is past the end of the block";
    case Errc::session_open_failed:
      return "could not open read session";
    case Errc::checksum_mismatch:
      return "packet checksum mismatch";
    case Errc::out_of_sequence:
      return "packet out of sequence";
    case Errc::short_stream:
      return "stream ended before requested length";
    case Errc::read_timeout:
      return "read timed out";
    case Errc::malformed_header:
      return "malformed protocol header";
    }
    return "unknown blockview error";
  }
};

} // namespace

const std::error_category &blockview_category() {
  static BlockviewCategory cat;
  return cat;
}

std::error_code make_error_code(Errc e) {
  return std::error_code(static_cast<int>(e), blockview_category());
}

void throw_error(Errc e, const std::string &what) {
  throw std::system_error(make_error_code(e), what);
}

} // namespace blockview
