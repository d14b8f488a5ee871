#pragma once
#include <string>
#include <system_error>

namespace blockview {

enum class Errc {
    no_candidates = 1,
    no_reachable_replica,
    transient_read_failure,
    invalid_range,
    session_open_failed,
    checksum_mismatch,
    out_of_sequence,
    short_stream,
    read_timeout,
    malformed_header
};

const std::error_category& blockview_category();
std::error_code make_error_code(Errc e);

[[noreturn]] void throw_error(Errc e, const std::string& what);

} // namespace blockview

namespace std {
template <> struct is_error_code_enum<blockview::Errc> : true_type {};
} // namespace std
