#include "cdl/error.hpp"

namespace cdl::core {

auto to_string(error_code ec) -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::parse_error: return "parse_error";
    case error_code::malformed_duration: return "malformed_duration";
    case error_code::non_terminating: return "non_terminating";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::unsupported: return "unsupported";
  }
  return "internal";
}

} // namespace cdl::core
