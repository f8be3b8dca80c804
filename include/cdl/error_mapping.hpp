#pragma once

#include "cdl/error.hpp"
#include "cdl/c/cdl.h"

namespace cdl::core {

constexpr cdl_status_t to_c_status(error_code ec) {
  switch (ec) {
    case error_code::ok: return CDL_OK;
    case error_code::parse_error: return CDL_ERROR_PARSE;
    case error_code::malformed_duration: return CDL_ERROR_MALFORMED_DURATION;
    case error_code::non_terminating: return CDL_ERROR_NON_TERMINATING;
    case error_code::config_invalid:
    case error_code::invalid_argument:
    case error_code::precondition_failed: return CDL_ERROR_INVALID_PARAM;
    case error_code::internal:
    case error_code::unsupported: return CDL_ERROR_INTERNAL;
  }
  return CDL_ERROR_INTERNAL;
}

constexpr error_code from_c_status(cdl_status_t st) {
  switch (st) {
    case CDL_OK: return error_code::ok;
    case CDL_ERROR_PARSE: return error_code::parse_error;
    case CDL_ERROR_MALFORMED_DURATION: return error_code::malformed_duration;
    case CDL_ERROR_NON_TERMINATING: return error_code::non_terminating;
    case CDL_ERROR_INVALID_PARAM: return error_code::invalid_argument;
    case CDL_ERROR_BUFFER_TOO_SMALL: return error_code::precondition_failed;
    default: return error_code::internal;
  }
}

} // namespace cdl::core
