#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; values never change meaning.
 * - Human-readable message and originating component for diagnostics.
 * - Only structural problems (bad definitions, non-terminating trees) are
 *   reported through this type. Evaluation problems become failing results.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace cdl::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  parse_error = 2101,        /**< definition missing fields or using unknown literals */
  malformed_duration = 2102, /**< duration string outside <N><s|m|h|d|w> */
  non_terminating = 2201,    /**< halt checker rejected the constraint tree */
  precondition_failed = 4001,
  internal = 9001,
  invalid_argument = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "cdl.parser" */
};

/** \brief Short stable name of an error code ("parse_error", ...). */
auto to_string(error_code ec) -> std::string_view;

} // namespace cdl::core
