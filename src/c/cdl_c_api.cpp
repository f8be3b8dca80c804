#include "cdl/c/cdl.h"

#include <cstring>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <string_view>

#include "cdl/error_mapping.hpp"
#include "cdl/evaluator.hpp"
#include "cdl/parser.hpp"
#include "cdl/value.hpp"

struct cdl_evaluator_t {
  std::unique_ptr<cdl::Evaluator> evaluator;

  // Result computed by a size query or a too-small fill, held until delivered.
  std::mutex pending_mutex;
  std::optional<std::string> pending_json;
  std::string pending_constraint;
  std::string pending_record;
  bool pending_passed{false};
};

#include "cdl_c_error.hpp"

thread_local std::string cdl_c::g_last_error;
using cdl_c::set_error;
using cdl_c::clear_error;

namespace {

cdl_status_t report(const cdl::core::error& e) {
  set_error(e.message);
  return cdl::core::to_c_status(e.code);
}

} // namespace

extern "C" {

CDL_C_API const char* cdl_get_last_error(void) {
  return cdl_c::g_last_error.empty() ? "" : cdl_c::g_last_error.c_str();
}

CDL_C_API const char* cdl_version(void) {
  return "3.0.0";
}

cdl_status_t cdl_evaluator_create(cdl_evaluator_t** out_evaluator) {
  if (!out_evaluator) return CDL_ERROR_INVALID_PARAM;
  clear_error();
  try {
    auto handle = std::make_unique<cdl_evaluator_t>();
    handle->evaluator = std::make_unique<cdl::Evaluator>();
    *out_evaluator = handle.release();
    return CDL_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return CDL_ERROR_INTERNAL;
  } catch (...) {
    set_error("unknown error in evaluator_create");
    return CDL_ERROR_UNKNOWN;
  }
}

cdl_status_t cdl_evaluator_destroy(cdl_evaluator_t* evaluator) {
  if (!evaluator) return CDL_ERROR_INVALID_PARAM;
  delete evaluator;
  return CDL_OK;
}

cdl_status_t cdl_check_json(const char* constraint_json) {
  if (!constraint_json) return CDL_ERROR_INVALID_PARAM;
  clear_error();
  try {
    auto parsed = cdl::Parser{}.parse_text(std::string_view(constraint_json));
    if (!parsed) return report(parsed.error());
    return CDL_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return CDL_ERROR_INTERNAL;
  } catch (...) {
    set_error("unknown error in check_json");
    return CDL_ERROR_UNKNOWN;
  }
}

cdl_status_t cdl_evaluate_json(
  cdl_evaluator_t* evaluator,
  const char* constraint_json,
  const char* record_json,
  char* out_buffer,
  size_t buffer_size,
  size_t* out_required_size,
  int* out_passed) {
  if (!evaluator || !evaluator->evaluator || !constraint_json || !record_json) return CDL_ERROR_INVALID_PARAM;
  clear_error();
  try {
    std::lock_guard lock(evaluator->pending_mutex);
    const bool same_request = evaluator->pending_json &&
                              evaluator->pending_constraint == constraint_json &&
                              evaluator->pending_record == record_json;
    if (!same_request) {
      evaluator->pending_json.reset();
      auto constraint = cdl::Parser{}.parse_text(std::string_view(constraint_json));
      if (!constraint) return report(constraint.error());
      auto record = cdl::Value::parse(std::string_view(record_json));
      if (!record) return report(record.error());

      const auto result = evaluator->evaluator->evaluate(*constraint, *record);
      evaluator->pending_json = cdl::to_json(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
      evaluator->pending_constraint = constraint_json;
      evaluator->pending_record = record_json;
      evaluator->pending_passed = result.passed;
    }

    const std::string& s = *evaluator->pending_json;
    if (out_passed) *out_passed = evaluator->pending_passed ? 1 : 0;
    const size_t required = s.size() + 1; // include NUL
    if (out_required_size) *out_required_size = required;

    if (!out_buffer || buffer_size == 0) {
      // Size query only; the result stays pending for the fill call
      return CDL_OK;
    }
    if (buffer_size < required) {
      set_error("buffer too small for evaluation result json");
      return CDL_ERROR_BUFFER_TOO_SMALL;
    }
    std::memcpy(out_buffer, s.c_str(), required);
    evaluator->pending_json.reset();
    return CDL_OK;
  } catch (const std::exception& e) {
    set_error(e.what());
    return CDL_ERROR_INTERNAL;
  } catch (...) {
    set_error("unknown error in evaluate_json");
    return CDL_ERROR_UNKNOWN;
  }
}

cdl_status_t cdl_evaluator_prune(cdl_evaluator_t* evaluator, int64_t max_age_seconds) {
  if (!evaluator || !evaluator->evaluator || max_age_seconds < 0) return CDL_ERROR_INVALID_PARAM;
  clear_error();
  evaluator->evaluator->prune_aggregations(max_age_seconds);
  return CDL_OK;
}

cdl_status_t cdl_evaluator_get_count(const cdl_evaluator_t* evaluator, uint64_t* out_count) {
  if (!evaluator || !evaluator->evaluator || !out_count) return CDL_ERROR_INVALID_PARAM;
  clear_error();
  *out_count = evaluator->evaluator->evaluation_count();
  return CDL_OK;
}

} // extern "C"
