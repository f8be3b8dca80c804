#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Symbol visibility
#if defined(_WIN32)
  #if defined(CDL_C_API_EXPORTS)
    #define CDL_C_API __declspec(dllexport)
  #else
    #define CDL_C_API __declspec(dllimport)
  #endif
#else
  #define CDL_C_API __attribute__((visibility("default")))
#endif

#include <stddef.h>
#include <stdint.h>

// Opaque handles
typedef struct cdl_evaluator_t cdl_evaluator_t;

typedef enum cdl_status_e {
  CDL_OK = 0,
  CDL_ERROR_UNKNOWN = 1,
  CDL_ERROR_INVALID_PARAM = 2,
  CDL_ERROR_PARSE = 3,
  CDL_ERROR_MALFORMED_DURATION = 4,
  CDL_ERROR_NON_TERMINATING = 5,
  CDL_ERROR_BUFFER_TOO_SMALL = 6,
  CDL_ERROR_INTERNAL = 7
} cdl_status_t;

// Thread-local last error string
CDL_C_API const char* cdl_get_last_error(void);

// Version info (semantic version string, e.g. "3.0.0")
CDL_C_API const char* cdl_version(void);

// Lifecycle. Each evaluator owns its own aggregation state.
CDL_C_API cdl_status_t cdl_evaluator_create(cdl_evaluator_t** out_evaluator);
CDL_C_API cdl_status_t cdl_evaluator_destroy(cdl_evaluator_t* evaluator);

// Parse and halt-check a constraint definition without evaluating it.
CDL_C_API cdl_status_t cdl_check_json(const char* constraint_json);

// Parse constraint_json, evaluate it against record_json and write the result
// object {"passed","constraint_id","message","timestamp","fingerprint"} as
// NUL-terminated JSON into out_buffer.
// - out_required_size (optional) receives the buffer size needed, NUL included.
// - Passing out_buffer == NULL or buffer_size == 0 performs a size query.
// - Each logical request is evaluated once. After a size query or a
//   CDL_ERROR_BUFFER_TOO_SMALL return the result stays pending on the handle;
//   the next call with the same constraint_json and record_json text returns
//   it without evaluating again (aggregation rules observe the record once).
//   A successful fill, or a call with different inputs, drops it.
// - out_passed (optional) receives 1 or 0.
CDL_C_API cdl_status_t cdl_evaluate_json(
  cdl_evaluator_t* evaluator,
  const char* constraint_json,
  const char* record_json,
  char* out_buffer,
  size_t buffer_size,
  size_t* out_required_size,
  int* out_passed);

// Drop aggregation entries older than max_age_seconds.
CDL_C_API cdl_status_t cdl_evaluator_prune(cdl_evaluator_t* evaluator, int64_t max_age_seconds);

// Number of node evaluations performed by this evaluator.
CDL_C_API cdl_status_t cdl_evaluator_get_count(const cdl_evaluator_t* evaluator, uint64_t* out_count);

#ifdef __cplusplus
}
#endif
