#pragma once
#include <string>
#include <string_view>
#include <new>

namespace cdl_c {
  // Shared thread-local error buffer for all C API translation units
  extern thread_local std::string g_last_error;

  inline void set_error(std::string_view s) noexcept {
    try {
      g_last_error.assign(s.data(), s.size());
    } catch (const std::bad_alloc&) {
      g_last_error.clear();
    }
  }
  inline void clear_error() noexcept {
    g_last_error.clear();
  }
} // namespace cdl_c
