#pragma once

#include <optional>
#include <string>
#include <cstdlib>

namespace cdl::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// True when CDL_DEBUG is set to something that does not start with '0'.
// Gates the [CDL][...] trace lines written to std::cerr.
inline bool debug_enabled() noexcept {
    auto v = safe_getenv("CDL_DEBUG");
    return v && !v->empty() && ((*v)[0] != '0');
}

} // namespace cdl::core
