#pragma once

/** \file clock.hpp
 *  \brief Injectable wall-clock used by windowed aggregation and temporal operators.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace cdl {

/** \brief Source of "now" as milliseconds since the Unix epoch. */
class Clock {
public:
  virtual ~Clock() = default;

  [[nodiscard]] virtual auto now() const -> std::chrono::milliseconds = 0;

  [[nodiscard]] auto now_ms() const -> std::int64_t { return now().count(); }
  [[nodiscard]] auto now_seconds() const -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(now()).count();
  }
};

/** \brief std::chrono::system_clock. */
class SystemClock final : public Clock {
public:
  [[nodiscard]] auto now() const -> std::chrono::milliseconds override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
  }
};

/** \brief Clock that only moves when told to. Used by tests and replays.
 *
 * Thread-safety: set/advance/now are safe to call concurrently.
 */
class ManualClock final : public Clock {
public:
  explicit ManualClock(std::chrono::milliseconds start = std::chrono::milliseconds{0})
      : now_ms_(start.count()) {}

  [[nodiscard]] auto now() const -> std::chrono::milliseconds override {
    return std::chrono::milliseconds{now_ms_.load(std::memory_order_acquire)};
  }

  void set(std::chrono::milliseconds t) { now_ms_.store(t.count(), std::memory_order_release); }
  void advance(std::chrono::milliseconds d) { now_ms_.fetch_add(d.count(), std::memory_order_acq_rel); }

private:
  std::atomic<std::int64_t> now_ms_;
};

/** \brief Process-wide SystemClock instance. */
inline auto system_clock() -> std::shared_ptr<const Clock> {
  static const auto clock = std::make_shared<const SystemClock>();
  return clock;
}

} // namespace cdl
