#pragma once

/** \file aggregation_state.hpp
 *  \brief Per-group append-only time series backing windowed aggregation rules.
 *
 * Structure: group_key -> [(timestamp_seconds, value), ...] in insertion order.
 * Reads scan the group's entries (no pre-aggregated index); the halt checker
 * caps window sizes. Entries are only removed by prune(), which is never
 * called implicitly.
 *
 * Thread-safety: none. The owning Evaluator serializes access.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cdl/clock.hpp"
#include "cdl/duration.hpp"

namespace cdl {

class AggregationState {
public:
  struct Entry {
    std::int64_t timestamp;  /**< seconds since epoch */
    double value;
  };

  explicit AggregationState(std::shared_ptr<const Clock> clock = system_clock());

  /** \brief Append at the clock's current time. */
  void append(std::string_view group_key, double value);
  /** \brief Append at an explicit timestamp (seconds since epoch). */
  void append(std::string_view group_key, double value, std::int64_t timestamp);

  /** \brief Values with timestamp >= now - window_seconds, oldest first. */
  [[nodiscard]] auto window(std::string_view group_key, std::int64_t window_seconds) const
      -> std::vector<double>;

  [[nodiscard]] auto sum(std::string_view group_key, std::int64_t window_seconds) const -> double;
  [[nodiscard]] auto count(std::string_view group_key, std::int64_t window_seconds) const -> std::size_t;
  /** \brief Mean over the window; 0.0 when the window is empty. */
  [[nodiscard]] auto avg(std::string_view group_key, std::int64_t window_seconds) const -> double;

  /** \brief Drop entries older than now - max_age_seconds from every group. */
  void prune(std::int64_t max_age_seconds = kSecondsPerWeek);

  [[nodiscard]] auto group_count() const noexcept -> std::size_t { return groups_.size(); }
  [[nodiscard]] auto entry_count() const noexcept -> std::size_t;
  void clear() noexcept { groups_.clear(); }

private:
  std::shared_ptr<const Clock> clock_;
  std::unordered_map<std::string, std::vector<Entry>> groups_;
};

} // namespace cdl
