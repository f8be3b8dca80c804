#include "cdl/aggregation_state.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace cdl {

AggregationState::AggregationState(std::shared_ptr<const Clock> clock)
    : clock_(clock ? std::move(clock) : system_clock()) {}

void AggregationState::append(std::string_view group_key, double value) {
  append(group_key, value, clock_->now_seconds());
}

void AggregationState::append(std::string_view group_key, double value, std::int64_t timestamp) {
  auto it = groups_.find(std::string(group_key));
  if (it == groups_.end()) {
    it = groups_.emplace(std::string(group_key), std::vector<Entry>{}).first;
  }
  it->second.push_back(Entry{timestamp, value});
}

auto AggregationState::window(std::string_view group_key, std::int64_t window_seconds) const
    -> std::vector<double> {
  std::vector<double> out;
  auto it = groups_.find(std::string(group_key));
  if (it == groups_.end()) return out;

  const std::int64_t cutoff = clock_->now_seconds() - window_seconds;
  for (const auto& e : it->second) {
    if (e.timestamp >= cutoff) out.push_back(e.value);
  }
  return out;
}

auto AggregationState::sum(std::string_view group_key, std::int64_t window_seconds) const -> double {
  const auto values = window(group_key, window_seconds);
  return std::accumulate(values.begin(), values.end(), 0.0);
}

auto AggregationState::count(std::string_view group_key, std::int64_t window_seconds) const
    -> std::size_t {
  return window(group_key, window_seconds).size();
}

auto AggregationState::avg(std::string_view group_key, std::int64_t window_seconds) const -> double {
  const auto values = window(group_key, window_seconds);
  if (values.empty()) return 0.0;
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

void AggregationState::prune(std::int64_t max_age_seconds) {
  const std::int64_t cutoff = clock_->now_seconds() - max_age_seconds;
  for (auto it = groups_.begin(); it != groups_.end();) {
    auto& entries = it->second;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [cutoff](const Entry& e) { return e.timestamp < cutoff; }),
                  entries.end());
    if (entries.empty()) {
      it = groups_.erase(it);
    } else {
      ++it;
    }
  }
}

auto AggregationState::entry_count() const noexcept -> std::size_t {
  std::size_t n = 0;
  for (const auto& [key, entries] : groups_) n += entries.size();
  return n;
}

} // namespace cdl
