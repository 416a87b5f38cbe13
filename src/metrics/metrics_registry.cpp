#include "record_stager/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace rs {

void MetricsRegistry::reset() {
  rows_ = header_rows_ = skipped_ = bytes_ = 0;
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  std::string key(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end()) {
    stage_order_.push_back(key);
  }
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.rows = rows_;
  r.header_rows = header_rows_;
  r.skipped_lines = skipped_;
  r.bytes = bytes_;
  r.wall_time_ms = wall_ms;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0 * 1024.0)) / sec : 0.0;
  r.rows_per_sec = (sec > 0.0) ? rows_ / sec : 0.0;

  // Stages in the order they were first started; unfinished ones are left out.
  for (const auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    if (it != stage_accum_ms_.end()) r.stages.push_back(StageTiming{name, it->second});
  }
  return r;
}

}
