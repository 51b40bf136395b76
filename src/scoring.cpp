#include "pacer/scoring.hpp"

#include <algorithm>
#include <cmath>

#include "pacer/clock.hpp"

namespace pacer {

namespace {

int clamp_score(double v) {
  const long r = std::lround(v);
  return static_cast<int>(std::max(0L, std::min(100L, r)));
}

}  // namespace

int login_success_rate(const std::vector<SessionAttempt>& attempts) {
  if (attempts.empty()) return 100;
  std::size_t ok = 0;
  for (const auto& a : attempts) {
    if (a.success) ++ok;
  }
  return clamp_score(100.0 * static_cast<double>(ok) / static_cast<double>(attempts.size()));
}

int post_success_rate(const std::vector<PublishOutcome>& outcomes) {
  std::size_t published = 0;
  std::size_t failed = 0;
  for (const auto& o : outcomes) {
    if (o.status == PublishStatus::published) ++published;
    else if (o.status == PublishStatus::failed) ++failed;
  }
  const std::size_t total = published + failed;
  if (total == 0) return 100;
  return clamp_score(100.0 * static_cast<double>(published) / static_cast<double>(total));
}

int engagement_naturalness(std::vector<int64_t> timestamps_ms, const HealthPolicy& policy) {
  if (timestamps_ms.size() < 2) return 100;
  std::sort(timestamps_ms.begin(), timestamps_ms.end());

  std::size_t rapid = 0;
  const std::size_t gaps = timestamps_ms.size() - 1;
  for (std::size_t i = 1; i < timestamps_ms.size(); ++i) {
    if (timestamps_ms[i] - timestamps_ms[i - 1] < policy.rapid_gap_ms) ++rapid;
  }
  const double ratio = static_cast<double>(rapid) / static_cast<double>(gaps);
  const double span = 100.0 - static_cast<double>(policy.naturalness_floor);
  return clamp_score(100.0 - ratio * span);
}

int freeze_risk(const std::vector<FreezeDetection>& detections, int64_t now_ms) {
  if (detections.empty()) return 0;
  double risk = 0.0;
  for (const auto& d : detections) {
    const double days_ago = static_cast<double>(now_ms - d.at_ms) / static_cast<double>(kMsPerDay);
    const double recency = std::max(1.0, 20.0 - days_ago * 0.6);
    const int confidence = d.confidence == 0 ? 50 : d.confidence;
    risk += recency * (static_cast<double>(confidence) / 100.0);
  }
  return clamp_score(risk);
}

int composite_score(int login, int post, int naturalness, int freeze_risk, const HealthPolicy& policy) {
  const double raw = static_cast<double>(login) * policy.weight_login +
                     static_cast<double>(post) * policy.weight_post +
                     static_cast<double>(naturalness) * policy.weight_naturalness +
                     static_cast<double>(100 - freeze_risk) * policy.weight_inverse_freeze;
  return clamp_score(raw);
}

}  // namespace pacer
