#pragma once

// pacer/scoring.hpp — Pure sub-score and composite functions.
//
// Every function here is a deterministic function of its arguments: no clock
// reads, no storage access. HealthEngine gathers the windows and calls these.
// All results are integers in [0,100], rounded half away from zero.

#include <cstdint>
#include <vector>

#include "pacer/limits.hpp"
#include "pacer/types.hpp"

namespace pacer {

// Percentage of successful attempts; 100 with no data.
int login_success_rate(const std::vector<SessionAttempt>& attempts);

// published / (published + failed); pending ignored; 100 with no terminal data.
int post_success_rate(const std::vector<PublishOutcome>& outcomes);

// Gaps shorter than policy.rapid_gap_ms between consecutive timestamps pull
// the score linearly from 100 toward policy.naturalness_floor. Timestamps need
// not be sorted. 100 with fewer than two timestamps.
int engagement_naturalness(std::vector<int64_t> timestamps_ms, const HealthPolicy& policy);

// Sum of max(1, 20 - days_ago*0.6) * confidence/100 over detections, with
// confidence 0 read as 50. 0 with no detections; clamped to 100.
int freeze_risk(const std::vector<FreezeDetection>& detections, int64_t now_ms);

// Weighted composite of the four sub-scores, clamped to [0,100].
int composite_score(int login, int post, int naturalness, int freeze_risk, const HealthPolicy& policy);

}  // namespace pacer
