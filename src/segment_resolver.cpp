/**
 * @file segment_resolver.cpp
 * @brief Segment resolution implementation
 */

#include "vidcut/segment_resolver.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "vidcut/config.hpp"
#include "vidcut/errors.hpp"
#include "vidcut/logging.hpp"

namespace vidcut {

CutList resolve_segments(double duration, std::vector<TimeSegment> remove,
                         double min_keep) {
  if (!std::isfinite(duration) || duration <= 0) {
    throw SegmentValidationError(
        fmt::format("invalid source duration {}", duration));
  }
  if (min_keep < 0)
    min_keep = Config::min_keep_sec();

  // **---- VALIDATE ----**

  for (const auto &s : remove) {
    if (!std::isfinite(s.start) || !std::isfinite(s.end)) {
      throw SegmentValidationError("segment bounds must be finite");
    }
    if (s.start >= s.end) {
      throw SegmentValidationError(fmt::format(
          "segment [{:.3f}, {:.3f}] has start >= end", s.start, s.end));
    }
    if (s.start < 0 || s.end > duration + SEGMENT_EPSILON) {
      throw SegmentValidationError(
          fmt::format("segment [{:.3f}, {:.3f}] is outside [0, {:.3f}]",
                      s.start, s.end, duration));
    }
  }

  // **---- SORT AND MERGE ----**

  std::sort(remove.begin(), remove.end(),
            [](const TimeSegment &a, const TimeSegment &b) {
              return a.start < b.start;
            });

  std::vector<TimeSegment> merged;
  merged.reserve(remove.size());
  for (const auto &s : remove) {
    if (!merged.empty()) {
      TimeSegment &prev = merged.back();
      if (s.start < prev.end - SEGMENT_EPSILON) {
        throw SegmentValidationError(fmt::format(
            "segments [{:.3f}, {:.3f}] and [{:.3f}, {:.3f}] overlap",
            prev.start, prev.end, s.start, s.end));
      }
      /// Touching ranges collapse into one so no zero-length keep appears
      if (s.start <= prev.end + SEGMENT_EPSILON) {
        prev.end = std::max(prev.end, s.end);
        continue;
      }
    }
    merged.push_back({s.start, std::min(s.end, duration)});
  }

  // **---- COMPLEMENT ----**

  CutList cuts;
  cuts.segments.reserve(merged.size() + 1);

  double cursor = 0.0;
  for (const auto &r : merged) {
    if (r.start - cursor >= min_keep && r.start - cursor > SEGMENT_EPSILON) {
      cuts.segments.push_back({cursor, r.start});
    } else if (r.start > cursor) {
      LOG_DEBUG("Dropping degenerate keep [{:.3f}, {:.3f}]", cursor, r.start);
    }
    cursor = r.end;
  }
  if (duration - cursor >= min_keep && duration - cursor > SEGMENT_EPSILON) {
    cuts.segments.push_back({cursor, duration});
  } else if (duration > cursor) {
    LOG_DEBUG("Dropping degenerate keep [{:.3f}, {:.3f}]", cursor, duration);
  }

  return cuts;
}

double total_length(const std::vector<TimeSegment> &segments) {
  double total = 0.0;
  for (const auto &s : segments)
    total += s.length();
  return total;
}

} // namespace vidcut
