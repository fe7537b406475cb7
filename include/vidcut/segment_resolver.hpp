/**
 * @file segment_resolver.hpp
 * @brief Turns user "remove" ranges into a validated keep cut-list
 */

#ifndef VIDCUT_SEGMENT_RESOLVER_HPP
#define VIDCUT_SEGMENT_RESOLVER_HPP

#include <vector>

#include "types.hpp"

namespace vidcut {

/// Boundaries closer than this are considered touching
constexpr double SEGMENT_EPSILON = 1e-6;

/**
 * @brief Resolve remove-segments into the keep cut-list of a source.
 *
 * @details Algorithm:
 *
 *          1. Validate every range (finite, start < end, inside [0, duration])
 *
 *          2. Sort by start, reject overlaps, merge touching ranges
 *
 *          3. Emit the complement intervals between merged ranges and the
 *             source boundaries
 *
 *          4. Drop keep-segments shorter than min_keep (degenerate splices)
 *
 * @param duration Source duration in seconds
 * @param remove User-selected ranges to remove, in any order
 * @param min_keep Minimum keep-segment length
 *                 (negative = Config::min_keep_sec())
 * @return Keep-segments in ascending start order (may be empty)
 * @throws SegmentValidationError on invalid or overlapping ranges
 */
CutList resolve_segments(double duration, std::vector<TimeSegment> remove,
                         double min_keep = -1.0);

/**
 * @brief Total length of a set of (non-overlapping) ranges.
 */
double total_length(const std::vector<TimeSegment> &segments);

} // namespace vidcut

#endif // VIDCUT_SEGMENT_RESOLVER_HPP
