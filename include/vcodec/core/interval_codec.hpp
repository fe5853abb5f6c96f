#pragma once

#include "vcodec/core/extended_types.hpp"
#include "vcodec/core/type_descriptor.hpp"

#include <string>
#include <string_view>

namespace vcodec::core::interval_codec {

/**
 * Parses interval text under the given range.
 *
 * Day-time ranges: "[-]D HH:MM:SS[.f]", "[-]HH:MM[:SS[.f]]", bare numbers.
 * Components map onto consecutive fields starting at the range start
 * (or at HOUR after a day part); fields finer than the range end are
 * dropped, fractions are only legal on SECOND and keep 6 digits.
 *
 * Year-month ranges: "1y 10m", "10m ago", "1 year 2 mons", "1-10".
 *
 * The result is normalized, so "32" under HOUR is 1 day 8 hours.
 */
Interval parse_interval(std::string_view raw, const IntervalRange& range);

/**
 * Text for an interval literal of the given range, inverse of
 * parse_interval. EncodingTypeMismatchError when the value has
 * components the range cannot hold.
 */
std::string format_interval(const Interval& value, const IntervalRange& range);

} // namespace vcodec::core::interval_codec
