#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace stagegraph::util {

/*
  Time utilities. All clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

/*
  UTC, microsecond precision, fixed width:

      2026-10-19T08:15:02.041337Z

  Fixed width keeps lexical order equal to chronological order.
*/
std::string ToIso8601(TimePoint tp);

// Compact form used as a path segment suffix: 20261019T081502041337Z
std::string ToPathSuffix(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace stagegraph::util
