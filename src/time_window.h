// time_window.h
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace vrpcheck {

// Instant since the Unix epoch, UTC. The fraction is kept as its decimal
// digits without trailing zeros ("5" for .500) so no precision is lost;
// digit strings of that form order lexicographically like the fractions.
struct Timestamp {
  long long seconds = 0;
  std::string fraction;
};

bool operator==(const Timestamp& a, const Timestamp& b);
bool operator!=(const Timestamp& a, const Timestamp& b);
bool operator<(const Timestamp& a, const Timestamp& b);

// Parses "2020-07-04T12:00:00Z", "2020-07-04T14:00:00.250+02:00", ...
// Returns nullopt for anything that is not a valid RFC3339 date-time
// (bad shape, month 13, Feb 30, missing offset).
std::optional<Timestamp> parse_rfc3339(const std::string& text);

enum class IntervalIssueKind {
  Malformed,     // not exactly two endpoints
  Unparseable,   // an endpoint is not RFC3339
  Inverted,      // start >= end
  Overlap,       // shares an instant with another window of the same list
};

struct IntervalIssue {
  IntervalIssueKind kind;
  std::size_t index;          // window index in the caller's list
  std::size_t other_index;    // second window for Overlap, == index otherwise
  std::string detail;
};

// Shared interval primitive used by every time-window rule.
//
// Windows are half-open [start, end): touching windows do not overlap.
// Malformed, unparseable and inverted windows are reported once each and are
// left out of the overlap scan. Per-window issues come first in index order,
// overlaps follow in order of window start.
std::vector<IntervalIssue> check_time_windows(const std::vector<TimeWindow>& windows);

std::string describe_issue(const IntervalIssue& issue, const std::vector<TimeWindow>& windows);

} // namespace vrpcheck
