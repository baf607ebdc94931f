#include <catch2/catch.hpp>

#include "fixtures.h"
#include "time_window.h"

using namespace vrpcheck;
using fixtures::at;
using fixtures::tw;

TEST_CASE("RFC3339 timestamps parse to UTC epoch seconds", "[time_window][rfc3339]")
{
    REQUIRE(parse_rfc3339("1970-01-01T00:00:00Z") == Timestamp{0, ""});
    REQUIRE(parse_rfc3339("2020-07-04T12:00:00Z") == Timestamp{1593864000, ""});
    // same instant, different offsets
    REQUIRE(parse_rfc3339("2020-07-04T14:00:00+02:00") == parse_rfc3339("2020-07-04T12:00:00Z"));
    REQUIRE(parse_rfc3339("2020-07-04T07:30:00-04:30") == parse_rfc3339("2020-07-04T12:00:00Z"));
    REQUIRE(parse_rfc3339("2020-07-04t12:00:00z") == parse_rfc3339("2020-07-04T12:00:00Z"));

    const auto frac = parse_rfc3339("2020-07-04T12:00:00.500Z");
    REQUIRE(frac);
    REQUIRE(*frac == Timestamp{1593864000, "5"});
    REQUIRE(parse_rfc3339("2020-07-04T12:00:00.000Z") == parse_rfc3339("2020-07-04T12:00:00Z"));

    REQUIRE(parse_rfc3339("2020-02-29T00:00:00Z"));
}

TEST_CASE("Non-RFC3339 text is rejected", "[time_window][rfc3339]")
{
    REQUIRE_FALSE(parse_rfc3339(""));
    REQUIRE_FALSE(parse_rfc3339("not a time"));
    REQUIRE_FALSE(parse_rfc3339("2020-07-04 12:00:00Z"));  // no 'T'
    REQUIRE_FALSE(parse_rfc3339("2020-07-04T12:00:00"));   // no offset
    REQUIRE_FALSE(parse_rfc3339("2020-07-04T12:00Z"));     // no seconds
    REQUIRE_FALSE(parse_rfc3339("2020-13-04T12:00:00Z"));
    REQUIRE_FALSE(parse_rfc3339("2019-02-29T12:00:00Z"));
    REQUIRE_FALSE(parse_rfc3339("2020-04-31T12:00:00Z"));
    REQUIRE_FALSE(parse_rfc3339("2020-07-04T24:00:00Z"));
    REQUIRE_FALSE(parse_rfc3339("2020-07-04T12:00:00+25:00"));
}

TEST_CASE("Disjoint valid windows produce no issues", "[time_window][interval]")
{
    // Given out of order on purpose.
    const std::vector<TimeWindow> times = {
        tw(at("15:00"), at("17:00")),
        tw(at("08:00"), at("09:00")),
        tw(at("10:00"), at("12:00")),
    };
    REQUIRE(check_time_windows(times).empty());
    REQUIRE(check_time_windows({}).empty());
}

TEST_CASE("Overlapping windows are reported with both indices", "[time_window][interval]")
{
    const std::vector<TimeWindow> times = {
        tw(at("13:00"), at("17:00")),
        tw(at("10:00"), at("14:00")),
    };
    const auto issues = check_time_windows(times);
    REQUIRE(issues.size() == 1);
    REQUIRE(issues[0].kind == IntervalIssueKind::Overlap);
    REQUIRE(issues[0].index == 0);
    REQUIRE(issues[0].other_index == 1);
}

TEST_CASE("Touching windows do not overlap", "[time_window][interval]")
{
    const std::vector<TimeWindow> times = {
        tw(at("10:00"), at("12:00")),
        tw(at("12:00"), at("14:00")),
    };
    REQUIRE(check_time_windows(times).empty());
}

TEST_CASE("A long window overlapping a non-adjacent one is found", "[time_window][interval]")
{
    const std::vector<TimeWindow> times = {
        tw(at("08:00"), at("18:00")),
        tw(at("09:00"), at("10:00")),
        tw(at("11:00"), at("12:00")),
    };
    const auto issues = check_time_windows(times);
    REQUIRE(issues.size() == 2);
    REQUIRE(issues[0].index == 0);
    REQUIRE(issues[0].other_index == 1);
    REQUIRE(issues[1].index == 0);
    REQUIRE(issues[1].other_index == 2);
}

TEST_CASE("Every pair of mutually overlapping windows is reported", "[time_window][interval]")
{
    const std::vector<TimeWindow> times = {
        tw(at("08:00"), at("18:00")),
        tw(at("09:00"), at("12:00")),
        tw(at("10:00"), at("11:00")),
    };
    const auto issues = check_time_windows(times);
    REQUIRE(issues.size() == 3);
    REQUIRE(issues[0].index == 0);
    REQUIRE(issues[0].other_index == 1);
    REQUIRE(issues[1].index == 0);
    REQUIRE(issues[1].other_index == 2);
    REQUIRE(issues[2].index == 1);
    REQUIRE(issues[2].other_index == 2);
    for (const auto& issue : issues)
        REQUIRE(issue.kind == IntervalIssueKind::Overlap);
}

TEST_CASE("Sub-microsecond fractions keep their order", "[time_window][rfc3339]")
{
    const auto start = parse_rfc3339("2020-07-04T12:00:00Z");
    const auto end = parse_rfc3339("2020-07-04T12:00:00.0000001Z");
    REQUIRE(start);
    REQUIRE(end);
    REQUIRE(*start < *end);
    REQUIRE(*parse_rfc3339("2020-07-04T12:00:00.05Z") < *parse_rfc3339("2020-07-04T12:00:00.5Z"));
    REQUIRE(*parse_rfc3339("2020-07-04T12:00:00.5Z") < *parse_rfc3339("2020-07-04T12:00:00.51Z"));

    const std::vector<TimeWindow> times = {
        tw("2020-07-04T12:00:00Z", "2020-07-04T12:00:00.0000001Z"),
        tw("2020-07-04T12:00:00.0000001Z", "2020-07-04T12:00:00.0000002Z"),
    };
    REQUIRE(check_time_windows(times).empty());
}

TEST_CASE("Inverted and empty windows are invalid and skip overlap checks", "[time_window][interval]")
{
    const std::vector<TimeWindow> times = {
        tw(at("12:00"), at("11:00")),
        tw(at("10:00"), at("10:00")),
        tw(at("10:30"), at("11:30")),
    };
    const auto issues = check_time_windows(times);
    REQUIRE(issues.size() == 2);
    REQUIRE(issues[0].kind == IntervalIssueKind::Inverted);
    REQUIRE(issues[0].index == 0);
    REQUIRE(issues[1].kind == IntervalIssueKind::Inverted);
    REQUIRE(issues[1].index == 1);
}

TEST_CASE("Malformed and unparseable windows are reported and excluded", "[time_window][interval]")
{
    const std::vector<TimeWindow> times = {
        TimeWindow{at("09:00")},
        tw("yesterday", at("12:00")),
        tw(at("09:00"), at("12:00")),
        TimeWindow{at("10:00"), at("11:00"), at("12:00")},
    };
    const auto issues = check_time_windows(times);
    REQUIRE(issues.size() == 3);
    REQUIRE(issues[0].kind == IntervalIssueKind::Malformed);
    REQUIRE(issues[0].index == 0);
    REQUIRE(issues[1].kind == IntervalIssueKind::Unparseable);
    REQUIRE(issues[1].index == 1);
    REQUIRE(issues[1].detail.find("yesterday") != std::string::npos);
    REQUIRE(issues[2].kind == IntervalIssueKind::Malformed);
    REQUIRE(issues[2].index == 3);
}

TEST_CASE("Offsets are honoured when comparing windows", "[time_window][interval]")
{
    // 10:00-12:00 UTC and 13:00+02:00 (= 11:00 UTC) to 15:00+02:00
    const std::vector<TimeWindow> times = {
        tw(at("10:00"), at("12:00")),
        tw("2020-07-04T13:00:00+02:00", "2020-07-04T15:00:00+02:00"),
    };
    const auto issues = check_time_windows(times);
    REQUIRE(issues.size() == 1);
    REQUIRE(issues[0].kind == IntervalIssueKind::Overlap);
}

TEST_CASE("Issue descriptions name the windows involved", "[time_window][interval]")
{
    const std::vector<TimeWindow> times = {
        tw(at("10:00"), at("14:00")),
        tw(at("13:00"), at("17:00")),
    };
    const auto issues = check_time_windows(times);
    REQUIRE(issues.size() == 1);
    const std::string text = describe_issue(issues[0], times);
    REQUIRE(text.find("time windows 0") != std::string::npos);
    REQUIRE(text.find("and 1") != std::string::npos);
    REQUIRE(text.find("overlap") != std::string::npos);
}
