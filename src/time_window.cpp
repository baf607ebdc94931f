#include "time_window.h"

#include <algorithm>
#include <regex>
#include <sstream>

namespace vrpcheck
{

    // ---------- small date helpers ----------

    static bool is_leap(int y)
    {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    static int days_in_month(int y, int m)
    {
        static const int dim[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return (m == 2 && is_leap(y)) ? 29 : dim[m - 1];
    }

    // Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's days_from_civil).
    static long long days_from_civil(int y, int m, int d)
    {
        y -= m <= 2;
        const long long era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<long long>(doe) - 719468;
    }

    std::optional<Timestamp> parse_rfc3339(const std::string &text)
    {
        static const std::regex re(
            R"(^(\d{4})-(\d{2})-(\d{2})[Tt](\d{2}):(\d{2}):(\d{2})(\.\d+)?(?:([Zz])|([+-])(\d{2}):(\d{2}))$)");
        std::smatch m;
        if (!std::regex_match(text, m, re))
            return std::nullopt;

        const int year = std::stoi(m[1].str());
        const int month = std::stoi(m[2].str());
        const int day = std::stoi(m[3].str());
        const int hour = std::stoi(m[4].str());
        const int minute = std::stoi(m[5].str());
        const int second = std::stoi(m[6].str());

        if (month < 1 || month > 12)
            return std::nullopt;
        if (day < 1 || day > days_in_month(year, month))
            return std::nullopt;
        // 60 is a leap second
        if (hour > 23 || minute > 59 || second > 60)
            return std::nullopt;

        std::string fraction;
        if (m[7].matched)
        {
            fraction = m[7].str().substr(1);
            fraction.erase(fraction.find_last_not_of('0') + 1);
        }

        long long offset_seconds = 0;
        if (!m[8].matched)
        {
            const int off_h = std::stoi(m[10].str());
            const int off_m = std::stoi(m[11].str());
            if (off_h > 23 || off_m > 59)
                return std::nullopt;
            offset_seconds = (off_h * 3600LL + off_m * 60LL) * (m[9].str() == "-" ? -1 : 1);
        }

        const long long local_seconds =
            days_from_civil(year, month, day) * 86400LL + hour * 3600LL + minute * 60LL + second;
        return Timestamp{local_seconds - offset_seconds, fraction};
    }

    bool operator==(const Timestamp &a, const Timestamp &b)
    {
        return a.seconds == b.seconds && a.fraction == b.fraction;
    }

    bool operator!=(const Timestamp &a, const Timestamp &b)
    {
        return !(a == b);
    }

    bool operator<(const Timestamp &a, const Timestamp &b)
    {
        if (a.seconds != b.seconds)
            return a.seconds < b.seconds;
        return a.fraction < b.fraction;
    }

    // ---------- interval checker ----------

    namespace
    {
        struct ParsedWindow
        {
            std::size_t index;
            Timestamp start;
            Timestamp end;
        };
    } // namespace

    std::vector<IntervalIssue> check_time_windows(const std::vector<TimeWindow> &windows)
    {
        std::vector<IntervalIssue> issues;
        std::vector<ParsedWindow> valid;
        valid.reserve(windows.size());

        for (std::size_t i = 0; i < windows.size(); ++i)
        {
            const TimeWindow &tw = windows[i];
            if (tw.size() != 2)
            {
                issues.push_back({IntervalIssueKind::Malformed, i, i,
                                  "expected [start, end], got " + std::to_string(tw.size()) + " value(s)"});
                continue;
            }

            const auto start = parse_rfc3339(tw[0]);
            const auto end = parse_rfc3339(tw[1]);
            if (!start || !end)
            {
                std::string bad;
                if (!start)
                    bad = "start '" + tw[0] + "'";
                if (!end)
                    bad += (bad.empty() ? "" : " and ") + std::string("end '") + tw[1] + "'";
                issues.push_back({IntervalIssueKind::Unparseable, i, i, bad + " is not an RFC3339 timestamp"});
                continue;
            }

            if (!(*start < *end))
            {
                issues.push_back({IntervalIssueKind::Inverted, i, i,
                                  "start '" + tw[0] + "' is not before end '" + tw[1] + "'"});
                continue;
            }

            valid.push_back(ParsedWindow{i, *start, *end});
        }

        // Ties on start keep caller order so the output is stable.
        std::stable_sort(valid.begin(), valid.end(), [](const ParsedWindow &a, const ParsedWindow &b)
                         { return a.start < b.start; });

        // Sweep by start keeping every window still open at w.start, so each
        // overlapping pair is reported once: [8,18) [9,12) [10,11) gives three.
        std::vector<const ParsedWindow *> active;
        for (const auto &w : valid)
        {
            active.erase(std::remove_if(active.begin(), active.end(), [&w](const ParsedWindow *a)
                                        { return !(w.start < a->end); }),
                         active.end());
            for (const ParsedWindow *a : active)
            {
                const std::size_t lo = std::min(a->index, w.index);
                const std::size_t hi = std::max(a->index, w.index);
                issues.push_back({IntervalIssueKind::Overlap, lo, hi,
                                  "overlaps with time window " + std::to_string(hi == w.index ? lo : hi)});
            }
            active.push_back(&w);
        }

        return issues;
    }

    std::string describe_issue(const IntervalIssue &issue, const std::vector<TimeWindow> &windows)
    {
        auto fmt = [&](std::size_t idx)
        {
            std::ostringstream o;
            o << "[";
            if (idx < windows.size())
            {
                const auto &tw = windows[idx];
                for (std::size_t k = 0; k < tw.size(); ++k)
                {
                    if (k)
                        o << ", ";
                    o << tw[k];
                }
            }
            o << "]";
            return o.str();
        };

        std::ostringstream oss;
        switch (issue.kind)
        {
        case IntervalIssueKind::Malformed:
            oss << "time window " << issue.index << " is malformed: " << issue.detail;
            break;
        case IntervalIssueKind::Unparseable:
            oss << "time window " << issue.index << " is invalid: " << issue.detail;
            break;
        case IntervalIssueKind::Inverted:
            oss << "time window " << issue.index << " " << fmt(issue.index) << " is invalid: " << issue.detail;
            break;
        case IntervalIssueKind::Overlap:
            oss << "time windows " << issue.index << " " << fmt(issue.index) << " and "
                << issue.other_index << " " << fmt(issue.other_index) << " overlap";
            break;
        }
        return oss.str();
    }

} // namespace vrpcheck
