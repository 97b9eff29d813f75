#include <issuehub-cpp/types.hpp>

#include <charconv>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace issuehub_cpp {

namespace {

// Parse exactly `width` decimal digits at `pos`.
auto parse_fixed(std::string_view text, std::size_t pos, std::size_t width) -> std::optional<int> {
    if (pos + width > text.size()) return std::nullopt;
    auto value = 0;
    auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + width, value);
    if (ec != std::errc{} || ptr != text.data() + pos + width) return std::nullopt;
    return value;
}

}  // anonymous namespace

auto parse_status(std::string_view text) -> std::optional<IssueStatus> {
    if (text == "Open") return IssueStatus::open;
    if (text == "In Progress" || text == "InProgress") return IssueStatus::in_progress;
    if (text == "Closed") return IssueStatus::closed;
    return std::nullopt;
}

auto Timestamp::now() -> Timestamp {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch());
    return Timestamp{ms.count()};
}

auto to_iso8601(Timestamp t) -> std::string {
    auto secs = t.millis_since_epoch / 1000;
    auto millis = t.millis_since_epoch % 1000;
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    auto raw = static_cast<std::time_t>(secs);
    auto tm = std::tm{};
    ::gmtime_r(&raw, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
    return buf;
}

auto parse_iso8601(std::string_view text) -> std::optional<Timestamp> {
    // YYYY-MM-DDTHH:MM:SS
    if (text.size() < 20) return std::nullopt;
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    auto year = parse_fixed(text, 0, 4);
    auto month = parse_fixed(text, 5, 2);
    auto day = parse_fixed(text, 8, 2);
    auto hour = parse_fixed(text, 11, 2);
    auto minute = parse_fixed(text, 14, 2);
    auto second = parse_fixed(text, 17, 2);
    if (!year || !month || !day || !hour || !minute || !second) return std::nullopt;
    if (*month < 1 || *month > 12 || *day < 1 || *day > 31 ||
        *hour > 23 || *minute > 59 || *second > 60) {
        return std::nullopt;
    }

    auto pos = std::size_t{19};
    auto millis = 0;
    if (text[pos] == '.') {
        ++pos;
        auto digits = std::size_t{0};
        auto scale = 100;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis += (text[pos] - '0') * scale;
                scale /= 10;
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
    }
    if (pos + 1 != text.size() || text[pos] != 'Z') return std::nullopt;

    auto tm = std::tm{};
    tm.tm_year = *year - 1900;
    tm.tm_mon = *month - 1;
    tm.tm_mday = *day;
    tm.tm_hour = *hour;
    tm.tm_min = *minute;
    tm.tm_sec = *second;
    auto secs = ::timegm(&tm);
    return Timestamp{static_cast<std::int64_t>(secs) * 1000 + millis};
}

}  // namespace issuehub_cpp
