#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpd {

/// Offset from UTC in effect at some instant.
struct UtcOffset {
    int32_t seconds = 0;
    bool is_dst = false;
    std::string abbreviation;

    bool operator==(const UtcOffset& o) const {
        return seconds == o.seconds && is_dst == o.is_dst && abbreviation == o.abbreviation;
    }
};

/// An IANA time zone read from a compiled TZif file (RFC 8536, versions
/// 1 through 4). Instants after the last stored transition are resolved
/// with the file's POSIX TZ footer rule.
class TimeZone {
public:
    /// Resolve `name` (e.g. "Europe/Kyiv") against `search_path`.
    /// Throws InvalidTimezoneError if the key is malformed or no TZif file
    /// with that name exists.
    [[nodiscard]] static TimeZone load(const std::string& name,
                                       const std::vector<std::string>& search_path);
    [[nodiscard]] static TimeZone load(const std::string& name);

    /// Parse TZif bytes. Throws InvalidTimezoneError on malformed data.
    [[nodiscard]] static TimeZone from_tzif(std::string name, std::string_view data);

    /// Built-in UTC, independent of the zone database.
    [[nodiscard]] static TimeZone utc();

    /// $TZDIR (if set) followed by the conventional zoneinfo directories.
    [[nodiscard]] static std::vector<std::string> default_search_path();

    /// Syntactic check of a zone key: relative, no "..", no empty
    /// components, restricted character set.
    [[nodiscard]] static bool is_valid_key(std::string_view name);

    [[nodiscard]] const std::string& name() const { return name_; }

    [[nodiscard]] UtcOffset offset_at(int64_t unix_seconds) const;

    // POSIX TZ rule pieces; public so the footer parser can be tested.
    struct RuleDate {
        enum class Kind { Julian1, Julian0, MonthWeekDay };
        Kind kind = Kind::MonthWeekDay;
        int day = 0;      // Jn / n / weekday (0 = Sunday)
        int week = 0;     // 1..5, 5 = last
        int month = 0;    // 1..12
        int32_t time = 7200;  // seconds after local midnight
    };

    struct PosixRule {
        UtcOffset standard;
        std::optional<UtcOffset> daylight;
        RuleDate start;
        RuleDate end;

        [[nodiscard]] UtcOffset offset_at(int64_t unix_seconds) const;
    };

    /// Parse a POSIX TZ string such as "EET-2EEST,M3.5.0/3,M10.5.0/4".
    /// Throws InvalidTimezoneError.
    [[nodiscard]] static PosixRule parse_posix_rule(std::string_view text);

private:
    TimeZone() = default;

    std::string name_;
    std::vector<int64_t> transitions_;
    std::vector<uint8_t> transition_types_;
    std::vector<UtcOffset> types_;
    std::optional<PosixRule> rule_;
};

// ---------- Civil calendar helpers ----------

struct CivilDate {
    int64_t year;
    unsigned month;
    unsigned day;
};

/// Days since 1970-01-01 in the proleptic Gregorian calendar.
[[nodiscard]] int64_t days_from_civil(int64_t year, unsigned month, unsigned day);
[[nodiscard]] CivilDate civil_from_days(int64_t days);

/// "YYYY-MM-DDTHH:MM:SS.ffffff+HH:MM" for `tp` shown at `utc_offset_seconds`.
[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point tp,
                                         int32_t utc_offset_seconds);

} // namespace mcpd
