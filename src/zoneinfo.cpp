#include "mcpd/zoneinfo.hpp"
#include "mcpd/error.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace mcpd {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr size_t MAX_TZIF_SIZE = 1 << 20;

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
    static constexpr unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29u : lengths[m - 1];
}

// 0 = Sunday
int weekday_from_days(int64_t days) {
    int64_t wd = (days + 4) % 7;
    if (wd < 0) wd += 7;
    return static_cast<int>(wd);
}

// ---------- TZif reading ----------

class ByteReader {
public:
    explicit ByteReader(std::string_view data) : data_(data) {}

    void need(size_t n) const {
        if (data_.size() - pos_ < n) {
            throw InvalidTimezoneError("Truncated zone data");
        }
    }

    uint8_t u8() {
        need(1);
        return static_cast<uint8_t>(data_[pos_++]);
    }

    int32_t be32() {
        need(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v = (v << 8) | static_cast<uint8_t>(data_[pos_++]);
        return static_cast<int32_t>(v);
    }

    int64_t be64() {
        need(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | static_cast<uint8_t>(data_[pos_++]);
        return static_cast<int64_t>(v);
    }

    std::string_view bytes(size_t n) {
        need(n);
        auto out = data_.substr(pos_, n);
        pos_ += n;
        return out;
    }

    void skip(size_t n) { bytes(n); }
    bool at_end() const { return pos_ >= data_.size(); }

private:
    std::string_view data_;
    size_t pos_ = 0;
};

struct TzifHeader {
    char version = 0;
    uint32_t isutcnt = 0, isstdcnt = 0, leapcnt = 0, timecnt = 0, typecnt = 0, charcnt = 0;

    size_t v1_block_size() const {
        return size_t{timecnt} * 5 + size_t{typecnt} * 6 + charcnt
               + size_t{leapcnt} * 8 + isstdcnt + isutcnt;
    }
};

TzifHeader read_header(ByteReader& in) {
    if (in.bytes(4) != "TZif") {
        throw InvalidTimezoneError("Not a TZif file");
    }
    TzifHeader h;
    h.version = static_cast<char>(in.u8());
    in.skip(15);
    h.isutcnt  = static_cast<uint32_t>(in.be32());
    h.isstdcnt = static_cast<uint32_t>(in.be32());
    h.leapcnt  = static_cast<uint32_t>(in.be32());
    h.timecnt  = static_cast<uint32_t>(in.be32());
    h.typecnt  = static_cast<uint32_t>(in.be32());
    h.charcnt  = static_cast<uint32_t>(in.be32());
    if (h.typecnt == 0 || h.typecnt > 256 || h.charcnt == 0) {
        throw InvalidTimezoneError("Invalid TZif header counts");
    }
    return h;
}

// ---------- POSIX TZ string parsing ----------

class RuleParser {
public:
    explicit RuleParser(std::string_view s) : s_(s) {}

    bool done() const { return pos_ >= s_.size(); }
    char peek() const { return done() ? '\0' : s_[pos_]; }

    void expect(char c) {
        if (peek() != c) fail();
        ++pos_;
    }

    std::string name() {
        std::string out;
        if (peek() == '<') {
            ++pos_;
            while (!done() && peek() != '>') out += s_[pos_++];
            expect('>');
        } else {
            while (!done() && std::isalpha(static_cast<unsigned char>(peek()))) out += s_[pos_++];
        }
        if (out.size() < 3) fail();
        return out;
    }

    // [+-]hh[:mm[:ss]] in seconds, sign as written.
    int32_t hms(int max_hours) {
        int sign = 1;
        if (peek() == '+' || peek() == '-') {
            sign = peek() == '-' ? -1 : 1;
            ++pos_;
        }
        int32_t h = number(0, max_hours);
        int32_t m = 0, sec = 0;
        if (peek() == ':') {
            ++pos_;
            m = number(0, 59);
            if (peek() == ':') {
                ++pos_;
                sec = number(0, 59);
            }
        }
        return sign * (h * 3600 + m * 60 + sec);
    }

    TimeZone::RuleDate date() {
        TimeZone::RuleDate d;
        if (peek() == 'M') {
            ++pos_;
            d.kind = TimeZone::RuleDate::Kind::MonthWeekDay;
            d.month = number(1, 12);
            expect('.');
            d.week = number(1, 5);
            expect('.');
            d.day = number(0, 6);
        } else if (peek() == 'J') {
            ++pos_;
            d.kind = TimeZone::RuleDate::Kind::Julian1;
            d.day = number(1, 365);
        } else {
            d.kind = TimeZone::RuleDate::Kind::Julian0;
            d.day = number(0, 365);
        }
        if (peek() == '/') {
            ++pos_;
            d.time = hms(167);
        }
        return d;
    }

    [[noreturn]] void fail() const {
        throw InvalidTimezoneError("Invalid POSIX TZ rule: " + std::string(s_));
    }

private:
    int32_t number(int lo, int hi) {
        if (!std::isdigit(static_cast<unsigned char>(peek()))) fail();
        int32_t v = 0;
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            v = v * 10 + (s_[pos_++] - '0');
            if (v > hi) fail();
        }
        if (v < lo) fail();
        return v;
    }

    std::string_view s_;
    size_t pos_ = 0;
};

// Local midnight (as seconds since the epoch, in local wall time) of the
// day a rule date names in `year`.
int64_t rule_day_start(const TimeZone::RuleDate& d, int64_t year) {
    int64_t jan1 = days_from_civil(year, 1, 1);
    int64_t days = 0;
    switch (d.kind) {
        case TimeZone::RuleDate::Kind::Julian1: {
            // Feb 29 is never counted
            int64_t idx = d.day - 1;
            if (is_leap(year) && d.day >= 60) ++idx;
            days = jan1 + idx;
            break;
        }
        case TimeZone::RuleDate::Kind::Julian0:
            days = jan1 + d.day;
            break;
        case TimeZone::RuleDate::Kind::MonthWeekDay: {
            auto month = static_cast<unsigned>(d.month);
            int64_t first = days_from_civil(year, month, 1);
            int offset = (d.day - weekday_from_days(first) + 7) % 7;
            int64_t dom = 1 + offset + int64_t{d.week - 1} * 7;
            if (dom > days_in_month(year, month)) dom -= 7;
            days = first + dom - 1;
            break;
        }
    }
    return days * SECONDS_PER_DAY;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw InvalidTimezoneError("Cannot open zone file: " + path.string());
    }
    std::string data;
    char buf[4096];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        data.append(buf, static_cast<size_t>(in.gcount()));
        if (data.size() > MAX_TZIF_SIZE) {
            throw InvalidTimezoneError("Zone file too large: " + path.string());
        }
    }
    return data;
}

} // anonymous namespace

// ---------- Civil calendar ----------

int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{y + (m <= 2), m, d};
}

std::string format_iso8601(std::chrono::system_clock::time_point tp, int32_t utc_offset_seconds) {
    using namespace std::chrono;
    const int64_t micros = duration_cast<microseconds>(tp.time_since_epoch()).count();
    const int64_t secs = floor_div(micros, 1000000);
    const int64_t frac = micros - secs * 1000000;
    const int64_t local = secs + utc_offset_seconds;
    const int64_t days = floor_div(local, SECONDS_PER_DAY);
    const int64_t sod = local - days * SECONDS_PER_DAY;
    const CivilDate date = civil_from_days(days);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%06lld",
                  static_cast<long long>(date.year), date.month, date.day,
                  static_cast<int>(sod / 3600), static_cast<int>(sod % 3600 / 60),
                  static_cast<int>(sod % 60), static_cast<long long>(frac));
    std::string out(buf);

    const char sign = utc_offset_seconds < 0 ? '-' : '+';
    const int32_t abs_off = utc_offset_seconds < 0 ? -utc_offset_seconds : utc_offset_seconds;
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, abs_off / 3600, abs_off % 3600 / 60);
    out += buf;
    if (abs_off % 60 != 0) {
        std::snprintf(buf, sizeof(buf), ":%02d", abs_off % 60);
        out += buf;
    }
    return out;
}

// ---------- PosixRule ----------

UtcOffset TimeZone::PosixRule::offset_at(int64_t t) const {
    if (!daylight) return standard;

    const int64_t year = civil_from_days(floor_div(t + standard.seconds, SECONDS_PER_DAY)).year;
    // Start is reached while standard time is in effect, end while DST is.
    const int64_t start_utc = rule_day_start(start, year) + start.time - standard.seconds;
    const int64_t end_utc = rule_day_start(end, year) + end.time - daylight->seconds;

    bool in_dst;
    if (start_utc < end_utc) {
        in_dst = t >= start_utc && t < end_utc;
    } else {
        in_dst = !(t >= end_utc && t < start_utc);
    }
    return in_dst ? *daylight : standard;
}

TimeZone::PosixRule TimeZone::parse_posix_rule(std::string_view text) {
    RuleParser p(text);
    PosixRule rule;

    rule.standard.abbreviation = p.name();
    // POSIX offsets count hours west of Greenwich.
    rule.standard.seconds = -p.hms(24);
    if (p.done()) return rule;

    UtcOffset dst;
    dst.is_dst = true;
    dst.abbreviation = p.name();
    dst.seconds = rule.standard.seconds + 3600;
    if (!p.done() && p.peek() != ',') {
        dst.seconds = -p.hms(24);
    }
    rule.daylight = dst;

    if (p.done()) {
        // No explicit dates: POSIX leaves them implementation-defined;
        // use the current US rules like glibc does.
        rule.start = RuleDate{RuleDate::Kind::MonthWeekDay, 0, 2, 3, 7200};
        rule.end = RuleDate{RuleDate::Kind::MonthWeekDay, 0, 1, 11, 7200};
        return rule;
    }
    p.expect(',');
    rule.start = p.date();
    p.expect(',');
    rule.end = p.date();
    if (!p.done()) p.fail();
    return rule;
}

// ---------- TimeZone ----------

TimeZone TimeZone::from_tzif(std::string name, std::string_view data) {
    ByteReader in(data);
    TzifHeader header = read_header(in);
    int time_size = 4;

    if (header.version >= '2') {
        // Skip the 32-bit block; the 64-bit one that follows supersedes it.
        in.skip(header.v1_block_size());
        header = read_header(in);
        time_size = 8;
    }

    TimeZone tz;
    tz.name_ = std::move(name);

    tz.transitions_.reserve(header.timecnt);
    for (uint32_t i = 0; i < header.timecnt; ++i) {
        tz.transitions_.push_back(time_size == 8 ? in.be64() : in.be32());
    }
    tz.transition_types_.reserve(header.timecnt);
    for (uint32_t i = 0; i < header.timecnt; ++i) {
        uint8_t idx = in.u8();
        if (idx >= header.typecnt) {
            throw InvalidTimezoneError("Transition references unknown type");
        }
        tz.transition_types_.push_back(idx);
    }

    struct RawType { int32_t utoff; bool isdst; uint8_t desig; };
    std::vector<RawType> raw_types;
    raw_types.reserve(header.typecnt);
    for (uint32_t i = 0; i < header.typecnt; ++i) {
        RawType t;
        t.utoff = in.be32();
        t.isdst = in.u8() != 0;
        t.desig = in.u8();
        raw_types.push_back(t);
    }
    std::string_view chars = in.bytes(header.charcnt);
    for (const auto& t : raw_types) {
        if (t.desig >= chars.size()) {
            throw InvalidTimezoneError("Abbreviation index out of range");
        }
        auto abbr = chars.substr(t.desig);
        abbr = abbr.substr(0, abbr.find('\0'));
        tz.types_.push_back(UtcOffset{t.utoff, t.isdst, std::string(abbr)});
    }

    // Leap second records and the std/wall and UT/local indicators do
    // not affect wall-clock offsets.
    in.skip(size_t{header.leapcnt} * static_cast<size_t>(time_size + 4));
    in.skip(header.isstdcnt);
    in.skip(header.isutcnt);

    if (time_size == 8 && !in.at_end()) {
        if (in.u8() != '\n') {
            throw InvalidTimezoneError("Malformed TZif footer");
        }
        std::string footer;
        while (true) {
            char c = static_cast<char>(in.u8());
            if (c == '\n') break;
            footer += c;
        }
        if (!footer.empty()) {
            tz.rule_ = parse_posix_rule(footer);
        }
    }

    if (!std::is_sorted(tz.transitions_.begin(), tz.transitions_.end())) {
        throw InvalidTimezoneError("Transitions are not sorted");
    }
    return tz;
}

TimeZone TimeZone::utc() {
    TimeZone tz;
    tz.name_ = "UTC";
    tz.types_.push_back(UtcOffset{0, false, "UTC"});
    return tz;
}

std::vector<std::string> TimeZone::default_search_path() {
    std::vector<std::string> path;
    if (const char* tzdir = std::getenv("TZDIR"); tzdir && *tzdir) {
        path.emplace_back(tzdir);
    }
    for (const char* dir : {"/usr/share/zoneinfo", "/usr/lib/zoneinfo",
                            "/usr/share/lib/zoneinfo", "/etc/zoneinfo"}) {
        path.emplace_back(dir);
    }
    return path;
}

bool TimeZone::is_valid_key(std::string_view name) {
    if (name.empty() || name.size() > 255 || name.front() == '/' || name.back() == '/') {
        return false;
    }
    size_t start = 0;
    while (start <= name.size()) {
        size_t slash = name.find('/', start);
        std::string_view part = name.substr(start, slash == std::string_view::npos
                                                        ? std::string_view::npos
                                                        : slash - start);
        if (part.empty() || part == "." || part == "..") return false;
        for (char c : part) {
            auto uc = static_cast<unsigned char>(c);
            if (!std::isalnum(uc) && c != '_' && c != '-' && c != '+' && c != '.') {
                return false;
            }
        }
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }
    return true;
}

TimeZone TimeZone::load(const std::string& name, const std::vector<std::string>& search_path) {
    if (!is_valid_key(name)) {
        throw InvalidTimezoneError("Invalid timezone key: " + name);
    }
    for (const auto& dir : search_path) {
        std::error_code ec;
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        if (!std::filesystem::is_regular_file(candidate, ec)) continue;
        std::string data = read_file(candidate);
        if (data.compare(0, 4, "TZif") != 0) continue;
        return from_tzif(name, data);
    }
    if (name == "UTC") {
        return utc();
    }
    throw InvalidTimezoneError("Unknown timezone: " + name);
}

TimeZone TimeZone::load(const std::string& name) {
    return load(name, default_search_path());
}

UtcOffset TimeZone::offset_at(int64_t t) const {
    if (transitions_.empty()) {
        return rule_ ? rule_->offset_at(t) : types_.front();
    }
    if (t < transitions_.front()) {
        return types_.front();
    }
    auto it = std::upper_bound(transitions_.begin(), transitions_.end(), t);
    auto idx = static_cast<size_t>(std::distance(transitions_.begin(), it)) - 1;
    if (idx + 1 == transitions_.size() && rule_) {
        return rule_->offset_at(t);
    }
    return types_[transition_types_[idx]];
}

} // namespace mcpd
