// Date.cpp – RFC 822 date-time grammar used by <pubDate> and <lastBuildDate>.
//
// Accepted shapes (after trimming, fields separated by whitespace):
//   [Wdy,] DD Mon YYYY HH:MM[:SS] [zone]      RFC 822 / RFC 2822
//   [Wdy,] DD-Mon-YY HH:MM[:SS] [zone]        obsolete dashed date
//   [Wdy]  Mon DD HH:MM:SS YYYY [zone]        asctime ordering
// Day and month may come in either order, and so may year and time. The time
// may use '.' instead of ':'. A trailing "(comment)" is ignored. A missing or
// unrecognised zone means UTC.

#include "FeedCraft/Date.hpp"
#include "TextUtil.hpp"

#include <array>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace feedcraft {

using detail::isDigit;
using detail::isSpace;

// ─── Lookup tables ────────────────────────────────────────────────────────────

static constexpr std::array<std::string_view, 7> kShortDays = {
    "mon", "tue", "wed", "thu", "fri", "sat", "sun",
};
static constexpr std::array<std::string_view, 7> kLongDays = {
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday",
};
static constexpr std::array<std::string_view, 12> kShortMonths = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec",
};
static constexpr std::array<std::string_view, 12> kLongMonths = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december",
};

struct NamedZone {
    std::string_view name;
    int              minutes; // east of UTC
};

// RFC 822 §5.1 zone names plus "UTC" and "Z".
static constexpr std::array<NamedZone, 14> kNamedZones = {{
    {"UT", 0},     {"UTC", 0},    {"GMT", 0},    {"Z", 0},
    {"AST", -240}, {"ADT", -180},
    {"EST", -300}, {"EDT", -240},
    {"CST", -360}, {"CDT", -300},
    {"MST", -420}, {"MDT", -360},
    {"PST", -480}, {"PDT", -420},
}};

// ─── Small parsing helpers ────────────────────────────────────────────────────

[[noreturn]] static void fail(std::string_view text, const std::string& why) {
    throw DateGrammarError("Invalid RSS date string '" + std::string(text) + "': " + why);
}

static std::vector<std::string_view> splitFields(std::string_view s) {
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && isSpace(s[i])) ++i;
        size_t start = i;
        while (i < s.size() && !isSpace(s[i])) ++i;
        if (i > start) out.push_back(s.substr(start, i - start));
    }
    return out;
}

static bool isDayName(std::string_view tok) {
    const std::string lower = detail::toLower(tok);
    for (size_t i = 0; i < kShortDays.size(); ++i) {
        if (lower == kShortDays[i] || lower == kLongDays[i])
            return true;
    }
    return false;
}

// 1-based month number, or 0 when tok is not a month name.
static unsigned monthNumber(std::string_view tok) {
    const std::string lower = detail::toLower(tok);
    for (size_t i = 0; i < kShortMonths.size(); ++i) {
        if (lower == kShortMonths[i] || lower == kLongMonths[i])
            return static_cast<unsigned>(i + 1);
    }
    return 0;
}

// Unsigned decimal field of minLen..maxLen digits.
static std::optional<int> digitsField(std::string_view s, size_t minLen, size_t maxLen) {
    if (s.size() < minLen || s.size() > maxLen)
        return std::nullopt;
    for (char c : s) {
        if (!isDigit(c)) return std::nullopt;
    }
    return detail::parseInteger<int>(s);
}

// Offset east of UTC in minutes. Anything that is neither a named zone nor a
// well-formed ±hhmm ("-05:00", "+5", military letters) is read as UTC.
static int zoneOffset(std::string_view zone) {
    if (zone.size() == 5 && (zone.front() == '+' || zone.front() == '-')) {
        if (auto hhmm = digitsField(zone.substr(1), 4, 4); hhmm && *hhmm % 100 <= 59) {
            const int total = (*hhmm / 100) * 60 + *hhmm % 100;
            return zone.front() == '-' ? -total : total;
        }
        return 0;
    }

    const std::string upper = detail::toUpper(zone);
    for (const auto& z : kNamedZones) {
        if (upper == z.name) return z.minutes;
    }
    return 0;
}

// ─── Public entry points ──────────────────────────────────────────────────────

Timestamp parseDate(std::string_view text) {
    const std::string_view s = detail::trim(text);
    if (s.empty())
        throw DateGrammarError("RSS date strings must be non-empty");

    std::vector<std::string_view> tok = splitFields(s);

    // Leading day name, with or without comma; "Mon,01 Jan ..." is split too.
    if (!tok.empty()) {
        const std::string_view first = tok.front();
        const size_t comma = first.find(',');
        if (comma != std::string_view::npos) {
            if (!isDayName(first.substr(0, comma)))
                fail(text, "unknown day name '" + std::string(first.substr(0, comma)) + "'");
            const std::string_view rest = first.substr(comma + 1);
            if (rest.empty()) tok.erase(tok.begin());
            else              tok.front() = rest;
        } else if (isDayName(first)) {
            tok.erase(tok.begin());
        }
    }

    // Drop a trailing "(comment)", which may itself contain spaces.
    for (size_t i = 0; i < tok.size(); ++i) {
        if (tok[i].front() == '(') {
            if (tok.back().back() != ')')
                fail(text, "unterminated comment");
            tok.resize(i);
            break;
        }
    }

    // Obsolete "DD-Mon-YY" date.
    if (!tok.empty()) {
        const std::string_view first = tok.front();
        const size_t a = first.find('-');
        const size_t b = (a == std::string_view::npos) ? a : first.find('-', a + 1);
        if (a != std::string_view::npos && b != std::string_view::npos &&
            first.find('-', b + 1) == std::string_view::npos) {
            std::array<std::string_view, 3> parts = {
                first.substr(0, a), first.substr(a + 1, b - a - 1), first.substr(b + 1)};
            tok.erase(tok.begin());
            tok.insert(tok.begin(), parts.begin(), parts.end());
        }
    }

    if (tok.size() != 4 && tok.size() != 5)
        fail(text, "expected day, month, year, time and zone");
    std::string_view dayTok = tok[0], monTok = tok[1], yearTok = tok[2], timeTok = tok[3];
    std::string_view zoneTok = (tok.size() == 5) ? tok[4] : std::string_view{};

    // "Jan 01 ..." names the month first.
    if (monthNumber(monTok) == 0 && monthNumber(dayTok) != 0)
        std::swap(dayTok, monTok);
    // "01 Jan 00:00:00 2024" and asctime put the time before the year.
    if (yearTok.find(':') != std::string_view::npos)
        std::swap(yearTok, timeTok);

    // "HH:MM:SS+hhmm" with the zone glued to the time.
    if (zoneTok.empty()) {
        const size_t p = timeTok.find_first_of("+-");
        if (p != std::string_view::npos) {
            zoneTok = timeTok.substr(p);
            timeTok = timeTok.substr(0, p);
        }
    }

    // ── Date ─────────────────────────────────────────────────────────────────
    const auto day = digitsField(dayTok, 1, 2);
    if (!day) fail(text, "bad day '" + std::string(dayTok) + "'");

    const unsigned month = monthNumber(monTok);
    if (month == 0) fail(text, "bad month '" + std::string(monTok) + "'");

    auto year = digitsField(yearTok, 2, 4);
    if (!year || yearTok.size() == 3) fail(text, "bad year '" + std::string(yearTok) + "'");
    if (yearTok.size() == 2)
        *year += (*year > 68) ? 1900 : 2000;

    const std::chrono::year_month_day ymd{std::chrono::year{*year},
                                          std::chrono::month{month},
                                          std::chrono::day{static_cast<unsigned>(*day)}};
    if (!ymd.ok())
        fail(text, "no such calendar date");

    // ── Time ─────────────────────────────────────────────────────────────────
    std::array<int, 3> hms = {0, 0, 0};
    const char sep = (timeTok.find(':') != std::string_view::npos) ? ':' : '.';
    size_t fields = 0;
    for (std::string_view rest = timeTok; ; ) {
        if (fields == hms.size()) fail(text, "bad time '" + std::string(timeTok) + "'");
        const size_t cut = rest.find(sep);
        auto v = digitsField(rest.substr(0, cut), 1, 2);
        if (!v) fail(text, "bad time '" + std::string(timeTok) + "'");
        hms[fields++] = *v;
        if (cut == std::string_view::npos) break;
        rest = rest.substr(cut + 1);
    }
    if (fields < 2) fail(text, "bad time '" + std::string(timeTok) + "'");
    if (hms[0] > 23 || hms[1] > 59 || hms[2] > 60)
        fail(text, "time out of range '" + std::string(timeTok) + "'");
    if (hms[2] == 60) hms[2] = 59; // leap second

    Timestamp ts;
    ts.offset = std::chrono::minutes{zoneOffset(zoneTok)};
    ts.utc    = std::chrono::sys_days{ymd} + std::chrono::hours{hms[0]} +
                std::chrono::minutes{hms[1]} + std::chrono::seconds{hms[2]} - ts.offset;
    return ts;
}

std::optional<Timestamp> parseOptionalDate(const std::optional<std::string>& text) {
    if (!text)
        return std::nullopt;
    return parseDate(*text);
}

std::string formatIso8601(const Timestamp& ts) {
    const auto local = ts.utc + ts.offset;
    const auto day   = std::chrono::floor<std::chrono::days>(local);
    const std::chrono::year_month_day ymd{day};
    const std::chrono::hh_mm_ss hms{local - day};

    const int off = static_cast<int>(ts.offset.count());
    const int absOff = std::abs(off);

    std::ostringstream os;
    os << std::setfill('0')
       << std::setw(4) << static_cast<int>(ymd.year()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
       << std::setw(2) << hms.hours().count() << ':'
       << std::setw(2) << hms.minutes().count() << ':'
       << std::setw(2) << hms.seconds().count()
       << (off < 0 ? '-' : '+')
       << std::setw(2) << absOff / 60 << ':'
       << std::setw(2) << absOff % 60;
    return os.str();
}

} // namespace feedcraft
