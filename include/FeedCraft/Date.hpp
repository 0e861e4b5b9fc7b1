#pragma once
// Date.hpp – RFC 822 date-time parsing for <pubDate> / <lastBuildDate>.
//
// The feed model keeps dates as the text found in the document; callers
// convert them on demand:
//
//   if (auto ts = parseOptionalDate(item.pub_date))
//       std::cout << formatIso8601(*ts) << '\n';

#include "Errors.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace feedcraft {

// An absolute instant together with the zone offset the text declared.
// Text without a usable zone (none, "-0000", or unrecognised) is taken to be UTC.
struct Timestamp {
    std::chrono::sys_seconds utc{};     // instant, UTC
    std::chrono::minutes     offset{0}; // declared offset east of UTC

    bool operator==(const Timestamp&) const = default;
};

// Parses an RFC 822 / RFC 2822 date-time, including the obsolete two-digit
// year, dashed "DD-Mon-YY" and named-zone forms.
// Throws DateGrammarError if text is blank or does not follow the grammar.
[[nodiscard]] Timestamp parseDate(std::string_view text);

// Returns std::nullopt for std::nullopt without touching the grammar;
// otherwise behaves like parseDate().
[[nodiscard]] std::optional<Timestamp> parseOptionalDate(const std::optional<std::string>& text);

// "YYYY-MM-DDTHH:MM:SS+HH:MM", rendered in the declared offset.
[[nodiscard]] std::string formatIso8601(const Timestamp& ts);

} // namespace feedcraft
