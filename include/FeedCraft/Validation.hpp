#pragma once
// Validation.hpp – Invariant checks over the feed model.
//
// check() returns the first invariant a value violates, or std::nullopt.
// It never throws; the extraction layer uses it to drop malformed optional
// structures. validateFeed() is the final gate run by parseRss() and turns
// the first violation into a ValidationError.

#include "Errors.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace feedcraft {

[[nodiscard]] std::optional<std::string> check(const Enclosure& e);
[[nodiscard]] std::optional<std::string> check(const Cloud& c);
[[nodiscard]] std::optional<std::string> check(const Image& img);
[[nodiscard]] std::optional<std::string> check(const Item& item);
[[nodiscard]] std::optional<std::string> check(const Channel& ch);
[[nodiscard]] std::optional<std::string> check(const RssFeed& feed);

// True if protocol names one of the rssCloud protocols (HTTP-POST, XML-RPC,
// SOAP 1.1), compared case-insensitively; "SOAP" is accepted for SOAP 1.1.
[[nodiscard]] bool isKnownCloudProtocol(std::string_view protocol);

// Whole-tree check, stopping at the first violation in this order:
//   1. feed version is "2.0"
//   2. skip_hours has at most 24 entries, each 0–23
//   3. skip_days has at most 7 entries
//   4. ttl, if present, is not negative
//   5. every item has a title or a description
// Throws ValidationError naming the violated invariant.
void validateFeed(const RssFeed& feed);

} // namespace feedcraft
