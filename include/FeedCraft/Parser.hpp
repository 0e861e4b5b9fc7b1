#pragma once
// Parser.hpp – Public entry point: RSS 2.0 text in, validated RssFeed out.
//
// Usage example:
//   try {
//       RssFeed feed = parseRss(text);
//       for (const auto& item : feed.channel.items) { ... }
//   } catch (const ParseError& e) {
//       std::cerr << e.what() << '\n';
//   }

#include "Errors.hpp"
#include "Types.hpp"

#include <string_view>

namespace feedcraft {

// Parses and validates one RSS 2.0 document.
//
// Throws
//   InputError         – not UTF-8 text, blank, or DOCTYPE / ENTITY present
//   XmlSyntaxError     – not well-formed XML
//   MissingFieldError  – no <rss>, no <channel>, or a channel skeleton field
//                        (title, link, description) missing or empty
//   ValidationError    – the assembled feed breaks an invariant
//
// Malformed optional parts (cloud, image, textInput, enclosure, guid, source,
// numeric fields, skipHours / skipDays entries, title-less and
// description-less items) are dropped rather than reported.
// Safe to call concurrently; each call owns its own tree.
[[nodiscard]] RssFeed parseRss(std::string_view document);

} // namespace feedcraft
