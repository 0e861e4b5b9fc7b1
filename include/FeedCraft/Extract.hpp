#pragma once
// Extract.hpp – Element-by-element extraction of the RSS 2.0 model.
//
// Policies:
//   • Channel skeleton (title, link, description): missing or empty throws
//     MissingFieldError.
//   • Optional text: missing or empty is std::nullopt.
//   • Structured optional elements (cloud, image, textInput, enclosure, guid,
//     source): a missing or malformed required part, or a failed check(),
//     drops the whole structure. Nothing is thrown.
//   • Integers use a strict base-10 grammar; unparseable text counts as absent.
//     Image width / height fall back to 88 / 31 when absent, unparseable or 0.
//   • skipHours / skipDays keep only recognised entries, in document order.
//   • Items carrying neither title nor description are dropped.

#include "Errors.hpp"
#include "Types.hpp"

#include <pugixml.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace feedcraft {

// ─── Scalar text ──────────────────────────────────────────────────────────────

// Text of the first child named name; throws MissingFieldError if absent or empty.
[[nodiscard]] std::string requiredText(pugi::xml_node parent, std::string_view name);

[[nodiscard]] std::optional<std::string> optionalText(pugi::xml_node parent, std::string_view name);

// Strict integer text of the first child named name.
[[nodiscard]] std::optional<int64_t> optionalInteger(pugi::xml_node parent, std::string_view name);

// ─── Shared by channel and item ───────────────────────────────────────────────

[[nodiscard]] std::vector<Category> extractCategories(pugi::xml_node parent);

// ─── Channel-level structures ─────────────────────────────────────────────────

[[nodiscard]] std::optional<Cloud>     extractCloud(pugi::xml_node channel);
[[nodiscard]] std::optional<Image>     extractImage(pugi::xml_node channel);
[[nodiscard]] std::optional<TextInput> extractTextInput(pugi::xml_node channel);
[[nodiscard]] std::vector<int32_t>     extractSkipHours(pugi::xml_node channel);
[[nodiscard]] std::vector<Weekday>     extractSkipDays(pugi::xml_node channel);

// ─── Item-level structures ────────────────────────────────────────────────────

[[nodiscard]] std::optional<Guid>      extractGuid(pugi::xml_node item);
[[nodiscard]] std::optional<Enclosure> extractEnclosure(pugi::xml_node item);
[[nodiscard]] std::optional<Source>    extractSource(pugi::xml_node item);

// std::nullopt when the <item> has neither title nor description.
[[nodiscard]] std::optional<Item> extractItem(pugi::xml_node item);

[[nodiscard]] std::vector<Item> extractItems(pugi::xml_node channel);

// ─── Whole channel ────────────────────────────────────────────────────────────

// Builds the channel from its element. Throws MissingFieldError for a missing
// skeleton field; never validates (see validateFeed()).
[[nodiscard]] Channel extractChannel(pugi::xml_node channel);

} // namespace feedcraft
