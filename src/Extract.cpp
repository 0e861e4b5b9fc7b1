// Extract.cpp – Builds the RSS 2.0 model from a <channel> element.
// Only the XmlView primitives touch the XML tree.

#include "FeedCraft/Extract.hpp"
#include "FeedCraft/Validation.hpp"
#include "FeedCraft/XmlView.hpp"
#include "TextUtil.hpp"

#include <utility>

namespace feedcraft {

// ─── Small parsing helpers ────────────────────────────────────────────────────

// <guid isPermaLink="..."> – anything unrecognised keeps the default (true).
static bool parsePermaLink(const std::optional<std::string>& attr) {
    if (!attr) return true;
    const std::string v = detail::toLower(*attr);
    if (v == "false" || v == "0" || v == "no") return false;
    return true;
}

// "monday" / "MONDAY" → "Monday"
static std::string capitalize(std::string_view s) {
    std::string out = detail::toLower(s);
    if (!out.empty()) out[0] = detail::toUpper(out[0]);
    return out;
}

// <width> / <height>: absent, unparseable or zero means the default size.
static int32_t imageDimension(const std::optional<std::string>& text, int32_t fallback) {
    if (!text) return fallback;
    const auto v = detail::parseInteger<int32_t>(*text);
    return (v && *v != 0) ? *v : fallback;
}

// Keeps a structure only if its own invariants hold.
template <typename T>
static std::optional<T> keepIfValid(T value) {
    if (check(value)) return std::nullopt;
    return value;
}

// ─── Scalar text ──────────────────────────────────────────────────────────────

std::string requiredText(pugi::xml_node parent, std::string_view name) {
    auto value = text(firstChild(parent, name));
    if (!value)
        throw MissingFieldError("Missing required <" + std::string(name) +
                                    "> element in RSS channel",
                                std::string(name));
    return std::move(*value);
}

std::optional<std::string> optionalText(pugi::xml_node parent, std::string_view name) {
    return text(firstChild(parent, name));
}

std::optional<int64_t> optionalInteger(pugi::xml_node parent, std::string_view name) {
    auto value = optionalText(parent, name);
    if (!value) return std::nullopt;
    return detail::parseInteger<int64_t>(*value);
}

std::vector<Category> extractCategories(pugi::xml_node parent) {
    std::vector<Category> out;
    for (pugi::xml_node node : childrenNamed(parent, "category")) {
        auto value = text(node);
        if (!value) continue;
        out.push_back(Category{std::move(*value), attribute(node, "domain")});
    }
    return out;
}

// ─── Channel-level structures ─────────────────────────────────────────────────

std::optional<Cloud> extractCloud(pugi::xml_node channel) {
    pugi::xml_node node = firstChild(channel, "cloud");
    if (!node) return std::nullopt;

    auto domain    = attribute(node, "domain");
    auto portText  = attribute(node, "port");
    auto path      = attribute(node, "path");
    auto procedure = attribute(node, "registerProcedure");
    auto protocol  = attribute(node, "protocol");
    if (!domain || !portText || !path || !procedure || !protocol)
        return std::nullopt;

    auto port = detail::parseInteger<int32_t>(*portText);
    if (!port) return std::nullopt;

    Cloud c;
    c.domain             = std::move(*domain);
    c.port               = *port;
    c.path               = std::move(*path);
    c.register_procedure = std::move(*procedure);
    c.protocol           = std::move(*protocol);
    return keepIfValid(std::move(c));
}

std::optional<Image> extractImage(pugi::xml_node channel) {
    pugi::xml_node node = firstChild(channel, "image");
    if (!node) return std::nullopt;

    auto url   = optionalText(node, "url");
    auto title = optionalText(node, "title");
    auto link  = optionalText(node, "link");
    if (!url || !title || !link)
        return std::nullopt;

    Image img;
    img.url   = std::move(*url);
    img.title = std::move(*title);
    img.link  = std::move(*link);
    img.width  = imageDimension(optionalText(node, "width"), kDefaultImageWidth);
    img.height = imageDimension(optionalText(node, "height"), kDefaultImageHeight);
    img.description = optionalText(node, "description");
    return keepIfValid(std::move(img));
}

std::optional<TextInput> extractTextInput(pugi::xml_node channel) {
    pugi::xml_node node = firstChild(channel, "textInput");
    if (!node) return std::nullopt;

    auto title       = optionalText(node, "title");
    auto description = optionalText(node, "description");
    auto name        = optionalText(node, "name");
    auto link        = optionalText(node, "link");
    if (!title || !description || !name || !link)
        return std::nullopt;

    return TextInput{std::move(*title), std::move(*description), std::move(*name), std::move(*link)};
}

std::vector<int32_t> extractSkipHours(pugi::xml_node channel) {
    std::vector<int32_t> hours;
    pugi::xml_node node = firstChild(channel, "skipHours");
    if (!node) return hours;

    for (pugi::xml_node hourNode : childrenNamed(node, "hour")) {
        auto value = text(hourNode);
        if (!value) continue;
        auto hour = detail::parseInteger<int32_t>(*value);
        if (!hour || *hour < 0 || *hour > 23) continue;
        hours.push_back(*hour);
    }
    return hours;
}

std::vector<Weekday> extractSkipDays(pugi::xml_node channel) {
    std::vector<Weekday> days;
    pugi::xml_node node = firstChild(channel, "skipDays");
    if (!node) return days;

    for (pugi::xml_node dayNode : childrenNamed(node, "day")) {
        auto value = text(dayNode);
        if (!value) continue;
        if (auto day = parseWeekday(capitalize(*value)))
            days.push_back(*day);
    }
    return days;
}

// ─── Item-level structures ────────────────────────────────────────────────────

std::optional<Guid> extractGuid(pugi::xml_node item) {
    pugi::xml_node node = firstChild(item, "guid");
    auto value = text(node);
    if (!value) return std::nullopt;
    return Guid{std::move(*value), parsePermaLink(attribute(node, "isPermaLink"))};
}

std::optional<Enclosure> extractEnclosure(pugi::xml_node item) {
    pugi::xml_node node = firstChild(item, "enclosure");
    if (!node) return std::nullopt;

    auto url        = attribute(node, "url");
    auto lengthText = attribute(node, "length");
    auto mediaType  = attribute(node, "type");
    if (!url || !lengthText || !mediaType)
        return std::nullopt;

    auto length = detail::parseInteger<int64_t>(*lengthText);
    if (!length) return std::nullopt;

    return keepIfValid(Enclosure{std::move(*url), *length, std::move(*mediaType)});
}

std::optional<Source> extractSource(pugi::xml_node item) {
    pugi::xml_node node = firstChild(item, "source");
    if (!node) return std::nullopt;

    auto url  = attribute(node, "url");
    auto name = text(node);
    if (!url || !name)
        return std::nullopt;
    return Source{std::move(*name), std::move(*url)};
}

std::optional<Item> extractItem(pugi::xml_node node) {
    Item item;
    item.title       = optionalText(node, "title");
    item.description = optionalText(node, "description");
    if (!item.title && !item.description)
        return std::nullopt;

    item.link       = optionalText(node, "link");
    item.author     = optionalText(node, "author");
    item.categories = extractCategories(node);
    item.comments   = optionalText(node, "comments");
    item.enclosure  = extractEnclosure(node);
    item.guid       = extractGuid(node);
    item.pub_date   = optionalText(node, "pubDate");
    item.source     = extractSource(node);
    return item;
}

std::vector<Item> extractItems(pugi::xml_node channel) {
    std::vector<Item> items;
    for (pugi::xml_node node : childrenNamed(channel, "item")) {
        if (auto item = extractItem(node))
            items.push_back(std::move(*item));
    }
    return items;
}

// ─── Whole channel ────────────────────────────────────────────────────────────

Channel extractChannel(pugi::xml_node node) {
    Channel ch;
    ch.title       = requiredText(node, "title");
    ch.link        = requiredText(node, "link");
    ch.description = requiredText(node, "description");

    ch.language        = optionalText(node, "language");
    ch.copyright       = optionalText(node, "copyright");
    ch.managing_editor = optionalText(node, "managingEditor");
    ch.web_master      = optionalText(node, "webMaster");
    ch.pub_date        = optionalText(node, "pubDate");
    ch.last_build_date = optionalText(node, "lastBuildDate");
    ch.categories      = extractCategories(node);
    ch.generator       = optionalText(node, "generator");
    ch.docs            = optionalText(node, "docs");
    ch.cloud           = extractCloud(node);
    ch.ttl             = optionalInteger(node, "ttl");
    ch.image           = extractImage(node);
    ch.rating          = optionalText(node, "rating");
    ch.text_input      = extractTextInput(node);
    ch.skip_hours      = extractSkipHours(node);
    ch.skip_days       = extractSkipDays(node);
    ch.items           = extractItems(node);
    return ch;
}

} // namespace feedcraft
