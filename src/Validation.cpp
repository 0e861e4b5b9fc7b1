// Validation.cpp – Per-entity invariants and the whole-feed validation pass.

#include "FeedCraft/Validation.hpp"
#include "TextUtil.hpp"

#include <array>
#include <string_view>

namespace feedcraft {

static constexpr std::array<std::string_view, 4> kCloudProtocols = {
    "HTTP-POST", "XML-RPC", "SOAP 1.1", "SOAP",
};

bool isKnownCloudProtocol(std::string_view protocol) {
    for (auto p : kCloudProtocols) {
        if (detail::iequals(protocol, p))
            return true;
    }
    return false;
}

// ─── Optional structures (failures degrade to absence) ────────────────────────

std::optional<std::string> check(const Enclosure& e) {
    if (e.length < 0)
        return "Enclosure length must be a non-negative byte count";
    return std::nullopt;
}

std::optional<std::string> check(const Cloud& c) {
    if (!isKnownCloudProtocol(c.protocol))
        return "Cloud protocol must be one of HTTP-POST, XML-RPC, or SOAP 1.1, got '" +
               c.protocol + "'";
    return std::nullopt;
}

std::optional<std::string> check(const Image& img) {
    if (img.width > kMaxImageWidth)
        return "Image width must not exceed " + std::to_string(kMaxImageWidth) + " pixels";
    if (img.height > kMaxImageHeight)
        return "Image height must not exceed " + std::to_string(kMaxImageHeight) + " pixels";
    return std::nullopt;
}

// ─── Items, channel, feed (failures abort the parse) ──────────────────────────

std::optional<std::string> check(const Item& item) {
    if (!item.title && !item.description)
        return "RSS items require at least a title or a description";
    return std::nullopt;
}

std::optional<std::string> check(const Channel& ch) {
    if (ch.skip_hours.size() > kMaxSkipHours)
        return "skip_hours may contain at most " + std::to_string(kMaxSkipHours) + " entries";
    for (int32_t hour : ch.skip_hours) {
        if (hour < 0 || hour > 23)
            return "Each skip hour must be between 0 and 23 inclusive, got " + std::to_string(hour);
    }
    if (ch.skip_days.size() > kMaxSkipDays)
        return "skip_days may contain at most the seven days of the week";
    if (ch.ttl && *ch.ttl < 0)
        return "ttl must be a non-negative number of minutes";
    return std::nullopt;
}

std::optional<std::string> check(const RssFeed& feed) {
    if (feed.version != kRssVersion)
        return "RSS 2.0 documents must declare version '2.0', got '" + feed.version + "'";
    return std::nullopt;
}

// ─── Whole-feed pass ──────────────────────────────────────────────────────────

void validateFeed(const RssFeed& feed) {
    if (auto v = check(feed))
        throw ValidationError(*v);
    if (auto v = check(feed.channel))
        throw ValidationError(*v);
    for (size_t i = 0; i < feed.channel.items.size(); ++i) {
        if (auto v = check(feed.channel.items[i]))
            throw ValidationError("item " + std::to_string(i + 1) + ": " + *v);
    }
}

} // namespace feedcraft
