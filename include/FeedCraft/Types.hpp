#pragma once
// Types.hpp – Value types of the RSS 2.0 document model.
// A parsed feed is a tree of these aggregates, owned top-down by value.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace feedcraft {

// ─── RSS 2.0 defaults and limits ─────────────────────────────────────────────
inline constexpr int32_t kDefaultImageWidth  = 88;
inline constexpr int32_t kDefaultImageHeight = 31;
inline constexpr int32_t kMaxImageWidth      = 144;
inline constexpr int32_t kMaxImageHeight     = 400;
inline constexpr size_t  kMaxSkipHours       = 24;
inline constexpr size_t  kMaxSkipDays        = 7;
inline constexpr char    kRssVersion[]       = "2.0";

// ─── <skipDays> entries ───────────────────────────────────────────────────────
enum class Weekday { Monday, Tuesday, Wednesday, Thursday, Friday, Saturday, Sunday };

inline constexpr std::array<std::string_view, 7> kWeekdayNames = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday",
};

[[nodiscard]] constexpr std::string_view weekdayName(Weekday d) noexcept {
    return kWeekdayNames[static_cast<size_t>(d)];
}

// Exact, case-sensitive match against the English day names.
[[nodiscard]] constexpr std::optional<Weekday> parseWeekday(std::string_view name) noexcept {
    for (size_t i = 0; i < kWeekdayNames.size(); ++i) {
        if (kWeekdayNames[i] == name)
            return static_cast<Weekday>(i);
    }
    return std::nullopt;
}

// ─── <category domain="..."> ──────────────────────────────────────────────────
// value is a forward-slash separated path in the taxonomy named by domain.
struct Category {
    std::string                value;
    std::optional<std::string> domain;

    bool operator==(const Category&) const = default;
};

// ─── <guid isPermaLink="..."> ─────────────────────────────────────────────────
struct Guid {
    std::string value;
    bool        is_perma_link{true};

    bool operator==(const Guid&) const = default;
};

// ─── <enclosure url length type/> ─────────────────────────────────────────────
struct Enclosure {
    std::string url;
    int64_t     length{0};   // bytes
    std::string media_type;  // MIME type

    bool operator==(const Enclosure&) const = default;
};

// ─── <source url="...">Channel name</source> ──────────────────────────────────
struct Source {
    std::string name;
    std::string url;

    bool operator==(const Source&) const = default;
};

// ─── <cloud/> – rssCloud notification endpoint ────────────────────────────────
struct Cloud {
    std::string domain;
    int32_t     port{0};
    std::string path;
    std::string register_procedure;
    std::string protocol;    // HTTP-POST, XML-RPC or SOAP 1.1

    bool operator==(const Cloud&) const = default;
};

// ─── <image> ──────────────────────────────────────────────────────────────────
struct Image {
    std::string                url;
    std::string                title;
    std::string                link;
    int32_t                    width{kDefaultImageWidth};
    int32_t                    height{kDefaultImageHeight};
    std::optional<std::string> description;

    bool operator==(const Image&) const = default;
};

// ─── <textInput> ──────────────────────────────────────────────────────────────
struct TextInput {
    std::string title;        // label of the Submit button
    std::string description;
    std::string name;         // name of the text object
    std::string link;         // CGI script that processes the request

    bool operator==(const TextInput&) const = default;
};

// ─── <item> ───────────────────────────────────────────────────────────────────
// At least one of title / description is present in any item the parser emits.
struct Item {
    std::optional<std::string> title;
    std::optional<std::string> link;
    std::optional<std::string> description;
    std::optional<std::string> author;
    std::vector<Category>      categories;
    std::optional<std::string> comments;
    std::optional<Enclosure>   enclosure;
    std::optional<Guid>        guid;
    std::optional<std::string> pub_date;   // RFC 822 text; see parseDate()
    std::optional<Source>      source;

    bool operator==(const Item&) const = default;
};

// ─── <channel> ────────────────────────────────────────────────────────────────
struct Channel {
    // Skeleton – always present and non-empty after a successful parse
    std::string title;
    std::string link;
    std::string description;

    std::optional<std::string> language;
    std::optional<std::string> copyright;
    std::optional<std::string> managing_editor;
    std::optional<std::string> web_master;
    std::optional<std::string> pub_date;
    std::optional<std::string> last_build_date;
    std::vector<Category>      categories;
    std::optional<std::string> generator;
    std::optional<std::string> docs;
    std::optional<Cloud>       cloud;
    std::optional<int64_t>     ttl;        // minutes
    std::optional<Image>       image;
    std::optional<std::string> rating;     // PICS
    std::optional<TextInput>   text_input;

    std::vector<int32_t> skip_hours;       // GMT hours, 0–23
    std::vector<Weekday> skip_days;

    std::vector<Item> items;               // document order

    bool operator==(const Channel&) const = default;
};

// ─── <rss version="2.0"> ──────────────────────────────────────────────────────
struct RssFeed {
    Channel     channel;
    std::string version{kRssVersion};

    bool operator==(const RssFeed&) const = default;
};

} // namespace feedcraft
