// Parser.cpp – load → locate <rss>/<channel> → extract → validate.

#include "FeedCraft/Parser.hpp"
#include "FeedCraft/DocumentLoader.hpp"
#include "FeedCraft/Extract.hpp"
#include "FeedCraft/Validation.hpp"
#include "FeedCraft/XmlView.hpp"

#include <utility>

namespace feedcraft {

RssFeed parseRss(std::string_view document) {
    const SafeDocument doc = loadDocument(document);

    pugi::xml_node rss = findElement(doc.document(), "rss");
    if (!rss)
        throw MissingFieldError("Missing <rss> root element", "rss");

    pugi::xml_node channel = firstChild(rss, "channel");
    if (!channel)
        throw MissingFieldError("Missing <channel> element inside <rss>", "channel");

    RssFeed feed;
    feed.channel = extractChannel(channel);
    if (auto version = attribute(rss, "version"))
        feed.version = std::move(*version);

    validateFeed(feed);
    return feed;
}

} // namespace feedcraft
