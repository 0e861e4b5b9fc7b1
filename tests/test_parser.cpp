// test_parser.cpp – End-to-end parseRss(): document shape, error kinds,
// degrade-to-absence behaviour and idempotence.

#include "FeedCraft/Date.hpp"
#include "FeedCraft/Parser.hpp"

#include <iostream>
#include <string>

using namespace feedcraft;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

// The Liftoff News sample channel published with RSS 2.0, trimmed to two items.
static const char* kLiftoff = R"(<?xml version="1.0" encoding="UTF-8"?>
<rss version="2.0" xmlns:atom="http://www.w3.org/2005/Atom">
  <channel>
    <title>  Liftoff News  </title>
    <link>http://liftoff.msfc.nasa.gov/</link>
    <description>Liftoff to Space Exploration.</description>
    <atom:link href="http://liftoff.msfc.nasa.gov/rss.xml" rel="self" type="application/rss+xml"/>
    <language>en-us</language>
    <pubDate>Tue, 10 Jun 2003 04:00:00 GMT</pubDate>
    <lastBuildDate>Tue, 10 Jun 2003 09:41:01 GMT</lastBuildDate>
    <docs>http://blogs.law.harvard.edu/tech/rss</docs>
    <generator>Weblog Editor 2.0</generator>
    <managingEditor>editor@example.com</managingEditor>
    <webMaster>webmaster@example.com</webMaster>
    <cloud domain="rpc.sys.com" port="80" path="/RPC2" registerProcedure="pingMe" protocol="soap"/>
    <ttl>40</ttl>
    <image>
      <url>http://liftoff.msfc.nasa.gov/news.gif</url>
      <title>Liftoff News</title>
      <link>http://liftoff.msfc.nasa.gov/</link>
    </image>
    <textInput>
      <title>Search</title>
      <description>Search Liftoff</description>
      <name>q</name>
      <link>http://liftoff.msfc.nasa.gov/search</link>
    </textInput>
    <skipHours><hour>0</hour><hour>1</hour></skipHours>
    <skipDays><day>Saturday</day><day>Sunday</day></skipDays>
    <item>
      <title>Star City</title>
      <link>http://liftoff.msfc.nasa.gov/news/2003/news-starcity.asp</link>
      <description>How do Americans get ready to work with Russians aboard the International Space Station?</description>
      <pubDate>Tue, 03 Jun 2003 09:39:21 GMT</pubDate>
      <guid>http://liftoff.msfc.nasa.gov/2003/06/03.html#item573</guid>
      <enclosure url="http://liftoff.msfc.nasa.gov/media/starcity.mp3" length="12216320" type="audio/mpeg"/>
    </item>
    <item>
      <description>Sky watchers in Europe, Asia, and parts of Alaska and Canada will experience a &lt;a href="http://science.nasa.gov/headlines/y2003/30may_solareclipse.htm"&gt;partial eclipse of the Sun&lt;/a&gt; on Saturday, May 31st.</description>
      <pubDate>Fri, 30 May 2003 11:06:42 GMT</pubDate>
      <guid isPermaLink="false">eclipse-2003</guid>
      <source url="http://www.tomalak.org/links2.xml">Tomalak's Realm</source>
    </item>
  </channel>
</rss>
)";

static std::string feedWith(const std::string& channelBody, const std::string& rssAttrs = " version=\"2.0\"") {
    return "<rss" + rssAttrs + "><channel>"
           "<title>T</title><link>http://x/</link><description>D</description>" +
           channelBody + "</channel></rss>";
}

// Which ParseError subclass parseRss() raised.
enum class Outcome { Parsed, Input, Syntax, Missing, Validation, Other };

static Outcome parseOutcome(const std::string& text) {
    try {
        (void)parseRss(text);
        return Outcome::Parsed;
    } catch (const InputError&) {
        return Outcome::Input;
    } catch (const XmlSyntaxError&) {
        return Outcome::Syntax;
    } catch (const MissingFieldError&) {
        return Outcome::Missing;
    } catch (const ValidationError&) {
        return Outcome::Validation;
    } catch (const std::exception& e) {
        std::cerr << "     unexpected: " << e.what() << '\n';
        return Outcome::Other;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
static void testFullChannel() {
    std::cout << "\n=== Test: full sample channel ===\n";
    RssFeed feed = parseRss(kLiftoff);
    const Channel& ch = feed.channel;

    CHECK(feed.version == "2.0", "version");
    CHECK(ch.title == "Liftoff News", "title trimmed");
    CHECK(ch.link == "http://liftoff.msfc.nasa.gov/", "link");
    CHECK(ch.description == "Liftoff to Space Exploration.", "description");
    CHECK(ch.language == "en-us", "language");
    CHECK(ch.ttl == 40, "ttl");
    CHECK(ch.cloud && ch.cloud->port == 80, "cloud");
    CHECK(ch.image && ch.image->width == 88 && ch.image->height == 31, "image with defaults");
    CHECK(ch.text_input && ch.text_input->name == "q", "textInput");
    CHECK((ch.skip_hours == std::vector<int32_t>{0, 1}), "skipHours");
    CHECK((ch.skip_days == std::vector<Weekday>{Weekday::Saturday, Weekday::Sunday}), "skipDays");

    CHECK(ch.items.size() == 2, "two items");
    if (ch.items.size() == 2) {
        const Item& a = ch.items[0];
        CHECK(a.title == "Star City", "item 1 title");
        CHECK(a.guid && a.guid->is_perma_link, "item 1 guid permalink");
        CHECK(a.enclosure && a.enclosure->length == 12216320, "item 1 enclosure");

        const Item& b = ch.items[1];
        CHECK(!b.title && b.description.has_value(), "item 2 description only");
        CHECK(b.description && b.description->find("<a href=") != std::string::npos,
              "escaped markup decoded");
        CHECK(b.guid && !b.guid->is_perma_link, "item 2 guid not permalink");
        CHECK(b.source && b.source->name == "Tomalak's Realm", "item 2 source");

        auto ts = parseOptionalDate(a.pub_date);
        CHECK(ts && formatIso8601(*ts) == "2003-06-03T09:39:21+00:00", "item date parses on demand");
    }
}

static void testRejectedDocuments() {
    std::cout << "\n=== Test: rejected documents ===\n";
    CHECK(parseOutcome("") == Outcome::Input, "empty → InputError");
    CHECK(parseOutcome("<!DOCTYPE rss>" + feedWith("")) == Outcome::Input, "DOCTYPE → InputError");
    CHECK(parseOutcome(feedWith("<!-- <!entity x 'y'> -->")) == Outcome::Input,
          "ENTITY token anywhere → InputError");
    CHECK(parseOutcome("<rss version=\"2.0\"><channel>") == Outcome::Syntax, "truncated → XmlSyntaxError");

    CHECK(parseOutcome("<feed><title>Atom</title></feed>") == Outcome::Missing, "no <rss> → MissingFieldError");
    CHECK(parseOutcome("<rss version=\"2.0\"></rss>") == Outcome::Missing, "no <channel> → MissingFieldError");
    CHECK(parseOutcome("<rss version=\"2.0\"><x><channel/></x></rss>") == Outcome::Missing,
          "nested <channel> is not a direct child");
    CHECK(parseOutcome("<rss version=\"2.0\"><channel><title>T</title><link>l</link></channel></rss>") ==
          Outcome::Missing, "no <description> → MissingFieldError");

    try {
        (void)parseRss("<rss version=\"2.0\"><channel><link>l</link><description>d</description></channel></rss>");
        CHECK(false, "missing title should throw");
    } catch (const MissingFieldError& e) {
        CHECK(e.field() == "title", "MissingFieldError names <title>");
    }
}

static void testRootAndVersion() {
    std::cout << "\n=== Test: root element and version ===\n";
    CHECK(parseRss(feedWith("", "")).version == "2.0", "absent version defaults to 2.0");
    CHECK(parseOutcome(feedWith("", " version=\"0.91\"")) == Outcome::Validation, "0.91 → ValidationError");

    const std::string prefixed =
        "<r:rss xmlns:r=\"urn:x\" version=\"2.0\"><r:channel><r:title>P</r:title>"
        "<r:link>l</r:link><r:description>d</r:description></r:channel></r:rss>";
    CHECK(parseOutcome(prefixed) == Outcome::Parsed, "prefixed element names accepted");

    const std::string wrapped = "<wrapper>" + feedWith("") + "</wrapper>";
    CHECK(parseOutcome(wrapped) == Outcome::Parsed, "<rss> found below the document element");
}

static void testDegradeToAbsence() {
    std::cout << "\n=== Test: optional structures degrade ===\n";
    RssFeed bigImage = parseRss(feedWith(
        "<image><url>u</url><title>t</title><link>l</link><width>200</width></image>"
        "<item><title>kept</title></item>"));
    CHECK(!bigImage.channel.image, "oversized image dropped");
    CHECK(bigImage.channel.items.size() == 1, "rest of channel parsed");

    RssFeed tallImage = parseRss(feedWith(
        "<image><url>u</url><title>t</title><link>l</link><height>500</height></image>"));
    CHECK(!tallImage.channel.image, "too-tall image dropped");

    RssFeed ftp = parseRss(feedWith(
        "<cloud domain=\"d\" port=\"21\" path=\"/\" registerProcedure=\"p\" protocol=\"ftp\"/>"));
    CHECK(!ftp.channel.cloud, "ftp cloud dropped, parse succeeds");

    RssFeed items = parseRss(feedWith(
        "<item><title>A</title></item>"
        "<item><link>http://x/nothing</link></item>"
        "<item><description>B</description></item>"
        "<item><title>C</title><enclosure url=\"u\" length=\"-3\" type=\"t\"/></item>"));
    CHECK(items.channel.items.size() == 3, "title-less and description-less item dropped");
    if (items.channel.items.size() == 3) {
        CHECK(items.channel.items[0].title == "A" &&
              items.channel.items[1].description == "B" &&
              items.channel.items[2].title == "C", "document order kept");
        CHECK(!items.channel.items[2].enclosure, "bad enclosure dropped, item kept");
    }

    RssFeed badDate = parseRss(feedWith("<item><title>x</title><pubDate>yesterday</pubDate></item>"));
    CHECK(badDate.channel.items.at(0).pub_date == "yesterday", "bad date is not a parse error");
}

static void testSkipHoursCap() {
    std::cout << "\n=== Test: skipHours cardinality ===\n";
    std::string hours = "<skipHours>";
    for (int h = 0; h < 24; ++h) hours += "<hour>" + std::to_string(h) + "</hour>";
    hours += "<hour>25</hour></skipHours>";
    RssFeed feed = parseRss(feedWith(hours));
    CHECK(feed.channel.skip_hours.size() == 24, "25 entries with one out of range → 24");
    CHECK(feed.channel.skip_hours.front() == 0 && feed.channel.skip_hours.back() == 23, "order kept");

    std::string dup = "<skipHours>";
    for (int h = 0; h < 25; ++h) dup += "<hour>" + std::to_string(h % 24) + "</hour>";
    dup += "</skipHours>";
    CHECK(parseOutcome(feedWith(dup)) == Outcome::Validation, "25 valid entries → ValidationError");

    std::string days = "<skipDays>";
    for (int d = 0; d < 8; ++d) days += "<day>Monday</day>";
    days += "</skipDays>";
    CHECK(parseOutcome(feedWith(days)) == Outcome::Validation, "8 skip days → ValidationError");

    CHECK(parseOutcome(feedWith("<ttl>-1</ttl>")) == Outcome::Validation, "negative ttl → ValidationError");
}

static void testIdempotence() {
    std::cout << "\n=== Test: idempotence ===\n";
    RssFeed a = parseRss(kLiftoff);
    RssFeed b = parseRss(kLiftoff);
    CHECK(a == b, "same text → equal feeds");
    b = parseRss(feedWith(""));
    CHECK(!(a == b), "different text → different feeds");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    try {
        testFullChannel();
        testRejectedDocuments();
        testRootAndVersion();
        testDegradeToAbsence();
        testSkipHoursCap();
        testIdempotence();
    } catch (const std::exception& e) {
        std::cerr << "FAIL unexpected exception: " << e.what() << '\n';
        ++failures;
    }

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
