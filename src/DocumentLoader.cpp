// DocumentLoader.cpp – Textual pre-scan and hardened pugixml parse.
//
// The DOCTYPE / ENTITY scan is a plain substring test over the whole
// case-folded input. It also rejects feeds that merely mention the token in
// escaped text; no DTD-bearing string is ever handed to the XML parser.

#include "FeedCraft/DocumentLoader.hpp"
#include "TextUtil.hpp"

#include <cstdint>
#include <string>

namespace feedcraft {

// DTD processing stays off: pugixml then skips a DOCTYPE without reading it
// and never resolves external entities.
static constexpr unsigned kParseOptions = pugi::parse_default & ~pugi::parse_doctype;

static constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

// ─── UTF-8 well-formedness (RFC 3629) ─────────────────────────────────────────
// Rejects overlong forms, surrogates and code points above U+10FFFF.
static bool isValidUtf8(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size()) {
        const auto b0 = static_cast<uint8_t>(s[i]);
        if (b0 < 0x80) { ++i; continue; }

        size_t   len = 0;
        uint32_t cp  = 0;
        if      ((b0 & 0xE0u) == 0xC0u) { len = 2; cp = b0 & 0x1Fu; }
        else if ((b0 & 0xF0u) == 0xE0u) { len = 3; cp = b0 & 0x0Fu; }
        else if ((b0 & 0xF8u) == 0xF0u) { len = 4; cp = b0 & 0x07u; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const auto b = static_cast<uint8_t>(s[i + k]);
            if ((b & 0xC0u) != 0x80u) return false;
            cp = (cp << 6) | (b & 0x3Fu);
        }

        if ((len == 2 && cp < 0x80u) || (len == 3 && cp < 0x800u) || (len == 4 && cp < 0x10000u))
            return false; // overlong
        if (cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu))
            return false;
        i += len;
    }
    return true;
}

// ─── Public entry point ───────────────────────────────────────────────────────

SafeDocument loadDocument(std::string_view raw) {
    if (raw.find('\0') != std::string_view::npos || !isValidUtf8(raw))
        throw InputError("RSS payload must be UTF-8 text");

    std::string_view body = raw;
    std::ptrdiff_t   bomShift = 0;
    if (body.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        body.remove_prefix(kUtf8Bom.size());
        bomShift = static_cast<std::ptrdiff_t>(kUtf8Bom.size());
    }

    const std::string_view stripped = detail::trim(body);
    if (stripped.empty())
        throw InputError("Empty RSS payload provided");

    const std::string upper = detail::toUpper(stripped);
    if (upper.find("<!DOCTYPE") != std::string::npos)
        throw InputError("Refusing to process RSS feeds that declare a document type");
    if (upper.find("<!ENTITY") != std::string::npos)
        throw InputError("Refusing to process RSS feeds that declare custom entities");

    auto doc = std::make_unique<pugi::xml_document>();
    pugi::xml_parse_result result =
        doc->load_buffer(body.data(), body.size(), kParseOptions, pugi::encoding_utf8);
    if (!result)
        throw XmlSyntaxError(std::string("Unable to parse RSS XML document: ") +
                                 result.description() + " at offset " +
                                 std::to_string(result.offset + bomShift),
                             result.offset + bomShift);

    return SafeDocument{std::move(doc)};
}

} // namespace feedcraft
