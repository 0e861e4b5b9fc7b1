#pragma once
// DocumentLoader.hpp – Gatekeeper between untrusted feed text and the XML parser.

#include "Errors.hpp"

#include <pugixml.hpp>

#include <memory>
#include <string_view>
#include <utility>

namespace feedcraft {

// A parsed XML tree that has passed the textual safety checks.
// Move-only; owns the underlying pugixml document.
class SafeDocument {
public:
    explicit SafeDocument(std::unique_ptr<pugi::xml_document> doc) noexcept
        : doc_(std::move(doc)) {}

    // The document node (parent of the root element).
    [[nodiscard]] pugi::xml_node document() const noexcept { return *doc_; }

    // The first top-level element, or a null node.
    [[nodiscard]] pugi::xml_node rootElement() const noexcept {
        return doc_->document_element();
    }

private:
    std::unique_ptr<pugi::xml_document> doc_;
};

// Rejects unsafe input before any XML is parsed, then parses it.
//
// Throws InputError when raw
//   • is not text (contains NUL or is not valid UTF-8),
//   • is empty or whitespace only,
//   • contains "<!DOCTYPE" or "<!ENTITY" anywhere (case-insensitive).
// Throws XmlSyntaxError when the remaining document is not well-formed.
[[nodiscard]] SafeDocument loadDocument(std::string_view raw);

} // namespace feedcraft
