#pragma once
// XmlView.hpp – Namespace-agnostic view over a pugixml tree.
//
// Element names are compared by local name only: "atom:link", "dc:link" and
// "link" all answer to "link". Prefix bindings are never resolved.
// These functions are the only XML operations the extraction layer uses.

#include <pugixml.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace feedcraft {

// The part of a qualified name after the first ':' (the whole name if none).
[[nodiscard]] std::string_view localName(std::string_view qualified) noexcept;

// First immediate element child of node whose local name is name.
// Returns a null node if there is none. Does not descend.
[[nodiscard]] pugi::xml_node firstChild(pugi::xml_node node, std::string_view name);

// All immediate element children of node with local name name, in document order.
[[nodiscard]] std::vector<pugi::xml_node> childrenNamed(pugi::xml_node node, std::string_view name);

// First element below node (depth-first, pre-order) with local name name.
[[nodiscard]] pugi::xml_node findElement(pugi::xml_node node, std::string_view name);

// Trimmed text of an element: the lone text/CDATA child if that is all it
// holds, otherwise the concatenated text of every descendant.
// std::nullopt for a null node or when nothing but whitespace remains.
[[nodiscard]] std::optional<std::string> text(pugi::xml_node node);

// Trimmed value of attribute name. std::nullopt when the attribute is
// absent, blank, or given more than once on the element.
[[nodiscard]] std::optional<std::string> attribute(pugi::xml_node node, std::string_view name);

} // namespace feedcraft
