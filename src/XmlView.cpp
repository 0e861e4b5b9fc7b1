// XmlView.cpp – Local-name based traversal helpers over pugixml nodes.

#include "FeedCraft/XmlView.hpp"
#include "TextUtil.hpp"

namespace feedcraft {

static bool hasLocalName(pugi::xml_node node, std::string_view name) {
    return node.type() == pugi::node_element && localName(node.name()) == name;
}

static bool isTextNode(pugi::xml_node node) {
    return node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata;
}

static void appendDescendantText(pugi::xml_node node, std::string& out) {
    for (pugi::xml_node child : node.children()) {
        if (isTextNode(child))
            out += child.value();
        else if (child.type() == pugi::node_element)
            appendDescendantText(child, out);
    }
}

std::string_view localName(std::string_view qualified) noexcept {
    const size_t colon = qualified.find(':');
    return colon == std::string_view::npos ? qualified : qualified.substr(colon + 1);
}

pugi::xml_node firstChild(pugi::xml_node node, std::string_view name) {
    for (pugi::xml_node child : node.children()) {
        if (hasLocalName(child, name))
            return child;
    }
    return {};
}

std::vector<pugi::xml_node> childrenNamed(pugi::xml_node node, std::string_view name) {
    std::vector<pugi::xml_node> out;
    for (pugi::xml_node child : node.children()) {
        if (hasLocalName(child, name))
            out.push_back(child);
    }
    return out;
}

pugi::xml_node findElement(pugi::xml_node node, std::string_view name) {
    return node.find_node([name](pugi::xml_node n) { return hasLocalName(n, name); });
}

std::optional<std::string> text(pugi::xml_node node) {
    if (!node)
        return std::nullopt;

    std::string raw;
    pugi::xml_node only = node.first_child();
    if (only && !only.next_sibling() && isTextNode(only))
        raw = only.value();
    else
        appendDescendantText(node, raw);

    const std::string_view trimmed = detail::trim(raw);
    if (trimmed.empty())
        return std::nullopt;
    return std::string(trimmed);
}

std::optional<std::string> attribute(pugi::xml_node node, std::string_view name) {
    pugi::xml_attribute found;
    for (pugi::xml_attribute attr : node.attributes()) {
        if (name != attr.name())
            continue;
        if (found)
            return std::nullopt; // multi-valued
        found = attr;
    }
    if (!found)
        return std::nullopt;

    const std::string_view trimmed = detail::trim(found.value());
    if (trimmed.empty())
        return std::nullopt;
    return std::string(trimmed);
}

} // namespace feedcraft
