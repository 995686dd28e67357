#ifndef TRAILSKETCH_COMMON_XML_HPP
#define TRAILSKETCH_COMMON_XML_HPP

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <memory>
#include <optional>
#include <string>

namespace trailsketch {
namespace xml {

struct DocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct CharDeleter {
    void operator()(xmlChar* text) const { xmlFree(text); }
};

using DocPtr = std::unique_ptr<xmlDoc, DocDeleter>;
using CharPtr = std::unique_ptr<xmlChar, CharDeleter>;

// Options for untrusted input: no network access, no stderr chatter
constexpr int kReadOptions = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

inline const xmlChar* as_xml(const char* text) {
    return reinterpret_cast<const xmlChar*>(text);
}

inline std::string element_name(const xmlNode* node) {
    return reinterpret_cast<const char*>(node->name);
}

inline bool has_name(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE && xmlStrcmp(node->name, as_xml(name)) == 0;
}

inline std::optional<std::string> attribute(const xmlNode* node, const char* name) {
    CharPtr value(xmlGetProp(node, as_xml(name)));
    if (!value) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(value.get()));
}

}  // namespace xml
}  // namespace trailsketch

#endif // TRAILSKETCH_COMMON_XML_HPP
