#include "HtmlText.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <climits>
#include <memory>
#include "core/Logger.hpp"
#include "lyrics/LyricsText.hpp"

namespace cal::lyrics::html {

namespace {

struct DocFree {
    void operator()(xmlDoc* doc) const {
        xmlFreeDoc(doc);
    }
};
struct XPathContextFree {
    void operator()(xmlXPathContext* ctx) const {
        xmlXPathFreeContext(ctx);
    }
};
struct XPathObjectFree {
    void operator()(xmlXPathObject* obj) const {
        xmlXPathFreeObject(obj);
    }
};
struct XmlCharFree {
    void operator()(xmlChar* s) const {
        xmlFree(s);
    }
};

using DocPtr = std::unique_ptr<xmlDoc, DocFree>;

// Lyrics sites do not serve valid HTML; parse leniently and quietly
constexpr int kParseOptions = HTML_PARSE_RECOVER | HTML_PARSE_NONET |
                              HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING;

DocPtr parse(std::string_view html) {
    if (html.empty() || html.size() > static_cast<size_t>(INT_MAX))
        return nullptr;
    return DocPtr(htmlReadMemory(html.data(),
                                 static_cast<int>(html.size()),
                                 nullptr,
                                 "utf-8",
                                 kParseOptions));
}

std::vector<xmlNode*> select(xmlDoc* doc, const std::string& xpath) {
    std::vector<xmlNode*> nodes;

    std::unique_ptr<xmlXPathContext, XPathContextFree> ctx(
            xmlXPathNewContext(doc));
    if (!ctx)
        return nodes;

    std::unique_ptr<xmlXPathObject, XPathObjectFree> obj(xmlXPathEvalExpression(
            reinterpret_cast<const xmlChar*>(xpath.c_str()), ctx.get()));
    if (!obj) {
        LOG_WARN("HtmlText: Invalid XPath expression '{}'", xpath);
        return nodes;
    }

    if (obj->nodesetval) {
        for (int i = 0; i < obj->nodesetval->nodeNr; ++i)
            nodes.push_back(obj->nodesetval->nodeTab[i]);
    }
    return nodes;
}

bool isElement(const xmlNode* node, const char* name) {
    return xmlStrcasecmp(node->name, reinterpret_cast<const xmlChar*>(name)) ==
           0;
}

// Source line breaks are whitespace in HTML; NBSP counts as a space
void appendFlowing(std::string& out, const char* s) {
    for (; *s; ++s) {
        unsigned char c = static_cast<unsigned char>(*s);
        if (c == '\n' || c == '\r' || c == '\t') {
            out += ' ';
        } else if (c == 0xC2 && static_cast<unsigned char>(s[1]) == 0xA0) {
            out += ' ';
            ++s;
        } else {
            out += *s;
        }
    }
}

void appendText(const xmlNode* node, std::string& out) {
    for (const xmlNode* cur = node->children; cur; cur = cur->next) {
        switch (cur->type) {
        case XML_TEXT_NODE:
        case XML_CDATA_SECTION_NODE: {
            std::unique_ptr<xmlChar, XmlCharFree> content(
                    xmlNodeGetContent(cur));
            if (content)
                appendFlowing(out, reinterpret_cast<const char*>(content.get()));
            break;
        }
        case XML_ELEMENT_NODE:
            if (isElement(cur, "br"))
                out += '\n';
            else if (!isElement(cur, "script") && !isElement(cur, "style"))
                appendText(cur, out);
            break;
        default:
            break;
        }
    }
}

std::string nodeText(const xmlNode* node) {
    std::string raw;
    appendText(node, raw);

    auto lines = text::splitLines(raw);
    for (auto& line : lines)
        line = text::trim(line);
    return text::joinLines(lines);
}

} // namespace

std::vector<std::string> selectText(std::string_view page,
                                    const std::string& xpath,
                                    const std::string& exclude) {
    std::vector<std::string> blocks;
    DocPtr doc = parse(page);
    if (!doc)
        return blocks;

    if (!exclude.empty()) {
        // Unlink everything before freeing; matches may be nested
        auto dropped = select(doc.get(), exclude);
        for (xmlNode* node : dropped)
            xmlUnlinkNode(node);
        for (xmlNode* node : dropped)
            xmlFreeNode(node);
    }

    for (const xmlNode* node : select(doc.get(), xpath))
        blocks.push_back(nodeText(node));
    return blocks;
}

std::string toText(std::string_view fragment) {
    DocPtr doc = parse(fragment);
    if (!doc)
        return {};

    auto bodies = select(doc.get(), "//body");
    if (bodies.empty())
        return {};
    return nodeText(bodies.front());
}

} // namespace cal::lyrics::html
