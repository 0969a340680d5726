#include "converter.hpp"
#include <gumbo.h>
#include <string>
#include <vector>
#include "string_utils.hpp"

namespace Trawl {
namespace Utils {
namespace Text {

namespace {

void collect_text(const GumboNode* node, std::string& out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE
        || node->type == GUMBO_NODE_CDATA) {
        out.append(node->v.text.text);
        out.push_back(' ');
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    GumboTag tag = node->v.element.tag;
    if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT
        || tag == GUMBO_TAG_TEMPLATE)
        return;

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_text(static_cast<const GumboNode*>(children->data[i]), out);
    }
}

void collect_links(const GumboNode* node, ExtractedPage& page) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    if (node->v.element.tag == GUMBO_TAG_A) {
        GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href) {
            std::string link = trim(href->value);
            if (!link.empty()) {
                page.links.push_back(link);
                if (page.anchor_texts.count(link) == 0) {
                    std::string text;
                    collect_text(node, text);
                    page.anchor_texts[link] = collapse_whitespace(text);
                }
            }
        }
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_links(static_cast<const GumboNode*>(children->data[i]), page);
    }
}

}  // namespace

ExtractedPage Converter::extract(const std::string& html) {
    ExtractedPage page;
    if (html.empty())
        return page;

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    collect_links(output->root, page);

    std::string text;
    collect_text(output->root, text);
    page.text = collapse_whitespace(text);

    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return page;
}

std::vector<std::string> Converter::extract_links(const std::string& html) {
    return extract(html).links;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Trawl
