// html_canonicalizer.cpp - HTML canonical form via libxml2's HTML parser

#include <semdiff/html_canonicalizer.h>
#include <semdiff/diagnostics.h>

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlmemory.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace semdiff {

namespace {

using DocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

void ensure_parser_initialized()
{
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

std::string_view as_view(const xmlChar* s)
{
    return s ? std::string_view(reinterpret_cast<const char*>(s)) : std::string_view{};
}

/// Whitespace runs become one space; leading and trailing whitespace removed
std::string collapse_whitespace(std::string_view text)
{
    std::vector<std::string> words;
    auto trimmed = boost::algorithm::trim_copy(std::string(text));
    if (trimmed.empty()) return {};
    boost::algorithm::split(words, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    return boost::algorithm::join(words, " ");
}

std::string escape(std::string_view text, bool in_attribute)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"':
                out += in_attribute ? "&quot;" : "\"";
                break;
            default:
                out += c;
        }
    }
    return out;
}

std::string attribute_value(xmlDoc* doc, xmlAttr* attr)
{
    if (!attr->children) return {};

    xmlChar* raw = xmlNodeListGetString(doc, attr->children, 1);
    std::string value(as_view(raw));
    xmlFree(raw);
    return value;
}

class HtmlWriter {
public:
    explicit HtmlWriter(xmlDoc* doc) : doc_(doc) {}

    void write_siblings(xmlNode* first, int level)
    {
        for (xmlNode* node = first; node; node = node->next) {
            write(node, level);
        }
    }

    [[nodiscard]] std::string result() const { return boost::algorithm::trim_copy(out_); }

private:
    xmlDoc* doc_;
    std::string out_;

    void indent(int level) { out_.append(static_cast<std::size_t>(level) * 2, ' '); }

    void write(xmlNode* node, int level)
    {
        switch (node->type) {
            case XML_ELEMENT_NODE:
                write_element(node, level);
                break;

            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE: {
                auto line = collapse_whitespace(as_view(node->content));
                if (line.empty()) break;
                indent(level);
                out_ += escape(line, false);
                out_ += '\n';
                break;
            }

            default:
                // Comments, DTD, processing instructions
                break;
        }
    }

    void write_element(xmlNode* node, int level)
    {
        std::string_view name = as_view(node->name);

        std::vector<std::pair<std::string, std::string>> attributes;
        for (xmlAttr* attr = node->properties; attr; attr = attr->next) {
            attributes.emplace_back(std::string(as_view(attr->name)),
                                    collapse_whitespace(attribute_value(doc_, attr)));
        }
        std::stable_sort(attributes.begin(), attributes.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });

        indent(level);
        out_ += '<';
        out_ += name;
        for (const auto& [attr_name, attr_value] : attributes) {
            out_ += ' ';
            out_ += attr_name;
            out_ += "=\"";
            out_ += escape(attr_value, true);
            out_ += '"';
        }
        out_ += ">\n";

        write_siblings(node->children, level + 1);

        indent(level);
        out_ += "</";
        out_ += name;
        out_ += ">\n";
    }
};

bool is_full_document(std::string_view html)
{
    auto head = boost::algorithm::trim_left_copy(std::string(html.substr(0, 64)));
    return boost::algorithm::istarts_with(head, "<!doctype") ||
           boost::algorithm::istarts_with(head, "<html");
}

xmlNode* find_child_element(xmlNode* parent, std::string_view name)
{
    if (!parent) return nullptr;
    for (xmlNode* child = parent->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE && as_view(child->name) == name) return child;
    }
    return nullptr;
}

} // anonymous namespace

std::string canonicalize_html(std::string_view html)
{
    ensure_parser_initialized();

    const bool full_document = is_full_document(html);
    std::string source = full_document
        ? std::string(html)
        : "<html><body>" + std::string(html) + "</body></html>";

    DocPtr doc(htmlReadMemory(source.data(), static_cast<int>(source.size()), nullptr, "UTF-8",
                              HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET),
               &xmlFreeDoc);
    if (!doc) {
        detail::log_access_error("canonicalize_html", "libxml2 could not parse the document");
        return {};
    }

    HtmlWriter writer(doc.get());
    if (full_document) {
        writer.write_siblings(doc->children, 0);
    } else if (xmlNode* body = find_child_element(xmlDocGetRootElement(doc.get()), "body")) {
        writer.write_siblings(body->children, 0);
    }
    return writer.result();
}

} // namespace semdiff
