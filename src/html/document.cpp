#include "rarity/html/document.hpp"

#include <climits>
#include <cstring>
#include <mutex>

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

namespace rarity::html {

using namespace rarity::core;

namespace {
    std::once_flag g_xml_init;

    constexpr int kParseOptions = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;

    [[nodiscard]] bool is_space(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
    }

    [[nodiscard]] bool ascii_iequals(const char* a, const char* b) noexcept {
        if (a == nullptr || b == nullptr) {
            return false;
        }
        for (; *a != '\0' && *b != '\0'; ++a, ++b) {
            char ca = *a;
            char cb = *b;
            if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
            if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
            if (ca != cb) {
                return false;
            }
        }
        return *a == '\0' && *b == '\0';
    }

    [[nodiscard]] bool has_class_token(const char* classes, const char* want) noexcept {
        const size_t want_len = std::strlen(want);
        if (want_len == 0) {
            return false;
        }
        const char* p = classes;
        while (*p != '\0') {
            while (*p != '\0' && is_space(*p)) {
                ++p;
            }
            const char* start = p;
            while (*p != '\0' && !is_space(*p)) {
                ++p;
            }
            if (static_cast<size_t>(p - start) == want_len && std::memcmp(start, want, want_len) == 0) {
                return true;
            }
        }
        return false;
    }
} // namespace

// ========================================================================
// Node
// ========================================================================

std::string_view Node::tag() const noexcept {
    if (node_ == nullptr || node_->name == nullptr) {
        return {};
    }
    return std::string_view(reinterpret_cast<const char*>(node_->name));
}

Status Node::first_text(std::string* out) const noexcept {
    if (out == nullptr || node_ == nullptr) {
        return make_status(StatusDomain::Html, StatusCode::Invalid);
    }

    for (xmlNode* child = node_->children; child != nullptr; child = child->next) {
        if (child->type != XML_TEXT_NODE && child->type != XML_CDATA_SECTION_NODE) {
            continue;
        }
        if (child->content == nullptr) {
            out->clear();
        } else {
            out->assign(reinterpret_cast<const char*>(child->content));
        }
        return ok_status();
    }
    return make_status(StatusDomain::Html, StatusCode::NotFound);
}

Status Node::attribute(const char* name, std::string* out) const noexcept {
    if (out == nullptr || name == nullptr || node_ == nullptr) {
        return make_status(StatusDomain::Html, StatusCode::Invalid);
    }

    xmlChar* value = xmlGetProp(node_, reinterpret_cast<const xmlChar*>(name));
    if (value == nullptr) {
        return make_status(StatusDomain::Html, StatusCode::NotFound);
    }
    out->assign(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return ok_status();
}

bool Node::matches(const Selector& sel) const noexcept {
    if (node_ == nullptr || node_->type != XML_ELEMENT_NODE || sel.tag == nullptr) {
        return false;
    }
    if (!ascii_iequals(reinterpret_cast<const char*>(node_->name), sel.tag)) {
        return false;
    }
    if (sel.attribute == nullptr) {
        return true;
    }

    xmlChar* raw = xmlGetProp(node_, reinterpret_cast<const xmlChar*>(sel.attribute));
    if (raw == nullptr) {
        return false;
    }
    const char* value = reinterpret_cast<const char*>(raw);
    bool ok = false;
    if (sel.value == nullptr) {
        ok = true;
    } else if (ascii_iequals(sel.attribute, "class")) {
        ok = has_class_token(value, sel.value);
    } else {
        ok = std::strcmp(value, sel.value) == 0;
    }
    xmlFree(raw);
    return ok;
}

// ========================================================================
// Document
// ========================================================================

void Document::DocFree::operator()(_xmlDoc* doc) const noexcept {
    if (doc != nullptr) {
        xmlFreeDoc(doc);
    }
}

Document::Document() noexcept = default;
Document::~Document() = default;
Document::Document(Document&&) noexcept = default;
Document& Document::operator=(Document&&) noexcept = default;

Status Document::parse(std::string_view html, Document* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Html, StatusCode::Invalid);
    }
    out->doc_.reset();

    std::call_once(g_xml_init, [] { xmlInitParser(); });

    if (html.empty() || html.size() > static_cast<size_t>(INT_MAX)) {
        return make_status(StatusDomain::Html, StatusCode::Malformed);
    }

    htmlDocPtr doc = htmlReadMemory(html.data(), static_cast<int>(html.size()), nullptr, "UTF-8", kParseOptions);
    if (doc == nullptr) {
        return make_status(StatusDomain::Html, StatusCode::Malformed);
    }
    if (xmlDocGetRootElement(doc) == nullptr) {
        xmlFreeDoc(doc);
        return make_status(StatusDomain::Html, StatusCode::Malformed);
    }

    out->doc_.reset(doc);
    return ok_status();
}

Status Document::walk(const Selector& sel, bool first_only, std::vector<Node>* out) const noexcept {
    if (!doc_) {
        return make_status(StatusDomain::Html, StatusCode::Malformed);
    }

    // Iterative pre-order walk; pages are untrusted and may nest deeply.
    std::vector<xmlNode*> stack;
    for (xmlNode* n = doc_->last; n != nullptr; n = n->prev) {
        stack.push_back(n);
    }
    while (!stack.empty()) {
        xmlNode* n = stack.back();
        stack.pop_back();

        if (n->type != XML_ELEMENT_NODE) {
            continue;
        }
        const Node node(n);
        if (node.matches(sel)) {
            out->push_back(node);
            if (first_only) {
                return ok_status();
            }
        }
        for (xmlNode* c = n->last; c != nullptr; c = c->prev) {
            stack.push_back(c);
        }
    }
    return ok_status();
}

Status Document::find_one(const Selector& sel, Node* out) const noexcept {
    if (out == nullptr || sel.tag == nullptr) {
        return make_status(StatusDomain::Html, StatusCode::Invalid);
    }

    std::vector<Node> found;
    const Status s = walk(sel, true, &found);
    if (!is_ok(s)) {
        return s;
    }
    if (found.empty()) {
        return make_status(StatusDomain::Html, StatusCode::NotFound);
    }
    *out = found.front();
    return ok_status();
}

Status Document::find_all(const Selector& sel, std::vector<Node>* out) const noexcept {
    if (out == nullptr || sel.tag == nullptr) {
        return make_status(StatusDomain::Html, StatusCode::Invalid);
    }
    out->clear();
    return walk(sel, false, out);
}

} // namespace rarity::html
