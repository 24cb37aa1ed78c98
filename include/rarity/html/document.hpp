#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "rarity/core/errors.hpp"

// libxml2 handles, forward-declared so that users of the navigator do not
// pull libxml headers in.
struct _xmlDoc;
struct _xmlNode;

namespace rarity::html {

// Tag plus an optional attribute constraint. For "class" the value matches any
// whitespace-separated class token; other attributes must match exactly.
struct Selector {
    const char* tag{nullptr};
    const char* attribute{nullptr};
    const char* value{nullptr};
};

// Non-owning view of an element. Valid only while its Document is alive.
class Node {
public:
    Node() noexcept = default;
    explicit Node(_xmlNode* n) noexcept : node_(n) {}

    [[nodiscard]] std::string_view tag() const noexcept;

    // Value of the first direct text child. Element children are skipped, not
    // descended into: <h2><span>A</span> B</h2> yields " B". Html/NotFound if
    // the element has no direct text child.
    [[nodiscard]] rarity::core::Status first_text(std::string* out) const noexcept;

    // Html/NotFound if the attribute is absent.
    [[nodiscard]] rarity::core::Status attribute(const char* name, std::string* out) const noexcept;

    [[nodiscard]] bool matches(const Selector& sel) const noexcept;

private:
    _xmlNode* node_{nullptr};
};

class Document {
public:
    Document() noexcept;
    ~Document();

    Document(Document&&) noexcept;
    Document& operator=(Document&&) noexcept;
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    // Parses html leniently (libxml2 recovery mode). On failure *out is still
    // assigned, in a failed state whose queries report Html/Malformed.
    [[nodiscard]] static rarity::core::Status parse(std::string_view html, Document* out) noexcept;

    [[nodiscard]] bool parsed() const noexcept { return doc_ != nullptr; }

    // First match in document order.
    // Html/NotFound on no match, Html/Malformed if the document failed to parse.
    [[nodiscard]] rarity::core::Status find_one(const Selector& sel, Node* out) const noexcept;

    // Every match in document order. An empty result is Ok.
    [[nodiscard]] rarity::core::Status find_all(const Selector& sel, std::vector<Node>* out) const noexcept;

private:
    struct DocFree {
        void operator()(_xmlDoc* doc) const noexcept;
    };

    // Stops at the first match when first_only is set.
    rarity::core::Status walk(const Selector& sel, bool first_only, std::vector<Node>* out) const noexcept;

    std::unique_ptr<_xmlDoc, DocFree> doc_;
};

} // namespace rarity::html
