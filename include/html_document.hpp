#pragma once

#include "config.hpp"
#include "document.hpp"

#include <gumbo.h>

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

// Owns a gumbo parse tree and a linear (document-order) view of its elements.
class HtmlDocument {
public:
  explicit HtmlDocument(std::string html);
  ~HtmlDocument();

  HtmlDocument(const HtmlDocument&) = delete;
  HtmlDocument& operator=(const HtmlDocument&) = delete;

  const std::vector<const GumboNode*>& elements() const { return elements_; }

  // Position of an element in elements(), or npos.
  size_t indexOf(const GumboNode* node) const;

  // Elements carrying any of the tags, in document order.
  std::vector<const GumboNode*> findAll(std::initializer_list<GumboTag> tags) const;

  static constexpr size_t npos = static_cast<size_t>(-1);

private:
  std::string source_;
  GumboOutput* output_;
  std::vector<const GumboNode*> elements_;
  std::unordered_map<const GumboNode*, size_t> index_;
};

// Forward iteration over a linear node order that stops after maxSteps
// advances or at the end of the sequence, whichever comes first.
template <typename Node>
class BoundedForwardWalk {
public:
  BoundedForwardWalk(const std::vector<Node>& order, size_t start, size_t maxSteps)
    : order_(order), pos_(start), maxSteps_(maxSteps) {}

  bool next(Node& out) {
    if (steps_ >= maxSteps_ || pos_ + 1 >= order_.size()) return false;
    ++steps_;
    out = order_[++pos_];
    return true;
  }

  size_t steps() const { return steps_; }

private:
  const std::vector<Node>& order_;
  size_t pos_;
  size_t maxSteps_;
  size_t steps_ = 0;
};

bool hasTag(const GumboNode* node, GumboTag tag);
bool isHeading(const GumboNode* node);

// Visible text of a subtree: each text fragment trimmed, empty fragments
// dropped, the rest joined by single spaces. Script and style are skipped.
std::string nodeText(const GumboNode* node);

// Descendant elements (not the node itself) carrying any of the tags.
std::vector<const GumboNode*> descendantsWithTag(const GumboNode* node,
                                                 std::initializer_list<GumboTag> tags);

// First descendant with the tag, or nullptr.
const GumboNode* firstDescendant(const GumboNode* node, GumboTag tag);

// Attribute value, or nullptr when the node has no such attribute.
const char* attributeValue(const GumboNode* node, const char* name);

std::string readTextFile(const std::filesystem::path& path);

DocumentBits extractHtmlBits(std::string html, const Limits& limits);
