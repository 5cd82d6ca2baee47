#include "html_document.hpp"

#include "errors.hpp"

#include <cctype>
#include <fstream>
#include <memory>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
  return s.substr(a, b - a);
}

bool tagIn(const GumboNode* node, std::initializer_list<GumboTag> tags) {
  if (node->type != GUMBO_NODE_ELEMENT) return false;
  for (GumboTag t : tags) {
    if (node->v.element.tag == t) return true;
  }
  return false;
}

void collectText(const GumboNode* node, std::string& out) {
  if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA ||
      node->type == GUMBO_NODE_WHITESPACE) {
    std::string piece = trim(node->v.text.text);
    if (piece.empty()) return;
    if (!out.empty()) out.push_back(' ');
    out += piece;
    return;
  }
  if (node->type != GUMBO_NODE_ELEMENT) return;
  if (node->v.element.tag == GUMBO_TAG_SCRIPT || node->v.element.tag == GUMBO_TAG_STYLE) return;

  const GumboVector& children = node->v.element.children;
  for (unsigned i = 0; i < children.length; ++i) {
    collectText(static_cast<const GumboNode*>(children.data[i]), out);
  }
}

// Pre-order walk with an explicit stack; malformed pages can nest deeply.
template <typename Fn>
void forEachElement(const GumboNode* root, Fn&& fn) {
  std::vector<const GumboNode*> stack{root};
  while (!stack.empty()) {
    const GumboNode* node = stack.back();
    stack.pop_back();
    if (node->type != GUMBO_NODE_ELEMENT) continue;
    fn(node);
    const GumboVector& children = node->v.element.children;
    for (unsigned i = children.length; i > 0; --i) {
      stack.push_back(static_cast<const GumboNode*>(children.data[i - 1]));
    }
  }
}

} // namespace

HtmlDocument::HtmlDocument(std::string html)
  : source_(std::move(html)),
    output_(gumbo_parse_with_options(&kGumboDefaultOptions, source_.data(), source_.size())) {
  if (!output_) throw ExtractionError("gumbo failed to parse document");
  forEachElement(output_->root, [this](const GumboNode* node) {
    index_.emplace(node, elements_.size());
    elements_.push_back(node);
  });
}

HtmlDocument::~HtmlDocument() {
  gumbo_destroy_output(&kGumboDefaultOptions, output_);
}

size_t HtmlDocument::indexOf(const GumboNode* node) const {
  auto it = index_.find(node);
  return it == index_.end() ? npos : it->second;
}

std::vector<const GumboNode*> HtmlDocument::findAll(std::initializer_list<GumboTag> tags) const {
  std::vector<const GumboNode*> out;
  for (const GumboNode* node : elements_) {
    if (tagIn(node, tags)) out.push_back(node);
  }
  return out;
}

bool hasTag(const GumboNode* node, GumboTag tag) {
  return node && node->type == GUMBO_NODE_ELEMENT && node->v.element.tag == tag;
}

bool isHeading(const GumboNode* node) {
  return node && tagIn(node, {GUMBO_TAG_H1, GUMBO_TAG_H2, GUMBO_TAG_H3, GUMBO_TAG_H4});
}

std::string nodeText(const GumboNode* node) {
  std::string out;
  if (node) collectText(node, out);
  return out;
}

std::vector<const GumboNode*> descendantsWithTag(const GumboNode* node,
                                                 std::initializer_list<GumboTag> tags) {
  std::vector<const GumboNode*> out;
  forEachElement(node, [&](const GumboNode* n) {
    if (n != node && tagIn(n, tags)) out.push_back(n);
  });
  return out;
}

const GumboNode* firstDescendant(const GumboNode* node, GumboTag tag) {
  auto found = descendantsWithTag(node, {tag});
  return found.empty() ? nullptr : found.front();
}

const char* attributeValue(const GumboNode* node, const char* name) {
  if (!node || node->type != GUMBO_NODE_ELEMENT) return nullptr;
  const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
  return attr ? attr->value : nullptr;
}

std::string readTextFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) throw NotFoundError(path.string());
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

DocumentBits extractHtmlBits(std::string html, const Limits& limits) {
  auto doc = std::make_shared<const HtmlDocument>(std::move(html));
  DocumentBits bits;

  auto titles = doc->findAll({GUMBO_TAG_TITLE});
  if (!titles.empty()) bits.title = nodeText(titles.front());

  // One pass per heading level: all h1 first, then h2, and so on.
  for (GumboTag level : {GUMBO_TAG_H1, GUMBO_TAG_H2, GUMBO_TAG_H3, GUMBO_TAG_H4}) {
    for (const GumboNode* h : doc->findAll({level})) {
      std::string text = nodeText(h);
      if (!text.empty()) bits.headings.push_back(std::move(text));
    }
  }

  for (const GumboNode* meta : doc->findAll({GUMBO_TAG_META})) {
    const char* value = attributeValue(meta, "content");
    if (!value || !*value) value = attributeValue(meta, "name");
    if (value && *value) bits.metadata.push_back(trim(value));
  }

  auto paragraphs = doc->findAll({GUMBO_TAG_P});
  if (paragraphs.size() > limits.maxBodyParagraphs) paragraphs.resize(limits.maxBodyParagraphs);
  for (size_t i = 0; i < paragraphs.size(); ++i) {
    if (i > 0) bits.body += ' ';
    bits.body += nodeText(paragraphs[i]);
  }

  bits.tree = std::move(doc);
  return bits;
}
