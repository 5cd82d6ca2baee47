#include "identifier.hpp"

#include "errors.hpp"
#include "extractor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_map>
#include <utility>

namespace {

std::vector<std::string> cellTexts(const GumboNode* row) {
  std::vector<std::string> cells;
  for (const GumboNode* cell : descendantsWithTag(row, {GUMBO_TAG_TH, GUMBO_TAG_TD})) {
    cells.push_back(nodeText(cell));
  }
  return cells;
}

bool hasDigit(const std::string& s) {
  return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool hasAlpha(const std::string& s) {
  return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isalpha(c); });
}

constexpr size_t kMinVendorKeyLength = 10;
// Longest whitespace-free word the vendor literal pattern is run on.
constexpr size_t kMaxPatternWord = 256;

bool isWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isUpperAlnum(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool wordBoundaryAt(const std::string& text, size_t pos) {
  bool before = pos > 0 && isWordChar(text[pos - 1]);
  bool after = pos < text.size() && isWordChar(text[pos]);
  return before != after;
}

// Occurrences of `\b<word>[0-9]*\b`, longest digit suffix that still ends on a
// boundary.
std::vector<std::string> keywordWithDigits(const std::string& text, const std::string& word) {
  std::vector<std::string> out;
  if (word.empty()) return out;
  size_t pos = text.find(word);
  while (pos != std::string::npos) {
    size_t next = pos + 1;
    if (wordBoundaryAt(text, pos)) {
      size_t stem = pos + word.size();
      size_t runEnd = stem;
      while (runEnd < text.size() && std::isdigit(static_cast<unsigned char>(text[runEnd]))) runEnd++;
      size_t end = runEnd;
      while (end > stem && !wordBoundaryAt(text, end)) end--;
      if (wordBoundaryAt(text, end)) {
        out.push_back(text.substr(pos, end - pos));
        next = std::max(end, pos + 1);
      }
    }
    pos = text.find(word, next);
  }
  return out;
}

// Maximal `[A-Z0-9]{10,}` runs bounded by non-word characters.
std::vector<std::string> longAlnumRuns(const std::string& text) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos < text.size()) {
    if (!isUpperAlnum(text[pos]) || !wordBoundaryAt(text, pos)) {
      pos++;
      continue;
    }
    size_t end = pos;
    while (end < text.size() && isUpperAlnum(text[end])) end++;
    if (end - pos >= kMinVendorKeyLength && wordBoundaryAt(text, end)) {
      out.push_back(text.substr(pos, end - pos));
    }
    pos = end;
  }
  return out;
}

// Whitespace-separated words of text.
std::vector<std::string> splitWords(const std::string& text) {
  std::vector<std::string> words;
  size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) pos++;
    size_t end = pos;
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) end++;
    if (end > pos) words.push_back(text.substr(pos, end - pos));
    pos = end;
  }
  return words;
}

bool identifierShaped(const std::string& name) {
  static const std::regex re("^[A-Z][A-Z0-9\\-.]{3,}$");
  return std::regex_match(name, re) && hasDigit(name);
}

} // namespace

std::regex orderingPattern(const Vocabulary& vocab) {
  return std::regex(vocab.orderingHeaderPattern, std::regex::icase);
}

std::vector<std::string> scoreParts(const DocumentBits& bits, const PartClassifier& classifier) {
  std::vector<std::string> pool = classifier.candidates(scoringText(bits));
  if (pool.empty()) return {};

  std::vector<std::pair<std::string, int>> freq;
  std::unordered_map<std::string, size_t> slot;
  for (auto& tok : pool) {
    auto it = slot.find(tok);
    if (it != slot.end()) {
      freq[it->second].second++;
      continue;
    }
    slot.emplace(tok, freq.size());
    freq.emplace_back(std::move(tok), 1);
  }

  std::string headings;
  for (size_t i = 0; i < bits.headings.size(); ++i) {
    if (i > 0) headings += " \n ";
    headings += bits.headings[i];
  }

  std::vector<std::pair<int, std::string>> scores;
  scores.reserve(freq.size());
  for (const auto& entry : freq) {
    int s = entry.second;
    if (bits.title.find(entry.first) != std::string::npos) s += 5;
    if (headings.find(entry.first) != std::string::npos) s += 3;
    scores.emplace_back(s, entry.first);
  }
  std::sort(scores.begin(), scores.end(), [](const auto& a, const auto& b) {
    if (a.first != b.first) return a.first > b.first;
    return a.second > b.second;
  });

  std::vector<std::string> out;
  out.reserve(scores.size());
  for (auto& s : scores) out.push_back(std::move(s.second));
  return out;
}

std::vector<std::string> findPackages(const DocumentBits& bits, const Vocabulary& vocab) {
  const std::string text = patternText(bits);
  std::set<std::string> pkgs;

  for (const auto& word : vocab.packageKeywords) {
    for (auto& pkg : keywordWithDigits(text, word)) pkgs.insert(std::move(pkg));
  }

  static const std::regex generic("\\b([A-Z]{2,5}[0-9]{2,4})\\b");
  for (auto it = std::sregex_iterator(text.begin(), text.end(), generic); it != std::sregex_iterator(); ++it) {
    std::string tok = (*it)[1].str();
    bool allowed = std::any_of(vocab.packagePrefixes.begin(), vocab.packagePrefixes.end(),
                               [&](const std::string& p) { return tok.compare(0, p.size(), p) == 0; });
    if (allowed) pkgs.insert(tok);
  }

  return std::vector<std::string>(pkgs.begin(), pkgs.end());
}

std::vector<std::string> partsFromOrderingSections(const HtmlDocument& doc,
                                                   const PartClassifier& classifier,
                                                   const std::regex& orderingRe,
                                                   size_t maxSteps) {
  CandidateList parts;
  const auto& order = doc.elements();
  for (const GumboNode* heading : doc.findAll({GUMBO_TAG_H1, GUMBO_TAG_H2, GUMBO_TAG_H3, GUMBO_TAG_H4})) {
    if (!std::regex_search(nodeText(heading), orderingRe)) continue;

    BoundedForwardWalk<const GumboNode*> walk(order, doc.indexOf(heading), maxSteps);
    const GumboNode* node = nullptr;
    while (walk.next(node)) {
      classifier.collectNew(nodeText(node), parts);
    }
  }
  return parts.items();
}

bool OrderingTableSignals::anyHeaderFlag() const {
  return std::find(headerFlags.begin(), headerFlags.end(), true) != headerFlags.end();
}

std::vector<size_t> OrderingTableSignals::scanColumns(size_t columnCount) const {
  std::vector<size_t> cols;
  if (anyHeaderFlag()) {
    for (size_t i = 0; i < headerFlags.size(); ++i) {
      if (headerFlags[i]) cols.push_back(i);
    }
    return cols;
  }
  for (size_t i = 0; i < columnCount; ++i) cols.push_back(i);
  return cols;
}

OrderingTableSignals orderingSignals(const HtmlDocument& doc, const GumboNode* table,
                                     const std::regex& orderingRe) {
  OrderingTableSignals signals;

  if (const GumboNode* thead = firstDescendant(table, GUMBO_TAG_THEAD)) {
    if (const GumboNode* first = firstDescendant(thead, GUMBO_TAG_TR)) signals.headers = cellTexts(first);
  }
  if (signals.headers.empty()) {
    if (const GumboNode* first = firstDescendant(table, GUMBO_TAG_TR)) signals.headers = cellTexts(first);
  }
  for (const auto& h : signals.headers) signals.headerFlags.push_back(std::regex_search(h, orderingRe));

  if (const GumboNode* caption = firstDescendant(table, GUMBO_TAG_CAPTION)) {
    signals.captionMatches = std::regex_search(nodeText(caption), orderingRe);
  }

  size_t idx = doc.indexOf(table);
  const auto& order = doc.elements();
  for (size_t i = idx; i != HtmlDocument::npos && i > 0; --i) {
    if (isHeading(order[i - 1])) {
      signals.precedingHeadingMatches = std::regex_search(nodeText(order[i - 1]), orderingRe);
      break;
    }
  }
  return signals;
}

std::vector<std::string> partsFromHtmlTables(const HtmlDocument& doc,
                                             const PartClassifier& classifier,
                                             const std::regex& orderingRe) {
  CandidateList parts;
  for (const GumboNode* table : doc.findAll({GUMBO_TAG_TABLE})) {
    OrderingTableSignals signals = orderingSignals(doc, table, orderingRe);
    spdlog::trace("table at element {}: ordering relevant={}", doc.indexOf(table), signals.relevant());

    auto rows = descendantsWithTag(table, {GUMBO_TAG_TR});
    for (size_t r = 1; r < rows.size(); ++r) {
      std::vector<std::string> cells = cellTexts(rows[r]);
      for (size_t col : signals.scanColumns(cells.size())) {
        if (col >= cells.size()) continue;
        classifier.collectNew(cells[col], parts);
      }
    }
  }
  return parts.items();
}

std::vector<std::string> partsFromPageTables(const std::vector<PageTable>& tables,
                                             const PartClassifier& classifier,
                                             const std::regex& orderingRe) {
  CandidateList parts;
  for (const auto& table : tables) {
    if (table.cells.empty()) continue;
    OrderingTableSignals signals;
    signals.headers = table.cells.front();
    for (const auto& h : signals.headers) signals.headerFlags.push_back(std::regex_search(h, orderingRe));

    for (size_t r = 1; r < table.cells.size(); ++r) {
      const auto& row = table.cells[r];
      for (size_t col : signals.scanColumns(row.size())) {
        if (col >= row.size()) continue;
        classifier.collectNew(row[col], parts);
      }
    }
  }
  return parts.items();
}

std::vector<std::string> extractVendorCodes(const std::string& text, const Vocabulary& vocab) {
  CandidateList out;

  std::regex literal(vocab.vendorLiteralPattern);
  for (const auto& word : splitWords(text)) {
    if (word.size() > kMaxPatternWord) continue;
    for (auto it = std::sregex_iterator(word.begin(), word.end(), literal); it != std::sregex_iterator(); ++it) {
      out.add(it->size() > 1 && (*it)[1].matched ? (*it)[1].str() : it->str());
    }
  }

  // concatenated/vendor keys
  for (const auto& tok : longAlnumRuns(text)) {
    if (hasDigit(tok) && hasAlpha(tok)) out.add(tok);
  }
  return out.items();
}

std::vector<std::string> pathCandidates(const std::filesystem::path& path, const Vocabulary& vocab) {
  std::vector<std::string> parts;
  std::filesystem::path comp = path.parent_path();
  for (int depth = 0; depth < 3; ++depth) {
    std::string name = comp.filename().string();
    if (!name.empty() && !vocab.formatReject.count(name) && identifierShaped(name)) {
      parts.push_back(name);
    }
    comp = comp.parent_path();
  }
  std::string stem = path.stem().string();
  if (identifierShaped(stem) && std::find(parts.begin(), parts.end(), stem) == parts.end()) {
    parts.push_back(stem);
  }
  return parts;
}

std::vector<std::string> mergeCandidates(const std::vector<std::vector<std::string>>& sources,
                                         size_t cap) {
  CandidateList merged;
  for (const auto& source : sources) merged.addAll(source);
  std::vector<std::string> out = merged.items();
  if (out.size() > cap) out.resize(cap);
  return out;
}

std::optional<std::string> deriveFamilyPrefix(const std::vector<std::string>& candidates) {
  if (candidates.empty()) return std::nullopt;
  std::string prefix;
  for (char c : candidates.front()) {
    if (!std::isalpha(static_cast<unsigned char>(c))) break;
    prefix.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  if (prefix.empty()) return std::nullopt;
  return prefix;
}

IdentifyResult identifyFile(const std::filesystem::path& path, const Config& config) {
  if (!std::filesystem::exists(path)) throw NotFoundError(path.string());
  DocumentKind kind = documentKindFor(path);
  if (kind == DocumentKind::Unsupported) throw UnsupportedFormatError(path.string());

  const Vocabulary& vocab = config.vocabulary;
  const Limits& limits = config.limits;
  PartClassifier classifier(vocab);
  std::regex orderingRe = orderingPattern(vocab);

  DocumentBits bits;
  std::vector<std::string> tableParts;
  std::vector<std::string> sectionParts;
  if (kind == DocumentKind::Markup) {
    bits = extractHtmlBits(readTextFile(path), limits);
    tableParts = partsFromHtmlTables(*bits.tree, classifier, orderingRe);
    sectionParts = partsFromOrderingSections(*bits.tree, classifier, orderingRe, limits.maxOrderingSteps);
  } else {
    bits = extractPdfBits(path.string(), limits);
    try {
      auto tables = extractTablesFromPdf(path.string(), 1, limits.maxPdfPages);
      tableParts = partsFromPageTables(tables, classifier, orderingRe);
    } catch (const std::exception& ex) {
      spdlog::warn("{}: table pass skipped: {}", path.string(), ex.what());
    }
  }

  std::vector<std::string> pathParts = pathCandidates(path, vocab);
  std::vector<std::string> vendorCodes = extractVendorCodes(patternText(bits), vocab);
  std::vector<std::string> textParts = scoreParts(bits, classifier);
  spdlog::debug("{}: path={} table={} section={} vendor={} text={}", path.string(), pathParts.size(),
                tableParts.size(), sectionParts.size(), vendorCodes.size(), textParts.size());

  IdentifyResult result;
  result.candidates = mergeCandidates({pathParts, tableParts, sectionParts, vendorCodes, textParts},
                                      limits.maxCandidates);
  if (!result.candidates.empty()) result.primaryIdentifier = result.candidates.front();
  result.packages = findPackages(bits, vocab);
  if (result.packages.size() > limits.maxPackages) result.packages.resize(limits.maxPackages);
  return result;
}
