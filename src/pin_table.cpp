#include "pin_table.hpp"

#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>

const char* const kDefaultPackageLabel = "DEFAULT_PACKAGE";

namespace {

constexpr int kStrongKeywordScore = 20;
constexpr int kModerateKeywordScore = 10;
constexpr int kPinLikeCellScore = 8;
constexpr size_t kPinLikeSampleRows = 10;
constexpr int kElectricalPenalty = 30;
constexpr int kElectricalThreshold = 2;
constexpr int kRowScoreCap = 40;

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
  return s.substr(a, b - a);
}

std::string lowerAscii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string upperAscii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

bool containsWord(const std::string& haystack, const std::string& word) {
  auto isWordChar = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };
  size_t pos = haystack.find(word);
  while (pos != std::string::npos) {
    bool leftOk = pos == 0 || !isWordChar(haystack[pos - 1]);
    size_t after = pos + word.size();
    bool rightOk = after >= haystack.size() || !isWordChar(haystack[after]);
    if (leftOk && rightOk) return true;
    pos = haystack.find(word, pos + 1);
  }
  return false;
}

bool ruleMatches(const HeaderRule& rule, const std::string& h) {
  if (!rule.exact.empty() && h != rule.exact) return false;
  for (const auto& term : rule.allOf) {
    if (!contains(h, term)) return false;
  }
  for (const auto& term : rule.noneOf) {
    if (contains(h, term)) return false;
  }
  if (rule.anyOf.empty() && rule.anyWord.empty()) return true;
  for (const auto& term : rule.anyOf) {
    if (contains(h, term)) return true;
  }
  for (const auto& term : rule.anyWord) {
    if (containsWord(h, term)) return true;
  }
  return false;
}

int keywordHits(const std::vector<std::string>& headers, const std::vector<std::string>& keywords) {
  int hits = 0;
  for (const auto& h : headers) {
    for (const auto& kw : keywords) {
      if (contains(h, kw)) hits++;
    }
  }
  return hits;
}

bool looksLikePin(const std::string& cell, const Vocabulary& vocab) {
  static const std::regex ballGrid("^[A-Z]\\d+$");
  if (std::all_of(cell.begin(), cell.end(), [](unsigned char c) { return std::isdigit(c); })) return true;
  if (std::regex_match(cell, ballGrid)) return true;
  const std::string upper = upperAscii(cell);
  return std::find(vocab.supplyMnemonics.begin(), vocab.supplyMnemonics.end(), upper) !=
         vocab.supplyMnemonics.end();
}

} // namespace

RawTable canonicalHeaderTable(const Vocabulary& vocab) {
  return RawTable{vocab.canonicalHeaders};
}

std::vector<RawTable> discoverHtmlTables(const HtmlDocument& doc) {
  std::vector<RawTable> tables;
  for (const GumboNode* table : doc.findAll({GUMBO_TAG_TABLE})) {
    RawTable rows;
    for (const GumboNode* tr : descendantsWithTag(table, {GUMBO_TAG_TR})) {
      std::vector<std::string> cells;
      for (const GumboNode* cell : descendantsWithTag(tr, {GUMBO_TAG_TD, GUMBO_TAG_TH})) {
        cells.push_back(nodeText(cell));
      }
      bool any = std::any_of(cells.begin(), cells.end(),
                             [](const std::string& c) { return !trim(c).empty(); });
      if (any) rows.push_back(std::move(cells));
    }
    if (rows.size() >= 2) tables.push_back(padRows(std::move(rows)));
  }
  return tables;
}

std::vector<RawTable> discoverPdfTables(const std::vector<PageTable>& tables) {
  std::vector<RawTable> out;
  for (const auto& table : tables) {
    if (table.cells.size() < 3) continue;
    RawTable clean;
    for (const auto& row : table.cells) {
      if (row.empty()) continue;
      std::vector<std::string> cleanRow;
      int nonEmpty = 0;
      for (const auto& cell : row) {
        cleanRow.push_back(collapseWhitespace(cell));
        if (!cleanRow.back().empty()) nonEmpty++;
      }
      if (nonEmpty >= 2) clean.push_back(std::move(cleanRow));
    }
    if (clean.size() < 3) continue;
    clean = padRows(std::move(clean));
    if (clean.front().size() < 3) continue;
    out.push_back(std::move(clean));
  }
  return out;
}

int headerCountBonus(size_t headerCount, HeaderBonusMode mode) {
  if (mode == HeaderBonusMode::Tiered) {
    if (headerCount >= 6) return 25;
    if (headerCount >= 4) return 15;
    return 0;
  }
  // First match wins, so the >= 6 arm is unreachable.
  if (headerCount >= 4) return 15;
  if (headerCount >= 6) return 25;
  return 0;
}

int scoreTableForPins(const RawTable& table, const Vocabulary& vocab) {
  if (table.size() < 3) return 0;

  std::vector<std::string> headers;
  for (const auto& h : table.front()) headers.push_back(lowerAscii(h));

  int score = 0;
  score += keywordHits(headers, vocab.strongKeywords) * kStrongKeywordScore;
  score += keywordHits(headers, vocab.moderateKeywords) * kModerateKeywordScore;

  size_t sampled = 0;
  int pinLike = 0;
  for (size_t r = 1; r < table.size() && sampled < kPinLikeSampleRows; ++r) {
    if (table[r].empty()) continue;
    std::string cell = trim(table[r][0]);
    if (cell.empty()) continue;
    sampled++;
    if (looksLikePin(cell, vocab)) pinLike++;
  }
  score += pinLike * kPinLikeCellScore;

  if (keywordHits(headers, vocab.electricalKeywords) >= kElectricalThreshold) score -= kElectricalPenalty;

  int dataRows = static_cast<int>(table.size()) - 1;
  score += std::min(dataRows * 2, kRowScoreCap);

  score += headerCountBonus(headers.size(), vocab.headerBonusMode);
  return score;
}

RawTable selectBestTable(const std::vector<RawTable>& tables, const Vocabulary& vocab) {
  const RawTable* best = nullptr;
  int bestScore = 0;
  for (const auto& table : tables) {
    int score = scoreTableForPins(table, vocab);
    spdlog::trace("candidate table {}x{} scored {}", table.size(), table.empty() ? 0 : table.front().size(), score);
    if (!best || score > bestScore) {
      best = &table;
      bestScore = score;
    }
  }
  if (best && bestScore > 0) return *best;
  return canonicalHeaderTable(vocab);
}

std::string normalizeHeader(const std::string& header, const std::vector<HeaderRule>& rules) {
  const std::string h = lowerAscii(trim(header));
  for (const auto& rule : rules) {
    if (ruleMatches(rule, h)) return rule.label;
  }
  return header;
}

std::vector<HeaderRule> effectiveHeaderRules(const Vocabulary& vocab) {
  std::vector<HeaderRule> rules = vocab.headerRules;
  if (vocab.ioTermMatch == IoTermMatch::Substring) return rules;
  for (auto& rule : rules) {
    auto io = std::find(rule.anyOf.begin(), rule.anyOf.end(), "io");
    if (io == rule.anyOf.end()) continue;
    rule.anyOf.erase(io);
    rule.anyWord.push_back("io");
  }
  return rules;
}

RawTable normalizeTableHeaders(const RawTable& table, const Vocabulary& vocab) {
  if (table.empty()) return canonicalHeaderTable(vocab);
  const std::vector<HeaderRule> rules = effectiveHeaderRules(vocab);
  RawTable out = table;
  for (auto& cell : out.front()) cell = normalizeHeader(cell, rules);
  return out;
}

PinTableMap extractPinTables(const std::filesystem::path& path, const Config& config) {
  if (!std::filesystem::exists(path)) throw NotFoundError(path.string());
  const Vocabulary& vocab = config.vocabulary;

  std::vector<RawTable> tables;
  switch (documentKindFor(path)) {
    case DocumentKind::Markup: {
      HtmlDocument doc(readTextFile(path));
      tables = discoverHtmlTables(doc);
      break;
    }
    case DocumentKind::Paginated:
      try {
        tables = discoverPdfTables(extractTablesFromPdf(path.string(), 1, config.limits.maxPdfPages));
      } catch (const std::exception& ex) {
        spdlog::warn("{}: no tables extracted: {}", path.string(), ex.what());
      }
      break;
    case DocumentKind::Unsupported:
      return PinTableMap{{kDefaultPackageLabel, canonicalHeaderTable(vocab)}};
  }
  spdlog::debug("{}: {} candidate table(s)", path.string(), tables.size());

  RawTable best = selectBestTable(tables, vocab);
  // The header-only sentinel is already canonical.
  if (best.size() > 1) best = normalizeTableHeaders(best, vocab);
  return PinTableMap{{kDefaultPackageLabel, std::move(best)}};
}

PinIndex::PinIndex(const RawTable& table) {
  if (table.size() < 2) return;
  for (size_t r = 1; r < table.size(); ++r) {
    const auto& row = table[r];
    if (row.empty()) continue;
    std::string number = trim(row[0]);
    std::string name = row.size() > 1 ? trim(row[1]) : std::string();
    if (!number.empty()) numbers_.insert(lowerAscii(number));
    if (!name.empty()) names_.insert(lowerAscii(name));
    if (!number.empty() && !name.empty()) numberToName_[lowerAscii(number)] = name;
  }
}

bool PinIndex::hasPin(const std::string& token) const {
  return hasPinName(token) || hasPinNumber(token);
}

bool PinIndex::hasPinName(const std::string& name) const {
  return names_.count(lowerAscii(trim(name))) > 0;
}

bool PinIndex::hasPinNumber(const std::string& number) const {
  return numbers_.count(lowerAscii(trim(number))) > 0;
}

std::string PinIndex::nameForNumber(const std::string& number) const {
  auto it = numberToName_.find(lowerAscii(trim(number)));
  return it == numberToName_.end() ? std::string() : it->second;
}

std::string pinContext(const RawTable& table, size_t maxRows) {
  if (table.size() < 2) return "No pin table available.";

  std::string out = "Device pins:";
  size_t emitted = 0;
  for (size_t r = 1; r < table.size() && emitted < maxRows; ++r) {
    const auto& row = table[r];
    if (row.size() < 2) continue;
    std::string type = row.size() > 2 ? trim(row[2]) : std::string();
    std::string desc = row.size() > 3 ? trim(row[3]) : std::string();
    out += "\nPin " + trim(row[0]) + ": " + trim(row[1]) + " (" + type + ") - " + desc;
    emitted++;
  }
  return out;
}

PinReport makePinReport(const std::filesystem::path& path, const PinTableMap& tables,
                        const Vocabulary& vocab) {
  PinReport report;
  report.filename = path.filename().string();
  if (!tables.empty() && !tables.begin()->second.empty()) {
    report.pin = tables.begin()->second;
  } else {
    report.pin = canonicalHeaderTable(vocab);
  }
  return report;
}
