#include "part_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace {

constexpr size_t kMinTokenLength = 4;
constexpr size_t kMaxTokenLength = 80;

const std::regex& decimalPattern() {
  static const std::regex re("\\d+\\.\\d+");
  return re;
}

const std::regex& punctuationRunPattern() {
  static const std::regex re("[.+\\-_]{4,}");
  return re;
}

const std::regex& partCharsetPattern() {
  static const std::regex re("^[A-Z0-9\\-.]+$", std::regex::icase);
  return re;
}

bool isWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isUpper(char c) {
  return c >= 'A' && c <= 'Z';
}

bool isTokenChar(char c) {
  return isUpper(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

bool wordBoundaryAt(const std::string& text, size_t pos) {
  bool before = pos > 0 && isWordChar(text[pos - 1]);
  bool after = pos < text.size() && isWordChar(text[pos]);
  return before != after;
}

std::string upperAscii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::regex buildSignalPattern(const std::vector<std::string>& prefixes) {
  std::string alternation;
  for (const auto& p : prefixes) {
    if (!alternation.empty()) alternation += '|';
    alternation += p;
  }
  if (alternation.empty()) return std::regex("$^");
  return std::regex("^(" + alternation + ")[A-Z0-9/._\\-]*$", std::regex::icase);
}

} // namespace

bool CandidateList::add(const std::string& s) {
  if (!seen_.insert(s).second) return false;
  items_.push_back(s);
  return true;
}

void CandidateList::addAll(const std::vector<std::string>& items) {
  for (const auto& s : items) add(s);
}

PartClassifier::PartClassifier(const Vocabulary& vocab)
  : formatReject_(vocab.formatReject),
    protocolReject_(vocab.protocolReject),
    signalRe_(buildSignalPattern(vocab.signalPrefixes)) {}

bool PartClassifier::isPartToken(const std::string& tok) const {
  if (formatReject_.count(tok) || protocolReject_.count(upperAscii(tok))) return false;
  if (tok.size() < kMinTokenLength || tok.size() > kMaxTokenLength) return false;
  if (!std::isalpha(static_cast<unsigned char>(tok[0]))) return false;
  if (std::none_of(tok.begin(), tok.end(), [](unsigned char c) { return std::isdigit(c); })) return false;
  if (std::regex_search(tok, decimalPattern())) return false;
  if (std::regex_match(tok, signalRe_)) return false;
  if (std::regex_search(tok, punctuationRunPattern())) return false;
  return std::regex_match(tok, partCharsetPattern());
}

// Same spans as the search `\b[A-Z][A-Z0-9\-.]{3,}\b`, scanned by hand so
// arbitrarily long runs cost no stack.
std::vector<std::string> PartClassifier::tokens(const std::string& text) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos < text.size()) {
    if (!isUpper(text[pos]) || !wordBoundaryAt(text, pos)) {
      pos++;
      continue;
    }
    size_t runEnd = pos + 1;
    while (runEnd < text.size() && isTokenChar(text[runEnd])) runEnd++;

    // Longest prefix of the run that ends on a word boundary.
    size_t end = runEnd;
    while (end >= pos + kMinTokenLength && !wordBoundaryAt(text, end)) end--;
    if (end < pos + kMinTokenLength) {
      // Later starts inside the run share its end, so none can match either.
      pos = runEnd;
      continue;
    }
    out.push_back(text.substr(pos, end - pos));
    pos = end;
  }
  return out;
}

std::vector<std::string> PartClassifier::candidates(const std::string& text) const {
  std::vector<std::string> out;
  for (auto& tok : tokens(text)) {
    if (isPartToken(tok)) out.push_back(std::move(tok));
  }
  return out;
}

void PartClassifier::collectNew(const std::string& text, CandidateList& out) const {
  for (const auto& tok : tokens(text)) {
    if (!out.contains(tok) && isPartToken(tok)) out.add(tok);
  }
}
