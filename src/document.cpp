#include "document.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string joinWith(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

} // namespace

DocumentKind documentKindFor(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == ".html" || ext == ".htm") return DocumentKind::Markup;
  if (ext == ".pdf") return DocumentKind::Paginated;
  return DocumentKind::Unsupported;
}

std::string scoringText(const DocumentBits& bits) {
  return joinWith({bits.title, joinWith(bits.headings, " \n "), joinWith(bits.metadata, " "), bits.body},
                  " \n ");
}

std::string patternText(const DocumentBits& bits) {
  return joinWith({bits.title, joinWith(bits.headings, " \n "), bits.body}, " \n ");
}

RawTable padRows(RawTable rows) {
  size_t maxCols = 0;
  for (const auto& row : rows) maxCols = std::max(maxCols, row.size());
  for (auto& row : rows) row.resize(maxCols);
  return rows;
}

std::string collapseWhitespace(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  bool inSpace = false;
  for (char c : s) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      inSpace = true;
      continue;
    }
    if (inSpace && !out.empty()) out.push_back(' ');
    inSpace = false;
    out.push_back(c);
  }
  return out;
}
