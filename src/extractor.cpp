#include "extractor.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace {

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

class ProcessPipe {
public:
  explicit ProcessPipe(const std::string& command) : pipe_(popen(command.c_str(), "r")) {
    if (!pipe_) throw std::runtime_error("Failed to open pipe for: " + command);
  }

  ~ProcessPipe() {
    if (pipe_) pclose(pipe_);
  }

  ProcessPipe(const ProcessPipe&) = delete;
  ProcessPipe& operator=(const ProcessPipe&) = delete;

  std::string readAll() {
    std::string output;
    char buffer[8192];
    while (true) {
      size_t n = std::fread(buffer, 1, sizeof(buffer), pipe_);
      if (n > 0) output.append(buffer, n);
      if (n < sizeof(buffer)) break;
    }
    return output;
  }

  int close() {
    int rc = pclose(pipe_);
    pipe_ = nullptr;
    return rc;
  }

private:
  FILE* pipe_;
};

const std::unordered_set<std::string>& docInfoKeys() {
  static const std::unordered_set<std::string> keys = {
    "Title", "Subject", "Keywords", "Author", "Creator", "Producer", "CreationDate", "ModDate"};
  return keys;
}

} // namespace

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  int rc = std::system(test.c_str());
  return rc == 0;
}

std::string shellQuote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string runCommandCapture(const std::string& command) {
  ProcessPipe pipe(command);
  std::string output = pipe.readAll();
  int rc = pipe.close();
  if (rc != 0) {
    throw std::runtime_error("command returned non-zero exit code: " + command);
  }
  return output;
}

std::vector<std::string> extractPdfPages(const std::string& pdfPath, int maxPages) {
  if (!commandExists("pdftotext")) {
    throw std::runtime_error(
      "pdftotext not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }
  std::string cmd = "pdftotext -enc UTF-8 -q";
  if (maxPages > 0) cmd += " -f 1 -l " + std::to_string(maxPages);
  cmd += " " + shellQuote(pdfPath) + " -";
  return splitPages(runCommandCapture(cmd), maxPages);
}

std::vector<std::string> splitPages(const std::string& text, int maxPages) {
  std::vector<std::string> pages;
  size_t start = 0;
  while (start < text.size()) {
    if (maxPages > 0 && static_cast<int>(pages.size()) >= maxPages) break;
    size_t ff = text.find('\f', start);
    if (ff == std::string::npos) {
      pages.push_back(text.substr(start));
      break;
    }
    pages.push_back(text.substr(start, ff - start));
    start = ff + 1;
  }
  return pages;
}

std::vector<std::string> extractPdfMetadata(const std::string& pdfPath) {
  if (!commandExists("pdfinfo")) {
    throw std::runtime_error("pdfinfo not found; install poppler-utils");
  }
  return parsePdfInfo(runCommandCapture("pdfinfo -enc UTF-8 " + shellQuote(pdfPath)));
}

std::vector<std::string> parsePdfInfo(const std::string& text) {
  std::vector<std::string> values;
  std::regex lineBreak("\r?\n");
  std::regex kvPattern("^\\s*([A-Za-z][\\w\\s./#-]{0,64}?)\\s*:\\s*(.+)$");

  std::sregex_token_iterator it(text.begin(), text.end(), lineBreak, -1);
  std::sregex_token_iterator end;
  for (; it != end; ++it) {
    std::string line = *it;
    std::smatch m;
    if (!std::regex_match(line, m, kvPattern)) continue;
    std::string key = trim(m[1].str());
    std::string value = trim(m[2].str());
    if (docInfoKeys().count(key) && !value.empty()) values.push_back(value);
  }
  return values;
}

DocumentBits buildPdfBits(const std::vector<std::string>& pages,
                          std::vector<std::string> metadata,
                          const Limits& limits) {
  DocumentBits bits;
  bits.metadata = std::move(metadata);

  for (size_t i = 0; i < pages.size(); ++i) {
    const std::string& txt = pages[i];
    if (i == 0) bits.title = trim(txt.substr(0, limits.titleChars));

    std::regex lineBreak("\r?\n");
    std::sregex_token_iterator it(txt.begin(), txt.end(), lineBreak, -1);
    std::sregex_token_iterator end;
    for (size_t n = 0; it != end && n < limits.maxHeadingLinesPerPage; ++it, ++n) {
      std::string line = trim(*it);
      if (!line.empty() && line.size() < limits.maxHeadingLineLength) bits.headings.push_back(line);
    }

    if (i > 0) bits.body += ' ';
    bits.body += txt;
  }
  return bits;
}

DocumentBits extractPdfBits(const std::string& pdfPath, const Limits& limits) {
  std::vector<std::string> metadata;
  try {
    metadata = extractPdfMetadata(pdfPath);
  } catch (const std::exception& ex) {
    spdlog::warn("{}: no document metadata: {}", pdfPath, ex.what());
  }

  std::vector<std::string> pages;
  try {
    pages = extractPdfPages(pdfPath, limits.maxPdfPages);
  } catch (const std::exception& ex) {
    spdlog::warn("{}: no extractable text: {}", pdfPath, ex.what());
  }
  spdlog::debug("{}: {} page(s) of text", pdfPath, pages.size());

  return buildPdfBits(pages, std::move(metadata), limits);
}
