#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

class HtmlDocument;

// Row 0 is the header row.
using RawTable = std::vector<std::vector<std::string>>;

enum class DocumentKind { Markup, Paginated, Unsupported };

// .html/.htm are markup, .pdf is paginated; the comparison ignores case.
DocumentKind documentKindFor(const std::filesystem::path& path);

// Uniform text view of one document, built once and read by every extractor.
struct DocumentBits {
  std::string title;
  std::vector<std::string> headings;
  std::vector<std::string> metadata;
  std::string body;
  // Parsed markup tree; null for paginated documents.
  std::shared_ptr<const HtmlDocument> tree;
};

// title, headings, metadata and body joined for frequency scoring.
std::string scoringText(const DocumentBits& bits);

// title, headings and body joined for package and vendor-code scans.
std::string patternText(const DocumentBits& bits);

// Pads every row with empty cells to the widest row.
RawTable padRows(RawTable rows);

// Collapses whitespace runs to single spaces and trims the ends.
std::string collapseWhitespace(const std::string& s);
