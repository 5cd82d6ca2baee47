#pragma once

#include "config.hpp"
#include "document.hpp"
#include "html_document.hpp"
#include "part_classifier.hpp"
#include "table_extractor.hpp"

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

struct IdentifyResult {
  std::optional<std::string> primaryIdentifier;
  std::vector<std::string> candidates;
  std::vector<std::string> packages;
};

// Case-insensitive "ordering information" header pattern from the vocabulary.
std::regex orderingPattern(const Vocabulary& vocab);

// Accepted tokens of title, headings, metadata and body ranked by frequency,
// +5 when the token occurs in the title and +3 when it occurs in a heading.
// Ties go to the lexicographically greater token.
std::vector<std::string> scoreParts(const DocumentBits& bits, const PartClassifier& classifier);

// Package-family codes of title, headings and body, sorted and distinct.
std::vector<std::string> findPackages(const DocumentBits& bits, const Vocabulary& vocab);

// Walks at most maxSteps elements past every ordering heading (h1-h4),
// collecting accepted tokens in encounter order.
std::vector<std::string> partsFromOrderingSections(const HtmlDocument& doc,
                                                   const PartClassifier& classifier,
                                                   const std::regex& orderingRe,
                                                   size_t maxSteps);

// Why a table looks like an ordering table. Column selection depends only on
// headerFlags; the table is scanned whether or not it is relevant().
struct OrderingTableSignals {
  std::vector<std::string> headers;
  std::vector<bool> headerFlags;
  bool captionMatches = false;
  bool precedingHeadingMatches = false;

  bool anyHeaderFlag() const;
  bool relevant() const { return anyHeaderFlag() || captionMatches || precedingHeadingMatches; }
  // Flagged column indices, or every index below columnCount when none is flagged.
  std::vector<size_t> scanColumns(size_t columnCount) const;
};

OrderingTableSignals orderingSignals(const HtmlDocument& doc, const GumboNode* table,
                                     const std::regex& orderingRe);

std::vector<std::string> partsFromHtmlTables(const HtmlDocument& doc,
                                             const PartClassifier& classifier,
                                             const std::regex& orderingRe);

// Same pass over detected page tables, first row taken as the header.
std::vector<std::string> partsFromPageTables(const std::vector<PageTable>& tables,
                                             const PartClassifier& classifier,
                                             const std::regex& orderingRe);

// Vendor literal codes (pattern applied per whitespace word), then long
// (>= 10) alphanumeric runs holding both a letter and a digit. Not gated by
// the part classifier.
std::vector<std::string> extractVendorCodes(const std::string& text, const Vocabulary& vocab);

// Identifier-shaped names among the three nearest ancestor directories and
// the file stem.
std::vector<std::string> pathCandidates(const std::filesystem::path& path, const Vocabulary& vocab);

// Concatenates sources in priority order, first occurrence wins, capped.
std::vector<std::string> mergeCandidates(const std::vector<std::vector<std::string>>& sources,
                                         size_t cap);

// Leading letters of the first candidate, upper-cased.
std::optional<std::string> deriveFamilyPrefix(const std::vector<std::string>& candidates);

// Throws NotFoundError when the path is absent and UnsupportedFormatError for
// anything but .html/.htm/.pdf.
IdentifyResult identifyFile(const std::filesystem::path& path, const Config& config);
