#pragma once

#include "config.hpp"
#include "document.hpp"
#include "html_document.hpp"
#include "table_extractor.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

using PinTableMap = std::map<std::string, RawTable>;

extern const char* const kDefaultPackageLabel;

// Single-row table holding the canonical headers.
RawTable canonicalHeaderTable(const Vocabulary& vocab);

// Every markup table with at least two non-blank rows, padded.
std::vector<RawTable> discoverHtmlTables(const HtmlDocument& doc);

// Page tables with >= 3 rows; cells whitespace-collapsed, rows with fewer
// than two non-empty cells dropped, kept when >= 3 rows and >= 3 columns.
std::vector<RawTable> discoverPdfTables(const std::vector<PageTable>& tables);

// +15 for >= 4 headers else +25 for >= 6 (FirstMatch), or the tiered reading.
int headerCountBonus(size_t headerCount, HeaderBonusMode mode);

// Pin-table likelihood; tables with fewer than three rows score 0.
int scoreTableForPins(const RawTable& table, const Vocabulary& vocab);

// Highest-scoring table (earliest wins ties), or the canonical header table
// when nothing scores above zero.
RawTable selectBestTable(const std::vector<RawTable>& tables, const Vocabulary& vocab);

// First matching rule's label, or the header unchanged.
std::string normalizeHeader(const std::string& header, const std::vector<HeaderRule>& rules);

// The vocabulary's header rules with the "io" term moved to whole-word
// matching when ioTermMatch is WholeWord.
std::vector<HeaderRule> effectiveHeaderRules(const Vocabulary& vocab);

// Rewrites the header row; data rows pass through.
RawTable normalizeTableHeaders(const RawTable& table, const Vocabulary& vocab);

// Throws NotFoundError for a missing path. Unsupported formats and documents
// without a pin-like table give the canonical header table.
PinTableMap extractPinTables(const std::filesystem::path& path, const Config& config);

// Case-insensitive pin lookup over a normalised table: column 0 is the pin
// number, column 1 the pin name.
class PinIndex {
public:
  explicit PinIndex(const RawTable& table);

  bool hasPin(const std::string& token) const;
  bool hasPinName(const std::string& name) const;
  bool hasPinNumber(const std::string& number) const;
  // Name as written in the table for a pin number, or "" when unknown.
  std::string nameForNumber(const std::string& number) const;

  size_t size() const { return numbers_.size(); }

private:
  std::unordered_set<std::string> names_;
  std::unordered_set<std::string> numbers_;
  std::unordered_map<std::string, std::string> numberToName_;
};

// "Device pins:" summary of the first maxRows data rows.
std::string pinContext(const RawTable& table, size_t maxRows);

// Per-file record handed to the rule-generation stage.
struct PinReport {
  std::string filename;
  RawTable pin;
  // Filled by the rule-generation stage; always empty here.
  std::vector<std::string> checklist;
  std::string footnote;
};

// Uses the first package's table, or the canonical header table.
PinReport makePinReport(const std::filesystem::path& path, const PinTableMap& tables,
                        const Vocabulary& vocab);
