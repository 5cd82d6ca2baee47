#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

// How the header-count bonus of the pin-table scorer is applied.
// FirstMatch: ">= 4 -> +15, else >= 6 -> +25" (the >= 6 arm never fires).
// Tiered:     ">= 6 -> +25, else >= 4 -> +15".
enum class HeaderBonusMode { FirstMatch, Tiered };

// How the bare "io" direction term is matched by the header normaliser.
// Substring: any header containing "io" ("Description", "Position") becomes
// Direction. WholeWord: only a standalone "io" word does.
enum class IoTermMatch { Substring, WholeWord };

// One entry of the ordered header-normalisation rule list. A lower-cased,
// trimmed header cell matches when it equals `exact` (if set), contains every
// `allOf` term, contains none of the `noneOf` terms and, when `anyOf` or
// `anyWord` is non-empty, contains one `anyOf` term as a substring or one
// `anyWord` term as a whole word.
struct HeaderRule {
  std::string label;
  std::vector<std::string> anyOf;
  std::vector<std::string> allOf;
  std::vector<std::string> noneOf;
  std::string exact;
  std::vector<std::string> anyWord;
};

// Pattern vocabulary shared by every extractor. Plain data so it can be
// replaced per organisation from the config file.
struct Vocabulary {
  std::unordered_set<std::string> formatReject;
  std::unordered_set<std::string> protocolReject;
  // Regex fragments, joined into one anchored alternation.
  std::vector<std::string> signalPrefixes;

  std::vector<std::string> packageKeywords;
  std::vector<std::string> packagePrefixes;

  std::string orderingHeaderPattern;
  std::string vendorLiteralPattern;

  std::vector<std::string> strongKeywords;
  std::vector<std::string> moderateKeywords;
  std::vector<std::string> electricalKeywords;
  std::vector<std::string> supplyMnemonics;
  HeaderBonusMode headerBonusMode = HeaderBonusMode::FirstMatch;

  std::vector<std::string> canonicalHeaders;
  std::vector<HeaderRule> headerRules;
  IoTermMatch ioTermMatch = IoTermMatch::Substring;
};

struct Limits {
  int maxPdfPages = 10;
  std::size_t maxOrderingSteps = 50;
  std::size_t maxCandidates = 2000;
  std::size_t maxPackages = 20;
  std::size_t maxBodyParagraphs = 50;
  std::size_t maxHeadingLinesPerPage = 10;
  std::size_t maxHeadingLineLength = 120;
  std::size_t titleChars = 200;
  std::size_t pinContextRows = 15;
};

struct Config {
  Vocabulary vocabulary;
  Limits limits;
  std::string logLevel = "info";
  std::string organization = "generic";
};

Vocabulary defaultVocabulary();

// Defaults plus environment overrides (ORG, PDF_MAX_PAGES).
Config defaultConfig();

// Compiles every pattern in the vocabulary. Throws ConfigError naming the
// offending key.
void validateVocabulary(const Vocabulary& vocab);

// Loads a YAML config on top of the defaults, then applies the selected
// organisation profile and environment overrides. An empty path is the same
// as defaultConfig(). Throws ConfigError when the file is missing or invalid.
Config loadConfig(const std::string& configPath);
