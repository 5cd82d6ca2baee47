#include "config.hpp"

#include "errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <string>

namespace {

std::string lowerAscii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> readList(const YAML::Node& node) {
  std::vector<std::string> out;
  for (const auto& item : node) out.push_back(item.as<std::string>());
  return out;
}

std::unordered_set<std::string> readSet(const YAML::Node& node) {
  std::unordered_set<std::string> out;
  for (const auto& item : node) out.insert(item.as<std::string>());
  return out;
}

HeaderBonusMode parseBonusMode(const std::string& value) {
  std::string v = lowerAscii(value);
  if (v == "first_match") return HeaderBonusMode::FirstMatch;
  if (v == "tiered") return HeaderBonusMode::Tiered;
  throw ConfigError("unknown header_bonus_mode: " + value);
}

IoTermMatch parseIoTermMatch(const std::string& value) {
  std::string v = lowerAscii(value);
  if (v == "substring") return IoTermMatch::Substring;
  if (v == "whole_word") return IoTermMatch::WholeWord;
  throw ConfigError("unknown io_term_match: " + value);
}

void compilePattern(const std::string& key, const std::string& pattern, std::regex::flag_type flags) {
  try {
    std::regex re(pattern, flags);
  } catch (const std::regex_error& e) {
    throw ConfigError("invalid " + key + " '" + pattern + "': " + e.what());
  }
}

void applyVocabulary(const YAML::Node& node, Vocabulary& vocab) {
  if (!node) return;
  if (node["format_reject"]) vocab.formatReject = readSet(node["format_reject"]);
  if (node["protocol_reject"]) vocab.protocolReject = readSet(node["protocol_reject"]);
  if (node["signal_prefixes"]) vocab.signalPrefixes = readList(node["signal_prefixes"]);
  if (node["package_keywords"]) vocab.packageKeywords = readList(node["package_keywords"]);
  if (node["package_prefixes"]) vocab.packagePrefixes = readList(node["package_prefixes"]);
  if (node["ordering_header_pattern"]) {
    vocab.orderingHeaderPattern = node["ordering_header_pattern"].as<std::string>();
  }
  if (node["vendor_literal_pattern"]) {
    vocab.vendorLiteralPattern = node["vendor_literal_pattern"].as<std::string>();
  }
  if (node["strong_keywords"]) vocab.strongKeywords = readList(node["strong_keywords"]);
  if (node["moderate_keywords"]) vocab.moderateKeywords = readList(node["moderate_keywords"]);
  if (node["electrical_keywords"]) vocab.electricalKeywords = readList(node["electrical_keywords"]);
  if (node["supply_mnemonics"]) vocab.supplyMnemonics = readList(node["supply_mnemonics"]);
  if (node["header_bonus_mode"]) {
    vocab.headerBonusMode = parseBonusMode(node["header_bonus_mode"].as<std::string>());
  }
  if (node["io_term_match"]) {
    vocab.ioTermMatch = parseIoTermMatch(node["io_term_match"].as<std::string>());
  }
  if (node["canonical_headers"]) vocab.canonicalHeaders = readList(node["canonical_headers"]);
  if (node["header_rules"]) {
    std::vector<HeaderRule> rules;
    for (const auto& r : node["header_rules"]) {
      HeaderRule rule;
      if (!r["label"]) throw ConfigError("header rule without a label");
      rule.label = r["label"].as<std::string>();
      if (r["any"]) rule.anyOf = readList(r["any"]);
      if (r["all"]) rule.allOf = readList(r["all"]);
      if (r["none"]) rule.noneOf = readList(r["none"]);
      if (r["exact"]) rule.exact = r["exact"].as<std::string>();
      if (r["any_word"]) rule.anyWord = readList(r["any_word"]);
      rules.push_back(std::move(rule));
    }
    vocab.headerRules = std::move(rules);
  }
}

void applyLimits(const YAML::Node& node, Limits& limits) {
  if (!node) return;
  if (node["max_pdf_pages"]) limits.maxPdfPages = node["max_pdf_pages"].as<int>();
  if (node["max_ordering_steps"]) limits.maxOrderingSteps = node["max_ordering_steps"].as<std::size_t>();
  if (node["max_candidates"]) limits.maxCandidates = node["max_candidates"].as<std::size_t>();
  if (node["max_packages"]) limits.maxPackages = node["max_packages"].as<std::size_t>();
  if (node["max_body_paragraphs"]) limits.maxBodyParagraphs = node["max_body_paragraphs"].as<std::size_t>();
  if (node["max_heading_lines_per_page"]) {
    limits.maxHeadingLinesPerPage = node["max_heading_lines_per_page"].as<std::size_t>();
  }
  if (node["max_heading_line_length"]) {
    limits.maxHeadingLineLength = node["max_heading_line_length"].as<std::size_t>();
  }
  if (node["title_chars"]) limits.titleChars = node["title_chars"].as<std::size_t>();
  if (node["pin_context_rows"]) limits.pinContextRows = node["pin_context_rows"].as<std::size_t>();
}

void applyEnvironment(Config& config) {
  if (const char* org = std::getenv("ORG")) {
    std::string value = lowerAscii(org);
    if (!value.empty()) config.organization = value;
  }
  if (const char* pages = std::getenv("PDF_MAX_PAGES")) {
    try {
      int n = std::stoi(pages);
      if (n > 0) config.limits.maxPdfPages = n;
    } catch (const std::exception&) {
      throw ConfigError(std::string("PDF_MAX_PAGES is not a number: ") + pages);
    }
  }
}

} // namespace

Vocabulary defaultVocabulary() {
  Vocabulary v;
  v.formatReject = {"PDF", "HTML", "UTF-8", "UTF8", "ISO-8859-1", "ASCII"};
  v.protocolReject = {"USB3.0", "USB3",  "USB2.0", "LPDDR4", "DDR3", "DDR3L", "DDR4",
                      "H.264",  "WMV9",  "ETHERNET", "CAN", "I2C",  "SPI",   "UART",
                      "SD3.0",  "MIPI",  "PCIE",   "SATA", "SD24", "MCLK",  "SMCLK",
                      "ACLK",   "DVSS",  "AVSS",   "VREF", "VCORE", "NMI",  "JTAG",
                      "TCK",    "TMS",   "TDI",    "TDO"};
  v.signalPrefixes = {"UCA", "USART", "UART", "SPI", "I2C",  "I2S",  "CAN",  "TA",
                      "TB",  "TC",    "TIM",  "ADC", "DAC",  "GPIO", "PORT", "P\\d",
                      "SD",  "USB",   "ETH",  "CLK", "MCLK", "SMCLK", "ACLK", "JTAG",
                      "NMI"};

  v.packageKeywords = {"QFN",  "LQFP", "TQFP", "QFP", "BGA", "FBGA", "WLCSP",
                       "SOIC", "SSOP", "DFN",  "QFPN", "QPN", "LGA"};
  v.packagePrefixes = {"QF",  "LQ",  "TQ",  "BG",  "DF",  "WL",  "SO",  "SS",
                       "RGZ", "RGE", "ZEJ", "ZCZ", "ZFG", "ALW", "AMC"};

  v.orderingHeaderPattern =
    "\\b(order|ordering|orderable|order\\s*code|order\\s*number|orderable\\s*device|"
    "device(\\s*name)?|part\\s*number|mpn|ordering\\s*information|product\\s*number)\\b";
  v.vendorLiteralPattern = "\\b(SL[A-Z]{1,2}[A-Z0-9]{3,})\\b";

  v.strongKeywords = {"pin", "ball", "terminal"};
  v.moderateKeywords = {"signal", "function", "description", "type", "direction", "name"};
  v.electricalKeywords = {"min", "max", "typical", "units", "conditions", "parameter"};
  v.supplyMnemonics = {"VDD", "VSS", "GND", "VCC", "NC", "AVDD", "DVDD"};

  v.canonicalHeaders = {"Pin Number", "Pin Name", "Signal Name", "Direction", "Type", "Description"};
  v.headerRules = {
    {"Pin Number", {"pin", "number", "#"}, {}, {"name"}, ""},
    {"Pin Name", {"pin", "ball"}, {"name"}, {}, ""},
    {"Pin Name", {}, {}, {}, "name"},
    {"Signal Name", {"signal", "function"}, {}, {"description"}, ""},
    {"Direction", {"direction", "i/o", "io"}, {}, {}, ""},
    {"Type", {"type"}, {}, {}, ""},
    {"Description", {"description", "function"}, {}, {}, ""},
  };
  return v;
}

void validateVocabulary(const Vocabulary& vocab) {
  compilePattern("ordering_header_pattern", vocab.orderingHeaderPattern, std::regex::icase);
  compilePattern("vendor_literal_pattern", vocab.vendorLiteralPattern, std::regex::ECMAScript);
  std::string alternation;
  for (const auto& p : vocab.signalPrefixes) {
    if (!alternation.empty()) alternation += '|';
    alternation += p;
  }
  if (!alternation.empty()) compilePattern("signal_prefixes", "^(" + alternation + ")", std::regex::icase);
}

Config defaultConfig() {
  Config config;
  config.vocabulary = defaultVocabulary();
  applyEnvironment(config);
  return config;
}

Config loadConfig(const std::string& configPath) {
  if (configPath.empty()) return defaultConfig();
  if (!std::filesystem::exists(configPath)) {
    throw ConfigError("config file not found: " + configPath);
  }

  Config config;
  config.vocabulary = defaultVocabulary();
  try {
    YAML::Node yaml = YAML::LoadFile(configPath);

    if (yaml["logging"] && yaml["logging"]["level"]) {
      config.logLevel = yaml["logging"]["level"].as<std::string>();
    }
    if (yaml["organization"]) config.organization = lowerAscii(yaml["organization"].as<std::string>());
    applyLimits(yaml["limits"], config.limits);
    applyVocabulary(yaml["vocabulary"], config.vocabulary);

    applyEnvironment(config);

    const YAML::Node orgs = yaml["organizations"];
    if (orgs && orgs[config.organization]) {
      applyVocabulary(orgs[config.organization]["vocabulary"], config.vocabulary);
      applyLimits(orgs[config.organization]["limits"], config.limits);
    }
  } catch (const YAML::Exception& e) {
    throw ConfigError("invalid config " + configPath + ": " + e.what());
  }
  validateVocabulary(config.vocabulary);
  return config;
}
