#include <catch2/catch.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <string>

namespace {

// Sets (or clears, for nullptr) an environment variable for one scope.
class ScopedEnv {
public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    if (const char* old = std::getenv(name)) {
      had_ = true;
      old_ = old;
    }
    if (value) {
      setenv(name, value, 1);
    } else {
      unsetenv(name);
    }
  }

  ~ScopedEnv() {
    if (had_) {
      setenv(name_.c_str(), old_.c_str(), 1);
    } else {
      unsetenv(name_.c_str());
    }
  }

private:
  std::string name_;
  std::string old_;
  bool had_ = false;
};

const char* kProfiles = R"(
logging:
  level: debug
limits:
  max_candidates: 25
  max_pdf_pages: 4
vocabulary:
  package_keywords: [QFN, BGA]
  header_bonus_mode: tiered
organizations:
  acme:
    limits:
      max_pdf_pages: 2
    vocabulary:
      supply_mnemonics: [VBAT]
)";

} // namespace

TEST_CASE("default config", "[config]") {
  ScopedEnv org("ORG", nullptr);
  ScopedEnv pages("PDF_MAX_PAGES", nullptr);

  Config config = loadConfig("");

  REQUIRE(config.logLevel == "info");
  REQUIRE(config.organization == "generic");
  REQUIRE(config.limits.maxPdfPages == 10);
  REQUIRE(config.limits.maxOrderingSteps == 50);
  REQUIRE(config.limits.maxCandidates == 2000);
  REQUIRE(config.limits.maxPackages == 20);
  REQUIRE(config.vocabulary.headerBonusMode == HeaderBonusMode::FirstMatch);
  REQUIRE(config.vocabulary.ioTermMatch == IoTermMatch::Substring);
  REQUIRE(config.vocabulary.canonicalHeaders.size() == 6);
  REQUIRE(config.vocabulary.headerRules.size() == 7);
  REQUIRE(config.vocabulary.formatReject.count("UTF-8") == 1);
}

TEST_CASE("environment overrides", "[config]") {
  ScopedEnv org("ORG", "ACME");
  ScopedEnv pages("PDF_MAX_PAGES", "3");

  Config config = defaultConfig();
  REQUIRE(config.organization == "acme");
  REQUIRE(config.limits.maxPdfPages == 3);

  SECTION("non-positive page caps are ignored") {
    ScopedEnv zero("PDF_MAX_PAGES", "0");
    REQUIRE(defaultConfig().limits.maxPdfPages == 10);
  }

  SECTION("a non-numeric page cap is an error") {
    ScopedEnv bad("PDF_MAX_PAGES", "many");
    REQUIRE_THROWS_AS(defaultConfig(), ConfigError);
  }
}

TEST_CASE("YAML file overrides defaults", "[config]") {
  ScopedEnv org("ORG", nullptr);
  ScopedEnv pages("PDF_MAX_PAGES", nullptr);
  TempDir dir;
  auto path = dir.write("pinextract.yaml", kProfiles);

  Config config = loadConfig(path.string());

  REQUIRE(config.logLevel == "debug");
  REQUIRE(config.limits.maxCandidates == 25);
  REQUIRE(config.limits.maxPdfPages == 4);
  REQUIRE(config.limits.maxPackages == 20);
  REQUIRE(config.vocabulary.packageKeywords == std::vector<std::string>{"QFN", "BGA"});
  REQUIRE(config.vocabulary.headerBonusMode == HeaderBonusMode::Tiered);
  REQUIRE(config.vocabulary.supplyMnemonics.size() == 7);
}

TEST_CASE("organization profile applies last", "[config]") {
  ScopedEnv pages("PDF_MAX_PAGES", "8");
  TempDir dir;
  auto path = dir.write("pinextract.yaml", kProfiles);

  SECTION("selected through ORG") {
    ScopedEnv org("ORG", "Acme");
    Config config = loadConfig(path.string());
    REQUIRE(config.organization == "acme");
    REQUIRE(config.limits.maxPdfPages == 2);
    REQUIRE(config.vocabulary.supplyMnemonics == std::vector<std::string>{"VBAT"});
  }

  SECTION("unknown organization keeps the base settings") {
    ScopedEnv org("ORG", "globex");
    Config config = loadConfig(path.string());
    REQUIRE(config.limits.maxPdfPages == 8);
    REQUIRE(config.vocabulary.supplyMnemonics.size() == 7);
  }
}

TEST_CASE("header rules from YAML replace the defaults", "[config]") {
  ScopedEnv org("ORG", nullptr);
  TempDir dir;
  auto path = dir.write("rules.yaml", R"(
vocabulary:
  header_rules:
    - label: Pin Number
      any: [pad]
    - label: Direction
      any_word: [dir]
      none: [note]
)");

  Config config = loadConfig(path.string());
  const auto& rules = config.vocabulary.headerRules;

  REQUIRE(rules.size() == 2);
  REQUIRE(rules[0].label == "Pin Number");
  REQUIRE(rules[0].anyOf == std::vector<std::string>{"pad"});
  REQUIRE(rules[1].anyWord == std::vector<std::string>{"dir"});
  REQUIRE(rules[1].noneOf == std::vector<std::string>{"note"});
  REQUIRE(rules[1].exact.empty());
}

TEST_CASE("invalid config files are reported", "[config]") {
  ScopedEnv org("ORG", nullptr);
  TempDir dir;

  REQUIRE_THROWS_AS(loadConfig((dir.path() / "absent.yaml").string()), ConfigError);

  auto badMode = dir.write("mode.yaml", "vocabulary:\n  header_bonus_mode: sometimes\n");
  REQUIRE_THROWS_AS(loadConfig(badMode.string()), ConfigError);

  auto badType = dir.write("type.yaml", "limits:\n  max_candidates: lots\n");
  REQUIRE_THROWS_AS(loadConfig(badType.string()), ConfigError);

  auto malformed = dir.write("broken.yaml", "limits: [unterminated\n");
  REQUIRE_THROWS_AS(loadConfig(malformed.string()), ConfigError);

  auto unlabeled = dir.write("rule.yaml", "vocabulary:\n  header_rules:\n    - any: [pin]\n");
  REQUIRE_THROWS_AS(loadConfig(unlabeled.string()), ConfigError);
}

TEST_CASE("io term matching is selectable", "[config]") {
  ScopedEnv org("ORG", nullptr);
  TempDir dir;

  auto wholeWord = dir.write("io.yaml", "vocabulary:\n  io_term_match: whole_word\n");
  REQUIRE(loadConfig(wholeWord.string()).vocabulary.ioTermMatch == IoTermMatch::WholeWord);

  auto bad = dir.write("io_bad.yaml", "vocabulary:\n  io_term_match: sometimes\n");
  REQUIRE_THROWS_AS(loadConfig(bad.string()), ConfigError);
}

TEST_CASE("vocabulary patterns are compiled when the config loads", "[config]") {
  ScopedEnv org("ORG", nullptr);
  TempDir dir;

  auto ordering = dir.write("ordering.yaml", "vocabulary:\n  ordering_header_pattern: '(order'\n");
  REQUIRE_THROWS_AS(loadConfig(ordering.string()), ConfigError);

  auto vendor = dir.write("vendor.yaml", "vocabulary:\n  vendor_literal_pattern: '[SL'\n");
  REQUIRE_THROWS_AS(loadConfig(vendor.string()), ConfigError);

  auto prefixes = dir.write("prefixes.yaml", "vocabulary:\n  signal_prefixes: ['GPIO(']\n");
  REQUIRE_THROWS_AS(loadConfig(prefixes.string()), ConfigError);

  auto profile = dir.write("profile.yaml", R"(
organizations:
  acme:
    vocabulary:
      vendor_literal_pattern: '\b(ACM[0-9'
)");
  {
    ScopedEnv acme("ORG", "acme");
    REQUIRE_THROWS_AS(loadConfig(profile.string()), ConfigError);
  }
  REQUIRE_NOTHROW(loadConfig(profile.string()));

  REQUIRE_NOTHROW(validateVocabulary(defaultVocabulary()));
}
