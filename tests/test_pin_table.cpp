#include <catch2/catch.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "pin_table.hpp"
#include "test_support.hpp"

#include <string>

namespace {

RawTable withHeader(std::vector<std::string> header, RawTable rows) {
  rows.insert(rows.begin(), std::move(header));
  return rows;
}

const RawTable kPinRows{{"1", "VDD", "Power"}, {"2", "GND", "Power"}};
const RawTable kPlainRows{{"A", "b", "c"}, {"B", "d", "e"}};

} // namespace

TEST_CASE("scoreTableForPins scores a small pin table", "[pintable]") {
  Vocabulary vocab = defaultVocabulary();

  // pin +20, name +10, type +10, two pin-like cells +16, two data rows +4
  REQUIRE(scoreTableForPins(withHeader({"Pin", "Name", "Type"}, kPinRows), vocab) == 60);
}

TEST_CASE("scoreTableForPins gives tables under three rows zero", "[pintable]") {
  Vocabulary vocab = defaultVocabulary();

  REQUIRE(scoreTableForPins(RawTable{{"Pin", "Name"}, {"1", "VDD"}}, vocab) == 0);
  REQUIRE(scoreTableForPins(RawTable{}, vocab) == 0);
}

TEST_CASE("a strong keyword header strictly raises the score", "[pintable]") {
  Vocabulary vocab = defaultVocabulary();
  RawTable rows{{"1", "VDD", "x"}, {"2", "GND", "y"}};

  int without = scoreTableForPins(withHeader({"Pin", "Name", "Notes"}, rows), vocab);
  int with = scoreTableForPins(withHeader({"Pin", "Name", "Ball"}, rows), vocab);

  REQUIRE(with > without);
  REQUIRE(with - without == 20);
}

TEST_CASE("electrical headers are penalised once at two matches", "[pintable]") {
  Vocabulary vocab = defaultVocabulary();

  int one = scoreTableForPins(withHeader({"Symbol", "Parameter", "Value"}, kPlainRows), vocab);
  int two = scoreTableForPins(withHeader({"Symbol", "Parameter", "Min"}, kPlainRows), vocab);
  int three = scoreTableForPins(withHeader({"Parameter", "Min", "Max"}, kPlainRows), vocab);

  REQUIRE(one == 4);
  REQUIRE(two == one - 30);
  REQUIRE(three == two);
}

TEST_CASE("pin-like first-column cells", "[pintable]") {
  Vocabulary vocab = defaultVocabulary();
  RawTable rows{{"A1", "x", "y"}, {"vdd", "x", "y"}, {"NC", "x", "y"}, {"PA1", "x", "y"}};

  // three pin-like cells, four data rows
  REQUIRE(scoreTableForPins(withHeader({"a", "b", "c"}, rows), vocab) == 3 * 8 + 8);
}

TEST_CASE("header-count bonus keeps first-match precedence", "[pintable]") {
  REQUIRE(headerCountBonus(3, HeaderBonusMode::FirstMatch) == 0);
  REQUIRE(headerCountBonus(4, HeaderBonusMode::FirstMatch) == 15);
  REQUIRE(headerCountBonus(6, HeaderBonusMode::FirstMatch) == 15);
  REQUIRE(headerCountBonus(9, HeaderBonusMode::FirstMatch) == 15);

  REQUIRE(headerCountBonus(3, HeaderBonusMode::Tiered) == 0);
  REQUIRE(headerCountBonus(5, HeaderBonusMode::Tiered) == 15);
  REQUIRE(headerCountBonus(6, HeaderBonusMode::Tiered) == 25);
}

TEST_CASE("header bonus mode changes the table score", "[pintable]") {
  Vocabulary vocab = defaultVocabulary();
  RawTable table = withHeader({"a", "b", "c", "d", "e", "f"},
                              RawTable{{"x", "", "", "", "", ""}, {"y", "", "", "", "", ""}});

  int firstMatch = scoreTableForPins(table, vocab);
  vocab.headerBonusMode = HeaderBonusMode::Tiered;
  int tiered = scoreTableForPins(table, vocab);

  REQUIRE(firstMatch == 4 + 15);
  REQUIRE(tiered == 4 + 25);
}

TEST_CASE("selectBestTable picks the top score or the sentinel", "[pintable]") {
  Vocabulary vocab = defaultVocabulary();
  RawTable electrical = withHeader({"Parameter", "Min", "Max"}, kPlainRows);
  RawTable pins = withHeader({"Pin", "Name", "Type"}, kPinRows);
  RawTable canonical = canonicalHeaderTable(vocab);

  REQUIRE(selectBestTable({}, vocab) == canonical);
  REQUIRE(selectBestTable({electrical}, vocab) == canonical);
  REQUIRE(selectBestTable({electrical, pins}, vocab) == pins);

  RawTable twin = pins;
  twin[1][1] = "VCC";
  REQUIRE(selectBestTable({pins, twin}, vocab) == pins);
}

TEST_CASE("normalizeHeader applies rules in order", "[normalize]") {
  const auto rules = defaultVocabulary().headerRules;

  REQUIRE(normalizeHeader("Pin", rules) == "Pin Number");
  REQUIRE(normalizeHeader("Pin #", rules) == "Pin Number");
  REQUIRE(normalizeHeader("Number", rules) == "Pin Number");
  REQUIRE(normalizeHeader("Pin Description", rules) == "Pin Number");
  REQUIRE(normalizeHeader("Pin Name", rules) == "Pin Name");
  REQUIRE(normalizeHeader("Ball Name", rules) == "Pin Name");
  REQUIRE(normalizeHeader("Name", rules) == "Pin Name");
  REQUIRE(normalizeHeader("Signal", rules) == "Signal Name");
  REQUIRE(normalizeHeader("Function", rules) == "Signal Name");
  REQUIRE(normalizeHeader("I/O", rules) == "Direction");
  REQUIRE(normalizeHeader("IO Type", rules) == "Direction");
  REQUIRE(normalizeHeader("Direction", rules) == "Direction");
  REQUIRE(normalizeHeader(" Type ", rules) == "Type");
  REQUIRE(normalizeHeader("Remarks ", rules) == "Remarks ");
}

TEST_CASE("the io term matches inside longer headers by default", "[normalize]") {
  const auto rules = defaultVocabulary().headerRules;

  REQUIRE(normalizeHeader("Description", rules) == "Direction");
  REQUIRE(normalizeHeader("Signal Description", rules) == "Direction");
  REQUIRE(normalizeHeader("Function Description", rules) == "Direction");
  REQUIRE(normalizeHeader("Position", rules) == "Direction");
  // Earlier rules still win.
  REQUIRE(normalizeHeader("Pin Description", rules) == "Pin Number");
  REQUIRE(normalizeHeader("Function", rules) == "Signal Name");
}

TEST_CASE("whole-word io matching is opt-in", "[normalize]") {
  Vocabulary vocab = defaultVocabulary();
  RawTable table{{"Description", "Position", "IO", "Function Description"}, {"a", "b", "c", "d"}};

  REQUIRE(normalizeTableHeaders(table, vocab).front() ==
          std::vector<std::string>{"Direction", "Direction", "Direction", "Direction"});

  vocab.ioTermMatch = IoTermMatch::WholeWord;
  auto rules = effectiveHeaderRules(vocab);
  REQUIRE(rules.size() == vocab.headerRules.size());
  REQUIRE(rules[4].label == "Direction");
  REQUIRE(rules[4].anyOf == std::vector<std::string>{"direction", "i/o"});
  REQUIRE(rules[4].anyWord == std::vector<std::string>{"io"});

  RawTable out = normalizeTableHeaders(table, vocab);
  REQUIRE(out.front() == std::vector<std::string>{"Description", "Position", "Direction", "Description"});
  REQUIRE(out[1] == table[1]);
}

TEST_CASE("the fallback header row keeps its literal column order", "[normalize]") {
  TempDir dir;
  auto path = dir.write("no_tables.html", "<p>No pin table here</p>");

  PinTableMap tables = extractPinTables(path, defaultConfig());

  REQUIRE(tables.at(kDefaultPackageLabel) ==
          RawTable{{"Pin Number", "Pin Name", "Signal Name", "Direction", "Type", "Description"}});
}

TEST_CASE("normalizeTableHeaders leaves data rows alone", "[normalize]") {
  Vocabulary vocab = defaultVocabulary();
  RawTable table = withHeader({"Pin", "Name", "Type"}, RawTable{{"1", "Pin Name", "Power"}});

  RawTable out = normalizeTableHeaders(table, vocab);

  REQUIRE(out == RawTable{{"Pin Number", "Pin Name", "Type"}, {"1", "Pin Name", "Power"}});
  REQUIRE(normalizeTableHeaders(RawTable{}, vocab) == canonicalHeaderTable(vocab));
}

TEST_CASE("extractPinTables normalises the best markup table", "[pintable]") {
  TempDir dir;
  auto path = dir.write("device.html",
    "<html><body><h2>Electrical</h2>"
    "<table><tr><th>Parameter</th><th>Min</th><th>Max</th></tr>"
    "<tr><td>VDD</td><td>1.8</td><td>3.6</td></tr><tr><td>IDD</td><td>1</td><td>5</td></tr></table>"
    "<table><tr><th>Pin</th><th>Name</th><th>Type</th></tr>"
    "<tr><td>1</td><td>VDD</td><td>Power</td></tr>"
    "<tr><td>2</td><td>GND</td><td>Power</td></tr></table>"
    "</body></html>");

  PinTableMap tables = extractPinTables(path, defaultConfig());

  REQUIRE(tables.size() == 1);
  REQUIRE(tables.at(kDefaultPackageLabel) ==
          RawTable{{"Pin Number", "Pin Name", "Type"}, {"1", "VDD", "Power"}, {"2", "GND", "Power"}});
  REQUIRE(extractPinTables(path, defaultConfig()) == tables);
}

TEST_CASE("extractPinTables falls back to the canonical header row", "[pintable]") {
  TempDir dir;
  Config config = defaultConfig();
  RawTable sentinel{{"Pin Number", "Pin Name", "Signal Name", "Direction", "Type", "Description"}};

  auto oneRow = dir.write("one_row.html", "<table><tr><th>Pin</th><th>Name</th></tr></table>");
  REQUIRE(extractPinTables(oneRow, config).at(kDefaultPackageLabel) == sentinel);

  auto ragged = dir.write("ragged.htm",
    "<table><tr><td>a</td></tr><tr><td>b</td><td>c</td></tr><tr><td></td></tr></table>");
  REQUIRE(extractPinTables(ragged, config).at(kDefaultPackageLabel) == sentinel);

  auto text = dir.write("notes.txt", "Pin Name Type");
  REQUIRE(extractPinTables(text, config) == PinTableMap{{kDefaultPackageLabel, sentinel}});

  REQUIRE_THROWS_AS(extractPinTables(dir.path() / "missing.html", config), NotFoundError);
}

TEST_CASE("discoverHtmlTables pads rows and drops blank ones", "[tables]") {
  HtmlDocument doc(
    "<table><thead><tr><th>Pin</th><th>Name</th><th>Type</th></tr></thead>"
    "<tbody><tr><td>1</td><td>VDD</td></tr><tr><td> </td></tr><tr><td>2</td></tr></tbody></table>"
    "<table><tr><td>only</td></tr></table>");

  auto tables = discoverHtmlTables(doc);

  REQUIRE(tables.size() == 1);
  REQUIRE(tables[0] == RawTable{{"Pin", "Name", "Type"}, {"1", "VDD", ""}, {"2", "", ""}});
}

TEST_CASE("PinIndex looks pins up without regard to case", "[pinindex]") {
  RawTable table{{"Pin Number", "Pin Name"}, {"1", "VDD"}, {"A2", "Gpio0"}, {"", "NC"}};
  PinIndex index(table);

  REQUIRE(index.hasPin("vdd"));
  REQUIRE(index.hasPin("a2"));
  REQUIRE(index.hasPinName("GPIO0"));
  REQUIRE(index.hasPinName("nc"));
  REQUIRE_FALSE(index.hasPinNumber("3"));
  REQUIRE(index.nameForNumber("a2") == "Gpio0");
  REQUIRE(index.nameForNumber("9").empty());
  REQUIRE(index.size() == 2);

  REQUIRE(PinIndex(RawTable{{"Pin Number", "Pin Name"}}).size() == 0);
}

TEST_CASE("pinContext summarises leading rows", "[pinindex]") {
  RawTable table{{"Pin Number", "Pin Name", "Type", "Description"},
                 {"1", "VDD", "Power", "Supply"},
                 {"2", "GND"},
                 {"3"},
                 {"4", "RST", "Input", "Reset"}};

  REQUIRE(pinContext(table, 2) == "Device pins:\nPin 1: VDD (Power) - Supply\nPin 2: GND () - ");
  REQUIRE(pinContext(table, 15) ==
          "Device pins:\nPin 1: VDD (Power) - Supply\nPin 2: GND () - \nPin 4: RST (Input) - Reset");
  REQUIRE(pinContext(RawTable{{"Pin Number"}}, 15) == "No pin table available.");
}

TEST_CASE("makePinReport uses the first package table", "[pinindex]") {
  Vocabulary vocab = defaultVocabulary();
  RawTable table{{"Pin Number"}, {"1"}};

  PinReport report = makePinReport("/data/sheets/xyz.pdf", PinTableMap{{kDefaultPackageLabel, table}}, vocab);
  REQUIRE(report.filename == "xyz.pdf");
  REQUIRE(report.pin == table);
  REQUIRE(report.checklist.empty());
  REQUIRE(report.footnote.empty());

  REQUIRE(makePinReport("xyz.pdf", PinTableMap{}, vocab).pin == canonicalHeaderTable(vocab));
}
