#include "config.hpp"
#include "errors.hpp"
#include "identifier.hpp"
#include "logging.hpp"
#include "pin_table.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

std::string jsonString(const std::string& s) {
  std::string out = "\"";
  for (unsigned char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  out += "\"";
  return out;
}

void printArray(const std::vector<std::string>& arr) {
  std::cout << "[";
  for (size_t i = 0; i < arr.size(); ++i) {
    std::cout << jsonString(arr[i]) << (i + 1 == arr.size() ? "" : ", ");
  }
  std::cout << "]";
}

void printIdentify(const std::string& path, const IdentifyResult& result) {
  std::cout << "{\n";
  std::cout << "  \"file\": " << jsonString(path) << ",\n";
  std::cout << "  \"device_name\": "
            << (result.primaryIdentifier ? jsonString(*result.primaryIdentifier) : "null") << ",\n";
  std::optional<std::string> family = deriveFamilyPrefix(result.candidates);
  std::cout << "  \"family_prefix\": " << (family ? jsonString(*family) : "null") << ",\n";
  std::cout << "  \"part_candidates\": ";
  printArray(result.candidates);
  std::cout << ",\n  \"packages\": ";
  printArray(result.packages);
  std::cout << "\n}\n";
}

void printPinTables(const PinTableMap& tables) {
  std::cout << "{\n";
  for (auto it = tables.begin(); it != tables.end(); ) {
    std::cout << "  " << jsonString(it->first) << ": [\n";
    const RawTable& table = it->second;
    for (size_t r = 0; r < table.size(); ++r) {
      std::cout << "    ";
      printArray(table[r]);
      std::cout << (r + 1 == table.size() ? "\n" : ",\n");
    }
    ++it;
    std::cout << (it == tables.end() ? "  ]\n" : "  ],\n");
  }
  std::cout << "}\n";
}

int usage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--pins] [--config=file.yaml] [--log-level=level] <file.html|file.pdf>\n";
  return 1;
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::string docPath;
    std::string configPath;
    std::string logLevel;
    bool extractPins = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--pins") {
        extractPins = true;
      } else if (arg.rfind("--config=", 0) == 0) {
        configPath = arg.substr(std::string("--config=").size());
      } else if (arg.rfind("--log-level=", 0) == 0) {
        logLevel = arg.substr(std::string("--log-level=").size());
      } else if (arg == "--help" || arg == "-h") {
        return usage(argv[0]);
      } else if (docPath.empty()) {
        docPath = arg;
      }
    }

    if (docPath.empty()) return usage(argv[0]);

    Config config = loadConfig(configPath);
    setupLogging(logLevel.empty() ? config.logLevel : logLevel);

    if (extractPins) {
      printPinTables(extractPinTables(docPath, config));
      return 0;
    }

    printIdentify(docPath, identifyFile(docPath, config));
    return 0;
  } catch (const NotFoundError& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
