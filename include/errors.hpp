#pragma once

#include <stdexcept>
#include <string>

// Base for every error raised by the extraction core.
struct ExtractionError : std::runtime_error {
  explicit ExtractionError(const std::string& what) : std::runtime_error(what) {}
};

// Input path does not exist.
struct NotFoundError : ExtractionError {
  explicit NotFoundError(const std::string& path)
    : ExtractionError("file not found: " + path) {}
};

// Extension is neither a markup nor a paginated document type.
struct UnsupportedFormatError : ExtractionError {
  explicit UnsupportedFormatError(const std::string& path)
    : ExtractionError("unsupported document format: " + path) {}
};

// One page (or one table on it) could not be parsed. Always recovered by the
// page loop; never escapes a public operation.
struct PageExtractionError : ExtractionError {
  PageExtractionError(int pageNumber, const std::string& reason)
    : ExtractionError("page " + std::to_string(pageNumber) + ": " + reason),
      pageNumber(pageNumber) {}

  int pageNumber;
};

// Configuration file missing or malformed.
struct ConfigError : ExtractionError {
  explicit ConfigError(const std::string& what) : ExtractionError(what) {}
};
