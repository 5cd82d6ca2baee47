#pragma once

#include "config.hpp"
#include "document.hpp"

#include <string>
#include <vector>

bool commandExists(const std::string& command);

// Wraps a string in single quotes for /bin/sh.
std::string shellQuote(const std::string& s);

// Runs a shell command and returns its stdout. The pipe is closed on every
// exit path. Throws std::runtime_error if the pipe cannot be opened or the
// command exits non-zero.
std::string runCommandCapture(const std::string& command);

// Text of the first maxPages pages, one entry per page, via `pdftotext`.
// Throws std::runtime_error when pdftotext is missing or fails.
std::vector<std::string> extractPdfPages(const std::string& pdfPath, int maxPages);

// Splits pdftotext output on form feeds, keeping at most maxPages pages.
std::vector<std::string> splitPages(const std::string& text, int maxPages);

// Non-empty document-info values (Title, Author, ...) via `pdfinfo`.
std::vector<std::string> extractPdfMetadata(const std::string& pdfPath);

// Parses `pdfinfo` output into document-info values, in output order.
std::vector<std::string> parsePdfInfo(const std::string& text);

// Title, headings and body from page texts. Heading lines are the first few
// short lines of each page; the title is the head of page one.
DocumentBits buildPdfBits(const std::vector<std::string>& pages,
                          std::vector<std::string> metadata,
                          const Limits& limits);

// Never throws for an unreadable PDF: failures are logged and the affected
// part of the bundle stays empty.
DocumentBits extractPdfBits(const std::string& pdfPath, const Limits& limits);
