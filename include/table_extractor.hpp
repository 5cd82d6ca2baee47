#pragma once

#include "document.hpp"

#include <string>
#include <vector>

struct WordBox {
  double xMin;
  double yMin;
  double xMax;
  double yMax;
  std::string text;
};

struct PageWords {
  int pageNumber;
  std::vector<WordBox> words;
};

// A table detected on one page. cells[0] is whatever row came first; callers
// decide whether it is a header.
struct PageTable {
  int pageNumber;
  RawTable cells;
};

// Splits `pdftotext -bbox-layout` output into pages (numbered from
// firstPage) and their words. A page whose markup cannot be parsed is logged
// and skipped.
std::vector<PageWords> parseBboxLayout(const std::string& xmlish, int firstPage = 1);

// Groups a page's words into rows, finds runs of consecutive rows that span
// at least two column positions and grids each run into a table.
// Throws PageExtractionError on degenerate geometry.
std::vector<RawTable> detectTablesOnPage(const PageWords& page);

// Extract tables by invoking `pdftotext -bbox-layout` to get word bounding boxes,
// then clustering words into rows/columns heuristically.
// If lastPage < firstPage or lastPage == -1, processes until end.
// Throws std::runtime_error if pdftotext is unavailable or fails; failures
// confined to one page are logged and that page is skipped.
std::vector<PageTable> extractTablesFromPdf(const std::string& pdfPath,
                                            int firstPage = 1,
                                            int lastPage = -1);
