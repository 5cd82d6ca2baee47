#include "table_extractor.hpp"

#include "errors.hpp"
#include "extractor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <stdexcept>
#include <string>

namespace {

struct Segment {
  double xMin;
  double xMax;
  std::string text;
};

struct RowGroup {
  double yCenter;
  std::vector<const WordBox*> words;
  std::vector<Segment> segments;
};

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          std::string digits = ent.substr(hex ? 2 : 1);
          if (!digits.empty() && digits.size() <= 6 &&
              std::all_of(digits.begin(), digits.end(), [hex](unsigned char c) {
                return hex ? std::isxdigit(c) : std::isdigit(c);
              })) {
            unsigned long code = std::stoul(digits, nullptr, hex ? 16 : 10);
            if (code <= 0x7F) rep.push_back(static_cast<char>(code));
          }
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

double parseCoordinate(const std::string& s, int pageNumber) {
  try {
    return std::stod(s);
  } catch (const std::exception&) {
    throw PageExtractionError(pageNumber, "bad word coordinate '" + s + "'");
  }
}

PageWords parsePageWords(const std::string& pageXml, int pageNumber) {
  static const std::regex wordRe(
    "<word[^>]*?xMin=\"([0-9.]+)\"[^>]*?yMin=\"([0-9.]+)\"[^>]*?xMax=\"([0-9.]+)\"[^>]*?yMax=\"([0-9.]+)\"[^>]*>([^<]*)</word>");

  PageWords page{pageNumber, {}};
  std::sregex_iterator it(pageXml.begin(), pageXml.end(), wordRe);
  std::sregex_iterator end;
  for (; it != end; ++it) {
    const std::smatch& m = *it;
    WordBox w;
    w.xMin = parseCoordinate(m[1].str(), pageNumber);
    w.yMin = parseCoordinate(m[2].str(), pageNumber);
    w.xMax = parseCoordinate(m[3].str(), pageNumber);
    w.yMax = parseCoordinate(m[4].str(), pageNumber);
    w.text = decodeEntities(m[5].str());
    if (w.xMax < w.xMin || w.yMax < w.yMin) {
      throw PageExtractionError(pageNumber, "inverted word box for '" + w.text + "'");
    }
    page.words.push_back(std::move(w));
  }
  return page;
}

double median(std::vector<double> v) {
  if (v.empty()) return 0.0;
  std::nth_element(v.begin(), v.begin() + v.size() / 2, v.end());
  return v[v.size() / 2];
}

std::vector<RowGroup> clusterRows(const std::vector<WordBox>& wordsOnPage, double hMed) {
  std::vector<RowGroup> rows;
  if (wordsOnPage.empty()) return rows;

  double tol = hMed > 0 ? hMed * 0.8 : 6.0;

  std::vector<const WordBox*> sorted;
  sorted.reserve(wordsOnPage.size());
  for (const auto& w : wordsOnPage) sorted.push_back(&w);
  std::stable_sort(sorted.begin(), sorted.end(), [](const WordBox* a, const WordBox* b) {
    double ya = (a->yMin + a->yMax) * 0.5;
    double yb = (b->yMin + b->yMax) * 0.5;
    if (ya == yb) return a->xMin < b->xMin;
    return ya < yb; // top to bottom
  });

  for (const WordBox* w : sorted) {
    double yc = (w->yMin + w->yMax) * 0.5;
    if (rows.empty() || std::abs(yc - rows.back().yCenter) > tol) {
      rows.push_back(RowGroup{yc, {}, {}});
    }
    rows.back().words.push_back(w);
    // update running yCenter as average
    rows.back().yCenter = (rows.back().yCenter * (rows.back().words.size() - 1) + yc) / rows.back().words.size();
  }

  for (auto& r : rows) {
    std::stable_sort(r.words.begin(), r.words.end(), [](const WordBox* a, const WordBox* b) {
      return a->xMin < b->xMin;
    });
  }
  return rows;
}

// Joins words separated by less than gapTol into one cell-sized segment.
void buildSegments(RowGroup& row, double gapTol) {
  for (const WordBox* w : row.words) {
    if (!row.segments.empty() && w->xMin - row.segments.back().xMax <= gapTol) {
      Segment& seg = row.segments.back();
      seg.text += ' ';
      seg.text += w->text;
      seg.xMax = std::max(seg.xMax, w->xMax);
      continue;
    }
    row.segments.push_back(Segment{w->xMin, w->xMax, w->text});
  }
}

std::vector<double> clusterColumns(const std::vector<const RowGroup*>& rows) {
  std::vector<double> centers;
  std::vector<double> widths;
  for (const RowGroup* r : rows) {
    for (const auto& s : r->segments) {
      centers.push_back((s.xMin + s.xMax) * 0.5);
      widths.push_back(s.xMax - s.xMin);
    }
  }
  if (centers.empty()) return {};
  double wMed = median(widths);
  double tol = std::max(8.0, wMed * 1.2);
  std::sort(centers.begin(), centers.end());
  std::vector<double> colCenters;
  double acc = centers.front();
  int count = 1;
  for (size_t i = 1; i < centers.size(); ++i) {
    if (centers[i] - centers[i - 1] <= tol) {
      acc += centers[i]; count++;
    } else {
      colCenters.push_back(acc / count);
      acc = centers[i]; count = 1;
    }
  }
  colCenters.push_back(acc / count);
  return colCenters;
}

RawTable buildGrid(const std::vector<const RowGroup*>& rows, const std::vector<double>& colCenters) {
  const size_t numCols = colCenters.size();
  RawTable grid;
  grid.reserve(rows.size());
  for (const RowGroup* r : rows) {
    std::vector<std::string> row(numCols);
    for (const auto& s : r->segments) {
      // assign to nearest column center
      double xc = (s.xMin + s.xMax) * 0.5;
      size_t bestIdx = 0;
      double bestDist = std::abs(xc - colCenters[0]);
      for (size_t c = 1; c < numCols; ++c) {
        double d = std::abs(xc - colCenters[c]);
        if (d < bestDist) { bestDist = d; bestIdx = c; }
      }
      if (!row[bestIdx].empty()) row[bestIdx] += ' ';
      row[bestIdx] += s.text;
    }
    grid.push_back(std::move(row));
  }
  return grid;
}

} // namespace

std::vector<PageWords> parseBboxLayout(const std::string& xmlish, int firstPage) {
  std::vector<PageWords> pages;
  int pageNo = firstPage > 0 ? firstPage : 1;

  size_t pos = xmlish.find("<page");
  while (pos != std::string::npos) {
    size_t next = xmlish.find("<page", pos + 5);
    std::string chunk = xmlish.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
    try {
      pages.push_back(parsePageWords(chunk, pageNo));
    } catch (const PageExtractionError& ex) {
      spdlog::warn("skipping {}", ex.what());
    } catch (const std::regex_error& ex) {
      spdlog::warn("skipping page {}: {}", pageNo, ex.what());
    }
    ++pageNo;
    pos = next;
  }
  return pages;
}

std::vector<RawTable> detectTablesOnPage(const PageWords& page) {
  std::vector<RawTable> tables;
  if (page.words.empty()) return tables;

  std::vector<double> heights;
  heights.reserve(page.words.size());
  for (const auto& w : page.words) heights.push_back(w.yMax - w.yMin);
  double hMed = median(heights);
  if (!std::isfinite(hMed)) throw PageExtractionError(page.pageNumber, "non-finite word heights");

  std::vector<RowGroup> rows = clusterRows(page.words, hMed);
  double gapTol = hMed > 0 ? hMed : 6.0;
  for (auto& r : rows) buildSegments(r, gapTol);

  // Runs of consecutive rows with two or more segments, broken by wide gaps.
  double maxRowGap = gapTol * 3.0;
  std::vector<std::vector<const RowGroup*>> runs;
  std::vector<const RowGroup*> current;
  for (const auto& r : rows) {
    bool tabular = r.segments.size() >= 2;
    bool adjacent = !current.empty() && r.yCenter - current.back()->yCenter <= maxRowGap;
    if (tabular && (current.empty() || adjacent)) {
      current.push_back(&r);
      continue;
    }
    if (current.size() >= 2) runs.push_back(current);
    current.clear();
    if (tabular) current.push_back(&r);
  }
  if (current.size() >= 2) runs.push_back(current);

  for (const auto& run : runs) {
    std::vector<double> cols = clusterColumns(run);
    if (cols.size() < 2) continue; // need at least 2 columns to be a table
    tables.push_back(buildGrid(run, cols));
  }
  return tables;
}

std::vector<PageTable> extractTablesFromPdf(const std::string& pdfPath, int firstPage, int lastPage) {
  if (!commandExists("pdftotext")) {
    throw std::runtime_error("pdftotext not found; install poppler-utils");
  }
  std::string cmd = "pdftotext -bbox-layout -enc UTF-8";
  if (firstPage > 0) {
    cmd += " -f " + std::to_string(firstPage);
  }
  if (lastPage > 0 && lastPage >= firstPage) {
    cmd += " -l " + std::to_string(lastPage);
  }
  cmd += " -q " + shellQuote(pdfPath) + " -";

  std::vector<PageTable> tables;
  for (const PageWords& page : parseBboxLayout(runCommandCapture(cmd), firstPage)) {
    try {
      for (auto& grid : detectTablesOnPage(page)) {
        tables.push_back(PageTable{page.pageNumber, std::move(grid)});
      }
    } catch (const PageExtractionError& ex) {
      spdlog::warn("{}: skipping {}", pdfPath, ex.what());
    }
  }
  spdlog::debug("{}: detected {} table(s)", pdfPath, tables.size());
  return tables;
}
