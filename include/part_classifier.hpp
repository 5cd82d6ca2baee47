#pragma once

#include "config.hpp"

#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

// Ordered list of distinct strings. Exact, case-sensitive comparison; later
// additions only append strings not already present.
class CandidateList {
public:
  // Returns true if the string was new.
  bool add(const std::string& s);
  void addAll(const std::vector<std::string>& items);

  const std::vector<std::string>& items() const { return items_; }
  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  bool contains(const std::string& s) const { return seen_.count(s) > 0; }

private:
  std::vector<std::string> items_;
  std::unordered_set<std::string> seen_;
};

// Decides whether a token is plausibly a device part number. Every extractor
// goes through this one gate.
class PartClassifier {
public:
  explicit PartClassifier(const Vocabulary& vocab);

  bool isPartToken(const std::string& tok) const;

  // Maximal uppercase-led alphanumeric spans of text, in order, unfiltered.
  static std::vector<std::string> tokens(const std::string& text);

  // Accepted tokens of text in order, repeats kept.
  std::vector<std::string> candidates(const std::string& text) const;

  // Appends accepted tokens of text that are not yet in out.
  void collectNew(const std::string& text, CandidateList& out) const;

private:
  std::unordered_set<std::string> formatReject_;
  std::unordered_set<std::string> protocolReject_;
  std::regex signalRe_;
};
