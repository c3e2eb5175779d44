#pragma once
#include <string>
#include <vector>
#include <pitstrat/ranker.hpp>
#include <pitstrat/strategy.hpp>

namespace pitstrat {

// One literal, pre-formatted fact. Explanation text may rephrase these
// but must not derive anything they do not already state.
struct RuleHit {
  std::string category;        // "Weather" | "Strategy" | "Stint" | "Historical"
  std::string rule_name;
  std::string observed_value;
  std::string impact;

  bool operator==(const RuleHit&) const = default;
};

// Pure transcription of `s` in the context of `ranked`; same input, same output.
std::vector<RuleHit> extract_rule_hits(const Strategy& s, const RankedResult& ranked);

} // namespace pitstrat
