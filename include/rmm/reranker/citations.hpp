#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rmm::reranker {

enum class CitationKind { Cited, NoCite, Malformed };

struct CitationResult {
  CitationKind kind = CitationKind::Malformed;
  /// First-seen order, duplicates removed. Empty unless kind == Cited.
  std::vector<std::size_t> indices;
};

struct Citation {
  std::size_t index = 0;
  double reward = 1.0;
};

/// Scan every "[...]" group. "[NO_CITE]" anywhere wins; groups that are not
/// comma-separated non-negative integers are skipped.
[[nodiscard]] CitationResult parse_citations(const std::string &text);

/// Citations of shown positions [0, shown); out-of-range indices are dropped.
[[nodiscard]] std::vector<Citation> extract_citations(const std::string &text, std::size_t shown);

/// Binary reward per shown position: 1 when cited, 0 otherwise.
[[nodiscard]] std::vector<double> compute_rewards(const std::vector<Citation> &citations,
                                                  std::size_t shown);

} // namespace rmm::reranker
