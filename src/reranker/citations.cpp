#include "rmm/reranker/citations.hpp"

#include "rmm/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace rmm::reranker {

namespace {

constexpr std::size_t kMaxIndexDigits = 6;

std::optional<std::vector<std::size_t>> parse_group(const std::string &group) {
  std::vector<std::size_t> out;
  const std::string body = common::trim(group);
  if (body.empty() || body.back() == ',') {
    return std::nullopt;
  }
  const auto parts = common::split(body, ',');
  if (parts.empty()) {
    return std::nullopt;
  }
  for (const auto &part : parts) {
    const std::string token = common::trim(part);
    if (token.empty() || token.size() > kMaxIndexDigits) {
      return std::nullopt;
    }
    if (!std::all_of(token.begin(), token.end(),
                     [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
      return std::nullopt;
    }
    out.push_back(static_cast<std::size_t>(std::stoul(token)));
  }
  return out;
}

} // namespace

CitationResult parse_citations(const std::string &text) {
  std::vector<std::string> groups;
  std::size_t pos = 0;
  while ((pos = text.find('[', pos)) != std::string::npos) {
    const auto close = text.find(']', pos + 1);
    if (close == std::string::npos) {
      break;
    }
    const auto nested = text.find('[', pos + 1);
    if (nested != std::string::npos && nested < close) {
      pos = nested;
      continue;
    }
    groups.push_back(text.substr(pos + 1, close - pos - 1));
    pos = close + 1;
  }

  for (const auto &group : groups) {
    if (common::trim(group) == "NO_CITE") {
      return CitationResult{.kind = CitationKind::NoCite, .indices = {}};
    }
  }

  CitationResult result;
  for (const auto &group : groups) {
    const auto parsed = parse_group(group);
    if (!parsed.has_value()) {
      continue;
    }
    for (const std::size_t index : *parsed) {
      if (std::find(result.indices.begin(), result.indices.end(), index) ==
          result.indices.end()) {
        result.indices.push_back(index);
      }
    }
  }
  result.kind = result.indices.empty() ? CitationKind::Malformed : CitationKind::Cited;
  return result;
}

std::vector<Citation> extract_citations(const std::string &text, const std::size_t shown) {
  const auto parsed = parse_citations(text);
  std::vector<Citation> out;
  if (parsed.kind != CitationKind::Cited) {
    return out;
  }
  for (const std::size_t index : parsed.indices) {
    if (index < shown) {
      out.push_back(Citation{.index = index, .reward = 1.0});
    }
  }
  return out;
}

std::vector<double> compute_rewards(const std::vector<Citation> &citations,
                                    const std::size_t shown) {
  std::vector<double> rewards(shown, 0.0);
  for (const auto &citation : citations) {
    if (citation.index < shown) {
      rewards[citation.index] = 1.0;
    }
  }
  return rewards;
}

} // namespace rmm::reranker
