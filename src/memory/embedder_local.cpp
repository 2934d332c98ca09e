#include "rmm/memory/embedder_local.hpp"

#include <cmath>
#include <functional>

namespace rmm::memory {

namespace {

void normalize(std::vector<double> &values) {
  double norm = 0.0;
  for (const double v : values) {
    norm += v * v;
  }
  norm = std::sqrt(norm);
  if (norm < 1e-12) {
    return;
  }
  for (double &v : values) {
    v /= norm;
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions) : dimensions_(dimensions) {}

common::Result<std::vector<double>> LocalEmbedder::embed(const std::string_view text) {
  if (dimensions_ == 0) {
    return common::Result<std::vector<double>>::failure("local embedder has zero dimensions");
  }
  std::vector<double> values(dimensions_, 0.0);

  // Hash every 3-character window so texts sharing words land near each other.
  const std::hash<std::string_view> hasher;
  constexpr std::size_t kWindow = 3;
  if (text.size() < kWindow) {
    const auto hash = hasher(text);
    values[hash % dimensions_] += 1.0;
  }
  for (std::size_t i = 0; i + kWindow <= text.size(); ++i) {
    const auto hash = hasher(text.substr(i, kWindow));
    values[hash % dimensions_] += (hash / dimensions_) % 2 == 0 ? 1.0 : -1.0;
  }

  normalize(values);
  return common::Result<std::vector<double>>::success(std::move(values));
}

common::Result<std::vector<std::vector<double>>>
LocalEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<double>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<std::vector<double>>>::failure(emb.error());
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<std::vector<double>>>::success(std::move(out));
}

} // namespace rmm::memory
