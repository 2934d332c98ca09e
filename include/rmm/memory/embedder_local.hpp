#pragma once

#include "rmm/memory/embedder.hpp"

namespace rmm::memory {

/// Deterministic hashed-substring embedder; no network, unit-norm output.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions);

  [[nodiscard]] std::string_view name() const override { return "local"; }
  [[nodiscard]] common::Result<std::vector<double>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<double>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

private:
  std::size_t dimensions_;
};

} // namespace rmm::memory
