#pragma once

#include "rmm/common/result.hpp"
#include "rmm/config/schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rmm::providers {
class HttpClient;
}

namespace rmm::memory {

class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<double>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<double>>>
  embed_batch(const std::vector<std::string> &texts) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

/// Exactly `dimensions` entries, all finite.
[[nodiscard]] common::Status validate_embedding(const std::vector<double> &embedding,
                                                std::size_t dimensions);

/// Embedder for embedding.provider at reranker.embedding_dimension.
[[nodiscard]] common::Result<std::shared_ptr<IEmbedder>>
create_embedder(const config::Config &config,
                std::shared_ptr<providers::HttpClient> http_client = nullptr);

} // namespace rmm::memory
