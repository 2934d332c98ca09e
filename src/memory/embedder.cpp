#include "rmm/memory/embedder.hpp"

#include "rmm/common/fs.hpp"
#include "rmm/memory/embedder_local.hpp"
#include "rmm/memory/embedder_openai.hpp"

#include <cmath>

namespace rmm::memory {

common::Status validate_embedding(const std::vector<double> &embedding,
                                  const std::size_t dimensions) {
  if (embedding.size() != dimensions) {
    return common::Status::error("embedding has " + std::to_string(embedding.size()) +
                                 " dimensions, expected " + std::to_string(dimensions));
  }
  for (const double value : embedding) {
    if (!std::isfinite(value)) {
      return common::Status::error("embedding contains a non-finite value");
    }
  }
  return common::Status::success();
}

common::Result<std::shared_ptr<IEmbedder>>
create_embedder(const config::Config &config, std::shared_ptr<providers::HttpClient> http_client) {
  const std::string provider = common::to_lower(common::trim(config.embedding.provider));
  const std::size_t dimensions = config.reranker.embedding_dimension;

  if (provider == "local") {
    return common::Result<std::shared_ptr<IEmbedder>>::success(
        std::make_shared<LocalEmbedder>(dimensions));
  }

  if (provider == "openai") {
    if (!config.embedding.api_key.has_value()) {
      return common::Result<std::shared_ptr<IEmbedder>>::failure(
          "embedding.api_key (or RMM_EMBEDDING_API_KEY) is required for the openai provider");
    }
    if (http_client == nullptr) {
      http_client = std::make_shared<providers::CurlHttpClient>();
    }
    return common::Result<std::shared_ptr<IEmbedder>>::success(
        std::make_shared<OpenAiEmbedder>(config.embedding, dimensions, std::move(http_client)));
  }

  return common::Result<std::shared_ptr<IEmbedder>>::failure("Unknown embedding provider: " +
                                                             config.embedding.provider);
}

} // namespace rmm::memory
