#pragma once

#include "rmm/memory/embedder.hpp"
#include "rmm/providers/traits.hpp"

namespace rmm::memory {

class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(config::EmbeddingConfig config, std::size_t dimensions,
                 std::shared_ptr<providers::HttpClient> http_client =
                     std::make_shared<providers::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override { return "openai"; }
  [[nodiscard]] common::Result<std::vector<double>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<double>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

private:
  config::EmbeddingConfig config_;
  std::size_t dimensions_;
  std::shared_ptr<providers::HttpClient> http_client_;
};

} // namespace rmm::memory
