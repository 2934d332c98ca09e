#pragma once

#include "rmm/config/schema.hpp"
#include "rmm/providers/llm.hpp"
#include "rmm/providers/traits.hpp"

#include <memory>
#include <string>

namespace rmm::providers {

/// ILlmClient over any OpenAI-compatible /chat/completions endpoint.
class CompatibleLlmClient final : public ILlmClient {
public:
  CompatibleLlmClient(config::LlmConfig config,
                      std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

  [[nodiscard]] common::Result<std::string> generate(const std::string &prompt) override;
  [[nodiscard]] std::string_view name() const override { return "compatible"; }

  [[nodiscard]] std::string build_body(const std::string &prompt) const;

private:
  config::LlmConfig config_;
  std::string base_url_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace rmm::providers
