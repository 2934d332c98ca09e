#include "rmm/providers/compatible.hpp"

#include "rmm/common/fs.hpp"
#include "rmm/common/json_util.hpp"

#include <sstream>

namespace rmm::providers {

CompatibleLlmClient::CompatibleLlmClient(config::LlmConfig config,
                                         std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), base_url_(config_.base_url),
      http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleLlmClient::build_body(const std::string &prompt) const {
  std::ostringstream body;
  body << "{";
  body << "\"model\":" << common::json_quote(config_.model) << ",";
  body << "\"messages\":[";
  body << "{\"role\":\"user\",\"content\":" << common::json_quote(prompt) << "}";
  body << "],";
  body << "\"temperature\":" << common::json_number(config_.temperature) << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

common::Result<std::string> CompatibleLlmClient::generate(const std::string &prompt) {
  const std::string api_key = config_.api_key.value_or("");
  if (common::trim(api_key).empty()) {
    return common::Result<std::string>::failure(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}
            .to_string());
  }

  const HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key},
  };

  const auto response = http_client_->post_json(base_url_ + "/chat/completions", headers,
                                                build_body(prompt),
                                                config_.timeout_ms);
  const auto status = check_http_response(response);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }

  auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return common::Result<std::string>::failure(
        ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()}
            .to_string());
  }
  return parsed;
}

} // namespace rmm::providers
