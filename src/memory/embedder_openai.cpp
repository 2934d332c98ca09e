#include "rmm/memory/embedder_openai.hpp"

#include "rmm/common/fs.hpp"
#include "rmm/common/json_util.hpp"

#include <algorithm>
#include <sstream>

namespace rmm::memory {

namespace {

using Batch = std::vector<std::vector<double>>;

// data[] entries carry "index" and "embedding"; order by index.
common::Result<Batch> parse_embedding_response(const std::string &body, const std::size_t expected,
                                               const std::size_t dimensions) {
  const std::string data = common::json_get_array(body, "data");
  if (data.empty()) {
    return common::Result<Batch>::failure("embedding response has no data array");
  }
  const auto entries = common::json_split_array(data);
  if (!entries.ok()) {
    return common::Result<Batch>::failure(entries.error());
  }
  if (entries.value().size() != expected) {
    return common::Result<Batch>::failure("embedding response has " +
                                          std::to_string(entries.value().size()) +
                                          " vectors, expected " + std::to_string(expected));
  }

  Batch out(expected);
  std::vector<bool> filled(expected, false);
  for (std::size_t i = 0; i < entries.value().size(); ++i) {
    const auto &entry = entries.value()[i];
    const auto index = common::json_get_int(entry, "index").value_or(static_cast<std::int64_t>(i));
    if (index < 0 || static_cast<std::size_t>(index) >= expected ||
        filled[static_cast<std::size_t>(index)]) {
      return common::Result<Batch>::failure("embedding response has an invalid index");
    }
    auto values = common::json_parse_number_array(common::json_get_array(entry, "embedding"));
    if (!values.ok()) {
      return common::Result<Batch>::failure("invalid embedding array: " + values.error());
    }
    const auto status = validate_embedding(values.value(), dimensions);
    if (!status.ok()) {
      return common::Result<Batch>::failure(status.error());
    }
    out[static_cast<std::size_t>(index)] = std::move(values.value());
    filled[static_cast<std::size_t>(index)] = true;
  }
  return common::Result<Batch>::success(std::move(out));
}

} // namespace

OpenAiEmbedder::OpenAiEmbedder(config::EmbeddingConfig config, const std::size_t dimensions,
                               std::shared_ptr<providers::HttpClient> http_client)
    : config_(std::move(config)), dimensions_(dimensions), http_client_(std::move(http_client)) {
  while (!config_.base_url.empty() && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
}

common::Result<std::vector<double>> OpenAiEmbedder::embed(const std::string_view text) {
  auto batch = embed_batch({std::string(text)});
  if (!batch.ok()) {
    return common::Result<std::vector<double>>::failure(batch.error());
  }
  return common::Result<std::vector<double>>::success(std::move(batch.value().front()));
}

common::Result<std::vector<std::vector<double>>>
OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return common::Result<Batch>::success({});
  }
  const std::string api_key = config_.api_key.value_or("");
  if (common::trim(api_key).empty()) {
    return common::Result<Batch>::failure("missing API key");
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":" << common::json_quote(config_.model) << ",";
  body << "\"input\":[";
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) {
      body << ',';
    }
    body << common::json_quote(texts[i]);
  }
  body << "]";
  // Only the v3 models accept a requested output size.
  if (common::starts_with(config_.model, "text-embedding-3")) {
    body << ",\"dimensions\":" << dimensions_;
  }
  body << "}";

  const providers::HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key},
  };

  const auto response = http_client_->post_json(config_.base_url + "/embeddings", headers,
                                                body.str(), config_.timeout_ms);
  const auto status = providers::check_http_response(response);
  if (!status.ok()) {
    return common::Result<Batch>::failure(status.error());
  }
  return parse_embedding_response(response.body, texts.size(), dimensions_);
}

} // namespace rmm::memory
