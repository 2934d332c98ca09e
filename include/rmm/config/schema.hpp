#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rmm::config {

struct RerankerConfig {
  std::size_t embedding_dimension = 1536;
  std::size_t top_k = 20;
  std::size_t top_m = 5;
  double temperature = 0.5;
  double learning_rate = 0.001;
  double baseline = 0.5;
  double clip_threshold = 100.0;
  /// Turns whose gradients are summed before the weights move; 1 updates every turn.
  std::size_t batch_size = 1;
};

struct ConsolidationConfig {
  std::size_t similar_k = 5;
};

struct ReflectionConfig {
  bool enabled = true;
  std::uint32_t min_turns = 2;
  std::uint32_t max_turns = 50;
  std::int64_t min_inactivity_ms = 600'000;
  std::int64_t max_inactivity_ms = 1'800'000;
  std::string mode = "strict"; // "strict" (AND) or "relaxed" (OR)
  std::uint32_t max_retries = 3;
};

struct StoreConfig {
  std::string backend = "sqlite";
  std::string path = "~/.rmm/rmm.db";
  std::string scope = "rmm";
};

struct EmbeddingConfig {
  std::string provider = "openai";
  std::string model = "text-embedding-3-small";
  std::string base_url = "https://api.openai.com/v1";
  std::optional<std::string> api_key;
  std::uint64_t timeout_ms = 30'000;
};

struct LlmConfig {
  std::string base_url = "https://api.openai.com/v1";
  std::string model = "gpt-4o-mini";
  double temperature = 0.0;
  std::optional<std::string> api_key;
  std::uint64_t timeout_ms = 30'000;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
};

struct Config {
  RerankerConfig reranker;
  ConsolidationConfig consolidation;
  ReflectionConfig reflection;
  StoreConfig store;
  EmbeddingConfig embedding;
  LlmConfig llm;
  ObservabilityConfig observability;
};

} // namespace rmm::config
