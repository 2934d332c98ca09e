#include "rmm/config/config.hpp"

#include "rmm/common/fs.hpp"
#include "rmm/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace rmm::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".rmm";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("RMM_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

// Negative values map to 0 so validation reports them instead of wrapping.
std::size_t read_size(const common::TomlDocument &doc, const std::string &key,
                      const std::size_t fallback) {
  const std::int64_t value = doc.get_i64(key, static_cast<std::int64_t>(fallback));
  return value < 0 ? 0 : static_cast<std::size_t>(value);
}

std::uint32_t read_u32(const common::TomlDocument &doc, const std::string &key,
                       const std::uint32_t fallback) {
  const std::int64_t value = doc.get_i64(key, fallback);
  return value < 0 ? 0 : static_cast<std::uint32_t>(value);
}

std::optional<std::string> read_secret(const common::TomlDocument &doc, const std::string &key,
                                       const std::optional<std::string> &fallback) {
  if (!doc.has(key)) {
    return fallback;
  }
  const std::string value = common::expand_path(doc.get_string(key));
  if (common::trim(value).empty()) {
    return std::nullopt;
  }
  return value;
}

common::Result<Config> invalid(const std::string &message) {
  return common::Result<Config>::failure(message);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const auto key = env_value("RMM_API_KEY"); key.has_value()) {
    config.embedding.api_key = key;
    config.llm.api_key = key;
  }
  if (const auto key = env_value("RMM_EMBEDDING_API_KEY"); key.has_value()) {
    config.embedding.api_key = key;
  }
  if (const auto key = env_value("RMM_LLM_API_KEY"); key.has_value()) {
    config.llm.api_key = key;
  }
  if (const auto model = env_value("RMM_LLM_MODEL"); model.has_value()) {
    config.llm.model = *model;
  }
  if (const auto path = env_value("RMM_STORE_PATH"); path.has_value()) {
    config.store.path = *path;
  }
  if (const auto level = env_value("RMM_LOG_LEVEL"); level.has_value()) {
    config.observability.log_level = *level;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();
  Config config;

  auto &reranker = config.reranker;
  reranker.embedding_dimension =
      read_size(doc, "reranker.embedding_dimension", reranker.embedding_dimension);
  reranker.top_k = read_size(doc, "reranker.top_k", reranker.top_k);
  reranker.top_m = read_size(doc, "reranker.top_m", reranker.top_m);
  reranker.temperature = doc.get_double("reranker.temperature", reranker.temperature);
  reranker.learning_rate = doc.get_double("reranker.learning_rate", reranker.learning_rate);
  reranker.baseline = doc.get_double("reranker.baseline", reranker.baseline);
  reranker.clip_threshold = doc.get_double("reranker.clip_threshold", reranker.clip_threshold);
  reranker.batch_size = read_size(doc, "reranker.batch_size", reranker.batch_size);

  config.consolidation.similar_k =
      read_size(doc, "consolidation.similar_k", config.consolidation.similar_k);

  auto &reflection = config.reflection;
  reflection.enabled = doc.get_bool("reflection.enabled", reflection.enabled);
  reflection.min_turns = read_u32(doc, "reflection.min_turns", reflection.min_turns);
  reflection.max_turns = read_u32(doc, "reflection.max_turns", reflection.max_turns);
  reflection.min_inactivity_ms =
      doc.get_i64("reflection.min_inactivity_ms", reflection.min_inactivity_ms);
  reflection.max_inactivity_ms =
      doc.get_i64("reflection.max_inactivity_ms", reflection.max_inactivity_ms);
  reflection.mode = doc.get_string("reflection.mode", reflection.mode);
  reflection.max_retries = read_u32(doc, "reflection.max_retries", reflection.max_retries);

  config.store.backend = doc.get_string("store.backend", config.store.backend);
  config.store.path = common::expand_path(doc.get_string("store.path", config.store.path));
  config.store.scope = doc.get_string("store.scope", config.store.scope);

  auto &embedding = config.embedding;
  embedding.provider = doc.get_string("embedding.provider", embedding.provider);
  embedding.model = doc.get_string("embedding.model", embedding.model);
  embedding.base_url = doc.get_string("embedding.base_url", embedding.base_url);
  embedding.api_key = read_secret(doc, "embedding.api_key", embedding.api_key);
  embedding.timeout_ms = static_cast<std::uint64_t>(
      doc.get_i64("embedding.timeout_ms", static_cast<std::int64_t>(embedding.timeout_ms)));

  auto &llm = config.llm;
  llm.base_url = doc.get_string("llm.base_url", llm.base_url);
  llm.model = doc.get_string("llm.model", llm.model);
  llm.temperature = doc.get_double("llm.temperature", llm.temperature);
  llm.api_key = read_secret(doc, "llm.api_key", llm.api_key);
  llm.timeout_ms = static_cast<std::uint64_t>(
      doc.get_i64("llm.timeout_ms", static_cast<std::int64_t>(llm.timeout_ms)));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.error());
  }

  const auto &path = path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    config.store.path = common::expand_path(config.store.path);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Status::error(path_result.error());
  }

  const std::filesystem::path path = path_result.value();
  if (!path.parent_path().empty()) {
    const auto dir = common::ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return common::Status::error(dir.error());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  const auto &reranker = config.reranker;
  file << "[reranker]\n";
  file << "embedding_dimension = " << reranker.embedding_dimension << "\n";
  file << "top_k = " << reranker.top_k << "\n";
  file << "top_m = " << reranker.top_m << "\n";
  file << "temperature = " << reranker.temperature << "\n";
  file << "learning_rate = " << reranker.learning_rate << "\n";
  file << "baseline = " << reranker.baseline << "\n";
  file << "clip_threshold = " << reranker.clip_threshold << "\n";
  file << "batch_size = " << reranker.batch_size << "\n";

  file << "\n[consolidation]\n";
  file << "similar_k = " << config.consolidation.similar_k << "\n";

  const auto &reflection = config.reflection;
  file << "\n[reflection]\n";
  file << "enabled = " << (reflection.enabled ? "true" : "false") << "\n";
  file << "min_turns = " << reflection.min_turns << "\n";
  file << "max_turns = " << reflection.max_turns << "\n";
  file << "min_inactivity_ms = " << reflection.min_inactivity_ms << "\n";
  file << "max_inactivity_ms = " << reflection.max_inactivity_ms << "\n";
  file << "mode = " << common::quote_toml_string(reflection.mode) << "\n";
  file << "max_retries = " << reflection.max_retries << "\n";

  file << "\n[store]\n";
  file << "backend = " << common::quote_toml_string(config.store.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.store.path) << "\n";
  file << "scope = " << common::quote_toml_string(config.store.scope) << "\n";

  file << "\n[embedding]\n";
  file << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
  file << "base_url = " << common::quote_toml_string(config.embedding.base_url) << "\n";
  if (config.embedding.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.embedding.api_key) << "\n";
  }
  file << "timeout_ms = " << config.embedding.timeout_ms << "\n";

  file << "\n[llm]\n";
  file << "base_url = " << common::quote_toml_string(config.llm.base_url) << "\n";
  file << "model = " << common::quote_toml_string(config.llm.model) << "\n";
  file << "temperature = " << config.llm.temperature << "\n";
  if (config.llm.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.llm.api_key) << "\n";
  }
  file << "timeout_ms = " << config.llm.timeout_ms << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Result<Config> validate_config(const Config &config) {
  Config normalized = config;

  const auto &reranker = config.reranker;
  if (reranker.embedding_dimension == 0) {
    return invalid("reranker.embedding_dimension must be > 0");
  }
  if (reranker.top_k == 0) {
    return invalid("reranker.top_k must be > 0");
  }
  if (reranker.top_m == 0) {
    return invalid("reranker.top_m must be > 0");
  }
  if (reranker.top_m > reranker.top_k) {
    return invalid("reranker.top_m must not exceed reranker.top_k");
  }
  if (!(reranker.temperature > 0.0)) {
    return invalid("reranker.temperature must be > 0");
  }
  if (!(reranker.learning_rate > 0.0)) {
    return invalid("reranker.learning_rate must be > 0");
  }
  if (!(reranker.baseline >= 0.0 && reranker.baseline <= 1.0)) {
    return invalid("reranker.baseline must be between 0.0 and 1.0");
  }
  if (!(reranker.clip_threshold > 0.0)) {
    return invalid("reranker.clip_threshold must be > 0");
  }
  if (reranker.batch_size == 0) {
    return invalid("reranker.batch_size must be > 0");
  }

  if (config.consolidation.similar_k == 0) {
    return invalid("consolidation.similar_k must be > 0");
  }

  const auto &reflection = config.reflection;
  normalized.reflection.mode = common::to_lower(common::trim(reflection.mode));
  if (normalized.reflection.mode != "strict" && normalized.reflection.mode != "relaxed") {
    return invalid("Invalid reflection.mode: " + reflection.mode);
  }
  if (reflection.min_turns == 0) {
    return invalid("reflection.min_turns must be > 0");
  }
  if (reflection.min_turns > reflection.max_turns) {
    return invalid("reflection.min_turns must not exceed reflection.max_turns");
  }
  if (reflection.min_inactivity_ms < 0 ||
      reflection.min_inactivity_ms > reflection.max_inactivity_ms) {
    return invalid("reflection.min_inactivity_ms must be between 0 and max_inactivity_ms");
  }

  normalized.store.backend = common::to_lower(common::trim(config.store.backend));
  if (normalized.store.backend != "sqlite" && normalized.store.backend != "memory") {
    return invalid("Invalid store.backend: " + config.store.backend);
  }
  if (normalized.store.backend == "sqlite" && common::trim(config.store.path).empty()) {
    return invalid("store.path is required for the sqlite backend");
  }
  if (common::trim(config.store.scope).empty()) {
    return invalid("store.scope must not be empty");
  }

  normalized.embedding.provider = common::to_lower(common::trim(config.embedding.provider));
  if (normalized.embedding.provider != "openai" && normalized.embedding.provider != "local") {
    return invalid("Invalid embedding.provider: " + config.embedding.provider);
  }
  if (normalized.embedding.provider == "openai" && common::trim(config.embedding.model).empty()) {
    return invalid("embedding.model is required for the openai provider");
  }

  if (common::trim(config.llm.base_url).empty()) {
    return invalid("llm.base_url must not be empty");
  }
  if (config.llm.temperature < 0.0 || config.llm.temperature > 2.0) {
    return invalid("llm.temperature must be between 0.0 and 2.0");
  }

  normalized.observability.log_level =
      common::to_lower(common::trim(config.observability.log_level));
  const auto &level = normalized.observability.log_level;
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    return invalid("Invalid observability.log_level: " + config.observability.log_level);
  }

  return common::Result<Config>::success(std::move(normalized));
}

} // namespace rmm::config
