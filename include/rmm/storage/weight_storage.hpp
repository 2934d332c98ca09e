#pragma once

#include "rmm/observability/observer.hpp"
#include "rmm/reranker/reranker.hpp"
#include "rmm/store/store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace rmm::storage {

inline constexpr const char *kWeightsKey = "reranker";

/// Appends [[row],[row],...] with round-trip precision.
void append_matrix(std::string &out, const reranker::Matrix &matrix);

/// Parses a dimension x dimension matrix; `name` prefixes error messages.
[[nodiscard]] common::Result<reranker::Matrix> parse_matrix(const std::string &array_json,
                                                            std::size_t dimension,
                                                            const char *name);

/// {"weights":{"queryTransform":[[..]],"memoryTransform":[[..]]},"config":{..},"updatedAt":ms}
[[nodiscard]] std::string serialize_state(const reranker::RerankerState &state,
                                          std::int64_t updated_at);

/// Rejects wrong matrix shapes, non-finite values and out-of-range config.
[[nodiscard]] common::Result<reranker::RerankerState> parse_state(const std::string &json,
                                                                  std::size_t dimension);

/// Per-user reranker state under [scope, user, "weights"].
class WeightStorage {
public:
  WeightStorage(std::shared_ptr<store::IKeyValueStore> store, std::string scope,
                std::size_t dimension,
                std::shared_ptr<observability::IObserver> observer = nullptr);

  /// nullopt on missing, invalid or unreadable data.
  [[nodiscard]] std::optional<reranker::RerankerState> load_weights(const std::string &user_id);

  /// Validates, stamps updatedAt, and overwrites. False without writing on
  /// invalid state or store failure.
  [[nodiscard]] bool save_weights(const std::string &user_id,
                                  const reranker::RerankerState &state);

  [[nodiscard]] store::Namespace namespace_for(const std::string &user_id) const;

private:
  void report(const std::string &operation, const std::string &user_id,
              const std::string &message);

  std::shared_ptr<store::IKeyValueStore> store_;
  std::string scope_;
  std::size_t dimension_;
  std::shared_ptr<observability::IObserver> observer_;
};

} // namespace rmm::storage
