#pragma once

#include "rmm/observability/observer.hpp"
#include "rmm/reranker/weight_update.hpp"
#include "rmm/store/store.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace rmm::storage {

inline constexpr const char *kGradientKey = "gradient";

/// Summed REINFORCE steps for turns not yet applied to the weights.
struct GradientAccumulator {
  reranker::GradientStep sum;
  std::size_t samples = 0;
  /// Number of batches applied so far.
  std::size_t batch_index = 0;
};

[[nodiscard]] GradientAccumulator make_empty_accumulator(std::size_t dimension,
                                                         std::size_t batch_index = 0);

/// {"samples":n,"batchIndex":n,"queryGradient":[[..]],"memoryGradient":[[..]],"updatedAt":ms}
[[nodiscard]] std::string serialize_accumulator(const GradientAccumulator &accumulator,
                                                std::int64_t updated_at);
[[nodiscard]] common::Result<GradientAccumulator> parse_accumulator(const std::string &json,
                                                                    std::size_t dimension);

/// Per-user gradient accumulator under [scope, user, "gradients"].
class GradientStorage {
public:
  GradientStorage(std::shared_ptr<store::IKeyValueStore> store, std::string scope,
                  std::size_t dimension,
                  std::shared_ptr<observability::IObserver> observer = nullptr);

  /// nullopt on missing, invalid or unreadable data.
  [[nodiscard]] std::optional<GradientAccumulator> load(const std::string &user_id);

  /// False without writing on a shape mismatch, non-finite values or store failure.
  [[nodiscard]] bool save(const std::string &user_id, const GradientAccumulator &accumulator);

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
