#pragma once

#include "rmm/memory/candidate_index.hpp"
#include "rmm/memory/embedder.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace rmm::memory {

/// In-process memory bank: brute-force cosine search over embedded summaries.
class VectorMemoryBank final : public ICandidateIndex {
public:
  explicit VectorMemoryBank(std::shared_ptr<IEmbedder> embedder,
                            std::size_t max_elements = 100'000);

  [[nodiscard]] std::string_view name() const override { return "vector"; }
  [[nodiscard]] common::Result<std::vector<IndexMatch>> search(const std::string &query,
                                                               std::size_t k) override;
  [[nodiscard]] common::Status add(const IndexDocument &document) override;
  [[nodiscard]] common::Status update(const IndexDocument &document) override;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::optional<IndexDocument> get(const std::string &id) const;

private:
  struct Entry {
    IndexDocument document;
    std::vector<double> embedding;
    std::uint64_t sequence = 0;
  };

  std::shared_ptr<IEmbedder> embedder_;
  std::size_t max_elements_;
  std::uint64_t next_sequence_ = 0;
  std::unordered_map<std::string, Entry> entries_;
  mutable std::mutex mutex_;
};

[[nodiscard]] double cosine_similarity(const std::vector<double> &a, const std::vector<double> &b);

} // namespace rmm::memory
