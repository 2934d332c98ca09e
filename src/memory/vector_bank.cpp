#include "rmm/memory/vector_bank.hpp"

#include <algorithm>
#include <cmath>

namespace rmm::memory {

double cosine_similarity(const std::vector<double> &a, const std::vector<double> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += a[i] * b[i];
    norm_a += a[i] * a[i];
    norm_b += b[i] * b[i];
  }

  if (norm_a < 1e-12 || norm_b < 1e-12) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

VectorMemoryBank::VectorMemoryBank(std::shared_ptr<IEmbedder> embedder,
                                   const std::size_t max_elements)
    : embedder_(std::move(embedder)), max_elements_(max_elements) {}

common::Result<std::vector<IndexMatch>> VectorMemoryBank::search(const std::string &query,
                                                                 const std::size_t k) {
  auto query_embedding = embedder_->embed(query);
  if (!query_embedding.ok()) {
    return common::Result<std::vector<IndexMatch>>::failure("query embedding failed: " +
                                                            query_embedding.error());
  }

  struct Scored {
    const Entry *entry;
    double score;
  };

  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Scored> scored;
  scored.reserve(entries_.size());
  for (const auto &[id, entry] : entries_) {
    (void)id;
    scored.push_back({&entry, cosine_similarity(query_embedding.value(), entry.embedding)});
  }
  // Ties resolve to insertion order so results are stable across runs.
  std::sort(scored.begin(), scored.end(), [](const Scored &lhs, const Scored &rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.entry->sequence < rhs.entry->sequence;
  });
  if (scored.size() > k) {
    scored.resize(k);
  }

  std::vector<IndexMatch> matches;
  matches.reserve(scored.size());
  for (const auto &item : scored) {
    const auto &doc = item.entry->document;
    matches.push_back(IndexMatch{.content = doc.content,
                                 .metadata = IndexMetadata{.id = doc.id,
                                                           .session_id = doc.session_id,
                                                           .turn_references = doc.turn_references,
                                                           .timestamp = doc.timestamp,
                                                           .raw_dialogue = doc.raw_dialogue},
                                 .score = item.score});
  }
  return common::Result<std::vector<IndexMatch>>::success(std::move(matches));
}

common::Status VectorMemoryBank::add(const IndexDocument &document) {
  if (document.id.empty()) {
    return common::Status::error("document id is required");
  }
  auto embedding = embedder_->embed(document.content);
  if (!embedding.ok()) {
    return common::Status::error("document embedding failed: " + embedding.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.contains(document.id)) {
    return common::Status::error("document already exists: " + document.id);
  }
  if (entries_.size() >= max_elements_) {
    return common::Status::error("memory bank full");
  }
  entries_[document.id] =
      Entry{.document = document, .embedding = std::move(embedding.value()), .sequence = next_sequence_++};
  return common::Status::success();
}

common::Status VectorMemoryBank::update(const IndexDocument &document) {
  auto embedding = embedder_->embed(document.content);
  if (!embedding.ok()) {
    return common::Status::error("document embedding failed: " + embedding.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(document.id);
  if (it == entries_.end()) {
    return common::Status::error("document not found: " + document.id);
  }
  it->second.document = document;
  it->second.embedding = std::move(embedding.value());
  return common::Status::success();
}

std::size_t VectorMemoryBank::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::optional<IndexDocument> VectorMemoryBank::get(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.document;
}

} // namespace rmm::memory
