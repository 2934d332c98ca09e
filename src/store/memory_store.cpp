#include "rmm/store/memory_store.hpp"

#include "rmm/common/id.hpp"

namespace rmm::store {

common::Result<std::optional<StoreItem>> InMemoryStore::get(const Namespace &ns,
                                                            const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = items_.find({namespace_key(ns), key});
  if (it == items_.end()) {
    return common::Result<std::optional<StoreItem>>::success(std::nullopt);
  }
  return common::Result<std::optional<StoreItem>>::success(it->second);
}

common::Status InMemoryStore::put(const Namespace &ns, const std::string &key,
                                  const std::string &value) {
  const std::int64_t now = common::now_ms();
  std::lock_guard<std::mutex> lock(mutex_);
  auto &item = items_[{namespace_key(ns), key}];
  if (item.created_at == 0) {
    item.created_at = now;
  }
  item.value = value;
  item.updated_at = now;
  return common::Status::success();
}

std::size_t InMemoryStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

} // namespace rmm::store
