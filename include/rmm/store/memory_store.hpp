#pragma once

#include "rmm/store/store.hpp"

#include <map>
#include <mutex>
#include <utility>

namespace rmm::store {

class InMemoryStore final : public IKeyValueStore {
public:
  [[nodiscard]] std::string_view name() const override { return "memory"; }
  [[nodiscard]] common::Result<std::optional<StoreItem>> get(const Namespace &ns,
                                                             const std::string &key) override;
  [[nodiscard]] common::Status put(const Namespace &ns, const std::string &key,
                                   const std::string &value) override;

  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, StoreItem> items_;
};

} // namespace rmm::store
