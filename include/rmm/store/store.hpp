#pragma once

#include "rmm/common/result.hpp"
#include "rmm/config/schema.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rmm::store {

using Namespace = std::vector<std::string>;

struct StoreItem {
  std::string value; // JSON document
  std::int64_t created_at = 0;
  std::int64_t updated_at = 0;
};

/// Durable key-value store with hierarchical namespaces. put() overwrites
/// unconditionally; the last writer wins.
class IKeyValueStore {
public:
  virtual ~IKeyValueStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::optional<StoreItem>> get(const Namespace &ns,
                                                                     const std::string &key) = 0;
  [[nodiscard]] virtual common::Status put(const Namespace &ns, const std::string &key,
                                           const std::string &value) = 0;
};

/// JSON array text of the namespace path, e.g. ["rmm","u1","weights"].
[[nodiscard]] std::string namespace_key(const Namespace &ns);

[[nodiscard]] common::Result<std::shared_ptr<IKeyValueStore>>
create_store(const config::StoreConfig &config);

} // namespace rmm::store
