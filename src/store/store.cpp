#include "rmm/store/store.hpp"

#include "rmm/common/fs.hpp"
#include "rmm/common/json_util.hpp"
#include "rmm/store/memory_store.hpp"
#include "rmm/store/sqlite_store.hpp"

namespace rmm::store {

std::string namespace_key(const Namespace &ns) {
  std::string out = "[";
  for (std::size_t i = 0; i < ns.size(); ++i) {
    if (i > 0) {
      out += ',';
    }
    out += common::json_quote(ns[i]);
  }
  out += ']';
  return out;
}

common::Result<std::shared_ptr<IKeyValueStore>> create_store(const config::StoreConfig &config) {
  using ResultT = common::Result<std::shared_ptr<IKeyValueStore>>;
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend == "memory") {
    return ResultT::success(std::make_shared<InMemoryStore>());
  }
  if (backend == "sqlite") {
    const std::string path = common::expand_path(config.path);
    auto sqlite = std::make_shared<SqliteStore>(path);
    if (!sqlite->open_error().empty()) {
      return ResultT::failure("failed to open store at " + path + ": " + sqlite->open_error());
    }
    return ResultT::success(std::move(sqlite));
  }
  return ResultT::failure("unknown store backend: " + config.backend);
}

} // namespace rmm::store
