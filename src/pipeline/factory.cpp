#include "rmm/pipeline/factory.hpp"

#include "rmm/config/config.hpp"
#include "rmm/memory/embedder.hpp"
#include "rmm/memory/vector_bank.hpp"
#include "rmm/observability/factory.hpp"
#include "rmm/providers/compatible.hpp"
#include "rmm/store/store.hpp"

#include <stdexcept>

namespace rmm::pipeline {

common::Result<std::unique_ptr<TurnPipeline>> create_pipeline(const config::Config &config) {
  using ResultT = common::Result<std::unique_ptr<TurnPipeline>>;

  auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return ResultT::failure("invalid config: " + validated.error());
  }
  const auto &cfg = validated.value();

  auto observer = observability::create_observer(cfg);
  auto embedder = memory::create_embedder(cfg);
  if (!embedder.ok()) {
    return ResultT::failure(embedder.error());
  }
  auto store = store::create_store(cfg.store);
  if (!store.ok()) {
    return ResultT::failure(store.error());
  }

  PipelineDependencies deps{
      .config = cfg,
      .embedder = embedder.value(),
      .index = std::make_shared<memory::VectorMemoryBank>(embedder.value()),
      .llm = std::make_shared<providers::CompatibleLlmClient>(cfg.llm),
      .store = store.value(),
      .observer = std::move(observer),
      .seed = std::nullopt,
  };
  try {
    return ResultT::success(std::make_unique<TurnPipeline>(std::move(deps)));
  } catch (const std::invalid_argument &ex) {
    return ResultT::failure(ex.what());
  }
}

} // namespace rmm::pipeline
