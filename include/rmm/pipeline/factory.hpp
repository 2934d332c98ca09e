#pragma once

#include "rmm/common/result.hpp"
#include "rmm/config/schema.hpp"
#include "rmm/pipeline/turn_pipeline.hpp"

#include <memory>

namespace rmm::pipeline {

/// Validate `config` and wire every collaborator it names: observer,
/// embedder, in-process memory bank, LLM client and durable store.
[[nodiscard]] common::Result<std::unique_ptr<TurnPipeline>>
create_pipeline(const config::Config &config);

} // namespace rmm::pipeline
