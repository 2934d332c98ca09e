#include "rmm/storage/weight_storage.hpp"

#include "rmm/common/id.hpp"
#include "rmm/common/json_util.hpp"
#include "rmm/observability/factory.hpp"

#include <exception>

namespace rmm::storage {

void append_matrix(std::string &out, const reranker::Matrix &matrix) {
  out += '[';
  for (std::size_t r = 0; r < matrix.rows(); ++r) {
    if (r > 0) {
      out += ',';
    }
    out += '[';
    for (std::size_t c = 0; c < matrix.cols(); ++c) {
      if (c > 0) {
        out += ',';
      }
      out += common::json_number(matrix.at(r, c));
    }
    out += ']';
  }
  out += ']';
}

common::Result<reranker::Matrix> parse_matrix(const std::string &array_json,
                                              const std::size_t dimension, const char *name) {
  using ResultT = common::Result<reranker::Matrix>;
  if (array_json.empty()) {
    return ResultT::failure(std::string(name) + " is missing");
  }
  auto rows = common::json_split_array(array_json);
  if (!rows.ok()) {
    return ResultT::failure(std::string(name) + ": " + rows.error());
  }
  if (rows.value().size() != dimension) {
    return ResultT::failure(std::string(name) + " has " + std::to_string(rows.value().size()) +
                            " rows, expected " + std::to_string(dimension));
  }

  reranker::Matrix matrix(dimension, dimension);
  for (std::size_t r = 0; r < dimension; ++r) {
    auto values = common::json_parse_number_array(rows.value()[r]);
    if (!values.ok()) {
      return ResultT::failure(std::string(name) + " row " + std::to_string(r) + ": " +
                              values.error());
    }
    if (values.value().size() != dimension) {
      return ResultT::failure(std::string(name) + " row " + std::to_string(r) + " has " +
                              std::to_string(values.value().size()) + " columns");
    }
    for (std::size_t c = 0; c < dimension; ++c) {
      matrix.at(r, c) = values.value()[c];
    }
  }
  return ResultT::success(std::move(matrix));
}

std::string serialize_state(const reranker::RerankerState &state, const std::int64_t updated_at) {
  std::string out;
  const std::size_t dim = state.weights.query_transform.rows();
  out.reserve(64 + dim * dim * 2 * 24);
  out += R"({"weights":{"queryTransform":)";
  append_matrix(out, state.weights.query_transform);
  out += R"(,"memoryTransform":)";
  append_matrix(out, state.weights.memory_transform);
  out += R"(},"config":{"topK":)";
  out += std::to_string(state.config.top_k);
  out += R"(,"topM":)";
  out += std::to_string(state.config.top_m);
  out += R"(,"temperature":)";
  out += common::json_number(state.config.temperature);
  out += R"(,"learningRate":)";
  out += common::json_number(state.config.learning_rate);
  out += R"(,"baseline":)";
  out += common::json_number(state.config.baseline);
  out += R"(},"updatedAt":)";
  out += std::to_string(updated_at);
  out += '}';
  return out;
}

common::Result<reranker::RerankerState> parse_state(const std::string &json,
                                                    const std::size_t dimension) {
  using ResultT = common::Result<reranker::RerankerState>;

  const std::string weights = common::json_get_object(json, "weights");
  if (weights.empty()) {
    return ResultT::failure("weights object is missing");
  }
  auto query = parse_matrix(common::json_get_array(weights, "queryTransform"), dimension,
                            "queryTransform");
  if (!query.ok()) {
    return ResultT::failure(query.error());
  }
  auto memory = parse_matrix(common::json_get_array(weights, "memoryTransform"), dimension,
                             "memoryTransform");
  if (!memory.ok()) {
    return ResultT::failure(memory.error());
  }

  const std::string config = common::json_get_object(json, "config");
  if (config.empty()) {
    return ResultT::failure("config object is missing");
  }
  const auto top_k = common::json_get_int(config, "topK");
  const auto top_m = common::json_get_int(config, "topM");
  const auto temperature = common::json_get_double(config, "temperature");
  const auto learning_rate = common::json_get_double(config, "learningRate");
  const auto baseline = common::json_get_double(config, "baseline");
  if (!top_k.has_value() || !top_m.has_value() || !temperature.has_value() ||
      !learning_rate.has_value() || !baseline.has_value()) {
    return ResultT::failure("config is missing a required field");
  }
  if (*top_k <= 0 || *top_m <= 0) {
    return ResultT::failure("topK and topM must be positive integers");
  }

  reranker::RerankerState state{
      .weights = reranker::RerankerWeights{.query_transform = std::move(query.value()),
                                           .memory_transform = std::move(memory.value())},
      .config =
          reranker::Hyperparameters{
              .top_k = static_cast<std::size_t>(*top_k),
              .top_m = static_cast<std::size_t>(*top_m),
              .temperature = *temperature,
              .learning_rate = *learning_rate,
              .baseline = *baseline,
          },
      .updated_at = common::json_get_int(json, "updatedAt"),
  };
  if (auto status = reranker::validate_state(state, dimension); !status.ok()) {
    return ResultT::failure(status.error());
  }
  return ResultT::success(std::move(state));
}

WeightStorage::WeightStorage(std::shared_ptr<store::IKeyValueStore> store, std::string scope,
                             const std::size_t dimension,
                             std::shared_ptr<observability::IObserver> observer)
    : store_(std::move(store)), scope_(std::move(scope)), dimension_(dimension),
      observer_(observer != nullptr ? std::move(observer) : observability::noop_observer()) {}

store::Namespace WeightStorage::namespace_for(const std::string &user_id) const {
  return {scope_, user_id, "weights"};
}

void WeightStorage::report(const std::string &operation, const std::string &user_id,
                           const std::string &message) {
  observer_->record_event(observability::PersistenceFailureEvent{
      .operation = operation, .user_id = user_id, .message = message});
}

std::optional<reranker::RerankerState> WeightStorage::load_weights(const std::string &user_id) {
  if (store_ == nullptr) {
    return std::nullopt;
  }

  common::Result<std::optional<store::StoreItem>> item =
      common::Result<std::optional<store::StoreItem>>::failure("not read");
  try {
    item = store_->get(namespace_for(user_id), kWeightsKey);
  } catch (const std::exception &ex) {
    report("load_weights", user_id, ex.what());
    return std::nullopt;
  } catch (...) {
    report("load_weights", user_id, "non-standard exception");
    return std::nullopt;
  }
  if (!item.ok()) {
    report("load_weights", user_id, item.error());
    return std::nullopt;
  }
  if (!item.value().has_value()) {
    return std::nullopt;
  }

  auto state = parse_state(item.value()->value, dimension_);
  if (!state.ok()) {
    observer_->record_event(observability::WarningEvent{
        .component = "weight_storage",
        .message = "ignoring stored weights for " + user_id + ": " + state.error()});
    return std::nullopt;
  }
  return std::move(state.value());
}

bool WeightStorage::save_weights(const std::string &user_id,
                                 const reranker::RerankerState &state) {
  if (store_ == nullptr) {
    return false;
  }
  if (auto status = reranker::validate_state(state, dimension_); !status.ok()) {
    report("save_weights", user_id, "invalid state: " + status.error());
    return false;
  }

  const std::string payload = serialize_state(state, common::now_ms());
  try {
    auto status = store_->put(namespace_for(user_id), kWeightsKey, payload);
    if (!status.ok()) {
      report("save_weights", user_id, status.error());
      return false;
    }
  } catch (const std::exception &ex) {
    report("save_weights", user_id, ex.what());
    return false;
  } catch (...) {
    report("save_weights", user_id, "non-standard exception");
    return false;
  }
  return true;
}

} // namespace rmm::storage
