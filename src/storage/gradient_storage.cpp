#include "rmm/storage/gradient_storage.hpp"

#include "rmm/common/id.hpp"
#include "rmm/common/json_util.hpp"
#include "rmm/observability/factory.hpp"
#include "rmm/storage/weight_storage.hpp"

#include <exception>

namespace rmm::storage {

namespace {

common::Status check_accumulator(const GradientAccumulator &accumulator,
                                 const std::size_t dimension) {
  const auto &query = accumulator.sum.query_transform;
  const auto &memory = accumulator.sum.memory_transform;
  if (query.rows() != dimension || query.cols() != dimension || memory.rows() != dimension ||
      memory.cols() != dimension) {
    return common::Status::error("gradient matrices must be " + std::to_string(dimension) + "x" +
                                 std::to_string(dimension));
  }
  if (!query.is_finite() || !memory.is_finite()) {
    return common::Status::error("gradient contains non-finite values");
  }
  return common::Status::success();
}

} // namespace

GradientAccumulator make_empty_accumulator(const std::size_t dimension,
                                           const std::size_t batch_index) {
  return GradientAccumulator{
      .sum = reranker::zero_step(dimension), .samples = 0, .batch_index = batch_index};
}

std::string serialize_accumulator(const GradientAccumulator &accumulator,
                                  const std::int64_t updated_at) {
  std::string out;
  out += R"({"samples":)";
  out += std::to_string(accumulator.samples);
  out += R"(,"batchIndex":)";
  out += std::to_string(accumulator.batch_index);
  out += R"(,"queryGradient":)";
  append_matrix(out, accumulator.sum.query_transform);
  out += R"(,"memoryGradient":)";
  append_matrix(out, accumulator.sum.memory_transform);
  out += R"(,"updatedAt":)";
  out += std::to_string(updated_at);
  out += '}';
  return out;
}

common::Result<GradientAccumulator> parse_accumulator(const std::string &json,
                                                      const std::size_t dimension) {
  using ResultT = common::Result<GradientAccumulator>;
  const auto samples = common::json_get_int(json, "samples");
  const auto batch_index = common::json_get_int(json, "batchIndex");
  if (!samples.has_value() || *samples < 0 || !batch_index.has_value() || *batch_index < 0) {
    return ResultT::failure("samples and batchIndex must be non-negative integers");
  }
  auto query = parse_matrix(common::json_get_array(json, "queryGradient"), dimension,
                            "queryGradient");
  if (!query.ok()) {
    return ResultT::failure(query.error());
  }
  auto memory = parse_matrix(common::json_get_array(json, "memoryGradient"), dimension,
                             "memoryGradient");
  if (!memory.ok()) {
    return ResultT::failure(memory.error());
  }

  GradientAccumulator accumulator{
      .sum = reranker::GradientStep{.query_transform = std::move(query.value()),
                                    .memory_transform = std::move(memory.value())},
      .samples = static_cast<std::size_t>(*samples),
      .batch_index = static_cast<std::size_t>(*batch_index),
  };
  if (auto status = check_accumulator(accumulator, dimension); !status.ok()) {
    return ResultT::failure(status.error());
  }
  return ResultT::success(std::move(accumulator));
}

GradientStorage::GradientStorage(std::shared_ptr<store::IKeyValueStore> store, std::string scope,
                                 const std::size_t dimension,
                                 std::shared_ptr<observability::IObserver> observer)
    : store_(std::move(store)), scope_(std::move(scope)), dimension_(dimension),
      observer_(observer != nullptr ? std::move(observer) : observability::noop_observer()) {}

store::Namespace GradientStorage::namespace_for(const std::string &user_id) const {
  return {scope_, user_id, "gradients"};
}

void GradientStorage::report(const std::string &operation, const std::string &user_id,
                             const std::string &message) {
  observer_->record_event(observability::PersistenceFailureEvent{
      .operation = operation, .user_id = user_id, .message = message});
}

std::optional<GradientAccumulator> GradientStorage::load(const std::string &user_id) {
  if (store_ == nullptr) {
    return std::nullopt;
  }

  common::Result<std::optional<store::StoreItem>> item =
      common::Result<std::optional<store::StoreItem>>::failure("not read");
  try {
    item = store_->get(namespace_for(user_id), kGradientKey);
  } catch (const std::exception &ex) {
    report("load_gradients", user_id, ex.what());
    return std::nullopt;
  } catch (...) {
    report("load_gradients", user_id, "non-standard exception");
    return std::nullopt;
  }
  if (!item.ok()) {
    report("load_gradients", user_id, item.error());
    return std::nullopt;
  }
  if (!item.value().has_value()) {
    return std::nullopt;
  }

  auto accumulator = parse_accumulator(item.value()->value, dimension_);
  if (!accumulator.ok()) {
    observer_->record_event(observability::WarningEvent{
        .component = "gradient_storage",
        .message = "ignoring stored gradients for " + user_id + ": " + accumulator.error()});
    return std::nullopt;
  }
  return std::move(accumulator.value());
}

bool GradientStorage::save(const std::string &user_id, const GradientAccumulator &accumulator) {
  if (store_ == nullptr) {
    return false;
  }
  if (auto status = check_accumulator(accumulator, dimension_); !status.ok()) {
    report("save_gradients", user_id, "invalid accumulator: " + status.error());
    return false;
  }

  try {
    auto status = store_->put(namespace_for(user_id), kGradientKey,
                              serialize_accumulator(accumulator, common::now_ms()));
    if (!status.ok()) {
      report("save_gradients", user_id, status.error());
      return false;
    }
  } catch (const std::exception &ex) {
    report("save_gradients", user_id, ex.what());
    return false;
  } catch (...) {
    report("save_gradients", user_id, "non-standard exception");
    return false;
  }
  return true;
}

} // namespace rmm::storage
