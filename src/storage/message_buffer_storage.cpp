#include "rmm/storage/message_buffer_storage.hpp"

#include "rmm/common/id.hpp"
#include "rmm/common/json_util.hpp"
#include "rmm/observability/factory.hpp"

#include <exception>
#include <limits>

namespace rmm::storage {

MessageBuffer make_empty_buffer(const std::int64_t now) {
  return MessageBuffer{.messages = {},
                       .human_message_count = 0,
                       .last_message_timestamp = now,
                       .created_at = now,
                       .retry_count = std::nullopt};
}

MessageBuffer append_messages(MessageBuffer buffer,
                              const std::vector<memory::StoredMessage> &messages,
                              const std::int64_t now) {
  buffer.messages.insert(buffer.messages.end(), messages.begin(), messages.end());
  buffer.human_message_count = memory::count_human_messages(buffer.messages);
  buffer.last_message_timestamp = now;
  if (buffer.created_at == 0) {
    buffer.created_at = now;
  }
  return buffer;
}

std::string serialize_buffer(const MessageBuffer &buffer) {
  std::string out = R"({"messages":[)";
  for (std::size_t i = 0; i < buffer.messages.size(); ++i) {
    if (i > 0) {
      out += ',';
    }
    out += R"({"type":)" + common::json_quote(buffer.messages[i].type) +
           R"(,"content":)" + common::json_quote(buffer.messages[i].content) + "}";
  }
  out += R"(],"humanMessageCount":)" + std::to_string(buffer.human_message_count);
  out += R"(,"lastMessageTimestamp":)" + std::to_string(buffer.last_message_timestamp);
  out += R"(,"createdAt":)" + std::to_string(buffer.created_at);
  if (buffer.retry_count.has_value()) {
    out += R"(,"retryCount":)" + std::to_string(*buffer.retry_count);
  }
  out += '}';
  return out;
}

common::Status validate_buffer(const MessageBuffer &buffer) {
  if (buffer.last_message_timestamp < 0 || buffer.created_at < 0) {
    return common::Status::error("timestamps must be non-negative");
  }
  for (const auto &message : buffer.messages) {
    if (message.type.empty()) {
      return common::Status::error("message type must not be empty");
    }
  }
  return common::Status::success();
}

common::Result<MessageBuffer> parse_buffer(const std::string &json) {
  using ResultT = common::Result<MessageBuffer>;
  const std::string messages_json = common::json_get_array(json, "messages");
  if (messages_json.empty()) {
    return ResultT::failure("messages array is missing");
  }
  auto elements = common::json_split_array(messages_json);
  if (!elements.ok()) {
    return ResultT::failure(elements.error());
  }

  MessageBuffer buffer;
  buffer.messages.reserve(elements.value().size());
  for (const auto &element : elements.value()) {
    auto type = common::json_get_string(element, "type");
    auto content = common::json_get_string(element, "content");
    if (!type.has_value() || !content.has_value()) {
      return ResultT::failure("message needs string type and content");
    }
    buffer.messages.push_back(
        memory::StoredMessage{.type = std::move(*type), .content = std::move(*content)});
  }

  const auto human_count = common::json_get_int(json, "humanMessageCount");
  const auto last_timestamp = common::json_get_int(json, "lastMessageTimestamp");
  const auto created_at = common::json_get_int(json, "createdAt");
  if (!human_count.has_value() || *human_count < 0 || !last_timestamp.has_value() ||
      !created_at.has_value()) {
    return ResultT::failure("buffer counters are missing or invalid");
  }
  buffer.human_message_count = static_cast<std::size_t>(*human_count);
  buffer.last_message_timestamp = *last_timestamp;
  buffer.created_at = *created_at;
  if (const auto retry = common::json_get_int(json, "retryCount"); retry.has_value()) {
    if (*retry < 0 || *retry > std::numeric_limits<std::uint32_t>::max()) {
      return ResultT::failure("retryCount is out of range");
    }
    buffer.retry_count = static_cast<std::uint32_t>(*retry);
  }

  if (auto status = validate_buffer(buffer); !status.ok()) {
    return ResultT::failure(status.error());
  }
  return ResultT::success(std::move(buffer));
}

MessageBufferStorage::MessageBufferStorage(std::shared_ptr<store::IKeyValueStore> store,
                                           std::string scope,
                                           std::shared_ptr<observability::IObserver> observer)
    : store_(std::move(store)), scope_(std::move(scope)),
      observer_(observer != nullptr ? std::move(observer) : observability::noop_observer()) {}

store::Namespace MessageBufferStorage::namespace_for(const std::string &user_id,
                                                     const bool staging) const {
  store::Namespace ns{scope_, user_id, "buffer"};
  if (staging) {
    ns.emplace_back("staging");
  }
  return ns;
}

std::optional<store::StoreItem> MessageBufferStorage::read(const std::string &user_id,
                                                           const bool staging,
                                                           const char *operation) {
  if (store_ == nullptr) {
    return std::nullopt;
  }
  try {
    auto item = store_->get(namespace_for(user_id, staging), kBufferKey);
    if (!item.ok()) {
      observer_->record_event(observability::PersistenceFailureEvent{
          .operation = operation, .user_id = user_id, .message = item.error()});
      return std::nullopt;
    }
    return item.value();
  } catch (const std::exception &ex) {
    observer_->record_event(observability::PersistenceFailureEvent{
        .operation = operation, .user_id = user_id, .message = ex.what()});
    return std::nullopt;
  } catch (...) {
    observer_->record_event(observability::PersistenceFailureEvent{
        .operation = operation, .user_id = user_id, .message = "non-standard exception"});
    return std::nullopt;
  }
}

bool MessageBufferStorage::write(const std::string &user_id, const bool staging,
                                 const MessageBuffer &buffer, const char *operation) {
  if (store_ == nullptr) {
    return false;
  }
  if (auto status = validate_buffer(buffer); !status.ok()) {
    observer_->record_event(observability::PersistenceFailureEvent{
        .operation = operation, .user_id = user_id, .message = status.error()});
    return false;
  }
  try {
    auto status = store_->put(namespace_for(user_id, staging), kBufferKey,
                              serialize_buffer(buffer));
    if (!status.ok()) {
      observer_->record_event(observability::PersistenceFailureEvent{
          .operation = operation, .user_id = user_id, .message = status.error()});
      return false;
    }
  } catch (const std::exception &ex) {
    observer_->record_event(observability::PersistenceFailureEvent{
        .operation = operation, .user_id = user_id, .message = ex.what()});
    return false;
  } catch (...) {
    observer_->record_event(observability::PersistenceFailureEvent{
        .operation = operation, .user_id = user_id, .message = "non-standard exception"});
    return false;
  }
  return true;
}

MessageBuffer MessageBufferStorage::load_buffer(const std::string &user_id) {
  auto item = load_buffer_item(user_id);
  if (!item.has_value()) {
    return make_empty_buffer(common::now_ms());
  }
  return std::move(item->buffer);
}

std::optional<BufferItem> MessageBufferStorage::load_buffer_item(const std::string &user_id) {
  auto item = read(user_id, false, "load_buffer");
  if (!item.has_value()) {
    return std::nullopt;
  }
  auto buffer = parse_buffer(item->value);
  if (!buffer.ok()) {
    observer_->record_event(observability::WarningEvent{
        .component = "buffer_storage",
        .message = "ignoring stored buffer for " + user_id + ": " + buffer.error()});
    return std::nullopt;
  }
  return BufferItem{.buffer = std::move(buffer.value()), .updated_at = item->updated_at};
}

bool MessageBufferStorage::save_buffer(const std::string &user_id, const MessageBuffer &buffer) {
  return write(user_id, false, buffer, "save_buffer");
}

bool MessageBufferStorage::clear_buffer(const std::string &user_id) {
  return write(user_id, false, make_empty_buffer(common::now_ms()), "clear_buffer");
}

bool MessageBufferStorage::stage_buffer(const std::string &user_id, const MessageBuffer &buffer) {
  return write(user_id, true, buffer, "stage_buffer");
}

std::optional<MessageBuffer> MessageBufferStorage::load_staging_buffer(const std::string &user_id) {
  auto item = read(user_id, true, "load_staging_buffer");
  if (!item.has_value()) {
    return std::nullopt;
  }
  auto buffer = parse_buffer(item->value);
  if (!buffer.ok()) {
    observer_->record_event(observability::WarningEvent{
        .component = "buffer_storage",
        .message = "ignoring staged buffer for " + user_id + ": " + buffer.error()});
    return std::nullopt;
  }
  if (buffer.value().messages.empty()) {
    return std::nullopt;
  }
  return std::move(buffer.value());
}

bool MessageBufferStorage::clear_staging(const std::string &user_id) {
  return write(user_id, true, make_empty_buffer(common::now_ms()), "clear_staging");
}

} // namespace rmm::storage
