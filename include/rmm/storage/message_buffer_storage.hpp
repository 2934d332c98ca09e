#pragma once

#include "rmm/memory/types.hpp"
#include "rmm/observability/observer.hpp"
#include "rmm/store/store.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rmm::storage {

inline constexpr const char *kBufferKey = "message-buffer";

/// Messages awaiting prospective reflection.
struct MessageBuffer {
  std::vector<memory::StoredMessage> messages;
  std::size_t human_message_count = 0;
  std::int64_t last_message_timestamp = 0;
  std::int64_t created_at = 0;
  /// Failed reflection attempts on a staged snapshot.
  std::optional<std::uint32_t> retry_count;
};

[[nodiscard]] MessageBuffer make_empty_buffer(std::int64_t now);

/// Copy of `buffer` with `messages` appended and counters refreshed.
[[nodiscard]] MessageBuffer append_messages(MessageBuffer buffer,
                                            const std::vector<memory::StoredMessage> &messages,
                                            std::int64_t now);

[[nodiscard]] std::string serialize_buffer(const MessageBuffer &buffer);
[[nodiscard]] common::Result<MessageBuffer> parse_buffer(const std::string &json);
[[nodiscard]] common::Status validate_buffer(const MessageBuffer &buffer);

struct BufferItem {
  MessageBuffer buffer;
  std::int64_t updated_at = 0;
};

/// Main buffer under [scope, user, "buffer"], staging snapshot under
/// [scope, user, "buffer", "staging"], both at key "message-buffer".
class MessageBufferStorage {
public:
  MessageBufferStorage(std::shared_ptr<store::IKeyValueStore> store, std::string scope,
                       std::shared_ptr<observability::IObserver> observer = nullptr);

  /// Never absent: missing or invalid data yields an empty buffer.
  [[nodiscard]] MessageBuffer load_buffer(const std::string &user_id);
  /// Main buffer with the store's updated_at; nullopt when missing or unreadable.
  [[nodiscard]] std::optional<BufferItem> load_buffer_item(const std::string &user_id);
  [[nodiscard]] bool save_buffer(const std::string &user_id, const MessageBuffer &buffer);
  [[nodiscard]] bool clear_buffer(const std::string &user_id);

  [[nodiscard]] bool stage_buffer(const std::string &user_id, const MessageBuffer &buffer);
  /// nullopt when nothing is staged, including after clear_staging().
  [[nodiscard]] std::optional<MessageBuffer> load_staging_buffer(const std::string &user_id);
  [[nodiscard]] bool clear_staging(const std::string &user_id);

  [[nodiscard]] store::Namespace namespace_for(const std::string &user_id, bool staging) const;

private:
  std::optional<store::StoreItem> read(const std::string &user_id, bool staging,
                                       const char *operation);
  bool write(const std::string &user_id, bool staging, const MessageBuffer &buffer,
             const char *operation);

  std::shared_ptr<store::IKeyValueStore> store_;
  std::string scope_;
  std::shared_ptr<observability::IObserver> observer_;
};

} // namespace rmm::storage
