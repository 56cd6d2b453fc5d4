#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sidecar::transcript {

enum class MessageType {
  User,
  Assistant,
  Summary,
  Progress,
  FileHistorySnapshot,
  Other,
};

enum class Role {
  None,
  User,
  Assistant,
};

[[nodiscard]] MessageType message_type_from_string(std::string_view value);
[[nodiscard]] Role role_from_string(std::string_view value);

struct TextBlock {
  std::string text;

  bool operator==(const TextBlock &) const = default;
};

/// A tool call recorded by the assistant. String-valued inputs are stored
/// decoded; any other input value keeps its JSON text.
struct ToolInvocationBlock {
  std::string name;
  std::map<std::string, std::string> parameters;

  bool operator==(const ToolInvocationBlock &) const = default;
};

struct ToolResultBlock {
  std::string reference_id;

  bool operator==(const ToolResultBlock &) const = default;
};

using ContentBlock = std::variant<TextBlock, ToolInvocationBlock, ToolResultBlock>;

struct Message {
  MessageType type = MessageType::Other;
  /// Record type exactly as it appeared in the source, for types we do not model.
  std::string type_name;
  Role role = Role::None;
  std::vector<ContentBlock> content;
  std::string uuid;
  std::string parent_uuid;
  std::string timestamp;
  /// Original JSON record. Shared so copies stay cheap; null for synthesized messages.
  std::shared_ptr<const std::string> raw;

  /// Compares everything except the raw record.
  [[nodiscard]] bool operator==(const Message &other) const;
};

/// Top-level string field of the original record, empty when absent.
[[nodiscard]] std::string raw_string_field(const Message &message, const std::string &field);

struct TranscriptSession {
  std::string session_id;
  std::vector<Message> messages;
};

} // namespace sidecar::transcript
