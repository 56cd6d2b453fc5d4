#include "sidecar/transcript/message.hpp"

#include "sidecar/common/json_util.hpp"

namespace sidecar::transcript {

MessageType message_type_from_string(const std::string_view value) {
  if (value == "user") {
    return MessageType::User;
  }
  if (value == "assistant") {
    return MessageType::Assistant;
  }
  if (value == "summary") {
    return MessageType::Summary;
  }
  if (value == "progress") {
    return MessageType::Progress;
  }
  if (value == "file-history-snapshot") {
    return MessageType::FileHistorySnapshot;
  }
  return MessageType::Other;
}

Role role_from_string(const std::string_view value) {
  if (value == "user") {
    return Role::User;
  }
  if (value == "assistant") {
    return Role::Assistant;
  }
  return Role::None;
}

bool Message::operator==(const Message &other) const {
  return type == other.type && type_name == other.type_name && role == other.role &&
         content == other.content && uuid == other.uuid && parent_uuid == other.parent_uuid &&
         timestamp == other.timestamp;
}

std::string raw_string_field(const Message &message, const std::string &field) {
  if (message.raw == nullptr) {
    return "";
  }
  return common::json_get_string(*message.raw, field);
}

} // namespace sidecar::transcript
