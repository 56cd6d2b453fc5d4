#include "sidecar/transcript/reader.hpp"

#include "sidecar/common/fs.hpp"
#include "sidecar/common/json_util.hpp"
#include "sidecar/observability/global.hpp"

#include <sstream>

namespace sidecar::transcript {

namespace {

std::string member_string(const common::JsonRawMap &members, const std::string &key) {
  const auto it = members.find(key);
  return it == members.end() ? std::string() : common::json_as_string(it->second);
}

std::map<std::string, std::string> parse_tool_input(const std::string &raw_input) {
  std::map<std::string, std::string> parameters;
  for (const auto &[key, value] : common::json_parse_object_raw(raw_input)) {
    if (common::json_kind(value) == common::JsonKind::String) {
      parameters[key] = common::json_as_string(value);
    } else {
      parameters[key] = value;
    }
  }
  return parameters;
}

// Blocks of kinds we do not model (thinking, image, ...) yield nullopt.
std::optional<ContentBlock> parse_block(const std::string &raw_block) {
  const auto members = common::json_parse_object_raw(raw_block);
  const std::string kind = member_string(members, "type");
  if (kind == "text") {
    return TextBlock{.text = member_string(members, "text")};
  }
  if (kind == "tool_use") {
    ToolInvocationBlock block{.name = member_string(members, "name"), .parameters = {}};
    if (const auto it = members.find("input"); it != members.end()) {
      block.parameters = parse_tool_input(it->second);
    }
    return block;
  }
  if (kind == "tool_result") {
    return ToolResultBlock{.reference_id = member_string(members, "tool_use_id")};
  }
  return std::nullopt;
}

std::vector<ContentBlock> parse_content(const std::string &raw_content) {
  std::vector<ContentBlock> blocks;
  switch (common::json_kind(raw_content)) {
  case common::JsonKind::String:
    blocks.push_back(TextBlock{.text = common::json_as_string(raw_content)});
    break;
  case common::JsonKind::Array:
    for (const auto &raw_block : common::json_split_top_level_objects(raw_content)) {
      if (auto block = parse_block(raw_block); block.has_value()) {
        blocks.push_back(std::move(*block));
      }
    }
    break;
  default:
    break;
  }
  return blocks;
}

} // namespace

std::optional<Message> parse_transcript_line(const std::string &line) {
  const std::string trimmed = common::trim(line);
  if (trimmed.empty() || common::json_kind(trimmed) != common::JsonKind::Object ||
      !common::json_validate(trimmed)) {
    return std::nullopt;
  }

  const auto members = common::json_parse_object_raw(trimmed);
  Message message;
  message.type_name = member_string(members, "type");
  message.type = message_type_from_string(message.type_name);
  message.uuid = member_string(members, "uuid");
  message.parent_uuid = member_string(members, "parentUuid");
  message.timestamp = member_string(members, "timestamp");

  if (message.type == MessageType::User || message.type == MessageType::Assistant) {
    std::string inner;
    if (const auto it = members.find("message");
        it != members.end() && common::json_kind(it->second) == common::JsonKind::Object) {
      inner = it->second;
    }
    const auto inner_members = common::json_parse_object_raw(inner);
    const auto role_it = inner_members.find("role");
    message.role = role_from_string(role_it == inner_members.end()
                                        ? message.type_name
                                        : common::json_as_string(role_it->second));
    if (const auto content_it = inner_members.find("content");
        content_it != inner_members.end()) {
      message.content = parse_content(content_it->second);
    } else {
      // An absent content field reads as the empty string.
      message.content.push_back(TextBlock{.text = ""});
    }
  } else if (message.type == MessageType::Summary) {
    message.content.push_back(TextBlock{.text = member_string(members, "summary")});
  }

  message.raw = std::make_shared<const std::string>(trimmed);
  return message;
}

std::vector<Message> parse_transcript(const std::string &raw_text, std::size_t *skipped_lines) {
  std::vector<Message> messages;
  std::size_t skipped = 0;
  std::istringstream stream(raw_text);
  std::string line;
  while (std::getline(stream, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    auto message = parse_transcript_line(line);
    if (!message.has_value()) {
      ++skipped;
      continue;
    }
    messages.push_back(std::move(*message));
  }
  if (skipped_lines != nullptr) {
    *skipped_lines = skipped;
  }
  return messages;
}

common::Result<std::vector<Message>> read_transcript_file(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<std::vector<Message>>::failure(
        common::ErrorCode::SessionRead, "Cannot read transcript: " + path.string());
  }

  std::size_t skipped = 0;
  auto messages = parse_transcript(content.value(), &skipped);
  if (skipped > 0) {
    observability::record_warning("transcript", "skipped " + std::to_string(skipped) +
                                                    " malformed line(s) in " + path.string());
  }
  return common::Result<std::vector<Message>>::success(std::move(messages));
}

} // namespace sidecar::transcript
