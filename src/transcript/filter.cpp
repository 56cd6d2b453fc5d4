#include "sidecar/transcript/filter.hpp"

#include "sidecar/common/text.hpp"

#include <array>
#include <type_traits>

namespace sidecar::transcript {

namespace {

constexpr const char *kShellTool = "Bash";

std::string parameter(const ToolInvocationBlock &block, const std::string &key) {
  const auto it = block.parameters.find(key);
  return it == block.parameters.end() ? std::string() : it->second;
}

ToolInvocationBlock strip_invocation(const ToolInvocationBlock &block,
                                     const FilterOptions &options) {
  ToolInvocationBlock stripped{.name = block.name, .parameters = {}};
  if (is_file_tool(block.name)) {
    stripped.parameters["file_path"] = parameter(block, "file_path");
  } else if (block.name == kShellTool) {
    stripped.parameters["description"] = parameter(block, "description");
    const std::string command = block.parameters.contains("command")
                                    ? parameter(block, "command")
                                    : parameter(block, "command_preview");
    stripped.parameters["command_preview"] =
        common::utf8_prefix(command, options.command_preview_chars);
  }
  return stripped;
}

std::vector<ContentBlock> filter_assistant_blocks(const std::vector<ContentBlock> &content,
                                                  const FilterOptions &options,
                                                  FilterStatistics &stats) {
  std::vector<ContentBlock> result;
  result.reserve(content.size());

  for (const auto &block : content) {
    std::visit(
        [&](const auto &b) {
          using T = std::decay_t<decltype(b)>;
          if constexpr (std::is_same_v<T, TextBlock>) {
            if (common::utf8_length(b.text) > options.long_text_threshold) {
              ++stats.truncated_messages;
              result.push_back(
                  TextBlock{.text = common::utf8_prefix(b.text, options.truncate_to) +
                                    kTruncationMarker});
            } else {
              result.push_back(b);
            }
          } else if constexpr (std::is_same_v<T, ToolInvocationBlock>) {
            ++stats.stripped_tool_content;
            result.push_back(strip_invocation(b, options));
          } else if constexpr (std::is_same_v<T, ToolResultBlock>) {
            result.push_back(ToolResultBlock{.reference_id = b.reference_id});
          }
        },
        block);
  }
  return result;
}

bool survives(const std::vector<ContentBlock> &blocks, const FilterOptions &options) {
  for (const auto &block : blocks) {
    const auto *text = std::get_if<TextBlock>(&block);
    if (text == nullptr || common::utf8_length(text->text) >= options.short_text_threshold) {
      return true;
    }
  }
  return false;
}

} // namespace

bool is_file_tool(const std::string &name) {
  static constexpr std::array<const char *, 4> kFileTools = {"Write", "Edit", "MultiEdit",
                                                             "Read"};
  for (const char *tool : kFileTools) {
    if (name == tool) {
      return true;
    }
  }
  return false;
}

FilteredTranscript filter_transcript(const std::string &session_id,
                                     const std::vector<Message> &messages,
                                     const FilterOptions &options) {
  FilteredTranscript filtered;
  filtered.session_id = session_id;
  filtered.stats.original_count = messages.size();

  for (const auto &message : messages) {
    switch (message.type) {
    case MessageType::Progress:
      ++filtered.stats.removed_progress;
      continue;
    case MessageType::FileHistorySnapshot:
      ++filtered.stats.removed_file_history;
      continue;
    case MessageType::Summary:
      filtered.messages.push_back(message);
      continue;
    default:
      break;
    }

    if (message.role == Role::User) {
      filtered.messages.push_back(message);
      continue;
    }
    if (message.role != Role::Assistant) {
      continue;
    }

    auto blocks = filter_assistant_blocks(message.content, options, filtered.stats);
    if (!survives(blocks, options)) {
      continue;
    }

    Message kept = message;
    kept.content = std::move(blocks);
    kept.raw = nullptr;
    filtered.messages.push_back(std::move(kept));
  }

  filtered.stats.kept_count = filtered.messages.size();
  return filtered;
}

} // namespace sidecar::transcript
