#include "sidecar/summarizer/summarizer.hpp"

#include "sidecar/common/clock.hpp"
#include "sidecar/common/fs.hpp"
#include "sidecar/common/text.hpp"
#include "sidecar/observability/global.hpp"

#include <sstream>
#include <variant>
#include <vector>

namespace sidecar::summarizer {

namespace {

constexpr std::size_t kHeaderAllowance = 100;
constexpr std::size_t kMinConversationRoom = 10'000;

constexpr const char *kConversationTruncated = "\n\n[...conversation truncated...]";
constexpr const char *kDiffTruncated = "\n\n[...diff truncated...]";

constexpr const char *kBriefingSystemPrompt =
    R"PROMPT(You are analyzing a developer's coding session with an AI assistant.
You are given TWO sources of truth:
1. CODEBASE DIFF: what actually changed in the code (the ground truth)
2. CONVERSATION: the developer's messages and AI responses (the context)

The diff tells you WHAT changed. The conversation tells you WHY.
Use both. When they conflict, trust the diff.

Produce a post-session briefing. Be SPECIFIC: reference actual files,
functions, and patterns from the DIFF. Never be generic.

Return JSON with exactly these fields:

{
  "session_summary": "2-3 sentences. What was built/changed. Reference actual file names and functionality from the diff.",
  "what_got_built": [
    {
      "file": "path/to/file",
      "description": "What this file does in plain language",
      "key_code": "The most important function/class and what it does",
      "key_decisions": ["Why X pattern was chosen over Y"]
    }
  ],
  "how_pieces_connect": "2-3 sentences explaining the architecture. How do the files relate? What calls what?",
  "patterns_used": [
    {
      "pattern": "Name of pattern",
      "where": "file:function_name (from the diff)",
      "explained": "What it does and why, in 1-2 sentences."
    }
  ],
  "will_bite_you": {
    "issue": "The single most likely thing to cause problems",
    "where": "file:line or function (be precise)",
    "why": "Why this is fragile or non-obvious",
    "what_to_check": "What to look at when it breaks"
  },
  "concepts_touched": [
    {
      "concept": "A technical concept",
      "in_code": "Where this concept appears in the actual diff",
      "developer_understood": true,
      "evidence": "From the conversation: what shows understanding"
    }
  ]
}

Respond with ONLY valid JSON, no markdown fencing.)PROMPT";

std::string join(const std::vector<std::string> &parts, const std::string &separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

std::string message_text(const transcript::Message &message) {
  std::vector<std::string> texts;
  for (const auto &block : message.content) {
    if (const auto *text = std::get_if<transcript::TextBlock>(&block)) {
      texts.push_back(text->text);
    }
  }
  return join(texts, " ");
}

std::vector<std::string> message_tools(const transcript::Message &message) {
  std::vector<std::string> tools;
  for (const auto &block : message.content) {
    const auto *tool = std::get_if<transcript::ToolInvocationBlock>(&block);
    if (tool == nullptr) {
      continue;
    }
    const auto path = tool->parameters.find("file_path");
    if (path != tool->parameters.end() && !path->second.empty()) {
      tools.push_back(tool->name + "(" + path->second + ")");
    } else {
      tools.push_back(tool->name);
    }
  }
  return tools;
}

std::string request_text(const std::string &diff_text, const std::string &conversation) {
  return "## CODEBASE DIFF\n\n" + diff_text + "\n\n## CONVERSATION\n\n" + conversation;
}

} // namespace

std::string format_conversation(const transcript::FilteredTranscript &transcript) {
  std::vector<std::string> parts;
  for (const auto &message : transcript.messages) {
    const std::string text = message_text(message);
    if (message.role == transcript::Role::User) {
      if (!text.empty()) {
        parts.push_back("USER: " + text);
      }
    } else if (message.role == transcript::Role::Assistant) {
      std::string line = text.empty() ? "ASSISTANT:" : "ASSISTANT: " + text;
      const auto tools = message_tools(message);
      if (!tools.empty()) {
        line += "\n  [Tools: " + join(tools, ", ") + "]";
      }
      parts.push_back(std::move(line));
    } else if (message.type == transcript::MessageType::Summary) {
      if (!text.empty()) {
        parts.push_back("SESSION SUMMARY: " + text);
      }
    }
  }
  return join(parts, "\n\n");
}

std::string build_summary_request(const std::string &diff_text, const std::string &conversation,
                                  const std::size_t max_chars) {
  std::string request = request_text(diff_text, conversation);
  if (common::utf8_length(request) <= max_chars) {
    return request;
  }

  const std::size_t diff_chars = common::utf8_length(diff_text);
  const std::size_t available =
      max_chars > diff_chars + kHeaderAllowance ? max_chars - diff_chars - kHeaderAllowance : 0;
  if (available > kMinConversationRoom) {
    return request_text(diff_text,
                        common::utf8_prefix(conversation, available) + kConversationTruncated);
  }
  return request_text(common::utf8_prefix(diff_text, max_chars / 2) + kDiffTruncated,
                      common::utf8_prefix(conversation, max_chars / 2) + kConversationTruncated);
}

std::string strip_code_fence(const std::string &text) {
  std::string trimmed = common::trim(text);
  if (!common::starts_with(trimmed, "```")) {
    return trimmed;
  }

  std::vector<std::string> lines;
  std::istringstream stream(trimmed);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  if (!lines.empty() && common::starts_with(lines.front(), "```")) {
    lines.erase(lines.begin());
  }
  if (!lines.empty() && common::trim(lines.back()) == "```") {
    lines.pop_back();
  }
  return join(lines, "\n");
}

ProviderSummarizer::ProviderSummarizer(std::shared_ptr<providers::Provider> provider,
                                       SummarizerOptions options)
    : provider_(std::move(provider)), options_(std::move(options)) {}

common::Result<SessionBriefing>
ProviderSummarizer::summarize(const transcript::FilteredTranscript &transcript,
                              const changes::ChangeSet &change_set,
                              const std::string &project_path) {
  const std::string message = build_summary_request(
      changes::format_change_set(change_set), format_conversation(transcript),
      options_.max_input_chars);
  observability::record_metric(
      observability::TokensEstimatedMetric{.tokens = common::utf8_length(message) / 4});

  const std::uint32_t attempts = options_.max_attempts == 0 ? 1 : options_.max_attempts;
  std::string last_error;
  for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    auto reply = provider_->chat_with_system(std::string(kBriefingSystemPrompt), message,
                                             options_.model, options_.temperature);
    if (!reply.ok()) {
      return common::Result<SessionBriefing>::failure(common::ErrorCode::Summarizer,
                                                      reply.error());
    }

    auto parsed = parse_briefing_json(strip_code_fence(reply.value()));
    if (!parsed.ok()) {
      last_error = parsed.error();
      observability::record_warning("summarizer", "attempt " + std::to_string(attempt) +
                                                      " returned malformed JSON: " + last_error);
      continue;
    }

    SessionBriefing briefing = std::move(parsed.value());
    briefing.session_id = transcript.session_id;
    briefing.project_path = project_path;
    briefing.created_at = common::now_rfc3339();
    return common::Result<SessionBriefing>::success(std::move(briefing));
  }

  return common::Result<SessionBriefing>::failure(
      common::ErrorCode::Summarizer, "failed to parse summarizer reply after " +
                                         std::to_string(attempts) + " attempts: " + last_error);
}

} // namespace sidecar::summarizer
