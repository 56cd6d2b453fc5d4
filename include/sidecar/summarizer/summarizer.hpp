#pragma once

#include "sidecar/changes/change_set.hpp"
#include "sidecar/common/result.hpp"
#include "sidecar/providers/traits.hpp"
#include "sidecar/summarizer/briefing.hpp"
#include "sidecar/transcript/filter.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace sidecar::summarizer {

/// Turns a filtered transcript and its change set into a briefing.
class Summarizer {
public:
  virtual ~Summarizer() = default;

  [[nodiscard]] virtual common::Result<SessionBriefing>
  summarize(const transcript::FilteredTranscript &transcript,
            const changes::ChangeSet &change_set, const std::string &project_path) = 0;
};

struct SummarizerOptions {
  std::string model = "claude-haiku-4-5-20251001";
  std::uint32_t max_attempts = 2;
  std::size_t max_input_chars = 150'000;
  double temperature = 0.2;
};

class ProviderSummarizer final : public Summarizer {
public:
  ProviderSummarizer(std::shared_ptr<providers::Provider> provider, SummarizerOptions options = {});

  [[nodiscard]] common::Result<SessionBriefing>
  summarize(const transcript::FilteredTranscript &transcript,
            const changes::ChangeSet &change_set, const std::string &project_path) override;

private:
  std::shared_ptr<providers::Provider> provider_;
  SummarizerOptions options_;
};

/// Conversation text handed to the summarizer: one paragraph per user,
/// assistant or summary message.
[[nodiscard]] std::string format_conversation(const transcript::FilteredTranscript &transcript);

/// Request body combining the change-set text and the conversation. When the
/// result would exceed max_chars the conversation is cut first; if the diff
/// alone leaves too little room, both halves are cut to max_chars / 2.
[[nodiscard]] std::string build_summary_request(const std::string &diff_text,
                                                const std::string &conversation,
                                                std::size_t max_chars);

/// Remove a surrounding ``` fence (with or without a language tag).
[[nodiscard]] std::string strip_code_fence(const std::string &text);

} // namespace sidecar::summarizer
