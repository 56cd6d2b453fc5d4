#pragma once

#include "sidecar/transcript/message.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sidecar::transcript {

/// Character thresholds count UTF-8 code points.
struct FilterOptions {
  std::size_t long_text_threshold = 500;
  std::size_t truncate_to = 300;
  std::size_t short_text_threshold = 50;
  std::size_t command_preview_chars = 100;
};

inline constexpr const char *kTruncationMarker = "...";

struct FilterStatistics {
  std::size_t original_count = 0;
  std::size_t kept_count = 0;
  std::size_t removed_progress = 0;
  std::size_t removed_file_history = 0;
  std::size_t truncated_messages = 0;
  std::size_t stripped_tool_content = 0;

  /// Messages dropped without a dedicated counter (short assistant replies,
  /// unknown record types).
  [[nodiscard]] std::size_t dropped_count() const {
    return original_count - kept_count - removed_progress - removed_file_history;
  }

  bool operator==(const FilterStatistics &) const = default;
};

struct FilteredTranscript {
  std::string session_id;
  std::vector<Message> messages;
  FilterStatistics stats;
};

/// Tools whose invocations keep only their file_path parameter.
[[nodiscard]] bool is_file_tool(const std::string &name);

/// Deterministic, side-effect-free reduction of a transcript.
[[nodiscard]] FilteredTranscript filter_transcript(const std::string &session_id,
                                                   const std::vector<Message> &messages,
                                                   const FilterOptions &options = {});

} // namespace sidecar::transcript
