#pragma once

#include "sidecar/common/result.hpp"
#include "sidecar/transcript/message.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sidecar::transcript {

/// Parse one transcript record. Returns nullopt when the line is blank or is
/// not a JSON object.
[[nodiscard]] std::optional<Message> parse_transcript_line(const std::string &line);

/// Parse a line-delimited transcript. Malformed lines are skipped and counted
/// in skipped_lines when provided.
[[nodiscard]] std::vector<Message> parse_transcript(const std::string &raw_text,
                                                    std::size_t *skipped_lines = nullptr);

/// Read and parse a transcript file. Fails with ErrorCode::SessionRead only
/// when the file cannot be opened.
[[nodiscard]] common::Result<std::vector<Message>>
read_transcript_file(const std::filesystem::path &path);

} // namespace sidecar::transcript
