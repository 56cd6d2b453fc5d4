#pragma once

#include "sidecar/common/result.hpp"
#include "sidecar/transcript/message.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sidecar::transcript {

struct SessionInfo {
  std::string session_id;
  std::string full_path;
  std::string first_prompt;
  std::string summary;
  std::uint64_t message_count = 0;
  std::string created;
  std::string modified;
  std::string git_branch;
  std::string project_path;
};

/// Sessions recorded under a projects directory: one subdirectory per
/// project, each holding a sessions-index.json and the *.jsonl transcripts.
class SessionCatalog {
public:
  explicit SessionCatalog(std::filesystem::path projects_dir);

  /// Sessions sorted by modification time, newest first. A missing or empty
  /// projects directory yields an empty list.
  [[nodiscard]] std::vector<SessionInfo>
  list(const std::optional<std::string> &project_filter = std::nullopt) const;

  /// Most recently modified session. Fails with ErrorCode::SessionNotFound.
  [[nodiscard]] common::Result<SessionInfo>
  latest(const std::optional<std::string> &project_filter = std::nullopt) const;

  /// Session by id across every project. Fails with ErrorCode::SessionNotFound.
  [[nodiscard]] common::Result<SessionInfo> get(const std::string &session_id) const;

  /// Full transcript of a session. Fails with SessionNotFound or SessionRead.
  [[nodiscard]] common::Result<TranscriptSession> read(const std::string &session_id) const;

  [[nodiscard]] const std::filesystem::path &projects_dir() const { return projects_dir_; }

private:
  std::filesystem::path projects_dir_;
};

} // namespace sidecar::transcript
