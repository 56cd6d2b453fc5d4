#pragma once

#include "sidecar/changes/change_set.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sidecar::changes {

/// Parse unified diff output. Input longer than max_chars is cut first and
/// the result is flagged truncated.
[[nodiscard]] ChangeSet parse_unified_diff(const std::string &diff_text, std::size_t max_chars);

struct StatusEntry {
  std::string path;
  FileStatus status = FileStatus::Modified;

  bool operator==(const StatusEntry &) const = default;
};

/// Parse `git status --porcelain` (v1) output.
[[nodiscard]] std::vector<StatusEntry> parse_porcelain_status(const std::string &status_text);

/// Build a change set from status entries by reading each added or modified
/// file under root and presenting its whole content as added lines. Reading
/// stops once the aggregate diff text reaches max_chars.
[[nodiscard]] ChangeSet synthesize_status_changes(const std::vector<StatusEntry> &entries,
                                                  const std::filesystem::path &root,
                                                  std::size_t max_chars);

} // namespace sidecar::changes
