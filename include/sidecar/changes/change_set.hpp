#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sidecar::changes {

enum class FileStatus {
  Added,
  Modified,
  Deleted,
  Renamed,
};

enum class Provenance {
  VersionControl,
  Reconstructed,
};

[[nodiscard]] std::string file_status_to_string(FileStatus status);
[[nodiscard]] std::string provenance_to_string(Provenance provenance);

struct FileChange {
  std::string path;
  FileStatus status = FileStatus::Modified;
  std::uint64_t additions = 0;
  std::uint64_t deletions = 0;
  std::optional<std::string> diff_text;

  bool operator==(const FileChange &) const = default;
};

struct ChangeSet {
  std::vector<FileChange> files;
  std::uint64_t total_additions = 0;
  std::uint64_t total_deletions = 0;
  bool truncated = false;
  Provenance provenance = Provenance::VersionControl;

  /// Re-derive the totals from the file entries.
  void recompute_totals();
  [[nodiscard]] bool empty() const { return files.empty(); }
};

/// Text block describing a change set for the summarizer request.
[[nodiscard]] std::string format_change_set(const ChangeSet &change_set);

} // namespace sidecar::changes
