#include "sidecar/changes/change_set.hpp"

#include <sstream>

namespace sidecar::changes {

std::string file_status_to_string(const FileStatus status) {
  switch (status) {
  case FileStatus::Added:
    return "added";
  case FileStatus::Modified:
    return "modified";
  case FileStatus::Deleted:
    return "deleted";
  case FileStatus::Renamed:
    return "renamed";
  }
  return "modified";
}

std::string provenance_to_string(const Provenance provenance) {
  switch (provenance) {
  case Provenance::VersionControl:
    return "version-control";
  case Provenance::Reconstructed:
    return "reconstructed";
  }
  return "reconstructed";
}

void ChangeSet::recompute_totals() {
  total_additions = 0;
  total_deletions = 0;
  for (const auto &file : files) {
    total_additions += file.additions;
    total_deletions += file.deletions;
  }
}

std::string format_change_set(const ChangeSet &change_set) {
  if (change_set.files.empty()) {
    return "(no diff available)";
  }

  std::ostringstream out;
  out << "Source: " << provenance_to_string(change_set.provenance) << " | +"
      << change_set.total_additions << " -" << change_set.total_deletions << " | "
      << change_set.files.size() << " files\n";
  if (change_set.truncated) {
    out << "(diff truncated)\n";
  }
  out << "\n";

  for (std::size_t i = 0; i < change_set.files.size(); ++i) {
    const auto &file = change_set.files[i];
    if (i > 0) {
      out << "\n";
    }
    if (file.diff_text.has_value() && !file.diff_text->empty()) {
      out << *file.diff_text;
    } else {
      out << "  " << file_status_to_string(file.status) << ": " << file.path;
    }
  }
  return out.str();
}

} // namespace sidecar::changes
