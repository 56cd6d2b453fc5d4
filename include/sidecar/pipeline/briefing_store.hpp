#pragma once

#include "sidecar/common/result.hpp"
#include "sidecar/summarizer/briefing.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sidecar::pipeline {

struct BriefingPaths {
  std::filesystem::path json_path;
  std::filesystem::path markdown_path;
};

/// Listing entry for a stored briefing.
struct BriefingSummary {
  std::string session_id;
  std::string project_path;
  std::string session_summary;
  std::string created_at;
  std::filesystem::path path;
};

/// Briefings stored as <name>.json plus a rendered <name>.md.
class BriefingStore {
public:
  explicit BriefingStore(std::filesystem::path dir);

  [[nodiscard]] common::Result<BriefingPaths> save(const summarizer::SessionBriefing &briefing) const;

  /// Stores under <session>-<YYYYMMDD-HHMMSS> so earlier snapshots are kept.
  [[nodiscard]] common::Result<BriefingPaths>
  save_snapshot(const summarizer::SessionBriefing &briefing,
                std::chrono::system_clock::time_point when = std::chrono::system_clock::now()) const;

  /// Fails with NotFound when no briefing exists and Persistence when the
  /// stored file cannot be decoded.
  [[nodiscard]] common::Result<summarizer::SessionBriefing> load(const std::string &session_id) const;

  /// Every decodable briefing, newest first. Unreadable files are skipped.
  [[nodiscard]] std::vector<BriefingSummary> list() const;

  [[nodiscard]] const std::filesystem::path &dir() const { return dir_; }

private:
  [[nodiscard]] common::Result<BriefingPaths> write(const summarizer::SessionBriefing &briefing,
                                                    const std::string &stem) const;

  std::filesystem::path dir_;
};

} // namespace sidecar::pipeline
