#pragma once

#include "sidecar/common/result.hpp"
#include "sidecar/summarizer/briefing.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sidecar::pipeline {

/// Cross-session knowledge about one project, grown by every briefing.
struct AccumulatedInsight {
  std::string project_path;
  std::vector<std::string> recurring_patterns;
  std::vector<std::string> known_issues;
  std::vector<std::string> architecture_notes;
  std::string last_updated;
  std::uint64_t briefing_count = 0;

  bool operator==(const AccumulatedInsight &) const = default;
};

[[nodiscard]] std::string encode_insight_json(const AccumulatedInsight &insight);
[[nodiscard]] common::Result<AccumulatedInsight> parse_insight_json(const std::string &json);

/// Folds a briefing into an insight: patterns, the risk issue and the
/// architecture note are appended unless already present verbatim.
void merge_briefing(AccumulatedInsight &insight, const summarizer::SessionBriefing &briefing);

/// One JSON file per project. Concurrent writers race; the last one wins.
class InsightStore {
public:
  explicit InsightStore(std::filesystem::path dir);

  /// File name for a project: 16 hex digits of sha256(project_path) + ".json".
  [[nodiscard]] static std::string file_name_for(const std::string &project_path);

  /// Load, merge and write back. An unreadable file restarts from empty.
  [[nodiscard]] common::Result<AccumulatedInsight>
  merge(const summarizer::SessionBriefing &briefing) const;

  [[nodiscard]] std::optional<AccumulatedInsight> load(const std::string &project_path) const;
  [[nodiscard]] std::vector<AccumulatedInsight> list() const;

  [[nodiscard]] const std::filesystem::path &dir() const { return dir_; }

private:
  std::filesystem::path dir_;
};

} // namespace sidecar::pipeline
