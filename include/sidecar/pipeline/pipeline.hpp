#pragma once

#include "sidecar/changes/change_set.hpp"
#include "sidecar/changes/extractor.hpp"
#include "sidecar/common/result.hpp"
#include "sidecar/pipeline/briefing_store.hpp"
#include "sidecar/pipeline/insight_store.hpp"
#include "sidecar/summarizer/summarizer.hpp"
#include "sidecar/transcript/catalog.hpp"
#include "sidecar/transcript/filter.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sidecar::pipeline {

struct PipelineOptions {
  std::optional<std::string> session_id;
  std::optional<std::string> project_path;
  /// Persist under a timestamped name and leave the insight store alone.
  bool snapshot = false;
};

struct PersistedBriefing {
  summarizer::SessionBriefing briefing;
  std::filesystem::path json_path;
  std::filesystem::path markdown_path;
  transcript::FilterStatistics stats;
  changes::ChangeSet change_set;
  /// Conversation size handed to the summarizer, at four characters per token.
  std::size_t estimated_tokens = 0;
  std::optional<AccumulatedInsight> insight;
};

/// Reader, filter, extractor, summarizer and persistence in one pass.
class Pipeline {
public:
  Pipeline(transcript::SessionCatalog catalog, std::shared_ptr<changes::ChangeSetExtractor> extractor,
           std::shared_ptr<summarizer::Summarizer> summarizer, BriefingStore briefings,
           InsightStore insights, transcript::FilterOptions filter_options = {});

  /// Fails with SessionNotFound, SessionRead, Summarizer or Persistence.
  [[nodiscard]] common::Result<PersistedBriefing> run(const PipelineOptions &options) const;

private:
  transcript::SessionCatalog catalog_;
  std::shared_ptr<changes::ChangeSetExtractor> extractor_;
  std::shared_ptr<summarizer::Summarizer> summarizer_;
  BriefingStore briefings_;
  InsightStore insights_;
  transcript::FilterOptions filter_options_;
};

/// Working directory recorded on the first message that carries one.
[[nodiscard]] std::string find_working_directory(const std::vector<transcript::Message> &messages);

struct PipelineStatus {
  std::size_t total_sessions = 0;
  std::size_t total_briefings = 0;
  std::set<std::string> projects;
  std::vector<AccumulatedInsight> insights;
};

[[nodiscard]] PipelineStatus pipeline_status(const transcript::SessionCatalog &catalog,
                                             const BriefingStore &briefings,
                                             const InsightStore &insights);

} // namespace sidecar::pipeline
