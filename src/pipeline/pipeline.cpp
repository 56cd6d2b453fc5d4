#include "sidecar/pipeline/pipeline.hpp"

#include "sidecar/common/text.hpp"
#include "sidecar/observability/global.hpp"

#include <chrono>

namespace sidecar::pipeline {

namespace {

class ExtractionTimer {
public:
  explicit ExtractionTimer(std::string session_id) : session_id_(std::move(session_id)) {}

  ~ExtractionTimer() {
    observability::record_event(observability::ExtractionEndEvent{
        .session_id = session_id_,
        .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_),
        .success = success_,
    });
  }

  ExtractionTimer(const ExtractionTimer &) = delete;
  ExtractionTimer &operator=(const ExtractionTimer &) = delete;

  void set_session_id(std::string session_id) { session_id_ = std::move(session_id); }
  void mark_success() { success_ = true; }

private:
  std::string session_id_;
  std::chrono::steady_clock::time_point started_ = std::chrono::steady_clock::now();
  bool success_ = false;
};

template <typename T> common::Result<PersistedBriefing> fail_with(const common::Result<T> &result) {
  observability::record_error("pipeline", result.error());
  return common::Result<PersistedBriefing>::failure(result.code(), result.error());
}

} // namespace

Pipeline::Pipeline(transcript::SessionCatalog catalog,
                   std::shared_ptr<changes::ChangeSetExtractor> extractor,
                   std::shared_ptr<summarizer::Summarizer> summarizer, BriefingStore briefings,
                   InsightStore insights, const transcript::FilterOptions filter_options)
    : catalog_(std::move(catalog)), extractor_(std::move(extractor)),
      summarizer_(std::move(summarizer)), briefings_(std::move(briefings)),
      insights_(std::move(insights)), filter_options_(filter_options) {}

std::string find_working_directory(const std::vector<transcript::Message> &messages) {
  for (const auto &message : messages) {
    std::string cwd = transcript::raw_string_field(message, "cwd");
    if (!cwd.empty()) {
      return cwd;
    }
  }
  return "";
}

common::Result<PersistedBriefing> Pipeline::run(const PipelineOptions &options) const {
  std::string session_id = options.session_id.value_or("");
  std::string project_path = options.project_path.value_or("");
  ExtractionTimer timer(session_id);

  if (session_id.empty()) {
    const std::optional<std::string> filter =
        project_path.empty() ? std::nullopt : std::optional<std::string>(project_path);
    auto latest = catalog_.latest(filter);
    if (!latest.ok()) {
      return fail_with(latest);
    }
    session_id = latest.value().session_id;
    if (project_path.empty()) {
      project_path = latest.value().project_path;
    }
    timer.set_session_id(session_id);
  }

  observability::record_event(observability::ExtractionStartEvent{
      .session_id = session_id, .project_path = project_path, .snapshot = options.snapshot});

  auto session = catalog_.read(session_id);
  if (!session.ok()) {
    return fail_with(session);
  }
  const auto &messages = session.value().messages;
  observability::record_stage("read", std::to_string(messages.size()) + " messages");

  if (project_path.empty()) {
    project_path = find_working_directory(messages);
  }

  auto filtered = transcript::filter_transcript(session_id, messages, filter_options_);
  observability::record_metric(observability::FilteredMessagesMetric{
      .original = filtered.stats.original_count, .kept = filtered.stats.kept_count});
  const std::size_t estimated_tokens =
      common::utf8_length(summarizer::format_conversation(filtered)) / 4;
  observability::record_stage("filter", "kept=" + std::to_string(filtered.stats.kept_count) +
                                            " tokens~" + std::to_string(estimated_tokens));

  auto change_set = extractor_->extract(project_path, messages);
  observability::record_metric(observability::ChangeSetSizeMetric{
      .files = change_set.files.size(),
      .additions = change_set.total_additions,
      .deletions = change_set.total_deletions});

  auto briefing = summarizer_->summarize(filtered, change_set, project_path);
  if (!briefing.ok()) {
    return fail_with(briefing);
  }
  observability::record_stage("summarize");

  auto paths = options.snapshot ? briefings_.save_snapshot(briefing.value())
                                : briefings_.save(briefing.value());
  if (!paths.ok()) {
    return fail_with(paths);
  }
  observability::record_stage("persist", paths.value().json_path.string());

  std::optional<AccumulatedInsight> insight;
  if (!options.snapshot) {
    auto merged = insights_.merge(briefing.value());
    if (!merged.ok()) {
      return fail_with(merged);
    }
    insight = std::move(merged.value());
    observability::record_stage("insights");
  }

  timer.mark_success();
  return common::Result<PersistedBriefing>::success(PersistedBriefing{
      .briefing = std::move(briefing.value()),
      .json_path = paths.value().json_path,
      .markdown_path = paths.value().markdown_path,
      .stats = filtered.stats,
      .change_set = std::move(change_set),
      .estimated_tokens = estimated_tokens,
      .insight = std::move(insight),
  });
}

PipelineStatus pipeline_status(const transcript::SessionCatalog &catalog,
                               const BriefingStore &briefings, const InsightStore &insights) {
  PipelineStatus status;
  const auto sessions = catalog.list();
  status.total_sessions = sessions.size();
  for (const auto &session : sessions) {
    if (!session.project_path.empty()) {
      status.projects.insert(session.project_path);
    }
  }
  status.total_briefings = briefings.list().size();
  status.insights = insights.list();
  return status;
}

} // namespace sidecar::pipeline
