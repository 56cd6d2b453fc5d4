#include "sidecar/pipeline/briefing_store.hpp"

#include "sidecar/common/clock.hpp"
#include "sidecar/common/fs.hpp"

#include <algorithm>

namespace sidecar::pipeline {

BriefingStore::BriefingStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

common::Result<BriefingPaths> BriefingStore::save(const summarizer::SessionBriefing &briefing) const {
  return write(briefing, common::safe_file_component(briefing.session_id));
}

common::Result<BriefingPaths>
BriefingStore::save_snapshot(const summarizer::SessionBriefing &briefing,
                             const std::chrono::system_clock::time_point when) const {
  return write(briefing,
               common::safe_file_component(briefing.session_id) + "-" + common::compact_stamp(when));
}

common::Result<BriefingPaths> BriefingStore::write(const summarizer::SessionBriefing &briefing,
                                                   const std::string &stem) const {
  BriefingPaths paths{
      .json_path = dir_ / (stem + ".json"),
      .markdown_path = dir_ / (stem + ".md"),
  };

  auto status = common::write_file_atomic(paths.json_path, summarizer::encode_briefing_json(briefing));
  if (!status.ok()) {
    return common::Result<BriefingPaths>::failure(common::ErrorCode::Persistence, status.error());
  }
  status = common::write_file_atomic(paths.markdown_path,
                                     summarizer::render_briefing_markdown(briefing));
  if (!status.ok()) {
    return common::Result<BriefingPaths>::failure(common::ErrorCode::Persistence, status.error());
  }
  return common::Result<BriefingPaths>::success(std::move(paths));
}

common::Result<summarizer::SessionBriefing>
BriefingStore::load(const std::string &session_id) const {
  const auto path = dir_ / (common::safe_file_component(session_id) + ".json");
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<summarizer::SessionBriefing>::failure(
        common::ErrorCode::NotFound, "No briefing found for session " + session_id);
  }

  auto parsed = summarizer::parse_briefing_json(content.value());
  if (!parsed.ok()) {
    return common::Result<summarizer::SessionBriefing>::failure(
        common::ErrorCode::Persistence, "Failed to load briefing " + path.string() + ": " +
                                            parsed.error());
  }
  if (parsed.value().session_id.empty()) {
    parsed.value().session_id = session_id;
  }
  return parsed;
}

std::vector<BriefingSummary> BriefingStore::list() const {
  std::vector<BriefingSummary> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir_, ec)) {
    return out;
  }

  for (const auto &entry : std::filesystem::directory_iterator(dir_, ec)) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") {
      continue;
    }
    auto content = common::read_file(entry.path());
    if (!content.ok()) {
      continue;
    }
    auto parsed = summarizer::parse_briefing_json(content.value());
    if (!parsed.ok()) {
      continue;
    }
    const auto &briefing = parsed.value();
    out.push_back(BriefingSummary{
        .session_id = briefing.session_id.empty() ? entry.path().stem().string()
                                                  : briefing.session_id,
        .project_path = briefing.project_path,
        .session_summary = briefing.session_summary,
        .created_at = briefing.created_at,
        .path = entry.path(),
    });
  }

  std::sort(out.begin(), out.end(), [](const BriefingSummary &a, const BriefingSummary &b) {
    if (a.created_at != b.created_at) {
      return a.created_at > b.created_at;
    }
    return a.path.filename() > b.path.filename();
  });
  return out;
}

} // namespace sidecar::pipeline
