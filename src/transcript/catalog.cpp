#include "sidecar/transcript/catalog.hpp"

#include "sidecar/common/clock.hpp"
#include "sidecar/common/fs.hpp"
#include "sidecar/common/json_util.hpp"
#include "sidecar/observability/global.hpp"
#include "sidecar/transcript/reader.hpp"

#include <algorithm>
#include <charconv>

namespace sidecar::transcript {

namespace {

constexpr const char *kIndexFileName = "sessions-index.json";

std::uint64_t parse_count(const std::string &raw) {
  std::uint64_t value = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  return ec == std::errc() ? value : 0;
}

SessionInfo parse_index_entry(const std::string &raw_entry, const std::string &original_path) {
  const auto members = common::json_parse_object_raw(raw_entry);
  const auto text = [&members](const std::string &key) {
    const auto it = members.find(key);
    return it == members.end() ? std::string() : common::json_as_string(it->second);
  };

  SessionInfo info;
  info.session_id = text("sessionId");
  info.full_path = text("fullPath");
  info.first_prompt = text("firstPrompt");
  info.summary = text("summary");
  if (const auto it = members.find("messageCount"); it != members.end()) {
    info.message_count = parse_count(it->second);
  }
  info.created = text("created");
  info.modified = text("modified");
  info.git_branch = text("gitBranch");
  info.project_path = members.contains("projectPath") ? text("projectPath") : original_path;
  return info;
}

// Projects without an index still expose their transcripts.
std::vector<SessionInfo> scan_transcript_files(const std::filesystem::path &project_dir) {
  std::vector<SessionInfo> sessions;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(project_dir, ec)) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".jsonl") {
      continue;
    }
    SessionInfo info;
    info.session_id = entry.path().stem().string();
    info.full_path = entry.path().string();
    info.modified = common::file_mtime_rfc3339(entry.path());
    info.created = info.modified;
    sessions.push_back(std::move(info));
  }
  return sessions;
}

std::vector<std::filesystem::path> project_dirs(const std::filesystem::path &root) {
  std::vector<std::filesystem::path> dirs;
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return dirs;
  }
  for (const auto &entry : std::filesystem::directory_iterator(root, ec)) {
    if (entry.is_directory(ec)) {
      dirs.push_back(entry.path());
    }
  }
  std::sort(dirs.begin(), dirs.end());
  return dirs;
}

} // namespace

SessionCatalog::SessionCatalog(std::filesystem::path projects_dir)
    : projects_dir_(std::move(projects_dir)) {}

std::vector<SessionInfo>
SessionCatalog::list(const std::optional<std::string> &project_filter) const {
  std::vector<SessionInfo> sessions;

  for (const auto &dir : project_dirs(projects_dir_)) {
    const auto index_path = dir / kIndexFileName;
    std::error_code ec;
    if (!std::filesystem::exists(index_path, ec)) {
      if (!project_filter.has_value()) {
        auto scanned = scan_transcript_files(dir);
        sessions.insert(sessions.end(), scanned.begin(), scanned.end());
      }
      continue;
    }

    const auto content = common::read_file(index_path);
    if (!content.ok() || !common::json_validate(content.value())) {
      observability::record_warning("catalog", "unreadable session index: " + index_path.string());
      continue;
    }

    const std::string &index = content.value();
    const std::string original_path = common::json_get_string(index, "originalPath");
    if (project_filter.has_value() && original_path != *project_filter) {
      continue;
    }

    for (const auto &raw_entry :
         common::json_split_top_level_objects(common::json_get_array(index, "entries"))) {
      sessions.push_back(parse_index_entry(raw_entry, original_path));
    }
  }

  std::stable_sort(sessions.begin(), sessions.end(),
                   [](const SessionInfo &a, const SessionInfo &b) { return a.modified > b.modified; });
  return sessions;
}

common::Result<SessionInfo>
SessionCatalog::latest(const std::optional<std::string> &project_filter) const {
  auto sessions = list(project_filter);
  if (sessions.empty()) {
    return common::Result<SessionInfo>::failure(common::ErrorCode::SessionNotFound,
                                                "Session not found: no sessions found");
  }
  return common::Result<SessionInfo>::success(std::move(sessions.front()));
}

common::Result<SessionInfo> SessionCatalog::get(const std::string &session_id) const {
  for (auto &info : list()) {
    if (info.session_id == session_id) {
      return common::Result<SessionInfo>::success(std::move(info));
    }
  }
  return common::Result<SessionInfo>::failure(common::ErrorCode::SessionNotFound,
                                              "Session not found: " + session_id);
}

common::Result<TranscriptSession> SessionCatalog::read(const std::string &session_id) const {
  const auto info = get(session_id);
  if (!info.ok()) {
    return common::Result<TranscriptSession>::failure(info.code(), info.error());
  }

  const std::filesystem::path path(info.value().full_path);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<TranscriptSession>::failure(
        common::ErrorCode::SessionRead, "Transcript file not found: " + path.string());
  }

  auto messages = read_transcript_file(path);
  if (!messages.ok()) {
    return common::Result<TranscriptSession>::failure(messages.code(), messages.error());
  }
  return common::Result<TranscriptSession>::success(
      TranscriptSession{.session_id = session_id, .messages = std::move(messages.value())});
}

} // namespace sidecar::transcript
