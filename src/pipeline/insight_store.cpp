#include "sidecar/pipeline/insight_store.hpp"

#include "sidecar/common/clock.hpp"
#include "sidecar/common/fs.hpp"
#include "sidecar/common/hash.hpp"
#include "sidecar/common/json_util.hpp"
#include "sidecar/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace sidecar::pipeline {

namespace {

constexpr std::size_t kFileKeyHexDigits = 16;

void append_unique(std::vector<std::string> &values, const std::string &value) {
  if (value.empty() || std::find(values.begin(), values.end(), value) != values.end()) {
    return;
  }
  values.push_back(value);
}

} // namespace

std::string encode_insight_json(const AccumulatedInsight &insight) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"project_path\": \"" << common::json_escape(insight.project_path) << "\",\n";
  out << "  \"recurring_patterns\": " << common::json_string_array(insight.recurring_patterns)
      << ",\n";
  out << "  \"known_issues\": " << common::json_string_array(insight.known_issues) << ",\n";
  out << "  \"architecture_notes\": " << common::json_string_array(insight.architecture_notes)
      << ",\n";
  out << "  \"last_updated\": \"" << common::json_escape(insight.last_updated) << "\",\n";
  out << "  \"briefing_count\": " << insight.briefing_count << "\n";
  out << "}\n";
  return out.str();
}

common::Result<AccumulatedInsight> parse_insight_json(const std::string &json) {
  if (!common::json_validate(json) || common::json_kind(json) != common::JsonKind::Object) {
    return common::Result<AccumulatedInsight>::failure("insight record is not a JSON object");
  }

  AccumulatedInsight insight{
      .project_path = common::json_get_string(json, "project_path"),
      .recurring_patterns = common::json_get_string_array(json, "recurring_patterns"),
      .known_issues = common::json_get_string_array(json, "known_issues"),
      .architecture_notes = common::json_get_string_array(json, "architecture_notes"),
      .last_updated = common::json_get_string(json, "last_updated"),
  };

  const std::string count = common::json_get_number(json, "briefing_count");
  if (!count.empty()) {
    std::uint64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(count.data(), count.data() + count.size(), parsed);
    if (ec == std::errc()) {
      insight.briefing_count = parsed;
    }
  }
  return common::Result<AccumulatedInsight>::success(std::move(insight));
}

void merge_briefing(AccumulatedInsight &insight, const summarizer::SessionBriefing &briefing) {
  for (const auto &pattern : briefing.patterns_used) {
    append_unique(insight.recurring_patterns, pattern.pattern);
  }
  if (briefing.will_bite_you.has_value()) {
    append_unique(insight.known_issues, briefing.will_bite_you->issue);
  }
  append_unique(insight.architecture_notes, briefing.how_pieces_connect);
  ++insight.briefing_count;
  insight.last_updated = common::now_rfc3339();
}

InsightStore::InsightStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::string InsightStore::file_name_for(const std::string &project_path) {
  return common::sha256_hex(project_path).substr(0, kFileKeyHexDigits) + ".json";
}

common::Result<AccumulatedInsight>
InsightStore::merge(const summarizer::SessionBriefing &briefing) const {
  const auto path = dir_ / file_name_for(briefing.project_path);

  AccumulatedInsight insight{.project_path = briefing.project_path};
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    auto content = common::read_file(path);
    auto parsed = content.ok() ? parse_insight_json(content.value())
                               : common::Result<AccumulatedInsight>::failure(content.error());
    if (parsed.ok()) {
      insight = std::move(parsed.value());
      insight.project_path = briefing.project_path;
    } else {
      observability::record_warning("insights", "restarting unreadable insight file " +
                                                    path.string() + ": " + parsed.error());
    }
  }

  merge_briefing(insight, briefing);

  const auto status = common::write_file_atomic(path, encode_insight_json(insight));
  if (!status.ok()) {
    return common::Result<AccumulatedInsight>::failure(common::ErrorCode::Persistence,
                                                       status.error());
  }
  return common::Result<AccumulatedInsight>::success(std::move(insight));
}

std::optional<AccumulatedInsight> InsightStore::load(const std::string &project_path) const {
  auto content = common::read_file(dir_ / file_name_for(project_path));
  if (!content.ok()) {
    return std::nullopt;
  }
  auto parsed = parse_insight_json(content.value());
  if (!parsed.ok()) {
    return std::nullopt;
  }
  return parsed.value();
}

std::vector<AccumulatedInsight> InsightStore::list() const {
  std::vector<AccumulatedInsight> out;
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
    auto parsed = parse_insight_json(content.value());
    if (parsed.ok()) {
      out.push_back(std::move(parsed.value()));
    }
  }
  std::sort(out.begin(), out.end(), [](const AccumulatedInsight &a, const AccumulatedInsight &b) {
    return a.project_path < b.project_path;
  });
  return out;
}

} // namespace sidecar::pipeline
