#pragma once

#include "sidecar/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sidecar::summarizer {

struct BuiltItem {
  std::string file;
  std::string description;
  std::string key_code;
  std::vector<std::string> key_decisions;

  bool operator==(const BuiltItem &) const = default;
};

struct PatternUse {
  std::string pattern;
  std::string where;
  std::string explained;

  bool operator==(const PatternUse &) const = default;
};

/// The single most likely source of trouble in the session's changes.
struct RiskNote {
  std::string issue;
  std::string where;
  std::string why;
  std::string what_to_check;

  bool operator==(const RiskNote &) const = default;
};

struct ConceptTouch {
  std::string concept_name;
  std::string in_code;
  bool developer_understood = false;
  std::string evidence;

  bool operator==(const ConceptTouch &) const = default;
};

struct SessionBriefing {
  std::string session_id;
  std::string project_path;
  std::string session_summary;
  std::vector<BuiltItem> what_got_built;
  std::string how_pieces_connect;
  std::vector<PatternUse> patterns_used;
  std::optional<RiskNote> will_bite_you;
  std::vector<ConceptTouch> concepts_touched;
  std::string created_at;

  bool operator==(const SessionBriefing &) const = default;
};

/// Indented JSON document holding every briefing field.
[[nodiscard]] std::string encode_briefing_json(const SessionBriefing &briefing);

/// Decode a briefing object. Missing fields keep their defaults; anything
/// other than a JSON object is an error.
[[nodiscard]] common::Result<SessionBriefing> parse_briefing_json(const std::string &json);

[[nodiscard]] std::string render_briefing_markdown(const SessionBriefing &briefing);

} // namespace sidecar::summarizer
