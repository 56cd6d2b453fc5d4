#include "sidecar/summarizer/briefing.hpp"

#include "sidecar/common/json_util.hpp"

#include <sstream>

namespace sidecar::summarizer {

namespace {

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

void write_field(std::ostringstream &out, const std::string &indent, const std::string &key,
                 const std::string &value, const bool last = false) {
  out << indent << quoted(key) << ": " << value << (last ? "\n" : ",\n");
}

std::string encode_built_item(const BuiltItem &item) {
  std::ostringstream out;
  out << "{\n";
  write_field(out, "      ", "file", quoted(item.file));
  write_field(out, "      ", "description", quoted(item.description));
  write_field(out, "      ", "key_code", quoted(item.key_code));
  write_field(out, "      ", "key_decisions", common::json_string_array(item.key_decisions), true);
  out << "    }";
  return out.str();
}

std::string encode_pattern(const PatternUse &pattern) {
  std::ostringstream out;
  out << "{\n";
  write_field(out, "      ", "pattern", quoted(pattern.pattern));
  write_field(out, "      ", "where", quoted(pattern.where));
  write_field(out, "      ", "explained", quoted(pattern.explained), true);
  out << "    }";
  return out.str();
}

std::string encode_concept(const ConceptTouch &touch) {
  std::ostringstream out;
  out << "{\n";
  write_field(out, "      ", "concept", quoted(touch.concept_name));
  write_field(out, "      ", "in_code", quoted(touch.in_code));
  write_field(out, "      ", "developer_understood", touch.developer_understood ? "true" : "false");
  write_field(out, "      ", "evidence", quoted(touch.evidence), true);
  out << "    }";
  return out.str();
}

std::string encode_risk(const std::optional<RiskNote> &risk) {
  if (!risk.has_value()) {
    return "{}";
  }
  std::ostringstream out;
  out << "{\n";
  write_field(out, "    ", "issue", quoted(risk->issue));
  write_field(out, "    ", "where", quoted(risk->where));
  write_field(out, "    ", "why", quoted(risk->why));
  write_field(out, "    ", "what_to_check", quoted(risk->what_to_check), true);
  out << "  }";
  return out.str();
}

template <typename T, typename Encoder>
std::string encode_list(const std::vector<T> &items, Encoder encode) {
  if (items.empty()) {
    return "[]";
  }
  std::ostringstream out;
  out << "[\n";
  for (std::size_t i = 0; i < items.size(); ++i) {
    out << "    " << encode(items[i]) << (i + 1 < items.size() ? ",\n" : "\n");
  }
  out << "  ]";
  return out.str();
}

template <typename T, typename Decoder>
std::vector<T> decode_list(const std::string &json, const std::string &field, Decoder decode) {
  std::vector<T> out;
  for (const auto &object : common::json_split_top_level_objects(common::json_get_array(json, field))) {
    out.push_back(decode(object));
  }
  return out;
}

} // namespace

std::string encode_briefing_json(const SessionBriefing &briefing) {
  std::ostringstream out;
  out << "{\n";
  write_field(out, "  ", "session_id", quoted(briefing.session_id));
  write_field(out, "  ", "project_path", quoted(briefing.project_path));
  write_field(out, "  ", "session_summary", quoted(briefing.session_summary));
  write_field(out, "  ", "what_got_built", encode_list(briefing.what_got_built, encode_built_item));
  write_field(out, "  ", "how_pieces_connect", quoted(briefing.how_pieces_connect));
  write_field(out, "  ", "patterns_used", encode_list(briefing.patterns_used, encode_pattern));
  write_field(out, "  ", "will_bite_you", encode_risk(briefing.will_bite_you));
  write_field(out, "  ", "concepts_touched", encode_list(briefing.concepts_touched, encode_concept));
  write_field(out, "  ", "created_at", quoted(briefing.created_at), true);
  out << "}\n";
  return out.str();
}

common::Result<SessionBriefing> parse_briefing_json(const std::string &json) {
  if (!common::json_validate(json) || common::json_kind(json) != common::JsonKind::Object) {
    return common::Result<SessionBriefing>::failure("briefing is not a JSON object");
  }

  SessionBriefing briefing;
  briefing.session_id = common::json_get_string(json, "session_id");
  briefing.project_path = common::json_get_string(json, "project_path");
  briefing.session_summary = common::json_get_string(json, "session_summary");
  briefing.how_pieces_connect = common::json_get_string(json, "how_pieces_connect");
  briefing.created_at = common::json_get_string(json, "created_at");

  briefing.what_got_built = decode_list<BuiltItem>(json, "what_got_built", [](const std::string &item) {
    return BuiltItem{
        .file = common::json_get_string(item, "file"),
        .description = common::json_get_string(item, "description"),
        .key_code = common::json_get_string(item, "key_code"),
        .key_decisions = common::json_get_string_array(item, "key_decisions"),
    };
  });

  briefing.patterns_used = decode_list<PatternUse>(json, "patterns_used", [](const std::string &item) {
    return PatternUse{
        .pattern = common::json_get_string(item, "pattern"),
        .where = common::json_get_string(item, "where"),
        .explained = common::json_get_string(item, "explained"),
    };
  });

  briefing.concepts_touched =
      decode_list<ConceptTouch>(json, "concepts_touched", [](const std::string &item) {
        const auto members = common::json_parse_object_raw(item);
        const auto understood = members.find("developer_understood");
        return ConceptTouch{
            .concept_name = common::json_get_string(item, "concept"),
            .in_code = common::json_get_string(item, "in_code"),
            .developer_understood = understood != members.end() && understood->second == "true",
            .evidence = common::json_get_string(item, "evidence"),
        };
      });

  const std::string risk = common::json_get_object(json, "will_bite_you");
  if (!risk.empty() && !common::json_parse_object_raw(risk).empty()) {
    briefing.will_bite_you = RiskNote{
        .issue = common::json_get_string(risk, "issue"),
        .where = common::json_get_string(risk, "where"),
        .why = common::json_get_string(risk, "why"),
        .what_to_check = common::json_get_string(risk, "what_to_check"),
    };
  }

  return common::Result<SessionBriefing>::success(std::move(briefing));
}

std::string render_briefing_markdown(const SessionBriefing &briefing) {
  std::ostringstream out;
  out << "# Session Briefing: " << briefing.session_id << "\n\n";
  out << "**Project:** " << briefing.project_path << "\n";
  out << "**Generated:** " << briefing.created_at << "\n\n";

  out << "## Summary\n" << briefing.session_summary << "\n\n";

  if (!briefing.what_got_built.empty()) {
    out << "## What Got Built\n";
    for (const auto &item : briefing.what_got_built) {
      out << "### `" << (item.file.empty() ? "unknown" : item.file) << "`\n";
      out << item.description << "\n";
      if (!item.key_code.empty()) {
        out << "- **Key code:** " << item.key_code << "\n";
      }
      for (const auto &decision : item.key_decisions) {
        out << "- " << decision << "\n";
      }
      out << "\n";
    }
  }

  if (!briefing.how_pieces_connect.empty()) {
    out << "## How Pieces Connect\n" << briefing.how_pieces_connect << "\n\n";
  }

  if (!briefing.patterns_used.empty()) {
    out << "## Patterns Used\n";
    for (const auto &pattern : briefing.patterns_used) {
      out << "- **" << pattern.pattern << "** (" << pattern.where << "): " << pattern.explained
          << "\n";
    }
    out << "\n";
  }

  if (briefing.will_bite_you.has_value()) {
    const auto &risk = *briefing.will_bite_you;
    out << "## Will Bite You\n";
    out << "**Issue:** " << risk.issue << "\n";
    out << "**Where:** " << risk.where << "\n";
    out << "**Why:** " << risk.why << "\n";
    out << "**What to check:** " << risk.what_to_check << "\n\n";
  }

  if (!briefing.concepts_touched.empty()) {
    out << "## Concepts Touched\n";
    for (const auto &touch : briefing.concepts_touched) {
      out << "- **" << touch.concept_name << "** [" << (touch.developer_understood ? "Y" : "N")
          << "] (" << touch.in_code << "): " << touch.evidence << "\n";
    }
    out << "\n";
  }

  return out.str();
}

} // namespace sidecar::summarizer
