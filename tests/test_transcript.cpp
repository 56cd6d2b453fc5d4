#include "test_framework.hpp"

#include "sidecar/transcript/catalog.hpp"
#include "sidecar/transcript/reader.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

void register_transcript_tests(std::vector<sidecar::tests::TestCase> &tests) {
  using sidecar::tests::require;
  using sidecar::testing::TempDir;
  namespace tr = sidecar::transcript;
  namespace helpers = sidecar::testing;

  tests.push_back({"transcript_parses_user_string_content", [] {
                     const auto message = tr::parse_transcript_line(
                         helpers::user_line("hello there", "/work/app"));
                     require(message.has_value(), "line should parse");
                     require(message->type == tr::MessageType::User, "user type");
                     require(message->role == tr::Role::User, "user role");
                     require(message->content.size() == 1, "one block");
                     const auto *text = std::get_if<tr::TextBlock>(&message->content.front());
                     require(text != nullptr && text->text == "hello there", "text content");
                     require(tr::raw_string_field(*message, "cwd") == "/work/app", "raw cwd");
                   }});

  tests.push_back({"transcript_parses_tool_invocation_inputs", [] {
                     const auto message = tr::parse_transcript_line(
                         R"({"type":"assistant","message":{"role":"assistant","content":[)"
                         R"({"type":"tool_use","id":"t","name":"Bash","input":{"command":"ls -la","timeout":30}}]}})");
                     require(message.has_value(), "line should parse");
                     const auto *tool =
                         std::get_if<tr::ToolInvocationBlock>(&message->content.front());
                     require(tool != nullptr, "tool block");
                     require(tool->name == "Bash", "tool name");
                     require(tool->parameters.at("command") == "ls -la", "string input decoded");
                     require(tool->parameters.at("timeout") == "30", "number input keeps JSON text");
                   }});

  tests.push_back({"transcript_drops_unknown_block_kinds", [] {
                     const auto message = tr::parse_transcript_line(
                         R"({"type":"assistant","message":{"role":"assistant","content":[)"
                         R"({"type":"thinking","thinking":"hmm"},{"type":"text","text":"done"},)"
                         R"({"type":"tool_result","tool_use_id":"t9","content":"ok"}]}})");
                     require(message.has_value(), "line should parse");
                     require(message->content.size() == 2, "thinking block dropped");
                     const auto *result = std::get_if<tr::ToolResultBlock>(&message->content[1]);
                     require(result != nullptr && result->reference_id == "t9", "tool result id");
                   }});

  tests.push_back({"transcript_summary_record_becomes_text", [] {
                     const auto message =
                         tr::parse_transcript_line(helpers::summary_line("Built the parser"));
                     require(message.has_value(), "line should parse");
                     require(message->type == tr::MessageType::Summary, "summary type");
                     const auto *text = std::get_if<tr::TextBlock>(&message->content.front());
                     require(text != nullptr && text->text == "Built the parser", "summary text");
                   }});

  tests.push_back({"transcript_keeps_unmodelled_types", [] {
                     const auto message = tr::parse_transcript_line(R"({"type":"system","x":1})");
                     require(message.has_value(), "line should parse");
                     require(message->type == tr::MessageType::Other, "other type");
                     require(message->type_name == "system", "original type name");
                   }});

  tests.push_back({"transcript_skips_malformed_lines", [] {
                     const std::string raw = helpers::user_line("one") + "\n{not json\n\n[1,2]\n" +
                                             helpers::progress_line() + "\n";
                     std::size_t skipped = 0;
                     const auto messages = tr::parse_transcript(raw, &skipped);
                     require(messages.size() == 2, "two valid records");
                     require(skipped == 2, "two malformed lines");
                     require(messages[1].type == tr::MessageType::Progress, "order preserved");
                   }});

  tests.push_back({"transcript_read_missing_file_fails", [] {
                     TempDir dir;
                     const auto result = tr::read_transcript_file(dir.path() / "none.jsonl");
                     require(!result.ok(), "read should fail");
                     require(result.code() == sidecar::common::ErrorCode::SessionRead,
                             "session read code");
                   }});

  tests.push_back({"catalog_missing_directory_is_empty", [] {
                     TempDir dir;
                     tr::SessionCatalog catalog(dir.path() / "does-not-exist");
                     require(catalog.list().empty(), "no sessions");
                     const auto latest = catalog.latest();
                     require(!latest.ok(), "latest should fail");
                     require(latest.code() == sidecar::common::ErrorCode::SessionNotFound,
                             "session not found code");
                   }});

  tests.push_back({"catalog_lists_newest_first_and_filters_by_project", [] {
                     TempDir dir;
                     const auto projects = dir.path() / "projects";
                     helpers::write_session(projects, "-work-app", "/work/app", "s-old",
                                            "2024-01-01T10:00:00Z", {helpers::user_line("a")});
                     helpers::write_session(projects, "-work-app", "/work/app", "s-new",
                                            "2024-03-01T10:00:00Z", {helpers::user_line("b")});
                     helpers::write_session(projects, "-work-lib", "/work/lib", "s-lib",
                                            "2024-02-01T10:00:00Z", {helpers::user_line("c")});

                     tr::SessionCatalog catalog(projects);
                     const auto all = catalog.list();
                     require(all.size() == 3, "three sessions");
                     require(all[0].session_id == "s-new", "newest first");
                     require(all[1].session_id == "s-lib", "middle");
                     require(all[2].session_id == "s-old", "oldest last");

                     const auto lib = catalog.list(std::string("/work/lib"));
                     require(lib.size() == 1 && lib[0].session_id == "s-lib", "project filter");

                     const auto latest = catalog.latest(std::string("/work/app"));
                     require(latest.ok() && latest.value().session_id == "s-new",
                             "latest within project");
                     require(latest.value().project_path == "/work/app", "project path");
                   }});

  tests.push_back({"catalog_get_and_read_by_id", [] {
                     TempDir dir;
                     const auto projects = dir.path() / "projects";
                     helpers::write_session(projects, "-work-app", "/work/app", "abc",
                                            "2024-01-01T10:00:00Z",
                                            {helpers::user_line("hi"), "garbage",
                                             helpers::assistant_text_line("hello back")});
                     tr::SessionCatalog catalog(projects);

                     const auto info = catalog.get("abc");
                     require(info.ok(), "session should be found");
                     require(info.value().git_branch == "main", "index fields");

                     const auto session = catalog.read("abc");
                     require(session.ok(), session.ok() ? "" : session.error());
                     require(session.value().messages.size() == 2, "malformed line skipped");

                     const auto missing = catalog.read("nope");
                     require(missing.code() == sidecar::common::ErrorCode::SessionNotFound,
                             "unknown id");
                   }});

  tests.push_back({"catalog_read_reports_missing_transcript", [] {
                     TempDir dir;
                     const auto projects = dir.path() / "projects";
                     helpers::write_session(projects, "-work-app", "/work/app", "gone",
                                            "2024-01-01T10:00:00Z", {helpers::user_line("x")});
                     std::filesystem::remove(projects / "-work-app" / "gone.jsonl");

                     tr::SessionCatalog catalog(projects);
                     const auto session = catalog.read("gone");
                     require(!session.ok(), "read should fail");
                     require(session.code() == sidecar::common::ErrorCode::SessionRead,
                             "session read code");
                   }});

  tests.push_back({"catalog_scans_projects_without_index", [] {
                     TempDir dir;
                     const auto projects = dir.path() / "projects";
                     dir.create_file("projects/-loose/loose-1.jsonl", helpers::user_line("x") + "\n");

                     tr::SessionCatalog catalog(projects);
                     const auto all = catalog.list();
                     require(all.size() == 1 && all[0].session_id == "loose-1", "scanned session");
                     require(catalog.list(std::string("/anything")).empty(),
                             "scan skipped under a project filter");
                   }});
}
