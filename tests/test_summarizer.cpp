#include "test_framework.hpp"

#include "sidecar/common/text.hpp"
#include "sidecar/summarizer/summarizer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

namespace sm = sidecar::summarizer;
namespace tr = sidecar::transcript;
using sidecar::testing::MockProvider;

tr::FilteredTranscript sample_transcript() {
  tr::FilteredTranscript filtered;
  filtered.session_id = "sess-1";

  tr::Message user;
  user.type = tr::MessageType::User;
  user.role = tr::Role::User;
  user.content.push_back(tr::TextBlock{.text = "Add a parser"});

  tr::Message assistant;
  assistant.type = tr::MessageType::Assistant;
  assistant.role = tr::Role::Assistant;
  assistant.content.push_back(tr::TextBlock{.text = "Writing it now"});
  assistant.content.push_back(tr::ToolInvocationBlock{
      .name = "Write", .parameters = {{"file_path", "/src/parser.cpp"}}});
  assistant.content.push_back(tr::ToolInvocationBlock{.name = "Bash", .parameters = {}});

  tr::Message summary;
  summary.type = tr::MessageType::Summary;
  summary.content.push_back(tr::TextBlock{.text = "Parser work"});

  filtered.messages = {user, assistant, summary};
  return filtered;
}

} // namespace

void register_summarizer_tests(std::vector<sidecar::tests::TestCase> &tests) {
  using sidecar::tests::require;
  using sidecar::tests::require_contains;

  tests.push_back({"summarizer_formats_conversation", [] {
                     const auto text = sm::format_conversation(sample_transcript());
                     require(text == "USER: Add a parser\n\n"
                                     "ASSISTANT: Writing it now\n"
                                     "  [Tools: Write(/src/parser.cpp), Bash]\n\n"
                                     "SESSION SUMMARY: Parser work",
                             "conversation text: " + text);
                   }});

  tests.push_back({"summarizer_request_fits_without_cutting", [] {
                     const auto request = sm::build_summary_request("DIFF", "CONV", 1000);
                     require(request == "## CODEBASE DIFF\n\nDIFF\n\n## CONVERSATION\n\nCONV",
                             "request layout");
                   }});

  tests.push_back({"summarizer_request_cuts_conversation_first", [] {
                     const std::string diff(1000, 'd');
                     const std::string conversation(50'000, 'c');
                     const auto request = sm::build_summary_request(diff, conversation, 20'000);
                     require_contains(request, diff, "diff kept whole");
                     require_contains(request, "[...conversation truncated...]",
                             "conversation marker");
                     require(request.find("[...diff truncated...]") == std::string::npos,
                             "no diff marker");
                     require(sidecar::common::utf8_length(request) <= 20'000, "within cap");
                   }});

  tests.push_back({"summarizer_request_halves_when_diff_dominates", [] {
                     const std::string diff(30'000, 'd');
                     const std::string conversation(30'000, 'c');
                     const auto request = sm::build_summary_request(diff, conversation, 20'000);
                     require_contains(request, "[...diff truncated...]",
                             "diff marker");
                     require_contains(request, "[...conversation truncated...]",
                             "conversation marker");
                     require(request.find(std::string(10'001, 'd')) == std::string::npos,
                             "diff cut to half");
                   }});

  tests.push_back({"summarizer_strips_code_fences", [] {
                     require(sm::strip_code_fence("```json\n{\"a\":1}\n```") == "{\"a\":1}",
                             "tagged fence");
                     require(sm::strip_code_fence("```\n{}\n```\n") == "{}", "bare fence");
                     require(sm::strip_code_fence("  {\"b\":2}  ") == "{\"b\":2}", "no fence");
                   }});

  tests.push_back({"summarizer_builds_briefing_from_reply", [] {
                     auto provider = std::make_shared<MockProvider>();
                     provider->push_response("```json\n" + sidecar::testing::briefing_reply() +
                                             "\n```");
                     sm::ProviderSummarizer summarizer(provider);

                     const auto result =
                         summarizer.summarize(sample_transcript(), {}, "/work/app");
                     require(result.ok(), result.ok() ? "" : result.error());
                     const auto &briefing = result.value();
                     require(briefing.session_id == "sess-1", "session id from transcript");
                     require(briefing.project_path == "/work/app", "project path");
                     require(!briefing.created_at.empty(), "timestamp set");
                     require(briefing.what_got_built.size() == 1, "built item");
                     require(briefing.will_bite_you.has_value(), "risk present");
                     require(briefing.concepts_touched.front().developer_understood,
                             "understood flag");
                     require(provider->last_system_prompt().has_value(), "system prompt sent");
                     const auto &prompt = *provider->last_system_prompt();
                     require_contains(prompt, "(be precise)", "parenthesised text kept in prompt");
                     require(prompt.size() >= 20 &&
                                 prompt.compare(prompt.size() - 20, 20, "no markdown fencing.") == 0,
                             "system prompt is complete");
                     require_contains(provider->last_message(), "## CONVERSATION",
                             "request body sent");
                   }});

  tests.push_back({"summarizer_retries_malformed_reply", [] {
                     auto provider = std::make_shared<MockProvider>();
                     provider->push_response("Sorry, here is no JSON");
                     provider->push_response(sidecar::testing::briefing_reply("Second try"));
                     sm::ProviderSummarizer summarizer(provider);

                     const auto result = summarizer.summarize(sample_transcript(), {}, "/p");
                     require(result.ok(), "second attempt should succeed");
                     require(result.value().session_summary == "Second try", "second reply used");
                     require(provider->calls() == 2, "two calls");
                   }});

  tests.push_back({"summarizer_gives_up_after_max_attempts", [] {
                     auto provider = std::make_shared<MockProvider>();
                     provider->push_response("[1,2,3]");
                     sm::ProviderSummarizer summarizer(provider, {.max_attempts = 3});

                     const auto result = summarizer.summarize(sample_transcript(), {}, "/p");
                     require(!result.ok(), "should fail");
                     require(result.code() == sidecar::common::ErrorCode::Summarizer,
                             "summarizer code");
                     require(provider->calls() == 3, "three attempts");
                   }});

  tests.push_back({"summarizer_provider_error_is_not_retried", [] {
                     auto provider = std::make_shared<MockProvider>();
                     provider->push_error("Provider error [auth] status=401");
                     sm::ProviderSummarizer summarizer(provider);

                     const auto result = summarizer.summarize(sample_transcript(), {}, "/p");
                     require(!result.ok(), "should fail");
                     require(result.code() == sidecar::common::ErrorCode::Summarizer,
                             "summarizer code");
                     require_contains(result.error(), "[auth]", "cause kept");
                     require(provider->calls() == 1, "single attempt");
                   }});

  tests.push_back({"summarizer_request_respects_input_cap", [] {
                     auto provider = std::make_shared<MockProvider>();
                     sm::ProviderSummarizer summarizer(provider, {.max_input_chars = 500});
                     auto transcript = sample_transcript();
                     transcript.messages.front().content = {
                         tr::TextBlock{.text = std::string(5'000, 'q')}};

                     const auto result = summarizer.summarize(transcript, {}, "/p");
                     require(result.ok(), "default reply parses");
                     require(provider->last_message().size() < 700, "request capped");
                   }});

  tests.push_back({"briefing_json_roundtrip_keeps_fields", [] {
                     const auto parsed = sm::parse_briefing_json(sidecar::testing::briefing_reply());
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     auto briefing = parsed.value();
                     briefing.session_id = "s";
                     briefing.created_at = "2024-01-01T00:00:00Z";

                     const auto again = sm::parse_briefing_json(sm::encode_briefing_json(briefing));
                     require(again.ok(), "encoded briefing parses");
                     require(again.value() == briefing, "fields preserved");
                   }});

  tests.push_back({"briefing_parse_rejects_non_objects", [] {
                     require(!sm::parse_briefing_json("").ok(), "empty");
                     require(!sm::parse_briefing_json("[]").ok(), "array");
                     require(!sm::parse_briefing_json("{\"session_summary\":").ok(), "truncated");

                     const auto minimal = sm::parse_briefing_json(R"({"will_bite_you":{}})");
                     require(minimal.ok(), "sparse object accepted");
                     require(!minimal.value().will_bite_you.has_value(), "empty risk is absent");
                   }});

  tests.push_back({"briefing_markdown_has_sections", [] {
                     auto briefing = sm::parse_briefing_json(sidecar::testing::briefing_reply()).value();
                     briefing.session_id = "abc";
                     const auto markdown = sm::render_briefing_markdown(briefing);
                     require(markdown.rfind("# Session Briefing: abc", 0) == 0, "title");
                     for (const char *section : {"## Summary", "## What Got Built",
                                                 "### `src/parser.cpp`", "## How Pieces Connect",
                                                 "## Patterns Used", "## Will Bite You",
                                                 "## Concepts Touched", "[Y]"}) {
                       require_contains(markdown, section,
                               std::string("missing ") + section);
                     }
                   }});
}
