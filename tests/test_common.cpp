#include "test_framework.hpp"

#include "sidecar/common/clock.hpp"
#include "sidecar/common/fs.hpp"
#include "sidecar/common/hash.hpp"
#include "sidecar/common/json_util.hpp"
#include "sidecar/common/process.hpp"
#include "sidecar/common/text.hpp"
#include "sidecar/common/toml.hpp"
#include "sidecar/observability/factory.hpp"
#include "sidecar/observability/multi_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

void register_common_tests(std::vector<sidecar::tests::TestCase> &tests) {
  using sidecar::tests::require;
  namespace common = sidecar::common;

  tests.push_back({"json_escape_roundtrips_control_characters", [] {
                     const std::string original = "line1\n\"quoted\"\t\\ end";
                     const std::string escaped = common::json_escape(original);
                     require(escaped.find('\n') == std::string::npos, "newline should be escaped");
                     require(common::json_unescape(escaped) == original, "unescape mismatch");
                   }});

  tests.push_back({"json_unescape_decodes_surrogate_pairs", [] {
                     require(common::json_unescape("\\u00e9") == "\xC3\xA9", "e-acute mismatch");
                     require(common::json_unescape("\\ud83d\\ude00") == "\xF0\x9F\x98\x80",
                             "surrogate pair mismatch");
                   }});

  tests.push_back({"json_validate_accepts_values_and_rejects_garbage", [] {
                     require(common::json_validate(R"({"a":[1,2,{"b":null}],"c":"x"})"),
                             "object should validate");
                     require(common::json_validate("  true "), "bare literal should validate");
                     require(!common::json_validate("{\"a\":1"), "unterminated object");
                     require(!common::json_validate("{} {}"), "two values");
                     require(!common::json_validate(""), "empty input");
                   }});

  tests.push_back({"json_parse_object_raw_keeps_nested_values", [] {
                     const auto members =
                         common::json_parse_object_raw(R"({"name":"x","list":[1,2],"obj":{"k":1}})");
                     require(members.size() == 3, "expected three members");
                     require(members.at("name") == "\"x\"", "string keeps quotes");
                     require(members.at("list") == "[1,2]", "array raw text");
                     require(common::json_kind(members.at("obj")) == common::JsonKind::Object,
                             "object kind");
                   }});

  tests.push_back({"json_split_top_level_objects_skips_scalars", [] {
                     const auto objects =
                         common::json_split_top_level_objects(R"([{"a":1}, 3, "s", {"b":[{}]}])");
                     require(objects.size() == 2, "expected two objects");
                     require(common::json_get_array(objects[1], "b") == "[{}]", "nested array");
                   }});

  tests.push_back({"toml_parses_sections_and_types", [] {
                     const auto parsed = common::parse_toml(
                         "# comment\n[summarizer]\nmodel = \"m # not comment\"\n"
                         "max_attempts = 3 # trailing\ntemperature = 0.5\nmax_tokens = -4\n"
                         "[notifications]\nenabled = true\n");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_string("summarizer.model") == "m # not comment",
                             "quoted hash should survive");
                     require(doc.get_uint("summarizer.max_attempts", 0) == 3, "int value");
                     require(doc.get_uint("summarizer.max_tokens", 9) == 9,
                             "negative value falls back");
                     require(doc.get_double("summarizer.temperature", 0.0) == 0.5, "double value");
                     require(doc.get_bool("notifications.enabled", false), "bool value");
                     require(doc.get_uint("missing.key", 7) == 7, "fallback value");
                   }});

  tests.push_back({"toml_rejects_line_without_equals", [] {
                     const auto parsed = common::parse_toml("[paths]\nprojects_dir\n");
                     require(!parsed.ok(), "parse should fail");
                     require(parsed.code() == common::ErrorCode::Config, "config error code");
                   }});

  tests.push_back({"utf8_helpers_count_code_points", [] {
                     const std::string text = "h\xC3\xA9llo";
                     require(common::utf8_length(text) == 5, "five code points");
                     require(common::utf8_prefix(text, 2) == "h\xC3\xA9", "prefix keeps sequence");
                     require(common::truncate_utf8(text, 2) == "h",
                             "byte truncation must not split a sequence");
                   }});

  tests.push_back({"safe_file_component_replaces_separators", [] {
                     require(common::safe_file_component("abc-1.2_x") == "abc-1.2_x", "unchanged");
                     require(common::safe_file_component("../etc/passwd") == ".._etc_passwd",
                             "slashes replaced");
                     require(common::safe_file_component("..") == "_..", "dot-dot prefixed");
                     require(common::safe_file_component("") == "_", "empty prefixed");
                   }});

  tests.push_back({"write_file_atomic_creates_parents_and_replaces", [] {
                     sidecar::testing::TempDir dir;
                     const auto path = dir.path() / "a" / "b" / "file.txt";
                     require(common::write_file_atomic(path, "first").ok(), "first write");
                     require(common::write_file_atomic(path, "second").ok(), "second write");
                     const auto content = common::read_file(path);
                     require(content.ok() && content.value() == "second", "content replaced");

                     std::size_t entries = 0;
                     for (const auto &entry : std::filesystem::directory_iterator(path.parent_path())) {
                       (void)entry;
                       ++entries;
                     }
                     require(entries == 1, "no temp file should remain");
                   }});

  tests.push_back({"read_file_missing_is_not_found", [] {
                     sidecar::testing::TempDir dir;
                     const auto content = common::read_file(dir.path() / "absent.txt");
                     require(!content.ok(), "read should fail");
                     require(content.code() == common::ErrorCode::NotFound, "not found code");
                   }});

  tests.push_back({"sha256_hex_matches_known_digest", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256(abc) mismatch");
                   }});

  tests.push_back({"clock_formats_utc_stamps", [] {
                     const std::chrono::system_clock::time_point when{
                         std::chrono::seconds(1'700'000'000)};
                     require(common::format_rfc3339(when) == "2023-11-14T22:13:20Z", "rfc3339");
                     require(common::compact_stamp(when) == "20231114-221320", "compact stamp");
                     require(common::epoch_seconds(when) == 1'700'000'000.0, "epoch seconds");
                   }});

  tests.push_back({"run_process_captures_output_and_exit_code", [] {
                     sidecar::testing::TempDir dir;
                     const auto result = common::run_process({"sh", "-c", "echo hi; exit 3"},
                                                             dir.path(), std::chrono::seconds(10));
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value().exit_code == 3, "exit code");
                     require(result.value().output == "hi\n", "stdout captured");
                     require(!result.value().timed_out, "no timeout");
                   }});

  tests.push_back({"run_process_kills_on_timeout", [] {
                     sidecar::testing::TempDir dir;
                     const auto result = common::run_process({"sleep", "5"}, dir.path(),
                                                             std::chrono::milliseconds(200));
                     require(result.ok(), "process should start");
                     require(result.value().timed_out, "timeout flag");
                   }});

  tests.push_back({"run_process_reports_missing_program", [] {
                     sidecar::testing::TempDir dir;
                     const auto result = common::run_process(
                         {"sidecar-definitely-missing-binary"}, dir.path(), std::chrono::seconds(5));
                     require(result.ok(), "fork should succeed");
                     require(result.value().exit_code == common::kExecFailedExitCode,
                             "exec failure exit code");
                   }});

  tests.push_back({"expand_path_substitutes_home_and_variables", [] {
                     const sidecar::testing::EnvGuard home("HOME", std::string("/home/tester"));
                     const sidecar::testing::EnvGuard var("SIDECAR_TEST_DIR", std::string("data"));
                     const sidecar::testing::EnvGuard unset("SIDECAR_TEST_UNSET", std::nullopt);
                     require(common::expand_path("~/x") == "/home/tester/x", "tilde");
                     require(common::expand_path("/a/$SIDECAR_TEST_DIR/b") == "/a/data/b",
                             "bare variable");
                     require(common::expand_path("/a/${SIDECAR_TEST_DIR}b") == "/a/datab",
                             "braced variable");
                     require(common::expand_path("/a/$SIDECAR_TEST_UNSET/b") == "/a//b",
                             "unset variable");
                     require(common::expand_path("cost $5 ${") == "cost $5 ${", "not a name");
                     require(common::expand_path("") == "", "empty");
                   }});

  tests.push_back({"create_observer_picks_backends_from_config", [] {
                     namespace obs = sidecar::observability;
                     auto config = sidecar::testing::temp_config("/tmp/sidecar-observer");
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none is noop");
                     config.observability.backend = "";
                     require(obs::create_observer(config)->name() == "noop", "empty is noop");
                     config.observability.backend = " LOG , none";
                     require(obs::create_observer(config)->name() == "log", "none dropped from list");
                     config.observability.backend = "log,log";
                     require(obs::create_observer(config)->name() == "multi", "two backends fan out");
                   }});

  tests.push_back({"multi_observer_forwards_to_every_backend", [] {
                     namespace obs = sidecar::observability;
                     auto first = std::make_unique<sidecar::testing::RecordingObserver>();
                     auto second = std::make_unique<sidecar::testing::RecordingObserver>();
                     auto *first_raw = first.get();
                     auto *second_raw = second.get();
                     std::vector<std::unique_ptr<obs::IObserver>> backends;
                     backends.push_back(std::move(first));
                     backends.push_back(nullptr);
                     backends.push_back(std::move(second));

                     obs::MultiObserver multi(std::move(backends));
                     require(multi.size() == 2, "null backend dropped");
                     multi.record_event(obs::StageEvent{.stage = "filter", .detail = ""});
                     multi.record_metric(obs::TokensEstimatedMetric{.tokens = 42});
                     require(first_raw->events.size() == 1 && second_raw->events.size() == 1,
                             "event fanned out");
                     require(first_raw->metrics.size() == 1 && second_raw->metrics.size() == 1,
                             "metric fanned out");
                   }});
}
