#include "test_framework.hpp"

#include "sidecar/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = sidecar::config::config_path_override();
    if (next.has_value()) {
      sidecar::config::set_config_path_override(*next);
    } else {
      sidecar::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      sidecar::config::set_config_path_override(*old_override);
    } else {
      sidecar::config::clear_config_path_override();
    }
  }
};

} // namespace

void register_config_tests(std::vector<sidecar::tests::TestCase> &tests) {
  using sidecar::tests::require;
  using sidecar::testing::EnvGuard;
  using sidecar::testing::TempDir;
  namespace cfg = sidecar::config;

  tests.push_back({"config_defaults_are_valid", [] {
                     cfg::Config config;
                     config.summarizer.api_key = "key";
                     const auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), warnings.ok() ? "" : warnings.error());
                     require(warnings.value().empty(), "defaults should not warn");
                     require(config.guard.lock_max_age_secs == 60, "lock window default");
                     require(config.summarizer.max_input_chars == 150'000, "input cap default");
                   }});

  tests.push_back({"config_parse_reads_every_section", [] {
                     const auto parsed = cfg::parse_config(
                         "[paths]\nbriefings_dir = \"/tmp/b\"\n"
                         "[summarizer]\nmodel = \"other-model\"\nmax_attempts = 4\n"
                         "temperature = 0.7\n"
                         "[extraction]\nmax_diff_chars = 1000\ngit_timeout_secs = 5\n"
                         "[guard]\nlock_max_age_secs = 30\nstale_lock_secs = 120\n"
                         "[notifications]\nenabled = true\n"
                         "[observability]\nbackend = \"none\"\n");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &config = parsed.value();
                     require(config.paths.briefings_dir == "/tmp/b", "briefings dir");
                     require(config.summarizer.model == "other-model", "model");
                     require(config.summarizer.max_attempts == 4, "max attempts");
                     require(config.summarizer.temperature == 0.7, "temperature");
                     require(config.extraction.max_diff_chars == 1000, "diff cap");
                     require(config.extraction.git_timeout_secs == 5, "git timeout");
                     require(config.guard.lock_max_age_secs == 30, "lock age");
                     require(config.guard.stale_lock_secs == 120, "stale age");
                     require(config.notifications.enabled, "notifications");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_validate_rejects_unknown_provider", [] {
                     cfg::Config config;
                     config.summarizer.provider = "openai";
                     const auto result = cfg::validate_config(config);
                     require(!result.ok(), "unknown provider should fail");
                     require(result.code() == sidecar::common::ErrorCode::Config, "config code");
                   }});

  tests.push_back({"config_validate_rejects_out_of_range_values", [] {
                     cfg::Config config;
                     config.summarizer.temperature = 1.5;
                     require(!cfg::validate_config(config).ok(), "temperature above 1");

                     cfg::Config zero_attempts;
                     zero_attempts.summarizer.max_attempts = 0;
                     require(!cfg::validate_config(zero_attempts).ok(), "zero attempts");
                   }});

  tests.push_back({"config_validate_warns_without_api_key", [] {
                     cfg::Config config;
                     config.guard.stale_lock_secs = 10;
                     const auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), "warnings only");
                     require(warnings.value().size() == 2, "missing key and short stale window");
                   }});

  tests.push_back({"config_env_overrides_take_precedence", [] {
                     EnvGuard model("SIDECAR_MODEL", "env-model");
                     EnvGuard key("SIDECAR_API_KEY", std::nullopt);
                     EnvGuard anthropic("ANTHROPIC_API_KEY", "sk-env");
                     EnvGuard backend("SIDECAR_OBSERVABILITY", "none");

                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.summarizer.model == "env-model", "model override");
                     require(config.summarizer.api_key == std::optional<std::string>("sk-env"),
                             "anthropic key used when none configured");
                     require(config.observability.backend == "none", "backend override");
                   }});

  tests.push_back({"config_configured_key_beats_anthropic_env", [] {
                     EnvGuard key("SIDECAR_API_KEY", std::nullopt);
                     EnvGuard anthropic("ANTHROPIC_API_KEY", "sk-env");

                     cfg::Config config;
                     config.summarizer.api_key = "sk-file";
                     cfg::apply_env_overrides(config);
                     require(config.summarizer.api_key == std::optional<std::string>("sk-file"),
                             "configured key kept");
                   }});

  tests.push_back({"config_load_uses_override_path", [] {
                     TempDir dir;
                     const auto path = dir.create_file(
                         "config.toml", "[summarizer]\nmodel = \"from-file\"\n");
                     ConfigOverrideGuard guard(path);
                     EnvGuard model("SIDECAR_MODEL", std::nullopt);
                     EnvGuard env_file("SIDECAR_ENV_FILE", std::nullopt);

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().summarizer.model == "from-file", "model from file");
                     const auto dir_result = cfg::config_dir();
                     require(dir_result.ok() && dir_result.value() == dir.path(),
                             "config dir follows the override");
                   }});

  tests.push_back({"config_load_without_file_returns_defaults", [] {
                     TempDir dir;
                     ConfigOverrideGuard guard(dir.path() / "missing.toml");
                     EnvGuard model("SIDECAR_MODEL", std::nullopt);

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), "missing file is not an error");
                     require(loaded.value().summarizer.model == cfg::Config{}.summarizer.model,
                             "default model");
                   }});

  tests.push_back({"config_load_reports_malformed_file", [] {
                     TempDir dir;
                     const auto path = dir.create_file("config.toml", "[summarizer\nbroken\n");
                     ConfigOverrideGuard guard(path);

                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "malformed file should fail");
                     require(loaded.code() == sidecar::common::ErrorCode::Config, "config code");
                   }});
}
