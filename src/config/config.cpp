#include "sidecar/config/config.hpp"

#include "sidecar/common/fs.hpp"
#include "sidecar/common/toml.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace sidecar::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".config/sidecar";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const auto env = env_value("SIDECAR_CONFIG_PATH"); env.has_value()) {
    return std::filesystem::path(common::expand_path(*env));
  }
  return std::nullopt;
}

bool is_env_name(const std::string &name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](const char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
  });
}

// KEY=value lines, optionally prefixed with "export" and with the value quoted.
// Variables already present in the environment are left untouched.
void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return;
  }

  std::istringstream lines(content.value());
  std::string line;
  while (std::getline(lines, line)) {
    std::string entry = common::trim(line);
    if (common::starts_with(entry, "export ")) {
      entry = common::trim(entry.substr(7));
    }
    const auto eq = entry.find('=');
    if (entry.empty() || entry.front() == '#' || eq == std::string::npos) {
      continue;
    }

    const std::string name = common::trim(entry.substr(0, eq));
    std::string value = common::trim(entry.substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    if (is_env_name(name) && !env_value(name.c_str()).has_value()) {
      setenv(name.c_str(), value.c_str(), 0);
    }
  }
}

// Earlier files win: $SIDECAR_ENV_FILE, then the config dir, then the working directory.
void load_dotenv_files() {
  if (const auto env_file = env_value("SIDECAR_ENV_FILE"); env_file.has_value()) {
    load_dotenv_file(common::expand_path(*env_file));
  }
  if (const auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  if (const auto cwd = std::filesystem::current_path(ec); !ec) {
    load_dotenv_file(cwd / ".env");
  }
}

std::string get_path(const common::TomlDocument &doc, const std::string &key,
                     const std::string &fallback) {
  const std::string value = doc.get_string(key, fallback);
  return value.empty() ? value : common::expand_path(value);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Config, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  if (const auto env_dir = env_value("SIDECAR_CONFIG_DIR"); env_dir.has_value()) {
    return common::ensure_dir(common::expand_path(*env_dir));
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.code(), home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.code(), cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const auto model = env_value("SIDECAR_MODEL"); model.has_value()) {
    config.summarizer.model = *model;
  }

  if (const auto api_key = env_value("SIDECAR_API_KEY"); api_key.has_value()) {
    config.summarizer.api_key = *api_key;
  } else if (!config.summarizer.api_key.has_value() ||
             common::trim(*config.summarizer.api_key).empty()) {
    if (const auto anthropic_key = env_value("ANTHROPIC_API_KEY"); anthropic_key.has_value()) {
      config.summarizer.api_key = *anthropic_key;
    }
  }

  if (const auto projects = env_value("SIDECAR_PROJECTS_DIR"); projects.has_value()) {
    config.paths.projects_dir = common::expand_path(*projects);
  }

  if (const auto backend = env_value("SIDECAR_OBSERVABILITY"); backend.has_value()) {
    config.observability.backend = *backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::Config, parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.paths.projects_dir = get_path(doc, "paths.projects_dir", config.paths.projects_dir);
  config.paths.briefings_dir = get_path(doc, "paths.briefings_dir", "");
  config.paths.insights_dir = get_path(doc, "paths.insights_dir", "");
  config.paths.locks_dir = get_path(doc, "paths.locks_dir", "");
  config.paths.logs_dir = get_path(doc, "paths.logs_dir", "");

  auto &summarizer = config.summarizer;
  summarizer.provider = doc.get_string("summarizer.provider", summarizer.provider);
  summarizer.model = doc.get_string("summarizer.model", summarizer.model);
  if (doc.has("summarizer.api_key")) {
    summarizer.api_key = common::expand_path(doc.get_string("summarizer.api_key"));
  }
  summarizer.base_url = doc.get_string("summarizer.base_url", summarizer.base_url);
  summarizer.max_attempts = doc.get_uint("summarizer.max_attempts", summarizer.max_attempts);
  summarizer.max_input_chars =
      doc.get_uint("summarizer.max_input_chars", summarizer.max_input_chars);
  summarizer.max_tokens = doc.get_uint("summarizer.max_tokens", summarizer.max_tokens);
  summarizer.timeout_ms = doc.get_uint("summarizer.timeout_ms", summarizer.timeout_ms);
  summarizer.temperature = doc.get_double("summarizer.temperature", summarizer.temperature);

  config.extraction.max_diff_chars =
      doc.get_uint("extraction.max_diff_chars", config.extraction.max_diff_chars);
  config.extraction.git_timeout_secs =
      doc.get_uint("extraction.git_timeout_secs", config.extraction.git_timeout_secs);

  config.guard.lock_max_age_secs =
      doc.get_uint("guard.lock_max_age_secs", config.guard.lock_max_age_secs);
  config.guard.stale_lock_secs =
      doc.get_uint("guard.stale_lock_secs", config.guard.stale_lock_secs);

  config.notifications.enabled =
      doc.get_bool("notifications.enabled", config.notifications.enabled);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::Config, cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    config.paths.projects_dir = common::expand_path(config.paths.projects_dir);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::Config,
                                           "Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::Config,
                                           path.string() + ": " + parsed.error());
  }
  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  const std::string provider = common::to_lower(common::trim(config.summarizer.provider));
  if (provider != "anthropic") {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "Unknown summarizer.provider: " + config.summarizer.provider);
  }

  const std::pair<bool, const char *> errors[] = {
      {config.summarizer.max_attempts == 0, "summarizer.max_attempts must be at least 1"},
      {config.summarizer.max_input_chars == 0, "summarizer.max_input_chars must be positive"},
      {config.summarizer.temperature < 0.0 || config.summarizer.temperature > 1.0,
       "summarizer.temperature must be between 0.0 and 1.0"},
      {config.extraction.max_diff_chars == 0, "extraction.max_diff_chars must be positive"},
      {config.extraction.git_timeout_secs == 0, "extraction.git_timeout_secs must be positive"},
      {config.guard.lock_max_age_secs == 0, "guard.lock_max_age_secs must be positive"},
  };
  for (const auto &[failed, message] : errors) {
    if (failed) {
      return common::Result<std::vector<std::string>>::failure(common::ErrorCode::Config, message);
    }
  }

  std::vector<std::string> warnings;
  if (config.guard.stale_lock_secs < config.guard.lock_max_age_secs) {
    warnings.push_back("guard.stale_lock_secs is shorter than guard.lock_max_age_secs");
  }
  if (!config.summarizer.api_key.has_value() || common::trim(*config.summarizer.api_key).empty()) {
    warnings.push_back("no summarizer API key configured (set ANTHROPIC_API_KEY)");
  }
  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace sidecar::config
