#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sidecar::config {

/// Directory locations. Empty values are derived from the config directory
/// by the runtime context.
struct PathsConfig {
  std::string projects_dir = "~/.claude/projects";
  std::string briefings_dir;
  std::string insights_dir;
  std::string locks_dir;
  std::string logs_dir;
};

struct SummarizerConfig {
  std::string provider = "anthropic";
  std::string model = "claude-haiku-4-5-20251001";
  std::optional<std::string> api_key;
  std::string base_url = "https://api.anthropic.com";
  std::uint32_t max_attempts = 2;
  std::uint32_t max_input_chars = 150'000;
  std::uint32_t max_tokens = 4096;
  std::uint32_t timeout_ms = 60'000;
  double temperature = 0.2;
};

struct ExtractionConfig {
  std::uint32_t max_diff_chars = 32'000;
  std::uint32_t git_timeout_secs = 30;
};

struct GuardConfig {
  std::uint32_t lock_max_age_secs = 60;
  std::uint32_t stale_lock_secs = 300;
};

struct NotificationsConfig {
  bool enabled = false;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  PathsConfig paths;
  SummarizerConfig summarizer;
  ExtractionConfig extraction;
  GuardConfig guard;
  NotificationsConfig notifications;
  ObservabilityConfig observability;
};

} // namespace sidecar::config
