#include "sidecar/runtime/app.hpp"

#include "sidecar/common/fs.hpp"
#include "sidecar/config/config.hpp"
#include "sidecar/observability/factory.hpp"
#include "sidecar/observability/global.hpp"
#include "sidecar/providers/anthropic.hpp"

namespace sidecar::runtime {

namespace {

std::filesystem::path resolve_dir(const std::string &configured,
                                  const std::filesystem::path &fallback) {
  if (configured.empty()) {
    return fallback;
  }
  return common::expand_path(configured);
}

} // namespace

ResolvedPaths resolve_paths(const config::PathsConfig &paths,
                            const std::filesystem::path &config_dir) {
  return ResolvedPaths{
      .projects_dir = common::expand_path(paths.projects_dir),
      .briefings_dir = resolve_dir(paths.briefings_dir, config_dir / "briefings"),
      .insights_dir = resolve_dir(paths.insights_dir, config_dir / "insights"),
      .locks_dir = resolve_dir(paths.locks_dir, config_dir / "locks"),
      .logs_dir = resolve_dir(paths.logs_dir, config_dir / "logs"),
  };
}

RuntimeContext::RuntimeContext(config::Config config, ResolvedPaths paths)
    : config_(std::move(config)), paths_(std::move(paths)) {}

common::Result<RuntimeContext> RuntimeContext::from_config(config::Config config) {
  auto dir = config::config_dir();
  if (!dir.ok()) {
    return common::Result<RuntimeContext>::failure(dir.code(), dir.error());
  }
  auto paths = resolve_paths(config.paths, dir.value());
  return common::Result<RuntimeContext>::success(
      RuntimeContext(std::move(config), std::move(paths)));
}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.code(), loaded.error());
  }
  return from_config(std::move(loaded.value()));
}

const config::Config &RuntimeContext::config() const { return config_; }

const ResolvedPaths &RuntimeContext::paths() const { return paths_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

transcript::SessionCatalog RuntimeContext::create_catalog() const {
  return transcript::SessionCatalog(paths_.projects_dir);
}

pipeline::BriefingStore RuntimeContext::create_briefing_store() const {
  return pipeline::BriefingStore(paths_.briefings_dir);
}

pipeline::InsightStore RuntimeContext::create_insight_store() const {
  return pipeline::InsightStore(paths_.insights_dir);
}

std::shared_ptr<changes::ChangeSetExtractor> RuntimeContext::create_extractor() const {
  auto git = std::make_shared<changes::ProcessGitClient>(
      std::chrono::seconds(config_.extraction.git_timeout_secs));
  return std::make_shared<changes::ChangeSetExtractor>(
      std::move(git), changes::ExtractorOptions{.max_diff_chars = config_.extraction.max_diff_chars});
}

common::Result<std::shared_ptr<summarizer::Summarizer>> RuntimeContext::create_summarizer() const {
  const auto &settings = config_.summarizer;
  if (common::to_lower(settings.provider) != "anthropic") {
    return common::Result<std::shared_ptr<summarizer::Summarizer>>::failure(
        common::ErrorCode::Config, "unsupported summarizer provider: " + settings.provider);
  }

  auto provider = std::make_shared<providers::AnthropicProvider>(
      settings.api_key.value_or(""), settings.base_url, std::make_shared<providers::CurlHttpClient>(),
      providers::AnthropicOptions{.max_tokens = settings.max_tokens,
                                  .timeout_ms = settings.timeout_ms});
  std::shared_ptr<summarizer::Summarizer> summarizer =
      std::make_shared<summarizer::ProviderSummarizer>(
          std::move(provider), summarizer::SummarizerOptions{
                                   .model = settings.model,
                                   .max_attempts = settings.max_attempts,
                                   .max_input_chars = settings.max_input_chars,
                                   .temperature = settings.temperature,
                               });
  return common::Result<std::shared_ptr<summarizer::Summarizer>>::success(std::move(summarizer));
}

common::Result<pipeline::Pipeline> RuntimeContext::create_pipeline() const {
  auto summarizer = create_summarizer();
  if (!summarizer.ok()) {
    return common::Result<pipeline::Pipeline>::failure(summarizer.code(), summarizer.error());
  }
  return common::Result<pipeline::Pipeline>::success(
      pipeline::Pipeline(create_catalog(), create_extractor(), summarizer.value(),
                         create_briefing_store(), create_insight_store()));
}

std::shared_ptr<guard::LockStore> RuntimeContext::create_lock_store() const {
  return std::make_shared<guard::FileLockStore>(paths_.locks_dir);
}

std::shared_ptr<guard::BackgroundLauncher> RuntimeContext::create_launcher() const {
  std::filesystem::path working_dir;
  if (auto home = common::home_dir(); home.ok()) {
    working_dir = home.value();
  }
  return std::make_shared<guard::DetachedProcessLauncher>(guard::DetachedLaunchOptions{
      .executable = guard::current_executable(),
      .logs_dir = paths_.logs_dir,
      .working_dir = working_dir,
      .config_path = config::config_path_override(),
  });
}

hooks::TriggerHandler RuntimeContext::create_trigger_handler() const {
  return hooks::TriggerHandler(
      create_lock_store(), create_launcher(),
      hooks::TriggerOptions{
          .lock_max_age = std::chrono::seconds(config_.guard.lock_max_age_secs),
          .stale_lock_age = std::chrono::seconds(config_.guard.stale_lock_secs),
      });
}

} // namespace sidecar::runtime
