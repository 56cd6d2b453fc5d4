#pragma once

#include "sidecar/changes/extractor.hpp"
#include "sidecar/common/result.hpp"
#include "sidecar/config/schema.hpp"
#include "sidecar/guard/launcher.hpp"
#include "sidecar/guard/lock_store.hpp"
#include "sidecar/hooks/trigger.hpp"
#include "sidecar/pipeline/briefing_store.hpp"
#include "sidecar/pipeline/insight_store.hpp"
#include "sidecar/pipeline/pipeline.hpp"
#include "sidecar/summarizer/summarizer.hpp"
#include "sidecar/transcript/catalog.hpp"

#include <filesystem>
#include <memory>

namespace sidecar::runtime {

/// Every directory the components work in, fully expanded.
struct ResolvedPaths {
  std::filesystem::path projects_dir;
  std::filesystem::path briefings_dir;
  std::filesystem::path insights_dir;
  std::filesystem::path locks_dir;
  std::filesystem::path logs_dir;
};

/// Configured paths with empty entries defaulted under config_dir.
[[nodiscard]] ResolvedPaths resolve_paths(const config::PathsConfig &paths,
                                          const std::filesystem::path &config_dir);

/// Composition root: owns the configuration and builds every component.
class RuntimeContext {
public:
  RuntimeContext(config::Config config, ResolvedPaths paths);

  [[nodiscard]] static common::Result<RuntimeContext> from_config(config::Config config);
  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] const ResolvedPaths &paths() const;

  /// Install the observer selected by observability.backend process-wide.
  void install_observer() const;

  [[nodiscard]] transcript::SessionCatalog create_catalog() const;
  [[nodiscard]] pipeline::BriefingStore create_briefing_store() const;
  [[nodiscard]] pipeline::InsightStore create_insight_store() const;
  [[nodiscard]] std::shared_ptr<changes::ChangeSetExtractor> create_extractor() const;
  [[nodiscard]] common::Result<std::shared_ptr<summarizer::Summarizer>> create_summarizer() const;
  [[nodiscard]] common::Result<pipeline::Pipeline> create_pipeline() const;

  [[nodiscard]] std::shared_ptr<guard::LockStore> create_lock_store() const;
  [[nodiscard]] std::shared_ptr<guard::BackgroundLauncher> create_launcher() const;
  [[nodiscard]] hooks::TriggerHandler create_trigger_handler() const;

private:
  config::Config config_;
  ResolvedPaths paths_;
};

} // namespace sidecar::runtime
