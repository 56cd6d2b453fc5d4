#pragma once

#include "sidecar/guard/launcher.hpp"
#include "sidecar/guard/lock_store.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace sidecar::hooks {

/// Payload a lifecycle hook receives on stdin.
struct HookEvent {
  std::string session_id;
  std::string cwd;
};

/// Decode a hook payload. Empty input, invalid JSON and a missing
/// session_id all yield nullopt.
[[nodiscard]] std::optional<HookEvent> parse_hook_event(const std::string &stdin_text);

/// The single object a hook writes to stdout.
[[nodiscard]] std::string hook_response_json(bool continue_session = true,
                                             bool suppress_output = true);

enum class TriggerOutcome {
  Launched,
  SkippedLocked,
  LockFailed,
  LaunchFailed,
};

[[nodiscard]] std::string trigger_outcome_name(TriggerOutcome outcome);

struct TriggerOptions {
  std::chrono::seconds lock_max_age{60};
  std::chrono::seconds stale_lock_age{300};
};

class TriggerHandler {
public:
  TriggerHandler(std::shared_ptr<guard::LockStore> locks,
                 std::shared_ptr<guard::BackgroundLauncher> launcher, TriggerOptions options = {});

  /// End of an assistant turn: one background analysis per session at a time.
  [[nodiscard]] TriggerOutcome on_stop(const HookEvent &event);

  /// Before context compaction: always snapshot, no deduplication.
  [[nodiscard]] TriggerOutcome on_pre_compact(const HookEvent &event);

private:
  std::shared_ptr<guard::LockStore> locks_;
  std::shared_ptr<guard::BackgroundLauncher> launcher_;
  TriggerOptions options_;
};

} // namespace sidecar::hooks
