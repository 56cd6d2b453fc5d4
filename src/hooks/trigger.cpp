#include "sidecar/hooks/trigger.hpp"

#include "sidecar/common/json_util.hpp"
#include "sidecar/observability/global.hpp"

namespace sidecar::hooks {

namespace {

std::optional<std::string> project_hint(const HookEvent &event) {
  if (event.cwd.empty()) {
    return std::nullopt;
  }
  return event.cwd;
}

} // namespace

std::optional<HookEvent> parse_hook_event(const std::string &stdin_text) {
  if (!common::json_validate(stdin_text) ||
      common::json_kind(stdin_text) != common::JsonKind::Object) {
    return std::nullopt;
  }
  HookEvent event{
      .session_id = common::json_get_string(stdin_text, "session_id"),
      .cwd = common::json_get_string(stdin_text, "cwd"),
  };
  if (event.session_id.empty()) {
    return std::nullopt;
  }
  return event;
}

std::string hook_response_json(const bool continue_session, const bool suppress_output) {
  return std::string("{\"continue\":") + (continue_session ? "true" : "false") +
         ",\"suppressOutput\":" + (suppress_output ? "true" : "false") + "}";
}

std::string trigger_outcome_name(const TriggerOutcome outcome) {
  switch (outcome) {
  case TriggerOutcome::Launched:
    return "launched";
  case TriggerOutcome::SkippedLocked:
    return "skipped_locked";
  case TriggerOutcome::LockFailed:
    return "lock_failed";
  case TriggerOutcome::LaunchFailed:
    return "launch_failed";
  }
  return "launch_failed";
}

TriggerHandler::TriggerHandler(std::shared_ptr<guard::LockStore> locks,
                               std::shared_ptr<guard::BackgroundLauncher> launcher,
                               const TriggerOptions options)
    : locks_(std::move(locks)), launcher_(std::move(launcher)), options_(options) {}

TriggerOutcome TriggerHandler::on_stop(const HookEvent &event) {
  locks_->sweep_stale(options_.stale_lock_age);

  if (locks_->is_locked(event.session_id, options_.lock_max_age)) {
    observability::record_lock(event.session_id, "skip");
    return TriggerOutcome::SkippedLocked;
  }

  const auto locked = locks_->create_lock(event.session_id);
  if (!locked.ok()) {
    observability::record_error("hooks", locked.error());
    return TriggerOutcome::LockFailed;
  }

  const auto launched = launcher_->launch(guard::LaunchRequest{
      .session_id = event.session_id, .snapshot = false, .project_path = project_hint(event)});
  if (!launched.ok()) {
    locks_->remove_lock(event.session_id);
    observability::record_error("hooks", launched.error());
    return TriggerOutcome::LaunchFailed;
  }
  return TriggerOutcome::Launched;
}

TriggerOutcome TriggerHandler::on_pre_compact(const HookEvent &event) {
  const auto launched = launcher_->launch(guard::LaunchRequest{
      .session_id = event.session_id, .snapshot = true, .project_path = project_hint(event)});
  if (!launched.ok()) {
    observability::record_error("hooks", launched.error());
    return TriggerOutcome::LaunchFailed;
  }
  return TriggerOutcome::Launched;
}

} // namespace sidecar::hooks
