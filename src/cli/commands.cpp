#include "sidecar/cli/commands.hpp"

#include "sidecar/common/clock.hpp"
#include "sidecar/common/fs.hpp"
#include "sidecar/common/process.hpp"
#include "sidecar/common/text.hpp"
#include "sidecar/config/config.hpp"
#include "sidecar/guard/lock_store.hpp"
#include "sidecar/hooks/trigger.hpp"
#include "sidecar/observability/global.hpp"
#include "sidecar/runtime/app.hpp"
#include "sidecar/summarizer/briefing.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace sidecar::cli {

namespace {

constexpr std::chrono::seconds kNotifyTimeout{5};
constexpr double kInputCostPerToken = 0.00000025;

std::string version_string() {
#ifdef SIDECAR_VERSION
  return std::string("sidecar ") + SIDECAR_VERSION;
#else
  return "sidecar 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::optional<std::string> take_optional(std::vector<std::string> &args,
                                         const std::string &long_name,
                                         const std::string &short_name) {
  std::string value;
  if (take_option(args, long_name, short_name, value) && !value.empty()) {
    return value;
  }
  return std::nullopt;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

std::string short_id(const std::string &session_id) { return session_id.substr(0, 8); }

common::Result<runtime::RuntimeContext> load_runtime() {
  auto runtime = runtime::RuntimeContext::from_disk();
  if (!runtime.ok()) {
    return runtime;
  }
  runtime.value().install_observer();

  auto warnings = config::validate_config(runtime.value().config());
  if (!warnings.ok()) {
    return common::Result<runtime::RuntimeContext>::failure(warnings.code(), warnings.error());
  }
  for (const auto &warning : warnings.value()) {
    observability::record_warning("config", warning);
  }
  return runtime;
}

void send_notification(const std::string &session_id) {
  auto result = common::run_process(
      {"notify-send", "Sidecar", "Session " + short_id(session_id) + " analyzed"}, {},
      std::chrono::duration_cast<std::chrono::milliseconds>(kNotifyTimeout));
  if (!result.ok()) {
    observability::record_warning("notify", result.error());
  } else if (result.value().exit_code != 0) {
    observability::record_warning("notify", "notify-send exited with " +
                                                std::to_string(result.value().exit_code));
  }
}

void print_briefing_text(const summarizer::SessionBriefing &briefing) {
  std::cout << "== Session Briefing: " << short_id(briefing.session_id) << "... ==\n";
  if (!briefing.project_path.empty()) {
    std::cout << briefing.project_path << "\n";
  }
  std::cout << "\n" << briefing.session_summary << "\n";

  if (!briefing.what_got_built.empty()) {
    std::cout << "\nWhat Got Built\n";
    for (const auto &item : briefing.what_got_built) {
      std::cout << "  " << item.file << "  " << item.description << "\n";
    }
  }
  if (!briefing.how_pieces_connect.empty()) {
    std::cout << "\nHow Pieces Connect\n  " << briefing.how_pieces_connect << "\n";
  }
  if (briefing.will_bite_you.has_value()) {
    const auto &risk = *briefing.will_bite_you;
    std::cout << "\nWill Bite You\n  " << risk.issue << "\n  Where: " << risk.where
              << "\n  Why: " << risk.why << "\n  Check: " << risk.what_to_check << "\n";
  }
  if (!briefing.patterns_used.empty()) {
    std::cout << "\nPatterns Used\n";
    for (const auto &pattern : briefing.patterns_used) {
      std::cout << "  " << pattern.pattern << " (" << pattern.where << "): " << pattern.explained
                << "\n";
    }
  }
}

void print_compact_view(const summarizer::SessionBriefing &briefing) {
  std::cout << "Session " << short_id(briefing.session_id) << " - "
            << common::utf8_prefix(briefing.session_summary, 60) << "\n";
  std::cout << "  " << briefing.what_got_built.size() << " files changed | "
            << briefing.patterns_used.size() << " patterns | "
            << (briefing.will_bite_you.has_value() ? 1 : 0) << " issue\n\n";

  if (briefing.will_bite_you.has_value()) {
    std::cout << "  Warning: " << briefing.will_bite_you->issue << "\n";
    if (!briefing.will_bite_you->where.empty()) {
      std::cout << "    -> " << briefing.will_bite_you->where << "\n";
    }
    std::cout << "\n";
  }

  if (!briefing.what_got_built.empty()) {
    std::cout << "  Files: ";
    for (std::size_t i = 0; i < briefing.what_got_built.size(); ++i) {
      const auto &file = briefing.what_got_built[i].file;
      std::cout << (i > 0 ? ", " : "") << (file.empty() ? "unknown" : file);
    }
    std::cout << "\n";
  }
}

void print_detail_view(const summarizer::SessionBriefing &briefing) {
  std::cout << "Session " << short_id(briefing.session_id) << " - " << briefing.project_path
            << "\n\n";
  std::cout << "Summary\n  " << briefing.session_summary << "\n";

  if (!briefing.what_got_built.empty()) {
    std::cout << "\nWhat Got Built\n";
    for (const auto &item : briefing.what_got_built) {
      std::cout << "  " << item.file << "  " << item.description;
      if (!item.key_code.empty()) {
        std::cout << "  [" << common::utf8_prefix(item.key_code, 50) << "]";
      }
      std::cout << "\n";
    }
  }
  if (!briefing.how_pieces_connect.empty()) {
    std::cout << "\nHow Pieces Connect\n  " << briefing.how_pieces_connect << "\n";
  }
  if (briefing.will_bite_you.has_value()) {
    const auto &risk = *briefing.will_bite_you;
    std::cout << "\nWill Bite You\n  " << risk.issue << "\n  Where: " << risk.where
              << "\n  Why: " << risk.why << "\n  Check: " << risk.what_to_check << "\n";
  }
}

} // namespace

int run_background_analysis(const runtime::RuntimeContext &runtime,
                            const std::function<common::Result<pipeline::Pipeline>()> &make_pipeline,
                            const pipeline::PipelineOptions &options, const bool notify) {
  const std::string label = options.session_id.value_or("latest");
  std::cerr << "=== " << common::now_rfc3339() << " analyze session=" << label
            << (options.snapshot ? " snapshot" : "") << " ===\n";

  std::shared_ptr<guard::LockStore> locks;
  std::optional<guard::ScopedLockRelease> release;
  if (options.session_id.has_value() && !options.snapshot) {
    locks = runtime.create_lock_store();
    release.emplace(*locks, *options.session_id);
  }

  try {
    auto pipeline = make_pipeline();
    if (!pipeline.ok()) {
      observability::record_error("analyze", pipeline.error());
      return 0;
    }

    const auto result = pipeline.value().run(options);
    if (!result.ok()) {
      observability::record_error("analyze", "analysis failed [" +
                                                 common::error_code_name(result.code()) +
                                                 "]: " + result.error());
      return 0;
    }

    const auto &persisted = result.value();
    char cost[32];
    std::snprintf(cost, sizeof(cost), "%.4f",
                  static_cast<double>(persisted.estimated_tokens) * kInputCostPerToken);
    observability::record_stage("background", "filtered=" +
                                                  std::to_string(persisted.stats.kept_count) +
                                                  " messages, ~" +
                                                  std::to_string(persisted.estimated_tokens) +
                                                  " tokens, est. cost ~$" + cost);
    observability::record_stage("background", "briefing=" + persisted.json_path.string());

    if (notify || runtime.config().notifications.enabled) {
      send_notification(persisted.briefing.session_id);
    }
  } catch (const std::exception &ex) {
    // A detached run has no caller to report to; the lock is released on return.
    observability::record_error("analyze", std::string("analysis aborted: ") + ex.what());
  }
  return 0;
}

namespace {

int run_analyze(std::vector<std::string> args) {
  const auto session_id = take_optional(args, "--session-id", "-s");
  const auto project = take_optional(args, "--project", "-p");
  std::string output = "text";
  take_option(args, "--output", "-o", output);
  const bool background = take_flag(args, "--background");
  const bool snapshot = take_flag(args, "--snapshot");
  const bool notify = take_flag(args, "--notify");

  if (output != "text" && output != "json" && output != "markdown") {
    std::cerr << "invalid --output: " << output << " (expected text, json or markdown)\n";
    return 1;
  }

  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << "Error: " << runtime.error() << "\n";
    return background ? 0 : 1;
  }

  const pipeline::PipelineOptions options{
      .session_id = session_id, .project_path = project, .snapshot = snapshot};
  if (background) {
    const auto &context = runtime.value();
    return run_background_analysis(
        context, [&context] { return context.create_pipeline(); }, options, notify);
  }

  auto pipeline = runtime.value().create_pipeline();
  if (!pipeline.ok()) {
    std::cerr << "Error: " << pipeline.error() << "\n";
    return 1;
  }
  const auto result = pipeline.value().run(options);
  if (!result.ok()) {
    std::cerr << "Error: " << result.error() << "\n";
    return 1;
  }

  const auto &briefing = result.value().briefing;
  if (output == "json") {
    std::cout << summarizer::encode_briefing_json(briefing);
  } else if (output == "markdown") {
    std::cout << summarizer::render_briefing_markdown(briefing);
  } else {
    print_briefing_text(briefing);
  }

  if (notify || runtime.value().config().notifications.enabled) {
    send_notification(briefing.session_id);
  }
  return 0;
}

int run_sessions(std::vector<std::string> args) {
  const auto project = take_optional(args, "--project", "-p");
  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << "Error: " << runtime.error() << "\n";
    return 1;
  }

  const auto sessions = runtime.value().create_catalog().list(project);
  if (sessions.empty()) {
    std::cout << "No sessions found.\n";
    return 0;
  }

  std::size_t index = 0;
  for (const auto &session : sessions) {
    const std::string &label = session.summary.empty() ? session.first_prompt : session.summary;
    std::cout << ++index << ". " << session.session_id << "  "
              << common::utf8_prefix(label, 50) << "  msgs=" << session.message_count << "  "
              << session.modified.substr(0, 10) << "\n";
  }
  std::cout << "\nUse: sidecar analyze -s <session-id>\n";
  return 0;
}

int run_briefing(std::vector<std::string> args) {
  const auto session_id = take_optional(args, "--session-id", "-s");
  const bool detail = take_flag(args, "--detail");
  const bool full = take_flag(args, "--full");

  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << "Error: " << runtime.error() << "\n";
    return 1;
  }
  const auto store = runtime.value().create_briefing_store();

  if (session_id.has_value()) {
    const auto loaded = store.load(*session_id);
    if (!loaded.ok()) {
      std::cerr << loaded.error() << "\n";
      return 1;
    }
    if (full) {
      std::cout << summarizer::render_briefing_markdown(loaded.value());
    } else if (detail) {
      print_detail_view(loaded.value());
    } else {
      print_compact_view(loaded.value());
    }
    return 0;
  }

  const auto briefings = store.list();
  if (briefings.empty()) {
    std::cout << "No briefings generated yet.\n";
    return 0;
  }
  std::size_t index = 0;
  for (const auto &entry : briefings) {
    std::cout << ++index << ". " << entry.session_id << "  "
              << common::utf8_prefix(entry.session_summary, 50) << "  "
              << entry.created_at.substr(0, 10) << "\n";
  }
  std::cout << "\nUse: sidecar briefing -s <session-id>\n";
  return 0;
}

int run_status() {
  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << "Error: " << runtime.error() << "\n";
    return 1;
  }
  const auto &ctx = runtime.value();
  const auto status = pipeline::pipeline_status(ctx.create_catalog(), ctx.create_briefing_store(),
                                                ctx.create_insight_store());

  std::cout << "Sessions: " << status.total_sessions << "\n";
  std::cout << "Briefings: " << status.total_briefings << "\n";
  std::cout << "Projects: ";
  if (status.projects.empty()) {
    std::cout << "none";
  }
  bool first = true;
  for (const auto &project : status.projects) {
    std::cout << (first ? "" : ", ") << project;
    first = false;
  }
  std::cout << "\n";
  std::cout << "Model: " << ctx.config().summarizer.model << "\n";
  std::cout << "Briefings dir: " << ctx.paths().briefings_dir.string() << "\n";

  for (const auto &insight : status.insights) {
    std::cout << "\nInsights: " << insight.project_path << "\n";
    std::cout << "  Briefing count: " << insight.briefing_count << "\n";
    std::cout << "  Patterns: ";
    if (insight.recurring_patterns.empty()) {
      std::cout << "none";
    }
    for (std::size_t i = 0; i < insight.recurring_patterns.size(); ++i) {
      std::cout << (i > 0 ? ", " : "") << insight.recurring_patterns[i];
    }
    std::cout << "\n  Known issues: " << insight.known_issues.size() << "\n";
  }
  return 0;
}

int run_hook(std::vector<std::string> args) {
  const std::string event_name = args.empty() ? "" : args[0];
  try {
    const auto event = hooks::parse_hook_event(read_stdin_all());
    if (event.has_value() && (event_name == "stop" || event_name == "pre-compact")) {
      auto runtime = runtime::RuntimeContext::from_disk();
      if (!runtime.ok()) {
        std::cerr << "[ERROR] hooks: " << runtime.error() << "\n";
      } else {
        runtime.value().install_observer();
        auto handler = runtime.value().create_trigger_handler();
        const auto outcome = event_name == "stop" ? handler.on_stop(*event)
                                                  : handler.on_pre_compact(*event);
        observability::record_stage("hook." + event_name,
                                    "session=" + event->session_id +
                                        " outcome=" + hooks::trigger_outcome_name(outcome));
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] hooks: " << e.what() << "\n";
  }
  std::cout << hooks::hook_response_json() << std::flush;
  return 0;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  sidecar" << RESET << DIM
            << "  post-session briefings for coding sessions" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "sidecar [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  ANALYSIS" << RESET << "\n";
  std::cout << "  " << GREEN << "analyze" << RESET << DIM
            << "        Analyze a session [-s ID] [-p PATH] [-o text|json|markdown]" << RESET << "\n";
  std::cout << "  " << DIM << "                 [--background] [--snapshot] [--notify]" << RESET
            << "\n";
  std::cout << "  " << GREEN << "sessions" << RESET << DIM << "       List recorded sessions [-p PATH]"
            << RESET << "\n";
  std::cout << "  " << GREEN << "briefing" << RESET << DIM
            << "       List briefings or show one [-s ID] [--detail|--full]" << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << DIM << "         Show sessions, briefings and insights"
            << RESET << "\n\n";

  std::cout << BOLD << "  HOOKS" << RESET << "\n";
  std::cout << "  " << GREEN << "hook stop" << RESET << DIM
            << "      Start a background analysis at the end of a turn" << RESET << "\n";
  std::cout << "  " << GREEN << "hook pre-compact" << RESET << DIM
            << " Snapshot the session before compaction" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print the config file location"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET << "\n";
  std::cout << "\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "analyze") {
    return run_analyze(std::move(args));
  }
  if (subcommand == "sessions") {
    return run_sessions(std::move(args));
  }
  if (subcommand == "briefing") {
    return run_briefing(std::move(args));
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "hook") {
    return run_hook(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace sidecar::cli
