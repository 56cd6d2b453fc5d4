#include "sidecar/changes/extractor.hpp"

#include "sidecar/changes/diff_parser.hpp"
#include "sidecar/common/fs.hpp"
#include "sidecar/observability/global.hpp"

#include <unordered_set>

namespace sidecar::changes {

struct ChangeSetExtractor::Context {
  std::filesystem::path project_path;
  const std::vector<transcript::Message> &messages;
  GitClient *git = nullptr;
  std::size_t max_chars = 0;
  bool checked = false;
  bool vcs_usable = false;
  int last_exit_code = 0;

  /// Output of `git <args>`: empty on a non-zero exit, nullopt once version
  /// control became unusable.
  std::optional<std::string> git_output(const std::vector<std::string> &args) {
    if (!repository_usable()) {
      return std::nullopt;
    }
    return invoke(args);
  }

  bool repository_usable() {
    if (checked) {
      return vcs_usable;
    }
    checked = true;
    std::error_code ec;
    if (git == nullptr || project_path.empty() ||
        !std::filesystem::is_directory(project_path, ec)) {
      return false;
    }
    vcs_usable = true;
    const auto git_dir = invoke({"rev-parse", "--git-dir"});
    if (git_dir.has_value() && last_exit_code != 0) {
      observability::record_warning("changes", "not a git repository: " + project_path.string());
      vcs_usable = false;
    }
    return vcs_usable;
  }

  std::optional<std::string> invoke(const std::vector<std::string> &args) {
    auto result = git->run(project_path, args);
    if (!result.ok()) {
      observability::record_warning("changes", "git unavailable: " + result.error());
      vcs_usable = false;
      return std::nullopt;
    }
    const auto &process = result.value();
    if (process.timed_out || process.exit_code == common::kExecFailedExitCode) {
      observability::record_warning("changes", process.timed_out ? "git timed out"
                                                                 : "git could not be executed");
      vcs_usable = false;
      return std::nullopt;
    }
    last_exit_code = process.exit_code;
    return process.exit_code == 0 ? process.output : std::string();
  }
};

namespace {

std::optional<ChangeSet> diff_strategy(ChangeSetExtractor::Context &ctx,
                                       const std::vector<std::string> &args) {
  const auto output = ctx.git_output(args);
  if (!output.has_value() || common::trim(*output).empty()) {
    return std::nullopt;
  }
  return parse_unified_diff(*output, ctx.max_chars);
}

std::optional<ChangeSet> status_strategy(ChangeSetExtractor::Context &ctx) {
  const auto output = ctx.git_output({"status", "--porcelain", "--untracked-files=all"});
  if (!output.has_value()) {
    return std::nullopt;
  }
  const auto entries = parse_porcelain_status(*output);
  if (entries.empty()) {
    return std::nullopt;
  }
  return synthesize_status_changes(entries, ctx.project_path, ctx.max_chars);
}

std::optional<ChangeSet> clean_tree_strategy(ChangeSetExtractor::Context &ctx) {
  if (!ctx.repository_usable()) {
    return std::nullopt;
  }
  ChangeSet empty;
  empty.provenance = Provenance::VersionControl;
  return empty;
}

} // namespace

ChangeSet reconstruct_from_transcript(const std::vector<transcript::Message> &messages) {
  ChangeSet change_set;
  change_set.provenance = Provenance::Reconstructed;
  std::unordered_set<std::string> seen;

  for (const auto &message : messages) {
    if (message.role != transcript::Role::Assistant) {
      continue;
    }
    for (const auto &block : message.content) {
      const auto *invocation = std::get_if<transcript::ToolInvocationBlock>(&block);
      if (invocation == nullptr) {
        continue;
      }
      const auto path_it = invocation->parameters.find("file_path");
      if (path_it == invocation->parameters.end() || path_it->second.empty()) {
        continue;
      }

      FileStatus status;
      if (invocation->name == "Write") {
        status = FileStatus::Added;
      } else if (invocation->name == "Edit" || invocation->name == "MultiEdit") {
        status = FileStatus::Modified;
      } else {
        continue;
      }

      if (seen.insert(path_it->second).second) {
        change_set.files.push_back(FileChange{.path = path_it->second, .status = status});
      }
    }
  }

  change_set.recompute_totals();
  return change_set;
}

ChangeSetExtractor::ChangeSetExtractor(std::shared_ptr<GitClient> git, ExtractorOptions options)
    : git_(std::move(git)), options_(options) {
  strategies_ = {
      {.name = "git-previous-commit",
       .run = [](Context &ctx) { return diff_strategy(ctx, {"diff", "HEAD~1"}); }},
      {.name = "git-working-tree",
       .run = [](Context &ctx) { return diff_strategy(ctx, {"diff", "HEAD"}); }},
      {.name = "git-status", .run = [](Context &ctx) { return status_strategy(ctx); }},
      {.name = "git-clean", .run = [](Context &ctx) { return clean_tree_strategy(ctx); }},
      {.name = "transcript",
       .run = [](Context &ctx) -> std::optional<ChangeSet> {
         return reconstruct_from_transcript(ctx.messages);
       }},
  };
}

ChangeSet ChangeSetExtractor::extract(const std::string &project_path,
                                      const std::vector<transcript::Message> &messages) const {
  Context ctx{.project_path = project_path,
              .messages = messages,
              .git = git_.get(),
              .max_chars = options_.max_diff_chars};

  for (const auto &strategy : strategies_) {
    if (auto result = strategy.run(ctx); result.has_value()) {
      last_strategy_ = strategy.name;
      observability::record_stage("extract", "strategy=" + strategy.name +
                                                 " files=" + std::to_string(result->files.size()));
      return std::move(*result);
    }
  }

  last_strategy_ = "transcript";
  return reconstruct_from_transcript(messages);
}

std::vector<std::string> ChangeSetExtractor::strategy_names() const {
  std::vector<std::string> names;
  names.reserve(strategies_.size());
  for (const auto &strategy : strategies_) {
    names.push_back(strategy.name);
  }
  return names;
}

} // namespace sidecar::changes
