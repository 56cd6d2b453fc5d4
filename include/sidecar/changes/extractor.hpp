#pragma once

#include "sidecar/changes/change_set.hpp"
#include "sidecar/changes/git_client.hpp"
#include "sidecar/transcript/message.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sidecar::changes {

struct ExtractorOptions {
  std::size_t max_diff_chars = 32'000;
};

/// Change list recovered from Write/Edit/MultiEdit invocations of assistant
/// messages. The first classification of a path is kept.
[[nodiscard]] ChangeSet reconstruct_from_transcript(const std::vector<transcript::Message> &messages);

/// Best-effort description of the code changes of a session. Version control
/// is preferred; when it is unusable the transcript is used instead.
class ChangeSetExtractor {
public:
  struct Context;

  /// One recovery strategy; nullopt means "not applicable, try the next".
  struct Strategy {
    std::string name;
    std::function<std::optional<ChangeSet>(Context &)> run;
  };

  ChangeSetExtractor(std::shared_ptr<GitClient> git, ExtractorOptions options = {});

  /// Never fails; the last strategy always produces a result.
  [[nodiscard]] ChangeSet extract(const std::string &project_path,
                                  const std::vector<transcript::Message> &messages) const;

  /// Strategy names in the order they are tried.
  [[nodiscard]] std::vector<std::string> strategy_names() const;

  /// Name of the strategy that produced the most recent result.
  [[nodiscard]] const std::string &last_strategy() const { return last_strategy_; }

private:
  std::shared_ptr<GitClient> git_;
  ExtractorOptions options_;
  std::vector<Strategy> strategies_;
  mutable std::string last_strategy_;
};

} // namespace sidecar::changes
