#pragma once

#include "sidecar/changes/git_client.hpp"
#include "sidecar/config/schema.hpp"
#include "sidecar/guard/launcher.hpp"
#include "sidecar/guard/lock_store.hpp"
#include "sidecar/observability/observer.hpp"
#include "sidecar/providers/traits.hpp"
#include "sidecar/summarizer/summarizer.hpp"

#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sidecar::testing {

/// Defaults with every directory under root and logging silenced.
config::Config temp_config(const std::filesystem::path &root);

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

/// Wall clock the test moves by hand.
class FakeClock {
public:
  FakeClock();

  void advance(std::chrono::seconds delta);
  [[nodiscard]] std::chrono::system_clock::time_point now() const { return *now_; }
  [[nodiscard]] guard::WallClock as_wall_clock() const;

private:
  std::shared_ptr<std::chrono::system_clock::time_point> now_;
};

/// Scripted git: replies are keyed by the space-joined argument list.
/// Unscripted commands exit 1 with no output.
class FakeGitClient final : public changes::GitClient {
public:
  void reply(const std::string &args, int exit_code, std::string output = "");
  void time_out(const std::string &args);
  void fail_to_start(const std::string &message = "git not found");

  [[nodiscard]] common::Result<common::ProcessResult>
  run(const std::filesystem::path &repo, const std::vector<std::string> &args) override;

  [[nodiscard]] const std::vector<std::string> &calls() const { return calls_; }

private:
  std::map<std::string, common::ProcessResult> replies_;
  std::optional<std::string> start_failure_;
  std::vector<std::string> calls_;
};

/// Provider returning queued replies in order; the last one repeats.
class MockProvider final : public providers::Provider {
public:
  void push_response(std::string response);
  void push_error(std::string error_message);

  [[nodiscard]] common::Result<std::string>
  chat_with_system(const std::optional<std::string> &system_prompt, const std::string &message,
                   const std::string &model, double temperature) override;

  [[nodiscard]] std::string name() const override { return "mock"; }

  [[nodiscard]] std::size_t calls() const { return calls_; }
  [[nodiscard]] const std::string &last_message() const { return last_message_; }
  [[nodiscard]] const std::optional<std::string> &last_system_prompt() const {
    return last_system_prompt_;
  }

private:
  struct Reply {
    bool ok = true;
    std::string text;
  };

  std::deque<Reply> replies_;
  std::size_t calls_ = 0;
  std::string last_message_;
  std::optional<std::string> last_system_prompt_;
};

/// HTTP client returning a canned response and remembering the request.
class FakeHttpClient final : public providers::HttpClient {
public:
  explicit FakeHttpClient(providers::HttpResponse response);

  [[nodiscard]] providers::HttpResponse post(const providers::HttpRequest &request) override;

  std::optional<providers::HttpRequest> last_request;

private:
  providers::HttpResponse response_;
};

class CountingLauncher final : public guard::BackgroundLauncher {
public:
  [[nodiscard]] common::Status launch(const guard::LaunchRequest &request) override;

  void set_failure(bool fail) { fail_ = fail; }
  [[nodiscard]] const std::vector<guard::LaunchRequest> &requests() const { return requests_; }

private:
  bool fail_ = false;
  std::vector<guard::LaunchRequest> requests_;
};

/// Summarizer that throws std::runtime_error from every call.
class ThrowingSummarizer final : public summarizer::Summarizer {
public:
  [[nodiscard]] common::Result<summarizer::SessionBriefing>
  summarize(const transcript::FilteredTranscript &transcript, const changes::ChangeSet &change_set,
            const std::string &project_path) override;
};

/// Observer that keeps every event for inspection.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;
};

/// Installs an observer for the lifetime of the guard and restores a noop one.
class ObserverGuard {
public:
  explicit ObserverGuard(std::unique_ptr<observability::IObserver> observer);
  ~ObserverGuard();

  ObserverGuard(const ObserverGuard &) = delete;
  ObserverGuard &operator=(const ObserverGuard &) = delete;
};

// Transcript record builders.
std::string user_line(const std::string &text, const std::string &cwd = "");
std::string assistant_text_line(const std::string &text);
std::string assistant_tool_line(const std::string &tool, const std::string &file_path);
std::string progress_line();
std::string file_history_line();
std::string summary_line(const std::string &summary);

/// Write a project directory with a sessions-index.json and one transcript.
void write_session(const std::filesystem::path &projects_dir, const std::string &project_dir,
                   const std::string &original_path, const std::string &session_id,
                   const std::string &modified, const std::vector<std::string> &lines);

/// A minimal valid briefing reply from the summarizer.
std::string briefing_reply(const std::string &summary = "Added a parser.");

} // namespace sidecar::testing
