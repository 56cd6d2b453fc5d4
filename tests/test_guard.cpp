#include "test_framework.hpp"

#include "sidecar/common/fs.hpp"
#include "sidecar/guard/launcher.hpp"
#include "sidecar/guard/lock_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <thread>

void register_guard_tests(std::vector<sidecar::tests::TestCase> &tests) {
  using sidecar::tests::require;
  using sidecar::testing::FakeClock;
  using sidecar::testing::TempDir;
  namespace gd = sidecar::guard;
  using namespace std::chrono_literals;

  tests.push_back({"lock_store_fresh_lock_blocks_until_expiry", [] {
                     TempDir dir;
                     FakeClock clock;
                     gd::FileLockStore store(dir.path() / "locks", clock.as_wall_clock());

                     require(!store.is_locked("s1", 60s), "no lock yet");
                     require(store.create_lock("s1").ok(), "create lock");
                     require(store.is_locked("s1", 60s), "fresh lock");

                     clock.advance(59s);
                     require(store.is_locked("s1", 60s), "still inside the window");
                     clock.advance(2s);
                     require(!store.is_locked("s1", 60s), "expired lock");
                     require(std::filesystem::exists(store.lock_path("s1")), "marker still on disk");

                     store.remove_lock("s1");
                     require(!std::filesystem::exists(store.lock_path("s1")), "marker removed");
                     store.remove_lock("s1");
                   }});

  tests.push_back({"lock_store_unreadable_marker_fails_open", [] {
                     TempDir dir;
                     gd::FileLockStore store(dir.path());
                     dir.create_file("s2.lock", "not a number");
                     require(!store.is_locked("s2", 60s), "garbage marker is unlocked");
                     dir.create_file("s3.lock", "");
                     require(!store.is_locked("s3", 60s), "empty marker is unlocked");
                   }});

  tests.push_back({"lock_store_marker_holds_epoch_seconds", [] {
                     TempDir dir;
                     FakeClock clock;
                     gd::FileLockStore store(dir.path(), clock.as_wall_clock());
                     require(store.create_lock("s").ok(), "create lock");
                     const auto content = sidecar::common::read_file(store.lock_path("s"));
                     require(content.ok(), "marker readable");
                     require(content.value().rfind("1700000000", 0) == 0, "epoch stamp");
                   }});

  tests.push_back({"lock_store_sweeps_stale_and_unreadable_markers", [] {
                     TempDir dir;
                     FakeClock clock;
                     gd::FileLockStore store(dir.path(), clock.as_wall_clock());
                     require(store.create_lock("old").ok(), "old lock");
                     clock.advance(400s);
                     require(store.create_lock("new").ok(), "new lock");
                     dir.create_file("broken.lock", "??");
                     dir.create_file("other.txt", "kept");

                     require(store.sweep_stale(300s) == 2, "old and broken removed");
                     require(!std::filesystem::exists(store.lock_path("old")), "old gone");
                     require(std::filesystem::exists(store.lock_path("new")), "new kept");
                     require(std::filesystem::exists(dir.path() / "other.txt"), "non-lock kept");
                   }});

  tests.push_back({"lock_store_future_marker_is_stale", [] {
                     TempDir dir;
                     FakeClock clock;
                     gd::FileLockStore store(dir.path(), clock.as_wall_clock());
                     dir.create_file("ahead.lock", "1800000000\n");
                     require(store.create_lock("fresh").ok(), "fresh lock");

                     require(!store.is_locked("ahead", 300s), "future stamp does not lock");
                     require(store.sweep_stale(300s) == 1, "future marker swept");
                     require(!std::filesystem::exists(store.lock_path("ahead")), "ahead gone");
                     require(store.is_locked("fresh", 300s), "current lock kept");
                   }});

  tests.push_back({"lock_store_sweep_of_missing_directory_is_noop", [] {
                     TempDir dir;
                     gd::FileLockStore store(dir.path() / "absent");
                     require(store.sweep_stale(300s) == 0, "nothing removed");
                   }});

  tests.push_back({"lock_path_sanitizes_session_id", [] {
                     TempDir dir;
                     gd::FileLockStore store(dir.path());
                     require(store.lock_path("a/b").filename() == "a_b.lock", "sanitized name");
                   }});

  tests.push_back({"scoped_lock_release_removes_on_scope_exit", [] {
                     TempDir dir;
                     gd::FileLockStore store(dir.path());
                     require(store.create_lock("s").ok(), "create lock");
                     {
                       gd::ScopedLockRelease release(store, "s");
                     }
                     require(!std::filesystem::exists(store.lock_path("s")), "released");

                     require(store.create_lock("t").ok(), "create lock");
                     {
                       gd::ScopedLockRelease release(store, "t");
                       release.dismiss();
                     }
                     require(std::filesystem::exists(store.lock_path("t")), "dismissed release");
                   }});

  tests.push_back({"scoped_lock_release_runs_during_unwinding", [] {
                     TempDir dir;
                     gd::FileLockStore store(dir.path());
                     require(store.create_lock("s").ok(), "create lock");
                     try {
                       gd::ScopedLockRelease release(store, "s");
                       throw std::runtime_error("analysis failed");
                     } catch (const std::runtime_error &) {
                     }
                     require(!std::filesystem::exists(store.lock_path("s")), "released on throw");
                   }});

  tests.push_back({"launcher_builds_analyze_command_line", [] {
                     gd::DetachedProcessLauncher launcher(
                         {.executable = "/usr/bin/sidecar",
                          .logs_dir = "/tmp/logs",
                          .working_dir = "/home/u",
                          .config_path = std::filesystem::path("/etc/sidecar.toml")});
                     const auto argv = launcher.build_argv(
                         {.session_id = "abc", .snapshot = true, .project_path = std::string("/p")});
                     const std::vector<std::string> expected = {
                         "/usr/bin/sidecar", "--config", "/etc/sidecar.toml", "analyze",
                         "--session-id", "abc", "--background", "--snapshot", "--project", "/p"};
                     require(argv == expected, "argv mismatch");

                     gd::DetachedProcessLauncher plain({.executable = "sidecar", .logs_dir = "/l"});
                     require(plain.build_argv({.session_id = "x"}).size() == 5, "minimal argv");
                     require(plain.log_path("x/y") == std::filesystem::path("/l/analyze-x_y.log"),
                             "log path");
                   }});

  tests.push_back({"launcher_detaches_child_and_appends_log", [] {
                     TempDir dir;
                     gd::DetachedProcessLauncher launcher({.executable = "true",
                                                           .logs_dir = dir.path() / "logs",
                                                           .working_dir = dir.path()});
                     const auto status = launcher.launch({.session_id = "bg"});
                     require(status.ok(), status.ok() ? "" : status.error());

                     const auto log = launcher.log_path("bg");
                     for (int i = 0; i < 50 && !std::filesystem::exists(log); ++i) {
                       std::this_thread::sleep_for(20ms);
                     }
                     require(std::filesystem::exists(log), "log file created by the child");
                   }});
}
