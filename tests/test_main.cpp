#include "test_framework.hpp"

#include "sidecar/observability/global.hpp"
#include "sidecar/observability/noop_observer.hpp"

#include <csignal>
#include <iostream>
#include <memory>

void register_common_tests(std::vector<sidecar::tests::TestCase> &tests);
void register_config_tests(std::vector<sidecar::tests::TestCase> &tests);
void register_transcript_tests(std::vector<sidecar::tests::TestCase> &tests);
void register_filter_tests(std::vector<sidecar::tests::TestCase> &tests);
void register_changes_tests(std::vector<sidecar::tests::TestCase> &tests);
void register_provider_tests(std::vector<sidecar::tests::TestCase> &tests);
void register_summarizer_tests(std::vector<sidecar::tests::TestCase> &tests);
void register_pipeline_tests(std::vector<sidecar::tests::TestCase> &tests);
void register_guard_tests(std::vector<sidecar::tests::TestCase> &tests);
void register_hooks_tests(std::vector<sidecar::tests::TestCase> &tests);
void register_pipeline_integration_tests(std::vector<sidecar::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);
  sidecar::observability::set_global_observer(
      std::make_unique<sidecar::observability::NoopObserver>());

  std::vector<sidecar::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_transcript_tests(tests);
  register_filter_tests(tests);
  register_changes_tests(tests);
  register_provider_tests(tests);
  register_summarizer_tests(tests);
  register_pipeline_tests(tests);
  register_guard_tests(tests);
  register_hooks_tests(tests);
  register_pipeline_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";
  return failed == 0 ? 0 : 1;
}
