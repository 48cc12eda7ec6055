#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<cdpgate::tests::TestCase> &tests);
void register_config_tests(std::vector<cdpgate::tests::TestCase> &tests);
void register_browser_tests(std::vector<cdpgate::tests::TestCase> &tests);
void register_snapshot_tests(std::vector<cdpgate::tests::TestCase> &tests);
void register_state_tests(std::vector<cdpgate::tests::TestCase> &tests);
void register_bridge_tests(std::vector<cdpgate::tests::TestCase> &tests);
void register_dispatcher_tests(std::vector<cdpgate::tests::TestCase> &tests);
void register_observability_health_tests(std::vector<cdpgate::tests::TestCase> &tests);

int main() {
  // Bridge tests close sockets under a live peer.
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<cdpgate::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_browser_tests(tests);
  register_snapshot_tests(tests);
  register_state_tests(tests);
  register_bridge_tests(tests);
  register_dispatcher_tests(tests);
  register_observability_health_tests(tests);

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
