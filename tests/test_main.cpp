#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "test_harness.h"

int g_failures = 0;
std::string g_current_test;

namespace {

std::vector<TestCase> all_tests() {
  std::vector<TestCase> tests;
  register_parser_tests(tests);
  register_selection_tests(tests);
  register_matcher_tests(tests);
  register_json_filter_tests(tests);
  register_executor_tests(tests);
  register_cli_tests(tests);
  return tests;
}

int run_test(const TestCase& test) {
  g_current_test = test.name;
  g_failures = 0;
  test.fn();
  return g_failures;
}

}  // namespace

int main(int argc, char** argv) {
  const std::vector<TestCase> tests = all_tests();
  if (argc > 1) {
    std::string target = argv[1];
    for (const auto& test : tests) {
      if (target == test.name) {
        int failures = run_test(test);
        return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
      }
    }
    std::cerr << "Unknown test: " << target << std::endl;
    std::cerr << "Available tests:" << std::endl;
    for (const auto& test : tests) {
      std::cerr << "  " << test.name << std::endl;
    }
    return EXIT_FAILURE;
  }

  int total_failures = 0;
  for (const auto& test : tests) {
    int failures = run_test(test);
    if (failures > 0) {
      std::cerr << "FAILED: " << test.name << " (" << failures << ")" << std::endl;
      total_failures += failures;
    }
  }

  if (total_failures > 0) {
    std::cerr << total_failures << " test(s) failed." << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << "All tests passed." << std::endl;
  return EXIT_SUCCESS;
}
