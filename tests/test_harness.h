#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "jnav/json_value.h"

struct TestCase {
  const char* name;
  void (*fn)();
};

void expect_true(bool condition, const std::string& message);
void expect_eq(size_t actual, size_t expected, const std::string& message);
void expect_str_eq(const std::string& actual, const std::string& expected,
                   const std::string& message);
/// Compares compact dumps of `actual`, joined by single spaces, against `expected`.
void expect_json_eq(const std::vector<jnav::Json>& actual, const std::string& expected,
                    const std::string& message);

int run_test(const TestCase& test);
/// Runs every case and prints a pass/fail summary. Returns a process exit status.
int run_all_tests(const std::vector<TestCase>& tests);
