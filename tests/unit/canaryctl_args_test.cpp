#include "args.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

using canary::cli::Args;
using canary::cli::ParseCount;
using canary::cli::UsageError;

bool Rejected(const std::string& text) {
  try {
    (void)ParseCount("--history", text);
  } catch (const UsageError&) {
    return true;
  }
  return false;
}

void TestCountsInRange() {
  assert(ParseCount("--history", "0") == 0);
  assert(ParseCount("--history", "30") == 30);
  assert(ParseCount("--history", "4294967295") == UINT32_MAX);
}

void TestCountsOutOfRangeAreRejected() {
  // would wrap to 0 and 1 when narrowed to 32 bits
  assert(Rejected("4294967296"));
  assert(Rejected("4294967297"));
  assert(Rejected("99999999999999999999"));
  assert(Rejected("-1"));
  assert(Rejected("7days"));
  assert(Rejected(""));
  assert(Rejected("abc"));
}

void TestFlagValues() {
  Args args({"--file", "backup.db", "--yes"});
  assert(args.Has("--yes"));
  assert(!args.Has("--force"));
  assert(args.Value("--file") == "backup.db");
  assert(!args.Value("--type"));

  bool threw = false;
  try {
    (void)Args({"--file"}).Value("--file");
  } catch (const UsageError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCountsInRange();
  TestCountsOutOfRangeAreRejected();
  TestFlagValues();

  std::cout << "canary_unit_canaryctl_args: pass\n";
  return 0;
}
