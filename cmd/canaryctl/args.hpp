#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace canary::cli {

class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Flags after the command word.
class Args {
 public:
  explicit Args(std::vector<std::string> values) : values_(std::move(values)) {
  }

  bool Has(const std::string& flag) const;

  // Throws UsageError when the flag is last with no value after it.
  std::optional<std::string> Value(const std::string& flag) const;

 private:
  std::vector<std::string> values_;
};

// Whole-string decimal in [0, UINT32_MAX]; anything else is a UsageError.
uint32_t ParseCount(const std::string& flag, const std::string& text);

} // namespace canary::cli
