#include "args.hpp"

#include <limits>

namespace canary::cli {

bool Args::Has(const std::string& flag) const {
  for (const auto& v : values_) {
    if (v == flag) return true;
  }
  return false;
}

std::optional<std::string> Args::Value(const std::string& flag) const {
  for (size_t i = 0; i < values_.size(); ++i) {
    if (values_[i] == flag) {
      if (i + 1 >= values_.size()) {
        throw UsageError(flag + " requires a value");
      }
      return values_[i + 1];
    }
  }
  return std::nullopt;
}

uint32_t ParseCount(const std::string& flag, const std::string& text) {
  long long value = 0;
  try {
    size_t used = 0;
    value       = std::stoll(text, &used);
    if (used != text.size()) {
      throw UsageError(flag + " expects a non-negative number: " + text);
    }
  } catch (const std::logic_error&) {
    throw UsageError(flag + " expects a non-negative number: " + text);
  }
  if (value < 0) {
    throw UsageError(flag + " expects a non-negative number: " + text);
  }
  if (static_cast<unsigned long long>(value) > std::numeric_limits<uint32_t>::max()) {
    throw UsageError(flag + " is out of range: " + text);
  }
  return static_cast<uint32_t>(value);
}

} // namespace canary::cli
