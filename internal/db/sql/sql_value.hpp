#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace canary::db::sql {

/*
  One SQLite cell, by storage class.

  NULL, INTEGER, REAL, TEXT, BLOB map 1:1 so archived rows can be
  re-inserted without type drift.
*/

using Blob = std::vector<std::uint8_t>;

using Value = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    Blob
>;

using Row = std::vector<Value>;

inline bool IsNull(const Value& v) {
  return std::holds_alternative<std::nullptr_t>(v);
}

}
