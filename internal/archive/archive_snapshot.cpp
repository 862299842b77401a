#include "archive_snapshot.hpp"

#include <type_traits>

#include "internal/bundle/tar_gz.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace canary::archive {

lifecycle::SqlValue ToProto(const db::sql::Value& value) {
  lifecycle::SqlValue out;
  std::visit(
      [&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out.set_null_value(true);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          out.set_integer_value(v);
        } else if constexpr (std::is_same_v<T, double>) {
          out.set_real_value(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          out.set_text_value(v);
        } else {
          out.set_blob_value(std::string(v.begin(), v.end()));
        }
      },
      value);
  return out;
}

db::sql::Value FromProto(const lifecycle::SqlValue& value) {
  switch (value.kind_case()) {
    case lifecycle::SqlValue::kIntegerValue:
      return value.integer_value();
    case lifecycle::SqlValue::kRealValue:
      return value.real_value();
    case lifecycle::SqlValue::kTextValue:
      return value.text_value();
    case lifecycle::SqlValue::kBlobValue:
      return db::sql::Blob(value.blob_value().begin(), value.blob_value().end());
    case lifecycle::SqlValue::kNullValue:
    case lifecycle::SqlValue::KIND_NOT_SET:
      break;
  }
  return nullptr;
}

void WriteSnapshot(const std::filesystem::path& path, const lifecycle::TableSnapshot& snapshot) {
  bundle::WriteGzipFile(path, util::ToJson(snapshot));
}

lifecycle::TableSnapshot ReadSnapshot(const std::filesystem::path& path) {
  lifecycle::TableSnapshot snapshot;
  util::FromJson(bundle::ReadGzipFile(path), &snapshot);

  if (snapshot.table().empty()) {
    throw util::IntegrityFailure("Snapshot has no table name: " + path.string());
  }
  if (snapshot.record_count() != static_cast<uint64_t>(snapshot.rows_size())) {
    throw util::IntegrityFailure("Snapshot record count mismatch in " + path.string() + ": header says " +
                                 std::to_string(snapshot.record_count()) + ", found " +
                                 std::to_string(snapshot.rows_size()));
  }
  for (const auto& row : snapshot.rows()) {
    if (row.values_size() != snapshot.columns_size()) {
      throw util::IntegrityFailure("Snapshot row width does not match its column list: " + path.string());
    }
  }
  return snapshot;
}

} // namespace canary::archive
