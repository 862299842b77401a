#pragma once

#include <filesystem>

#include "canary/lifecycle/v1/reports.pb.h"
#include "internal/db/sql/sql_value.hpp"

namespace canary::archive {

namespace lifecycle = canary::lifecycle::v1;

/*
  Compressed table snapshots: a TableSnapshot message as JSON, gzipped.
  Cells keep their storage class (integer/real/text/blob/null).
*/

lifecycle::SqlValue ToProto(const db::sql::Value& value);
db::sql::Value      FromProto(const lifecycle::SqlValue& value);

// Durable: visible under path only once fully written and synced.
void WriteSnapshot(const std::filesystem::path& path, const lifecycle::TableSnapshot& snapshot);

// Throws NotFound / IntegrityFailure.
lifecycle::TableSnapshot ReadSnapshot(const std::filesystem::path& path);

} // namespace canary::archive
