#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace canary::util {

/*
  Time utilities: the one place that reads the clock.

  Everything persisted is UTC.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// "2026-10-19T08:15:00Z"
std::string ToIso8601(TimePoint tp);

// "2026-10-19 08:15:00", the form SQLite's CURRENT_TIMESTAMP produces.
std::string ToSqlTimestamp(TimePoint tp);

// "20261019_081500", used in artifact file names.
std::string FileStamp(TimePoint tp);

std::optional<TimePoint> ParseSqlTimestamp(const std::string& text);

TimePoint DaysAgo(TimePoint from, uint32_t days);

// Last write time of a file as a system_clock time point.
TimePoint LastWriteTime(const std::filesystem::path& path);

} // namespace canary::util
