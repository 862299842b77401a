#include "time.hpp"

#include <sys/stat.h>

#include <cstdio>
#include <ctime>

#include "internal/util/errors.hpp"

namespace canary::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  std::time_t t = Clock::to_time_t(tp);
  std::tm     tm{};
  gmtime_r(&t, &tm);
  return tm;
}

std::string Format(TimePoint tp, const char* fmt) {
  std::tm tm = ToUtc(tp);
  char    buf[64];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) +
                                                                    std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToIso8601(TimePoint tp) {
  return Format(tp, "%Y-%m-%dT%H:%M:%SZ");
}

std::string ToSqlTimestamp(TimePoint tp) {
  return Format(tp, "%Y-%m-%d %H:%M:%S");
}

std::string FileStamp(TimePoint tp) {
  return Format(tp, "%Y%m%d_%H%M%S");
}

std::optional<TimePoint> ParseSqlTimestamp(const std::string& text) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  char sep = 0;

  int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d", &year, &month, &day, &sep, &hour, &minute, &second);
  if (fields != 3 && fields != 7) {
    return std::nullopt;
  }
  if (fields == 7 && sep != ' ' && sep != 'T') {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;

  std::time_t t = timegm(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return Clock::from_time_t(t);
}

TimePoint DaysAgo(TimePoint from, uint32_t days) {
  return from - std::chrono::hours(24) * static_cast<int64_t>(days);
}

TimePoint LastWriteTime(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    throw StorageError("stat failed: " + path.string());
  }
  return Clock::from_time_t(st.st_mtim.tv_sec) +
         std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(st.st_mtim.tv_nsec));
}

} // namespace canary::util
