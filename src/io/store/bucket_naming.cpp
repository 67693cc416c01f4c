#include "bucket_naming.hpp"
#include "utils/utils.hpp"

#include <cstdio>
#include <ctime>

namespace {
constexpr uint64_t HOUR_MS = 3600ULL * 1000ULL;
constexpr uint64_t DAY_MS = 24ULL * HOUR_MS;
} // namespace

uint64_t bucket_duration_ms(Config::BucketGranularity granularity) {
  return granularity == Config::BucketGranularity::DAILY ? DAY_MS : HOUR_MS;
}

std::string bucket_for_timestamp(uint64_t epoch_ms,
                                 Config::BucketGranularity granularity) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm_utc{};
  gmtime_r(&seconds, &tm_utc);

  char buffer[32];
  if (granularity == Config::BucketGranularity::DAILY)
    std::snprintf(buffer, sizeof(buffer), "%04d.%02d.%02d",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday);
  else
    std::snprintf(buffer, sizeof(buffer), "%04d.%02d.%02d.%02d",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                  tm_utc.tm_hour);
  return buffer;
}

std::optional<uint64_t> bucket_start_ms(const std::string &bucket,
                                        Config::BucketGranularity granularity) {
  auto parts = Utils::split_string(bucket, '.');
  size_t expected = granularity == Config::BucketGranularity::DAILY ? 3 : 4;
  if (parts.size() != expected)
    return std::nullopt;

  std::vector<int> values;
  for (const auto &part : parts) {
    auto v = Utils::string_to_number<int>(part);
    if (!v || part.empty())
      return std::nullopt;
    values.push_back(*v);
  }

  std::tm t{};
  t.tm_year = values[0] - 1900;
  t.tm_mon = values[1] - 1;
  t.tm_mday = values[2];
  t.tm_hour = expected == 4 ? values[3] : 0;
  if (t.tm_mon < 0 || t.tm_mon > 11 || t.tm_mday < 1 || t.tm_mday > 31 ||
      t.tm_hour < 0 || t.tm_hour > 23)
    return std::nullopt;

  std::time_t seconds = timegm(&t);
  if (seconds < 0)
    return std::nullopt;
  return static_cast<uint64_t>(seconds) * 1000ULL;
}

std::optional<std::string> next_bucket(const std::string &bucket,
                                       Config::BucketGranularity granularity) {
  auto start = bucket_start_ms(bucket, granularity);
  if (!start)
    return std::nullopt;
  return bucket_for_timestamp(*start + bucket_duration_ms(granularity),
                              granularity);
}

std::vector<std::string> buckets_between(uint64_t from_ms, uint64_t to_ms,
                                         Config::BucketGranularity granularity) {
  std::vector<std::string> buckets;
  if (from_ms > to_ms)
    return buckets;
  const uint64_t step = bucket_duration_ms(granularity);
  uint64_t cursor = from_ms - (from_ms % step);
  for (; cursor <= to_ms; cursor += step)
    buckets.push_back(bucket_for_timestamp(cursor, granularity));
  return buckets;
}
