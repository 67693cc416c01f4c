#ifndef BUCKET_NAMING_HPP
#define BUCKET_NAMING_HPP

#include "core/config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Buckets are identified by their UTC suffix: "2025.06.19.04" (hourly) or
// "2025.06.19" (daily). The collection name is prefix + suffix.

uint64_t bucket_duration_ms(Config::BucketGranularity granularity);

std::string bucket_for_timestamp(uint64_t epoch_ms,
                                 Config::BucketGranularity granularity);

// Start of the bucket in epoch ms, or nullopt for a malformed suffix.
std::optional<uint64_t> bucket_start_ms(const std::string &bucket,
                                        Config::BucketGranularity granularity);

std::optional<std::string> next_bucket(const std::string &bucket,
                                       Config::BucketGranularity granularity);

// Every bucket overlapping [from_ms, to_ms], oldest first.
std::vector<std::string> buckets_between(uint64_t from_ms, uint64_t to_ms,
                                         Config::BucketGranularity granularity);

inline std::string collection_name(const std::string &prefix,
                                   const std::string &bucket) {
  return prefix + bucket;
}

#endif // BUCKET_NAMING_HPP
