#ifndef LOG_FETCHER_HPP
#define LOG_FETCHER_HPP

#include "core/config.hpp"
#include "store_interfaces.hpp"
#include "utils/retry_policy.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct FetchedBatch {
  std::string bucket;
  // Empty when the sequence rolled over into `bucket` without finding records
  // yet; the committer still moves the cursor to the new bucket.
  std::vector<AuditRecord> records;
};

class LogFetcher;

// Lazy walk over the unclassified buckets, from the cursor up to the bucket
// holding the window end. Each record is yielded at most once per sequence.
// Its read position runs ahead of the cursor, which only moves on commit.
class FetchSequence {
public:
  // nullopt once the sequence is exhausted. Throws FetchError after the
  // retry ceiling.
  std::optional<FetchedBatch> next_batch();

private:
  friend class LogFetcher;
  FetchSequence(LogFetcher &fetcher, std::string start_bucket,
                std::optional<RecordKey> start_after, std::string last_bucket,
                uint64_t window_end_ms);

  bool bucket_closed(const std::string &bucket) const;

  LogFetcher &fetcher_;
  std::string bucket_;
  std::optional<RecordKey> position_;
  std::string last_bucket_;
  uint64_t window_end_ms_;
  bool done_ = false;
};

// Owns the CursorState. advance() and checkpoint() must be called from one
// thread only, the run's committer.
class LogFetcher {
public:
  LogFetcher(IUnclassifiedStore &store, ICursorStore &cursor_store,
             const Config::StoreConfig &store_config,
             const Config::FetcherConfig &fetcher_config, RetryPolicy retry);

  FetchSequence fetch(uint64_t window_end_ms);

  // Marks everything in `bucket` up to and including `key` as consumed.
  void advance(const std::string &bucket, const RecordKey &key);
  // Moves into a later bucket with nothing consumed yet.
  void advance_to_bucket(const std::string &bucket);

  // Persists the in-memory cursor if it moved. Throws StoreWriteError.
  void checkpoint();

  const CursorState &cursor();

private:
  friend class FetchSequence;

  void ensure_loaded();

  IUnclassifiedStore &store_;
  ICursorStore &cursor_store_;
  Config::StoreConfig store_config_;
  Config::FetcherConfig fetcher_config_;
  RetryPolicy retry_;

  bool loaded_ = false;
  CursorState cursor_;
  CursorState persisted_;
  bool has_persisted_ = false;
};

#endif // LOG_FETCHER_HPP
