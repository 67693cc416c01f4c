#include "log_fetcher.hpp"
#include "bucket_naming.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <utility>

FetchSequence::FetchSequence(LogFetcher &fetcher, std::string start_bucket,
                             std::optional<RecordKey> start_after,
                             std::string last_bucket, uint64_t window_end_ms)
    : fetcher_(fetcher), bucket_(std::move(start_bucket)),
      position_(std::move(start_after)), last_bucket_(std::move(last_bucket)),
      window_end_ms_(window_end_ms) {}

bool FetchSequence::bucket_closed(const std::string &bucket) const {
  auto granularity = fetcher_.store_config_.bucket_granularity;
  auto start = bucket_start_ms(bucket, granularity);
  if (!start)
    return true;
  uint64_t closes_at = *start + bucket_duration_ms(granularity) +
                       uint64_t{fetcher_.fetcher_config_.bucket_settle_seconds} * 1000;
  return closes_at <= window_end_ms_;
}

std::optional<FetchedBatch> FetchSequence::next_batch() {
  while (!done_) {
    const std::string bucket = bucket_;
    const std::optional<RecordKey> after = position_;
    const size_t limit = fetcher_.store_config_.page_size;

    FetchPage page = retry_with_backoff(
        fetcher_.retry_, "Fetch from bucket " + bucket, LogComponent::IO_FETCHER,
        [&] { return fetcher_.store_.fetch_after(bucket, after, limit); },
        [] { PipelineMetrics::instance().fetch_retries.Increment(); });

    const bool scanned_any = page.last_scanned.has_value();
    if (scanned_any)
      position_ = std::move(page.last_scanned);

    if (!page.records.empty()) {
      PipelineMetrics::instance().records_fetched.Increment(
          static_cast<double>(page.records.size()));
      return FetchedBatch{bucket, std::move(page.records)};
    }

    if (scanned_any) {
      LOG(LogLevel::WARN, LogComponent::IO_FETCHER,
          "Page of bucket " << bucket
                            << " held no decodable records. Reading on.");
      continue;
    }

    if (bucket_ >= last_bucket_ || !bucket_closed(bucket_)) {
      done_ = true;
      break;
    }

    auto next = next_bucket(bucket_, fetcher_.store_config_.bucket_granularity);
    if (!next) {
      LOG(LogLevel::ERROR, LogComponent::IO_FETCHER,
          "Cannot compute the bucket after '" << bucket_ << "'. Stopping.");
      done_ = true;
      break;
    }
    LOG(LogLevel::DEBUG, LogComponent::IO_FETCHER,
        "Bucket " << bucket_ << " exhausted and closed. Moving to " << *next);
    bucket_ = *next;
    position_.reset();
    return FetchedBatch{bucket_, {}};
  }
  return std::nullopt;
}

LogFetcher::LogFetcher(IUnclassifiedStore &store, ICursorStore &cursor_store,
                       const Config::StoreConfig &store_config,
                       const Config::FetcherConfig &fetcher_config,
                       RetryPolicy retry)
    : store_(store), cursor_store_(cursor_store), store_config_(store_config),
      fetcher_config_(fetcher_config), retry_(std::move(retry)) {}

void LogFetcher::ensure_loaded() {
  if (loaded_)
    return;
  if (auto state = cursor_store_.load()) {
    cursor_ = *state;
    persisted_ = *state;
    has_persisted_ = true;
  }
  loaded_ = true;
}

FetchSequence LogFetcher::fetch(uint64_t window_end_ms) {
  ensure_loaded();
  auto granularity = store_config_.bucket_granularity;
  std::string last_bucket = bucket_for_timestamp(window_end_ms, granularity);

  std::string start_bucket = cursor_.bucket;
  std::optional<RecordKey> start_after = cursor_.last;
  if (start_bucket.empty()) {
    uint64_t lookback =
        uint64_t{fetcher_config_.initial_lookback_buckets} * bucket_duration_ms(granularity);
    uint64_t start_ms = window_end_ms > lookback ? window_end_ms - lookback : 0;
    start_bucket = bucket_for_timestamp(start_ms, granularity);
    start_after.reset();
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_FETCHER,
      "Fetch window " << start_bucket << " .. " << last_bucket);
  return FetchSequence(*this, std::move(start_bucket), std::move(start_after),
                       std::move(last_bucket), window_end_ms);
}

void LogFetcher::advance(const std::string &bucket, const RecordKey &key) {
  ensure_loaded();
  if (!cursor_.bucket.empty() && bucket < cursor_.bucket) {
    LOG(LogLevel::WARN, LogComponent::IO_FETCHER,
        "Ignoring cursor move backwards from bucket " << cursor_.bucket
                                                      << " to " << bucket);
    return;
  }
  if (bucket == cursor_.bucket && cursor_.last && key < *cursor_.last)
    return;
  cursor_.bucket = bucket;
  cursor_.last = key;
}

void LogFetcher::advance_to_bucket(const std::string &bucket) {
  ensure_loaded();
  if (!cursor_.bucket.empty() && bucket <= cursor_.bucket)
    return;
  cursor_.bucket = bucket;
  cursor_.last.reset();
}

void LogFetcher::checkpoint() {
  ensure_loaded();
  if (cursor_.bucket.empty() || (has_persisted_ && cursor_ == persisted_))
    return;
  cursor_store_.save(cursor_);
  persisted_ = cursor_;
  has_persisted_ = true;
}

const CursorState &LogFetcher::cursor() {
  ensure_loaded();
  return cursor_;
}
