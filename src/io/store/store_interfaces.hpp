#ifndef STORE_INTERFACES_HPP
#define STORE_INTERFACES_HPP

#include "core/audit_record.hpp"
#include "core/classification_result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

// Position of a record inside its bucket. Buckets are read in
// (timestamp, id) order.
struct RecordKey {
  uint64_t timestamp_ms = 0;
  std::string id;
  // The stored sort values as canonical extended JSON,
  // {"timestamp": ..., "id": ...}. Null when the key was built from decoded
  // fields only. Not part of equality or ordering.
  nlohmann::json stored;

  bool operator<(const RecordKey &other) const {
    return std::tie(timestamp_ms, id) < std::tie(other.timestamp_ms, other.id);
  }
  bool operator==(const RecordKey &other) const {
    return timestamp_ms == other.timestamp_ms && id == other.id;
  }
};

// Fetch high-water mark. `last` empty means nothing in `bucket` has been
// consumed yet.
struct CursorState {
  std::string bucket;
  std::optional<RecordKey> last;

  bool operator==(const CursorState &other) const {
    return bucket == other.bucket && last == other.last;
  }
  bool operator!=(const CursorState &other) const { return !(*this == other); }
};

// What the aggregator needs from one classified document.
struct ClassifiedRecord {
  std::string record_id;
  uint64_t timestamp_ms = 0;
  Label label = Label::BENIGN;
  double confidence = 0.0;
  std::vector<TriggeredRule> triggered_rules;
};

inline RecordKey record_key(const AuditRecord &record) {
  return RecordKey{record.timestamp_ms, record.id, record.store_key};
}

// One page of a bucket scan. `last_scanned` is the key of the last document
// the scan walked past, decodable or not; empty only when the page was empty.
struct FetchPage {
  std::vector<AuditRecord> records;
  std::optional<RecordKey> last_scanned;
};

class IUnclassifiedStore {
public:
  virtual ~IUnclassifiedStore() = default;

  // Records of `bucket` strictly after `after` in (timestamp, id) order. At
  // most `limit` documents are scanned; undecodable ones are dropped from
  // `records` but still move `last_scanned`. Throws FetchError when the store
  // is unreachable.
  virtual FetchPage
  fetch_after(const std::string &bucket, const std::optional<RecordKey> &after,
              size_t limit) = 0;
};

class IClassifiedStore {
public:
  virtual ~IClassifiedStore() = default;

  // Throws FetchError.
  virtual bool exists(const std::string &bucket, const std::string &record_id,
                      const std::string &model_version) = 0;

  // Insert-if-absent keyed on (record id, model version). Returns true when
  // this call inserted the document. Throws StoreWriteError.
  virtual bool upsert(const std::string &bucket, const AuditRecord &record,
                      const ClassificationResult &result) = 0;

  // Every document in `bucket` classified under `model_version`. Throws
  // FetchError.
  virtual void
  scan(const std::string &bucket, const std::string &model_version,
       const std::function<void(const ClassifiedRecord &)> &visitor) = 0;
};

class ICursorStore {
public:
  virtual ~ICursorStore() = default;
  virtual std::optional<CursorState> load() = 0;
  // Throws StoreWriteError.
  virtual void save(const CursorState &state) = 0;
};

#endif // STORE_INTERFACES_HPP
