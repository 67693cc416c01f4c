#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include "core/errors.hpp"
#include "io/notify/base_dispatcher.hpp"
#include "io/rules/rule_set_store.hpp"
#include "io/store/mongo_audit_store.hpp"
#include "io/store/store_interfaces.hpp"
#include "models/base_model.hpp"
#include "models/features.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// 2025-06-19T04:00:00Z
constexpr uint64_t kBaseTimeMs = 1750305600000ULL;
constexpr uint64_t kHourMs = 3600ULL * 1000ULL;

inline AuditRecord
make_record(const std::string &id, uint64_t timestamp_ms,
            const std::vector<std::pair<std::string, int>> &rules = {},
            const std::string &uri = "/index.html") {
  AuditRecord record;
  record.id = id;
  record.timestamp_ms = timestamp_ms;
  record.http_method = "GET";
  record.request_uri = uri;
  record.user_agent = "Mozilla/5.0 (X11; Linux x86_64) Firefox/126.0";
  record.request_headers = {{"host", "example.com"}};
  for (const auto &[rule_id, level] : rules) {
    TriggeredRule rule;
    rule.rule_id = rule_id;
    rule.paranoia_level = level;
    rule.anomaly_score = 5.0;
    rule.severity = "critical";
    record.triggered_rules.push_back(rule);
  }
  record.source_document = {{"transaction_id", id}};
  return record;
}

// Unclassified and classified buckets in memory, with injectable failures.
class InMemoryAuditStore : public IUnclassifiedStore, public IClassifiedStore {
public:
  struct StoredResult {
    std::string bucket;
    ClassifiedRecord record;
    ClassificationResult result;
  };

  void add_unclassified(const std::string &bucket, AuditRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    unclassified_[bucket].push_back(std::move(record));
  }

  // Seeds a classified document directly, bypassing the pipeline.
  void add_classified(const std::string &bucket, const AuditRecord &record,
                      Label label, const std::string &model_version) {
    ClassificationResult result;
    result.record_id = record.id;
    result.label = label;
    result.confidence = label == Label::MALICIOUS ? 0.95 : 0.05;
    result.model_version = model_version;
    result.feature_schema_version = FEATURE_SCHEMA_VERSION;
    std::lock_guard<std::mutex> lock(mutex_);
    store_result(bucket, record, result);
  }

  FetchPage fetch_after(const std::string &bucket,
                        const std::optional<RecordKey> &after,
                        size_t limit) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++fetch_calls;
    if (failing_fetches > 0) {
      --failing_fetches;
      throw FetchError("store unreachable");
    }
    std::vector<AuditRecord> records = unclassified_[bucket];
    std::sort(records.begin(), records.end(),
              [](const AuditRecord &a, const AuditRecord &b) {
                return record_key(a) < record_key(b);
              });
    FetchPage page;
    size_t scanned = 0;
    for (const auto &record : records) {
      if (after && !(*after < record_key(record)))
        continue;
      if (scanned >= limit)
        break;
      ++scanned;
      page.last_scanned = record_key(record);
      if (undecodable_ids.count(record.id) == 0)
        page.records.push_back(record);
    }
    return page;
  }

  bool exists(const std::string &bucket, const std::string &record_id,
              const std::string &model_version) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++exists_calls;
    if (failing_exists > 0) {
      --failing_exists;
      throw FetchError("classified store unreachable");
    }
    (void)bucket;
    return classified_.count(classified_document_id(record_id, model_version)) > 0;
  }

  bool upsert(const std::string &bucket, const AuditRecord &record,
              const ClassificationResult &result) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++upsert_calls;
    if (failing_writes > 0) {
      --failing_writes;
      throw StoreWriteError("write not acknowledged");
    }
    return store_result(bucket, record, result);
  }

  void scan(const std::string &bucket, const std::string &model_version,
            const std::function<void(const ClassifiedRecord &)> &visitor) override {
    std::vector<ClassifiedRecord> matching;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++scan_calls;
      if (failing_scans > 0) {
        --failing_scans;
        throw FetchError("scan failed");
      }
      for (const auto &[id, stored] : classified_)
        if (stored.bucket == bucket && stored.result.model_version == model_version)
          matching.push_back(stored.record);
    }
    for (const auto &record : matching)
      visitor(record);
  }

  size_t classified_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return classified_.size();
  }

  std::optional<StoredResult> classified(const std::string &record_id,
                                         const std::string &model_version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = classified_.find(classified_document_id(record_id, model_version));
    if (it == classified_.end())
      return std::nullopt;
    return it->second;
  }

  int fetch_calls = 0;
  int exists_calls = 0;
  int upsert_calls = 0;
  int scan_calls = 0;
  int failing_fetches = 0;
  int failing_exists = 0;
  int failing_writes = 0;
  int failing_scans = 0;
  // Scanned and counted against the page limit but never returned.
  std::set<std::string> undecodable_ids;

private:
  bool store_result(const std::string &bucket, const AuditRecord &record,
                    const ClassificationResult &result) {
    const std::string key = classified_document_id(record.id, result.model_version);
    if (classified_.count(key))
      return false;
    StoredResult stored;
    stored.bucket = bucket;
    stored.record.record_id = record.id;
    stored.record.timestamp_ms = record.timestamp_ms;
    stored.record.label = result.label;
    stored.record.confidence = result.confidence;
    stored.record.triggered_rules = record.triggered_rules;
    stored.result = result;
    classified_[key] = stored;
    return true;
  }

  mutable std::mutex mutex_;
  std::map<std::string, std::vector<AuditRecord>> unclassified_;
  std::map<std::string, StoredResult> classified_;
};

class InMemoryCursorStore : public ICursorStore {
public:
  std::optional<CursorState> load() override { return state; }

  void save(const CursorState &new_state) override {
    ++save_calls;
    if (fail_saves)
      throw StoreWriteError("cursor disk full");
    state = new_state;
  }

  std::optional<CursorState> state;
  int save_calls = 0;
  bool fail_saves = false;
};

class InMemoryRuleSetStore : public IRuleSetStore {
public:
  RuleSetState load() override { return state; }

  void compare_and_write(uint64_t expected_version,
                         const RuleSetState &next) override {
    ++write_calls;
    if (before_write)
      before_write(*this);
    if (state.version != expected_version)
      throw RuleConflictError("version moved to " + std::to_string(state.version));
    if (fail_persistence)
      throw RulePersistenceError("rule config volume is read-only");
    state = next;
  }

  RuleSetState state;
  int write_calls = 0;
  bool fail_persistence = false;
  // Runs inside compare_and_write, before the version check.
  std::function<void(InMemoryRuleSetStore &)> before_write;
};

// Scores by SQL injection pattern hits so tests control labels through the
// request URI.
class FakeModel : public IClassificationModel {
public:
  explicit FakeModel(std::string version = "test-model-1",
                     int schema_version = FEATURE_SCHEMA_VERSION)
      : version_(std::move(version)), schema_version_(schema_version) {}

  double predict_probability(const std::vector<double> &features) const override {
    ++predict_calls;
    if (throw_on_predict || failing_predicts.fetch_sub(1) > 0)
      throw std::runtime_error("inference backend failure");
    if (scorer)
      return scorer(features);
    const size_t sqli = static_cast<size_t>(Feature::SQLI_PATTERN_HITS);
    return features.at(sqli) > 0 ? 0.97 : 0.03;
  }

  const std::string &model_version() const override { return version_; }
  int feature_schema_version() const override { return schema_version_; }
  size_t input_width() const override {
    return static_cast<size_t>(Feature::FEATURE_COUNT);
  }

  mutable std::atomic<int> predict_calls{0};
  bool throw_on_predict = false;
  // Calls that throw before the model starts answering.
  mutable std::atomic<int> failing_predicts{0};
  std::function<double(const std::vector<double> &)> scorer;

private:
  std::string version_;
  int schema_version_;
};

class RecordingDispatcher : public INotificationDispatcher {
public:
  enum class Mode { SUCCEED, FAIL, THROW };

  explicit RecordingDispatcher(Mode mode = Mode::SUCCEED) : mode_(mode) {}

  bool dispatch(const Notification &notification) override {
    received.push_back(notification);
    if (mode_ == Mode::THROW)
      throw NotificationError("smtp connection refused");
    return mode_ == Mode::SUCCEED;
  }
  const char *get_name() const override { return "RecordingDispatcher"; }
  std::string get_dispatcher_type() const override { return "recording"; }

  size_t count(NotificationKind kind) const {
    return static_cast<size_t>(std::count_if(
        received.begin(), received.end(),
        [kind](const Notification &n) { return n.kind == kind; }));
  }

  std::vector<Notification> received;

private:
  Mode mode_;
};

#endif // TEST_FAKES_HPP
