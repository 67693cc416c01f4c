#include "mongo_audit_store.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>
#include <bsoncxx/types/bson_value/view.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/update.hpp>
#include <mongocxx/write_concern.hpp>

#include <chrono>
#include <string>
#include <vector>
#include <utility>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_array;
using bsoncxx::builder::basic::make_document;

std::string classified_document_id(const std::string &record_id,
                                   const std::string &model_version) {
  return record_id + ":" + model_version;
}

nlohmann::json build_classified_document(const AuditRecord &record,
                                         const ClassificationResult &result) {
  nlohmann::json doc = record.source_document.is_object()
                           ? record.source_document
                           : nlohmann::json::object();
  doc.erase("_id");
  doc["record_id"] = result.record_id;
  doc["target"] = result.label == Label::MALICIOUS ? 1 : 0;
  doc["label"] = label_to_string(result.label);
  doc["confidence"] = result.confidence;
  doc["model_version"] = result.model_version;
  doc["feature_schema_version"] = result.feature_schema_version;
  doc["classification_timestamp"] = {{"$date", result.classified_at_ms}};
  return doc;
}

std::optional<ClassifiedRecord>
parse_classified_document(const nlohmann::json &doc,
                          const std::string &timestamp_field) {
  auto record = AuditRecord::from_json(doc, "record_id", timestamp_field);
  if (!record)
    return std::nullopt;

  ClassifiedRecord classified;
  classified.record_id = record->id;
  classified.timestamp_ms = record->timestamp_ms;
  classified.triggered_rules = std::move(record->triggered_rules);

  auto label = doc.find("label");
  auto target = doc.find("target");
  if (label != doc.end() && label->is_string())
    classified.label = label->get<std::string>() == "malicious" ? Label::MALICIOUS
                                                                : Label::BENIGN;
  else if (target != doc.end() && target->is_number())
    classified.label = target->get<int>() == 1 ? Label::MALICIOUS : Label::BENIGN;
  else
    return std::nullopt;

  auto confidence = doc.find("confidence");
  if (confidence != doc.end() && confidence->is_number())
    classified.confidence = confidence->get<double>();
  return classified;
}

MongoAuditStore::MongoAuditStore(std::shared_ptr<MongoManager> manager,
                                 Config::StoreConfig config)
    : mongo_manager_(std::move(manager)), config_(std::move(config)) {}

namespace {

// BSON types a timestamp or id field can plausibly hold, in the server's
// cross-type sort order.
const std::vector<std::string> kSortTypeOrder = {"number", "string", "objectId",
                                                 "bool",   "date",   "timestamp"};

int sort_type_index(const nlohmann::json &value) {
  if (value.is_number())
    return 0;
  if (value.is_string())
    return 1;
  if (value.is_boolean())
    return 3;
  if (!value.is_object())
    return -1;
  if (value.contains("$numberInt") || value.contains("$numberLong") ||
      value.contains("$numberDouble") || value.contains("$numberDecimal"))
    return 0;
  if (value.contains("$oid"))
    return 2;
  if (value.contains("$date"))
    return 4;
  if (value.contains("$timestamp"))
    return 5;
  return -1;
}

nlohmann::json later_sort_types(const nlohmann::json &value) {
  nlohmann::json types = nlohmann::json::array();
  int index = sort_type_index(value);
  if (index < 0)
    return types;
  for (size_t i = static_cast<size_t>(index) + 1; i < kSortTypeOrder.size(); ++i)
    types.push_back(kSortTypeOrder[i]);
  return types;
}

nlohmann::json stored_value(const RecordKey &key, const char *name,
                            nlohmann::json fallback) {
  if (key.stored.is_object()) {
    auto it = key.stored.find(name);
    if (it != key.stored.end())
      return *it;
  }
  return fallback;
}

nlohmann::json field_condition(const std::string &field, const std::string &op,
                               const nlohmann::json &operand) {
  nlohmann::json condition = nlohmann::json::object();
  condition[field][op] = operand;
  return condition;
}

// {"timestamp": ..., "id": ...} in canonical extended JSON, straight from the
// BSON so the type survives.
nlohmann::json stored_sort_values(const bsoncxx::document::view &doc,
                                  const std::string &timestamp_field,
                                  const std::string &id_field) {
  bsoncxx::builder::basic::document keys{};
  auto ts = doc[timestamp_field];
  if (ts)
    keys.append(kvp("timestamp", ts.get_value()));
  auto id = doc[id_field];
  if (id)
    keys.append(kvp("id", id.get_value()));
  return nlohmann::json::parse(
      bsoncxx::to_json(keys.view(), bsoncxx::ExtendedJsonMode::k_canonical));
}

} // namespace

nlohmann::json build_resume_filter(const std::string &timestamp_field,
                                   const std::string &id_field,
                                   const std::optional<RecordKey> &after) {
  nlohmann::json filter = nlohmann::json::object();
  // Documents without an id are invisible to the fetcher.
  filter[id_field]["$exists"] = true;
  if (!after) {
    filter[timestamp_field]["$exists"] = true;
    return filter;
  }

  nlohmann::json date_fallback = nlohmann::json::object();
  date_fallback["$date"]["$numberLong"] = std::to_string(after->timestamp_ms);
  const nlohmann::json ts = stored_value(*after, "timestamp", date_fallback);
  const nlohmann::json id = stored_value(*after, "id", nlohmann::json(after->id));

  nlohmann::json branches = nlohmann::json::array();
  branches.push_back(field_condition(timestamp_field, "$gt", ts));
  nlohmann::json later_ts = later_sort_types(ts);
  if (!later_ts.empty())
    branches.push_back(field_condition(timestamp_field, "$type", later_ts));

  nlohmann::json same_ts_later_id = field_condition(id_field, "$gt", id);
  same_ts_later_id[timestamp_field] = ts;
  branches.push_back(same_ts_later_id);
  nlohmann::json later_id = later_sort_types(id);
  if (!later_id.empty()) {
    nlohmann::json same_ts_later_id_type = field_condition(id_field, "$type", later_id);
    same_ts_later_id_type[timestamp_field] = ts;
    branches.push_back(same_ts_later_id_type);
  }

  filter["$or"] = branches;
  return filter;
}

FetchPage MongoAuditStore::fetch_after(const std::string &bucket,
                                       const std::optional<RecordKey> &after,
                                       size_t limit) {
  const std::string &ts_field = config_.timestamp_field_name;
  const std::string &id_field = config_.id_field_name;

  bsoncxx::document::value filter{bsoncxx::builder::basic::document{}.extract()};
  try {
    filter = bsoncxx::from_json(build_resume_filter(ts_field, id_field, after).dump());
  } catch (const bsoncxx::exception &e) {
    throw WafError("Resume position in bucket " + bucket +
                   " cannot be encoded as a query: " + e.what());
  }

  mongocxx::options::find opts{};
  opts.sort(make_document(kvp(ts_field, 1), kvp(id_field, 1)));
  opts.limit(static_cast<int64_t>(limit));
  opts.max_time(std::chrono::milliseconds(config_.operation_timeout_ms));

  FetchPage page;
  try {
    auto client = mongo_manager_->get_client();
    auto collection =
        (*client)[config_.database][collection_name(config_.unclassified_prefix, bucket)];

    LOG(LogLevel::TRACE, LogComponent::IO_STORE,
        "Querying bucket " << bucket << " after "
                           << (after ? after->id : std::string("<start>")));

    mongocxx::cursor cursor = collection.find(filter.view(), opts);
    for (const auto &doc : cursor) {
      RecordKey scanned;
      std::optional<AuditRecord> record;
      try {
        scanned.stored = stored_sort_values(doc, ts_field, id_field);
        record = AuditRecord::from_json(nlohmann::json::parse(bsoncxx::to_json(doc)),
                                        id_field, ts_field);
      } catch (const std::exception &e) {
        LOG(LogLevel::WARN, LogComponent::IO_STORE,
            "Skipping undecodable document in bucket " << bucket << ": "
                                                       << e.what());
      }
      if (record) {
        scanned.timestamp_ms = record->timestamp_ms;
        scanned.id = record->id;
        record->store_key = scanned.stored;
        page.records.push_back(std::move(*record));
      } else if (page.last_scanned) {
        scanned.timestamp_ms = page.last_scanned->timestamp_ms;
        scanned.id = page.last_scanned->id;
      } else if (after) {
        scanned.timestamp_ms = after->timestamp_ms;
        scanned.id = after->id;
      }
      page.last_scanned = std::move(scanned);
    }
  } catch (const mongocxx::exception &e) {
    throw FetchError("Fetch from bucket " + bucket + " failed: " + e.what());
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_STORE,
      "Fetched " << page.records.size() << " records from bucket " << bucket);
  return page;
}

bool MongoAuditStore::exists(const std::string &bucket,
                             const std::string &record_id,
                             const std::string &model_version) {
  try {
    auto client = mongo_manager_->get_client();
    auto collection =
        (*client)[config_.database][collection_name(config_.classified_prefix, bucket)];

    mongocxx::options::find opts{};
    opts.projection(make_document(kvp("_id", 1)));
    opts.max_time(std::chrono::milliseconds(config_.operation_timeout_ms));

    auto found = collection.find_one(
        make_document(kvp("_id", classified_document_id(record_id, model_version))),
        opts);
    return static_cast<bool>(found);
  } catch (const mongocxx::exception &e) {
    throw FetchError("Existence check in bucket " + bucket + " failed: " +
                     e.what());
  }
}

bool MongoAuditStore::upsert(const std::string &bucket,
                             const AuditRecord &record,
                             const ClassificationResult &result) {
  bsoncxx::document::value document{bsoncxx::builder::basic::document{}.extract()};
  try {
    document = bsoncxx::from_json(build_classified_document(record, result).dump());
  } catch (const bsoncxx::exception &e) {
    throw WafError("Record " + record.id +
                   " cannot be encoded as BSON: " + e.what());
  }

  try {
    auto client = mongo_manager_->get_client();
    auto collection =
        (*client)[config_.database][collection_name(config_.classified_prefix, bucket)];

    mongocxx::write_concern concern{};
    concern.journal(true);
    concern.timeout(std::chrono::milliseconds(config_.operation_timeout_ms));

    mongocxx::options::update opts{};
    opts.upsert(true);
    opts.write_concern(concern);

    auto outcome = collection.update_one(
        make_document(kvp("_id", classified_document_id(result.record_id,
                                                        result.model_version))),
        make_document(kvp("$setOnInsert", document.view())), opts);

    bool inserted = outcome && outcome->upserted_count() > 0;
    LOG(LogLevel::TRACE, LogComponent::IO_WRITER,
        (inserted ? "Inserted" : "Already present") << " classified record "
                                                    << result.record_id
                                                    << " in bucket " << bucket);
    return inserted;
  } catch (const mongocxx::exception &e) {
    throw StoreWriteError("Write of record " + result.record_id +
                          " to bucket " + bucket + " failed: " + e.what());
  }
}

void MongoAuditStore::scan(
    const std::string &bucket, const std::string &model_version,
    const std::function<void(const ClassifiedRecord &)> &visitor) {
  try {
    auto client = mongo_manager_->get_client();
    auto collection =
        (*client)[config_.database][collection_name(config_.classified_prefix, bucket)];

    mongocxx::options::find opts{};
    opts.projection(make_document(kvp("record_id", 1),
                                  kvp(config_.timestamp_field_name, 1),
                                  kvp("label", 1), kvp("target", 1),
                                  kvp("confidence", 1), kvp("rules", 1)));
    opts.max_time(std::chrono::milliseconds(config_.operation_timeout_ms));
    opts.batch_size(static_cast<int32_t>(config_.page_size));

    auto cursor = collection.find(
        make_document(kvp("model_version", model_version)), opts);
    for (const auto &doc : cursor) {
      nlohmann::json json_doc;
      try {
        json_doc = nlohmann::json::parse(bsoncxx::to_json(doc));
      } catch (const nlohmann::json::exception &e) {
        LOG(LogLevel::WARN, LogComponent::IO_STORE,
            "Skipping undecodable classified document: " << e.what());
        continue;
      }
      if (auto classified =
              parse_classified_document(json_doc, config_.timestamp_field_name))
        visitor(*classified);
    }
  } catch (const mongocxx::exception &e) {
    throw FetchError("Scan of classified bucket " + bucket + " failed: " +
                     e.what());
  }
}
