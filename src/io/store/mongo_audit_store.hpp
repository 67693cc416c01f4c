#ifndef MONGO_AUDIT_STORE_HPP
#define MONGO_AUDIT_STORE_HPP

#include "core/config.hpp"
#include "io/db/mongo_manager.hpp"
#include "store_interfaces.hpp"

#include <memory>

// Unclassified and classified time-bucketed collections in one database.
class MongoAuditStore : public IUnclassifiedStore, public IClassifiedStore {
public:
  MongoAuditStore(std::shared_ptr<MongoManager> manager,
                  Config::StoreConfig config);

  FetchPage fetch_after(const std::string &bucket,
                        const std::optional<RecordKey> &after,
                        size_t limit) override;

  bool exists(const std::string &bucket, const std::string &record_id,
              const std::string &model_version) override;

  bool upsert(const std::string &bucket, const AuditRecord &record,
              const ClassificationResult &result) override;

  void scan(const std::string &bucket, const std::string &model_version,
            const std::function<void(const ClassifiedRecord &)> &visitor) override;

private:
  std::shared_ptr<MongoManager> mongo_manager_;
  Config::StoreConfig config_;
};

// Query selecting the documents sorted strictly after `after` under
// sort({ts: 1, id: 1}), as extended JSON. Comparison operators only match
// values of the same BSON type, so the predicate compares against the stored
// values and adds a $type branch for every type that sorts later.
nlohmann::json build_resume_filter(const std::string &timestamp_field,
                                   const std::string &id_field,
                                   const std::optional<RecordKey> &after);

// `_id` of a classified document; the idempotence key.
std::string classified_document_id(const std::string &record_id,
                                   const std::string &model_version);

// The original document plus the classification fields, minus its `_id`.
nlohmann::json build_classified_document(const AuditRecord &record,
                                         const ClassificationResult &result);

// Reads back what build_classified_document wrote.
std::optional<ClassifiedRecord>
parse_classified_document(const nlohmann::json &doc,
                          const std::string &timestamp_field);

#endif // MONGO_AUDIT_STORE_HPP
