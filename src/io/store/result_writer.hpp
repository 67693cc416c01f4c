#ifndef RESULT_WRITER_HPP
#define RESULT_WRITER_HPP

#include "store_interfaces.hpp"
#include "utils/retry_policy.hpp"

#include <string>

// Idempotent persistence of classification results into the classified
// bucket matching the record's source bucket.
class ResultWriter {
public:
  ResultWriter(IClassifiedStore &store, RetryPolicy retry);

  // Throws FetchError after the retry ceiling.
  bool already_classified(const std::string &bucket, const AuditRecord &record,
                          const std::string &model_version);

  // True when this call created the document, false when (record id, model
  // version) was already present. Throws StoreWriteError after the retry
  // ceiling.
  bool write(const std::string &bucket, const AuditRecord &record,
             const ClassificationResult &result);

private:
  IClassifiedStore &store_;
  RetryPolicy retry_;
};

#endif // RESULT_WRITER_HPP
