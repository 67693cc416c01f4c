#include "result_writer.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <utility>

ResultWriter::ResultWriter(IClassifiedStore &store, RetryPolicy retry)
    : store_(store), retry_(std::move(retry)) {}

bool ResultWriter::already_classified(const std::string &bucket,
                                      const AuditRecord &record,
                                      const std::string &model_version) {
  return retry_with_backoff(
      retry_, "Existence check for record " + record.id, LogComponent::IO_WRITER,
      [&] { return store_.exists(bucket, record.id, model_version); },
      [] { PipelineMetrics::instance().fetch_retries.Increment(); });
}

bool ResultWriter::write(const std::string &bucket, const AuditRecord &record,
                         const ClassificationResult &result) {
  bool inserted = retry_with_backoff(
      retry_, "Write of record " + record.id, LogComponent::IO_WRITER,
      [&] { return store_.upsert(bucket, record, result); },
      [] { PipelineMetrics::instance().write_retries.Increment(); });

  if (!inserted)
    LOG(LogLevel::DEBUG, LogComponent::IO_WRITER,
        "Record " << record.id << " already classified under model "
                  << result.model_version << ". Write was a no-op.");
  return inserted;
}
