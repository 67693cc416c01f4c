#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Root of every error the pipeline raises on purpose. Anything else that
// escapes a component is a programming error.
class WafError : public std::runtime_error {
public:
  explicit WafError(const std::string &what) : std::runtime_error(what) {}
};

// Store, model or network unreachable. Retried with backoff; the run resumes
// from the persisted cursor.
class TransientIOError : public WafError {
public:
  explicit TransientIOError(const std::string &what) : WafError(what) {}
};

class FetchError : public TransientIOError {
public:
  explicit FetchError(const std::string &what) : TransientIOError(what) {}
};

class StoreWriteError : public TransientIOError {
public:
  explicit StoreWriteError(const std::string &what)
      : TransientIOError(what) {}
};

// The inference backend failed to score a vector. Retried like any store
// failure; at the ceiling the run aborts before the record is committed.
class InferenceError : public TransientIOError {
public:
  explicit InferenceError(const std::string &what) : TransientIOError(what) {}
};

class ModelLoadError : public WafError {
public:
  explicit ModelLoadError(const std::string &what) : WafError(what) {}
};

// Feature/model version incompatibility. Fatal to the run.
class SchemaMismatchError : public WafError {
public:
  explicit SchemaMismatchError(const std::string &what) : WafError(what) {}
};

// Concurrent ruleset mutation detected. The cycle aborts with nothing applied.
class RuleConflictError : public WafError {
public:
  explicit RuleConflictError(const std::string &what) : WafError(what) {}
};

// The new RuleSetState could not be made durable. Never retried in-cycle.
class RulePersistenceError : public WafError {
public:
  explicit RulePersistenceError(const std::string &what) : WafError(what) {}
};

class NotificationError : public WafError {
public:
  explicit NotificationError(const std::string &what) : WafError(what) {}
};

class ConfigError : public WafError {
public:
  explicit ConfigError(const std::string &what) : WafError(what) {}
};

#endif // ERRORS_HPP
