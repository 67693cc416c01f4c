#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP

#include "core/config.hpp"
#include "core/notifier.hpp"
#include "core/run_status.hpp"
#include "detection/crs_rule_catalog.hpp"
#include "io/rules/rule_set_store.hpp"
#include "io/store/store_interfaces.hpp"
#include "models/classifier.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

// Everything a run touches. The orchestrator does not own the stores.
struct PipelineDependencies {
  IUnclassifiedStore &unclassified_store;
  IClassifiedStore &classified_store;
  ICursorStore &cursor_store;
  IRuleSetStore &rule_store;
  std::shared_ptr<const Classifier> classifier;
  std::shared_ptr<const CrsRuleCatalog> catalog;
  Notifier &notifier;
  RunStatusLog *run_log = nullptr;

  std::function<uint64_t()> clock;
  // Replaces the retry sleep; empty keeps the real one.
  std::function<void(std::chrono::milliseconds)> retry_sleeper;
};

// Runs the classification half and the hardening half on their own cadences.
// Neither kind of run ever overlaps itself.
class Orchestrator {
public:
  Orchestrator(std::shared_ptr<const Config::AppConfig> config,
               PipelineDependencies deps);
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  RunStatus run_classification();
  RunStatus run_hardening_cycle();
  RunStatus rollback(uint64_t version);

  void start();
  void stop();

  // Queue a run on the scheduler thread; safe from any thread.
  void request_classification();
  void request_hardening();
  // Stops the classification run in flight, or else the next one, at its
  // next micro-batch boundary. Committed records stay committed.
  void request_cancel() { cancel_requested_ = true; }

  // Applies from the next run or cycle. Store and model stay as loaded.
  void update_config(std::shared_ptr<const Config::AppConfig> config);
  std::shared_ptr<const Config::AppConfig> config() const;

private:
  struct ClassifyCounts {
    uint64_t fetched = 0;
    uint64_t classified = 0;
    uint64_t written = 0;
    uint64_t already_classified = 0;
    uint64_t skipped = 0;
    uint64_t batches = 0;
  };

  void scheduler_loop();
  RetryPolicy make_retry_policy(const Config::AppConfig &config) const;
  void finish_run(RunStatus &status);

  std::shared_ptr<const Config::AppConfig> config_;
  mutable std::mutex config_mutex_;
  PipelineDependencies deps_;

  std::mutex classify_mutex_;
  std::mutex hardening_mutex_;
  std::atomic<bool> cancel_requested_{false};

  std::thread scheduler_thread_;
  std::mutex schedule_mutex_;
  std::condition_variable schedule_cv_;
  bool stop_requested_ = false;
  bool classify_requested_ = false;
  bool harden_requested_ = false;
};

#endif // ORCHESTRATOR_HPP
