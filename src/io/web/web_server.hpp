#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/metrics_registry.hpp"
#include "core/notifier.hpp"
#include "core/orchestrator.hpp"
#include "core/run_status.hpp"

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

// Metrics, liveness, run history and the manual schedule triggers. Triggers
// only queue work on the orchestrator; nothing runs on the HTTP threads.
class WebServer {
public:
  WebServer(const std::string &host, int port,
            MetricsRegistry &metrics_registry, Orchestrator &orchestrator,
            RunStatusLog &run_log, Notifier &notifier);
  ~WebServer();

  void start();
  void stop();

private:
  void run();

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::string host_;
  int port_;
  MetricsRegistry &metrics_registry_;
  Orchestrator &orchestrator_;
  RunStatusLog &run_log_;
  Notifier &notifier_;
};

#endif // WEB_SERVER_HPP
