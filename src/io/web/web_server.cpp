#include "web_server.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <prometheus/text_serializer.h>

namespace {

size_t limit_param(const httplib::Request &req, size_t fallback) {
  if (!req.has_param("limit"))
    return fallback;
  auto parsed = Utils::string_to_number<size_t>(req.get_param_value("limit"));
  if (!parsed || *parsed == 0)
    return fallback;
  return std::min<size_t>(*parsed, 500);
}

} // namespace

WebServer::WebServer(const std::string &host, int port,
                     MetricsRegistry &metrics_registry,
                     Orchestrator &orchestrator, RunStatusLog &run_log,
                     Notifier &notifier)
    : host_(host), port_(port), metrics_registry_(metrics_registry),
      orchestrator_(orchestrator), run_log_(run_log), notifier_(notifier) {
  server_ = std::make_unique<httplib::Server>();

  server_->Get("/metrics", [this](const httplib::Request &req,
                                  httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::WEB,
        "Received request for /metrics from " << req.remote_addr);
    prometheus::TextSerializer serializer;
    auto collected_metrics = metrics_registry_.get_registry()->Collect();
    res.set_content(serializer.Serialize(collected_metrics),
                    "text/plain; version=0.0.4");
  });

  server_->Get("/health", [](const httplib::Request &, httplib::Response &res) {
    nlohmann::json j = {{"status", "ok"},
                        {"time", Utils::format_ms_as_iso8601(
                                     Utils::get_current_time_ms())}};
    res.set_content(j.dump(), "application/json");
  });

  server_->Get("/api/v1/runs/latest",
               [this](const httplib::Request &req, httplib::Response &res) {
                 nlohmann::json j = run_log_.latest(limit_param(req, 20));
                 res.set_content(j.dump(2), "application/json");
               });

  server_->Get("/api/v1/notifications/recent",
               [this](const httplib::Request &req, httplib::Response &res) {
                 nlohmann::json j = nlohmann::json::array();
                 for (const auto &n :
                      notifier_.get_recent_notifications(limit_param(req, 50)))
                   j.push_back(n.to_json());
                 res.set_content(j.dump(2), "application/json");
               });

  server_->Post("/api/v1/trigger/classify",
                [this](const httplib::Request &req, httplib::Response &res) {
                  LOG(LogLevel::INFO, LogComponent::WEB,
                      "Manual classification trigger from " << req.remote_addr);
                  orchestrator_.request_classification();
                  res.status = 202;
                  res.set_content(R"({"queued":"classification"})",
                                  "application/json");
                });

  server_->Post("/api/v1/trigger/harden",
                [this](const httplib::Request &req, httplib::Response &res) {
                  LOG(LogLevel::INFO, LogComponent::WEB,
                      "Manual hardening trigger from " << req.remote_addr);
                  orchestrator_.request_hardening();
                  res.status = 202;
                  res.set_content(R"({"queued":"hardening"})",
                                  "application/json");
                });

  LOG(LogLevel::INFO, LogComponent::WEB,
      "Web server initialized for " << host_ << ":" << port_);
}

WebServer::~WebServer() { stop(); }

void WebServer::start() {
  if (server_thread_.joinable())
    return;
  server_thread_ = std::thread(&WebServer::run, this);
}

void WebServer::stop() {
  if (server_)
    server_->stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
    LOG(LogLevel::INFO, LogComponent::WEB, "Web server stopped.");
  }
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::WEB,
      "Web server listening on " << host_ << ":" << port_);
  if (!server_->listen(host_.c_str(), port_)) {
    LOG(LogLevel::ERROR, LogComponent::WEB,
        "Web server failed to listen on " << host_ << ":" << port_);
  }
}
