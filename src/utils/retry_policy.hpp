#ifndef RETRY_POLICY_HPP
#define RETRY_POLICY_HPP

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

struct RetryPolicy {
  size_t max_attempts = 3;
  std::chrono::milliseconds base_delay = std::chrono::milliseconds(500);
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_delay = std::chrono::milliseconds(30000);

  // Sleeps between attempts. Tests swap in a recorder.
  std::function<void(std::chrono::milliseconds)> sleeper =
      [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };

  static RetryPolicy from_config(const Config::FetcherConfig &config) {
    RetryPolicy policy;
    policy.max_attempts = std::max<size_t>(1, config.max_attempts);
    policy.base_delay = std::chrono::milliseconds(config.base_delay_ms);
    policy.backoff_multiplier = config.backoff_multiplier;
    policy.max_delay = std::chrono::milliseconds(config.max_delay_ms);
    return policy;
  }

  // Delay before attempt `attempt + 1`, where attempt 0 is the first retry.
  std::chrono::milliseconds delay_for(size_t attempt) const {
    double delay_ms = static_cast<double>(base_delay.count()) *
                      std::pow(backoff_multiplier, static_cast<double>(attempt));
    delay_ms = std::min(delay_ms, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<long>(delay_ms));
  }
};

// Runs `fn`, retrying only TransientIOError up to the attempt ceiling. The
// last TransientIOError is rethrown once the ceiling is reached; any other
// exception escapes on the first throw.
template <typename Fn>
auto retry_with_backoff(const RetryPolicy &policy, const std::string &operation,
                        LogComponent component, Fn &&fn,
                        const std::function<void()> &on_retry = {})
    -> decltype(fn()) {
  for (size_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const TransientIOError &e) {
      if (attempt >= policy.max_attempts) {
        LOG(LogLevel::ERROR, component,
            operation << " failed after " << attempt
                      << " attempts: " << e.what());
        throw;
      }
      auto delay = policy.delay_for(attempt - 1);
      LOG(LogLevel::WARN, component,
          operation << " attempt " << attempt << "/" << policy.max_attempts
                    << " failed: " << e.what() << ". Retrying in "
                    << delay.count() << "ms");
      if (on_retry)
        on_retry();
      if (policy.sleeper)
        policy.sleeper(delay);
    }
  }
}

#endif // RETRY_POLICY_HPP
