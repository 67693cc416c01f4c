#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include <chrono>
#include <prometheus/histogram.h>

class ScopedTimer {
public:
  explicit ScopedTimer(prometheus::Histogram &histogram_metric)
      : metric_(histogram_metric),
        start_time_(std::chrono::steady_clock::now()) {}

  ~ScopedTimer() {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(
        end_time - start_time_);
    metric_.Observe(duration.count());
  }

private:
  prometheus::Histogram &metric_;
  std::chrono::time_point<std::chrono::steady_clock> start_time_;
};

#endif // SCOPED_TIMER_HPP
