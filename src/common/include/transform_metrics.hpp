#ifndef LARGEFILE_TRANSFORM_METRICS_HPP
#define LARGEFILE_TRANSFORM_METRICS_HPP

#include <chrono>
#include <cstddef> // For size_t
#include <iostream>

#include "config.hpp"

namespace largefile_common {

// Tracks bytes/lines pushed through a transform, logs a progress line every
// `progress_step_percent` of `total_bytes_expected`, and prints a summary.
class TransformMetrics {
public:
  TransformMetrics(std::size_t total_bytes_expected, std::ostream &out,
                   unsigned int progress_step_percent =
                       config::PROGRESS_STEP_PERCENT);

  void start_timer();
  void stop_timer();

  void record_chunk(std::size_t bytes_processed, std::size_t lines_processed);

  void print_summary() const;

  std::size_t total_bytes_expected() const { return m_total_bytes_expected; }
  std::size_t bytes_processed() const { return m_bytes_processed; }
  std::size_t lines_processed() const { return m_lines_processed; }
  unsigned int last_logged_percent() const { return m_last_logged_percent; }
  double elapsed_seconds() const;

private:
  std::size_t m_total_bytes_expected;
  std::ostream &m_out;
  unsigned int m_progress_step_percent;

  std::chrono::steady_clock::time_point m_start_time;
  std::chrono::steady_clock::time_point m_end_time;
  bool m_timer_started = false;
  bool m_timer_running = false;

  std::size_t m_bytes_processed = 0;
  std::size_t m_lines_processed = 0;
  unsigned int m_last_logged_percent = 0;
};

} // namespace largefile_common

#endif // LARGEFILE_TRANSFORM_METRICS_HPP
