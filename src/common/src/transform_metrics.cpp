#include "transform_metrics.hpp"
#include <cmath>   // For std::floor
#include <iomanip> // For std::fixed, std::setprecision

namespace largefile_common {

TransformMetrics::TransformMetrics(std::size_t total_bytes_expected,
                                   std::ostream &out,
                                   unsigned int progress_step_percent)
    : m_total_bytes_expected(total_bytes_expected), m_out(out),
      m_progress_step_percent(progress_step_percent) {}

void TransformMetrics::start_timer() {
  if (!m_timer_running) {
    m_start_time = std::chrono::steady_clock::now();
    m_timer_started = true;
    m_timer_running = true;
  }
}

void TransformMetrics::stop_timer() {
  if (m_timer_running) {
    m_end_time = std::chrono::steady_clock::now();
    m_timer_running = false;
  }
}

void TransformMetrics::record_chunk(std::size_t bytes_processed,
                                    std::size_t lines_processed) {
  m_bytes_processed += bytes_processed;
  m_lines_processed += lines_processed;

  if (m_total_bytes_expected == 0) {
    return;
  }

  double progress = static_cast<double>(m_bytes_processed) * 100.0 /
                    static_cast<double>(m_total_bytes_expected);
  if (progress >= static_cast<double>(m_last_logged_percent) +
                      static_cast<double>(m_progress_step_percent)) {
    m_last_logged_percent = static_cast<unsigned int>(std::floor(progress));
    m_out << "Progress: " << m_last_logged_percent
          << "%, Lines processed: " << m_lines_processed << std::endl;
  }
}

double TransformMetrics::elapsed_seconds() const {
  if (!m_timer_started) {
    return 0.0;
  }
  auto end = m_timer_running ? std::chrono::steady_clock::now() : m_end_time;
  return std::chrono::duration_cast<std::chrono::duration<double>>(
             end - m_start_time)
      .count();
}

void TransformMetrics::print_summary() const {
  m_out << "Transformation complete and file saved." << std::endl;
  m_out << "Total lines processed: " << m_lines_processed << std::endl;
  std::ios_base::fmtflags flags = m_out.flags();
  std::streamsize precision = m_out.precision();
  m_out << "Total time: " << std::fixed << std::setprecision(2)
        << elapsed_seconds() << " seconds" << std::endl;
  m_out.flags(flags);
  m_out.precision(precision);
}

} // namespace largefile_common
