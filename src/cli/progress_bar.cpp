#include "cli/progress_bar.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace upstream {
namespace cli {

ProgressBar::ProgressBar(std::ostream& out, std::string label, std::size_t width)
  : out_(out)
  , label_(std::move(label))
  , width_(width) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t total) {
  if (finished_) {
    return;
  }
  if (!started_) {
    started_ = true;
    start_time_ = std::chrono::steady_clock::now();
  }
  total_ = total;
  current_ = std::min(current, total);
  render();
}

void ProgressBar::finish() {
  if (!started_ || finished_) {
    return;
  }
  current_ = total_;
  render();
  finished_ = true;
  out_ << '\n' << std::flush;
}

network::ProgressCallback ProgressBar::callback() {
  return [this](std::uint64_t current, std::uint64_t total) { update(current, total); };
}

void ProgressBar::render() {
  const double fraction = total_ == 0 ? 1.0 : static_cast<double>(current_) / static_cast<double>(total_);
  const auto filled = static_cast<std::size_t>(fraction * static_cast<double>(width_));

  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
  const double speed = elapsed.count() > 0 ? static_cast<double>(current_) / elapsed.count() : 0.0;

  std::ostringstream line;
  line << '\r' << label_
       << std::setw(3) << static_cast<int>(fraction * 100) << "% ["
       << std::string(filled, '=') << std::string(width_ - filled, ' ') << "] "
       << format_bytes(speed) << "/s";
  out_ << line.str() << std::flush;
}

std::string format_bytes(double bytes) {
  static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  std::size_t unit = 0;
  while (bytes >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
    bytes /= 1024.0;
    ++unit;
  }

  std::ostringstream ss;
  if (unit == 0) {
    ss << static_cast<std::uint64_t>(bytes) << ' ' << units[unit];
  } else {
    ss << std::fixed << std::setprecision(1) << bytes << ' ' << units[unit];
  }
  return ss.str();
}

} // namespace cli
} // namespace upstream
