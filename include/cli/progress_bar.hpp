#ifndef UPSTREAM_CLI_PROGRESS_BAR_HPP
#define UPSTREAM_CLI_PROGRESS_BAR_HPP

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include "network/progress_sink.hpp"

namespace upstream {
namespace cli {

// Single-line text progress bar, e.g.
//   Uploading Shard:  42% [================                        ] 1.5 MiB/s
// Created lazily by the first update; finish() is driven by the caller.
class ProgressBar {
public:
  ProgressBar(std::ostream& out, std::string label, std::size_t width = 40);

  void update(std::uint64_t current, std::uint64_t total);
  void finish();

  // Callback bound to this bar, which must outlive the transfer
  network::ProgressCallback callback();

  bool started() const { return started_; }
  std::uint64_t current() const { return current_; }
  std::uint64_t total() const { return total_; }

private:
  std::ostream& out_;
  std::string label_;
  std::size_t width_;
  bool started_{false};
  bool finished_{false};
  std::uint64_t current_{0};
  std::uint64_t total_{0};
  std::chrono::steady_clock::time_point start_time_;

  void render();
};

// "512 B", "1.5 KiB", "250.0 MiB"
std::string format_bytes(double bytes);

} // namespace cli
} // namespace upstream

#endif // UPSTREAM_CLI_PROGRESS_BAR_HPP
