#ifndef UPSTREAM_NETWORK_PROGRESS_SINK_HPP
#define UPSTREAM_NETWORK_PROGRESS_SINK_HPP

#include <cstdint>
#include <functional>

namespace upstream::network {

// Called synchronously from the transfer loop with (bytes so far, total bytes).
// Advisory only: it must return promptly and must not be relied on to abort a transfer.
using ProgressCallback = std::function<void(std::uint64_t current, std::uint64_t total)>;

// Invokes callback if set. Anything the callback throws is logged and dropped.
void notify_progress(const ProgressCallback& callback, std::uint64_t current, std::uint64_t total);

} // namespace upstream::network

#endif // UPSTREAM_NETWORK_PROGRESS_SINK_HPP
