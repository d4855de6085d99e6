#include "network/progress_sink.hpp"
#include <exception>
#include <boost/log/trivial.hpp>

namespace upstream::network {

void notify_progress(const ProgressCallback& callback, std::uint64_t current, std::uint64_t total) {
  if (!callback) {
    return;
  }
  try {
    callback(current, total);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Progress: Ignoring exception from progress callback: " << e.what();
  } catch (...) {
    BOOST_LOG_TRIVIAL(warning) << "Progress: Ignoring unknown exception from progress callback";
  }
}

} // namespace upstream::network
