#include "shard/shard_planner.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace upstream {
namespace shard {

std::uint64_t ByteRange::clamped_length(std::uint64_t file_size) const {
  if (start >= file_size) {
    return 0;
  }
  return std::min(end, file_size) - start;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ShardPlanner::ShardPlanner(std::uint64_t shard_size) : shard_size_(shard_size) {
  if (shard_size_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Shard planner: Rejected zero shard size";
    throw InvalidShardSize();
  }
}


//==============================================
// PLANNING
//==============================================

std::uint64_t ShardPlanner::shard_count(std::uint64_t file_size) const {
  return file_size / shard_size_ + (file_size % shard_size_ != 0 ? 1 : 0);
}

std::vector<ByteRange> ShardPlanner::plan(std::uint64_t file_size) const {
  const std::uint64_t count = shard_count(file_size);
  BOOST_LOG_TRIVIAL(debug) << "Shard planner: Planning " << count << " shard(s) of "
                           << shard_size_ << " bytes for " << file_size << " bytes";

  std::vector<ByteRange> ranges;
  ranges.reserve(count);

  // Walk start/end forward by shard_size; the final end is not clamped here
  std::uint64_t start = 0;
  std::uint64_t end = shard_size_;
  for (std::uint64_t i = 0; i < count; ++i) {
    ranges.push_back(ByteRange{start, end});
    start = end;
    end += shard_size_;
  }

  return ranges;
}

} // namespace shard
} // namespace upstream
