#ifndef UPSTREAM_SHARD_SHARD_PLANNER_HPP
#define UPSTREAM_SHARD_SHARD_PLANNER_HPP

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace upstream {
namespace shard {

class InvalidShardSize : public std::invalid_argument {
public:
  InvalidShardSize() : std::invalid_argument("Shard size must be greater than zero") {}
};

// Half-open byte range [start, end) of the source file.
// The last range of a plan may extend past end-of-file.
struct ByteRange {
  std::uint64_t start = 0;
  std::uint64_t end = 0;

  std::uint64_t nominal_length() const { return end - start; }
  // Bytes actually present in a file of file_size bytes
  std::uint64_t clamped_length(std::uint64_t file_size) const;

  bool operator==(const ByteRange& other) const {
    return start == other.start && end == other.end;
  }
};

class ShardPlanner {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ShardPlanner(std::uint64_t shard_size);


  // ---- PLANNING ----
  // Number of shards needed for file_size bytes: ceil(file_size / shard_size)
  std::uint64_t shard_count(std::uint64_t file_size) const;
  // Ordered ranges covering [0, file_size); index order is reassembly order
  std::vector<ByteRange> plan(std::uint64_t file_size) const;


  // ---- GETTERS ----
  std::uint64_t shard_size() const { return shard_size_; }

private:
  // ---- PARAMETERS ----
  std::uint64_t shard_size_;
};

} // namespace shard
} // namespace upstream

#endif // UPSTREAM_SHARD_SHARD_PLANNER_HPP
