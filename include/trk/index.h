#ifndef TRK_INDEX_H
#define TRK_INDEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <trk/header.h>
#include <trk/source.h>
#include <trk/trk_export.h>

namespace trk {

/**
 * Default upper bound (exclusive) for a 32-bit word to be taken as a length
 * field by the heuristic scan. Any float32 of magnitude above ~1.4e-40 reads
 * as an unsigned integer far larger than this, while real point counts stay
 * well below it. Files whose coordinates or scalars reinterpret below the
 * bound (zeros excepted) force the sequential fallback.
 */
constexpr uint32_t kDefaultLengthThreshold = 100000;

enum class IndexStrategy {
  Sequential,            ///< exact walk over the length fields
  Heuristic,             ///< bulk scan; a mismatch throws TrkHeuristicMismatch
  HeuristicWithFallback, ///< bulk scan, sequential walk on mismatch
  Auto                   ///< HeuristicWithFallback for large payloads, Sequential otherwise
};

struct IndexOptions {
  IndexStrategy strategy = IndexStrategy::Auto;
  uint32_t length_threshold = kDefaultLengthThreshold;
  // Also require accepted candidates to chain record by record up to the end of the payload.
  bool verify_layout = true;
  unsigned int num_threads = 1;
  std::size_t scan_chunk_bytes = 256 * 1024 * 1024;
  uint64_t auto_heuristic_min_bytes = 64ULL * 1024ULL * 1024ULL;
};

/// One streamline record: its point count and the absolute offset of its int32 length field.
struct IndexEntry {
  uint32_t length = 0;
  uint64_t byte_offset = 0;

  bool operator==(const IndexEntry &other) const {
    return length == other.length && byte_offset == other.byte_offset;
  }
  bool operator!=(const IndexEntry &other) const { return !(*this == other); }
};

/// Position of every streamline in a TRK file, keyed by streamline id.
class TRK_EXPORT StreamlineIndex {
public:
  StreamlineIndex() = default;
  StreamlineIndex(std::vector<IndexEntry> entries, PointSchema schema, IndexStrategy strategy)
      : entries_(std::move(entries)), schema_(schema), strategy_(strategy) {}

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const IndexEntry &operator[](std::size_t id) const { return entries_[id]; }
  const std::vector<IndexEntry> &entries() const { return entries_; }
  const PointSchema &schema() const { return schema_; }

  /// Strategy that actually produced the entries (Sequential or Heuristic).
  IndexStrategy strategy() const { return strategy_; }

  /// Absolute offset of the first coordinate of streamline `id`.
  uint64_t data_offset(std::size_t id) const { return entries_[id].byte_offset + 4; }

  std::vector<uint32_t> lengths() const;
  uint64_t total_points() const;

private:
  std::vector<IndexEntry> entries_;
  PointSchema schema_;
  IndexStrategy strategy_ = IndexStrategy::Sequential;
};

/**
 * @brief Exact index by walking the length fields from the end of the header.
 *
 * Reads header.streamline_count records, or every record up to the end of the
 * data when the header does not store the count. Throws
 * TrkTruncatedStreamError when the data ends early or a length is negative.
 */
TRK_EXPORT std::vector<IndexEntry> build_index_sequential(StreamlineSource &source, const FileHeader &header);

/**
 * @brief Index from a bulk scan for words in (0, threshold).
 *
 * Throws TrkHeuristicMismatch when the candidates do not account for exactly
 * header.streamline_count records (or do not chain, with verify_layout), and
 * when the heuristic cannot apply to the file (byte-swapped or count not stored).
 */
TRK_EXPORT std::vector<IndexEntry>
build_index_heuristic(StreamlineSource &source, const FileHeader &header, const IndexOptions &options = {});

/// Builds the index with the strategy requested in `options`.
TRK_EXPORT StreamlineIndex build_index(StreamlineSource &source,
                                       const FileHeader &header,
                                       const IndexOptions &options = {});

TRK_EXPORT std::string index_strategy_name(IndexStrategy strategy);
/// Parses "sequential", "heuristic", "fallback" or "auto". Throws TrkArgumentError otherwise.
TRK_EXPORT IndexStrategy parse_index_strategy(const std::string &name);

namespace detail {

/**
 * Appends one entry per little-endian word of `words` with a value in
 * (0, threshold). `base_offset` is the absolute file offset of `words[0]`.
 */
TRK_EXPORT void scan_length_candidates(const char *words,
                                       std::size_t nb_words,
                                       uint32_t threshold,
                                       uint64_t base_offset,
                                       std::vector<IndexEntry> &out);

/// Same as scan_length_candidates, split by word range over `num_threads` workers. File order is kept.
TRK_EXPORT std::vector<IndexEntry> scan_length_candidates_parallel(const char *words,
                                                                   std::size_t nb_words,
                                                                   uint32_t threshold,
                                                                   uint64_t base_offset,
                                                                   unsigned int num_threads);

} // namespace detail

} // namespace trk

#endif // TRK_INDEX_H
