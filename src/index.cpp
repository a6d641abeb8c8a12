#include <trk/index.h>

#include <trk/detail/byte_order.h>
#include <trk/detail/exceptions.h>
#include <trk/detail/thread_join.h>

#include <algorithm>
#include <chrono>
#include <exception>

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

namespace trk {
namespace {

// Below this many words per worker the thread start-up dominates the scan.
constexpr std::size_t kMinWordsPerThread = 1 << 20;

double elapsed_seconds(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

void verify_chain(const std::vector<IndexEntry> &entries, const FileHeader &header, uint64_t source_size) {
  const PointSchema schema = header.schema();
  uint64_t expected = header.header_size_bytes;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (entries[i].byte_offset != expected) {
      throw TrkHeuristicMismatch("Heuristic candidates do not chain at offset " + std::to_string(expected),
                                 header.streamline_count,
                                 i);
    }
    expected += schema.record_bytes(entries[i].length);
  }
  if (expected > source_size) {
    throw TrkHeuristicMismatch("Heuristic candidates extend past the end of the file",
                               header.streamline_count,
                               entries.size());
  }
}

} // namespace

std::vector<uint32_t> StreamlineIndex::lengths() const {
  std::vector<uint32_t> out;
  out.reserve(entries_.size());
  for (const auto &entry : entries_) {
    out.push_back(entry.length);
  }
  return out;
}

uint64_t StreamlineIndex::total_points() const {
  uint64_t total = 0;
  for (const auto &entry : entries_) {
    total += entry.length;
  }
  return total;
}

namespace detail {

void scan_length_candidates(const char *words,
                            std::size_t nb_words,
                            uint32_t threshold,
                            uint64_t base_offset,
                            std::vector<IndexEntry> &out) {
  for (std::size_t i = 0; i < nb_words; ++i) {
    const uint32_t w = load_u32(words + i * 4);
    // zero is both int32(0) and float32(0.0f), never a valid length
    if (w > 0 && w < threshold) {
      out.push_back(IndexEntry{w, base_offset + static_cast<uint64_t>(i) * 4});
    }
  }
}

std::vector<IndexEntry> scan_length_candidates_parallel(const char *words,
                                                        std::size_t nb_words,
                                                        uint32_t threshold,
                                                        uint64_t base_offset,
                                                        unsigned int num_threads) {
  const std::size_t max_workers = std::max<std::size_t>(1, nb_words / kMinWordsPerThread);
  const std::size_t workers = std::min<std::size_t>(std::max(1u, num_threads), max_workers);

  std::vector<IndexEntry> out;
  if (workers == 1) {
    scan_length_candidates(words, nb_words, threshold, base_offset, out);
    return out;
  }

  const std::size_t per_worker = (nb_words + workers - 1) / workers;
  std::vector<std::vector<IndexEntry>> parts(workers);
  std::vector<std::exception_ptr> errors(workers);
  detail::ThreadJoiner threads(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    const std::size_t begin = std::min(nb_words, w * per_worker);
    const std::size_t end = std::min(nb_words, begin + per_worker);
    threads.spawn([&, w, begin, end]() {
      try {
        scan_length_candidates(words + begin * 4, end - begin, threshold, base_offset + begin * 4, parts[w]);
      } catch (...) {
        errors[w] = std::current_exception();
      }
    });
  }
  threads.join();
  for (const auto &err : errors) {
    if (err) {
      std::rethrow_exception(err);
    }
  }

  std::size_t total = 0;
  for (const auto &part : parts) {
    total += part.size();
  }
  out.reserve(total);
  for (const auto &part : parts) {
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

} // namespace detail

std::vector<IndexEntry> build_index_sequential(StreamlineSource &source, const FileHeader &header) {
  check_header_fits(header);
  const PointSchema schema = header.schema();
  const uint64_t end = source.size();
  const bool count_stored = header.streamline_count_stored;
  const uint64_t expected = header.streamline_count;
  const char *resident = source.data();

  std::vector<IndexEntry> entries;
  if (count_stored) {
    entries.reserve(static_cast<size_t>(expected));
  }

  uint64_t offset = header.header_size_bytes;
  while (count_stored ? entries.size() < expected : offset < end) {
    if (end - offset < 4) {
      throw TrkTruncatedStreamError("TRK data ended before the length of streamline " +
                                        std::to_string(entries.size()),
                                    offset,
                                    count_stored ? expected : entries.size() + 1,
                                    entries.size());
    }

    int32_t length = 0;
    if (resident != nullptr) {
      length = detail::load_i32(resident + offset, header.byte_swapped);
    } else {
      char buf[4];
      source.read(offset, buf, sizeof(buf));
      length = detail::load_i32(buf, header.byte_swapped);
    }
    if (length < 0) {
      throw TrkTruncatedStreamError("Negative length for streamline " + std::to_string(entries.size()),
                                    offset,
                                    count_stored ? expected : entries.size() + 1,
                                    entries.size());
    }

    const uint64_t record = schema.record_bytes(static_cast<uint32_t>(length));
    if (record > end - offset) {
      throw TrkTruncatedStreamError("TRK data ended inside streamline " + std::to_string(entries.size()),
                                    offset,
                                    count_stored ? expected : entries.size() + 1,
                                    entries.size());
    }
    entries.push_back(IndexEntry{static_cast<uint32_t>(length), offset});
    offset += record;
  }

  if (offset < end) {
    spdlog::debug("{} trailing bytes after the last streamline", end - offset);
  }
  return entries;
}

std::vector<IndexEntry>
build_index_heuristic(StreamlineSource &source, const FileHeader &header, const IndexOptions &options) {
  check_header_fits(header);
  if (options.length_threshold == 0) {
    throw TrkArgumentError("Heuristic length threshold must be positive");
  }
  if (header.byte_swapped) {
    throw TrkHeuristicMismatch("Heuristic length scan does not apply to byte-swapped files", header.streamline_count, 0);
  }
  if (!header.streamline_count_stored) {
    throw TrkHeuristicMismatch("Heuristic length scan needs the streamline count from the header", 0, 0);
  }

  const uint64_t expected = header.streamline_count;
  const uint64_t begin = header.header_size_bytes;
  const uint64_t source_size = source.size();
  const uint64_t nb_words = (source_size - std::min(source_size, begin)) / 4;

  std::vector<IndexEntry> entries;
  const char *resident = source.data();
  if (resident != nullptr) {
    entries = detail::scan_length_candidates_parallel(
        resident + begin, static_cast<size_t>(nb_words), options.length_threshold, begin, options.num_threads);
  } else {
    const uint64_t chunk_words = std::max<uint64_t>(1, options.scan_chunk_bytes / 4);
    std::vector<char> buffer(static_cast<size_t>(std::min(chunk_words, std::max<uint64_t>(nb_words, 1)) * 4));
    for (uint64_t w = 0; w < nb_words; w += chunk_words) {
      const uint64_t n = std::min(chunk_words, nb_words - w);
      const uint64_t chunk_offset = begin + w * 4;
      source.read(chunk_offset, buffer.data(), static_cast<size_t>(n * 4));
      auto part = detail::scan_length_candidates_parallel(
          buffer.data(), static_cast<size_t>(n), options.length_threshold, chunk_offset, options.num_threads);
      entries.insert(entries.end(), part.begin(), part.end());
      if (entries.size() > expected) {
        break;
      }
    }
  }

  if (entries.size() != expected) {
    throw TrkHeuristicMismatch("Heuristic length scan found " + std::to_string(entries.size()) +
                                   " candidate length fields",
                               expected,
                               entries.size());
  }
  if (options.verify_layout) {
    verify_chain(entries, header, source_size);
  }
  return entries;
}

StreamlineIndex build_index(StreamlineSource &source, const FileHeader &header, const IndexOptions &options) {
  const auto t0 = std::chrono::steady_clock::now();
  const PointSchema schema = header.schema();

  IndexStrategy strategy = options.strategy;
  if (strategy == IndexStrategy::Auto) {
    strategy = header.payload_bytes() >= options.auto_heuristic_min_bytes ? IndexStrategy::HeuristicWithFallback
                                                                           : IndexStrategy::Sequential;
    spdlog::debug("Auto index strategy picked {} for a {} byte payload",
                  index_strategy_name(strategy),
                  header.payload_bytes());
  }
  if (strategy == IndexStrategy::HeuristicWithFallback &&
      (header.byte_swapped || !header.streamline_count_stored)) {
    spdlog::debug("Heuristic length scan not applicable to this file, using the sequential strategy");
    strategy = IndexStrategy::Sequential;
  }

  StreamlineIndex index;
  switch (strategy) {
  case IndexStrategy::Heuristic:
    index = StreamlineIndex(build_index_heuristic(source, header, options), schema, IndexStrategy::Heuristic);
    break;
  case IndexStrategy::HeuristicWithFallback:
    try {
      index = StreamlineIndex(build_index_heuristic(source, header, options), schema, IndexStrategy::Heuristic);
    } catch (const TrkHeuristicMismatch &e) {
      spdlog::warn("{}. Using the sequential fallback.", e.what());
      index = StreamlineIndex(build_index_sequential(source, header), schema, IndexStrategy::Sequential);
    }
    break;
  case IndexStrategy::Sequential:
  default:
    index = StreamlineIndex(build_index_sequential(source, header), schema, IndexStrategy::Sequential);
    break;
  }

  spdlog::debug("Indexed {} streamlines ({}) in {} sec.",
                index.size(),
                index_strategy_name(index.strategy()),
                elapsed_seconds(t0));
  return index;
}

std::string index_strategy_name(IndexStrategy strategy) {
  switch (strategy) {
  case IndexStrategy::Sequential:
    return "sequential";
  case IndexStrategy::Heuristic:
    return "heuristic";
  case IndexStrategy::HeuristicWithFallback:
    return "fallback";
  case IndexStrategy::Auto:
  default:
    return "auto";
  }
}

IndexStrategy parse_index_strategy(const std::string &name) {
  if (name == "sequential") {
    return IndexStrategy::Sequential;
  }
  if (name == "heuristic") {
    return IndexStrategy::Heuristic;
  }
  if (name == "fallback") {
    return IndexStrategy::HeuristicWithFallback;
  }
  if (name == "auto") {
    return IndexStrategy::Auto;
  }
  throw TrkArgumentError("Unknown index strategy: " + name);
}

} // namespace trk
