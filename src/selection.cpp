#include <trk/selection.h>

#include <cstddef>
#include <numeric>
#include <random>
#include <utility>

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

namespace trk {
namespace {

std::vector<uint64_t> sample_ids(const StreamlineSelection &selection, uint64_t streamline_count) {
  std::vector<uint64_t> ids;
  if (selection.sample_count == 0) {
    return ids;
  }
  if (streamline_count == 0) {
    spdlog::warn("Cannot sample {} streamlines from an empty file", selection.sample_count);
    return ids;
  }

  std::mt19937_64 rng(selection.seed != 0 ? selection.seed : std::random_device{}());
  spdlog::debug("Sampling {} streamlines uniformly at random", selection.sample_count);

  bool with_replacement = selection.with_replacement;
  if (!with_replacement && selection.sample_count > streamline_count) {
    spdlog::warn("Requested {} streamlines out of {} without replacement, sampling with replacement",
                 selection.sample_count,
                 streamline_count);
    with_replacement = true;
  }

  ids.reserve(static_cast<size_t>(selection.sample_count));
  if (with_replacement) {
    std::uniform_int_distribution<uint64_t> dist(0, streamline_count - 1);
    for (uint64_t i = 0; i < selection.sample_count; ++i) {
      ids.push_back(dist(rng));
    }
    return ids;
  }

  // partial Fisher-Yates: the first sample_count slots end up a random draw in random order
  std::vector<uint64_t> pool(static_cast<size_t>(streamline_count));
  std::iota(pool.begin(), pool.end(), uint64_t(0));
  for (uint64_t i = 0; i < selection.sample_count; ++i) {
    std::uniform_int_distribution<uint64_t> dist(i, streamline_count - 1);
    std::swap(pool[static_cast<size_t>(i)], pool[static_cast<size_t>(dist(rng))]);
  }
  ids.assign(pool.begin(), pool.begin() + static_cast<std::ptrdiff_t>(selection.sample_count));
  return ids;
}

} // namespace

std::vector<uint64_t> resolve_selection(const StreamlineSelection &selection, uint64_t streamline_count) {
  switch (selection.kind) {
  case StreamlineSelection::Kind::Explicit:
    return selection.ids;
  case StreamlineSelection::Kind::Sample:
    return sample_ids(selection, streamline_count);
  case StreamlineSelection::Kind::All:
  default: {
    std::vector<uint64_t> ids(static_cast<size_t>(streamline_count));
    std::iota(ids.begin(), ids.end(), uint64_t(0));
    return ids;
  }
  }
}

} // namespace trk
