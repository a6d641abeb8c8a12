#include <trk/trk.h>

#include <chrono>

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

namespace trk {
namespace {

double seconds_since(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

} // namespace

LoadResult load(const std::string &path, const LoadOptions &options) {
  spdlog::debug("Loading {}", path);
  auto t0 = std::chrono::steady_clock::now();

  LoadResult result;
  result.header = read_header(path);
  spdlog::debug("Read header in {} sec.", seconds_since(t0));

  auto source = open_source(path, options.source_mode);

  IndexOptions index_options = options.index;
  index_options.num_threads = options.num_threads;
  const StreamlineIndex index = build_index(*source, result.header, index_options);
  result.index_strategy = index.strategy();
  if (!result.header.streamline_count_stored) {
    result.header.streamline_count = index.size();
  }

  result.ids = resolve_selection(options.selection, index.size());

  ExtractOptions extract_options;
  extract_options.apply_affine = options.apply_affine;
  extract_options.num_threads = options.num_threads;
  result.streamlines = extract(*source, result.header, index, result.ids, extract_options);

  result.lengths.reserve(result.ids.size());
  for (const uint64_t id : result.ids) {
    result.lengths.push_back(index[static_cast<std::size_t>(id)].length);
  }

  spdlog::debug("Loaded {} of {} streamlines from {} in {} sec.",
                result.streamlines.size(),
                index.size(),
                path,
                seconds_since(t0));
  return result;
}

StreamlineIndex load_index(const std::string &path, const IndexOptions &options, SourceMode mode) {
  const FileHeader header = read_header(path);
  auto source = open_source(path, mode);
  return build_index(*source, header, options);
}

} // namespace trk
