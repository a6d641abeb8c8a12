#include <trk/extract.h>

#include <trk/affine.h>
#include <trk/detail/byte_order.h>
#include <trk/detail/exceptions.h>
#include <trk/detail/thread_join.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <exception>

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

namespace trk {
namespace {

using PointBlock = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Below this many streamlines per worker, threads are not worth starting.
constexpr std::size_t kMinIdsPerThread = 4096;

// Reshapes length * point_width raw floats into an N x 3 streamline, dropping scalar columns.
template <typename ReadFn>
Streamline read_points(const IndexEntry &entry, const PointSchema &schema, bool swapped, ReadFn &&read_fn) {
  const uint32_t width = schema.point_width();
  const std::size_t nb_floats = static_cast<std::size_t>(entry.length) * width;

  Streamline s(entry.length, 3);
  if (entry.length == 0) {
    return s;
  }
  if (width == 3) {
    read_fn(s.data(), nb_floats * sizeof(float));
    if (swapped) {
      detail::swap_words(s.data(), nb_floats);
    }
    return s;
  }

  PointBlock block(entry.length, width);
  read_fn(block.data(), nb_floats * sizeof(float));
  if (swapped) {
    detail::swap_words(block.data(), nb_floats);
  }
  s = block.leftCols(3);
  return s;
}

void extract_range_resident(const char *data,
                            uint64_t data_size,
                            const FileHeader &header,
                            const StreamlineIndex &index,
                            const std::vector<uint64_t> &ids,
                            std::size_t begin,
                            std::size_t end,
                            const AffineParts *affine,
                            std::vector<Streamline> &out) {
  for (std::size_t i = begin; i < end; ++i) {
    const uint64_t id = ids[i];
    const IndexEntry &entry = index[static_cast<std::size_t>(id)];
    const uint64_t offset = index.data_offset(static_cast<std::size_t>(id));
    out[i] = read_points(entry, index.schema(), header.byte_swapped, [&](void *dst, std::size_t nbytes) {
      if (offset > data_size || nbytes > data_size - offset) {
        throw TrkTruncatedStreamError("Streamline " + std::to_string(id) + " extends past the end of the data",
                                      offset,
                                      nbytes,
                                      offset > data_size ? 0 : data_size - offset);
      }
      if (nbytes > 0) {
        std::memcpy(dst, data + offset, nbytes);
      }
    });
    if (affine != nullptr) {
      apply_affine(*affine, out[i]);
    }
  }
}

} // namespace

void check_ids(const std::vector<uint64_t> &ids, uint64_t count) {
  for (const uint64_t id : ids) {
    if (id >= count) {
      throw TrkIndexOutOfRange(id, count);
    }
  }
}

std::vector<Streamline> extract(StreamlineSource &source,
                                const FileHeader &header,
                                const StreamlineIndex &index,
                                const std::vector<uint64_t> &ids,
                                const ExtractOptions &options) {
  check_ids(ids, index.size());

  const auto t0 = std::chrono::steady_clock::now();
  // R and t are taken out of the affine once for the whole batch.
  const AffineParts parts = split_affine(header.affine);
  const AffineParts *affine = options.apply_affine ? &parts : nullptr;

  std::vector<Streamline> streamlines(ids.size());
  const char *resident = source.data();

  if (resident == nullptr) {
    for (std::size_t i = 0; i < ids.size(); ++i) {
      const std::size_t id = static_cast<std::size_t>(ids[i]);
      const uint64_t offset = index.data_offset(id);
      streamlines[i] = read_points(index[id], index.schema(), header.byte_swapped, [&](void *dst, std::size_t nbytes) {
        source.read(offset, dst, nbytes);
      });
      if (affine != nullptr) {
        apply_affine(*affine, streamlines[i]);
      }
    }
  } else {
    const std::size_t max_workers = std::max<std::size_t>(1, ids.size() / kMinIdsPerThread);
    const std::size_t workers = std::min<std::size_t>(std::max(1u, options.num_threads), max_workers);
    const uint64_t data_size = source.size();

    if (workers == 1) {
      extract_range_resident(resident, data_size, header, index, ids, 0, ids.size(), affine, streamlines);
    } else {
      // each worker fills a disjoint range of output slots
      const std::size_t per_worker = (ids.size() + workers - 1) / workers;
      std::vector<std::exception_ptr> errors(workers);
      detail::ThreadJoiner threads(workers);
      for (std::size_t w = 0; w < workers; ++w) {
        const std::size_t begin = std::min(ids.size(), w * per_worker);
        const std::size_t end = std::min(ids.size(), begin + per_worker);
        threads.spawn([&, w, begin, end]() {
          try {
            extract_range_resident(resident, data_size, header, index, ids, begin, end, affine, streamlines);
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
    }
  }

  spdlog::debug("Extracted {} streamlines from {} source{} in {} sec.",
                streamlines.size(),
                source.name(),
                options.apply_affine ? " and applied the affine" : "",
                std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count());
  return streamlines;
}

} // namespace trk
