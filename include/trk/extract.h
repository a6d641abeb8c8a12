#ifndef TRK_EXTRACT_H
#define TRK_EXTRACT_H

#include <Eigen/Core>

#include <cstdint>
#include <vector>

#include <trk/header.h>
#include <trk/index.h>
#include <trk/source.h>
#include <trk/trk_export.h>

namespace trk {

/// Points of one streamline, one row per point.
using Streamline = Eigen::Matrix<float, Eigen::Dynamic, 3, Eigen::RowMajor>;

struct ExtractOptions {
  bool apply_affine = true;
  // Worker threads for memory-resident sources; stream sources always use the calling thread.
  unsigned int num_threads = 1;
};

/**
 * @brief Materialize the requested streamlines, in request order.
 *
 * Every id is range checked before the first read (TrkIndexOutOfRange).
 * Each streamline costs one read (or one slice of a resident source): its
 * length * point_width floats starting right after its length field. Scalar
 * columns are dropped and, with apply_affine, points are mapped through
 * header.affine.
 */
TRK_EXPORT std::vector<Streamline> extract(StreamlineSource &source,
                                           const FileHeader &header,
                                           const StreamlineIndex &index,
                                           const std::vector<uint64_t> &ids,
                                           const ExtractOptions &options = {});

/// Throws TrkIndexOutOfRange for the first id not below `count`.
TRK_EXPORT void check_ids(const std::vector<uint64_t> &ids, uint64_t count);

} // namespace trk

#endif // TRK_EXTRACT_H
