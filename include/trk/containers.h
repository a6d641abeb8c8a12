#ifndef TRK_CONTAINERS_H
#define TRK_CONTAINERS_H

#include <Eigen/Core>

#include <cstdint>
#include <vector>

#include <trk/detail/exceptions.h>
#include <trk/extract.h>

namespace trk {

/// All points of a streamline list in one N x 3 block, with per-streamline lengths and start rows.
struct ArraySequence {
  Eigen::Matrix<float, Eigen::Dynamic, 3, Eigen::RowMajor> points;
  std::vector<uint32_t> lengths;
  std::vector<uint64_t> offsets;

  std::size_t size() const { return lengths.size(); }
};

inline ArraySequence to_array_sequence(const std::vector<Streamline> &streamlines) {
  ArraySequence seq;
  seq.lengths.reserve(streamlines.size());
  seq.offsets.reserve(streamlines.size());

  uint64_t total = 0;
  for (const auto &s : streamlines) {
    seq.offsets.push_back(total);
    seq.lengths.push_back(static_cast<uint32_t>(s.rows()));
    total += static_cast<uint64_t>(s.rows());
  }

  seq.points.resize(static_cast<Eigen::Index>(total), 3);
  for (std::size_t i = 0; i < streamlines.size(); ++i) {
    if (seq.lengths[i] > 0) {
      seq.points.middleRows(static_cast<Eigen::Index>(seq.offsets[i]), seq.lengths[i]) = streamlines[i];
    }
  }
  return seq;
}

inline std::vector<Streamline> split_array_sequence(const ArraySequence &seq) {
  if (seq.offsets.size() != seq.lengths.size()) {
    throw TrkArgumentError("ArraySequence offsets and lengths differ in size");
  }
  std::vector<Streamline> streamlines;
  streamlines.reserve(seq.size());
  for (std::size_t i = 0; i < seq.size(); ++i) {
    if (seq.offsets[i] + seq.lengths[i] > static_cast<uint64_t>(seq.points.rows())) {
      throw TrkArgumentError("ArraySequence streamline " + std::to_string(i) + " exceeds the point block");
    }
    streamlines.emplace_back(seq.points.middleRows(static_cast<Eigen::Index>(seq.offsets[i]), seq.lengths[i]));
  }
  return streamlines;
}

} // namespace trk

#endif // TRK_CONTAINERS_H
