#ifndef TRK_AFFINE_H
#define TRK_AFFINE_H

#include <Eigen/Core>

#include <array>
#include <cstdint>
#include <string>

#include <trk/trk_export.h>

namespace trk {

/// Per input axis: (output axis, flip) with flip in {-1, +1}.
using Orientation = Eigen::Matrix<int, 3, 2>;

/**
 * @brief Axis orientation of a 4x4 voxel-to-world affine.
 *
 * Implementation notes:
 * - Follows nibabel's io_orientation: the rotation/zoom/shear block is
 *   normalised by its column norms, the closest orthogonal matrix is taken
 *   from an SVD, and output axes are then picked greedily by largest
 *   absolute component.
 * - Throws TrkFormatError when a column of the affine is zero.
 * - A rank deficient block (a singular value below 3 * eps * the largest)
 *   throws TrkFormatError, where nibabel drops those singular values and
 *   leaves the matching axes unassigned.
 */
TRK_EXPORT Orientation io_orientation(const Eigen::Matrix4d &affine);

/// Axis codes such as "RAS" or "LPS" for an orientation.
TRK_EXPORT std::string orientation_to_axcodes(const Orientation &ornt);

/// Orientation for axis codes such as "LPS". Throws TrkFormatError on unknown or repeated codes.
TRK_EXPORT Orientation axcodes_to_orientation(const std::string &codes);

/// Orientation taking axes in `start` to axes in `end`.
TRK_EXPORT Orientation orientation_transform(const Orientation &start, const Orientation &end);

/// Affine undoing the flips and axis permutation of `ornt` for an array of the given shape.
TRK_EXPORT Eigen::Matrix4d inverse_orientation_affine(const Orientation &ornt, const std::array<int16_t, 3> &shape);

/**
 * @brief TrackVis voxmm -> RAS+mm affine.
 *
 * Scales by 1/voxel_size, shifts by half a voxel (TrackVis puts the origin on
 * the voxel corner), reorients from `voxel_order` to the orientation of
 * `voxel_to_rasmm` and finally applies `voxel_to_rasmm`.
 */
TRK_EXPORT Eigen::Matrix4f trackvis_to_rasmm(const Eigen::Matrix4f &voxel_to_rasmm,
                                             const std::array<float, 3> &voxel_sizes,
                                             const std::array<int16_t, 3> &dimensions,
                                             const std::string &voxel_order);

/// Rotation/zoom/shear block and translation column of a 4x4 affine.
struct AffineParts {
  Eigen::Matrix3f rotation = Eigen::Matrix3f::Identity();
  Eigen::Vector3f translation = Eigen::Vector3f::Zero();
};

inline AffineParts split_affine(const Eigen::Matrix4f &affine) {
  AffineParts parts;
  parts.rotation = affine.block<3, 3>(0, 0);
  parts.translation = affine.block<3, 1>(0, 3);
  return parts;
}

/// Applies p' = R p + t to every row of an N x 3 point matrix, in place.
template <typename Derived> void apply_affine(const AffineParts &parts, Eigen::MatrixBase<Derived> &points) {
  if (points.rows() == 0) {
    return;
  }
  points = (points * parts.rotation.transpose()).rowwise() + parts.translation.transpose();
}

} // namespace trk

#endif // TRK_AFFINE_H
