#include <trk/affine.h>
#include <trk/detail/exceptions.h>

#include <Eigen/LU>
#include <Eigen/SVD>
#include <cctype>
#include <cmath>
#include <limits>

namespace trk {
namespace {

const char kAxisLabels[3][2] = {{'L', 'R'}, {'P', 'A'}, {'I', 'S'}};

} // namespace

Orientation io_orientation(const Eigen::Matrix4d &affine) {
  const Eigen::Matrix3d rzs = affine.block<3, 3>(0, 0);
  const Eigen::Vector3d zooms = rzs.colwise().norm().transpose();
  for (int i = 0; i < 3; ++i) {
    if (zooms(i) == 0.0) {
      throw TrkFormatError("Affine has a zero column, cannot determine orientation");
    }
  }
  const Eigen::Matrix3d rs = rzs * zooms.cwiseInverse().asDiagonal();

  // Polar decomposition: closest shearless matrix to rs.
  Eigen::JacobiSVD<Eigen::Matrix3d> svd(rs, Eigen::ComputeFullU | Eigen::ComputeFullV);
  const Eigen::Vector3d s = svd.singularValues();
  const double tol = s.maxCoeff() * 3.0 * std::numeric_limits<double>::epsilon();
  if (s.minCoeff() <= tol) {
    throw TrkFormatError("Affine is rank deficient, cannot determine orientation");
  }
  Eigen::Matrix3d r = svd.matrixU() * svd.matrixV().transpose();

  Orientation ornt;
  for (int in_ax = 0; in_ax < 3; ++in_ax) {
    const Eigen::Vector3d col = r.col(in_ax);
    Eigen::Index out_ax = 0;
    const double max_abs = col.cwiseAbs().maxCoeff(&out_ax);
    if (max_abs < 1e-8) {
      throw TrkFormatError("Affine axes are not separable, cannot determine orientation");
    }
    ornt(in_ax, 0) = static_cast<int>(out_ax);
    ornt(in_ax, 1) = col(out_ax) < 0.0 ? -1 : 1;
    // remove the output axis from further consideration
    r.row(out_ax).setZero();
  }
  return ornt;
}

std::string orientation_to_axcodes(const Orientation &ornt) {
  std::string codes;
  for (int i = 0; i < 3; ++i) {
    const int axis = ornt(i, 0);
    codes.push_back(kAxisLabels[axis][ornt(i, 1) < 0 ? 0 : 1]);
  }
  return codes;
}

Orientation axcodes_to_orientation(const std::string &codes) {
  if (codes.size() != 3) {
    throw TrkFormatError("Voxel order must have 3 axis codes: '" + codes + "'");
  }
  Orientation ornt;
  bool used[3] = {false, false, false};
  for (int i = 0; i < 3; ++i) {
    const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(codes[i])));
    bool found = false;
    for (int axis = 0; axis < 3 && !found; ++axis) {
      for (int side = 0; side < 2; ++side) {
        if (kAxisLabels[axis][side] == c) {
          if (used[axis]) {
            throw TrkFormatError("Voxel order repeats an axis: '" + codes + "'");
          }
          used[axis] = true;
          ornt(i, 0) = axis;
          ornt(i, 1) = side == 0 ? -1 : 1;
          found = true;
          break;
        }
      }
    }
    if (!found) {
      throw TrkFormatError("Unknown axis code in voxel order: '" + codes + "'");
    }
  }
  return ornt;
}

Orientation orientation_transform(const Orientation &start, const Orientation &end) {
  Orientation result = Orientation::Constant(-2);
  for (int end_in = 0; end_in < 3; ++end_in) {
    for (int start_in = 0; start_in < 3; ++start_in) {
      if (end(end_in, 0) == start(start_in, 0)) {
        result(start_in, 0) = end_in;
        result(start_in, 1) = start(start_in, 1) == end(end_in, 1) ? 1 : -1;
        break;
      }
    }
  }
  if ((result.col(0).array() < 0).any()) {
    throw TrkFormatError("Orientations do not share the same axes");
  }
  return result;
}

Eigen::Matrix4d inverse_orientation_affine(const Orientation &ornt, const std::array<int16_t, 3> &shape) {
  Eigen::Matrix4d undo_flip = Eigen::Matrix4d::Identity();
  for (int i = 0; i < 3; ++i) {
    const double flip = static_cast<double>(ornt(i, 1));
    const double center_trans = -(static_cast<double>(shape[i]) - 1.0) / 2.0;
    undo_flip(i, i) = flip;
    undo_flip(i, 3) = flip * center_trans - center_trans;
  }

  Eigen::Matrix4d undo_reorder = Eigen::Matrix4d::Zero();
  for (int i = 0; i < 3; ++i) {
    undo_reorder(i, ornt(i, 0)) = 1.0;
  }
  undo_reorder(3, 3) = 1.0;

  return undo_flip * undo_reorder;
}

Eigen::Matrix4f trackvis_to_rasmm(const Eigen::Matrix4f &voxel_to_rasmm,
                                  const std::array<float, 3> &voxel_sizes,
                                  const std::array<int16_t, 3> &dimensions,
                                  const std::string &voxel_order) {
  // voxmm -> voxel
  Eigen::Matrix4d scale = Eigen::Matrix4d::Identity();
  for (int i = 0; i < 3; ++i) {
    if (voxel_sizes[i] == 0.0f) {
      throw TrkFormatError("Voxel sizes must be non-zero");
    }
    scale(i, i) = 1.0 / static_cast<double>(voxel_sizes[i]);
  }

  // TrackVis puts (0,0,0) on the voxel corner, RAS+mm on the voxel center.
  Eigen::Matrix4d offset = Eigen::Matrix4d::Identity();
  offset.block<3, 1>(0, 3).setConstant(-0.5);

  Eigen::Matrix4d affine = offset * scale;

  // voxel (header order) -> voxel (affine order)
  const Eigen::Matrix4d vox_to_ras = voxel_to_rasmm.cast<double>();
  const Orientation affine_ornt = io_orientation(vox_to_ras);
  const Orientation header_ornt = axcodes_to_orientation(voxel_order);
  const Orientation ornt = orientation_transform(header_ornt, affine_ornt);
  affine = inverse_orientation_affine(ornt, dimensions) * affine;

  // voxel -> rasmm
  return (vox_to_ras * affine).cast<float>();
}

} // namespace trk
