#ifndef TRK_HEADER_H
#define TRK_HEADER_H

#include <Eigen/Core>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <trk/trk_export.h>

namespace trk {

/// Size in bytes of a TrackVis header; streamline data starts right after it.
constexpr uint32_t kTrkHeaderSize = 1000;

/// Per-point and per-streamline float layout of the stored records.
struct PointSchema {
  uint32_t scalars_per_point = 0;
  uint32_t properties_per_streamline = 0;

  /// Floats stored per point: xyz followed by the scalars.
  uint32_t point_width() const { return 3 + scalars_per_point; }
  /// Floats stored once per streamline, after its last point.
  uint32_t property_width() const { return properties_per_streamline; }
  /// Bytes taken by one record: the int32 length, the points and the properties.
  uint64_t record_bytes(uint32_t length) const {
    return 4 + static_cast<uint64_t>(length) * point_width() * 4 + static_cast<uint64_t>(property_width()) * 4;
  }
};

/**
 * @brief Decoded TrackVis header.
 *
 * `affine` maps the stored voxmm coordinates to RAS+ millimeters, following
 * nibabel's get_affine_trackvis_to_rasmm. `voxel_to_rasmm` is the raw
 * vox_to_ras matrix of the file (identity when the file does not set it).
 */
struct FileHeader {
  uint32_t header_size_bytes = kTrkHeaderSize;
  uint64_t streamline_count = 0;
  bool streamline_count_stored = true;
  uint32_t scalars_per_point = 0;
  uint32_t properties_per_streamline = 0;
  Eigen::Matrix4f affine = Eigen::Matrix4f::Identity();

  int32_t version = 2;
  std::array<int16_t, 3> dimensions{{0, 0, 0}};
  std::array<float, 3> voxel_sizes{{1.0f, 1.0f, 1.0f}};
  std::array<float, 3> origin{{0.0f, 0.0f, 0.0f}};
  Eigen::Matrix4f voxel_to_rasmm = Eigen::Matrix4f::Identity();
  std::string voxel_order = "LPS";
  std::vector<std::string> scalar_names;
  std::vector<std::string> property_names;

  bool byte_swapped = false;
  uint64_t file_size_bytes = 0;

  PointSchema schema() const { return PointSchema{scalars_per_point, properties_per_streamline}; }

  uint64_t payload_bytes() const {
    return file_size_bytes > header_size_bytes ? file_size_bytes - header_size_bytes : 0;
  }
};

/**
 * @brief Read and validate the TrackVis header of `path`.
 *
 * Detects byte-swapped files from hdr_size, accepts versions 1 and 2 and
 * derives the voxmm -> RAS+mm affine. Throws TrkIOError when the file cannot
 * be opened and TrkFormatError when the header is not a valid TrackVis header.
 */
TRK_EXPORT FileHeader read_header(const std::string &path);

/// Decode a header from the first kTrkHeaderSize bytes of `bytes`.
TRK_EXPORT FileHeader parse_header(const char *bytes, uint64_t file_size_bytes);

/// Throws TrkFormatError unless the header fits inside the file.
TRK_EXPORT void check_header_fits(const FileHeader &header);

} // namespace trk

#endif // TRK_HEADER_H
