#ifndef TRK_TESTS_TRK_TEST_UTILS_H
#define TRK_TESTS_TRK_TEST_UTILS_H

#include <Eigen/Core>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace trk_test {

namespace fs = std::filesystem;

using PointRows = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Layout of a synthetic TrackVis file. n_count < 0 stores the number of streamlines written.
struct TrkLayout {
  int16_t n_scalars = 0;
  int16_t n_properties = 0;
  int32_t n_count = -1;
  int32_t version = 2;
  std::array<int16_t, 3> dim{{10, 10, 10}};
  std::array<float, 3> voxel_size{{1.0f, 1.0f, 1.0f}};
  Eigen::Matrix4f vox_to_ras = Eigen::Matrix4f::Identity();
  std::string voxel_order = "RAS";
  std::string magic = "TRACK";
  // Raw 20-byte name slots; a slot may hold "name\0<count>".
  std::vector<std::string> scalar_name_slots;
  bool big_endian = false;
};

// vox_to_ras for which the voxmm -> RAS+mm affine of a RAS, 1mm file is exactly the identity.
inline Eigen::Matrix4f identity_rasmm_vox_to_ras() {
  Eigen::Matrix4f m = Eigen::Matrix4f::Identity();
  m.block<3, 1>(0, 3).setConstant(0.5f);
  return m;
}

class ByteWriter {
public:
  explicit ByteWriter(bool big_endian) : big_endian_(big_endian) {}

  void put_raw(std::vector<char> &out, size_t offset, const void *src, size_t n) const {
    if (out.size() < offset + n) {
      out.resize(offset + n, 0);
    }
    std::memcpy(out.data() + offset, src, n);
    if (big_endian_ && n > 1) {
      std::reverse(out.begin() + static_cast<std::ptrdiff_t>(offset),
                   out.begin() + static_cast<std::ptrdiff_t>(offset + n));
    }
  }

  void put_i16(std::vector<char> &out, size_t offset, int16_t v) const { put_raw(out, offset, &v, sizeof(v)); }
  void put_i32(std::vector<char> &out, size_t offset, int32_t v) const { put_raw(out, offset, &v, sizeof(v)); }
  void put_f32(std::vector<char> &out, size_t offset, float v) const { put_raw(out, offset, &v, sizeof(v)); }

private:
  bool big_endian_;
};

inline std::vector<char> make_header_bytes(const TrkLayout &layout, int32_t n_count) {
  std::vector<char> out(1000, 0);
  const ByteWriter w(layout.big_endian);
  std::memcpy(out.data(), layout.magic.data(), std::min<size_t>(layout.magic.size(), 6));
  for (int i = 0; i < 3; ++i) {
    w.put_i16(out, 6 + 2 * i, layout.dim[i]);
    w.put_f32(out, 12 + 4 * i, layout.voxel_size[i]);
  }
  w.put_i16(out, 36, layout.n_scalars);
  for (size_t i = 0; i < layout.scalar_name_slots.size() && i < 10; ++i) {
    const std::string &slot = layout.scalar_name_slots[i];
    std::memcpy(out.data() + 38 + 20 * i, slot.data(), std::min<size_t>(slot.size(), 20));
  }
  w.put_i16(out, 238, layout.n_properties);
  for (int i = 0; i < 4; ++i) {
    for (int j = 0; j < 4; ++j) {
      w.put_f32(out, 440 + 4 * (i * 4 + j), layout.vox_to_ras(i, j));
    }
  }
  std::memcpy(out.data() + 948, layout.voxel_order.data(), std::min<size_t>(layout.voxel_order.size(), 4));
  w.put_i32(out, 988, n_count);
  w.put_i32(out, 992, layout.version);
  w.put_i32(out, 996, 1000);
  return out;
}

// Serialises streamlines (rows = points, cols = 3 + n_scalars) and optional per-streamline properties.
inline std::vector<char> make_trk_bytes(const TrkLayout &layout,
                                        const std::vector<PointRows> &streamlines,
                                        const std::vector<std::vector<float>> &properties = {}) {
  const int32_t n_count = layout.n_count < 0 ? static_cast<int32_t>(streamlines.size()) : layout.n_count;
  std::vector<char> out = make_header_bytes(layout, n_count);
  const ByteWriter w(layout.big_endian);
  const Eigen::Index width = 3 + layout.n_scalars;

  for (size_t s = 0; s < streamlines.size(); ++s) {
    const PointRows &pts = streamlines[s];
    if (pts.cols() != width) {
      throw std::invalid_argument("Synthetic streamline has the wrong number of columns");
    }
    w.put_i32(out, out.size(), static_cast<int32_t>(pts.rows()));
    for (Eigen::Index i = 0; i < pts.rows(); ++i) {
      for (Eigen::Index j = 0; j < width; ++j) {
        w.put_f32(out, out.size(), pts(i, j));
      }
    }
    for (int16_t p = 0; p < layout.n_properties; ++p) {
      const float value = s < properties.size() ? properties[s][static_cast<size_t>(p)] : static_cast<float>(s);
      w.put_f32(out, out.size(), value);
    }
  }
  return out;
}

inline void write_bytes(const fs::path &path, const std::vector<char> &bytes) {
  std::ofstream out(path.string(), std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to open " + path.string() + " for writing");
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

inline void write_trk(const fs::path &path,
                      const TrkLayout &layout,
                      const std::vector<PointRows> &streamlines,
                      const std::vector<std::vector<float>> &properties = {}) {
  write_bytes(path, make_trk_bytes(layout, streamlines, properties));
}

// Streamline `s` of `length` points: coordinates well away from zero, scalars as given width.
inline PointRows make_points(int s, int length, int n_scalars = 0) {
  PointRows pts(length, 3 + n_scalars);
  for (int i = 0; i < length; ++i) {
    pts(i, 0) = 10.0f + static_cast<float>(s) + 0.25f * static_cast<float>(i);
    pts(i, 1) = 20.0f + static_cast<float>(s) * 0.5f + static_cast<float>(i);
    pts(i, 2) = 30.0f - 0.125f * static_cast<float>(i);
    for (int k = 0; k < n_scalars; ++k) {
      pts(i, 3 + k) = 100.0f + static_cast<float>(k) + static_cast<float>(i);
    }
  }
  return pts;
}

inline std::vector<PointRows> make_streamlines(const std::vector<int> &lengths, int n_scalars = 0) {
  std::vector<PointRows> out;
  out.reserve(lengths.size());
  for (size_t s = 0; s < lengths.size(); ++s) {
    out.push_back(make_points(static_cast<int>(s), lengths[s], n_scalars));
  }
  return out;
}

inline std::vector<PointRows> make_random_streamlines(size_t count, int max_length, int n_scalars, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> len_dist(1, max_length);
  std::uniform_real_distribution<float> coord(1.0f, 200.0f);
  std::vector<PointRows> out;
  out.reserve(count);
  for (size_t s = 0; s < count; ++s) {
    PointRows pts(len_dist(rng), 3 + n_scalars);
    for (Eigen::Index i = 0; i < pts.rows(); ++i) {
      for (Eigen::Index j = 0; j < pts.cols(); ++j) {
        pts(i, j) = coord(rng);
      }
    }
    out.push_back(pts);
  }
  return out;
}

inline fs::path make_temp_test_dir(const std::string &prefix) {
  std::error_code ec;
  auto base = fs::temp_directory_path(ec);
  if (ec) {
    throw std::runtime_error("Failed to get temp directory: " + ec.message());
  }

  static std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;

  for (int attempt = 0; attempt < 100; ++attempt) {
    fs::path candidate = base / (prefix + "_" + std::to_string(dist(rng)));
    std::error_code dir_ec;
    if (fs::create_directory(candidate, dir_ec)) {
      return candidate;
    }
    if (dir_ec && dir_ec != std::errc::file_exists) {
      throw std::runtime_error("Failed to create temporary directory: " + dir_ec.message());
    }
  }
  throw std::runtime_error("Unable to create unique temporary directory");
}

// Temporary directory removed on destruction.
class ScopedTempDir {
public:
  explicit ScopedTempDir(const std::string &prefix = "trk_test") : path_(make_temp_test_dir(prefix)) {}
  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;

  ~ScopedTempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
      std::cerr << "Failed to clean up test directory " << path_.string() << ": " << ec.message() << std::endl;
    }
  }

  const fs::path &path() const { return path_; }
  fs::path file(const std::string &name) const { return path_ / name; }

private:
  fs::path path_;
};

} // namespace trk_test

#endif // TRK_TESTS_TRK_TEST_UTILS_H
