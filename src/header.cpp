#include <trk/header.h>

#include <trk/affine.h>
#include <trk/detail/byte_order.h>
#include <trk/detail/exceptions.h>

#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

namespace trk {
namespace detail {

#pragma pack(push, 1)
struct TrackVisHeader {
  char id_string[6];
  std::int16_t dim[3];
  float voxel_size[3];
  float origin[3];
  std::int16_t n_scalars;
  char scalar_name[10][20];
  std::int16_t n_properties;
  char property_name[10][20];
  float vox_to_ras[4][4];
  char reserved[444];
  char voxel_order[4];
  char pad2[4];
  float image_orientation_patient[6];
  char pad1[2];
  unsigned char invert_x;
  unsigned char invert_y;
  unsigned char invert_z;
  unsigned char swap_xy;
  unsigned char swap_yz;
  unsigned char swap_zx;
  std::int32_t n_count;
  std::int32_t version;
  std::int32_t hdr_size;
};
#pragma pack(pop)

static_assert(sizeof(TrackVisHeader) == kTrkHeaderSize, "TrackVis header must be 1000 bytes");

void swap_trackvis_header(TrackVisHeader &hdr) {
  for (std::int16_t &dim : hdr.dim) {
    swap_2(dim);
  }
  for (float &value : hdr.voxel_size) {
    swap_4(value);
  }
  for (float &value : hdr.origin) {
    swap_4(value);
  }
  swap_2(hdr.n_scalars);
  swap_2(hdr.n_properties);
  for (auto &row : hdr.vox_to_ras) {
    for (float &value : row) {
      swap_4(value);
    }
  }
  for (float &value : hdr.image_orientation_patient) {
    swap_4(value);
  }
  swap_4(hdr.n_count);
  swap_4(hdr.version);
  swap_4(hdr.hdr_size);
}

std::string fixed_string(const char *data, size_t size) {
  size_t len = 0;
  while (len < size && data[len] != '\0') {
    ++len;
  }
  return std::string(data, len);
}

// Names are stored in 10 slots of 20 bytes. A slot may encode a repeat count
// after the terminating NUL ("name\0" followed by digits).
std::vector<std::string> decode_names(const char (&slots)[10][20], size_t count) {
  std::vector<std::string> names;
  for (size_t slot = 0; slot < 10 && names.size() < count; ++slot) {
    const std::string name = fixed_string(slots[slot], 20);
    if (name.empty()) {
      continue;
    }
    size_t repeat = 1;
    if (name.size() + 1 < 20) {
      const std::string tail = fixed_string(slots[slot] + name.size() + 1, 20 - name.size() - 1);
      if (!tail.empty() && std::isdigit(static_cast<unsigned char>(tail[0]))) {
        repeat = static_cast<size_t>(std::stoul(tail));
      }
    }
    for (size_t r = 0; r < repeat && names.size() < count; ++r) {
      names.push_back(name);
    }
  }
  names.resize(count);
  return names;
}

} // namespace detail

FileHeader parse_header(const char *bytes, uint64_t file_size_bytes) {
  detail::TrackVisHeader hdr{};
  std::memcpy(&hdr, bytes, sizeof(hdr));

  if (std::strncmp(hdr.id_string, "TRACK", 5) != 0) {
    throw TrkFormatError("Not a TrackVis file: magic string is not TRACK");
  }

  FileHeader header;
  if (hdr.hdr_size != static_cast<std::int32_t>(kTrkHeaderSize)) {
    detail::swap_trackvis_header(hdr);
    if (hdr.hdr_size != static_cast<std::int32_t>(kTrkHeaderSize)) {
      throw TrkFormatError("Invalid TrackVis hdr_size: " + std::to_string(hdr.hdr_size));
    }
    header.byte_swapped = true;
    spdlog::info("TrackVis file is in non-native byte order, records will be byte swapped.");
  }

  if (hdr.version != 1 && hdr.version != 2) {
    throw TrkFormatError("Unsupported TrackVis version: " + std::to_string(hdr.version));
  }
  if (hdr.n_scalars < 0 || hdr.n_properties < 0) {
    throw TrkFormatError("Negative scalar or property count in TrackVis header");
  }
  if (hdr.n_count < 0) {
    throw TrkFormatError("Negative streamline count in TrackVis header: " + std::to_string(hdr.n_count));
  }

  header.header_size_bytes = kTrkHeaderSize;
  header.file_size_bytes = file_size_bytes;
  header.version = hdr.version;
  header.streamline_count = static_cast<uint64_t>(hdr.n_count);
  header.streamline_count_stored = hdr.n_count > 0;
  header.scalars_per_point = static_cast<uint32_t>(hdr.n_scalars);
  header.properties_per_streamline = static_cast<uint32_t>(hdr.n_properties);

  for (int i = 0; i < 3; ++i) {
    header.dimensions[i] = hdr.dim[i];
    header.voxel_sizes[i] = hdr.voxel_size[i];
    header.origin[i] = hdr.origin[i];
  }

  for (int i = 0; i < 4; ++i) {
    for (int j = 0; j < 4; ++j) {
      header.voxel_to_rasmm(i, j) = hdr.vox_to_ras[i][j];
    }
  }
  if (header.voxel_to_rasmm(3, 3) == 0.0f) {
    spdlog::warn("TrackVis header has no vox_to_ras affine, using the identity.");
    header.voxel_to_rasmm = Eigen::Matrix4f::Identity();
  }

  header.voxel_order = detail::fixed_string(hdr.voxel_order, sizeof(hdr.voxel_order));
  if (header.voxel_order.empty()) {
    spdlog::warn("TrackVis header has no voxel order, assuming LPS.");
    header.voxel_order = "LPS";
  }

  header.scalar_names = detail::decode_names(hdr.scalar_name, header.scalars_per_point);
  header.property_names = detail::decode_names(hdr.property_name, header.properties_per_streamline);

  header.affine =
      trackvis_to_rasmm(header.voxel_to_rasmm, header.voxel_sizes, header.dimensions, header.voxel_order);

  spdlog::debug("TrackVis v{} header: {} streamlines{}, {} scalars/point, {} properties/streamline{}",
                header.version,
                header.streamline_count,
                header.streamline_count_stored ? "" : " (count not stored)",
                header.scalars_per_point,
                header.properties_per_streamline,
                header.byte_swapped ? ", byte-swapped" : "");
  return header;
}

void check_header_fits(const FileHeader &header) {
  if (header.header_size_bytes > header.file_size_bytes) {
    throw TrkFormatError("Header size (" + std::to_string(header.header_size_bytes) + ") exceeds file size (" +
                         std::to_string(header.file_size_bytes) + ")");
  }
}

FileHeader read_header(const std::string &path) {
  std::error_code ec;
  const auto file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw TrkIOError("Failed to stat TRK file: " + path + ": " + ec.message());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw TrkIOError("Failed to open TRK file: " + path);
  }
  char bytes[kTrkHeaderSize];
  in.read(bytes, static_cast<std::streamsize>(kTrkHeaderSize));
  if (in.gcount() != static_cast<std::streamsize>(kTrkHeaderSize)) {
    throw TrkFormatError("File too small to hold a TrackVis header: " + path);
  }

  FileHeader header = parse_header(bytes, static_cast<uint64_t>(file_size));
  check_header_fits(header);
  return header;
}

} // namespace trk
