#include <trk/source.h>

#include <trk/detail/exceptions.h>

#include <cstring>
#include <filesystem>
#include <system_error>

namespace trk {

void StreamlineSource::check_range(uint64_t offset, std::size_t nbytes) const {
  const uint64_t total = size();
  if (offset > total || static_cast<uint64_t>(nbytes) > total - offset) {
    const uint64_t available = offset > total ? 0 : total - offset;
    throw TrkTruncatedStreamError("Read past the end of the TRK data", offset, nbytes, available);
  }
}

FileStreamSource::FileStreamSource(const std::string &path) : path_(path) {
  std::error_code ec;
  const auto file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw TrkIOError("Failed to stat TRK file: " + path + ": " + ec.message());
  }
  size_ = static_cast<uint64_t>(file_size);
  in_.open(path, std::ios::binary);
  if (!in_) {
    throw TrkIOError("Failed to open TRK file: " + path);
  }
}

void FileStreamSource::read(uint64_t offset, void *dst, std::size_t nbytes) {
  check_range(offset, nbytes);
  if (nbytes == 0) {
    return;
  }
  in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  in_.read(static_cast<char *>(dst), static_cast<std::streamsize>(nbytes));
  if (in_.gcount() != static_cast<std::streamsize>(nbytes)) {
    const uint64_t got = in_.gcount() < 0 ? 0 : static_cast<uint64_t>(in_.gcount());
    in_.clear();
    throw TrkTruncatedStreamError("Short read from " + path_, offset, nbytes, got);
  }
}

MappedFileSource::MappedFileSource(const std::string &path) {
  std::error_code ec;
  mmap_.map(path, ec);
  if (ec) {
    throw TrkIOError("Failed to memory-map TRK file: " + path + ": " + ec.message());
  }
}

void MappedFileSource::read(uint64_t offset, void *dst, std::size_t nbytes) {
  check_range(offset, nbytes);
  if (nbytes == 0) {
    return;
  }
  std::memcpy(dst, mmap_.data() + offset, nbytes);
}

MemoryBufferSource::MemoryBufferSource(std::vector<char> buffer) : owned_(std::move(buffer)) {
  data_ = owned_.data();
  size_ = static_cast<uint64_t>(owned_.size());
}

MemoryBufferSource::MemoryBufferSource(const char *data, std::size_t size) : data_(data), size_(size) {}

std::unique_ptr<MemoryBufferSource> MemoryBufferSource::from_file(const std::string &path) {
  std::error_code ec;
  const auto file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw TrkIOError("Failed to stat TRK file: " + path + ": " + ec.message());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw TrkIOError("Failed to open TRK file: " + path);
  }
  std::vector<char> buffer(static_cast<size_t>(file_size));
  in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  if (in.gcount() != static_cast<std::streamsize>(buffer.size())) {
    throw TrkIOError("Failed to read TRK file: " + path);
  }
  return std::make_unique<MemoryBufferSource>(std::move(buffer));
}

void MemoryBufferSource::read(uint64_t offset, void *dst, std::size_t nbytes) {
  check_range(offset, nbytes);
  if (nbytes == 0) {
    return;
  }
  std::memcpy(dst, data_ + offset, nbytes);
}

std::unique_ptr<StreamlineSource> open_source(const std::string &path, SourceMode mode) {
  switch (mode) {
  case SourceMode::Stream:
    return std::make_unique<FileStreamSource>(path);
  case SourceMode::InMemory:
    return MemoryBufferSource::from_file(path);
  case SourceMode::Mapped:
  default:
    return std::make_unique<MappedFileSource>(path);
  }
}

std::string source_mode_name(SourceMode mode) {
  switch (mode) {
  case SourceMode::Stream:
    return "stream";
  case SourceMode::InMemory:
    return "memory";
  case SourceMode::Mapped:
  default:
    return "mmap";
  }
}

SourceMode parse_source_mode(const std::string &name) {
  if (name == "stream") {
    return SourceMode::Stream;
  }
  if (name == "mmap") {
    return SourceMode::Mapped;
  }
  if (name == "memory") {
    return SourceMode::InMemory;
  }
  throw TrkArgumentError("Unknown source mode: " + name);
}

} // namespace trk
