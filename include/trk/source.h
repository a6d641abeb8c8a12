#ifndef TRK_SOURCE_H
#define TRK_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <mio/mmap.hpp>

#include <trk/trk_export.h>

namespace trk {

/// How `load` reads the streamline data.
enum class SourceMode {
  Stream,  ///< std::ifstream, one seek + read per request
  Mapped,  ///< read-only memory map of the whole file
  InMemory ///< whole file read into a buffer once
};

/**
 * @brief Random-access byte source over a TRK file.
 *
 * Offsets are absolute file offsets (the header included). `data()` is
 * non-null when the whole file is resident in memory, in which case readers
 * may slice it directly instead of calling `read`.
 */
class TRK_EXPORT StreamlineSource {
public:
  StreamlineSource() = default;
  // Sources own file handles, maps or buffers that readers point into.
  StreamlineSource(const StreamlineSource &) = delete;
  StreamlineSource &operator=(const StreamlineSource &) = delete;
  virtual ~StreamlineSource() = default;

  virtual uint64_t size() const = 0;

  /// Copies `nbytes` starting at `offset` into `dst`. Throws TrkTruncatedStreamError past the end.
  virtual void read(uint64_t offset, void *dst, std::size_t nbytes) = 0;

  virtual const char *data() const { return nullptr; }

  virtual std::string name() const = 0;

protected:
  void check_range(uint64_t offset, std::size_t nbytes) const;
};

class TRK_EXPORT FileStreamSource : public StreamlineSource {
public:
  explicit FileStreamSource(const std::string &path);

  uint64_t size() const override { return size_; }
  void read(uint64_t offset, void *dst, std::size_t nbytes) override;
  std::string name() const override { return "stream"; }

private:
  std::string path_;
  std::ifstream in_;
  uint64_t size_ = 0;
};

class TRK_EXPORT MappedFileSource : public StreamlineSource {
public:
  explicit MappedFileSource(const std::string &path);

  uint64_t size() const override { return static_cast<uint64_t>(mmap_.size()); }
  void read(uint64_t offset, void *dst, std::size_t nbytes) override;
  const char *data() const override { return mmap_.data(); }
  std::string name() const override { return "mmap"; }

private:
  mio::mmap_source mmap_;
};

class TRK_EXPORT MemoryBufferSource : public StreamlineSource {
public:
  /// Takes ownership of `buffer`.
  explicit MemoryBufferSource(std::vector<char> buffer);
  /// Wraps a caller-owned buffer, which must outlive the source.
  MemoryBufferSource(const char *data, std::size_t size);

  /// Reads the whole file at `path` into memory.
  static std::unique_ptr<MemoryBufferSource> from_file(const std::string &path);

  uint64_t size() const override { return size_; }
  void read(uint64_t offset, void *dst, std::size_t nbytes) override;
  const char *data() const override { return data_; }
  std::string name() const override { return "memory"; }

private:
  std::vector<char> owned_;
  const char *data_ = nullptr;
  uint64_t size_ = 0;
};

TRK_EXPORT std::unique_ptr<StreamlineSource> open_source(const std::string &path, SourceMode mode);

TRK_EXPORT std::string source_mode_name(SourceMode mode);
/// Parses "stream", "mmap" or "memory". Throws TrkArgumentError otherwise.
TRK_EXPORT SourceMode parse_source_mode(const std::string &name);

} // namespace trk

#endif // TRK_SOURCE_H
