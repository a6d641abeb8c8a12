#ifndef TRK_H
#define TRK_H

#include <cstdint>
#include <string>
#include <vector>

#include <trk/affine.h>
#include <trk/containers.h>
#include <trk/detail/exceptions.h>
#include <trk/extract.h>
#include <trk/header.h>
#include <trk/index.h>
#include <trk/selection.h>
#include <trk/source.h>
#include <trk/trk_export.h>

namespace trk {

struct LoadOptions {
  StreamlineSelection selection;
  bool apply_affine = true;
  IndexOptions index;
  SourceMode source_mode = SourceMode::Mapped;
  // Workers for the heuristic scan and for extraction from resident sources.
  unsigned int num_threads = 1;
};

struct LoadResult {
  std::vector<Streamline> streamlines;
  FileHeader header;
  std::vector<uint32_t> lengths;
  std::vector<uint64_t> ids;
  IndexStrategy index_strategy = IndexStrategy::Sequential;
};

/**
 * @brief Load the selected streamlines of a TrackVis file.
 *
 * Reads the header, indexes every streamline with the requested strategy,
 * resolves the selection and extracts only the selected streamlines, in
 * selection order. `lengths[i]` is the point count of `streamlines[i]` and
 * `ids[i]` its streamline id. When the header does not store the streamline
 * count, `header.streamline_count` is set from the index.
 */
TRK_EXPORT LoadResult load(const std::string &path, const LoadOptions &options = {});

/// Index every streamline of `path` without extracting any.
TRK_EXPORT StreamlineIndex load_index(const std::string &path,
                                      const IndexOptions &options = {},
                                      SourceMode mode = SourceMode::Mapped);

} // namespace trk

#endif // TRK_H
