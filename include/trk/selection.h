#ifndef TRK_SELECTION_H
#define TRK_SELECTION_H

#include <cstdint>
#include <vector>

#include <trk/trk_export.h>

namespace trk {

/// Which streamlines a load should return.
struct StreamlineSelection {
  enum class Kind { All, Explicit, Sample };

  Kind kind = Kind::All;
  std::vector<uint64_t> ids;     // Explicit
  uint64_t sample_count = 0;     // Sample
  bool with_replacement = false; // Sample
  uint64_t seed = 0;             // Sample, 0 seeds from std::random_device

  static StreamlineSelection all() { return StreamlineSelection(); }

  static StreamlineSelection explicit_ids(std::vector<uint64_t> ids) {
    StreamlineSelection sel;
    sel.kind = Kind::Explicit;
    sel.ids = std::move(ids);
    return sel;
  }

  static StreamlineSelection sample(uint64_t count, bool with_replacement = false, uint64_t seed = 0) {
    StreamlineSelection sel;
    sel.kind = Kind::Sample;
    sel.sample_count = count;
    sel.with_replacement = with_replacement;
    sel.seed = seed;
    return sel;
  }
};

/**
 * @brief Resolve a selection to explicit streamline ids.
 *
 * All gives 0..streamline_count in ascending order, Explicit is returned
 * verbatim and Sample draws uniformly at random. Asking for more ids than
 * there are streamlines without replacement logs a warning and samples with
 * replacement. Ids are not range checked here; the extractor does it.
 */
TRK_EXPORT std::vector<uint64_t> resolve_selection(const StreamlineSelection &selection, uint64_t streamline_count);

} // namespace trk

#endif // TRK_SELECTION_H
