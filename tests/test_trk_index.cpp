#include <gtest/gtest.h>
#include <trk/trk.h>

#include "trk_test_utils.h"

#include <cstring>
#include <memory>
#include <random>
#include <vector>

using namespace trk;
using namespace trk_test;

namespace {

float float_from_bits(uint32_t bits) {
  float f = 0.0f;
  std::memcpy(&f, &bits, sizeof(f));
  return f;
}

struct IndexFixture {
  ScopedTempDir dir;
  fs::path path;
  FileHeader header;

  IndexFixture(const TrkLayout &layout,
               const std::vector<PointRows> &streamlines,
               const std::vector<std::vector<float>> &properties = {})
      : path(dir.file("index.trk")) {
    write_trk(path, layout, streamlines, properties);
    header = read_header(path.string());
  }

  std::unique_ptr<StreamlineSource> source(SourceMode mode = SourceMode::Mapped) const {
    return open_source(path.string(), mode);
  }
};

IndexOptions strategy_options(IndexStrategy strategy) {
  IndexOptions options;
  options.strategy = strategy;
  return options;
}

// Streamlines with tiny (denormal) coordinates that read as small integers.
std::vector<PointRows> make_near_zero_streamlines() {
  auto streamlines = make_streamlines({3, 4, 2});
  streamlines[0](1, 0) = float_from_bits(42);
  streamlines[1](2, 2) = float_from_bits(7);
  return streamlines;
}

} // namespace

TEST(TrkIndex, SequentialRecordsLengthsAndOffsets) {
  IndexFixture fx(TrkLayout(), make_streamlines({2, 1, 3}));
  auto source = fx.source();
  const auto entries = build_index_sequential(*source, fx.header);

  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0], (IndexEntry{2, 1000}));
  EXPECT_EQ(entries[1], (IndexEntry{1, 1000 + 4 + 2 * 12}));
  EXPECT_EQ(entries[2], (IndexEntry{3, 1000 + 4 + 2 * 12 + 4 + 1 * 12}));
}

TEST(TrkIndex, SequentialReconstructsPayloadSize) {
  TrkLayout layout;
  layout.n_scalars = 2;
  layout.n_properties = 3;
  IndexFixture fx(layout, make_random_streamlines(50, 40, 2, 11));
  auto source = fx.source();
  const auto index = build_index(*source, fx.header, strategy_options(IndexStrategy::Sequential));

  uint64_t total = 0;
  for (const auto &entry : index.entries()) {
    total += index.schema().record_bytes(entry.length);
  }
  EXPECT_EQ(total, fx.header.payload_bytes());
  EXPECT_EQ(index.strategy(), IndexStrategy::Sequential);
}

TEST(TrkIndex, HeuristicMatchesSequential) {
  TrkLayout layout;
  layout.n_scalars = 1;
  layout.n_properties = 2;
  IndexFixture fx(layout, make_random_streamlines(200, 60, 1, 3));
  auto source = fx.source();

  const auto sequential = build_index_sequential(*source, fx.header);
  const auto heuristic = build_index_heuristic(*source, fx.header);
  EXPECT_EQ(heuristic, sequential);

  const auto index = build_index(*source, fx.header, strategy_options(IndexStrategy::HeuristicWithFallback));
  EXPECT_EQ(index.strategy(), IndexStrategy::Heuristic);
  EXPECT_EQ(index.entries(), sequential);
}

TEST(TrkIndex, StrictHeuristicRejectsFalsePositives) {
  IndexFixture fx(TrkLayout(), make_near_zero_streamlines());
  auto source = fx.source();
  try {
    build_index_heuristic(*source, fx.header);
    FAIL() << "expected TrkHeuristicMismatch";
  } catch (const TrkHeuristicMismatch &e) {
    EXPECT_EQ(e.expected(), 3u);
    EXPECT_EQ(e.found(), 5u);
  }
}

TEST(TrkIndex, FallbackRecoversFromFalsePositives) {
  IndexFixture fx(TrkLayout(), make_near_zero_streamlines());
  auto source = fx.source();

  const auto expected = build_index_sequential(*source, fx.header);
  const auto index = build_index(*source, fx.header, strategy_options(IndexStrategy::HeuristicWithFallback));
  EXPECT_EQ(index.strategy(), IndexStrategy::Sequential);
  EXPECT_EQ(index.entries(), expected);
  EXPECT_EQ(index.lengths(), (std::vector<uint32_t>{3, 4, 2}));
}

TEST(TrkIndex, LengthsAboveThresholdForceFallback) {
  IndexFixture fx(TrkLayout(), make_streamlines({2, 5, 1}));
  auto source = fx.source();

  IndexOptions options = strategy_options(IndexStrategy::Heuristic);
  options.length_threshold = 4;
  EXPECT_THROW(build_index_heuristic(*source, fx.header, options), TrkHeuristicMismatch);

  options.strategy = IndexStrategy::HeuristicWithFallback;
  const auto index = build_index(*source, fx.header, options);
  EXPECT_EQ(index.strategy(), IndexStrategy::Sequential);
  EXPECT_EQ(index.lengths(), (std::vector<uint32_t>{2, 5, 1}));
}

TEST(TrkIndex, ZeroThresholdIsAnArgumentError) {
  IndexFixture fx(TrkLayout(), make_streamlines({2}));
  auto source = fx.source();
  IndexOptions options;
  options.length_threshold = 0;
  EXPECT_THROW(build_index_heuristic(*source, fx.header, options), TrkArgumentError);
}

TEST(TrkIndex, LayoutCheckCatchesSwappedCandidate) {
  // One false positive inside streamline 0 and a true length above the threshold
  // in streamline 1 leave exactly as many candidates as streamlines.
  auto streamlines = make_streamlines({2, 60});
  streamlines[0](1, 1) = float_from_bits(7);
  IndexFixture fx(TrkLayout(), streamlines);
  auto source = fx.source();

  IndexOptions options;
  options.length_threshold = 50;
  EXPECT_THROW(build_index_heuristic(*source, fx.header, options), TrkHeuristicMismatch);

  options.verify_layout = false;
  const auto unchecked = build_index_heuristic(*source, fx.header, options);
  ASSERT_EQ(unchecked.size(), 2u);
  EXPECT_EQ(unchecked[1].length, 7u);

  options.verify_layout = true;
  options.strategy = IndexStrategy::HeuristicWithFallback;
  const auto index = build_index(*source, fx.header, options);
  EXPECT_EQ(index.lengths(), (std::vector<uint32_t>{2, 60}));
}

TEST(TrkIndex, ChunkedScanMatchesResidentScan) {
  TrkLayout layout;
  layout.n_properties = 1;
  IndexFixture fx(layout, make_random_streamlines(120, 30, 0, 5));
  auto mapped = fx.source(SourceMode::Mapped);
  auto stream = fx.source(SourceMode::Stream);

  IndexOptions options;
  options.scan_chunk_bytes = 64;
  EXPECT_EQ(build_index_heuristic(*stream, fx.header, options), build_index_heuristic(*mapped, fx.header, options));
}

TEST(TrkIndex, SourceModesAgree) {
  TrkLayout layout;
  layout.n_scalars = 3;
  IndexFixture fx(layout, make_random_streamlines(40, 25, 3, 17));
  auto mapped = fx.source(SourceMode::Mapped);
  auto stream = fx.source(SourceMode::Stream);
  auto memory = fx.source(SourceMode::InMemory);

  const auto reference = build_index_sequential(*mapped, fx.header);
  EXPECT_EQ(build_index_sequential(*stream, fx.header), reference);
  EXPECT_EQ(build_index_sequential(*memory, fx.header), reference);
}

TEST(TrkIndex, ParallelScanKeepsFileOrder) {
  const size_t nb_words = 3u * 1024u * 1024u + 17u;
  std::vector<uint32_t> words(nb_words);
  std::mt19937 rng(123);
  std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFFFFu);
  for (auto &w : words) {
    w = dist(rng);
    if ((w & 0xFFF) == 0) {
      w = (w >> 12) % 1000;
    }
  }
  const char *data = reinterpret_cast<const char *>(words.data());

  std::vector<IndexEntry> serial;
  detail::scan_length_candidates(data, nb_words, kDefaultLengthThreshold, 1000, serial);
  const auto parallel = detail::scan_length_candidates_parallel(data, nb_words, kDefaultLengthThreshold, 1000, 4);
  ASSERT_FALSE(serial.empty());
  EXPECT_EQ(parallel, serial);
}

TEST(TrkIndex, ByteSwappedFileUsesSequentialWalk) {
  TrkLayout layout;
  layout.n_scalars = 1;
  const auto streamlines = make_streamlines({3, 1, 4}, 1);
  IndexFixture little(layout, streamlines);
  layout.big_endian = true;
  IndexFixture big(layout, streamlines);

  auto big_source = big.source();
  auto little_source = little.source();
  EXPECT_EQ(build_index_sequential(*big_source, big.header), build_index_sequential(*little_source, little.header));
  EXPECT_THROW(build_index_heuristic(*big_source, big.header), TrkHeuristicMismatch);

  const auto index = build_index(*big_source, big.header, strategy_options(IndexStrategy::HeuristicWithFallback));
  EXPECT_EQ(index.strategy(), IndexStrategy::Sequential);
  EXPECT_EQ(index.lengths(), (std::vector<uint32_t>{3, 1, 4}));
}

TEST(TrkIndex, UnstoredCountWalksToEndOfData) {
  TrkLayout layout;
  layout.n_count = 0;
  IndexFixture fx(layout, make_streamlines({5, 2, 2, 7}));
  auto source = fx.source();
  const auto index = build_index(*source, fx.header, strategy_options(IndexStrategy::HeuristicWithFallback));
  EXPECT_EQ(index.lengths(), (std::vector<uint32_t>{5, 2, 2, 7}));
}

TEST(TrkIndex, MissingRecordsAreTruncation) {
  TrkLayout layout;
  layout.n_count = 4;
  IndexFixture fx(layout, make_streamlines({2, 3}));
  auto source = fx.source();
  try {
    build_index_sequential(*source, fx.header);
    FAIL() << "expected TrkTruncatedStreamError";
  } catch (const TrkTruncatedStreamError &e) {
    EXPECT_EQ(e.expected(), 4u);
    EXPECT_EQ(e.found(), 2u);
    EXPECT_EQ(e.offset(), fx.header.file_size_bytes);
  }
}

TEST(TrkIndex, PartialRecordIsTruncation) {
  ScopedTempDir dir;
  auto bytes = make_trk_bytes(TrkLayout(), make_streamlines({2, 3}));
  bytes.resize(bytes.size() - 5);
  const auto path = dir.file("partial.trk");
  write_bytes(path, bytes);

  const auto header = read_header(path.string());
  auto source = open_source(path.string(), SourceMode::Stream);
  EXPECT_THROW(build_index_sequential(*source, header), TrkTruncatedStreamError);
  EXPECT_THROW(build_index(*source, header, strategy_options(IndexStrategy::HeuristicWithFallback)),
               TrkTruncatedStreamError);
}

TEST(TrkIndex, EmptyFileGivesEmptyIndex) {
  TrkLayout layout;
  layout.n_count = 0;
  IndexFixture fx(layout, {});
  auto source = fx.source(SourceMode::Stream);
  for (auto strategy : {IndexStrategy::Sequential, IndexStrategy::HeuristicWithFallback, IndexStrategy::Auto}) {
    EXPECT_TRUE(build_index(*source, fx.header, strategy_options(strategy)).empty());
  }
}

TEST(TrkIndex, AutoStrategyFollowsPayloadSize) {
  IndexFixture fx(TrkLayout(), make_streamlines({4, 4, 4}));
  auto source = fx.source();

  IndexOptions options;
  EXPECT_EQ(build_index(*source, fx.header, options).strategy(), IndexStrategy::Sequential);

  options.auto_heuristic_min_bytes = 0;
  EXPECT_EQ(build_index(*source, fx.header, options).strategy(), IndexStrategy::Heuristic);
}

TEST(TrkIndex, StrategyNames) {
  for (auto strategy : {IndexStrategy::Sequential,
                        IndexStrategy::Heuristic,
                        IndexStrategy::HeuristicWithFallback,
                        IndexStrategy::Auto}) {
    EXPECT_EQ(parse_index_strategy(index_strategy_name(strategy)), strategy);
  }
  EXPECT_THROW(parse_index_strategy("bulk"), TrkArgumentError);
}
