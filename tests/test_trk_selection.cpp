#include <gtest/gtest.h>
#include <trk/selection.h>

#include <algorithm>
#include <set>
#include <vector>

using namespace trk;

TEST(TrkSelection, AllIsEveryIdInOrder) {
  EXPECT_EQ(resolve_selection(StreamlineSelection::all(), 4), (std::vector<uint64_t>{0, 1, 2, 3}));
  EXPECT_TRUE(resolve_selection(StreamlineSelection::all(), 0).empty());
}

TEST(TrkSelection, ExplicitIdsAreReturnedVerbatim) {
  const std::vector<uint64_t> ids{3, 1, 3, 0};
  EXPECT_EQ(resolve_selection(StreamlineSelection::explicit_ids(ids), 4), ids);
  // range checks belong to extraction
  EXPECT_EQ(resolve_selection(StreamlineSelection::explicit_ids({7}), 4), (std::vector<uint64_t>{7}));
}

TEST(TrkSelection, SampleWithoutReplacementIsDistinct) {
  const auto ids = resolve_selection(StreamlineSelection::sample(40, false, 1234), 50);
  ASSERT_EQ(ids.size(), 40u);
  const std::set<uint64_t> unique(ids.begin(), ids.end());
  EXPECT_EQ(unique.size(), ids.size());
  EXPECT_LT(*std::max_element(ids.begin(), ids.end()), 50u);
}

TEST(TrkSelection, SampleEverythingIsAPermutation) {
  auto ids = resolve_selection(StreamlineSelection::sample(20, false, 8), 20);
  std::sort(ids.begin(), ids.end());
  std::vector<uint64_t> expected(20);
  for (uint64_t i = 0; i < 20; ++i) {
    expected[i] = i;
  }
  EXPECT_EQ(ids, expected);
}

TEST(TrkSelection, SeededSamplesAreReproducible) {
  const auto a = resolve_selection(StreamlineSelection::sample(10, false, 99), 1000);
  const auto b = resolve_selection(StreamlineSelection::sample(10, false, 99), 1000);
  EXPECT_EQ(a, b);

  const auto c = resolve_selection(StreamlineSelection::sample(10, true, 99), 1000);
  const auto d = resolve_selection(StreamlineSelection::sample(10, true, 99), 1000);
  EXPECT_EQ(c, d);
}

TEST(TrkSelection, SampleWithReplacementStaysInRange) {
  const auto ids = resolve_selection(StreamlineSelection::sample(500, true, 3), 5);
  ASSERT_EQ(ids.size(), 500u);
  for (const auto id : ids) {
    EXPECT_LT(id, 5u);
  }
}

TEST(TrkSelection, OversizedSampleSwitchesToReplacement) {
  const auto ids = resolve_selection(StreamlineSelection::sample(12, false, 17), 3);
  ASSERT_EQ(ids.size(), 12u);
  for (const auto id : ids) {
    EXPECT_LT(id, 3u);
  }
}

TEST(TrkSelection, SampleFromEmptyFileIsEmpty) {
  EXPECT_TRUE(resolve_selection(StreamlineSelection::sample(5, false, 1), 0).empty());
  EXPECT_TRUE(resolve_selection(StreamlineSelection::sample(5, true, 1), 0).empty());
  EXPECT_TRUE(resolve_selection(StreamlineSelection::sample(0, false, 1), 10).empty());
}

TEST(TrkSelection, UnseededSampleIsValid) {
  const auto ids = resolve_selection(StreamlineSelection::sample(8), 8);
  const std::set<uint64_t> unique(ids.begin(), ids.end());
  EXPECT_EQ(unique.size(), 8u);
}
