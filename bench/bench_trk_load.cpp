// Benchmark TRK indexing and random-access extraction over synthetic files.
#include <benchmark/benchmark.h>
#include <trk/trk.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/resource.h>
#endif

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

namespace {

constexpr float kStepMm = 2.0f;
constexpr float kMinLengthMm = 20.0f;
constexpr float kMaxLengthMm = 250.0f;
constexpr int16_t kScalarsPerPoint = 1;
constexpr int16_t kPropertiesPerStreamline = 1;
constexpr std::array<int16_t, 3> kDims = {145, 174, 145};
constexpr std::array<float, 3> kVoxelSize = {1.25f, 1.25f, 1.25f};

size_t parse_env_size(const char *name, size_t default_value) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == '\0') {
    return default_value;
  }
  char *end = nullptr;
  const unsigned long long value = std::strtoull(raw, &end, 10);
  if (end == raw) {
    return default_value;
  }
  return static_cast<size_t>(value);
}

std::vector<size_t> streamlines_for_benchmarks() {
  const size_t only = parse_env_size("TRK_BENCH_ONLY_STREAMLINES", 0);
  if (only > 0) {
    return {only};
  }
  const size_t max_val = parse_env_size("TRK_BENCH_MAX_STREAMLINES", 1000000);
  std::vector<size_t> counts = {1000000, 500000, 100000};
  counts.erase(std::remove_if(counts.begin(), counts.end(), [&](size_t v) { return v > max_val; }), counts.end());
  if (counts.empty()) {
    counts.push_back(max_val);
  }
  return counts;
}

unsigned int bench_threads() {
  const size_t requested = parse_env_size("TRK_BENCH_THREADS", 0);
  if (requested > 0) {
    return static_cast<unsigned int>(requested);
  }
  const unsigned int hc = std::thread::hardware_concurrency();
  return hc == 0 ? 1U : hc;
}

double get_max_rss_kb() {
#if defined(__unix__) || defined(__APPLE__)
  rusage usage{};
  if (getrusage(RUSAGE_SELF, &usage) != 0) {
    return 0.0;
  }
#if defined(__APPLE__)
  return static_cast<double>(usage.ru_maxrss) / 1024.0;
#else
  return static_cast<double>(usage.ru_maxrss);
#endif
#else
  return 0.0;
#endif
}

std::string make_temp_path(const std::string &prefix) {
  static std::atomic<uint64_t> counter{0};
  const auto id = counter.fetch_add(1, std::memory_order_relaxed);
  const auto dir = std::filesystem::temp_directory_path();
  return (dir / (prefix + "_" + std::to_string(id) + ".trk")).string();
}

template <typename T>
void put(std::vector<char> &buf, size_t offset, T value) {
  std::memcpy(buf.data() + offset, &value, sizeof(T));
}

std::vector<char> make_header(size_t streamlines) {
  std::vector<char> header(trk::kTrkHeaderSize, 0);
  std::memcpy(header.data(), "TRACK", 5);
  for (int i = 0; i < 3; ++i) {
    put<int16_t>(header, 6 + 2 * i, kDims[i]);
    put<float>(header, 12 + 4 * i, kVoxelSize[i]);
  }
  put<int16_t>(header, 36, kScalarsPerPoint);
  std::memcpy(header.data() + 38, "fa", 2);
  put<int16_t>(header, 238, kPropertiesPerStreamline);
  std::memcpy(header.data() + 240, "bundle", 6);
  for (int i = 0; i < 4; ++i) {
    put<float>(header, 440 + 4 * (i * 4 + i), i < 3 ? kVoxelSize[i] : 1.0f);
  }
  std::memcpy(header.data() + 948, "LAS", 3);
  put<int32_t>(header, 988, static_cast<int32_t>(streamlines));
  put<int32_t>(header, 992, 2);
  put<int32_t>(header, 996, static_cast<int32_t>(trk::kTrkHeaderSize));
  return header;
}

// Random walks inside the volume, written record by record.
void write_synthetic_trk(const std::string &path, size_t streamlines, uint32_t seed) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to open " + path);
  }
  const auto header = make_header(streamlines);
  out.write(header.data(), static_cast<std::streamsize>(header.size()));

  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> length_mm(kMinLengthMm, kMaxLengthMm);
  std::uniform_real_distribution<float> start(30.0f, 150.0f);
  std::normal_distribution<float> step(0.0f, kStepMm);
  std::uniform_real_distribution<float> scalar(0.1f, 1.0f);

  std::vector<float> record;
  for (size_t s = 0; s < streamlines; ++s) {
    const int32_t length = static_cast<int32_t>(std::ceil(length_mm(rng) / kStepMm)) + 1;
    record.clear();
    std::array<float, 3> p{start(rng), start(rng), start(rng)};
    for (int32_t i = 0; i < length; ++i) {
      for (auto &c : p) {
        c = std::max(1.0f, c + step(rng));
      }
      record.insert(record.end(), p.begin(), p.end());
      record.push_back(scalar(rng));
    }
    record.push_back(static_cast<float>(s % 80 + 1));
    out.write(reinterpret_cast<const char *>(&length), sizeof(length));
    out.write(reinterpret_cast<const char *>(record.data()), static_cast<std::streamsize>(record.size() * 4));
  }
  if (!out) {
    throw std::runtime_error("Failed to write " + path);
  }
}

// Files are generated once per streamline count and removed at exit.
class DatasetCache {
public:
  ~DatasetCache() {
    for (const auto &kv : paths_) {
      std::error_code ec;
      std::filesystem::remove(kv.second, ec);
    }
  }

  const std::string &get(size_t streamlines) {
    auto it = paths_.find(streamlines);
    if (it != paths_.end()) {
      return it->second;
    }
    const std::string path = make_temp_path("trk_bench");
    write_synthetic_trk(path, streamlines, static_cast<uint32_t>(streamlines));
    return paths_.emplace(streamlines, path).first->second;
  }

private:
  std::map<size_t, std::string> paths_;
};

DatasetCache &datasets() {
  static DatasetCache cache;
  return cache;
}

void add_common_counters(benchmark::State &state, size_t streamlines, const std::string &path) {
  state.counters["streamlines"] = static_cast<double>(streamlines);
  state.counters["file_bytes"] = static_cast<double>(std::filesystem::file_size(path));
  state.counters["max_rss_kb"] = get_max_rss_kb();
}

} // namespace

static void BM_TrkIndex(benchmark::State &state) {
  const size_t streamlines = static_cast<size_t>(state.range(0));
  const auto strategy = static_cast<trk::IndexStrategy>(state.range(1));
  const auto mode = static_cast<trk::SourceMode>(state.range(2));
  const std::string &path = datasets().get(streamlines);

  trk::IndexOptions options;
  options.strategy = strategy;
  options.num_threads = state.range(3) != 0 ? bench_threads() : 1;

  const trk::FileHeader header = trk::read_header(path);
  for (auto _ : state) {
    auto source = trk::open_source(path, mode);
    auto index = trk::build_index(*source, header, options);
    benchmark::DoNotOptimize(index.entries().data());
  }

  add_common_counters(state, streamlines, path);
  state.counters["threads"] = static_cast<double>(options.num_threads);
  state.SetLabel(trk::index_strategy_name(strategy) + "/" + trk::source_mode_name(mode));
}

static void BM_TrkExtract_Sample(benchmark::State &state) {
  const size_t streamlines = static_cast<size_t>(state.range(0));
  const size_t sample = static_cast<size_t>(state.range(1));
  const auto mode = static_cast<trk::SourceMode>(state.range(2));
  const std::string &path = datasets().get(streamlines);

  const trk::FileHeader header = trk::read_header(path);
  auto source = trk::open_source(path, mode);
  trk::IndexOptions index_options;
  index_options.strategy = trk::IndexStrategy::HeuristicWithFallback;
  const trk::StreamlineIndex index = trk::build_index(*source, header, index_options);

  uint64_t seed = 1;
  for (auto _ : state) {
    state.PauseTiming();
    const auto ids = trk::resolve_selection(trk::StreamlineSelection::sample(sample, false, seed++), index.size());
    state.ResumeTiming();
    auto out = trk::extract(*source, header, index, ids);
    benchmark::DoNotOptimize(out.data());
  }

  add_common_counters(state, streamlines, path);
  state.counters["sample"] = static_cast<double>(sample);
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(sample));
  state.SetLabel(trk::source_mode_name(mode));
}

static void BM_TrkLoad_All(benchmark::State &state) {
  const size_t streamlines = static_cast<size_t>(state.range(0));
  const bool apply_affine = state.range(1) != 0;
  const std::string &path = datasets().get(streamlines);

  trk::LoadOptions options;
  options.apply_affine = apply_affine;
  options.num_threads = bench_threads();
  for (auto _ : state) {
    auto result = trk::load(path, options);
    benchmark::DoNotOptimize(result.streamlines.data());
  }

  add_common_counters(state, streamlines, path);
  state.counters["affine"] = apply_affine ? 1.0 : 0.0;
}

static void ApplyIndexArgs(benchmark::internal::Benchmark *bench) {
  const std::array<int, 2> strategies = {static_cast<int>(trk::IndexStrategy::Sequential),
                                         static_cast<int>(trk::IndexStrategy::HeuristicWithFallback)};
  const std::array<int, 2> modes = {static_cast<int>(trk::SourceMode::Stream),
                                    static_cast<int>(trk::SourceMode::Mapped)};
  for (const auto count : streamlines_for_benchmarks()) {
    for (const auto strategy : strategies) {
      for (const auto mode : modes) {
        bench->Args({static_cast<int64_t>(count), strategy, mode, 0});
      }
    }
    bench->Args({static_cast<int64_t>(count),
                 static_cast<int>(trk::IndexStrategy::HeuristicWithFallback),
                 static_cast<int>(trk::SourceMode::Mapped),
                 1});
  }
}

static void ApplySampleArgs(benchmark::internal::Benchmark *bench) {
  const std::array<int, 3> samples = {100, 1000, 10000};
  const std::array<int, 3> modes = {static_cast<int>(trk::SourceMode::Stream),
                                    static_cast<int>(trk::SourceMode::Mapped),
                                    static_cast<int>(trk::SourceMode::InMemory)};
  for (const auto count : streamlines_for_benchmarks()) {
    for (const auto sample : samples) {
      for (const auto mode : modes) {
        bench->Args({static_cast<int64_t>(count), sample, mode});
      }
    }
  }
}

static void ApplyLoadArgs(benchmark::internal::Benchmark *bench) {
  for (const auto count : streamlines_for_benchmarks()) {
    bench->Args({static_cast<int64_t>(count), 0});
    bench->Args({static_cast<int64_t>(count), 1});
  }
}

BENCHMARK(BM_TrkIndex)->Apply(ApplyIndexArgs)->Unit(benchmark::kMillisecond);

BENCHMARK(BM_TrkExtract_Sample)->Apply(ApplySampleArgs)->Unit(benchmark::kMillisecond);

BENCHMARK(BM_TrkLoad_All)->Apply(ApplyLoadArgs)->Unit(benchmark::kMillisecond);

int main(int argc, char **argv) {
  ::benchmark::Initialize(&argc, argv);
  if (::benchmark::ReportUnrecognizedArguments(argc, argv)) {
    return 1;
  }
  spdlog::set_level(spdlog::level::warn);
  try {
    ::benchmark::RunSpecifiedBenchmarks();
  } catch (const std::exception &ex) {
    std::cerr << "Benchmark failed: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
