#include <trk/trk.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

#include "cli_colors.h"

namespace
{
std::string format_point(const trk::Streamline &s, Eigen::Index row)
{
	std::ostringstream out;
	out << std::fixed << std::setprecision(3) << "(" << s(row, 0) << ", " << s(row, 1) << ", " << s(row, 2) << ")";
	return out.str();
}

void print_result(const trk::LoadResult &result, const std::string &path, double seconds, size_t preview)
{
	const trk_cli::Colors colors = trk_cli::terminal_colors();

	std::cout << trk_cli::colorize(colors, colors.bold, "TRK load") << "\n";
	trk_cli::print_field(std::cout, colors, "Path", path, 0);
	trk_cli::print_field(std::cout, colors, "Index strategy", trk::index_strategy_name(result.index_strategy), 0);
	trk_cli::print_field(std::cout, colors, "Streamlines in file", result.header.streamline_count, 0);
	trk_cli::print_field(std::cout, colors, "Streamlines loaded", result.streamlines.size(), 0);

	uint64_t points = 0;
	for (const uint32_t length : result.lengths)
	{
		points += length;
	}
	trk_cli::print_field(std::cout, colors, "Points loaded", points, 0);
	std::ostringstream elapsed;
	elapsed << std::fixed << std::setprecision(3) << seconds << " sec.";
	trk_cli::print_field(std::cout, colors, "Elapsed", elapsed.str(), 0);

	const size_t shown = std::min(preview, result.streamlines.size());
	if (shown == 0)
	{
		return;
	}
	trk_cli::print_section(std::cout, colors, "Streamlines");
	for (size_t i = 0; i < shown; ++i)
	{
		const trk::Streamline &s = result.streamlines[i];
		std::cout << "  " << trk_cli::colorize(colors, colors.yellow, "#" + std::to_string(result.ids[i])) << " "
		          << result.lengths[i] << " points";
		if (s.rows() > 0)
		{
			std::cout << ", first " << format_point(s, 0) << ", last " << format_point(s, s.rows() - 1);
		}
		std::cout << "\n";
	}
}

} // namespace

int main(int argc, char **argv)
{
	CLI::App app{"Load streamlines from a TrackVis .trk file."};
	std::string path;
	std::vector<uint64_t> ids;
	uint64_t sample = 0;
	bool replace = false;
	uint64_t seed = 0;
	std::string strategy = "auto";
	std::string source = "mmap";
	bool no_affine = false;
	unsigned int threads = 1;
	uint32_t threshold = trk::kDefaultLengthThreshold;
	size_t preview = 5;
	bool verbose = false;

	app.add_option("path", path, "Path to the .trk file")->required();
	auto *ids_opt = app.add_option("--ids", ids, "Streamline ids to load, in order (repeats allowed)");
	auto *sample_opt = app.add_option("--sample", sample, "Load N streamlines drawn at random");
	sample_opt->excludes(ids_opt);
	app.add_flag("--replace", replace, "Sample with replacement")->needs(sample_opt);
	app.add_option("--seed", seed, "Random seed for --sample (0 seeds from the system)")->needs(sample_opt);
	app.add_option("--strategy", strategy, "Index strategy")
	    ->check(CLI::IsMember({"sequential", "heuristic", "fallback", "auto"}));
	app.add_option("--threshold", threshold, "Largest length (exclusive) accepted by the heuristic scan");
	app.add_option("--source", source, "How to read the file")->check(CLI::IsMember({"stream", "mmap", "memory"}));
	app.add_flag("--no-affine", no_affine, "Return coordinates as stored (voxmm)");
	app.add_option("--threads", threads, "Worker threads for indexing and extraction")->check(CLI::PositiveNumber);
	app.add_option("--preview", preview, "Number of loaded streamlines to print");
	app.add_flag("-v,--verbose", verbose, "Log timings");

	CLI11_PARSE(app, argc, argv);
	if (verbose)
	{
		spdlog::set_level(spdlog::level::debug);
	}

	try
	{
		trk::LoadOptions options;
		if (*ids_opt)
		{
			options.selection = trk::StreamlineSelection::explicit_ids(ids);
		}
		else if (*sample_opt)
		{
			options.selection = trk::StreamlineSelection::sample(sample, replace, seed);
		}
		options.apply_affine = !no_affine;
		options.index.strategy = trk::parse_index_strategy(strategy);
		options.index.length_threshold = threshold;
		options.source_mode = trk::parse_source_mode(source);
		options.num_threads = threads;

		const auto t0 = std::chrono::steady_clock::now();
		const trk::LoadResult result = trk::load(path, options);
		const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
		print_result(result, path, seconds, preview);
		return 0;
	}
	catch (const trk::TrkIndexOutOfRange &e)
	{
		std::cerr << "trk_load: " << e.what() << "\n";
		return 2;
	}
	catch (const std::exception &e)
	{
		std::cerr << "trk_load: " << e.what() << "\n";
		return 1;
	}
}
