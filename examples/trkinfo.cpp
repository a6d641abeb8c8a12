#include <trk/trk.h>

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "cli_colors.h"

namespace
{
template <typename T>
std::string format_array(const T &values)
{
	std::ostringstream out;
	out << "[";
	for (size_t i = 0; i < values.size(); ++i)
	{
		if (i > 0)
		{
			out << ", ";
		}
		out << values[i];
	}
	out << "]";
	return out.str();
}

std::string format_names(const std::vector<std::string> &names)
{
	if (names.empty())
	{
		return "none";
	}
	std::ostringstream out;
	for (size_t i = 0; i < names.size(); ++i)
	{
		if (i > 0)
		{
			out << ", ";
		}
		out << (names[i].empty() ? "<unnamed>" : names[i]);
	}
	return out.str();
}

void print_matrix(const trk_cli::Colors &colors, const std::string &label, const Eigen::Matrix4f &m)
{
	std::cout << "  " << trk_cli::colorize(colors, colors.cyan, label) << ":\n";
	for (int i = 0; i < 4; ++i)
	{
		std::cout << "    [";
		for (int j = 0; j < 4; ++j)
		{
			if (j > 0)
			{
				std::cout << ", ";
			}
			std::cout << std::fixed << std::setprecision(4) << m(i, j);
		}
		std::cout << "]\n";
	}
}

void print_header_info(const trk::FileHeader &header, const std::string &path)
{
	const trk_cli::Colors colors = trk_cli::terminal_colors();

	std::cout << trk_cli::colorize(colors, colors.bold, "TRK info") << "\n";
	trk_cli::print_field(std::cout, colors, "Path", path, 0);
	trk_cli::print_field(std::cout, colors, "File size", std::to_string(header.file_size_bytes) + " bytes", 0);

	trk_cli::print_section(std::cout, colors, "Header");
	trk_cli::print_field(std::cout, colors, "Version", header.version);
	trk_cli::print_field(std::cout, colors, "Byte order", header.byte_swapped ? "big endian" : "little endian");
	trk_cli::print_field(std::cout,
	                     colors,
	                     "Streamlines",
	                     header.streamline_count_stored ? std::to_string(header.streamline_count) : "not stored");
	trk_cli::print_field(std::cout, colors, "Dimensions", format_array(header.dimensions));
	trk_cli::print_field(std::cout, colors, "Voxel sizes", format_array(header.voxel_sizes));
	trk_cli::print_field(std::cout, colors, "Voxel order", header.voxel_order);
	trk_cli::print_field(std::cout, colors, "Scalars per point", header.scalars_per_point);
	trk_cli::print_field(std::cout, colors, "Scalar names", format_names(header.scalar_names));
	trk_cli::print_field(std::cout, colors, "Properties per streamline", header.properties_per_streamline);
	trk_cli::print_field(std::cout, colors, "Property names", format_names(header.property_names));
	print_matrix(colors, "Voxel->RASMM", header.voxel_to_rasmm);
	print_matrix(colors, "VoxMM->RASMM", header.affine);
}

void print_length_stats(const trk::StreamlineIndex &index)
{
	const trk_cli::Colors colors = trk_cli::terminal_colors();
	trk_cli::print_section(std::cout, colors, "Streamline lengths");
	trk_cli::print_field(std::cout, colors, "Index strategy", trk::index_strategy_name(index.strategy()));
	trk_cli::print_field(std::cout, colors, "Count", index.size());
	if (index.empty())
	{
		return;
	}

	uint32_t min_len = index[0].length;
	uint32_t max_len = index[0].length;
	for (const auto &entry : index.entries())
	{
		min_len = std::min(min_len, entry.length);
		max_len = std::max(max_len, entry.length);
	}
	const double mean_len = static_cast<double>(index.total_points()) / static_cast<double>(index.size());
	std::ostringstream summary;
	summary << min_len << " / " << std::fixed << std::setprecision(2) << mean_len << " / " << max_len;
	trk_cli::print_field(std::cout, colors, "Min/Mean/Max", summary.str());
	trk_cli::print_field(std::cout, colors, "Points", index.total_points());
}

} // namespace

int main(int argc, char **argv)
{
	CLI::App app{"Print information about a TrackVis .trk file."};
	std::string path;
	bool show_stats = false;
	std::string strategy = "auto";

	app.add_option("path", path, "Path to the .trk file")->required();
	app.add_flag("--stats", show_stats, "Index the file and print Min/Mean/Max streamline lengths");
	app.add_option("--strategy", strategy, "Index strategy for --stats")
	    ->check(CLI::IsMember({"sequential", "heuristic", "fallback", "auto"}));

	CLI11_PARSE(app, argc, argv);
	try
	{
		const trk::FileHeader header = trk::read_header(path);
		print_header_info(header, path);
		if (show_stats)
		{
			trk::IndexOptions options;
			options.strategy = trk::parse_index_strategy(strategy);
			print_length_stats(trk::load_index(path, options));
		}
		return 0;
	}
	catch (const std::exception &e)
	{
		std::cerr << "trkinfo: " << e.what() << "\n";
		return 1;
	}
}
