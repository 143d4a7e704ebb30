#include "pm/core/PointMetrics.hpp"
#include "pm/core/util/FilterExpression.hpp"
#include "pm/core/util/LoadJson.hpp"
#include "pm/core/util/NeighborhoodStats.hpp"
#include "pm/core/util/PointCloudIO.hpp"

#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;

static std::string joined(const std::vector<std::string>& items)
{
    std::string out;
    for (const auto& item : items) {
        out += (out.empty() ? "" : ", ") + item;
    }
    return out;
}

int main(int argc, char* argv[])
{
    ///// Parse the command line options /////
    // clang-format off
    po::options_description required("Required arguments");
    required.add_options()
        ("input,i", po::value<std::string>()->required(),
            "Point cloud text file, header line with X Y Z and attribute names")
        ("output,o", po::value<std::string>()->required(),
            "Output CSV file");

    po::options_description optional("Optional arguments");
    optional.add_options()
        ("help,h", "Show this help message")
        ("params,p", po::value<std::string>(),
            "JSON file with run parameters (k, xyz, exclude_self, index, fields, threads, verbose); "
            "command line values take precedence")
        ("k,k", po::value<int>(),
            "Number of nearest neighbors per point (default 8)")
        ("metric,m", po::value<std::string>()->default_value("describe:Z"),
            ("Built-in aggregation: " + joined(pm::stats::availableAggregations())).c_str())
        ("filter,f", po::value<std::string>(),
            "Only compute metrics for points matching e.g. \"ReturnNumber == 1 && Z > 2\"")
        ("no-xyz", po::bool_switch()->default_value(false),
            "Do not prepend X, Y, Z columns")
        ("exclude-self", po::bool_switch()->default_value(false),
            "Leave each point out of its own neighborhood")
        ("threads,t", po::value<int>(),
            "Worker threads (default 1)")
        ("index", po::value<std::string>(),
            "Spatial index: rtree or linear")
        ("verbose,v", po::bool_switch()->default_value(false),
            "Print timing information");
    // clang-format on

    po::options_description all("Usage");
    all.add(required).add(optional);

    po::variables_map parsed;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).run(), parsed);

        if (parsed.count("help") > 0 || argc < 2) {
            std::cout << "pm_point_metrics: per point metrics over k nearest neighbors\n\n";
            std::cout << all << '\n';
            return EXIT_SUCCESS;
        }

        po::notify(parsed);
    } catch (po::error& e) {
        std::cerr << "Error: " << e.what() << '\n';
        std::cerr << "Use --help for usage information\n";
        return EXIT_FAILURE;
    }

    const std::filesystem::path input_path = parsed["input"].as<std::string>();
    const std::filesystem::path output_path = parsed["output"].as<std::string>();

    try {
        pm::PointMetricsParams params;
        if (parsed.count("params")) {
            params = pm::PointMetricsParams::fromJson(pm::json::load_json_file(parsed["params"].as<std::string>()));
        }
        if (parsed.count("k")) params.k = parsed["k"].as<int>();
        if (parsed.count("threads")) params.threads = parsed["threads"].as<int>();
        if (parsed.count("index")) params.index = pm::indexTypeFromString(parsed["index"].as<std::string>());
        if (parsed["no-xyz"].as<bool>()) params.includeCoordinates = false;
        if (parsed["exclude-self"].as<bool>()) params.excludeSelf = true;
        if (parsed["verbose"].as<bool>()) params.verbose = true;

        const pm::Aggregation aggregation = pm::stats::fromString(parsed["metric"].as<std::string>());
        pm::PointPredicate filter;
        if (parsed.count("filter")) {
            filter = pm::parsePredicate(parsed["filter"].as<std::string>());
        }

        const auto t0 = std::chrono::steady_clock::now();
        const pm::PointSet points = pm::readPointSet(input_path);
        std::cout << "Loaded " << points.size() << " points from " << input_path.string();
        if (!points.attributeNames().empty()) {
            std::cout << " (attributes: " << joined(points.attributeNames()) << ")";
        }
        std::cout << std::endl;
        if (params.verbose) {
            std::cout << "Params: " << params.toJson().dump() << std::endl;
        }

        const pm::ResultTable table = pm::computePointMetrics(points, aggregation, params, filter);
        pm::writeCsv(table, output_path);

        const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        std::cout << "Wrote " << table.rows() << " rows x " << table.cols() << " columns to "
                  << output_path.string() << " in " << seconds << "s" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
