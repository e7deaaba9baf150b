#pragma once

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "scapula/averaging.hpp"
#include "scapula/types.hpp"

namespace scapula_apps {

/**
 * Flags shared by the command-line tools. Anything not starting with "--"
 * is collected as a positional argument.
 */
struct Options {
    scapula::ICPConfig icp;
    scapula::AveragingConfig averaging;
    bool normalize = false;
    std::vector<std::string> positional;
};

inline void print_icp_usage(std::ostream& os) {
    os << "  --max-iterations N   ICP iteration cap (default 100)\n"
       << "  --tolerance T        Convergence threshold (default 1e-6)\n"
       << "  --points1 N          Source subsampling target (default 3000)\n"
       << "  --points2 N          Target subsampling target (default 3000)\n"
       << "  --share-indices      Rows correspond one to one, skip neighbor search\n"
       << "  --kdtree             Use the KD-tree neighbor search\n"
       << "  --residual           Report RMS residual after alignment\n";
}

inline void print_averaging_usage(std::ostream& os) {
    os << "  --dispersion         Report rotation/translation standard deviation\n"
       << "  --geodesic           Karcher mean instead of chordal mean\n";
}

inline Options parse_options(int argc, char* argv[]) {
    Options options;

    auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--max-iterations") {
            options.icp.max_iterations = std::stoi(next_value(i, arg));
        } else if (arg == "--tolerance") {
            options.icp.tolerance = std::stod(next_value(i, arg));
        } else if (arg == "--points1") {
            options.icp.target_point_count_source = std::stoi(next_value(i, arg));
        } else if (arg == "--points2") {
            options.icp.target_point_count_target = std::stoi(next_value(i, arg));
        } else if (arg == "--share-indices") {
            options.icp.share_indices = true;
        } else if (arg == "--kdtree") {
            options.icp.neighbor_search = scapula::NeighborSearch::KDTree;
        } else if (arg == "--residual") {
            options.icp.compute_residual = true;
        } else if (arg == "--dispersion") {
            options.averaging.compute_dispersion = true;
        } else if (arg == "--geodesic") {
            options.averaging.rotation_mean = scapula::RotationMean::Geodesic;
        } else if (arg == "--normalize") {
            options.normalize = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("Unknown option " + arg);
        } else {
            options.positional.push_back(arg);
        }
    }

    return options;
}

} // namespace scapula_apps
