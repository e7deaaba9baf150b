#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "scapula.hpp"
#include "common/icp_options.hpp"
#include "common/report.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <reference.ply> <scan.ply>... [options]\n";
    scapula_apps::print_icp_usage(std::cerr);
    scapula_apps::print_averaging_usage(std::cerr);
    std::cerr << "  --normalize          Scale every cloud by its bounding-box diagonal\n";
}

} // namespace


int main(int argc, char* argv[]) {
    try {
        const scapula_apps::Options options = scapula_apps::parse_options(argc, argv);
        if (options.positional.size() < 2) {
            print_usage(argv[0]);
            return 1;
        }

        auto load = [&](const std::string& path) {
            scapula::PointCloud cloud = scapula::load_ply(path);
            return options.normalize ? scapula::rough_normalize(cloud) : cloud;
        };

        const scapula::PointCloud reference = load(options.positional[0]);
        std::cout << "Reference: " << options.positional[0] << " (" << reference.size() << " points)\n";

        std::vector<scapula::PointCloud> scans;
        for (size_t i = 1; i < options.positional.size(); ++i) {
            scans.push_back(load(options.positional[i]));
            std::cout << "Scan " << i - 1 << ": " << options.positional[i]
                      << " (" << scans.back().size() << " points)\n";
        }

        auto start = std::chrono::high_resolution_clock::now();
        const std::vector<scapula::ICPResult> results =
            scapula::register_to_reference(reference, scans, options.icp);
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        std::cout << "\nRegistered " << results.size() << " scans in "
                  << duration.count() << " ms\n";
        for (size_t i = 0; i < results.size(); ++i) {
            std::cout << "  [" << i << "] iterations: " << results[i].num_iterations;
            if (results[i].residual_rms) {
                std::cout << ", residual RMS: " << std::scientific << std::setprecision(4)
                          << *results[i].residual_rms << std::defaultfloat;
            }
            std::cout << "\n";
        }

        const scapula::TransformCollection collection =
            scapula::collect_transforms(results, options.positional[0]);
        const scapula::AveragingResult average =
            scapula::average_transforms(collection, options.averaging);

        scapula_apps::print_average(collection.label, collection.transforms.size(), average);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
