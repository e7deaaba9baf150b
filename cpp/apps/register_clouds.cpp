#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>

#include "scapula.hpp"
#include "common/icp_options.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <source.ply> <target.ply> [options]\n";
    scapula_apps::print_icp_usage(std::cerr);
    std::cerr << "  --normalize          Scale both clouds by their bounding-box diagonal\n";
}

const char* state_name(scapula::TerminationState state) {
    return state == scapula::TerminationState::Converged ? "converged" : "max iterations reached";
}

} // namespace


int main(int argc, char* argv[]) {
    try {
        const scapula_apps::Options options = scapula_apps::parse_options(argc, argv);
        if (options.positional.size() != 2) {
            print_usage(argv[0]);
            return 1;
        }

        scapula::PointCloud source = scapula::load_ply(options.positional[0]);
        scapula::PointCloud target = scapula::load_ply(options.positional[1]);
        if (options.normalize) {
            source = scapula::rough_normalize(source);
            target = scapula::rough_normalize(target);
        }

        std::cout << std::string(60, '=') << "\n";
        std::cout << "Rigid registration\n";
        std::cout << std::string(60, '=') << "\n";
        std::cout << "Source: " << options.positional[0] << " (" << source.size() << " points)\n";
        std::cout << "Target: " << options.positional[1] << " (" << target.size() << " points)\n";

        auto start = std::chrono::high_resolution_clock::now();
        const scapula::ICPResult result = scapula::icp_point_to_point(source, target, options.icp);
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);

        const double angle = scapula::angle_between_rotations(
            Eigen::Matrix3d::Identity(), result.transformation.R());

        std::cout << "\nResults:\n";
        std::cout << "  State: " << state_name(result.state) << "\n";
        std::cout << "  Iterations: " << result.num_iterations << "\n";
        if (result.residual_rms) {
            std::cout << "  Residual RMS: " << std::scientific << std::setprecision(6)
                      << *result.residual_rms << "\n";
        }
        std::cout << "  Rotation angle: " << std::fixed << std::setprecision(4)
                  << angle * 180.0 / M_PI << " degrees\n";
        std::cout << "  Time: " << std::fixed << std::setprecision(2)
                  << duration.count() / 1000.0 << " ms\n";
        std::cout << "\nTransform:\n" << std::setprecision(6)
                  << result.transformation.matrix() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
