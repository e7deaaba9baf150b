#pragma once

#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>

#include "scapula/averaging.hpp"

namespace scapula_apps {

inline void print_average(const std::string& label, size_t count, const scapula::AveragingResult& average) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Average of " << count << " transforms";
    if (!label.empty()) {
        std::cout << " (" << label << ")";
    }
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << std::fixed << std::setprecision(4) << average.mean.matrix() << "\n";

    if (average.dispersion) {
        std::cout << "\nDispersion:\n";
        std::cout << "  Rotation SD: " << std::setprecision(4)
                  << average.dispersion->rotation_std * 180.0 / M_PI << " degrees\n";
        std::cout << "  Translation SD: " << std::setprecision(6)
                  << average.dispersion->translation_std << "\n";
        for (size_t i = 0; i < average.angular_deviations.size(); ++i) {
            std::cout << "  [" << i << "] angle to mean: " << std::setprecision(4)
                      << average.angular_deviations[i] * 180.0 / M_PI << " degrees\n";
        }
    }
}

} // namespace scapula_apps
