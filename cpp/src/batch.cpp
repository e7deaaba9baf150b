#include "scapula/batch.hpp"
#include "scapula/errors.hpp"
#include "scapula/point_to_point.hpp"

#include <iostream>

namespace scapula {

std::vector<ICPResult> register_to_reference(
    const PointCloud& reference,
    const std::vector<PointCloud>& clouds,
    const ICPConfig& config
) {
    std::vector<ICPResult> results;
    results.reserve(clouds.size());

    int unconverged = 0;
    for (size_t i = 0; i < clouds.size(); ++i) {
        try {
            results.push_back(icp_point_to_point(clouds[i], reference, config));
        } catch (const RegistrationError& e) {
            throw RegistrationError(e.code(), "cloud " + std::to_string(i) + ": " + e.message());
        }

        if (!results.back().converged()) {
            std::cerr << "Warning: cloud " << i << " did not converge after "
                      << results.back().num_iterations << " iterations\n";
            unconverged++;
        }
    }

    if (unconverged > 0) {
        std::cerr << "  Unconverged: " << unconverged << " / " << clouds.size() << "\n";
    }

    return results;
}

TransformCollection collect_transforms(
    const std::vector<ICPResult>& results,
    const std::string& label
) {
    TransformCollection collection;
    collection.label = label;
    collection.transforms.reserve(results.size());
    for (const auto& result : results) {
        collection.transforms.push_back(result.transformation);
    }
    return collection;
}

} // namespace scapula
