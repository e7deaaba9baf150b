#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace scapula {

/**
 * Register every cloud onto a shared reference, one independent ICP run each.
 *
 * Runs that stop at max_iterations are kept and reported on std::cerr.
 * A RegistrationError from any run is rethrown with the cloud index added.
 *
 * @param reference Target cloud shared by all runs
 * @param clouds Moving clouds, results keep this order
 * @param config Settings applied to every run
 */
std::vector<ICPResult> register_to_reference(
    const PointCloud& reference,
    const std::vector<PointCloud>& clouds,
    const ICPConfig& config = ICPConfig()
);


/**
 * Gather the transforms of a batch under one label.
 */
TransformCollection collect_transforms(
    const std::vector<ICPResult>& results,
    const std::string& label
);

} // namespace scapula
