#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "homogeneous.hpp"
#include "nearest_neighbor.hpp"
#include "svd.hpp"
#include "types.hpp"

namespace scapula {

/**
 * Subsampling stride so that about target_count points remain.
 */
inline int subsample_stride(size_t total_points, int target_count) {
    if (target_count <= 0) {
        throw std::invalid_argument("target point count must be positive, got " +
                                    std::to_string(target_count));
    }
    const size_t stride = total_points / static_cast<size_t>(target_count);
    return stride > 1 ? static_cast<int>(stride) : 1;
}


/**
 * Squared Frobenius distance of a step transform to the identity.
 */
inline double step_metric(const Transformation& step) {
    return (Eigen::Matrix4d::Identity() - step.matrix()).squaredNorm();
}


/**
 * Point-to-Point ICP registration.
 *
 * The source is centred on its centroid before iterating, so
 * config.initial_transform is a guess for the centred source. Each iteration
 * solves Kabsch on the current correspondences and left-multiplies the step
 * onto the accumulated transform. The loop stops when the step metric
 * ||I - step||_F^2, or its change since the previous iteration, drops below
 * config.tolerance, or after config.max_iterations.
 *
 * Without share_indices both clouds are strided down to roughly
 * target_point_count_{source,target} points and matched by nearest neighbor.
 * With share_indices row i of source is paired with row i of target.
 *
 * @param source Cloud to move
 * @param target Reference cloud
 * @param config Algorithm parameters
 * @return Transform mapping original source coordinates onto target
 * @throws RegistrationError on empty/degenerate input, std::invalid_argument on bad config
 */
inline ICPResult icp_point_to_point(
    const PointCloud& source,
    const PointCloud& target,
    const ICPConfig& config = ICPConfig{}
) {
    using Matrix = PointCloud::Matrix;

    if (config.max_iterations < 0) {
        throw std::invalid_argument("max_iterations must be non-negative");
    }
    if (!(config.tolerance >= 0.0)) {
        throw std::invalid_argument("tolerance must be non-negative");
    }
    if (target.empty()) {
        throw RegistrationError(ErrorCode::EmptyReferenceSet, "target cloud is empty");
    }
    if (source.size() < 3) {
        throw RegistrationError(ErrorCode::InsufficientCorrespondences,
                                "source cloud has " + std::to_string(source.size()) +
                                " points, need at least 3");
    }
    if (config.share_indices && source.size() != target.size()) {
        throw RegistrationError(ErrorCode::InsufficientCorrespondences,
                                "share_indices requires clouds of equal size (" +
                                std::to_string(source.size()) + " vs " +
                                std::to_string(target.size()) + ")");
    }

    // Initializing: centre the moving cloud
    const Eigen::Vector3d source_mean = source.centroid();
    Eigen::RowVector4d mean_h;
    mean_h << source_mean.transpose(), 1.0;
    const PointCloud centred =
        PointCloud::from_homogeneous(subtract_homogeneous(source.homogeneous(), mean_h));

    int source_stride = 1;
    int target_stride = 1;
    if (!config.share_indices) {
        source_stride = subsample_stride(source.size(), config.target_point_count_source);
        target_stride = subsample_stride(target.size(), config.target_point_count_target);
    }
    const PointCloud moving = centred.strided(source_stride);
    const PointCloud reference = target.strided(target_stride);

    std::unique_ptr<NearestNeighborIndex> nn_index;
    if (!config.share_indices) {
        nn_index = make_nearest_neighbor_index(config.neighbor_search, reference.points());
    }

    // Copy, the caller's guess is never modified
    Transformation total_transform = config.initial_transform;

    ICPResult result;
    double prev_metric = std::numeric_limits<double>::infinity();

    for (int iter = 0; iter < config.max_iterations; ++iter) {
        const Matrix current = total_transform.apply(moving).points();

        Transformation step;
        if (config.share_indices) {
            step = estimate_transformation(current, reference.points());
        } else {
            const Correspondences matches = nn_index->query(current);
            Matrix target_matched(static_cast<Eigen::Index>(matches.size()), 3);
            for (size_t i = 0; i < matches.size(); ++i) {
                target_matched.row(i) = reference.points().row(matches.indices[i]);
            }
            step = estimate_transformation(current, target_matched);
        }

        total_transform = step * total_transform;

        const double metric = step_metric(step);
        result.metric_history.push_back(metric);
        result.num_iterations = iter + 1;

        if (metric < config.tolerance || std::abs(prev_metric - metric) < config.tolerance) {
            result.state = TerminationState::Converged;
            break;
        }
        prev_metric = metric;
    }

    if (config.compute_residual) {
        const Matrix aligned = total_transform.apply(moving).points();
        const Correspondences matches = nn_index
            ? nn_index->query(aligned)
            : BruteForceIndex(reference.points()).query(aligned);
        result.residual_rms = matches.rms();
    }

    // Re-express for the uncentred source
    total_transform.set_translation(total_transform.t() - total_transform.R() * source_mean);
    result.transformation = total_transform;

    return result;
}

} // namespace scapula
