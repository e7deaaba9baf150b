#include "scapula/averaging.hpp"
#include "scapula/errors.hpp"
#include "scapula/svd.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include <gtsam/geometry/Rot3.h>
#include <gtsam/slam/KarcherMeanFactor-inl.h>

namespace scapula {

namespace {

Eigen::Matrix3d chordal_mean(const std::vector<Transformation>& transforms) {
    Eigen::Matrix3d sum = Eigen::Matrix3d::Zero();
    for (const auto& T : transforms) {
        sum += T.R();
    }
    // Throws NumericDegeneracy when the rotations cancel out
    return project_to_rotation(sum / static_cast<double>(transforms.size()));
}

Eigen::Matrix3d geodesic_mean(const std::vector<Transformation>& transforms) {
    std::vector<gtsam::Rot3, Eigen::aligned_allocator<gtsam::Rot3>> rotations;
    rotations.reserve(transforms.size());
    for (const auto& T : transforms) {
        rotations.emplace_back(T.R());
    }

    const Eigen::Matrix3d mean = gtsam::FindKarcherMean<gtsam::Rot3>(rotations).matrix();
    if (!mean.allFinite()) {
        throw RegistrationError(ErrorCode::NumericDegeneracy, "Karcher mean did not converge");
    }
    return mean;
}

} // namespace

// ============================================================================
// Statistics helpers
// ============================================================================

double angle_between_rotations(const Eigen::Matrix3d& rotation1, const Eigen::Matrix3d& rotation2) {
    const double cos_angle = ((rotation1.transpose() * rotation2).trace() - 1.0) / 2.0;
    return std::acos(std::max(-1.0, std::min(1.0, cos_angle)));
}

double population_std(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= static_cast<double>(values.size());

    double var = 0.0;
    for (double v : values) var += (v - mean) * (v - mean);
    var /= static_cast<double>(values.size());

    return std::sqrt(var);
}

// ============================================================================
// Averaging
// ============================================================================

AveragingResult average_transforms(
    const std::vector<Transformation>& transforms,
    const AveragingConfig& config
) {
    if (transforms.empty()) {
        throw RegistrationError(ErrorCode::EmptyCollection, "cannot average zero transforms");
    }

    const Eigen::Matrix3d rotation = config.rotation_mean == RotationMean::Geodesic
        ? geodesic_mean(transforms)
        : chordal_mean(transforms);

    Eigen::Vector3d translation = Eigen::Vector3d::Zero();
    for (const auto& T : transforms) {
        translation += T.t();
    }
    translation /= static_cast<double>(transforms.size());

    AveragingResult result;
    result.mean = Transformation::from_rt(rotation, translation);

    if (!config.compute_dispersion) {
        return result;
    }

    std::vector<double> norms;
    norms.reserve(transforms.size());
    result.angular_deviations.reserve(transforms.size());
    for (const auto& T : transforms) {
        result.angular_deviations.push_back(angle_between_rotations(T.R(), rotation));
        norms.push_back(T.t().norm());
    }

    DispersionSummary dispersion;
    dispersion.rotation_std = population_std(result.angular_deviations);
    dispersion.translation_std = population_std(norms);
    result.dispersion = dispersion;

    return result;
}

AveragingResult average_transforms(
    const TransformCollection& collection,
    const AveragingConfig& config
) {
    if (collection.transforms.empty()) {
        throw RegistrationError(ErrorCode::EmptyCollection,
                                "collection '" + collection.label + "' is empty");
    }
    return average_transforms(collection.transforms, config);
}

} // namespace scapula
