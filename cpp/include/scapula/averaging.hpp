#pragma once

#include <Eigen/Dense>
#include <optional>
#include <vector>

#include "types.hpp"

namespace scapula {

/**
 * How the rotation blocks are averaged.
 *
 * Chordal: entry-wise mean projected back onto SO(3) with an SVD. This
 *   minimizes the sum of squared Frobenius (chordal) distances, which is a
 *   good approximation of the geodesic mean only while the rotations are
 *   close together.
 * Geodesic: Karcher mean on SO(3), minimizing the sum of squared rotation
 *   angles to the inputs.
 */
enum class RotationMean {
    Chordal,
    Geodesic
};

struct AveragingConfig {
    bool compute_dispersion = false;
    RotationMean rotation_mean = RotationMean::Chordal;
};

struct AveragingResult {
    Transformation mean;
    std::optional<DispersionSummary> dispersion;
    std::vector<double> angular_deviations;  // Filled with dispersion, radians
};


/**
 * Angle (radians) of the relative rotation R1^T * R2.
 * The arccos argument is clamped to [-1, 1].
 */
double angle_between_rotations(const Eigen::Matrix3d& rotation1, const Eigen::Matrix3d& rotation2);


/**
 * Mean of a set of rigid transforms: rotation mean per config.rotation_mean,
 * arithmetic mean of the translations.
 *
 * With compute_dispersion, also reports the population standard deviation of
 * the per-transform angles to the mean rotation and of the translation norms.
 *
 * @throws RegistrationError EmptyCollection for an empty input
 * @throws RegistrationError NumericDegeneracy when the rotations cancel out
 */
AveragingResult average_transforms(
    const std::vector<Transformation>& transforms,
    const AveragingConfig& config = AveragingConfig()
);

AveragingResult average_transforms(
    const TransformCollection& collection,
    const AveragingConfig& config = AveragingConfig()
);


/**
 * Population standard deviation; 0 for fewer than two values.
 */
double population_std(const std::vector<double>& values);

} // namespace scapula
