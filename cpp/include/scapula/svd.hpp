#pragma once

#include <Eigen/Dense>
#include <Eigen/SVD>
#include <cmath>
#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace scapula {

/**
 * Relative threshold under which a singular value counts as zero.
 */
constexpr double kRankTolerance = 1e-10;

/**
 * True when the 3x3 matrix behind these (descending) singular values has
 * rank below 2. With rank 2 the third direction is fixed by the
 * orthonormality constraint, below that the rotation is not unique.
 */
inline bool is_rank_deficient(const Eigen::Vector3d& singular_values) {
    const double largest = singular_values(0);
    if (!(largest > 0.0)) {
        return true;
    }
    return singular_values(1) <= kRankTolerance * largest;
}


/**
 * Nearest rotation (Frobenius norm) to an arbitrary 3x3 matrix:
 * M = U S V^T  ->  U V^T, with the last column of U negated when the
 * product would be a reflection.
 *
 * @throws RegistrationError NumericDegeneracy when M has rank < 2 or is not finite
 */
inline Eigen::Matrix3d project_to_rotation(const Eigen::Matrix3d& M) {
    if (!M.allFinite()) {
        throw RegistrationError(ErrorCode::NumericDegeneracy, "matrix has non-finite entries");
    }

    Eigen::JacobiSVD<Eigen::Matrix3d> svd(M, Eigen::ComputeFullU | Eigen::ComputeFullV);
    if (is_rank_deficient(svd.singularValues())) {
        throw RegistrationError(ErrorCode::NumericDegeneracy,
                                "matrix is rank deficient, nearest rotation is not unique");
    }

    Eigen::Matrix3d U = svd.matrixU();
    const Eigen::Matrix3d V = svd.matrixV();

    Eigen::Matrix3d R = U * V.transpose();
    if (R.determinant() < 0) {
        U.col(2) *= -1;
        R = U * V.transpose();
    }
    return R;
}


/**
 * Compute optimal rigid transformation aligning source to target (Kabsch).
 *
 * Uses SVD closed-form solution:
 *   1. Center both point sets
 *   2. Compute cross-covariance H = Σ (p_i - p̄)(q_i - q̄)ᵀ
 *   3. SVD: H = UΣVᵀ
 *   4. R = VUᵀ (with reflection correction)
 *   5. t = q̄ - R * p̄
 *
 * @param source_points Nx3 matrix of source points
 * @param target_points Nx3 matrix of corresponding target points
 * @return Transformation aligning source to target, det(R) = +1
 * @throws RegistrationError InsufficientCorrespondences if sizes differ or N < 3
 * @throws RegistrationError NumericDegeneracy if the points are collinear or coincident
 */
inline Transformation estimate_transformation(
    const PointCloud::Matrix& source_points,
    const PointCloud::Matrix& target_points
) {
    using Vector3 = Eigen::Vector3d;
    using Matrix3 = Eigen::Matrix3d;

    const Eigen::Index n = source_points.rows();
    if (n != target_points.rows()) {
        throw RegistrationError(ErrorCode::InsufficientCorrespondences,
                                "point sets differ in size (" + std::to_string(n) + " vs " +
                                std::to_string(target_points.rows()) + ")");
    }
    if (n < 3) {
        throw RegistrationError(ErrorCode::InsufficientCorrespondences,
                                "need at least 3 correspondences, got " + std::to_string(n));
    }
    if (!source_points.allFinite() || !target_points.allFinite()) {
        throw RegistrationError(ErrorCode::NumericDegeneracy, "point sets contain non-finite values");
    }

    Vector3 p_centroid = source_points.colwise().mean().transpose();
    Vector3 q_centroid = target_points.colwise().mean().transpose();

    PointCloud::Matrix p_centered = source_points.rowwise() - p_centroid.transpose();
    PointCloud::Matrix q_centered = target_points.rowwise() - q_centroid.transpose();

    // H = P^T * Q
    Matrix3 H = p_centered.transpose() * q_centered;

    Eigen::JacobiSVD<Matrix3> svd(H, Eigen::ComputeFullU | Eigen::ComputeFullV);
    if (is_rank_deficient(svd.singularValues())) {
        throw RegistrationError(ErrorCode::NumericDegeneracy,
                                "cross-covariance is rank deficient (collinear or coincident points)");
    }
    Matrix3 U = svd.matrixU();
    Matrix3 V = svd.matrixV();

    Matrix3 R = V * U.transpose();

    // Reflection case (det = -1)
    if (R.determinant() < 0) {
        V.col(2) *= -1;
        R = V * U.transpose();
    }

    Vector3 t = q_centroid - R * p_centroid;

    return Transformation::from_rt(R, t);
}


/**
 * RMS distance between paired rows.
 * Optionally applies transformation to source first.
 */
inline double compute_rms_error(
    const PointCloud::Matrix& source_points,
    const PointCloud::Matrix& target_points,
    const Transformation* transform = nullptr
) {
    if (source_points.rows() != target_points.rows()) {
        throw RegistrationError(ErrorCode::InsufficientCorrespondences,
                                "compute_rms_error: point sets differ in size");
    }
    if (source_points.rows() == 0) {
        return 0.0;
    }

    PointCloud::Matrix src = source_points;
    if (transform) {
        src = (source_points * transform->R().transpose()).rowwise()
              + transform->t().transpose();
    }

    const double mse = (src - target_points).rowwise().squaredNorm().mean();
    return std::sqrt(mse);
}

} // namespace scapula
