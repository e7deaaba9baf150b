#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace scapula {

/**
 * Invert a rigid homogeneous matrix:
 *   [R^T , -R^T * t]
 *   [ 0  ,     1   ]
 */
inline Eigen::Matrix4d invert_rigid(const Eigen::Matrix4d& T) {
    Eigen::Matrix4d out = Eigen::Matrix4d::Identity();
    out.block<3, 3>(0, 0) = T.block<3, 3>(0, 0).transpose();
    out.block<3, 1>(0, 3) = -out.block<3, 3>(0, 0) * T.block<3, 1>(0, 3);
    return out;
}


/**
 * Transformation from system 1 to system 2: T1^-1 * T2.
 *
 * @param T1 Origin coordinate system (4x4)
 * @param T2 Destination coordinate system (4x4)
 */
inline Eigen::Matrix4d compose_rigid(const Eigen::Matrix4d& T1, const Eigen::Matrix4d& T2) {
    return invert_rigid(T1) * T2;
}

inline Transformation compose_rigid(const Transformation& T1, const Transformation& T2) {
    return Transformation(compose_rigid(T1.matrix(), T2.matrix()));
}


/**
 * Row-wise a - b on homogeneous Nx4 points; the 4th column is forced to 1.
 */
inline PointCloud::HomogeneousMatrix subtract_homogeneous(
    const PointCloud::HomogeneousMatrix& a,
    const PointCloud::HomogeneousMatrix& b
) {
    if (a.rows() != b.rows()) {
        throw std::invalid_argument(
            "subtract_homogeneous: row count mismatch (" + std::to_string(a.rows()) +
            " vs " + std::to_string(b.rows()) + ")");
    }
    PointCloud::HomogeneousMatrix out = a - b;
    out.col(3).setOnes();
    return out;
}

// Broadcast variant: subtracts the same point from every row
inline PointCloud::HomogeneousMatrix subtract_homogeneous(
    const PointCloud::HomogeneousMatrix& a,
    const Eigen::RowVector4d& b
) {
    PointCloud::HomogeneousMatrix out = a.rowwise() - b;
    out.col(3).setOnes();
    return out;
}


/**
 * Rotation matrix from intrinsic Euler angles.
 *
 * Elementary rotations are multiplied left to right in sequence order,
 * e.g. "zyx" gives Rz(a0) * Ry(a1) * Rx(a2).
 *
 * @param angles One angle (radians) per character of sequence
 * @param sequence Axis letters among 'x', 'y', 'z'
 * @throws std::invalid_argument on unknown axis or size mismatch
 */
inline Eigen::Matrix3d from_euler(const Eigen::VectorXd& angles, const std::string& sequence) {
    if (static_cast<size_t>(angles.size()) != sequence.size()) {
        throw std::invalid_argument("from_euler: " + std::to_string(angles.size()) +
                                    " angles for sequence '" + sequence + "'");
    }

    Eigen::Matrix3d out = Eigen::Matrix3d::Identity();
    for (size_t i = 0; i < sequence.size(); ++i) {
        const double angle = angles(static_cast<Eigen::Index>(i));
        Eigen::Vector3d axis;
        switch (sequence[i]) {
            case 'x': axis = Eigen::Vector3d::UnitX(); break;
            case 'y': axis = Eigen::Vector3d::UnitY(); break;
            case 'z': axis = Eigen::Vector3d::UnitZ(); break;
            default:
                throw std::invalid_argument(std::string("from_euler: unknown axis '") +
                                            sequence[i] + "'");
        }
        out = out * Eigen::AngleAxisd(angle, axis).toRotationMatrix();
    }
    return out;
}

inline Transformation from_euler_homogeneous(const Eigen::VectorXd& angles, const std::string& sequence) {
    return Transformation::from_rt(from_euler(angles, sequence), Eigen::Vector3d::Zero());
}


/**
 * Scale a cloud by the diagonal of its axis-aligned bounding box.
 * Brings scans of different sizes to a comparable magnitude before
 * registration; the result is not centred.
 */
inline PointCloud rough_normalize(const PointCloud& cloud) {
    if (cloud.empty()) {
        throw RegistrationError(ErrorCode::NumericDegeneracy, "rough_normalize: empty cloud");
    }
    const Eigen::RowVector3d range =
        cloud.points().colwise().maxCoeff() - cloud.points().colwise().minCoeff();
    const double scale = range.norm();
    if (!(scale > 0.0) || !std::isfinite(scale)) {
        throw RegistrationError(ErrorCode::NumericDegeneracy,
                                "rough_normalize: cloud has no spatial extent");
    }
    return PointCloud(PointCloud::Matrix(cloud.points() / scale));
}

} // namespace scapula
