#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <random>

#include "scapula/types.hpp"

namespace scapula_test {

/// Uniform random points in [-scale, scale]^3
inline scapula::PointCloud random_cloud(int n, double scale = 1.0, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(-scale, scale);

    scapula::PointCloud::Matrix points(n, 3);
    for (int i = 0; i < n; ++i) {
        points(i, 0) = dist(rng);
        points(i, 1) = dist(rng);
        points(i, 2) = dist(rng);
    }
    return scapula::PointCloud(std::move(points));
}

/// Anisotropic blob, elongated along x, so nearest-neighbor ICP has a unique optimum
inline scapula::PointCloud ellipsoid_cloud(int n, unsigned seed = 7) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> dist(0.0, 1.0);

    scapula::PointCloud::Matrix points(n, 3);
    for (int i = 0; i < n; ++i) {
        points(i, 0) = 3.0 * dist(rng);
        points(i, 1) = 1.5 * dist(rng);
        points(i, 2) = 0.5 * dist(rng);
    }
    return scapula::PointCloud(std::move(points));
}

inline Eigen::Matrix3d rotation(double angle, const Eigen::Vector3d& axis) {
    return Eigen::AngleAxisd(angle, axis.normalized()).toRotationMatrix();
}

inline scapula::Transformation rigid(double angle, const Eigen::Vector3d& axis, const Eigen::Vector3d& t) {
    return scapula::Transformation::from_rt(rotation(angle, axis), t);
}

/// Unit cube corners, 8 points
inline scapula::PointCloud unit_cube() {
    scapula::PointCloud::Matrix points(8, 3);
    points << 0, 0, 0,
              1, 0, 0,
              0, 1, 0,
              1, 1, 0,
              0, 0, 1,
              1, 0, 1,
              0, 1, 1,
              1, 1, 1;
    return scapula::PointCloud(std::move(points));
}

} // namespace scapula_test
