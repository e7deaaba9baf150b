#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace scapula {

/**
 * Point cloud represented as Nx3 Eigen matrix.
 * Each row is a point [x, y, z].
 */
class PointCloud {
public:
    using Matrix = Eigen::Matrix<double, Eigen::Dynamic, 3, Eigen::RowMajor>;
    using HomogeneousMatrix = Eigen::Matrix<double, Eigen::Dynamic, 4, Eigen::RowMajor>;
    using Vector3 = Eigen::Vector3d;

    PointCloud() = default;

    explicit PointCloud(const Matrix& points) : points_(points) {}

    explicit PointCloud(Matrix&& points) : points_(std::move(points)) {}

    // Drops the homogeneous coordinate
    static PointCloud from_homogeneous(const HomogeneousMatrix& points) {
        return PointCloud(Matrix(points.leftCols<3>()));
    }

    const Matrix& points() const { return points_; }

    size_t size() const { return static_cast<size_t>(points_.rows()); }
    bool empty() const { return points_.rows() == 0; }

    auto row(int i) const { return points_.row(i); }

    Vector3 centroid() const {
        return points_.colwise().mean().transpose();
    }

    // Nx4 copy with the 4th coordinate set to 1
    HomogeneousMatrix homogeneous() const {
        HomogeneousMatrix out(points_.rows(), 4);
        out.leftCols<3>() = points_;
        out.col(3).setOnes();
        return out;
    }

    /**
     * Every stride-th point, starting at index 0.
     */
    PointCloud strided(int stride) const {
        if (stride <= 1) {
            return *this;
        }
        const Eigen::Index n = (points_.rows() + stride - 1) / stride;
        Matrix out(n, 3);
        for (Eigen::Index i = 0; i < n; ++i) {
            out.row(i) = points_.row(i * stride);
        }
        return PointCloud(std::move(out));
    }

private:
    Matrix points_;
};


/**
 * Rigid transformation in 3D, stored as 4x4 homogeneous matrix.
 */
class Transformation {
public:
    using Matrix4 = Eigen::Matrix4d;
    using Matrix3 = Eigen::Matrix3d;
    using Vector3 = Eigen::Vector3d;

    Transformation() : matrix_(Matrix4::Identity()) {}

    explicit Transformation(const Matrix4& matrix) : matrix_(matrix) {}

    static Transformation from_rt(const Matrix3& R, const Vector3& t) {
        Matrix4 mat = Matrix4::Identity();
        mat.block<3, 3>(0, 0) = R;
        mat.block<3, 1>(0, 3) = t;
        return Transformation(mat);
    }

    static Transformation identity() {
        return Transformation();
    }

    const Matrix4& matrix() const { return matrix_; }

    Matrix3 R() const { return matrix_.block<3, 3>(0, 0); }
    Vector3 t() const { return matrix_.block<3, 1>(0, 3); }

    void set_translation(const Vector3& t) { matrix_.block<3, 1>(0, 3) = t; }

    Vector3 apply(const Vector3& p) const {
        return R() * p + t();
    }

    PointCloud apply(const PointCloud& cloud) const {
        // P_transformed = P * R^T + t^T (row-wise)
        PointCloud::Matrix transformed =
            (cloud.points() * R().transpose()).rowwise() + t().transpose();
        return PointCloud(std::move(transformed));
    }

    // this applied after other
    Transformation operator*(const Transformation& other) const {
        return Transformation(matrix_ * other.matrix_);
    }

    Transformation inverse() const {
        Matrix3 R_inv = R().transpose();
        Vector3 t_inv = -R_inv * t();
        return from_rt(R_inv, t_inv);
    }

    /**
     * True when the rotation block is orthonormal with det +1 and the
     * bottom row is [0 0 0 1], all within tol.
     */
    bool is_rigid(double tol = 1e-9) const {
        const Matrix3 rot = R();
        if (!(rot.transpose() * rot).isApprox(Matrix3::Identity(), tol)) {
            return false;
        }
        if (std::abs(rot.determinant() - 1.0) > tol) {
            return false;
        }
        return matrix_.row(3).isApprox(Eigen::RowVector4d(0, 0, 0, 1), tol);
    }

private:
    Matrix4 matrix_;
};


/**
 * Nearest-neighbor search backends.
 */
enum class NeighborSearch {
    BruteForce,
    KDTree
};


/**
 * Point-to-point ICP configuration.
 */
struct ICPConfig {
    int max_iterations = 100;
    double tolerance = 1e-6;              // Threshold on the change of the step metric
    int target_point_count_source = 3000; // Subsampling targets, ignored when share_indices
    int target_point_count_target = 3000;
    bool share_indices = false;           // Row i of source matches row i of target
    Transformation initial_transform = Transformation::identity();
    bool compute_residual = false;
    NeighborSearch neighbor_search = NeighborSearch::BruteForce;
};


enum class TerminationState {
    Converged,
    MaxIterationsReached
};


/**
 * Result of ICP registration.
 */
struct ICPResult {
    Transformation transformation;
    TerminationState state = TerminationState::MaxIterationsReached;
    int num_iterations = 0;
    std::vector<double> metric_history;  // ||I - step||_F^2 per iteration
    std::optional<double> residual_rms;

    bool converged() const { return state == TerminationState::Converged; }
};


/**
 * Ordered transforms sharing a semantic label.
 */
struct TransformCollection {
    std::string label;
    std::vector<Transformation> transforms;
};


/**
 * Rotation (radians) and translation (cloud units) standard deviations.
 */
struct DispersionSummary {
    double rotation_std = 0.0;
    double translation_std = 0.0;
};

} // namespace scapula
