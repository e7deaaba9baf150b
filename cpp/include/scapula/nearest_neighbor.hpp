#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace scapula {

/**
 * Closest reference point for every query point.
 * indices[i] is the row of the reference cloud nearest to query row i,
 * squared_distances[i] its squared Euclidean distance.
 */
struct Correspondences {
    std::vector<int> indices;
    std::vector<double> squared_distances;

    size_t size() const { return indices.size(); }

    double rms() const {
        if (squared_distances.empty()) return 0.0;
        double sum = 0.0;
        for (double d : squared_distances) sum += d;
        return std::sqrt(sum / static_cast<double>(squared_distances.size()));
    }
};


// Shared by every backend so equal inputs give bit-identical distances
inline double squared_distance(double ax, double ay, double az, double bx, double by, double bz) {
    const double dx = ax - bx;
    const double dy = ay - by;
    const double dz = az - bz;
    return dx * dx + dy * dy + dz * dz;
}


/**
 * Nearest-neighbor query over a fixed reference cloud.
 *
 * Implementations must agree exactly: among equidistant reference points
 * the smallest index wins.
 */
class NearestNeighborIndex {
public:
    virtual ~NearestNeighborIndex() = default;

    virtual Correspondences query(const PointCloud::Matrix& queries) const = 0;

    virtual size_t size() const = 0;
};


/**
 * O(N*M) linear scan over the reference set.
 */
class BruteForceIndex : public NearestNeighborIndex {
public:
    explicit BruteForceIndex(const PointCloud::Matrix& reference) : reference_(reference) {
        if (reference_.rows() == 0) {
            throw RegistrationError(ErrorCode::EmptyReferenceSet,
                                    "nearest neighbor search needs at least one reference point");
        }
    }

    Correspondences query(const PointCloud::Matrix& queries) const override {
        const int n = static_cast<int>(queries.rows());
        const int m = static_cast<int>(reference_.rows());

        Correspondences out;
        out.indices.resize(n);
        out.squared_distances.resize(n);

        for (int i = 0; i < n; ++i) {
            int best_idx = 0;
            double best_dist_sq = std::numeric_limits<double>::infinity();
            for (int j = 0; j < m; ++j) {
                const double dist_sq = squared_distance(
                    reference_(j, 0), reference_(j, 1), reference_(j, 2),
                    queries(i, 0), queries(i, 1), queries(i, 2));
                if (dist_sq < best_dist_sq) {
                    best_dist_sq = dist_sq;
                    best_idx = j;
                }
            }
            out.indices[i] = best_idx;
            out.squared_distances[i] = best_dist_sq;
        }
        return out;
    }

    size_t size() const override { return static_cast<size_t>(reference_.rows()); }

private:
    PointCloud::Matrix reference_;
};


/**
 * KD-Tree for 3D nearest neighbor search.
 *
 * Ties resolve to the smallest reference index, so results match
 * BruteForceIndex bit for bit.
 */
class KDTreeIndex : public NearestNeighborIndex {
public:
    using Vector3 = Eigen::Vector3d;

    explicit KDTreeIndex(const PointCloud::Matrix& reference) {
        const int n = static_cast<int>(reference.rows());
        if (n == 0) {
            throw RegistrationError(ErrorCode::EmptyReferenceSet,
                                    "nearest neighbor search needs at least one reference point");
        }

        points_.resize(n);
        std::vector<int> indices(n);
        for (int i = 0; i < n; ++i) {
            points_[i] = reference.row(i).transpose();
            indices[i] = i;
        }

        root_ = build(indices, 0, n, 0);
    }

    /**
     * Nearest neighbor for a single point.
     * Returns (index, squared_distance).
     */
    std::pair<int, double> nearest(const Vector3& query) const {
        int best_idx = -1;
        double best_dist_sq = std::numeric_limits<double>::infinity();
        search_nearest(root_.get(), query, best_idx, best_dist_sq);
        return {best_idx, best_dist_sq};
    }

    Correspondences query(const PointCloud::Matrix& queries) const override {
        const int n = static_cast<int>(queries.rows());

        Correspondences out;
        out.indices.resize(n);
        out.squared_distances.resize(n);

        for (int i = 0; i < n; ++i) {
            auto [idx, dist_sq] = nearest(queries.row(i).transpose());
            out.indices[i] = idx;
            out.squared_distances[i] = dist_sq;
        }
        return out;
    }

    size_t size() const override { return points_.size(); }

private:
    struct Node {
        int point_idx;
        int split_dim;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;

        Node(int idx, int dim) : point_idx(idx), split_dim(dim) {}
    };

    std::vector<Vector3> points_;
    std::unique_ptr<Node> root_;

    std::unique_ptr<Node> build(std::vector<int>& indices, int start, int end, int depth) {
        if (start >= end) return nullptr;

        const int dim = depth % 3;

        // Median split; equal coordinates may land on either side, search
        // handles that by visiting the far side when the plane is not farther
        const int mid = start + (end - start) / 2;
        std::nth_element(
            indices.begin() + start,
            indices.begin() + mid,
            indices.begin() + end,
            [this, dim](int a, int b) {
                if (points_[a](dim) != points_[b](dim)) {
                    return points_[a](dim) < points_[b](dim);
                }
                return a < b;
            }
        );

        auto node = std::make_unique<Node>(indices[mid], dim);
        node->left = build(indices, start, mid, depth + 1);
        node->right = build(indices, mid + 1, end, depth + 1);

        return node;
    }

    void search_nearest(
        const Node* node,
        const Vector3& query,
        int& best_idx,
        double& best_dist_sq
    ) const {
        if (!node) return;

        const Vector3& p = points_[node->point_idx];
        const double dist_sq = squared_distance(p.x(), p.y(), p.z(), query.x(), query.y(), query.z());
        if (dist_sq < best_dist_sq || (dist_sq == best_dist_sq && node->point_idx < best_idx)) {
            best_dist_sq = dist_sq;
            best_idx = node->point_idx;
        }

        const int dim = node->split_dim;
        const double diff = query(dim) - p(dim);

        const Node* first = (diff < 0) ? node->left.get() : node->right.get();
        const Node* second = (diff < 0) ? node->right.get() : node->left.get();

        search_nearest(first, query, best_idx, best_dist_sq);

        // <= keeps equidistant candidates with a smaller index reachable
        if (diff * diff <= best_dist_sq) {
            search_nearest(second, query, best_idx, best_dist_sq);
        }
    }
};


inline std::unique_ptr<NearestNeighborIndex> make_nearest_neighbor_index(
    NeighborSearch kind,
    const PointCloud::Matrix& reference
) {
    switch (kind) {
        case NeighborSearch::KDTree:
            return std::make_unique<KDTreeIndex>(reference);
        case NeighborSearch::BruteForce:
            return std::make_unique<BruteForceIndex>(reference);
    }
    throw std::invalid_argument("Unknown neighbor search backend");
}

} // namespace scapula
