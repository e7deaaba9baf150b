#include <gtest/gtest.h>

#include <cmath>

#include "scapula/averaging.hpp"
#include "scapula/point_to_point.hpp"
#include "test_utils.hpp"

using scapula::ICPConfig;
using scapula::ICPResult;
using scapula::PointCloud;
using scapula::Transformation;

namespace {

PointCloud centred(const PointCloud& cloud) {
    return PointCloud(PointCloud::Matrix(cloud.points().rowwise() - cloud.points().colwise().mean()));
}

double rotation_error(const Transformation& a, const Transformation& b) {
    return scapula::angle_between_rotations(a.R(), b.R());
}

scapula::ErrorCode error_code_of(const PointCloud& source, const PointCloud& target, const ICPConfig& config) {
    try {
        scapula::icp_point_to_point(source, target, config);
    } catch (const scapula::RegistrationError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected RegistrationError";
    return scapula::ErrorCode::EmptyCollection;
}

} // namespace

TEST(ICPTest, SelfAlignmentOfCentredCloudTakesOneIteration)
{
    const PointCloud cloud = centred(scapula_test::random_cloud(200));

    ICPConfig config;
    config.share_indices = true;
    const ICPResult result = scapula::icp_point_to_point(cloud, cloud, config);

    EXPECT_TRUE(result.converged());
    EXPECT_EQ(result.num_iterations, 1);
    EXPECT_TRUE(result.transformation.matrix().isApprox(Eigen::Matrix4d::Identity(), 1e-9));
}

TEST(ICPTest, SelfAlignmentConvergesToIdentity)
{
    PointCloud::Matrix shifted = scapula_test::random_cloud(200).points();
    shifted.rowwise() += Eigen::RowVector3d(5.0, -3.0, 12.0);
    const PointCloud cloud(shifted);

    ICPConfig config;
    config.share_indices = true;
    const ICPResult result = scapula::icp_point_to_point(cloud, cloud, config);

    EXPECT_TRUE(result.converged());
    // First step recovers the centroid shift, the second is the identity
    EXPECT_EQ(result.num_iterations, 2);
    EXPECT_LT(rotation_error(result.transformation, Transformation::identity()), 1e-9);
    EXPECT_LT(result.transformation.t().norm(), 1e-9);
}

TEST(ICPTest, ExactRecoveryWithSharedIndices)
{
    const PointCloud source = scapula_test::random_cloud(300, 2.0, 11);
    const Transformation truth = scapula_test::rigid(1.2, {0.3, -1.0, 0.7}, {4.0, -2.5, 0.75});
    const PointCloud target = truth.apply(source);

    ICPConfig config;
    config.share_indices = true;
    const ICPResult result = scapula::icp_point_to_point(source, target, config);

    EXPECT_TRUE(result.converged());
    EXPECT_LT(rotation_error(result.transformation, truth), 1e-6);
    EXPECT_LT((result.transformation.t() - truth.t()).norm(), 1e-6);
    EXPECT_TRUE(result.transformation.is_rigid(1e-9));
}

TEST(ICPTest, UnitCubeRotatedAboutZ)
{
    const PointCloud cube = scapula_test::unit_cube();
    const Transformation truth = Transformation::from_rt(
        scapula_test::rotation(M_PI / 2, Eigen::Vector3d::UnitZ()), Eigen::Vector3d(1, 2, 3));
    const PointCloud moved = truth.apply(cube);

    ICPConfig config;
    config.share_indices = true;
    const ICPResult result = scapula::icp_point_to_point(cube, moved, config);

    Eigen::Matrix3d Rz90;
    Rz90 << 0, -1, 0,
            1,  0, 0,
            0,  0, 1;
    EXPECT_TRUE(result.transformation.R().isApprox(Rz90, 1e-4));
    EXPECT_NEAR(result.transformation.t().x(), 1.0, 1e-4);
    EXPECT_NEAR(result.transformation.t().y(), 2.0, 1e-4);
    EXPECT_NEAR(result.transformation.t().z(), 3.0, 1e-4);
}

TEST(ICPTest, NearestNeighborAlignmentOfSmallMotion)
{
    const PointCloud source = centred(scapula_test::ellipsoid_cloud(400));
    const Transformation truth = scapula_test::rigid(0.03, {0.2, 0.1, 1.0}, {0.05, -0.03, 0.02});
    const PointCloud target = truth.apply(source);

    ICPConfig config;
    config.tolerance = 1e-12;
    config.compute_residual = true;
    const ICPResult result = scapula::icp_point_to_point(source, target, config);

    EXPECT_LT(rotation_error(result.transformation, truth), 1e-3);
    EXPECT_LT((result.transformation.t() - truth.t()).norm(), 1e-3);
    ASSERT_TRUE(result.residual_rms.has_value());
    EXPECT_LT(*result.residual_rms, 1e-3);
}

TEST(ICPTest, KDTreeSearchGivesIdenticalResult)
{
    const PointCloud source = scapula_test::ellipsoid_cloud(300, 21);
    const PointCloud target = scapula_test::rigid(0.08, {1, 0, 0}, {0.2, 0.0, -0.1}).apply(source);

    ICPConfig config;
    config.max_iterations = 30;
    const ICPResult brute = scapula::icp_point_to_point(source, target, config);

    config.neighbor_search = scapula::NeighborSearch::KDTree;
    const ICPResult tree = scapula::icp_point_to_point(source, target, config);

    EXPECT_EQ(brute.num_iterations, tree.num_iterations);
    EXPECT_EQ(brute.metric_history, tree.metric_history);
    EXPECT_TRUE(brute.transformation.matrix() == tree.transformation.matrix());
}

TEST(ICPTest, RepeatedRunsAreDeterministic)
{
    const PointCloud source = scapula_test::ellipsoid_cloud(5000, 3);
    const PointCloud target = scapula_test::rigid(0.03, {0, 1, 0}, {0.05, 0.0, 0.0}).apply(source);

    ICPConfig config;
    config.target_point_count_source = 1000;
    config.target_point_count_target = 1000;
    config.max_iterations = 20;

    const ICPResult first = scapula::icp_point_to_point(source, target, config);
    const ICPResult second = scapula::icp_point_to_point(source, target, config);

    EXPECT_TRUE(first.transformation.matrix() == second.transformation.matrix());
    EXPECT_EQ(first.num_iterations, second.num_iterations);
}

TEST(ICPTest, IterationCapIsNotAnError)
{
    const PointCloud source = scapula_test::random_cloud(50);
    const Transformation truth = scapula_test::rigid(0.5, {0, 0, 1}, {1, 1, 1});

    ICPConfig config;
    config.share_indices = true;
    config.max_iterations = 1;
    const ICPResult result = scapula::icp_point_to_point(source, truth.apply(source), config);

    EXPECT_EQ(result.state, scapula::TerminationState::MaxIterationsReached);
    EXPECT_EQ(result.num_iterations, 1);
    ASSERT_EQ(result.metric_history.size(), 1u);
    EXPECT_GT(result.metric_history[0], config.tolerance);
}

TEST(ICPTest, ZeroIterationsReturnsInitialGuess)
{
    const PointCloud source = scapula_test::random_cloud(20);
    const Eigen::Vector3d mean = source.centroid();

    ICPConfig config;
    config.max_iterations = 0;
    config.initial_transform = scapula_test::rigid(0.2, {1, 0, 0}, {0, 0, 1});
    const ICPResult result = scapula::icp_point_to_point(source, source, config);

    EXPECT_EQ(result.num_iterations, 0);
    EXPECT_TRUE(result.transformation.R().isApprox(config.initial_transform.R()));
    // The guess applies to the centred source
    EXPECT_TRUE(result.transformation.t().isApprox(
        config.initial_transform.t() - config.initial_transform.R() * mean, 1e-12));
}

TEST(ICPTest, InitialTransformIsNotModified)
{
    const PointCloud source = scapula_test::random_cloud(40);
    const PointCloud target = scapula_test::rigid(0.4, {1, 1, 0}, {2, 0, 0}).apply(source);

    ICPConfig config;
    config.share_indices = true;
    const Transformation before = config.initial_transform;

    const ICPResult first = scapula::icp_point_to_point(source, target, config);
    const ICPResult second = scapula::icp_point_to_point(source, target, config);

    EXPECT_TRUE(config.initial_transform.matrix() == before.matrix());
    EXPECT_TRUE(config.initial_transform.matrix() == Eigen::Matrix4d::Identity());
    EXPECT_TRUE(first.transformation.matrix() == second.transformation.matrix());
}

TEST(ICPTest, ResidualWithSharedIndicesIsZeroForExactMatch)
{
    const PointCloud source = scapula_test::random_cloud(100, 1.0, 5);
    const PointCloud target = scapula_test::rigid(0.9, {0, 1, 1}, {0.5, 0.5, 0.5}).apply(source);

    ICPConfig config;
    config.share_indices = true;
    config.compute_residual = true;
    const ICPResult result = scapula::icp_point_to_point(source, target, config);

    ASSERT_TRUE(result.residual_rms.has_value());
    EXPECT_NEAR(*result.residual_rms, 0.0, 1e-8);

    config.compute_residual = false;
    EXPECT_FALSE(scapula::icp_point_to_point(source, target, config).residual_rms.has_value());
}

TEST(ICPTest, MetricHistoryTracksIterations)
{
    const PointCloud source = scapula_test::ellipsoid_cloud(200, 9);
    const PointCloud target = scapula_test::rigid(0.05, {0, 0, 1}, {0.1, 0.1, 0}).apply(source);

    const ICPResult result = scapula::icp_point_to_point(source, target);
    EXPECT_EQ(static_cast<int>(result.metric_history.size()), result.num_iterations);
    EXPECT_GE(result.num_iterations, 1);
}

TEST(ICPTest, SubsampleStride)
{
    EXPECT_EQ(scapula::subsample_stride(10000, 3000), 3);
    EXPECT_EQ(scapula::subsample_stride(9000, 3000), 3);
    EXPECT_EQ(scapula::subsample_stride(2999, 3000), 1);
    EXPECT_EQ(scapula::subsample_stride(0, 10), 1);
    EXPECT_THROW(scapula::subsample_stride(100, 0), std::invalid_argument);
}

TEST(ICPTest, StepMetricOfIdentityIsZero)
{
    EXPECT_DOUBLE_EQ(scapula::step_metric(Transformation::identity()), 0.0);

    Eigen::Matrix4d shifted = Eigen::Matrix4d::Identity();
    shifted(0, 3) = 2.0;
    EXPECT_DOUBLE_EQ(scapula::step_metric(Transformation(shifted)), 4.0);
}

TEST(ICPTest, InvalidInputsFail)
{
    const PointCloud cloud = scapula_test::random_cloud(10);
    const PointCloud empty;
    PointCloud::Matrix two_points(2, 3);
    two_points.setRandom();

    ICPConfig config;
    EXPECT_EQ(error_code_of(cloud, empty, config), scapula::ErrorCode::EmptyReferenceSet);
    EXPECT_EQ(error_code_of(PointCloud(two_points), cloud, config),
              scapula::ErrorCode::InsufficientCorrespondences);

    config.share_indices = true;
    EXPECT_EQ(error_code_of(cloud, scapula_test::random_cloud(11), config),
              scapula::ErrorCode::InsufficientCorrespondences);

    ICPConfig bad;
    bad.target_point_count_target = 0;
    EXPECT_THROW(scapula::icp_point_to_point(cloud, cloud, bad), std::invalid_argument);
    bad = ICPConfig();
    bad.max_iterations = -1;
    EXPECT_THROW(scapula::icp_point_to_point(cloud, cloud, bad), std::invalid_argument);
}
