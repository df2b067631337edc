#include <gtest/gtest.h>

#include <cmath>

#include "root_motion_estimator.hpp"

namespace
{

// 33 image landmarks with only the hips filled in
Eigen::MatrixXd hips(double leftX, double rightX, double y, double leftZ = 0.0, double rightZ = 0.0)
{
  Eigen::MatrixXd m = Eigen::MatrixXd::Zero(33, 4);
  m.row(RootMotionEstimator::LEFT_HIP) << leftX, y, leftZ, 1.0;
  m.row(RootMotionEstimator::RIGHT_HIP) << rightX, y, rightZ, 1.0;
  return m;
}

}  // namespace

TEST(RootMotionEstimator, FirstCallAfterResetIsZero)
{
  RootMotionEstimator estimator;
  estimator.reset(640, 480);
  EXPECT_FALSE(estimator.hasOrigin());

  const auto t = estimator.computeTranslation(hips(0.55, 0.45, 0.6));
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(*t, Eigen::Vector3d::Zero());
  EXPECT_TRUE(estimator.hasOrigin());

  estimator.computeTranslation(hips(0.65, 0.55, 0.6));
  estimator.reset(640, 480);
  const auto again = estimator.computeTranslation(hips(0.85, 0.75, 0.3));
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(*again, Eigen::Vector3d::Zero());
}

TEST(RootMotionEstimator, MissingHipsGiveNothing)
{
  RootMotionEstimator estimator;
  EXPECT_FALSE(estimator.computeTranslation(Eigen::MatrixXd::Zero(20, 4)).has_value());

  Eigen::MatrixXd bad = hips(0.55, 0.45, 0.6);
  bad(RootMotionEstimator::LEFT_HIP, 0) = NAN;
  EXPECT_FALSE(estimator.computeTranslation(bad).has_value());
  EXPECT_FALSE(estimator.hasOrigin());
}

TEST(RootMotionEstimator, TranslationFollowsHipMidpoint)
{
  RootMotionEstimator estimator;
  estimator.reset(640, 480);
  estimator.setModelHipSpan(18.0);
  estimator.computeTranslation(hips(0.55, 0.45, 0.5));

  // Step right and down in the image, span 64 px
  const auto t = estimator.computeTranslation(hips(0.60, 0.50, 0.6));
  ASSERT_TRUE(t.has_value());

  const double factor = 1.0 + (18.0 / 64.0 - 1.0) * RootMotionEstimator::FACTOR_RATE;
  EXPECT_NEAR(estimator.getScaleFactor(), factor, 1e-12);
  EXPECT_NEAR(t->x(), 32.0 * factor, 1e-9);
  EXPECT_NEAR(t->y(), -48.0 * factor, 1e-9);  // image y grows downward
  EXPECT_NEAR(t->z(), 0.0, 1e-12);
}

TEST(RootMotionEstimator, DepthIsDamped)
{
  RootMotionEstimator estimator;
  estimator.reset(640, 480);
  estimator.computeTranslation(hips(0.55, 0.45, 0.5, 0.0, 0.0));
  const auto t = estimator.computeTranslation(hips(0.55, 0.45, 0.5, 0.1, 0.1));
  ASSERT_TRUE(t.has_value());
  EXPECT_NEAR(t->z(), 64.0 * estimator.getScaleFactor() * RootMotionEstimator::Z_DAMPER, 1e-9);
}

TEST(RootMotionEstimator, SideOnHipsKeepScale)
{
  RootMotionEstimator estimator;
  estimator.reset(640, 480);
  estimator.computeTranslation(hips(0.50, 0.50, 0.5, 0.1, -0.1));

  // Hips span more in depth than in x: the span is not trusted
  estimator.computeTranslation(hips(0.51, 0.49, 0.5, 0.1, -0.1));
  EXPECT_DOUBLE_EQ(estimator.getScaleFactor(), 1.0);
}

TEST(RootMotionEstimator, ScaleConvergesToModelSpan)
{
  RootMotionEstimator estimator;
  estimator.reset(640, 480);
  estimator.setModelHipSpan(32.0);
  for (int i = 0; i < 400; ++i) {
    estimator.computeTranslation(hips(0.55, 0.45, 0.5));
  }
  EXPECT_NEAR(estimator.getScaleFactor(), 0.5, 1e-6);
}
