#include <gtest/gtest.h>

#include <cmath>

#include "smoothing_engine.hpp"
#include "vector_math.hpp"

namespace
{

constexpr double kPi = 3.14159265358979323846;

// Cutoff far above the frame rate: output tracks input almost exactly
const FilterParams kTracking{1000.0, 0.0, 1.0};

Eigen::Quaterniond rotY(double angle)
{
  return Eigen::Quaterniond(Eigen::AngleAxisd(angle, Eigen::Vector3d::UnitY()));
}

// Feeds a tight cluster around `center`, returns the last output
Eigen::Vector3d feedCluster(PositionSmoother& smoother, const Eigen::Vector3d& center, int frames, double& t)
{
  Eigen::Vector3d out = Eigen::Vector3d::Zero();
  for (int i = 0; i < frames; ++i) {
    const double jitter = (i % 2 == 0 ? 1.0 : -1.0) * 0.001;
    out = smoother.smooth(t, center + Eigen::Vector3d(jitter, -jitter, 0.5 * jitter));
    t += 1.0 / 30.0;
  }
  return out;
}

}  // namespace

TEST(SmoothingEngine, AdaptiveFactorFollowsVelocityClass)
{
  SmoothingConfig config;
  const InterpolationRange body = interpolationRange(config, BodyPart::Core);
  EXPECT_DOUBLE_EQ(adaptiveFactor(config, body, 1.0), 0.75);   // 0.5 * 1.5
  EXPECT_DOUBLE_EQ(adaptiveFactor(config, body, 0.0), 0.35);   // 0.5 * 0.7

  const InterpolationRange hand = interpolationRange(config, BodyPart::Hand);
  EXPECT_DOUBLE_EQ(adaptiveFactor(config, hand, 1.0), 0.85);   // capped at max
  EXPECT_NEAR(adaptiveFactor(config, hand, 0.0), 0.49, 1e-12);
}

TEST(QuaternionSmoother, FirstSampleSeeds)
{
  QuaternionSmoother smoother;
  const Eigen::Quaterniond q = rotY(0.8);
  const Eigen::Quaterniond out = smoother.smooth(0.0, q);
  EXPECT_NEAR(vecmath::angularDistance(out, q), 0.0, 1e-12);
  EXPECT_TRUE(smoother.isInitialized());
  EXPECT_TRUE(smoother.getRecentVelocities().empty());
}

TEST(QuaternionSmoother, NonPositiveTimeStepReturnsPrevious)
{
  QuaternionSmoother smoother;
  smoother.smooth(0.0, rotY(0.0));
  const Eigen::Quaterniond prev = smoother.smooth(0.1, rotY(0.5));
  const Eigen::Quaterniond out = smoother.smooth(0.1, rotY(1.5));
  EXPECT_NEAR(vecmath::angularDistance(out, prev), 0.0, 1e-12);
}

TEST(QuaternionSmoother, MovesPartwayTowardTarget)
{
  QuaternionSmoother smoother;
  smoother.smooth(0.0, Eigen::Quaterniond::Identity());
  const Eigen::Quaterniond out = smoother.smooth(1.0 / 30.0, rotY(kPi / 2));

  // Fast motion: factor 0.75
  EXPECT_NEAR(vecmath::angularDistance(out, Eigen::Quaterniond::Identity()), 0.75 * kPi / 2, 1e-9);
  ASSERT_EQ(smoother.getRecentVelocities().size(), 1u);
  EXPECT_NEAR(smoother.getRecentVelocities().front(), (kPi / 2) * 30.0, 1e-6);
}

TEST(QuaternionSmoother, NegatedTargetTakesShortPath)
{
  QuaternionSmoother a;
  QuaternionSmoother b;
  a.smooth(0.0, Eigen::Quaterniond::Identity());
  b.smooth(0.0, Eigen::Quaterniond::Identity());

  Eigen::Quaterniond negated = rotY(0.3);
  negated.coeffs() = -negated.coeffs();

  const Eigen::Quaterniond outA = a.smooth(0.1, rotY(0.3));
  const Eigen::Quaterniond outB = b.smooth(0.1, negated);
  EXPECT_NEAR(vecmath::angularDistance(outA, outB), 0.0, 1e-9);
  EXPECT_NEAR(b.getRecentVelocities().back(), a.getRecentVelocities().back(), 1e-9);
}

TEST(QuaternionSmoother, HistoryIsBounded)
{
  SmoothingConfig config;
  config.historySize = 4;
  QuaternionSmoother smoother(config, BodyPart::Limb);
  for (int i = 0; i < 20; ++i) {
    smoother.smooth(i * 0.1, rotY(i * 0.05));
  }
  EXPECT_EQ(smoother.getRecentVelocities().size(), 4u);
}

TEST(PositionSmoother, RejectsTenSigmaOutlier)
{
  SmoothingConfig config;
  PositionSmoother smoother(config, kTracking);
  double t = 0.0;
  const Eigen::Vector3d center(1.0, 1.0, 1.0);
  const Eigen::Vector3d last = feedCluster(smoother, center, 10, t);

  ASSERT_FALSE(smoother.isValidPosition(center + Eigen::Vector3d(10.0, 0, 0)));
  const Eigen::Vector3d out = smoother.smooth(t, center + Eigen::Vector3d(10.0, 0, 0));
  EXPECT_EQ(out, last);
}

TEST(PositionSmoother, PersistentJumpIsAccepted)
{
  SmoothingConfig config;
  PositionSmoother smoother(config, kTracking);
  double t = 0.0;
  const Eigen::Vector3d last = feedCluster(smoother, Eigen::Vector3d::Zero(), 10, t);

  const Eigen::Vector3d moved(5.0, 0.0, 0.0);
  for (int i = 0; i < config.maxConsecutiveOutliers; ++i) {
    EXPECT_EQ(smoother.smooth(t, moved), last);
    t += 1.0 / 30.0;
  }
  const Eigen::Vector3d accepted = smoother.smooth(t, moved);
  EXPECT_GT(accepted.x(), last.x());
}

TEST(PositionSmoother, OutlierRejectionCanBeDisabled)
{
  SmoothingConfig config;
  config.enableOutlierRejection = false;
  PositionSmoother smoother(config, kTracking);
  double t = 0.0;
  const Eigen::Vector3d last = feedCluster(smoother, Eigen::Vector3d::Zero(), 10, t);
  EXPECT_NE(smoother.smooth(t, Eigen::Vector3d(10.0, 0, 0)), last);
}

TEST(PositionSmoother, FastMotionBoostsBeta)
{
  SmoothingConfig config;
  config.enableOutlierRejection = false;
  PositionSmoother smoother(config, config.limbFilter);
  EXPECT_DOUBLE_EQ(smoother.getFilterBeta(), config.limbFilter.beta);

  for (int i = 0; i < 10; ++i) {
    smoother.smooth(i / 30.0, Eigen::Vector3d(i * 0.5, 0, 0));
  }
  EXPECT_DOUBLE_EQ(smoother.getFilterBeta(), config.limbFilter.beta * config.fastMotionBetaBoost);

  smoother.reset();
  EXPECT_DOUBLE_EQ(smoother.getFilterBeta(), config.limbFilter.beta);
  EXPECT_FALSE(smoother.isInitialized());
}

TEST(SmoothingEngine, CreatesSmoothersLazilyAndResets)
{
  SmoothingEngine engine;
  EXPECT_EQ(engine.rotationSmootherCount(), 0u);

  engine.smoothRotation(BoneId::LeftArm, 0.0, Eigen::Quaterniond::Identity());
  engine.smoothRotation(BoneId::LeftArm, 0.1, rotY(0.1));
  engine.smoothPosition(BoneId::Hips, 0.0, Eigen::Vector3d::Zero());
  EXPECT_EQ(engine.rotationSmootherCount(), 1u);
  EXPECT_EQ(engine.positionSmootherCount(), 1u);

  engine.resetBone(BoneId::LeftArm);
  EXPECT_EQ(engine.rotationSmootherCount(), 0u);

  engine.reset();
  EXPECT_EQ(engine.positionSmootherCount(), 0u);
}

TEST(SmoothingEngine, InterpolationFactorUsesBodyPartRange)
{
  SmoothingEngine engine;
  EXPECT_DOUBLE_EQ(engine.adaptiveInterpolationFactor(BoneId::Spine), 0.5);
  EXPECT_DOUBLE_EQ(engine.adaptiveInterpolationFactor(BoneId::LeftHandIndex2), 0.7);

  // Holding still: slow factor
  for (int i = 0; i < 5; ++i) {
    engine.smoothRotation(BoneId::Spine, i * 0.1, Eigen::Quaterniond::Identity());
  }
  EXPECT_DOUBLE_EQ(engine.adaptiveInterpolationFactor(BoneId::Spine), 0.35);
}

TEST(SmoothingEngine, SmoothPoseKeepsAbsentPointsAbsent)
{
  SmoothingEngine engine;
  CanonicalPose pose;
  pose.set(BoneId::Hips, Eigen::Vector3d(0, 1, 0), 0.9);
  engine.smoothPose(pose, 0.0);

  EXPECT_TRUE(pose.has(BoneId::Hips));
  EXPECT_FALSE(pose.has(BoneId::Head));
  EXPECT_EQ(pose[BoneId::Hips]->position, Eigen::Vector3d(0, 1, 0));
  EXPECT_DOUBLE_EQ(pose[BoneId::Hips]->visibility, 0.9);
  EXPECT_EQ(engine.positionSmootherCount(), 1u);
}
