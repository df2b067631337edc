#include <gtest/gtest.h>

#include <string>

#include "retarget_config.hpp"

#ifndef MOTION_RETARGET_CONFIG_DIR
#define MOTION_RETARGET_CONFIG_DIR "config"
#endif

namespace
{

void expectDefaults(const RetargetConfig& config)
{
  const RetargetConfig defaults;
  EXPECT_DOUBLE_EQ(config.visibilityThreshold, defaults.visibilityThreshold);
  EXPECT_DOUBLE_EQ(config.hipsDamping, defaults.hipsDamping);
  EXPECT_DOUBLE_EQ(config.armAlignWeight, defaults.armAlignWeight);
  EXPECT_DOUBLE_EQ(config.headFlipDot, defaults.headFlipDot);
  EXPECT_EQ(config.enableRootMotion, defaults.enableRootMotion);
  EXPECT_EQ(config.smoothing.historySize, defaults.smoothing.historySize);
  EXPECT_DOUBLE_EQ(config.smoothing.handFilter.minCutoff, defaults.smoothing.handFilter.minCutoff);
}

}  // namespace

TEST(RetargetConfig, OverridesKeepOtherDefaults)
{
  const RetargetConfig config = parseRetargetConfig(
    "visibility_threshold: 0.6\n"
    "hips:\n"
    "  root_motion: false\n"
    "weights:\n"
    "  arm_align: 0.95\n"
    "smoothing:\n"
    "  rotation: false\n"
    "  max_consecutive_outliers: 5\n"
    "  limb_filter: {beta: 0.7}\n");

  EXPECT_DOUBLE_EQ(config.visibilityThreshold, 0.6);
  EXPECT_FALSE(config.enableRootMotion);
  EXPECT_DOUBLE_EQ(config.armAlignWeight, 0.95);
  EXPECT_FALSE(config.enableRotationSmoothing);
  EXPECT_EQ(config.smoothing.maxConsecutiveOutliers, 5);
  EXPECT_DOUBLE_EQ(config.smoothing.limbFilter.beta, 0.7);

  const RetargetConfig defaults;
  EXPECT_DOUBLE_EQ(config.hipsDamping, defaults.hipsDamping);
  EXPECT_DOUBLE_EQ(config.alignWeight, defaults.alignWeight);
  EXPECT_DOUBLE_EQ(config.smoothing.limbFilter.minCutoff, defaults.smoothing.limbFilter.minCutoff);
  EXPECT_TRUE(config.autoScaleMetricLegLength);
}

TEST(RetargetConfig, EmptyTextGivesDefaults)
{
  expectDefaults(parseRetargetConfig(""));
}

TEST(RetargetConfig, MalformedTextGivesDefaults)
{
  expectDefaults(parseRetargetConfig("hips: [damping: 0.5"));
}

TEST(RetargetConfig, TypeMismatchGivesDefaults)
{
  const RetargetConfig config = parseRetargetConfig(
    "visibility_threshold: 0.9\n"
    "hips:\n"
    "  damping: fast\n");
  expectDefaults(config);
}

TEST(RetargetConfig, ShippedFileMatchesDefaults)
{
  const RetargetConfig config = loadRetargetConfig(MOTION_RETARGET_CONFIG_DIR "/retarget.yaml");
  const RetargetConfig defaults;

  expectDefaults(config);
  EXPECT_DOUBLE_EQ(config.minHipHeightRatio, defaults.minHipHeightRatio);
  EXPECT_DOUBLE_EQ(config.torsoBaseWeight, defaults.torsoBaseWeight);
  EXPECT_DOUBLE_EQ(config.forearmTwistWeight, defaults.forearmTwistWeight);
  EXPECT_DOUBLE_EQ(config.neckShare, defaults.neckShare);
  EXPECT_DOUBLE_EQ(config.smoothing.baseInterpolationFactor, defaults.smoothing.baseInterpolationFactor);
  EXPECT_DOUBLE_EQ(config.smoothing.coreFilter.beta, defaults.smoothing.coreFilter.beta);
  EXPECT_EQ(config.enableRotationSmoothing, defaults.enableRotationSmoothing);
}

TEST(RetargetConfig, MissingFileGivesDefaults)
{
  expectDefaults(loadRetargetConfig(MOTION_RETARGET_CONFIG_DIR "/does_not_exist.yaml"));
}
