#include <gtest/gtest.h>

#include <cmath>

#include "adaptive_filter.hpp"

TEST(AdaptiveFilter, FirstSamplePassesThrough)
{
  AdaptiveFilter filter;
  EXPECT_FALSE(filter.isInitialized());
  EXPECT_DOUBLE_EQ(filter.filter(0.0, 5.0), 5.0);
  EXPECT_TRUE(filter.isInitialized());
}

TEST(AdaptiveFilter, NonPositiveTimeStepReturnsPrevious)
{
  AdaptiveFilter filter;
  filter.filter(1.0, 2.0);
  const double out = filter.filter(2.0, 4.0);

  EXPECT_DOUBLE_EQ(filter.filter(2.0, 100.0), out);
  EXPECT_DOUBLE_EQ(filter.filter(1.5, -100.0), out);
}

TEST(AdaptiveFilter, OutputStaysBetweenPreviousAndInput)
{
  AdaptiveFilter filter(FilterParams{1.0, 0.0, 1.0});
  filter.filter(0.0, 0.0);
  const double out = filter.filter(0.1, 10.0);
  EXPECT_GT(out, 0.0);
  EXPECT_LT(out, 10.0);
}

TEST(AdaptiveFilter, ConvergesOnConstantSignal)
{
  AdaptiveFilter filter(FilterParams{1.0, 0.5, 1.0});
  filter.filter(0.0, 0.0);
  double out = 0.0;
  for (int i = 1; i <= 300; ++i) {
    out = filter.filter(i / 30.0, 1.0);
  }
  EXPECT_NEAR(out, 1.0, 1e-3);
}

TEST(AdaptiveFilter, HigherBetaFollowsFastMotionCloser)
{
  AdaptiveFilter slow(FilterParams{0.5, 0.0, 1.0});
  AdaptiveFilter fast(FilterParams{0.5, 5.0, 1.0});
  slow.filter(0.0, 0.0);
  fast.filter(0.0, 0.0);

  double slowOut = 0.0;
  double fastOut = 0.0;
  for (int i = 1; i <= 10; ++i) {
    const double t = i / 30.0;
    slowOut = slow.filter(t, 10.0 * t);
    fastOut = fast.filter(t, 10.0 * t);
  }
  const double target = 10.0 * 10 / 30.0;
  EXPECT_LT(std::abs(target - fastOut), std::abs(target - slowOut));
}

TEST(AdaptiveFilter, ResetStartsOver)
{
  AdaptiveFilter filter;
  filter.filter(0.0, 1.0);
  filter.filter(1.0, 2.0);
  filter.reset();
  EXPECT_FALSE(filter.isInitialized());
  EXPECT_DOUBLE_EQ(filter.filter(5.0, 42.0), 42.0);
}

TEST(AdaptiveFilter, SmoothingFactorRange)
{
  EXPECT_DOUBLE_EQ(AdaptiveFilter::smoothingFactor(0.1, 0.0), 1.0);
  const double a = AdaptiveFilter::smoothingFactor(1.0 / 30.0, 1.0);
  EXPECT_GT(a, 0.0);
  EXPECT_LT(a, 1.0);
}

TEST(AdaptiveFilter3, FiltersEachAxisAndSharesBeta)
{
  AdaptiveFilter3 filter(FilterParams{0.01, 0.3, 1.0});
  const Eigen::Vector3d first(1, 2, 3);
  EXPECT_EQ(filter.filter(0.0, first), first);

  filter.setBeta(0.9);
  EXPECT_DOUBLE_EQ(filter.getBeta(), 0.9);

  const Eigen::Vector3d out = filter.filter(0.1, Eigen::Vector3d(2, 2, 2));
  EXPECT_GT(out.x(), 1.0);
  EXPECT_LT(out.x(), 2.0);
  EXPECT_NEAR(out.y(), 2.0, 1e-12);
  EXPECT_LT(out.z(), 3.0);
  EXPECT_GT(out.z(), 2.0);
}
