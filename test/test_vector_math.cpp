#include <gtest/gtest.h>

#include <cmath>

#include "vector_math.hpp"

namespace
{

constexpr double kPi = 3.14159265358979323846;
constexpr double kTol = 1e-9;

Eigen::Quaterniond axisAngle(double angle, const Eigen::Vector3d& axis)
{
  return Eigen::Quaterniond(Eigen::AngleAxisd(angle, axis.normalized()));
}

void expectSameRotation(const Eigen::Quaterniond& a, const Eigen::Quaterniond& b, double tol = 1e-9)
{
  EXPECT_NEAR(vecmath::angularDistance(a, b), 0.0, tol);
}

}  // namespace

TEST(VectorMath, NormalizeZeroVectorIsUnchanged)
{
  const Eigen::Vector3d zero = Eigen::Vector3d::Zero();
  EXPECT_EQ(vecmath::normalizeOrKeep(zero), zero);
  EXPECT_NEAR(vecmath::normalizeOrKeep(Eigen::Vector3d(3, 4, 0)).norm(), 1.0, kTol);
}

TEST(VectorMath, NormalizeTinyQuaternionGivesIdentity)
{
  const Eigen::Quaterniond tiny(1e-9, 0, 0, 0);
  expectSameRotation(vecmath::normalizeOrIdentity(tiny), Eigen::Quaterniond::Identity());
}

TEST(VectorMath, SlerpOfEqualRotationsIsThatRotation)
{
  const Eigen::Quaterniond q = axisAngle(0.7, Eigen::Vector3d(1, 2, 3));
  for (double t : {0.0, 0.25, 0.5, 1.0}) {
    const Eigen::Quaterniond r = vecmath::slerp(q, q, t);
    EXPECT_NEAR(r.w(), q.w(), kTol);
    EXPECT_NEAR(r.x(), q.x(), kTol);
    EXPECT_NEAR(r.y(), q.y(), kTol);
    EXPECT_NEAR(r.z(), q.z(), kTol);
  }
}

TEST(VectorMath, SlerpHalfwayHalvesTheAngle)
{
  const Eigen::Quaterniond from = Eigen::Quaterniond::Identity();
  const Eigen::Quaterniond to = axisAngle(kPi / 2, Eigen::Vector3d::UnitY());
  const Eigen::Quaterniond mid = vecmath::slerp(from, to, 0.5);
  expectSameRotation(mid, axisAngle(kPi / 4, Eigen::Vector3d::UnitY()));
}

TEST(VectorMath, SlerpTakesShortestPath)
{
  const Eigen::Quaterniond from = Eigen::Quaterniond::Identity();
  Eigen::Quaterniond to = axisAngle(0.4, Eigen::Vector3d::UnitZ());
  to.coeffs() = -to.coeffs();  // same rotation, other hemisphere
  const Eigen::Quaterniond mid = vecmath::slerp(from, to, 0.5);
  expectSameRotation(mid, axisAngle(0.2, Eigen::Vector3d::UnitZ()));
}

TEST(VectorMath, FromUnitVectorsSameDirectionIsIdentity)
{
  const Eigen::Vector3d v(0.3, -0.5, 0.8);
  expectSameRotation(vecmath::fromUnitVectors(v, v), Eigen::Quaterniond::Identity());
}

TEST(VectorMath, FromUnitVectorsOppositeIsHalfTurn)
{
  for (const Eigen::Vector3d& v : {Eigen::Vector3d(1, 0, 0), Eigen::Vector3d(0, 1, 0),
                                   Eigen::Vector3d(0.2, -0.9, 0.4)}) {
    const Eigen::Quaterniond q = vecmath::fromUnitVectors(v, -v);
    ASSERT_TRUE(vecmath::isFinite(q));
    EXPECT_NEAR(std::abs(q.w()), 0.0, 1e-9);

    // The rotation axis is perpendicular to v
    EXPECT_NEAR(q.vec().dot(v.normalized()), 0.0, 1e-9);
    const Eigen::Vector3d rotated = q * v.normalized();
    EXPECT_TRUE(rotated.isApprox(-v.normalized(), 1e-9));
  }
}

TEST(VectorMath, FromUnitVectorsRotatesAOntoB)
{
  const Eigen::Vector3d a(1, 0, 0);
  const Eigen::Vector3d b(0, 0, 2);
  const Eigen::Quaterniond q = vecmath::fromUnitVectors(a, b);
  EXPECT_TRUE((q * a).isApprox(b.normalized(), 1e-9));
}

TEST(VectorMath, FromUnitVectorsZeroInputIsIdentity)
{
  expectSameRotation(vecmath::fromUnitVectors(Eigen::Vector3d::Zero(), Eigen::Vector3d::UnitX()),
                     Eigen::Quaterniond::Identity());
}

TEST(VectorMath, OrthonormalBasisOfAxesIsIdentity)
{
  const Eigen::Quaterniond q = vecmath::fromOrthonormalBasis(
    Eigen::Vector3d::UnitX(), Eigen::Vector3d::UnitY(), Eigen::Vector3d::UnitZ());
  expectSameRotation(q, Eigen::Quaterniond::Identity());
}

TEST(VectorMath, OrthonormalBasisMatchesRotationMatrix)
{
  // Each trace branch of the conversion
  for (const Eigen::Quaterniond& expected :
       {axisAngle(0.3, Eigen::Vector3d(1, 1, 0)), axisAngle(3.0, Eigen::Vector3d::UnitX()),
        axisAngle(3.0, Eigen::Vector3d::UnitY()), axisAngle(3.0, Eigen::Vector3d::UnitZ())}) {
    const Eigen::Matrix3d m = expected.toRotationMatrix();
    const Eigen::Quaterniond q = vecmath::fromOrthonormalBasis(m.col(0), m.col(1), m.col(2));
    expectSameRotation(q, expected, 1e-6);
  }
}

TEST(VectorMath, BasisFromUpRightOrthogonalizesTheHint)
{
  const auto q = vecmath::basisFromUpRight(Eigen::Vector3d(0, 2, 0), Eigen::Vector3d(1, 0.3, 0));
  ASSERT_TRUE(q.has_value());
  expectSameRotation(*q, Eigen::Quaterniond::Identity(), 1e-9);
}

TEST(VectorMath, BasisFromUpRightRejectsParallelInputs)
{
  EXPECT_FALSE(vecmath::basisFromUpRight(Eigen::Vector3d::UnitY(), Eigen::Vector3d::UnitY()).has_value());
  EXPECT_FALSE(vecmath::basisFromUpRight(Eigen::Vector3d::Zero(), Eigen::Vector3d::UnitX()).has_value());
}

TEST(VectorMath, InverseUndoesRotation)
{
  const Eigen::Quaterniond q = axisAngle(1.1, Eigen::Vector3d(0.2, 1, -0.4));
  expectSameRotation(vecmath::multiply(q, vecmath::inverse(q)), Eigen::Quaterniond::Identity());
}

TEST(VectorMath, LerpAndFiniteChecks)
{
  EXPECT_DOUBLE_EQ(vecmath::lerp(2.0, 4.0, 0.25), 2.5);
  EXPECT_TRUE(vecmath::isFinite(Eigen::Vector3d(1, 2, 3)));
  EXPECT_FALSE(vecmath::isFinite(Eigen::Vector3d(1, NAN, 3)));
  EXPECT_FALSE(vecmath::isFinite(Eigen::Quaterniond(INFINITY, 0, 0, 0)));
}
