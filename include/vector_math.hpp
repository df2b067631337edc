#pragma once

// C++ Standard Library
#include <optional>

// Third-party libraries
#include <Eigen/Core>
#include <Eigen/Geometry>

// Small vector/quaternion helpers used by the retargeting code.
// Every quaternion returned from here is unit length.
namespace vecmath {

constexpr double EPSILON = 1e-6;

inline Eigen::Vector3d add(const Eigen::Vector3d& a, const Eigen::Vector3d& b) { return a + b; }
inline Eigen::Vector3d sub(const Eigen::Vector3d& a, const Eigen::Vector3d& b) { return a - b; }
inline Eigen::Vector3d scale(const Eigen::Vector3d& v, double s) { return v * s; }
inline double dot(const Eigen::Vector3d& a, const Eigen::Vector3d& b) { return a.dot(b); }
inline Eigen::Vector3d cross(const Eigen::Vector3d& a, const Eigen::Vector3d& b) { return a.cross(b); }
inline double length(const Eigen::Vector3d& v) { return v.norm(); }

// Zero-length input is returned unchanged.
Eigen::Vector3d normalizeOrKeep(const Eigen::Vector3d& v);

Eigen::Quaterniond multiply(const Eigen::Quaterniond& a, const Eigen::Quaterniond& b);
Eigen::Quaterniond inverse(const Eigen::Quaterniond& q);
Eigen::Quaterniond normalizeOrIdentity(const Eigen::Quaterniond& q);

// Shortest-path spherical interpolation from `from` toward `to`.
Eigen::Quaterniond slerp(const Eigen::Quaterniond& from, const Eigen::Quaterniond& to, double t);

// Rotation whose columns are (right, up, forward).
Eigen::Quaterniond fromOrthonormalBasis(const Eigen::Vector3d& right,
                                        const Eigen::Vector3d& up,
                                        const Eigen::Vector3d& forward);

// Minimal rotation taking direction a onto direction b.
Eigen::Quaterniond fromUnitVectors(const Eigen::Vector3d& a, const Eigen::Vector3d& b);

// forward = right x up, right' = up x forward. nullopt when up/right are
// zero-length or parallel.
std::optional<Eigen::Quaterniond> basisFromUpRight(const Eigen::Vector3d& up,
                                                   const Eigen::Vector3d& rightHint);

// Angle in radians of the rotation taking a onto b (double cover aware).
double angularDistance(const Eigen::Quaterniond& a, const Eigen::Quaterniond& b);

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

bool isFinite(const Eigen::Vector3d& v);
bool isFinite(const Eigen::Quaterniond& q);

}  // namespace vecmath
