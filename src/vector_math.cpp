#include "vector_math.hpp"

#include <algorithm>
#include <cmath>

namespace vecmath {

Eigen::Vector3d normalizeOrKeep(const Eigen::Vector3d& v) {
    const double lenSq = v.squaredNorm();
    if (lenSq == 0.0) {
        return v;
    }
    return v / std::sqrt(lenSq);
}

Eigen::Quaterniond normalizeOrIdentity(const Eigen::Quaterniond& q) {
    const double lenSq = q.coeffs().squaredNorm();
    if (lenSq < EPSILON * EPSILON || !std::isfinite(lenSq)) {
        return Eigen::Quaterniond::Identity();
    }
    Eigen::Quaterniond out = q;
    out.coeffs() /= std::sqrt(lenSq);
    return out;
}

Eigen::Quaterniond multiply(const Eigen::Quaterniond& a, const Eigen::Quaterniond& b) {
    return normalizeOrIdentity(a * b);
}

Eigen::Quaterniond inverse(const Eigen::Quaterniond& q) {
    // Unit quaternion: inverse == conjugate
    return q.conjugate();
}

Eigen::Quaterniond slerp(const Eigen::Quaterniond& from, const Eigen::Quaterniond& to, double t) {
    double cosHalfTheta = from.coeffs().dot(to.coeffs());
    Eigen::Vector4d target = to.coeffs();
    if (cosHalfTheta < 0.0) {
        cosHalfTheta = -cosHalfTheta;
        target = -target;
    }

    Eigen::Vector4d out;
    if (cosHalfTheta > 1.0 - EPSILON) {
        // Nearly identical: linear blend avoids dividing by sin(~0)
        out = from.coeffs() + t * (target - from.coeffs());
    } else {
        const double halfTheta = std::acos(std::min(cosHalfTheta, 1.0));
        const double sinHalfTheta = std::sin(halfTheta);
        const double ratioA = std::sin((1.0 - t) * halfTheta) / sinHalfTheta;
        const double ratioB = std::sin(t * halfTheta) / sinHalfTheta;
        out = ratioA * from.coeffs() + ratioB * target;
    }

    Eigen::Quaterniond result;
    result.coeffs() = out;
    return normalizeOrIdentity(result);
}

Eigen::Quaterniond fromOrthonormalBasis(const Eigen::Vector3d& right,
                                        const Eigen::Vector3d& up,
                                        const Eigen::Vector3d& forward) {
    const double m00 = right.x(), m01 = up.x(), m02 = forward.x();
    const double m10 = right.y(), m11 = up.y(), m12 = forward.y();
    const double m20 = right.z(), m21 = up.z(), m22 = forward.z();
    const double trace = m00 + m11 + m22;

    double x, y, z, w;
    if (trace > 0.0) {
        const double s = 0.5 / std::sqrt(trace + 1.0);
        w = 0.25 / s;
        x = (m21 - m12) * s;
        y = (m02 - m20) * s;
        z = (m10 - m01) * s;
    } else if (m00 > m11 && m00 > m22) {
        const double s = 2.0 * std::sqrt(std::max(1.0 + m00 - m11 - m22, EPSILON));
        w = (m21 - m12) / s;
        x = 0.25 * s;
        y = (m01 + m10) / s;
        z = (m02 + m20) / s;
    } else if (m11 > m22) {
        const double s = 2.0 * std::sqrt(std::max(1.0 + m11 - m00 - m22, EPSILON));
        w = (m02 - m20) / s;
        x = (m01 + m10) / s;
        y = 0.25 * s;
        z = (m12 + m21) / s;
    } else {
        const double s = 2.0 * std::sqrt(std::max(1.0 + m22 - m00 - m11, EPSILON));
        w = (m10 - m01) / s;
        x = (m02 + m20) / s;
        y = (m12 + m21) / s;
        z = 0.25 * s;
    }
    return normalizeOrIdentity(Eigen::Quaterniond(w, x, y, z));
}

Eigen::Quaterniond fromUnitVectors(const Eigen::Vector3d& a, const Eigen::Vector3d& b) {
    const Eigen::Vector3d v1 = normalizeOrKeep(a);
    const Eigen::Vector3d v2 = normalizeOrKeep(b);
    if (v1.squaredNorm() == 0.0 || v2.squaredNorm() == 0.0) {
        return Eigen::Quaterniond::Identity();
    }

    const double r = v1.dot(v2) + 1.0;
    if (r < EPSILON) {
        // Opposite directions: half turn about any axis perpendicular to v1
        Eigen::Vector3d axis = Eigen::Vector3d::UnitX().cross(v1);
        if (axis.squaredNorm() < EPSILON) {
            axis = Eigen::Vector3d::UnitY().cross(v1);
        }
        axis.normalize();
        return Eigen::Quaterniond(0.0, axis.x(), axis.y(), axis.z());
    }

    const Eigen::Vector3d c = v1.cross(v2);
    return normalizeOrIdentity(Eigen::Quaterniond(r, c.x(), c.y(), c.z()));
}

std::optional<Eigen::Quaterniond> basisFromUpRight(const Eigen::Vector3d& up,
                                                   const Eigen::Vector3d& rightHint) {
    if (up.squaredNorm() < EPSILON || rightHint.squaredNorm() < EPSILON) {
        return std::nullopt;
    }
    const Eigen::Vector3d u = up.normalized();
    const Eigen::Vector3d forward = rightHint.normalized().cross(u);
    if (forward.squaredNorm() < EPSILON) {
        return std::nullopt;
    }
    const Eigen::Vector3d f = forward.normalized();
    const Eigen::Vector3d r = u.cross(f).normalized();
    return fromOrthonormalBasis(r, u, f);
}

double angularDistance(const Eigen::Quaterniond& a, const Eigen::Quaterniond& b) {
    const double d = std::min(1.0, std::abs(a.coeffs().dot(b.coeffs())));
    return 2.0 * std::acos(d);
}

bool isFinite(const Eigen::Vector3d& v) {
    return std::isfinite(v.x()) && std::isfinite(v.y()) && std::isfinite(v.z());
}

bool isFinite(const Eigen::Quaterniond& q) {
    return std::isfinite(q.x()) && std::isfinite(q.y()) && std::isfinite(q.z()) && std::isfinite(q.w());
}

}  // namespace vecmath
