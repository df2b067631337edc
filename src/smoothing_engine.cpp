#include "smoothing_engine.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "vector_math.hpp"

InterpolationRange interpolationRange(const SmoothingConfig& config, BodyPart part) {
    if (part == BodyPart::Hand) {
        return {config.handBaseInterpolationFactor,
                config.handMinInterpolationFactor,
                config.handMaxInterpolationFactor};
    }
    return {config.baseInterpolationFactor,
            config.minInterpolationFactor,
            config.maxInterpolationFactor};
}

double adaptiveFactor(const SmoothingConfig& config, const InterpolationRange& range, double velocity) {
    if (velocity > config.velocityThreshold) {
        // Fast: follow the target more closely
        return std::min(range.base * config.fastFactorScale, range.max);
    }
    return std::max(range.base * config.slowFactorScale, range.min);
}

// ---------------------------------------------------------------------------
// QuaternionSmoother

QuaternionSmoother::QuaternionSmoother(const SmoothingConfig& config, BodyPart part)
    : config(config), range(interpolationRange(config, part)) {}

Eigen::Quaterniond QuaternionSmoother::smooth(double t, const Eigen::Quaterniond& target) {
    const Eigen::Quaterniond unitTarget = vecmath::normalizeOrIdentity(target);
    if (!initialized) {
        prevQuat = unitTarget;
        prevTime = t;
        initialized = true;
        return unitTarget;
    }

    const double dt = t - prevTime;
    if (dt <= 0) {
        return prevQuat;
    }

    Eigen::Quaterniond adjusted = unitTarget;
    if (config.enableQuaternionSmoothing && prevQuat.coeffs().dot(unitTarget.coeffs()) < 0) {
        adjusted.coeffs() = -adjusted.coeffs();
    }

    const Eigen::Quaterniond delta = adjusted * prevQuat.conjugate();
    const double angle = 2.0 * std::acos(std::clamp(delta.w(), -1.0, 1.0));
    const double angularVelocity = angle / dt;

    double factor = range.base;
    if (config.enableVelocityAdaptive) {
        recentVelocities.push_back(angularVelocity);
        while (recentVelocities.size() > config.historySize) {
            recentVelocities.pop_front();
        }
        factor = adaptiveFactor(config, range, angularVelocity);
    }

    prevQuat = vecmath::slerp(prevQuat, adjusted, factor);
    prevTime = t;
    return prevQuat;
}

void QuaternionSmoother::reset() {
    initialized = false;
    prevQuat = Eigen::Quaterniond::Identity();
    prevTime = 0;
    recentVelocities.clear();
}

// ---------------------------------------------------------------------------
// PositionSmoother

PositionSmoother::PositionSmoother(const SmoothingConfig& config, const FilterParams& params)
    : config(config), baseBeta(params.beta), filter(params) {}

bool PositionSmoother::isValidPosition(const Eigen::Vector3d& position) const {
    if (recentPositions.size() < 3) return true;

    const double n = static_cast<double>(recentPositions.size());
    const Eigen::Vector3d mean =
        std::accumulate(recentPositions.begin(), recentPositions.end(), Eigen::Vector3d(Eigen::Vector3d::Zero())) / n;

    double variance = 0.0;
    for (const auto& p : recentPositions) {
        variance += (p - mean).squaredNorm();
    }
    const double stdDev = std::sqrt(variance / n);

    return (position - mean).norm() <= stdDev * config.outlierThreshold;
}

Eigen::Vector3d PositionSmoother::smooth(double t, const Eigen::Vector3d& target) {
    if (config.enableOutlierRejection && initialized && !isValidPosition(target)) {
        ++consecutiveOutliers;
        if (consecutiveOutliers <= config.maxConsecutiveOutliers) {
            return prevPosition;
        }
        // Persistent jump: restart the statistics around the new location
        recentPositions.clear();
    }
    consecutiveOutliers = 0;

    const Eigen::Vector3d filtered = filter.filter(t, target);

    recentPositions.push_back(filtered);
    while (recentPositions.size() > config.historySize) {
        recentPositions.pop_front();
    }

    if (initialized) {
        const double dt = t - prevTime;
        if (dt > 0) {
            recentSpeeds.push_back((filtered - prevPosition).norm() / dt);
            while (recentSpeeds.size() > config.historySize) {
                recentSpeeds.pop_front();
            }
        }
    }

    if (config.enableVelocityAdaptive && !recentSpeeds.empty()) {
        const double avgSpeed =
            std::accumulate(recentSpeeds.begin(), recentSpeeds.end(), 0.0) / recentSpeeds.size();
        filter.setBeta(avgSpeed > config.velocityThreshold ? baseBeta * config.fastMotionBetaBoost : baseBeta);
    }

    prevPosition = filtered;
    prevTime = t;
    initialized = true;
    return filtered;
}

void PositionSmoother::reset() {
    filter.reset();
    filter.setBeta(baseBeta);
    initialized = false;
    prevPosition = Eigen::Vector3d::Zero();
    prevTime = 0;
    consecutiveOutliers = 0;
    recentPositions.clear();
    recentSpeeds.clear();
}

// ---------------------------------------------------------------------------
// SmoothingEngine

const FilterParams& SmoothingEngine::filterParamsFor(BodyPart part) const {
    switch (part) {
        case BodyPart::Core:
            return config.coreFilter;
        case BodyPart::Hand:
            return config.handFilter;
        case BodyPart::Limb:
        default:
            return config.limbFilter;
    }
}

Eigen::Quaterniond SmoothingEngine::smoothRotation(BoneId bone, double t, const Eigen::Quaterniond& target) {
    auto it = quatSmoothers.find(bone);
    if (it == quatSmoothers.end()) {
        it = quatSmoothers.emplace(bone, QuaternionSmoother(config, bodyPartOf(bone))).first;
    }
    return it->second.smooth(t, target);
}

Eigen::Vector3d SmoothingEngine::smoothPosition(BoneId bone, double t, const Eigen::Vector3d& target) {
    auto it = posSmoothers.find(bone);
    if (it == posSmoothers.end()) {
        it = posSmoothers.emplace(bone, PositionSmoother(config, filterParamsFor(bodyPartOf(bone)))).first;
    }
    return it->second.smooth(t, target);
}

void SmoothingEngine::smoothPose(CanonicalPose& pose, double t) {
    for (std::size_t i = 0; i < BONE_COUNT; ++i) {
        const BoneId id = boneAt(i);
        auto& point = pose.get(id);
        if (!point) continue;
        point->position = smoothPosition(id, t, point->position);
    }
}

double SmoothingEngine::adaptiveInterpolationFactor(BoneId bone) const {
    const InterpolationRange range = interpolationRange(config, bodyPartOf(bone));

    auto it = quatSmoothers.find(bone);
    if (it == quatSmoothers.end() || it->second.getRecentVelocities().empty()) {
        return range.base;
    }

    const auto& velocities = it->second.getRecentVelocities();
    const double avg = std::accumulate(velocities.begin(), velocities.end(), 0.0) / velocities.size();
    return adaptiveFactor(config, range, avg);
}

void SmoothingEngine::reset() {
    quatSmoothers.clear();
    posSmoothers.clear();
}

void SmoothingEngine::resetBone(BoneId bone) {
    quatSmoothers.erase(bone);
    posSmoothers.erase(bone);
}
