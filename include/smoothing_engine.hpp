#pragma once

// C++ Standard Library
#include <cstddef>
#include <deque>
#include <unordered_map>

// Third-party libraries
#include <Eigen/Core>
#include <Eigen/Geometry>

// built by me
#include "adaptive_filter.hpp"
#include "canonical_pose.hpp"

struct SmoothingConfig {
    bool enableVelocityAdaptive = true;
    bool enableQuaternionSmoothing = true;
    bool enableOutlierRejection = true;

    double baseInterpolationFactor = 0.5;
    double minInterpolationFactor = 0.1;
    double maxInterpolationFactor = 0.9;
    double velocityThreshold = 0.1;
    double outlierThreshold = 3.0;  // standard deviations

    double handBaseInterpolationFactor = 0.7;
    double handMinInterpolationFactor = 0.3;
    double handMaxInterpolationFactor = 0.85;

    std::size_t historySize = 10;
    double fastFactorScale = 1.5;
    double slowFactorScale = 0.7;

    // A run this long of rejected samples is taken as real motion, not a glitch
    int maxConsecutiveOutliers = 3;

    FilterParams coreFilter{0.01, 0.1, 1.0};
    FilterParams limbFilter{0.01, 0.3, 1.0};
    FilterParams handFilter{0.05, 0.5, 1.0};
    double fastMotionBetaBoost = 2.0;
};

struct InterpolationRange {
    double base;
    double min;
    double max;
};

InterpolationRange interpolationRange(const SmoothingConfig& config, BodyPart part);

// Factor picked from the fast/slow classification of `velocity`.
double adaptiveFactor(const SmoothingConfig& config, const InterpolationRange& range, double velocity);

class QuaternionSmoother {
public:
    QuaternionSmoother() : QuaternionSmoother(SmoothingConfig(), BodyPart::Limb) {}
    QuaternionSmoother(const SmoothingConfig& config, BodyPart part);

    Eigen::Quaterniond smooth(double t, const Eigen::Quaterniond& target);

    const std::deque<double>& getRecentVelocities() const { return recentVelocities; }
    const InterpolationRange& getRange() const { return range; }
    bool isInitialized() const { return initialized; }
    void reset();

private:
    SmoothingConfig config;
    InterpolationRange range;
    bool initialized = false;
    Eigen::Quaterniond prevQuat = Eigen::Quaterniond::Identity();
    double prevTime = 0;
    std::deque<double> recentVelocities;
};

class PositionSmoother {
public:
    PositionSmoother() : PositionSmoother(SmoothingConfig(), SmoothingConfig().limbFilter) {}
    PositionSmoother(const SmoothingConfig& config, const FilterParams& params);

    Eigen::Vector3d smooth(double t, const Eigen::Vector3d& target);

    // True when `position` lies within outlierThreshold sigma of the recent mean.
    bool isValidPosition(const Eigen::Vector3d& position) const;

    const std::deque<double>& getRecentSpeeds() const { return recentSpeeds; }
    double getFilterBeta() const { return filter.getBeta(); }
    bool isInitialized() const { return initialized; }
    void reset();

private:
    SmoothingConfig config;
    double baseBeta;
    AdaptiveFilter3 filter;

    bool initialized = false;
    Eigen::Vector3d prevPosition = Eigen::Vector3d::Zero();
    double prevTime = 0;
    int consecutiveOutliers = 0;
    std::deque<Eigen::Vector3d> recentPositions;
    std::deque<double> recentSpeeds;
};

// Per-bone smoother caches, created on first touch and owned by the engine.
class SmoothingEngine {
public:
    SmoothingEngine() = default;
    explicit SmoothingEngine(const SmoothingConfig& config) : config(config) {}

    Eigen::Quaterniond smoothRotation(BoneId bone, double t, const Eigen::Quaterniond& target);
    Eigen::Vector3d smoothPosition(BoneId bone, double t, const Eigen::Vector3d& target);

    // Runs every present point through its position smoother in place.
    void smoothPose(CanonicalPose& pose, double t);

    // Interpolation factor from the bone's recent angular velocities.
    double adaptiveInterpolationFactor(BoneId bone) const;

    void reset();
    void resetBone(BoneId bone);

    const SmoothingConfig& getConfig() const { return config; }
    std::size_t rotationSmootherCount() const { return quatSmoothers.size(); }
    std::size_t positionSmootherCount() const { return posSmoothers.size(); }

private:
    const FilterParams& filterParamsFor(BodyPart part) const;

    SmoothingConfig config;
    std::unordered_map<BoneId, QuaternionSmoother> quatSmoothers;
    std::unordered_map<BoneId, PositionSmoother> posSmoothers;
};
