#pragma once

// C++ Standard Library
#include <array>
#include <bitset>
#include <optional>
#include <utility>
#include <vector>

// Third-party libraries
#include <Eigen/Core>
#include <Eigen/Geometry>

// built by me
#include "bone_handle.hpp"
#include "canonical_pose.hpp"
#include "retarget_config.hpp"
#include "root_motion_estimator.hpp"
#include "smoothing_engine.hpp"

// Drives a bound humanoid skeleton from canonical poses. The bind pose is
// captured once in the constructor; a different skeleton needs a new instance.
class Retargeter {
public:
    enum class State { Unbound, Bound };
    enum class Axis { X, Y, Z };

    struct BindInfo {
        bool valid = false;
        Eigen::Vector3d position = Eigen::Vector3d::Zero();
        Eigen::Quaterniond rotation = Eigen::Quaterniond::Identity();
        Eigen::Vector3d localPosition = Eigen::Vector3d::Zero();
        Eigen::Quaterniond localRotation = Eigen::Quaterniond::Identity();
        std::vector<std::pair<BoneId, Eigen::Vector3d>> childDirections;

        std::optional<Eigen::Vector3d> childDirection(BoneId child) const;
    };

    using BoneLink = std::pair<BoneId, BoneId>;

    // Every parent -> child link with a bind direction
    static const std::vector<BoneLink>& chainLinks();
    // Links aligned by plain direction deltas after the special handlers
    static const std::vector<BoneLink>& standardLinks();

    explicit Retargeter(const SkeletonBinding& binding, const RetargetConfig& config = RetargetConfig());

    // One frame. imageLandmarks feed root motion and may be empty. Rotation
    // smoothing runs only when a timestamp is given. Never throws.
    void applyPose(const CanonicalPose& pose,
                   const Eigen::MatrixXd& imageLandmarks,
                   int width,
                   int height,
                   std::optional<double> timestamp = std::nullopt);

    // Per-point position smoothing through the owned SmoothingEngine.
    void smoothPose(CanonicalPose& pose, double t);

    void resetSmoothing();
    void resetRootMotion();

    State getState() const { return state; }
    const BindInfo& bindInfo(BoneId id) const { return bindPose[boneIndex(id)]; }
    double getModelLegLength() const { return modelLegLength; }
    Axis getVerticalAxis() const { return verticalAxis; }
    double getUpSign() const { return upSign; }
    // Hips local units per world unit, 100 for a metre scene over a centimetre rig
    double getHipsLocalScale() const { return hipsLocalScale; }
    const std::optional<Eigen::Quaterniond>& getHipsBindBasis() const { return hipsBindBasis; }
    const std::optional<Eigen::Quaterniond>& getSpineBindBasis() const { return spineBindBasis; }
    const std::optional<Eigen::Quaterniond>& getHeadBindBasis() const { return headBindBasis; }
    const RootMotionEstimator& rootMotion() const { return rootMotionEstimator; }
    const SmoothingEngine& smoothing() const { return smoothingEngine; }
    const RetargetConfig& getConfig() const { return config; }

private:
    // Bind time
    void computeBindPose();
    void computeHipsBasis();
    void computeSpineBasis();
    void computeHeadBasis();
    void detectAxes();
    void computeModelLegLength();

    // Per frame
    void positionHips(const CanonicalPose& pose, const Eigen::MatrixXd& imageLandmarks);
    void handleHips(const CanonicalPose& pose);
    void handleSpine(const CanonicalPose& pose);
    void handleLimb(const CanonicalPose& pose, BoneId start, BoneId mid, BoneId end,
                    std::optional<BoneId> fingerTip, double swivelWeight);
    // false when either limb is too straight to define a plane
    bool handleSwivel(const CanonicalPose& pose, BoneId start, BoneId mid, BoneId end, double weight);
    void handleForearmTwist(BoneId mid, const PosePoint& pMid, const PosePoint& pEnd, const PosePoint& pFinger,
                            const BindInfo& bMid, const BindInfo& bEnd, const BindInfo& bFinger);
    void handleHand(const CanonicalPose& pose, BoneId hand, BoneId forearm, BoneId index, BoneId pinky);
    void handleHead(const CanonicalPose& pose);
    void alignBone(BoneId parent, BoneId child, const CanonicalPose& pose);
    void applySmoothing(double t);

    // Writes parent^-1 * targetWorld into the bone, slerped by t
    void applyWorldRotation(BoneId id, const Eigen::Quaterniond& targetWorld, double t);
    void slerpLocalRotation(BoneId id, const Eigen::Quaterniond& targetLocal, double t);

    BoneHandle* bone(BoneId id) const { return binding[boneIndex(id)]; }
    const BindInfo* bind(BoneId id) const;
    double verticalValue(const Eigen::Vector3d& v) const;
    double forwardValue(const Eigen::Vector3d& v) const;

    SkeletonBinding binding;
    RetargetConfig config;
    State state = State::Unbound;

    std::array<BindInfo, BONE_COUNT> bindPose;
    std::optional<Eigen::Quaterniond> hipsBindBasis;
    std::optional<Eigen::Quaterniond> spineBindBasis;
    std::optional<Eigen::Quaterniond> headBindBasis;
    std::array<bool, BONE_COUNT> armChainBone{};

    Axis verticalAxis = Axis::Y;
    double upSign = 1.0;
    double hipsLocalScale = 1.0;
    double modelLegLength = 1.0;

    RootMotionEstimator rootMotionEstimator;
    SmoothingEngine smoothingEngine;
    std::bitset<BONE_COUNT> touched;
};
