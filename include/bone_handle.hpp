#pragma once

// C++ Standard Library
#include <array>

// Third-party libraries
#include <Eigen/Core>
#include <Eigen/Geometry>

// built by me
#include "canonical_pose.hpp"

// A bone owned by some scene graph. The retargeter reads world transforms
// and writes local position/rotation only.
class BoneHandle {
public:
    virtual ~BoneHandle() = default;

    virtual Eigen::Vector3d worldPosition() const = 0;
    virtual Eigen::Quaterniond worldRotation() const = 0;

    virtual Eigen::Vector3d localPosition() const = 0;
    virtual Eigen::Quaterniond localRotation() const = 0;
    virtual void setLocalPosition(const Eigen::Vector3d& position) = 0;
    virtual void setLocalRotation(const Eigen::Quaterniond& rotation) = 0;

    // Identity for a root bone
    virtual Eigen::Quaterniond parentWorldRotation() const = 0;

    // Recompute world transforms of this bone and its descendants
    virtual void propagateToChildren() = 0;
};

// Canonical bone -> handle, nullptr where the rig has no such bone.
// Non-owning: the scene must outlive every Retargeter built on it.
using SkeletonBinding = std::array<BoneHandle*, BONE_COUNT>;

inline SkeletonBinding emptyBinding() {
    SkeletonBinding binding;
    binding.fill(nullptr);
    return binding;
}
