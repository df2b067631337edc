#pragma once

// C++ Standard Library
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Third-party libraries
#include <Eigen/Core>

// Canonical joint roles, independent of any rig's naming.
enum class BoneId : uint8_t {
    Hips,
    Spine,
    Spine1,
    Spine2,
    Neck,
    Head,
    HeadTopEnd,
    LeftEye,
    RightEye,
    LeftEar,
    RightEar,
    Nose,

    LeftShoulder,
    LeftArm,
    LeftForeArm,
    LeftHand,
    LeftHandThumb1, LeftHandThumb2, LeftHandThumb3, LeftHandThumb4,
    LeftHandIndex1, LeftHandIndex2, LeftHandIndex3, LeftHandIndex4,
    LeftHandMiddle1, LeftHandMiddle2, LeftHandMiddle3, LeftHandMiddle4,
    LeftHandRing1, LeftHandRing2, LeftHandRing3, LeftHandRing4,
    LeftHandPinky1, LeftHandPinky2, LeftHandPinky3, LeftHandPinky4,

    RightShoulder,
    RightArm,
    RightForeArm,
    RightHand,
    RightHandThumb1, RightHandThumb2, RightHandThumb3, RightHandThumb4,
    RightHandIndex1, RightHandIndex2, RightHandIndex3, RightHandIndex4,
    RightHandMiddle1, RightHandMiddle2, RightHandMiddle3, RightHandMiddle4,
    RightHandRing1, RightHandRing2, RightHandRing3, RightHandRing4,
    RightHandPinky1, RightHandPinky2, RightHandPinky3, RightHandPinky4,

    LeftUpLeg,
    LeftLeg,
    LeftFoot,
    LeftToeBase,
    LeftToeEnd,
    RightUpLeg,
    RightLeg,
    RightFoot,
    RightToeBase,
    RightToeEnd,

    Count
};

constexpr std::size_t BONE_COUNT = static_cast<std::size_t>(BoneId::Count);

inline constexpr std::size_t boneIndex(BoneId id) { return static_cast<std::size_t>(id); }
inline constexpr BoneId boneAt(std::size_t index) { return static_cast<BoneId>(index); }

// Canonical names, e.g. "LeftHandIndex2", "HeadTop_End".
const char* boneName(BoneId id);
std::optional<BoneId> boneFromName(const std::string& name);

enum class Side { Left, Right };
enum class Finger { Thumb, Index, Middle, Ring, Pinky };

// segment is 1..4
BoneId fingerBone(Side side, Finger finger, int segment);

enum class BodyPart { Core, Limb, Hand };

// Substring rule on the canonical name: "Hand" plus a finger name, or the hand itself.
bool isHandBone(const std::string& name);
bool isHandBone(BoneId id);
BodyPart bodyPartOf(BoneId id);

struct PosePoint {
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    double visibility = 0.0;

    PosePoint() = default;
    PosePoint(const Eigen::Vector3d& p, double v) : position(p), visibility(v) {}
};

// One frame of canonical joint positions. An empty slot means the joint was
// not observed this frame and must not drive its bone.
class CanonicalPose {
public:
    void set(BoneId id, const PosePoint& point) { points[boneIndex(id)] = point; }
    void set(BoneId id, const Eigen::Vector3d& position, double visibility) {
        points[boneIndex(id)] = PosePoint(position, visibility);
    }
    void erase(BoneId id) { points[boneIndex(id)].reset(); }

    bool has(BoneId id) const { return points[boneIndex(id)].has_value(); }
    const std::optional<PosePoint>& get(BoneId id) const { return points[boneIndex(id)]; }
    std::optional<PosePoint>& get(BoneId id) { return points[boneIndex(id)]; }
    const std::optional<PosePoint>& operator[](BoneId id) const { return get(id); }

    std::size_t size() const;
    bool empty() const { return size() == 0; }
    void clear();

private:
    std::array<std::optional<PosePoint>, BONE_COUNT> points;
};
