#include "canonical_pose.hpp"

#include <unordered_map>

namespace {

constexpr std::array<const char*, BONE_COUNT> BONE_NAMES = {
    "Hips", "Spine", "Spine1", "Spine2", "Neck", "Head", "HeadTop_End",
    "LeftEye", "RightEye", "LeftEar", "RightEar", "Nose",

    "LeftShoulder", "LeftArm", "LeftForeArm", "LeftHand",
    "LeftHandThumb1", "LeftHandThumb2", "LeftHandThumb3", "LeftHandThumb4",
    "LeftHandIndex1", "LeftHandIndex2", "LeftHandIndex3", "LeftHandIndex4",
    "LeftHandMiddle1", "LeftHandMiddle2", "LeftHandMiddle3", "LeftHandMiddle4",
    "LeftHandRing1", "LeftHandRing2", "LeftHandRing3", "LeftHandRing4",
    "LeftHandPinky1", "LeftHandPinky2", "LeftHandPinky3", "LeftHandPinky4",

    "RightShoulder", "RightArm", "RightForeArm", "RightHand",
    "RightHandThumb1", "RightHandThumb2", "RightHandThumb3", "RightHandThumb4",
    "RightHandIndex1", "RightHandIndex2", "RightHandIndex3", "RightHandIndex4",
    "RightHandMiddle1", "RightHandMiddle2", "RightHandMiddle3", "RightHandMiddle4",
    "RightHandRing1", "RightHandRing2", "RightHandRing3", "RightHandRing4",
    "RightHandPinky1", "RightHandPinky2", "RightHandPinky3", "RightHandPinky4",

    "LeftUpLeg", "LeftLeg", "LeftFoot", "LeftToeBase", "LeftToe_End",
    "RightUpLeg", "RightLeg", "RightFoot", "RightToeBase", "RightToe_End",
};

const std::unordered_map<std::string, BoneId>& nameIndex() {
    static const std::unordered_map<std::string, BoneId> index = [] {
        std::unordered_map<std::string, BoneId> m;
        for (std::size_t i = 0; i < BONE_COUNT; ++i) {
            m.emplace(BONE_NAMES[i], boneAt(i));
        }
        return m;
    }();
    return index;
}

}  // namespace

const char* boneName(BoneId id) {
    const std::size_t i = boneIndex(id);
    return i < BONE_COUNT ? BONE_NAMES[i] : "Unknown";
}

std::optional<BoneId> boneFromName(const std::string& name) {
    const auto& index = nameIndex();
    auto it = index.find(name);
    if (it == index.end()) return std::nullopt;
    return it->second;
}

BoneId fingerBone(Side side, Finger finger, int segment) {
    const BoneId thumb1 = side == Side::Left ? BoneId::LeftHandThumb1 : BoneId::RightHandThumb1;
    const std::size_t offset = static_cast<std::size_t>(finger) * 4 + static_cast<std::size_t>(segment - 1);
    return boneAt(boneIndex(thumb1) + offset);
}

bool isHandBone(const std::string& name) {
    auto contains = [&name](const char* part) { return name.find(part) != std::string::npos; };
    if (name == "LeftHand" || name == "RightHand") return true;
    return contains("Hand") &&
           (contains("Thumb") || contains("Index") || contains("Middle") ||
            contains("Ring") || contains("Pinky"));
}

bool isHandBone(BoneId id) {
    return isHandBone(std::string(boneName(id)));
}

BodyPart bodyPartOf(BoneId id) {
    if (isHandBone(id)) return BodyPart::Hand;
    switch (id) {
        case BoneId::Hips:
        case BoneId::Spine:
        case BoneId::Spine1:
        case BoneId::Spine2:
        case BoneId::Neck:
        case BoneId::Head:
        case BoneId::HeadTopEnd:
        case BoneId::LeftEye:
        case BoneId::RightEye:
        case BoneId::LeftEar:
        case BoneId::RightEar:
        case BoneId::Nose:
        case BoneId::LeftShoulder:
        case BoneId::RightShoulder:
            return BodyPart::Core;
        default:
            return BodyPart::Limb;
    }
}

std::size_t CanonicalPose::size() const {
    std::size_t n = 0;
    for (const auto& p : points) {
        if (p) ++n;
    }
    return n;
}

void CanonicalPose::clear() {
    for (auto& p : points) {
        p.reset();
    }
}
