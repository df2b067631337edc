#include "pose_mapper.hpp"

#include <algorithm>
#include <cmath>

#include "vector_math.hpp"

namespace {

constexpr double EXTENSION_RATIO = 0.3;
constexpr int FINGER_SEGMENTS = 4;

struct SideIndices {
    Side side;
    int shoulder, elbow, wrist, pinky, index, thumb;
    int hip, knee, ankle, footIndex;
    BoneId arm, foreArm, hand;
    BoneId upLeg, leg, foot, toeBase, toeEnd;
};

const std::array<SideIndices, 2> SIDES = {{
    {Side::Left,
     PoseLandmark::LEFT_SHOULDER, PoseLandmark::LEFT_ELBOW, PoseLandmark::LEFT_WRIST,
     PoseLandmark::LEFT_PINKY, PoseLandmark::LEFT_INDEX, PoseLandmark::LEFT_THUMB,
     PoseLandmark::LEFT_HIP, PoseLandmark::LEFT_KNEE, PoseLandmark::LEFT_ANKLE, PoseLandmark::LEFT_FOOT_INDEX,
     BoneId::LeftArm, BoneId::LeftForeArm, BoneId::LeftHand,
     BoneId::LeftUpLeg, BoneId::LeftLeg, BoneId::LeftFoot, BoneId::LeftToeBase, BoneId::LeftToeEnd},
    {Side::Right,
     PoseLandmark::RIGHT_SHOULDER, PoseLandmark::RIGHT_ELBOW, PoseLandmark::RIGHT_WRIST,
     PoseLandmark::RIGHT_PINKY, PoseLandmark::RIGHT_INDEX, PoseLandmark::RIGHT_THUMB,
     PoseLandmark::RIGHT_HIP, PoseLandmark::RIGHT_KNEE, PoseLandmark::RIGHT_ANKLE, PoseLandmark::RIGHT_FOOT_INDEX,
     BoneId::RightArm, BoneId::RightForeArm, BoneId::RightHand,
     BoneId::RightUpLeg, BoneId::RightLeg, BoneId::RightFoot, BoneId::RightToeBase, BoneId::RightToeEnd},
}};

constexpr std::array<Finger, 5> FINGERS = {
    Finger::Thumb, Finger::Index, Finger::Middle, Finger::Ring, Finger::Pinky};

std::optional<PosePoint> midpoint(const std::optional<PosePoint>& a, const std::optional<PosePoint>& b) {
    if (!a || !b) return std::nullopt;
    return PosePoint((a->position + b->position) * 0.5, (a->visibility + b->visibility) * 0.5);
}

// to + 0.3 * (to - from)
std::optional<PosePoint> extend(const std::optional<PosePoint>& from, const std::optional<PosePoint>& to) {
    if (!from || !to) return std::nullopt;
    const Eigen::Vector3d dir = to->position - from->position;
    return PosePoint(to->position + dir * EXTENSION_RATIO, std::min(from->visibility, to->visibility));
}

void setIfPresent(CanonicalPose& pose, BoneId id, const std::optional<PosePoint>& p) {
    if (p) pose.set(id, *p);
}

// Straight chain from the wrist toward a fingertip estimate
void assignFingerChain(CanonicalPose& pose, Side side, Finger finger,
                       const std::optional<PosePoint>& base, const std::optional<PosePoint>& tip) {
    if (!base || !tip) return;
    const double vis = std::min(base->visibility, tip->visibility);
    for (int i = 1; i <= FINGER_SEGMENTS; ++i) {
        const double t = static_cast<double>(i) / FINGER_SEGMENTS;
        pose.set(fingerBone(side, finger, i),
                 base->position + (tip->position - base->position) * t, vis);
    }
}

Eigen::Vector3d toPixels(const Eigen::MatrixXd& landmarks, int row, double width, double height) {
    return Eigen::Vector3d(landmarks(row, 0) * width, landmarks(row, 1) * height, landmarks(row, 2) * width);
}

// Detailed fingers from the hand detector. Offsets from the hand wrist are
// taken in pixels, flipped into the world axes and scaled by the ratio of the
// world forearm length to the pixel forearm length.
bool mapHandLandmarks(CanonicalPose& pose, const LandmarkFrame& frame, const SideIndices& s,
                      const Eigen::MatrixXd& hand, PalmOrientationSmoother* palmSmoother) {
    if (hand.rows() < HandLandmark::COUNT || hand.cols() < 3) return false;
    if (!hand.topLeftCorner(HandLandmark::COUNT, 3).allFinite()) return false;

    const auto world_elbow = landmarkPoint(frame.worldLandmarks, s.elbow, true);
    const auto world_wrist = landmarkPoint(frame.worldLandmarks, s.wrist, true);
    const auto image_elbow = landmarkPoint(frame.imageLandmarks, s.elbow, false);
    const auto image_wrist = landmarkPoint(frame.imageLandmarks, s.wrist, false);
    if (!world_elbow || !world_wrist || !image_elbow || !image_wrist) return false;

    const double w = std::max(frame.width, 1);
    const double h = std::max(frame.height, 1);

    const Eigen::Vector3d pixel_forearm =
        toPixels(frame.imageLandmarks, s.wrist, w, h) - toPixels(frame.imageLandmarks, s.elbow, w, h);
    const Eigen::Vector3d world_forearm = world_wrist->position - world_elbow->position;
    if (pixel_forearm.norm() < vecmath::EPSILON || world_forearm.norm() < vecmath::EPSILON) return false;

    const double scale = world_forearm.norm() / pixel_forearm.norm();
    const Eigen::Vector3d hand_wrist_px = toPixels(hand, HandLandmark::WRIST, w, h);

    auto offset = [&](int row, double depthSign) {
        const Eigen::Vector3d d = toPixels(hand, row, w, h) - hand_wrist_px;
        return Eigen::Vector3d(d.x(), -d.y(), -d.z() * depthSign) * scale;
    };

    // Pick the depth sign whose wrist -> middle MCP direction continues the forearm
    const Eigen::Vector3d forearm_dir = world_forearm.normalized();
    auto alignment = [&](double depthSign) {
        const Eigen::Vector3d v = offset(HandLandmark::MIDDLE_MCP, depthSign);
        return v.norm() < vecmath::EPSILON ? 0.0 : v.normalized().dot(forearm_dir);
    };
    const double candidate = alignment(1.0) >= alignment(-1.0) ? 1.0 : -1.0;
    const double depth_sign = palmSmoother ? palmSmoother->update(s.side, candidate) : candidate;

    for (std::size_t f = 0; f < FINGERS.size(); ++f) {
        for (int segment = 1; segment <= FINGER_SEGMENTS; ++segment) {
            const int row = 1 + static_cast<int>(f) * FINGER_SEGMENTS + (segment - 1);
            double vis = hand.cols() >= 4 ? hand(row, 3) : 1.0;
            if (!std::isfinite(vis)) vis = 0.0;
            pose.set(fingerBone(s.side, FINGERS[f], segment),
                     world_wrist->position + offset(row, depth_sign),
                     std::min(world_wrist->visibility, vis));
        }
    }
    return true;
}

}  // namespace

double PalmOrientationSmoother::update(Side side, double candidateSign) {
    const double candidate = candidateSign >= 0 ? 1.0 : -1.0;
    SideState& state = states[index(side)];
    if (!state.initialized) {
        state.initialized = true;
        state.sign = candidate;
        state.pending = 0;
        return state.sign;
    }
    if (candidate == state.sign) {
        state.pending = 0;
        return state.sign;
    }
    if (++state.pending >= switchFrames) {
        state.sign = candidate;
        state.pending = 0;
    }
    return state.sign;
}

void PalmOrientationSmoother::reset() {
    states = {};
}

std::optional<PosePoint> landmarkPoint(const Eigen::MatrixXd& landmarks, int index, bool flipAxes) {
    if (index < 0 || index >= landmarks.rows() || landmarks.cols() < 3) {
        return std::nullopt;
    }
    Eigen::Vector3d p = landmarks.row(index).head<3>().transpose();
    if (!vecmath::isFinite(p)) {
        return std::nullopt;
    }
    if (flipAxes) {
        p.y() = -p.y();
        p.z() = -p.z();
    }
    double visibility = landmarks.cols() >= 4 ? landmarks(index, 3) : 1.0;
    if (!std::isfinite(visibility)) visibility = 0.0;
    return PosePoint(p, visibility);
}

CanonicalPose buildCanonicalPose(const LandmarkFrame& frame, PalmOrientationSmoother* palmSmoother) {
    CanonicalPose pose;
    const Eigen::MatrixXd& world = frame.worldLandmarks;
    if (world.rows() == 0) {
        return pose;
    }

    auto point = [&world](int index) { return landmarkPoint(world, index, true); };

    const auto left_hip = point(PoseLandmark::LEFT_HIP);
    const auto right_hip = point(PoseLandmark::RIGHT_HIP);
    const auto left_shoulder = point(PoseLandmark::LEFT_SHOULDER);
    const auto right_shoulder = point(PoseLandmark::RIGHT_SHOULDER);
    const auto left_ear = point(PoseLandmark::LEFT_EAR);
    const auto right_ear = point(PoseLandmark::RIGHT_EAR);
    const auto nose = point(PoseLandmark::NOSE);

    const auto hips = midpoint(left_hip, right_hip);
    const auto neck = midpoint(left_shoulder, right_shoulder);
    auto head = midpoint(left_ear, right_ear);
    if (!head) head = nose;

    setIfPresent(pose, BoneId::Hips, hips);
    setIfPresent(pose, BoneId::Neck, neck);
    setIfPresent(pose, BoneId::Head, head);
    setIfPresent(pose, BoneId::HeadTopEnd, extend(neck, head));
    setIfPresent(pose, BoneId::LeftEye, point(PoseLandmark::LEFT_EYE));
    setIfPresent(pose, BoneId::RightEye, point(PoseLandmark::RIGHT_EYE));
    setIfPresent(pose, BoneId::LeftEar, left_ear);
    setIfPresent(pose, BoneId::RightEar, right_ear);
    setIfPresent(pose, BoneId::Nose, nose);

    const auto spine1 = midpoint(hips, neck);
    setIfPresent(pose, BoneId::Spine1, spine1);
    setIfPresent(pose, BoneId::Spine, midpoint(hips, spine1));
    setIfPresent(pose, BoneId::Spine2, midpoint(spine1, neck));

    for (const auto& s : SIDES) {
        const auto wrist = point(s.wrist);
        const auto ankle = point(s.ankle);
        const auto foot_index = point(s.footIndex);

        setIfPresent(pose, s.arm, point(s.shoulder));
        setIfPresent(pose, s.foreArm, point(s.elbow));
        setIfPresent(pose, s.hand, wrist);
        setIfPresent(pose, s.upLeg, point(s.hip));
        setIfPresent(pose, s.leg, point(s.knee));
        setIfPresent(pose, s.foot, ankle);
        setIfPresent(pose, s.toeBase, foot_index);
        setIfPresent(pose, s.toeEnd, extend(ankle, foot_index));

        const auto& hand = s.side == Side::Left ? frame.leftHand : frame.rightHand;
        if (hand && mapHandLandmarks(pose, frame, s, *hand, palmSmoother)) {
            continue;
        }

        const auto index_tip = point(s.index);
        const auto pinky_tip = point(s.pinky);
        const auto middle_tip = midpoint(index_tip, pinky_tip);
        assignFingerChain(pose, s.side, Finger::Thumb, wrist, point(s.thumb));
        assignFingerChain(pose, s.side, Finger::Index, wrist, index_tip);
        assignFingerChain(pose, s.side, Finger::Middle, wrist, middle_tip);
        assignFingerChain(pose, s.side, Finger::Ring, wrist, middle_tip);
        assignFingerChain(pose, s.side, Finger::Pinky, wrist, pinky_tip);
    }

    return pose;
}
