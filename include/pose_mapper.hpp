#pragma once

// C++ Standard Library
#include <array>
#include <cstddef>
#include <optional>

// Third-party libraries
#include <Eigen/Core>

// built by me
#include "canonical_pose.hpp"

// MediaPipe Pose landmark indices
struct PoseLandmark {
    static constexpr int NOSE = 0;
    static constexpr int LEFT_EYE = 2;
    static constexpr int RIGHT_EYE = 5;
    static constexpr int LEFT_EAR = 7;
    static constexpr int RIGHT_EAR = 8;
    static constexpr int LEFT_SHOULDER = 11;
    static constexpr int RIGHT_SHOULDER = 12;
    static constexpr int LEFT_ELBOW = 13;
    static constexpr int RIGHT_ELBOW = 14;
    static constexpr int LEFT_WRIST = 15;
    static constexpr int RIGHT_WRIST = 16;
    static constexpr int LEFT_PINKY = 17;
    static constexpr int RIGHT_PINKY = 18;
    static constexpr int LEFT_INDEX = 19;
    static constexpr int RIGHT_INDEX = 20;
    static constexpr int LEFT_THUMB = 21;
    static constexpr int RIGHT_THUMB = 22;
    static constexpr int LEFT_HIP = 23;
    static constexpr int RIGHT_HIP = 24;
    static constexpr int LEFT_KNEE = 25;
    static constexpr int RIGHT_KNEE = 26;
    static constexpr int LEFT_ANKLE = 27;
    static constexpr int RIGHT_ANKLE = 28;
    static constexpr int LEFT_HEEL = 29;
    static constexpr int RIGHT_HEEL = 30;
    static constexpr int LEFT_FOOT_INDEX = 31;
    static constexpr int RIGHT_FOOT_INDEX = 32;
    static constexpr int COUNT = 33;
};

// MediaPipe Hands landmark indices
struct HandLandmark {
    static constexpr int WRIST = 0;
    static constexpr int THUMB_CMC = 1;
    static constexpr int INDEX_MCP = 5;
    static constexpr int MIDDLE_MCP = 9;
    static constexpr int RING_MCP = 13;
    static constexpr int PINKY_MCP = 17;
    static constexpr int COUNT = 21;
};

// One frame from the pose estimator. Rows are landmarks, columns are
// x, y, z and optionally visibility.
struct LandmarkFrame {
    Eigen::MatrixXd worldLandmarks;   // metres, hip centred
    Eigen::MatrixXd imageLandmarks;   // normalized image coordinates
    std::optional<Eigen::MatrixXd> leftHand;   // 21 rows, normalized image coordinates
    std::optional<Eigen::MatrixXd> rightHand;
    int width = 640;
    int height = 480;
    double timestamp = 0;
};

// Keeps the chosen hand depth sign stable: a new sign must win for
// `switchFrames` consecutive frames before it replaces the current one.
class PalmOrientationSmoother {
public:
    static constexpr int SWITCH_FRAMES = 3;

    explicit PalmOrientationSmoother(int switchFrames = SWITCH_FRAMES) : switchFrames(switchFrames) {}

    double update(Side side, double candidateSign);
    double currentSign(Side side) const { return states[index(side)].sign; }
    void reset();

private:
    struct SideState {
        bool initialized = false;
        double sign = 1.0;
        int pending = 0;
    };

    static std::size_t index(Side side) { return side == Side::Left ? 0 : 1; }

    int switchFrames;
    std::array<SideState, 2> states;
};

// Reads row `index` as a point. World rows get the y/z axis flip.
// nullopt when the row is missing or non-finite.
std::optional<PosePoint> landmarkPoint(const Eigen::MatrixXd& landmarks, int index, bool flipAxes);

// Landmark frame to canonical pose. Pure unless `palmSmoother` is given.
CanonicalPose buildCanonicalPose(const LandmarkFrame& frame, PalmOrientationSmoother* palmSmoother = nullptr);
