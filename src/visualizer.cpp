#include "visualizer.hpp"

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

namespace {

// Body connections, face excluded
const std::vector<std::pair<int, int>> BODY_CONNECTIONS = {
    {PoseLandmark::LEFT_SHOULDER, PoseLandmark::RIGHT_SHOULDER},
    {PoseLandmark::LEFT_SHOULDER, PoseLandmark::LEFT_HIP},
    {PoseLandmark::RIGHT_SHOULDER, PoseLandmark::RIGHT_HIP},
    {PoseLandmark::LEFT_HIP, PoseLandmark::RIGHT_HIP},
    {PoseLandmark::LEFT_SHOULDER, PoseLandmark::LEFT_ELBOW},
    {PoseLandmark::LEFT_ELBOW, PoseLandmark::LEFT_WRIST},
    {PoseLandmark::RIGHT_SHOULDER, PoseLandmark::RIGHT_ELBOW},
    {PoseLandmark::RIGHT_ELBOW, PoseLandmark::RIGHT_WRIST},
    {PoseLandmark::LEFT_HIP, PoseLandmark::LEFT_KNEE},
    {PoseLandmark::LEFT_KNEE, PoseLandmark::LEFT_ANKLE},
    {PoseLandmark::LEFT_ANKLE, PoseLandmark::LEFT_FOOT_INDEX},
    {PoseLandmark::RIGHT_HIP, PoseLandmark::RIGHT_KNEE},
    {PoseLandmark::RIGHT_KNEE, PoseLandmark::RIGHT_ANKLE},
    {PoseLandmark::RIGHT_ANKLE, PoseLandmark::RIGHT_FOOT_INDEX},
};

// Wrist to each fingertip through the four joints of the finger
const std::vector<std::pair<int, int>> HAND_CONNECTIONS = [] {
    std::vector<std::pair<int, int>> c;
    for (int base = 1; base <= 17; base += 4) {
        c.emplace_back(0, base);
        for (int i = 0; i < 3; ++i) c.emplace_back(base + i, base + i + 1);
    }
    return c;
}();

constexpr double MIN_DRAW_VISIBILITY = 0.5;

}  // namespace

void TrackerVisualizer::drawLandmarks(cv::Mat& frame, const LandmarkFrame& landmarks) {
    const Eigen::MatrixXd& image = landmarks.imageLandmarks;
    if (image.rows() >= PoseLandmark::COUNT) {
        for (const auto& [start_idx, end_idx] : BODY_CONNECTIONS) {
            const bool visible = image.cols() < 4 ||
                (image(start_idx, 3) > MIN_DRAW_VISIBILITY && image(end_idx, 3) > MIN_DRAW_VISIBILITY);
            if (!visible) continue;

            const cv::Point start_point = normalizedToPixel(image(start_idx, 0), image(start_idx, 1));
            const cv::Point end_point = normalizedToPixel(image(end_idx, 0), image(end_idx, 1));

            // MediaPipe's left side has odd indices
            const cv::Scalar& color = (start_idx % 2 == 1 && end_idx % 2 == 1) ? colors["left"]
                                    : (start_idx % 2 == 0 && end_idx % 2 == 0) ? colors["right"]
                                    : colors["center"];
            cv::line(frame, start_point, end_point, color, 2);
            cv::circle(frame, start_point, 4, cv::Scalar(0, 0, 255), -1);
            cv::circle(frame, end_point, 4, cv::Scalar(0, 0, 255), -1);
        }
    }

    if (landmarks.leftHand) drawHand(frame, *landmarks.leftHand, colors["left"]);
    if (landmarks.rightHand) drawHand(frame, *landmarks.rightHand, colors["right"]);
}

void TrackerVisualizer::drawHand(cv::Mat& frame, const Eigen::MatrixXd& hand, const cv::Scalar& color) {
    if (hand.rows() < HandLandmark::COUNT) return;

    for (const auto& [a, b] : HAND_CONNECTIONS) {
        cv::line(frame, normalizedToPixel(hand(a, 0), hand(a, 1)),
                 normalizedToPixel(hand(b, 0), hand(b, 1)), color, 1);
    }
    for (int i = 0; i < HandLandmark::COUNT; ++i) {
        cv::circle(frame, normalizedToPixel(hand(i, 0), hand(i, 1)), 2, cv::Scalar(255, 255, 255), -1);
    }
}

cv::Scalar TrackerVisualizer::sideColor(const std::string& boneName) const {
    if (boneName.find("Left") != std::string::npos) return colors.at("left");
    if (boneName.find("Right") != std::string::npos) return colors.at("right");
    return colors.at("center");
}

cv::Mat TrackerVisualizer::drawSkeleton(const SceneSkeleton& skeleton, const cv::Size& panelSize) {
    cv::Mat panel(panelSize, CV_8UC3, cv::Scalar(32, 33, 36));
    if (skeleton.size() == 0) return panel;

    double min_x = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double min_y = std::numeric_limits<double>::max();
    double max_y = std::numeric_limits<double>::lowest();
    for (std::size_t i = 0; i < skeleton.size(); ++i) {
        const Eigen::Vector3d& p = skeleton.node(static_cast<int>(i)).worldPosition;
        min_x = std::min(min_x, p.x());
        max_x = std::max(max_x, p.x());
        min_y = std::min(min_y, p.y());
        max_y = std::max(max_y, p.y());
    }

    const double span = std::max(max_x - min_x, max_y - min_y);
    if (span <= 0) return panel;
    const double scale = 0.9 * std::min(panelSize.width, panelSize.height) / span;
    const double center_x = (min_x + max_x) * 0.5;
    const double center_y = (min_y + max_y) * 0.5;

    // The model faces the camera, so its left (+X) is drawn on screen right
    auto project = [&](const Eigen::Vector3d& p) {
        return cv::Point(static_cast<int>(panelSize.width * 0.5 + (p.x() - center_x) * scale),
                         static_cast<int>(panelSize.height * 0.5 - (p.y() - center_y) * scale));
    };

    for (std::size_t i = 0; i < skeleton.size(); ++i) {
        const SceneSkeleton::Node& n = skeleton.node(static_cast<int>(i));
        if (n.parent < 0) continue;
        const SceneSkeleton::Node& parent = skeleton.node(n.parent);
        cv::line(panel, project(parent.worldPosition), project(n.worldPosition), sideColor(n.name), 2);
    }
    for (std::size_t i = 0; i < skeleton.size(); ++i) {
        cv::circle(panel, project(skeleton.node(static_cast<int>(i)).worldPosition), 2,
                   cv::Scalar(255, 255, 255), -1);
    }

    cv::putText(panel, "Retargeted", cv::Point(10, 24), font, 0.6, cv::Scalar(255, 255, 255), 1);
    return panel;
}

void TrackerVisualizer::drawStatus(cv::Mat& frame, double fps, bool bodyFound, bool recording) {
    const std::string fps_text = "FPS: " + std::to_string(static_cast<int>(fps));
    cv::putText(frame, fps_text, cv::Point(10, 30), font, 0.7, cv::Scalar(255, 255, 255), 2);

    if (!bodyFound) {
        cv::putText(frame, "Tracking lost", cv::Point(10, 60), font, 0.7, cv::Scalar(0, 0, 255), 2);
    }
    if (recording) {
        cv::circle(frame, cv::Point(frameWidth - 30, 30), 10, cv::Scalar(0, 0, 255), -1);
    }
}
