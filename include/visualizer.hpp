#pragma once

// C++ Standard Library
#include <map>
#include <string>

// Third-party libraries
#include <opencv2/opencv.hpp>
#include <Eigen/Core>

// built by me
#include "pose_mapper.hpp"
#include "scene_skeleton.hpp"

// Draws the detected landmarks over the camera frame and a front view of
// the retargeted skeleton in a side panel.
class TrackerVisualizer {
public:
    TrackerVisualizer(int width, int height)
        : frameWidth(width), frameHeight(height) {
        colors["left"] = cv::Scalar(0, 255, 0);    // Green
        colors["right"] = cv::Scalar(0, 0, 255);   // Red
        colors["center"] = cv::Scalar(255, 200, 0);
        font = cv::FONT_HERSHEY_SIMPLEX;
    }

    void drawLandmarks(cv::Mat& frame, const LandmarkFrame& landmarks);

    // Orthographic X/Y projection of the skeleton, fitted to the panel
    cv::Mat drawSkeleton(const SceneSkeleton& skeleton, const cv::Size& panelSize);

    void drawStatus(cv::Mat& frame, double fps, bool bodyFound, bool recording);

private:
    cv::Point normalizedToPixel(double x, double y) const {
        return cv::Point(static_cast<int>(x * frameWidth), static_cast<int>(y * frameHeight));
    }
    void drawHand(cv::Mat& frame, const Eigen::MatrixXd& hand, const cv::Scalar& color);
    cv::Scalar sideColor(const std::string& boneName) const;

    int frameWidth;
    int frameHeight;
    std::map<std::string, cv::Scalar> colors;
    int font;
};
