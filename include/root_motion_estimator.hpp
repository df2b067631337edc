#pragma once

// C++ Standard Library
#include <optional>

// Third-party libraries
#include <Eigen/Core>

// Root (hips) translation from the image-space hip midpoint. The pixel to model
// scale is calibrated continuously from the observed hip span.
class RootMotionEstimator {
public:
    static constexpr int LEFT_HIP = 23;
    static constexpr int RIGHT_HIP = 24;
    static constexpr double Z_DAMPER = 1.5;
    static constexpr double MIN_PIXEL_SPAN = 20.0;
    static constexpr double FACTOR_RATE = 0.05;

    RootMotionEstimator() = default;

    void setModelHipSpan(double span) { modelHipSpan = span; }
    double getModelHipSpan() const { return modelHipSpan; }

    // Clears the origin. Call on a new source or a frame size change.
    void reset(int width = 640, int height = 480);

    // imageLandmarks: rows of normalized (x, y, z[, visibility]).
    // nullopt when the hip rows are missing or non-finite.
    std::optional<Eigen::Vector3d> computeTranslation(const Eigen::MatrixXd& imageLandmarks);

    bool hasOrigin() const { return originSet; }
    double getScaleFactor() const { return currentFactor; }
    const Eigen::Vector3d& getTranslation() const { return translation; }
    int getWidth() const { return width; }
    int getHeight() const { return height; }

private:
    std::optional<Eigen::Vector3d> toPixels(const Eigen::MatrixXd& landmarks, int row) const;

    int width = 640;
    int height = 480;
    double modelHipSpan = 100.0;
    bool originSet = false;
    Eigen::Vector3d origin = Eigen::Vector3d::Zero();
    double currentFactor = 1.0;
    Eigen::Vector3d translation = Eigen::Vector3d::Zero();
};
