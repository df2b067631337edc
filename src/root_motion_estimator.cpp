#include "root_motion_estimator.hpp"

#include <cmath>

#include "vector_math.hpp"

void RootMotionEstimator::reset(int width, int height) {
    this->width = width;
    this->height = height;
    originSet = false;
    origin.setZero();
    currentFactor = 1.0;
    translation.setZero();
}

std::optional<Eigen::Vector3d> RootMotionEstimator::toPixels(const Eigen::MatrixXd& landmarks, int row) const {
    if (row >= landmarks.rows() || landmarks.cols() < 3) {
        return std::nullopt;
    }
    const Eigen::Vector3d p(landmarks(row, 0) * width,
                            landmarks(row, 1) * height,
                            landmarks(row, 2) * width);
    if (!vecmath::isFinite(p)) {
        return std::nullopt;
    }
    return p;
}

std::optional<Eigen::Vector3d> RootMotionEstimator::computeTranslation(const Eigen::MatrixXd& imageLandmarks) {
    const auto leftHip = toPixels(imageLandmarks, LEFT_HIP);
    const auto rightHip = toPixels(imageLandmarks, RIGHT_HIP);
    if (!leftHip || !rightHip) {
        return std::nullopt;
    }

    const Eigen::Vector3d hipMid = (*leftHip + *rightHip) * 0.5;
    if (!originSet) {
        origin = hipMid;
        originSet = true;
        translation.setZero();
        return translation;
    }

    // Only trust the span while the hips face the camera
    const double pixelSpan = (*leftHip - *rightHip).norm();
    const double xDiff = std::abs(leftHip->x() - rightHip->x());
    const double zDiff = std::abs(leftHip->z() - rightHip->z());
    double targetFactor = currentFactor;
    if (pixelSpan > MIN_PIXEL_SPAN && xDiff > zDiff) {
        targetFactor = modelHipSpan / pixelSpan;
    }
    currentFactor = vecmath::lerp(currentFactor, targetFactor, FACTOR_RATE);

    const Eigen::Vector3d delta = hipMid - origin;
    translation = Eigen::Vector3d(delta.x() * currentFactor,
                                  -delta.y() * currentFactor,
                                  delta.z() * currentFactor * Z_DAMPER);
    return translation;
}
