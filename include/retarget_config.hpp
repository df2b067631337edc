#pragma once

// C++ Standard Library
#include <string>

// built by me
#include "smoothing_engine.hpp"

// Hand-tuned defaults for the retargeter. Every weight is a slerp factor
// toward the frame's target rotation.
struct RetargetConfig {
    double visibilityThreshold = 0.5;

    // Hips placement
    double hipsDamping = 0.1;
    double minHipHeightRatio = 0.85;
    bool enableRootMotion = true;
    bool autoScaleMetricLegLength = true;

    // Torso: weight = base + visibility * scale
    double torsoBaseWeight = 0.3;
    double torsoVisibilityWeight = 0.4;
    double spineRelaxWeight = 0.7;

    // Limbs
    double armAlignWeight = 0.8;
    double alignWeight = 0.5;
    double armSwivelWeight = 0.75;
    double legSwivelWeight = 0.5;
    double forearmTwistWeight = 0.75;
    double handWeight = 0.9;

    // Head: weight = base + confidence * scale
    double headBaseWeight = 0.3;
    double headConfidenceWeight = 0.5;
    double neckShare = 0.25;
    double headFlipDot = -0.3;
    double headFlipPenalty = 0.3;

    bool enableRotationSmoothing = true;
    SmoothingConfig smoothing;
};

// Overrides from a YAML file on top of the defaults. A missing or malformed
// file logs a warning and yields the defaults.
RetargetConfig loadRetargetConfig(const std::string& path);

// Same, from YAML text.
RetargetConfig parseRetargetConfig(const std::string& yaml);
