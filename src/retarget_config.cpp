#include "retarget_config.hpp"

#include <yaml-cpp/yaml.h>

#include "log.hpp"

namespace {

template <typename T>
void readValue(const YAML::Node& node, const char* key, T& value) {
    if (node[key]) {
        value = node[key].as<T>();
    }
}

void readFilter(const YAML::Node& node, const char* key, FilterParams& params) {
    if (!node[key]) return;
    const YAML::Node f = node[key];
    readValue(f, "min_cutoff", params.minCutoff);
    readValue(f, "beta", params.beta);
    readValue(f, "d_cutoff", params.dCutoff);
}

void applyConfig(const YAML::Node& config, RetargetConfig& out) {
    readValue(config, "visibility_threshold", out.visibilityThreshold);

    if (config["hips"]) {
        const YAML::Node hips = config["hips"];
        readValue(hips, "damping", out.hipsDamping);
        readValue(hips, "min_height_ratio", out.minHipHeightRatio);
        readValue(hips, "root_motion", out.enableRootMotion);
        readValue(hips, "auto_scale_metric_leg_length", out.autoScaleMetricLegLength);
    }

    if (config["weights"]) {
        const YAML::Node w = config["weights"];
        readValue(w, "torso_base", out.torsoBaseWeight);
        readValue(w, "torso_visibility", out.torsoVisibilityWeight);
        readValue(w, "spine_relax", out.spineRelaxWeight);
        readValue(w, "arm_align", out.armAlignWeight);
        readValue(w, "align", out.alignWeight);
        readValue(w, "arm_swivel", out.armSwivelWeight);
        readValue(w, "leg_swivel", out.legSwivelWeight);
        readValue(w, "forearm_twist", out.forearmTwistWeight);
        readValue(w, "hand", out.handWeight);
    }

    if (config["head"]) {
        const YAML::Node head = config["head"];
        readValue(head, "base_weight", out.headBaseWeight);
        readValue(head, "confidence_weight", out.headConfidenceWeight);
        readValue(head, "neck_share", out.neckShare);
        readValue(head, "flip_dot", out.headFlipDot);
        readValue(head, "flip_penalty", out.headFlipPenalty);
    }

    if (config["smoothing"]) {
        const YAML::Node s = config["smoothing"];
        SmoothingConfig& sc = out.smoothing;
        readValue(s, "rotation", out.enableRotationSmoothing);
        readValue(s, "velocity_adaptive", sc.enableVelocityAdaptive);
        readValue(s, "quaternion_continuity", sc.enableQuaternionSmoothing);
        readValue(s, "outlier_rejection", sc.enableOutlierRejection);
        readValue(s, "base_factor", sc.baseInterpolationFactor);
        readValue(s, "min_factor", sc.minInterpolationFactor);
        readValue(s, "max_factor", sc.maxInterpolationFactor);
        readValue(s, "hand_base_factor", sc.handBaseInterpolationFactor);
        readValue(s, "hand_min_factor", sc.handMinInterpolationFactor);
        readValue(s, "hand_max_factor", sc.handMaxInterpolationFactor);
        readValue(s, "velocity_threshold", sc.velocityThreshold);
        readValue(s, "outlier_threshold", sc.outlierThreshold);
        readValue(s, "max_consecutive_outliers", sc.maxConsecutiveOutliers);
        readValue(s, "history_size", sc.historySize);
        readValue(s, "fast_motion_beta_boost", sc.fastMotionBetaBoost);
        readFilter(s, "core_filter", sc.coreFilter);
        readFilter(s, "limb_filter", sc.limbFilter);
        readFilter(s, "hand_filter", sc.handFilter);
    }
}

}  // namespace

RetargetConfig loadRetargetConfig(const std::string& path) {
    RetargetConfig config;
    try {
        applyConfig(YAML::LoadFile(path), config);
        LOG_INFO("[Config] Loaded " << path);
    } catch (const YAML::Exception& e) {
        LOG_WARN("[Config] Could not load " << path << ": " << e.what() << ", using defaults");
        return RetargetConfig();
    }
    return config;
}

RetargetConfig parseRetargetConfig(const std::string& yaml) {
    RetargetConfig config;
    try {
        applyConfig(YAML::Load(yaml), config);
    } catch (const YAML::Exception& e) {
        LOG_WARN("[Config] Invalid configuration: " << e.what() << ", using defaults");
        return RetargetConfig();
    }
    return config;
}
