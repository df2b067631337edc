#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>

#include "pose_mapper.hpp"
#include "retarget_config.hpp"
#include "retargeter.hpp"
#include "scene_skeleton.hpp"

namespace py = pybind11;

namespace {

LandmarkFrame makeFrame(const Eigen::MatrixXd& world_landmarks,
                        const Eigen::MatrixXd& image_landmarks,
                        const std::optional<Eigen::MatrixXd>& left_hand,
                        const std::optional<Eigen::MatrixXd>& right_hand,
                        int width, int height, double timestamp) {
    LandmarkFrame frame;
    frame.worldLandmarks = world_landmarks;
    frame.imageLandmarks = image_landmarks;
    frame.leftHand = left_hand;
    frame.rightHand = right_hand;
    frame.width = width;
    frame.height = height;
    frame.timestamp = timestamp;
    return frame;
}

py::dict poseToDict(const CanonicalPose& pose) {
    py::dict result;
    for (std::size_t i = 0; i < BONE_COUNT; ++i) {
        const auto& point = pose[boneAt(i)];
        if (!point) continue;
        result[boneName(boneAt(i))] = py::make_tuple(
            point->position.x(), point->position.y(), point->position.z(), point->visibility);
    }
    return result;
}

// Built-in T-pose humanoid driven frame by frame from Python
class RetargetSession {
public:
    RetargetSession(double unit_scale, const std::string& config_path, double armature_scale)
        : skeleton(SceneSkeleton::makeTPoseHumanoid(unit_scale, "mixamorig:", armature_scale)),
          binding(skeleton->bindCanonical()),
          retargeter(binding, config_path.empty() ? RetargetConfig() : loadRetargetConfig(config_path)) {}

    py::dict process(const Eigen::MatrixXd& world_landmarks,
                     const Eigen::MatrixXd& image_landmarks,
                     const std::optional<Eigen::MatrixXd>& left_hand,
                     const std::optional<Eigen::MatrixXd>& right_hand,
                     int width, int height, std::optional<double> timestamp) {
        LandmarkFrame frame = makeFrame(world_landmarks, image_landmarks, left_hand, right_hand,
                                        width, height, timestamp.value_or(0.0));
        CanonicalPose pose = buildCanonicalPose(frame, &palmSmoother);
        if (timestamp) retargeter.smoothPose(pose, *timestamp);
        retargeter.applyPose(pose, frame.imageLandmarks, width, height, timestamp);
        return rotations();
    }

    // Bone name -> local rotation (w, x, y, z)
    py::dict rotations() const {
        py::dict result;
        for (std::size_t i = 0; i < BONE_COUNT; ++i) {
            const BoneHandle* bone = binding[i];
            if (!bone) continue;
            const Eigen::Quaterniond q = bone->localRotation();
            result[boneName(boneAt(i))] = py::make_tuple(q.w(), q.x(), q.y(), q.z());
        }
        return result;
    }

    Eigen::Vector3d hipsPosition() const {
        const BoneHandle* hips = binding[boneIndex(BoneId::Hips)];
        return hips ? hips->localPosition() : Eigen::Vector3d::Zero();
    }

    void reset() {
        retargeter.resetSmoothing();
        retargeter.resetRootMotion();
        palmSmoother.reset();
    }

private:
    std::unique_ptr<SceneSkeleton> skeleton;
    SkeletonBinding binding;
    Retargeter retargeter;
    PalmOrientationSmoother palmSmoother;
};

}  // namespace

PYBIND11_MODULE(motion_retarget_python, m) {
    m.doc() = "Retarget MediaPipe landmarks onto a humanoid skeleton";

    m.def("build_canonical_pose",
          [](const Eigen::MatrixXd& world_landmarks, const Eigen::MatrixXd& image_landmarks,
             const std::optional<Eigen::MatrixXd>& left_hand, const std::optional<Eigen::MatrixXd>& right_hand,
             int width, int height) {
              return poseToDict(buildCanonicalPose(
                  makeFrame(world_landmarks, image_landmarks, left_hand, right_hand, width, height, 0.0)));
          },
          py::arg("world_landmarks"), py::arg("image_landmarks"),
          py::arg("left_hand") = py::none(), py::arg("right_hand") = py::none(),
          py::arg("width") = 640, py::arg("height") = 480);

    m.def("bone_names", [] {
        std::vector<std::string> names;
        for (std::size_t i = 0; i < BONE_COUNT; ++i) names.emplace_back(boneName(boneAt(i)));
        return names;
    });

    py::class_<RetargetSession>(m, "RetargetSession")
        .def(py::init<double, const std::string&, double>(),
             py::arg("unit_scale") = 1.0, py::arg("config_path") = "", py::arg("armature_scale") = 1.0)
        .def("process", &RetargetSession::process,
             py::arg("world_landmarks"), py::arg("image_landmarks"),
             py::arg("left_hand") = py::none(), py::arg("right_hand") = py::none(),
             py::arg("width") = 640, py::arg("height") = 480, py::arg("timestamp") = py::none())
        .def("rotations", &RetargetSession::rotations)
        .def("hips_position", &RetargetSession::hipsPosition)
        .def("reset", &RetargetSession::reset);
}
