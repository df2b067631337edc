#pragma once

// C++ Standard Library

#include <optional>

// Third-party libraries
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/embed.h>
#include <opencv2/opencv.hpp>
#include <Eigen/Core>

// built by me
#include "log.hpp"
#include "pose_mapper.hpp"

namespace py = pybind11;

// Python MediaPipe Pose + Hands running in an embedded interpreter.
// One instance per process.
class MediaPipeWrapper {
public:
    MediaPipeWrapper() {
        try {
            if (!Py_IsInitialized()) {
                py::initialize_interpreter();
                ownsInterpreter = true;
            }

            py::exec(R"(
                import mediapipe as mp
                import numpy as np

                mp_pose = mp.solutions.pose
                mp_hands = mp.solutions.hands

                pose = mp_pose.Pose(
                    min_detection_confidence=0.5,
                    min_tracking_confidence=0.5,
                    model_complexity=1
                )

                hands = mp_hands.Hands(
                    min_detection_confidence=0.5,
                    min_tracking_confidence=0.5,
                    max_num_hands=2
                )

                def landmark_rows(landmarks, with_visibility):
                    if with_visibility:
                        return [[l.x, l.y, l.z, l.visibility] for l in landmarks.landmark]
                    return [[l.x, l.y, l.z] for l in landmarks.landmark]
            )");

            LOG_INFO("[MediaPipe] Initialized pose and hand detectors");

        } catch (const py::error_already_set& e) {
            LOG_WARN("[MediaPipe] Python error in constructor: " << e.what());
            throw;
        }
    }

    ~MediaPipeWrapper() {
        try {
            py::exec(R"(
                pose.close()
                hands.close()
            )");
        } catch (const py::error_already_set& e) {
            LOG_WARN("[MediaPipe] Python error on shutdown: " << e.what());
        }
        if (ownsInterpreter) {
            py::finalize_interpreter();
        }
    }

    MediaPipeWrapper(const MediaPipeWrapper&) = delete;
    MediaPipeWrapper& operator=(const MediaPipeWrapper&) = delete;

    // Fills `out` for one BGR frame. Returns false when no body was found;
    // Python errors are logged and reported as "no body".
    bool processFrame(const cv::Mat& frame, double timestamp, LandmarkFrame& out) {
        out = LandmarkFrame();
        out.width = frame.cols;
        out.height = frame.rows;
        out.timestamp = timestamp;

        try {
            cv::Mat rgb_frame;
            cv::cvtColor(frame, rgb_frame, cv::COLOR_BGR2RGB);

            py::array_t<unsigned char> py_image(
                {rgb_frame.rows, rgb_frame.cols, 3},
                {static_cast<py::ssize_t>(rgb_frame.step[0]), static_cast<py::ssize_t>(rgb_frame.step[1]),
                 static_cast<py::ssize_t>(rgb_frame.elemSize1())},
                rgb_frame.data
            );

            py::dict locals;
            locals["image_array"] = py_image;

            py::exec(R"(
                try:
                    pose_results = pose.process(image_array)
                    hand_results = hands.process(image_array)

                    image_rows = []
                    world_rows = []
                    hand_rows = []
                    hand_scores = []

                    if pose_results.pose_landmarks:
                        image_rows = landmark_rows(pose_results.pose_landmarks, True)
                    if pose_results.pose_world_landmarks:
                        world_rows = landmark_rows(pose_results.pose_world_landmarks, True)
                    if hand_results.multi_hand_landmarks:
                        for hand_landmarks, handedness in zip(hand_results.multi_hand_landmarks,
                                                              hand_results.multi_handedness):
                            hand_rows.append(landmark_rows(hand_landmarks, False))
                            hand_scores.append(handedness.classification[0].score)

                except Exception as e:
                    print(f"[MediaPipe] Error in Python processing: {str(e)}")
                    image_rows = []
                    world_rows = []
                    hand_rows = []
                    hand_scores = []
            )", py::globals(), locals);

            out.imageLandmarks = toMatrix(locals["image_rows"].cast<py::list>(), 4);
            out.worldLandmarks = toMatrix(locals["world_rows"].cast<py::list>(), 4);

            auto py_hands = locals["hand_rows"].cast<py::list>();
            auto py_scores = locals["hand_scores"].cast<py::list>();
            for (size_t i = 0; i < py::len(py_hands); ++i) {
                Eigen::MatrixXd hand = toMatrix(py_hands[i].cast<py::list>(), 3);
                Eigen::MatrixXd with_score(hand.rows(), 4);
                with_score.leftCols(3) = hand;
                with_score.col(3).setConstant(py_scores[i].cast<double>());
                assignHand(out, with_score);
            }

        } catch (const py::error_already_set& e) {
            LOG_WARN("[MediaPipe] Python error in processFrame: " << e.what());
            out.imageLandmarks.resize(0, 4);
            out.worldLandmarks.resize(0, 4);
            out.leftHand.reset();
            out.rightHand.reset();
        }

        return out.worldLandmarks.rows() >= PoseLandmark::COUNT;
    }

private:
    static Eigen::MatrixXd toMatrix(const py::list& rows, int cols) {
        Eigen::MatrixXd m(py::len(rows), cols);
        for (size_t i = 0; i < py::len(rows); ++i) {
            auto row = rows[i].cast<py::list>();
            for (int j = 0; j < cols; ++j) {
                m(i, j) = row[j].cast<double>();
            }
        }
        return m;
    }

    // MediaPipe's handedness label is mirrored for selfie input, so hands are
    // matched to the closer body wrist in the image instead.
    static void assignHand(LandmarkFrame& out, const Eigen::MatrixXd& hand) {
        if (hand.rows() < HandLandmark::COUNT) return;
        if (out.imageLandmarks.rows() < PoseLandmark::COUNT) return;

        const Eigen::Vector2d wrist = hand.row(HandLandmark::WRIST).head<2>().transpose();
        const Eigen::Vector2d left =
            out.imageLandmarks.row(PoseLandmark::LEFT_WRIST).head<2>().transpose();
        const Eigen::Vector2d right =
            out.imageLandmarks.row(PoseLandmark::RIGHT_WRIST).head<2>().transpose();

        const bool is_left = (wrist - left).squaredNorm() <= (wrist - right).squaredNorm();
        std::optional<Eigen::MatrixXd>& slot = is_left ? out.leftHand : out.rightHand;
        if (!slot) slot = hand;
    }

    bool ownsInterpreter = false;
};
