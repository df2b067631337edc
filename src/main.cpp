// main.cpp
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

#include "log.hpp"
#include "mediapipe_wrapper.hpp"
#include "pose_mapper.hpp"
#include "retarget_config.hpp"
#include "retargeter.hpp"
#include "scene_skeleton.hpp"
#include "visualizer.hpp"

namespace {

// Local rotation (w, x, y, z) of every bound bone plus the hips position
struct FrameRecord {
    double timestamp = 0;
    bool bodyFound = false;
    Eigen::Vector3d hipsPosition = Eigen::Vector3d::Zero();
    std::vector<Eigen::Quaterniond> rotations;
};

// Generate timestamp string for file naming
std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y%m%d_%H%M%S");
    return ss.str();
}

std::filesystem::path createOutputDirectory(const std::string& base_name) {
    std::string dir_name = base_name + "_" + getTimestamp();
    std::filesystem::path output_dir = std::filesystem::current_path() / "outputs" / dir_name;
    std::filesystem::create_directories(output_dir);
    return output_dir;
}

FrameRecord recordFrame(const SkeletonBinding& binding, double timestamp, bool bodyFound) {
    FrameRecord record;
    record.timestamp = timestamp;
    record.bodyFound = bodyFound;
    if (const BoneHandle* hips = binding[boneIndex(BoneId::Hips)]) {
        record.hipsPosition = hips->localPosition();
    }
    for (const BoneHandle* bone : binding) {
        record.rotations.push_back(bone ? bone->localRotation() : Eigen::Quaterniond::Identity());
    }
    return record;
}

void saveBoneRotations(const std::filesystem::path& output_dir,
                       const SkeletonBinding& binding,
                       const std::vector<FrameRecord>& frames) {
    const std::filesystem::path csv_path = output_dir / "bone_rotations.csv";
    std::ofstream csv(csv_path);
    if (!csv) {
        LOG_WARN("Error: Could not write " << csv_path);
        return;
    }

    csv << "timestamp,frame,body_found,hips_x,hips_y,hips_z";
    for (std::size_t i = 0; i < BONE_COUNT; ++i) {
        if (!binding[i]) continue;
        const std::string name = boneName(boneAt(i));
        csv << "," << name << "_qw," << name << "_qx," << name << "_qy," << name << "_qz";
    }
    csv << "\n";

    for (size_t f = 0; f < frames.size(); ++f) {
        const FrameRecord& record = frames[f];
        csv << record.timestamp << "," << f << "," << (record.bodyFound ? "1" : "0")
            << "," << record.hipsPosition.x() << "," << record.hipsPosition.y() << "," << record.hipsPosition.z();
        for (std::size_t i = 0; i < BONE_COUNT; ++i) {
            if (!binding[i]) continue;
            const Eigen::Quaterniond& q = record.rotations[i];
            csv << "," << q.w() << "," << q.x() << "," << q.y() << "," << q.z();
        }
        csv << "\n";
    }

    LOG_INFO("Saved bone rotations to: " << csv_path);
}

// Everything one source of motion needs, reset together
struct RetargetPipeline {
    std::unique_ptr<SceneSkeleton> skeleton;
    SkeletonBinding binding;
    std::unique_ptr<Retargeter> retargeter;
    PalmOrientationSmoother palmSmoother;

    explicit RetargetPipeline(const RetargetConfig& config)
        : skeleton(SceneSkeleton::makeTPoseHumanoid()),
          binding(skeleton->bindCanonical()),
          retargeter(std::make_unique<Retargeter>(binding, config)) {}

    // Returns whether a body was found
    bool process(MediaPipeWrapper& mediapipe, const cv::Mat& frame, double timestamp, LandmarkFrame& landmarks) {
        if (!mediapipe.processFrame(frame, timestamp, landmarks)) return false;

        CanonicalPose pose = buildCanonicalPose(landmarks, &palmSmoother);
        retargeter->smoothPose(pose, timestamp);
        retargeter->applyPose(pose, landmarks.imageLandmarks, landmarks.width, landmarks.height, timestamp);
        return true;
    }

    void reset() {
        retargeter->resetSmoothing();
        retargeter->resetRootMotion();
        palmSmoother.reset();
    }
};

cv::Mat composeView(TrackerVisualizer& visualizer, const cv::Mat& frame, const LandmarkFrame& landmarks,
                    const SceneSkeleton& skeleton, double fps, bool bodyFound, bool recording) {
    cv::Mat overlay = frame.clone();
    visualizer.drawLandmarks(overlay, landmarks);
    visualizer.drawStatus(overlay, fps, bodyFound, recording);

    cv::Mat panel = visualizer.drawSkeleton(skeleton, cv::Size(frame.rows, frame.rows));
    cv::Mat combined;
    cv::hconcat(overlay, panel, combined);
    return combined;
}

int processVideoFile(const std::string& video_path, const RetargetConfig& config) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        LOG_WARN("Error: Could not open video file: " << video_path);
        return -1;
    }

    double fps = cap.get(cv::CAP_PROP_FPS);
    if (fps <= 0) fps = 30.0;
    int total_frames = cap.get(cv::CAP_PROP_FRAME_COUNT);
    int frame_width = cap.get(cv::CAP_PROP_FRAME_WIDTH);
    int frame_height = cap.get(cv::CAP_PROP_FRAME_HEIGHT);

    LOG_INFO("Processing video: " << video_path);
    LOG_INFO("Resolution: " << frame_width << "x" << frame_height);
    LOG_INFO("FPS: " << fps << ", Total frames: " << total_frames);

    std::filesystem::path output_dir = createOutputDirectory(std::filesystem::path(video_path).stem().string());

    MediaPipeWrapper mediapipe;
    RetargetPipeline pipeline(config);
    TrackerVisualizer visualizer(frame_width, frame_height);
    std::vector<FrameRecord> frames;

    cv::Mat frame;
    int frame_count = 0;
    while (cap.read(frame)) {
        double timestamp = frame_count / fps;
        LandmarkFrame landmarks;
        bool body_found = false;

        try {
            body_found = pipeline.process(mediapipe, frame, timestamp, landmarks);
        } catch (const std::exception& e) {
            LOG_WARN("Error processing frame " << frame_count << ": " << e.what());
        }
        frames.push_back(recordFrame(pipeline.binding, timestamp, body_found));

        frame_count++;
        if (total_frames > 0 && frame_count % 30 == 0) {
            LOG_INFO("Progress: " << frame_count << "/" << total_frames
                     << " (" << (frame_count * 100 / total_frames) << "%)");
        }

        // Preview (ESC to stop early)
        cv::imshow("Retargeting Video",
                   composeView(visualizer, frame, landmarks, *pipeline.skeleton, fps, body_found, false));
        if (cv::waitKey(1) == 27) break;
    }

    cap.release();
    saveBoneRotations(output_dir, pipeline.binding, frames);
    LOG_INFO("Processing complete! Output saved to: " << output_dir);
    cv::destroyAllWindows();
    return 0;
}

int processCamera(const RetargetConfig& config) {
    LOG_INFO("Opening camera...");

    cv::VideoCapture cap(0);
    if (!cap.isOpened()) {
        LOG_WARN("Error: Could not open camera");
        return -1;
    }

    int frame_width = cap.get(cv::CAP_PROP_FRAME_WIDTH);
    int frame_height = cap.get(cv::CAP_PROP_FRAME_HEIGHT);
    LOG_INFO("Camera resolution: " << frame_width << "x" << frame_height);

    MediaPipeWrapper mediapipe;
    RetargetPipeline pipeline(config);
    TrackerVisualizer visualizer(frame_width, frame_height);

    bool is_recording = false;
    std::vector<FrameRecord> recording;
    std::filesystem::path current_output_dir;
    const auto start_time = std::chrono::steady_clock::now();
    auto last_frame_time = start_time;
    double fps = 0;

    LOG_INFO("Controls:");
    LOG_INFO("  ESC - Exit");
    LOG_INFO("  Space - Start/Stop recording");
    LOG_INFO("  R - Reset filters and root motion");

    cv::Mat frame;
    while (true) {
        cap >> frame;
        if (frame.empty()) break;

        const auto now = std::chrono::steady_clock::now();
        const double timestamp = std::chrono::duration<double>(now - start_time).count();
        const double frame_seconds = std::chrono::duration<double>(now - last_frame_time).count();
        if (frame_seconds > 0) fps = 1.0 / frame_seconds;
        last_frame_time = now;

        LandmarkFrame landmarks;
        bool body_found = false;
        try {
            body_found = pipeline.process(mediapipe, frame, timestamp, landmarks);
        } catch (const std::exception& e) {
            LOG_WARN("Error processing frame: " << e.what());
        }

        if (is_recording) {
            recording.push_back(recordFrame(pipeline.binding, timestamp, body_found));
        }

        cv::imshow("Motion Retargeting",
                   composeView(visualizer, frame, landmarks, *pipeline.skeleton, fps, body_found, is_recording));

        int key = cv::waitKey(1);
        if (key == 27) break;  // ESC to exit
        else if (key == ' ') {
            if (!is_recording) {
                is_recording = true;
                current_output_dir = createOutputDirectory("live_recording");
                recording.clear();
                LOG_INFO("Recording started! Output will be saved to: " << current_output_dir);
            } else {
                is_recording = false;
                saveBoneRotations(current_output_dir, pipeline.binding, recording);
                LOG_INFO("Recording stopped! Files saved to: " << current_output_dir);
            }
        }
        else if (key == 'r' || key == 'R') {
            pipeline.reset();
            LOG_INFO("Filters and root motion reset");
        }
    }

    if (is_recording) {
        saveBoneRotations(current_output_dir, pipeline.binding, recording);
        LOG_INFO("Recording saved to: " << current_output_dir);
    }

    cap.release();
    cv::destroyAllWindows();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string video_path;
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                LOG_WARN("Usage: " << argv[0] << " [video] [--config file.yaml]");
                return -1;
            }
            config_path = argv[++i];
        } else if (video_path.empty()) {
            video_path = arg;
        }
    }

    LOG_PRINT_LEVEL();

    RetargetConfig config;
    if (!config_path.empty()) {
        config = loadRetargetConfig(config_path);
    }

    try {
        if (!video_path.empty()) {
            if (!std::filesystem::exists(video_path)) {
                LOG_WARN("Video file not found: " << video_path);
                return -1;
            }
            LOG_INFO("Video processing mode: " << video_path);
            return processVideoFile(video_path, config);
        }
        return processCamera(config);
    } catch (const std::exception& e) {
        LOG_WARN("Fatal error: " << e.what());
        return -1;
    }
}
