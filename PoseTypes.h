#ifndef POSE_TYPES_H
#define POSE_TYPES_H

#include <opencv2/core.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// 33-point body model landmark indices
enum PoseLandmark {
    NOSE = 0,
    LEFT_EYE_INNER = 1,
    LEFT_EYE = 2,
    LEFT_EYE_OUTER = 3,
    RIGHT_EYE_INNER = 4,
    RIGHT_EYE = 5,
    RIGHT_EYE_OUTER = 6,
    LEFT_EAR = 7,
    RIGHT_EAR = 8,
    MOUTH_LEFT = 9,
    MOUTH_RIGHT = 10,
    LEFT_SHOULDER = 11,
    RIGHT_SHOULDER = 12,
    LEFT_ELBOW = 13,
    RIGHT_ELBOW = 14,
    LEFT_WRIST = 15,
    RIGHT_WRIST = 16,
    LEFT_PINKY = 17,
    RIGHT_PINKY = 18,
    LEFT_INDEX = 19,
    RIGHT_INDEX = 20,
    LEFT_THUMB = 21,
    RIGHT_THUMB = 22,
    LEFT_HIP = 23,
    RIGHT_HIP = 24,
    LEFT_KNEE = 25,
    RIGHT_KNEE = 26,
    LEFT_ANKLE = 27,
    RIGHT_ANKLE = 28,
    LEFT_HEEL = 29,
    RIGHT_HEEL = 30,
    LEFT_FOOT_INDEX = 31,
    RIGHT_FOOT_INDEX = 32,
    LANDMARK_COUNT = 33
};

struct Landmark {
    cv::Point3f position;
    float visibility = 0.0f;

    Landmark() = default;
    Landmark(float x, float y, float z, float visibility)
        : position(x, y, z), visibility(visibility) {}
};

// Detected body points of one sampled video frame
struct LandmarkFrame {
    int frameIndex = 0;
    uint64_t timestamp = 0;
    std::map<int, Landmark> landmarks;
};

// Named joint angles of one frame; std::nullopt marks a missing angle
struct AngleVector {
    int frameIndex = 0;
    std::map<std::string, std::optional<double>> values;

    std::optional<double> get(const std::string& name) const {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string& name, std::optional<double> value) { values[name] = value; }

    // A frame with no measured angle is unusable
    bool isUsable() const {
        for (const auto& [name, value] : values) {
            if (value) {
                return true;
            }
        }
        return false;
    }

    int measuredCount() const {
        int count = 0;
        for (const auto& [name, value] : values) {
            if (value) {
                count++;
            }
        }
        return count;
    }
};

using AngleSequence = std::vector<AngleVector>;

// (referenceFrameIndex, candidateFrameIndex)
using AlignmentStep = std::pair<int, int>;
using AlignmentPath = std::vector<AlignmentStep>;

#endif
