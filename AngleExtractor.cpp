#include "AngleExtractor.h"
#include "PoseError.h"
#include "ThreadPool.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <future>
#include <iterator>

namespace {
constexpr double kMinVectorLength = 1e-6;
constexpr double kRadToDeg = 180.0 / CV_PI;
}

std::optional<double> AngleExtractor::calculateJointAngle(const cv::Point3f& a,
                                                          const cv::Point3f& vertex,
                                                          const cv::Point3f& c) {
    // Vectors from the vertex to both ends
    cv::Point3d v1 = cv::Point3d(a) - cv::Point3d(vertex);
    cv::Point3d v2 = cv::Point3d(c) - cv::Point3d(vertex);

    double v1Mag = cv::norm(v1);
    double v2Mag = cv::norm(v2);

    if (v1Mag < kMinVectorLength || v2Mag < kMinVectorLength) {
        return std::nullopt;
    }

    double cosAngle = v1.dot(v2) / (v1Mag * v2Mag);
    cosAngle = std::clamp(cosAngle, -1.0, 1.0);

    return std::acos(cosAngle) * kRadToDeg;
}

std::optional<Landmark> AngleExtractor::resolveLandmark(const LandmarkFrame& frame, const LandmarkRef& ref) {
    auto first = frame.landmarks.find(ref.first);
    if (first == frame.landmarks.end()) {
        return std::nullopt;
    }
    if (!ref.isMidpoint()) {
        return first->second;
    }

    auto second = frame.landmarks.find(ref.second);
    if (second == frame.landmarks.end()) {
        return std::nullopt;
    }

    Landmark midpoint;
    midpoint.position = (first->second.position + second->second.position) * 0.5f;
    midpoint.visibility = std::min(first->second.visibility, second->second.visibility);
    return midpoint;
}

std::optional<double> AngleExtractor::extractAngle(const LandmarkFrame& frame, const AngleDefinition& angle) {
    auto a = resolveLandmark(frame, angle.a);
    auto vertex = resolveLandmark(frame, angle.vertex);
    auto c = resolveLandmark(frame, angle.c);

    if (!a || !vertex || !c) {
        return std::nullopt;
    }
    if (a->visibility < angle.visibilityThreshold ||
        vertex->visibility < angle.visibilityThreshold ||
        c->visibility < angle.visibilityThreshold) {
        return std::nullopt;
    }

    return calculateJointAngle(a->position, vertex->position, c->position);
}

AngleVector AngleExtractor::extract(const LandmarkFrame& frame, const PoseDefinition& pose) {
    AngleVector result;
    result.frameIndex = frame.frameIndex;

    for (const auto& angle : pose.angles) {
        result.set(angle.name, extractAngle(frame, angle));
    }
    return result;
}

void AngleExtractor::validateFrameOrder(const std::vector<LandmarkFrame>& frames) {
    for (size_t i = 1; i < frames.size(); i++) {
        if (frames[i].frameIndex <= frames[i - 1].frameIndex) {
            throw PoseError(ErrorCode::InvalidFrameSequence,
                            "Frame index " + std::to_string(frames[i].frameIndex) +
                            " does not follow " + std::to_string(frames[i - 1].frameIndex));
        }
    }
}

AngleExtractor::SequenceResult AngleExtractor::extractSequence(const std::vector<LandmarkFrame>& frames,
                                                               const PoseDefinition& pose,
                                                               ThreadPool* pool) {
    validateFrameOrder(frames);

    SequenceResult result;
    result.vectors.reserve(frames.size());

    if (pool == nullptr || pool->threadCount() < 2 || frames.size() < 2) {
        for (const auto& frame : frames) {
            result.vectors.push_back(extract(frame, pose));
        }
    } else {
        // Contiguous chunks keep the output in frame order
        size_t chunkCount = std::min(pool->threadCount(), frames.size());
        size_t chunkSize = (frames.size() + chunkCount - 1) / chunkCount;

        std::vector<std::future<AngleSequence>> chunks;
        for (size_t begin = 0; begin < frames.size(); begin += chunkSize) {
            size_t end = std::min(begin + chunkSize, frames.size());
            chunks.push_back(pool->enqueue([&frames, &pose, begin, end] {
                AngleSequence part;
                part.reserve(end - begin);
                for (size_t i = begin; i < end; i++) {
                    part.push_back(extract(frames[i], pose));
                }
                return part;
            }));
        }

        for (auto& chunk : chunks) {
            AngleSequence part = chunk.get();
            std::ranges::move(part, std::back_inserter(result.vectors));
        }
    }

    for (const auto& vector : result.vectors) {
        if (vector.isUsable()) {
            result.usableFrames++;
        } else {
            result.unusableFrames++;
            spdlog::debug("Frame {} unusable: no angle of '{}' could be measured",
                          vector.frameIndex, pose.name);
        }
    }

    spdlog::debug("Extracted angles from {} frames ({} usable)", frames.size(), result.usableFrames);
    return result;
}
