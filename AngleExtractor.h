#pragma once

#include "PoseRegistry.h"
#include "PoseTypes.h"

#include <optional>
#include <vector>

class ThreadPool;

class AngleExtractor {
public:
    struct SequenceResult {
        AngleSequence vectors;    // one per input frame, unusable ones included
        int usableFrames = 0;
        int unusableFrames = 0;

        double usableRatio() const {
            int total = usableFrames + unusableFrames;
            return total > 0 ? static_cast<double>(usableFrames) / total : 0.0;
        }
    };

    // Angle at `vertex` in degrees; nullopt when two points coincide
    static std::optional<double> calculateJointAngle(const cv::Point3f& a,
                                                     const cv::Point3f& vertex,
                                                     const cv::Point3f& c);

    // Position and visibility of a single landmark or a landmark midpoint
    static std::optional<Landmark> resolveLandmark(const LandmarkFrame& frame, const LandmarkRef& ref);

    static AngleVector extract(const LandmarkFrame& frame, const PoseDefinition& pose);

    // Throws PoseError(InvalidFrameSequence) if indices are not strictly increasing
    static SequenceResult extractSequence(const std::vector<LandmarkFrame>& frames,
                                          const PoseDefinition& pose,
                                          ThreadPool* pool = nullptr);

    static void validateFrameOrder(const std::vector<LandmarkFrame>& frames);

private:
    static std::optional<double> extractAngle(const LandmarkFrame& frame, const AngleDefinition& angle);
};
