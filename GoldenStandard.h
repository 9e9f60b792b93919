#pragma once

#include "PoseRegistry.h"
#include "PoseTypes.h"

#include <map>
#include <string>
#include <vector>

struct AngleStatistics {
    std::string name;
    double tolerance = 0.0;
    double mean = 0.0;
    double stdDev = 0.0;
    double min = 0.0;
    double max = 0.0;
    int count = 0;
    double confidence = 0.0;   // fraction of frames in which the angle was measured
};

/**
 * @brief Reference angle template for one pose
 *
 * Built once from an expert performance and read-only afterwards: the
 * testing path only ever takes it by const reference.
 */
struct GoldenStandard {
    std::string poseName;
    std::string createdAt;
    std::string videoSource;
    int totalFrames = 0;
    std::vector<AngleStatistics> angles;    // pose-definition order
    AngleSequence sequence;                 // filtered per-frame reference
    std::map<std::string, std::string> metadata;

    const AngleStatistics* findAngle(const std::string& name) const;
    std::map<std::string, double> tolerances() const;
};

class GoldenStandardBuilder {
public:
    struct Options {
        int minUsableFrames = 5;
        double maxMissingFraction = 0.5;
        double minDetectionRate = 0.5;
        double targetDetectionRate = 0.8;
    };

    GoldenStandardBuilder();
    explicit GoldenStandardBuilder(Options options);

    // Throws PoseError(InsufficientTrainingData | AngleUnreliable)
    GoldenStandard build(const AngleSequence& trainingVectors,
                         const PoseDefinition& pose,
                         const std::string& videoSource = "",
                         const std::map<std::string, std::string>& metadata = {}) const;

    const Options& getOptions() const noexcept { return options; }

    // ISO 8601 UTC, e.g. 2024-05-01T12:00:00Z
    static std::string currentTimestamp();

private:
    AngleStatistics computeStatistics(const AngleDefinition& angle, const AngleSequence& usable) const;

    Options options;
};
