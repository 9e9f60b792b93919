#include "GoldenStandard.h"
#include "PoseError.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

const AngleStatistics* GoldenStandard::findAngle(const std::string& name) const {
    auto it = std::ranges::find_if(angles, [&](const AngleStatistics& stats) {
        return stats.name == name;
    });
    return it != angles.end() ? &*it : nullptr;
}

std::map<std::string, double> GoldenStandard::tolerances() const {
    std::map<std::string, double> result;
    for (const auto& stats : angles) {
        result[stats.name] = stats.tolerance;
    }
    return result;
}

GoldenStandardBuilder::GoldenStandardBuilder()
    : GoldenStandardBuilder(Options{}) {
}

GoldenStandardBuilder::GoldenStandardBuilder(Options opts)
    : options(opts) {
    if (options.minUsableFrames < 1) {
        throw PoseError(ErrorCode::InvalidConfiguration, "min_training_frames must be at least 1");
    }
    if (options.maxMissingFraction < 0.0 || options.maxMissingFraction > 1.0) {
        throw PoseError(ErrorCode::InvalidConfiguration, "max_missing_fraction must be in [0,1]");
    }
    if (options.minDetectionRate < 0.0 || options.minDetectionRate > 1.0) {
        throw PoseError(ErrorCode::InvalidConfiguration, "min_detection_rate must be in [0,1]");
    }
}

GoldenStandard GoldenStandardBuilder::build(const AngleSequence& trainingVectors,
                                            const PoseDefinition& pose,
                                            const std::string& videoSource,
                                            const std::map<std::string, std::string>& metadata) const {
    // Keep only frames with at least one measured angle of this pose
    AngleSequence usable;
    usable.reserve(trainingVectors.size());
    for (const auto& vector : trainingVectors) {
        AngleVector filtered;
        filtered.frameIndex = vector.frameIndex;
        for (const auto& angle : pose.angles) {
            filtered.set(angle.name, vector.get(angle.name));
        }
        if (filtered.isUsable()) {
            usable.push_back(std::move(filtered));
        }
    }

    const int total = static_cast<int>(trainingVectors.size());
    const int usableCount = static_cast<int>(usable.size());

    if (usableCount < options.minUsableFrames) {
        throw PoseError(ErrorCode::InsufficientTrainingData,
                        "Only " + std::to_string(usableCount) + " usable training frames for '" +
                        pose.name + "', at least " + std::to_string(options.minUsableFrames) + " required");
    }

    double detectionRate = static_cast<double>(usableCount) / total;
    if (detectionRate < options.minDetectionRate) {
        std::ostringstream msg;
        msg << "Pose detected in " << usableCount << "/" << total << " training frames ("
            << std::fixed << std::setprecision(1) << detectionRate * 100.0 << "%), minimum "
            << options.minDetectionRate * 100.0 << "%";
        throw PoseError(ErrorCode::InsufficientTrainingData, msg.str());
    }
    if (detectionRate < options.targetDetectionRate) {
        spdlog::warn("Training detection rate {:.1f}% is below the {:.0f}% target",
                     detectionRate * 100.0, options.targetDetectionRate * 100.0);
    }

    GoldenStandard golden;
    golden.poseName = pose.name;
    golden.createdAt = currentTimestamp();
    golden.videoSource = videoSource;
    golden.totalFrames = total;
    golden.metadata = metadata;

    for (const auto& angle : pose.angles) {
        golden.angles.push_back(computeStatistics(angle, usable));
    }
    golden.sequence = std::move(usable);

    spdlog::info("Built golden standard for '{}' from {}/{} frames", pose.name, usableCount, total);
    for (const auto& stats : golden.angles) {
        spdlog::debug("  {}: mean={:.1f} std={:.1f} confidence={:.2f}",
                      stats.name, stats.mean, stats.stdDev, stats.confidence);
    }
    return golden;
}

AngleStatistics GoldenStandardBuilder::computeStatistics(const AngleDefinition& angle,
                                                         const AngleSequence& usable) const {
    std::vector<double> values;
    values.reserve(usable.size());
    for (const auto& vector : usable) {
        if (auto value = vector.get(angle.name)) {
            values.push_back(*value);
        }
    }

    double missingFraction = 1.0 - static_cast<double>(values.size()) / usable.size();
    if (values.empty() || missingFraction > options.maxMissingFraction) {
        std::ostringstream msg;
        msg << "Angle '" << angle.name << "' missing in " << std::fixed << std::setprecision(1)
            << missingFraction * 100.0 << "% of training frames (limit "
            << options.maxMissingFraction * 100.0 << "%)";
        throw PoseError(ErrorCode::AngleUnreliable, msg.str());
    }

    AngleStatistics stats;
    stats.name = angle.name;
    stats.tolerance = angle.tolerance;
    stats.count = static_cast<int>(values.size());
    stats.confidence = static_cast<double>(values.size()) / usable.size();

    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    stats.mean = sum / values.size();

    double variance = 0.0;
    for (double v : values) {
        variance += (v - stats.mean) * (v - stats.mean);
    }
    stats.stdDev = std::sqrt(variance / values.size());

    auto [minIt, maxIt] = std::ranges::minmax_element(values);
    stats.min = *minIt;
    stats.max = *maxIt;
    return stats;
}

std::string GoldenStandardBuilder::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}
