#include "PoseEvaluator.h"
#include "AngleExtractor.h"
#include "PoseError.h"
#include "RecordFormatter.h"

#include <spdlog/spdlog.h>
#include <iomanip>
#include <sstream>

PoseEvaluator::PoseEvaluator(const Configuration& config)
    : registry(loadRegistry(config)),
      builder(builderOptions(config)),
      aligner(alignerOptions(config)),
      scorer(scorerPolicy(config)),
      minCandidateFrames(config.getIntegerOr("min_candidate_frames", 3)),
      minDetectionRate(config.getNumberOr("min_detection_rate", 0.5)) {

    if (minCandidateFrames < 1) {
        throw PoseError(ErrorCode::InvalidConfiguration, "min_candidate_frames must be at least 1");
    }

    int threads = config.getIntegerOr("extraction_threads", 4);
    if (threads < 1) {
        throw PoseError(ErrorCode::InvalidConfiguration, "extraction_threads must be at least 1");
    }
    if (threads > 1) {
        pool = std::make_unique<ThreadPool>(static_cast<size_t>(threads));
    }

    spdlog::info("Pose evaluator ready: {} poses, {} extraction threads, band width {}",
                 registry.size(), threads, aligner.getOptions().bandWidth);
}

PoseRegistry PoseEvaluator::loadRegistry(const Configuration& config) {
    double visibility = config.getNumberOr("visibility_threshold", 0.3);
    if (visibility < 0.0 || visibility > 1.0) {
        throw PoseError(ErrorCode::InvalidConfiguration, "visibility_threshold must be in [0,1]");
    }

    std::filesystem::path catalog = config.getPathOr("pose_catalog", "");
    if (catalog.empty()) {
        return PoseRegistry::builtin(static_cast<float>(visibility));
    }
    return PoseRegistry::fromDefinitions(
        RecordFormatter::loadPoseCatalog(catalog, static_cast<float>(visibility)));
}

GoldenStandardBuilder::Options PoseEvaluator::builderOptions(const Configuration& config) {
    GoldenStandardBuilder::Options options;
    options.minUsableFrames = config.getIntegerOr("min_training_frames", options.minUsableFrames);
    options.maxMissingFraction = config.getNumberOr("max_missing_fraction", options.maxMissingFraction);
    options.minDetectionRate = config.getNumberOr("min_detection_rate", options.minDetectionRate);
    options.targetDetectionRate = config.getNumberOr("target_detection_rate", options.targetDetectionRate);
    return options;
}

SequenceAligner::Options PoseEvaluator::alignerOptions(const Configuration& config) {
    SequenceAligner::Options options;
    options.bandWidth = config.getIntegerOr("dtw_band_width", options.bandWidth);
    options.missingPairPenalty = config.getNumberOr("missing_pair_penalty", options.missingPairPenalty);
    options.degenerateCostLimit = config.getNumberOr("degenerate_cost_limit", options.degenerateCostLimit);
    return options;
}

PoseScorer::Policy PoseEvaluator::scorerPolicy(const Configuration& config) {
    PoseScorer::Policy policy;
    policy.passThreshold = config.getNumberOr("pass_threshold", policy.passThreshold);
    policy.cutoffMultiple = config.getNumberOr("score_cutoff_multiple", policy.cutoffMultiple);
    policy.targetDetectionRate = config.getNumberOr("target_detection_rate", policy.targetDetectionRate);
    return policy;
}

GoldenStandard PoseEvaluator::train(const std::vector<LandmarkFrame>& frames,
                                    const std::string& poseName,
                                    const std::string& videoSource) const {
    const PoseDefinition& pose = registry.lookup(poseName);
    spdlog::info("Training '{}' from {} frames", pose.name, frames.size());

    auto extracted = AngleExtractor::extractSequence(frames, pose, pool.get());

    std::ostringstream rate;
    rate << std::fixed << std::setprecision(3) << extracted.usableRatio();
    std::map<std::string, std::string> metadata{
        {"detectionRate", rate.str()},
        {"usableFrames", std::to_string(extracted.usableFrames)}
    };

    return builder.build(extracted.vectors, pose, videoSource, metadata);
}

EvaluationResult PoseEvaluator::evaluate(const std::vector<LandmarkFrame>& frames,
                                         const GoldenStandard& golden,
                                         const std::string& videoSource) const {
    const PoseDefinition& pose = registry.lookup(golden.poseName);
    spdlog::info("Evaluating {} frames against the '{}' golden standard", frames.size(), pose.name);

    auto extracted = AngleExtractor::extractSequence(frames, pose, pool.get());

    EvaluationResult result = evaluateAngles(extracted.vectors, golden);
    result.videoSource = videoSource;
    return result;
}

EvaluationResult PoseEvaluator::evaluateAngles(const AngleSequence& candidate,
                                               const GoldenStandard& golden) const {
    PoseDefinition pose = referencePose(golden);

    if (golden.sequence.empty()) {
        throw PoseError(ErrorCode::AlignmentInputTooShort,
                        "Golden standard for '" + golden.poseName + "' has no reference frames");
    }

    AngleSequence usable;
    usable.reserve(candidate.size());
    for (const auto& vector : candidate) {
        if (vector.isUsable()) {
            usable.push_back(vector);
        }
    }

    const int total = static_cast<int>(candidate.size());
    const int usableCount = static_cast<int>(usable.size());

    if (usableCount < minCandidateFrames) {
        throw PoseError(ErrorCode::AlignmentInputTooShort,
                        "Only " + std::to_string(usableCount) + " usable frames, at least " +
                        std::to_string(minCandidateFrames) + " required");
    }

    double detectionRate = static_cast<double>(usableCount) / total;
    if (detectionRate < minDetectionRate) {
        std::ostringstream msg;
        msg << "Pose detected in " << usableCount << "/" << total << " frames ("
            << std::fixed << std::setprecision(1) << detectionRate * 100.0 << "%), minimum "
            << minDetectionRate * 100.0 << "%";
        throw PoseError(ErrorCode::LowDetectionRate, msg.str());
    }

    AlignmentResult alignment = aligner.align(golden.sequence, usable, golden.tolerances());
    spdlog::debug("Aligned {} reference and {} candidate frames: path {}, cost {:.3f}",
                  golden.sequence.size(), usable.size(), alignment.path.size(), alignment.totalCost);

    EvaluationResult result = scorer.score(alignment, golden.sequence, usable, pose, detectionRate);
    result.evaluatedAt = GoldenStandardBuilder::currentTimestamp();
    result.totalFrames = total;
    result.usableFrames = usableCount;
    return result;
}

PoseDefinition PoseEvaluator::referencePose(const GoldenStandard& golden) const {
    PoseDefinition pose = registry.lookup(golden.poseName);

    // Angles without statistics are neither aligned nor scored
    std::erase_if(pose.angles, [&](const AngleDefinition& angle) {
        if (golden.findAngle(angle.name) == nullptr) {
            spdlog::warn("Golden standard for '{}' has no statistics for '{}', skipping it",
                         golden.poseName, angle.name);
            return true;
        }
        return false;
    });
    for (auto& angle : pose.angles) {
        angle.tolerance = golden.findAngle(angle.name)->tolerance;
    }
    return pose;
}
