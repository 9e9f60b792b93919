#pragma once

#include "Configuration.h"
#include "GoldenStandard.h"
#include "PoseRegistry.h"
#include "PoseScorer.h"
#include "PoseTypes.h"
#include "SequenceAligner.h"
#include "ThreadPool.h"

#include <memory>
#include <string>
#include <vector>

/**
 * @brief Training and testing entry points of the pose evaluation engine
 *
 * Built once from a Configuration; every option is validated up front so a
 * bad setting fails here with InvalidConfiguration instead of halfway
 * through an evaluation. train() and evaluate() share nothing mutable
 * except the extraction thread pool.
 */
class PoseEvaluator {
public:
    explicit PoseEvaluator(const Configuration& config);

    // No copy
    PoseEvaluator(const PoseEvaluator&) = delete;
    PoseEvaluator& operator=(const PoseEvaluator&) = delete;

    GoldenStandard train(const std::vector<LandmarkFrame>& frames,
                         const std::string& poseName,
                         const std::string& videoSource = "") const;

    EvaluationResult evaluate(const std::vector<LandmarkFrame>& frames,
                              const GoldenStandard& golden,
                              const std::string& videoSource = "") const;

    // Candidate angles already extracted; unusable vectors are dropped here
    EvaluationResult evaluateAngles(const AngleSequence& candidate,
                                    const GoldenStandard& golden) const;

    const PoseRegistry& getRegistry() const noexcept { return registry; }
    const GoldenStandardBuilder& getBuilder() const noexcept { return builder; }
    const SequenceAligner& getAligner() const noexcept { return aligner; }
    const PoseScorer& getScorer() const noexcept { return scorer; }

private:
    static PoseRegistry loadRegistry(const Configuration& config);
    static GoldenStandardBuilder::Options builderOptions(const Configuration& config);
    static SequenceAligner::Options alignerOptions(const Configuration& config);
    static PoseScorer::Policy scorerPolicy(const Configuration& config);

    // Pose definition with tolerances taken from the golden standard
    PoseDefinition referencePose(const GoldenStandard& golden) const;

    PoseRegistry registry;
    GoldenStandardBuilder builder;
    SequenceAligner aligner;
    PoseScorer scorer;
    std::unique_ptr<ThreadPool> pool;
    int minCandidateFrames;
    double minDetectionRate;
};
