#pragma once

#include "PoseRegistry.h"
#include "PoseTypes.h"
#include "SequenceAligner.h"

#include <optional>
#include <string>
#include <vector>

struct AngleScore {
    std::string name;
    std::optional<double> score;        // nullopt = unmeasured
    double meanSignedDeviation = 0.0;   // candidate minus reference, degrees
    double referenceMean = 0.0;
    double candidateMean = 0.0;
    double tolerance = 0.0;
    int samples = 0;                    // aligned pairs where both sides measured the angle
    std::string status;

    bool isMeasured() const noexcept { return score.has_value(); }
};

struct FeedbackEntry {
    std::string angleName;
    std::string message;
    int severity = 0;                   // 1 = most severe
    double score = 0.0;
};

struct EvaluationResult {
    std::string poseName;
    std::string displayName;
    std::string videoSource;
    std::string evaluatedAt;

    int overallScore = 0;
    bool passed = false;
    std::string grade;
    std::string summary;

    std::vector<AngleScore> angles;     // pose-definition order
    std::vector<FeedbackEntry> feedback;
    std::vector<std::string> recommendations;
    std::vector<std::string> strengths;     // what went well
    std::vector<std::string> improvements;  // what to work on next

    size_t pathLength = 0;
    double alignmentCost = 0.0;
    double normalizedCost = 0.0;

    int totalFrames = 0;
    int usableFrames = 0;
    double detectionRate = 0.0;

    const AngleScore* findAngle(const std::string& name) const;
};

/**
 * @brief Turns an alignment into per-angle scores and feedback
 *
 * A pair scores 100 while the deviation is within tolerance and falls
 * linearly to 0 at cutoffMultiple * tolerance. Angles that were never
 * measured on both sides of any aligned pair are reported unmeasured and
 * do not take part in the overall score.
 */
class PoseScorer {
public:
    struct Policy {
        double passThreshold = 70.0;
        double cutoffMultiple = 2.0;
        double targetDetectionRate = 0.8;   // pose consistency worth praising
    };

    PoseScorer();
    explicit PoseScorer(Policy policy);

    // Throws PoseError(AlignmentDegenerate) when no angle could be measured.
    // detectionRate, when known, is recorded and commented on in the summary lists.
    EvaluationResult score(const AlignmentResult& alignment,
                           const AngleSequence& reference,
                           const AngleSequence& candidate,
                           const PoseDefinition& pose,
                           std::optional<double> detectionRate = std::nullopt) const;

    static double scoreDeviation(double deviation, double tolerance, double cutoffMultiple);
    static std::string statusFor(double score);
    static std::string gradeFor(double score);

    const Policy& getPolicy() const noexcept { return policy; }

private:
    AngleScore scoreAngle(const AngleDefinition& angle,
                          const AlignmentPath& path,
                          const AngleSequence& reference,
                          const AngleSequence& candidate) const;
    static FeedbackEntry makeFeedback(const AngleDefinition& angle, const AngleScore& result);
    static std::string summaryFor(int overallScore, const std::string& poseDisplayName);
    void addProgressNotes(EvaluationResult& result, std::optional<double> detectionRate) const;

    Policy policy;
};
