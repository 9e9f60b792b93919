#include "PoseScorer.h"
#include "PoseError.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

const AngleScore* EvaluationResult::findAngle(const std::string& name) const {
    auto it = std::ranges::find_if(angles, [&](const AngleScore& angle) {
        return angle.name == name;
    });
    return it != angles.end() ? &*it : nullptr;
}

PoseScorer::PoseScorer()
    : PoseScorer(Policy{}) {
}

PoseScorer::PoseScorer(Policy p)
    : policy(p) {
    if (policy.passThreshold < 0.0 || policy.passThreshold > 100.0) {
        throw PoseError(ErrorCode::InvalidConfiguration, "pass_threshold must be in [0,100]");
    }
    if (!(policy.cutoffMultiple > 1.0)) {
        throw PoseError(ErrorCode::InvalidConfiguration, "score_cutoff_multiple must be greater than 1");
    }
    if (policy.targetDetectionRate < 0.0 || policy.targetDetectionRate > 1.0) {
        throw PoseError(ErrorCode::InvalidConfiguration, "target_detection_rate must be in [0,1]");
    }
}

double PoseScorer::scoreDeviation(double deviation, double tolerance, double cutoffMultiple) {
    if (deviation <= tolerance) {
        return 100.0;
    }
    double cutoff = cutoffMultiple * tolerance;
    if (deviation >= cutoff) {
        return 0.0;
    }
    return 100.0 * (cutoff - deviation) / (cutoff - tolerance);
}

std::string PoseScorer::statusFor(double score) {
    if (score >= 85.0) return "EXCELLENT";
    if (score >= 70.0) return "GOOD";
    if (score >= 50.0) return "NEEDS_IMPROVEMENT";
    return "POOR";
}

std::string PoseScorer::gradeFor(double score) {
    if (score >= 90.0) return "A";
    if (score >= 80.0) return "B";
    if (score >= 70.0) return "C";
    if (score >= 60.0) return "D";
    return "F";
}

AngleScore PoseScorer::scoreAngle(const AngleDefinition& angle,
                                  const AlignmentPath& path,
                                  const AngleSequence& reference,
                                  const AngleSequence& candidate) const {
    AngleScore result;
    result.name = angle.name;
    result.tolerance = angle.tolerance;

    double scoreSum = 0.0;
    double refSum = 0.0;
    double candSum = 0.0;

    for (const auto& [refIndex, candIndex] : path) {
        auto refValue = reference[refIndex].get(angle.name);
        auto candValue = candidate[candIndex].get(angle.name);
        if (!refValue || !candValue) {
            continue;
        }

        scoreSum += scoreDeviation(std::abs(*refValue - *candValue), angle.tolerance, policy.cutoffMultiple);
        refSum += *refValue;
        candSum += *candValue;
        result.samples++;
    }

    if (result.samples == 0) {
        result.status = "UNMEASURED";
        return result;
    }

    result.score = scoreSum / result.samples;
    result.referenceMean = refSum / result.samples;
    result.candidateMean = candSum / result.samples;
    result.meanSignedDeviation = result.candidateMean - result.referenceMean;
    result.status = statusFor(*result.score);
    return result;
}

FeedbackEntry PoseScorer::makeFeedback(const AngleDefinition& angle, const AngleScore& result) {
    FeedbackEntry entry;
    entry.angleName = angle.name;
    entry.score = result.score.value_or(0.0);

    std::ostringstream msg;
    msg << std::fixed << std::setprecision(1);

    double deviation = result.meanSignedDeviation;
    if (deviation > 0.0 && !angle.aboveLabel.empty()) {
        msg << angleDisplayName(angle.name) << " is " << angle.aboveLabel << ": "
            << deviation << "° above the reference on average.";
    } else if (deviation < 0.0 && !angle.belowLabel.empty()) {
        msg << angleDisplayName(angle.name) << " is " << angle.belowLabel << ": "
            << -deviation << "° below the reference on average.";
    } else {
        msg << angleDisplayName(angle.name) << " varies around the reference and stays outside the "
            << angle.tolerance << "° tolerance.";
    }

    entry.message = msg.str();
    return entry;
}

std::string PoseScorer::summaryFor(int overallScore, const std::string& poseDisplayName) {
    if (overallScore >= 85) {
        return "Excellent form! Your " + poseDisplayName + " is very well executed.";
    }
    if (overallScore >= 70) {
        return "Good overall form in your " + poseDisplayName + ". Minor adjustments will help perfect it.";
    }
    if (overallScore >= 50) {
        return "Your " + poseDisplayName + " needs some improvement. Focus on the areas highlighted below.";
    }
    return "Your " + poseDisplayName + " requires significant work. Review the recommendations carefully.";
}

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

std::string percent(double rate) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0) << rate * 100.0 << "%";
    return ss.str();
}

} // namespace

void PoseScorer::addProgressNotes(EvaluationResult& result, std::optional<double> detectionRate) const {
    std::vector<std::string> excellent;
    std::vector<std::string> good;
    std::vector<std::string> focus;
    for (const auto& angle : result.angles) {
        if (!angle.isMeasured()) {
            continue;
        }
        if (angle.status == "EXCELLENT") {
            excellent.push_back(angleDisplayName(angle.name));
        } else if (angle.status == "GOOD") {
            good.push_back(angleDisplayName(angle.name));
        } else {
            focus.push_back(angleDisplayName(angle.name));
        }
    }

    if (!excellent.empty()) {
        result.strengths.push_back("Excellent alignment: " + joinNames(excellent));
    }
    if (!good.empty()) {
        result.strengths.push_back("Good form: " + joinNames(good));
    }
    if (result.passed) {
        result.strengths.push_back("Overall score of " + std::to_string(result.overallScore) +
                                   " meets the passing threshold");
    }

    if (!focus.empty()) {
        result.improvements.push_back("Focus on: " + joinNames(focus));
    }

    if (detectionRate) {
        result.detectionRate = *detectionRate;
        if (*detectionRate >= policy.targetDetectionRate) {
            result.strengths.push_back("Excellent pose consistency (" + percent(*detectionRate) +
                                       " detection rate)");
        } else {
            result.improvements.push_back("Improve pose stability (current: " + percent(*detectionRate) +
                                          ", target: " + percent(policy.targetDetectionRate) + "+)");
        }
    }

    if (result.overallScore < 90) {
        result.improvements.emplace_back("Work on overall alignment to reach the excellent range (90+)");
    }

    if (result.strengths.empty()) {
        result.strengths.emplace_back("Keep practicing!");
    }
    if (result.improvements.empty()) {
        result.improvements.emplace_back("Great job! Keep maintaining this form.");
    }
}

EvaluationResult PoseScorer::score(const AlignmentResult& alignment,
                                   const AngleSequence& reference,
                                   const AngleSequence& candidate,
                                   const PoseDefinition& pose,
                                   std::optional<double> detectionRate) const {
    for (const auto& [refIndex, candIndex] : alignment.path) {
        if (refIndex < 0 || candIndex < 0 ||
            refIndex >= static_cast<int>(reference.size()) ||
            candIndex >= static_cast<int>(candidate.size())) {
            throw PoseError(ErrorCode::AlignmentDegenerate,
                            "Alignment path refers to frames outside the sequences");
        }
    }

    EvaluationResult result;
    result.poseName = pose.name;
    result.displayName = pose.displayName.empty() ? pose.name : pose.displayName;
    result.pathLength = alignment.path.size();
    result.alignmentCost = alignment.totalCost;
    result.normalizedCost = alignment.normalizedCost;

    double measuredSum = 0.0;
    int measuredCount = 0;
    for (const auto& angle : pose.angles) {
        AngleScore angleScore = scoreAngle(angle, alignment.path, reference, candidate);
        if (angleScore.isMeasured()) {
            measuredSum += *angleScore.score;
            measuredCount++;
        } else {
            spdlog::warn("Angle '{}' was never measured in the aligned frames", angle.name);
        }
        result.angles.push_back(std::move(angleScore));
    }

    if (measuredCount == 0) {
        throw PoseError(ErrorCode::AlignmentDegenerate,
                        "No angle of '" + pose.name + "' was measured in both sequences");
    }

    double mean = measuredSum / measuredCount;
    result.overallScore = std::clamp(static_cast<int>(std::lround(mean)), 0, 100);
    result.passed = result.overallScore >= policy.passThreshold;
    result.grade = gradeFor(result.overallScore);
    result.summary = summaryFor(result.overallScore, result.displayName);

    // One entry per failing angle, lowest score first, ties in definition order
    for (size_t i = 0; i < pose.angles.size(); i++) {
        const AngleScore& angleScore = result.angles[i];
        if (angleScore.isMeasured() && *angleScore.score < policy.passThreshold) {
            result.feedback.push_back(makeFeedback(pose.angles[i], angleScore));
        }
    }
    std::ranges::stable_sort(result.feedback, {}, &FeedbackEntry::score);
    for (size_t i = 0; i < result.feedback.size(); i++) {
        result.feedback[i].severity = static_cast<int>(i) + 1;
    }

    std::set<std::string> seen;
    for (const auto& entry : result.feedback) {
        const AngleDefinition* angle = pose.findAngle(entry.angleName);
        if (angle && !angle->recommendation.empty() && seen.insert(angle->recommendation).second) {
            result.recommendations.push_back(angle->recommendation);
        }
    }
    if (!result.passed) {
        result.recommendations.emplace_back("Consider practicing with a yoga instructor for personalized guidance.");
        result.recommendations.emplace_back("Watch tutorial videos to understand proper form and alignment.");
    }

    addProgressNotes(result, detectionRate);

    spdlog::info("Scored '{}': {} ({}), {} of {} angles measured, {} feedback entries",
                 pose.name, result.overallScore, result.passed ? "PASS" : "FAIL",
                 measuredCount, pose.angles.size(), result.feedback.size());
    return result;
}
