#include "TestSupport.h"
#include "../PoseScorer.h"

#include <string>

namespace {

// Tree Pose from the built-in catalog with the knee tolerance tightened to 15 degrees
PoseDefinition treePose() {
    PoseRegistry registry = PoseRegistry::builtin();
    PoseDefinition pose = registry.lookup("Tree Pose");
    for (auto& angle : pose.angles) {
        if (angle.name == "left_knee") {
            angle.tolerance = 15.0;
        }
    }
    return pose;
}

AngleSequence constantKnee(int frames, double leftKnee) {
    AngleSequence sequence;
    for (int i = 0; i < frames; i++) {
        sequence.push_back(makeVector(i, {{"left_knee", leftKnee}}));
    }
    return sequence;
}

AlignmentResult identityAlignment(int frames) {
    AlignmentResult alignment;
    for (int i = 0; i < frames; i++) {
        alignment.path.emplace_back(i, i);
    }
    return alignment;
}

void testScoreCurve() {
    ASSERT_NEAR(PoseScorer::scoreDeviation(0.0, 15.0, 2.0), 100.0, 1e-12);
    ASSERT_NEAR(PoseScorer::scoreDeviation(15.0, 15.0, 2.0), 100.0, 1e-12);
    ASSERT_NEAR(PoseScorer::scoreDeviation(22.5, 15.0, 2.0), 50.0, 1e-12);
    ASSERT_NEAR(PoseScorer::scoreDeviation(25.0, 15.0, 2.0), 100.0 / 3.0, 1e-9);
    ASSERT_NEAR(PoseScorer::scoreDeviation(30.0, 15.0, 2.0), 0.0, 1e-12);
    ASSERT_NEAR(PoseScorer::scoreDeviation(90.0, 15.0, 2.0), 0.0, 1e-12);

    // Wider cutoff
    ASSERT_NEAR(PoseScorer::scoreDeviation(30.0, 10.0, 3.0), 50.0, 1e-12);
}

void testStatusAndGrade() {
    ASSERT_EQ(PoseScorer::statusFor(92.0), std::string("EXCELLENT"));
    ASSERT_EQ(PoseScorer::statusFor(85.0), std::string("EXCELLENT"));
    ASSERT_EQ(PoseScorer::statusFor(70.0), std::string("GOOD"));
    ASSERT_EQ(PoseScorer::statusFor(55.0), std::string("NEEDS_IMPROVEMENT"));
    ASSERT_EQ(PoseScorer::statusFor(10.0), std::string("POOR"));

    ASSERT_EQ(PoseScorer::gradeFor(100.0), std::string("A"));
    ASSERT_EQ(PoseScorer::gradeFor(85.0), std::string("B"));
    ASSERT_EQ(PoseScorer::gradeFor(70.0), std::string("C"));
    ASSERT_EQ(PoseScorer::gradeFor(60.0), std::string("D"));
    ASSERT_EQ(PoseScorer::gradeFor(59.9), std::string("F"));
}

void testTreePoseWithinTolerance() {
    PoseDefinition pose = treePose();
    AngleSequence reference = constantKnee(5, 170.0);
    AngleSequence candidate = constantKnee(5, 165.0);

    EvaluationResult result = PoseScorer().score(identityAlignment(5), reference, candidate, pose);

    const AngleScore* knee = result.findAngle("left_knee");
    ASSERT_TRUE(knee != nullptr);
    ASSERT_TRUE(knee->isMeasured());
    ASSERT_NEAR(*knee->score, 100.0, 1e-9);
    ASSERT_NEAR(knee->meanSignedDeviation, -5.0, 1e-9);
    ASSERT_EQ(knee->samples, 5);
    ASSERT_EQ(knee->status, std::string("EXCELLENT"));

    ASSERT_EQ(result.overallScore, 100);
    ASSERT_TRUE(result.passed);
    ASSERT_EQ(result.grade, std::string("A"));
    ASSERT_TRUE(result.feedback.empty());
    ASSERT_TRUE(result.recommendations.empty());
    ASSERT_EQ(result.displayName, std::string("Tree Pose"));
    ASSERT_EQ(result.pathLength, 5u);
}

void testTreePoseBentKnee() {
    PoseDefinition pose = treePose();
    AngleSequence reference = constantKnee(5, 170.0);
    AngleSequence candidate = constantKnee(5, 145.0);

    EvaluationResult result = PoseScorer().score(identityAlignment(5), reference, candidate, pose);

    const AngleScore* knee = result.findAngle("left_knee");
    ASSERT_NEAR(*knee->score, 100.0 * (1.0 - (25.0 - 15.0) / 15.0), 1e-9);
    ASSERT_NEAR(knee->meanSignedDeviation, -25.0, 1e-9);
    ASSERT_NEAR(knee->referenceMean, 170.0, 1e-9);
    ASSERT_NEAR(knee->candidateMean, 145.0, 1e-9);
    ASSERT_EQ(knee->status, std::string("POOR"));

    ASSERT_EQ(result.overallScore, 33);
    ASSERT_FALSE(result.passed);
    ASSERT_EQ(result.grade, std::string("F"));

    ASSERT_EQ(result.feedback.size(), 1u);
    ASSERT_EQ(result.feedback[0].angleName, std::string("left_knee"));
    ASSERT_EQ(result.feedback[0].severity, 1);
    ASSERT_TRUE(result.feedback[0].message.find("too bent") != std::string::npos);
    ASSERT_TRUE(result.feedback[0].message.find("25.0") != std::string::npos);

    // Knee recommendation plus the two general ones for a failed evaluation
    ASSERT_EQ(result.recommendations.size(), 3u);
    ASSERT_EQ(result.recommendations[0], pose.findAngle("left_knee")->recommendation);
}

void testUnmeasuredAnglesAreNeutral() {
    PoseDefinition pose = treePose();
    AngleSequence reference = constantKnee(4, 170.0);
    AngleSequence candidate = constantKnee(4, 170.0);

    EvaluationResult result = PoseScorer().score(identityAlignment(4), reference, candidate, pose);

    // Only the knee was measured; the other six angles neither help nor hurt
    ASSERT_EQ(result.angles.size(), pose.angles.size());
    ASSERT_EQ(result.overallScore, 100);
    for (const auto& angle : result.angles) {
        if (angle.name == "left_knee") {
            continue;
        }
        ASSERT_FALSE(angle.isMeasured());
        ASSERT_EQ(angle.status, std::string("UNMEASURED"));
        ASSERT_EQ(angle.samples, 0);
    }

    // A reference-only measurement does not count either
    reference[0].set("right_knee", 120.0);
    EvaluationResult again = PoseScorer().score(identityAlignment(4), reference, candidate, pose);
    ASSERT_FALSE(again.findAngle("right_knee")->isMeasured());
    ASSERT_EQ(again.overallScore, 100);
}

void testFeedbackSeverityOrder() {
    PoseDefinition pose = treePose();

    AngleSequence reference;
    AngleSequence candidate;
    for (int i = 0; i < 3; i++) {
        reference.push_back(makeVector(i, {{"left_knee", 170.0}, {"right_knee", 170.0}, {"left_hip", 90.0}}));
        // left_knee 25 below (33.3), right_knee 35 above (60), left_hip within tolerance
        candidate.push_back(makeVector(i, {{"left_knee", 145.0}, {"right_knee", 205.0}, {"left_hip", 95.0}}));
    }

    EvaluationResult result = PoseScorer().score(identityAlignment(3), reference, candidate, pose);

    ASSERT_EQ(result.feedback.size(), 2u);
    ASSERT_EQ(result.feedback[0].angleName, std::string("left_knee"));
    ASSERT_EQ(result.feedback[0].severity, 1);
    ASSERT_EQ(result.feedback[1].angleName, std::string("right_knee"));
    ASSERT_EQ(result.feedback[1].severity, 2);
    ASSERT_TRUE(result.feedback[1].message.find("too straight") != std::string::npos);

    // Mean of 33.3, 60 and 100
    ASSERT_EQ(result.overallScore, 64);
    ASSERT_FALSE(result.passed);

    // Both knees share one recommendation
    ASSERT_EQ(result.recommendations.size(), 3u);
}

void testPassThreshold() {
    PoseDefinition pose = treePose();
    AngleSequence reference = constantKnee(3, 170.0);
    AngleSequence candidate = constantKnee(3, 150.0);

    // Deviation 20 scores 66.7 under the default curve
    EvaluationResult strict = PoseScorer().score(identityAlignment(3), reference, candidate, pose);
    ASSERT_EQ(strict.overallScore, 67);
    ASSERT_FALSE(strict.passed);

    PoseScorer::Policy policy;
    policy.passThreshold = 60.0;
    EvaluationResult lenient = PoseScorer(policy).score(identityAlignment(3), reference, candidate, pose);
    ASSERT_TRUE(lenient.passed);
    ASSERT_TRUE(lenient.feedback.empty());
}

void testProgressNotes() {
    PoseDefinition pose = treePose();
    AngleSequence reference = constantKnee(5, 170.0);

    EvaluationResult steady = PoseScorer().score(identityAlignment(5), reference, constantKnee(5, 165.0), pose, 0.9);
    ASSERT_NEAR(steady.detectionRate, 0.9, 1e-12);
    ASSERT_EQ(steady.strengths.size(), 3u);
    ASSERT_EQ(steady.strengths[0], std::string("Excellent alignment: Left knee"));
    ASSERT_EQ(steady.strengths[1], std::string("Overall score of 100 meets the passing threshold"));
    ASSERT_EQ(steady.strengths[2], std::string("Excellent pose consistency (90% detection rate)"));
    ASSERT_EQ(steady.improvements.size(), 1u);
    ASSERT_EQ(steady.improvements[0], std::string("Great job! Keep maintaining this form."));

    EvaluationResult shaky = PoseScorer().score(identityAlignment(5), reference, constantKnee(5, 145.0), pose, 0.6);
    ASSERT_EQ(shaky.strengths.size(), 1u);
    ASSERT_EQ(shaky.strengths[0], std::string("Keep practicing!"));
    ASSERT_EQ(shaky.improvements.size(), 3u);
    ASSERT_EQ(shaky.improvements[0], std::string("Focus on: Left knee"));
    ASSERT_EQ(shaky.improvements[1], std::string("Improve pose stability (current: 60%, target: 80%+)"));
    ASSERT_EQ(shaky.improvements[2], std::string("Work on overall alignment to reach the excellent range (90+)"));

    // Without a detection rate nothing is said about consistency
    EvaluationResult unknown = PoseScorer().score(identityAlignment(5), reference, constantKnee(5, 165.0), pose);
    ASSERT_EQ(unknown.strengths.size(), 2u);
    ASSERT_NEAR(unknown.detectionRate, 0.0, 1e-12);
}

void testInvalidInput() {
    PoseDefinition pose = treePose();
    AngleSequence reference = constantKnee(3, 170.0);

    AngleSequence noKnee;
    for (int i = 0; i < 3; i++) {
        noKnee.push_back(makeVector(i, {{"left_knee", std::nullopt}, {"right_hip", 90.0}}));
    }
    ASSERT_POSE_ERROR(PoseScorer().score(identityAlignment(3), reference, noKnee, pose),
                      ErrorCode::AlignmentDegenerate);

    ASSERT_POSE_ERROR(PoseScorer().score(identityAlignment(4), reference, reference, pose),
                      ErrorCode::AlignmentDegenerate);

    PoseScorer::Policy policy;
    policy.passThreshold = 120.0;
    ASSERT_POSE_ERROR(PoseScorer{policy}, ErrorCode::InvalidConfiguration);

    policy = {};
    policy.cutoffMultiple = 1.0;
    ASSERT_POSE_ERROR(PoseScorer{policy}, ErrorCode::InvalidConfiguration);

    policy = {};
    policy.targetDetectionRate = 1.5;
    ASSERT_POSE_ERROR(PoseScorer{policy}, ErrorCode::InvalidConfiguration);
}

} // namespace

int main() {
    setupTestLogging();
    spdlog::info("PoseScorer tests");

    RUN_TEST(testScoreCurve);
    RUN_TEST(testStatusAndGrade);
    RUN_TEST(testTreePoseWithinTolerance);
    RUN_TEST(testTreePoseBentKnee);
    RUN_TEST(testUnmeasuredAnglesAreNeutral);
    RUN_TEST(testFeedbackSeverityOrder);
    RUN_TEST(testPassThreshold);
    RUN_TEST(testProgressNotes);
    RUN_TEST(testInvalidInput);

    spdlog::info("All PoseScorer tests passed");
    return 0;
}
