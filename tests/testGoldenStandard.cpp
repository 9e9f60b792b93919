#include "TestSupport.h"
#include "../GoldenStandard.h"

#include <cmath>

namespace {

PoseDefinition kneePose() {
    PoseDefinition pose;
    pose.name = "knee-bend";
    pose.displayName = "Knee Bend";

    AngleDefinition left;
    left.name = "left_knee";
    left.a = LEFT_HIP;
    left.vertex = LEFT_KNEE;
    left.c = LEFT_ANKLE;
    left.tolerance = 15.0;
    pose.angles.push_back(left);

    AngleDefinition right = left;
    right.name = "right_knee";
    right.a = RIGHT_HIP;
    right.vertex = RIGHT_KNEE;
    right.c = RIGHT_ANKLE;
    right.tolerance = 12.0;
    pose.angles.push_back(right);
    return pose;
}

void testStatistics() {
    AngleSequence vectors = {
        makeVector(0, {{"left_knee", 168.0}, {"right_knee", 90.0}}),
        makeVector(1, {{"left_knee", 170.0}, {"right_knee", 92.0}}),
        makeVector(2, {{"left_knee", 172.0}, {"right_knee", std::nullopt}}),
        makeVector(3, {{"left_knee", 170.0}, {"right_knee", 94.0}}),
        makeVector(4, {{"left_knee", 170.0}, {"right_knee", 92.0}}),
        // Ignored: not part of the pose
        makeVector(5, {{"left_knee", 170.0}, {"right_knee", 92.0}, {"left_elbow", 10.0}})
    };

    GoldenStandardBuilder builder;
    GoldenStandard golden = builder.build(vectors, kneePose(), "expert.mp4", {{"instructor", "A"}});

    ASSERT_EQ(golden.poseName, std::string("knee-bend"));
    ASSERT_EQ(golden.videoSource, std::string("expert.mp4"));
    ASSERT_EQ(golden.totalFrames, 6);
    ASSERT_EQ(golden.sequence.size(), 6u);
    ASSERT_EQ(golden.metadata.at("instructor"), std::string("A"));
    ASSERT_EQ(golden.createdAt.size(), 20u);
    ASSERT_EQ(golden.createdAt.back(), 'Z');

    ASSERT_EQ(golden.angles.size(), 2u);
    ASSERT_EQ(golden.angles[0].name, std::string("left_knee"));
    ASSERT_EQ(golden.angles[1].name, std::string("right_knee"));

    const AngleStatistics* left = golden.findAngle("left_knee");
    ASSERT_TRUE(left != nullptr);
    ASSERT_NEAR(left->mean, 170.0, 1e-9);
    ASSERT_NEAR(left->stdDev, std::sqrt(8.0 / 6.0), 1e-9);
    ASSERT_NEAR(left->min, 168.0, 1e-9);
    ASSERT_NEAR(left->max, 172.0, 1e-9);
    ASSERT_EQ(left->count, 6);
    ASSERT_NEAR(left->confidence, 1.0, 1e-12);
    ASSERT_NEAR(left->tolerance, 15.0, 1e-12);

    const AngleStatistics* right = golden.findAngle("right_knee");
    ASSERT_TRUE(right != nullptr);
    ASSERT_NEAR(right->mean, 92.0, 1e-9);
    ASSERT_EQ(right->count, 5);
    ASSERT_NEAR(right->confidence, 5.0 / 6.0, 1e-12);

    auto tolerances = golden.tolerances();
    ASSERT_NEAR(tolerances.at("right_knee"), 12.0, 1e-12);

    // Reference sequence keeps only the pose's angles
    ASSERT_FALSE(golden.sequence[5].values.contains("left_elbow"));
    ASSERT_FALSE(golden.sequence[2].get("right_knee").has_value());
}

void testUnusableFramesDropped() {
    AngleSequence vectors;
    for (int i = 0; i < 8; i++) {
        if (i % 4 == 1) {
            vectors.push_back(makeVector(i, {{"left_knee", std::nullopt}, {"right_knee", std::nullopt}}));
        } else {
            vectors.push_back(makeVector(i, {{"left_knee", 160.0}, {"right_knee", 100.0}}));
        }
    }

    GoldenStandard golden = GoldenStandardBuilder().build(vectors, kneePose());
    ASSERT_EQ(golden.totalFrames, 8);
    ASSERT_EQ(golden.sequence.size(), 6u);
    ASSERT_EQ(golden.sequence[1].frameIndex, 2);
}

void testInsufficientTrainingData() {
    AngleSequence vectors = {
        makeVector(0, {{"left_knee", 170.0}, {"right_knee", 90.0}}),
        makeVector(1, {{"left_knee", std::nullopt}, {"right_knee", std::nullopt}}),
        makeVector(2, {{"left_knee", 171.0}, {"right_knee", 91.0}})
    };

    GoldenStandardBuilder::Options options;
    options.minUsableFrames = 10;
    GoldenStandardBuilder builder(options);
    ASSERT_POSE_ERROR(builder.build(vectors, kneePose()), ErrorCode::InsufficientTrainingData);

    ASSERT_POSE_ERROR(GoldenStandardBuilder().build({}, kneePose()), ErrorCode::InsufficientTrainingData);
}

void testLowTrainingDetectionRate() {
    AngleSequence vectors;
    for (int i = 0; i < 20; i++) {
        if (i < 6) {
            vectors.push_back(makeVector(i, {{"left_knee", 170.0}, {"right_knee", 90.0}}));
        } else {
            vectors.push_back(makeVector(i, {{"left_knee", std::nullopt}, {"right_knee", std::nullopt}}));
        }
    }

    // Six usable frames pass the count but only 30% were detected
    ASSERT_POSE_ERROR(GoldenStandardBuilder().build(vectors, kneePose()), ErrorCode::InsufficientTrainingData);
}

void testAngleUnreliable() {
    AngleSequence vectors;
    for (int i = 0; i < 6; i++) {
        std::optional<double> right = (i < 2) ? std::optional<double>(90.0) : std::nullopt;
        vectors.push_back(makeVector(i, {{"left_knee", 170.0}, {"right_knee", right}}));
    }
    ASSERT_POSE_ERROR(GoldenStandardBuilder().build(vectors, kneePose()), ErrorCode::AngleUnreliable);

    // Raising the limit accepts the sparse angle
    GoldenStandardBuilder::Options options;
    options.maxMissingFraction = 0.7;
    GoldenStandard golden = GoldenStandardBuilder(options).build(vectors, kneePose());
    ASSERT_EQ(golden.findAngle("right_knee")->count, 2);

    AngleSequence neverMeasured;
    for (int i = 0; i < 6; i++) {
        neverMeasured.push_back(makeVector(i, {{"left_knee", 170.0}, {"right_knee", std::nullopt}}));
    }
    options.maxMissingFraction = 1.0;
    ASSERT_POSE_ERROR(GoldenStandardBuilder(options).build(neverMeasured, kneePose()),
                      ErrorCode::AngleUnreliable);
}

void testInvalidOptions() {
    GoldenStandardBuilder::Options options;
    options.minUsableFrames = 0;
    ASSERT_POSE_ERROR(GoldenStandardBuilder{options}, ErrorCode::InvalidConfiguration);

    options = {};
    options.maxMissingFraction = 1.5;
    ASSERT_POSE_ERROR(GoldenStandardBuilder{options}, ErrorCode::InvalidConfiguration);

    options = {};
    options.minDetectionRate = -0.1;
    ASSERT_POSE_ERROR(GoldenStandardBuilder{options}, ErrorCode::InvalidConfiguration);
}

} // namespace

int main() {
    setupTestLogging();
    spdlog::info("GoldenStandard tests");

    RUN_TEST(testStatistics);
    RUN_TEST(testUnusableFramesDropped);
    RUN_TEST(testInsufficientTrainingData);
    RUN_TEST(testLowTrainingDetectionRate);
    RUN_TEST(testAngleUnreliable);
    RUN_TEST(testInvalidOptions);

    spdlog::info("All GoldenStandard tests passed");
    return 0;
}
