#pragma once

#include "PoseTypes.h"

#include <map>
#include <string>
#include <vector>

// A landmark index, or the midpoint of two landmarks when `second` is set
struct LandmarkRef {
    int first = -1;
    int second = -1;

    LandmarkRef() = default;
    LandmarkRef(int index) : first(index) {}
    LandmarkRef(int a, int b) : first(a), second(b) {}

    bool isMidpoint() const noexcept { return second >= 0; }
};

struct AngleDefinition {
    std::string name;
    LandmarkRef a;
    LandmarkRef vertex;
    LandmarkRef c;
    double tolerance = 15.0;         // degrees
    float visibilityThreshold = 0.3f;
    std::string aboveLabel;          // candidate angle larger than reference
    std::string belowLabel;          // candidate angle smaller than reference
    std::string recommendation;
};

struct PoseDefinition {
    std::string name;
    std::string displayName;
    std::vector<AngleDefinition> angles;

    const AngleDefinition* findAngle(const std::string& angleName) const;
    std::map<std::string, double> tolerances() const;
};

/**
 * @brief Read-only catalog of supported poses
 *
 * Definitions are validated once when added; lookups afterwards never
 * mutate the registry, so one instance may be shared by concurrent
 * evaluations.
 */
class PoseRegistry {
public:
    PoseRegistry() = default;

    // Catalog of the poses the yoga evaluation system ships with
    static PoseRegistry builtin(float visibilityThreshold = 0.3f);

    static PoseRegistry fromDefinitions(const std::vector<PoseDefinition>& definitions);

    void addPose(PoseDefinition definition);

    // Throws PoseError(UnknownPose)
    const PoseDefinition& lookup(const std::string& poseName) const;

    bool contains(const std::string& poseName) const;
    std::vector<std::string> poseNames() const;
    size_t size() const noexcept { return poses.size(); }

    // "Tree Pose", "tree_pose" and "tree-pose" all map to "tree-pose"
    static std::string normalizeName(const std::string& poseName);

    // Throws PoseError(InvalidPoseDefinition)
    static void validate(const PoseDefinition& definition);

private:
    std::map<std::string, PoseDefinition> poses;
};

// "left_knee" -> "Left knee"
std::string angleDisplayName(const std::string& angleName);
