#include "PoseRegistry.h"
#include "PoseError.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <ranges>
#include <set>
#include <sstream>

namespace {

struct AngleTemplate {
    LandmarkRef a;
    LandmarkRef vertex;
    LandmarkRef c;
    const char* aboveLabel;
    const char* belowLabel;
    const char* recommendation;
};

// Joint triplets and feedback phrasing shared by every pose
const std::map<std::string, AngleTemplate>& angleTemplates() {
    static const std::map<std::string, AngleTemplate> templates = {
        {"left_shoulder", {LEFT_ELBOW, LEFT_SHOULDER, LEFT_HIP,
                           "raised too high", "held too low",
                           "Focus on shoulder alignment and arm extension."}},
        {"right_shoulder", {RIGHT_ELBOW, RIGHT_SHOULDER, RIGHT_HIP,
                            "raised too high", "held too low",
                            "Focus on shoulder alignment and arm extension."}},
        {"left_hip", {LEFT_SHOULDER, LEFT_HIP, LEFT_KNEE,
                      "too open", "too closed",
                      "Practice hip opening exercises and focus on proper hip alignment."}},
        {"right_hip", {RIGHT_SHOULDER, RIGHT_HIP, RIGHT_KNEE,
                       "too open", "too closed",
                       "Practice hip opening exercises and focus on proper hip alignment."}},
        {"left_knee", {LEFT_HIP, LEFT_KNEE, LEFT_ANKLE,
                       "too straight", "too bent",
                       "Keep your knee aligned over your ankle and avoid hyperextension."}},
        {"right_knee", {RIGHT_HIP, RIGHT_KNEE, RIGHT_ANKLE,
                        "too straight", "too bent",
                        "Keep your knee aligned over your ankle and avoid hyperextension."}},
        {"left_elbow", {LEFT_SHOULDER, LEFT_ELBOW, LEFT_WRIST,
                        "too straight", "too bent",
                        "Focus on maintaining straight or properly bent arms as required by the pose."}},
        {"right_elbow", {RIGHT_SHOULDER, RIGHT_ELBOW, RIGHT_WRIST,
                         "too straight", "too bent",
                         "Focus on maintaining straight or properly bent arms as required by the pose."}},
        {"spine_alignment", {LandmarkRef(LEFT_HIP, RIGHT_HIP),
                             LandmarkRef(LEFT_SHOULDER, RIGHT_SHOULDER), NOSE,
                             "too extended", "too rounded",
                             "Engage your core and focus on maintaining a neutral spine throughout the pose."}}
    };
    return templates;
}

PoseDefinition makePose(const std::string& name, const std::string& displayName,
                        const std::vector<std::pair<std::string, double>>& angles,
                        float visibilityThreshold) {
    PoseDefinition pose;
    pose.name = name;
    pose.displayName = displayName;

    for (const auto& [angleName, tolerance] : angles) {
        const AngleTemplate& t = angleTemplates().at(angleName);
        AngleDefinition angle;
        angle.name = angleName;
        angle.a = t.a;
        angle.vertex = t.vertex;
        angle.c = t.c;
        angle.tolerance = tolerance;
        angle.visibilityThreshold = visibilityThreshold;
        angle.aboveLabel = t.aboveLabel;
        angle.belowLabel = t.belowLabel;
        angle.recommendation = t.recommendation;
        pose.angles.push_back(std::move(angle));
    }
    return pose;
}

bool isValidRef(const LandmarkRef& ref) {
    if (ref.first < 0 || ref.first >= LANDMARK_COUNT) {
        return false;
    }
    return !ref.isMidpoint() || ref.second < LANDMARK_COUNT;
}

} // namespace

const AngleDefinition* PoseDefinition::findAngle(const std::string& angleName) const {
    auto it = std::ranges::find_if(angles, [&](const AngleDefinition& angle) {
        return angle.name == angleName;
    });
    return it != angles.end() ? &*it : nullptr;
}

std::map<std::string, double> PoseDefinition::tolerances() const {
    std::map<std::string, double> result;
    for (const auto& angle : angles) {
        result[angle.name] = angle.tolerance;
    }
    return result;
}

PoseRegistry PoseRegistry::builtin(float visibilityThreshold) {
    PoseRegistry registry;

    registry.addPose(makePose("downward-dog", "Downward Dog", {
        {"left_shoulder", 15}, {"right_shoulder", 15},
        {"left_hip", 20}, {"right_hip", 20},
        {"left_knee", 10}, {"right_knee", 10},
        {"spine_alignment", 8}
    }, visibilityThreshold));

    registry.addPose(makePose("warrior-1", "Warrior 1", {
        {"left_hip", 25}, {"right_hip", 25},
        {"left_knee", 15}, {"right_knee", 15},
        {"left_shoulder", 20}, {"right_shoulder", 20},
        {"spine_alignment", 10}
    }, visibilityThreshold));

    registry.addPose(makePose("warrior-2", "Warrior 2", {
        {"left_hip", 25}, {"right_hip", 25},
        {"left_knee", 15}, {"right_knee", 15},
        {"left_shoulder", 20}, {"right_shoulder", 20},
        {"left_elbow", 10}, {"right_elbow", 10}
    }, visibilityThreshold));

    registry.addPose(makePose("tree-pose", "Tree Pose", {
        {"left_hip", 20}, {"right_hip", 20},
        {"left_knee", 25}, {"right_knee", 25},
        {"left_shoulder", 15}, {"right_shoulder", 15},
        {"spine_alignment", 12}
    }, visibilityThreshold));

    registry.addPose(makePose("triangle-pose", "Triangle Pose", {
        {"left_hip", 20}, {"right_hip", 20},
        {"left_knee", 10}, {"right_knee", 10},
        {"left_shoulder", 25}, {"right_shoulder", 25},
        {"spine_alignment", 15}
    }, visibilityThreshold));

    return registry;
}

PoseRegistry PoseRegistry::fromDefinitions(const std::vector<PoseDefinition>& definitions) {
    PoseRegistry registry;
    for (const auto& definition : definitions) {
        registry.addPose(definition);
    }
    return registry;
}

void PoseRegistry::addPose(PoseDefinition definition) {
    validate(definition);

    std::string key = normalizeName(definition.name);
    if (poses.contains(key)) {
        throw PoseError(ErrorCode::InvalidPoseDefinition,
                        "Duplicate pose definition: " + definition.name);
    }
    if (definition.displayName.empty()) {
        definition.displayName = definition.name;
    }

    spdlog::debug("Registered pose '{}' with {} angles", key, definition.angles.size());
    poses.emplace(std::move(key), std::move(definition));
}

const PoseDefinition& PoseRegistry::lookup(const std::string& poseName) const {
    auto it = poses.find(normalizeName(poseName));
    if (it == poses.end()) {
        std::ostringstream supported;
        bool first = true;
        for (const auto& name : poseNames()) {
            supported << (first ? "" : ", ") << name;
            first = false;
        }
        throw PoseError(ErrorCode::UnknownPose,
                        "Unsupported pose: " + poseName + ". Supported poses: " + supported.str());
    }
    return it->second;
}

bool PoseRegistry::contains(const std::string& poseName) const {
    return poses.contains(normalizeName(poseName));
}

std::vector<std::string> PoseRegistry::poseNames() const {
    std::vector<std::string> names;
    names.reserve(poses.size());
    for (const auto& name : poses | std::views::keys) {
        names.push_back(name);
    }
    return names;
}

std::string PoseRegistry::normalizeName(const std::string& poseName) {
    std::string result;
    result.reserve(poseName.size());

    for (unsigned char ch : poseName) {
        if (std::isspace(ch) || ch == '_') {
            if (!result.empty() && result.back() != '-') {
                result.push_back('-');
            }
        } else {
            result.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    while (!result.empty() && result.back() == '-') {
        result.pop_back();
    }
    return result;
}

void PoseRegistry::validate(const PoseDefinition& definition) {
    if (normalizeName(definition.name).empty()) {
        throw PoseError(ErrorCode::InvalidPoseDefinition, "Pose definition without a name");
    }
    if (definition.angles.empty()) {
        throw PoseError(ErrorCode::InvalidPoseDefinition,
                        "Pose '" + definition.name + "' declares no angles");
    }

    std::set<std::string> seen;
    for (const auto& angle : definition.angles) {
        const std::string where = "Pose '" + definition.name + "' angle '" + angle.name + "'";

        if (angle.name.empty()) {
            throw PoseError(ErrorCode::InvalidPoseDefinition,
                            "Pose '" + definition.name + "' has an unnamed angle");
        }
        if (!seen.insert(angle.name).second) {
            throw PoseError(ErrorCode::InvalidPoseDefinition, where + " is declared twice");
        }
        if (!isValidRef(angle.a) || !isValidRef(angle.vertex) || !isValidRef(angle.c)) {
            throw PoseError(ErrorCode::InvalidPoseDefinition, where + " has an empty or invalid landmark triplet");
        }
        if (!(angle.tolerance > 0.0)) {
            throw PoseError(ErrorCode::InvalidPoseDefinition, where + " needs a positive tolerance");
        }
        if (angle.visibilityThreshold < 0.0f || angle.visibilityThreshold > 1.0f) {
            throw PoseError(ErrorCode::InvalidPoseDefinition, where + " visibility threshold must be in [0,1]");
        }
    }
}

std::string angleDisplayName(const std::string& angleName) {
    std::string result = angleName;
    std::ranges::replace(result, '_', ' ');
    if (!result.empty()) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}
