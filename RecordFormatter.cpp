#include "RecordFormatter.h"
#include "PoseError.h"

#include <spdlog/spdlog.h>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

json RecordFormatter::readJsonFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PoseError(ErrorCode::IOError, "Failed to open file for reading: " + path.string());
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw PoseError(ErrorCode::FormatError, path.string() + ": " + e.what());
    }
}

bool RecordFormatter::writeJsonFile(const fs::path& path, const json& root) {
    try {
        if (!path.parent_path().empty()) {
            fs::create_directories(path.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        spdlog::error("Failed to create directory for {}: {}", path.string(), e.what());
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        spdlog::error("Failed to open file for writing: {}", path.string());
        return false;
    }

    file << std::setw(2) << root << std::endl;
    if (!file) {
        spdlog::error("Failed to write {}", path.string());
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Landmark frames
// ---------------------------------------------------------------------------

json RecordFormatter::landmarkFramesToJson(const std::vector<LandmarkFrame>& frames) {
    json framesJson = json::array();

    for (const auto& frame : frames) {
        json landmarksJson = json::object();
        for (const auto& [index, landmark] : frame.landmarks) {
            landmarksJson[std::to_string(index)] = {
                {"position", {
                    {"x", landmark.position.x},
                    {"y", landmark.position.y},
                    {"z", landmark.position.z}
                }},
                {"visibility", landmark.visibility}
            };
        }

        framesJson.push_back({
            {"index", frame.frameIndex},
            {"timestamp", frame.timestamp},
            {"landmarks", landmarksJson}
        });
    }

    return {{"frames", framesJson}};
}

std::vector<LandmarkFrame> RecordFormatter::landmarkFramesFromJson(const json& root) {
    std::vector<LandmarkFrame> frames;

    try {
        const json& framesJson = root.at("frames");
        frames.reserve(framesJson.size());

        for (size_t i = 0; i < framesJson.size(); i++) {
            const json& frameJson = framesJson[i];

            LandmarkFrame frame;
            frame.frameIndex = frameJson.value("index", static_cast<int>(i));
            frame.timestamp = frameJson.value("timestamp", uint64_t{0});

            for (const auto& [key, landmarkJson] : frameJson.at("landmarks").items()) {
                size_t consumed = 0;
                int index = std::stoi(key, &consumed);
                if (consumed != key.size()) {
                    throw PoseError(ErrorCode::FormatError, "Landmark key '" + key + "' is not an integer index");
                }
                if (index < 0 || index >= LANDMARK_COUNT) {
                    throw PoseError(ErrorCode::FormatError,
                                    "Landmark index " + key + " outside the 33-point body model");
                }

                float visibility = landmarkJson.value("visibility", 1.0f);
                if (!(visibility >= 0.0f && visibility <= 1.0f)) {
                    throw PoseError(ErrorCode::FormatError,
                                    "Landmark " + key + " in frame " + std::to_string(frame.frameIndex) +
                                    " has visibility outside [0,1]");
                }

                const json& position = landmarkJson.at("position");
                frame.landmarks[index] = Landmark(position.at("x").get<float>(),
                                                  position.at("y").get<float>(),
                                                  position.value("z", 0.0f),
                                                  visibility);
            }

            frames.push_back(std::move(frame));
        }
    } catch (const json::exception& e) {
        throw PoseError(ErrorCode::FormatError, std::string("Invalid landmark frames: ") + e.what());
    } catch (const std::logic_error&) {
        throw PoseError(ErrorCode::FormatError, "Landmark keys must be integer indices");
    }

    return frames;
}

std::vector<LandmarkFrame> RecordFormatter::loadLandmarkFrames(const fs::path& path) {
    auto frames = landmarkFramesFromJson(readJsonFile(path));
    spdlog::info("Loaded {} landmark frames from {}", frames.size(), path.string());
    return frames;
}

bool RecordFormatter::saveLandmarkFrames(const fs::path& path, const std::vector<LandmarkFrame>& frames) {
    return writeJsonFile(path, landmarkFramesToJson(frames));
}

// ---------------------------------------------------------------------------
// Golden standard
// ---------------------------------------------------------------------------

json RecordFormatter::goldenStandardToJson(const GoldenStandard& golden) {
    json anglesJson = json::array();
    for (const auto& stats : golden.angles) {
        anglesJson.push_back({
            {"name", stats.name},
            {"tolerance", stats.tolerance},
            {"mean", stats.mean},
            {"std", stats.stdDev},
            {"min", stats.min},
            {"max", stats.max},
            {"count", stats.count},
            {"confidence", stats.confidence}
        });
    }

    json sequenceJson = json::array();
    for (const auto& vector : golden.sequence) {
        json values = json::object();
        for (const auto& [name, value] : vector.values) {
            values[name] = value ? json(*value) : json(nullptr);
        }
        sequenceJson.push_back({{"index", vector.frameIndex}, {"angles", values}});
    }

    json metadataJson = json::object();
    for (const auto& [key, value] : golden.metadata) {
        metadataJson[key] = value;
    }

    return {
        {"poseName", golden.poseName},
        {"createdAt", golden.createdAt},
        {"videoSource", golden.videoSource},
        {"totalFrames", golden.totalFrames},
        {"angles", anglesJson},
        {"sequence", sequenceJson},
        {"metadata", metadataJson}
    };
}

GoldenStandard RecordFormatter::goldenStandardFromJson(const json& root) {
    GoldenStandard golden;

    try {
        golden.poseName = root.at("poseName").get<std::string>();
        golden.createdAt = root.value("createdAt", std::string());
        golden.videoSource = root.value("videoSource", std::string());

        for (const auto& angleJson : root.at("angles")) {
            AngleStatistics stats;
            stats.name = angleJson.at("name").get<std::string>();
            stats.tolerance = angleJson.at("tolerance").get<double>();
            stats.mean = angleJson.at("mean").get<double>();
            stats.stdDev = angleJson.value("std", 0.0);
            stats.min = angleJson.value("min", stats.mean);
            stats.max = angleJson.value("max", stats.mean);
            stats.count = angleJson.value("count", 0);
            stats.confidence = angleJson.value("confidence", 1.0);

            if (!(stats.tolerance > 0.0)) {
                throw PoseError(ErrorCode::FormatError,
                                "Golden standard angle '" + stats.name + "' has a non-positive tolerance");
            }
            golden.angles.push_back(std::move(stats));
        }

        for (const auto& frameJson : root.at("sequence")) {
            AngleVector vector;
            vector.frameIndex = frameJson.value("index", static_cast<int>(golden.sequence.size()));
            for (const auto& [name, value] : frameJson.at("angles").items()) {
                vector.set(name, value.is_null() ? std::nullopt : std::optional<double>(value.get<double>()));
            }
            golden.sequence.push_back(std::move(vector));
        }

        golden.totalFrames = root.value("totalFrames", static_cast<int>(golden.sequence.size()));

        if (root.contains("metadata")) {
            for (const auto& [key, value] : root.at("metadata").items()) {
                golden.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
    } catch (const json::exception& e) {
        throw PoseError(ErrorCode::FormatError, std::string("Invalid golden standard: ") + e.what());
    }

    if (golden.angles.empty()) {
        throw PoseError(ErrorCode::FormatError, "Golden standard for '" + golden.poseName + "' has no angles");
    }
    return golden;
}

GoldenStandard RecordFormatter::loadGoldenStandard(const fs::path& path) {
    GoldenStandard golden = goldenStandardFromJson(readJsonFile(path));
    spdlog::info("Loaded golden standard for '{}' ({} reference frames) from {}",
                 golden.poseName, golden.sequence.size(), path.string());
    return golden;
}

bool RecordFormatter::saveGoldenStandard(const fs::path& path, const GoldenStandard& golden) {
    if (!writeJsonFile(path, goldenStandardToJson(golden))) {
        return false;
    }
    spdlog::info("Saved golden standard for '{}' to {}", golden.poseName, path.string());
    return true;
}

// ---------------------------------------------------------------------------
// Evaluation result
// ---------------------------------------------------------------------------

json RecordFormatter::evaluationResultToJson(const EvaluationResult& result) {
    json anglesJson = json::array();
    for (const auto& angle : result.angles) {
        anglesJson.push_back({
            {"name", angle.name},
            {"score", angle.score ? json(*angle.score) : json(nullptr)},
            {"measured", angle.isMeasured()},
            {"meanSignedDeviation", angle.meanSignedDeviation},
            {"referenceMean", angle.referenceMean},
            {"candidateMean", angle.candidateMean},
            {"tolerance", angle.tolerance},
            {"samples", angle.samples},
            {"status", angle.status}
        });
    }

    json feedbackJson = json::array();
    for (const auto& entry : result.feedback) {
        feedbackJson.push_back({
            {"angle", entry.angleName},
            {"message", entry.message},
            {"severity", entry.severity}
        });
    }

    return {
        {"poseName", result.poseName},
        {"displayName", result.displayName},
        {"videoSource", result.videoSource},
        {"evaluatedAt", result.evaluatedAt},
        {"overallScore", result.overallScore},
        {"passed", result.passed},
        {"grade", result.grade},
        {"summary", result.summary},
        {"angles", anglesJson},
        {"feedback", feedbackJson},
        {"recommendations", result.recommendations},
        {"strengths", result.strengths},
        {"improvements", result.improvements},
        {"alignment", {
            {"pathLength", result.pathLength},
            {"cost", result.alignmentCost},
            {"normalizedCost", result.normalizedCost}
        }},
        {"frames", {
            {"total", result.totalFrames},
            {"usable", result.usableFrames},
            {"detectionRate", result.detectionRate}
        }}
    };
}

bool RecordFormatter::saveEvaluationResult(const fs::path& path, const EvaluationResult& result) {
    if (!writeJsonFile(path, evaluationResultToJson(result))) {
        return false;
    }
    spdlog::info("Saved evaluation result to {}", path.string());
    return true;
}

// ---------------------------------------------------------------------------
// Pose catalog
// ---------------------------------------------------------------------------

LandmarkRef RecordFormatter::landmarkRefFromJson(const json& value) {
    if (value.is_number_integer()) {
        return LandmarkRef(value.get<int>());
    }
    if (value.is_array() && value.size() == 2) {
        return LandmarkRef(value[0].get<int>(), value[1].get<int>());
    }
    // Left invalid so PoseRegistry::validate rejects the triplet
    return LandmarkRef();
}

std::vector<PoseDefinition> RecordFormatter::poseCatalogFromJson(const json& root,
                                                                 float defaultVisibilityThreshold) {
    std::vector<PoseDefinition> poses;

    try {
        for (const auto& poseJson : root.at("poses")) {
            PoseDefinition pose;
            pose.name = poseJson.at("name").get<std::string>();
            pose.displayName = poseJson.value("displayName", pose.name);

            for (const auto& angleJson : poseJson.at("angles")) {
                AngleDefinition angle;
                angle.name = angleJson.at("name").get<std::string>();
                angle.a = landmarkRefFromJson(angleJson.at("a"));
                angle.vertex = landmarkRefFromJson(angleJson.at("vertex"));
                angle.c = landmarkRefFromJson(angleJson.at("c"));
                angle.tolerance = angleJson.at("tolerance").get<double>();
                angle.visibilityThreshold = angleJson.value("visibilityThreshold", defaultVisibilityThreshold);
                angle.aboveLabel = angleJson.value("aboveLabel", std::string("too large"));
                angle.belowLabel = angleJson.value("belowLabel", std::string("too small"));
                angle.recommendation = angleJson.value("recommendation", std::string());
                pose.angles.push_back(std::move(angle));
            }

            poses.push_back(std::move(pose));
        }
    } catch (const json::exception& e) {
        throw PoseError(ErrorCode::FormatError, std::string("Invalid pose catalog: ") + e.what());
    }

    return poses;
}

std::vector<PoseDefinition> RecordFormatter::loadPoseCatalog(const fs::path& path,
                                                             float defaultVisibilityThreshold) {
    auto poses = poseCatalogFromJson(readJsonFile(path), defaultVisibilityThreshold);
    spdlog::info("Loaded {} pose definitions from {}", poses.size(), path.string());
    return poses;
}
