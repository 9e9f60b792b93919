#ifndef RECORD_FORMATTER_H
#define RECORD_FORMATTER_H

#include "GoldenStandard.h"
#include "PoseRegistry.h"
#include "PoseScorer.h"
#include "PoseTypes.h"

#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * JSON records exchanged with the surrounding system: landmark frames
 * written by the detector, golden standards, evaluation results and pose
 * catalogs. Loaders throw PoseError(IOError | FormatError); savers log and
 * return false on failure.
 */
class RecordFormatter {
public:
    // Landmark frames
    static nlohmann::json landmarkFramesToJson(const std::vector<LandmarkFrame>& frames);
    static std::vector<LandmarkFrame> landmarkFramesFromJson(const nlohmann::json& root);
    static std::vector<LandmarkFrame> loadLandmarkFrames(const std::filesystem::path& path);
    static bool saveLandmarkFrames(const std::filesystem::path& path, const std::vector<LandmarkFrame>& frames);

    // Golden standard
    static nlohmann::json goldenStandardToJson(const GoldenStandard& golden);
    static GoldenStandard goldenStandardFromJson(const nlohmann::json& root);
    static GoldenStandard loadGoldenStandard(const std::filesystem::path& path);
    static bool saveGoldenStandard(const std::filesystem::path& path, const GoldenStandard& golden);

    // Evaluation result
    static nlohmann::json evaluationResultToJson(const EvaluationResult& result);
    static bool saveEvaluationResult(const std::filesystem::path& path, const EvaluationResult& result);

    // Pose catalog
    static std::vector<PoseDefinition> poseCatalogFromJson(const nlohmann::json& root,
                                                           float defaultVisibilityThreshold = 0.3f);
    static std::vector<PoseDefinition> loadPoseCatalog(const std::filesystem::path& path,
                                                       float defaultVisibilityThreshold = 0.3f);

private:
    static nlohmann::json readJsonFile(const std::filesystem::path& path);
    static bool writeJsonFile(const std::filesystem::path& path, const nlohmann::json& root);
    static LandmarkRef landmarkRefFromJson(const nlohmann::json& value);
};

#endif
