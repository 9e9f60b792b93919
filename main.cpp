#include "Configuration.h"
#include "PoseError.h"
#include "PoseEvaluator.h"
#include "RecordFormatter.h"

#include <iostream>
#include <string>
#include <filesystem>
#include <stdexcept>
#include <spdlog/spdlog.h>

// Function to display command-line help
void displayHelp() {
    std::cout << "PoseEval - pose comparison and scoring" << std::endl;
    std::cout << "--------------------------------------" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  --train <pose> <frames.json>        Build a golden standard from expert frames" << std::endl;
    std::cout << "  --evaluate <golden.json> <frames.json>" << std::endl;
    std::cout << "                                      Score candidate frames against a golden standard" << std::endl;
    std::cout << "  --output path      Where to write the resulting JSON" << std::endl;
    std::cout << "  --config file.ini  Use specific config file (default: pose_eval.ini)" << std::endl;
    std::cout << "  --threads N        Use N threads for angle extraction (default: 4)" << std::endl;
    std::cout << "  --band N           DTW band width, 0 for unbounded (default: 0)" << std::endl;
    std::cout << "  --help             Display this help" << std::endl;
}

int main(int argc, char** argv) {
    // Configure logging
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    try {
        enum class Mode { None, Train, Evaluate };

        Mode mode = Mode::None;
        std::string poseName;
        std::string goldenPath;
        std::string framesPath;
        std::string configFile = "pose_eval.ini";
        std::string outputPath;
        int numThreads = -1;
        int bandWidth = -1;

        // Process command line arguments
        for (int i = 1; i < argc; i++) {
            if (std::string arg = argv[i]; arg == "--train" && i+2 < argc) {
                mode = Mode::Train;
                poseName = argv[i+1];
                framesPath = argv[i+2];
                i += 2;
            } else if (arg == "--evaluate" && i+2 < argc) {
                mode = Mode::Evaluate;
                goldenPath = argv[i+1];
                framesPath = argv[i+2];
                i += 2;
            } else if (arg == "--threads" && i+1 < argc) {
                numThreads = std::stoi(argv[i+1]);
                i++;
            } else if (arg == "--band" && i+1 < argc) {
                bandWidth = std::stoi(argv[i+1]);
                i++;
            } else if (arg == "--config" && i+1 < argc) {
                configFile = argv[i+1];
                i++;
            } else if (arg == "--output" && i+1 < argc) {
                outputPath = argv[i+1];
                i++;
            } else if (arg == "--help") {
                displayHelp();
                return 0;
            } else {
                spdlog::error("Unknown or incomplete argument: {}", arg);
                displayHelp();
                return -1;
            }
        }

        if (mode == Mode::None) {
            displayHelp();
            return -1;
        }

        Configuration config(configFile);

        // Set command-line overrides
        if (numThreads >= 0) {
            config.setValue("extraction_threads", numThreads);
        }
        if (bandWidth >= 0) {
            config.setValue("dtw_band_width", bandWidth);
        }

        auto level = spdlog::level::from_str(config.getValueOr<std::string>("log_level", "info"));
        spdlog::set_level(level);
        spdlog::debug("{}", config.toString());

        PoseEvaluator evaluator(config);
        auto frames = RecordFormatter::loadLandmarkFrames(framesPath);

        if (mode == Mode::Train) {
            if (outputPath.empty()) {
                outputPath = std::filesystem::path(framesPath).stem().string() + "_golden.json";
            }

            GoldenStandard golden = evaluator.train(frames, poseName, framesPath);
            if (!RecordFormatter::saveGoldenStandard(outputPath, golden)) {
                return -1;
            }

            spdlog::info("Training complete:");
            spdlog::info("  Pose: {}", golden.poseName);
            spdlog::info("  Reference frames: {}/{}", golden.sequence.size(), golden.totalFrames);
            for (const auto& stats : golden.angles) {
                spdlog::info("  {}: {:.1f} +/- {:.1f} deg", stats.name, stats.mean, stats.stdDev);
            }
        } else {
            if (outputPath.empty()) {
                outputPath = std::filesystem::path(framesPath).stem().string() + "_result.json";
            }

            GoldenStandard golden = RecordFormatter::loadGoldenStandard(goldenPath);
            EvaluationResult result = evaluator.evaluate(frames, golden, framesPath);
            if (!RecordFormatter::saveEvaluationResult(outputPath, result)) {
                return -1;
            }

            spdlog::info("Evaluation complete:");
            spdlog::info("  Score: {} ({}, grade {})", result.overallScore,
                         result.passed ? "passed" : "failed", result.grade);
            spdlog::info("  {}", result.summary);
            for (const auto& entry : result.feedback) {
                spdlog::info("  {}. {}", entry.severity, entry.message);
            }
            for (const auto& note : result.strengths) {
                spdlog::info("  + {}", note);
            }
            for (const auto& note : result.improvements) {
                spdlog::info("  - {}", note);
            }
        }

        return 0;
    } catch (const PoseError& e) {
        spdlog::error("{} failed: {}", errorCodeToString(e.code()), e.message());
        return -1;
    } catch (const std::exception& e) {
        spdlog::error("Unhandled exception: {}", e.what());
        return -1;
    }
}
