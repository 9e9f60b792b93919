#include "Configuration.h"
#include "PoseError.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <limits>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <ranges>
#include <sstream>

Configuration::Configuration(std::filesystem::path configPath)
    : configFilePath(std::move(configPath)) {

    settings["log_level"] = std::string("info");
    settings["visibility_threshold"] = 0.3;
    settings["pose_catalog"] = std::string();
    settings["extraction_threads"] = 4;

    // Golden standard creation
    settings["min_training_frames"] = 5;
    settings["max_missing_fraction"] = 0.5;
    settings["min_detection_rate"] = 0.5;
    settings["target_detection_rate"] = 0.8;

    // Evaluation
    settings["min_candidate_frames"] = 3;
    settings["dtw_band_width"] = 0;
    settings["missing_pair_penalty"] = 1.0e6;
    settings["degenerate_cost_limit"] = 5.0e5;
    settings["pass_threshold"] = 70.0;
    settings["score_cutoff_multiple"] = 2.0;

    if (configFilePath.empty()) {
        return;
    }
    if (std::filesystem::exists(configFilePath)) {
        if (!loadFromFile(configFilePath)) {
            spdlog::warn("Failed to load configuration from {}, using defaults",
                         configFilePath.string());
        }
    } else {
        spdlog::debug("Configuration file {} not found, using defaults", configFilePath.string());
    }
}

bool Configuration::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Failed to open configuration file: {}", path.string());
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        lineNumber++;
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        size_t separatorPos = line.find('=');
        if (separatorPos == std::string::npos) {
            spdlog::warn("{}:{}: ignoring line without '='", path.string(), lineNumber);
            continue;
        }

        std::string key = trim(line.substr(0, separatorPos));
        std::string valueStr = trim(line.substr(separatorPos + 1));

        if (key.empty()) {
            continue;
        }

        settings[key] = parseValue(valueStr);
    }

    spdlog::info("Loaded configuration from {}", path.string());
    return true;
}

bool Configuration::saveToFile(const std::filesystem::path& path) const {
    try {
        std::filesystem::path directory = path.parent_path();
        if (!directory.empty() && !std::filesystem::exists(directory)) {
            std::filesystem::create_directories(directory);
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            spdlog::error("Failed to open configuration file for writing: {}", path.string());
            return false;
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);

        file << "# PoseEval Configuration File" << std::endl;
        file << "# Generated on " << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S")
             << std::endl << std::endl;

        std::vector<std::string> keys = getKeys();
        std::ranges::sort(keys);

        for (const auto& key : keys) {
            file << key << " = " << valueToString(settings.at(key)) << std::endl;
        }

        spdlog::info("Saved configuration to {}", path.string());
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Error saving configuration file: {}", e.what());
        return false;
    }
}

double Configuration::getNumberOr(const std::string& key, double defaultValue) const {
    auto it = settings.find(key);
    if (it == settings.end()) {
        return defaultValue;
    }
    if (const auto* value = std::get_if<double>(&it->second)) {
        return *value;
    }
    if (const auto* value = std::get_if<int>(&it->second)) {
        return static_cast<double>(*value);
    }
    spdlog::warn("Setting '{}' is not numeric, using {}", key, defaultValue);
    return defaultValue;
}

int Configuration::getIntegerOr(const std::string& key, int defaultValue) const {
    auto it = settings.find(key);
    if (it == settings.end()) {
        return defaultValue;
    }
    if (const auto* value = std::get_if<int>(&it->second)) {
        return *value;
    }
    if (const auto* value = std::get_if<double>(&it->second)) {
        if (std::isfinite(*value) && std::trunc(*value) == *value &&
            *value >= std::numeric_limits<int>::min() && *value <= std::numeric_limits<int>::max()) {
            return static_cast<int>(*value);
        }
    }
    throw PoseError(ErrorCode::InvalidConfiguration,
                    "Setting '" + key + "' must be an integer, got '" + valueToString(it->second) + "'");
}

std::filesystem::path Configuration::getPathOr(const std::string& key,
                                               const std::filesystem::path& defaultValue) const {
    return getValueOr<std::filesystem::path>(key, defaultValue);
}

void Configuration::setValue(const std::string& key, const ValueType& value) {
    settings[key] = value;
}

bool Configuration::hasValue(const std::string& key) const {
    return settings.contains(key);
}

std::vector<std::string> Configuration::getKeys() const {
    std::vector<std::string> keys;
    keys.reserve(settings.size());

    for (const auto& key : settings | std::views::keys) {
        keys.push_back(key);
    }

    return keys;
}

std::string Configuration::toString() const {
    std::stringstream ss;
    ss << "Configuration (" << settings.size() << " items):" << std::endl;

    std::vector<std::string> keys = getKeys();
    std::ranges::sort(keys);

    for (const auto& key : keys) {
        ss << "  " << key << " = " << valueToString(settings.at(key)) << std::endl;
    }

    return ss.str();
}

std::string Configuration::trim(const std::string& str) {
    const auto begin = std::ranges::find_if_not(str,
                                                [](unsigned char c) { return std::isspace(c); });

    const auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();

    return (begin < end) ? std::string(begin, end) : std::string();
}

Configuration::ValueType Configuration::parseValue(const std::string& value) {
    if (value == "true" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "no") {
        return false;
    }

    // Integer only if the whole string was consumed
    try {
        size_t pos;
        int intValue = std::stoi(value, &pos);
        if (pos == value.length()) {
            return intValue;
        }
    } catch (const std::logic_error&) {
        // not an integer
    }

    try {
        size_t pos;
        double doubleValue = std::stod(value, &pos);
        if (pos == value.length()) {
            return doubleValue;
        }
    } catch (const std::logic_error&) {
        // not a number
    }

    // Quoted strings keep their content verbatim
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }

    return value;
}

std::string Configuration::valueToString(const ValueType& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss << arg;
            return ss.str();
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::filesystem::path>) {
            return arg.string();
        } else {
            return "[unknown type]";
        }
    }, value);
}
