#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

/**
 * @brief Settings for the pose evaluation engine
 *
 * Values come from an ini-style `key = value` file layered over the
 * defaults set in the constructor. Values are typed on load; numeric
 * settings should be read with getNumberOr, which accepts either an
 * integer or a floating point literal.
 */
class Configuration {
public:
    // Configuration value types supported
    using ValueType = std::variant<
        std::string,
        int,
        double,
        bool,
        std::filesystem::path
    >;

    // Defaults only; loads `configPath` when it exists
    explicit Configuration(std::filesystem::path configPath = "pose_eval.ini");

    bool loadFromFile(const std::filesystem::path& path);
    bool saveToFile(const std::filesystem::path& path) const;

    template<typename T>
    std::optional<T> getValue(const std::string& key) const {
        auto it = settings.find(key);
        if (it == settings.end()) {
            return std::nullopt;
        }

        if (const T* value = std::get_if<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    template<typename T>
    T getValueOr(const std::string& key, const T& defaultValue) const {
        auto value = getValue<T>(key);
        return value.value_or(defaultValue);
    }

    // Integer or double setting as double
    double getNumberOr(const std::string& key, double defaultValue) const;

    // Integer setting; a whole-valued double such as 10.0 is accepted.
    // Throws PoseError(InvalidConfiguration) for any other value.
    int getIntegerOr(const std::string& key, int defaultValue) const;

    std::filesystem::path getPathOr(const std::string& key,
                                    const std::filesystem::path& defaultValue) const;

    void setValue(const std::string& key, const ValueType& value);
    bool hasValue(const std::string& key) const;

    std::vector<std::string> getKeys() const;

    // String representation for debugging
    std::string toString() const;

    const std::filesystem::path& getConfigFilePath() const noexcept {
        return configFilePath;
    }

private:
    std::unordered_map<std::string, ValueType> settings;
    std::filesystem::path configFilePath;

    static std::string trim(const std::string& str);
    static ValueType parseValue(const std::string& value);
    static std::string valueToString(const ValueType& value);
};

// Strings read from a file are paths only when the caller asks for a path
template<>
inline std::optional<std::filesystem::path> Configuration::getValue<std::filesystem::path>(
    const std::string& key) const {

    auto it = settings.find(key);
    if (it == settings.end()) {
        return std::nullopt;
    }

    if (const auto* str = std::get_if<std::string>(&it->second)) {
        return std::filesystem::path(*str);
    }
    if (const auto* path = std::get_if<std::filesystem::path>(&it->second)) {
        return *path;
    }
    return std::nullopt;
}
