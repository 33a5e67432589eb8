#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "game/showdown.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

struct Settings {
    EvaluationSettings evaluation;
    std::optional<std::string> reportPath;
};

Result<int> validateNumThreads(int numThreads);

// Every field is optional. Missing fields keep their defaults, invalid fields are errors.
Result<Settings> loadSettings(const YAML::Node& root);
Result<Settings> loadSettingsFromFile(const std::string& filePath);

#endif // SETTINGS_HPP
