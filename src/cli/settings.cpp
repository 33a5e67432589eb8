#include "cli/settings.hpp"

#include "game/config.hpp"
#include "game/showdown.hpp"
#include "game/tally.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {
enum class FieldStatus {
    Missing,
    Invalid,
    Loaded
};

template <typename T>
FieldStatus loadField(T& field, const YAML::Node& node, const std::vector<std::string>& indices, std::size_t depth) {
    if (!node.IsDefined() || node.IsNull()) {
        return FieldStatus::Missing;
    }

    if (depth == indices.size()) {
        try {
            field = node.as<T>();
            std::cout << "Successfully loaded field " << join(indices, "::") << ".\n";
            return FieldStatus::Loaded;
        }
        catch (const YAML::Exception&) {
            return FieldStatus::Invalid;
        }
    }

    if (!node.IsMap()) {
        return FieldStatus::Invalid;
    }

    return loadField(field, node[indices[depth]], indices, depth + 1);
}

// Returns false only if the field is present but cannot be converted to T
template <typename T>
bool loadFieldOptional(std::optional<T>& field, const YAML::Node& root, const std::vector<std::string>& indices) {
    T value{};
    FieldStatus status = loadField(value, root, indices, 0);
    switch (status) {
        case FieldStatus::Loaded:
            field = value;
            return true;
        case FieldStatus::Missing:
            std::cout << "Could not load field " << join(indices, "::") << ", using default.\n";
            field = std::nullopt;
            return true;
        default:
            std::cerr << "Error: Could not load field " << join(indices, "::") << ".\n";
            return false;
    }
}
} // namespace

Result<int> validateNumThreads(int numThreads) {
    if (numThreads < showdown::MinNumThreads || numThreads > showdown::MaxNumThreads) {
        return "Error: Thread count must be between " + std::to_string(showdown::MinNumThreads)
            + " and " + std::to_string(showdown::MaxNumThreads) + ".";
    }
    return numThreads;
}

Result<Settings> loadSettings(const YAML::Node& root) {
    Settings settings;

    // Load tie policy
    std::optional<std::string> tiePolicyName;
    if (!loadFieldOptional(tiePolicyName, root, { "tie-policy" })) {
        return "Error: tie-policy must be a string.";
    }
    if (tiePolicyName) {
        Result<TiePolicy> tiePolicyResult = getTiePolicyFromName(*tiePolicyName);
        if (tiePolicyResult.isError()) {
            return tiePolicyResult.getError();
        }
        settings.evaluation.tiePolicy = tiePolicyResult.getValue();
    }

    // Load malformed line policy
    std::optional<std::string> malformedLinePolicyName;
    if (!loadFieldOptional(malformedLinePolicyName, root, { "malformed-lines" })) {
        return "Error: malformed-lines must be a string.";
    }
    if (malformedLinePolicyName) {
        Result<MalformedLinePolicy> policyResult = getMalformedLinePolicyFromName(*malformedLinePolicyName);
        if (policyResult.isError()) {
            return policyResult.getError();
        }
        settings.evaluation.malformedLinePolicy = policyResult.getValue();
    }

    // Load thread count
    std::optional<int> numThreads;
    if (!loadFieldOptional(numThreads, root, { "threads" })) {
        return "Error: threads must be an integer.";
    }
    if (numThreads) {
        Result<int> numThreadsResult = validateNumThreads(*numThreads);
        if (numThreadsResult.isError()) {
            return numThreadsResult.getError();
        }
        settings.evaluation.numThreads = numThreadsResult.getValue();
    }

    // Load report path
    if (!loadFieldOptional(settings.reportPath, root, { "report" })) {
        return "Error: report must be a file path.";
    }

    return settings;
}

Result<Settings> loadSettingsFromFile(const std::string& filePath) {
    YAML::Node root;

    try {
        root = YAML::LoadFile(filePath);
    }
    catch (const YAML::Exception& e) {
        return std::string{ "Error: Could not load settings file. " } + e.what();
    }

    std::cout << "Loading settings from " << filePath << ":\n";
    return loadSettings(root);
}
