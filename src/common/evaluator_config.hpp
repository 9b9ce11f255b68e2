#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace skyshield {

struct ScoringWeights {
    double speed = 0.30;
    double proximity = 0.40;
    double identification = 0.30;
};

// Tunables of the threat evaluator. Defaults match the fielded configuration;
// every value can be overridden from the JSON config file.
struct EvaluatorConfig {
    double pollIntervalSeconds = 0.5;
    double speedCeiling = 1500.0;
    double innerRadius = 100.0;
    double outerRadius = 300.0;
    ScoringWeights weights;
    int deadBandThreshold = 2;
    int escalationThreshold = 90;
    Position protectedPoint{400.0, 300.0};
    std::string databasePath;

    std::chrono::milliseconds pollInterval() const;
};

// $HOME/.local/share/skyshield/skyshield.db
std::string defaultDatabasePath();
// $HOME/.config/skyshield/evaluator.json
std::string defaultConfigPath();

EvaluatorConfig defaultConfig();

// Keys missing from the document keep their defaults. Throws ConfigError on
// wrong types or on a configuration that fails validateConfig().
EvaluatorConfig configFromJson(const nlohmann::json &document);
EvaluatorConfig loadConfigFile(const std::string &path);

// --db on the command line. Throws ConfigError for an empty path, which
// SQLite would otherwise open as a private temporary database.
void applyDatabaseOverride(EvaluatorConfig &config, const std::string &path);

void validateConfig(const EvaluatorConfig &config);

nlohmann::json configToJson(const EvaluatorConfig &config);

} // namespace skyshield
