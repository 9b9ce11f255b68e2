#include "common/evaluator_config.hpp"

#include <cmath>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>

#include "common/errors.hpp"

namespace skyshield {

namespace {

constexpr double kWeightSumTolerance = 1e-6;

std::filesystem::path homePath()
{
    const char *home = std::getenv("HOME");
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

void readDouble(const nlohmann::json &object, const char *key, double &out)
{
    auto it = object.find(key);
    if (it == object.end()) {
        return;
    }
    if (!it->is_number()) {
        throw ConfigError(std::string("config key '") + key + "' must be a number");
    }
    out = it->get<double>();
}

void readInt(const nlohmann::json &object, const char *key, int &out)
{
    auto it = object.find(key);
    if (it == object.end()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(std::string("config key '") + key + "' must be an integer");
    }
    const bool fits = it->is_number_unsigned()
        ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : it->get<int64_t>() >= std::numeric_limits<int>::min()
            && it->get<int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) {
        throw ConfigError(std::string("config key '") + key + "' is out of range");
    }
    out = static_cast<int>(it->get<int64_t>());
}

const nlohmann::json *readObject(const nlohmann::json &object, const char *key)
{
    auto it = object.find(key);
    if (it == object.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("config key '") + key + "' must be an object");
    }
    return &(*it);
}

} // namespace

std::chrono::milliseconds EvaluatorConfig::pollInterval() const
{
    return std::chrono::milliseconds(
        static_cast<long long>(std::llround(pollIntervalSeconds * 1000.0)));
}

std::string defaultDatabasePath()
{
    return (homePath() / ".local/share/skyshield/skyshield.db").string();
}

std::string defaultConfigPath()
{
    return (homePath() / ".config/skyshield/evaluator.json").string();
}

EvaluatorConfig defaultConfig()
{
    EvaluatorConfig config;
    config.databasePath = defaultDatabasePath();
    return config;
}

EvaluatorConfig configFromJson(const nlohmann::json &document)
{
    if (!document.is_object()) {
        throw ConfigError("config document must be a JSON object");
    }

    EvaluatorConfig config = defaultConfig();
    readDouble(document, "pollIntervalSeconds", config.pollIntervalSeconds);
    readDouble(document, "speedCeiling", config.speedCeiling);
    readDouble(document, "innerRadius", config.innerRadius);
    readDouble(document, "outerRadius", config.outerRadius);
    readInt(document, "deadBandThreshold", config.deadBandThreshold);
    readInt(document, "escalationThreshold", config.escalationThreshold);

    if (const nlohmann::json *weights = readObject(document, "weights")) {
        for (auto it = weights->begin(); it != weights->end(); ++it) {
            if (it.key() != "speed" && it.key() != "proximity"
                && it.key() != "identification") {
                throw ConfigError("unknown scoring weight '" + it.key() + "'");
            }
        }
        readDouble(*weights, "speed", config.weights.speed);
        readDouble(*weights, "proximity", config.weights.proximity);
        readDouble(*weights, "identification", config.weights.identification);
    }

    if (const nlohmann::json *point = readObject(document, "protectedPoint")) {
        readDouble(*point, "x", config.protectedPoint.x);
        readDouble(*point, "y", config.protectedPoint.y);
    }

    auto dbPath = document.find("databasePath");
    if (dbPath != document.end()) {
        if (!dbPath->is_string() || dbPath->get<std::string>().empty()) {
            throw ConfigError("config key 'databasePath' must be a non-empty string");
        }
        config.databasePath = dbPath->get<std::string>();
    }

    validateConfig(config);
    return config;
}

EvaluatorConfig loadConfigFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot read config file " + path);
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigError("config file " + path + " is not valid JSON: " + ex.what());
    }
    return configFromJson(document);
}

void applyDatabaseOverride(EvaluatorConfig &config, const std::string &path)
{
    if (path.empty()) {
        throw ConfigError("database path must not be empty");
    }
    config.databasePath = path;
}

void validateConfig(const EvaluatorConfig &config)
{
    if (!std::isfinite(config.pollIntervalSeconds) || config.pollIntervalSeconds <= 0.0) {
        throw ConfigError("pollIntervalSeconds must be positive");
    }
    if (!std::isfinite(config.speedCeiling) || config.speedCeiling <= 0.0) {
        throw ConfigError("speedCeiling must be positive");
    }
    if (!std::isfinite(config.innerRadius) || config.innerRadius < 0.0) {
        throw ConfigError("innerRadius must be non-negative");
    }
    if (!std::isfinite(config.outerRadius) || config.innerRadius >= config.outerRadius) {
        throw ConfigError("outerRadius must be greater than innerRadius");
    }

    const ScoringWeights &w = config.weights;
    if (w.speed < 0.0 || w.proximity < 0.0 || w.identification < 0.0) {
        throw ConfigError("scoring weights must be non-negative");
    }
    const double sum = w.speed + w.proximity + w.identification;
    if (!std::isfinite(sum) || std::fabs(sum - 1.0) > kWeightSumTolerance) {
        throw ConfigError("scoring weights must sum to 1.0");
    }

    if (config.deadBandThreshold < 0) {
        throw ConfigError("deadBandThreshold must be non-negative");
    }
    if (config.escalationThreshold < 0 || config.escalationThreshold > 100) {
        throw ConfigError("escalationThreshold must be within [0, 100]");
    }
    if (!std::isfinite(config.protectedPoint.x) || !std::isfinite(config.protectedPoint.y)) {
        throw ConfigError("protectedPoint must be finite");
    }
    if (config.databasePath.empty()) {
        throw ConfigError("databasePath must not be empty");
    }
}

nlohmann::json configToJson(const EvaluatorConfig &config)
{
    return nlohmann::json{
        {"pollIntervalSeconds", config.pollIntervalSeconds},
        {"speedCeiling", config.speedCeiling},
        {"innerRadius", config.innerRadius},
        {"outerRadius", config.outerRadius},
        {"weights", {
            {"speed", config.weights.speed},
            {"proximity", config.weights.proximity},
            {"identification", config.weights.identification}
        }},
        {"deadBandThreshold", config.deadBandThreshold},
        {"escalationThreshold", config.escalationThreshold},
        {"protectedPoint", {{"x", config.protectedPoint.x}, {"y", config.protectedPoint.y}}},
        {"databasePath", config.databasePath}
    };
}

} // namespace skyshield
