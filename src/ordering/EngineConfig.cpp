#include "EngineConfig.hpp"
#include "common/Profiler.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace ordering {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::invalid_argument("Invalid boolean for '" + key + "': '" + value + "'");
}

size_t parseSize(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size() || value.empty() || value[0] == '-') {
        throw std::invalid_argument("Invalid number for '" + key + "': '" + value + "'");
    }
    return static_cast<size_t>(parsed);
}

} // namespace

std::map<std::string, std::string> EngineConfig::parseKeyValueFile(const std::string& path) {
    std::string filePath = (!path.empty() && path[0] == '@') ? path.substr(1) : path;
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filePath);
    }

    std::map<std::string, std::string> params;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Malformed config line: '" + line + "'");
        }
        params[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
    return params;
}

EngineConfig EngineConfig::fromFile(const std::string& path) {
    return fromParams(parseKeyValueFile(path));
}

EngineConfig EngineConfig::fromParams(const std::map<std::string, std::string>& params) {
    EngineConfig config;
    for (const auto& [key, value] : params) {
        if (key == "key_cache_enabled") {
            config.keyCacheEnabled = parseBool(key, value);
        } else if (key == "key_cache_capacity") {
            config.keyCacheCapacity = parseSize(key, value);
        } else if (key == "insertion_threshold") {
            config.insertionThreshold = parseSize(key, value);
        } else if (key == "log_level") {
            config.logLevel = common::Logger::levelFromString(value);
        } else if (key == "log_file") {
            config.logFile = value;
        } else if (key == "profiling") {
            config.profilingEnabled = parseBool(key, value);
        } else {
            ORDERING_LOG_WARN("Ignoring unknown config key '" + key + "'");
        }
    }
    return config;
}

EngineConfig EngineConfig::fromJson(const json& configJson) {
    if (!configJson.is_object()) {
        throw std::invalid_argument("Engine config must be a JSON object");
    }

    // Normalise en clé=valeur pour partager la validation
    std::map<std::string, std::string> params;
    for (auto it = configJson.begin(); it != configJson.end(); ++it) {
        if (it->is_string()) {
            params[it.key()] = it->get<std::string>();
        } else if (it->is_boolean()) {
            params[it.key()] = it->get<bool>() ? "true" : "false";
        } else {
            params[it.key()] = it->dump();
        }
    }
    return fromParams(params);
}

json EngineConfig::toJson() const {
    std::string level = common::Logger::levelToString(logLevel);
    while (!level.empty() && level.back() == ' ') level.pop_back();
    for (auto& c : level) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    return json{
        {"key_cache_enabled", keyCacheEnabled},
        {"key_cache_capacity", keyCacheCapacity},
        {"insertion_threshold", insertionThreshold},
        {"log_level", level},
        {"log_file", logFile},
        {"profiling", profilingEnabled}
    };
}

void EngineConfig::apply() const {
    common::Logger::instance().setLevel(logLevel);
    if (!logFile.empty()) {
        common::Logger::instance().enableFileLogging(logFile);
    }
    common::Profiler::instance().setEnabled(profilingEnabled);
}

} // namespace ordering
