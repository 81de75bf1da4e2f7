#pragma once

#include "common/Logger.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace ordering {

using json = nlohmann::json;

/**
 * Paramètres du moteur de tri
 *
 * Fichier texte "clé=valeur" (une par ligne, '#' pour les commentaires) :
 *   key_cache_enabled = true
 *   key_cache_capacity = 100000
 *   insertion_threshold = 24
 *   log_level = info
 *   log_file = /var/log/ordering.log
 *   profiling = false
 */
struct EngineConfig {
    bool keyCacheEnabled = true;
    size_t keyCacheCapacity = 100000;
    size_t insertionThreshold = 24;
    common::LogLevel logLevel = common::LogLevel::INFO;
    std::string logFile;
    bool profilingEnabled = false;

    // "@chemin" accepté comme dans les autres options fichier
    static EngineConfig fromFile(const std::string& path);
    static EngineConfig fromParams(const std::map<std::string, std::string>& params);
    static EngineConfig fromJson(const json& configJson);

    static std::map<std::string, std::string> parseKeyValueFile(const std::string& path);

    json toJson() const;

    // Configure le Logger et le Profiler
    void apply() const;
};

} // namespace ordering
