#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace scrollkeep {

struct ExportConfig {
    int maxScrolls = 500;
    int64_t idleThresholdMs = 30000;
    int64_t minStepDelayMs = 3000;
    int64_t pollIntervalMs = 1000;
    int64_t errorRecoveryWaitMs = 5000;
    int maxNoChangeSteps = 8;
    int64_t resumeMaxAgeMs = 6LL * 60 * 60 * 1000;
    size_t chunkSize = 512 * 1024;
    std::string dataDir;
};

// $SCROLLKEEP_DATA_DIR, else $HOME/.local/share/scrollkeep.
std::string defaultDataDir();

// Defaults, then <dataDir>/config.json, then environment overrides.
// Missing or unreadable files keep the defaults.
ExportConfig loadExportConfig();

// Applies recognised keys from a JSON object. Wrong-typed values are ignored.
void applyConfigJson(ExportConfig &config, const nlohmann::json &json);

nlohmann::json configToJson(const ExportConfig &config);

} // namespace scrollkeep
