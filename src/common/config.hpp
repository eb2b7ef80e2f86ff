#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace tfscope {

struct ScopeConfig {
    int pollIntervalMs = 2500;
    // Stream tag/step notifications during the initial load instead of
    // announcing them once the first full pass is done.
    bool interactivePreload = false;
    // 0 selects QThread::idealThreadCount().
    int workerThreads = 0;
    int recordCacheSize = 32;
    // Progress is reported every Nth record while initially loading.
    int progressEvery = 10;
    int maxCorruptRetries = 3;
    bool traceLogging = false;
};

QString defaultConfigPath();

// Reads the JSON config at path (defaultConfigPath() when empty) and applies
// TFSCOPE_* environment overrides. A missing file yields the defaults.
ScopeConfig loadConfig(const QString &path = QString());

ScopeConfig configFromJson(const nlohmann::json &json);
nlohmann::json configToJson(const ScopeConfig &config);

void applyEnvironmentOverrides(ScopeConfig &config);

} // namespace tfscope
