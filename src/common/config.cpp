#include "common/config.hpp"

#include <QFile>

#include "common/logging.hpp"

namespace tfscope {

namespace {

template <typename T>
void readField(const nlohmann::json &json, const char *key, T &target)
{
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception &ex) {
        TFS_LOG_WARN(QStringLiteral("Config"),
                     QStringLiteral("readField"),
                     QStringLiteral("config_field_ignored"),
                     QStringLiteral("type_mismatch"),
                     QStringLiteral("json_get"),
                     logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"key", key}, {"error", ex.what()}});
    }
}

int clampPositive(int value, int fallback)
{
    return value > 0 ? value : fallback;
}

} // namespace

QString defaultConfigPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".config/tfscope/config.json");
    }
    return home + QStringLiteral("/.config/tfscope/config.json");
}

ScopeConfig configFromJson(const nlohmann::json &json)
{
    ScopeConfig config;
    if (!json.is_object()) {
        return config;
    }
    readField(json, "pollIntervalMs", config.pollIntervalMs);
    readField(json, "interactivePreload", config.interactivePreload);
    readField(json, "workerThreads", config.workerThreads);
    readField(json, "recordCacheSize", config.recordCacheSize);
    readField(json, "progressEvery", config.progressEvery);
    readField(json, "maxCorruptRetries", config.maxCorruptRetries);
    readField(json, "traceLogging", config.traceLogging);

    const ScopeConfig defaults;
    config.pollIntervalMs = clampPositive(config.pollIntervalMs, defaults.pollIntervalMs);
    config.recordCacheSize = clampPositive(config.recordCacheSize, defaults.recordCacheSize);
    config.progressEvery = clampPositive(config.progressEvery, defaults.progressEvery);
    if (config.workerThreads < 0) {
        config.workerThreads = defaults.workerThreads;
    }
    if (config.maxCorruptRetries < 0) {
        config.maxCorruptRetries = defaults.maxCorruptRetries;
    }
    return config;
}

nlohmann::json configToJson(const ScopeConfig &config)
{
    return nlohmann::json{
        {"pollIntervalMs", config.pollIntervalMs},
        {"interactivePreload", config.interactivePreload},
        {"workerThreads", config.workerThreads},
        {"recordCacheSize", config.recordCacheSize},
        {"progressEvery", config.progressEvery},
        {"maxCorruptRetries", config.maxCorruptRetries},
        {"traceLogging", config.traceLogging},
    };
}

void applyEnvironmentOverrides(ScopeConfig &config)
{
    bool ok = false;
    const int interval = qEnvironmentVariableIntValue("TFSCOPE_POLL_INTERVAL_MS", &ok);
    if (ok && interval > 0) {
        config.pollIntervalMs = interval;
    }
    const int workers = qEnvironmentVariableIntValue("TFSCOPE_WORKER_THREADS", &ok);
    if (ok && workers >= 0) {
        config.workerThreads = workers;
    }
    if (qEnvironmentVariableIntValue("TFSCOPE_TRACE") == 1) {
        config.traceLogging = true;
    }
}

ScopeConfig loadConfig(const QString &path)
{
    const QString configPath = path.isEmpty() ? defaultConfigPath() : path;

    ScopeConfig config;
    QFile file(configPath);
    if (file.exists()) {
        if (!file.open(QIODevice::ReadOnly)) {
            TFS_LOG_WARN(QStringLiteral("Config"),
                         QStringLiteral("loadConfig"),
                         QStringLiteral("config_open_failed"),
                         QStringLiteral("startup"),
                         QStringLiteral("file_open"),
                         logging::defaultWho(),
                         QString(),
                         nlohmann::json{{"path", configPath.toStdString()},
                                        {"error", file.errorString().toStdString()}});
        } else {
            const QByteArray raw = file.readAll();
            const auto parsed = nlohmann::json::parse(raw.constData(),
                                                      raw.constData() + raw.size(),
                                                      nullptr,
                                                      false);
            if (parsed.is_discarded()) {
                TFS_LOG_WARN(QStringLiteral("Config"),
                             QStringLiteral("loadConfig"),
                             QStringLiteral("config_parse_failed"),
                             QStringLiteral("startup"),
                             QStringLiteral("json_parse"),
                             logging::defaultWho(),
                             QString(),
                             nlohmann::json{{"path", configPath.toStdString()}});
            } else {
                config = configFromJson(parsed);
            }
        }
    }

    applyEnvironmentOverrides(config);

    TFS_LOG_DEBUG(QStringLiteral("Config"),
                  QStringLiteral("loadConfig"),
                  QStringLiteral("config_loaded"),
                  QStringLiteral("startup"),
                  QStringLiteral("json_file_and_env"),
                  logging::defaultWho(),
                  QString(),
                  configToJson(config));
    return config;
}

} // namespace tfscope
