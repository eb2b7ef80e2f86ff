#pragma once

#include <QObject>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tfscope {

class IngestionEngine;

struct TailOptions {
    enum class Format {
        Text,
        Json
    };

    Format format = Format::Text;
    // Finish once the initial load (and any export) is done.
    bool once = false;
    // Where the newest image of every image tag is written after the
    // initial load. Empty disables the export.
    QString exportDir;
};

// Prints the engine's notifications to stdout and drives the optional
// image export.
class TailConsole : public QObject
{
    Q_OBJECT
public:
    TailConsole(IngestionEngine &engine, TailOptions options, QObject *parent = nullptr);

    int exportedCount() const { return m_exported; }

signals:
    void finished(int exitCode);

private:
    void onTagDiscovered(const Tag &tag, EntryType type);
    void onGlobalEntryDiscovered(const Tag &tag, EntryType type);
    void onStepInserted(int position, int iteration);
    void onProgress(int iteration, double ratio);
    void onInitialLoadComplete();
    void onSourceRemoved(const LoaderId &loaderId);
    void onSourceDiscoveryCleared();
    void onLoopStopped();
    void onEngineFailed(const QString &message);

    void exportLatestImages();
    void exportDone();
    QString exportPath(const Tag &tag, const QString &suffix) const;
    void print(const nlohmann::json &event) const;

    IngestionEngine &m_engine;
    TailOptions m_options;
    int m_pendingExports = 0;
    int m_exported = 0;
    bool m_failed = false;
    bool m_finished = false;
};

} // namespace tfscope
