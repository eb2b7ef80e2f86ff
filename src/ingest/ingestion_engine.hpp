#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <QMutex>
#include <QObject>
#include <QRecursiveMutex>
#include <QString>
#include <QStringList>
#include <QThread>
#include <QWaitCondition>

#include "common/config.hpp"
#include "common/models.hpp"
#include "ingest/entry.hpp"
#include "ingest/ingest_sink.hpp"
#include "ingest/source_loader.hpp"

namespace tfscope {

class SourceRegistry;
class WorkerPool;

/**
 * IngestionEngine tails a set of sources on a background thread and keeps a
 * merged tag/step index of everything decoded so far.
 *
 * Index and loader list are mutated only by the poll thread, always under
 * indexMutex(). Accessors copy a snapshot under the same lock. Requests from
 * other threads (addSource, reload, stop) are flags or queues picked up by
 * the poll thread between records.
 */
class IngestionEngine : public QObject, public IngestSink
{
    Q_OBJECT
public:
    using TagIndex = std::map<Tag, std::vector<std::shared_ptr<PerStepEntry>>>;
    using StepEntries = std::map<Tag, std::shared_ptr<PerStepEntry>>;

    IngestionEngine(const SourceRegistry &registry,
                    const ScopeConfig &config,
                    QObject *parent = nullptr);
    ~IngestionEngine() override;

    // Resolves the paths and starts the poll thread. Returns the paths no
    // source kind applies to.
    QStringList start(const QStringList &paths);
    // Hot-adds a top-level source. Initial-load mode is re-entered once the
    // poll thread adopts it. Returns false if the path is unresolved or the
    // loop has already stopped.
    bool addSource(const QString &path);
    // Clears the index and re-reads every source from offset 0.
    void reload();
    // Requests interruption and blocks until the poll thread and the worker
    // pool have drained.
    void stop();
    // Wakes the poll thread before the interval elapses.
    void wake();

    // One full pass over all sources. Returns false once no source is left.
    // Only call it directly while the poll thread is not running.
    bool pollCycle();

    std::vector<qint64> steps() const;
    std::vector<Tag> tags() const;
    std::vector<EntryType> tagTypes() const;
    TagIndex tagIndex() const;
    StepEntries entriesAtStep(qint64 step) const;
    std::shared_ptr<PerStepEntry> entryAt(const Tag &tag, qint64 step) const;
    std::shared_ptr<GlobalEntry> globalEntry(const Tag &tag) const;
    std::vector<Tag> globalTags() const;
    int sourceCount() const;

    bool isInitialLoad() const;
    EngineState state() const;
    QString fatalError() const;
    const ScopeConfig &config() const { return m_config; }

    // IngestSink
    bool isInterruptionRequested() const override;
    QRecursiveMutex &indexMutex() override { return m_indexMutex; }
    Tag tagToPath(const std::string &rawTag) override;
    void addEntry(const std::shared_ptr<Entry> &entry) override;
    void addScalar(const Tag &tag, qint64 step, double value, const LoaderId &loaderId) override;
    WorkerPool *workerPool() override { return m_pool; }
    void removeLoader(const LoaderId &loaderId) override;
    void nextIteration() override;

signals:
    void sourceDiscoveryCleared();
    void progress(int iteration, double ratio);
    void stepInserted(int position, int iteration);
    void tagDiscovered(const tfscope::Tag &tag, tfscope::EntryType type);
    void globalEntryDiscovered(const tfscope::Tag &tag, tfscope::EntryType type);
    void initialLoadComplete();
    void loopStopped();
    void sourceRemoved(const tfscope::LoaderId &loaderId);
    void engineFailed(const QString &message);

private:
    bool enqueueSource(const QString &path);
    void adoptPendingSources();
    bool hasPendingSources() const;
    void performReload();
    void finishInitialLoad();
    void clearIndex();
    void runLoop();
    void teardown();
    bool shouldAnnounce() const;
    void registerTag(const Tag &tag, EntryType type);
    void insertStep(qint64 step);

    const SourceRegistry &m_registry;
    const ScopeConfig m_config;
    const SourceOptions m_sourceOptions;
    WorkerPool *m_pool = nullptr;

    // Poll thread state.
    std::unique_ptr<QThread> m_thread;
    std::vector<Source> m_loaders;
    qint64 m_iteration = 0;
    std::atomic<bool> m_initialLoad{true};
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_reloadRequested{false};

    // Requests from other threads.
    mutable QMutex m_requestMutex;
    QStringList m_paths;
    std::vector<Source> m_pendingSources;
    int m_nextLoaderIndex = 0;

    // Loop wait and lifecycle.
    mutable QMutex m_waitMutex;
    QWaitCondition m_waitCondition;
    bool m_wakePending = false;
    EngineState m_state = EngineState::Idle;
    QString m_fatalError;

    // Index.
    mutable QRecursiveMutex m_indexMutex;
    TagIndex m_tagIndex;
    std::map<qint64, StepEntries> m_stepIndex;
    std::vector<qint64> m_steps;
    std::vector<std::pair<int, int>> m_pendingSteps;
    std::vector<Tag> m_tags;
    std::vector<EntryType> m_tagTypes;
    std::map<Tag, EntryType> m_knownTags;
    std::map<Tag, std::shared_ptr<GlobalEntry>> m_globalIndex;
    std::vector<Tag> m_globalTags;
    std::map<std::string, Tag> m_tagPathCache;
};

} // namespace tfscope
