#include "ingest/ingestion_engine.hpp"

#include <algorithm>

#include <QMutexLocker>
#include <QUuid>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "ingest/source_registry.hpp"
#include "ingest/worker_pool.hpp"

namespace tfscope {

namespace {

const QString kComponent = QStringLiteral("IngestionEngine");

void sortBySortKey(std::vector<Source> &sources)
{
    std::stable_sort(sources.begin(), sources.end(), [](const Source &lhs, const Source &rhs) {
        return sourceSortKey(lhs) < sourceSortKey(rhs);
    });
}

} // namespace

IngestionEngine::IngestionEngine(const SourceRegistry &registry,
                                 const ScopeConfig &config,
                                 QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_config(config)
    , m_sourceOptions(SourceOptions::fromConfig(config))
    , m_pool(new WorkerPool(config.workerThreads, this))
{
    qRegisterMetaType<tfscope::Tag>("tfscope::Tag");
    qRegisterMetaType<tfscope::EntryType>("tfscope::EntryType");
    qRegisterMetaType<tfscope::LoaderId>("tfscope::LoaderId");
}

IngestionEngine::~IngestionEngine()
{
    stop();

    std::vector<Source> loaders;
    {
        QMutexLocker locker(&m_indexMutex);
        clearIndex();
        loaders.swap(m_loaders);
    }
    for (auto &source : loaders) {
        closeSource(source);
    }
}

QStringList IngestionEngine::start(const QStringList &paths)
{
    {
        QMutexLocker locker(&m_waitMutex);
        if (m_state != EngineState::Idle) {
            TFS_LOG_WARN(kComponent,
                         QStringLiteral("start"),
                         QStringLiteral("start_ignored"),
                         QStringLiteral("engine_not_idle"),
                         QStringLiteral("none"),
                         logging::defaultWho(),
                         QString(),
                         nlohmann::json{{"state", toEngineStateString(m_state)}});
            return {};
        }
    }

    QStringList unresolved;
    for (const QString &path : paths) {
        if (!enqueueSource(path)) {
            unresolved.append(path);
        }
    }
    {
        QMutexLocker locker(&m_requestMutex);
        sortBySortKey(m_pendingSources);
    }

    {
        QMutexLocker locker(&m_waitMutex);
        m_state = EngineState::Running;
    }
    m_thread.reset(QThread::create([this]() { runLoop(); }));
    m_thread->setObjectName(QStringLiteral("tfscope-poll"));
    m_thread->start();

    TFS_LOG_INFO(kComponent,
                 QStringLiteral("start"),
                 QStringLiteral("engine_started"),
                 QStringLiteral("start_requested"),
                 QStringLiteral("poll_thread"),
                 logging::defaultWho(),
                 QString(),
                 nlohmann::json{{"sources", paths.size() - unresolved.size()},
                                {"unresolved", unresolved.size()},
                                {"interval_ms", m_config.pollIntervalMs},
                                {"worker_threads", m_pool->maxThreadCount()}});
    return unresolved;
}

// Initial-load mode is re-entered when the poll thread adopts the source, so a
// cycle already in flight cannot finish the load before the source is read.
bool IngestionEngine::addSource(const QString &path)
{
    if (state() == EngineState::Stopped) {
        TFS_LOG_WARN(kComponent,
                     QStringLiteral("addSource"),
                     QStringLiteral("add_ignored"),
                     QStringLiteral("engine_stopped"),
                     QStringLiteral("none"),
                     logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"path", path.toStdString()}});
        return false;
    }
    if (!enqueueSource(path)) {
        return false;
    }
    wake();
    return true;
}

bool IngestionEngine::enqueueSource(const QString &path)
{
    QMutexLocker locker(&m_requestMutex);
    const LoaderId id{m_nextLoaderIndex++};
    std::optional<Source> source = m_registry.resolve(path, id, m_sourceOptions);
    if (!source) {
        TFS_LOG_WARN(kComponent,
                     QStringLiteral("enqueueSource"),
                     QStringLiteral("source_unresolved"),
                     QStringLiteral("no_matching_source_kind"),
                     QStringLiteral("skip_path"),
                     logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"path", path.toStdString()}});
        return false;
    }

    TFS_LOG_INFO(kComponent,
                 QStringLiteral("enqueueSource"),
                 QStringLiteral("source_added"),
                 QStringLiteral("path_resolved"),
                 QStringLiteral("source_registry"),
                 logging::defaultWho(),
                 QString(),
                 nlohmann::json{{"source", describeSource(*source).toStdString()},
                                {"loader_id", loaderIdToString(id).toStdString()}});
    m_paths.append(path);
    m_pendingSources.push_back(std::move(*source));
    return true;
}

void IngestionEngine::reload()
{
    m_reloadRequested = true;
    wake();
}

void IngestionEngine::wake()
{
    QMutexLocker locker(&m_waitMutex);
    m_wakePending = true;
    m_waitCondition.wakeAll();
}

void IngestionEngine::stop()
{
    bool drainHere = false;
    {
        QMutexLocker locker(&m_waitMutex);
        if (m_state == EngineState::Running) {
            m_state = EngineState::StopRequested;
        } else if (m_state == EngineState::Idle) {
            drainHere = true;
        }
        m_stopRequested = true;
        m_wakePending = true;
        m_waitCondition.wakeAll();
    }

    if (m_thread) {
        m_thread->wait();
        m_thread.reset();
        return;
    }

    if (drainHere) {
        // Never started; pollCycle() may still have queued decodes.
        m_pool->stop();
        QMutexLocker locker(&m_waitMutex);
        m_state = EngineState::Stopped;
    }
}

bool IngestionEngine::isInterruptionRequested() const
{
    return m_stopRequested || m_reloadRequested;
}

void IngestionEngine::runLoop()
{
    TFS_LOG_INFO(kComponent,
                 QStringLiteral("runLoop"),
                 QStringLiteral("poll_loop_started"),
                 QStringLiteral("engine_started"),
                 QStringLiteral("poll_thread"),
                 logging::defaultWho(),
                 QString(),
                 nlohmann::json::object());

    try {
        while (!m_stopRequested) {
            if (!pollCycle()) {
                TFS_LOG_INFO(kComponent,
                             QStringLiteral("runLoop"),
                             QStringLiteral("no_sources_left"),
                             QStringLiteral("all_sources_removed"),
                             QStringLiteral("stop_loop"),
                             logging::defaultWho(),
                             QString(),
                             nlohmann::json::object());
                break;
            }

            QMutexLocker locker(&m_waitMutex);
            if (m_stopRequested) {
                break;
            }
            if (!m_wakePending) {
                m_waitCondition.wait(&m_waitMutex,
                                     static_cast<unsigned long>(m_config.pollIntervalMs));
            }
            m_wakePending = false;
        }
    } catch (const std::exception &error) {
        TFS_LOG_ERROR(kComponent,
                      QStringLiteral("runLoop"),
                      QStringLiteral("poll_loop_failed"),
                      QStringLiteral("unhandled_exception"),
                      QStringLiteral("teardown"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"error", error.what()}});
        QMutexLocker locker(&m_waitMutex);
        m_fatalError = QString::fromUtf8(error.what());
    }

    teardown();
}

void IngestionEngine::teardown()
{
    m_pool->stop();

    QString failure;
    {
        QMutexLocker locker(&m_waitMutex);
        m_state = EngineState::Stopped;
        failure = m_fatalError;
    }

    TFS_LOG_INFO(kComponent,
                 QStringLiteral("teardown"),
                 QStringLiteral("poll_loop_stopped"),
                 failure.isEmpty() ? QStringLiteral("stop_requested") : QStringLiteral("fatal_error"),
                 QStringLiteral("worker_pool_drained"),
                 logging::defaultWho(),
                 QString(),
                 nlohmann::json{{"iterations", m_iteration}});

    emit loopStopped();
    if (!failure.isEmpty()) {
        emit engineFailed(failure);
    }
}

bool IngestionEngine::pollCycle()
{
    if (m_reloadRequested.exchange(false)) {
        performReload();
    }
    adoptPendingSources();
    if (m_loaders.empty()) {
        return false;
    }

    logging::CorrelationScope corrScope(QUuid::createUuid().toString(QUuid::WithoutBraces));
    TFS_LOG_DEBUG(kComponent,
                  QStringLiteral("pollCycle"),
                  QStringLiteral("poll_cycle_started"),
                  QStringLiteral("timer"),
                  QStringLiteral("poll_sources"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"sources", m_loaders.size()},
                                 {"initial_load", m_initialLoad.load()}});

    std::vector<LoaderId> dropped;
    for (auto &source : m_loaders) {
        if (!pollSource(source, *this)) {
            dropped.push_back(sourceId(source));
        }
        if (isInterruptionRequested()) {
            return true;
        }
    }

    if (!dropped.empty()) {
        std::vector<Source> removed;
        {
            QMutexLocker locker(&m_indexMutex);
            for (const LoaderId &id : dropped) {
                const auto it = std::find_if(m_loaders.begin(), m_loaders.end(),
                                             [&id](const Source &source) {
                                                 return sourceId(source) == id;
                                             });
                if (it != m_loaders.end()) {
                    removed.push_back(std::move(*it));
                    m_loaders.erase(it);
                }
            }
        }
        for (auto &source : removed) {
            removeLoader(sourceId(source));
            closeSource(source);
        }
    }

    if (m_loaders.empty()) {
        return hasPendingSources();
    }

    if (m_initialLoad && !hasPendingSources()) {
        finishInitialLoad();
    }
    return true;
}

bool IngestionEngine::hasPendingSources() const
{
    QMutexLocker locker(&m_requestMutex);
    return !m_pendingSources.empty();
}

void IngestionEngine::adoptPendingSources()
{
    std::vector<Source> pending;
    {
        QMutexLocker locker(&m_requestMutex);
        pending.swap(m_pendingSources);
    }
    if (pending.empty()) {
        return;
    }

    {
        QMutexLocker locker(&m_indexMutex);
        for (auto &source : pending) {
            m_loaders.push_back(std::move(source));
        }
    }
    m_initialLoad = true;
}

void IngestionEngine::performReload()
{
    TFS_LOG_INFO(kComponent,
                 QStringLiteral("performReload"),
                 QStringLiteral("index_cleared"),
                 QStringLiteral("reload_requested"),
                 QStringLiteral("rescan_from_zero"),
                 logging::defaultWho(),
                 QString(),
                 nlohmann::json{{"sources", m_loaders.size()}});

    m_pool->cancelAll();

    std::vector<Source> previous;
    {
        QMutexLocker locker(&m_indexMutex);
        clearIndex();
        previous.swap(m_loaders);
    }
    for (auto &source : previous) {
        closeSource(source);
    }

    QStringList paths;
    {
        QMutexLocker locker(&m_requestMutex);
        for (auto &source : m_pendingSources) {
            closeSource(source);
        }
        m_pendingSources.clear();
        paths.swap(m_paths);
    }
    for (const QString &path : paths) {
        enqueueSource(path);
    }
    {
        QMutexLocker locker(&m_requestMutex);
        sortBySortKey(m_pendingSources);
    }

    m_iteration = 0;
    m_initialLoad = true;
    emit sourceDiscoveryCleared();
}

void IngestionEngine::clearIndex()
{
    for (auto &[tag, entries] : m_tagIndex) {
        for (auto &entry : entries) {
            entry->close();
        }
    }
    for (auto &[tag, entry] : m_globalIndex) {
        entry->close();
    }
    m_tagIndex.clear();
    m_stepIndex.clear();
    m_steps.clear();
    m_pendingSteps.clear();
    m_tags.clear();
    m_tagTypes.clear();
    m_knownTags.clear();
    m_globalIndex.clear();
    m_globalTags.clear();
    m_tagPathCache.clear();
}

bool IngestionEngine::shouldAnnounce() const
{
    return m_config.interactivePreload || !m_initialLoad;
}

Tag IngestionEngine::tagToPath(const std::string &rawTag)
{
    QMutexLocker locker(&m_indexMutex);
    const auto it = m_tagPathCache.find(rawTag);
    if (it != m_tagPathCache.end()) {
        return it->second;
    }
    Tag tag = parseTagPath(rawTag);
    m_tagPathCache.emplace(rawTag, tag);
    return tag;
}

// Tags of both kinds share one first-seen order; a tag never changes kind.
void IngestionEngine::registerTag(const Tag &tag, EntryType type)
{
    const auto [it, inserted] = m_knownTags.emplace(tag, type);
    if (!inserted) {
        if (it->second != type) {
            throw InvariantViolation("tag '" + tag.toString() + "' re-registered as "
                                     + toEntryTypeString(type) + " (was "
                                     + toEntryTypeString(it->second) + ")");
        }
        return;
    }

    m_tags.push_back(tag);
    m_tagTypes.push_back(type);
    if (shouldAnnounce()) {
        emit tagDiscovered(tag, type);
    }
}

void IngestionEngine::insertStep(qint64 step)
{
    const auto stepIt = std::lower_bound(m_steps.begin(), m_steps.end(), step);
    if (stepIt == m_steps.end() || *stepIt != step) {
        const int stepPosition = static_cast<int>(stepIt - m_steps.begin());
        m_steps.insert(stepIt, step);
        m_pendingSteps.emplace_back(stepPosition, static_cast<int>(m_iteration));
    }
}

void IngestionEngine::addEntry(const std::shared_ptr<Entry> &entry)
{
    QMutexLocker locker(&m_indexMutex);
    const Tag &tag = entry->tag();

    if (entry->isPerStep()) {
        const auto perStep = std::static_pointer_cast<PerStepEntry>(entry);
        registerTag(tag, entry->type());

        const qint64 step = perStep->step();
        m_stepIndex[step][tag] = perStep;

        auto &entries = m_tagIndex[tag];
        const auto position = std::upper_bound(
            entries.begin(), entries.end(), step,
            [](qint64 value, const std::shared_ptr<PerStepEntry> &existing) {
                return value < existing->step();
            });
        entries.insert(position, perStep);
        insertStep(step);
        return;
    }

    const auto global = std::dynamic_pointer_cast<GlobalEntry>(entry);
    if (!global) {
        throw InvariantViolation("entry for tag '" + tag.toString()
                                 + "' is neither per-step nor global");
    }
    if (m_globalIndex.count(tag) != 0) {
        throw InvariantViolation("second global entry registered for tag '" + tag.toString() + "'");
    }
    registerTag(tag, global->type());

    // Consumers connect to stepAdded from the engine's thread.
    global->moveToThread(thread());
    m_globalIndex.emplace(tag, global);
    m_globalTags.push_back(tag);
    if (shouldAnnounce()) {
        emit globalEntryDiscovered(tag, global->type());
    }
}

void IngestionEngine::addScalar(const Tag &tag, qint64 step, double value, const LoaderId &loaderId)
{
    QMutexLocker locker(&m_indexMutex);
    std::shared_ptr<ScalarEntry> scalar;
    const auto it = m_globalIndex.find(tag);
    if (it == m_globalIndex.end()) {
        scalar = std::make_shared<ScalarEntry>(tag);
        addEntry(scalar);
    } else {
        scalar = std::dynamic_pointer_cast<ScalarEntry>(it->second);
        if (!scalar) {
            throw InvariantViolation("global entry for tag '" + tag.toString()
                                     + "' is not a scalar series");
        }
    }
    scalar->addData(step, value, loaderId);
    insertStep(step);
}

std::shared_ptr<GlobalEntry> IngestionEngine::globalEntry(const Tag &tag) const
{
    QMutexLocker locker(&m_indexMutex);
    const auto it = m_globalIndex.find(tag);
    return it == m_globalIndex.end() ? nullptr : it->second;
}

void IngestionEngine::removeLoader(const LoaderId &loaderId)
{
    TFS_LOG_INFO(kComponent,
                 QStringLiteral("removeLoader"),
                 QStringLiteral("source_removed"),
                 QStringLiteral("source_gone"),
                 QStringLiteral("notify_consumers"),
                 logging::defaultWho(),
                 QString(),
                 nlohmann::json{{"loader_id", loaderIdToString(loaderId).toStdString()}});
    emit sourceRemoved(loaderId);
}

void IngestionEngine::nextIteration()
{
    qint64 loaded = 0;
    qint64 total = 0;
    for (const auto &source : m_loaders) {
        loaded += sourceBytesLoaded(source);
        total += sourceBytesTotal(source);
    }
    const double ratio = total > 0 ? static_cast<double>(loaded) / static_cast<double>(total) : 1.0;

    std::vector<std::pair<int, int>> pendingSteps;
    {
        QMutexLocker locker(&m_indexMutex);
        pendingSteps.swap(m_pendingSteps);
    }

    const int iteration = static_cast<int>(m_iteration);
    if (m_initialLoad) {
        if (m_iteration % std::max(1, m_config.progressEvery) == 0) {
            emit progress(iteration, ratio);
        }
    } else {
        emit progress(iteration, 1.0);
    }
    ++m_iteration;

    if (shouldAnnounce()) {
        for (const auto &[position, stepIteration] : pendingSteps) {
            emit stepInserted(position, stepIteration);
        }
    }
}

void IngestionEngine::finishInitialLoad()
{
    if (!m_config.interactivePreload) {
        std::vector<Tag> tags;
        std::vector<EntryType> types;
        std::vector<std::pair<Tag, EntryType>> globals;
        {
            QMutexLocker locker(&m_indexMutex);
            tags = m_tags;
            types = m_tagTypes;
            for (const Tag &tag : m_globalTags) {
                globals.emplace_back(tag, m_globalIndex.at(tag)->type());
            }
        }
        for (size_t i = 0; i < tags.size(); ++i) {
            emit tagDiscovered(tags[i], types[i]);
        }
        for (const auto &[tag, type] : globals) {
            emit globalEntryDiscovered(tag, type);
        }
    }

    emit progress(static_cast<int>(m_iteration), 1.0);
    m_initialLoad = false;

    TFS_LOG_INFO(kComponent,
                 QStringLiteral("finishInitialLoad"),
                 QStringLiteral("initial_load_complete"),
                 QStringLiteral("first_full_cycle"),
                 QStringLiteral("announce_index"),
                 logging::defaultWho(),
                 QString(),
                 nlohmann::json{{"iterations", m_iteration},
                                {"tags", tags().size()},
                                {"steps", steps().size()}});
    emit initialLoadComplete();
}

std::vector<qint64> IngestionEngine::steps() const
{
    QMutexLocker locker(&m_indexMutex);
    return m_steps;
}

std::vector<Tag> IngestionEngine::tags() const
{
    QMutexLocker locker(&m_indexMutex);
    return m_tags;
}

std::vector<EntryType> IngestionEngine::tagTypes() const
{
    QMutexLocker locker(&m_indexMutex);
    return m_tagTypes;
}

IngestionEngine::TagIndex IngestionEngine::tagIndex() const
{
    QMutexLocker locker(&m_indexMutex);
    return m_tagIndex;
}

IngestionEngine::StepEntries IngestionEngine::entriesAtStep(qint64 step) const
{
    QMutexLocker locker(&m_indexMutex);
    const auto it = m_stepIndex.find(step);
    return it == m_stepIndex.end() ? StepEntries{} : it->second;
}

std::shared_ptr<PerStepEntry> IngestionEngine::entryAt(const Tag &tag, qint64 step) const
{
    QMutexLocker locker(&m_indexMutex);
    const auto stepIt = m_stepIndex.find(step);
    if (stepIt == m_stepIndex.end()) {
        return nullptr;
    }
    const auto it = stepIt->second.find(tag);
    return it == stepIt->second.end() ? nullptr : it->second;
}

std::vector<Tag> IngestionEngine::globalTags() const
{
    QMutexLocker locker(&m_indexMutex);
    return m_globalTags;
}

int IngestionEngine::sourceCount() const
{
    size_t count = 0;
    {
        QMutexLocker locker(&m_indexMutex);
        count = m_loaders.size();
    }
    QMutexLocker locker(&m_requestMutex);
    return static_cast<int>(count + m_pendingSources.size());
}

bool IngestionEngine::isInitialLoad() const
{
    return m_initialLoad || hasPendingSources();
}

EngineState IngestionEngine::state() const
{
    QMutexLocker locker(&m_waitMutex);
    return m_state;
}

QString IngestionEngine::fatalError() const
{
    QMutexLocker locker(&m_waitMutex);
    return m_fatalError;
}

} // namespace tfscope
