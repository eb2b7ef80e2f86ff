#include "ingest/source_loader.hpp"

#include <algorithm>
#include <functional>
#include <type_traits>

#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "formats/event_file.hpp"
#include "formats/example_record.hpp"
#include "ingest/entry.hpp"

namespace tfscope {

namespace {

using RecordHandler = std::function<void(const QByteArray &record, qint64 offset)>;

nlohmann::json sourceContext(const QString &path, const LoaderId &id)
{
    return nlohmann::json{{"path", path.toStdString()},
                          {"loader_id", loaderIdToString(id).toStdString()}};
}

// Decides what to do about a frame that failed its checksum at offset.
// Returns true when the frame was skipped and scanning may continue.
bool handleCorruptFrame(const QString &component,
                        FileTracker &file,
                        CorruptFrameState &corrupt,
                        const SourceOptions &options,
                        const LoaderId &id,
                        qint64 offset,
                        const RecordReader &reader)
{
    if (corrupt.offset != offset) {
        corrupt.offset = offset;
        corrupt.failures = 0;
    }
    ++corrupt.failures;

    nlohmann::json context = sourceContext(file.path(), id);
    context["offset"] = offset;
    context["failures"] = corrupt.failures;
    context["error"] = reader.errorString().toStdString();

    const bool exhausted = options.maxCorruptRetries > 0
        && corrupt.failures >= options.maxCorruptRetries;
    if (!exhausted) {
        TFS_LOG_WARN(component,
                     QStringLiteral("poll"),
                     QStringLiteral("corrupt_frame"),
                     QStringLiteral("checksum_mismatch"),
                     QStringLiteral("retry_next_cycle"),
                     logging::defaultWho(),
                     QString(),
                     context);
        return false;
    }

    if (reader.corruptFrameEnd() <= offset) {
        // The length itself is unreadable, so there is no frame end to skip to.
        if (corrupt.failures == options.maxCorruptRetries) {
            TFS_LOG_ERROR(component,
                          QStringLiteral("poll"),
                          QStringLiteral("source_stalled"),
                          QStringLiteral("corrupt_length_header"),
                          QStringLiteral("keep_offset"),
                          logging::defaultWho(),
                          QString(),
                          context);
        }
        return false;
    }

    context["skipped_to"] = reader.corruptFrameEnd();
    TFS_LOG_ERROR(component,
                  QStringLiteral("poll"),
                  QStringLiteral("corrupt_frame_skipped"),
                  QStringLiteral("retries_exhausted"),
                  QStringLiteral("advance_past_frame"),
                  logging::defaultWho(),
                  QString(),
                  context);
    file.setCommittedOffset(reader.corruptFrameEnd());
    corrupt = CorruptFrameState{};
    return true;
}

// One pass over the frames after the committed offset. Each record is
// handed to the handler under the index lock and committed right after, so
// an interruption between records loses nothing.
void scanRecords(const QString &component,
                 FileTracker &file,
                 CorruptFrameState &corrupt,
                 const SourceOptions &options,
                 const LoaderId &id,
                 IngestSink &sink,
                 const RecordHandler &handler)
{
    std::unique_ptr<RecordReader> reader = file.newReader();
    while (!sink.isInterruptionRequested()) {
        const qint64 start = reader->offset();
        const ReadStatus status = reader->next();
        switch (status) {
        case ReadStatus::Ok:
            corrupt = CorruptFrameState{};
            {
                QMutexLocker locker(&sink.indexMutex());
                handler(reader->record(), start);
            }
            file.setCommittedOffset(reader->offset());
            sink.nextIteration();
            break;
        case ReadStatus::EndOfStream:
        case ReadStatus::PartialRecord:
            return;
        case ReadStatus::IoError:
            throw IngestError(reader->errorString().toStdString());
        case ReadStatus::DataLoss:
            if (!handleCorruptFrame(component, file, corrupt, options, id, start, *reader)) {
                return;
            }
            reader = file.newReader();
            break;
        }
    }
}

// Shared poll body of the single-file sources.
bool pollFile(const QString &component,
              const std::shared_ptr<FileTracker> &file,
              CorruptFrameState &corrupt,
              const SourceOptions &options,
              const LoaderId &id,
              IngestSink &sink,
              const RecordHandler &handler)
{
    if (!file) {
        return false;
    }
    if (!file->isValid()) {
        nlohmann::json context = sourceContext(file->path(), id);
        context["committed"] = file->committedOffset();
        TFS_LOG_INFO(component,
                     QStringLiteral("poll"),
                     QStringLiteral("source_gone"),
                     QStringLiteral("deleted_or_truncated"),
                     QStringLiteral("drop_source"),
                     logging::defaultWho(),
                     QString(),
                     context);
        return false;
    }
    if (!file->hasChanged()) {
        return true;
    }

    try {
        scanRecords(component, *file, corrupt, options, id, sink, handler);
    } catch (const IngestError &error) {
        nlohmann::json context = sourceContext(file->path(), id);
        context["error"] = error.what();
        TFS_LOG_WARN(component,
                     QStringLiteral("poll"),
                     QStringLiteral("read_failed"),
                     QStringLiteral("transient_io"),
                     QStringLiteral("retry_next_cycle"),
                     logging::defaultWho(),
                     QString(),
                     context);
    } catch (const std::exception &error) {
        nlohmann::json context = sourceContext(file->path(), id);
        context["error"] = error.what();
        TFS_LOG_ERROR(component,
                      QStringLiteral("poll"),
                      QStringLiteral("poll_failed"),
                      QStringLiteral("unexpected_exception"),
                      QStringLiteral("propagate"),
                      logging::defaultWho(),
                      QString(),
                      context);
        throw;
    }
    return true;
}

void logMalformedPayload(const QString &component, const QString &path, const LoaderId &id,
                         qint64 offset)
{
    nlohmann::json context = sourceContext(path, id);
    context["offset"] = offset;
    TFS_LOG_WARN(component,
                 QStringLiteral("ingestRecord"),
                 QStringLiteral("malformed_payload"),
                 QStringLiteral("protobuf_parse_failed"),
                 QStringLiteral("skip_record"),
                 logging::defaultWho(),
                 QString(),
                 context);
}

QStringList eventFileNames(const QString &dirPath)
{
    const QDir dir(dirPath);
    return dir.entryList(QStringList{QStringLiteral("*%1*").arg(QLatin1String(kEventFileMarker))},
                         QDir::Files,
                         QDir::Name);
}

} // namespace

SourceOptions SourceOptions::fromConfig(const ScopeConfig &config)
{
    SourceOptions options;
    options.recordCacheSize = config.recordCacheSize;
    options.maxCorruptRetries = config.maxCorruptRetries;
    return options;
}

// EventFileSource

EventFileSource::EventFileSource(QString path, LoaderId id, const SourceOptions &options)
    : m_path(std::move(path))
    , m_id(std::move(id))
    , m_options(options)
    , m_file(std::make_shared<FileTracker>(m_path, options.recordCacheSize))
{
}

bool EventFileSource::appliesTo(const QString &path)
{
    return path.contains(QLatin1String(kEventFileMarker)) && !QFileInfo(path).isDir();
}

qint64 EventFileSource::bytesLoaded() const
{
    return m_file ? m_file->committedOffset() : 0;
}

qint64 EventFileSource::bytesTotal() const
{
    return m_file ? m_file->size() : 0;
}

qint64 EventFileSource::sortKey() const
{
    return m_file ? m_file->lastModifiedMsecs() : 0;
}

bool EventFileSource::poll(IngestSink &sink)
{
    return pollFile(QStringLiteral("EventFileSource"), m_file, m_corrupt, m_options, m_id, sink,
                    [this, &sink](const QByteArray &record, qint64 offset) {
                        ingestRecord(record, offset, sink);
                    });
}

void EventFileSource::close()
{
    if (m_file) {
        m_file->dropCaches();
        m_file.reset();
    }
}

void EventFileSource::ingestRecord(const QByteArray &record, qint64 offset, IngestSink &sink)
{
    const std::optional<DecodedEvent> event = decodeEventRecord(record);
    if (!event) {
        logMalformedPayload(QStringLiteral("EventFileSource"), m_path, m_id, offset);
        return;
    }

    for (const DecodedValue &value : event->values) {
        const Tag tag = sink.tagToPath(value.tag);
        if (value.type == EntryType::Image) {
            sink.addEntry(std::make_shared<EventImageEntry>(
                m_file, offset, value.valueIndex, tag, event->step, m_id, sink.workerPool()));
        } else {
            sink.addScalar(tag, event->step, value.scalar, m_id);
        }
    }
}

// EventDirectorySource

EventDirectorySource::EventDirectorySource(QString path, LoaderId id, const SourceOptions &options)
    : m_path(std::move(path))
    , m_id(std::move(id))
    , m_options(options)
{
    discoverChildren();
}

bool EventDirectorySource::appliesTo(const QString &path)
{
    return QFileInfo(path).isDir() && !eventFileNames(path).isEmpty();
}

qint64 EventDirectorySource::bytesLoaded() const
{
    qint64 total = 0;
    for (const auto &child : m_children) {
        total += child.bytesLoaded();
    }
    return total;
}

qint64 EventDirectorySource::bytesTotal() const
{
    qint64 total = 0;
    for (const auto &child : m_children) {
        total += child.bytesTotal();
    }
    return total;
}

qint64 EventDirectorySource::sortKey() const
{
    qint64 key = 0;
    for (const auto &child : m_children) {
        key = std::max(key, child.sortKey());
    }
    return key;
}

LoaderId EventDirectorySource::nextChildId()
{
    LoaderId id = m_id;
    id.push_back(m_nextSubId++);
    return id;
}

void EventDirectorySource::discoverChildren()
{
    const QDir dir(m_path);
    for (const QString &name : eventFileNames(m_path)) {
        const QString filePath = dir.filePath(name);
        const bool tracked = std::any_of(m_children.begin(), m_children.end(),
                                         [&filePath](const EventFileSource &child) {
                                             return child.path() == filePath;
                                         });
        if (tracked) {
            continue;
        }

        m_children.emplace_back(filePath, nextChildId(), m_options);
        TFS_LOG_INFO(QStringLiteral("EventDirectorySource"),
                     QStringLiteral("discoverChildren"),
                     QStringLiteral("source_discovered"),
                     QStringLiteral("new_event_file"),
                     QStringLiteral("track_file"),
                     logging::defaultWho(),
                     QString(),
                     sourceContext(filePath, m_children.back().id()));
    }
}

bool EventDirectorySource::poll(IngestSink &sink)
{
    if (!QFileInfo(m_path).isDir()) {
        TFS_LOG_INFO(QStringLiteral("EventDirectorySource"),
                     QStringLiteral("poll"),
                     QStringLiteral("source_gone"),
                     QStringLiteral("directory_deleted"),
                     QStringLiteral("drop_children"),
                     logging::defaultWho(),
                     QString(),
                     sourceContext(m_path, m_id));
        for (auto &child : m_children) {
            sink.removeLoader(child.id());
            child.close();
        }
        m_children.clear();
        return false;
    }

    discoverChildren();
    std::stable_sort(m_children.begin(), m_children.end(),
                     [](const EventFileSource &lhs, const EventFileSource &rhs) {
                         return lhs.sortKey() < rhs.sortKey();
                     });

    std::vector<LoaderId> removed;
    for (auto &child : m_children) {
        if (!child.poll(sink)) {
            removed.push_back(child.id());
        }
        if (sink.isInterruptionRequested()) {
            return true;
        }
    }

    for (const LoaderId &id : removed) {
        const auto it = std::find_if(m_children.begin(), m_children.end(),
                                     [&id](const EventFileSource &child) {
                                         return child.id() == id;
                                     });
        if (it == m_children.end()) {
            continue;
        }
        it->close();
        m_children.erase(it);
        sink.removeLoader(id);
    }
    return !m_children.empty();
}

void EventDirectorySource::close()
{
    for (auto &child : m_children) {
        child.close();
    }
    m_children.clear();
}

// RecordFileSource

RecordFileSource::RecordFileSource(QString path, LoaderId id, const SourceOptions &options)
    : m_path(std::move(path))
    , m_id(std::move(id))
    , m_options(options)
    , m_file(std::make_shared<FileTracker>(m_path, options.recordCacheSize))
{
}

bool RecordFileSource::appliesTo(const QString &path)
{
    return path.contains(QLatin1String(kRecordFileMarker)) && !QFileInfo(path).isDir();
}

qint64 RecordFileSource::bytesLoaded() const
{
    return m_file ? m_file->committedOffset() : 0;
}

qint64 RecordFileSource::bytesTotal() const
{
    return m_file ? m_file->size() : 0;
}

qint64 RecordFileSource::sortKey() const
{
    return m_file ? m_file->lastModifiedMsecs() : 0;
}

bool RecordFileSource::poll(IngestSink &sink)
{
    return pollFile(QStringLiteral("RecordFileSource"), m_file, m_corrupt, m_options, m_id, sink,
                    [this, &sink](const QByteArray &record, qint64 offset) {
                        ingestRecord(record, offset, sink);
                    });
}

void RecordFileSource::close()
{
    if (m_file) {
        m_file->dropCaches();
        m_file.reset();
    }
}

void RecordFileSource::ingestRecord(const QByteArray &record, qint64 offset, IngestSink &sink)
{
    const qint64 step = m_iteration++;
    const std::optional<DecodedExample> example = decodeExampleRecord(record);
    if (!example) {
        logMalformedPayload(QStringLiteral("RecordFileSource"), m_path, m_id, offset);
        return;
    }

    if (example->hasImage) {
        sink.addEntry(std::make_shared<RecordImageEntry>(
            m_file, offset, step, example->name, example->label, m_id, sink.workerPool()));
    }
    for (int mask = 0; mask < example->maskCount; ++mask) {
        sink.addEntry(std::make_shared<RecordMaskEntry>(
            m_file, offset, step, mask, example->name, m_id, sink.workerPool()));
    }
}

// Variant dispatch

bool pollSource(Source &source, IngestSink &sink)
{
    return std::visit([&sink](auto &loader) { return loader.poll(sink); }, source);
}

void closeSource(Source &source)
{
    std::visit([](auto &loader) { loader.close(); }, source);
}

const LoaderId &sourceId(const Source &source)
{
    return std::visit([](const auto &loader) -> const LoaderId & { return loader.id(); }, source);
}

qint64 sourceBytesLoaded(const Source &source)
{
    return std::visit([](const auto &loader) { return loader.bytesLoaded(); }, source);
}

qint64 sourceBytesTotal(const Source &source)
{
    return std::visit([](const auto &loader) { return loader.bytesTotal(); }, source);
}

qint64 sourceSortKey(const Source &source)
{
    return std::visit([](const auto &loader) { return loader.sortKey(); }, source);
}

QString describeSource(const Source &source)
{
    return std::visit(
        [](const auto &loader) {
            using Loader = std::decay_t<decltype(loader)>;
            QString kind;
            if constexpr (std::is_same_v<Loader, EventFileSource>) {
                kind = QStringLiteral("EventFileSource");
            } else if constexpr (std::is_same_v<Loader, EventDirectorySource>) {
                kind = QStringLiteral("EventDirectorySource");
            } else {
                kind = QStringLiteral("RecordFileSource");
            }
            return QStringLiteral("%1(%2)").arg(kind, loader.path());
        },
        source);
}

} // namespace tfscope
