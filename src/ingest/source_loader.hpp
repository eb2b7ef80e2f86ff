#pragma once

#include <memory>
#include <variant>
#include <vector>

#include <QByteArray>
#include <QString>

#include "common/config.hpp"
#include "common/models.hpp"
#include "ingest/file_tracker.hpp"
#include "ingest/ingest_sink.hpp"

namespace tfscope {

inline constexpr char kEventFileMarker[] = ".tfevents";
inline constexpr char kRecordFileMarker[] = ".tfrecords";

struct SourceOptions {
    int recordCacheSize = 32;
    // Consecutive cycles a corrupt frame is retried before it is skipped;
    // 0 retries forever.
    int maxCorruptRetries = 3;

    static SourceOptions fromConfig(const ScopeConfig &config);
};

// Bookkeeping for a frame that failed its checksum.
struct CorruptFrameState {
    qint64 offset = -1;
    int failures = 0;
};

/**
 * Tails one event log. Every poll reads the frames appended since the last
 * committed offset; image values become per-step entries, scalar values
 * observations on the tag's global ScalarEntry.
 */
class EventFileSource {
public:
    EventFileSource(QString path, LoaderId id, const SourceOptions &options);

    static bool appliesTo(const QString &path);

    const LoaderId &id() const { return m_id; }
    const QString &path() const { return m_path; }
    const std::shared_ptr<FileTracker> &file() const { return m_file; }

    qint64 bytesLoaded() const;
    qint64 bytesTotal() const;
    qint64 sortKey() const;

    // False once the file is gone or was truncated below the committed offset.
    bool poll(IngestSink &sink);
    void close();

private:
    void ingestRecord(const QByteArray &record, qint64 offset, IngestSink &sink);

    QString m_path;
    LoaderId m_id;
    SourceOptions m_options;
    std::shared_ptr<FileTracker> m_file;
    CorruptFrameState m_corrupt;
};

/**
 * A directory of event logs. New files are picked up on every poll and get
 * nested loader ids that are never reused.
 */
class EventDirectorySource {
public:
    EventDirectorySource(QString path, LoaderId id, const SourceOptions &options);

    static bool appliesTo(const QString &path);

    const LoaderId &id() const { return m_id; }
    const QString &path() const { return m_path; }
    const std::vector<EventFileSource> &children() const { return m_children; }

    qint64 bytesLoaded() const;
    qint64 bytesTotal() const;
    qint64 sortKey() const;

    // Reports removed children through the sink. False when the directory is
    // gone or has no children left.
    bool poll(IngestSink &sink);
    void close();

private:
    void discoverChildren();
    LoaderId nextChildId();

    QString m_path;
    LoaderId m_id;
    SourceOptions m_options;
    int m_nextSubId = 0;
    std::vector<EventFileSource> m_children;
};

/**
 * Tails one record file of examples. The step of each entry is the ordinal
 * of its record within the file.
 */
class RecordFileSource {
public:
    RecordFileSource(QString path, LoaderId id, const SourceOptions &options);

    static bool appliesTo(const QString &path);

    const LoaderId &id() const { return m_id; }
    const QString &path() const { return m_path; }
    const std::shared_ptr<FileTracker> &file() const { return m_file; }

    qint64 bytesLoaded() const;
    qint64 bytesTotal() const;
    qint64 sortKey() const;

    bool poll(IngestSink &sink);
    void close();

private:
    void ingestRecord(const QByteArray &record, qint64 offset, IngestSink &sink);

    QString m_path;
    LoaderId m_id;
    SourceOptions m_options;
    std::shared_ptr<FileTracker> m_file;
    CorruptFrameState m_corrupt;
    qint64 m_iteration = 0;
};

using Source = std::variant<EventFileSource, EventDirectorySource, RecordFileSource>;

bool pollSource(Source &source, IngestSink &sink);
void closeSource(Source &source);
const LoaderId &sourceId(const Source &source);
qint64 sourceBytesLoaded(const Source &source);
qint64 sourceBytesTotal(const Source &source);
qint64 sourceSortKey(const Source &source);
QString describeSource(const Source &source);

} // namespace tfscope
