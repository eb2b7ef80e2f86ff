#include "ingest/file_tracker.hpp"

#include <QFileInfo>
#include <QMutexLocker>

#include "common/logging.hpp"

namespace tfscope {

FileTracker::FileTracker(QString path, int cacheCapacity)
    : m_path(std::move(path))
    , m_recordCache(cacheCapacity)
    , m_messageCache(cacheCapacity)
{
}

bool FileTracker::isValid() const
{
    const QFileInfo info(m_path);
    return info.exists() && m_committedOffset <= info.size();
}

bool FileTracker::hasChanged() const
{
    return m_committedOffset != size();
}

qint64 FileTracker::size() const
{
    const QFileInfo info(m_path);
    return info.exists() ? info.size() : 0;
}

qint64 FileTracker::lastModifiedMsecs() const
{
    const QFileInfo info(m_path);
    if (!info.exists()) {
        return 0;
    }
    return info.lastModified().toMSecsSinceEpoch();
}

qint64 FileTracker::committedOffset() const
{
    return m_committedOffset;
}

void FileTracker::setCommittedOffset(qint64 offset)
{
    if (offset < m_committedOffset) {
        // The committed offset only moves forward while the file is the same
        // file; going back means it was replaced, so cached records are stale.
        TFS_LOG_ERROR(QStringLiteral("FileTracker"),
                      QStringLiteral("setCommittedOffset"),
                      QStringLiteral("offset_regressed"),
                      QStringLiteral("file_replaced"),
                      QStringLiteral("drop_record_cache"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"path", m_path.toStdString()},
                                     {"committed", m_committedOffset},
                                     {"requested", offset}});
        dropCaches();
    }
    m_committedOffset = offset;
}

std::unique_ptr<RecordReader> FileTracker::newReader() const
{
    return newReaderFrom(m_committedOffset);
}

std::unique_ptr<RecordReader> FileTracker::newReaderFrom(qint64 offset) const
{
    return std::make_unique<RecordReader>(m_path, offset);
}

std::optional<QByteArray> FileTracker::readCachedRecordAt(qint64 offset)
{
    {
        QMutexLocker locker(&m_cacheMutex);
        if (const QByteArray *cached = m_recordCache.object(offset)) {
            return *cached;
        }
    }

    RecordReader reader(m_path, offset);
    const ReadStatus status = reader.next();
    if (status != ReadStatus::Ok) {
        TFS_LOG_WARN(QStringLiteral("FileTracker"),
                     QStringLiteral("readCachedRecordAt"),
                     QStringLiteral("record_reread_failed"),
                     QStringLiteral("lazy_decode"),
                     QStringLiteral("record_reader"),
                     logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"path", m_path.toStdString()},
                                    {"offset", offset},
                                    {"status", toReadStatusString(status)},
                                    {"error", reader.errorString().toStdString()}});
        return std::nullopt;
    }

    QByteArray record = reader.record();
    QMutexLocker locker(&m_cacheMutex);
    m_recordCache.insert(offset, new QByteArray(record));
    return record;
}

std::shared_ptr<const google::protobuf::Message> FileTracker::cachedMessage(qint64 offset) const
{
    QMutexLocker locker(&m_cacheMutex);
    if (const auto *cached = m_messageCache.object(offset)) {
        return *cached;
    }
    return nullptr;
}

void FileTracker::storeMessage(qint64 offset,
                               std::shared_ptr<const google::protobuf::Message> message)
{
    QMutexLocker locker(&m_cacheMutex);
    m_messageCache.insert(offset,
                          new std::shared_ptr<const google::protobuf::Message>(std::move(message)));
}

void FileTracker::dropCaches()
{
    QMutexLocker locker(&m_cacheMutex);
    m_recordCache.clear();
    m_messageCache.clear();
}

} // namespace tfscope
