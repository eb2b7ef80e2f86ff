#pragma once

#include <memory>
#include <optional>

#include <QByteArray>
#include <QCache>
#include <QMutex>
#include <QString>

#include <google/protobuf/message.h>

#include "ingest/record_reader.hpp"

namespace tfscope {

/**
 * FileTracker follows one physical record file across poll cycles.
 *
 * It remembers the committed read offset (end of the last record that made it
 * into the index) and hands out readers positioned there. Records are
 * re-read lazily by offset long after the poll that indexed them, so raw and
 * decoded records are kept in a small LRU cache. The cache methods may be
 * called from worker threads; everything else belongs to the poll thread.
 */
class FileTracker {
public:
    explicit FileTracker(QString path, int cacheCapacity = 32);

    const QString &path() const { return m_path; }

    // The file exists and has not been truncated below the committed offset.
    bool isValid() const;
    // There are bytes beyond the committed offset (or fewer than it).
    bool hasChanged() const;
    qint64 size() const;
    qint64 lastModifiedMsecs() const;

    qint64 committedOffset() const;
    void setCommittedOffset(qint64 offset);

    std::unique_ptr<RecordReader> newReader() const;
    std::unique_ptr<RecordReader> newReaderFrom(qint64 offset) const;

    // Payload of the record starting at offset, or nullopt when no complete
    // valid record is there.
    std::optional<QByteArray> readCachedRecordAt(qint64 offset);

    // Parses the record at offset as Message, caching the parsed message.
    template <typename Message>
    std::shared_ptr<const Message> readCachedAndDecodeAt(qint64 offset);

    void dropCaches();

private:
    std::shared_ptr<const google::protobuf::Message> cachedMessage(qint64 offset) const;
    void storeMessage(qint64 offset, std::shared_ptr<const google::protobuf::Message> message);

    QString m_path;
    qint64 m_committedOffset = 0;

    mutable QMutex m_cacheMutex;
    QCache<qint64, QByteArray> m_recordCache;
    QCache<qint64, std::shared_ptr<const google::protobuf::Message>> m_messageCache;
};

template <typename Message>
std::shared_ptr<const Message> FileTracker::readCachedAndDecodeAt(qint64 offset)
{
    if (auto cached = std::dynamic_pointer_cast<const Message>(cachedMessage(offset))) {
        return cached;
    }

    const std::optional<QByteArray> record = readCachedRecordAt(offset);
    if (!record.has_value()) {
        return nullptr;
    }

    auto message = std::make_shared<Message>();
    if (!message->ParseFromArray(record->constData(), static_cast<int>(record->size()))) {
        return nullptr;
    }
    storeMessage(offset, message);
    return message;
}

} // namespace tfscope
