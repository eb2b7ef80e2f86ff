#pragma once

#include <QByteArray>
#include <QFile>
#include <QString>

namespace tfscope {

enum class ReadStatus {
    Ok,
    // Clean end of the file: no bytes after the last record.
    EndOfStream,
    // Trailing bytes that do not yet form a whole frame (writer mid-append).
    PartialRecord,
    // A complete header or frame whose checksum does not match.
    DataLoss,
    // The file could not be opened or read.
    IoError
};

const char *toReadStatusString(ReadStatus status);

/**
 * RecordReader walks the framed records of a record file from a byte offset.
 *
 * Frame layout:
 *   u64 length (LE) | u32 masked crc32c(length) | payload | u32 masked crc32c(payload)
 *
 * offset() is always the end of the last fully validated record, so a caller
 * can resume from it without losing or replaying anything. The file handle is
 * held only while the reader is alive.
 */
class RecordReader {
public:
    static constexpr qint64 kHeaderSize = 12;
    static constexpr qint64 kFooterSize = 4;

    RecordReader(const QString &path, qint64 startOffset);
    ~RecordReader();

    RecordReader(const RecordReader &) = delete;
    RecordReader &operator=(const RecordReader &) = delete;

    bool open();
    void close();
    bool isOpen() const;

    // Reads and validates one frame. On Ok, record() holds the payload and
    // offset() moves past the frame; on any other status nothing advances.
    ReadStatus next();

    const QByteArray &record() const { return m_record; }
    qint64 offset() const { return m_offset; }
    const QString &path() const { return m_path; }
    QString errorString() const { return m_error; }

    // After DataLoss on the payload checksum: end offset of the bad frame,
    // usable to skip it. -1 when the length header itself was corrupt.
    qint64 corruptFrameEnd() const { return m_corruptFrameEnd; }

private:
    bool readExact(qint64 position, qint64 size, QByteArray &out);
    ReadStatus readFailureStatus();

    QString m_path;
    QFile m_file;
    qint64 m_offset = 0;
    QByteArray m_record;
    QString m_error;
    qint64 m_corruptFrameEnd = -1;
};

} // namespace tfscope
