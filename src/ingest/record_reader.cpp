#include "ingest/record_reader.hpp"

#include <QtEndian>

#include "common/crc32c.hpp"

namespace tfscope {

const char *toReadStatusString(ReadStatus status)
{
    switch (status) {
    case ReadStatus::Ok:
        return "ok";
    case ReadStatus::EndOfStream:
        return "end_of_stream";
    case ReadStatus::PartialRecord:
        return "partial_record";
    case ReadStatus::DataLoss:
        return "data_loss";
    case ReadStatus::IoError:
        return "io_error";
    }
    return "io_error";
}

RecordReader::RecordReader(const QString &path, qint64 startOffset)
    : m_path(path)
    , m_file(path)
    , m_offset(startOffset)
{
}

RecordReader::~RecordReader()
{
    close();
}

bool RecordReader::open()
{
    if (m_file.isOpen()) {
        return true;
    }
    if (!m_file.open(QIODevice::ReadOnly)) {
        m_error = m_file.errorString();
        return false;
    }
    return true;
}

void RecordReader::close()
{
    if (m_file.isOpen()) {
        m_file.close();
    }
}

bool RecordReader::isOpen() const
{
    return m_file.isOpen();
}

bool RecordReader::readExact(qint64 position, qint64 size, QByteArray &out)
{
    if (!m_file.seek(position)) {
        m_error = m_file.errorString();
        return false;
    }
    out = m_file.read(size);
    return out.size() == size;
}

ReadStatus RecordReader::readFailureStatus()
{
    // A short read without a device error means the file shrank or is still
    // being written under us.
    if (m_file.error() != QFileDevice::NoError) {
        m_error = m_file.errorString();
        return ReadStatus::IoError;
    }
    return ReadStatus::PartialRecord;
}

ReadStatus RecordReader::next()
{
    m_record.clear();
    m_error.clear();
    m_corruptFrameEnd = -1;

    if (!m_file.isOpen() && !open()) {
        return ReadStatus::IoError;
    }

    // The writer may be appending concurrently; only trust bytes that are
    // already there.
    const qint64 available = m_file.size() - m_offset;
    if (available <= 0) {
        return ReadStatus::EndOfStream;
    }
    if (available < kHeaderSize) {
        return ReadStatus::PartialRecord;
    }

    QByteArray header;
    if (!readExact(m_offset, kHeaderSize, header)) {
        return readFailureStatus();
    }

    const auto *headerBytes = reinterpret_cast<const uchar *>(header.constData());
    const quint64 length = qFromLittleEndian<quint64>(headerBytes);
    const quint32 lengthCrc = qFromLittleEndian<quint32>(headerBytes + 8);
    if (maskedCrc32c(header.constData(), 8) != lengthCrc) {
        m_error = QStringLiteral("corrupted record length at offset %1").arg(m_offset);
        return ReadStatus::DataLoss;
    }

    if (length > static_cast<quint64>(available)) {
        return ReadStatus::PartialRecord;
    }
    const qint64 frameSize = kHeaderSize + static_cast<qint64>(length) + kFooterSize;
    if (frameSize > available) {
        return ReadStatus::PartialRecord;
    }

    QByteArray body;
    if (!readExact(m_offset + kHeaderSize, static_cast<qint64>(length) + kFooterSize, body)) {
        return readFailureStatus();
    }

    const auto *footer = reinterpret_cast<const uchar *>(body.constData()) + length;
    const quint32 dataCrc = qFromLittleEndian<quint32>(footer);
    if (maskedCrc32c(body.constData(), static_cast<size_t>(length)) != dataCrc) {
        m_error = QStringLiteral("corrupted record payload at offset %1").arg(m_offset);
        m_corruptFrameEnd = m_offset + frameSize;
        return ReadStatus::DataLoss;
    }

    body.truncate(static_cast<qsizetype>(length));
    m_record = std::move(body);
    m_offset += frameSize;
    return ReadStatus::Ok;
}

} // namespace tfscope
