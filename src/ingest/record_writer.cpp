#include "ingest/record_writer.hpp"

#include <QtEndian>

#include <algorithm>

#include "common/crc32c.hpp"

namespace tfscope {

RecordWriter::RecordWriter(const QString &path)
    : m_file(path)
{
}

RecordWriter::~RecordWriter()
{
    close();
}

bool RecordWriter::open(bool truncate)
{
    const QIODevice::OpenMode mode = truncate
        ? (QIODevice::WriteOnly | QIODevice::Truncate)
        : (QIODevice::WriteOnly | QIODevice::Append);
    return m_file.open(mode);
}

void RecordWriter::close()
{
    if (m_file.isOpen()) {
        m_file.flush();
        m_file.close();
    }
}

QByteArray RecordWriter::encodeFrame(const QByteArray &record)
{
    QByteArray frame;
    frame.resize(8 + 4 + record.size() + 4);
    auto *out = reinterpret_cast<uchar *>(frame.data());

    qToLittleEndian<quint64>(static_cast<quint64>(record.size()), out);
    qToLittleEndian<quint32>(maskedCrc32c(frame.constData(), 8), out + 8);
    std::copy(record.cbegin(), record.cend(), frame.begin() + 12);
    qToLittleEndian<quint32>(maskedCrc32c(record.constData(), static_cast<size_t>(record.size())),
                             out + 12 + record.size());
    return frame;
}

bool RecordWriter::write(const QByteArray &record)
{
    const QByteArray frame = encodeFrame(record);
    return m_file.write(frame) == frame.size();
}

bool RecordWriter::flush()
{
    return m_file.flush();
}

} // namespace tfscope
