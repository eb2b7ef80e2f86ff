#pragma once

#include <QByteArray>
#include <QFile>
#include <QString>

namespace tfscope {

// Appends framed records readable by RecordReader.
class RecordWriter {
public:
    explicit RecordWriter(const QString &path);
    ~RecordWriter();

    bool open(bool truncate = false);
    void close();

    bool write(const QByteArray &record);
    bool flush();

    QString errorString() const { return m_file.errorString(); }

    static QByteArray encodeFrame(const QByteArray &record);

private:
    QFile m_file;
};

} // namespace tfscope
