#pragma once

#include <optional>

#include <QByteArray>
#include <QString>

#include "ingest/entry.hpp"

namespace tfscope {

namespace proto {
class Example;
}

// What a record-file example contributes to the index.
struct DecodedExample {
    std::optional<QString> name;
    std::optional<qint64> label;
    qint64 height = 0;
    qint64 width = 0;
    bool hasImage = false;
    int maskCount = 0;
};

// Decode capability for record files. nullopt when the payload does not parse.
// Images and masks are only reported when both height and width are present.
std::optional<DecodedExample> decodeExampleRecord(const QByteArray &record);

// Channels in a packed mask blob: bytes / (w*h) when raw, decoded strip
// height / h when compressed.
int countMasks(const proto::Example &example);

class RecordImageEntry : public ImageEntry {
public:
    RecordImageEntry(std::weak_ptr<FileTracker> file,
                     qint64 offset,
                     qint64 step,
                     std::optional<QString> name,
                     std::optional<qint64> label,
                     LoaderId loaderId,
                     WorkerPool *pool);

    const std::optional<QString> &name() const { return m_name; }
    const std::optional<qint64> &label() const { return m_label; }

    ImageData materialize() const override;

private:
    std::optional<QString> m_name;
    std::optional<qint64> m_label;
};

class RecordMaskEntry : public ImageEntry {
public:
    RecordMaskEntry(std::weak_ptr<FileTracker> file,
                    qint64 offset,
                    qint64 step,
                    int maskIndex,
                    std::optional<QString> name,
                    LoaderId loaderId,
                    WorkerPool *pool);

    int maskIndex() const { return m_maskIndex; }

    ImageData materialize() const override;

private:
    int m_maskIndex = 0;
    std::optional<QString> m_name;
};

} // namespace tfscope
