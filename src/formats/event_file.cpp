#include "formats/event_file.hpp"

#include <QImage>

#include "event.pb.h"
#include "ingest/file_tracker.hpp"

namespace tfscope {

std::optional<DecodedEvent> decodeEventRecord(const QByteArray &record)
{
    proto::Event event;
    if (!event.ParseFromArray(record.constData(), static_cast<int>(record.size()))) {
        return std::nullopt;
    }

    DecodedEvent decoded;
    decoded.step = event.step();
    if (!event.has_summary()) {
        return decoded;
    }

    const proto::Summary &summary = event.summary();
    for (int index = 0; index < summary.value_size(); ++index) {
        const proto::SummaryValue &value = summary.value(index);
        switch (value.value_case()) {
        case proto::SummaryValue::kImage:
            decoded.values.push_back(DecodedValue{value.tag(), EntryType::Image, 0.0, index});
            break;
        case proto::SummaryValue::kSimpleValue:
            decoded.values.push_back(
                DecodedValue{value.tag(), EntryType::Scalar, value.simple_value(), index});
            break;
        default:
            break;
        }
    }
    return decoded;
}

EventImageEntry::EventImageEntry(std::weak_ptr<FileTracker> file,
                                 qint64 offset,
                                 int valueIndex,
                                 Tag tag,
                                 qint64 step,
                                 LoaderId loaderId,
                                 WorkerPool *pool)
    : ImageEntry(std::move(file), offset, std::move(tag), step, std::move(loaderId), pool)
    , m_valueIndex(valueIndex)
{
}

ImageData EventImageEntry::materialize() const
{
    const auto tracker = file();
    if (!tracker) {
        return Unavailable{};
    }

    const auto event = tracker->readCachedAndDecodeAt<proto::Event>(offset());
    if (!event || !event->has_summary() || m_valueIndex >= event->summary().value_size()) {
        return Unavailable{};
    }

    const proto::SummaryValue &value = event->summary().value(m_valueIndex);
    if (!value.has_image()) {
        return Unavailable{};
    }

    const std::string &encoded = value.image().encoded_image_string();
    const QByteArray bytes(encoded.data(), static_cast<qsizetype>(encoded.size()));
    const QImage image = QImage::fromData(bytes);
    if (image.isNull()) {
        // Unknown codec: let the consumer try the encoded bytes.
        return bytes.isEmpty() ? ImageData{Unavailable{}} : ImageData{CompressedBlob{bytes}};
    }
    return imageToResult(image, QString::fromStdString(tagString()));
}

} // namespace tfscope
