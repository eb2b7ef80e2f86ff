#include "formats/example_record.hpp"

#include <algorithm>
#include <array>
#include <limits>

#include <QBuffer>
#include <QImage>
#include <QImageReader>

#include "example.pb.h"
#include "ingest/file_tracker.hpp"

namespace tfscope {

namespace {

constexpr int kMaskChannels = 8;

constexpr std::array<uchar, 36> kMaskPalette = {
    141, 211, 199,
    255, 255, 179,
    190, 186, 218,
    251, 128, 114,
    128, 177, 211,
    253, 180, 98,
    179, 222, 105,
    252, 205, 229,
    217, 217, 217,
    188, 128, 189,
    204, 235, 197,
    255, 237, 111,
};

const proto::Feature *findFeature(const proto::Example &example, const char *key)
{
    const auto &features = example.features().feature();
    const auto it = features.find(key);
    return it == features.end() ? nullptr : &it->second;
}

bool hasFeature(const proto::Example &example, const char *key)
{
    return findFeature(example, key) != nullptr;
}

std::optional<qint64> int64Feature(const proto::Example &example, const char *key)
{
    const proto::Feature *feature = findFeature(example, key);
    if (!feature || !feature->has_int64_list() || feature->int64_list().value_size() == 0) {
        return std::nullopt;
    }
    return feature->int64_list().value(0);
}

std::optional<QByteArray> bytesFeature(const proto::Example &example, const char *key)
{
    const proto::Feature *feature = findFeature(example, key);
    if (!feature || !feature->has_bytes_list() || feature->bytes_list().value_size() == 0) {
        return std::nullopt;
    }
    const std::string &value = feature->bytes_list().value(0);
    return QByteArray(value.data(), static_cast<qsizetype>(value.size()));
}

struct Dimensions {
    qint64 height = 0;
    qint64 width = 0;
};

std::optional<Dimensions> dimensionsOf(const proto::Example &example)
{
    const auto height = int64Feature(example, "height");
    const auto width = int64Feature(example, "width");
    if (!height || !width || *height <= 0 || *width <= 0) {
        return std::nullopt;
    }
    // Planes are addressed with int offsets; larger shapes are malformed.
    if (*height > std::numeric_limits<int>::max() / *width) {
        return std::nullopt;
    }
    return Dimensions{*height, *width};
}

std::shared_ptr<const proto::Example> readExample(const std::shared_ptr<FileTracker> &tracker,
                                                  qint64 offset)
{
    if (!tracker) {
        return nullptr;
    }
    return tracker->readCachedAndDecodeAt<proto::Example>(offset);
}

QString describe(const std::string &tag, const std::optional<QString> &name)
{
    return QStringLiteral("%1\nName: %2")
        .arg(QString::fromStdString(tag), name.value_or(QStringLiteral("(unnamed)")));
}

QString compressedSuffix(bool compressed)
{
    return compressed ? QStringLiteral("\nCompressed: True") : QStringLiteral("\nCompressed: False");
}

} // namespace

int countMasks(const proto::Example &example)
{
    const auto dims = dimensionsOf(example);
    if (!dims) {
        return 0;
    }

    if (const auto raw = bytesFeature(example, "mask_raw")) {
        return static_cast<int>(raw->size() / (dims->height * dims->width));
    }
    if (const auto compressed = bytesFeature(example, "mask_compressed")) {
        QBuffer buffer;
        buffer.setData(*compressed);
        QImageReader reader(&buffer);
        const QSize size = reader.size();
        if (!size.isValid()) {
            return 0;
        }
        return static_cast<int>(size.height() / dims->height);
    }
    return 0;
}

std::optional<DecodedExample> decodeExampleRecord(const QByteArray &record)
{
    proto::Example example;
    if (!example.ParseFromArray(record.constData(), static_cast<int>(record.size()))) {
        return std::nullopt;
    }

    DecodedExample decoded;
    if (const auto identifier = bytesFeature(example, "identifier")) {
        decoded.name = QString::fromUtf8(*identifier);
    }
    decoded.label = int64Feature(example, "label");

    const auto dims = dimensionsOf(example);
    if (!dims) {
        return decoded;
    }
    decoded.height = dims->height;
    decoded.width = dims->width;
    decoded.hasImage = hasFeature(example, "image_raw") || hasFeature(example, "image_compressed");
    if (hasFeature(example, "mask_raw") || hasFeature(example, "mask_compressed")) {
        decoded.maskCount = countMasks(example);
    }
    return decoded;
}

RecordImageEntry::RecordImageEntry(std::weak_ptr<FileTracker> file,
                                   qint64 offset,
                                   qint64 step,
                                   std::optional<QString> name,
                                   std::optional<qint64> label,
                                   LoaderId loaderId,
                                   WorkerPool *pool)
    : ImageEntry(std::move(file), offset, makeTag({"image"}), step, std::move(loaderId), pool)
    , m_name(std::move(name))
    , m_label(label)
{
}

ImageData RecordImageEntry::materialize() const
{
    const auto example = readExample(file(), offset());
    if (!example) {
        return Unavailable{};
    }
    const auto dims = dimensionsOf(*example);
    if (!dims) {
        return Unavailable{};
    }

    QString info = describe(tagString(), m_name);
    if (m_label) {
        info += QStringLiteral("\nLabel: %1").arg(*m_label);
    }

    if (const auto raw = bytesFeature(*example, "image_raw")) {
        info += compressedSuffix(false);
        return rawImageToResult(*raw, static_cast<int>(dims->height),
                                static_cast<int>(dims->width), info);
    }
    if (const auto compressed = bytesFeature(*example, "image_compressed")) {
        info += compressedSuffix(true);
        const QImage image = QImage::fromData(*compressed);
        if (image.isNull()) {
            return CompressedBlob{*compressed};
        }
        return imageToResult(image, info);
    }
    return Unavailable{};
}

RecordMaskEntry::RecordMaskEntry(std::weak_ptr<FileTracker> file,
                                 qint64 offset,
                                 qint64 step,
                                 int maskIndex,
                                 std::optional<QString> name,
                                 LoaderId loaderId,
                                 WorkerPool *pool)
    : ImageEntry(std::move(file), offset, makeTag({"mask", static_cast<qint64>(maskIndex)}), step,
                 std::move(loaderId), pool)
    , m_maskIndex(maskIndex)
    , m_name(std::move(name))
{
}

ImageData RecordMaskEntry::materialize() const
{
    const auto example = readExample(file(), offset());
    if (!example) {
        return Unavailable{};
    }
    const auto dims = dimensionsOf(*example);
    if (!dims) {
        return Unavailable{};
    }
    const int height = static_cast<int>(dims->height);
    const int width = static_cast<int>(dims->width);

    QString info = describe(tagString(), m_name);

    if (const auto raw = bytesFeature(*example, "mask_raw")) {
        info += compressedSuffix(false);
        const qsizetype planeSize = static_cast<qsizetype>(height) * width;
        const qsizetype begin = m_maskIndex * planeSize;
        if (begin + planeSize > raw->size()) {
            return Unavailable{};
        }

        QImage mask(width, height, QImage::Format_Grayscale8);
        const int factor = 255 / kMaskChannels;
        const auto *source = reinterpret_cast<const uchar *>(raw->constData() + begin);
        for (int y = 0; y < height; ++y) {
            uchar *line = mask.scanLine(y);
            for (int x = 0; x < width; ++x) {
                line[x] = static_cast<uchar>(std::min(255, source[y * width + x] * factor));
            }
        }
        return imageToResult(mask, info);
    }

    if (const auto compressed = bytesFeature(*example, "mask_compressed")) {
        info += compressedSuffix(true);
        const QImage strip = QImage::fromData(*compressed);
        if (strip.isNull() || !strip.isGrayscale() || strip.width() < width
            || strip.height() < (m_maskIndex + 1) * height) {
            return Unavailable{};
        }

        const QImage plane = strip.convertToFormat(QImage::Format_Grayscale8)
                                 .copy(0, m_maskIndex * height, width, height);
        QImage colored(width, height, QImage::Format_RGB888);
        for (int y = 0; y < height; ++y) {
            const uchar *in = plane.constScanLine(y);
            uchar *out = colored.scanLine(y);
            for (int x = 0; x < width; ++x) {
                const size_t base = static_cast<size_t>(in[x]) * 3;
                for (size_t c = 0; c < 3; ++c) {
                    out[x * 3 + c] = base + c < kMaskPalette.size() ? kMaskPalette[base + c] : 255;
                }
            }
        }
        return imageToResult(colored, info);
    }
    return Unavailable{};
}

} // namespace tfscope
