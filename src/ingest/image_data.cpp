#include "ingest/image_data.hpp"

namespace tfscope {

namespace {

QString sizeSuffix(int height, int width, int channels)
{
    return QStringLiteral("\nSize: %1x%2x%3").arg(height).arg(width).arg(channels);
}

} // namespace

ImageData imageToResult(const QImage &image, const QString &message)
{
    if (image.isNull()) {
        return Unavailable{};
    }

    const bool isGray = image.format() == QImage::Format_Grayscale8
        || (image.format() == QImage::Format_Indexed8 && image.allGray());
    const QImage converted = isGray
        ? image.convertToFormat(QImage::Format_Grayscale8)
        : image.convertToFormat(QImage::Format_RGB888);
    if (converted.isNull()) {
        return Unavailable{};
    }

    // QImage scan lines are already 32-bit aligned.
    RawBlob blob;
    blob.bytes = QByteArray(reinterpret_cast<const char *>(converted.constBits()),
                            static_cast<qsizetype>(converted.sizeInBytes()));
    blob.width = converted.width();
    blob.height = converted.height();
    blob.isColor = !isGray;
    blob.description = message + sizeSuffix(blob.height, blob.width, isGray ? 1 : 3);
    return blob;
}

ImageData rawImageToResult(const QByteArray &raw, int height, int width, const QString &message)
{
    if (height <= 0 || width <= 0) {
        return Unavailable{};
    }
    const qsizetype pixels = static_cast<qsizetype>(height) * width;
    const qsizetype channels = raw.size() / pixels;
    if (raw.size() != pixels * channels || (channels != 1 && channels != 3)) {
        return Unavailable{};
    }

    const qsizetype stride = width * channels;
    if (stride % 4 != 0) {
        const QImage::Format format = channels == 1
            ? QImage::Format_Grayscale8
            : QImage::Format_RGB888;
        const QImage view(reinterpret_cast<const uchar *>(raw.constData()),
                          width, height, stride, format);
        return imageToResult(view.copy(), message);
    }

    RawBlob blob;
    blob.bytes = raw;
    blob.width = width;
    blob.height = height;
    blob.isColor = channels == 3;
    blob.description = message + sizeSuffix(height, width, static_cast<int>(channels));
    return blob;
}

bool isAvailable(const ImageData &data)
{
    return !std::holds_alternative<Unavailable>(data);
}

} // namespace tfscope
