#pragma once

#include <variant>

#include <QByteArray>
#include <QImage>
#include <QString>

namespace tfscope {

// Encoded image bytes (PNG, JPEG, ...) handed to the consumer as-is.
struct CompressedBlob {
    QByteArray bytes;
};

// Decoded 8-bit gray or RGB pixels, rows padded to a 4-byte stride.
struct RawBlob {
    QByteArray bytes;
    int width = 0;
    int height = 0;
    bool isColor = false;
    QString description;
};

struct Unavailable {};

using ImageData = std::variant<Unavailable, CompressedBlob, RawBlob>;

// Grayscale images stay single channel, anything else becomes RGB888.
ImageData imageToResult(const QImage &image, const QString &message);

// Packs height*width*channels raw bytes (1 or 3 channels) into a RawBlob.
ImageData rawImageToResult(const QByteArray &raw, int height, int width, const QString &message);

bool isAvailable(const ImageData &data);

} // namespace tfscope
