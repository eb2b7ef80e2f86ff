#include "tail/TailConsole.hpp"

#include <iostream>

#include <QDir>
#include <QFile>
#include <QImage>

#include "common/logging.hpp"
#include "ingest/decode_future.hpp"
#include "ingest/entry.hpp"
#include "ingest/ingestion_engine.hpp"

namespace tfscope {

namespace {

std::string tagText(const Tag &tag)
{
    return tag.toString();
}

// Rows of a RawBlob are padded to 4 bytes.
QImage imageFromRaw(const QByteArray &data, int width, int height, bool isColor)
{
    const int channels = isColor ? 3 : 1;
    const int stride = ((width * channels + 3) / 4) * 4;
    if (width <= 0 || height <= 0 || data.size() < static_cast<qsizetype>(stride) * height) {
        return QImage();
    }
    const QImage view(reinterpret_cast<const uchar *>(data.constData()),
                      width,
                      height,
                      stride,
                      isColor ? QImage::Format_RGB888 : QImage::Format_Grayscale8);
    return view.copy();
}

} // namespace

TailConsole::TailConsole(IngestionEngine &engine, TailOptions options, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
    , m_options(std::move(options))
{
    connect(&m_engine, &IngestionEngine::tagDiscovered, this, &TailConsole::onTagDiscovered);
    connect(&m_engine, &IngestionEngine::globalEntryDiscovered,
            this, &TailConsole::onGlobalEntryDiscovered);
    connect(&m_engine, &IngestionEngine::stepInserted, this, &TailConsole::onStepInserted);
    connect(&m_engine, &IngestionEngine::progress, this, &TailConsole::onProgress);
    connect(&m_engine, &IngestionEngine::initialLoadComplete,
            this, &TailConsole::onInitialLoadComplete);
    connect(&m_engine, &IngestionEngine::sourceRemoved, this, &TailConsole::onSourceRemoved);
    connect(&m_engine, &IngestionEngine::sourceDiscoveryCleared,
            this, &TailConsole::onSourceDiscoveryCleared);
    connect(&m_engine, &IngestionEngine::loopStopped, this, &TailConsole::onLoopStopped);
    connect(&m_engine, &IngestionEngine::engineFailed, this, &TailConsole::onEngineFailed);
}

void TailConsole::print(const nlohmann::json &event) const
{
    if (m_options.format == TailOptions::Format::Json) {
        std::cout << event.dump() << std::endl;
        return;
    }

    const std::string kind = event.value("event", std::string());
    if (kind == "tag" || kind == "global") {
        std::cout << kind << "  " << event.value("tag", std::string()) << "  "
                  << event.value("type", std::string()) << std::endl;
    } else if (kind == "step") {
        std::cout << "step  #" << event.value("position", 0) << "  (iteration "
                  << event.value("iteration", 0) << ")" << std::endl;
    } else if (kind == "progress") {
        std::cout << "progress  " << static_cast<int>(event.value("ratio", 0.0) * 100.0)
                  << "%  (iteration " << event.value("iteration", 0) << ")" << std::endl;
    } else if (kind == "ready") {
        std::cout << "ready  " << event.value("tags", 0) << " tags, "
                  << event.value("steps", 0) << " steps" << std::endl;
    } else if (kind == "removed") {
        std::cout << "removed  " << event.value("loader_id", std::string()) << std::endl;
    } else if (kind == "exported") {
        std::cout << "exported  " << event.value("tag", std::string()) << " -> "
                  << event.value("path", std::string()) << std::endl;
    } else if (kind == "error") {
        std::cerr << "error  " << event.value("message", std::string()) << std::endl;
    } else {
        std::cout << kind << std::endl;
    }
}

void TailConsole::onTagDiscovered(const Tag &tag, EntryType type)
{
    print({{"event", "tag"}, {"tag", tagText(tag)}, {"type", toEntryTypeString(type)}});
}

void TailConsole::onGlobalEntryDiscovered(const Tag &tag, EntryType type)
{
    print({{"event", "global"}, {"tag", tagText(tag)}, {"type", toEntryTypeString(type)}});
}

void TailConsole::onStepInserted(int position, int iteration)
{
    print({{"event", "step"}, {"position", position}, {"iteration", iteration}});
}

void TailConsole::onProgress(int iteration, double ratio)
{
    print({{"event", "progress"}, {"iteration", iteration}, {"ratio", ratio}});
}

void TailConsole::onInitialLoadComplete()
{
    print({{"event", "ready"},
           {"tags", m_engine.tags().size()},
           {"globals", m_engine.globalTags().size()},
           {"steps", m_engine.steps().size()}});

    if (!m_options.exportDir.isEmpty()) {
        exportLatestImages();
        return;
    }
    if (m_options.once && !m_finished) {
        m_finished = true;
        emit finished(0);
    }
}

void TailConsole::onSourceRemoved(const LoaderId &loaderId)
{
    print({{"event", "removed"}, {"loader_id", loaderIdToString(loaderId).toStdString()}});
}

void TailConsole::onSourceDiscoveryCleared()
{
    print({{"event", "cleared"}});
}

void TailConsole::onLoopStopped()
{
    print({{"event", "stopped"}});
    // loopStopped arrives before engineFailed; the failure is already recorded.
    if (!m_engine.fatalError().isEmpty()) {
        onEngineFailed(m_engine.fatalError());
        return;
    }
    if (!m_finished && m_pendingExports == 0) {
        m_finished = true;
        emit finished(m_failed ? 2 : 0);
    }
}

void TailConsole::onEngineFailed(const QString &message)
{
    if (m_failed) {
        return;
    }
    m_failed = true;
    print({{"event", "error"}, {"message", message.toStdString()}});
    if (!m_finished) {
        m_finished = true;
        emit finished(2);
    }
}

QString TailConsole::exportPath(const Tag &tag, const QString &suffix) const
{
    QString name = QString::fromStdString(tag.toString());
    name.replace(QLatin1Char('/'), QLatin1Char('_'));
    return QDir(m_options.exportDir).filePath(name + suffix);
}

void TailConsole::exportLatestImages()
{
    if (!QDir().mkpath(m_options.exportDir)) {
        print({{"event", "error"},
               {"message", "cannot create export directory " + m_options.exportDir.toStdString()}});
        if (m_options.once && !m_finished) {
            m_finished = true;
            emit finished(1);
        }
        return;
    }

    const IngestionEngine::TagIndex index = m_engine.tagIndex();
    for (const auto &[tag, entries] : index) {
        if (entries.empty() || entries.back()->type() != EntryType::Image) {
            continue;
        }
        const auto image = std::dynamic_pointer_cast<ImageEntry>(entries.back());
        if (!image) {
            continue;
        }

        const std::shared_ptr<DecodeFuture> future = image->readImageDataAsync();
        const Tag exportTag = tag;
        connect(future.get(), &DecodeFuture::rawDataReady, this,
                [this, exportTag](const QByteArray &data, int width, int height, bool isColor,
                                  const QString &) {
                    const QImage decoded = imageFromRaw(data, width, height, isColor);
                    const QString path = exportPath(exportTag, QStringLiteral(".png"));
                    if (decoded.isNull() || !decoded.save(path, "PNG")) {
                        print({{"event", "error"},
                               {"message", "cannot write " + path.toStdString()}});
                        return;
                    }
                    ++m_exported;
                    print({{"event", "exported"},
                           {"tag", tagText(exportTag)},
                           {"path", path.toStdString()}});
                });
        connect(future.get(), &DecodeFuture::dataReady, this,
                [this, exportTag](const QByteArray &data) {
                    // Encoded with a codec QImage does not know; keep the bytes.
                    const QString path = exportPath(exportTag, QStringLiteral(".bin"));
                    QFile file(path);
                    if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size()) {
                        print({{"event", "error"},
                               {"message", "cannot write " + path.toStdString()}});
                        return;
                    }
                    ++m_exported;
                    print({{"event", "exported"},
                           {"tag", tagText(exportTag)},
                           {"path", path.toStdString()}});
                });
        connect(future.get(), &DecodeFuture::done, this, &TailConsole::exportDone);
        ++m_pendingExports;
        future->start();
    }

    if (m_pendingExports == 0 && m_options.once && !m_finished) {
        m_finished = true;
        emit finished(0);
    }
}

void TailConsole::exportDone()
{
    if (m_pendingExports > 0) {
        --m_pendingExports;
    }
    if (m_pendingExports == 0 && m_options.once && !m_finished) {
        TFS_LOG_INFO(QStringLiteral("TailConsole"),
                     QStringLiteral("exportDone"),
                     QStringLiteral("export_finished"),
                     QStringLiteral("initial_load_complete"),
                     QStringLiteral("decode_futures"),
                     logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"exported", m_exported},
                                    {"dir", m_options.exportDir.toStdString()}});
        m_finished = true;
        emit finished(0);
    }
}

} // namespace tfscope
