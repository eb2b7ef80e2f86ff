#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QRecursiveMutex>
#include <QTemporaryDir>

#include <algorithm>
#include <map>

#include "common/models.hpp"
#include "formats/example_record.hpp"
#include "ingest/entry.hpp"
#include "ingest/ingest_sink.hpp"
#include "ingest/source_loader.hpp"
#include "ingest/source_registry.hpp"
#include "ingest/worker_pool.hpp"
#include "record_fixtures.hpp"

using namespace tfscope;

namespace {

// Collects what a source hands to the engine.
class RecordingSink : public IngestSink {
public:
    bool isInterruptionRequested() const override { return interrupt; }
    QRecursiveMutex &indexMutex() override { return mutex; }
    Tag tagToPath(const std::string &rawTag) override { return parseTagPath(rawTag); }

    void addEntry(const std::shared_ptr<Entry> &entry) override
    {
        entries.push_back(entry);
        if (!entry->isPerStep()) {
            globals[entry->tag()] = std::dynamic_pointer_cast<GlobalEntry>(entry);
        }
    }

    void addScalar(const Tag &tag, qint64 step, double value, const LoaderId &loaderId) override
    {
        auto scalar = std::dynamic_pointer_cast<ScalarEntry>(globalEntry(tag));
        if (!scalar) {
            scalar = std::make_shared<ScalarEntry>(tag);
            addEntry(scalar);
        }
        scalar->addData(step, value, loaderId);
    }

    std::shared_ptr<GlobalEntry> globalEntry(const Tag &tag) const
    {
        const auto it = globals.find(tag);
        return it == globals.end() ? nullptr : it->second;
    }

    WorkerPool *workerPool() override { return &pool; }
    void removeLoader(const LoaderId &loaderId) override { removed.push_back(loaderId); }
    void nextIteration() override { ++iterations; }

    std::vector<std::shared_ptr<PerStepEntry>> perStep() const
    {
        std::vector<std::shared_ptr<PerStepEntry>> out;
        for (const auto &entry : entries) {
            if (entry->isPerStep()) {
                out.push_back(std::static_pointer_cast<PerStepEntry>(entry));
            }
        }
        return out;
    }

    // Order-sensitive fingerprint of everything indexed.
    QStringList describe(const LoaderId &series) const
    {
        QStringList lines;
        for (const auto &entry : perStep()) {
            lines << QStringLiteral("%1@%2").arg(QString::fromStdString(entry->tagString()))
                         .arg(entry->step());
        }
        for (const auto &[tag, global] : globals) {
            const auto scalar = std::dynamic_pointer_cast<ScalarEntry>(global);
            const auto steps = scalar->steps(series);
            const auto values = scalar->values(series);
            for (size_t i = 0; i < steps.size(); ++i) {
                lines << QStringLiteral("%1@%2=%3").arg(QString::fromStdString(tag.toString()))
                             .arg(steps[i])
                             .arg(values[i]);
            }
        }
        return lines;
    }

    bool interrupt = false;
    int iterations = 0;
    QRecursiveMutex mutex;
    std::vector<std::shared_ptr<Entry>> entries;
    std::map<Tag, std::shared_ptr<GlobalEntry>> globals;
    std::vector<LoaderId> removed;
    WorkerPool pool{1};
};

QList<QByteArray> mixedEvents(int count)
{
    QList<QByteArray> records;
    records << fixtures::fileVersionEvent();
    for (int step = 0; step < count; ++step) {
        records << fixtures::scalarEvent(step, "loss", 1.0f / static_cast<float>(step + 1));
        if (step % 3 == 0) {
            records << fixtures::imageEvent(step, "input/0/image",
                                            fixtures::grayImage(4, 4, uchar(step)));
        }
    }
    return records;
}

const RawBlob &asRaw(const ImageData &data)
{
    return std::get<RawBlob>(data);
}

} // namespace

class SourceLoaderTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testAppliesTo();
    void testRegistryResolvesInOrder();
    void testResumeCorrectness();
    void testPartialWriteSafety();
    void testUnchangedFileIsNoop();
    void testFileSourceGone();
    void testTruncatedFileIsGone();
    void testInterruptionStopsBetweenRecords();
    void testMalformedPayloadSkipped();
    void testCorruptFrameSkippedAfterRetries();
    void testCorruptFrameRetriedForeverWhenUnlimited();
    void testEventImageMaterialize();
    void testDirectoryChildRemoval();
    void testDirectoryPicksUpNewFiles();
    void testDirectoryGoneReportsChildren();
    void testRecordFileRawImageAndMasks();
    void testRecordFileCompressedMasks();
    void testRecordFileOversizedDimensionsIgnored();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
};

void SourceLoaderTests::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void SourceLoaderTests::testAppliesTo()
{
    QVERIFY(EventFileSource::appliesTo(QStringLiteral("/runs/events.out.tfevents.1.host")));
    QVERIFY(!EventFileSource::appliesTo(QStringLiteral("/runs/train.tfrecords")));
    QVERIFY(RecordFileSource::appliesTo(QStringLiteral("/data/train.tfrecords")));
    QVERIFY(!RecordFileSource::appliesTo(QStringLiteral("/data/readme.txt")));

    QVERIFY(!EventDirectorySource::appliesTo(m_dir->path()));
    QVERIFY(fixtures::appendRecords(m_dir->filePath(QStringLiteral("a.tfevents")),
                                    {fixtures::fileVersionEvent()}));
    QVERIFY(EventDirectorySource::appliesTo(m_dir->path()));
    QVERIFY(!EventFileSource::appliesTo(m_dir->path()));
}

void SourceLoaderTests::testRegistryResolvesInOrder()
{
    const QString dirPath = m_dir->filePath(QStringLiteral("run"));
    QVERIFY(QDir().mkpath(dirPath));
    QVERIFY(fixtures::appendRecords(dirPath + QStringLiteral("/x.tfevents"),
                                    {fixtures::fileVersionEvent()}));

    const SourceRegistry registry = SourceRegistry::withDefaultKinds();
    QCOMPARE(registry.kindNames(),
             (QStringList{QStringLiteral("event_file"), QStringLiteral("event_directory"),
                          QStringLiteral("record_file")}));

    const SourceOptions options;
    const auto directory = registry.resolve(dirPath, LoaderId{4}, options);
    QVERIFY(directory.has_value());
    QVERIFY(std::holds_alternative<EventDirectorySource>(*directory));
    QCOMPARE(sourceId(*directory), LoaderId{4});
    QCOMPARE(std::get<EventDirectorySource>(*directory).children().front().id(),
             (LoaderId{4, 0}));

    const auto record = registry.resolve(m_dir->filePath(QStringLiteral("d.tfrecords")),
                                         LoaderId{5}, options);
    QVERIFY(record.has_value());
    QVERIFY(std::holds_alternative<RecordFileSource>(*record));

    QVERIFY(!registry.resolve(m_dir->filePath(QStringLiteral("notes.txt")), LoaderId{6}, options)
                 .has_value());

    SourceRegistry empty;
    QVERIFY(empty.isEmpty());
    QVERIFY(!empty.resolve(dirPath, LoaderId{0}, options).has_value());
}

void SourceLoaderTests::testResumeCorrectness()
{
    QByteArray stream;
    for (const QByteArray &record : mixedEvents(12)) {
        stream += RecordWriter::encodeFrame(record);
    }

    // Reference: the whole file decoded in one pass.
    const QString fullPath = m_dir->filePath(QStringLiteral("full.tfevents"));
    QVERIFY(fixtures::appendBytes(fullPath, stream));
    RecordingSink reference;
    EventFileSource whole(fullPath, LoaderId{0}, SourceOptions{});
    QVERIFY(whole.poll(reference));

    // Same bytes appended in uneven chunks with a poll after each.
    const QString growingPath = m_dir->filePath(QStringLiteral("growing.tfevents"));
    QVERIFY(fixtures::appendBytes(growingPath, QByteArray()));
    RecordingSink incremental;
    EventFileSource growing(growingPath, LoaderId{0}, SourceOptions{});
    const int chunkSizes[] = {1, 5, 11, 30, 7, 64, 3, 19};
    qsizetype written = 0;
    int chunk = 0;
    while (written < stream.size()) {
        const qsizetype size = std::min<qsizetype>(chunkSizes[chunk++ % 8], stream.size() - written);
        QVERIFY(fixtures::appendBytes(growingPath, stream.mid(written, size)));
        written += size;
        QVERIFY(growing.poll(incremental));
        QVERIFY(growing.bytesLoaded() <= written);
    }
    QVERIFY(growing.poll(incremental));

    QCOMPARE(incremental.describe(LoaderId{0}), reference.describe(LoaderId{0}));
    QCOMPARE(incremental.iterations, reference.iterations);
    QCOMPARE(growing.bytesLoaded(), growing.bytesTotal());
    QCOMPARE(growing.bytesLoaded(), static_cast<qint64>(stream.size()));
}

void SourceLoaderTests::testPartialWriteSafety()
{
    const QString path = m_dir->filePath(QStringLiteral("p.tfevents"));
    const QByteArray first = RecordWriter::encodeFrame(fixtures::scalarEvent(0, "loss", 1.0f));
    const QByteArray second = RecordWriter::encodeFrame(fixtures::scalarEvent(1, "loss", 0.5f));
    QVERIFY(fixtures::appendBytes(path, first + second.left(second.size() / 2)));

    RecordingSink sink;
    EventFileSource source(path, LoaderId{0}, SourceOptions{});
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 1);
    QCOMPARE(source.bytesLoaded(), static_cast<qint64>(first.size()));

    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 1);

    QVERIFY(fixtures::appendBytes(path, second.mid(second.size() / 2)));
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 2);

    const auto loss = std::dynamic_pointer_cast<ScalarEntry>(sink.globalEntry(makeTag({"loss"})));
    QVERIFY(loss != nullptr);
    QCOMPARE(loss->steps(LoaderId{0}), (std::vector<qint64>{0, 1}));
}

void SourceLoaderTests::testUnchangedFileIsNoop()
{
    const QString path = m_dir->filePath(QStringLiteral("same.tfevents"));
    QVERIFY(fixtures::appendRecords(path, {fixtures::scalarEvent(0, "loss", 1.0f)}));

    RecordingSink sink;
    EventFileSource source(path, LoaderId{0}, SourceOptions{});
    QVERIFY(source.poll(sink));
    QVERIFY(source.poll(sink));
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 1);
    QCOMPARE(sink.globals.size(), size_t(1));
}

void SourceLoaderTests::testFileSourceGone()
{
    const QString path = m_dir->filePath(QStringLiteral("gone.tfevents"));
    QVERIFY(fixtures::appendRecords(path, {fixtures::scalarEvent(0, "loss", 1.0f)}));

    RecordingSink sink;
    EventFileSource source(path, LoaderId{0}, SourceOptions{});
    QVERIFY(source.poll(sink));
    QVERIFY(QFile::remove(path));
    QVERIFY(!source.poll(sink));
    // Single files leave removal reporting to their owner.
    QVERIFY(sink.removed.empty());
}

void SourceLoaderTests::testTruncatedFileIsGone()
{
    const QString path = m_dir->filePath(QStringLiteral("t.tfrecords"));
    QVERIFY(fixtures::appendRecords(path, {fixtures::rawExample(QStringLiteral("a"), 1, 2, 2, 0),
                                           fixtures::rawExample(QStringLiteral("b"), 1, 2, 2, 0)}));

    RecordingSink sink;
    RecordFileSource source(path, LoaderId{0}, SourceOptions{});
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.perStep().size(), size_t(2));

    QFile file(path);
    QVERIFY(file.resize(10));
    QVERIFY(!source.poll(sink));
}

void SourceLoaderTests::testInterruptionStopsBetweenRecords()
{
    const QString path = m_dir->filePath(QStringLiteral("i.tfevents"));
    QVERIFY(fixtures::appendRecords(path, {fixtures::scalarEvent(0, "loss", 1.0f),
                                           fixtures::scalarEvent(1, "loss", 2.0f)}));

    RecordingSink sink;
    sink.interrupt = true;
    EventFileSource source(path, LoaderId{0}, SourceOptions{});
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 0);
    QCOMPARE(source.bytesLoaded(), qint64(0));

    sink.interrupt = false;
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 2);
}

void SourceLoaderTests::testMalformedPayloadSkipped()
{
    const QString path = m_dir->filePath(QStringLiteral("m.tfevents"));
    QVERIFY(fixtures::appendRecords(path, {QByteArray("\xff\xff\xff\xff", 4),
                                           fixtures::scalarEvent(3, "loss", 1.0f)}));

    RecordingSink sink;
    EventFileSource source(path, LoaderId{0}, SourceOptions{});
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 2);
    QCOMPARE(source.bytesLoaded(), source.bytesTotal());
    QCOMPARE(sink.globals.size(), size_t(1));
}

void SourceLoaderTests::testCorruptFrameSkippedAfterRetries()
{
    const QString path = m_dir->filePath(QStringLiteral("c.tfevents"));
    const QByteArray good = RecordWriter::encodeFrame(fixtures::scalarEvent(0, "loss", 1.0f));
    QByteArray bad = RecordWriter::encodeFrame(fixtures::scalarEvent(1, "loss", 2.0f));
    bad[bad.size() - 6] = static_cast<char>(bad[bad.size() - 6] ^ 0x55);
    const QByteArray after = RecordWriter::encodeFrame(fixtures::scalarEvent(2, "loss", 3.0f));
    QVERIFY(fixtures::appendBytes(path, good + bad + after));

    SourceOptions options;
    options.maxCorruptRetries = 3;
    RecordingSink sink;
    EventFileSource source(path, LoaderId{0}, options);

    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 1);
    QCOMPARE(source.bytesLoaded(), static_cast<qint64>(good.size()));

    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 1);

    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 2);
    QCOMPARE(source.bytesLoaded(), source.bytesTotal());

    const auto loss = std::dynamic_pointer_cast<ScalarEntry>(sink.globalEntry(makeTag({"loss"})));
    QCOMPARE(loss->steps(LoaderId{0}), (std::vector<qint64>{0, 2}));
}

void SourceLoaderTests::testCorruptFrameRetriedForeverWhenUnlimited()
{
    const QString path = m_dir->filePath(QStringLiteral("stall.tfevents"));
    QByteArray bad = RecordWriter::encodeFrame(fixtures::scalarEvent(0, "loss", 1.0f));
    bad[bad.size() - 6] = static_cast<char>(bad[bad.size() - 6] ^ 0x55);
    QVERIFY(fixtures::appendBytes(path, bad));

    SourceOptions options;
    options.maxCorruptRetries = 0;
    RecordingSink sink;
    EventFileSource source(path, LoaderId{0}, options);
    for (int cycle = 0; cycle < 6; ++cycle) {
        QVERIFY(source.poll(sink));
    }
    QCOMPARE(sink.iterations, 0);
    QCOMPARE(source.bytesLoaded(), qint64(0));
    QVERIFY(source.bytesLoaded() < source.bytesTotal());
}

void SourceLoaderTests::testEventImageMaterialize()
{
    const QString path = m_dir->filePath(QStringLiteral("img.tfevents"));
    QVERIFY(fixtures::appendRecords(path, {fixtures::imageEvent(4, "input/2/image",
                                                                fixtures::grayImage(5, 3, 77))}));

    RecordingSink sink;
    EventFileSource source(path, LoaderId{1}, SourceOptions{});
    QVERIFY(source.poll(sink));

    const auto entries = sink.perStep();
    QCOMPARE(entries.size(), size_t(1));
    QCOMPARE(entries.front()->tag(), makeTag({"input", qint64(2)}));
    QCOMPARE(entries.front()->step(), qint64(4));
    QCOMPARE(entries.front()->loaderId(), LoaderId{1});

    const auto image = std::dynamic_pointer_cast<ImageEntry>(entries.front());
    QVERIFY(image != nullptr);
    const ImageData data = image->materialize();
    QVERIFY(std::holds_alternative<RawBlob>(data));
    const RawBlob &raw = asRaw(data);
    QCOMPARE(raw.width, 5);
    QCOMPARE(raw.height, 3);
    QVERIFY(!raw.isColor);
    QCOMPARE(raw.bytes.size(), qsizetype(8 * 3));
    QCOMPARE(static_cast<uchar>(raw.bytes.at(0)), uchar(77));
    QCOMPARE(raw.description, QStringLiteral("input/2\nSize: 3x5x1"));

    // Once the source lets go of the file, decodes report unavailable.
    source.close();
    QVERIFY(std::holds_alternative<Unavailable>(image->materialize()));
}

void SourceLoaderTests::testDirectoryChildRemoval()
{
    const QString dirPath = m_dir->filePath(QStringLiteral("run"));
    QVERIFY(QDir().mkpath(dirPath));
    const QDir dir(dirPath);
    for (const QString &name : {QStringLiteral("a.tfevents"), QStringLiteral("b.tfevents"),
                                QStringLiteral("c.tfevents")}) {
        QVERIFY(fixtures::appendRecords(dir.filePath(name), {fixtures::scalarEvent(0, "loss", 1.0f)}));
    }

    RecordingSink sink;
    EventDirectorySource source(dirPath, LoaderId{0}, SourceOptions{});
    QCOMPARE(source.children().size(), size_t(3));
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 3);

    QVERIFY(QFile::remove(dir.filePath(QStringLiteral("b.tfevents"))));
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.removed, (std::vector<LoaderId>{LoaderId{0, 1}}));
    QCOMPARE(source.children().size(), size_t(2));

    // The survivors keep polling.
    QVERIFY(fixtures::appendRecords(dir.filePath(QStringLiteral("c.tfevents")),
                                    {fixtures::scalarEvent(1, "loss", 2.0f)}));
    QVERIFY(fixtures::appendRecords(dir.filePath(QStringLiteral("a.tfevents")),
                                    {fixtures::scalarEvent(1, "loss", 3.0f)}));
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 5);
    QCOMPARE(sink.removed.size(), size_t(1));
    QCOMPARE(source.bytesLoaded(), source.bytesTotal());
}

void SourceLoaderTests::testDirectoryPicksUpNewFiles()
{
    const QString dirPath = m_dir->filePath(QStringLiteral("run"));
    QVERIFY(QDir().mkpath(dirPath));
    const QDir dir(dirPath);
    QVERIFY(fixtures::appendRecords(dir.filePath(QStringLiteral("a.tfevents")),
                                    {fixtures::scalarEvent(0, "loss", 1.0f)}));

    RecordingSink sink;
    EventDirectorySource source(dirPath, LoaderId{3}, SourceOptions{});
    QVERIFY(source.poll(sink));

    QVERIFY(QFile::remove(dir.filePath(QStringLiteral("a.tfevents"))));
    QVERIFY(fixtures::appendRecords(dir.filePath(QStringLiteral("a2.tfevents")),
                                    {fixtures::scalarEvent(0, "acc", 0.5f)}));
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.removed, (std::vector<LoaderId>{LoaderId{3, 0}}));
    QCOMPARE(source.children().size(), size_t(1));
    QCOMPARE(source.children().front().id(), (LoaderId{3, 1}));

    // Re-created under the old name: still a fresh id.
    QVERIFY(fixtures::appendRecords(dir.filePath(QStringLiteral("a.tfevents")),
                                    {fixtures::scalarEvent(1, "loss", 1.0f)}));
    QVERIFY(source.poll(sink));
    QCOMPARE(source.children().size(), size_t(2));
    bool sawFreshId = false;
    for (const auto &child : source.children()) {
        sawFreshId = sawFreshId || child.id() == LoaderId{3, 2};
    }
    QVERIFY(sawFreshId);

    // Every child removed: the directory itself is done.
    QVERIFY(QFile::remove(dir.filePath(QStringLiteral("a.tfevents"))));
    QVERIFY(QFile::remove(dir.filePath(QStringLiteral("a2.tfevents"))));
    QVERIFY(!source.poll(sink));
}

void SourceLoaderTests::testDirectoryGoneReportsChildren()
{
    const QString dirPath = m_dir->filePath(QStringLiteral("run"));
    QVERIFY(QDir().mkpath(dirPath));
    QVERIFY(fixtures::appendRecords(dirPath + QStringLiteral("/a.tfevents"),
                                    {fixtures::scalarEvent(0, "loss", 1.0f)}));
    QVERIFY(fixtures::appendRecords(dirPath + QStringLiteral("/b.tfevents"),
                                    {fixtures::scalarEvent(0, "loss", 1.0f)}));

    RecordingSink sink;
    EventDirectorySource source(dirPath, LoaderId{2}, SourceOptions{});
    QVERIFY(source.poll(sink));

    QVERIFY(QDir(dirPath).removeRecursively());
    QVERIFY(!source.poll(sink));
    QCOMPARE(sink.removed.size(), size_t(2));
    QVERIFY(std::find(sink.removed.begin(), sink.removed.end(), LoaderId{2, 0})
            != sink.removed.end());
    QVERIFY(std::find(sink.removed.begin(), sink.removed.end(), LoaderId{2, 1})
            != sink.removed.end());
    QVERIFY(source.children().empty());
}

void SourceLoaderTests::testRecordFileRawImageAndMasks()
{
    const QString path = m_dir->filePath(QStringLiteral("train.tfrecords"));
    QVERIFY(fixtures::appendRecords(path, {fixtures::rawExample(QStringLiteral("sample"), 4, 4, 3, 3),
                                           fixtures::rawExample(QStringLiteral("next"), 5, 4, 3, 0)}));

    RecordingSink sink;
    RecordFileSource source(path, LoaderId{0}, SourceOptions{});
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 2);

    const auto entries = sink.perStep();
    QCOMPARE(entries.size(), size_t(5));
    QCOMPARE(entries[0]->tag(), makeTag({"image"}));
    QCOMPARE(entries[1]->tag(), makeTag({"mask", qint64(0)}));
    QCOMPARE(entries[3]->tag(), makeTag({"mask", qint64(2)}));
    QCOMPARE(entries[0]->step(), qint64(0));
    QCOMPARE(entries[4]->tag(), makeTag({"image"}));
    QCOMPARE(entries[4]->step(), qint64(1));

    const auto image = std::dynamic_pointer_cast<RecordImageEntry>(entries[0]);
    QVERIFY(image != nullptr);
    QCOMPARE(image->name(), std::optional<QString>(QStringLiteral("sample")));
    QCOMPARE(image->label(), std::optional<qint64>(4));
    const ImageData imageData = image->materialize();
    QVERIFY(std::holds_alternative<RawBlob>(imageData));
    QCOMPARE(asRaw(imageData).width, 4);
    QCOMPARE(asRaw(imageData).height, 3);
    QVERIFY(asRaw(imageData).description.contains(QStringLiteral("Name: sample")));
    QVERIFY(asRaw(imageData).description.contains(QStringLiteral("Label: 4")));
    QVERIFY(asRaw(imageData).description.contains(QStringLiteral("Compressed: False")));

    const auto mask = std::dynamic_pointer_cast<RecordMaskEntry>(entries[2]);
    QVERIFY(mask != nullptr);
    QCOMPARE(mask->maskIndex(), 1);
    const ImageData maskData = mask->materialize();
    QVERIFY(std::holds_alternative<RawBlob>(maskData));
    QVERIFY(!asRaw(maskData).isColor);
    QCOMPARE(static_cast<uchar>(asRaw(maskData).bytes.at(0)), uchar(2 * 31));
}

void SourceLoaderTests::testRecordFileCompressedMasks()
{
    const QString path = m_dir->filePath(QStringLiteral("seg.tfrecords"));
    QVERIFY(fixtures::appendRecords(path, {fixtures::compressedExample(QStringLiteral("seg"), 3, 2, 2)}));

    RecordingSink sink;
    RecordFileSource source(path, LoaderId{0}, SourceOptions{});
    QVERIFY(source.poll(sink));

    const auto entries = sink.perStep();
    QCOMPARE(entries.size(), size_t(3));

    const ImageData imageData = std::dynamic_pointer_cast<ImageEntry>(entries[0])->materialize();
    QVERIFY(std::holds_alternative<RawBlob>(imageData));
    QVERIFY(asRaw(imageData).description.contains(QStringLiteral("Compressed: True")));
    QCOMPARE(static_cast<uchar>(asRaw(imageData).bytes.at(0)), uchar(200));

    const ImageData maskData = std::dynamic_pointer_cast<ImageEntry>(entries[2])->materialize();
    QVERIFY(std::holds_alternative<RawBlob>(maskData));
    const RawBlob &mask = asRaw(maskData);
    QVERIFY(mask.isColor);
    QCOMPARE(mask.width, 3);
    QCOMPARE(mask.height, 2);
    QCOMPARE(static_cast<uchar>(mask.bytes.at(0)), uchar(255));
    QCOMPARE(static_cast<uchar>(mask.bytes.at(1)), uchar(255));
    QCOMPARE(static_cast<uchar>(mask.bytes.at(2)), uchar(179));
}

void SourceLoaderTests::testRecordFileOversizedDimensionsIgnored()
{
    auto oversized = [](qint64 height, qint64 width) {
        proto::Example example;
        fixtures::setBytes(example, "identifier", QByteArrayLiteral("huge"));
        fixtures::setInt64(example, "height", height);
        fixtures::setInt64(example, "width", width);
        fixtures::setBytes(example, "image_raw", QByteArrayLiteral("ab"));
        fixtures::setBytes(example, "mask_raw", QByteArrayLiteral("abcd"));
        return fixtures::serialize(example);
    };

    const QString path = m_dir->filePath(QStringLiteral("huge.tfrecords"));
    QVERIFY(fixtures::appendRecords(path, {oversized(qint64(1) << 32, qint64(1) << 32),
                                           oversized(65536, 65536),
                                           fixtures::rawExample(QStringLiteral("ok"), 1, 2, 2, 1)}));

    RecordingSink sink;
    RecordFileSource source(path, LoaderId{0}, SourceOptions{});
    QVERIFY(source.poll(sink));
    QCOMPARE(sink.iterations, 3);
    QCOMPARE(source.bytesLoaded(), source.bytesTotal());

    // The malformed examples still take their step ordinals.
    const auto entries = sink.perStep();
    QCOMPARE(entries.size(), size_t(2));
    QCOMPARE(entries[0]->tag(), makeTag({"image"}));
    QCOMPARE(entries[0]->step(), qint64(2));
    QCOMPARE(entries[1]->tag(), makeTag({"mask", qint64(0)}));
}

QTEST_GUILESS_MAIN(SourceLoaderTests)
#include "test_source_loaders.moc"
