#pragma once

#include <map>
#include <memory>
#include <vector>

#include <QMutex>
#include <QObject>
#include <QPointer>

#include "common/models.hpp"
#include "ingest/decode_future.hpp"
#include "ingest/image_data.hpp"

namespace tfscope {

class FileTracker;
class WorkerPool;

// Unit of decoded data, identified by its tag.
class Entry : public std::enable_shared_from_this<Entry> {
public:
    explicit Entry(Tag tag);
    virtual ~Entry();

    const Tag &tag() const { return m_tag; }
    std::string tagString() const { return m_tag.toString(); }

    virtual EntryType type() const = 0;
    virtual bool isPerStep() const = 0;

    // Releases file references and pending work; called on engine teardown.
    virtual void close();

private:
    Tag m_tag;
};

// Entry tied to one step of one record. Holds a non-owning handle to the
// file it came from so the record can be re-read lazily.
class PerStepEntry : public Entry {
public:
    PerStepEntry(std::weak_ptr<FileTracker> file,
                 qint64 offset,
                 Tag tag,
                 qint64 step,
                 LoaderId loaderId);

    bool isPerStep() const override { return true; }

    qint64 step() const { return m_step; }
    qint64 offset() const { return m_offset; }
    const LoaderId &loaderId() const { return m_loaderId; }

    // Null after close() or once the owning loader dropped the file.
    std::shared_ptr<FileTracker> file() const;

    void close() override;

private:
    mutable QMutex m_fileMutex;
    std::weak_ptr<FileTracker> m_file;
    qint64 m_offset = 0;
    qint64 m_step = 0;
    LoaderId m_loaderId;
};

// Entry accumulating (step, value) observations across the whole run.
class GlobalEntry : public QObject, public Entry
{
    Q_OBJECT
public:
    explicit GlobalEntry(Tag tag);

    bool isPerStep() const override { return false; }

    // All distinct steps across loaders, or the steps of one loader.
    virtual std::vector<qint64> steps() const = 0;
    virtual std::vector<qint64> steps(const LoaderId &loaderId) const = 0;
    // Loader ids in order of first observation.
    virtual std::vector<LoaderId> loaderIds() const = 0;

signals:
    void stepAdded(int index, const tfscope::LoaderId &loaderId);
};

// Scalar series, partitioned by the top-level source that produced it.
class ScalarEntry : public GlobalEntry
{
    Q_OBJECT
public:
    explicit ScalarEntry(Tag tag);

    EntryType type() const override { return EntryType::Scalar; }

    std::vector<qint64> steps() const override;
    std::vector<qint64> steps(const LoaderId &loaderId) const override;
    std::vector<LoaderId> loaderIds() const override;

    std::vector<double> values(const LoaderId &loaderId) const;
    size_t observationCount(const LoaderId &loaderId) const;

    // Inserts after any existing observation of the same step.
    void addData(qint64 step, double value, const LoaderId &loaderId);

    void close() override;

    static LoaderId seriesId(const LoaderId &loaderId);

private:
    struct Series {
        std::vector<qint64> steps;
        std::vector<double> values;
    };

    mutable QMutex m_mutex;
    std::vector<qint64> m_allSteps;
    std::vector<LoaderId> m_loaderIds;
    std::map<LoaderId, Series> m_series;
};

// Per-step entry whose pixels are decoded on the worker pool on demand.
class ImageEntry : public PerStepEntry {
public:
    ImageEntry(std::weak_ptr<FileTracker> file,
               qint64 offset,
               Tag tag,
               qint64 step,
               LoaderId loaderId,
               WorkerPool *pool);
    ~ImageEntry() override;

    EntryType type() const override { return EntryType::Image; }

    // Heavy decode. Runs on a pool thread; must not touch engine state.
    virtual ImageData materialize() const = 0;

    // The in-flight future for this entry, created on first request. The
    // caller connects to it and calls start().
    std::shared_ptr<DecodeFuture> readImageDataAsync();

    void close() override;

private:
    QPointer<WorkerPool> m_pool;
    QMutex m_futureMutex;
    std::shared_ptr<DecodeFuture> m_future;
};

} // namespace tfscope
