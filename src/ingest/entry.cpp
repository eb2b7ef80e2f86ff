#include "ingest/entry.hpp"

#include <algorithm>

#include <QMutexLocker>

#include "ingest/file_tracker.hpp"
#include "ingest/worker_pool.hpp"

namespace tfscope {

Entry::Entry(Tag tag)
    : m_tag(std::move(tag))
{
}

Entry::~Entry() = default;

void Entry::close()
{
}

PerStepEntry::PerStepEntry(std::weak_ptr<FileTracker> file,
                           qint64 offset,
                           Tag tag,
                           qint64 step,
                           LoaderId loaderId)
    : Entry(std::move(tag))
    , m_file(std::move(file))
    , m_offset(offset)
    , m_step(step)
    , m_loaderId(std::move(loaderId))
{
}

std::shared_ptr<FileTracker> PerStepEntry::file() const
{
    QMutexLocker locker(&m_fileMutex);
    return m_file.lock();
}

void PerStepEntry::close()
{
    QMutexLocker locker(&m_fileMutex);
    m_file.reset();
}

GlobalEntry::GlobalEntry(Tag tag)
    : Entry(std::move(tag))
{
}

ScalarEntry::ScalarEntry(Tag tag)
    : GlobalEntry(std::move(tag))
{
}

LoaderId ScalarEntry::seriesId(const LoaderId &loaderId)
{
    if (loaderId.empty()) {
        return loaderId;
    }
    return LoaderId{loaderId.front()};
}

std::vector<qint64> ScalarEntry::steps() const
{
    QMutexLocker locker(&m_mutex);
    return m_allSteps;
}

std::vector<qint64> ScalarEntry::steps(const LoaderId &loaderId) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_series.find(seriesId(loaderId));
    if (it == m_series.end()) {
        return {};
    }
    return it->second.steps;
}

std::vector<LoaderId> ScalarEntry::loaderIds() const
{
    QMutexLocker locker(&m_mutex);
    return m_loaderIds;
}

std::vector<double> ScalarEntry::values(const LoaderId &loaderId) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_series.find(seriesId(loaderId));
    if (it == m_series.end()) {
        return {};
    }
    return it->second.values;
}

size_t ScalarEntry::observationCount(const LoaderId &loaderId) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_series.find(seriesId(loaderId));
    return it == m_series.end() ? 0 : it->second.steps.size();
}

void ScalarEntry::addData(qint64 step, double value, const LoaderId &loaderId)
{
    const LoaderId series = seriesId(loaderId);
    int index = 0;
    {
        QMutexLocker locker(&m_mutex);
        auto allIt = std::lower_bound(m_allSteps.begin(), m_allSteps.end(), step);
        if (allIt == m_allSteps.end() || *allIt != step) {
            m_allSteps.insert(allIt, step);
        }

        auto [seriesIt, inserted] = m_series.try_emplace(series);
        if (inserted) {
            m_loaderIds.push_back(series);
        }
        Series &data = seriesIt->second;
        auto stepIt = std::upper_bound(data.steps.begin(), data.steps.end(), step);
        index = static_cast<int>(stepIt - data.steps.begin());
        data.steps.insert(stepIt, step);
        data.values.insert(data.values.begin() + index, value);
    }
    emit stepAdded(index, series);
}

void ScalarEntry::close()
{
    GlobalEntry::close();
    QMutexLocker locker(&m_mutex);
    m_series.clear();
    m_allSteps.clear();
    m_loaderIds.clear();
}

ImageEntry::ImageEntry(std::weak_ptr<FileTracker> file,
                       qint64 offset,
                       Tag tag,
                       qint64 step,
                       LoaderId loaderId,
                       WorkerPool *pool)
    : PerStepEntry(std::move(file), offset, std::move(tag), step, std::move(loaderId))
    , m_pool(pool)
{
}

ImageEntry::~ImageEntry() = default;

std::shared_ptr<DecodeFuture> ImageEntry::readImageDataAsync()
{
    QMutexLocker locker(&m_futureMutex);
    if (m_future) {
        return m_future;
    }

    std::weak_ptr<Entry> weakSelf = weak_from_this();
    m_future = DecodeFuture::create(
        [weakSelf]() -> ImageData {
            const auto self = std::static_pointer_cast<const ImageEntry>(weakSelf.lock());
            if (!self) {
                return Unavailable{};
            }
            return self->materialize();
        },
        m_pool.data(),
        QString::fromStdString(tagString()) + QStringLiteral("@") + QString::number(step()));

    DecodeFuture *raw = m_future.get();
    QObject::connect(raw, &DecodeFuture::done, raw, [weakSelf, raw]() {
        const auto self = std::static_pointer_cast<ImageEntry>(weakSelf.lock());
        if (!self) {
            return;
        }
        QMutexLocker futureLocker(&self->m_futureMutex);
        if (self->m_future.get() == raw) {
            self->m_future.reset();
        }
    }, Qt::DirectConnection);
    return m_future;
}

void ImageEntry::close()
{
    PerStepEntry::close();

    std::shared_ptr<DecodeFuture> pending;
    {
        QMutexLocker locker(&m_futureMutex);
        pending = std::move(m_future);
        m_future.reset();
    }
    if (pending) {
        pending->cancel();
    }
}

} // namespace tfscope
