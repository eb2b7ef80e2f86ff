#include "ingest/decode_future.hpp"

#include <QMutexLocker>

#include "common/logging.hpp"
#include "ingest/worker_pool.hpp"

namespace tfscope {

std::shared_ptr<DecodeFuture> DecodeFuture::create(Work work,
                                                   WorkerPool *pool,
                                                   const QString &label)
{
    // The last reference may drop on a pool thread; delete on the owning thread.
    return std::shared_ptr<DecodeFuture>(new DecodeFuture(std::move(work), pool, label),
                                         [](DecodeFuture *future) { future->deleteLater(); });
}

DecodeFuture::DecodeFuture(Work work, WorkerPool *pool, const QString &label)
    : m_work(std::move(work))
    , m_pool(pool)
    , m_label(label)
{
    setAutoDelete(false);
}

DecodeFuture::~DecodeFuture() = default;

void DecodeFuture::run()
{
    // The pool holds a reference until release().
    const auto self = shared_from_this();
    execute();
    if (!m_pool.isNull()) {
        m_pool->release(this);
    }
}

void DecodeFuture::execute()
{
    QMutexLocker locker(&m_mutex);
    if (m_state != State::Started) {
        return;
    }

    locker.unlock();
    ImageData result;
    QString failure;
    try {
        result = m_work();
    } catch (const std::exception &ex) {
        failure = QString::fromUtf8(ex.what());
    }
    locker.relock();

    if (m_state == State::Cancelled) {
        // cancel() already delivered done(); the result is discarded.
        TFS_LOG_DEBUG(QStringLiteral("DecodeFuture"),
                      QStringLiteral("run"),
                      QStringLiteral("decode_result_discarded"),
                      QStringLiteral("cancelled_in_flight"),
                      QStringLiteral("worker_pool"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"label", m_label.toStdString()}});
        return;
    }

    m_state = State::Completed;
    if (!failure.isEmpty()) {
        TFS_LOG_ERROR(QStringLiteral("DecodeFuture"),
                      QStringLiteral("run"),
                      QStringLiteral("decode_failed"),
                      QStringLiteral("materialize_threw"),
                      QStringLiteral("worker_pool"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"label", m_label.toStdString()},
                                     {"error", failure.toStdString()}});
    } else if (const auto *compressed = std::get_if<CompressedBlob>(&result)) {
        emit dataReady(compressed->bytes);
    } else if (const auto *raw = std::get_if<RawBlob>(&result)) {
        emit rawDataReady(raw->bytes, raw->width, raw->height, raw->isColor, raw->description);
    }
    emit done();
}

void DecodeFuture::start()
{
    QMutexLocker locker(&m_mutex);
    if (m_state != State::Created) {
        return;
    }

    m_state = State::Started;
    if (m_pool.isNull() || !m_pool->start(shared_from_this())) {
        m_state = State::Cancelled;
        TFS_LOG_WARN(QStringLiteral("DecodeFuture"),
                     QStringLiteral("start"),
                     QStringLiteral("decode_rejected"),
                     QStringLiteral("worker_pool_stopped"),
                     QStringLiteral("worker_pool"),
                     logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"label", m_label.toStdString()}});
        emit done();
    }
}

void DecodeFuture::cancel()
{
    QMutexLocker locker(&m_mutex);
    if (m_state == State::Cancelled || m_state == State::Completed) {
        return;
    }

    const bool submitted = m_state == State::Started;
    m_state = State::Cancelled;
    if (submitted && !m_pool.isNull()) {
        m_pool->cancel(this);
    }
    emit done();
}

DecodeFuture::State DecodeFuture::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_state;
}

bool DecodeFuture::isFinished() const
{
    QMutexLocker locker(&m_mutex);
    return m_state == State::Cancelled || m_state == State::Completed;
}

} // namespace tfscope
