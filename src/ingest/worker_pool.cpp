#include "ingest/worker_pool.hpp"

#include <algorithm>

#include <QMutexLocker>
#include <QThread>

#include "common/logging.hpp"
#include "ingest/decode_future.hpp"

namespace tfscope {

WorkerPool::WorkerPool(int maxThreads, QObject *parent)
    : QObject(parent)
{
    m_threadPool.setMaxThreadCount(maxThreads > 0 ? maxThreads : QThread::idealThreadCount());
}

WorkerPool::~WorkerPool()
{
    stop();
}

bool WorkerPool::start(const std::shared_ptr<DecodeFuture> &future)
{
    QMutexLocker locker(&m_mutex);
    if (m_stopped) {
        return false;
    }

    m_pending.push_back(future);
    m_threadPool.start(future.get());
    return true;
}

bool WorkerPool::cancel(DecodeFuture *future)
{
    QMutexLocker locker(&m_mutex);
    if (!m_threadPool.tryTake(future)) {
        // Already running; release() drops it when run() returns.
        return false;
    }
    erasePending(future);
    return true;
}

void WorkerPool::release(DecodeFuture *future)
{
    QMutexLocker locker(&m_mutex);
    erasePending(future);
}

void WorkerPool::cancelAll()
{
    std::vector<std::shared_ptr<DecodeFuture>> pending;
    {
        QMutexLocker locker(&m_mutex);
        pending = m_pending;
    }

    // Futures take their own lock first and then ours; never call into them
    // while holding m_mutex.
    for (const auto &future : pending) {
        future->cancel();
    }
}

void WorkerPool::stop()
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_stopped) {
            return;
        }
        m_stopped = true;
    }

    cancelAll();
    m_threadPool.waitForDone();

    QMutexLocker locker(&m_mutex);
    if (!m_pending.empty()) {
        TFS_LOG_WARN(QStringLiteral("WorkerPool"),
                     QStringLiteral("stop"),
                     QStringLiteral("futures_still_pending"),
                     QStringLiteral("shutdown"),
                     QStringLiteral("wait_for_done"),
                     logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"pending", m_pending.size()}});
        m_pending.clear();
    }
}

int WorkerPool::pendingCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_pending.size());
}

bool WorkerPool::isStopped() const
{
    QMutexLocker locker(&m_mutex);
    return m_stopped;
}

int WorkerPool::maxThreadCount() const
{
    return m_threadPool.maxThreadCount();
}

void WorkerPool::erasePending(DecodeFuture *future)
{
    auto it = std::find_if(m_pending.begin(), m_pending.end(),
                           [future](const auto &pending) { return pending.get() == future; });
    if (it != m_pending.end()) {
        m_pending.erase(it);
    }
}

} // namespace tfscope
