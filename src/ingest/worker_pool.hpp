#pragma once

#include <memory>
#include <vector>

#include <QObject>
#include <QRecursiveMutex>
#include <QThreadPool>

namespace tfscope {

class DecodeFuture;

// Bounded pool shared by every entry of one engine. Keeps a submitted future
// alive until it is taken back off the queue or its run() has returned.
class WorkerPool : public QObject
{
    Q_OBJECT
public:
    explicit WorkerPool(int maxThreads, QObject *parent = nullptr);
    ~WorkerPool() override;

    // Returns false once the pool has been stopped.
    bool start(const std::shared_ptr<DecodeFuture> &future);
    // Best effort: removes the future from the queue if it has not started.
    bool cancel(DecodeFuture *future);

    // Cancels every queued and running future; the pool stays usable.
    void cancelAll();
    // cancelAll() and wait for the running ones; further start() calls fail.
    void stop();

    // Called by a future at the end of run().
    void release(DecodeFuture *future);

    int pendingCount() const;
    bool isStopped() const;
    int maxThreadCount() const;

private:
    void erasePending(DecodeFuture *future);

    QThreadPool m_threadPool;
    mutable QRecursiveMutex m_mutex;
    std::vector<std::shared_ptr<DecodeFuture>> m_pending;
    bool m_stopped = false;
};

} // namespace tfscope
