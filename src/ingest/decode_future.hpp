#pragma once

#include <functional>
#include <memory>

#include <QByteArray>
#include <QObject>
#include <QPointer>
#include <QRecursiveMutex>
#include <QRunnable>
#include <QString>

#include "ingest/image_data.hpp"

namespace tfscope {

class WorkerPool;

/**
 * DecodeFuture is one unit of heavy per-entry decode run on a WorkerPool.
 *
 * Created -> Started -> (Cancelled | Completed), or Created -> Cancelled.
 * done() fires exactly once per future; dataReady()/rawDataReady() fire at
 * most once and only when the work completed without cancellation or error.
 * The work body runs with the future's lock released so that cancel() from
 * the consumer thread is observed while the decode is in flight.
 */
class DecodeFuture : public QObject,
                     public QRunnable,
                     public std::enable_shared_from_this<DecodeFuture>
{
    Q_OBJECT
public:
    enum class State {
        Created,
        Started,
        Cancelled,
        Completed
    };

    using Work = std::function<ImageData()>;

    static std::shared_ptr<DecodeFuture> create(Work work,
                                                WorkerPool *pool,
                                                const QString &label = QString());

    ~DecodeFuture() override;

    void run() override;

    // Idempotent; submits the work to the pool on the first call.
    void start();
    // Idempotent; safe before, during and after start().
    void cancel();

    State state() const;
    bool isFinished() const;
    QString label() const { return m_label; }

signals:
    void done();
    void dataReady(const QByteArray &data);
    void rawDataReady(const QByteArray &data,
                      int width,
                      int height,
                      bool isColor,
                      const QString &description);

private:
    DecodeFuture(Work work, WorkerPool *pool, const QString &label);

    void execute();

    Work m_work;
    QPointer<WorkerPool> m_pool;
    QString m_label;

    mutable QRecursiveMutex m_mutex;
    State m_state = State::Created;
};

} // namespace tfscope
