#pragma once

#include <memory>
#include <string>

#include <QRecursiveMutex>

#include "common/models.hpp"

namespace tfscope {

class Entry;
class WorkerPool;

// Mutation interface a source loader sees while polling. Implemented by the
// ingestion engine; index mutations must happen while holding indexMutex().
class IngestSink {
public:
    virtual ~IngestSink() = default;

    virtual bool isInterruptionRequested() const = 0;

    virtual QRecursiveMutex &indexMutex() = 0;

    virtual Tag tagToPath(const std::string &rawTag) = 0;
    virtual void addEntry(const std::shared_ptr<Entry> &entry) = 0;
    // Appends one observation to the tag's scalar series, creating it on
    // first sight.
    virtual void addScalar(const Tag &tag, qint64 step, double value, const LoaderId &loaderId) = 0;

    virtual WorkerPool *workerPool() = 0;

    // A nested source disappeared.
    virtual void removeLoader(const LoaderId &loaderId) = 0;
    // Called once per indexed record.
    virtual void nextIteration() = 0;
};

} // namespace tfscope
