#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QByteArray>

#include "common/models.hpp"
#include "ingest/entry.hpp"

namespace tfscope {

// One indexable value of an event record. Scalars carry their value; images
// are referenced by their position inside the record and decoded later.
struct DecodedValue {
    std::string tag;
    EntryType type = EntryType::Scalar;
    double scalar = 0.0;
    int valueIndex = 0;
};

struct DecodedEvent {
    qint64 step = 0;
    std::vector<DecodedValue> values;
};

// Decode capability for event logs. nullopt when the payload does not parse;
// records without a summary decode to an empty value list.
std::optional<DecodedEvent> decodeEventRecord(const QByteArray &record);

// Image stored in the summary of an event record.
class EventImageEntry : public ImageEntry {
public:
    EventImageEntry(std::weak_ptr<FileTracker> file,
                    qint64 offset,
                    int valueIndex,
                    Tag tag,
                    qint64 step,
                    LoaderId loaderId,
                    WorkerPool *pool);

    int valueIndex() const { return m_valueIndex; }

    ImageData materialize() const override;

private:
    int m_valueIndex = 0;
};

} // namespace tfscope
