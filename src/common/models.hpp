#pragma once

#include <compare>
#include <string>
#include <variant>
#include <vector>

#include <QMetaType>
#include <QString>
#include <QtGlobal>

namespace tfscope {

// One segment of a tag path: a name or a trailing numeric index.
using TagPart = std::variant<std::string, qint64>;

// Hierarchical identity of a data stream, e.g. ("input", 3).
struct Tag {
    std::vector<TagPart> parts;

    std::string toString() const;

    bool operator==(const Tag &other) const = default;
    auto operator<=>(const Tag &other) const = default;
};

// Provenance chain: top-level source index, nested sub-source index, ...
using LoaderId = std::vector<int>;

enum class EntryType {
    Image,
    Scalar
};

enum class EngineState {
    Idle,
    Running,
    StopRequested,
    Stopped
};

Tag makeTag(std::initializer_list<TagPart> parts);

// Converts a raw summary tag into a Tag: a trailing "/image" is dropped and
// trailing "/<digits>" segments become numeric parts ("input/3/image" ->
// ("input", 3)).
Tag parseTagPath(const std::string &raw);

std::string toEntryTypeString(EntryType type);
std::string toEngineStateString(EngineState state);
QString loaderIdToString(const LoaderId &id);

} // namespace tfscope

Q_DECLARE_METATYPE(tfscope::Tag)
Q_DECLARE_METATYPE(tfscope::EntryType)
