#include "common/models.hpp"

#include <algorithm>
#include <cctype>

#include <QStringList>

namespace tfscope {

std::string Tag::toString() const
{
    std::string out;
    for (const auto &part : parts) {
        if (!out.empty()) {
            out += "/";
        }
        if (const auto *name = std::get_if<std::string>(&part)) {
            out += *name;
        } else {
            out += std::to_string(std::get<qint64>(part));
        }
    }
    return out;
}

Tag makeTag(std::initializer_list<TagPart> parts)
{
    return Tag{std::vector<TagPart>(parts)};
}

Tag parseTagPath(const std::string &raw)
{
    static const std::string kImageSuffix = "/image";

    std::string rest = raw;
    if (rest.size() >= kImageSuffix.size()
        && rest.compare(rest.size() - kImageSuffix.size(), kImageSuffix.size(), kImageSuffix) == 0) {
        rest.resize(rest.size() - kImageSuffix.size());
    }

    std::vector<TagPart> indices;
    while (true) {
        const size_t slash = rest.rfind('/');
        if (slash == std::string::npos || slash + 1 == rest.size()) {
            break;
        }
        const std::string tail = rest.substr(slash + 1);
        const bool numeric = std::all_of(tail.begin(), tail.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
        if (!numeric || tail.size() > 18) {
            break;
        }
        indices.insert(indices.begin(), static_cast<qint64>(std::stoll(tail)));
        rest.resize(slash);
    }

    Tag tag;
    tag.parts.reserve(indices.size() + 1);
    tag.parts.emplace_back(rest);
    tag.parts.insert(tag.parts.end(), indices.begin(), indices.end());
    return tag;
}

std::string toEntryTypeString(EntryType type)
{
    switch (type) {
    case EntryType::Image:
        return "image";
    case EntryType::Scalar:
        return "scalar";
    }
    return "image";
}

std::string toEngineStateString(EngineState state)
{
    switch (state) {
    case EngineState::Idle:
        return "idle";
    case EngineState::Running:
        return "running";
    case EngineState::StopRequested:
        return "stop_requested";
    case EngineState::Stopped:
        return "stopped";
    }
    return "idle";
}

QString loaderIdToString(const LoaderId &id)
{
    QStringList parts;
    for (int index : id) {
        parts << QString::number(index);
    }
    return QStringLiteral("(") + parts.join(QStringLiteral(",")) + QStringLiteral(")");
}

} // namespace tfscope
