#include "ingest/source_registry.hpp"

namespace tfscope {

namespace {

template <typename Loader>
SourceKind makeKind(const QString &name)
{
    SourceKind kind;
    kind.name = name;
    kind.appliesTo = &Loader::appliesTo;
    kind.create = [](const QString &path, const LoaderId &id, const SourceOptions &options) {
        return Source(std::in_place_type<Loader>, path, id, options);
    };
    return kind;
}

} // namespace

void SourceRegistry::registerKind(SourceKind kind)
{
    m_kinds.push_back(std::move(kind));
}

std::optional<Source> SourceRegistry::resolve(const QString &path,
                                              const LoaderId &id,
                                              const SourceOptions &options) const
{
    for (const auto &kind : m_kinds) {
        if (kind.appliesTo && kind.appliesTo(path)) {
            return kind.create(path, id, options);
        }
    }
    return std::nullopt;
}

QStringList SourceRegistry::kindNames() const
{
    QStringList names;
    for (const auto &kind : m_kinds) {
        names.append(kind.name);
    }
    return names;
}

SourceRegistry SourceRegistry::withDefaultKinds()
{
    SourceRegistry registry;
    registry.registerKind(makeKind<EventFileSource>(QStringLiteral("event_file")));
    registry.registerKind(makeKind<EventDirectorySource>(QStringLiteral("event_directory")));
    registry.registerKind(makeKind<RecordFileSource>(QStringLiteral("record_file")));
    return registry;
}

} // namespace tfscope
