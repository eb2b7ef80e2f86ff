#pragma once

#include <functional>
#include <optional>
#include <vector>

#include <QString>
#include <QStringList>

#include "ingest/source_loader.hpp"

namespace tfscope {

struct SourceKind {
    QString name;
    std::function<bool(const QString &path)> appliesTo;
    std::function<Source(const QString &path, const LoaderId &id, const SourceOptions &options)> create;
};

// Maps a path to the source kind that can tail it. Kinds are tried in
// registration order and the first match wins.
class SourceRegistry {
public:
    void registerKind(SourceKind kind);

    std::optional<Source> resolve(const QString &path,
                                  const LoaderId &id,
                                  const SourceOptions &options) const;

    QStringList kindNames() const;
    bool isEmpty() const { return m_kinds.empty(); }

    // Event file, event directory, record file.
    static SourceRegistry withDefaultKinds();

private:
    std::vector<SourceKind> m_kinds;
};

} // namespace tfscope
