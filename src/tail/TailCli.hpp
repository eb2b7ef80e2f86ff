#pragma once

#include <QStringList>

namespace tfscope {

class TailCli
{
public:
    // Parses the command line, tails the paths until --once completes, the
    // sources are gone or the engine fails. Returns the process exit code:
    // 0 on success, 1 for usage errors, 2 when the engine failed.
    int run(int argc, char *argv[]);

private:
    QStringList expandPaths(const QStringList &args) const;
};

} // namespace tfscope
