#include <QCoreApplication>

#include "common/logging.hpp"
#include "common/tfscope_version.hpp"
#include "tail/TailCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tfscope-tail"));
    QCoreApplication::setApplicationVersion(QStringLiteral(TFSCOPE_VERSION));

    tfscope::TailCli cli;
    const int exitCode = cli.run(argc, argv);
    tfscope::logging::shutdownLogging();
    return exitCode;
}
