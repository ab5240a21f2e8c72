#include <QCoreApplication>
#include <QLoggingCategory>
#include <QString>
#include <QTextStream>

#include <cstdio>

#include "version.h"

#include "nullus/TaskError.hpp"
#include "nullus/cli/CommandLine.hpp"
#include "nullus/cli/CommandRunner.hpp"
#include "nullus/core/AppContext.hpp"
#include "nullus/data/DataProvider.hpp"

namespace {
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("nullus"));
    QCoreApplication::setApplicationName(QStringLiteral("nullus-todo"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kNullusTodoVersion));

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    QTextStream err(stderr);
    out.setCodec("UTF-8");
    err.setCodec("UTF-8");

    nullus::cli::CommandLine commandLine;
    const nullus::cli::ParsedCommand command = commandLine.parse(app.arguments());

    if (!command.error.isEmpty()) {
        err << "todo: " << command.error << '\n';
        err << commandLine.helpText();
        return kExitUsage;
    }
    if (command.helpRequested) {
        out << commandLine.helpText();
        return 0;
    }
    if (command.versionRequested) {
        out << "todo " << QCoreApplication::applicationVersion() << '\n';
        return 0;
    }
    if (command.verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("nullus.*.debug=true"));
    }

    try {
        nullus::data::DataProvider provider(command.storagePath);
        nullus::core::AppContext context(provider.taskRepository());
        out << nullus::cli::runCommand(context, command);
    } catch (const nullus::TaskError &error) {
        out.flush();
        err << "todo: error: " << error.message() << '\n';
        return kExitFailure;
    }
    return 0;
}
