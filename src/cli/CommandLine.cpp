#include "nullus/cli/CommandLine.hpp"

#include "nullus/Logging.hpp"

namespace nullus {
namespace cli {

namespace {
QCommandLineOption flag(const QStringList &names, const QString &description)
{
    return QCommandLineOption(names, description);
}
} // namespace

CommandLine::CommandLine()
    : m_helpOption(QStringList{ QStringLiteral("h"), QStringLiteral("help") },
                   QStringLiteral("Show this help."))
    , m_versionOption(QStringLiteral("version"), QStringLiteral("Show version information."))
    , m_verboseOption(QStringList{ QStringLiteral("v"), QStringLiteral("verbose") },
                      QStringLiteral("Print debug output of the task store."))
    , m_fileOption(QStringLiteral("file"),
                   QStringLiteral("Use PATH as task file instead of the configured one."),
                   QStringLiteral("PATH"))
{
    m_actions = {
        { Action::List, flag({ QStringLiteral("l"), QStringLiteral("list") },
                             QStringLiteral("List active task(s) matching REGEX; all if REGEX is left empty.")) },
        { Action::Add, flag({ QStringLiteral("a"), QStringLiteral("add") },
                            QStringLiteral("Add TASK(s).")) },
        { Action::Update, flag({ QStringLiteral("u"), QStringLiteral("update") },
                               QStringLiteral("Replace the description of task ID with DESC.")) },
        { Action::Done, flag({ QStringLiteral("d"), QStringLiteral("done") },
                             QStringLiteral("Toggle task(s) ID... between done and todo.")) },
        { Action::Schedule, flag({ QStringLiteral("s"), QStringLiteral("schedule") },
                                 QStringLiteral("Schedule task(s) ID... to DATE (YYYY-MM-DD).")) },
        { Action::Deadline, flag({ QStringLiteral("deadline") },
                                 QStringLiteral("Give task(s) ID... a deadline DATE (YYYY-MM-DD).")) },
        { Action::Pin, flag({ QStringLiteral("p"), QStringLiteral("pin") },
                            QStringLiteral("Toggle the pin of task(s) ID....")) },
        { Action::Delete, flag({ QStringLiteral("delete") },
                               QStringLiteral("Hide task(s) ID... and reassign task ids.")) },
        { Action::Prune, flag({ QStringLiteral("prune") },
                              QStringLiteral("Hide done task(s) and reassign task ids.")) },
        { Action::Purge, flag({ QStringLiteral("purge") },
                              QStringLiteral("Permanently remove stored task(s) ID... (see --dump).")) },
        { Action::Dump, flag({ QStringLiteral("dump") },
                             QStringLiteral("List active and hidden tasks.")) },
        { Action::DumpMatching, flag({ QStringLiteral("dumpr") },
                                     QStringLiteral("List active and hidden tasks matching REGEX.")) },
    };

    m_parser.setApplicationDescription(QStringLiteral("CLI to-do list"));
    m_parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsCompactedShortOptions);
    m_parser.addOption(m_helpOption);
    m_parser.addOption(m_versionOption);
    m_parser.addOption(m_verboseOption);
    m_parser.addOption(m_fileOption);
    for (const auto &entry : m_actions) {
        m_parser.addOption(entry.option);
    }
    m_parser.addPositionalArgument(QStringLiteral("operands"),
                                   QStringLiteral("TASK, ID, DATE or REGEX arguments of the chosen action."),
                                   QStringLiteral("[operands...]"));
}

ParsedCommand CommandLine::parse(const QStringList &arguments)
{
    ParsedCommand command;
    if (!m_parser.parse(arguments)) {
        command.error = m_parser.errorText();
        return command;
    }

    command.helpRequested = m_parser.isSet(m_helpOption);
    command.versionRequested = m_parser.isSet(m_versionOption);
    command.verbose = m_parser.isSet(m_verboseOption);
    command.storagePath = m_parser.value(m_fileOption);

    QStringList chosen;
    for (const auto &entry : m_actions) {
        if (m_parser.isSet(entry.option)) {
            command.action = entry.action;
            chosen << QStringLiteral("--%1").arg(entry.option.names().last());
        }
    }
    if (chosen.size() > 1) {
        command.action = Action::None;
        command.error = QStringLiteral("options %1 are mutually exclusive").arg(chosen.join(QStringLiteral(", ")));
        return command;
    }
    if (command.helpRequested || command.versionRequested) {
        return command;
    }

    const QStringList operands = m_parser.positionalArguments();
    if (!readOperands(operands, command)) {
        command.action = Action::None;
        return command;
    }
    if (command.action == Action::None) {
        command.helpRequested = true;
    }
    qCDebug(lcCli) << "parsed action" << static_cast<int>(command.action) << "with" << operands.size() << "operand(s)";
    return command;
}

QString CommandLine::helpText() const
{
    return m_parser.helpText();
}

bool CommandLine::readOperands(const QStringList &operands, ParsedCommand &command) const
{
    const int count = operands.size();
    switch (command.action) {
    case Action::None:
        if (count > 0) {
            command.error = QStringLiteral("no action given for '%1'").arg(operands.join(QLatin1Char(' ')));
            return false;
        }
        return true;
    case Action::List:
        if (count > 1) {
            command.error = QStringLiteral("--list takes at most one REGEX");
            return false;
        }
        command.pattern = operands.value(0);
        return true;
    case Action::Add:
        if (count == 0) {
            command.error = QStringLiteral("--add needs at least one TASK");
            return false;
        }
        command.descriptions = operands;
        return true;
    case Action::Update:
        if (count < 2) {
            command.error = QStringLiteral("--update needs ID and DESC");
            return false;
        }
        if (!readIds(operands.mid(0, 1), command)) {
            return false;
        }
        command.descriptions << operands.mid(1).join(QLatin1Char(' '));
        return true;
    case Action::Done:
    case Action::Pin:
    case Action::Delete:
    case Action::Purge:
        if (count == 0) {
            command.error = QStringLiteral("at least one task ID is required");
            return false;
        }
        return readIds(operands, command);
    case Action::Schedule:
    case Action::Deadline:
        if (count == 0) {
            command.error = QStringLiteral("DATE is required");
            return false;
        }
        command.date = operands.front();
        return readIds(operands.mid(1), command);
    case Action::Prune:
    case Action::Dump:
        if (count > 0) {
            command.error = QStringLiteral("unexpected argument '%1'").arg(operands.front());
            return false;
        }
        return true;
    case Action::DumpMatching:
        if (count != 1) {
            command.error = QStringLiteral("--dumpr needs exactly one REGEX");
            return false;
        }
        command.pattern = operands.front();
        return true;
    }
    return true;
}

bool CommandLine::readIds(const QStringList &operands, ParsedCommand &command)
{
    for (const QString &operand : operands) {
        bool ok = false;
        const int id = operand.toInt(&ok);
        if (!ok) {
            command.error = QStringLiteral("invalid task id '%1'").arg(operand);
            return false;
        }
        command.ids.push_back(id);
    }
    return true;
}

} // namespace cli
} // namespace nullus
