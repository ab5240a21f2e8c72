#pragma once

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>
#include <vector>

namespace nullus {
namespace cli {

enum class Action
{
    None,
    List,
    Add,
    Update,
    Done,
    Schedule,
    Deadline,
    Pin,
    Delete,
    Prune,
    Purge,
    Dump,
    DumpMatching,
};

struct ParsedCommand
{
    Action action = Action::None;
    QString pattern;
    QStringList descriptions;
    QString date;
    std::vector<int> ids;

    QString storagePath;
    bool verbose = false;
    bool helpRequested = false;
    bool versionRequested = false;

    // Non-empty when the arguments could not be mapped to one action.
    QString error;
};

class CommandLine
{
public:
    CommandLine();

    // arguments[0] is the program name, as in QCoreApplication::arguments().
    ParsedCommand parse(const QStringList &arguments);
    QString helpText() const;

private:
    struct ActionOption
    {
        Action action;
        QCommandLineOption option;
    };

    bool readOperands(const QStringList &operands, ParsedCommand &command) const;
    static bool readIds(const QStringList &operands, ParsedCommand &command);

    QCommandLineParser m_parser;
    std::vector<ActionOption> m_actions;
    QCommandLineOption m_helpOption;
    QCommandLineOption m_versionOption;
    QCommandLineOption m_verboseOption;
    QCommandLineOption m_fileOption;
};

} // namespace cli
} // namespace nullus
