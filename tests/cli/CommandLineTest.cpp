#include <QtTest/QtTest>

#include "nullus/TaskError.hpp"
#include "nullus/cli/CommandLine.hpp"
#include "nullus/cli/CommandRunner.hpp"
#include "nullus/core/AppContext.hpp"
#include "nullus/data/FileTaskRepository.hpp"

using namespace nullus;
using namespace nullus::cli;

namespace {
ParsedCommand parse(const QStringList &arguments)
{
    CommandLine commandLine;
    return commandLine.parse(QStringList{ QStringLiteral("todo") } + arguments);
}

QString run(data::TaskRepository &repo, const QStringList &arguments)
{
    const ParsedCommand command = parse(arguments);
    if (!command.error.isEmpty()) {
        return QStringLiteral("usage error: ") + command.error;
    }
    core::AppContext context(repo);
    return runCommand(context, command);
}
} // namespace

class CommandLineTest : public QObject
{
    Q_OBJECT

private slots:
    void noArgumentsRequestsHelp();
    void mapsActionsAndOperands_data();
    void mapsActionsAndOperands();
    void updateJoinsDescription();
    void rejectsConflictingActions();
    void rejectsBadOperands_data();
    void rejectsBadOperands();
    void readsGlobalOptions();
    void runsScenarioAgainstFile();
    void runReportsNotFound();
};

void CommandLineTest::noArgumentsRequestsHelp()
{
    const auto command = parse({});
    QVERIFY(command.error.isEmpty());
    QVERIFY(command.helpRequested);
    QVERIFY(command.action == Action::None);

    QVERIFY(parse({ QStringLiteral("--help") }).helpRequested);
    QVERIFY(CommandLine().helpText().contains(QStringLiteral("--dumpr")));
}

void CommandLineTest::mapsActionsAndOperands_data()
{
    QTest::addColumn<QStringList>("arguments");
    QTest::addColumn<int>("action");
    QTest::addColumn<QString>("pattern");
    QTest::addColumn<QStringList>("descriptions");
    QTest::addColumn<QString>("date");
    QTest::addColumn<QList<int>>("ids");

    QTest::newRow("list") << QStringList{ QStringLiteral("-l") } << int(Action::List)
                          << QString() << QStringList() << QString() << QList<int>();
    QTest::newRow("list regex") << QStringList{ QStringLiteral("--list"), QStringLiteral("milk|bread") }
                                << int(Action::List) << QStringLiteral("milk|bread") << QStringList() << QString()
                                << QList<int>();
    QTest::newRow("add") << QStringList{ QStringLiteral("-a"), QStringLiteral("buy milk"), QStringLiteral("call mom") }
                         << int(Action::Add) << QString()
                         << QStringList{ QStringLiteral("buy milk"), QStringLiteral("call mom") } << QString()
                         << QList<int>();
    QTest::newRow("done") << QStringList{ QStringLiteral("-d"), QStringLiteral("1"), QStringLiteral("3") }
                          << int(Action::Done) << QString() << QStringList() << QString() << QList<int>{ 1, 3 };
    QTest::newRow("schedule") << QStringList{ QStringLiteral("-s"), QStringLiteral("2025-01-01"), QStringLiteral("2") }
                              << int(Action::Schedule) << QString() << QStringList() << QStringLiteral("2025-01-01")
                              << QList<int>{ 2 };
    QTest::newRow("schedule no ids") << QStringList{ QStringLiteral("--schedule"), QStringLiteral("2025-01-01") }
                                     << int(Action::Schedule) << QString() << QStringList()
                                     << QStringLiteral("2025-01-01") << QList<int>();
    QTest::newRow("deadline") << QStringList{ QStringLiteral("--deadline"), QStringLiteral("2025-06-30"),
                                              QStringLiteral("1"), QStringLiteral("2") }
                              << int(Action::Deadline) << QString() << QStringList() << QStringLiteral("2025-06-30")
                              << QList<int>{ 1, 2 };
    QTest::newRow("pin") << QStringList{ QStringLiteral("-p"), QStringLiteral("4") } << int(Action::Pin) << QString()
                         << QStringList() << QString() << QList<int>{ 4 };
    QTest::newRow("delete") << QStringList{ QStringLiteral("--delete"), QStringLiteral("2") } << int(Action::Delete)
                            << QString() << QStringList() << QString() << QList<int>{ 2 };
    QTest::newRow("prune") << QStringList{ QStringLiteral("--prune") } << int(Action::Prune) << QString()
                           << QStringList() << QString() << QList<int>();
    QTest::newRow("purge") << QStringList{ QStringLiteral("--purge"), QStringLiteral("5") } << int(Action::Purge)
                           << QString() << QStringList() << QString() << QList<int>{ 5 };
    QTest::newRow("dump") << QStringList{ QStringLiteral("--dump") } << int(Action::Dump) << QString()
                          << QStringList() << QString() << QList<int>();
    QTest::newRow("dumpr") << QStringList{ QStringLiteral("--dumpr"), QStringLiteral("^old") }
                           << int(Action::DumpMatching) << QStringLiteral("^old") << QStringList() << QString()
                           << QList<int>();
}

void CommandLineTest::mapsActionsAndOperands()
{
    QFETCH(QStringList, arguments);
    QFETCH(int, action);
    QFETCH(QString, pattern);
    QFETCH(QStringList, descriptions);
    QFETCH(QString, date);
    QFETCH(QList<int>, ids);

    const auto command = parse(arguments);
    QVERIFY2(command.error.isEmpty(), qPrintable(command.error));
    QCOMPARE(int(command.action), action);
    QVERIFY(!command.helpRequested);
    QCOMPARE(command.pattern, pattern);
    QCOMPARE(command.descriptions, descriptions);
    QCOMPARE(command.date, date);
    QCOMPARE(QList<int>(command.ids.begin(), command.ids.end()), ids);
}

void CommandLineTest::updateJoinsDescription()
{
    const auto command = parse({ QStringLiteral("-u"), QStringLiteral("2"), QStringLiteral("buy"), QStringLiteral("oat milk") });
    QVERIFY(command.error.isEmpty());
    QVERIFY(command.action == Action::Update);
    QCOMPARE(command.ids, std::vector<int>{ 2 });
    QCOMPARE(command.descriptions, QStringList{ QStringLiteral("buy oat milk") });
}

void CommandLineTest::rejectsConflictingActions()
{
    const auto command = parse({ QStringLiteral("-l"), QStringLiteral("--prune") });
    QVERIFY(!command.error.isEmpty());
    QVERIFY(command.error.contains(QStringLiteral("mutually exclusive")));
    QVERIFY(command.action == Action::None);

    QVERIFY(!parse({ QStringLiteral("--dump"), QStringLiteral("--dumpr"), QStringLiteral("x") }).error.isEmpty());
}

void CommandLineTest::rejectsBadOperands_data()
{
    QTest::addColumn<QStringList>("arguments");

    QTest::newRow("unknown option") << QStringList{ QStringLiteral("--frobnicate") };
    QTest::newRow("operands without action") << QStringList{ QStringLiteral("buy milk") };
    QTest::newRow("add without task") << QStringList{ QStringLiteral("-a") };
    QTest::newRow("done without id") << QStringList{ QStringLiteral("-d") };
    QTest::newRow("done with word") << QStringList{ QStringLiteral("-d"), QStringLiteral("one") };
    QTest::newRow("update without desc") << QStringList{ QStringLiteral("-u"), QStringLiteral("1") };
    QTest::newRow("update bad id") << QStringList{ QStringLiteral("-u"), QStringLiteral("x"), QStringLiteral("y") };
    QTest::newRow("schedule without date") << QStringList{ QStringLiteral("-s") };
    QTest::newRow("list two patterns") << QStringList{ QStringLiteral("-l"), QStringLiteral("a"), QStringLiteral("b") };
    QTest::newRow("prune with operand") << QStringList{ QStringLiteral("--prune"), QStringLiteral("1") };
    QTest::newRow("dumpr without regex") << QStringList{ QStringLiteral("--dumpr") };
}

void CommandLineTest::rejectsBadOperands()
{
    QFETCH(QStringList, arguments);
    const auto command = parse(arguments);
    QVERIFY(!command.error.isEmpty());
    QVERIFY(command.action == Action::None);
}

void CommandLineTest::readsGlobalOptions()
{
    const auto command = parse({ QStringLiteral("--file"), QStringLiteral("/tmp/x.csv"), QStringLiteral("-v"),
                                 QStringLiteral("--dump") });
    QVERIFY(command.error.isEmpty());
    QCOMPARE(command.storagePath, QStringLiteral("/tmp/x.csv"));
    QVERIFY(command.verbose);
    QVERIFY(command.action == Action::Dump);

    QVERIFY(parse({ QStringLiteral("--version") }).versionRequested);
}

void CommandLineTest::runsScenarioAgainstFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    data::FileTaskRepository repo(dir.filePath(QStringLiteral("tasks.csv")));

    QCOMPARE(run(repo, { QStringLiteral("-l") }), QStringLiteral("No active tasks found.\n"));
    QCOMPARE(run(repo, { QStringLiteral("-a"), QStringLiteral("buy milk"), QStringLiteral("write report") }),
             QStringLiteral("Added 2 task(s).\n"));
    QCOMPARE(run(repo, { QStringLiteral("-d"), QStringLiteral("1") }),
             QStringLiteral("Marked 1 task(s) done, 0 reopened.\n"));
    QCOMPARE(run(repo, { QStringLiteral("--prune") }), QStringLiteral("Pruned 1 done task(s).\n"));

    QCOMPARE(run(repo, { QStringLiteral("-l") }),
             QStringLiteral("id  status  desc\n"
                            "--  ------  ------------\n"
                            "1   TODO    write report\n"));

    const QString dump = run(repo, { QStringLiteral("--dump") });
    QVERIFY(dump.contains(QStringLiteral("buy milk")));
    QVERIFY(dump.contains(QStringLiteral("false")));

    QCOMPARE(run(repo, { QStringLiteral("--purge"), QStringLiteral("2") }), QStringLiteral("Purged 1 task(s).\n"));
    QVERIFY(!run(repo, { QStringLiteral("--dump") }).contains(QStringLiteral("buy milk")));
}

void CommandLineTest::runReportsNotFound()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    data::FileTaskRepository repo(dir.filePath(QStringLiteral("tasks.csv")));
    run(repo, { QStringLiteral("-a"), QStringLiteral("one") });

    QVERIFY_EXCEPTION_THROWN(run(repo, { QStringLiteral("-p"), QStringLiteral("2") }), NotFoundError);
    QVERIFY_EXCEPTION_THROWN(run(repo, { QStringLiteral("-s"), QStringLiteral("2025-13-40"), QStringLiteral("1") }),
                             ValidationError);
}

QTEST_GUILESS_MAIN(CommandLineTest)
#include "CommandLineTest.moc"
