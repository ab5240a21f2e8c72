#include <QtTest/QtTest>

#include "nullus/TaskError.hpp"
#include "nullus/core/AppContext.hpp"
#include "nullus/data/FileTaskRepository.hpp"
#include "nullus/data/InMemoryTaskRepository.hpp"

using namespace nullus;
using namespace nullus::core;
using nullus::data::TaskItem;

namespace {
QByteArray readAll(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}
} // namespace

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void savesOnlyAfterMutation();
    void failedCommandLeavesFileUntouched();
    void mutationsPersistAcrossSessions();
};

void AppContextTest::savesOnlyAfterMutation()
{
    data::InMemoryTaskRepository repo;
    AppContext context(repo);
    QCOMPARE(repo.loadCount(), 1);

    context.execute([](const std::vector<TaskItem> &tasks) { return listTasks(tasks, QString()); });
    QCOMPARE(repo.saveCount(), 0);

    const auto result = context.execute([](const std::vector<TaskItem> &tasks) {
        return addTasks(tasks, { QStringLiteral("buy milk") });
    });
    QVERIFY(result.mutated);
    QCOMPARE(repo.saveCount(), 1);
    QCOMPARE(context.tasks().size(), std::size_t(1));
    QCOMPARE(repo.loadCount(), 1);
    QCOMPARE(repo.load().front().description, QStringLiteral("buy milk"));
}

void AppContextTest::failedCommandLeavesFileUntouched()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.csv"));
    data::FileTaskRepository repo(path);
    {
        AppContext context(repo);
        context.execute([](const std::vector<TaskItem> &tasks) {
            return addTasks(tasks, { QStringLiteral("a"), QStringLiteral("b") });
        });
    }
    const QByteArray before = readAll(path);
    QVERIFY(!before.isEmpty());

    AppContext context(repo);
    QVERIFY_EXCEPTION_THROWN(context.execute([](const std::vector<TaskItem> &tasks) {
        return toggleDone(tasks, { 1, 3 });
    }),
                             NotFoundError);
    QVERIFY_EXCEPTION_THROWN(context.execute([](const std::vector<TaskItem> &tasks) {
        return scheduleTasks(tasks, QStringLiteral("2025-13-40"), { 1 });
    }),
                             ValidationError);
    QCOMPARE(readAll(path), before);
    QCOMPARE(context.tasks().size(), std::size_t(2));
}

void AppContextTest::mutationsPersistAcrossSessions()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    data::FileTaskRepository repo(dir.filePath(QStringLiteral("tasks.csv")));
    {
        AppContext context(repo);
        context.execute([](const std::vector<TaskItem> &tasks) {
            return addTasks(tasks, { QStringLiteral("first"), QStringLiteral("second") });
        });
    }
    {
        AppContext context(repo);
        context.execute([](const std::vector<TaskItem> &tasks) { return toggleDone(tasks, { 1 }); });
    }
    {
        AppContext context(repo);
        context.execute([](const std::vector<TaskItem> &tasks) { return pruneDone(tasks); });
    }

    AppContext context(repo);
    const auto listing = context.execute([](const std::vector<TaskItem> &tasks) { return listTasks(tasks, QString()); });
    QCOMPARE(listing.view.size(), std::size_t(1));
    QCOMPARE(listing.view.front().id, 1);
    QCOMPARE(listing.view.front().description, QStringLiteral("second"));

    const auto dump = context.execute([](const std::vector<TaskItem> &tasks) { return dumpTasks(tasks); });
    QCOMPARE(dump.view.size(), std::size_t(2));
    QVERIFY(!dump.view.back().visible);
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
