#include <QtTest/QtTest>

#include "tinytask/core/Errors.hpp"
#include "tinytask/core/TaskEngine.hpp"

#include <limits>
#include <set>

using namespace tinytask;
using namespace tinytask::core;
using data::Priority;
using data::TaskCollection;
using data::TaskItem;

namespace {

const QDateTime Now(QDate(2025, 1, 5), QTime(10, 0), Qt::UTC);

NewTask titled(const QString &title)
{
    NewTask input;
    input.title = title;
    return input;
}

TaskCollection withTasks(const QStringList &titles)
{
    TaskCollection collection;
    for (const QString &title : titles) {
        collection = addTask(std::move(collection), titled(title), Now).collection;
    }
    return collection;
}

bool doneMatchesCompletedAt(const TaskCollection &collection)
{
    for (const auto &task : collection.active) {
        if (task.done != task.completedAt.isValid()) {
            return false;
        }
    }
    return true;
}

} // namespace

class TaskEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void addAssignsDefaults();
    void addValidatesInput_data();
    void addValidatesInput();
    void idsStayUniqueAcrossDeletes();
    void addFailsWhenIdsAreExhausted();
    void editChangesOnlySuppliedFields();
    void editClearsDueDateAndNote();
    void editWithInvalidPriorityLeavesTaskUnchanged();
    void editRejectsUnknownIdAndEmptyEdit();
    void setDoneCouplesCompletedAt();
    void setTagsReplacesAndClears();
    void deleteUnknownIdFails();
    void clearDoneOnlyKeepsPending();
    void clearAllEmptiesCollection();
    void archiveMovesDoneTasksOnce();
};

void TaskEngineTest::addAssignsDefaults()
{
    NewTask input = titled(QStringLiteral("  Buy milk "));
    input.tags = {QStringLiteral("home"), QStringLiteral("home"), QStringLiteral("errand")};
    input.note = QString();

    const auto result = addTask(TaskCollection{}, input, Now);
    QCOMPARE(result.task.id, 1);
    QCOMPARE(result.task.title, QStringLiteral("Buy milk"));
    QCOMPARE(result.task.priority, Priority::Medium);
    QCOMPARE(result.task.tags, QStringList({QStringLiteral("home"), QStringLiteral("errand")}));
    QVERIFY(!result.task.done);
    QVERIFY(!result.task.completedAt.isValid());
    QVERIFY(!result.task.dueDate.isValid());
    QVERIFY(!result.task.note.has_value());
    QCOMPARE(result.task.createdAt, Now);
    QCOMPARE(result.collection.active.size(), static_cast<size_t>(1));
    QVERIFY(result.collection.active.front() == result.task);
}

void TaskEngineTest::addValidatesInput_data()
{
    QTest::addColumn<QString>("title");
    QTest::addColumn<QString>("priority");
    QTest::addColumn<QString>("dueDate");
    QTest::addColumn<QStringList>("tags");

    QTest::newRow("empty title") << QString() << QStringLiteral("medium") << QString() << QStringList();
    QTest::newRow("blank title") << QStringLiteral("   ") << QStringLiteral("medium") << QString() << QStringList();
    QTest::newRow("bad priority") << QStringLiteral("Task") << QStringLiteral("urgent") << QString()
                                  << QStringList();
    QTest::newRow("bad date") << QStringLiteral("Task") << QStringLiteral("low") << QStringLiteral("2025-02-30")
                              << QStringList();
    QTest::newRow("empty tag") << QStringLiteral("Task") << QStringLiteral("low") << QString()
                               << QStringList({QStringLiteral("ok"), QString()});
}

void TaskEngineTest::addValidatesInput()
{
    QFETCH(QString, title);
    QFETCH(QString, priority);
    QFETCH(QString, dueDate);
    QFETCH(QStringList, tags);

    NewTask input;
    input.title = title;
    input.priority = priority;
    if (!dueDate.isEmpty()) {
        input.dueDate = dueDate;
    }
    input.tags = tags;

    const TaskCollection before = withTasks({QStringLiteral("Existing")});
    QVERIFY_EXCEPTION_THROWN(addTask(before, input, Now), ValidationError);
    QCOMPARE(before.active.size(), static_cast<size_t>(1));
}

void TaskEngineTest::idsStayUniqueAcrossDeletes()
{
    TaskCollection collection = withTasks({QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")});
    collection = deleteTask(std::move(collection), 2);
    auto added = addTask(collection, titled(QStringLiteral("d")), Now);
    QCOMPARE(added.task.id, 4);

    collection = deleteTask(std::move(added.collection), 4);
    added = addTask(collection, titled(QStringLiteral("e")), Now);
    QCOMPARE(added.task.id, 4);

    std::set<int> ids;
    for (const auto &task : added.collection.active) {
        ids.insert(task.id);
    }
    QCOMPARE(ids.size(), added.collection.active.size());
    QCOMPARE(*ids.rbegin(), added.task.id);
}

void TaskEngineTest::addFailsWhenIdsAreExhausted()
{
    TaskItem last;
    last.id = std::numeric_limits<int>::max();
    last.title = QStringLiteral("Last");
    last.createdAt = Now;
    TaskCollection collection;
    collection.active.push_back(last);

    QVERIFY_EXCEPTION_THROWN(addTask(collection, titled(QStringLiteral("One more")), Now), ValidationError);
    QCOMPARE(collection.active.size(), static_cast<size_t>(1));
}

void TaskEngineTest::editChangesOnlySuppliedFields()
{
    NewTask input = titled(QStringLiteral("Report"));
    input.tags = {QStringLiteral("work")};
    input.note = QStringLiteral("Draft");
    const auto added = addTask(TaskCollection{}, input, Now);

    TaskEdit edit;
    edit.priority = QStringLiteral("HIGH");
    edit.dueDate = QStringLiteral("2025-03-01");
    const auto edited = editTask(added.collection, 1, edit);

    const TaskItem &task = edited.active.front();
    QCOMPARE(task.priority, Priority::High);
    QCOMPARE(task.dueDate, QDate(2025, 3, 1));
    QCOMPARE(task.title, QStringLiteral("Report"));
    QCOMPARE(task.tags, QStringList({QStringLiteral("work")}));
    QVERIFY(task.note == QStringLiteral("Draft"));
    QCOMPARE(task.createdAt, added.task.createdAt);
    QCOMPARE(task.id, 1);
}

void TaskEngineTest::editClearsDueDateAndNote()
{
    NewTask input = titled(QStringLiteral("Report"));
    input.dueDate = QStringLiteral("2025-03-01");
    input.note = QStringLiteral("Draft");
    const auto added = addTask(TaskCollection{}, input, Now);

    TaskEdit edit;
    edit.dueDate = QString();
    edit.note = QString();
    const auto edited = editTask(added.collection, 1, edit);
    QVERIFY(!edited.active.front().dueDate.isValid());
    QVERIFY(!edited.active.front().note.has_value());
}

void TaskEngineTest::editWithInvalidPriorityLeavesTaskUnchanged()
{
    const TaskCollection collection = withTasks({QStringLiteral("Report")});

    TaskEdit edit;
    edit.title = QStringLiteral("Renamed");
    edit.priority = QStringLiteral("invalid");
    QVERIFY_EXCEPTION_THROWN(editTask(collection, 1, edit), ValidationError);

    QCOMPARE(collection.active.front().priority, Priority::Medium);
    QCOMPARE(collection.active.front().title, QStringLiteral("Report"));
}

void TaskEngineTest::editRejectsUnknownIdAndEmptyEdit()
{
    const TaskCollection collection = withTasks({QStringLiteral("Report")});

    TaskEdit edit;
    edit.title = QStringLiteral("Other");
    QVERIFY_EXCEPTION_THROWN(editTask(collection, 42, edit), NotFoundError);
    QVERIFY_EXCEPTION_THROWN(editTask(collection, 1, TaskEdit{}), ValidationError);
}

void TaskEngineTest::setDoneCouplesCompletedAt()
{
    TaskCollection collection = withTasks({QStringLiteral("a"), QStringLiteral("b")});

    collection = setDone(std::move(collection), 1, true, Now);
    QVERIFY(collection.findById(1)->done);
    QCOMPARE(collection.findById(1)->completedAt, Now);
    QVERIFY(doneMatchesCompletedAt(collection));

    // Marking it done again keeps the original completion time.
    collection = setDone(std::move(collection), 1, true, Now.addDays(1));
    QCOMPARE(collection.findById(1)->completedAt, Now);

    collection = setDone(std::move(collection), 1, false, Now);
    QVERIFY(!collection.findById(1)->done);
    QVERIFY(!collection.findById(1)->completedAt.isValid());
    QVERIFY(doneMatchesCompletedAt(collection));

    QVERIFY_EXCEPTION_THROWN(setDone(collection, 9, true, Now), NotFoundError);
}

void TaskEngineTest::setTagsReplacesAndClears()
{
    NewTask input = titled(QStringLiteral("Tagged"));
    input.tags = {QStringLiteral("old")};
    TaskCollection collection = addTask(TaskCollection{}, input, Now).collection;

    collection = setTags(std::move(collection), 1, {QStringLiteral("work"), QStringLiteral("urgent")});
    QCOMPARE(collection.findById(1)->tags, QStringList({QStringLiteral("work"), QStringLiteral("urgent")}));

    collection = setTags(std::move(collection), 1, {});
    QVERIFY(collection.findById(1)->tags.isEmpty());

    QVERIFY_EXCEPTION_THROWN(setTags(collection, 2, {QStringLiteral("x")}), NotFoundError);
}

void TaskEngineTest::deleteUnknownIdFails()
{
    const TaskCollection collection = withTasks({QStringLiteral("a"), QStringLiteral("b")});
    try {
        deleteTask(collection, 999);
        QFAIL("expected NotFoundError");
    } catch (const NotFoundError &error) {
        QCOMPARE(error.id(), 999);
    }
    QCOMPARE(collection.active.size(), static_cast<size_t>(2));
}

void TaskEngineTest::clearDoneOnlyKeepsPending()
{
    TaskCollection collection = withTasks({QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")});
    collection = setDone(std::move(collection), 1, true, Now);
    collection = setDone(std::move(collection), 3, true, Now);

    const auto cleared = clearTasks(collection, true);
    QCOMPARE(cleared.active.size(), static_cast<size_t>(1));
    QCOMPARE(cleared.active.front().id, 2);
    QCOMPARE(cleared.active.front().title, QStringLiteral("b"));
}

void TaskEngineTest::clearAllEmptiesCollection()
{
    const auto cleared = clearTasks(withTasks({QStringLiteral("a"), QStringLiteral("b")}), false);
    QVERIFY(cleared.active.empty());
}

void TaskEngineTest::archiveMovesDoneTasksOnce()
{
    TaskCollection collection = withTasks({QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")});
    collection = setDone(std::move(collection), 2, true, Now);

    const QDateTime archiveTime = Now.addDays(2);
    const auto first = archiveCompleted(collection, archiveTime);
    QCOMPARE(first.archived.size(), static_cast<size_t>(1));
    QCOMPARE(first.archived.front().id, 2);
    QCOMPARE(first.archived.front().completedAt, Now);
    QCOMPARE(first.archived.front().archivedAt, archiveTime);
    QCOMPARE(first.collection.active.size(), static_cast<size_t>(2));

    const auto second = archiveCompleted(first.collection, archiveTime);
    QVERIFY(second.archived.empty());
    QCOMPARE(second.collection.active.size(), first.collection.active.size());
    for (size_t i = 0; i < second.collection.active.size(); ++i) {
        QVERIFY(second.collection.active[i] == first.collection.active[i]);
    }
}

QTEST_GUILESS_MAIN(TaskEngineTest)
#include "TaskEngineTest.moc"
