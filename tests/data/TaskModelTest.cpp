#include <QtTest/QtTest>

#include "tinytask/data/Task.hpp"
#include "tinytask/data/TaskCollection.hpp"
#include "tinytask/data/TaskStore.hpp"

using namespace tinytask::data;

class TaskModelTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesPriorities();
    void parsesDueDates();
    void normalizesTags();
    void nextIdFollowsMaximum();
    void findsById();
};

void TaskModelTest::parsesPriorities()
{
    QVERIFY(priorityFromString(QStringLiteral("low")) == Priority::Low);
    QVERIFY(priorityFromString(QStringLiteral(" HIGH ")) == Priority::High);
    QVERIFY(priorityFromString(QStringLiteral("Medium")) == Priority::Medium);
    QVERIFY(!priorityFromString(QStringLiteral("urgent")).has_value());
    QVERIFY(!priorityFromString(QString()).has_value());

    QCOMPARE(priorityToString(Priority::High), QStringLiteral("high"));
}

void TaskModelTest::parsesDueDates()
{
    QCOMPARE(dueDateFromString(QStringLiteral("2025-01-10")), QDate(2025, 1, 10));
    QCOMPARE(dueDateFromString(QStringLiteral("2024-02-29")), QDate(2024, 2, 29));
    QVERIFY(!dueDateFromString(QStringLiteral("2025-02-29")).isValid());
    QVERIFY(!dueDateFromString(QStringLiteral("2025-1-10")).isValid());
    QVERIFY(!dueDateFromString(QStringLiteral("tomorrow")).isValid());
    QVERIFY(!dueDateFromString(QString()).isValid());

    QCOMPARE(dueDateToString(QDate(2025, 3, 4)), QStringLiteral("2025-03-04"));
    QVERIFY(dueDateToString(QDate()).isEmpty());
}

void TaskModelTest::normalizesTags()
{
    const auto tags = normalizeTags({QStringLiteral("work"), QStringLiteral(" home "), QStringLiteral("work")});
    QVERIFY(tags.has_value());
    QCOMPARE(*tags, QStringList({QStringLiteral("work"), QStringLiteral("home")}));

    QVERIFY(normalizeTags({}).has_value());
    QVERIFY(!normalizeTags({QStringLiteral("ok"), QStringLiteral("  ")}).has_value());
}

void TaskModelTest::nextIdFollowsMaximum()
{
    TaskCollection collection;
    QCOMPARE(TaskStore::nextId(collection), 1);

    TaskItem first;
    first.id = 4;
    TaskItem second;
    second.id = 2;
    collection.active = {first, second};
    QCOMPARE(TaskStore::nextId(collection), 5);

    // Archived ids do not take part in allocation.
    TaskItem archived;
    archived.id = 40;
    collection.archived = {archived};
    QCOMPARE(TaskStore::nextId(collection), 5);
}

void TaskModelTest::findsById()
{
    TaskCollection collection;
    TaskItem task;
    task.id = 7;
    task.title = QStringLiteral("Seven");
    collection.active.push_back(task);

    QVERIFY(collection.contains(7));
    QVERIFY(!collection.contains(8));
    QCOMPARE(collection.findById(7)->title, QStringLiteral("Seven"));
    QVERIFY(collection.findById(8) == nullptr);
}

QTEST_GUILESS_MAIN(TaskModelTest)
#include "TaskModelTest.moc"
