#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "taskstore/replica/Replica.hpp"

using namespace taskstore;
using namespace taskstore::replica;

class ReplicaTest : public QObject
{
    Q_OBJECT

private slots:
    void createsStoreOnOpen();
    void readOnlyRequiresExistingStore();
    void readOnlyRejectsCommits();
    void createAndUpdate();
    void failedCommitRollsBack();
    void undoRevertsToLastUndoPoint();
    void undoRestoresDeletedTask();
    void undoWithEmptyLog();
};

void ReplicaTest::createsStoreOnOpen()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/store"));

    Replica replica;
    core::StorageError error;
    QVERIFY2(replica.open(path, Replica::AccessMode::ReadWrite, &error), qPrintable(error.toString()));
    QVERIFY(replica.isOpen());
    QCOMPARE(replica.directory(), path);
    QVERIFY(QFileInfo::exists(Replica::databasePath(path)));

    const auto count = replica.operationCount();
    QVERIFY(count.has_value());
    QCOMPARE(*count, 0);

    replica.close();
    QVERIFY(!replica.isOpen());
}

void ReplicaTest::readOnlyRequiresExistingStore()
{
    QTemporaryDir dir;
    Replica replica;
    core::StorageError error;
    QVERIFY(!replica.open(dir.filePath(QStringLiteral("missing")), Replica::AccessMode::ReadOnly, &error));
    QCOMPARE(error.kind(), core::StorageError::Kind::Database);
    QVERIFY(!replica.isOpen());
}

void ReplicaTest::readOnlyRejectsCommits()
{
    QTemporaryDir dir;
    {
        Replica writer;
        QVERIFY(writer.open(dir.path()));
    }

    Replica reader;
    QVERIFY(reader.open(dir.path(), Replica::AccessMode::ReadOnly));
    core::StorageError error;
    QVERIFY(!reader.commitOperations({ReplicaOperation::create(QUuid::createUuid())}, &error));
    QVERIFY(error.isValid());
}

void ReplicaTest::createAndUpdate()
{
    QTemporaryDir dir;
    Replica replica;
    QVERIFY(replica.open(dir.path()));

    const QUuid uuid = QUuid::createUuid();
    core::StorageError error;
    QVERIFY2(replica.commitOperations({ReplicaOperation::undoPoint(), ReplicaOperation::create(uuid),
                                       ReplicaOperation::update(uuid, QStringLiteral("description"),
                                                                QStringLiteral("Buy milk")),
                                       ReplicaOperation::update(uuid, QStringLiteral("status"),
                                                                QStringLiteral("pending"))},
                                      &error),
             qPrintable(error.toString()));

    auto fields = replica.taskFields(uuid);
    QVERIFY(fields.has_value());
    QCOMPARE(fields->value(QStringLiteral("description")), QStringLiteral("Buy milk"));
    QCOMPARE(fields->value(QStringLiteral("status")), QStringLiteral("pending"));

    QVERIFY(replica.commitOperations({ReplicaOperation::update(uuid, QStringLiteral("status"), std::nullopt)}));
    fields = replica.taskFields(uuid);
    QVERIFY(fields.has_value());
    QVERIFY(!fields->contains(QStringLiteral("status")));

    const auto all = replica.allTaskFields();
    QVERIFY(all.has_value());
    QCOMPARE(static_cast<int>(all->size()), 1);
    QCOMPARE(all->front().uuid, uuid);

    QVERIFY(!replica.taskFields(QUuid::createUuid(), &error).has_value());
}

void ReplicaTest::failedCommitRollsBack()
{
    QTemporaryDir dir;
    Replica replica;
    QVERIFY(replica.open(dir.path()));

    const QUuid created = QUuid::createUuid();
    const QUuid missing = QUuid::createUuid();
    core::StorageError error;
    QVERIFY(!replica.commitOperations({ReplicaOperation::undoPoint(), ReplicaOperation::create(created),
                                       ReplicaOperation::update(created, QStringLiteral("description"),
                                                                QStringLiteral("kept?")),
                                       ReplicaOperation::update(missing, QStringLiteral("description"),
                                                                QStringLiteral("nope"))},
                                      &error));
    QCOMPARE(error.kind(), core::StorageError::Kind::Database);

    core::StorageError readError;
    QVERIFY(!replica.taskFields(created, &readError).has_value());
    QVERIFY(!readError.isValid());
    QCOMPARE(*replica.operationCount(), 0);
}

void ReplicaTest::undoRevertsToLastUndoPoint()
{
    QTemporaryDir dir;
    Replica replica;
    QVERIFY(replica.open(dir.path()));

    const QUuid uuid = QUuid::createUuid();
    QVERIFY(replica.commitOperations({ReplicaOperation::undoPoint(), ReplicaOperation::create(uuid),
                                      ReplicaOperation::update(uuid, QStringLiteral("description"),
                                                               QStringLiteral("first"))}));
    QVERIFY(replica.commitOperations({ReplicaOperation::undoPoint(),
                                      ReplicaOperation::update(uuid, QStringLiteral("description"),
                                                               QStringLiteral("second")),
                                      ReplicaOperation::update(uuid, QStringLiteral("project"),
                                                               QStringLiteral("Home"))}));

    bool undone = false;
    QVERIFY(replica.undo(&undone));
    QVERIFY(undone);
    auto fields = replica.taskFields(uuid);
    QVERIFY(fields.has_value());
    QCOMPARE(fields->value(QStringLiteral("description")), QStringLiteral("first"));
    QVERIFY(!fields->contains(QStringLiteral("project")));

    QVERIFY(replica.undo(&undone));
    QVERIFY(undone);
    QVERIFY(!replica.taskFields(uuid).has_value());

    QVERIFY(replica.undo(&undone));
    QVERIFY(!undone);
}

void ReplicaTest::undoRestoresDeletedTask()
{
    QTemporaryDir dir;
    Replica replica;
    QVERIFY(replica.open(dir.path()));

    const QUuid uuid = QUuid::createUuid();
    QVERIFY(replica.commitOperations({ReplicaOperation::undoPoint(), ReplicaOperation::create(uuid),
                                      ReplicaOperation::update(uuid, QStringLiteral("description"),
                                                               QStringLiteral("keep me"))}));
    QVERIFY(replica.commitOperations({ReplicaOperation::undoPoint(), ReplicaOperation::remove(uuid)}));
    QVERIFY(!replica.taskFields(uuid).has_value());

    bool undone = false;
    QVERIFY(replica.undo(&undone));
    QVERIFY(undone);
    const auto fields = replica.taskFields(uuid);
    QVERIFY(fields.has_value());
    QCOMPARE(fields->value(QStringLiteral("description")), QStringLiteral("keep me"));
}

void ReplicaTest::undoWithEmptyLog()
{
    QTemporaryDir dir;
    Replica replica;
    QVERIFY(replica.open(dir.path()));
    QVERIFY(replica.commitOperations({ReplicaOperation::undoPoint()}));

    bool undone = true;
    QVERIFY(replica.undo(&undone));
    QVERIFY(!undone);
}

QTEST_GUILESS_MAIN(ReplicaTest)
#include "ReplicaTest.moc"
