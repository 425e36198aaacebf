#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "mocks/FakeReplica.hpp"

#include "taskstore/data/ReplicaStorageBackend.hpp"
#include "taskstore/replica/ReplicaActor.hpp"

using namespace taskstore;
using namespace taskstore::data;
using taskstore::tests::FakeReplica;

class ReplicaStorageBackendTest : public QObject
{
    Q_OBJECT

private slots:
    void writesNeedAReplica();
    void saveNewTaskCommitsCreate();
    void saveExistingTaskCommitsDiff();
    void saveTreatsReadErrorAsNewTask();
    void commitErrorIsReported();
    void deleteCommitsDeleteBatch();
    void initializeRequiresStore();
    void readsGoThroughTheStore();
    void resavingKeepsOneAnnotation_data();
    void resavingKeepsOneAnnotation();
    void queryAppliesContext();
    void undoDelegatesToReplica();
    void backupIsUnsupported();
};

void ReplicaStorageBackendTest::writesNeedAReplica()
{
    ReplicaStorageBackend backend(QStringLiteral("/nonexistent"));
    Task task;

    core::StorageError error;
    QVERIFY(!backend.saveTask(task, &error));
    QCOMPARE(error.kind(), core::StorageError::Kind::Configuration);
    QCOMPARE(error.message(), QStringLiteral("write path not configured"));

    error = core::StorageError();
    QVERIFY(!backend.deleteTask(task.id, &error));
    QCOMPARE(error.kind(), core::StorageError::Kind::Configuration);

    error = core::StorageError();
    QVERIFY(!backend.undo(nullptr, &error));
    QCOMPARE(error.kind(), core::StorageError::Kind::Configuration);
}

void ReplicaStorageBackendTest::saveNewTaskCommitsCreate()
{
    ReplicaStorageBackend backend(QStringLiteral("/unused"));
    auto fake = std::make_unique<FakeReplica>();
    FakeReplica *replica = fake.get();
    backend.setReplica(std::move(fake));

    Task task;
    task.description = QStringLiteral("Buy milk");
    QVERIFY(backend.saveTask(task));

    QCOMPARE(replica->reads, 1);
    QCOMPARE(static_cast<int>(replica->commits.size()), 1);
    const replica::OperationBatch &batch = replica->commits.front();
    QCOMPARE(static_cast<int>(batch.size()), 2);
    QVERIFY(replica::isUndoPoint(batch.at(0)));
    QVERIFY(std::holds_alternative<replica::CreateOp>(batch.at(1)));
}

void ReplicaStorageBackendTest::saveExistingTaskCommitsDiff()
{
    ReplicaStorageBackend backend(QStringLiteral("/unused"));
    auto fake = std::make_unique<FakeReplica>();
    FakeReplica *replica = fake.get();
    backend.setReplica(std::move(fake));

    Task task;
    task.description = QStringLiteral("Buy milk");
    replica->tasks.insert(task.id, task);

    Task updated = task;
    updated.tags.insert(QStringLiteral("errand"));
    QVERIFY(backend.saveTask(updated));

    const replica::OperationBatch expected{replica::UndoPointOp{},
                                           replica::AddTagOp{task.id, QStringLiteral("errand")}};
    QVERIFY(replica->commits.back() == expected);

    // Saving an unchanged task still commits a lone undo point.
    QVERIFY(backend.saveTask(updated));
    QCOMPARE(static_cast<int>(replica->commits.back().size()), 1);
}

void ReplicaStorageBackendTest::saveTreatsReadErrorAsNewTask()
{
    ReplicaStorageBackend backend(QStringLiteral("/unused"));
    auto fake = std::make_unique<FakeReplica>();
    FakeReplica *replica = fake.get();
    replica->readError = core::StorageError::database(QStringLiteral("read failed"));
    backend.setReplica(std::move(fake));

    Task task;
    task.description = QStringLiteral("fallback");
    core::StorageError error;
    QVERIFY2(backend.saveTask(task, &error), qPrintable(error.toString()));
    QVERIFY(!error.isValid());
    QVERIFY(std::holds_alternative<replica::CreateOp>(replica->commits.back().at(1)));
}

void ReplicaStorageBackendTest::commitErrorIsReported()
{
    ReplicaStorageBackend backend(QStringLiteral("/unused"));
    auto fake = std::make_unique<FakeReplica>();
    fake->commitError = core::StorageError::database(QStringLiteral("cannot map operation: invalid tag ''"));
    backend.setReplica(std::move(fake));

    core::StorageError error;
    QVERIFY(!backend.saveTask(Task(), &error));
    QCOMPARE(error.kind(), core::StorageError::Kind::Database);
    QVERIFY(error.message().startsWith(QStringLiteral("Failed to commit operations")));
    QVERIFY(error.message().contains(QStringLiteral("invalid tag")));
}

void ReplicaStorageBackendTest::deleteCommitsDeleteBatch()
{
    ReplicaStorageBackend backend(QStringLiteral("/unused"));
    auto fake = std::make_unique<FakeReplica>();
    FakeReplica *replica = fake.get();
    backend.setReplica(std::move(fake));

    const QUuid id = QUuid::createUuid();
    QVERIFY(backend.deleteTask(id));
    const replica::OperationBatch expected{replica::UndoPointOp{}, replica::DeleteOp{id}};
    QVERIFY(replica->commits.back() == expected);
}

void ReplicaStorageBackendTest::initializeRequiresStore()
{
    QTemporaryDir dir;
    ReplicaStorageBackend backend(dir.filePath(QStringLiteral("missing")));
    core::StorageError error;
    QVERIFY(!backend.initialize(&error));
    QVERIFY(error.isValid());

    QVERIFY(!backend.loadAllTasks(&error).has_value());
}

void ReplicaStorageBackendTest::readsGoThroughTheStore()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("replica"));

    core::StorageError error;
    auto wrapper = replica::openEmbeddedReplica(path, &error);
    QVERIFY2(wrapper, qPrintable(error.toString()));

    ReplicaStorageBackend backend(path);
    backend.setReplica(std::move(wrapper));
    QVERIFY2(backend.initialize(&error), qPrintable(error.toString()));

    Task task;
    task.description = QStringLiteral("Buy milk");
    task.project = QStringLiteral("Home");
    QVERIFY(backend.saveTask(task, &error));

    Task edited = task;
    edited.addTag(QStringLiteral("errand"));
    edited.addAnnotation(Annotation{QDateTime::fromSecsSinceEpoch(1700000000, Qt::UTC), QStringLiteral("2 litres")});
    QVERIFY2(backend.saveTask(edited, &error), qPrintable(error.toString()));

    const auto loaded = backend.loadTask(task.id, &error);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->description, QStringLiteral("Buy milk"));
    QCOMPARE(loaded->project, QStringLiteral("Home"));
    QCOMPARE(loaded->tags, QSet<QString>({QStringLiteral("errand")}));
    QCOMPARE(loaded->annotations.size(), 1);
    QCOMPARE(loaded->annotations.front().description, QStringLiteral("2 litres"));
    QCOMPARE(loaded->modified, edited.modified);

    core::StorageError missingError;
    QVERIFY(!backend.loadTask(QUuid::createUuid(), &missingError).has_value());
    QVERIFY(!missingError.isValid());

    QVERIFY(backend.deleteTask(task.id, &error));
    const auto all = backend.loadAllTasks(&error);
    QVERIFY(all.has_value());
    QCOMPARE(static_cast<int>(all->size()), 1);
    QCOMPARE(all->front().status, TaskStatus::Deleted);
}

void ReplicaStorageBackendTest::resavingKeepsOneAnnotation_data()
{
    QTest::addColumn<QDateTime>("entry");
    QTest::addColumn<QString>("text");

    QTest::newRow("sub-second entry") << QDateTime::fromMSecsSinceEpoch(1700000000123, Qt::UTC)
                                      << QStringLiteral("2 litres");
    QTest::newRow("multi-line text") << QDateTime::fromSecsSinceEpoch(1700000000, Qt::UTC)
                                     << QStringLiteral("first line\nsecond line");
}

void ReplicaStorageBackendTest::resavingKeepsOneAnnotation()
{
    QFETCH(QDateTime, entry);
    QFETCH(QString, text);

    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("replica"));
    auto wrapper = replica::openEmbeddedReplica(path);
    QVERIFY(wrapper);
    ReplicaStorageBackend backend(path);
    backend.setReplica(std::move(wrapper));

    Task task;
    task.description = QStringLiteral("Buy milk");
    task.addAnnotation(Annotation{entry, text});

    core::StorageError error;
    QVERIFY2(backend.saveTask(task, &error), qPrintable(error.toString()));
    QVERIFY2(backend.saveTask(task, &error), qPrintable(error.toString()));
    QVERIFY2(backend.saveTask(task, &error), qPrintable(error.toString()));

    const auto loaded = backend.loadTask(task.id, &error);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->annotations.size(), 1);
    QCOMPARE(loaded->annotations.front().entry, QDateTime::fromSecsSinceEpoch(1700000000, Qt::UTC));

    // Saving what was read back changes nothing either.
    QVERIFY(backend.saveTask(*loaded, &error));
    QCOMPARE(backend.loadTask(task.id)->annotations.size(), 1);
}

void ReplicaStorageBackendTest::queryAppliesContext()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("replica"));
    auto wrapper = replica::openEmbeddedReplica(path);
    QVERIFY(wrapper);

    ReplicaStorageBackend backend(path);
    backend.setReplica(std::move(wrapper));
    QVERIFY(backend.initialize());

    Task home;
    home.description = QStringLiteral("home");
    home.project = QStringLiteral("Home");
    Task work;
    work.description = QStringLiteral("work");
    work.project = QStringLiteral("Work");
    QVERIFY(backend.saveTask(home));
    QVERIFY(backend.saveTask(work));

    const UserContext context{QStringLiteral("w"), QStringLiteral("project:Work"), QStringLiteral("project:Work"), true};
    TaskQuery query;
    auto result = backend.queryTasks(query, &context);
    QVERIFY(result.has_value());
    QCOMPARE(static_cast<int>(result->size()), 1);
    QCOMPARE(result->front().id, work.id);

    query.ignoreContext = true;
    result = backend.queryTasks(query, &context);
    QVERIFY(result.has_value());
    QCOMPARE(static_cast<int>(result->size()), 2);
}

void ReplicaStorageBackendTest::undoDelegatesToReplica()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("replica"));
    auto wrapper = replica::openEmbeddedReplica(path);
    QVERIFY(wrapper);

    ReplicaStorageBackend backend(path);
    backend.setReplica(std::move(wrapper));

    Task task;
    task.description = QStringLiteral("oops");
    QVERIFY(backend.saveTask(task));
    QVERIFY(backend.deleteTask(task.id));

    bool undone = false;
    core::StorageError error;
    QVERIFY2(backend.undo(&undone, &error), qPrintable(error.toString()));
    QVERIFY(undone);
    const auto restored = backend.loadTask(task.id);
    QVERIFY(restored.has_value());
    QCOMPARE(restored->status, TaskStatus::Pending);
}

void ReplicaStorageBackendTest::backupIsUnsupported()
{
    ReplicaStorageBackend backend(QStringLiteral("/unused"));
    core::StorageError error;
    QVERIFY(!backend.backup(&error).has_value());
    QCOMPARE(error.kind(), core::StorageError::Kind::Unsupported);

    error = core::StorageError();
    QVERIFY(!backend.restore(QStringLiteral("[]"), &error));
    QCOMPARE(error.kind(), core::StorageError::Kind::Unsupported);
}

QTEST_GUILESS_MAIN(ReplicaStorageBackendTest)
#include "ReplicaStorageBackendTest.moc"
