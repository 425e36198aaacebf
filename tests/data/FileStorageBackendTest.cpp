#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "taskstore/data/FileStorageBackend.hpp"

using namespace taskstore;
using namespace taskstore::data;

class FileStorageBackendTest : public QObject
{
    Q_OBJECT

private slots:
    void saveAndLoad();
    void persistsAcrossInstances();
    void deleteMissingTaskIsNotFound();
    void overwriteKeepsBackup();
    void queryFiltersTasks();
    void backupAndRestore();
    void restoreRejectsGarbage();
    void undoIsUnsupported();
};

void FileStorageBackendTest::saveAndLoad()
{
    QTemporaryDir dir;
    FileStorageBackend backend(dir.path());
    core::StorageError error;
    QVERIFY2(backend.initialize(&error), qPrintable(error.toString()));

    Task task;
    task.description = QStringLiteral("Buy milk");
    task.tags = {QStringLiteral("errand")};
    QVERIFY(backend.saveTask(task, &error));

    const auto loaded = backend.loadTask(task.id, &error);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->description, QStringLiteral("Buy milk"));
    QCOMPARE(loaded->tags, task.tags);

    QVERIFY(!backend.loadTask(QUuid::createUuid(), &error).has_value());

    QVERIFY(backend.deleteTask(task.id, &error));
    QVERIFY(!backend.loadTask(task.id).has_value());
}

void FileStorageBackendTest::persistsAcrossInstances()
{
    QTemporaryDir dir;
    Task task;
    task.description = QStringLiteral("Persist me");
    {
        FileStorageBackend backend(dir.path());
        QVERIFY(backend.initialize());
        QVERIFY(backend.saveTask(task));
    }

    FileStorageBackend reader(dir.path());
    // Reads before initialize() go to the file.
    const auto all = reader.loadAllTasks();
    QVERIFY(all.has_value());
    QCOMPARE(static_cast<int>(all->size()), 1);
    QCOMPARE(all->front().id, task.id);
}

void FileStorageBackendTest::deleteMissingTaskIsNotFound()
{
    QTemporaryDir dir;
    FileStorageBackend backend(dir.path());
    QVERIFY(backend.initialize());

    core::StorageError error;
    QVERIFY(!backend.deleteTask(QUuid::createUuid(), &error));
    QCOMPARE(error.kind(), core::StorageError::Kind::NotFound);
}

void FileStorageBackendTest::overwriteKeepsBackup()
{
    QTemporaryDir dir;
    FileStorageBackend backend(dir.path());
    QVERIFY(backend.initialize());

    Task first;
    first.description = QStringLiteral("first");
    QVERIFY(backend.saveTask(first));
    Task second;
    second.description = QStringLiteral("second");
    QVERIFY(backend.saveTask(second));

    QVERIFY(QFile::exists(backend.tasksFilePath()));
    const QStringList backups = QDir(backend.backupDirectory()).entryList({QStringLiteral("tasks_*.json")}, QDir::Files);
    QVERIFY(!backups.isEmpty());
}

void FileStorageBackendTest::queryFiltersTasks()
{
    QTemporaryDir dir;
    FileStorageBackend backend(dir.path());
    QVERIFY(backend.initialize());

    Task home;
    home.description = QStringLiteral("home");
    home.project = QStringLiteral("Home");
    Task work;
    work.description = QStringLiteral("work");
    work.project = QStringLiteral("Work");
    QVERIFY(backend.saveTask(home));
    QVERIFY(backend.saveTask(work));

    TaskQuery query;
    query.project = ProjectFilter::exact(QStringLiteral("Work"));
    const auto result = backend.queryTasks(query);
    QVERIFY(result.has_value());
    QCOMPARE(static_cast<int>(result->size()), 1);
    QCOMPARE(result->front().id, work.id);
}

void FileStorageBackendTest::backupAndRestore()
{
    QTemporaryDir dir;
    FileStorageBackend backend(dir.path());
    QVERIFY(backend.initialize());

    const auto empty = backend.backup();
    QVERIFY(empty.has_value());
    QVERIFY(empty->isEmpty());

    Task task;
    task.description = QStringLiteral("snapshot");
    QVERIFY(backend.saveTask(task));
    const auto snapshot = backend.backup();
    QVERIFY(snapshot.has_value());
    QVERIFY(snapshot->contains(QStringLiteral("snapshot")));

    QVERIFY(backend.deleteTask(task.id));
    QVERIFY(!backend.loadTask(task.id).has_value());

    core::StorageError error;
    QVERIFY2(backend.restore(*snapshot, &error), qPrintable(error.toString()));
    const auto restored = backend.loadTask(task.id);
    QVERIFY(restored.has_value());
    QCOMPARE(restored->description, QStringLiteral("snapshot"));

    // Empty backup data is accepted and changes nothing.
    QVERIFY(backend.restore(QString()));
    QVERIFY(backend.loadTask(task.id).has_value());
}

void FileStorageBackendTest::restoreRejectsGarbage()
{
    QTemporaryDir dir;
    FileStorageBackend backend(dir.path());
    QVERIFY(backend.initialize());

    Task task;
    QVERIFY(backend.saveTask(task));

    core::StorageError error;
    QVERIFY(!backend.restore(QStringLiteral("{\"not\": \"an array\"}"), &error));
    QCOMPARE(error.kind(), core::StorageError::Kind::Serialization);
    QVERIFY(backend.loadTask(task.id).has_value());
}

void FileStorageBackendTest::undoIsUnsupported()
{
    QTemporaryDir dir;
    FileStorageBackend backend(dir.path());
    bool undone = true;
    core::StorageError error;
    QVERIFY(!backend.undo(&undone, &error));
    QVERIFY(!undone);
    QCOMPARE(error.kind(), core::StorageError::Kind::Unsupported);
}

QTEST_GUILESS_MAIN(FileStorageBackendTest)
#include "FileStorageBackendTest.moc"
