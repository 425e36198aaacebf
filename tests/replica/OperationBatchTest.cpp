#include <QtTest/QtTest>

#include "taskstore/replica/OperationBatch.hpp"

#include <algorithm>

using namespace taskstore;
using namespace taskstore::replica;

namespace {
data::Task sampleTask()
{
    data::Task task;
    task.description = QStringLiteral("Buy milk");
    task.project = QStringLiteral("Home");
    task.tags = {QStringLiteral("errand"), QStringLiteral("shop")};
    return task;
}

template <typename Op>
std::vector<Op> collect(const OperationBatch &batch)
{
    std::vector<Op> result;
    for (const Operation &operation : batch) {
        if (const auto *op = std::get_if<Op>(&operation)) {
            result.push_back(*op);
        }
    }
    return result;
}
} // namespace

class OperationBatchTest : public QObject
{
    Q_OBJECT

private slots:
    void tagDiffIsSymmetricDifference();
    void unchangedTaskProducesNoOps();
    void saveBatchForNewTask();
    void saveBatchForUnchangedTask();
    void deleteBatch();
    void coarseFieldsUseUpdate();
    void newAnnotationsOnly();
    void annotationsComparedInStoredForm();
    void dependencyDiff();
    void scalarFieldsSetAndUnset();
    void udaChanges();
    void udaNamedLikeFieldIsIgnored();
};

void OperationBatchTest::tagDiffIsSymmetricDifference()
{
    const data::Task old = sampleTask();
    data::Task updated = old;
    updated.tags = {QStringLiteral("shop"), QStringLiteral("home"), QStringLiteral("weekend")};

    const OperationBatch ops = computeUpdateOps(old, updated);
    QCOMPARE(static_cast<int>(ops.size()), 3);

    const auto added = collect<AddTagOp>(ops);
    const auto removed = collect<RemoveTagOp>(ops);
    QCOMPARE(static_cast<int>(added.size()), 2);
    QCOMPARE(static_cast<int>(removed.size()), 1);

    QSet<QString> addedTags;
    for (const AddTagOp &op : added) {
        QCOMPARE(op.uuid, old.id);
        addedTags.insert(op.tag);
    }
    QCOMPARE(addedTags, QSet<QString>({QStringLiteral("home"), QStringLiteral("weekend")}));
    QCOMPARE(removed.front().tag, QStringLiteral("errand"));
}

void OperationBatchTest::unchangedTaskProducesNoOps()
{
    const data::Task task = sampleTask();
    QVERIFY(computeUpdateOps(task, task).empty());
}

void OperationBatchTest::saveBatchForNewTask()
{
    const data::Task task = sampleTask();
    const OperationBatch batch = buildSaveBatch(std::nullopt, task);

    QCOMPARE(static_cast<int>(batch.size()), 2);
    QVERIFY(isUndoPoint(batch.at(0)));
    const auto *create = std::get_if<CreateOp>(&batch.at(1));
    QVERIFY(create);
    QCOMPARE(create->uuid, task.id);
    QCOMPARE(create->data.value(QStringLiteral("description")).toString(), QStringLiteral("Buy milk"));
    QCOMPARE(create->data.value(QStringLiteral("project")).toString(), QStringLiteral("Home"));
}

void OperationBatchTest::saveBatchForUnchangedTask()
{
    const data::Task task = sampleTask();
    const OperationBatch batch = buildSaveBatch(task, task);
    QCOMPARE(static_cast<int>(batch.size()), 1);
    QVERIFY(isUndoPoint(batch.front()));
}

void OperationBatchTest::deleteBatch()
{
    const QUuid id = QUuid::createUuid();
    const OperationBatch expected{UndoPointOp{}, DeleteOp{id}};
    QVERIFY(buildDeleteBatch(id) == expected);
    QCOMPARE(static_cast<int>(buildDeleteBatch(QUuid()).size()), 2);
}

void OperationBatchTest::coarseFieldsUseUpdate()
{
    const data::Task old = sampleTask();
    data::Task updated = old;
    updated.description = QStringLiteral("Buy oat milk");
    updated.project.clear();
    updated.status = data::TaskStatus::Completed;

    const auto updates = collect<UpdateOp>(computeUpdateOps(old, updated));
    QCOMPARE(static_cast<int>(updates.size()), 3);

    const auto find = [&updates](const QString &key) {
        return std::find_if(updates.begin(), updates.end(), [&key](const UpdateOp &op) { return op.key == key; });
    };

    const auto description = find(QStringLiteral("description"));
    QVERIFY(description != updates.end());
    QCOMPARE(description->oldValue.toString(), QStringLiteral("Buy milk"));
    QCOMPARE(description->newValue.toString(), QStringLiteral("Buy oat milk"));

    const auto project = find(QStringLiteral("project"));
    QVERIFY(project != updates.end());
    QVERIFY(project->newValue.isNull());

    const auto status = find(QStringLiteral("status"));
    QVERIFY(status != updates.end());
    QCOMPARE(status->newValue.toString(), QStringLiteral("completed"));
}

void OperationBatchTest::newAnnotationsOnly()
{
    data::Task old = sampleTask();
    const QDateTime first = QDateTime::fromSecsSinceEpoch(1700000000, Qt::UTC);
    old.annotations.append(data::Annotation{first, QStringLiteral("first")});

    data::Task updated = old;
    const QDateTime second = first.addSecs(60);
    updated.annotations.append(data::Annotation{second, QStringLiteral("second")});

    const OperationBatch ops = computeUpdateOps(old, updated);
    QCOMPARE(static_cast<int>(ops.size()), 1);
    const auto *annotation = std::get_if<AddAnnotationOp>(&ops.front());
    QVERIFY(annotation);
    QCOMPARE(annotation->entry, second);
    QCOMPARE(annotation->description, QStringLiteral("second"));

    // Removals are not represented.
    data::Task trimmed = old;
    trimmed.annotations.clear();
    QVERIFY(computeUpdateOps(old, trimmed).empty());
}

void OperationBatchTest::annotationsComparedInStoredForm()
{
    // What the store hands back: whole seconds, newlines folded to spaces.
    data::Task stored = sampleTask();
    stored.annotations.append(data::Annotation{QDateTime::fromSecsSinceEpoch(1700000000, Qt::UTC),
                                               QStringLiteral("2 litres")});
    stored.annotations.append(data::Annotation{QDateTime::fromSecsSinceEpoch(1700000100, Qt::UTC),
                                               QStringLiteral("first line second line")});

    data::Task edited = stored;
    edited.annotations[0].entry = QDateTime::fromMSecsSinceEpoch(1700000000750, Qt::UTC);
    edited.annotations[1].description = QStringLiteral("first line\nsecond line");
    QVERIFY(computeUpdateOps(stored, edited).empty());

    // The same new annotation twice is added once.
    const data::Annotation note{QDateTime::fromSecsSinceEpoch(1700000200, Qt::UTC), QStringLiteral("note")};
    edited.annotations.append(note);
    edited.annotations.append(note);
    QCOMPARE(static_cast<int>(collect<AddAnnotationOp>(computeUpdateOps(stored, edited)).size()), 1);
}

void OperationBatchTest::dependencyDiff()
{
    const QUuid keep = QUuid::createUuid();
    const QUuid drop = QUuid::createUuid();
    const QUuid add = QUuid::createUuid();

    data::Task old = sampleTask();
    old.depends = {keep, drop};
    data::Task updated = old;
    updated.depends = {keep, add};

    const OperationBatch ops = computeUpdateOps(old, updated);
    QCOMPARE(static_cast<int>(ops.size()), 2);
    const auto added = collect<AddDependencyOp>(ops);
    const auto removed = collect<RemoveDependencyOp>(ops);
    QCOMPARE(static_cast<int>(added.size()), 1);
    QCOMPARE(static_cast<int>(removed.size()), 1);
    QCOMPARE(added.front().dependsOn, add);
    QCOMPARE(removed.front().dependsOn, drop);
}

void OperationBatchTest::scalarFieldsSetAndUnset()
{
    data::Task old = sampleTask();
    old.due = QDateTime::fromSecsSinceEpoch(1700000000, Qt::UTC);

    data::Task updated = old;
    updated.due = QDateTime();
    updated.priority = data::Priority::High;

    const OperationBatch ops = computeUpdateOps(old, updated);
    const auto sets = collect<SetFieldOp>(ops);
    const auto unsets = collect<UnsetFieldOp>(ops);
    QCOMPARE(static_cast<int>(sets.size()), 1);
    QCOMPARE(static_cast<int>(unsets.size()), 1);
    QCOMPARE(sets.front().key, QStringLiteral("priority"));
    QCOMPARE(sets.front().value, QStringLiteral("H"));
    QCOMPARE(unsets.front().key, QStringLiteral("due"));
}

void OperationBatchTest::udaChanges()
{
    data::Task old = sampleTask();
    old.udas.insert(QStringLiteral("estimate"), 2.0);
    old.udas.insert(QStringLiteral("client"), QStringLiteral("acme"));

    data::Task updated = old;
    updated.udas.insert(QStringLiteral("estimate"), 3.5);
    updated.udas.remove(QStringLiteral("client"));

    const OperationBatch ops = computeUpdateOps(old, updated);
    const auto sets = collect<SetFieldOp>(ops);
    const auto unsets = collect<UnsetFieldOp>(ops);
    QCOMPARE(static_cast<int>(sets.size()), 1);
    QCOMPARE(sets.front().key, QStringLiteral("estimate"));
    QCOMPARE(sets.front().value, QStringLiteral("3.5"));
    QCOMPARE(static_cast<int>(unsets.size()), 1);
    QCOMPARE(unsets.front().key, QStringLiteral("client"));
}

void OperationBatchTest::udaNamedLikeFieldIsIgnored()
{
    data::Task old = sampleTask();
    data::Task updated = old;
    updated.udas.insert(QStringLiteral("description"), QStringLiteral("shadow"));
    updated.udas.insert(QStringLiteral("urgency"), 9.0);
    QVERIFY(computeUpdateOps(old, updated).empty());
    QVERIFY(computeUpdateOps(updated, old).empty());
}

QTEST_GUILESS_MAIN(OperationBatchTest)
#include "OperationBatchTest.moc"
