#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <QUuid>

#include <memory>
#include <optional>

#include "version.h"

#include "taskstore/core/AppContext.hpp"
#include "taskstore/core/StorageError.hpp"
#include "taskstore/data/StorageBackend.hpp"
#include "taskstore/data/Task.hpp"
#include "taskstore/data/TaskJson.hpp"
#include "taskstore/data/TaskQuery.hpp"

using namespace taskstore;

namespace {
enum ExitCode
{
    ExitSuccess = 0,
    ExitStorageError = 1,
    ExitUsageError = 2,
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int usageError(const QString &message)
{
    err() << message << Qt::endl;
    return ExitUsageError;
}

int storageError(const core::StorageError &error)
{
    err() << error.toString() << Qt::endl;
    return ExitStorageError;
}

std::optional<QUuid> parseTaskId(const QStringList &arguments)
{
    if (arguments.size() < 2) {
        return std::nullopt;
    }
    const QUuid id = QUuid::fromString(arguments.at(1));
    if (id.isNull()) {
        return std::nullopt;
    }
    return id;
}

QString describe(const data::Task &task)
{
    QString line = task.id.toString(QUuid::WithoutBraces);
    line += QLatin1Char(' ') + data::statusToString(task.status);
    if (!task.project.isEmpty()) {
        line += QStringLiteral(" [%1]").arg(task.project);
    }
    line += QLatin1Char(' ') + task.description;
    QStringList tags = task.tags.values();
    tags.sort();
    for (const QString &tag : tags) {
        line += QStringLiteral(" +%1").arg(tag);
    }
    return line;
}

// Loads, edits and stores one task.
template <typename Edit>
int modifyTask(data::StorageBackend &backend, const QUuid &id, Edit edit)
{
    core::StorageError error;
    std::optional<data::Task> task = backend.loadTask(id, &error);
    if (!task) {
        if (!error.isValid()) {
            error = core::StorageError::notFound(
                QStringLiteral("no task %1").arg(id.toString(QUuid::WithoutBraces)));
        }
        return storageError(error);
    }
    edit(*task);
    if (!backend.saveTask(*task, &error)) {
        return storageError(error);
    }
    out() << describe(*task) << Qt::endl;
    return ExitSuccess;
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("taskstore"));
    QCoreApplication::setApplicationName(QStringLiteral("taskstore"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskStoreVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Local task store"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("add, list, done, delete, annotate, undo or export"));
    parser.addPositionalArgument(QStringLiteral("arguments"), QStringLiteral("Command arguments."),
                                 QStringLiteral("[arguments...]"));

    const QCommandLineOption projectOption(QStringList{QStringLiteral("p"), QStringLiteral("project")},
                                           QStringLiteral("Project of the task."), QStringLiteral("project"));
    const QCommandLineOption tagOption(QStringList{QStringLiteral("t"), QStringLiteral("tag")},
                                       QStringLiteral("Tag, may be repeated."), QStringLiteral("tag"));
    const QCommandLineOption statusOption(QStringLiteral("status"),
                                          QStringLiteral("Only list tasks with this status."),
                                          QStringLiteral("status"));
    const QCommandLineOption allContextsOption(QStringLiteral("all-contexts"),
                                               QStringLiteral("Ignore the active context."));
    parser.addOptions({projectOption, tagOption, statusOption, allContextsOption});

    if (!parser.parse(app.arguments())) {
        return usageError(parser.errorText());
    }
    if (parser.isSet(versionOption)) {
        parser.showVersion();
    }
    if (parser.isSet(helpOption)) {
        parser.showHelp(ExitSuccess);
    }

    const QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        return usageError(parser.helpText());
    }
    const QString command = arguments.constFirst();

    QSettings settings;
    core::StorageError error;
    std::unique_ptr<core::AppContext> context = core::AppContext::load(settings, &error);
    if (!context) {
        return storageError(error);
    }
    data::StorageBackend &backend = context->storageBackend();

    if (command == QLatin1String("add")) {
        const QString description = arguments.mid(1).join(QLatin1Char(' ')).trimmed();
        if (description.isEmpty()) {
            return usageError(QStringLiteral("add needs a description"));
        }
        data::Task task;
        task.description = description;
        task.modified = task.entry;
        task.project = parser.value(projectOption);
        for (const QString &tag : parser.values(tagOption)) {
            task.tags.insert(tag);
        }
        if (!backend.saveTask(task, &error)) {
            return storageError(error);
        }
        out() << QStringLiteral("Created task %1").arg(task.id.toString(QUuid::WithoutBraces)) << Qt::endl;
        return ExitSuccess;
    }

    if (command == QLatin1String("list")) {
        data::TaskQuery query;
        query.status = data::TaskStatus::Pending;
        if (parser.isSet(statusOption)) {
            const QString status = parser.value(statusOption);
            const QStringList known{QStringLiteral("pending"), QStringLiteral("completed"),
                                    QStringLiteral("deleted"), QStringLiteral("waiting"),
                                    QStringLiteral("recurring")};
            if (status == QLatin1String("all")) {
                query.status.reset();
            } else if (known.contains(status)) {
                query.status = data::statusFromString(status);
            } else {
                return usageError(QStringLiteral("unknown status '%1'").arg(status));
            }
        }
        if (parser.isSet(projectOption)) {
            query.project = data::ProjectFilter::hierarchy(parser.value(projectOption));
        }
        const QStringList tags = parser.values(tagOption);
        if (!tags.isEmpty()) {
            data::TagFilter filter;
            for (const QString &tag : tags) {
                filter.include.insert(tag);
            }
            query.tags = filter;
        }
        query.sort = data::SortCriteria{data::SortField::Entry, true};
        query.ignoreContext = parser.isSet(allContextsOption);

        const auto tasks = backend.queryTasks(query, context->activeContext(), &error);
        if (!tasks) {
            return storageError(error);
        }
        for (const data::Task &task : *tasks) {
            out() << describe(task) << Qt::endl;
        }
        return ExitSuccess;
    }

    if (command == QLatin1String("done")) {
        const auto id = parseTaskId(arguments);
        if (!id) {
            return usageError(QStringLiteral("done needs a task uuid"));
        }
        return modifyTask(backend, *id, [](data::Task &task) { task.complete(); });
    }

    if (command == QLatin1String("delete")) {
        const auto id = parseTaskId(arguments);
        if (!id) {
            return usageError(QStringLiteral("delete needs a task uuid"));
        }
        if (!backend.deleteTask(*id, &error)) {
            return storageError(error);
        }
        out() << QStringLiteral("Deleted task %1").arg(id->toString(QUuid::WithoutBraces)) << Qt::endl;
        return ExitSuccess;
    }

    if (command == QLatin1String("annotate")) {
        const auto id = parseTaskId(arguments);
        const QString text = arguments.mid(2).join(QLatin1Char(' ')).trimmed();
        if (!id || text.isEmpty()) {
            return usageError(QStringLiteral("annotate needs a task uuid and a text"));
        }
        return modifyTask(backend, *id, [&text](data::Task &task) {
            task.addAnnotation(data::Annotation{data::currentTimestamp(), text});
        });
    }

    if (command == QLatin1String("undo")) {
        bool undone = false;
        if (!backend.undo(&undone, &error)) {
            return storageError(error);
        }
        out() << (undone ? QStringLiteral("Undid the last change") : QStringLiteral("Nothing to undo")) << Qt::endl;
        return ExitSuccess;
    }

    if (command == QLatin1String("export")) {
        const auto tasks = backend.loadAllTasks(&error);
        if (!tasks) {
            return storageError(error);
        }
        out() << QString::fromUtf8(data::serializeTasks(*tasks));
        out().flush();
        return ExitSuccess;
    }

    return usageError(QStringLiteral("unknown command '%1'").arg(command));
}
