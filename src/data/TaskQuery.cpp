#include "taskstore/data/TaskQuery.hpp"

#include <QRegularExpression>

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace taskstore {
namespace data {

namespace {
QString stripQuotes(QString value)
{
    while (!value.isEmpty() && (value.startsWith(QLatin1Char('"')) || value.startsWith(QLatin1Char('\'')))) {
        value.remove(0, 1);
    }
    while (!value.isEmpty() && (value.endsWith(QLatin1Char('"')) || value.endsWith(QLatin1Char('\'')))) {
        value.chop(1);
    }
    return value;
}

// Missing values sort last in either direction.
template <typename T>
bool lessWithMissingLast(const std::optional<T> &lhs, const std::optional<T> &rhs, bool ascending)
{
    if (lhs && rhs) {
        return ascending ? *lhs < *rhs : *rhs < *lhs;
    }
    return lhs.has_value() && !rhs.has_value();
}

std::optional<QDateTime> optionalDate(const QDateTime &value)
{
    if (value.isValid()) {
        return value;
    }
    return std::nullopt;
}

bool sortsBefore(const Task &lhs, const Task &rhs, const SortCriteria &criteria)
{
    switch (criteria.field) {
    case SortField::Entry:
        return criteria.ascending ? lhs.entry < rhs.entry : rhs.entry < lhs.entry;
    case SortField::Modified: {
        const QDateTime left = lhs.modified.isValid() ? lhs.modified : lhs.entry;
        const QDateTime right = rhs.modified.isValid() ? rhs.modified : rhs.entry;
        return criteria.ascending ? left < right : right < left;
    }
    case SortField::Due:
        return lessWithMissingLast(optionalDate(lhs.due), optionalDate(rhs.due), criteria.ascending);
    case SortField::Priority:
        return lessWithMissingLast(lhs.priority, rhs.priority, criteria.ascending);
    case SortField::Project:
        return criteria.ascending ? lhs.project < rhs.project : rhs.project < lhs.project;
    }
    return false;
}
} // namespace

ProjectFilter ProjectFilter::exact(const QString &project)
{
    return ProjectFilter{Kind::Exact, QStringList{project}};
}

ProjectFilter ProjectFilter::hierarchy(const QString &project)
{
    return ProjectFilter{Kind::Hierarchy, QStringList{project}};
}

ProjectFilter ProjectFilter::multiple(const QStringList &projects)
{
    return ProjectFilter{Kind::Multiple, projects};
}

ProjectFilter ProjectFilter::noProject()
{
    return ProjectFilter{Kind::NoProject, QStringList()};
}

bool ProjectFilter::matches(const QString &project) const
{
    switch (kind) {
    case Kind::Exact:
        return !project.isEmpty() && !projects.isEmpty() && project == projects.constFirst();
    case Kind::Hierarchy: {
        if (project.isEmpty() || projects.isEmpty()) {
            return false;
        }
        const QString &root = projects.constFirst();
        return project == root || project.startsWith(root + QLatin1Char('.'));
    }
    case Kind::Multiple:
        return !project.isEmpty() && projects.contains(project);
    case Kind::NoProject:
        return project.isEmpty();
    }
    return false;
}

bool TagFilter::matches(const QSet<QString> &tags) const
{
    for (const QString &tag : include) {
        if (!tags.contains(tag)) {
            return false;
        }
    }
    for (const QString &tag : exclude) {
        if (tags.contains(tag)) {
            return false;
        }
    }
    return true;
}

bool TagFilter::isEmpty() const
{
    return include.isEmpty() && exclude.isEmpty();
}

bool DateFilter::matches(const Task &task) const
{
    switch (kind) {
    case Kind::DueBefore:
        return task.due.isValid() && task.due < from;
    case Kind::DueAfter:
        return task.due.isValid() && task.due > from;
    case Kind::DueBetween:
        return task.due.isValid() && task.due >= from && task.due <= to;
    case Kind::ScheduledBefore:
        return task.scheduled.isValid() && task.scheduled < from;
    case Kind::ScheduledAfter:
        return task.scheduled.isValid() && task.scheduled > from;
    case Kind::ModifiedBefore:
        return task.modified.isValid() && task.modified < from;
    case Kind::ModifiedAfter:
        return task.modified.isValid() && task.modified > from;
    case Kind::EntryBefore:
        return task.entry < from;
    case Kind::EntryAfter:
        return task.entry > from;
    }
    return false;
}

std::optional<QString> parseProjectFromFilter(const QString &filter)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const QStringList tokens = filter.split(whitespace, Qt::SkipEmptyParts);
    for (const QString &token : tokens) {
        QString value;
        if (token.startsWith(QLatin1String("project:"))) {
            value = token.mid(8);
        } else if (token.startsWith(QLatin1String("project="))) {
            value = token.mid(8);
            while (value.startsWith(QLatin1Char('='))) {
                value.remove(0, 1);
            }
        } else {
            continue;
        }
        value = stripQuotes(value);
        if (!value.isEmpty()) {
            return value;
        }
    }
    return std::nullopt;
}

bool matchesQuery(const Task &task, const TaskQuery &query, const UserContext *activeContext)
{
    if (query.status && task.status != *query.status) {
        return false;
    }
    if (query.project && !query.project->matches(task.project)) {
        return false;
    }
    if (query.tags && !query.tags->matches(task.tags)) {
        return false;
    }
    if (query.date && !query.date->matches(task)) {
        return false;
    }
    if (activeContext && !query.ignoreContext) {
        const std::optional<QString> project = parseProjectFromFilter(activeContext->readFilter);
        if (project && task.project != *project) {
            return false;
        }
    }
    return true;
}

std::vector<Task> applyQuery(std::vector<Task> tasks, const TaskQuery &query, const UserContext *activeContext)
{
    std::vector<Task> result;
    result.reserve(tasks.size());
    std::copy_if(std::make_move_iterator(tasks.begin()), std::make_move_iterator(tasks.end()),
                 std::back_inserter(result),
                 [&](const Task &task) { return matchesQuery(task, query, activeContext); });

    if (query.sort) {
        const SortCriteria criteria = *query.sort;
        std::stable_sort(result.begin(), result.end(), [&criteria](const Task &lhs, const Task &rhs) {
            return sortsBefore(lhs, rhs, criteria);
        });
    }

    const auto offset = static_cast<std::size_t>(std::max(0, query.offset.value_or(0)));
    if (offset >= result.size()) {
        return {};
    }
    auto first = result.begin() + static_cast<std::ptrdiff_t>(offset);
    auto last = result.end();
    if (query.limit) {
        const auto limit = static_cast<std::size_t>(std::max(0, *query.limit));
        if (limit < result.size() - offset) {
            last = first + static_cast<std::ptrdiff_t>(limit);
        }
    }
    return std::vector<Task>(std::make_move_iterator(first), std::make_move_iterator(last));
}

} // namespace data
} // namespace taskstore
