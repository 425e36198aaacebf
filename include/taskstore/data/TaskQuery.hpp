#pragma once

#include <QDateTime>
#include <QSet>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

#include "taskstore/data/Task.hpp"

namespace taskstore {
namespace data {

struct ProjectFilter
{
    enum class Kind
    {
        Exact,
        // The project itself and every dotted sub-project.
        Hierarchy,
        Multiple,
        NoProject,
    };

    Kind kind = Kind::Exact;
    QStringList projects;

    static ProjectFilter exact(const QString &project);
    static ProjectFilter hierarchy(const QString &project);
    static ProjectFilter multiple(const QStringList &projects);
    static ProjectFilter noProject();

    bool matches(const QString &project) const;
};

struct TagFilter
{
    // Every tag in `include` must be present, none of `exclude` may be.
    QSet<QString> include;
    QSet<QString> exclude;

    bool matches(const QSet<QString> &tags) const;
    bool isEmpty() const;
};

struct DateFilter
{
    enum class Kind
    {
        DueBefore,
        DueAfter,
        DueBetween,
        ScheduledBefore,
        ScheduledAfter,
        ModifiedBefore,
        ModifiedAfter,
        EntryBefore,
        EntryAfter,
    };

    Kind kind = Kind::DueBefore;
    QDateTime from;
    // Upper bound for DueBetween only.
    QDateTime to;

    bool matches(const Task &task) const;
};

enum class SortField
{
    Entry,
    Modified,
    Due,
    Priority,
    Project,
};

struct SortCriteria
{
    SortField field = SortField::Entry;
    bool ascending = true;
};

struct TaskQuery
{
    std::optional<TaskStatus> status;
    std::optional<ProjectFilter> project;
    std::optional<TagFilter> tags;
    std::optional<DateFilter> date;
    std::optional<SortCriteria> sort;
    std::optional<int> limit;
    std::optional<int> offset;
    // Skip the active context's project constraint.
    bool ignoreContext = false;
};

struct UserContext
{
    QString name;
    QString readFilter;
    QString writeFilter;
    bool active = false;
};

// Extracts X from `project:X`, `project=X` or `project==X`, quotes stripped.
std::optional<QString> parseProjectFromFilter(const QString &filter);

bool matchesQuery(const Task &task, const TaskQuery &query, const UserContext *activeContext = nullptr);

// Filters, sorts and pages `tasks` in that order.
std::vector<Task> applyQuery(std::vector<Task> tasks, const TaskQuery &query,
                             const UserContext *activeContext = nullptr);

} // namespace data
} // namespace taskstore
