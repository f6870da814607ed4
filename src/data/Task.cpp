#include "tinytask/data/Task.hpp"

namespace tinytask {
namespace data {

namespace {
constexpr auto DUE_DATE_FORMAT = "yyyy-MM-dd";
} // namespace

bool operator==(const TaskItem &lhs, const TaskItem &rhs)
{
    return lhs.id == rhs.id
        && lhs.title == rhs.title
        && lhs.done == rhs.done
        && lhs.tags == rhs.tags
        && lhs.priority == rhs.priority
        && lhs.dueDate == rhs.dueDate
        && lhs.note == rhs.note
        && lhs.createdAt == rhs.createdAt
        && lhs.completedAt == rhs.completedAt
        && lhs.archivedAt == rhs.archivedAt;
}

bool operator!=(const TaskItem &lhs, const TaskItem &rhs)
{
    return !(lhs == rhs);
}

QString priorityToString(Priority priority)
{
    switch (priority) {
    case Priority::Low:
        return QStringLiteral("low");
    case Priority::Medium:
        return QStringLiteral("medium");
    case Priority::High:
        return QStringLiteral("high");
    }
    return QStringLiteral("medium");
}

std::optional<Priority> priorityFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("low")) {
        return Priority::Low;
    }
    if (normalized == QLatin1String("medium")) {
        return Priority::Medium;
    }
    if (normalized == QLatin1String("high")) {
        return Priority::High;
    }
    return std::nullopt;
}

QString dueDateToString(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return date.toString(QLatin1String(DUE_DATE_FORMAT));
}

QDate dueDateFromString(const QString &value)
{
    const QString trimmed = value.trimmed();
    // QDate::fromString accepts single-digit fields, so pin the length as well.
    if (trimmed.size() != 10) {
        return {};
    }
    return QDate::fromString(trimmed, QLatin1String(DUE_DATE_FORMAT));
}

std::optional<QStringList> normalizeTags(const QStringList &tags)
{
    QStringList cleaned;
    cleaned.reserve(tags.size());
    for (const QString &tag : tags) {
        const QString trimmed = tag.trimmed();
        if (trimmed.isEmpty()) {
            return std::nullopt;
        }
        if (!cleaned.contains(trimmed)) {
            cleaned << trimmed;
        }
    }
    return cleaned;
}

} // namespace data
} // namespace tinytask
