#include "vacationplaner/core/DateUtils.hpp"

#include <QRegularExpression>

#include "vacationplaner/core/Logging.hpp"

namespace vacationplaner {
namespace core {

namespace {
constexpr auto ISO_DATE_FORMAT = "yyyy-MM-dd";
constexpr int DaysPerWeek = 7;
} // namespace

std::optional<QDate> parseDate(const QString &text)
{
    static const QRegularExpression pattern(
        QRegularExpression::anchoredPattern(QStringLiteral("([0-9]{4})-([0-9]{2})-([0-9]{2})")));
    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const QDate date(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt());
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

QString formatDate(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return date.toString(QLatin1String(ISO_DATE_FORMAT));
}

bool isWeekend(const QDate &date)
{
    return date.dayOfWeek() >= Qt::Saturday;
}

DateRange::DateRange(QDate start, QDate end)
    : m_start(start)
    , m_end(end)
{
}

DateRange::const_iterator DateRange::begin() const
{
    if (isEmpty()) {
        return const_iterator();
    }
    return const_iterator(m_start);
}

DateRange::const_iterator DateRange::end() const
{
    if (isEmpty()) {
        return const_iterator();
    }
    return const_iterator(m_end.addDays(1));
}

bool DateRange::isEmpty() const
{
    return !m_start.isValid() || !m_end.isValid() || m_start > m_end;
}

int DateRange::size() const
{
    if (isEmpty()) {
        return 0;
    }
    return static_cast<int>(m_start.daysTo(m_end)) + 1;
}

DateRange daysInRange(const QDate &start, const QDate &end)
{
    return DateRange(start, end);
}

std::vector<Week> monthGrid(int year, int month)
{
    std::vector<Week> weeks;
    const QDate first(year, month, 1);
    if (!first.isValid()) {
        qCWarning(lcCalendar) << "Invalid month" << month << "for year" << year;
        return weeks;
    }

    Week week{};
    int column = first.dayOfWeek() - 1;
    for (int day = 1; day <= first.daysInMonth(); ++day) {
        week[static_cast<std::size_t>(column)] = day;
        if (++column == DaysPerWeek) {
            weeks.push_back(week);
            week.fill(0);
            column = 0;
        }
    }
    if (column > 0) {
        weeks.push_back(week);
    }
    return weeks;
}

} // namespace core
} // namespace vacationplaner
