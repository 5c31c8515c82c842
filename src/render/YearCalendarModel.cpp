#include "vacationplaner/render/YearCalendarModel.hpp"

#include "vacationplaner/core/DateUtils.hpp"
#include "vacationplaner/core/Logging.hpp"
#include "vacationplaner/data/HolidayConfig.hpp"
#include "vacationplaner/data/VacationConfig.hpp"

namespace vacationplaner {
namespace render {

YearCalendarModel::YearCalendarModel(const data::HolidayConfig &holidays,
                                     const data::VacationConfig &vacation,
                                     QObject *parent)
    : QObject(parent)
    , m_holidays(holidays)
    , m_vacation(vacation)
    , m_year(vacation.year)
{
}

void YearCalendarModel::setYear(int year)
{
    if (!QDate(year, 1, 1).isValid()) {
        return;
    }
    m_year = year;
}

int YearCalendarModel::year() const
{
    return m_year;
}

void YearCalendarModel::refresh()
{
    m_months.clear();
    m_months.reserve(12);
    for (int month = 1; month <= 12; ++month) {
        CalendarMonth calendarMonth;
        calendarMonth.month = month;
        for (const auto &week : core::monthGrid(m_year, month)) {
            CalendarWeek row;
            row.reserve(static_cast<int>(week.size()));
            for (int day : week) {
                CalendarCell cell;
                if (day != 0) {
                    cell.date = QDate(m_year, month, day);
                }
                cell.classification = core::classify(m_year, month, day, m_holidays, m_vacation);
                row.append(cell);
            }
            calendarMonth.weeks.append(row);
        }
        m_months.append(calendarMonth);
    }
    m_statistics = core::computeStatistics(m_year, m_holidays, m_vacation);
    emit calendarChanged();
}

const QVector<CalendarMonth> &YearCalendarModel::months() const
{
    return m_months;
}

const CalendarMonth &YearCalendarModel::month(int month) const
{
    static const CalendarMonth empty;
    if (month < 1 || month > m_months.size()) {
        qCWarning(lcRender) << "No grid for month" << month << "of" << m_year;
        return empty;
    }
    return m_months.at(month - 1);
}

const core::YearStatistics &YearCalendarModel::statistics() const
{
    return m_statistics;
}

const data::VacationConfig &YearCalendarModel::vacationConfig() const
{
    return m_vacation;
}

} // namespace render
} // namespace vacationplaner
