#pragma once

#include <QDate>
#include <QObject>
#include <QVector>

#include "vacationplaner/core/DayClassifier.hpp"
#include "vacationplaner/core/YearStatistics.hpp"

namespace vacationplaner {
namespace render {

struct CalendarCell
{
    QDate date; // invalid for padding cells
    core::DayClassification classification;
};

using CalendarWeek = QVector<CalendarCell>;

struct CalendarMonth
{
    int month = 0;
    QVector<CalendarWeek> weeks;
};

// Classified month grids and statistics for one year. The model keeps
// references to the configs; they must outlive it.
class YearCalendarModel : public QObject
{
    Q_OBJECT

public:
    YearCalendarModel(const data::HolidayConfig &holidays,
                      const data::VacationConfig &vacation,
                      QObject *parent = nullptr);

    void setYear(int year);
    int year() const;
    void refresh();

    const QVector<CalendarMonth> &months() const;
    // Empty month before refresh() or for a month outside 1..12.
    const CalendarMonth &month(int month) const;
    const core::YearStatistics &statistics() const;
    const data::VacationConfig &vacationConfig() const;

signals:
    void calendarChanged();

private:
    const data::HolidayConfig &m_holidays;
    const data::VacationConfig &m_vacation;
    int m_year = 0;
    QVector<CalendarMonth> m_months;
    core::YearStatistics m_statistics;
};

} // namespace render
} // namespace vacationplaner
