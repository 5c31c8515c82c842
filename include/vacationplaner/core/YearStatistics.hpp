#pragma once

#include <QDate>
#include <QString>
#include <vector>

#include "vacationplaner/data/HolidayConfig.hpp"
#include "vacationplaner/data/VacationConfig.hpp"

namespace vacationplaner {
namespace core {

struct VacationBlockStatistics
{
    int id = 0;
    QString description;
    QDate start;
    QDate end;
    int totalDays = 0;
    int workdays = 0; // days that are neither weekend nor a configured holiday
};

struct YearStatistics
{
    int year = 0;
    int totalDays = 0;
    int workdays = 0;
    int weekends = 0;
    int holidays = 0;
    int vacationDays = 0;
    int vacationWorkdays = 0;
    int daysOff = 0;
    int daysAtWork = 0;
    std::vector<VacationBlockStatistics> vacationBlockStats;

    double percentDaysOff() const;
};

// Overlapping vacation blocks are counted once per block, both in the
// year totals and in the per-block figures.
YearStatistics computeStatistics(int year,
                                 const data::HolidayConfig &holidays,
                                 const data::VacationConfig &vacation);

} // namespace core
} // namespace vacationplaner
