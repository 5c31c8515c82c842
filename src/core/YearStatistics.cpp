#include "vacationplaner/core/YearStatistics.hpp"

#include <algorithm>

#include "vacationplaner/core/DateUtils.hpp"
#include "vacationplaner/core/DayClassifier.hpp"
#include "vacationplaner/core/Logging.hpp"

namespace vacationplaner {
namespace core {

namespace {

int containingBlockCount(const QDate &date, const data::VacationConfig &vacation)
{
    return static_cast<int>(std::count_if(vacation.vacationBlocks.cbegin(), vacation.vacationBlocks.cend(),
                                          [&date](const data::VacationBlock &block) {
                                              return block.contains(date);
                                          }));
}

VacationBlockStatistics blockStatistics(const data::VacationBlock &block, const data::HolidayConfig &holidays)
{
    VacationBlockStatistics stats;
    stats.id = block.id;
    stats.description = block.description;
    stats.start = block.start;
    stats.end = block.end;
    for (const QDate &date : daysInRange(block.start, block.end)) {
        ++stats.totalDays;
        if (!isWeekend(date) && !isHoliday(date, holidays)) {
            ++stats.workdays;
        }
    }
    return stats;
}

} // namespace

double YearStatistics::percentDaysOff() const
{
    if (totalDays <= 0) {
        return 0.0;
    }
    return 100.0 * daysOff / totalDays;
}

YearStatistics computeStatistics(int year,
                                 const data::HolidayConfig &holidays,
                                 const data::VacationConfig &vacation)
{
    YearStatistics stats;
    stats.year = year;

    for (const QDate &date : daysInRange(QDate(year, 1, 1), QDate(year, 12, 31))) {
        ++stats.totalDays;
        if (isHoliday(date, holidays)) {
            ++stats.holidays;
        }
        const bool weekend = isWeekend(date);
        if (weekend) {
            ++stats.weekends;
        } else {
            ++stats.workdays;
        }
        const int blocks = containingBlockCount(date, vacation);
        stats.vacationDays += blocks;
        if (!weekend) {
            stats.vacationWorkdays += blocks;
        }
    }

    stats.daysOff = stats.weekends + stats.holidays + stats.vacationWorkdays;
    // Keeps daysOff + daysAtWork == workdays + weekends.
    stats.daysAtWork = stats.workdays - stats.holidays - stats.vacationWorkdays;

    stats.vacationBlockStats.reserve(vacation.vacationBlocks.size());
    for (const auto &block : vacation.vacationBlocks) {
        stats.vacationBlockStats.push_back(blockStatistics(block, holidays));
    }

    qCDebug(lcCalendar) << "Statistics for" << year << ": days off" << stats.daysOff << "of" << stats.totalDays;
    return stats;
}

} // namespace core
} // namespace vacationplaner
