#include "vacationplaner/core/DayClassifier.hpp"

#include <algorithm>

#include "vacationplaner/core/DateUtils.hpp"
#include "vacationplaner/core/Logging.hpp"

namespace vacationplaner {
namespace core {

QString dayTypeName(DayType type)
{
    switch (type) {
    case DayType::Holiday:
        return QStringLiteral("holiday");
    case DayType::Vacation:
        return QStringLiteral("vacation");
    case DayType::Weekend:
        return QStringLiteral("weekend");
    case DayType::Weekday:
    default:
        return QStringLiteral("weekday");
    }
}

const data::HolidayEntry *findHoliday(const QDate &date, const data::HolidayConfig &holidays)
{
    const auto it = std::find_if(holidays.holidays.cbegin(), holidays.holidays.cend(),
                                 [&date](const data::HolidayEntry &entry) { return entry.date == date; });
    return it != holidays.holidays.cend() ? &*it : nullptr;
}

const data::VacationBlock *findVacationBlock(const QDate &date, const data::VacationConfig &vacation)
{
    const auto it = std::find_if(vacation.vacationBlocks.cbegin(), vacation.vacationBlocks.cend(),
                                 [&date](const data::VacationBlock &block) { return block.contains(date); });
    return it != vacation.vacationBlocks.cend() ? &*it : nullptr;
}

bool isHoliday(const QDate &date, const data::HolidayConfig &holidays)
{
    return findHoliday(date, holidays) != nullptr;
}

bool isInVacationBlock(const QDate &date, const data::VacationConfig &vacation)
{
    return findVacationBlock(date, vacation) != nullptr;
}

DayClassification classify(const QDate &date,
                           const data::HolidayConfig &holidays,
                           const data::VacationConfig &vacation)
{
    DayClassification result;
    if (!date.isValid()) {
        return result;
    }
    result.display = QString::number(date.day());

    if (const auto *holiday = findHoliday(date, holidays)) {
        result.type = DayType::Holiday;
        result.description = holiday->description;
        return result;
    }
    if (isWeekend(date)) {
        result.type = DayType::Weekend;
        return result;
    }
    if (const auto *block = findVacationBlock(date, vacation)) {
        result.type = DayType::Vacation;
        result.description = block->description;
        result.vacationBlockId = block->id;
        return result;
    }
    return result;
}

DayClassification classify(int year, int month, int day,
                           const data::HolidayConfig &holidays,
                           const data::VacationConfig &vacation)
{
    if (day == 0) {
        return {};
    }
    const QDate date(year, month, day);
    if (!date.isValid()) {
        qCWarning(lcCalendar) << "Treating invalid date as padding:" << year << month << day;
        return {};
    }
    return classify(date, holidays, vacation);
}

} // namespace core
} // namespace vacationplaner
