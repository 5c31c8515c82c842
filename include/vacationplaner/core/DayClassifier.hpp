#pragma once

#include <QDate>
#include <QString>
#include <optional>

#include "vacationplaner/data/HolidayConfig.hpp"
#include "vacationplaner/data/VacationConfig.hpp"

namespace vacationplaner {
namespace core {

enum class DayType
{
    Holiday,
    Vacation,
    Weekend,
    Weekday,
};

struct DayClassification
{
    DayType type = DayType::Weekday;
    QString display; // day of month, empty for grid padding cells
    std::optional<QString> description;
    std::optional<int> vacationBlockId;
};

QString dayTypeName(DayType type);

// First matching entry in configured order, or nullptr.
const data::HolidayEntry *findHoliday(const QDate &date, const data::HolidayConfig &holidays);
const data::VacationBlock *findVacationBlock(const QDate &date, const data::VacationConfig &vacation);

bool isHoliday(const QDate &date, const data::HolidayConfig &holidays);
bool isInVacationBlock(const QDate &date, const data::VacationConfig &vacation);

// Precedence: Holiday, Weekend, Vacation, Weekday.
DayClassification classify(const QDate &date,
                           const data::HolidayConfig &holidays,
                           const data::VacationConfig &vacation);

// Grid variant: day 0 denotes a padding cell outside the month.
DayClassification classify(int year, int month, int day,
                           const data::HolidayConfig &holidays,
                           const data::VacationConfig &vacation);

} // namespace core
} // namespace vacationplaner
