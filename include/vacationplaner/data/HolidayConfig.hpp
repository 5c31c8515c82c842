#pragma once

#include <QDate>
#include <QString>
#include <vector>

namespace vacationplaner {
namespace data {

struct HolidayEntry
{
    QDate date;
    QString description;
};

struct HolidayConfig
{
    QString region;
    int year = 0;
    std::vector<HolidayEntry> holidays; // configured order, duplicates allowed
};

} // namespace data
} // namespace vacationplaner
