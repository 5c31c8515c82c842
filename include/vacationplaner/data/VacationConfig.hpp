#pragma once

#include <QDate>
#include <QString>
#include <vector>

namespace vacationplaner {
namespace data {

struct VacationBlock
{
    int id = 0; // position in the configured sequence
    QDate start;
    QDate end;
    QString description;

    bool contains(const QDate &date) const { return start <= date && date <= end; }
};

struct VacationConfig
{
    QString firstName;
    QString lastName;
    int year = 0;
    QString region;
    std::vector<VacationBlock> vacationBlocks;

    QString fullName() const { return firstName + QLatin1Char(' ') + lastName; }
};

} // namespace data
} // namespace vacationplaner
