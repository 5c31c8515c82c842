#pragma once

#include <QDate>
#include <QString>

#include "vacationplaner/core/DayClassifier.hpp"
#include "vacationplaner/data/HolidayConfig.hpp"
#include "vacationplaner/data/VacationConfig.hpp"

namespace vacationplaner {
namespace data {

// Writes one all-day out-of-office VEVENT per holiday, vacation and
// (optionally) weekend day of the vacation config's year. The exporter
// keeps references to the configs; they must outlive it.
class IcsExporter
{
public:
    IcsExporter(const HolidayConfig &holidays, const VacationConfig &vacation);

    QString toIcs(bool includeWeekends) const;
    bool save(const QString &filePath, bool includeWeekends) const;

    // Number of events toIcs() emits.
    int eventCount(bool includeWeekends) const;

    static QString encodeText(const QString &text);
    static QString foldLine(const QString &line);

private:
    bool qualifies(const core::DayClassification &classification, bool includeWeekends) const;
    QString eventText(const QDate &date, const core::DayClassification &classification) const;

    const HolidayConfig &m_holidays;
    const VacationConfig &m_vacation;
};

} // namespace data
} // namespace vacationplaner
