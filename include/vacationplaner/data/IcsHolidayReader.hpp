#pragma once

#include <QJsonObject>
#include <QString>
#include <optional>

#include "vacationplaner/core/ConfigError.hpp"
#include "vacationplaner/data/HolidayConfig.hpp"

namespace vacationplaner {
namespace data {

// Reads public holiday calendars published as iCalendar files. Every VEVENT
// contributes its DTSTART date and SUMMARY.
class IcsHolidayReader
{
public:
    static std::optional<HolidayConfig> read(const QString &filePath, core::ConfigError *error = nullptr);

    // Converts calendar text into the holiday JSON shape, ready for validation.
    // "year" is the smallest event year and is absent when there are no events.
    static QJsonObject toHolidayDocument(const QString &content, const QString &region);

private:
    static QString decodeText(const QString &text);
    static QDate parseDate(const QString &value);
};

} // namespace data
} // namespace vacationplaner
