#include "vacationplaner/data/IcsExporter.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>
#include <QStringList>
#include <QTextStream>

#include "vacationplaner/core/DateUtils.hpp"
#include "vacationplaner/core/Logging.hpp"
#include "vacationplaner/core/YearStatistics.hpp"

namespace vacationplaner {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr int MaxLineLength = 75;
const QString LineBreak = QStringLiteral("\r\n");

QString categoryFor(core::DayType type)
{
    switch (type) {
    case core::DayType::Holiday:
        return QStringLiteral("Holiday");
    case core::DayType::Vacation:
        return QStringLiteral("Vacation");
    case core::DayType::Weekend:
        return QStringLiteral("Weekend");
    case core::DayType::Weekday:
    default:
        return {};
    }
}

QString classFor(core::DayType type)
{
    return type == core::DayType::Vacation ? QStringLiteral("PRIVATE") : QStringLiteral("PUBLIC");
}

} // namespace

IcsExporter::IcsExporter(const HolidayConfig &holidays, const VacationConfig &vacation)
    : m_holidays(holidays)
    , m_vacation(vacation)
{
}

QString IcsExporter::toIcs(bool includeWeekends) const
{
    const int year = m_vacation.year;
    const core::YearStatistics stats = core::computeStatistics(year, m_holidays, m_vacation);

    QStringList lines;
    lines << QStringLiteral("BEGIN:VCALENDAR");
    lines << QStringLiteral("PRODID:-//VacationPlaner//EN");
    lines << QStringLiteral("VERSION:2.0");
    lines << QStringLiteral("CALSCALE:GREGORIAN");
    lines << QStringLiteral("METHOD:PUBLISH");
    lines << QStringLiteral("X-WR-CALNAME:") + encodeText(QStringLiteral("Vacation %1 - %2").arg(year).arg(m_vacation.fullName()));
    lines << QStringLiteral("X-VACATIONPLANER-DAYS-OFF:%1").arg(stats.daysOff);
    lines << QStringLiteral("X-VACATIONPLANER-VACATION-WORKDAYS:%1").arg(stats.vacationWorkdays);
    lines << QStringLiteral("X-VACATIONPLANER-HOLIDAYS:%1").arg(stats.holidays);
    lines << QStringLiteral("X-VACATIONPLANER-WEEKENDS:%1").arg(stats.weekends);
    lines << QStringLiteral("X-VACATIONPLANER-PERCENT-OFF:%1").arg(stats.percentDaysOff(), 0, 'f', 1);

    QString text;
    for (const QString &line : qAsConst(lines)) {
        text += foldLine(line) + LineBreak;
    }

    for (const QDate &date : core::daysInRange(QDate(year, 1, 1), QDate(year, 12, 31))) {
        const auto classification = core::classify(date, m_holidays, m_vacation);
        if (!qualifies(classification, includeWeekends)) {
            continue;
        }
        text += eventText(date, classification);
    }

    text += QStringLiteral("END:VCALENDAR") + LineBreak;
    return text;
}

bool IcsExporter::save(const QString &filePath, bool includeWeekends) const
{
    if (filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        qCInfo(lcExport) << "Creating output directory:" << dir.absolutePath();
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCCritical(lcExport) << "Cannot write" << filePath << ":" << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream << toIcs(includeWeekends);
    stream.flush();

    if (!file.commit()) {
        qCCritical(lcExport) << "Failed to save" << filePath << ":" << file.errorString();
        return false;
    }
    qCInfo(lcExport) << "Saved ICS file to:" << filePath;
    return true;
}

int IcsExporter::eventCount(bool includeWeekends) const
{
    const int year = m_vacation.year;
    int count = 0;
    for (const QDate &date : core::daysInRange(QDate(year, 1, 1), QDate(year, 12, 31))) {
        if (qualifies(core::classify(date, m_holidays, m_vacation), includeWeekends)) {
            ++count;
        }
    }
    return count;
}

bool IcsExporter::qualifies(const core::DayClassification &classification, bool includeWeekends) const
{
    if (classification.type == core::DayType::Weekday) {
        return false;
    }
    return includeWeekends || classification.type != core::DayType::Weekend;
}

QString IcsExporter::eventText(const QDate &date, const core::DayClassification &classification) const
{
    const QString name = m_vacation.fullName();
    const QString category = categoryFor(classification.type);
    const QString description = classification.description.value_or(QString()).isEmpty()
                                    ? category
                                    : *classification.description;

    QStringList lines;
    lines << QStringLiteral("BEGIN:VEVENT");
    lines << QStringLiteral("UID:") + encodeText(QStringLiteral("%1-%2-%3")
                                                     .arg(core::formatDate(date),
                                                          core::dayTypeName(classification.type),
                                                          name));
    lines << QStringLiteral("SUMMARY:") + encodeText(QStringLiteral("%1 - %2").arg(description, name));
    lines << QStringLiteral("DESCRIPTION:")
                 + encodeText(QStringLiteral("%1 - Out of Office - %2").arg(description, name));
    lines << QStringLiteral("DTSTART;VALUE=DATE:") + date.toString(QLatin1String(DATE_FORMAT));
    lines << QStringLiteral("DTEND;VALUE=DATE:") + date.addDays(1).toString(QLatin1String(DATE_FORMAT));
    lines << QStringLiteral("TRANSP:TRANSPARENT");
    lines << QStringLiteral("X-MICROSOFT-CDO-BUSYSTATUS:OOF");
    lines << QStringLiteral("X-MICROSOFT-CDO-ALLDAYEVENT:TRUE");
    lines << QStringLiteral("ORGANIZER:") + encodeText(name);
    lines << QStringLiteral("STATUS:CONFIRMED");
    lines << QStringLiteral("CLASS:") + classFor(classification.type);
    lines << QStringLiteral("CATEGORIES:") + category;
    lines << QStringLiteral("END:VEVENT");

    QString text;
    for (const QString &line : qAsConst(lines)) {
        text += foldLine(line) + LineBreak;
    }
    return text;
}

QString IcsExporter::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString IcsExporter::foldLine(const QString &line)
{
    if (line.toUtf8().size() <= MaxLineLength) {
        return line;
    }
    // Limits count UTF-8 octets; a surrogate pair is never split.
    QString folded;
    int budget = MaxLineLength;
    int used = 0;
    int pos = 0;
    while (pos < line.size()) {
        const int units = line.at(pos).isHighSurrogate() && pos + 1 < line.size()
                && line.at(pos + 1).isLowSurrogate()
            ? 2
            : 1;
        const QString character = line.mid(pos, units);
        const int octets = character.toUtf8().size();
        if (used + octets > budget) {
            folded += LineBreak + QLatin1Char(' ');
            budget = MaxLineLength - 1;
            used = 0;
        }
        folded += character;
        used += octets;
        pos += units;
    }
    return folded;
}

} // namespace data
} // namespace vacationplaner
