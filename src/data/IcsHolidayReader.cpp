#include "vacationplaner/data/IcsHolidayReader.hpp"

#include <QDate>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QRegularExpression>
#include <QTextStream>

#include "vacationplaner/core/ConfigValidator.hpp"
#include "vacationplaner/core/DateUtils.hpp"
#include "vacationplaner/core/Logging.hpp"

namespace vacationplaner {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";

void reportError(core::ConfigError *error, core::ConfigErrorCode code, const QString &message)
{
    qCWarning(lcConfig).noquote() << message;
    if (error) {
        error->code = code;
        error->message = message;
    }
}
} // namespace

std::optional<HolidayConfig> IcsHolidayReader::read(const QString &filePath, core::ConfigError *error)
{
    qCInfo(lcConfig) << "Loading iCal holiday file:" << filePath;
    QFile file(filePath);
    if (!file.exists()) {
        reportError(error, core::ConfigErrorCode::FileNotFound,
                    QStringLiteral("Holiday file does not exist: %1").arg(filePath));
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        reportError(error, core::ConfigErrorCode::ParseError,
                    QStringLiteral("Cannot read holiday file %1: %2").arg(filePath, file.errorString()));
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    const QString content = stream.readAll();
    if (!content.contains(QLatin1String("BEGIN:VCALENDAR"))) {
        reportError(error, core::ConfigErrorCode::ParseError,
                    QStringLiteral("Invalid iCal format in holiday file: %1").arg(filePath));
        return std::nullopt;
    }

    const QString region = QFileInfo(filePath).completeBaseName();
    return core::validateHolidayConfig(toHolidayDocument(content, region), error);
}

QJsonObject IcsHolidayReader::toHolidayDocument(const QString &content, const QString &region)
{
    QJsonArray holidays;
    int firstYear = 0;
    bool inEvent = false;
    QDate eventDate;
    QString eventSummary;

    auto finalizeEvent = [&]() {
        if (!eventDate.isValid()) {
            qCWarning(lcConfig) << "Skipping holiday event without a start date:" << eventSummary;
            return;
        }
        if (firstYear == 0 || eventDate.year() < firstYear) {
            firstYear = eventDate.year();
        }
        QJsonObject entry;
        entry.insert(QStringLiteral("date"), core::formatDate(eventDate));
        entry.insert(QStringLiteral("description"), eventSummary);
        holidays.append(entry);
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            inEvent = true;
            eventDate = QDate();
            eventSummary.clear();
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            if (inEvent) {
                finalizeEvent();
            }
            inEvent = false;
            return;
        }
        if (!inEvent) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }
        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1).trimmed();
        const QString name = property.section(';', 0, 0).toUpper();

        if (name == QLatin1String("DTSTART")) {
            eventDate = parseDate(rawValue);
        } else if (name == QLatin1String("SUMMARY")) {
            eventSummary = decodeText(rawValue);
        }
    };

    // Continuation lines start with a space or tab and belong to the previous line.
    QString accumulator;
    bool hasAccumulator = false;
    const QStringList lines = content.split(QRegularExpression(QStringLiteral("\r\n|\n|\r")));
    for (const QString &line : lines) {
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    QJsonObject document;
    document.insert(QStringLiteral("region"), region);
    if (firstYear != 0) {
        document.insert(QStringLiteral("year"), firstYear);
    }
    document.insert(QStringLiteral("holidays"), holidays);
    return document;
}

QString IcsHolidayReader::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c != QLatin1Char('\\') || i + 1 == text.size()) {
            decoded += c;
            continue;
        }
        const QChar escaped = text.at(++i);
        if (escaped == QLatin1Char('n') || escaped == QLatin1Char('N')) {
            decoded += QLatin1Char('\n');
        } else if (escaped == QLatin1Char(',') || escaped == QLatin1Char(';') || escaped == QLatin1Char('\\')) {
            decoded += escaped;
        } else {
            // unknown escapes are kept as written
            decoded += c;
            decoded += escaped;
        }
    }
    return decoded;
}

QDate IcsHolidayReader::parseDate(const QString &value)
{
    // DATE values and both floating and UTC DATE-TIME values start with yyyyMMdd.
    if (value.size() < 8) {
        return {};
    }
    return QDate::fromString(value.left(8), QLatin1String(DATE_FORMAT));
}

} // namespace data
} // namespace vacationplaner
