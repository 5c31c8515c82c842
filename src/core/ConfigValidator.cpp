#include "vacationplaner/core/ConfigValidator.hpp"

#include <QJsonArray>
#include <QJsonValue>
#include <QVariant>
#include <cmath>
#include <initializer_list>
#include <limits>

#include "vacationplaner/core/DateUtils.hpp"
#include "vacationplaner/core/Logging.hpp"

namespace vacationplaner {
namespace core {

namespace {

void reportError(ConfigError *error, ConfigErrorCode code, const QString &message)
{
    qCWarning(lcConfig).noquote() << message;
    if (error) {
        error->code = code;
        error->message = message;
    }
}

QString firstMissingField(const QJsonObject &object, std::initializer_list<const char *> fields)
{
    for (const char *field : fields) {
        const QString key = QLatin1String(field);
        if (!object.contains(key)) {
            return key;
        }
    }
    return {};
}

bool readInteger(const QJsonValue &value, int *out)
{
    if (!value.isDouble()) {
        return false;
    }
    const double number = value.toDouble();
    if (number != std::floor(number)
        || number < static_cast<double>(std::numeric_limits<int>::min())
        || number > static_cast<double>(std::numeric_limits<int>::max())) {
        return false;
    }
    *out = static_cast<int>(number);
    return true;
}

QString displayValue(const QJsonValue &value)
{
    return value.toVariant().toString();
}

std::optional<QDate> readDate(const QJsonValue &value)
{
    if (!value.isString()) {
        return std::nullopt;
    }
    return parseDate(value.toString());
}

} // namespace

QString errorCodeName(ConfigErrorCode code)
{
    switch (code) {
    case ConfigErrorCode::MissingField:
        return QStringLiteral("MissingField");
    case ConfigErrorCode::InvalidType:
        return QStringLiteral("InvalidType");
    case ConfigErrorCode::InvalidDateFormat:
        return QStringLiteral("InvalidDateFormat");
    case ConfigErrorCode::InvalidRange:
        return QStringLiteral("InvalidRange");
    case ConfigErrorCode::FileNotFound:
        return QStringLiteral("FileNotFound");
    case ConfigErrorCode::ParseError:
        return QStringLiteral("ParseError");
    case ConfigErrorCode::UnsupportedFormat:
        return QStringLiteral("UnsupportedFormat");
    case ConfigErrorCode::None:
    default:
        return QStringLiteral("None");
    }
}

std::optional<data::HolidayConfig> validateHolidayConfig(const QJsonObject &document, ConfigError *error)
{
    const QString missing = firstMissingField(document, {"region", "year", "holidays"});
    if (!missing.isEmpty()) {
        reportError(error, ConfigErrorCode::MissingField,
                    QStringLiteral("Missing required field in holiday config: %1").arg(missing));
        return std::nullopt;
    }

    data::HolidayConfig config;
    const QJsonValue region = document.value(QLatin1String("region"));
    if (!region.isString()) {
        reportError(error, ConfigErrorCode::InvalidType, QStringLiteral("region must be a string"));
        return std::nullopt;
    }
    config.region = region.toString();

    if (!readInteger(document.value(QLatin1String("year")), &config.year)) {
        reportError(error, ConfigErrorCode::InvalidType, QStringLiteral("year must be an integer"));
        return std::nullopt;
    }

    const QJsonValue holidays = document.value(QLatin1String("holidays"));
    if (!holidays.isArray()) {
        reportError(error, ConfigErrorCode::InvalidType, QStringLiteral("holidays must be a list"));
        return std::nullopt;
    }

    const QJsonArray entries = holidays.toArray();
    config.holidays.reserve(static_cast<size_t>(entries.size()));
    for (const QJsonValue &value : entries) {
        if (!value.isObject()) {
            reportError(error, ConfigErrorCode::InvalidType, QStringLiteral("holiday entries must be objects"));
            return std::nullopt;
        }
        const QJsonObject entry = value.toObject();
        const QString missingEntryField = firstMissingField(entry, {"date", "description"});
        if (!missingEntryField.isEmpty()) {
            reportError(error, ConfigErrorCode::MissingField,
                        QStringLiteral("Missing required field in holiday: %1").arg(missingEntryField));
            return std::nullopt;
        }

        const QJsonValue dateValue = entry.value(QLatin1String("date"));
        const auto date = readDate(dateValue);
        if (!date) {
            reportError(error, ConfigErrorCode::InvalidDateFormat,
                        QStringLiteral("Invalid date format in holiday: %1").arg(displayValue(dateValue)));
            return std::nullopt;
        }

        const QJsonValue description = entry.value(QLatin1String("description"));
        if (!description.isString()) {
            reportError(error, ConfigErrorCode::InvalidType,
                        QStringLiteral("Holiday description must be a string: %1").arg(formatDate(*date)));
            return std::nullopt;
        }

        data::HolidayEntry holiday;
        holiday.date = *date;
        holiday.description = description.toString();
        if (holiday.date.year() != config.year) {
            qCWarning(lcConfig).noquote()
                << QStringLiteral("Holiday date doesn't match configured year %1. Holiday: %2 (%3)")
                       .arg(config.year)
                       .arg(holiday.description, formatDate(holiday.date));
        }
        config.holidays.push_back(std::move(holiday));
    }

    qCDebug(lcConfig) << "Validated holiday config" << config.region << config.year << "with"
                      << config.holidays.size() << "holidays";
    return config;
}

std::optional<data::VacationConfig> validateVacationConfig(const QJsonObject &document, ConfigError *error)
{
    const QString missing = firstMissingField(document, {"firstName", "lastName", "year", "region", "vacationBlocks"});
    if (!missing.isEmpty()) {
        reportError(error, ConfigErrorCode::MissingField,
                    QStringLiteral("Missing required field in vacation config: %1").arg(missing));
        return std::nullopt;
    }

    data::VacationConfig config;
    if (!readInteger(document.value(QLatin1String("year")), &config.year)) {
        reportError(error, ConfigErrorCode::InvalidType, QStringLiteral("year must be an integer"));
        return std::nullopt;
    }

    const QJsonValue blocks = document.value(QLatin1String("vacationBlocks"));
    if (!blocks.isArray()) {
        reportError(error, ConfigErrorCode::InvalidType, QStringLiteral("vacationBlocks must be a list"));
        return std::nullopt;
    }

    const QJsonValue firstName = document.value(QLatin1String("firstName"));
    const QJsonValue lastName = document.value(QLatin1String("lastName"));
    const QJsonValue region = document.value(QLatin1String("region"));
    if (!firstName.isString() || !lastName.isString() || !region.isString()) {
        reportError(error, ConfigErrorCode::InvalidType,
                    QStringLiteral("firstName, lastName and region must be strings"));
        return std::nullopt;
    }
    config.firstName = firstName.toString();
    config.lastName = lastName.toString();
    config.region = region.toString();

    const QJsonArray entries = blocks.toArray();
    config.vacationBlocks.reserve(static_cast<size_t>(entries.size()));
    int index = 0;
    for (const QJsonValue &value : entries) {
        if (!value.isObject()) {
            reportError(error, ConfigErrorCode::InvalidType, QStringLiteral("vacation blocks must be objects"));
            return std::nullopt;
        }
        const QJsonObject entry = value.toObject();
        const QString missingBlockField = firstMissingField(entry, {"description", "start", "end"});
        if (!missingBlockField.isEmpty()) {
            reportError(error, ConfigErrorCode::MissingField,
                        QStringLiteral("Missing required field in vacation block: %1").arg(missingBlockField));
            return std::nullopt;
        }

        const QJsonValue description = entry.value(QLatin1String("description"));
        if (!description.isString()) {
            reportError(error, ConfigErrorCode::InvalidType,
                        QStringLiteral("Vacation block description must be a string (block %1)").arg(index));
            return std::nullopt;
        }

        const QJsonValue startValue = entry.value(QLatin1String("start"));
        const QJsonValue endValue = entry.value(QLatin1String("end"));
        const auto start = readDate(startValue);
        const auto end = readDate(endValue);
        if (!start || !end) {
            const QJsonValue &bad = start ? endValue : startValue;
            reportError(error, ConfigErrorCode::InvalidDateFormat,
                        QStringLiteral("Invalid date format in vacation block '%1': %2")
                            .arg(description.toString(), displayValue(bad)));
            return std::nullopt;
        }
        if (*start > *end) {
            reportError(error, ConfigErrorCode::InvalidRange,
                        QStringLiteral("Start date %1 is after end date %2")
                            .arg(formatDate(*start), formatDate(*end)));
            return std::nullopt;
        }

        data::VacationBlock block;
        block.id = index++;
        block.start = *start;
        block.end = *end;
        block.description = description.toString();
        if (block.start.year() != config.year || block.end.year() != config.year) {
            qCWarning(lcConfig).noquote()
                << QStringLiteral("Vacation block dates don't match configured year %1. Block: %2")
                       .arg(config.year)
                       .arg(block.description);
        }
        config.vacationBlocks.push_back(std::move(block));
    }

    qCDebug(lcConfig) << "Validated vacation config for" << config.fullName() << config.year << "with"
                      << config.vacationBlocks.size() << "blocks";
    return config;
}

QStringList checkCompatibility(const data::HolidayConfig &holidays, const data::VacationConfig &vacation)
{
    QStringList warnings;
    if (vacation.year != holidays.year) {
        warnings << QStringLiteral("Year mismatch: vacation config year (%1) != holiday config year (%2)")
                        .arg(vacation.year)
                        .arg(holidays.year);
    }

    const QString vacationRegion = vacation.region.toLower();
    const QString holidayRegion = holidays.region.toLower();
    if (!holidayRegion.contains(vacationRegion) && !vacationRegion.contains(holidayRegion)) {
        warnings << QStringLiteral("Region mismatch: vacation config region (%1) and holiday config region (%2)")
                        .arg(vacationRegion, holidayRegion);
    }

    for (const QString &warning : qAsConst(warnings)) {
        qCWarning(lcConfig).noquote() << warning;
    }
    return warnings;
}

} // namespace core
} // namespace vacationplaner
