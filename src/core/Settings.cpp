#include "vacationplaner/core/Settings.hpp"

#include <QDir>
#include <QSettings>

#include "vacationplaner/core/DayClassifier.hpp"

namespace vacationplaner {
namespace core {

namespace {
const QString ConfigDirKey = QStringLiteral("paths/configDir");
const QString OutputDirKey = QStringLiteral("paths/outputDir");
const QString IncludeWeekendsKey = QStringLiteral("export/includeWeekends");

QString colorKey(DayType type)
{
    return QStringLiteral("colors/%1").arg(dayTypeName(type));
}
} // namespace

Settings::Settings() = default;

Settings::Settings(QString iniPath)
    : m_iniPath(std::move(iniPath))
{
}

QString Settings::configDir() const
{
    return open()->value(ConfigDirKey, QDir::current().filePath(QStringLiteral("conf"))).toString();
}

void Settings::setConfigDir(const QString &path)
{
    open()->setValue(ConfigDirKey, path);
}

QString Settings::outputDir() const
{
    return open()->value(OutputDirKey, QDir::current().filePath(QStringLiteral("vacationplans"))).toString();
}

void Settings::setOutputDir(const QString &path)
{
    open()->setValue(OutputDirKey, path);
}

bool Settings::includeWeekends() const
{
    return open()->value(IncludeWeekendsKey, false).toBool();
}

void Settings::setIncludeWeekends(bool include)
{
    open()->setValue(IncludeWeekendsKey, include);
}

QString Settings::color(DayType type) const
{
    return open()->value(colorKey(type), defaultColor(type)).toString();
}

void Settings::setColor(DayType type, const QString &color)
{
    open()->setValue(colorKey(type), color);
}

QString Settings::defaultColor(DayType type)
{
    switch (type) {
    case DayType::Holiday:
        return QStringLiteral("#FFDDC1");
    case DayType::Vacation:
        return QStringLiteral("#C1FFD7");
    case DayType::Weekend:
        return QStringLiteral("#C1D4FF");
    case DayType::Weekday:
    default:
        return QStringLiteral("#FFFFFF");
    }
}

std::unique_ptr<QSettings> Settings::open() const
{
    if (m_iniPath.isEmpty()) {
        return std::make_unique<QSettings>();
    }
    return std::make_unique<QSettings>(m_iniPath, QSettings::IniFormat);
}

} // namespace core
} // namespace vacationplaner
