#pragma once

#include <QString>
#include <memory>

class QSettings;

namespace vacationplaner {
namespace core {

enum class DayType;

// Persistent defaults. Command line options take precedence over these.
class Settings
{
public:
    Settings();
    // Backed by an INI file instead of the platform store.
    explicit Settings(QString iniPath);

    QString configDir() const;
    void setConfigDir(const QString &path);

    QString outputDir() const;
    void setOutputDir(const QString &path);

    bool includeWeekends() const;
    void setIncludeWeekends(bool include);

    // "#RRGGBB" fill color for cells of the given type.
    QString color(DayType type) const;
    void setColor(DayType type, const QString &color);

    static QString defaultColor(DayType type);

private:
    std::unique_ptr<QSettings> open() const;

    QString m_iniPath;
};

} // namespace core
} // namespace vacationplaner
