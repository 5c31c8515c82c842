#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <optional>

#include "vacationplaner/core/ConfigError.hpp"
#include "vacationplaner/data/HolidayConfig.hpp"
#include "vacationplaner/data/VacationConfig.hpp"

namespace vacationplaner {
namespace data {

class ConfigResolver;

// Discovers configuration files in a directory and turns them into validated
// configs. Which file is used is decided by the resolver passed in.
class ConfigLoader
{
public:
    explicit ConfigLoader(QString configDir);

    const QString &configDir() const;
    bool configDirExists() const;

    // vacation-planer*.json
    QStringList vacationCandidates() const;
    // holidays-*.json and *.ics
    QStringList holidayCandidates() const;

    std::optional<VacationConfig> loadVacationConfig(const ConfigResolver &resolver,
                                                     core::ConfigError *error = nullptr) const;
    std::optional<HolidayConfig> loadHolidayConfig(const ConfigResolver &resolver,
                                                   core::ConfigError *error = nullptr) const;

    static std::optional<QJsonObject> readJsonObject(const QString &filePath, core::ConfigError *error = nullptr);
    static std::optional<VacationConfig> loadVacationFile(const QString &filePath,
                                                          core::ConfigError *error = nullptr);
    // Dispatches on the file suffix: .json or .ics.
    static std::optional<HolidayConfig> loadHolidayFile(const QString &filePath,
                                                        core::ConfigError *error = nullptr);

private:
    QStringList findFiles(const QStringList &patterns) const;

    QString m_configDir;
};

} // namespace data
} // namespace vacationplaner
