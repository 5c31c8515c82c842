#pragma once

#include <QString>
#include <QStringList>
#include <memory>
#include <optional>

#include "vacationplaner/core/ConfigError.hpp"
#include "vacationplaner/core/YearStatistics.hpp"
#include "vacationplaner/data/HolidayConfig.hpp"
#include "vacationplaner/data/VacationConfig.hpp"

namespace vacationplaner {
namespace data {
class ConfigLoader;
class ConfigResolver;
}

namespace core {

struct AppOptions
{
    QString configDir;
    QString outputDir;
    QString vacationConfigPath; // explicit override, optional
    QString holidayConfigPath;  // explicit override, optional
};

// Owns the configs of one run. They are loaded once by initialize() and are
// read-only afterwards.
class AppContext
{
public:
    explicit AppContext(AppOptions options);
    ~AppContext();

    bool initialize(ConfigError *error = nullptr);
    bool isInitialized() const;

    const data::HolidayConfig &holidayConfig() const;
    const data::VacationConfig &vacationConfig() const;
    int year() const;

    // Compatibility warnings collected by initialize().
    const QStringList &warnings() const;
    const YearStatistics &statistics() const;

    const AppOptions &options() const;
    // vacation_{year}_{firstName}_{lastName}.{suffix} inside the output directory.
    QString outputFilePath(const QString &suffix) const;
    bool ensureOutputDir() const;

private:
    std::unique_ptr<data::ConfigResolver> makeVacationResolver() const;
    std::unique_ptr<data::ConfigResolver> makeHolidayResolver(const data::VacationConfig &vacation) const;

    AppOptions m_options;
    std::unique_ptr<data::ConfigLoader> m_loader;
    std::optional<data::HolidayConfig> m_holidayConfig;
    std::optional<data::VacationConfig> m_vacationConfig;
    std::optional<YearStatistics> m_statistics;
    QStringList m_warnings;
};

} // namespace core
} // namespace vacationplaner
