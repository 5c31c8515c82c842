#include "vacationplaner/core/AppContext.hpp"

#include <QDir>

#include "vacationplaner/core/ConfigValidator.hpp"
#include "vacationplaner/core/Logging.hpp"
#include "vacationplaner/data/ConfigLoader.hpp"
#include "vacationplaner/data/ConfigResolver.hpp"

namespace vacationplaner {
namespace core {

AppContext::AppContext(AppOptions options)
    : m_options(std::move(options))
    , m_loader(std::make_unique<data::ConfigLoader>(m_options.configDir))
{
    qCInfo(lcApp) << "Configuration path:" << m_loader->configDir();
    qCInfo(lcApp) << "Output path:" << QDir(m_options.outputDir).absolutePath();
}

AppContext::~AppContext() = default;

bool AppContext::initialize(ConfigError *error)
{
    const bool explicitFiles = !m_options.vacationConfigPath.isEmpty() && !m_options.holidayConfigPath.isEmpty();
    if (!explicitFiles && !m_loader->configDirExists()) {
        const QString message = QStringLiteral("Configuration path does not exist: %1").arg(m_loader->configDir());
        qCCritical(lcApp).noquote() << message;
        if (error) {
            error->code = ConfigErrorCode::FileNotFound;
            error->message = message;
        }
        return false;
    }

    auto vacation = m_loader->loadVacationConfig(*makeVacationResolver(), error);
    if (!vacation) {
        qCCritical(lcApp) << "Error loading vacation config";
        return false;
    }
    qCInfo(lcApp) << "Loaded vacation config for" << vacation->fullName();

    auto holidays = m_loader->loadHolidayConfig(*makeHolidayResolver(*vacation), error);
    if (!holidays) {
        qCCritical(lcApp) << "Error loading holiday config";
        return false;
    }
    qCInfo(lcApp) << "Loaded holiday config for" << holidays->region << holidays->year;

    m_warnings = checkCompatibility(*holidays, *vacation);
    m_statistics = computeStatistics(vacation->year, *holidays, *vacation);
    m_vacationConfig = std::move(vacation);
    m_holidayConfig = std::move(holidays);

    qCInfo(lcApp) << "Calendar initialized for year" << year() << "with" << m_holidayConfig->holidays.size()
                  << "holidays and" << m_vacationConfig->vacationBlocks.size() << "vacation blocks";
    return true;
}

bool AppContext::isInitialized() const
{
    return m_vacationConfig.has_value() && m_holidayConfig.has_value();
}

const data::HolidayConfig &AppContext::holidayConfig() const
{
    return *m_holidayConfig;
}

const data::VacationConfig &AppContext::vacationConfig() const
{
    return *m_vacationConfig;
}

int AppContext::year() const
{
    return m_vacationConfig ? m_vacationConfig->year : 0;
}

const QStringList &AppContext::warnings() const
{
    return m_warnings;
}

const YearStatistics &AppContext::statistics() const
{
    return *m_statistics;
}

const AppOptions &AppContext::options() const
{
    return m_options;
}

QString AppContext::outputFilePath(const QString &suffix) const
{
    if (!m_vacationConfig) {
        return {};
    }
    const QString baseName = QStringLiteral("vacation_%1_%2_%3")
                                 .arg(m_vacationConfig->year)
                                 .arg(m_vacationConfig->firstName, m_vacationConfig->lastName);
    return QDir(m_options.outputDir).absoluteFilePath(baseName + QLatin1Char('.') + suffix);
}

bool AppContext::ensureOutputDir() const
{
    QDir dir(m_options.outputDir);
    if (dir.exists()) {
        return true;
    }
    qCInfo(lcApp) << "Creating output directory:" << dir.absolutePath();
    return dir.mkpath(QStringLiteral("."));
}

std::unique_ptr<data::ConfigResolver> AppContext::makeVacationResolver() const
{
    auto chain = std::make_unique<data::ChainResolver>();
    if (!m_options.vacationConfigPath.isEmpty()) {
        chain->append(std::make_unique<data::ExplicitPathResolver>(m_options.vacationConfigPath));
    }
    chain->append(std::make_unique<data::SingleCandidateResolver>());
    return chain;
}

std::unique_ptr<data::ConfigResolver> AppContext::makeHolidayResolver(const data::VacationConfig &vacation) const
{
    auto chain = std::make_unique<data::ChainResolver>();
    if (!m_options.holidayConfigPath.isEmpty()) {
        chain->append(std::make_unique<data::ExplicitPathResolver>(m_options.holidayConfigPath));
    }
    chain->append(std::make_unique<data::ExactMatchResolver>(vacation.region, vacation.year));
    chain->append(std::make_unique<data::SingleCandidateResolver>());
    return chain;
}

} // namespace core
} // namespace vacationplaner
