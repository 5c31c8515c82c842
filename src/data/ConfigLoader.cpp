#include "vacationplaner/data/ConfigLoader.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>

#include "vacationplaner/core/ConfigValidator.hpp"
#include "vacationplaner/core/Logging.hpp"
#include "vacationplaner/data/ConfigResolver.hpp"
#include "vacationplaner/data/IcsHolidayReader.hpp"

namespace vacationplaner {
namespace data {

namespace {

void reportError(core::ConfigError *error, core::ConfigErrorCode code, const QString &message)
{
    qCWarning(lcConfig).noquote() << message;
    if (error) {
        error->code = code;
        error->message = message;
    }
}

void logCandidates(const QString &kind, const QStringList &candidates)
{
    qCInfo(lcConfig) << "Found" << candidates.size() << kind << "configuration files";
    for (const QString &candidate : candidates) {
        qCInfo(lcConfig).noquote() << "  -" << QFileInfo(candidate).fileName();
    }
}

} // namespace

ConfigLoader::ConfigLoader(QString configDir)
    : m_configDir(QDir(configDir).absolutePath())
{
}

const QString &ConfigLoader::configDir() const
{
    return m_configDir;
}

bool ConfigLoader::configDirExists() const
{
    return QFileInfo(m_configDir).isDir();
}

QStringList ConfigLoader::vacationCandidates() const
{
    return findFiles({QStringLiteral("vacation-planer*.json")});
}

QStringList ConfigLoader::holidayCandidates() const
{
    return findFiles({QStringLiteral("holidays-*.json"), QStringLiteral("*.ics")});
}

std::optional<VacationConfig> ConfigLoader::loadVacationConfig(const ConfigResolver &resolver,
                                                               core::ConfigError *error) const
{
    const QStringList candidates = vacationCandidates();
    logCandidates(QStringLiteral("vacation"), candidates);
    const auto path = resolver.resolve(candidates);
    if (!path) {
        reportError(error, core::ConfigErrorCode::FileNotFound,
                    candidates.isEmpty()
                        ? QStringLiteral("No vacation configuration files found in %1").arg(m_configDir)
                        : QStringLiteral("Could not select a vacation configuration file (%1 candidates, strategy: %2)")
                              .arg(candidates.size())
                              .arg(resolver.name()));
        return std::nullopt;
    }
    return loadVacationFile(*path, error);
}

std::optional<HolidayConfig> ConfigLoader::loadHolidayConfig(const ConfigResolver &resolver,
                                                             core::ConfigError *error) const
{
    const QStringList candidates = holidayCandidates();
    logCandidates(QStringLiteral("holiday"), candidates);
    const auto path = resolver.resolve(candidates);
    if (!path) {
        reportError(error, core::ConfigErrorCode::FileNotFound,
                    candidates.isEmpty()
                        ? QStringLiteral("No holiday configuration files found in %1").arg(m_configDir)
                        : QStringLiteral("Could not select a holiday configuration file (%1 candidates, strategy: %2)")
                              .arg(candidates.size())
                              .arg(resolver.name()));
        return std::nullopt;
    }
    return loadHolidayFile(*path, error);
}

std::optional<QJsonObject> ConfigLoader::readJsonObject(const QString &filePath, core::ConfigError *error)
{
    QFile file(filePath);
    if (!file.exists()) {
        reportError(error, core::ConfigErrorCode::FileNotFound,
                    QStringLiteral("Configuration file does not exist: %1").arg(filePath));
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        reportError(error, core::ConfigErrorCode::ParseError,
                    QStringLiteral("Cannot read %1: %2").arg(filePath, file.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        reportError(error, core::ConfigErrorCode::ParseError,
                    QStringLiteral("Invalid JSON format in %1 at offset %2: %3")
                        .arg(filePath)
                        .arg(parseError.offset)
                        .arg(parseError.errorString()));
        return std::nullopt;
    }
    if (!document.isObject()) {
        reportError(error, core::ConfigErrorCode::InvalidType,
                    QStringLiteral("Configuration root must be an object: %1").arg(filePath));
        return std::nullopt;
    }
    return document.object();
}

std::optional<VacationConfig> ConfigLoader::loadVacationFile(const QString &filePath, core::ConfigError *error)
{
    qCInfo(lcConfig) << "Loading vacation config:" << filePath;
    const auto document = readJsonObject(filePath, error);
    if (!document) {
        return std::nullopt;
    }
    return core::validateVacationConfig(*document, error);
}

std::optional<HolidayConfig> ConfigLoader::loadHolidayFile(const QString &filePath, core::ConfigError *error)
{
    const QString suffix = QFileInfo(filePath).suffix().toLower();
    if (suffix == QLatin1String("ics")) {
        return IcsHolidayReader::read(filePath, error);
    }
    if (suffix != QLatin1String("json")) {
        reportError(error, core::ConfigErrorCode::UnsupportedFormat,
                    QStringLiteral("Unsupported holiday config file format: %1").arg(filePath));
        return std::nullopt;
    }

    qCInfo(lcConfig) << "Loading JSON holiday file:" << filePath;
    const auto document = readJsonObject(filePath, error);
    if (!document) {
        return std::nullopt;
    }
    return core::validateHolidayConfig(*document, error);
}

QStringList ConfigLoader::findFiles(const QStringList &patterns) const
{
    QStringList files;
    const QDir dir(m_configDir);
    if (!dir.exists()) {
        return files;
    }
    for (const QString &pattern : patterns) {
        const QStringList names = dir.entryList({pattern}, QDir::Files | QDir::Readable, QDir::Name);
        for (const QString &name : names) {
            const QString path = dir.filePath(name);
            if (!files.contains(path)) {
                files << path;
            }
        }
    }
    return files;
}

} // namespace data
} // namespace vacationplaner
