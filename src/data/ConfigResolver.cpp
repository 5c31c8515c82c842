#include "vacationplaner/data/ConfigResolver.hpp"

#include <QFileInfo>

#include "vacationplaner/core/Logging.hpp"

namespace vacationplaner {
namespace data {

ExplicitPathResolver::ExplicitPathResolver(QString path)
    : m_path(std::move(path))
{
}

std::optional<QString> ExplicitPathResolver::resolve(const QStringList &candidates) const
{
    Q_UNUSED(candidates);
    if (m_path.isEmpty()) {
        return std::nullopt;
    }
    const QFileInfo info(m_path);
    if (!info.exists() || !info.isFile()) {
        qCWarning(lcConfig) << "Configured file does not exist:" << m_path;
        return std::nullopt;
    }
    return info.absoluteFilePath();
}

QString ExplicitPathResolver::name() const
{
    return QStringLiteral("explicit path");
}

ExactMatchResolver::ExactMatchResolver(QString region, int year)
    : m_region(std::move(region))
    , m_year(year)
{
}

std::optional<QString> ExactMatchResolver::resolve(const QStringList &candidates) const
{
    if (m_region.isEmpty()) {
        return std::nullopt;
    }
    const QString region = m_region.toLower();
    const QString year = QString::number(m_year);
    const QString stem = QStringLiteral("holidays-%1-%2").arg(region, year);

    for (const QString &suffix : {QStringLiteral(".json"), QStringLiteral(".ics")}) {
        for (const QString &candidate : candidates) {
            if (QFileInfo(candidate).fileName().toLower() == stem + suffix) {
                qCInfo(lcConfig) << "Found exact match:" << candidate;
                return candidate;
            }
        }
    }

    for (const QString &candidate : candidates) {
        const QString fileName = QFileInfo(candidate).fileName().toLower();
        if (fileName.contains(region) && fileName.contains(year)) {
            qCInfo(lcConfig) << "Found partial match:" << candidate;
            return candidate;
        }
    }
    return std::nullopt;
}

QString ExactMatchResolver::name() const
{
    return QStringLiteral("region/year match (%1 %2)").arg(m_region).arg(m_year);
}

std::optional<QString> SingleCandidateResolver::resolve(const QStringList &candidates) const
{
    if (candidates.size() != 1) {
        return std::nullopt;
    }
    qCInfo(lcConfig) << "Using the only available file:" << candidates.front();
    return candidates.front();
}

QString SingleCandidateResolver::name() const
{
    return QStringLiteral("single candidate");
}

void ChainResolver::append(std::unique_ptr<ConfigResolver> resolver)
{
    if (!resolver) {
        return;
    }
    m_resolvers.push_back(std::move(resolver));
}

bool ChainResolver::isEmpty() const
{
    return m_resolvers.empty();
}

std::optional<QString> ChainResolver::resolve(const QStringList &candidates) const
{
    for (const auto &resolver : m_resolvers) {
        if (auto path = resolver->resolve(candidates)) {
            qCDebug(lcConfig) << "Resolved" << *path << "via" << resolver->name();
            return path;
        }
    }
    return std::nullopt;
}

QString ChainResolver::name() const
{
    QStringList names;
    for (const auto &resolver : m_resolvers) {
        names << resolver->name();
    }
    return names.join(QStringLiteral(" > "));
}

} // namespace data
} // namespace vacationplaner
