#pragma once

#include <QString>
#include <QStringList>
#include <memory>
#include <optional>
#include <vector>

namespace vacationplaner {
namespace data {

// Picks one configuration file out of the discovered candidates.
class ConfigResolver
{
public:
    virtual ~ConfigResolver() = default;

    virtual std::optional<QString> resolve(const QStringList &candidates) const = 0;
    virtual QString name() const = 0;
};

class ExplicitPathResolver : public ConfigResolver
{
public:
    explicit ExplicitPathResolver(QString path);

    std::optional<QString> resolve(const QStringList &candidates) const override;
    QString name() const override;

private:
    QString m_path;
};

// holidays-{region}-{year}.json, then .ics, then any candidate whose file
// name contains both region and year (case-insensitive).
class ExactMatchResolver : public ConfigResolver
{
public:
    ExactMatchResolver(QString region, int year);

    std::optional<QString> resolve(const QStringList &candidates) const override;
    QString name() const override;

private:
    QString m_region;
    int m_year = 0;
};

class SingleCandidateResolver : public ConfigResolver
{
public:
    std::optional<QString> resolve(const QStringList &candidates) const override;
    QString name() const override;
};

class ChainResolver : public ConfigResolver
{
public:
    ChainResolver() = default;

    void append(std::unique_ptr<ConfigResolver> resolver);
    bool isEmpty() const;

    std::optional<QString> resolve(const QStringList &candidates) const override;
    QString name() const override;

private:
    std::vector<std::unique_ptr<ConfigResolver>> m_resolvers;
};

} // namespace data
} // namespace vacationplaner
