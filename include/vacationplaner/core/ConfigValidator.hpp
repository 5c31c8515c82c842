#pragma once

#include <QJsonObject>
#include <QStringList>
#include <optional>

#include "vacationplaner/core/ConfigError.hpp"
#include "vacationplaner/data/HolidayConfig.hpp"
#include "vacationplaner/data/VacationConfig.hpp"

namespace vacationplaner {
namespace core {

// Both validators return std::nullopt and fill *error on the first violation.
// Entries dated outside the declared year are logged, not rejected.
std::optional<data::HolidayConfig> validateHolidayConfig(const QJsonObject &document,
                                                         ConfigError *error = nullptr);
std::optional<data::VacationConfig> validateVacationConfig(const QJsonObject &document,
                                                           ConfigError *error = nullptr);

// Year and region mismatches between the two documents. Never fatal.
QStringList checkCompatibility(const data::HolidayConfig &holidays, const data::VacationConfig &vacation);

} // namespace core
} // namespace vacationplaner
