#pragma once

#include <QString>

namespace vacationplaner {
namespace core {

enum class ConfigErrorCode
{
    None,
    MissingField,
    InvalidType,
    InvalidDateFormat,
    InvalidRange,
    FileNotFound,
    ParseError,
    UnsupportedFormat,
};

struct ConfigError
{
    ConfigErrorCode code = ConfigErrorCode::None;
    QString message;

    bool isError() const { return code != ConfigErrorCode::None; }
};

QString errorCodeName(ConfigErrorCode code);

} // namespace core
} // namespace vacationplaner
