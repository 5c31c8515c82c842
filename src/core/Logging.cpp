#include "vacationplaner/core/Logging.hpp"

namespace vacationplaner {

Q_LOGGING_CATEGORY(lcConfig, "vacationplaner.config", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCalendar, "vacationplaner.calendar", QtInfoMsg)
Q_LOGGING_CATEGORY(lcExport, "vacationplaner.export", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRender, "vacationplaner.render", QtInfoMsg)
Q_LOGGING_CATEGORY(lcApp, "vacationplaner.app", QtInfoMsg)

} // namespace vacationplaner
