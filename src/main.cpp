#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include "version.h"

#include "vacationplaner/core/AppContext.hpp"
#include "vacationplaner/core/ConfigError.hpp"
#include "vacationplaner/core/DayClassifier.hpp"
#include "vacationplaner/core/Logging.hpp"
#include "vacationplaner/core/Settings.hpp"
#include "vacationplaner/data/IcsExporter.hpp"
#include "vacationplaner/render/CalendarRenderer.hpp"
#include "vacationplaner/render/PreviewWindow.hpp"
#include "vacationplaner/render/YearCalendarModel.hpp"

using namespace vacationplaner;

namespace {

// The preview window is the only part that needs a display.
bool wantsPreview(int argc, char *argv[])
{
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QLatin1String("--no-show") || arg == QLatin1String("--no-viz")
            || arg == QLatin1String("--version") || arg == QLatin1String("--help")
            || arg == QLatin1String("-h") || arg == QLatin1String("-v")) {
            return false;
        }
    }
    return true;
}

render::CalendarColors colorsFromSettings(const core::Settings &settings)
{
    render::CalendarColors colors;
    colors.holiday = QColor(settings.color(core::DayType::Holiday));
    colors.vacation = QColor(settings.color(core::DayType::Vacation));
    colors.weekend = QColor(settings.color(core::DayType::Weekend));
    colors.weekday = QColor(settings.color(core::DayType::Weekday));
    return colors;
}

void printStatistics(QTextStream &out, const core::YearStatistics &stats)
{
    out << "\nStatistics " << stats.year << ":\n";
    out << "  Workdays:          " << stats.workdays << '\n';
    out << "  Weekend days:      " << stats.weekends << '\n';
    out << "  Holidays:          " << stats.holidays << '\n';
    out << "  Vacation workdays: " << stats.vacationWorkdays << '\n';
    out << "  Days off:          " << stats.daysOff << " ("
        << QString::number(stats.percentDaysOff(), 'f', 1) << "%)\n";
    out << "  Days at work:      " << stats.daysAtWork << '\n';
    for (const auto &block : stats.vacationBlockStats) {
        out << "  - " << block.description << ": " << block.workdays << " of " << block.totalDays
            << " days are workdays\n";
    }
}

} // namespace

int main(int argc, char *argv[])
{
    const bool preview = wantsPreview(argc, argv);
    if (!preview && qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QCoreApplication::setOrganizationName(QStringLiteral("VacationPlaner"));
    QCoreApplication::setApplicationName(QStringLiteral("VacationPlaner"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kVacationPlanerVersion));

    QApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("VacationPlaner - A tool for managing and visualizing holidays and vacation days"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption confOption(QStringLiteral("conf"), QStringLiteral("Path to configuration directory"),
                                        QStringLiteral("dir"));
    const QCommandLineOption outputOption(QStringLiteral("output"), QStringLiteral("Path to output directory"),
                                          QStringLiteral("dir"));
    const QCommandLineOption vacationOption(QStringLiteral("vacation-config"),
                                            QStringLiteral("Path to vacation configuration file"),
                                            QStringLiteral("file"));
    const QCommandLineOption holidayOption(QStringLiteral("holiday-config"),
                                           QStringLiteral("Path to holiday configuration file (.json or .ics)"),
                                           QStringLiteral("file"));
    const QCommandLineOption noVizOption(QStringLiteral("no-viz"), QStringLiteral("Skip visualization generation"));
    const QCommandLineOption noIcsOption(QStringLiteral("no-ics"), QStringLiteral("Skip ICS file generation"));
    const QCommandLineOption noShowOption(QStringLiteral("no-show"), QStringLiteral("Don't display visualization"));
    const QCommandLineOption weekendsOption(QStringLiteral("include-weekends"),
                                            QStringLiteral("Include weekends in ICS file"));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QStringLiteral("Enable debug logging"));
    parser.addOptions({confOption, outputOption, vacationOption, holidayOption, noVizOption, noIcsOption,
                       noShowOption, weekendsOption, verboseOption});
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("vacationplaner.*.debug=true"));
    }

    core::Settings settings;
    core::AppOptions options;
    options.configDir = parser.isSet(confOption) ? parser.value(confOption) : settings.configDir();
    options.outputDir = parser.isSet(outputOption) ? parser.value(outputOption) : settings.outputDir();
    options.vacationConfigPath = parser.value(vacationOption);
    options.holidayConfigPath = parser.value(holidayOption);
    const bool includeWeekends = parser.isSet(weekendsOption) || settings.includeWeekends();

    QTextStream out(stdout);
    QTextStream err(stderr);

    core::AppContext context(options);
    core::ConfigError error;
    if (!context.initialize(&error)) {
        qCCritical(lcApp).noquote() << "Initialization failed:" << error.message;
        err << "\nError [" << core::errorCodeName(error.code) << "]: " << error.message << '\n';
        return 1;
    }
    for (const QString &warning : context.warnings()) {
        err << "Warning: " << warning << '\n';
    }
    if (!context.ensureOutputDir()) {
        err << "\nError: cannot create output directory " << options.outputDir << '\n';
        return 1;
    }

    QStringList generated;
    if (!parser.isSet(noIcsOption)) {
        const data::IcsExporter exporter(context.holidayConfig(), context.vacationConfig());
        const QString icsPath = context.outputFilePath(QStringLiteral("ics"));
        if (!exporter.save(icsPath, includeWeekends)) {
            err << "\nError: failed to write " << icsPath << '\n';
            return 1;
        }
        generated << QStringLiteral("ICS: %1").arg(icsPath);
    }

    render::YearCalendarModel model(context.holidayConfig(), context.vacationConfig());
    model.refresh();
    render::CalendarRenderer renderer(model);
    renderer.setColors(colorsFromSettings(settings));

    if (!parser.isSet(noVizOption)) {
        const QString pngPath = context.outputFilePath(QStringLiteral("png"));
        const QString pdfPath = context.outputFilePath(QStringLiteral("pdf"));
        if (!renderer.savePng(pngPath) || !renderer.savePdf(pdfPath)) {
            err << "\nError: failed to write visualization files\n";
            return 1;
        }
        generated << QStringLiteral("PNG: %1").arg(pngPath) << QStringLiteral("PDF: %1").arg(pdfPath);
    }

    out << "\nVacationPlaner completed successfully!\n";
    for (const QString &line : qAsConst(generated)) {
        out << "  - " << line << '\n';
    }
    printStatistics(out, context.statistics());
    out.flush();

    if (preview && !parser.isSet(noVizOption)) {
        render::PreviewWindow window(renderer.renderImage(110));
        window.setWindowTitle(QObject::tr("Vacationplan %1 - %2").arg(context.year()).arg(context.vacationConfig().fullName()));
        window.show();
        return app.exec();
    }
    return 0;
}
