#include "vacationplaner/render/CalendarRenderer.hpp"

#include <QDir>
#include <QFileInfo>
#include <QFont>
#include <QFontMetricsF>
#include <QLocale>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QPen>
#include <QStringList>
#include <array>

#include "vacationplaner/core/DateUtils.hpp"
#include "vacationplaner/core/Logging.hpp"
#include "vacationplaner/data/VacationConfig.hpp"
#include "vacationplaner/render/YearCalendarModel.hpp"

namespace vacationplaner {
namespace render {

namespace {
// A4 landscape in points.
constexpr double PageWidth = 842.0;
constexpr double PageHeight = 595.0;
constexpr double PageMargin = 18.0;
constexpr double TitleHeight = 44.0;
constexpr double LegendHeight = 26.0;
constexpr double StatisticsWidth = 190.0;
constexpr int MonthColumns = 3;
constexpr int MonthRows = 4;
constexpr int GridRows = 7; // weekday header plus up to six weeks
constexpr double PointsPerInch = 72.0;
constexpr int PdfResolution = 300;

const std::array<QColor, 6> BlockBorderColors = {
    QColor(0x2E, 0x7D, 0x32),
    QColor(0x15, 0x65, 0xC0),
    QColor(0xC6, 0x28, 0x28),
    QColor(0x6A, 0x1B, 0x9A),
    QColor(0xEF, 0x6C, 0x00),
    QColor(0x00, 0x83, 0x8F),
};

QFont pageFont(int pixelSize, bool bold = false)
{
    QFont font;
    font.setPixelSize(pixelSize);
    font.setBold(bold);
    return font;
}

void ensureParentDir(const QString &filePath)
{
    QDir dir = QFileInfo(filePath).dir();
    if (!dir.exists()) {
        qCInfo(lcRender) << "Creating output directory:" << dir.absolutePath();
        dir.mkpath(QStringLiteral("."));
    }
}
} // namespace

QColor CalendarColors::forType(core::DayType type) const
{
    switch (type) {
    case core::DayType::Holiday:
        return holiday;
    case core::DayType::Vacation:
        return vacation;
    case core::DayType::Weekend:
        return weekend;
    case core::DayType::Weekday:
    default:
        return weekday;
    }
}

CalendarRenderer::CalendarRenderer(const YearCalendarModel &model)
    : m_model(model)
{
}

void CalendarRenderer::setColors(const CalendarColors &colors)
{
    m_colors = colors;
}

const CalendarColors &CalendarRenderer::colors() const
{
    return m_colors;
}

QColor CalendarRenderer::blockBorderColor(int blockId)
{
    const int count = static_cast<int>(BlockBorderColors.size());
    const int index = ((blockId % count) + count) % count;
    return BlockBorderColors[static_cast<size_t>(index)];
}

QSizeF CalendarRenderer::pageSize()
{
    return QSizeF(PageWidth, PageHeight);
}

void CalendarRenderer::paint(QPainter &painter, const QSizeF &deviceSize) const
{
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.scale(deviceSize.width() / PageWidth, deviceSize.height() / PageHeight);
    painter.fillRect(QRectF(0, 0, PageWidth, PageHeight), Qt::white);

    const QRectF content(PageMargin, PageMargin, PageWidth - 2 * PageMargin, PageHeight - 2 * PageMargin);
    paintTitle(painter, QRectF(content.left(), content.top(), content.width(), TitleHeight));

    const double gridTop = content.top() + TitleHeight;
    const double gridHeight = content.height() - TitleHeight - LegendHeight;
    const double gridWidth = content.width() - StatisticsWidth;
    const double monthWidth = gridWidth / MonthColumns;
    const double monthHeight = gridHeight / MonthRows;

    const auto &months = m_model.months();
    for (int index = 0; index < months.size(); ++index) {
        const int row = index / MonthColumns;
        const int column = index % MonthColumns;
        const QRectF monthRect(content.left() + column * monthWidth,
                               gridTop + row * monthHeight,
                               monthWidth,
                               monthHeight);
        paintMonth(painter, months.at(index), monthRect.adjusted(4, 2, -4, -2));
    }

    paintStatistics(painter, QRectF(content.left() + gridWidth + 8, gridTop, StatisticsWidth - 8, gridHeight));
    paintLegend(painter, QRectF(content.left(), content.bottom() - LegendHeight, gridWidth, LegendHeight));
    painter.restore();
}

void CalendarRenderer::paintTitle(QPainter &painter, const QRectF &rect) const
{
    const auto &vacation = m_model.vacationConfig();
    painter.setPen(Qt::black);
    painter.setFont(pageFont(16, true));
    painter.drawText(QRectF(rect.left(), rect.top(), rect.width(), rect.height() / 2),
                     Qt::AlignHCenter | Qt::AlignBottom,
                     QStringLiteral("Vacationplan %1 - %2").arg(m_model.year()).arg(vacation.region));
    painter.setFont(pageFont(12));
    painter.drawText(QRectF(rect.left(), rect.center().y(), rect.width(), rect.height() / 2),
                     Qt::AlignHCenter | Qt::AlignVCenter,
                     vacation.fullName());
}

void CalendarRenderer::paintMonth(QPainter &painter, const CalendarMonth &month, const QRectF &rect) const
{
    const double titleHeight = rect.height() * 0.16;
    const QRectF titleRect(rect.left(), rect.top(), rect.width(), titleHeight);
    painter.setPen(Qt::black);
    painter.setFont(pageFont(11, true));
    painter.drawText(titleRect, Qt::AlignCenter, QLocale::c().standaloneMonthName(month.month));

    const double cellWidth = rect.width() / 7.0;
    const double cellHeight = (rect.height() - titleHeight) / GridRows;
    const double top = titleRect.bottom();
    const QPen gridPen(QColor(0x90, 0x90, 0x90), 0.5);

    painter.setFont(pageFont(7, true));
    for (int column = 0; column < 7; ++column) {
        const QRectF cell(rect.left() + column * cellWidth, top, cellWidth, cellHeight);
        painter.fillRect(cell, QColor(0xEE, 0xEE, 0xEE));
        painter.setPen(gridPen);
        painter.drawRect(cell);
        painter.setPen(Qt::black);
        painter.drawText(cell, Qt::AlignCenter, QLocale::c().dayName(column + 1, QLocale::ShortFormat).left(2));
    }

    painter.setFont(pageFont(7));
    for (int row = 0; row < month.weeks.size(); ++row) {
        const auto &week = month.weeks.at(row);
        for (int column = 0; column < week.size(); ++column) {
            const auto &cell = week.at(column);
            const QRectF cellRect(rect.left() + column * cellWidth,
                                  top + (row + 1) * cellHeight,
                                  cellWidth,
                                  cellHeight);
            painter.fillRect(cellRect, m_colors.forType(cell.classification.type));
            painter.setPen(gridPen);
            painter.drawRect(cellRect);

            if (cell.classification.vacationBlockId) {
                painter.setPen(QPen(blockBorderColor(*cell.classification.vacationBlockId), 1.2));
                painter.drawRect(cellRect.adjusted(0.8, 0.8, -0.8, -0.8));
            }

            if (!cell.classification.display.isEmpty()) {
                painter.setPen(Qt::black);
                painter.drawText(cellRect, Qt::AlignCenter, cell.classification.display);
            }
        }
    }
}

void CalendarRenderer::paintLegend(QPainter &painter, const QRectF &rect) const
{
    struct LegendEntry
    {
        core::DayType type;
        QString label;
    };
    const LegendEntry entries[] = {
        {core::DayType::Holiday, QStringLiteral("Holidays")},
        {core::DayType::Vacation, QStringLiteral("Vacation days")},
        {core::DayType::Weekend, QStringLiteral("Weekends")},
    };

    painter.setFont(pageFont(10));
    const double entryWidth = rect.width() / 3.0;
    const double swatchSize = 10.0;
    int index = 0;
    for (const auto &entry : entries) {
        const double x = rect.left() + index * entryWidth + entryWidth / 4.0;
        const QRectF swatch(x, rect.center().y() - swatchSize / 2, swatchSize * 2, swatchSize);
        painter.fillRect(swatch, m_colors.forType(entry.type));
        painter.setPen(QPen(Qt::darkGray, 0.5));
        painter.drawRect(swatch);
        painter.setPen(Qt::black);
        painter.drawText(QRectF(swatch.right() + 6, rect.top(), entryWidth - swatch.width() - 6, rect.height()),
                         Qt::AlignLeft | Qt::AlignVCenter,
                         entry.label);
        ++index;
    }
}

void CalendarRenderer::paintStatistics(QPainter &painter, const QRectF &rect) const
{
    const auto &stats = m_model.statistics();

    painter.fillRect(rect, QColor(0xF7, 0xF7, 0xF7));
    painter.setPen(QPen(QColor(0xC0, 0xC0, 0xC0), 0.5));
    painter.drawRect(rect);

    const QRectF inner = rect.adjusted(8, 8, -8, -8);
    double y = inner.top();
    const double lineHeight = 13.0;

    auto drawLine = [&](const QString &text, const QFont &font, const QColor &color = Qt::black) {
        if (y + lineHeight > inner.bottom()) {
            return;
        }
        painter.setFont(font);
        painter.setPen(color);
        const QFontMetricsF metrics(font);
        painter.drawText(QRectF(inner.left(), y, inner.width(), lineHeight),
                         Qt::AlignLeft | Qt::AlignVCenter,
                         metrics.elidedText(text, Qt::ElideRight, inner.width()));
        y += lineHeight;
    };

    const QFont heading = pageFont(11, true);
    const QFont body = pageFont(9);
    drawLine(QStringLiteral("Statistics"), heading);
    y += 2;
    drawLine(QStringLiteral("Days in year: %1").arg(stats.totalDays), body);
    drawLine(QStringLiteral("Workdays: %1").arg(stats.workdays), body);
    drawLine(QStringLiteral("Weekend days: %1").arg(stats.weekends), body);
    drawLine(QStringLiteral("Holidays: %1").arg(stats.holidays), body);
    drawLine(QStringLiteral("Vacation days: %1").arg(stats.vacationDays), body);
    drawLine(QStringLiteral("Vacation workdays: %1").arg(stats.vacationWorkdays), body);
    drawLine(QStringLiteral("Days off: %1 (%2%)").arg(stats.daysOff).arg(stats.percentDaysOff(), 0, 'f', 1), body);
    drawLine(QStringLiteral("Days at work: %1").arg(stats.daysAtWork), body);

    if (stats.vacationBlockStats.empty()) {
        return;
    }
    y += lineHeight / 2;
    drawLine(QStringLiteral("Vacation blocks"), heading);
    y += 2;
    const QString dateFormat = QStringLiteral("dd.MM.");
    for (const auto &block : stats.vacationBlockStats) {
        drawLine(block.description, pageFont(9, true), blockBorderColor(block.id));
        drawLine(QStringLiteral("  %1 - %2: %3 days, %4 workdays")
                     .arg(block.start.toString(dateFormat), block.end.toString(dateFormat))
                     .arg(block.totalDays)
                     .arg(block.workdays),
                 body);
    }
}

QImage CalendarRenderer::renderImage(int dpi) const
{
    const QSize size(qRound(PageWidth / PointsPerInch * dpi), qRound(PageHeight / PointsPerInch * dpi));
    QImage image(size, QImage::Format_ARGB32_Premultiplied);
    const int dotsPerMeter = qRound(dpi / 0.0254);
    image.setDotsPerMeterX(dotsPerMeter);
    image.setDotsPerMeterY(dotsPerMeter);
    image.fill(Qt::white);

    QPainter painter(&image);
    paint(painter, QSizeF(size));
    painter.end();
    return image;
}

bool CalendarRenderer::savePng(const QString &filePath, int dpi) const
{
    ensureParentDir(filePath);
    const QImage image = renderImage(dpi);
    if (!image.save(filePath, "PNG")) {
        qCCritical(lcRender) << "Failed to save PNG visualization to" << filePath;
        return false;
    }
    qCInfo(lcRender) << "Saved PNG visualization to:" << filePath;
    return true;
}

bool CalendarRenderer::savePdf(const QString &filePath) const
{
    ensureParentDir(filePath);
    QPdfWriter writer(filePath);
    writer.setResolution(PdfResolution);
    writer.setPageLayout(QPageLayout(QPageSize(QPageSize::A4), QPageLayout::Landscape, QMarginsF(0, 0, 0, 0)));
    writer.setTitle(QStringLiteral("Vacationplan %1").arg(m_model.year()));
    writer.setCreator(QStringLiteral("VacationPlaner"));

    QPainter painter;
    if (!painter.begin(&writer)) {
        qCCritical(lcRender) << "Failed to open PDF for writing:" << filePath;
        return false;
    }
    paint(painter, QSizeF(writer.width(), writer.height()));
    painter.end();

    if (!QFileInfo::exists(filePath)) {
        qCCritical(lcRender) << "Failed to save PDF visualization to" << filePath;
        return false;
    }
    qCInfo(lcRender) << "Saved PDF visualization to:" << filePath;
    return true;
}

} // namespace render
} // namespace vacationplaner
