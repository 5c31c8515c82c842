#pragma once

#include <QColor>
#include <QImage>
#include <QRectF>
#include <QSizeF>
#include <QString>

#include "vacationplaner/core/DayClassifier.hpp"

class QPainter;

namespace vacationplaner {
namespace render {

class YearCalendarModel;
struct CalendarMonth;

struct CalendarColors
{
    QColor holiday = QColor(0xFF, 0xDD, 0xC1);
    QColor vacation = QColor(0xC1, 0xFF, 0xD7);
    QColor weekend = QColor(0xC1, 0xD4, 0xFF);
    QColor weekday = Qt::white;

    QColor forType(core::DayType type) const;
};

// Draws a year as twelve month tables on an A4 landscape page together with
// a legend and a statistics panel.
class CalendarRenderer
{
public:
    explicit CalendarRenderer(const YearCalendarModel &model);

    void setColors(const CalendarColors &colors);
    const CalendarColors &colors() const;

    // Paints into a device of the given size, scaled from page coordinates.
    void paint(QPainter &painter, const QSizeF &deviceSize) const;

    QImage renderImage(int dpi = 150) const;
    bool savePng(const QString &filePath, int dpi = 300) const;
    bool savePdf(const QString &filePath) const;

    // Outline color of cells belonging to the given vacation block; cycles.
    static QColor blockBorderColor(int blockId);
    static QSizeF pageSize();

private:
    void paintTitle(QPainter &painter, const QRectF &rect) const;
    void paintMonth(QPainter &painter, const CalendarMonth &month, const QRectF &rect) const;
    void paintLegend(QPainter &painter, const QRectF &rect) const;
    void paintStatistics(QPainter &painter, const QRectF &rect) const;

    const YearCalendarModel &m_model;
    CalendarColors m_colors;
};

} // namespace render
} // namespace vacationplaner
