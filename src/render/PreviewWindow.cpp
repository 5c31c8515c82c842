#include "vacationplaner/render/PreviewWindow.hpp"

#include <QGuiApplication>
#include <QKeyEvent>
#include <QLabel>
#include <QPixmap>
#include <QScreen>

namespace vacationplaner {
namespace render {

PreviewWindow::PreviewWindow(const QImage &image, QWidget *parent)
    : QScrollArea(parent)
{
    m_imageLabel = new QLabel(this);
    m_imageLabel->setPixmap(QPixmap::fromImage(image));
    m_imageLabel->setAlignment(Qt::AlignCenter);
    setWidget(m_imageLabel);
    setWidgetResizable(true);
    setBackgroundRole(QPalette::Dark);

    QSize preferred = image.size() + QSize(24, 24);
    if (const QScreen *screen = QGuiApplication::primaryScreen()) {
        preferred = preferred.boundedTo(screen->availableSize() * 0.9);
    }
    resize(preferred);
}

void PreviewWindow::keyPressEvent(QKeyEvent *event)
{
    if (event->key() == Qt::Key_Escape || event->matches(QKeySequence::Close)) {
        close();
        return;
    }
    QScrollArea::keyPressEvent(event);
}

} // namespace render
} // namespace vacationplaner
