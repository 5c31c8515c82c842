#pragma once

#include <QImage>
#include <QScrollArea>

class QLabel;

namespace vacationplaner {
namespace render {

class PreviewWindow : public QScrollArea
{
    Q_OBJECT

public:
    explicit PreviewWindow(const QImage &image, QWidget *parent = nullptr);

protected:
    void keyPressEvent(QKeyEvent *event) override;

private:
    QLabel *m_imageLabel = nullptr;
};

} // namespace render
} // namespace vacationplaner
