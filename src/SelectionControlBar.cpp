#include "SelectionControlBar.h"
#include "Constants.h"

#include <QHBoxLayout>
#include <QPushButton>

#include <algorithm>

using namespace NeoCR;

SelectionControlBar::SelectionControlBar(QWidget* parent)
    : QWidget(parent)
{
    setAttribute(Qt::WA_TranslucentBackground);

    auto* layout = new QHBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(ControlBar::kButtonSpacing);

    m_changeModelButton = new QPushButton(this);
    m_cancelButton = new QPushButton(tr("Cancel"), this);
    m_cancelButton->setFixedSize(ControlBar::kCancelWidth, ControlBar::kButtonHeight);

    // Keep keyboard focus on the selector so Escape reaches it
    m_changeModelButton->setFocusPolicy(Qt::NoFocus);
    m_cancelButton->setFocusPolicy(Qt::NoFocus);

    layout->addWidget(m_changeModelButton);
    layout->addWidget(m_cancelButton);

    connect(m_changeModelButton, &QPushButton::clicked, this, &SelectionControlBar::changeModelRequested);
    connect(m_cancelButton, &QPushButton::clicked, this, &SelectionControlBar::cancelRequested);

    setStyleSheet(
        "QPushButton { color: #f3f3f3; font-size: 13px; font-weight: 600;"
        " background: qlineargradient(x1:0, y1:0, x2:0, y2:1, stop:0 rgba(255,255,255,58), stop:1 rgba(255,255,255,26));"
        " border: 1px solid rgba(255,255,255,70); border-radius: 12px; padding: 0 12px; }"
        "QPushButton:hover { background: rgba(255,255,255,72); border-color: rgba(45,212,191,180); }"
        "QPushButton:pressed { background: rgba(255,255,255,40); }"
    );

    setModelName(QString());
}

QString SelectionControlBar::changeModelLabel(const QString& modelName)
{
    return tr("Change Model (current: %1)").arg(modelName);
}

int SelectionControlBar::changeModelButtonWidth(const QString& label)
{
    return std::max(ControlBar::kChangeModelMinWidth,
                    static_cast<int>(label.size()) * ControlBar::kPixelsPerChar);
}

QRect SelectionControlBar::barGeometry(const QSize& screenSize, const QSize& barSize)
{
    const int marginBottom = static_cast<int>(screenSize.height() * ControlBar::kBottomMarginRatio);
    const int x = (screenSize.width() - barSize.width()) / 2;
    const int y = screenSize.height() - marginBottom - barSize.height();
    return QRect(QPoint(x, y), barSize);
}

void SelectionControlBar::setModelName(const QString& modelName)
{
    const QString label = changeModelLabel(modelName);
    m_changeModelButton->setText(label);
    m_changeModelButton->setFixedSize(changeModelButtonWidth(label), ControlBar::kButtonHeight);
    updateBarSize();
}

void SelectionControlBar::setChangeModelVisible(bool visible)
{
    m_changeModelVisible = visible;
    m_changeModelButton->setVisible(visible);
    updateBarSize();
}

void SelectionControlBar::positionForScreen(const QSize& screenSize)
{
    setGeometry(barGeometry(screenSize, size()));
}

void SelectionControlBar::updateBarSize()
{
    int width = ControlBar::kCancelWidth;
    if (m_changeModelVisible) {
        width += m_changeModelButton->width() + ControlBar::kButtonSpacing;
    }
    setFixedSize(width, ControlBar::kButtonHeight);
}
