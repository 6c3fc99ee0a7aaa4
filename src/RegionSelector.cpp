#include "RegionSelector.h"
#include "SelectionControlBar.h"

#include <QApplication>
#include <QCloseEvent>
#include <QCursor>
#include <QDebug>
#include <QFontMetrics>
#include <QGuiApplication>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QScreen>

namespace {
const QColor kAccentColor(45, 212, 191);
const QColor kDimColor(0, 0, 0, 100);
const QColor kLabelBackground(20, 20, 20, 210);
}

RegionSelector::RegionSelector(QWidget* parent)
    : QWidget(parent)
    , m_currentScreen(nullptr)
    , m_selectionManager(nullptr)
    , m_controlBar(nullptr)
{
    setWindowFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint | Qt::Tool);
    setMouseTracking(true);
    setCursor(Qt::CrossCursor);
    setFocusPolicy(Qt::StrongFocus);

    m_selectionManager = new SelectionStateManager(this);
    connect(m_selectionManager, &SelectionStateManager::selectionChanged,
            this, [this](const QRect&) { update(); });

    m_controlBar = new SelectionControlBar(this);
    connect(m_controlBar, &SelectionControlBar::changeModelRequested,
            this, &RegionSelector::onChangeModelClicked);
    connect(m_controlBar, &SelectionControlBar::cancelRequested,
            this, &RegionSelector::cancelSelection);

    // Escape must work even while the control bar or nothing has focus
    qApp->installEventFilter(this);
}

RegionSelector::~RegionSelector()
{
    qApp->removeEventFilter(this);
}

void RegionSelector::setupScreenGeometry(QScreen* screen)
{
    m_currentScreen = screen ? screen : QGuiApplication::primaryScreen();

    const QRect screenGeom = m_currentScreen->geometry();
    setGeometry(screenGeom);
    setFixedSize(screenGeom.size());
    m_selectionManager->setBounds(QRect(0, 0, screenGeom.width(), screenGeom.height()));
}

void RegionSelector::initializeForScreen(QScreen* screen, const QPixmap& preCapture)
{
    setupScreenGeometry(screen);

    if (!preCapture.isNull()) {
        m_backgroundPixmap = preCapture;
        qDebug() << "RegionSelector: Using pre-captured screenshot, size:" << preCapture.size();
    }
    else {
        m_backgroundPixmap = m_currentScreen->grabWindow(0);
        qDebug() << "RegionSelector: Captured screenshot now, size:" << m_backgroundPixmap.size();
    }

    qDebug() << "RegionSelector: Initialized for screen" << m_currentScreen->name()
        << "logical size:" << m_currentScreen->geometry().size()
        << "devicePixelRatio:" << m_currentScreen->devicePixelRatio();

    m_selectionManager->reset();
    m_currentPoint = QCursor::pos() - m_currentScreen->geometry().topLeft();
    m_controlBar->positionForScreen(size());
}

void RegionSelector::setModelName(const QString& modelName)
{
    m_modelName = modelName;
    m_controlBar->setModelName(modelName);
    m_controlBar->positionForScreen(size());
}

void RegionSelector::setModelChangeAllowed(bool allowed)
{
    m_controlBar->setChangeModelVisible(allowed);
    m_controlBar->positionForScreen(size());
}

void RegionSelector::releaseSnapshot()
{
    m_backgroundPixmap = QPixmap();
}

void RegionSelector::cancelSelection()
{
    if (!m_selectionManager->cancel()) {
        return;
    }

    qDebug() << "RegionSelector: Selection cancelled";
    releaseSnapshot();
    emit selectionCancelled();
    close();
}

void RegionSelector::onChangeModelClicked()
{
    if (!m_selectionManager->cancel()) {
        return;
    }

    qDebug() << "RegionSelector: Model change requested, current model" << m_modelName;
    releaseSnapshot();
    emit modelChangeRequested();
    close();
}

// ============================================================================
// Drawing
// ============================================================================

void RegionSelector::paintEvent(QPaintEvent*)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);

    // Snapshot is in device pixels, drawn scaled to the logical size
    if (!m_backgroundPixmap.isNull()) {
        painter.drawPixmap(rect(), m_backgroundPixmap);
    }

    if (m_selectionManager->isFinished()) {
        return;
    }

    const QRect sel = m_selectionManager->isDragging() ? m_selectionManager->selectionRect() : QRect();
    drawDimming(painter, sel);
    if (!sel.isEmpty()) {
        drawSelectionFrame(painter, sel);
        drawSizeLabel(painter, sel);
    }
    drawCrosshair(painter);
}

void RegionSelector::drawDimming(QPainter& painter, const QRect& hole)
{
    QPainterPath shade;
    shade.setFillRule(Qt::OddEvenFill);
    shade.addRect(rect());
    if (!hole.isEmpty()) {
        shade.addRect(hole);
    }
    painter.fillPath(shade, kDimColor);
}

void RegionSelector::drawSelectionFrame(QPainter& painter, const QRect& sel)
{
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setPen(QPen(kAccentColor, 3));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(sel);
    painter.restore();
}

void RegionSelector::drawCrosshair(QPainter& painter)
{
    QColor lineColor = kAccentColor;
    lineColor.setAlpha(160);
    painter.setPen(QPen(lineColor, 1, Qt::DashLine));
    painter.drawLine(QPoint(0, m_currentPoint.y()), QPoint(width(), m_currentPoint.y()));
    painter.drawLine(QPoint(m_currentPoint.x(), 0), QPoint(m_currentPoint.x(), height()));
}

void RegionSelector::drawSizeLabel(QPainter& painter, const QRect& sel)
{
    const QString label = QStringLiteral("%1 \u00d7 %2").arg(sel.width()).arg(sel.height());

    QFont labelFont = painter.font();
    labelFont.setPointSize(11);
    labelFont.setBold(true);
    const QFontMetrics metrics(labelFont);
    const QSize labelSize = metrics.size(Qt::TextSingleLine, label) + QSize(20, 10);

    // Prefer just above the top-left corner, fall back to just inside it
    QPoint origin(sel.left(), sel.top() - labelSize.height() - 6);
    if (origin.y() < 0) {
        origin = sel.topLeft() + QPoint(6, 6);
    }
    origin.setX(qBound(0, origin.x(), qMax(0, width() - labelSize.width())));

    const QRect labelRect(origin, labelSize);
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setPen(Qt::NoPen);
    painter.setBrush(kLabelBackground);
    painter.drawRoundedRect(labelRect, 5, 5);
    painter.setFont(labelFont);
    painter.setPen(Qt::white);
    painter.drawText(labelRect, Qt::AlignCenter, label);
    painter.restore();
}

// ============================================================================
// Input
// ============================================================================

void RegionSelector::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || !m_selectionManager->isIdle()) {
        QWidget::mousePressEvent(event);
        return;
    }

    m_currentPoint = event->pos();
    m_selectionManager->startSelection(event->pos());
}

void RegionSelector::mouseMoveEvent(QMouseEvent* event)
{
    m_currentPoint = event->pos();

    if (m_selectionManager->isDragging()) {
        m_selectionManager->updateSelection(event->pos());
    }
    else {
        update();
    }
}

void RegionSelector::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || !m_selectionManager->isDragging()) {
        QWidget::mouseReleaseEvent(event);
        return;
    }

    m_selectionManager->updateSelection(event->pos());
    if (!m_selectionManager->finishSelection()) {
        qDebug() << "RegionSelector: Selection too small, waiting for a new drag";
        return;
    }

    const QRect globalRegion =
        m_selectionManager->selectionRect().translated(m_currentScreen->geometry().topLeft());
    qDebug() << "RegionSelector: Region selected" << globalRegion;

    releaseSnapshot();
    emit regionSelected(globalRegion);
    close();
}

void RegionSelector::keyPressEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Escape) {
        cancelSelection();
        return;
    }
    QWidget::keyPressEvent(event);
}

void RegionSelector::closeEvent(QCloseEvent* event)
{
    // Closed by the window manager before a result was produced
    if (!m_selectionManager->isFinished()) {
        cancelSelection();
    }
    QWidget::closeEvent(event);
}

bool RegionSelector::eventFilter(QObject* obj, QEvent* event)
{
    if (event->type() == QEvent::KeyPress && isVisible() && !m_selectionManager->isFinished()) {
        QKeyEvent* keyEvent = static_cast<QKeyEvent*>(event);
        if (keyEvent->key() == Qt::Key_Escape) {
            qDebug() << "RegionSelector: Cancelled via Escape (event filter)";
            cancelSelection();
            return true;
        }
    }
    return QWidget::eventFilter(obj, event);
}
