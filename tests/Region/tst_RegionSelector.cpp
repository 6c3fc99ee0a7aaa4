#include <QtTest>
#include "RegionSelector.h"
#include "SelectionControlBar.h"
#include <QGuiApplication>
#include <QPushButton>
#include <QScreen>
#include <QSignalSpy>

/**
 * @brief Widget-level tests for RegionSelector.
 *
 * Runs on the offscreen platform, where the primary screen sits at the
 * origin so local and global coordinates coincide.
 */
class tst_RegionSelector : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testInitialState();
    void testDragSelectsRegion_data();
    void testDragSelectsRegion();
    void testSmallDragIsIgnored();
    void testEscapeBeforeDragCancels();
    void testEscapeWhileDragging();
    void testDoubleEscapeEmitsOnce();
    void testCancelButtonThenEscape();
    void testCancelSelectionSlotIsIdempotent();
    void testCancelAfterSelectionIsNoop();
    void testWindowCloseCancels();
    void testChangeModelRequested();
    void testChangeModelHidden();
    void testModelNameInControlBar();

private:
    void drag(const QPoint& from, const QPoint& to);

    RegionSelector* m_selector = nullptr;
};

void tst_RegionSelector::init()
{
    QScreen* screen = QGuiApplication::primaryScreen();
    QVERIFY(screen);

    QPixmap snapshot(screen->geometry().size());
    snapshot.fill(Qt::darkGray);

    m_selector = new RegionSelector();
    m_selector->initializeForScreen(screen, snapshot);
    m_selector->setModelName(QStringLiteral("qwen3-vl:8b"));
    m_selector->show();
    QVERIFY(QTest::qWaitForWindowExposed(m_selector));
}

void tst_RegionSelector::cleanup()
{
    delete m_selector;
    m_selector = nullptr;
}

void tst_RegionSelector::drag(const QPoint& from, const QPoint& to)
{
    QTest::mousePress(m_selector, Qt::LeftButton, Qt::NoModifier, from);
    QTest::mouseMove(m_selector, (from + to) / 2);
    QTest::mouseRelease(m_selector, Qt::LeftButton, Qt::NoModifier, to);
}

void tst_RegionSelector::testInitialState()
{
    QVERIFY(m_selector->hasSnapshot());
    QVERIFY(m_selector->selectionManager()->isIdle());
    QCOMPARE(m_selector->currentScreen(), QGuiApplication::primaryScreen());
}

void tst_RegionSelector::testDragSelectsRegion_data()
{
    QTest::addColumn<QPoint>("from");
    QTest::addColumn<QPoint>("to");

    QTest::newRow("down-right") << QPoint(100, 100) << QPoint(400, 300);
    QTest::newRow("up-left") << QPoint(400, 300) << QPoint(100, 100);
}

void tst_RegionSelector::testDragSelectsRegion()
{
    QFETCH(QPoint, from);
    QFETCH(QPoint, to);

    QSignalSpy selectedSpy(m_selector, &RegionSelector::regionSelected);
    QSignalSpy cancelledSpy(m_selector, &RegionSelector::selectionCancelled);

    drag(from, to);

    QCOMPARE(selectedSpy.count(), 1);
    QCOMPARE(cancelledSpy.count(), 0);

    const QRect expected = QRect(100, 100, 300, 200)
        .translated(QGuiApplication::primaryScreen()->geometry().topLeft());
    QCOMPARE(selectedSpy.first().at(0).toRect(), expected);
    QVERIFY(!m_selector->hasSnapshot());
    QVERIFY(!m_selector->isVisible());
}

void tst_RegionSelector::testSmallDragIsIgnored()
{
    QSignalSpy selectedSpy(m_selector, &RegionSelector::regionSelected);

    drag(QPoint(100, 100), QPoint(105, 105));

    QCOMPARE(selectedSpy.count(), 0);
    QVERIFY(m_selector->selectionManager()->isIdle());
    QVERIFY(m_selector->hasSnapshot());

    // Retry succeeds
    drag(QPoint(100, 100), QPoint(200, 200));
    QCOMPARE(selectedSpy.count(), 1);
    QCOMPARE(selectedSpy.first().at(0).toRect().size(), QSize(100, 100));
}

void tst_RegionSelector::testEscapeBeforeDragCancels()
{
    QSignalSpy cancelledSpy(m_selector, &RegionSelector::selectionCancelled);
    QSignalSpy selectedSpy(m_selector, &RegionSelector::regionSelected);

    QTest::keyClick(m_selector, Qt::Key_Escape);

    QCOMPARE(cancelledSpy.count(), 1);
    QCOMPARE(selectedSpy.count(), 0);
    QVERIFY(m_selector->selectionManager()->isCancelled());
    QVERIFY(!m_selector->hasSnapshot());
}

void tst_RegionSelector::testEscapeWhileDragging()
{
    QSignalSpy cancelledSpy(m_selector, &RegionSelector::selectionCancelled);
    QSignalSpy selectedSpy(m_selector, &RegionSelector::regionSelected);

    QTest::mousePress(m_selector, Qt::LeftButton, Qt::NoModifier, QPoint(100, 100));
    QTest::mouseMove(m_selector, QPoint(300, 300));
    QTest::keyClick(m_selector, Qt::Key_Escape);

    QCOMPARE(cancelledSpy.count(), 1);
    QCOMPARE(m_selector->selectionManager()->selectionRect(), QRect());
    QCOMPARE(selectedSpy.count(), 0);
}

void tst_RegionSelector::testDoubleEscapeEmitsOnce()
{
    QSignalSpy cancelledSpy(m_selector, &RegionSelector::selectionCancelled);

    QTest::keyClick(m_selector, Qt::Key_Escape);
    QTest::keyClick(m_selector, Qt::Key_Escape);

    QCOMPARE(cancelledSpy.count(), 1);
}

void tst_RegionSelector::testCancelButtonThenEscape()
{
    QSignalSpy cancelledSpy(m_selector, &RegionSelector::selectionCancelled);

    m_selector->controlBar()->cancelButton()->click();
    QTest::keyClick(m_selector, Qt::Key_Escape);

    QCOMPARE(cancelledSpy.count(), 1);
}

void tst_RegionSelector::testCancelSelectionSlotIsIdempotent()
{
    QSignalSpy cancelledSpy(m_selector, &RegionSelector::selectionCancelled);

    // Global listener and local handler firing together
    QMetaObject::invokeMethod(m_selector, "cancelSelection", Qt::QueuedConnection);
    m_selector->cancelSelection();
    QCoreApplication::processEvents();

    QCOMPARE(cancelledSpy.count(), 1);
}

void tst_RegionSelector::testCancelAfterSelectionIsNoop()
{
    QSignalSpy cancelledSpy(m_selector, &RegionSelector::selectionCancelled);
    QSignalSpy selectedSpy(m_selector, &RegionSelector::regionSelected);

    drag(QPoint(100, 100), QPoint(400, 300));
    m_selector->cancelSelection();

    QCOMPARE(selectedSpy.count(), 1);
    QCOMPARE(cancelledSpy.count(), 0);
}

void tst_RegionSelector::testWindowCloseCancels()
{
    QSignalSpy cancelledSpy(m_selector, &RegionSelector::selectionCancelled);

    m_selector->close();

    QCOMPARE(cancelledSpy.count(), 1);
    QVERIFY(!m_selector->hasSnapshot());
}

void tst_RegionSelector::testChangeModelRequested()
{
    QSignalSpy changeSpy(m_selector, &RegionSelector::modelChangeRequested);
    QSignalSpy cancelledSpy(m_selector, &RegionSelector::selectionCancelled);

    m_selector->controlBar()->changeModelButton()->click();

    QCOMPARE(changeSpy.count(), 1);
    QCOMPARE(cancelledSpy.count(), 0);
    QVERIFY(!m_selector->hasSnapshot());
    QVERIFY(!m_selector->isVisible());
}

void tst_RegionSelector::testChangeModelHidden()
{
    m_selector->setModelChangeAllowed(false);

    QVERIFY(!m_selector->controlBar()->isChangeModelVisible());
    QVERIFY(m_selector->controlBar()->changeModelButton()->isHidden());
    QCOMPARE(m_selector->controlBar()->width(), 120);
}

void tst_RegionSelector::testModelNameInControlBar()
{
    QCOMPARE(m_selector->controlBar()->changeModelButton()->text(),
             QStringLiteral("Change Model (current: qwen3-vl:8b)"));
}

QTEST_MAIN(tst_RegionSelector)
#include "tst_RegionSelector.moc"
