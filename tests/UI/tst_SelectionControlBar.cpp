#include <QtTest>
#include "SelectionControlBar.h"
#include <QPushButton>
#include <QSignalSpy>

class tst_SelectionControlBar : public QObject
{
    Q_OBJECT

private slots:
    void testChangeModelButtonWidth_data();
    void testChangeModelButtonWidth();
    void testBarGeometry();
    void testBarSize();
    void testPositionForScreen();
    void testSignals();
};

void tst_SelectionControlBar::testChangeModelButtonWidth_data()
{
    QTest::addColumn<QString>("modelName");
    QTest::addColumn<int>("expectedWidth");

    // 35 characters * 7 = 245, below the minimum
    QTest::newRow("short") << QStringLiteral("qwen3-vl:8b") << 250;
    // 24 + 60 characters * 7
    QTest::newRow("long") << QString(60, QLatin1Char('x')) << 588;
}

void tst_SelectionControlBar::testChangeModelButtonWidth()
{
    QFETCH(QString, modelName);
    QFETCH(int, expectedWidth);

    const QString label = SelectionControlBar::changeModelLabel(modelName);
    QCOMPARE(SelectionControlBar::changeModelButtonWidth(label), expectedWidth);
}

void tst_SelectionControlBar::testBarGeometry()
{
    const QRect geometry = SelectionControlBar::barGeometry(QSize(1920, 1080), QSize(380, 40));

    QCOMPARE(geometry, QRect(770, 932, 380, 40));
}

void tst_SelectionControlBar::testBarSize()
{
    SelectionControlBar bar;
    bar.setModelName(QStringLiteral("qwen3-vl:8b"));

    QCOMPARE(bar.changeModelButton()->size(), QSize(250, 40));
    QCOMPARE(bar.cancelButton()->size(), QSize(120, 40));
    QCOMPARE(bar.size(), QSize(380, 40));
}

void tst_SelectionControlBar::testPositionForScreen()
{
    QWidget host;
    host.resize(1000, 800);
    auto* bar = new SelectionControlBar(&host);
    bar->setModelName(QStringLiteral("llava:7b"));

    bar->positionForScreen(host.size());

    QCOMPARE(bar->geometry().bottom() + 1, 800 - 80);
    QCOMPARE(bar->x(), (1000 - bar->width()) / 2);
}

void tst_SelectionControlBar::testSignals()
{
    SelectionControlBar bar;
    QSignalSpy changeSpy(&bar, &SelectionControlBar::changeModelRequested);
    QSignalSpy cancelSpy(&bar, &SelectionControlBar::cancelRequested);

    bar.changeModelButton()->click();
    bar.cancelButton()->click();

    QCOMPARE(changeSpy.count(), 1);
    QCOMPARE(cancelSpy.count(), 1);
}

QTEST_MAIN(tst_SelectionControlBar)
#include "tst_SelectionControlBar.moc"
