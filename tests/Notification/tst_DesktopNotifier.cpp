#include <QtTest>
#include <QTemporaryDir>

#include "notification/DesktopNotifier.h"

class tst_DesktopNotifier : public QObject
{
    Q_OBJECT

private slots:
    void testTruncate_ShortTextUnchanged();
    void testTruncate_ExactLimitUnchanged();
    void testTruncate_LongTextCut();
    void testTruncate_SurrogatePairs_data();
    void testTruncate_SurrogatePairs();
    void testDefaultProgram();

    void testNotify_Success();
    void testNotify_NonZeroExit();
    void testNotify_MissingProgram();
    void testNotifyTextCaptured_PassesTitleAndPreview();
};

void tst_DesktopNotifier::testTruncate_ShortTextUnchanged()
{
    QCOMPARE(DesktopNotifier::truncateForPreview("hello"), QString("hello"));
    QCOMPARE(DesktopNotifier::truncateForPreview(QString()), QString());
}

void tst_DesktopNotifier::testTruncate_ExactLimitUnchanged()
{
    const QString text(200, QLatin1Char('a'));
    QCOMPARE(DesktopNotifier::truncateForPreview(text), text);
}

void tst_DesktopNotifier::testTruncate_LongTextCut()
{
    const QString text = QString(200, QLatin1Char('a')) + QLatin1Char('b');
    const QString preview = DesktopNotifier::truncateForPreview(text);
    QCOMPARE(preview.size(), 203);
    QCOMPARE(preview, QString(200, QLatin1Char('a')) + "...");
}

void tst_DesktopNotifier::testTruncate_SurrogatePairs_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<QString>("expected");

    // U+1F600 occupies two UTF-16 units
    const QString emoji = QString::fromUcs4(U"\U0001F600");
    QCOMPARE(emoji.size(), 2);

    auto repeat = [](const QString& s, int count) {
        QString out;
        for (int i = 0; i < count; ++i) {
            out += s;
        }
        return out;
    };

    QTest::newRow("150 emoji unchanged") << repeat(emoji, 150) << repeat(emoji, 150);
    QTest::newRow("200 emoji unchanged") << repeat(emoji, 200) << repeat(emoji, 200);
    QTest::newRow("201 emoji cut at 200")
        << repeat(emoji, 201) << repeat(emoji, 200) + "...";
    QTest::newRow("pair straddling unit 200")
        << QString(199, QLatin1Char('a')) + emoji + emoji
        << QString(199, QLatin1Char('a')) + emoji + "...";
    QTest::newRow("mixed exact limit")
        << QString(199, QLatin1Char('a')) + emoji
        << QString(199, QLatin1Char('a')) + emoji;
}

void tst_DesktopNotifier::testTruncate_SurrogatePairs()
{
    QFETCH(QString, text);
    QFETCH(QString, expected);

    const QString preview = DesktopNotifier::truncateForPreview(text);
    QCOMPARE(preview, expected);

    // No lone high surrogate left at the cut
    const QString body = preview.endsWith("...") && preview != text ? preview.chopped(3) : preview;
    QVERIFY(body.isEmpty() || !body.back().isHighSurrogate());
}

void tst_DesktopNotifier::testDefaultProgram()
{
    DesktopNotifier notifier;
    QCOMPARE(notifier.program(), QString("notify-send"));
}

void tst_DesktopNotifier::testNotify_Success()
{
    DesktopNotifier notifier;
    notifier.setProgram("true");
    QVERIFY(notifier.notify("Title", "Body"));
}

void tst_DesktopNotifier::testNotify_NonZeroExit()
{
    DesktopNotifier notifier;
    notifier.setProgram("false");
    QVERIFY(!notifier.notify("Title", "Body"));
}

void tst_DesktopNotifier::testNotify_MissingProgram()
{
    DesktopNotifier notifier;
    notifier.setProgram("neocr-no-such-notifier");
    QVERIFY(!notifier.notify("Title", "Body"));
}

void tst_DesktopNotifier::testNotifyTextCaptured_PassesTitleAndPreview()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    // Script that records its arguments, one per line
    const QString scriptPath = dir.filePath("record.sh");
    const QString outputPath = dir.filePath("args.txt");
    QFile script(scriptPath);
    QVERIFY(script.open(QIODevice::WriteOnly));
    script.write("#!/bin/sh\nprintf '%s\\n' \"$1\" \"$2\" > \"" + outputPath.toUtf8() + "\"\n");
    script.close();
    script.setPermissions(script.permissions() | QFileDevice::ExeOwner);

    DesktopNotifier notifier;
    notifier.setProgram(scriptPath);
    QVERIFY(notifier.notifyTextCaptured(QString(250, QLatin1Char('x'))));

    QFile output(outputPath);
    QVERIFY(output.open(QIODevice::ReadOnly));
    const QStringList lines = QString::fromUtf8(output.readAll()).split('\n', Qt::SkipEmptyParts);
    QCOMPARE(lines.size(), 2);
    QCOMPARE(lines.at(0), QString("Neocr: text captured"));
    QCOMPARE(lines.at(1), QString(200, QLatin1Char('x')) + "...");
}

QTEST_MAIN(tst_DesktopNotifier)
#include "tst_DesktopNotifier.moc"
