// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include <QtTest>
#include <QSignalSpy>

#include "QRLogger.h"
#include "QRProgressReporter.h"

using namespace QRelay;
using std::chrono::milliseconds;

/**
 * @brief 进度渲染与限频单元测试
 */
class TestQRProgressReporter : public QObject
{
    Q_OBJECT

private slots:
    void testFormatBytes();
    void testFormatDuration();
    void testProgressBar();
    void testRenderProgress();
    void testRenderSummary();
    void testReportRateLimited();
    void testSummaryAndNotifyNeverSuppressed();
    void testLinesGoToLogger();
};

void TestQRProgressReporter::testFormatBytes()
{
    QCOMPARE(formatBytes(512), QStringLiteral("512 B"));
    QCOMPARE(formatBytes(1536), QStringLiteral("1.50 KB"));
    QCOMPARE(formatBytes(5 * 1024 * 1024), QStringLiteral("5.00 MB"));
    QCOMPARE(formatBytes(qint64(2) * 1024 * 1024 * 1024), QStringLiteral("2.00 GB"));
}

void TestQRProgressReporter::testFormatDuration()
{
    QCOMPARE(formatDuration(0), QStringLiteral("00:00"));
    QCOMPARE(formatDuration(75), QStringLiteral("01:15"));
    QCOMPARE(formatDuration(3725), QStringLiteral("01:02:05"));
    QCOMPARE(formatDuration(-3), QStringLiteral("00:00"));
}

void TestQRProgressReporter::testProgressBar()
{
    QCOMPARE(progressBar(0, 10), QString(10, QChar(0x2591)));
    QCOMPARE(progressBar(100, 10), QString(10, QChar(0x2593)));
    QCOMPARE(progressBar(50, 10), QString(5, QChar(0x2593)) + QString(5, QChar(0x2591)));
    QCOMPARE(progressBar(250, 4), QString(4, QChar(0x2593)));
    QCOMPARE(progressBar(42).size(), 20);
}

void TestQRProgressReporter::testRenderProgress()
{
    QRQueueSnapshot queue;
    queue.userId = 7;
    queue.total = 5;
    queue.completed = 3;
    queue.failed = 1;
    queue.progress = 60.0;
    queue.paused = true;

    QRTaskSnapshot task;
    task.messageId = 103;
    task.status = TaskStatus::Error;
    task.lastError = RelayError::ItemNotFound;
    task.lastErrorMessage = QStringLiteral("message is empty");

    const QString line = QRLogProgressReporter::renderProgress(queue, task);
    QVERIFY(line.contains(QStringLiteral("60.0%")));
    QVERIFY(line.contains(QStringLiteral("3/5 done, 1 failed")));
    QVERIFY(line.contains(QStringLiteral("msg 103 Error")));
    QVERIFY(line.contains(QStringLiteral("message is empty")));
    QVERIFY(line.contains(QStringLiteral("paused")));
}

void TestQRProgressReporter::testRenderSummary()
{
    QRBatchSummary summary;
    summary.userId = 7;
    summary.total = 10;
    summary.succeeded = 9;
    summary.failed = 1;
    summary.successRate = 90.0;
    summary.elapsedMs = 65000;
    summary.aborted = true;
    summary.abortMessage = QStringLiteral("login failed");

    const QString line = QRLogProgressReporter::renderSummary(summary);
    QVERIFY(line.contains(QStringLiteral("10 total, 9 ok, 1 failed")));
    QVERIFY(line.contains(QStringLiteral("90.0% success")));
    QVERIFY(line.contains(QStringLiteral("01:05")));
    QVERIFY(line.contains(QStringLiteral("aborted: login failed")));
}

void TestQRProgressReporter::testReportRateLimited()
{
    QRDefaultLogger logger;
    logger.enableConsoleOutput(false);
    QRLogProgressReporter reporter(&logger, milliseconds(60000));
    QSignalSpy lines(&reporter, &QRLogProgressReporter::lineRendered);

    QRQueueSnapshot queue;
    queue.userId = 7;
    QRTaskSnapshot task;

    reporter.report(7, queue, task);
    reporter.report(7, queue, task);
    reporter.report(7, queue, task);

    QCOMPARE(lines.count(), 1);
    QCOMPARE(reporter.renderedCount(), 1);
    QCOMPARE(reporter.suppressedCount(), 2);

    // 其他用户有独立的限频窗口
    reporter.report(8, queue, task);
    QCOMPARE(reporter.renderedCount(), 2);
}

void TestQRProgressReporter::testSummaryAndNotifyNeverSuppressed()
{
    QRDefaultLogger logger;
    logger.enableConsoleOutput(false);
    QRLogProgressReporter reporter(&logger, milliseconds(60000));

    QRQueueSnapshot queue;
    QRTaskSnapshot task;
    reporter.report(7, queue, task);
    reporter.notify(7, QStringLiteral("resuming"));
    reporter.reportSummary(7, QRBatchSummary());
    reporter.notify(7, QStringLiteral("again"));

    QCOMPARE(reporter.renderedCount(), 4);
    QCOMPARE(reporter.suppressedCount(), 0);
    QVERIFY(reporter.lastLine(7).contains(QStringLiteral("again")));

    // 摘要之后限频窗口重置
    reporter.report(7, queue, task);
    QCOMPARE(reporter.renderedCount(), 5);
}

void TestQRProgressReporter::testLinesGoToLogger()
{
    QRDefaultLogger logger;
    logger.enableConsoleOutput(false);
    QRLogProgressReporter reporter(&logger, milliseconds(0));

    reporter.report(7, QRQueueSnapshot(), QRTaskSnapshot());
    reporter.notify(7, QStringLiteral("session expired"));

    const QList<RelayLogEntry> entries = logger.entries(LogCategory::Progress);
    QCOMPARE(entries.size(), 2);
    QCOMPARE(entries.at(1).level, RelayLogLevel::Warning);
    QVERIFY(entries.at(1).message.contains(QStringLiteral("session expired")));
}

QTEST_MAIN(TestQRProgressReporter)
#include "tst_QRProgressReporter.moc"
