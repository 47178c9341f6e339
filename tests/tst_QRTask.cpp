// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include <QtTest>

#include "QRCancelToken.h"
#include "QRContentType.h"
#include "QRTask.h"

using namespace QRelay;

/**
 * @brief QRTask 状态机与内容类型表单元测试
 *
 * 测试覆盖：
 * - 状态迁移规则（终态不可离开，任意非终态可取消）
 * - 进度、速度与 ETA 计算
 * - 取消令牌的可见性
 * - 内容类型能力表与文件名生成
 */
class TestQRTask : public QObject
{
    Q_OBJECT

private slots:
    // ========== 状态机 ==========
    void testInitialState();
    void testHappyPathTransitions();
    void testTerminalStatesAreFinal();
    void testCancelFromAnyActiveState();
    void testIllegalTransitionRejected();
    void testRequeueAfterAbort();

    // ========== 进度 ==========
    void testProgressComputation();
    void testProgressWithoutTotal();
    void testResetProgress();

    // ========== 取消与错误 ==========
    void testCancelTokenVisibility();
    void testSetErrorDefaultsMessage();
    void testSnapshotCopiesFields();

    // ========== 内容类型 ==========
    void testContentTypeTable();
    void testContentTypeFromName();
    void testResolveExtension_data();
    void testResolveExtension();
    void testGenerateFileName();
};

void TestQRTask::testInitialState()
{
    QRTask task(1, 2, 101, 7);
    QCOMPARE(task.status(), TaskStatus::Queued);
    QCOMPARE(task.userId(), qint64(1));
    QCOMPARE(task.chatId(), qint64(2));
    QCOMPARE(task.messageId(), qint64(101));
    QCOMPARE(task.requestMessageId(), qint64(7));
    QCOMPARE(task.retryCount(), 0);
    QCOMPARE(task.progress(), 0.0);
    QVERIFY(!task.startTime().isValid());
}

void TestQRTask::testHappyPathTransitions()
{
    QRTask task(1, 2, 101);
    const QDateTime now = QDateTime::currentDateTimeUtc();

    task.start(now);
    QCOMPARE(task.status(), TaskStatus::Downloading);
    QCOMPARE(task.startTime(), now);

    QVERIFY(task.setStatus(TaskStatus::Uploading));
    QVERIFY(task.setStatus(TaskStatus::Completed));
    QCOMPARE(task.status(), TaskStatus::Completed);
}

void TestQRTask::testTerminalStatesAreFinal()
{
    const QList<TaskStatus> terminals = {
        TaskStatus::Completed, TaskStatus::Cancelled, TaskStatus::Error, TaskStatus::Skipped
    };
    const QList<TaskStatus> all = {
        TaskStatus::Queued, TaskStatus::Downloading, TaskStatus::Uploading, TaskStatus::Completed,
        TaskStatus::Paused, TaskStatus::Cancelled, TaskStatus::Error, TaskStatus::Skipped
    };

    for (TaskStatus from : terminals) {
        QVERIFY(isTerminalStatus(from));
        for (TaskStatus to : all) {
            if (to == from) {
                continue;
            }
            QVERIFY2(!QRTask::canTransition(from, to),
                     qPrintable(taskStatusName(from) + QStringLiteral(" -> ") + taskStatusName(to)));
        }
    }
}

void TestQRTask::testCancelFromAnyActiveState()
{
    const QList<TaskStatus> live = {
        TaskStatus::Queued, TaskStatus::Downloading, TaskStatus::Uploading, TaskStatus::Paused
    };
    for (TaskStatus from : live) {
        QVERIFY(!isTerminalStatus(from));
        QVERIFY(QRTask::canTransition(from, TaskStatus::Cancelled));
    }
}

void TestQRTask::testIllegalTransitionRejected()
{
    QRTask task(1, 2, 101);

    // Queued 不能直接完成
    QVERIFY(!task.setStatus(TaskStatus::Completed));
    QCOMPARE(task.status(), TaskStatus::Queued);

    QVERIFY(!task.setStatus(TaskStatus::Uploading));
    QVERIFY(task.setStatus(TaskStatus::Downloading));

    QVERIFY(task.setStatus(TaskStatus::Completed));
    QVERIFY(!task.setStatus(TaskStatus::Downloading));
    QCOMPARE(task.status(), TaskStatus::Completed);
}

void TestQRTask::testRequeueAfterAbort()
{
    QRTask task(1, 2, 101);
    task.start();
    task.updateProgress(50, 100);

    QVERIFY(task.setStatus(TaskStatus::Queued));
    task.resetProgress();
    QCOMPARE(task.status(), TaskStatus::Queued);
    QCOMPARE(task.bytesTransferred(), qint64(0));
    QVERIFY(!task.startTime().isValid());
}

void TestQRTask::testProgressComputation()
{
    QRTask task(1, 2, 101);
    const QDateTime start = QDateTime::currentDateTimeUtc();
    task.start(start);

    task.updateProgress(250, 1000, start.addSecs(5));
    QCOMPARE(task.progress(), 25.0);
    QCOMPARE(task.speed(), 50.0);   // 250 字节 / 5 秒
    QCOMPARE(task.eta(), 15.0);     // 750 / 50
}

void TestQRTask::testProgressWithoutTotal()
{
    QRTask task(1, 2, 101);
    const QDateTime start = QDateTime::currentDateTimeUtc();
    task.start(start);

    task.updateProgress(100, 0, start.addSecs(1));
    QCOMPARE(task.progress(), 0.0);
    QCOMPARE(task.eta(), 0.0);

    // 没有经过时间时速度为 0，而不是除零
    task.updateProgress(100, 200, start);
    QCOMPARE(task.progress(), 50.0);
    QCOMPARE(task.speed(), 0.0);
    QCOMPARE(task.eta(), 0.0);
}

void TestQRTask::testResetProgress()
{
    QRTask task(1, 2, 101);
    const QDateTime start = QDateTime::currentDateTimeUtc();
    task.start(start);
    task.updateProgress(10, 20, start.addSecs(2));

    task.resetProgress();
    QCOMPARE(task.progress(), 0.0);
    QCOMPARE(task.speed(), 0.0);
    QCOMPARE(task.totalBytes(), qint64(0));
}

void TestQRTask::testCancelTokenVisibility()
{
    auto token = QRCancelTokenPtr::create();
    QRTask task(1, 2, 101);
    task.setCancelToken(token);
    task.start();

    QVERIFY(!task.isCancelled());
    token->cancel();
    QVERIFY(task.isCancelled());
    // 令牌只是信号，状态仍由队列管理器迁移
    QCOMPARE(task.status(), TaskStatus::Downloading);

    QRTask other(1, 2, 102);
    QVERIFY(other.setStatus(TaskStatus::Cancelled));
    QVERIFY(other.isCancelled());
}

void TestQRTask::testSetErrorDefaultsMessage()
{
    QRTask task(1, 2, 101);
    task.setError(RelayError::ItemTooLarge);
    QCOMPARE(task.lastError(), RelayError::ItemTooLarge);
    QCOMPARE(task.lastErrorMessage(), errorString(RelayError::ItemTooLarge));

    task.setError(RelayError::ItemFatal, QStringLiteral("media unavailable"));
    QCOMPARE(task.lastErrorMessage(), QStringLiteral("media unavailable"));
}

void TestQRTask::testSnapshotCopiesFields()
{
    QRTask task(5, 6, 77, 8);
    task.start();
    task.incrementRetryCount();
    QROutputDescriptor output;
    output.contentType = ContentType::Photo;
    output.fileName = QStringLiteral("photo_8_77_1.jpg");
    task.setOutput(output);

    const QRTaskSnapshot s = task.snapshot();
    QCOMPARE(s.userId, qint64(5));
    QCOMPARE(s.messageId, qint64(77));
    QCOMPARE(s.requestMessageId, qint64(8));
    QCOMPARE(s.status, TaskStatus::Downloading);
    QCOMPARE(s.retryCount, 1);
    QCOMPARE(s.output.fileName, output.fileName);
    QCOMPARE(s.output.contentType, ContentType::Photo);
}

void TestQRTask::testContentTypeTable()
{
    QVERIFY(!contentTypeInfo(ContentType::Text).isMedia);
    QVERIFY(contentTypeInfo(ContentType::Photo).isMedia);

    QVERIFY(contentTypeInfo(ContentType::Video).hasThumbnail);
    QVERIFY(contentTypeInfo(ContentType::Audio).hasThumbnail);
    QVERIFY(contentTypeInfo(ContentType::Document).hasThumbnail);
    QVERIFY(!contentTypeInfo(ContentType::Photo).hasThumbnail);
    QVERIFY(!contentTypeInfo(ContentType::Sticker).hasThumbnail);

    QCOMPARE(contentTypeName(ContentType::Video), QStringLiteral("Video"));
    QCOMPARE(contentTypeInfo(ContentType::Voice).type, ContentType::Voice);
}

void TestQRTask::testContentTypeFromName()
{
    QCOMPARE(contentTypeFromName(QStringLiteral("Document")).value(), ContentType::Document);
    QCOMPARE(contentTypeFromName(QStringLiteral("animation")).value(), ContentType::Animation);
    QVERIFY(!contentTypeFromName(QStringLiteral("hologram")).has_value());
}

void TestQRTask::testResolveExtension_data()
{
    QTest::addColumn<int>("type");
    QTest::addColumn<QString>("mime");
    QTest::addColumn<bool>("animated");
    QTest::addColumn<bool>("video");
    QTest::addColumn<QString>("expected");

    QTest::newRow("text") << int(ContentType::Text) << QString() << false << false << "txt";
    QTest::newRow("photo") << int(ContentType::Photo) << QString() << false << false << "jpg";
    QTest::newRow("video-default") << int(ContentType::Video) << QString() << false << false << "mp4";
    QTest::newRow("video-mkv") << int(ContentType::Video) << "video/x-matroska" << false << false << "mkv";
    QTest::newRow("video-webm") << int(ContentType::Video) << "video/webm" << false << false << "webm";
    QTest::newRow("audio-ogg") << int(ContentType::Audio) << "audio/ogg" << false << false << "ogg";
    QTest::newRow("audio-default") << int(ContentType::Audio) << "audio/mpeg" << false << false << "mp3";
    QTest::newRow("animation-gif") << int(ContentType::Animation) << "image/gif" << false << false << "gif";
    QTest::newRow("sticker-static") << int(ContentType::Sticker) << QString() << false << false << "webp";
    QTest::newRow("sticker-animated") << int(ContentType::Sticker) << QString() << true << false << "tgs";
    QTest::newRow("sticker-video") << int(ContentType::Sticker) << QString() << false << true << "webm";
    QTest::newRow("document") << int(ContentType::Document) << "application/pdf" << false << false << "bin";
}

void TestQRTask::testResolveExtension()
{
    QFETCH(int, type);
    QFETCH(QString, mime);
    QFETCH(bool, animated);
    QFETCH(bool, video);
    QFETCH(QString, expected);

    MediaHints hints;
    hints.mimeType = mime;
    hints.animated = animated;
    hints.video = video;
    QCOMPARE(resolveExtension(static_cast<ContentType>(type), hints), expected);
}

void TestQRTask::testGenerateFileName()
{
    QCOMPARE(generateFileName(ContentType::Photo, MediaHints(), 10, 101, 1700000000),
             QStringLiteral("photo_10_101_1700000000.jpg"));

    // 媒体保留原始文件名
    QCOMPARE(generateFileName(ContentType::Document, MediaHints(), 10, 101, 1700000000,
                              QStringLiteral("report.pdf")),
             QStringLiteral("report.pdf"));

    // 文本消息没有原始文件名可用
    const QString text = generateFileName(ContentType::Text, MediaHints(), 10, 101, 1700000000,
                                          QStringLiteral("ignored.txt"));
    QVERIFY(text.endsWith(QStringLiteral("_10_101_1700000000.txt")));
}

QTEST_MAIN(TestQRTask)
#include "tst_QRTask.moc"
