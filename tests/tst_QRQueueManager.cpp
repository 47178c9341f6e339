// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

/**
 * @file tst_QRQueueManager.cpp
 * @brief QRQueueManager 单元测试
 *
 * 测试覆盖：
 * - 批次接受与拒绝（无效区间、超过上限）
 * - 任务推进、计数器与批次进度
 * - 暂停/恢复/取消的语义与幂等性
 * - 检查点合并写入、强制刷新与失败上报
 * - 队列不变量
 */

#include <QtTest>
#include <QSignalSpy>

#include "QRMemoryCheckpointStore.h"
#include "QRQueueManager.h"
#include "QRQueueRegistry.h"

using namespace QRelay;
using std::chrono::milliseconds;

class TestQRQueueManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== 批次接受 ==========
    void testAddBatchCreatesTasks();
    void testAddBatchRejectsInvalidRange();
    void testAddBatchRejectsOversizedBatch();
    void testAddBatchReplacesPreviousBatch();

    // ========== 推进与计数 ==========
    void testProgressAfterMixedResults();
    void testStartNextTaskSingleActive();
    void testUpdateTaskProgressPhases();
    void testAbortCurrentTaskRequeues();
    void testInvariantHoldsThroughout();

    // ========== 暂停/恢复/取消 ==========
    void testPauseBlocksStartNextTask();
    void testPauseResumeIdempotent();
    void testPauseMarksActiveTask();
    void testCancelTruncatesAndDeletesCheckpoint();
    void testCancelSignalsToken();
    void testUnknownUser();

    // ========== 检查点 ==========
    void testCheckpointDebounceCoalesces();
    void testCheckpointFlushEvery();
    void testFlushCheckpointWritesArmedState();
    void testFinishBatchDeletesCheckpoint();
    void testCheckpointFailureReported();
    void testAddBatchDiscardsStaleCheckpoint();

private:
    void completeNext(qint64 userId, bool success);

    QRQueueRegistry *m_registry = nullptr;
    QRMemoryCheckpointStore *m_store = nullptr;
    QRQueueManager *m_manager = nullptr;
};

void TestQRQueueManager::init()
{
    QRRelaySettings settings = QRRelaySettings::immediate();
    settings.checkpointDebounce = milliseconds(20);

    m_registry = new QRQueueRegistry();
    m_store = new QRMemoryCheckpointStore(this);
    m_manager = new QRQueueManager(*m_registry, m_store, settings, this);
}

void TestQRQueueManager::cleanup()
{
    delete m_manager;
    m_manager = nullptr;
    delete m_store;
    m_store = nullptr;
    delete m_registry;
    m_registry = nullptr;
}

void TestQRQueueManager::completeNext(qint64 userId, bool success)
{
    QVERIFY(m_manager->startNextTask(userId));
    QVERIFY(m_manager->completeCurrentTask(userId, success));
}

void TestQRQueueManager::testAddBatchCreatesTasks()
{
    QSignalSpy admitted(m_manager, &QRQueueManager::batchAdmitted);

    QRBatchMetadata meta;
    meta.chatId = -100777;
    meta.requestMessageId = 5;
    const auto snapshot = m_manager->addBatch(1, QRMessageRange(101, 105), 42, meta);

    QVERIFY(snapshot.has_value());
    QCOMPARE(snapshot->total, 5);
    QCOMPARE(snapshot->pending, 5);
    QCOMPARE(snapshot->completed, 0);
    QVERIFY(!snapshot->hasActive);
    QCOMPARE(snapshot->metadata.fromId, qint64(101));
    QCOMPARE(snapshot->metadata.toId, qint64(105));
    QCOMPARE(snapshot->metadata.destinationChatId, qint64(42));
    QVERIFY(snapshot->metadata.createdAt.isValid());

    QCOMPARE(m_manager->pendingMessageIds(1), (QList<qint64>{101, 102, 103, 104, 105}));
    QCOMPARE(admitted.count(), 1);
    QVERIFY(m_manager->isActive(1));

    QRTaskPtr task = m_manager->startNextTask(1);
    QCOMPARE(task->chatId(), qint64(-100777));
    QCOMPARE(task->requestMessageId(), qint64(5));
}

void TestQRQueueManager::testAddBatchRejectsInvalidRange()
{
    QSignalSpy rejected(m_manager, &QRQueueManager::batchRejected);

    QVERIFY(!m_manager->addBatch(1, QRMessageRange(10, 5), 42).has_value());
    QVERIFY(!m_manager->addBatch(1, QRMessageRange(0, 5), 42).has_value());

    QCOMPARE(rejected.count(), 2);
    QCOMPARE(rejected.at(0).at(1).value<RelayError>(), RelayError::InvalidRange);
    QVERIFY(!m_manager->hasQueue(1));
    QCOMPARE(m_manager->statistics().batchesRejected, 2);
}

void TestQRQueueManager::testAddBatchRejectsOversizedBatch()
{
    QRRelaySettings settings = m_manager->settings();
    settings.maxBatchSize = 3;
    m_manager->setSettings(settings);

    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 3), 42).has_value());

    // 拒绝不触碰已有队列
    QSignalSpy rejected(m_manager, &QRQueueManager::batchRejected);
    QVERIFY(!m_manager->addBatch(1, QRMessageRange(1, 4), 42).has_value());
    QCOMPARE(rejected.count(), 1);
    QCOMPARE(rejected.at(0).at(1).value<RelayError>(), RelayError::BatchTooLarge);
    QCOMPARE(m_manager->validateRange(QRMessageRange(1, 4)), RelayError::BatchTooLarge);
    QCOMPARE(m_manager->status(1).total, 3);
}

void TestQRQueueManager::testAddBatchReplacesPreviousBatch()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 3), 42));
    QRCancelTokenPtr oldToken = m_manager->cancelToken(1);

    QVERIFY(m_manager->addBatch(1, QRMessageRange(10, 11), 42));
    QVERIFY(oldToken->isCancelled());
    QVERIFY(!m_manager->cancelToken(1)->isCancelled());
    QCOMPARE(m_manager->pendingMessageIds(1), (QList<qint64>{10, 11}));
}

void TestQRQueueManager::testProgressAfterMixedResults()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(101, 105), 42));

    completeNext(1, true);
    completeNext(1, true);
    completeNext(1, false);

    const auto snapshot = m_manager->snapshot(1);
    QCOMPARE(snapshot->total, 5);
    QCOMPARE(snapshot->completed, 3);
    QCOMPARE(snapshot->failed, 1);
    QCOMPARE(snapshot->remaining, 2);
    QCOMPARE(snapshot->progress, 60.0);
    QCOMPARE(snapshot->successRate, 40.0);

    const QRQueueStatus status = m_manager->status(1);
    QCOMPARE(status.failed, 1);
    QVERIFY(!status.hasActive);
    QCOMPARE(m_manager->statistics().tasksCompleted, 2);
    QCOMPARE(m_manager->statistics().tasksFailed, 1);
}

void TestQRQueueManager::testStartNextTaskSingleActive()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 3), 42));

    QRTaskPtr first = m_manager->startNextTask(1);
    QVERIFY(first);
    QCOMPARE(first->messageId(), qint64(1));
    QCOMPARE(first->status(), TaskStatus::Downloading);
    QCOMPARE(m_manager->activeTaskCount(1), 1);

    // 已有当前任务时不会再取下一个
    QVERIFY(!m_manager->startNextTask(1));
    QCOMPARE(m_manager->pendingMessageIds(1).size(), 2);
}

void TestQRQueueManager::testUpdateTaskProgressPhases()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 2), 42));
    QVERIFY(!m_manager->updateTaskProgress(1, 10, 100));

    m_manager->startNextTask(1);
    QVERIFY(m_manager->updateTaskProgress(1, 50, 100));
    QCOMPARE(m_manager->currentTask(1)->status, TaskStatus::Downloading);
    QCOMPARE(m_manager->currentTask(1)->progress, 50.0);

    QVERIFY(m_manager->updateTaskProgress(1, 100, 100, TaskStatus::Uploading));
    QCOMPARE(m_manager->currentTask(1)->status, TaskStatus::Uploading);

    // 进行中的任务计入批次进度
    QCOMPARE(m_manager->snapshot(1)->progress, 50.0);
}

void TestQRQueueManager::testAbortCurrentTaskRequeues()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 3), 42));
    m_manager->startNextTask(1);
    m_manager->updateTaskProgress(1, 10, 100);

    QVERIFY(m_manager->abortCurrentTask(1));
    QVERIFY(!m_manager->currentTask(1).has_value());
    QCOMPARE(m_manager->pendingMessageIds(1), (QList<qint64>{1, 2, 3}));
    QVERIFY(m_manager->checkInvariant(1));

    QRTaskPtr again = m_manager->startNextTask(1);
    QCOMPARE(again->messageId(), qint64(1));
    QCOMPARE(again->progress(), 0.0);
}

void TestQRQueueManager::testInvariantHoldsThroughout()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 6), 42));
    QVERIFY(m_manager->checkInvariant(1));

    m_manager->startNextTask(1);
    QVERIFY(m_manager->checkInvariant(1));
    m_manager->completeCurrentTask(1, true);
    QVERIFY(m_manager->checkInvariant(1));

    m_manager->startNextTask(1);
    m_manager->pause(1);
    QVERIFY(m_manager->checkInvariant(1));
    m_manager->resume(1);
    m_manager->completeCurrentTask(1, false);
    QVERIFY(m_manager->checkInvariant(1));

    m_manager->startNextTask(1);
    m_manager->cancel(1);
    QVERIFY(m_manager->checkInvariant(1));

    const QRQueueStatus status = m_manager->status(1);
    QVERIFY(status.failed <= status.completed);
    QVERIFY(status.completed <= status.total);
}

void TestQRQueueManager::testPauseBlocksStartNextTask()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 3), 42));
    QVERIFY(m_manager->pause(1));

    QVERIFY(!m_manager->startNextTask(1));
    QVERIFY(m_manager->isPaused(1));
    QCOMPARE(m_manager->pendingMessageIds(1).size(), 3);

    QVERIFY(m_manager->resume(1));
    QVERIFY(m_manager->startNextTask(1));
}

void TestQRQueueManager::testPauseResumeIdempotent()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 3), 42));
    QSignalSpy paused(m_manager, &QRQueueManager::queuePaused);
    QSignalSpy resumed(m_manager, &QRQueueManager::queueResumed);

    QVERIFY(m_manager->pause(1));
    QVERIFY(m_manager->pause(1));
    QCOMPARE(paused.count(), 1);

    QVERIFY(m_manager->resume(1));
    QVERIFY(m_manager->resume(1));
    QCOMPARE(resumed.count(), 1);
}

void TestQRQueueManager::testPauseMarksActiveTask()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 3), 42));
    m_manager->startNextTask(1);

    m_manager->pause(1);
    QCOMPARE(m_manager->currentTask(1)->status, TaskStatus::Paused);
    QCOMPARE(m_manager->activeTaskCount(1), 0);
    QVERIFY(m_manager->status(1).hasActive);

    m_manager->resume(1);
    QCOMPARE(m_manager->currentTask(1)->status, TaskStatus::Downloading);
}

void TestQRQueueManager::testCancelTruncatesAndDeletesCheckpoint()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 4), 42));
    completeNext(1, true);
    completeNext(1, true);
    QTRY_VERIFY(m_store->loadCheckpoint(1).has_value());

    QSignalSpy cancelled(m_manager, &QRQueueManager::batchCancelled);
    QCOMPARE(m_manager->pendingMessageIds(1).size(), 2);
    QVERIFY(m_manager->cancel(1));

    const QRQueueStatus status = m_manager->status(1);
    QCOMPARE(status.total, status.completed);
    QCOMPARE(status.total, 2);
    QVERIFY(m_manager->pendingMessageIds(1).isEmpty());
    QVERIFY(!m_store->loadCheckpoint(1).has_value());
    QCOMPARE(cancelled.count(), 1);
    QVERIFY(!m_manager->isActive(1));
}

void TestQRQueueManager::testCancelSignalsToken()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 4), 42));
    QRTaskPtr task = m_manager->startNextTask(1);
    QRCancelTokenPtr token = m_manager->cancelToken(1);

    m_manager->cancel(1);
    QVERIFY(token->isCancelled());
    QVERIFY(task->isCancelled());
    QCOMPARE(task->status(), TaskStatus::Cancelled);
    QVERIFY(!m_manager->status(1).hasActive);
    QCOMPARE(m_manager->status(1).total, 0);
}

void TestQRQueueManager::testUnknownUser()
{
    QVERIFY(!m_manager->pause(99));
    QVERIFY(!m_manager->resume(99));
    QVERIFY(!m_manager->cancel(99));
    QVERIFY(!m_manager->startNextTask(99));
    QVERIFY(!m_manager->snapshot(99).has_value());

    const QRQueueStatus status = m_manager->status(99);
    QCOMPARE(status.total, 0);
    QVERIFY(!status.hasActive);
}

void TestQRQueueManager::testCheckpointDebounceCoalesces()
{
    QRRelaySettings settings = m_manager->settings();
    settings.checkpointDebounce = milliseconds(100);
    m_manager->setSettings(settings);

    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 10), 42));
    QSignalSpy saved(m_manager, &QRQueueManager::checkpointSaved);

    completeNext(1, true);
    completeNext(1, true);
    completeNext(1, false);
    QVERIFY(m_manager->hasPendingCheckpoint(1));
    QCOMPARE(m_store->saveCount(), 0);

    QTRY_COMPARE(m_store->saveCount(), 1);
    QTest::qWait(150);
    QCOMPARE(m_store->saveCount(), 1);
    QCOMPARE(saved.count(), 1);

    // 写入的是最后一次完成后的状态
    const auto cp = m_store->loadCheckpoint(1);
    QCOMPARE(cp->completed, 3);
    QCOMPARE(cp->failed, 1);
    QCOMPARE(cp->total, 10);
    QCOMPARE(cp->metadata.fromId, qint64(1));
}

void TestQRQueueManager::testCheckpointFlushEvery()
{
    QRRelaySettings settings = m_manager->settings();
    settings.checkpointDebounce = milliseconds(60000);
    settings.checkpointFlushEvery = 2;
    m_manager->setSettings(settings);

    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 10), 42));

    completeNext(1, true);
    QCOMPARE(m_store->saveCount(), 0);
    completeNext(1, true);
    QCOMPARE(m_store->saveCount(), 1);
    QVERIFY(!m_manager->hasPendingCheckpoint(1));

    completeNext(1, true);
    completeNext(1, true);
    QCOMPARE(m_store->saveCount(), 2);
    QCOMPARE(m_store->loadCheckpoint(1)->completed, 4);
}

void TestQRQueueManager::testFlushCheckpointWritesArmedState()
{
    QRRelaySettings settings = m_manager->settings();
    settings.checkpointDebounce = milliseconds(60000);
    m_manager->setSettings(settings);

    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 5), 42));

    // 尚未有完成的条目，没有需要刷新的内容
    QVERIFY(m_manager->flushCheckpoint(1));
    QCOMPARE(m_store->saveCount(), 0);

    completeNext(1, true);
    QVERIFY(m_manager->hasPendingCheckpoint(1));
    QVERIFY(m_manager->flushCheckpoint(1));
    QCOMPARE(m_store->saveCount(), 1);
    QVERIFY(!m_manager->hasPendingCheckpoint(1));
}

void TestQRQueueManager::testFinishBatchDeletesCheckpoint()
{
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 2), 42));
    completeNext(1, true);
    QTRY_COMPARE(m_store->size(), 1);

    QSignalSpy deleted(m_manager, &QRQueueManager::checkpointDeleted);
    completeNext(1, true);
    m_manager->finishBatch(1);

    QCOMPARE(m_store->size(), 0);
    QCOMPARE(deleted.count(), 1);
    QVERIFY(!m_manager->hasPendingCheckpoint(1));
}

void TestQRQueueManager::testCheckpointFailureReported()
{
    m_store->setFailSaves(true);
    QVERIFY(m_manager->addBatch(1, QRMessageRange(1, 5), 42));
    QSignalSpy failed(m_manager, &QRQueueManager::checkpointFailed);

    completeNext(1, true);
    QTRY_COMPARE(failed.count(), 1);
    QCOMPARE(failed.at(0).at(0).toLongLong(), qint64(1));
    QVERIFY(!failed.at(0).at(1).toString().isEmpty());
    QCOMPARE(m_manager->statistics().checkpointFailures, 1);
    QCOMPARE(m_manager->statistics().checkpointWrites, 0);
}

void TestQRQueueManager::testAddBatchDiscardsStaleCheckpoint()
{
    // 旧批次中途中止后留下的检查点
    QRCheckpoint stale;
    stale.userId = 1;
    stale.total = 5;
    stale.completed = 2;
    stale.metadata.fromId = 1;
    stale.metadata.toId = 5;
    stale.metadata.destinationChatId = 42;
    stale.batchStartTime = QDateTime::currentDateTimeUtc();
    stale.updatedAt = stale.batchStartTime;
    QVERIFY(m_store->saveCheckpoint(1, stale));

    QSignalSpy deleted(m_manager, &QRQueueManager::checkpointDeleted);
    QVERIFY(m_manager->addBatch(1, QRMessageRange(100, 102), 42));

    QVERIFY(!m_store->loadCheckpoint(1));
    QCOMPARE(deleted.count(), 1);
    QVERIFY(m_store->listIncompleteCheckpoints().isEmpty());

    // 被拒绝的批次不触碰已有检查点
    QVERIFY(m_store->saveCheckpoint(1, stale));
    QVERIFY(!m_manager->addBatch(1, QRMessageRange(10, 5), 42));
    QVERIFY(m_store->loadCheckpoint(1));
}

QTEST_MAIN(TestQRQueueManager)
#include "tst_QRQueueManager.moc"
