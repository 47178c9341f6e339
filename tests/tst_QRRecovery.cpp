// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "QRJsonCheckpointStore.h"
#include "QRMemoryCheckpointStore.h"
#include "QRQueueManager.h"
#include "QRQueueRegistry.h"
#include "QRRecovery.h"

using namespace QRelay;

namespace {

QRCheckpoint pendingCheckpoint(qint64 userId, int total, int completed, qint64 fromId,
                               qint64 destination = 42)
{
    QRCheckpoint cp;
    cp.userId = userId;
    cp.total = total;
    cp.completed = completed;
    cp.metadata.chatId = -100555;
    cp.metadata.fromId = fromId;
    cp.metadata.toId = fromId + total - 1;
    cp.metadata.destinationChatId = destination;
    cp.batchStartTime = QDateTime::currentDateTimeUtc().addSecs(-300);
    cp.updatedAt = QDateTime::currentDateTimeUtc();
    return cp;
}

} // namespace

/**
 * @brief 启动恢复单元测试
 *
 * 从检查点重建队列：剩余条目从 fromId + completed 开始，
 * 计数器与暂停状态原样恢复，无法恢复的检查点被删除。
 */
class TestQRRecovery : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testRebuildsRemainingTasks();
    void testRestoresPausedState();
    void testDiscardsMissingDestination();
    void testDiscardsMissingRangeStart();
    void testSkipsActiveQueue();
    void testMultipleUsers();
    void testRoundTripThroughJsonStore();
    void testEmptyStore();

private:
    QRQueueRegistry *m_registry = nullptr;
    QRMemoryCheckpointStore *m_store = nullptr;
    QRQueueManager *m_manager = nullptr;
};

void TestQRRecovery::init()
{
    m_registry = new QRQueueRegistry();
    m_store = new QRMemoryCheckpointStore();
    m_manager = new QRQueueManager(*m_registry, m_store, QRRelaySettings::immediate());
}

void TestQRRecovery::cleanup()
{
    delete m_manager;
    delete m_store;
    delete m_registry;
    m_manager = nullptr;
    m_store = nullptr;
    m_registry = nullptr;
}

void TestQRRecovery::testRebuildsRemainingTasks()
{
    QVERIFY(m_store->saveCheckpoint(7, pendingCheckpoint(7, 10, 4, 100)));
    QSignalSpy restored(m_manager, &QRQueueManager::queueRestored);

    QRRecovery recovery(m_store, m_manager);
    QCOMPARE(recovery.restore(), QList<qint64>{7});

    QCOMPARE(m_manager->pendingMessageIds(7), (QList<qint64>{104, 105, 106, 107, 108, 109}));
    const QRQueueStatus status = m_manager->status(7);
    QCOMPARE(status.total, 10);
    QCOMPARE(status.completed, 4);
    QVERIFY(!status.hasActive);
    QVERIFY(m_manager->checkInvariant(7));

    QCOMPARE(restored.count(), 1);
    QCOMPARE(restored.at(0).at(1).toInt(), 6);

    const auto snapshot = m_manager->snapshot(7);
    QCOMPARE(snapshot->metadata.destinationChatId, qint64(42));
    QCOMPARE(snapshot->progress, 40.0);

    QRTaskPtr first = m_manager->startNextTask(7);
    QCOMPARE(first->chatId(), qint64(-100555));
    QVERIFY(!first->isCancelled());
}

void TestQRRecovery::testRestoresPausedState()
{
    QRCheckpoint cp = pendingCheckpoint(7, 5, 2, 10);
    cp.paused = true;
    cp.failed = 1;
    QVERIFY(m_store->saveCheckpoint(7, cp));

    QRRecovery recovery(m_store, m_manager);
    recovery.restore();

    QVERIFY(m_manager->isPaused(7));
    QCOMPARE(m_manager->status(7).failed, 1);
    QVERIFY(!m_manager->startNextTask(7));
}

void TestQRRecovery::testDiscardsMissingDestination()
{
    QVERIFY(m_store->saveCheckpoint(7, pendingCheckpoint(7, 10, 4, 100, 0)));

    QRRecovery recovery(m_store, m_manager);
    QVERIFY(recovery.restore().isEmpty());

    QCOMPARE(recovery.lastReport().discarded, QList<qint64>{7});
    QVERIFY(!m_store->loadCheckpoint(7).has_value());
    QVERIFY(!m_manager->isActive(7));
}

void TestQRRecovery::testDiscardsMissingRangeStart()
{
    QVERIFY(m_store->saveCheckpoint(7, pendingCheckpoint(7, 10, 4, 0)));

    QRRecovery recovery(m_store, m_manager);
    QVERIFY(recovery.restore().isEmpty());
    QCOMPARE(recovery.lastReport().discarded, QList<qint64>{7});
    QCOMPARE(m_store->size(), 0);
}

void TestQRRecovery::testSkipsActiveQueue()
{
    QVERIFY(m_manager->addBatch(7, QRMessageRange(1, 3), 42));
    QVERIFY(m_store->saveCheckpoint(7, pendingCheckpoint(7, 10, 4, 100)));

    QRRecovery recovery(m_store, m_manager);
    QVERIFY(recovery.restore().isEmpty());
    QCOMPARE(recovery.lastReport().skipped, QList<qint64>{7});

    // 运行中的批次不被覆盖，检查点保留
    QCOMPARE(m_manager->pendingMessageIds(7), (QList<qint64>{1, 2, 3}));
    QVERIFY(m_store->loadCheckpoint(7).has_value());
}

void TestQRRecovery::testMultipleUsers()
{
    QVERIFY(m_store->saveCheckpoint(1, pendingCheckpoint(1, 3, 1, 50)));
    QVERIFY(m_store->saveCheckpoint(2, pendingCheckpoint(2, 4, 0, 70)));
    QVERIFY(m_store->saveCheckpoint(3, pendingCheckpoint(3, 4, 4, 70)));

    QRRecovery recovery(m_store, m_manager);
    QList<qint64> users = recovery.restore();
    std::sort(users.begin(), users.end());
    QCOMPARE(users, (QList<qint64>{1, 2}));

    QCOMPARE(m_manager->pendingMessageIds(1), (QList<qint64>{51, 52}));
    QCOMPARE(m_manager->pendingMessageIds(2), (QList<qint64>{70, 71, 72, 73}));
    QVERIFY(!m_manager->hasQueue(3));
}

void TestQRRecovery::testRoundTripThroughJsonStore()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    // 第一次运行：处理 3 条后“进程退出”
    {
        QRJsonCheckpointStore store(dir.path());
        QRQueueRegistry registry;
        QRRelaySettings settings = QRRelaySettings::immediate();
        settings.checkpointDebounce = std::chrono::milliseconds(60000);
        QRQueueManager manager(registry, &store, settings);

        QRBatchMetadata meta;
        meta.sourceType = SourceType::Public;
        meta.sourceId = QStringLiteral("somechannel");
        QVERIFY(manager.addBatch(9, QRMessageRange(200, 207), 42, meta));
        for (int i = 0; i < 3; ++i) {
            QVERIFY(manager.startNextTask(9));
            manager.completeCurrentTask(9, i != 1);
        }
        QVERIFY(manager.flushCheckpoint(9));
    }

    // 第二次运行
    QRJsonCheckpointStore store(dir.path());
    QRQueueRegistry registry;
    QRQueueManager manager(registry, &store, QRRelaySettings::immediate());
    QRRecovery recovery(&store, &manager);

    QCOMPARE(recovery.restore(), QList<qint64>{9});
    QCOMPARE(manager.pendingMessageIds(9), (QList<qint64>{203, 204, 205, 206, 207}));
    QCOMPARE(manager.status(9).completed, 3);
    QCOMPARE(manager.status(9).failed, 1);
    QCOMPARE(manager.snapshot(9)->metadata.sourceId, QStringLiteral("somechannel"));
}

void TestQRRecovery::testEmptyStore()
{
    QRRecovery recovery(m_store, m_manager);
    QVERIFY(recovery.restore().isEmpty());
    QVERIFY(recovery.lastReport().restored.isEmpty());
    QVERIFY(recovery.lastReport().discarded.isEmpty());
}

QTEST_MAIN(TestQRRecovery)
#include "tst_QRRecovery.moc"
