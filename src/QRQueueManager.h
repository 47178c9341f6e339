// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRQUEUEMANAGER_H
#define QRQUEUEMANAGER_H

#include <QHash>
#include <QList>
#include <QObject>
#include <optional>
#include "QRCheckpoint.h"
#include "QRError.h"
#include "QRGlobal.h"
#include "QRQueue.h"
#include "QRRelaySettings.h"
#include "QRTask.h"

class QTimer;

namespace QRelay {

class QRCheckpointStore;
class QRLogger;
class QRQueueRegistry;

/**
 * @brief 对外暴露的队列状态
 */
struct QRQueueStatus {
    int total = 0;
    int completed = 0;
    int failed = 0;
    bool paused = false;
    bool hasActive = false;
};

/**
 * @brief 队列管理器
 *
 * 所有用户队列的唯一修改入口：批次准入、出队、完成、暂停/恢复/取消，
 * 以及带合并窗口的检查点持久化。
 *
 * 单飞保证在 startNextTask() 中实现：current 槽位非空时不会再出队，
 * 因此每个用户任意时刻最多一个任务处于 Downloading/Uploading。
 *
 * 所有方法都是非阻塞的，必须在管理器所在线程调用。检查点写入由
 * 每个用户一个的单次定时器触发，窗口内的每次完成都会重新计时。
 *
 * @code
 * QRQueueRegistry registry;
 * QRQueueManager manager(registry, &store, settings);
 *
 * auto snapshot = manager.addBatch(userId, QRMessageRange(101, 105), chatId, meta);
 * if (!snapshot) {
 *     // batchRejected 信号已发出
 * }
 * QRTaskPtr task = manager.startNextTask(userId);
 * manager.completeCurrentTask(userId, true);
 * @endcode
 */
class QRELAY_EXPORT QRQueueManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief 使用计数
     */
    struct Statistics {
        int batchesAdmitted = 0;      ///< 已接受的批次
        int batchesRejected = 0;      ///< 被拒绝的批次
        int batchesCancelled = 0;     ///< 被取消的批次
        int tasksAdmitted = 0;        ///< 已接受的条目
        int tasksCompleted = 0;       ///< 成功的条目
        int tasksFailed = 0;          ///< 失败的条目
        int checkpointWrites = 0;     ///< 成功的检查点写入
        int checkpointFailures = 0;   ///< 失败的检查点写入或删除
    };

    /**
     * @brief 构造函数
     * @param registry 队列注册表（不拥有）
     * @param store 检查点存储（不拥有，可为 nullptr）
     * @param settings 配置
     * @param parent 父对象
     */
    QRQueueManager(QRQueueRegistry &registry, QRCheckpointStore *store,
                   const QRRelaySettings &settings = QRRelaySettings(),
                   QObject *parent = nullptr);
    ~QRQueueManager() override;

    void setSettings(const QRRelaySettings &settings);
    [[nodiscard]] QRRelaySettings settings() const { return m_settings; }

    void setCheckpointStore(QRCheckpointStore *store) { m_store = store; }
    [[nodiscard]] QRCheckpointStore *checkpointStore() const { return m_store; }

    void setLogger(QRLogger *logger) { m_logger = logger; }

    // ========================================================================
    // 批次生命周期
    // ========================================================================

    /**
     * @brief 接受新批次
     *
     * 重置用户队列（清空待处理列表、current、计数器和暂停标志，
     * 取消上一个批次的令牌），并为区间内每个消息 ID 生成一个任务。
     *
     * 区间为空、颠倒或超过 maxBatchSize 时拒绝：队列保持不变，
     * 发出 batchRejected 并返回 std::nullopt。
     *
     * @param userId 用户
     * @param range 消息 ID 区间
     * @param destinationChatId 目标会话
     * @param metadata 其余元数据，fromId/toId/destinationChatId 以参数为准
     */
    std::optional<QRQueueSnapshot> addBatch(qint64 userId, const QRMessageRange &range,
                                            qint64 destinationChatId,
                                            const QRBatchMetadata &metadata = QRBatchMetadata());

    /**
     * @brief 取出下一个任务
     *
     * 队列暂停、待处理为空或 current 已被占用时返回空指针。
     * 否则弹出队首，记录开始时间，状态置为 Downloading 并放入 current。
     */
    QRTaskPtr startNextTask(qint64 userId);

    /**
     * @brief 完成当前任务
     *
     * 无 current 时不做任何事。否则状态置为 Completed 或 Error，
     * completed（以及 failed）加一，清空 current，并安排检查点写入。
     */
    QRTaskPtr completeCurrentTask(qint64 userId, bool success);

    /**
     * @brief 暂停队列（幂等）
     * @return 用户没有队列时返回 false
     */
    bool pause(qint64 userId);

    /**
     * @brief 恢复队列（幂等），current 的开始时间重新记录
     */
    bool resume(qint64 userId);

    /**
     * @brief 取消批次
     *
     * 取消令牌，清空待处理，current 置为 Cancelled 并清空，
     * total = completed，停止待写入的检查点并删除已有检查点。
     */
    bool cancel(qint64 userId);

    /**
     * @brief 执行器报告当前任务的字节进度和阶段
     * @param phase Downloading 或 Uploading
     */
    bool updateTaskProgress(qint64 userId, qint64 current, qint64 total,
                            TaskStatus phase = TaskStatus::Downloading);

    /**
     * @brief 批次级中止：current 以 Queued 状态放回待处理队首
     */
    bool abortCurrentTask(qint64 userId);

    /**
     * @brief 立即执行已安排的检查点写入
     * @return 写入失败时返回 false；没有安排写入时返回 true
     */
    bool flushCheckpoint(qint64 userId);

    /**
     * @brief 批次正常结束：停止合并定时器并按写入规则落盘
     *
     * completed == total 时删除检查点。
     */
    void finishBatch(qint64 userId);

    /**
     * @brief 从检查点重建队列
     *
     * 待处理从 fromId + completed 开始连续生成 total - completed 个任务。
     * 用户已有未完成的队列、剩余数不为正或缺少起点时返回 false。
     */
    bool restoreQueue(const QRCheckpoint &checkpoint);

    void setProgressMessageId(qint64 userId, qint64 messageId);

    // ========================================================================
    // 查询
    // ========================================================================

    /**
     * @brief 按准入规则检查区间
     * @return NoError、InvalidRange 或 BatchTooLarge
     */
    [[nodiscard]] RelayError validateRange(const QRMessageRange &range) const;

    [[nodiscard]] QRQueueStatus status(qint64 userId) const;
    [[nodiscard]] std::optional<QRQueueSnapshot> snapshot(qint64 userId) const;
    [[nodiscard]] QList<qint64> pendingMessageIds(qint64 userId) const;
    [[nodiscard]] std::optional<QRTaskSnapshot> currentTask(qint64 userId) const;
    [[nodiscard]] QRCancelTokenPtr cancelToken(qint64 userId) const;

    [[nodiscard]] bool hasQueue(qint64 userId) const;

    /**
     * @brief 队列是否还有未完成的工作（待处理或 current）
     */
    [[nodiscard]] bool isActive(qint64 userId) const;

    [[nodiscard]] bool isPaused(qint64 userId) const;

    /**
     * @brief 用户当前处于 Downloading/Uploading 的任务数（0 或 1）
     */
    [[nodiscard]] int activeTaskCount(qint64 userId) const;

    /**
     * @brief 检查用户队列的计数不变式
     */
    [[nodiscard]] bool checkInvariant(qint64 userId) const;

    /**
     * @brief 是否有安排中的检查点写入
     */
    [[nodiscard]] bool hasPendingCheckpoint(qint64 userId) const;

    [[nodiscard]] Statistics statistics() const { return m_stats; }

signals:
    void batchAdmitted(qint64 userId, const QRelay::QRQueueSnapshot &snapshot);
    void batchRejected(qint64 userId, QRelay::RelayError error, const QString &message);
    void batchCancelled(qint64 userId);
    void queuePaused(qint64 userId);
    void queueResumed(qint64 userId);
    void queueRestored(qint64 userId, int remaining);

    void checkpointSaved(qint64 userId, const QRelay::QRCheckpoint &checkpoint);
    void checkpointDeleted(qint64 userId);
    void checkpointFailed(qint64 userId, const QString &message);

private:
    void scheduleCheckpoint(qint64 userId);
    void stopCheckpointTimer(qint64 userId);
    bool writeCheckpoint(qint64 userId);
    bool removeCheckpoint(qint64 userId);
    void log(RelayLogLevel level, const QString &message) const;

    QRQueueRegistry &m_registry;
    QRCheckpointStore *m_store;
    QRRelaySettings m_settings;
    QRLogger *m_logger = nullptr;

    QHash<qint64, QTimer *> m_saveTimers;           ///< 每个用户一个合并定时器
    QHash<qint64, int> m_completionsSinceFlush;
    Statistics m_stats;
};

} // namespace QRelay

#endif // QRQUEUEMANAGER_H
