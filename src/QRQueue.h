// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRQUEUE_H
#define QRQUEUE_H

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include "QRCancelToken.h"
#include "QRGlobal.h"
#include "QRTask.h"

namespace QRelay {

/**
 * @brief 源会话类型
 */
enum class SourceType {
    Public,     ///< 公开频道/群组
    Private,    ///< 私有频道/群组（需要用户会话）
    Bot         ///< 机器人对话
};

[[nodiscard]] QRELAY_EXPORT QString sourceTypeName(SourceType type);
[[nodiscard]] QRELAY_EXPORT SourceType sourceTypeFromName(const QString &name,
                                                          SourceType fallback = SourceType::Public);

/**
 * @brief 连续消息 ID 区间 [fromId, toId]
 */
struct QRMessageRange {
    qint64 fromId = 0;
    qint64 toId = 0;

    QRMessageRange() = default;
    QRMessageRange(qint64 from, qint64 to) : fromId(from), toId(to) {}

    /**
     * @brief 区间内的条目数，区间颠倒时为 0
     */
    [[nodiscard]] qint64 count() const noexcept { return toId >= fromId ? toId - fromId + 1 : 0; }

    [[nodiscard]] bool isValid() const noexcept { return fromId > 0 && toId >= fromId; }
};

/**
 * @brief 批次元数据
 */
struct QRBatchMetadata {
    SourceType sourceType = SourceType::Public;
    QString sourceId;               ///< 频道用户名或数字 ID
    qint64 chatId = 0;              ///< 解析后的源会话 ID
    qint64 fromId = 0;              ///< 区间起点
    qint64 toId = 0;                ///< 区间终点
    qint64 destinationChatId = 0;   ///< 目标会话
    qint64 requestMessageId = 0;    ///< 发起请求的命令消息
    QString link;                   ///< 原始链接
    QDateTime createdAt;

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static QRBatchMetadata fromJson(const QJsonObject &json);
};

/**
 * @brief 队列快照（复制出的值）
 */
struct QRQueueSnapshot {
    qint64 userId = 0;
    int total = 0;
    int completed = 0;
    int failed = 0;
    int remaining = 0;
    int pending = 0;
    bool paused = false;
    bool hasActive = false;
    double progress = 0.0;      ///< 批次进度百分比
    double eta = 0.0;           ///< 批次剩余秒数
    double successRate = 100.0;
    qint64 progressMessageId = 0;
    QDateTime batchStartTime;
    QRBatchMetadata metadata;
};

/**
 * @brief 单个用户的任务队列
 *
 * 每个用户一个，在进程生命周期内保留，批次之间只重置不销毁。
 * 队列只由 QRQueueManager 修改，对外只提供快照。
 *
 * 不变式：pending + (current ? 1 : 0) + completed == total，且 failed <= completed。
 */
class QRELAY_EXPORT QRQueue
{
public:
    explicit QRQueue(qint64 userId);

    [[nodiscard]] qint64 userId() const noexcept { return m_userId; }

    /**
     * @brief 以新批次重置队列
     *
     * 清空待处理列表、current 槽位、计数器与暂停标志，取消上一个批次的令牌。
     */
    void reset(const QRBatchMetadata &metadata, const QList<QRTaskPtr> &tasks,
               const QRCancelTokenPtr &token,
               const QDateTime &now = QDateTime::currentDateTimeUtc());

    // 待处理列表
    [[nodiscard]] int pendingCount() const { return static_cast<int>(m_pending.size()); }
    [[nodiscard]] QList<qint64> pendingMessageIds() const;
    QRTaskPtr takeNext();
    void pushFront(const QRTaskPtr &task);
    void clearPending();

    // current 槽位
    [[nodiscard]] QRTaskPtr current() const { return m_current; }
    void setCurrent(const QRTaskPtr &task) { m_current = task; }
    void clearCurrent() { m_current.reset(); }

    // 计数器
    [[nodiscard]] int total() const noexcept { return m_total; }
    [[nodiscard]] int completed() const noexcept { return m_completed; }
    [[nodiscard]] int failed() const noexcept { return m_failed; }
    void recordCompletion(bool success);
    void truncateToCompleted() { m_total = m_completed; }
    void restoreCounters(int total, int completed, int failed);

    [[nodiscard]] bool isPaused() const noexcept { return m_paused; }
    void setPaused(bool paused) { m_paused = paused; }

    [[nodiscard]] const QRBatchMetadata &metadata() const { return m_metadata; }
    [[nodiscard]] QDateTime batchStartTime() const { return m_batchStartTime; }
    void setBatchStartTime(const QDateTime &time) { m_batchStartTime = time; }

    [[nodiscard]] qint64 progressMessageId() const noexcept { return m_progressMessageId; }
    void setProgressMessageId(qint64 id) { m_progressMessageId = id; }

    [[nodiscard]] QRCancelTokenPtr cancelToken() const { return m_cancelToken; }

    /**
     * @brief 是否还有未完成的工作（待处理或 current）
     */
    [[nodiscard]] bool hasWork() const { return !m_pending.isEmpty() || m_current; }

    /**
     * @brief 批次进度 = (completed + current.progress / 100) / total * 100
     */
    [[nodiscard]] double batchProgress() const;

    /**
     * @brief 批次剩余时间（秒）= 平均每条耗时 * 剩余条数，completed 为 0 时返回 0
     */
    [[nodiscard]] double batchEta(const QDateTime &now = QDateTime::currentDateTimeUtc()) const;

    [[nodiscard]] int remaining() const noexcept { return m_total - m_completed; }

    /**
     * @brief 成功率 = (completed - failed) / total * 100，total 为 0 时为 100
     */
    [[nodiscard]] double successRate() const;

    [[nodiscard]] bool checkInvariant() const;

    [[nodiscard]] QRQueueSnapshot snapshot(const QDateTime &now = QDateTime::currentDateTimeUtc()) const;

private:
    qint64 m_userId;
    QList<QRTaskPtr> m_pending;
    QRTaskPtr m_current;
    int m_total = 0;
    int m_completed = 0;
    int m_failed = 0;
    bool m_paused = false;
    QRBatchMetadata m_metadata;
    QDateTime m_batchStartTime;
    qint64 m_progressMessageId = 0;
    QRCancelTokenPtr m_cancelToken;
};

} // namespace QRelay

Q_DECLARE_METATYPE(QRelay::QRQueueSnapshot)

#endif // QRQUEUE_H
