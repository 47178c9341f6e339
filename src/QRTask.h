// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRTASK_H
#define QRTASK_H

#include <QDateTime>
#include <QMetaType>
#include <QSharedPointer>
#include <QString>
#include "QRCancelToken.h"
#include "QRContentType.h"
#include "QRError.h"
#include "QRGlobal.h"

namespace QRelay {

/**
 * @brief 任务状态
 *
 * @par 状态转换
 * - Queued → Downloading（被 startNextTask 取出）
 * - Downloading → Uploading（执行器进入上传阶段）
 * - Downloading/Uploading ⇄ Paused
 * - Downloading/Uploading/Paused → Completed | Error
 * - 任意非终止状态 → Cancelled
 * - Queued → Skipped
 * - Downloading/Uploading/Paused → Queued（批次中止，任务放回队首）
 */
enum class TaskStatus {
    Queued,
    Downloading,
    Uploading,
    Completed,
    Paused,
    Cancelled,
    Error,
    Skipped
};

/**
 * @brief 状态名（如 "Downloading"）
 */
[[nodiscard]] QRELAY_EXPORT QString taskStatusName(TaskStatus status);

/**
 * @brief 是否为终止状态（Completed/Cancelled/Error/Skipped）
 */
[[nodiscard]] QRELAY_EXPORT bool isTerminalStatus(TaskStatus status) noexcept;

/**
 * @brief 是否处于执行中（Downloading/Uploading）
 */
[[nodiscard]] QRELAY_EXPORT bool isActiveStatus(TaskStatus status) noexcept;

/**
 * @brief 执行器解析出的输出描述
 */
struct QROutputDescriptor {
    ContentType contentType = ContentType::Document;
    QString fileName;
    QString filePath;

    [[nodiscard]] bool isEmpty() const { return fileName.isEmpty() && filePath.isEmpty(); }
};

/**
 * @brief 任务快照（复制出的值，供进度报告和状态查询使用）
 */
struct QRTaskSnapshot {
    qint64 userId = 0;
    qint64 chatId = 0;
    qint64 messageId = 0;
    qint64 requestMessageId = 0;
    TaskStatus status = TaskStatus::Queued;
    qint64 bytesTransferred = 0;
    qint64 totalBytes = 0;
    double progress = 0.0;        ///< 百分比 0-100
    double speed = 0.0;           ///< 字节/秒
    double eta = 0.0;             ///< 秒
    int retryCount = 0;
    QROutputDescriptor output;
    RelayError lastError = RelayError::NoError;
    QString lastErrorMessage;
};

/**
 * @brief 单条转发任务
 *
 * 标识为 (用户, 源会话 ID, 消息 ID)，另记录发起请求的命令消息 ID。
 * 任务先由队列的待处理列表持有，出队后由 QRBatchWorker 在一次尝试期间持有，
 * 队列的 current 槽位引用同一个对象。
 */
class QRELAY_EXPORT QRTask
{
public:
    QRTask(qint64 userId, qint64 chatId, qint64 messageId, qint64 requestMessageId = 0);

    [[nodiscard]] qint64 userId() const noexcept { return m_userId; }
    [[nodiscard]] qint64 chatId() const noexcept { return m_chatId; }
    [[nodiscard]] qint64 messageId() const noexcept { return m_messageId; }
    [[nodiscard]] qint64 requestMessageId() const noexcept { return m_requestMessageId; }

    [[nodiscard]] TaskStatus status() const noexcept { return m_status; }

    /**
     * @brief 切换状态
     *
     * @return 转换不合法时返回 false，状态保持不变
     */
    bool setStatus(TaskStatus status);

    /**
     * @brief 检查状态转换是否合法
     */
    [[nodiscard]] static bool canTransition(TaskStatus from, TaskStatus to) noexcept;

    /**
     * @brief 记录开始时间并进入 Downloading
     */
    void start(const QDateTime &now = QDateTime::currentDateTimeUtc());

    /**
     * @brief 重新记录开始时间（恢复后速度与剩余时间不计暂停时长）
     */
    void restampStart(const QDateTime &now = QDateTime::currentDateTimeUtc());

    [[nodiscard]] QDateTime startTime() const { return m_startTime; }

    /**
     * @brief 更新传输进度
     *
     * progress = current / total * 100（total 为 0 时为 0），
     * speed = current / 已用秒数，eta = (total - current) / speed；
     * 已用时间或速度不为正时 speed 与 eta 保持为 0。
     */
    void updateProgress(qint64 current, qint64 total,
                        const QDateTime &now = QDateTime::currentDateTimeUtc());

    /**
     * @brief 清空进度（任务被放回队首时使用）
     */
    void resetProgress();

    [[nodiscard]] qint64 bytesTransferred() const noexcept { return m_bytesTransferred; }
    [[nodiscard]] qint64 totalBytes() const noexcept { return m_totalBytes; }
    [[nodiscard]] double progress() const noexcept { return m_progress; }
    [[nodiscard]] double speed() const noexcept { return m_speed; }
    [[nodiscard]] double eta() const noexcept { return m_eta; }

    [[nodiscard]] int retryCount() const noexcept { return m_retryCount; }
    void incrementRetryCount() noexcept { ++m_retryCount; }
    void resetRetryCount() noexcept { m_retryCount = 0; }

    [[nodiscard]] QROutputDescriptor output() const { return m_output; }
    void setOutput(const QROutputDescriptor &output) { m_output = output; }

    [[nodiscard]] RelayError lastError() const noexcept { return m_lastError; }
    [[nodiscard]] QString lastErrorMessage() const { return m_lastErrorMessage; }
    void setError(RelayError error, const QString &message = QString());

    /**
     * @brief 绑定批次取消令牌
     */
    void setCancelToken(const QRCancelTokenPtr &token) { m_cancelToken = token; }

    /**
     * @brief 执行器在长时间传输中轮询此方法
     */
    [[nodiscard]] bool isCancelled() const;

    [[nodiscard]] QRTaskSnapshot snapshot() const;

private:
    qint64 m_userId;
    qint64 m_chatId;
    qint64 m_messageId;
    qint64 m_requestMessageId;

    TaskStatus m_status = TaskStatus::Queued;
    QDateTime m_startTime;
    qint64 m_bytesTransferred = 0;
    qint64 m_totalBytes = 0;
    double m_progress = 0.0;
    double m_speed = 0.0;
    double m_eta = 0.0;
    int m_retryCount = 0;

    QROutputDescriptor m_output;
    RelayError m_lastError = RelayError::NoError;
    QString m_lastErrorMessage;

    QRCancelTokenPtr m_cancelToken;
};

using QRTaskPtr = QSharedPointer<QRTask>;

} // namespace QRelay

Q_DECLARE_METATYPE(QRelay::QRTaskSnapshot)

#endif // QRTASK_H
