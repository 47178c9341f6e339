// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRCHECKPOINT_H
#define QRCHECKPOINT_H

#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <optional>
#include "QRGlobal.h"
#include "QRQueue.h"

namespace QRelay {

/**
 * @brief 批次检查点
 *
 * 粗粒度的持久化快照，只记录计数器和元数据，不序列化逐条任务。
 * 恢复时根据 metadata.fromId + completed 重建待处理区间。
 *
 * @par JSON 格式
 * \code
 * {
 *   "user_id": 42, "total": 10, "completed": 4, "failed": 1,
 *   "paused": false, "progress": 40.0,
 *   "metadata": { "from_id": 100, "to_id": 109, "destination_chat_id": 7, ... },
 *   "batch_start_time": "...", "created_at": "...", "updated_at": "..."
 * }
 * \endcode
 */
struct QRELAY_EXPORT QRCheckpoint {
    qint64 userId = 0;
    int total = 0;
    int completed = 0;
    int failed = 0;
    bool paused = false;
    double progress = 0.0;
    QRBatchMetadata metadata;
    QDateTime batchStartTime;
    QDateTime createdAt;
    QDateTime updatedAt;

    [[nodiscard]] int remaining() const noexcept { return total - completed; }

    /**
     * @brief 是否仍有未完成的条目
     */
    [[nodiscard]] bool isIncomplete() const noexcept { return total > 0 && completed < total; }

    /**
     * @brief 从队列生成检查点
     */
    [[nodiscard]] static QRCheckpoint fromQueue(const QRQueue &queue,
                                                const QDateTime &now = QDateTime::currentDateTimeUtc());

    [[nodiscard]] QJsonObject toJson() const;

    /**
     * @brief 从 JSON 解析
     * @return 缺少 user_id 或计数器不合法时返回 std::nullopt
     */
    [[nodiscard]] static std::optional<QRCheckpoint> fromJson(const QJsonObject &json);
};

} // namespace QRelay

Q_DECLARE_METATYPE(QRelay::QRCheckpoint)

#endif // QRCHECKPOINT_H
