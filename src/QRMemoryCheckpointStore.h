// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRMEMORYCHECKPOINTSTORE_H
#define QRMEMORYCHECKPOINTSTORE_H

#include "QRCheckpointStore.h"
#include <QHash>
#include <QMutex>

QT_BEGIN_NAMESPACE

namespace QRelay {

/**
 * @brief 内存检查点存储
 *
 * 进程退出即丢失，用于测试和不需要崩溃恢复的部署。
 * 支持故障注入以模拟存储不可用。
 *
 * @code
 * QRMemoryCheckpointStore store;
 * store.setFailSaves(true);   // 之后的 saveCheckpoint 全部失败
 * @endcode
 */
class QRELAY_EXPORT QRMemoryCheckpointStore : public QRCheckpointStore
{
    Q_OBJECT

public:
    explicit QRMemoryCheckpointStore(QObject *parent = nullptr);
    ~QRMemoryCheckpointStore() override;

    // QRCheckpointStore 接口实现
    bool saveCheckpoint(qint64 userId, const QRCheckpoint &checkpoint) override;
    [[nodiscard]] std::optional<QRCheckpoint> loadCheckpoint(qint64 userId) override;
    bool deleteCheckpoint(qint64 userId) override;
    [[nodiscard]] QList<QRCheckpoint> listIncompleteCheckpoints() override;
    [[nodiscard]] QString lastError() const override;

    // 故障注入
    void setFailSaves(bool fail);
    void setFailDeletes(bool fail);

    // 统计（成功的写入与删除次数）
    [[nodiscard]] int saveCount() const;
    [[nodiscard]] int deleteCount() const;
    [[nodiscard]] int size() const;
    void clear();

private:
    mutable QMutex m_mutex;
    QHash<qint64, QRCheckpoint> m_checkpoints;
    QString m_lastError;
    bool m_failSaves = false;
    bool m_failDeletes = false;
    int m_saveCount = 0;
    int m_deleteCount = 0;
};

} // namespace QRelay

QT_END_NAMESPACE

#endif // QRMEMORYCHECKPOINTSTORE_H
