// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRCHECKPOINTSTORE_H
#define QRCHECKPOINTSTORE_H

#include <QObject>
#include <QList>
#include <optional>
#include "QRCheckpoint.h"
#include "QRGlobal.h"

QT_BEGIN_NAMESPACE

namespace QRelay {

class QRLogger;

/**
 * @brief 检查点持久化存储抽象基类
 *
 * 每个用户最多一个检查点。实现包括磁盘 JSON 存储和内存存储。
 *
 * @par 使用示例
 * @code
 * auto *store = new QRJsonCheckpointStore("/var/lib/relay/checkpoints");
 * manager->setCheckpointStore(store);
 * @endcode
 */
class QRELAY_EXPORT QRCheckpointStore : public QObject
{
    Q_OBJECT

public:
    explicit QRCheckpointStore(QObject *parent = nullptr) : QObject(parent) {}
    ~QRCheckpointStore() override = default;

    /**
     * @brief 保存（覆盖）用户的检查点
     *
     * 已存在的检查点保留其 createdAt。
     * @return 失败时返回 false，原因见 lastError()
     */
    virtual bool saveCheckpoint(qint64 userId, const QRCheckpoint &checkpoint) = 0;

    /**
     * @brief 读取用户的检查点
     */
    [[nodiscard]] virtual std::optional<QRCheckpoint> loadCheckpoint(qint64 userId) = 0;

    /**
     * @brief 删除用户的检查点，不存在时也返回 true
     */
    virtual bool deleteCheckpoint(qint64 userId) = 0;

    /**
     * @brief 列出所有未完成的检查点，按 updatedAt 从旧到新排序
     */
    [[nodiscard]] virtual QList<QRCheckpoint> listIncompleteCheckpoints() = 0;

    /**
     * @brief 最近一次失败的描述
     */
    [[nodiscard]] virtual QString lastError() const = 0;

    void setLogger(QRLogger *logger) { m_logger = logger; }
    [[nodiscard]] QRLogger *logger() const { return m_logger; }

protected:
    /**
     * @brief 按 updatedAt 升序排序，并过滤掉已完成的检查点
     */
    [[nodiscard]] static QList<QRCheckpoint> sortedIncomplete(const QList<QRCheckpoint> &all);

    QRLogger *m_logger = nullptr;
};

} // namespace QRelay

QT_END_NAMESPACE

#endif // QRCHECKPOINTSTORE_H
