// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRSESSIONPROVIDER_H
#define QRSESSIONPROVIDER_H

#include <QDateTime>
#include <QObject>
#include <QSharedPointer>
#include <QString>
#include <functional>
#include "QRGlobal.h"

namespace QRelay {

/**
 * @brief 已认证的用户会话句柄
 *
 * 具体的传输实现可以继承此类携带真实的客户端对象。
 */
class QRELAY_EXPORT QRSession
{
public:
    explicit QRSession(qint64 userId, const QString &name = QString());
    virtual ~QRSession();

    [[nodiscard]] qint64 userId() const noexcept { return m_userId; }
    [[nodiscard]] QString name() const { return m_name; }
    [[nodiscard]] QDateTime createdAt() const { return m_createdAt; }

private:
    qint64 m_userId;
    QString m_name;
    QDateTime m_createdAt;
};

using QRSessionPtr = QSharedPointer<QRSession>;

/**
 * @brief 会话提供者接口
 *
 * acquire() 以回调返回会话，空指针表示没有可用凭据，批次不能开始。
 * 回调可以同步或异步调用，但每次 acquire 只调用一次。
 */
class QRELAY_EXPORT QRSessionProvider : public QObject
{
    Q_OBJECT

public:
    using SessionCallback = std::function<void(QRSessionPtr)>;

    explicit QRSessionProvider(QObject *parent = nullptr) : QObject(parent) {}
    ~QRSessionProvider() override = default;

    /**
     * @brief 获取用户会话
     */
    virtual void acquire(qint64 userId, SessionCallback callback) = 0;

    /**
     * @brief 丢弃缓存的会话
     */
    virtual void invalidate(qint64 userId) = 0;

    /**
     * @brief 释放批次范围的资源，批次结束时调用
     */
    virtual void release(qint64 userId) { Q_UNUSED(userId) }
};

} // namespace QRelay

#endif // QRSESSIONPROVIDER_H
