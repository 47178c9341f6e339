// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRCANCELTOKEN_H
#define QRCANCELTOKEN_H

#include <QObject>
#include <QSharedPointer>
#include <memory>
#include "QRGlobal.h"

namespace QRelay {

/**
 * @brief 批次取消令牌
 *
 * 每个批次一个令牌。QRBatchWorker 在循环与重试边界轮询 isCancelled()，
 * 传输执行器在长时间传输中同样轮询。isCancelled() 是原子读取，
 * 可以在执行器的工作线程中调用。
 *
 * cancelled() 信号用于打断工作循环中正在等待的定时器。
 *
 * @code
 * QRCancelTokenPtr token = QRCancelTokenPtr::create();
 * connect(token.data(), &QRCancelToken::cancelled, worker, &QRBatchWorker::interrupt);
 * token->cancel();
 * @endcode
 */
class QRELAY_EXPORT QRCancelToken : public QObject
{
    Q_OBJECT

public:
    explicit QRCancelToken(QObject *parent = nullptr);
    ~QRCancelToken() override;

    /**
     * @brief 取消令牌，重复调用无副作用
     */
    void cancel();

    /**
     * @brief 检查令牌是否已被取消（线程安全）
     */
    [[nodiscard]] bool isCancelled() const;

signals:
    /**
     * @brief 令牌第一次被取消时发射
     */
    void cancelled();

private:
    class Private;
    std::unique_ptr<Private> d_ptr;
};

using QRCancelTokenPtr = QSharedPointer<QRCancelToken>;

} // namespace QRelay

#endif // QRCANCELTOKEN_H
