// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRMOCKTRANSFEREXECUTOR_H
#define QRMOCKTRANSFEREXECUTOR_H

#include <QHash>
#include <QList>
#include "QRTransferExecutor.h"

namespace QRelay {

/**
 * @brief 脚本化的传输执行器
 *
 * 用于单元测试和演示，按消息 ID 返回预设结果，可模拟延迟、进度和异常。
 *
 * @code
 * QRMockTransferExecutor executor;
 * executor.mockSequence(103, { QRTransferOutcome::rateLimited(30),
 *                              QRTransferOutcome::rateLimited(30),
 *                              QRTransferOutcome::success(2048) });
 * executor.mockOutcome(104, QRTransferOutcome::itemFatal("filtered"));
 * executor.mockException(105, "boom");
 * executor.setGlobalDelay(5);
 * @endcode
 */
class QRELAY_EXPORT QRMockTransferExecutor : public QRTransferExecutor
{
    Q_OBJECT

public:
    explicit QRMockTransferExecutor(QObject *parent = nullptr);
    ~QRMockTransferExecutor() override;

    /**
     * @brief 对某条消息的每次尝试都返回同一结果
     */
    void mockOutcome(qint64 messageId, const QRTransferOutcome &outcome);

    /**
     * @brief 对某条消息依次返回一组结果，用完后回到 mockOutcome 或默认结果
     */
    void mockSequence(qint64 messageId, const QList<QRTransferOutcome> &outcomes);

    /**
     * @brief 对某条消息的每次尝试都抛出 std::runtime_error
     */
    void mockException(qint64 messageId, const QString &what);

    /**
     * @brief 未预设的消息使用的结果（默认 success(1024)）
     */
    void setDefaultOutcome(const QRTransferOutcome &outcome);

    /**
     * @brief 结果回调前的延迟（毫秒），回调始终异步
     */
    void setGlobalDelay(int msecs);
    [[nodiscard]] int globalDelay() const { return m_globalDelay; }

    /**
     * @brief 在回调前报告一次下载进度和一次上传进度
     */
    void setSimulateProgress(bool enable) { m_simulateProgress = enable; }

    /**
     * @brief 每次 execute 开始时调用的钩子
     */
    void setOnExecute(std::function<void(const QRTaskPtr &)> hook) { m_onExecute = std::move(hook); }

    // QRTransferExecutor 接口实现
    void execute(const QRTaskPtr &task, const QRSessionPtr &session, DoneCallback done) override;

    /**
     * @brief 按调用顺序记录的消息 ID
     */
    [[nodiscard]] QList<qint64> calls() const { return m_calls; }
    [[nodiscard]] int callCount(qint64 messageId) const;
    [[nodiscard]] int totalCalls() const { return static_cast<int>(m_calls.size()); }

    /**
     * @brief 每次调用收到的会话名
     */
    [[nodiscard]] QList<QString> sessionNames() const { return m_sessionNames; }

    void clear();

private:
    QRTransferOutcome nextOutcome(qint64 messageId);

    QHash<qint64, QRTransferOutcome> m_outcomes;
    QHash<qint64, QList<QRTransferOutcome>> m_sequences;
    QHash<qint64, QString> m_exceptions;
    QRTransferOutcome m_defaultOutcome;
    int m_globalDelay = 0;
    bool m_simulateProgress = false;
    std::function<void(const QRTaskPtr &)> m_onExecute;
    QList<qint64> m_calls;
    QList<QString> m_sessionNames;
};

} // namespace QRelay

#endif // QRMOCKTRANSFEREXECUTOR_H
