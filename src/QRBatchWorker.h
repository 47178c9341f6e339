// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRBATCHWORKER_H
#define QRBATCHWORKER_H

#include <QElapsedTimer>
#include <QObject>
#include <chrono>
#include "QRCancelToken.h"
#include "QRError.h"
#include "QRGlobal.h"
#include "QRProgressReporter.h"
#include "QRRelaySettings.h"
#include "QRSessionProvider.h"
#include "QRTask.h"

class QTimer;

namespace QRelay {

class QRLogger;
class QRQueueManager;
class QRTransferExecutor;
struct QRTransferOutcome;

/**
 * @brief 单个用户的批次执行器
 *
 * 每个活跃用户一个，按提交顺序逐条处理队列。循环由单次定时器串联，
 * 暂停轮询、条目间等待和重试退避都不会阻塞事件循环。
 *
 * @par 状态机
 * \code
 * Idle → Running ⇄ Paused
 *          ├→ Draining → Completed   （取消）
 *          ├→ Completed              （队列耗尽）
 *          └→ FatalAbort             （会话不可用或存储失败）
 * \endcode
 *
 * @par 一次迭代
 * 1. 令牌已取消 → Draining；存储失败 → FatalAbort
 * 2. 队列暂停 → Paused，等待 pausePollInterval 后重试
 * 3. startNextTask，为空则正常结束
 * 4. 获取会话，失败 → FatalAbort（任务放回队首，检查点落盘）
 * 5. 调用执行器，异常转为 ItemFatal
 * 6. 暂时性错误按 QRRetryPolicy 在同一条目上重试，用尽后按 ItemFatal 处理
 * 7. UserCancelled → 立即停止，不调用 completeCurrentTask
 * 8. Success / ItemFatal → completeCurrentTask
 * 9. 报告进度，等待 interTaskDelay
 *
 * @code
 * auto *worker = new QRBatchWorker(userId, &manager, &sessions, &executor, &reporter, settings);
 * connect(worker, &QRBatchWorker::finished, worker, &QObject::deleteLater);
 * worker->start();
 * @endcode
 */
class QRELAY_EXPORT QRBatchWorker : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Running,
        Paused,
        Draining,
        Completed,
        FatalAbort
    };
    Q_ENUM(State)

    QRBatchWorker(qint64 userId,
                  QRQueueManager *manager,
                  QRSessionProvider *sessions,
                  QRTransferExecutor *executor,
                  QRProgressReporter *reporter,
                  const QRRelaySettings &settings = QRRelaySettings(),
                  QObject *parent = nullptr);
    ~QRBatchWorker() override;

    void setLogger(QRLogger *logger) { m_logger = logger; }

    [[nodiscard]] qint64 userId() const noexcept { return m_userId; }
    [[nodiscard]] State state() const noexcept { return m_state; }

    /**
     * @brief 是否已进入终止状态
     */
    [[nodiscard]] bool isFinished() const noexcept { return m_finished; }

    /**
     * @brief 结束后的摘要，结束前为默认值
     */
    [[nodiscard]] QRBatchSummary summary() const { return m_summary; }

    /**
     * @brief 开始处理，只在 Idle 状态下有效
     */
    void start();

signals:
    void stateChanged(QRelay::QRBatchWorker::State state);
    void taskStarted(qint64 userId, qint64 messageId);
    void taskRetrying(qint64 userId, qint64 messageId, int attempt, qint64 delayMs);
    void taskFinished(qint64 userId, const QRelay::QRTaskSnapshot &task, bool success);
    void aborted(qint64 userId, QRelay::RelayError error, const QString &message);
    void finished(const QRelay::QRBatchSummary &summary);

private:
    enum class NextAction {
        Step,
        Retry
    };

    void schedule(NextAction action, std::chrono::milliseconds delay);
    void onTimer();
    void interrupt();
    void onStoreFailure(qint64 userId, const QString &message);

    void step();
    void onSession(const QRSessionPtr &session);
    void attempt();
    void retryAttempt();
    void onOutcome(const QRTransferOutcome &outcome);
    void finishTask(bool success);
    void abortBatch(RelayError error, const QString &message);
    void finalize();

    bool stopIfCancelled();
    void setState(State state);
    void log(RelayLogLevel level, const QString &message) const;

    qint64 m_userId;
    QRQueueManager *m_manager;
    QRSessionProvider *m_sessions;
    QRTransferExecutor *m_executor;
    QRProgressReporter *m_reporter;
    QRRelaySettings m_settings;
    QRLogger *m_logger = nullptr;

    State m_state = State::Idle;
    bool m_finished = false;
    bool m_cancelled = false;
    bool m_storeFailed = false;
    QString m_storeError;

    QTimer *m_timer;
    NextAction m_nextAction = NextAction::Step;
    quint64 m_attemptId = 0;

    QRCancelTokenPtr m_token;
    QRTaskPtr m_task;
    QRSessionPtr m_session;
    QElapsedTimer m_elapsed;
    QRBatchSummary m_summary;
};

} // namespace QRelay

#endif // QRBATCHWORKER_H
