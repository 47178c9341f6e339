// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRBatchWorker.h"
#include "QRLogger.h"
#include "QRQueueManager.h"
#include "QRTransferExecutor.h"
#include <QPointer>
#include <QTimer>
#include <exception>
#include <limits>

namespace QRelay {

QRBatchWorker::QRBatchWorker(qint64 userId,
                             QRQueueManager *manager,
                             QRSessionProvider *sessions,
                             QRTransferExecutor *executor,
                             QRProgressReporter *reporter,
                             const QRRelaySettings &settings,
                             QObject *parent)
    : QObject(parent)
    , m_userId(userId)
    , m_manager(manager)
    , m_sessions(sessions)
    , m_executor(executor)
    , m_reporter(reporter)
    , m_settings(settings)
    , m_timer(new QTimer(this))
{
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &QRBatchWorker::onTimer);

    m_summary.userId = userId;
}

QRBatchWorker::~QRBatchWorker() = default;

void QRBatchWorker::log(RelayLogLevel level, const QString &message) const
{
    relayLog(m_logger, level, LogCategory::Worker, QStringLiteral("user %1: %2").arg(m_userId).arg(message));
}

void QRBatchWorker::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

void QRBatchWorker::start()
{
    if (m_state != State::Idle || !m_manager || !m_sessions || !m_executor) {
        return;
    }

    m_token = m_manager->cancelToken(m_userId);
    if (m_token) {
        connect(m_token.data(), &QRCancelToken::cancelled, this, &QRBatchWorker::interrupt);
    }
    connect(m_manager, &QRQueueManager::checkpointFailed, this, &QRBatchWorker::onStoreFailure);
    connect(m_executor, &QRTransferExecutor::progress, this,
            [this](qint64 userId, qint64 current, qint64 total, TaskStatus phase) {
                if (userId == m_userId && m_task && !m_finished) {
                    m_manager->updateTaskProgress(userId, current, total, phase);
                }
            });

    m_elapsed.start();
    setState(State::Running);
    log(RelayLogLevel::Info, QStringLiteral("worker started"));
    schedule(NextAction::Step, std::chrono::milliseconds(0));
}

// ============================================================================
// 定时器驱动
// ============================================================================

void QRBatchWorker::schedule(NextAction action, std::chrono::milliseconds delay)
{
    m_nextAction = action;
    m_timer->start(static_cast<int>(qBound<qint64>(0, delay.count(), std::numeric_limits<int>::max())));
}

void QRBatchWorker::onTimer()
{
    if (m_finished) {
        return;
    }
    if (m_nextAction == NextAction::Retry) {
        retryAttempt();
    } else {
        step();
    }
}

void QRBatchWorker::interrupt()
{
    // 只打断等待中的定时器，进行中的传输由执行器轮询令牌结束
    if (m_finished || !m_timer->isActive()) {
        return;
    }
    m_timer->stop();
    schedule(NextAction::Step, std::chrono::milliseconds(0));
}

void QRBatchWorker::onStoreFailure(qint64 userId, const QString &message)
{
    if (userId != m_userId || m_finished) {
        return;
    }
    m_storeFailed = true;
    m_storeError = message;
}

bool QRBatchWorker::stopIfCancelled()
{
    if (!m_token || !m_token->isCancelled()) {
        return false;
    }
    m_cancelled = true;
    setState(State::Draining);
    log(RelayLogLevel::Info, QStringLiteral("batch cancelled, draining"));
    finalize();
    return true;
}

// ============================================================================
// 循环体
// ============================================================================

void QRBatchWorker::step()
{
    if (stopIfCancelled()) {
        return;
    }
    if (m_storeFailed) {
        abortBatch(RelayError::StoreUnavailable, m_storeError);
        return;
    }

    if (m_manager->isPaused(m_userId)) {
        setState(State::Paused);
        schedule(NextAction::Step, m_settings.pausePollInterval);
        return;
    }
    setState(State::Running);

    m_task = m_manager->startNextTask(m_userId);
    if (!m_task) {
        finalize();
        return;
    }

    emit taskStarted(m_userId, m_task->messageId());
    log(RelayLogLevel::Debug, QStringLiteral("processing message %1").arg(m_task->messageId()));

    QPointer<QRBatchWorker> self(this);
    const quint64 attemptId = ++m_attemptId;
    m_sessions->acquire(m_userId, [self, attemptId](QRSessionPtr session) {
        if (!self || self->m_finished || self->m_attemptId != attemptId) {
            return;
        }
        self->onSession(session);
    });
}

void QRBatchWorker::onSession(const QRSessionPtr &session)
{
    // 等待会话期间用户已取消：按取消收尾，不再报告会话不可用
    if (stopIfCancelled()) {
        return;
    }
    if (!session) {
        abortBatch(RelayError::SessionUnavailable, errorString(RelayError::SessionUnavailable));
        return;
    }

    m_session = session;
    attempt();
}

void QRBatchWorker::attempt()
{
    QPointer<QRBatchWorker> self(this);
    const quint64 attemptId = ++m_attemptId;

    try {
        m_executor->execute(m_task, m_session, [self, attemptId](const QRTransferOutcome &outcome) {
            if (!self || self->m_finished || self->m_attemptId != attemptId) {
                return;
            }
            self->onOutcome(outcome);
        });
    } catch (const std::exception &e) {
        ++m_attemptId;
        log(RelayLogLevel::Error, QStringLiteral("executor threw on message %1: %2")
                                      .arg(m_task->messageId()).arg(QString::fromUtf8(e.what())));
        onOutcome(QRTransferOutcome::itemFatal(QString::fromUtf8(e.what())));
    } catch (...) {
        ++m_attemptId;
        log(RelayLogLevel::Error, QStringLiteral("executor threw a non-standard exception on message %1")
                                      .arg(m_task->messageId()));
        onOutcome(QRTransferOutcome::itemFatal(QStringLiteral("unknown exception")));
    }
}

void QRBatchWorker::retryAttempt()
{
    if (stopIfCancelled()) {
        return;
    }
    if (m_storeFailed) {
        abortBatch(RelayError::StoreUnavailable, m_storeError);
        return;
    }
    if (m_manager->isPaused(m_userId)) {
        setState(State::Paused);
        schedule(NextAction::Retry, m_settings.pausePollInterval);
        return;
    }

    setState(State::Running);
    attempt();
}

void QRBatchWorker::onOutcome(const QRTransferOutcome &outcome)
{
    if (outcome.kind == QRTransferOutcome::Kind::UserCancelled) {
        // 执行器自行观察到取消时，队列仍需按取消规则清空
        if (!m_token || !m_token->isCancelled()) {
            m_manager->cancel(m_userId);
        }
        m_cancelled = true;
        setState(State::Draining);
        log(RelayLogLevel::Info, QStringLiteral("transfer of message %1 cancelled").arg(m_task->messageId()));
        finalize();
        return;
    }
    if (stopIfCancelled()) {
        return;
    }

    const QRRetryPolicy &policy = m_settings.retryPolicy;

    switch (outcome.kind) {
    case QRTransferOutcome::Kind::Success:
        if (!outcome.output.isEmpty()) {
            m_task->setOutput(outcome.output);
        }
        if (outcome.bytes > 0) {
            m_task->updateProgress(outcome.bytes, outcome.bytes);
        }
        finishTask(true);
        return;

    case QRTransferOutcome::Kind::RateLimited:
    case QRTransferOutcome::Kind::ExpiredReference: {
        const int retries = m_task->retryCount();
        m_task->setError(outcome.error, outcome.reason);

        if (!policy.shouldRetry(outcome.error, retries)) {
            log(RelayLogLevel::Warning, QStringLiteral("message %1: retries exhausted (%2)")
                                            .arg(m_task->messageId()).arg(outcome.reason));
            m_task->setError(RelayError::ItemFatal,
                             QStringLiteral("retries exhausted: %1").arg(outcome.reason));
            finishTask(false);
            return;
        }

        const auto delay = policy.delayFor(outcome.error, retries, outcome.mandatedWait());
        m_task->incrementRetryCount();
        log(RelayLogLevel::Info, QStringLiteral("message %1: %2, retry %3 in %4 ms")
                                     .arg(m_task->messageId())
                                     .arg(outcomeKindName(outcome.kind))
                                     .arg(m_task->retryCount())
                                     .arg(delay.count()));
        emit taskRetrying(m_userId, m_task->messageId(), m_task->retryCount(), delay.count());
        schedule(NextAction::Retry, delay);
        return;
    }

    case QRTransferOutcome::Kind::ItemFatal:
        m_task->setError(outcome.error, outcome.reason);
        log(RelayLogLevel::Warning, QStringLiteral("message %1 failed: %2")
                                        .arg(m_task->messageId()).arg(outcome.reason));
        finishTask(false);
        return;

    case QRTransferOutcome::Kind::UserCancelled:
        break;
    }
}

void QRBatchWorker::finishTask(bool success)
{
    m_manager->completeCurrentTask(m_userId, success);
    const QRTaskSnapshot taskSnapshot = m_task->snapshot();
    m_task.reset();
    m_session.reset();

    emit taskFinished(m_userId, taskSnapshot, success);

    if (m_reporter) {
        try {
            const QRQueueSnapshot queueSnapshot = m_manager->snapshot(m_userId).value_or(QRQueueSnapshot());
            m_reporter->report(m_userId, queueSnapshot, taskSnapshot);
        } catch (const std::exception &e) {
            log(RelayLogLevel::Warning, QStringLiteral("progress reporter failed: %1").arg(QString::fromUtf8(e.what())));
        }
    }

    schedule(NextAction::Step, m_settings.interTaskDelay);
}

void QRBatchWorker::abortBatch(RelayError error, const QString &message)
{
    log(RelayLogLevel::Error, QStringLiteral("batch aborted: %1 (%2)").arg(errorString(error), message));

    m_manager->abortCurrentTask(m_userId);
    if (!m_manager->flushCheckpoint(m_userId)) {
        log(RelayLogLevel::Error, QStringLiteral("checkpoint could not be flushed during abort"));
    }
    m_task.reset();
    m_session.reset();

    m_summary.aborted = true;
    m_summary.abortError = error;
    m_summary.abortMessage = message;

    setState(State::FatalAbort);
    emit aborted(m_userId, error, message);

    if (m_reporter) {
        try {
            m_reporter->notify(m_userId, QStringLiteral("%1: %2").arg(errorString(error), message));
        } catch (const std::exception &e) {
            log(RelayLogLevel::Warning, QStringLiteral("progress reporter failed: %1").arg(QString::fromUtf8(e.what())));
        }
    }

    finalize();
}

void QRBatchWorker::finalize()
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    m_timer->stop();

    if (m_state != State::FatalAbort && !m_cancelled) {
        m_manager->finishBatch(m_userId);
    }
    m_sessions->release(m_userId);

    const QRQueueStatus status = m_manager->status(m_userId);
    m_summary.total = status.total;
    m_summary.succeeded = status.completed - status.failed;
    m_summary.failed = status.failed;
    m_summary.elapsedMs = m_elapsed.isValid() ? m_elapsed.elapsed() : 0;
    m_summary.successRate = status.total > 0
        ? static_cast<double>(m_summary.succeeded) / status.total * 100.0
        : 100.0;
    m_summary.filesPerMinute = m_summary.elapsedMs > 0
        ? status.completed / (m_summary.elapsedMs / 60000.0)
        : 0.0;
    m_summary.cancelled = m_cancelled;

    if (m_state != State::FatalAbort) {
        setState(State::Completed);
    }

    log(RelayLogLevel::Info, QStringLiteral("worker finished: %1/%2 ok, %3 failed")
                                 .arg(m_summary.succeeded).arg(m_summary.total).arg(m_summary.failed));
    emit finished(m_summary);

    if (m_reporter) {
        try {
            m_reporter->reportSummary(m_userId, m_summary);
        } catch (const std::exception &e) {
            log(RelayLogLevel::Warning, QStringLiteral("progress reporter failed: %1").arg(QString::fromUtf8(e.what())));
        }
    }
}

} // namespace QRelay
