// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRRelayService.h"
#include "QRBatchWorker.h"
#include "QRCheckpointStore.h"
#include "QRLogger.h"
#include "QRRecovery.h"
#include "QRSessionPool.h"
#include "QRTransferExecutor.h"

namespace QRelay {

QRRelayService::QRRelayService(const QRRelaySettings &settings,
                               QRTransferExecutor *executor,
                               QRSessionFactory *sessionFactory,
                               QRCheckpointStore *store,
                               QRProgressReporter *reporter,
                               QObject *parent)
    : QRRelayService(settings, executor, static_cast<QRSessionProvider *>(nullptr), store, reporter, parent)
{
    m_pool = new QRSessionPool(sessionFactory, this);
    m_sessions = m_pool;
}

QRRelayService::QRRelayService(const QRRelaySettings &settings,
                               QRTransferExecutor *executor,
                               QRSessionProvider *sessions,
                               QRCheckpointStore *store,
                               QRProgressReporter *reporter,
                               QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_manager(new QRQueueManager(m_registry, store, settings, this))
    , m_sessions(sessions)
    , m_executor(executor)
    , m_store(store)
    , m_reporter(reporter)
{
}

QRRelayService::~QRRelayService()
{
    // Worker 持有 m_manager 的裸指针，先于管理器销毁
    qDeleteAll(m_workers);
    m_workers.clear();
}

void QRRelayService::setLogger(QRLogger *logger)
{
    m_logger = logger;
    m_manager->setLogger(logger);
    if (m_store) {
        m_store->setLogger(logger);
    }
    if (m_pool) {
        m_pool->setLogger(logger);
    }
    for (QRBatchWorker *worker : std::as_const(m_workers)) {
        worker->setLogger(logger);
    }
}

RelayError QRRelayService::submitBatch(qint64 userId, const QRMessageRange &range, qint64 destinationChatId,
                                       const QRBatchMetadata &metadata)
{
    if (isProcessing(userId)) {
        relayLog(m_logger, RelayLogLevel::Info, LogCategory::Service,
                 QStringLiteral("user %1: submission rejected, a batch is already processing").arg(userId));
        return RelayError::BatchInProgress;
    }

    if (!m_manager->addBatch(userId, range, destinationChatId, metadata)) {
        return m_manager->validateRange(range);
    }

    launchWorker(userId, false);
    return RelayError::NoError;
}

bool QRRelayService::pause(qint64 userId)
{
    return m_manager->pause(userId);
}

bool QRRelayService::resume(qint64 userId)
{
    return m_manager->resume(userId);
}

bool QRRelayService::cancel(qint64 userId)
{
    return m_manager->cancel(userId);
}

QRQueueStatus QRRelayService::status(qint64 userId) const
{
    return m_manager->status(userId);
}

int QRRelayService::resumePending()
{
    QRRecovery recovery(m_store, m_manager);
    recovery.setLogger(m_logger);

    const QList<qint64> users = recovery.restore();
    for (qint64 userId : users) {
        if (isProcessing(userId)) {
            continue;
        }
        if (m_reporter) {
            const QRQueueStatus queued = m_manager->status(userId);
            m_reporter->notify(userId, QStringLiteral("resuming batch after restart, %1 items remaining")
                                           .arg(queued.total - queued.completed));
        }
        launchWorker(userId, true);
    }
    return static_cast<int>(users.size());
}

bool QRRelayService::isProcessing(qint64 userId) const
{
    const QRBatchWorker *worker = m_workers.value(userId, nullptr);
    return worker && !worker->isFinished();
}

void QRRelayService::launchWorker(qint64 userId, bool resumed)
{
    auto *worker = new QRBatchWorker(userId, m_manager, m_sessions, m_executor, m_reporter, m_settings, this);
    worker->setLogger(m_logger);
    m_workers.insert(userId, worker);

    connect(worker, &QRBatchWorker::aborted, this, &QRRelayService::batchAborted);
    connect(worker, &QRBatchWorker::finished, this, [this, userId, worker](const QRBatchSummary &summary) {
        if (m_workers.value(userId) == worker) {
            m_workers.remove(userId);
        }
        worker->deleteLater();
        emit batchFinished(userId, summary);
    });

    emit batchStarted(userId, resumed);
    worker->start();
}

} // namespace QRelay
