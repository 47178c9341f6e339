// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRQueueManager.h"
#include "QRCheckpointStore.h"
#include "QRLogger.h"
#include "QRQueueRegistry.h"
#include <QTimer>

#include <limits>

namespace QRelay {

QRQueueManager::QRQueueManager(QRQueueRegistry &registry, QRCheckpointStore *store,
                               const QRRelaySettings &settings, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_store(store)
    , m_settings(settings)
{
}

QRQueueManager::~QRQueueManager() = default;

void QRQueueManager::setSettings(const QRRelaySettings &settings)
{
    m_settings = settings;
}

void QRQueueManager::log(RelayLogLevel level, const QString &message) const
{
    relayLog(m_logger, level, LogCategory::Queue, message);
}

// ============================================================================
// 批次生命周期
// ============================================================================

std::optional<QRQueueSnapshot> QRQueueManager::addBatch(qint64 userId, const QRMessageRange &range,
                                                        qint64 destinationChatId,
                                                        const QRBatchMetadata &metadata)
{
    const RelayError rejection = validateRange(range);
    if (rejection != RelayError::NoError) {
        const QString reason = rejection == RelayError::BatchTooLarge
            ? QStringLiteral("batch of %1 items exceeds limit %2").arg(range.count()).arg(m_settings.maxBatchSize)
            : QStringLiteral("invalid range %1..%2").arg(range.fromId).arg(range.toId);
        ++m_stats.batchesRejected;
        log(RelayLogLevel::Warning, QStringLiteral("user %1: batch rejected, %2").arg(userId).arg(reason));
        emit batchRejected(userId, rejection, reason);
        return std::nullopt;
    }

    // 上一个批次残留的写入不能落到新批次上，已落盘的旧检查点也作废
    stopCheckpointTimer(userId);
    m_completionsSinceFlush.remove(userId);
    removeCheckpoint(userId);

    QRBatchMetadata meta = metadata;
    meta.fromId = range.fromId;
    meta.toId = range.toId;
    meta.destinationChatId = destinationChatId;
    const QDateTime now = QDateTime::currentDateTimeUtc();
    if (!meta.createdAt.isValid()) {
        meta.createdAt = now;
    }

    auto token = QRCancelTokenPtr::create();
    QList<QRTaskPtr> tasks;
    tasks.reserve(static_cast<int>(range.count()));
    for (qint64 id = range.fromId; id <= range.toId; ++id) {
        auto task = QRTaskPtr::create(userId, meta.chatId, id, meta.requestMessageId);
        task->setCancelToken(token);
        tasks.append(task);
    }

    QRQueue &queue = m_registry.queueFor(userId);
    queue.reset(meta, tasks, token, now);

    ++m_stats.batchesAdmitted;
    m_stats.tasksAdmitted += queue.total();

    log(RelayLogLevel::Info, QStringLiteral("user %1: batch of %2 tasks admitted (%3..%4)")
                                 .arg(userId).arg(queue.total()).arg(range.fromId).arg(range.toId));

    const QRQueueSnapshot snap = queue.snapshot(now);
    emit batchAdmitted(userId, snap);
    return snap;
}

QRTaskPtr QRQueueManager::startNextTask(qint64 userId)
{
    QRQueue *queue = m_registry.find(userId);
    if (!queue || queue->isPaused() || queue->current() || queue->pendingCount() == 0) {
        return {};
    }

    QRTaskPtr task = queue->takeNext();
    task->start(QDateTime::currentDateTimeUtc());
    queue->setCurrent(task);

    log(RelayLogLevel::Debug, QStringLiteral("user %1: started message %2 (%3 pending)")
                                  .arg(userId).arg(task->messageId()).arg(queue->pendingCount()));
    return task;
}

QRTaskPtr QRQueueManager::completeCurrentTask(qint64 userId, bool success)
{
    QRQueue *queue = m_registry.find(userId);
    if (!queue || !queue->current()) {
        return {};
    }

    QRTaskPtr task = queue->current();
    task->setStatus(success ? TaskStatus::Completed : TaskStatus::Error);
    queue->recordCompletion(success);
    queue->clearCurrent();

    if (success) {
        ++m_stats.tasksCompleted;
    } else {
        ++m_stats.tasksFailed;
    }

    scheduleCheckpoint(userId);
    return task;
}

bool QRQueueManager::pause(qint64 userId)
{
    QRQueue *queue = m_registry.find(userId);
    if (!queue) {
        return false;
    }
    if (queue->isPaused()) {
        return true;
    }

    queue->setPaused(true);
    if (QRTaskPtr task = queue->current(); task && isActiveStatus(task->status())) {
        task->setStatus(TaskStatus::Paused);
    }

    log(RelayLogLevel::Info, QStringLiteral("user %1: queue paused").arg(userId));
    emit queuePaused(userId);
    return true;
}

bool QRQueueManager::resume(qint64 userId)
{
    QRQueue *queue = m_registry.find(userId);
    if (!queue) {
        return false;
    }
    if (!queue->isPaused()) {
        return true;
    }

    queue->setPaused(false);
    if (QRTaskPtr task = queue->current(); task && task->status() == TaskStatus::Paused) {
        task->setStatus(TaskStatus::Downloading);
        task->restampStart(QDateTime::currentDateTimeUtc());
    }

    log(RelayLogLevel::Info, QStringLiteral("user %1: queue resumed").arg(userId));
    emit queueResumed(userId);
    return true;
}

bool QRQueueManager::cancel(qint64 userId)
{
    QRQueue *queue = m_registry.find(userId);
    if (!queue) {
        return false;
    }

    if (QRCancelTokenPtr token = queue->cancelToken()) {
        token->cancel();
    }

    queue->clearPending();
    if (QRTaskPtr task = queue->current()) {
        task->setStatus(TaskStatus::Cancelled);
        queue->clearCurrent();
    }
    queue->truncateToCompleted();

    stopCheckpointTimer(userId);
    m_completionsSinceFlush.remove(userId);
    removeCheckpoint(userId);

    ++m_stats.batchesCancelled;
    log(RelayLogLevel::Info, QStringLiteral("user %1: batch cancelled after %2 items")
                                 .arg(userId).arg(queue->completed()));
    emit batchCancelled(userId);
    return true;
}

bool QRQueueManager::updateTaskProgress(qint64 userId, qint64 current, qint64 total, TaskStatus phase)
{
    QRQueue *queue = m_registry.find(userId);
    if (!queue || !queue->current()) {
        return false;
    }

    QRTaskPtr task = queue->current();
    if (phase == TaskStatus::Uploading && task->status() == TaskStatus::Downloading) {
        task->setStatus(TaskStatus::Uploading);
    }
    task->updateProgress(current, total, QDateTime::currentDateTimeUtc());
    return true;
}

bool QRQueueManager::abortCurrentTask(qint64 userId)
{
    QRQueue *queue = m_registry.find(userId);
    if (!queue || !queue->current()) {
        return false;
    }

    QRTaskPtr task = queue->current();
    task->setStatus(TaskStatus::Queued);
    task->resetProgress();
    queue->clearCurrent();
    queue->pushFront(task);

    log(RelayLogLevel::Info, QStringLiteral("user %1: message %2 returned to queue")
                                 .arg(userId).arg(task->messageId()));
    return true;
}

bool QRQueueManager::flushCheckpoint(qint64 userId)
{
    if (!hasPendingCheckpoint(userId)) {
        return true;
    }
    stopCheckpointTimer(userId);
    return writeCheckpoint(userId);
}

void QRQueueManager::finishBatch(qint64 userId)
{
    stopCheckpointTimer(userId);
    m_completionsSinceFlush.remove(userId);
    if (m_registry.find(userId)) {
        writeCheckpoint(userId);
    }
}

bool QRQueueManager::restoreQueue(const QRCheckpoint &checkpoint)
{
    const qint64 userId = checkpoint.userId;
    if (isActive(userId)) {
        log(RelayLogLevel::Info, QStringLiteral("user %1: restore skipped, queue already active").arg(userId));
        return false;
    }

    const int remaining = checkpoint.remaining();
    const qint64 fromId = checkpoint.metadata.fromId;
    if (remaining <= 0 || fromId <= 0) {
        return false;
    }

    const QRBatchMetadata &meta = checkpoint.metadata;
    auto token = QRCancelTokenPtr::create();
    QList<QRTaskPtr> tasks;
    tasks.reserve(remaining);
    const qint64 start = fromId + checkpoint.completed;
    for (int i = 0; i < remaining; ++i) {
        auto task = QRTaskPtr::create(userId, meta.chatId, start + i, meta.requestMessageId);
        task->setCancelToken(token);
        tasks.append(task);
    }

    stopCheckpointTimer(userId);
    m_completionsSinceFlush.remove(userId);

    QRQueue &queue = m_registry.queueFor(userId);
    const QDateTime now = QDateTime::currentDateTimeUtc();
    queue.reset(meta, tasks, token, now);
    queue.restoreCounters(checkpoint.total, checkpoint.completed, checkpoint.failed);
    queue.setPaused(checkpoint.paused);
    queue.setBatchStartTime(checkpoint.batchStartTime.isValid() ? checkpoint.batchStartTime : now);

    log(RelayLogLevel::Info, QStringLiteral("user %1: restored %2 of %3 tasks starting at %4")
                                 .arg(userId).arg(remaining).arg(checkpoint.total).arg(start));
    emit queueRestored(userId, remaining);
    return true;
}

void QRQueueManager::setProgressMessageId(qint64 userId, qint64 messageId)
{
    if (QRQueue *queue = m_registry.find(userId)) {
        queue->setProgressMessageId(messageId);
    }
}

// ============================================================================
// 查询
// ============================================================================

RelayError QRQueueManager::validateRange(const QRMessageRange &range) const
{
    if (!range.isValid() || range.count() <= 0) {
        return RelayError::InvalidRange;
    }
    if (range.count() > m_settings.maxBatchSize) {
        return RelayError::BatchTooLarge;
    }
    return RelayError::NoError;
}

QRQueueStatus QRQueueManager::status(qint64 userId) const
{
    QRQueueStatus result;
    if (const QRQueue *queue = m_registry.find(userId)) {
        result.total = queue->total();
        result.completed = queue->completed();
        result.failed = queue->failed();
        result.paused = queue->isPaused();
        result.hasActive = !queue->current().isNull();
    }
    return result;
}

std::optional<QRQueueSnapshot> QRQueueManager::snapshot(qint64 userId) const
{
    if (const QRQueue *queue = m_registry.find(userId)) {
        return queue->snapshot();
    }
    return std::nullopt;
}

QList<qint64> QRQueueManager::pendingMessageIds(qint64 userId) const
{
    if (const QRQueue *queue = m_registry.find(userId)) {
        return queue->pendingMessageIds();
    }
    return {};
}

std::optional<QRTaskSnapshot> QRQueueManager::currentTask(qint64 userId) const
{
    const QRQueue *queue = m_registry.find(userId);
    if (!queue || !queue->current()) {
        return std::nullopt;
    }
    return queue->current()->snapshot();
}

QRCancelTokenPtr QRQueueManager::cancelToken(qint64 userId) const
{
    const QRQueue *queue = m_registry.find(userId);
    return queue ? queue->cancelToken() : QRCancelTokenPtr();
}

bool QRQueueManager::hasQueue(qint64 userId) const
{
    return m_registry.contains(userId);
}

bool QRQueueManager::isActive(qint64 userId) const
{
    const QRQueue *queue = m_registry.find(userId);
    return queue && queue->hasWork();
}

bool QRQueueManager::isPaused(qint64 userId) const
{
    const QRQueue *queue = m_registry.find(userId);
    return queue && queue->isPaused();
}

int QRQueueManager::activeTaskCount(qint64 userId) const
{
    const QRQueue *queue = m_registry.find(userId);
    if (!queue || !queue->current()) {
        return 0;
    }
    return isActiveStatus(queue->current()->status()) ? 1 : 0;
}

bool QRQueueManager::checkInvariant(qint64 userId) const
{
    const QRQueue *queue = m_registry.find(userId);
    return !queue || queue->checkInvariant();
}

bool QRQueueManager::hasPendingCheckpoint(qint64 userId) const
{
    QTimer *timer = m_saveTimers.value(userId, nullptr);
    return timer && timer->isActive();
}

// ============================================================================
// 检查点
// ============================================================================

void QRQueueManager::scheduleCheckpoint(qint64 userId)
{
    if (!m_store) {
        return;
    }

    const int flushEvery = m_settings.checkpointFlushEvery;
    if (flushEvery > 0) {
        int &count = m_completionsSinceFlush[userId];
        if (++count >= flushEvery) {
            count = 0;
            stopCheckpointTimer(userId);
            writeCheckpoint(userId);
            return;
        }
    }

    QTimer *timer = m_saveTimers.value(userId, nullptr);
    if (!timer) {
        timer = new QTimer(this);
        timer->setSingleShot(true);
        connect(timer, &QTimer::timeout, this, [this, userId]() {
            writeCheckpoint(userId);
        });
        m_saveTimers.insert(userId, timer);
    }

    timer->start(static_cast<int>(qBound<qint64>(0, m_settings.checkpointDebounce.count(),
                                                 std::numeric_limits<int>::max())));
}

void QRQueueManager::stopCheckpointTimer(qint64 userId)
{
    if (QTimer *timer = m_saveTimers.value(userId, nullptr)) {
        timer->stop();
    }
}

bool QRQueueManager::writeCheckpoint(qint64 userId)
{
    const QRQueue *queue = m_registry.find(userId);
    if (!m_store || !queue) {
        return true;
    }

    if (queue->total() <= 0 || queue->completed() >= queue->total()) {
        return removeCheckpoint(userId);
    }

    const QRCheckpoint checkpoint = QRCheckpoint::fromQueue(*queue);
    if (!m_store->saveCheckpoint(userId, checkpoint)) {
        ++m_stats.checkpointFailures;
        const QString message = m_store->lastError();
        log(RelayLogLevel::Error, QStringLiteral("user %1: checkpoint write failed: %2").arg(userId).arg(message));
        emit checkpointFailed(userId, message);
        return false;
    }

    ++m_stats.checkpointWrites;
    log(RelayLogLevel::Debug, QStringLiteral("user %1: checkpoint saved (%2/%3)")
                                  .arg(userId).arg(checkpoint.completed).arg(checkpoint.total));
    emit checkpointSaved(userId, checkpoint);
    return true;
}

bool QRQueueManager::removeCheckpoint(qint64 userId)
{
    if (!m_store) {
        return true;
    }

    if (!m_store->deleteCheckpoint(userId)) {
        ++m_stats.checkpointFailures;
        const QString message = m_store->lastError();
        log(RelayLogLevel::Error, QStringLiteral("user %1: checkpoint delete failed: %2").arg(userId).arg(message));
        emit checkpointFailed(userId, message);
        return false;
    }

    emit checkpointDeleted(userId);
    return true;
}

} // namespace QRelay
