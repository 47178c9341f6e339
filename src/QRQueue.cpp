// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRQueue.h"

namespace QRelay {

QString sourceTypeName(SourceType type)
{
    switch (type) {
    case SourceType::Public:  return QStringLiteral("public");
    case SourceType::Private: return QStringLiteral("private");
    case SourceType::Bot:     return QStringLiteral("bot");
    }
    return QStringLiteral("public");
}

SourceType sourceTypeFromName(const QString &name, SourceType fallback)
{
    const QString lower = name.trimmed().toLower();
    if (lower == QLatin1String("public")) return SourceType::Public;
    if (lower == QLatin1String("private")) return SourceType::Private;
    if (lower == QLatin1String("bot")) return SourceType::Bot;
    return fallback;
}

// ============================================================================
// QRBatchMetadata
// ============================================================================

QJsonObject QRBatchMetadata::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("source_type"), sourceTypeName(sourceType));
    obj.insert(QStringLiteral("source_id"), sourceId);
    obj.insert(QStringLiteral("chat_id"), chatId);
    obj.insert(QStringLiteral("from_id"), fromId);
    obj.insert(QStringLiteral("to_id"), toId);
    obj.insert(QStringLiteral("destination_chat_id"), destinationChatId);
    obj.insert(QStringLiteral("request_message_id"), requestMessageId);
    obj.insert(QStringLiteral("link"), link);
    if (createdAt.isValid()) {
        obj.insert(QStringLiteral("created_at"), createdAt.toString(Qt::ISODateWithMs));
    }
    return obj;
}

QRBatchMetadata QRBatchMetadata::fromJson(const QJsonObject &json)
{
    QRBatchMetadata meta;
    meta.sourceType = sourceTypeFromName(json.value(QStringLiteral("source_type")).toString());
    meta.sourceId = json.value(QStringLiteral("source_id")).toString();
    meta.chatId = json.value(QStringLiteral("chat_id")).toInteger();
    meta.fromId = json.value(QStringLiteral("from_id")).toInteger();
    meta.toId = json.value(QStringLiteral("to_id")).toInteger();
    meta.destinationChatId = json.value(QStringLiteral("destination_chat_id")).toInteger();
    meta.requestMessageId = json.value(QStringLiteral("request_message_id")).toInteger();
    meta.link = json.value(QStringLiteral("link")).toString();
    meta.createdAt = QDateTime::fromString(json.value(QStringLiteral("created_at")).toString(),
                                           Qt::ISODateWithMs);
    return meta;
}

// ============================================================================
// QRQueue
// ============================================================================

QRQueue::QRQueue(qint64 userId)
    : m_userId(userId)
{
}

void QRQueue::reset(const QRBatchMetadata &metadata, const QList<QRTaskPtr> &tasks,
                    const QRCancelTokenPtr &token, const QDateTime &now)
{
    if (m_cancelToken && m_cancelToken != token) {
        m_cancelToken->cancel();
    }

    m_pending = tasks;
    m_current.reset();
    m_total = static_cast<int>(tasks.size());
    m_completed = 0;
    m_failed = 0;
    m_paused = false;
    m_metadata = metadata;
    m_batchStartTime = now;
    m_progressMessageId = 0;
    m_cancelToken = token;
}

QList<qint64> QRQueue::pendingMessageIds() const
{
    QList<qint64> ids;
    ids.reserve(m_pending.size());
    for (const QRTaskPtr &task : m_pending) {
        ids.append(task->messageId());
    }
    return ids;
}

QRTaskPtr QRQueue::takeNext()
{
    if (m_pending.isEmpty()) {
        return {};
    }
    return m_pending.takeFirst();
}

void QRQueue::pushFront(const QRTaskPtr &task)
{
    m_pending.prepend(task);
}

void QRQueue::clearPending()
{
    m_pending.clear();
}

void QRQueue::recordCompletion(bool success)
{
    ++m_completed;
    if (!success) {
        ++m_failed;
    }
}

void QRQueue::restoreCounters(int total, int completed, int failed)
{
    m_total = total;
    m_completed = completed;
    m_failed = failed;
}

double QRQueue::batchProgress() const
{
    if (m_total <= 0) {
        return 0.0;
    }
    const double currentFraction = m_current ? m_current->progress() / 100.0 : 0.0;
    return (m_completed + currentFraction) / m_total * 100.0;
}

double QRQueue::batchEta(const QDateTime &now) const
{
    if (m_completed <= 0 || !m_batchStartTime.isValid()) {
        return 0.0;
    }
    const double elapsed = m_batchStartTime.msecsTo(now) / 1000.0;
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return elapsed / m_completed * (m_total - m_completed);
}

double QRQueue::successRate() const
{
    if (m_total <= 0) {
        return 100.0;
    }
    return static_cast<double>(m_completed - m_failed) / m_total * 100.0;
}

bool QRQueue::checkInvariant() const
{
    const int inFlight = m_current ? 1 : 0;
    return pendingCount() + inFlight + m_completed == m_total
        && m_failed <= m_completed
        && m_failed >= 0;
}

QRQueueSnapshot QRQueue::snapshot(const QDateTime &now) const
{
    QRQueueSnapshot s;
    s.userId = m_userId;
    s.total = m_total;
    s.completed = m_completed;
    s.failed = m_failed;
    s.remaining = remaining();
    s.pending = pendingCount();
    s.paused = m_paused;
    s.hasActive = !m_current.isNull();
    s.progress = batchProgress();
    s.eta = batchEta(now);
    s.successRate = successRate();
    s.progressMessageId = m_progressMessageId;
    s.batchStartTime = m_batchStartTime;
    s.metadata = m_metadata;
    return s;
}

} // namespace QRelay
