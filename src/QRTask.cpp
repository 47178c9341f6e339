// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRTask.h"

namespace QRelay {

QString taskStatusName(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Queued:      return QStringLiteral("Queued");
    case TaskStatus::Downloading: return QStringLiteral("Downloading");
    case TaskStatus::Uploading:   return QStringLiteral("Uploading");
    case TaskStatus::Completed:   return QStringLiteral("Completed");
    case TaskStatus::Paused:      return QStringLiteral("Paused");
    case TaskStatus::Cancelled:   return QStringLiteral("Cancelled");
    case TaskStatus::Error:       return QStringLiteral("Error");
    case TaskStatus::Skipped:     return QStringLiteral("Skipped");
    }
    return QStringLiteral("Unknown");
}

bool isTerminalStatus(TaskStatus status) noexcept
{
    return status == TaskStatus::Completed
        || status == TaskStatus::Cancelled
        || status == TaskStatus::Error
        || status == TaskStatus::Skipped;
}

bool isActiveStatus(TaskStatus status) noexcept
{
    return status == TaskStatus::Downloading || status == TaskStatus::Uploading;
}

QRTask::QRTask(qint64 userId, qint64 chatId, qint64 messageId, qint64 requestMessageId)
    : m_userId(userId)
    , m_chatId(chatId)
    , m_messageId(messageId)
    , m_requestMessageId(requestMessageId)
{
}

bool QRTask::canTransition(TaskStatus from, TaskStatus to) noexcept
{
    if (from == to) {
        return true;
    }
    if (isTerminalStatus(from)) {
        return false;
    }
    if (to == TaskStatus::Cancelled) {
        return true;
    }

    switch (from) {
    case TaskStatus::Queued:
        return to == TaskStatus::Downloading || to == TaskStatus::Skipped;
    case TaskStatus::Downloading:
        return to == TaskStatus::Uploading || to == TaskStatus::Paused
            || to == TaskStatus::Completed || to == TaskStatus::Error
            || to == TaskStatus::Queued;
    case TaskStatus::Uploading:
        return to == TaskStatus::Paused || to == TaskStatus::Completed
            || to == TaskStatus::Error || to == TaskStatus::Queued;
    case TaskStatus::Paused:
        return to == TaskStatus::Downloading || to == TaskStatus::Completed
            || to == TaskStatus::Error || to == TaskStatus::Queued;
    default:
        return false;
    }
}

bool QRTask::setStatus(TaskStatus status)
{
    if (!canTransition(m_status, status)) {
        return false;
    }
    m_status = status;
    return true;
}

void QRTask::start(const QDateTime &now)
{
    m_startTime = now;
    setStatus(TaskStatus::Downloading);
}

void QRTask::restampStart(const QDateTime &now)
{
    m_startTime = now;
}

void QRTask::updateProgress(qint64 current, qint64 total, const QDateTime &now)
{
    m_bytesTransferred = current;
    m_totalBytes = total;
    m_progress = total > 0 ? static_cast<double>(current) / static_cast<double>(total) * 100.0 : 0.0;

    m_speed = 0.0;
    m_eta = 0.0;
    if (!m_startTime.isValid()) {
        return;
    }

    const double elapsed = m_startTime.msecsTo(now) / 1000.0;
    if (elapsed <= 0.0) {
        return;
    }

    m_speed = static_cast<double>(current) / elapsed;
    if (m_speed > 0.0 && total > current) {
        m_eta = static_cast<double>(total - current) / m_speed;
    }
}

void QRTask::resetProgress()
{
    m_bytesTransferred = 0;
    m_totalBytes = 0;
    m_progress = 0.0;
    m_speed = 0.0;
    m_eta = 0.0;
    m_startTime = QDateTime();
}

void QRTask::setError(RelayError error, const QString &message)
{
    m_lastError = error;
    m_lastErrorMessage = message.isEmpty() ? errorString(error) : message;
}

bool QRTask::isCancelled() const
{
    return m_status == TaskStatus::Cancelled || (m_cancelToken && m_cancelToken->isCancelled());
}

QRTaskSnapshot QRTask::snapshot() const
{
    QRTaskSnapshot s;
    s.userId = m_userId;
    s.chatId = m_chatId;
    s.messageId = m_messageId;
    s.requestMessageId = m_requestMessageId;
    s.status = m_status;
    s.bytesTransferred = m_bytesTransferred;
    s.totalBytes = m_totalBytes;
    s.progress = m_progress;
    s.speed = m_speed;
    s.eta = m_eta;
    s.retryCount = m_retryCount;
    s.output = m_output;
    s.lastError = m_lastError;
    s.lastErrorMessage = m_lastErrorMessage;
    return s;
}

} // namespace QRelay
