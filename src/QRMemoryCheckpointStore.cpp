// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRMemoryCheckpointStore.h"
#include "QRLogger.h"
#include <QMutexLocker>

QT_BEGIN_NAMESPACE

namespace QRelay {

QRMemoryCheckpointStore::QRMemoryCheckpointStore(QObject *parent)
    : QRCheckpointStore(parent)
{
}

QRMemoryCheckpointStore::~QRMemoryCheckpointStore() = default;

bool QRMemoryCheckpointStore::saveCheckpoint(qint64 userId, const QRCheckpoint &checkpoint)
{
    QMutexLocker locker(&m_mutex);

    if (m_failSaves) {
        m_lastError = QStringLiteral("simulated save failure for user %1").arg(userId);
        relayLog(m_logger, RelayLogLevel::Warning, LogCategory::Store, m_lastError);
        return false;
    }

    QRCheckpoint stored = checkpoint;
    stored.userId = userId;
    auto it = m_checkpoints.constFind(userId);
    if (it != m_checkpoints.constEnd() && it->createdAt.isValid()) {
        stored.createdAt = it->createdAt;
    }

    m_checkpoints.insert(userId, stored);
    ++m_saveCount;
    m_lastError.clear();
    return true;
}

std::optional<QRCheckpoint> QRMemoryCheckpointStore::loadCheckpoint(qint64 userId)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_checkpoints.constFind(userId);
    if (it == m_checkpoints.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

bool QRMemoryCheckpointStore::deleteCheckpoint(qint64 userId)
{
    QMutexLocker locker(&m_mutex);

    if (m_failDeletes) {
        m_lastError = QStringLiteral("simulated delete failure for user %1").arg(userId);
        relayLog(m_logger, RelayLogLevel::Warning, LogCategory::Store, m_lastError);
        return false;
    }

    if (m_checkpoints.remove(userId) > 0) {
        ++m_deleteCount;
    }
    m_lastError.clear();
    return true;
}

QList<QRCheckpoint> QRMemoryCheckpointStore::listIncompleteCheckpoints()
{
    QMutexLocker locker(&m_mutex);
    return sortedIncomplete(m_checkpoints.values());
}

QString QRMemoryCheckpointStore::lastError() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastError;
}

void QRMemoryCheckpointStore::setFailSaves(bool fail)
{
    QMutexLocker locker(&m_mutex);
    m_failSaves = fail;
}

void QRMemoryCheckpointStore::setFailDeletes(bool fail)
{
    QMutexLocker locker(&m_mutex);
    m_failDeletes = fail;
}

int QRMemoryCheckpointStore::saveCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_saveCount;
}

int QRMemoryCheckpointStore::deleteCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_deleteCount;
}

int QRMemoryCheckpointStore::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_checkpoints.size());
}

void QRMemoryCheckpointStore::clear()
{
    QMutexLocker locker(&m_mutex);
    m_checkpoints.clear();
    m_saveCount = 0;
    m_deleteCount = 0;
    m_lastError.clear();
}

} // namespace QRelay

QT_END_NAMESPACE
