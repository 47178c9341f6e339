// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRSessionPool.h"
#include "QRLogger.h"
#include <QPointer>

namespace QRelay {

QRSessionPool::QRSessionPool(QRSessionFactory *factory, QObject *parent)
    : QRSessionPool(factory, Options(), parent)
{
}

QRSessionPool::QRSessionPool(QRSessionFactory *factory, const Options &options, QObject *parent)
    : QRSessionProvider(parent)
    , m_factory(factory)
    , m_options(options)
{
}

QRSessionPool::~QRSessionPool() = default;

void QRSessionPool::acquire(qint64 userId, SessionCallback callback)
{
    auto waiting = m_waiters.find(userId);
    if (waiting != m_waiters.end()) {
        waiting->append(std::move(callback));
        return;
    }
    m_waiters.insert(userId, QList<SessionCallback>{std::move(callback)});

    const QRSessionPtr cached = m_sessions.value(userId);
    if (!cached) {
        createSession(userId);
        return;
    }

    if (!m_options.validateOnAcquire || !m_factory) {
        ++m_stats.reused;
        finish(userId, cached);
        return;
    }

    QPointer<QRSessionPool> self(this);
    m_factory->validate(cached, [self, userId, cached](bool valid) {
        if (!self) {
            return;
        }
        if (valid) {
            ++self->m_stats.reused;
            self->finish(userId, cached);
            return;
        }

        relayLog(self->m_logger, RelayLogLevel::Info, LogCategory::Session,
                 QStringLiteral("user %1: cached session is stale, recreating").arg(userId));
        if (self->m_sessions.value(userId) == cached) {
            self->m_sessions.remove(userId);
            ++self->m_stats.invalidated;
            emit self->sessionInvalidated(userId);
        }
        self->createSession(userId);
    });
}

void QRSessionPool::createSession(qint64 userId)
{
    if (!m_factory) {
        ++m_stats.failed;
        finish(userId, QRSessionPtr());
        return;
    }

    QPointer<QRSessionPool> self(this);
    m_factory->create(userId, [self, userId](QRSessionPtr session) {
        if (!self) {
            return;
        }
        if (!session) {
            ++self->m_stats.failed;
            relayLog(self->m_logger, RelayLogLevel::Warning, LogCategory::Session,
                     QStringLiteral("user %1: no usable session").arg(userId));
            self->finish(userId, QRSessionPtr());
            return;
        }

        ++self->m_stats.created;
        self->m_sessions.insert(userId, session);
        relayLog(self->m_logger, RelayLogLevel::Debug, LogCategory::Session,
                 QStringLiteral("user %1: session created").arg(userId));
        emit self->sessionCreated(userId);
        self->finish(userId, session);
    });
}

void QRSessionPool::finish(qint64 userId, const QRSessionPtr &session)
{
    // 先取出等待者，回调中再次 acquire 会开始新一轮
    const QList<SessionCallback> waiters = m_waiters.take(userId);
    for (const SessionCallback &callback : waiters) {
        if (callback) {
            callback(session);
        }
    }
}

void QRSessionPool::invalidate(qint64 userId)
{
    if (m_sessions.remove(userId) > 0) {
        ++m_stats.invalidated;
        relayLog(m_logger, RelayLogLevel::Info, LogCategory::Session,
                 QStringLiteral("user %1: session invalidated").arg(userId));
        emit sessionInvalidated(userId);
    }
}

void QRSessionPool::release(qint64 userId)
{
    if (m_options.releaseOnBatchEnd) {
        m_sessions.remove(userId);
    }
}

void QRSessionPool::clear()
{
    m_sessions.clear();
}

} // namespace QRelay
