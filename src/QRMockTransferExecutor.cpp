// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRMockTransferExecutor.h"
#include <QTimer>
#include <stdexcept>

namespace QRelay {

QRMockTransferExecutor::QRMockTransferExecutor(QObject *parent)
    : QRTransferExecutor(parent)
    , m_defaultOutcome(QRTransferOutcome::success(1024))
{
}

QRMockTransferExecutor::~QRMockTransferExecutor() = default;

void QRMockTransferExecutor::mockOutcome(qint64 messageId, const QRTransferOutcome &outcome)
{
    m_outcomes.insert(messageId, outcome);
}

void QRMockTransferExecutor::mockSequence(qint64 messageId, const QList<QRTransferOutcome> &outcomes)
{
    m_sequences.insert(messageId, outcomes);
}

void QRMockTransferExecutor::mockException(qint64 messageId, const QString &what)
{
    m_exceptions.insert(messageId, what);
}

void QRMockTransferExecutor::setDefaultOutcome(const QRTransferOutcome &outcome)
{
    m_defaultOutcome = outcome;
}

void QRMockTransferExecutor::setGlobalDelay(int msecs)
{
    m_globalDelay = qMax(0, msecs);
}

int QRMockTransferExecutor::callCount(qint64 messageId) const
{
    return static_cast<int>(m_calls.count(messageId));
}

void QRMockTransferExecutor::clear()
{
    m_outcomes.clear();
    m_sequences.clear();
    m_exceptions.clear();
    m_calls.clear();
    m_sessionNames.clear();
    m_defaultOutcome = QRTransferOutcome::success(1024);
}

QRTransferOutcome QRMockTransferExecutor::nextOutcome(qint64 messageId)
{
    auto seq = m_sequences.find(messageId);
    if (seq != m_sequences.end() && !seq->isEmpty()) {
        return seq->takeFirst();
    }
    return m_outcomes.value(messageId, m_defaultOutcome);
}

void QRMockTransferExecutor::execute(const QRTaskPtr &task, const QRSessionPtr &session, DoneCallback done)
{
    const qint64 messageId = task->messageId();
    m_calls.append(messageId);
    m_sessionNames.append(session ? session->name() : QString());

    if (m_onExecute) {
        m_onExecute(task);
    }

    auto thrown = m_exceptions.constFind(messageId);
    if (thrown != m_exceptions.constEnd()) {
        throw std::runtime_error(thrown->toStdString());
    }

    const QRTransferOutcome outcome = nextOutcome(messageId);
    QTimer::singleShot(m_globalDelay, this, [this, task, outcome, done]() {
        if (task->isCancelled()) {
            done(QRTransferOutcome::userCancelled());
            return;
        }
        if (m_simulateProgress && outcome.isSuccess()) {
            const qint64 total = qMax<qint64>(outcome.bytes, 1);
            reportProgress(task, total / 2, total, TaskStatus::Downloading);
            reportProgress(task, total, total, TaskStatus::Uploading);
        }
        done(outcome);
    });
}

} // namespace QRelay
