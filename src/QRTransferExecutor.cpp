// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRTransferExecutor.h"

namespace QRelay {

QRTransferOutcome QRTransferOutcome::success(qint64 bytes, const QROutputDescriptor &output)
{
    QRTransferOutcome outcome;
    outcome.kind = Kind::Success;
    outcome.bytes = bytes;
    outcome.output = output;
    return outcome;
}

QRTransferOutcome QRTransferOutcome::rateLimited(int waitSeconds)
{
    QRTransferOutcome outcome;
    outcome.kind = Kind::RateLimited;
    outcome.waitSeconds = qMax(0, waitSeconds);
    outcome.error = RelayError::RateLimited;
    outcome.reason = QStringLiteral("flood wait %1s").arg(outcome.waitSeconds);
    return outcome;
}

QRTransferOutcome QRTransferOutcome::expiredReference()
{
    QRTransferOutcome outcome;
    outcome.kind = Kind::ExpiredReference;
    outcome.error = RelayError::ExpiredReference;
    outcome.reason = errorString(RelayError::ExpiredReference);
    return outcome;
}

QRTransferOutcome QRTransferOutcome::userCancelled()
{
    QRTransferOutcome outcome;
    outcome.kind = Kind::UserCancelled;
    outcome.error = RelayError::UserCancelled;
    outcome.reason = errorString(RelayError::UserCancelled);
    return outcome;
}

QRTransferOutcome QRTransferOutcome::itemFatal(const QString &reason, RelayError error)
{
    QRTransferOutcome outcome;
    outcome.kind = Kind::ItemFatal;
    outcome.error = isItemFatal(error) ? error : RelayError::ItemFatal;
    outcome.reason = reason.isEmpty() ? errorString(outcome.error) : reason;
    return outcome;
}

QString outcomeKindName(QRTransferOutcome::Kind kind)
{
    switch (kind) {
    case QRTransferOutcome::Kind::Success:          return QStringLiteral("Success");
    case QRTransferOutcome::Kind::RateLimited:      return QStringLiteral("RateLimited");
    case QRTransferOutcome::Kind::ExpiredReference: return QStringLiteral("ExpiredReference");
    case QRTransferOutcome::Kind::UserCancelled:    return QStringLiteral("UserCancelled");
    case QRTransferOutcome::Kind::ItemFatal:        return QStringLiteral("ItemFatal");
    }
    return QStringLiteral("Unknown");
}

void QRTransferExecutor::reportProgress(const QRTaskPtr &task, qint64 current, qint64 total,
                                        TaskStatus phase)
{
    if (task) {
        emit progress(task->userId(), current, total, phase);
    }
}

} // namespace QRelay
