// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRCheckpoint.h"

namespace QRelay {

namespace {

QString timeToString(const QDateTime &time)
{
    return time.isValid() ? time.toString(Qt::ISODateWithMs) : QString();
}

QDateTime timeFromJson(const QJsonObject &json, const QString &key)
{
    return QDateTime::fromString(json.value(key).toString(), Qt::ISODateWithMs);
}

} // namespace

QRCheckpoint QRCheckpoint::fromQueue(const QRQueue &queue, const QDateTime &now)
{
    QRCheckpoint cp;
    cp.userId = queue.userId();
    cp.total = queue.total();
    cp.completed = queue.completed();
    cp.failed = queue.failed();
    cp.paused = queue.isPaused();
    cp.progress = queue.batchProgress();
    cp.metadata = queue.metadata();
    cp.batchStartTime = queue.batchStartTime();
    cp.createdAt = now;
    cp.updatedAt = now;
    return cp;
}

QJsonObject QRCheckpoint::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("user_id"), userId);
    obj.insert(QStringLiteral("total"), total);
    obj.insert(QStringLiteral("completed"), completed);
    obj.insert(QStringLiteral("failed"), failed);
    obj.insert(QStringLiteral("paused"), paused);
    obj.insert(QStringLiteral("progress"), progress);
    obj.insert(QStringLiteral("metadata"), metadata.toJson());
    obj.insert(QStringLiteral("batch_start_time"), timeToString(batchStartTime));
    obj.insert(QStringLiteral("created_at"), timeToString(createdAt));
    obj.insert(QStringLiteral("updated_at"), timeToString(updatedAt));
    return obj;
}

std::optional<QRCheckpoint> QRCheckpoint::fromJson(const QJsonObject &json)
{
    if (!json.contains(QStringLiteral("user_id"))) {
        return std::nullopt;
    }

    QRCheckpoint cp;
    cp.userId = json.value(QStringLiteral("user_id")).toInteger();
    cp.total = json.value(QStringLiteral("total")).toInt();
    cp.completed = json.value(QStringLiteral("completed")).toInt();
    cp.failed = json.value(QStringLiteral("failed")).toInt();
    cp.paused = json.value(QStringLiteral("paused")).toBool();
    cp.progress = json.value(QStringLiteral("progress")).toDouble();
    cp.metadata = QRBatchMetadata::fromJson(json.value(QStringLiteral("metadata")).toObject());
    cp.batchStartTime = timeFromJson(json, QStringLiteral("batch_start_time"));
    cp.createdAt = timeFromJson(json, QStringLiteral("created_at"));
    cp.updatedAt = timeFromJson(json, QStringLiteral("updated_at"));

    if (cp.total < 0 || cp.completed < 0 || cp.failed < 0 || cp.failed > cp.completed) {
        return std::nullopt;
    }
    return cp;
}

} // namespace QRelay
