// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRJsonCheckpointStore.h"
#include "QRLogger.h"
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QMutexLocker>
#include <QSaveFile>
#include <QStandardPaths>

QT_BEGIN_NAMESPACE

namespace QRelay {

QRJsonCheckpointStore::QRJsonCheckpointStore(const QString &directory, QObject *parent)
    : QRCheckpointStore(parent)
    , m_directory(directory)
{
    if (m_directory.isEmpty()) {
        m_directory = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
                      + QStringLiteral("/checkpoints");
    }
}

QRJsonCheckpointStore::~QRJsonCheckpointStore() = default;

void QRJsonCheckpointStore::setDirectory(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    m_directory = path;
}

QString QRJsonCheckpointStore::directory() const
{
    QMutexLocker locker(&m_mutex);
    return m_directory;
}

QString QRJsonCheckpointStore::filePath(qint64 userId) const
{
    return QDir(m_directory).filePath(QString::number(userId) + QStringLiteral(".json"));
}

bool QRJsonCheckpointStore::ensureDirectory()
{
    QDir dir;
    if (dir.exists(m_directory) || dir.mkpath(m_directory)) {
        return true;
    }
    setError(QStringLiteral("cannot create checkpoint directory %1").arg(m_directory));
    return false;
}

void QRJsonCheckpointStore::setError(const QString &message)
{
    m_lastError = message;
    relayLog(m_logger, RelayLogLevel::Warning, LogCategory::Store, message);
}

std::optional<QRCheckpoint> QRJsonCheckpointStore::readFile(const QString &path, QString *error) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        *error = QStringLiteral("malformed checkpoint %1: %2").arg(path, parseError.errorString());
        return std::nullopt;
    }

    auto checkpoint = QRCheckpoint::fromJson(doc.object());
    if (!checkpoint) {
        *error = QStringLiteral("invalid checkpoint fields in %1").arg(path);
    }
    return checkpoint;
}

bool QRJsonCheckpointStore::saveCheckpoint(qint64 userId, const QRCheckpoint &checkpoint)
{
    QMutexLocker locker(&m_mutex);

    if (!ensureDirectory()) {
        return false;
    }

    const QString path = filePath(userId);
    QRCheckpoint stored = checkpoint;
    stored.userId = userId;

    if (QFile::exists(path)) {
        QString ignored;
        const auto previous = readFile(path, &ignored);
        if (previous && previous->createdAt.isValid()) {
            stored.createdAt = previous->createdAt;
        }
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(QStringLiteral("cannot open %1 for writing: %2").arg(path, file.errorString()));
        return false;
    }

    const QByteArray payload = QJsonDocument(stored.toJson()).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        setError(QStringLiteral("short write to %1: %2").arg(path, file.errorString()));
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        setError(QStringLiteral("cannot commit %1: %2").arg(path, file.errorString()));
        return false;
    }

    m_lastError.clear();
    return true;
}

std::optional<QRCheckpoint> QRJsonCheckpointStore::loadCheckpoint(qint64 userId)
{
    QMutexLocker locker(&m_mutex);

    const QString path = filePath(userId);
    if (!QFile::exists(path)) {
        return std::nullopt;
    }

    QString error;
    auto checkpoint = readFile(path, &error);
    if (!checkpoint) {
        setError(error);
    }
    return checkpoint;
}

bool QRJsonCheckpointStore::deleteCheckpoint(qint64 userId)
{
    QMutexLocker locker(&m_mutex);

    const QString path = filePath(userId);
    if (!QFile::exists(path)) {
        return true;
    }

    QFile file(path);
    if (!file.remove()) {
        setError(QStringLiteral("cannot remove %1: %2").arg(path, file.errorString()));
        return false;
    }
    m_lastError.clear();
    return true;
}

QList<QRCheckpoint> QRJsonCheckpointStore::listIncompleteCheckpoints()
{
    QMutexLocker locker(&m_mutex);

    QList<QRCheckpoint> all;
    QDirIterator it(m_directory, QStringList() << QStringLiteral("*.json"), QDir::Files);
    while (it.hasNext()) {
        const QString path = it.next();

        QString error;
        auto checkpoint = readFile(path, &error);
        if (!checkpoint) {
            relayLog(m_logger, RelayLogLevel::Warning, LogCategory::Store,
                     QStringLiteral("skipping unreadable checkpoint: %1").arg(error));
            continue;
        }
        all.append(*checkpoint);
    }

    return sortedIncomplete(all);
}

QString QRJsonCheckpointStore::lastError() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastError;
}

} // namespace QRelay

QT_END_NAMESPACE
