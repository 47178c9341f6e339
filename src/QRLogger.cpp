// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRLogger.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QDebug>
#include <QMutex>
#include <QVector>

namespace QRelay {

namespace {

constexpr int kMaxRetainedEntries = 10000;
constexpr qint64 kDefaultMaxFileSize = 10 * 1024 * 1024;

void writeToConsole(RelayLogLevel level, const QString &text)
{
    switch (level) {
    case RelayLogLevel::Debug:
        qDebug().noquote() << text;
        break;
    case RelayLogLevel::Info:
        qInfo().noquote() << text;
        break;
    case RelayLogLevel::Warning:
        qWarning().noquote() << text;
        break;
    case RelayLogLevel::Error:
        qCritical().noquote() << text;
        break;
    }
}

} // namespace

// ============================================================================
// RelayLogEntry
// ============================================================================

QString RelayLogEntry::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("level"), logLevelToString(level));
    obj.insert(QStringLiteral("category"), category);
    obj.insert(QStringLiteral("message"), message);
    obj.insert(QStringLiteral("timestamp"), timestamp.toString(Qt::ISODateWithMs));
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QString RelayLogEntry::toPlainText() const
{
    return QStringLiteral("%1 [%2] %3: %4")
        .arg(timestamp.toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz")),
             logLevelToString(level),
             category,
             message);
}

// ============================================================================
// Utility Functions
// ============================================================================

QString logLevelToString(RelayLogLevel level)
{
    switch (level) {
    case RelayLogLevel::Debug:    return QStringLiteral("DEBUG");
    case RelayLogLevel::Info:     return QStringLiteral("INFO");
    case RelayLogLevel::Warning:  return QStringLiteral("WARN");
    case RelayLogLevel::Error:    return QStringLiteral("ERROR");
    }
    return QStringLiteral("UNKNOWN");
}

RelayLogLevel stringToLogLevel(const QString &str)
{
    const QString upper = str.trimmed().toUpper();
    if (upper == QLatin1String("DEBUG")) return RelayLogLevel::Debug;
    if (upper == QLatin1String("INFO")) return RelayLogLevel::Info;
    if (upper == QLatin1String("WARN") || upper == QLatin1String("WARNING")) return RelayLogLevel::Warning;
    if (upper == QLatin1String("ERROR")) return RelayLogLevel::Error;
    return RelayLogLevel::Info;
}

void relayLog(QRLogger *logger, RelayLogLevel level, const QString &category, const QString &message)
{
    if (logger) {
        logger->log(level, category, message);
        return;
    }
    writeToConsole(level, QStringLiteral("[%1] %2").arg(category, message));
}

// ============================================================================
// QRDefaultLogger::Private
// ============================================================================

class QRDefaultLogger::Private
{
public:
    RelayLogLevel minLevel = RelayLogLevel::Info;
    bool enableConsole = true;
    QString logFile;
    qint64 maxFileSize = kDefaultMaxFileSize;
    int backupCount = 5;
    QString logFormat = QStringLiteral("%{time} [%{level}] %{category}: %{message}");
    std::function<void(const RelayLogEntry &)> customCallback;
    QVector<RelayLogEntry> entries;
    mutable QMutex mutex;

    QString formatLog(const RelayLogEntry &entry) const
    {
        QString result = logFormat;
        result.replace(QLatin1String("%{level}"), logLevelToString(entry.level));
        result.replace(QLatin1String("%{time}"),
                       entry.timestamp.toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz")));
        result.replace(QLatin1String("%{category}"), entry.category);
        result.replace(QLatin1String("%{message}"), entry.message);
        return result;
    }

    void rotate()
    {
        for (int i = backupCount - 1; i > 0; --i) {
            const QString older = QStringLiteral("%1.%2").arg(logFile).arg(i + 1);
            QFile::remove(older);
            QFile::rename(QStringLiteral("%1.%2").arg(logFile).arg(i), older);
        }
        const QString first = logFile + QStringLiteral(".1");
        QFile::remove(first);
        if (backupCount > 0) {
            QFile::rename(logFile, first);
        } else {
            QFile::remove(logFile);
        }
    }

    void writeToFile(const QString &text)
    {
        if (logFile.isEmpty()) {
            return;
        }

        if (maxFileSize > 0 && QFile(logFile).size() > maxFileSize) {
            rotate();
        }

        QFile file(logFile);
        if (!file.open(QIODevice::Append | QIODevice::Text)) {
            qWarning() << "QRDefaultLogger: cannot open log file" << logFile << file.errorString();
            return;
        }
        QTextStream stream(&file);
        stream << text << "\n";
    }
};

// ============================================================================
// QRDefaultLogger
// ============================================================================

QRDefaultLogger::QRDefaultLogger()
    : d_ptr(std::make_unique<Private>())
{
}

QRDefaultLogger::~QRDefaultLogger() = default;

void QRDefaultLogger::enableConsoleOutput(bool enable)
{
    QMutexLocker locker(&d_ptr->mutex);
    d_ptr->enableConsole = enable;
}

void QRDefaultLogger::enableFileOutput(const QString &filePath, qint64 maxSize, int backupCount)
{
    QMutexLocker locker(&d_ptr->mutex);
    d_ptr->logFile = filePath;
    d_ptr->maxFileSize = maxSize > 0 ? maxSize : kDefaultMaxFileSize;
    d_ptr->backupCount = qMax(0, backupCount);
}

void QRDefaultLogger::disableFileOutput()
{
    QMutexLocker locker(&d_ptr->mutex);
    d_ptr->logFile.clear();
}

void QRDefaultLogger::setCustomCallback(std::function<void(const RelayLogEntry &)> callback)
{
    QMutexLocker locker(&d_ptr->mutex);
    d_ptr->customCallback = std::move(callback);
}

void QRDefaultLogger::setLogFormat(const QString &format)
{
    QMutexLocker locker(&d_ptr->mutex);
    d_ptr->logFormat = format;
}

void QRDefaultLogger::log(RelayLogLevel level, const QString &category, const QString &message)
{
    std::function<void(const RelayLogEntry &)> callback;
    RelayLogEntry entry;

    {
        QMutexLocker locker(&d_ptr->mutex);

        if (level < d_ptr->minLevel) {
            return;
        }

        entry.level = level;
        entry.category = category;
        entry.message = message;
        entry.timestamp = QDateTime::currentDateTime();

        d_ptr->entries.append(entry);
        if (d_ptr->entries.size() > kMaxRetainedEntries) {
            d_ptr->entries.removeFirst();
        }

        const QString formatted = d_ptr->formatLog(entry);
        if (d_ptr->enableConsole) {
            writeToConsole(level, formatted);
        }
        d_ptr->writeToFile(formatted);

        callback = d_ptr->customCallback;
    }

    // 回调在锁外执行，允许回调内再次写日志
    if (callback) {
        callback(entry);
    }
}

void QRDefaultLogger::setMinLogLevel(RelayLogLevel level)
{
    QMutexLocker locker(&d_ptr->mutex);
    d_ptr->minLevel = level;
}

RelayLogLevel QRDefaultLogger::minLogLevel() const
{
    QMutexLocker locker(&d_ptr->mutex);
    return d_ptr->minLevel;
}

void QRDefaultLogger::clear()
{
    QMutexLocker locker(&d_ptr->mutex);
    d_ptr->entries.clear();
}

QList<RelayLogEntry> QRDefaultLogger::entries() const
{
    QMutexLocker locker(&d_ptr->mutex);
    return QList<RelayLogEntry>(d_ptr->entries.begin(), d_ptr->entries.end());
}

QList<RelayLogEntry> QRDefaultLogger::entries(const QString &category) const
{
    QMutexLocker locker(&d_ptr->mutex);
    QList<RelayLogEntry> result;
    for (const RelayLogEntry &entry : d_ptr->entries) {
        if (entry.category == category) {
            result.append(entry);
        }
    }
    return result;
}

} // namespace QRelay
