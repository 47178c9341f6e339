// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRProgressReporter.h"
#include "QRLogger.h"
#include <cmath>

namespace QRelay {

// ============================================================================
// 格式化工具
// ============================================================================

QString formatBytes(qint64 bytes)
{
    const qint64 KB = 1024;
    const qint64 MB = KB * 1024;
    const qint64 GB = MB * 1024;

    if (bytes >= GB) {
        return QString::number(bytes / static_cast<double>(GB), 'f', 2) + QStringLiteral(" GB");
    } else if (bytes >= MB) {
        return QString::number(bytes / static_cast<double>(MB), 'f', 2) + QStringLiteral(" MB");
    } else if (bytes >= KB) {
        return QString::number(bytes / static_cast<double>(KB), 'f', 2) + QStringLiteral(" KB");
    }
    return QString::number(bytes) + QStringLiteral(" B");
}

QString formatDuration(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0) {
        seconds = 0;
    }
    const qint64 total = static_cast<qint64>(seconds);
    const qint64 h = total / 3600;
    const qint64 m = (total % 3600) / 60;
    const qint64 s = total % 60;

    if (h > 0) {
        return QStringLiteral("%1:%2:%3")
            .arg(h, 2, 10, QLatin1Char('0'))
            .arg(m, 2, 10, QLatin1Char('0'))
            .arg(s, 2, 10, QLatin1Char('0'));
    }
    return QStringLiteral("%1:%2")
        .arg(m, 2, 10, QLatin1Char('0'))
        .arg(s, 2, 10, QLatin1Char('0'));
}

QString progressBar(double percent, int length)
{
    const double clamped = qBound(0.0, percent, 100.0);
    const int filled = static_cast<int>(clamped / 100.0 * length);
    return QString(filled, QChar(0x2593)) + QString(length - filled, QChar(0x2591));
}

// ============================================================================
// QRLogProgressReporter
// ============================================================================

QRLogProgressReporter::QRLogProgressReporter(QRLogger *logger, std::chrono::milliseconds minInterval,
                                             QObject *parent)
    : QRProgressReporter(parent)
    , m_logger(logger)
    , m_minInterval(minInterval)
{
}

QRLogProgressReporter::~QRLogProgressReporter() = default;

QString QRLogProgressReporter::renderProgress(const QRQueueSnapshot &queue, const QRTaskSnapshot &task)
{
    QString line = QStringLiteral("[user %1] %2 %3% | %4/%5 done, %6 failed")
                       .arg(queue.userId)
                       .arg(progressBar(queue.progress))
                       .arg(QString::number(queue.progress, 'f', 1))
                       .arg(queue.completed)
                       .arg(queue.total)
                       .arg(queue.failed);

    line += QStringLiteral(" | msg %1 %2").arg(task.messageId).arg(taskStatusName(task.status));
    if (task.totalBytes > 0) {
        line += QStringLiteral(" %1/%2").arg(formatBytes(task.bytesTransferred), formatBytes(task.totalBytes));
    }
    if (task.speed > 0) {
        line += QStringLiteral(" @ %1/s").arg(formatBytes(static_cast<qint64>(task.speed)));
    }
    if (task.lastError != RelayError::NoError) {
        line += QStringLiteral(" (%1)").arg(task.lastErrorMessage);
    }
    if (queue.eta > 0) {
        line += QStringLiteral(" | ETA %1").arg(formatDuration(queue.eta));
    }
    if (queue.paused) {
        line += QStringLiteral(" | paused");
    }
    return line;
}

QString QRLogProgressReporter::renderSummary(const QRBatchSummary &summary)
{
    QString line = QStringLiteral("[user %1] batch finished: %2 total, %3 ok, %4 failed, "
                                  "%5% success, %6 files/min, elapsed %7")
                       .arg(summary.userId)
                       .arg(summary.total)
                       .arg(summary.succeeded)
                       .arg(summary.failed)
                       .arg(QString::number(summary.successRate, 'f', 1))
                       .arg(QString::number(summary.filesPerMinute, 'f', 1))
                       .arg(formatDuration(summary.elapsedMs / 1000.0));
    if (summary.cancelled) {
        line += QStringLiteral(" (cancelled)");
    }
    if (summary.aborted) {
        line += QStringLiteral(" (aborted: %1)").arg(summary.abortMessage);
    }
    return line;
}

void QRLogProgressReporter::emitLine(qint64 userId, RelayLogLevel level, const QString &line)
{
    ++m_rendered;
    m_lastLines.insert(userId, line);
    relayLog(m_logger, level, LogCategory::Progress, line);
    emit lineRendered(userId, line);
}

void QRLogProgressReporter::report(qint64 userId, const QRQueueSnapshot &queue, const QRTaskSnapshot &task)
{
    QElapsedTimer &last = m_lastReport[userId];
    if (last.isValid() && last.elapsed() < m_minInterval.count()) {
        ++m_suppressed;
        return;
    }
    last.start();
    emitLine(userId, RelayLogLevel::Info, renderProgress(queue, task));
}

void QRLogProgressReporter::reportSummary(qint64 userId, const QRBatchSummary &summary)
{
    m_lastReport.remove(userId);
    emitLine(userId, summary.aborted ? RelayLogLevel::Warning : RelayLogLevel::Info, renderSummary(summary));
}

void QRLogProgressReporter::notify(qint64 userId, const QString &message)
{
    emitLine(userId, RelayLogLevel::Warning, QStringLiteral("[user %1] %2").arg(userId).arg(message));
}

} // namespace QRelay
