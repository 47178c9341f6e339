// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRPROGRESSREPORTER_H
#define QRPROGRESSREPORTER_H

#include <QElapsedTimer>
#include <QHash>
#include <QObject>
#include <chrono>
#include "QRError.h"
#include "QRGlobal.h"
#include "QRQueue.h"
#include "QRTask.h"

namespace QRelay {

class QRLogger;

/**
 * @brief 批次结束摘要
 */
struct QRBatchSummary {
    qint64 userId = 0;
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    qint64 elapsedMs = 0;
    double successRate = 100.0;     ///< 百分比
    double filesPerMinute = 0.0;
    bool cancelled = false;
    bool aborted = false;
    RelayError abortError = RelayError::NoError;
    QString abortMessage;
};

/**
 * @brief 进度报告接口
 *
 * 所有方法都是即发即弃的，实现自行负责限流。
 * 实现抛出的异常会被 QRBatchWorker 捕获并记录，不影响批次。
 */
class QRELAY_EXPORT QRProgressReporter : public QObject
{
    Q_OBJECT

public:
    explicit QRProgressReporter(QObject *parent = nullptr) : QObject(parent) {}
    ~QRProgressReporter() override = default;

    /**
     * @brief 报告一次进度（每个条目结束后调用）
     */
    virtual void report(qint64 userId, const QRQueueSnapshot &queue, const QRTaskSnapshot &task) = 0;

    /**
     * @brief 报告批次摘要
     */
    virtual void reportSummary(qint64 userId, const QRBatchSummary &summary) = 0;

    /**
     * @brief 发送一条通知（例如批次中止的原因）
     */
    virtual void notify(qint64 userId, const QString &message) = 0;
};

/**
 * @brief 通过日志输出进度的报告器
 *
 * 每个事件渲染为一行文本写入 Progress 分类。同一用户的进度报告
 * 间隔不小于 minInterval（默认 3 秒），间隔内的报告被丢弃；
 * 摘要与通知不限流。
 */
class QRELAY_EXPORT QRLogProgressReporter : public QRProgressReporter
{
    Q_OBJECT

public:
    explicit QRLogProgressReporter(QRLogger *logger = nullptr,
                                   std::chrono::milliseconds minInterval = std::chrono::milliseconds(3000),
                                   QObject *parent = nullptr);
    ~QRLogProgressReporter() override;

    void setMinInterval(std::chrono::milliseconds interval) { m_minInterval = interval; }
    [[nodiscard]] std::chrono::milliseconds minInterval() const { return m_minInterval; }

    // QRProgressReporter 接口实现
    void report(qint64 userId, const QRQueueSnapshot &queue, const QRTaskSnapshot &task) override;
    void reportSummary(qint64 userId, const QRBatchSummary &summary) override;
    void notify(qint64 userId, const QString &message) override;

    [[nodiscard]] int renderedCount() const { return m_rendered; }
    [[nodiscard]] int suppressedCount() const { return m_suppressed; }
    [[nodiscard]] QString lastLine(qint64 userId) const { return m_lastLines.value(userId); }

    [[nodiscard]] static QString renderProgress(const QRQueueSnapshot &queue, const QRTaskSnapshot &task);
    [[nodiscard]] static QString renderSummary(const QRBatchSummary &summary);

signals:
    void lineRendered(qint64 userId, const QString &line);

private:
    void emitLine(qint64 userId, RelayLogLevel level, const QString &line);

    QRLogger *m_logger;
    std::chrono::milliseconds m_minInterval;
    QHash<qint64, QElapsedTimer> m_lastReport;
    QHash<qint64, QString> m_lastLines;
    int m_rendered = 0;
    int m_suppressed = 0;
};

/**
 * @brief 格式化字节数（B/KB/MB/GB）
 */
[[nodiscard]] QRELAY_EXPORT QString formatBytes(qint64 bytes);

/**
 * @brief 格式化秒数为 hh:mm:ss 或 mm:ss
 */
[[nodiscard]] QRELAY_EXPORT QString formatDuration(double seconds);

/**
 * @brief 文本进度条
 */
[[nodiscard]] QRELAY_EXPORT QString progressBar(double percent, int length = 20);

} // namespace QRelay

Q_DECLARE_METATYPE(QRelay::QRBatchSummary)

#endif // QRPROGRESSREPORTER_H
