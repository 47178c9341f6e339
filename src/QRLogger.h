// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRLOGGER_H
#define QRLOGGER_H

#include <QString>
#include <QDateTime>
#include <QList>
#include <functional>
#include <memory>
#include "QRGlobal.h"

namespace QRelay {

/**
 * @brief 日志级别
 */
enum class RelayLogLevel {
    Debug,      ///< 调试日志
    Info,       ///< 信息日志
    Warning,    ///< 警告日志
    Error       ///< 错误日志
};

/**
 * @brief 日志分类
 */
namespace LogCategory {
inline const QString Queue    = QStringLiteral("Queue");
inline const QString Worker   = QStringLiteral("Worker");
inline const QString Session  = QStringLiteral("Session");
inline const QString Store    = QStringLiteral("Store");
inline const QString Recovery = QStringLiteral("Recovery");
inline const QString Progress = QStringLiteral("Progress");
inline const QString Service  = QStringLiteral("Service");
} // namespace LogCategory

/**
 * @brief 日志记录结构体
 */
struct RelayLogEntry {
    RelayLogLevel level = RelayLogLevel::Info;  ///< 日志级别
    QString category;                           ///< 日志分类（如 "Queue", "Worker"）
    QString message;                            ///< 日志消息
    QDateTime timestamp;                        ///< 时间戳

    /**
     * @brief 将日志转换为单行 JSON
     */
    [[nodiscard]] QString toJson() const;

    /**
     * @brief 将日志转换为纯文本格式
     */
    [[nodiscard]] QString toPlainText() const;
};

/**
 * @brief 日志抽象基类
 *
 * 所有组件通过 setLogger() 接收一个非拥有的 QRLogger 指针；
 * 未设置时回退到 Qt 的 qDebug/qWarning。
 *
 * @code
 * auto *logger = new QRDefaultLogger();
 * logger->setMinLogLevel(RelayLogLevel::Info);
 * logger->enableFileOutput("/var/log/relay.log");
 * manager->setLogger(logger);
 * @endcode
 */
class QRELAY_EXPORT QRLogger
{
public:
    virtual ~QRLogger() = default;

    /**
     * @brief 记录日志
     * @param level 日志级别
     * @param category 日志分类
     * @param message 日志消息
     */
    virtual void log(RelayLogLevel level, const QString &category, const QString &message) = 0;

    /**
     * @brief 记录日志条目
     */
    virtual void logEntry(const RelayLogEntry &entry) {
        log(entry.level, entry.category, entry.message);
    }

    /**
     * @brief 设置最小日志级别（低于此级别的日志将被忽略）
     */
    virtual void setMinLogLevel(RelayLogLevel level) = 0;

    virtual RelayLogLevel minLogLevel() const = 0;

    /**
     * @brief 清空已保留的日志
     */
    virtual void clear() {}
};

/**
 * @brief 默认的日志实现
 *
 * 支持控制台输出（qDebug/qInfo/qWarning/qCritical）、
 * 按大小轮转的文件输出和自定义回调。
 * 最近 10000 条日志保留在内存中，便于测试与诊断。
 */
class QRELAY_EXPORT QRDefaultLogger : public QRLogger
{
public:
    QRDefaultLogger();
    ~QRDefaultLogger() override;

    void enableConsoleOutput(bool enable = true);

    /**
     * @brief 启用文件输出
     * @param filePath 日志文件路径
     * @param maxSize 单个日志文件的最大大小（字节），0 表示使用默认 10MB
     * @param backupCount 保留的旧日志文件数量
     */
    void enableFileOutput(const QString &filePath, qint64 maxSize = 0, int backupCount = 5);

    void disableFileOutput();

    /**
     * @brief 设置自定义日志回调
     */
    void setCustomCallback(std::function<void(const RelayLogEntry &)> callback);

    /**
     * @brief 设置日志格式
     *
     * 支持占位符 %{time}、%{level}、%{category}、%{message}。
     * 默认格式："%{time} [%{level}] %{category}: %{message}"
     */
    void setLogFormat(const QString &format);

    // QRLogger interface
    void log(RelayLogLevel level, const QString &category, const QString &message) override;
    void setMinLogLevel(RelayLogLevel level) override;
    RelayLogLevel minLogLevel() const override;
    void clear() override;

    /**
     * @brief 获取保留的日志条目
     */
    [[nodiscard]] QList<RelayLogEntry> entries() const;

    /**
     * @brief 按分类筛选日志条目
     */
    [[nodiscard]] QList<RelayLogEntry> entries(const QString &category) const;

private:
    class Private;
    std::unique_ptr<Private> d_ptr;
};

/**
 * @brief 日志级别转字符串
 */
QRELAY_EXPORT QString logLevelToString(RelayLogLevel level);

/**
 * @brief 字符串转日志级别（大小写不敏感，无法识别时返回 Info）
 */
QRELAY_EXPORT RelayLogLevel stringToLogLevel(const QString &str);

/**
 * @brief 写日志的统一入口
 *
 * logger 为空时回退到 Qt 消息处理器。
 */
QRELAY_EXPORT void relayLog(QRLogger *logger, RelayLogLevel level,
                            const QString &category, const QString &message);

} // namespace QRelay

#endif // QRLOGGER_H
