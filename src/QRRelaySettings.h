// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRRELAYSETTINGS_H
#define QRRELAYSETTINGS_H

#include <chrono>
#include <QString>
#include "QRGlobal.h"
#include "QRLogger.h"
#include "QRRetryPolicy.h"

namespace QRelay {

/**
 * @brief 转发流水线配置
 *
 * 所有时间间隔均为毫秒精度，测试中可以设置为毫秒级以加快运行。
 *
 * @code
 * QRRelaySettings settings = QRRelaySettings::fromEnvironment();
 * if (!settings.isValid()) {
 *     qFatal("invalid relay settings");
 * }
 * QRRelayService service(settings, &executor, &sessions, &store, &reporter);
 * @endcode
 *
 * @par 环境变量
 * | 变量 | 字段 | 单位 |
 * |---|---|---|
 * | RELAY_WAITING_TIME | interTaskDelay | 秒 |
 * | RELAY_PAUSE_POLL_MS | pausePollInterval | 毫秒 |
 * | RELAY_CHECKPOINT_DEBOUNCE_MS | checkpointDebounce | 毫秒 |
 * | RELAY_CHECKPOINT_FLUSH_EVERY | checkpointFlushEvery | 次 |
 * | RELAY_MAX_BATCH_SIZE | maxBatchSize | 条 |
 * | RELAY_MAX_RETRIES | retryPolicy.maxRetries | 次 |
 * | RELAY_PROGRESS_INTERVAL_MS | progressInterval | 毫秒 |
 * | RELAY_CHECKPOINT_DIR | checkpointDirectory | 路径 |
 * | RELAY_LOG_LEVEL | logLevel | DEBUG/INFO/WARN/ERROR |
 * | RELAY_LOG_FILE | logFile | 路径 |
 */
class QRELAY_EXPORT QRRelaySettings
{
public:
    /**
     * @brief 两个条目之间的等待时间
     *
     * @note 默认值：2 秒
     */
    std::chrono::milliseconds interTaskDelay{2000};

    /**
     * @brief 队列暂停时的轮询间隔
     */
    std::chrono::milliseconds pausePollInterval{2000};

    /**
     * @brief 检查点写入的合并窗口
     *
     * 窗口内的多次完成只触发一次写入。
     */
    std::chrono::milliseconds checkpointDebounce{2000};

    /**
     * @brief 每完成 N 个条目立即写一次检查点
     *
     * 0 表示关闭，只依赖合并窗口。
     */
    int checkpointFlushEvery = 0;

    /**
     * @brief 单个批次允许的最大条目数，超出的批次被拒绝
     */
    int maxBatchSize = 10000;

    /**
     * @brief 单条目重试策略
     */
    QRRetryPolicy retryPolicy = QRRetryPolicy::standardRetry();

    /**
     * @brief 进度报告的最小间隔（每个用户）
     */
    std::chrono::milliseconds progressInterval{3000};

    /**
     * @brief 检查点目录，为空时使用 AppDataLocation/checkpoints
     */
    QString checkpointDirectory;

    RelayLogLevel logLevel = RelayLogLevel::Info;

    /**
     * @brief 日志文件路径，为空时只输出到控制台
     */
    QString logFile;

    QRRelaySettings() = default;

    /**
     * @brief 检查配置是否有效
     *
     * 时间间隔不能为负，批次上限必须为正，重试次数不能为负。
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief 从环境变量读取，格式错误的值回退到默认值
     */
    [[nodiscard]] static QRRelaySettings fromEnvironment();

    /**
     * @brief 所有等待为 0 的配置，用于测试和演示
     */
    [[nodiscard]] static QRRelaySettings immediate();
};

} // namespace QRelay

#endif // QRRELAYSETTINGS_H
