// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRRelaySettings.h"
#include <QtGlobal>

#include <limits>

namespace QRelay {

namespace {

qint64 envInteger(const char *name, qint64 fallback)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return fallback;
    }
    bool ok = false;
    const qint64 value = qEnvironmentVariable(name).trimmed().toLongLong(&ok);
    return ok ? value : fallback;
}

// QTimer 与计数字段都是 int，超出范围的值按格式错误处理
constexpr qint64 kIntMax = std::numeric_limits<int>::max();

int envInt(const char *name, int fallback)
{
    const qint64 value = envInteger(name, fallback);
    return value > kIntMax || value < -kIntMax ? fallback : static_cast<int>(value);
}

std::chrono::milliseconds envMillis(const char *name, std::chrono::milliseconds fallback)
{
    const qint64 value = envInteger(name, fallback.count());
    return value > kIntMax ? fallback : std::chrono::milliseconds(value);
}

} // namespace

bool QRRelaySettings::isValid() const
{
    using std::chrono::milliseconds;
    return interTaskDelay >= milliseconds(0)
        && pausePollInterval >= milliseconds(0)
        && checkpointDebounce >= milliseconds(0)
        && progressInterval >= milliseconds(0)
        && checkpointFlushEvery >= 0
        && maxBatchSize > 0
        && retryPolicy.maxRetries >= 0;
}

QRRelaySettings QRRelaySettings::fromEnvironment()
{
    QRRelaySettings settings;

    // RELAY_WAITING_TIME 以秒为单位
    const qint64 waitSeconds = envInteger("RELAY_WAITING_TIME", -1);
    if (waitSeconds >= 0 && waitSeconds <= kIntMax / 1000) {
        settings.interTaskDelay = std::chrono::seconds(waitSeconds);
    }

    settings.pausePollInterval = envMillis("RELAY_PAUSE_POLL_MS", settings.pausePollInterval);
    settings.checkpointDebounce = envMillis("RELAY_CHECKPOINT_DEBOUNCE_MS", settings.checkpointDebounce);
    settings.checkpointFlushEvery = envInt("RELAY_CHECKPOINT_FLUSH_EVERY", settings.checkpointFlushEvery);
    settings.maxBatchSize = envInt("RELAY_MAX_BATCH_SIZE", settings.maxBatchSize);
    settings.retryPolicy.maxRetries = envInt("RELAY_MAX_RETRIES", settings.retryPolicy.maxRetries);
    settings.progressInterval = envMillis("RELAY_PROGRESS_INTERVAL_MS", settings.progressInterval);

    if (qEnvironmentVariableIsSet("RELAY_CHECKPOINT_DIR")) {
        settings.checkpointDirectory = qEnvironmentVariable("RELAY_CHECKPOINT_DIR");
    }
    if (qEnvironmentVariableIsSet("RELAY_LOG_LEVEL")) {
        settings.logLevel = stringToLogLevel(qEnvironmentVariable("RELAY_LOG_LEVEL"));
    }
    if (qEnvironmentVariableIsSet("RELAY_LOG_FILE")) {
        settings.logFile = qEnvironmentVariable("RELAY_LOG_FILE");
    }

    // 超出范围的值同样回退到默认值
    const QRRelaySettings defaults;
    if (settings.pausePollInterval.count() < 0) settings.pausePollInterval = defaults.pausePollInterval;
    if (settings.checkpointDebounce.count() < 0) settings.checkpointDebounce = defaults.checkpointDebounce;
    if (settings.checkpointFlushEvery < 0) settings.checkpointFlushEvery = defaults.checkpointFlushEvery;
    if (settings.maxBatchSize <= 0) settings.maxBatchSize = defaults.maxBatchSize;
    if (settings.retryPolicy.maxRetries < 0) settings.retryPolicy.maxRetries = defaults.retryPolicy.maxRetries;
    if (settings.progressInterval.count() < 0) settings.progressInterval = defaults.progressInterval;

    return settings;
}

QRRelaySettings QRRelaySettings::immediate()
{
    QRRelaySettings settings;
    settings.interTaskDelay = std::chrono::milliseconds(0);
    settings.pausePollInterval = std::chrono::milliseconds(10);
    settings.checkpointDebounce = std::chrono::milliseconds(0);
    settings.progressInterval = std::chrono::milliseconds(0);
    settings.retryPolicy.initialDelay = std::chrono::milliseconds(0);
    settings.retryPolicy.maxDelay = std::chrono::milliseconds(0);
    settings.retryPolicy.rateLimitPadding = std::chrono::milliseconds(0);
    settings.retryPolicy.maxMandatedWait = std::chrono::milliseconds(0);
    return settings;
}

} // namespace QRelay
