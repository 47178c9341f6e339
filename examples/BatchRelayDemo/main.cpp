// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

/**
 * @file main.cpp
 * @brief 批次转发演示程序
 *
 * 用 mock 执行器跑一个完整的批次：
 * 1. 从环境变量读取配置（RELAY_*）
 * 2. 恢复上次中断的批次（检查点保存在 JSON 目录）
 * 3. 提交新批次，其中一条触发限流、一条不可恢复
 * 4. 打印进度与批次摘要
 *
 * 用法: BatchRelayDemo [fromId toId]
 * 中途 Ctrl+C 退出后再次运行，会从检查点继续。
 */

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QTimer>

#include "QRJsonCheckpointStore.h"
#include "QRLogger.h"
#include "QRMockTransferExecutor.h"
#include "QRProgressReporter.h"
#include "QRRelayService.h"
#include "QRSessionPool.h"

using namespace QRelay;

/**
 * @brief 演示用会话工厂，模拟 200ms 的登录耗时
 */
class DemoSessionFactory : public QObject, public QRSessionFactory
{
public:
    void create(qint64 userId, std::function<void(QRSessionPtr)> callback) override
    {
        qDebug() << "登录用户" << userId << "...";
        QTimer::singleShot(200, this, [userId, callback]() {
            callback(QRSessionPtr::create(userId, QStringLiteral("demo-session-%1").arg(userId)));
        });
    }

    void validate(const QRSessionPtr &session, std::function<void(bool)> callback) override
    {
        callback(!session.isNull());
    }
};

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("BatchRelayDemo"));

    qint64 fromId = 1;
    qint64 toId = 12;
    const QStringList args = app.arguments();
    if (args.size() >= 3) {
        fromId = args.at(1).toLongLong();
        toId = args.at(2).toLongLong();
    }

    QRRelaySettings settings = QRRelaySettings::fromEnvironment();
    if (!qEnvironmentVariableIsSet("RELAY_WAITING_TIME")) {
        settings.interTaskDelay = std::chrono::milliseconds(300);
    }
    settings.checkpointDebounce = std::chrono::milliseconds(500);
    settings.retryPolicy.rateLimitPadding = std::chrono::milliseconds(500);
    if (settings.checkpointDirectory.isEmpty()) {
        settings.checkpointDirectory = QDir::temp().filePath(QStringLiteral("qrelay-demo"));
    }

    QRDefaultLogger logger;
    logger.setMinLogLevel(settings.logLevel);
    if (!settings.logFile.isEmpty()) {
        logger.enableFileOutput(settings.logFile);
    }

    QRJsonCheckpointStore store(settings.checkpointDirectory);
    DemoSessionFactory factory;

    QRMockTransferExecutor executor;
    executor.setGlobalDelay(150);
    executor.setSimulateProgress(true);
    executor.setDefaultOutcome(QRTransferOutcome::success(3 * 1024 * 1024));
    // 第 3 条先被限流 1 秒，第 5 条源消息不存在
    executor.mockSequence(fromId + 2, {QRTransferOutcome::rateLimited(1), QRTransferOutcome::success(1024)});
    executor.mockOutcome(fromId + 4, QRTransferOutcome::itemFatal(QStringLiteral("message is empty"),
                                                                  RelayError::ItemNotFound));

    QRLogProgressReporter reporter(&logger, settings.progressInterval);

    QRRelayService service(settings, &executor, &factory, &store, &reporter);
    service.setLogger(&logger);

    const qint64 userId = 1000;
    int running = 0;

    QObject::connect(&service, &QRRelayService::batchStarted, [&running](qint64 user, bool resumed) {
        ++running;
        qDebug() << "批次开始: 用户" << user << (resumed ? "(从检查点恢复)" : "");
    });
    QObject::connect(&service, &QRRelayService::batchFinished,
                     [&running, &app](qint64 user, const QRBatchSummary &summary) {
        qDebug().noquote() << QRLogProgressReporter::renderSummary(summary);
        qDebug() << "用户" << user << "的批次结束";
        if (--running == 0) {
            QTimer::singleShot(0, &app, &QCoreApplication::quit);
        }
    });

    QTimer::singleShot(0, [&]() {
        qDebug() << "检查点目录:" << settings.checkpointDirectory;

        const int resumed = service.resumePending();
        if (resumed > 0) {
            qDebug() << "恢复了" << resumed << "个未完成的批次";
            return;
        }

        QRBatchMetadata meta;
        meta.sourceType = SourceType::Public;
        meta.sourceId = QStringLiteral("demo_channel");
        meta.link = QStringLiteral("https://t.me/demo_channel/%1-%2").arg(fromId).arg(toId);

        const RelayError error = service.submitBatch(userId, QRMessageRange(fromId, toId), 42, meta);
        if (error != RelayError::NoError) {
            qWarning() << "提交失败:" << errorString(error);
            app.exit(1);
        }
    });

    return app.exec();
}
