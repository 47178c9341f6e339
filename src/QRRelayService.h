// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRRELAYSERVICE_H
#define QRRELAYSERVICE_H

#include <QHash>
#include <QObject>
#include <memory>
#include <optional>
#include "QRError.h"
#include "QRGlobal.h"
#include "QRProgressReporter.h"
#include "QRQueue.h"
#include "QRQueueManager.h"
#include "QRQueueRegistry.h"
#include "QRRelaySettings.h"

namespace QRelay {

class QRBatchWorker;
class QRCheckpointStore;
class QRLogger;
class QRSessionFactory;
class QRSessionPool;
class QRSessionProvider;
class QRTransferExecutor;

/**
 * @brief 转发服务（顶层上下文）
 *
 * 持有队列注册表、队列管理器和会话池，为命令处理层提供唯一的修改入口。
 * 每个用户同一时刻最多一个 QRBatchWorker。
 *
 * @code
 * QRRelayService service(settings, &executor, &factory, &store, &reporter);
 * service.resumePending();   // 恢复上次未完成的批次
 *
 * RelayError error = service.submitBatch(userId, QRMessageRange(100, 199), chatId, meta);
 * if (error == RelayError::BatchInProgress) {
 *     // 已有批次在处理
 * }
 * @endcode
 */
class QRELAY_EXPORT QRRelayService : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief 使用内部会话池（由 factory 建立会话）
     */
    QRRelayService(const QRRelaySettings &settings,
                   QRTransferExecutor *executor,
                   QRSessionFactory *sessionFactory,
                   QRCheckpointStore *store,
                   QRProgressReporter *reporter,
                   QObject *parent = nullptr);

    /**
     * @brief 使用外部会话提供者（不拥有）
     */
    QRRelayService(const QRRelaySettings &settings,
                   QRTransferExecutor *executor,
                   QRSessionProvider *sessions,
                   QRCheckpointStore *store,
                   QRProgressReporter *reporter,
                   QObject *parent = nullptr);

    ~QRRelayService() override;

    void setLogger(QRLogger *logger);

    /**
     * @brief 提交批次并启动 Worker
     *
     * @return NoError；该用户已有 Worker 在运行时返回 BatchInProgress；
     *         区间被拒绝时返回 InvalidRange 或 BatchTooLarge
     */
    RelayError submitBatch(qint64 userId, const QRMessageRange &range, qint64 destinationChatId,
                           const QRBatchMetadata &metadata = QRBatchMetadata());

    bool pause(qint64 userId);
    bool resume(qint64 userId);
    bool cancel(qint64 userId);

    [[nodiscard]] QRQueueStatus status(qint64 userId) const;

    /**
     * @brief 从检查点恢复批次，为每个恢复的用户启动 Worker
     * @return 恢复的批次数
     */
    int resumePending();

    /**
     * @brief 用户是否有运行中的 Worker
     */
    [[nodiscard]] bool isProcessing(qint64 userId) const;

    [[nodiscard]] int activeWorkerCount() const { return static_cast<int>(m_workers.size()); }
    [[nodiscard]] QRBatchWorker *worker(qint64 userId) const { return m_workers.value(userId, nullptr); }

    [[nodiscard]] QRQueueManager *queueManager() const { return m_manager; }
    [[nodiscard]] QRSessionProvider *sessionProvider() const { return m_sessions; }
    [[nodiscard]] QRSessionPool *sessionPool() const { return m_pool; }
    [[nodiscard]] QRRelaySettings settings() const { return m_settings; }

signals:
    void batchStarted(qint64 userId, bool resumed);
    void batchFinished(qint64 userId, const QRelay::QRBatchSummary &summary);
    void batchAborted(qint64 userId, QRelay::RelayError error, const QString &message);

private:
    void launchWorker(qint64 userId, bool resumed);

    QRRelaySettings m_settings;
    QRQueueRegistry m_registry;
    QRQueueManager *m_manager;
    QRSessionPool *m_pool = nullptr;
    QRSessionProvider *m_sessions;
    QRTransferExecutor *m_executor;
    QRCheckpointStore *m_store;
    QRProgressReporter *m_reporter;
    QRLogger *m_logger = nullptr;
    QHash<qint64, QRBatchWorker *> m_workers;
};

} // namespace QRelay

#endif // QRRELAYSERVICE_H
