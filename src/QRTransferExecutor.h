// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRTRANSFEREXECUTOR_H
#define QRTRANSFEREXECUTOR_H

#include <QObject>
#include <chrono>
#include <functional>
#include "QRError.h"
#include "QRGlobal.h"
#include "QRSessionProvider.h"
#include "QRTask.h"

namespace QRelay {

/**
 * @brief 单条目传输结果
 */
struct QRELAY_EXPORT QRTransferOutcome {
    enum class Kind {
        Success,            ///< 传输完成
        RateLimited,        ///< 源平台要求等待 waitSeconds 秒
        ExpiredReference,   ///< 文件引用过期
        UserCancelled,      ///< 执行中观察到取消
        ItemFatal           ///< 条目不可恢复的失败
    };

    Kind kind = Kind::Success;
    qint64 bytes = 0;
    int waitSeconds = 0;
    RelayError error = RelayError::NoError;
    QString reason;
    QROutputDescriptor output;

    [[nodiscard]] static QRTransferOutcome success(qint64 bytes = 0,
                                                   const QROutputDescriptor &output = QROutputDescriptor());
    [[nodiscard]] static QRTransferOutcome rateLimited(int waitSeconds);
    [[nodiscard]] static QRTransferOutcome expiredReference();
    [[nodiscard]] static QRTransferOutcome userCancelled();

    /**
     * @brief 条目失败
     * @param error ItemFatal 系列错误码（ItemFiltered、ItemTooLarge 等）
     * @param reason 描述，为空时使用 errorString(error)
     */
    [[nodiscard]] static QRTransferOutcome itemFatal(const QString &reason = QString(),
                                                     RelayError error = RelayError::ItemFatal);

    [[nodiscard]] bool isSuccess() const noexcept { return kind == Kind::Success; }
    [[nodiscard]] bool isTransient() const noexcept {
        return kind == Kind::RateLimited || kind == Kind::ExpiredReference;
    }

    /**
     * @brief 源平台要求的等待时间
     */
    [[nodiscard]] std::chrono::milliseconds mandatedWait() const {
        return std::chrono::seconds(waitSeconds);
    }
};

[[nodiscard]] QRELAY_EXPORT QString outcomeKindName(QRTransferOutcome::Kind kind);

/**
 * @brief 传输执行器接口
 *
 * 负责单个条目的获取与转发。execute() 必须恰好调用一次 done。
 * 长时间传输中应轮询 task->isCancelled()，观察到取消时以 UserCancelled 结束。
 *
 * 执行器通过 reportProgress() 报告字节进度，QRBatchWorker 会把它转发给队列管理器。
 */
class QRELAY_EXPORT QRTransferExecutor : public QObject
{
    Q_OBJECT

public:
    using DoneCallback = std::function<void(const QRTransferOutcome &)>;

    explicit QRTransferExecutor(QObject *parent = nullptr) : QObject(parent) {}
    ~QRTransferExecutor() override = default;

    /**
     * @brief 执行一次传输尝试
     *
     * @param task 当前任务
     * @param session 用户会话
     * @param done 结果回调
     */
    virtual void execute(const QRTaskPtr &task, const QRSessionPtr &session, DoneCallback done) = 0;

signals:
    /**
     * @brief 传输进度
     * @param phase Downloading 或 Uploading
     */
    void progress(qint64 userId, qint64 current, qint64 total, QRelay::TaskStatus phase);

protected:
    void reportProgress(const QRTaskPtr &task, qint64 current, qint64 total,
                        TaskStatus phase = TaskStatus::Downloading);
};

} // namespace QRelay

#endif // QRTRANSFEREXECUTOR_H
