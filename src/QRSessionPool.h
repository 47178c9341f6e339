// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRSESSIONPOOL_H
#define QRSESSIONPOOL_H

#include <QHash>
#include <QList>
#include "QRSessionProvider.h"

namespace QRelay {

class QRLogger;

/**
 * @brief 会话工厂接口
 *
 * 负责真正的登录握手和有效性检查。两个方法都以回调返回结果，
 * 回调可以同步调用。
 */
class QRELAY_EXPORT QRSessionFactory
{
public:
    virtual ~QRSessionFactory() = default;

    /**
     * @brief 为用户建立新会话，失败时回调空指针
     */
    virtual void create(qint64 userId, std::function<void(QRSessionPtr)> callback) = 0;

    /**
     * @brief 检查缓存的会话是否仍然可用
     */
    virtual void validate(const QRSessionPtr &session, std::function<void(bool)> callback) = 0;
};

/**
 * @brief 会话池统计信息
 */
struct QRSessionPoolStatistics {
    int created = 0;        ///< 新建的会话数
    int reused = 0;         ///< 复用缓存会话的次数
    int invalidated = 0;    ///< 被丢弃的会话数（失效或显式 invalidate）
    int failed = 0;         ///< 创建失败的次数
};

/**
 * @brief 带缓存的会话提供者
 *
 * 每个用户缓存一个会话，每次 acquire 时惰性校验：失效的会话被丢弃并透明重建。
 *
 * 同一用户的创建或校验正在进行时，后续的 acquire 排队等待，
 * 并以同一个结果回调，因此两个几乎同时的请求不会握手两次。
 *
 * @code
 * QRSessionPool pool(&factory);
 * pool.acquire(userId, [](QRSessionPtr session) {
 *     if (!session) {
 *         // 没有可用凭据
 *     }
 * });
 * @endcode
 */
class QRELAY_EXPORT QRSessionPool : public QRSessionProvider
{
    Q_OBJECT

public:
    /**
     * @brief 会话池选项
     */
    struct Options {
        /// 批次结束时丢弃缓存的会话（每次批次都重新登录）
        bool releaseOnBatchEnd = false;

        /// acquire 时校验缓存的会话
        bool validateOnAcquire = true;
    };

    explicit QRSessionPool(QRSessionFactory *factory, QObject *parent = nullptr);
    QRSessionPool(QRSessionFactory *factory, const Options &options, QObject *parent = nullptr);
    ~QRSessionPool() override;

    void setOptions(const Options &options) { m_options = options; }
    [[nodiscard]] Options options() const { return m_options; }

    void setLogger(QRLogger *logger) { m_logger = logger; }

    // QRSessionProvider 接口实现
    void acquire(qint64 userId, SessionCallback callback) override;
    void invalidate(qint64 userId) override;
    void release(qint64 userId) override;

    [[nodiscard]] bool hasSession(qint64 userId) const { return m_sessions.contains(userId); }

    /**
     * @brief 用户是否有进行中的创建或校验
     */
    [[nodiscard]] bool isPending(qint64 userId) const { return m_waiters.contains(userId); }

    [[nodiscard]] int sessionCount() const { return static_cast<int>(m_sessions.size()); }
    [[nodiscard]] QRSessionPoolStatistics statistics() const { return m_stats; }

    /**
     * @brief 丢弃所有缓存的会话
     */
    void clear();

signals:
    void sessionCreated(qint64 userId);
    void sessionInvalidated(qint64 userId);

private:
    void createSession(qint64 userId);
    void finish(qint64 userId, const QRSessionPtr &session);

    QRSessionFactory *m_factory;
    Options m_options;
    QRLogger *m_logger = nullptr;
    QHash<qint64, QRSessionPtr> m_sessions;
    QHash<qint64, QList<SessionCallback>> m_waiters;   ///< 进行中的用户及其等待者
    QRSessionPoolStatistics m_stats;
};

} // namespace QRelay

#endif // QRSESSIONPOOL_H
