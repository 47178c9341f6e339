// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRJSONCHECKPOINTSTORE_H
#define QRJSONCHECKPOINTSTORE_H

#include "QRCheckpointStore.h"
#include <QMutex>

QT_BEGIN_NAMESPACE

namespace QRelay {

/**
 * @brief 磁盘 JSON 检查点存储
 *
 * 每个用户一个 JSON 文件，通过 QSaveFile 原子替换，进程崩溃不会留下半写的文件。
 * 无法解析的文件在列举时跳过并记录日志。
 *
 * @par 目录结构
 * @code
 * <directory>/
 * ├── 123456.json
 * └── 789012.json
 * @endcode
 *
 * @par 使用示例
 * @code
 * auto *store = new QRJsonCheckpointStore("/var/lib/relay/checkpoints");
 * manager->setCheckpointStore(store);
 * @endcode
 */
class QRELAY_EXPORT QRJsonCheckpointStore : public QRCheckpointStore
{
    Q_OBJECT

public:
    /**
     * @brief 构造函数
     * @param directory 检查点目录，为空时使用 AppDataLocation/checkpoints
     * @param parent 父对象
     */
    explicit QRJsonCheckpointStore(const QString &directory = QString(), QObject *parent = nullptr);
    ~QRJsonCheckpointStore() override;

    void setDirectory(const QString &path);
    [[nodiscard]] QString directory() const;

    /**
     * @brief 用户检查点文件路径
     */
    [[nodiscard]] QString filePath(qint64 userId) const;

    // QRCheckpointStore 接口实现
    bool saveCheckpoint(qint64 userId, const QRCheckpoint &checkpoint) override;
    [[nodiscard]] std::optional<QRCheckpoint> loadCheckpoint(qint64 userId) override;
    bool deleteCheckpoint(qint64 userId) override;
    [[nodiscard]] QList<QRCheckpoint> listIncompleteCheckpoints() override;
    [[nodiscard]] QString lastError() const override;

private:
    bool ensureDirectory();
    std::optional<QRCheckpoint> readFile(const QString &path, QString *error) const;
    void setError(const QString &message);

    mutable QMutex m_mutex;
    QString m_directory;
    QString m_lastError;
};

} // namespace QRelay

QT_END_NAMESPACE

#endif // QRJSONCHECKPOINTSTORE_H
