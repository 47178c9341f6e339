// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRError.h"

QT_BEGIN_NAMESPACE

namespace QRelay {

QString errorString(RelayError error)
{
    switch (error) {
    case RelayError::NoError:
        return QStringLiteral("无错误");
    case RelayError::RateLimited:
        return QStringLiteral("触发源平台限流");
    case RelayError::ExpiredReference:
        return QStringLiteral("文件引用已过期");
    case RelayError::UserCancelled:
        return QStringLiteral("用户已取消");
    case RelayError::ItemFatal:
        return QStringLiteral("条目传输失败");
    case RelayError::ItemFiltered:
        return QStringLiteral("条目被类型过滤");
    case RelayError::ItemTooLarge:
        return QStringLiteral("文件过大");
    case RelayError::ItemNotFound:
        return QStringLiteral("源消息不存在");
    case RelayError::SessionUnavailable:
        return QStringLiteral("无法建立会话");
    case RelayError::StoreUnavailable:
        return QStringLiteral("存储不可用");
    case RelayError::BatchTooLarge:
        return QStringLiteral("批次过大");
    case RelayError::InvalidRange:
        return QStringLiteral("无效的消息范围");
    case RelayError::BatchInProgress:
        return QStringLiteral("已有批次正在处理");
    case RelayError::Unknown:
        return QStringLiteral("未知错误");
    }
    return QStringLiteral("未知错误 (%1)").arg(static_cast<int>(error));
}

bool isTransient(RelayError error) noexcept
{
    return error == RelayError::RateLimited
        || error == RelayError::ExpiredReference;
}

bool isItemFatal(RelayError error) noexcept
{
    const int code = static_cast<int>(error);
    return code >= 100 && code < 200;
}

bool isSystemFatal(RelayError error) noexcept
{
    const int code = static_cast<int>(error);
    return code >= 200 && code < 300;
}

} // namespace QRelay
QT_END_NAMESPACE
