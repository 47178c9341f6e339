// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRCONTENTTYPE_H
#define QRCONTENTTYPE_H

#include <QString>
#include <optional>
#include "QRGlobal.h"

namespace QRelay {

/**
 * @brief 消息内容类型
 *
 * 封闭枚举，每种类型的能力由 contentTypeInfo() 的静态表描述，
 * 调用方据此决定是否需要缩略图、默认扩展名等，而不是比较字符串。
 */
enum class ContentType {
    Text,
    Photo,
    Video,
    Audio,
    Voice,
    Animation,
    Sticker,
    Document
};

/**
 * @brief 内容类型能力表条目
 */
struct ContentTypeInfo {
    ContentType type;
    const char *name;               ///< 显示名（与旧版字符串一致，如 "Video"）
    const char *filePrefix;         ///< 生成文件名时的前缀
    const char *defaultExtension;   ///< 无 MIME 提示时使用的扩展名
    bool hasThumbnail;              ///< 源端可能携带缩略图
    bool isMedia;                   ///< 需要下载/上传文件（Text 为 false）
};

/**
 * @brief 解析扩展名所需的媒体提示
 */
struct MediaHints {
    QString mimeType;
    bool animated = false;   ///< 动态贴纸（.tgs）
    bool video = false;      ///< 视频贴纸（.webm）
};

/**
 * @brief 获取内容类型的能力表条目
 */
[[nodiscard]] QRELAY_EXPORT const ContentTypeInfo &contentTypeInfo(ContentType type) noexcept;

/**
 * @brief 内容类型显示名
 */
[[nodiscard]] QRELAY_EXPORT QString contentTypeName(ContentType type);

/**
 * @brief 从显示名解析内容类型（大小写不敏感）
 * @return 无法识别时返回 std::nullopt
 */
[[nodiscard]] QRELAY_EXPORT std::optional<ContentType> contentTypeFromName(const QString &name);

/**
 * @brief 根据 MIME 提示解析扩展名（不含点）
 *
 * @par 规则
 * - Video: x-matroska → mkv，webm → webm，否则 mp4
 * - Audio: ogg → ogg，wav → wav，否则 mp3
 * - Animation: gif → gif，否则 mp4
 * - Sticker: animated → tgs，video → webm，否则 webp
 * - 其他类型使用默认扩展名
 */
[[nodiscard]] QRELAY_EXPORT QString resolveExtension(ContentType type, const MediaHints &hints = {});

/**
 * @brief 生成输出文件名
 *
 * 媒体类型若带有原始文件名则直接使用，否则生成
 * "<prefix>_<requestId>_<messageId>_<timestamp>.<ext>"。
 *
 * @param type 内容类型
 * @param hints MIME 提示
 * @param requestId 发起请求的命令消息 ID
 * @param messageId 源消息 ID
 * @param timestamp Unix 时间戳（秒）
 * @param originalName 源端文件名，可为空
 */
[[nodiscard]] QRELAY_EXPORT QString generateFileName(ContentType type,
                                                     const MediaHints &hints,
                                                     qint64 requestId,
                                                     qint64 messageId,
                                                     qint64 timestamp,
                                                     const QString &originalName = QString());

} // namespace QRelay

#endif // QRCONTENTTYPE_H
