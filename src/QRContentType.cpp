// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRContentType.h"

#include <array>

namespace QRelay {

namespace {

constexpr std::array<ContentTypeInfo, 8> kContentTypes = {{
    { ContentType::Text,      "Text",      "text_message", "txt",  false, false },
    { ContentType::Photo,     "Photo",     "photo",        "jpg",  false, true  },
    { ContentType::Video,     "Video",     "video",        "mp4",  true,  true  },
    { ContentType::Audio,     "Audio",     "audio",        "mp3",  true,  true  },
    { ContentType::Voice,     "Voice",     "voice",        "ogg",  false, true  },
    { ContentType::Animation, "Animation", "animation",    "mp4",  false, true  },
    { ContentType::Sticker,   "Sticker",   "sticker",      "webp", false, true  },
    { ContentType::Document,  "Document",  "document",     "bin",  true,  true  },
}};

} // namespace

const ContentTypeInfo &contentTypeInfo(ContentType type) noexcept
{
    return kContentTypes[static_cast<std::size_t>(type)];
}

QString contentTypeName(ContentType type)
{
    return QString::fromLatin1(contentTypeInfo(type).name);
}

std::optional<ContentType> contentTypeFromName(const QString &name)
{
    for (const ContentTypeInfo &info : kContentTypes) {
        if (name.compare(QLatin1String(info.name), Qt::CaseInsensitive) == 0) {
            return info.type;
        }
    }
    return std::nullopt;
}

QString resolveExtension(ContentType type, const MediaHints &hints)
{
    const QString mime = hints.mimeType.toLower();

    switch (type) {
    case ContentType::Video:
        if (mime.contains(QLatin1String("x-matroska"))) {
            return QStringLiteral("mkv");
        }
        if (mime.contains(QLatin1String("webm"))) {
            return QStringLiteral("webm");
        }
        break;
    case ContentType::Audio:
        if (mime.contains(QLatin1String("ogg"))) {
            return QStringLiteral("ogg");
        }
        if (mime.contains(QLatin1String("wav"))) {
            return QStringLiteral("wav");
        }
        break;
    case ContentType::Animation:
        if (mime.contains(QLatin1String("gif"))) {
            return QStringLiteral("gif");
        }
        break;
    case ContentType::Sticker:
        if (hints.animated) {
            return QStringLiteral("tgs");
        }
        if (hints.video) {
            return QStringLiteral("webm");
        }
        break;
    default:
        break;
    }

    return QString::fromLatin1(contentTypeInfo(type).defaultExtension);
}

QString generateFileName(ContentType type,
                         const MediaHints &hints,
                         qint64 requestId,
                         qint64 messageId,
                         qint64 timestamp,
                         const QString &originalName)
{
    const ContentTypeInfo &info = contentTypeInfo(type);
    if (info.isMedia && !originalName.isEmpty()) {
        return originalName;
    }

    return QStringLiteral("%1_%2_%3_%4.%5")
        .arg(QLatin1String(info.filePrefix))
        .arg(requestId)
        .arg(messageId)
        .arg(timestamp)
        .arg(resolveExtension(type, hints));
}

} // namespace QRelay
