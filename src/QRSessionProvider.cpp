// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRSessionProvider.h"

namespace QRelay {

QRSession::QRSession(qint64 userId, const QString &name)
    : m_userId(userId)
    , m_name(name)
    , m_createdAt(QDateTime::currentDateTimeUtc())
{
}

QRSession::~QRSession() = default;

} // namespace QRelay
