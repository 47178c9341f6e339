// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRCancelToken.h"
#include <QAtomicInt>

namespace QRelay {

class QRCancelToken::Private
{
public:
    QAtomicInt cancelled{0};
};

QRCancelToken::QRCancelToken(QObject *parent)
    : QObject(parent)
    , d_ptr(std::make_unique<Private>())
{
}

QRCancelToken::~QRCancelToken() = default;

void QRCancelToken::cancel()
{
    if (!d_ptr->cancelled.testAndSetOrdered(0, 1)) {
        return;
    }
    emit cancelled();
}

bool QRCancelToken::isCancelled() const
{
    return d_ptr->cancelled.loadAcquire() != 0;
}

} // namespace QRelay
