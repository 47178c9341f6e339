// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRCheckpointStore.h"
#include <algorithm>

QT_BEGIN_NAMESPACE

namespace QRelay {

QList<QRCheckpoint> QRCheckpointStore::sortedIncomplete(const QList<QRCheckpoint> &all)
{
    QList<QRCheckpoint> result;
    for (const QRCheckpoint &cp : all) {
        if (cp.isIncomplete()) {
            result.append(cp);
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const QRCheckpoint &a, const QRCheckpoint &b) {
        if (a.updatedAt != b.updatedAt) {
            return a.updatedAt < b.updatedAt;
        }
        return a.userId < b.userId;
    });
    return result;
}

} // namespace QRelay

QT_END_NAMESPACE
