// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRGLOBAL_H
#define QRGLOBAL_H

#include "QRelayConfig.h"
#include <QtCore/qglobal.h>

// 导出宏定义
#ifndef QRELAY_EXPORT
#  if defined(QT_BUILD_QRELAY_LIB)
#    define QRELAY_EXPORT Q_DECL_EXPORT
#  else
#    define QRELAY_EXPORT Q_DECL_IMPORT
#  endif
#endif

namespace QRelay {

// 版本信息
constexpr int versionMajor() { return QRELAY_VERSION_MAJOR; }
constexpr int versionMinor() { return QRELAY_VERSION_MINOR; }
constexpr int versionPatch() { return QRELAY_VERSION_PATCH; }
constexpr const char* versionString() { return QRELAY_VERSION_STRING; }

} // namespace QRelay

#endif // QRGLOBAL_H
