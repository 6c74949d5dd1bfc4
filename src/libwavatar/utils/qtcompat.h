// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_UTILS_QTCOMPAT_H
#define LIBWAVATAR_UTILS_QTCOMPAT_H
#include <QtGlobal>

namespace compat {

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
using HashValue = size_t;
#else
using HashValue = uint;
#endif

}

#endif
